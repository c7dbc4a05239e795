#include "scribe/generator.hpp"
#include "scribe/data.hpp"
#include <iomanip>
#include <iostream>
#include <string>

using namespace scribe;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <output_csv> [text...] [--steps N] [--batch N]"
                  << " [--<model field> VALUE]..." << std::endl;
        return 1;
    }

    try {
        std::string output = argv[1];
        std::vector<std::string> texts;
        int steps = 300;
        int batch = 1;

        ModelConfig config;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.compare(0, 2, "--") != 0) {
                texts.push_back(arg);
                continue;
            }
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return 1;
            }
            std::string key = arg.substr(2);
            std::string value = argv[++i];
            if (key == "steps") steps = std::stoi(value);
            else if (key == "batch") batch = std::stoi(value);
            else if (!apply_override(config, key, value)) {
                std::cerr << "Unknown option " << arg << std::endl;
                return 1;
            }
        }

        Sampler sampler(config.seed);
        Seq samples;
        if (texts.empty()) {
            std::cout << "Generating " << steps << " unconditional steps for batch of "
                      << batch << std::endl;
            HandwritingModel model(config);
            samples = generate_unconditional(model, steps, batch, sampler);
        } else {
            OneHotEncoder encoder;
            config.n_char = encoder.n_char();
            SynthesisModel model(config);
            CharBatch chars = pad_chars(encoder.encode(texts));

            std::cout << "Generating " << config.generation_steps << " steps for "
                      << texts.size() << " text(s)" << std::endl;
            AttentionTrace trace;
            samples = generate_conditional(model, chars, sampler, &trace);

            for (int b = 0; b < chars.batch_size(); ++b) {
                std::cout << "  \"" << texts[b] << "\": final kappa mean "
                          << std::fixed << std::setprecision(3)
                          << trace.kappa.back().col(b).mean() << " over "
                          << chars.lengths[b] << " characters" << std::endl;
            }
        }

        save_strokes_csv(samples, output);
        std::cout << "Wrote " << samples.size() << " steps to " << output << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
