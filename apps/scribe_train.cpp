#include "scribe/trainer.hpp"
#include "scribe/data.hpp"
#include "scribe/generator.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

using namespace scribe;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--uncond] [--epochs N] [--batches N] [--batch_size N]\n"
              << "       [--lr X] [--samples FILE] [--<model field> VALUE]..." << std::endl;
}

std::vector<StrokeBatch> make_batches(DataGenerator& generator, const OneHotEncoder& encoder,
                                      int n_batches, int batch_size, bool uncond) {
    std::vector<StrokeBatch> batches;
    for (int i = 0; i < n_batches; ++i) {
        StrokeBatch batch = pad_strokes(generator.generate_strokes(batch_size, 20, 40));
        if (!uncond) {
            auto sentences = generator.generate_sentences(batch_size, 3, 8, "abcde ");
            batch.chars = pad_chars(encoder.encode(sentences));
        }
        batches.push_back(batch);
    }
    return batches;
}

template <class Model>
void run_training(Trainer<Model>& trainer, const std::vector<StrokeBatch>& train,
                  const std::vector<StrokeBatch>& valid, int epochs) {
    auto start_time = std::chrono::high_resolution_clock::now();
    for (int epoch = 0; epoch < epochs; ++epoch) {
        trainer.train_epoch(train);
        F valid_loss = trainer.evaluate(valid);
        std::cout << "  validation loss: " << std::fixed << std::setprecision(4) << valid_loss
                  << " | lr: " << std::scientific << std::setprecision(2)
                  << trainer.learning_rate() << std::fixed << std::endl;
    }
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    std::cout << "Training completed in " << duration.count() << " ms ("
              << trainer.steps() << " steps)" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        ModelConfig model_config;
        model_config.memory_cells = 32;
        model_config.n_gaussians = 5;
        model_config.num_layers = 2;

        TrainConfig train_config;
        train_config.batch_size = 8;
        train_config.epochs = 5;
        train_config.print_every = 5;

        bool uncond = false;
        int n_batches = 10;
        std::string samples_file;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--uncond") {
                uncond = true;
                continue;
            }
            if (arg.compare(0, 2, "--") != 0 || i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            std::string key = arg.substr(2);
            std::string value = argv[++i];
            if (key == "epochs") train_config.epochs = std::stoi(value);
            else if (key == "batches") n_batches = std::stoi(value);
            else if (key == "batch_size") train_config.batch_size = std::stoi(value);
            else if (key == "lr") train_config.learning_rate = std::stod(value);
            else if (key == "samples") samples_file = value;
            else if (!apply_override(model_config, key, value)) {
                std::cerr << "Unknown option --" << key << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        OneHotEncoder encoder;
        model_config.n_char = encoder.n_char();
        model_config.validate();

        std::cout << "=== scribe " << (uncond ? "unconditional" : "conditional") << " training ==="
                  << std::endl;
        std::cout << "Architecture: memory_cells=" << model_config.memory_cells
                  << ", layers=" << model_config.num_layers
                  << ", mixtures=" << model_config.n_gaussians
                  << ", window=" << model_config.n_gaussians_window << std::endl;

        DataGenerator generator(101);
        auto train = make_batches(generator, encoder, n_batches, train_config.batch_size, uncond);
        auto valid = make_batches(generator, encoder, 2, train_config.batch_size, uncond);

        Sampler sampler(model_config.seed);
        if (uncond) {
            HandwritingModel model(model_config);
            Trainer<HandwritingModel> trainer(model, train_config);
            run_training(trainer, train, valid, train_config.epochs);
            if (!samples_file.empty()) {
                save_strokes_csv(generate_unconditional(model, 300, 3, sampler), samples_file);
                std::cout << "Wrote samples to " << samples_file << std::endl;
            }
        } else {
            SynthesisModel model(model_config);
            Trainer<SynthesisModel> trainer(model, train_config);
            run_training(trainer, train, valid, train_config.epochs);
            if (!samples_file.empty()) {
                CharBatch chars = pad_chars(encoder.encode(std::vector<std::string>{"abcd", "ebb"}));
                save_strokes_csv(generate_conditional(model, chars, sampler), samples_file);
                std::cout << "Wrote samples to " << samples_file << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
