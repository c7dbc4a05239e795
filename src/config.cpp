#include "scribe/config.hpp"
#include <stdexcept>

namespace scribe {

namespace {

void require_positive(int value, const char* name) {
    if (value <= 0) {
        throw std::invalid_argument(std::string("ModelConfig.") + name +
                                    " must be positive, got " + std::to_string(value));
    }
}

void require_positive(F value, const char* name) {
    if (!(value > 0)) {
        throw std::invalid_argument(std::string("ModelConfig.") + name +
                                    " must be positive, got " + std::to_string(value));
    }
}

} // namespace

void ModelConfig::validate() const {
    require_positive(memory_cells, "memory_cells");
    require_positive(n_gaussians, "n_gaussians");
    require_positive(num_layers, "num_layers");
    require_positive(n_gaussians_window, "n_gaussians_window");
    require_positive(n_char, "n_char");
    require_positive(eps, "eps");
    require_positive(hidden_clip, "hidden_clip");
    require_positive(output_clip, "output_clip");
    require_positive(window_clip, "window_clip");
    require_positive(grad_norm_clip, "grad_norm_clip");
    require_positive(generation_steps, "generation_steps");
}

bool apply_override(ModelConfig& config, const std::string& key, const std::string& value) {
    if (key == "memory_cells") config.memory_cells = std::stoi(value);
    else if (key == "n_gaussians") config.n_gaussians = std::stoi(value);
    else if (key == "num_layers") config.num_layers = std::stoi(value);
    else if (key == "n_gaussians_window") config.n_gaussians_window = std::stoi(value);
    else if (key == "n_char") config.n_char = std::stoi(value);
    else if (key == "eps") config.eps = std::stod(value);
    else if (key == "hidden_clip") config.hidden_clip = std::stod(value);
    else if (key == "output_clip") config.output_clip = std::stod(value);
    else if (key == "window_clip") config.window_clip = std::stod(value);
    else if (key == "grad_norm_clip") config.grad_norm_clip = std::stod(value);
    else if (key == "generation_steps") config.generation_steps = std::stoi(value);
    else if (key == "seed") config.seed = static_cast<unsigned>(std::stoul(value));
    else return false;
    return true;
}

} // namespace scribe
