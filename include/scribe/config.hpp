#pragma once
#include "types.hpp"
#include <string>

namespace scribe {

// Model architecture and numerical constants
struct ModelConfig {
    int memory_cells = 400;
    int n_gaussians = 20;          // output mixture components (m)
    int num_layers = 3;
    int n_gaussians_window = 10;   // window components (K), conditional only
    int n_char = 57;               // alphabet size, conditional only

    F eps = 1e-4;
    F hidden_clip = 10.0;          // per-layer hidden output gradient bound
    F output_clip = 100.0;         // mixture projection output gradient bound
    F window_clip = 100.0;         // context vector gradient bound
    F grad_norm_clip = 5.0;        // global parameter gradient norm

    int generation_steps = 600;    // fixed horizon for conditional synthesis
    unsigned seed = 42;

    // Throws std::invalid_argument naming the first bad field
    void validate() const;

    int stack_width() const { return memory_cells * num_layers; }
};

// Apply a "--key value" override. Returns false if key is not a ModelConfig field.
bool apply_override(ModelConfig& config, const std::string& key, const std::string& value);

} // namespace scribe
