#pragma once
#include "model.hpp"
#include "sampler.hpp"

namespace scribe {

// Per-step alignment diagnostics of conditional generation
struct AttentionTrace {
    Seq phi;     // [steps] of (U x B)
    Seq kappa;   // [steps] of (K x B)
};

// Returns [steps] of (3 x batch), excluding the initial zero point
Seq generate_unconditional(const HandwritingModel& model, int steps, int batch, Sampler& sampler);

// Runs config().generation_steps steps over the padded character batch
Seq generate_conditional(const SynthesisModel& model, const CharBatch& chars, Sampler& sampler,
                         AttentionTrace* trace = nullptr);

} // namespace scribe
