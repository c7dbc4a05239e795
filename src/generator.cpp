#include "scribe/generator.hpp"
#include <stdexcept>

namespace scribe {

Seq generate_unconditional(const HandwritingModel& model, int steps, int batch, Sampler& sampler) {
    if (steps <= 0 || batch <= 0) {
        throw std::invalid_argument("generate_unconditional: steps and batch must be positive");
    }

    Seq samples;
    samples.reserve(steps);

    Mat point = Mat::Zero(3, batch);   // dummy first point, not part of the output
    StateInit init = StateInit::fresh();
    for (int i = 0; i < steps; ++i) {
        ForwardResult step = model.forward(Seq{point}, init);
        point = sampler.sample(step.params.back());
        samples.push_back(point);
        init = StateInit::continued(std::move(step.final_state));
    }
    return samples;
}

Seq generate_conditional(const SynthesisModel& model, const CharBatch& chars, Sampler& sampler,
                         AttentionTrace* trace) {
    const int steps = model.config().generation_steps;
    if (chars.empty()) {
        throw std::invalid_argument("generate_conditional: no character sequences given");
    }

    const int batch = chars.batch_size();
    Seq samples;
    samples.reserve(steps);
    if (trace) {
        trace->phi.clear();
        trace->kappa.clear();
        trace->phi.reserve(steps);
        trace->kappa.reserve(steps);
    }

    Mat point = Mat::Zero(3, batch);
    StateInit init = StateInit::fresh();
    for (int i = 0; i < steps; ++i) {
        ForwardResult step = model.forward(Seq{point}, chars, init);
        point = sampler.sample(step.params.back());
        samples.push_back(point);
        if (trace) {
            trace->phi.push_back(step.caches.back().window.phi);
            trace->kappa.push_back(step.caches.back().window.kappa);
        }
        init = StateInit::continued(std::move(step.final_state));
    }
    return samples;
}

} // namespace scribe
