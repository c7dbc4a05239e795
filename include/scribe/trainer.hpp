#pragma once
#include "model.hpp"
#include "optim.hpp"
#include <vector>

namespace scribe {

// Training configuration
struct TrainConfig {
    F learning_rate = 1e-3;
    int batch_size = 16;
    int epochs = 10;
    bool verbose = true;
    int print_every = 10;

    F plateau_factor = 0.31622776601683794;   // sqrt(0.1)
    int plateau_patience = 10;
};

// One optimizer step per padded batch: forward, masked NLL, backward,
// global norm clip, Adam. Model is HandwritingModel or SynthesisModel.
template <class Model>
class Trainer {
public:
    Trainer(Model& model, const TrainConfig& config = TrainConfig{});

    // Returns the batch loss. When the loss or the gradient norm is not
    // finite the parameters are left untouched.
    F train_batch(const StrokeBatch& batch);

    // Mean batch loss over the epoch; steps the plateau scheduler
    F train_epoch(const std::vector<StrokeBatch>& batches);

    F evaluate(const std::vector<StrokeBatch>& batches) const;

    F learning_rate() const { return optimizer_.lr; }
    F last_grad_norm() const { return last_grad_norm_; }
    int steps() const { return step_; }

private:
    Model& model_;
    TrainConfig config_;
    Adam optimizer_;
    ReduceOnPlateau scheduler_;
    ModelGrads grads_, m_, v_;
    int step_ = 0;
    int epoch_ = 0;
    F last_grad_norm_ = 0.0;
};

} // namespace scribe
