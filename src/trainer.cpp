#include "scribe/trainer.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

namespace scribe {

template <class Model>
Trainer<Model>::Trainer(Model& model, const TrainConfig& config)
    : model_(model), config_(config), optimizer_(config.learning_rate),
      scheduler_(config.plateau_factor, config.plateau_patience) {
    grads_ = model_.make_grads();
    m_ = model_.make_grads();
    v_ = model_.make_grads();
}

template <class Model>
F Trainer<Model>::train_batch(const StrokeBatch& batch) {
    grads_.zero();
    F loss = model_.loss(batch, &grads_);
    step_++;

    if (!std::isfinite(loss)) {
        std::cerr << "Warning: non-finite loss " << loss << " at step " << step_
                  << ", skipping update" << std::endl;
        return loss;
    }

    last_grad_norm_ = clip_grad_norm(grads_, model_.config().grad_norm_clip);
    if (!std::isfinite(last_grad_norm_)) {
        std::cerr << "Warning: non-finite gradient norm " << last_grad_norm_ << " at step "
                  << step_ << ", skipping update" << std::endl;
        return loss;
    }

    optimizer_.begin_step();
    model_.apply_gradients(optimizer_, grads_, m_, v_);

    if (config_.verbose && config_.print_every > 0 && step_ % config_.print_every == 0) {
        std::cout << "Step " << std::setw(5) << step_
                  << " | Loss: " << std::fixed << std::setprecision(4) << loss
                  << " | Grad norm: " << std::setprecision(3) << last_grad_norm_
                  << std::endl;
    }
    return loss;
}

template <class Model>
F Trainer<Model>::train_epoch(const std::vector<StrokeBatch>& batches) {
    F total_loss = 0.0;
    int num_batches = 0;
    for (const auto& batch : batches) {
        total_loss += train_batch(batch);
        num_batches++;
    }
    F epoch_loss = num_batches > 0 ? total_loss / num_batches : 0.0;
    epoch_++;

    if (scheduler_.step(epoch_loss, optimizer_) && config_.verbose) {
        std::cout << "Reducing learning rate to " << std::scientific << std::setprecision(2)
                  << optimizer_.lr << std::fixed << std::endl;
    }
    if (config_.verbose) {
        std::cout << "Epoch " << std::setw(3) << epoch_
                  << " | Avg loss: " << std::fixed << std::setprecision(4) << epoch_loss
                  << std::endl;
    }
    return epoch_loss;
}

template <class Model>
F Trainer<Model>::evaluate(const std::vector<StrokeBatch>& batches) const {
    F total_loss = 0.0;
    for (const auto& batch : batches) {
        total_loss += model_.loss(batch);
    }
    return batches.empty() ? 0.0 : total_loss / batches.size();
}

template class Trainer<HandwritingModel>;
template class Trainer<SynthesisModel>;

} // namespace scribe
