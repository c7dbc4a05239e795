#include "scribe/generator.hpp"
#include "scribe/trainer.hpp"
#include "scribe/data.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace scribe;

bool all_points_valid(const Seq& samples, int batch) {
    for (const auto& point : samples) {
        if (point.rows() != 3 || point.cols() != batch) return false;
        if (!all_finite(point)) return false;
        for (int b = 0; b < batch; ++b) {
            if (point(0, b) != 0.0 && point(0, b) != 1.0) return false;
        }
    }
    return true;
}

bool test_training_step_reduces_loss() {
    std::cout << "Testing a training step on a fixed batch..." << std::endl;
    ModelConfig config;
    config.memory_cells = 8;
    config.n_gaussians = 2;
    config.num_layers = 1;
    config.seed = 3;
    HandwritingModel model(config);

    Mat stroke(2, 3);
    stroke << 0.0, 0.5, -0.2,
              1.0, 0.1, 0.3;
    StrokeBatch batch = pad_strokes({stroke});

    TrainConfig train_config;
    train_config.learning_rate = 1e-3;
    train_config.verbose = false;
    Trainer<HandwritingModel> trainer(model, train_config);

    F before = model.loss(batch);
    trainer.train_batch(batch);
    F after = model.loss(batch);

    if (!(after < before)) {
        std::cout << "FAIL: loss did not decrease (" << before << " -> " << after << ")" << std::endl;
        return false;
    }
    if (trainer.steps() != 1 || !(trainer.last_grad_norm() > 0.0)) {
        std::cout << "FAIL: trainer did not record the step" << std::endl;
        return false;
    }
    return true;
}

bool test_unconditional_generation() {
    std::cout << "Testing unconditional generation..." << std::endl;
    ModelConfig config;
    config.memory_cells = 16;
    config.n_gaussians = 3;
    config.num_layers = 2;
    HandwritingModel model(config);
    Sampler sampler(7);

    Seq samples = generate_unconditional(model, 50, 2, sampler);
    if (samples.size() != 50) {
        std::cout << "FAIL: expected 50 points, got " << samples.size() << std::endl;
        return false;
    }
    if (!all_points_valid(samples, 2)) {
        std::cout << "FAIL: generated points are malformed" << std::endl;
        return false;
    }
    return true;
}

bool test_conditional_generation_reproducible() {
    std::cout << "Testing conditional generation reproducibility..." << std::endl;
    OneHotEncoder encoder;
    ModelConfig config;
    config.memory_cells = 8;
    config.n_gaussians = 2;
    config.num_layers = 2;
    config.n_gaussians_window = 2;
    config.n_char = encoder.n_char();
    SynthesisModel model(config);

    CharBatch chars = pad_chars({encoder.encode("hello")});

    Sampler sampler(11), other(12);
    AttentionTrace trace;
    Seq a = generate_conditional(model, chars, sampler, &trace);
    sampler.seed(11);
    Seq b = generate_conditional(model, chars, sampler);
    Seq c = generate_conditional(model, chars, other);

    if (static_cast<int>(a.size()) != config.generation_steps || !all_points_valid(a, 1)) {
        std::cout << "FAIL: expected " << config.generation_steps << " valid points" << std::endl;
        return false;
    }

    bool same = true, differs = false;
    for (size_t t = 0; t < a.size(); ++t) {
        same &= (a[t] - b[t]).cwiseAbs().maxCoeff() == 0.0;
        differs |= (a[t] - c[t]).cwiseAbs().maxCoeff() > 0.0;
    }
    if (!same) {
        std::cout << "FAIL: identical seeds produced different strokes" << std::endl;
        return false;
    }
    if (!differs) {
        std::cout << "FAIL: different seeds produced identical strokes" << std::endl;
        return false;
    }

    if (trace.phi.size() != a.size() || trace.kappa.size() != a.size()) {
        std::cout << "FAIL: attention trace length mismatch" << std::endl;
        return false;
    }
    if (trace.phi[0].rows() != 5 || trace.phi[0].cols() != 1 ||
        trace.kappa[0].rows() != 2 || trace.kappa[0].cols() != 1) {
        std::cout << "FAIL: attention trace shapes are wrong" << std::endl;
        return false;
    }
    for (size_t t = 1; t < trace.kappa.size(); ++t) {
        if ((trace.kappa[t] - trace.kappa[t - 1]).minCoeff() < 0.0) {
            std::cout << "FAIL: window position moved backwards at step " << t << std::endl;
            return false;
        }
    }
    return true;
}

bool test_generation_errors() {
    std::cout << "Testing generation argument errors..." << std::endl;
    ModelConfig config;
    config.memory_cells = 4;
    config.n_gaussians = 2;
    config.num_layers = 1;
    config.n_gaussians_window = 2;
    config.n_char = 4;
    HandwritingModel uncond(config);
    Sampler sampler(1);

    int caught = 0;
    try {
        generate_unconditional(uncond, 0, 1, sampler);
    } catch (const std::invalid_argument&) {
        caught++;
    }

    SynthesisModel cond(config);
    OneHotEncoder wide_encoder;   // n_char 57 against a model built for 4
    try {
        generate_conditional(cond, pad_chars({wide_encoder.encode("ab")}), sampler);
    } catch (const std::invalid_argument&) {
        caught++;
    }
    try {
        generate_conditional(cond, CharBatch{}, sampler);
    } catch (const std::invalid_argument&) {
        caught++;
    }

    if (caught != 3) {
        std::cout << "FAIL: expected 3 rejected calls, got " << caught << std::endl;
        return false;
    }
    return true;
}

ModelConfig small_conditional_config(int n_char) {
    ModelConfig config;
    config.memory_cells = 6;
    config.n_gaussians = 2;
    config.num_layers = 2;
    config.n_gaussians_window = 2;
    config.n_char = n_char;
    config.seed = 9;
    return config;
}

std::vector<StrokeBatch> conditional_batches(const OneHotEncoder& encoder, int count) {
    DataGenerator generator(17);
    std::vector<StrokeBatch> batches;
    for (int i = 0; i < count; ++i) {
        StrokeBatch batch = pad_strokes(generator.generate_strokes(2, 4, 7));
        batch.chars = pad_chars(encoder.encode(generator.generate_sentences(2, 2, 4, "abc")));
        batches.push_back(batch);
    }
    return batches;
}

bool test_padding_garbage_does_not_reach_weights() {
    std::cout << "Testing training on a batch with garbage padding..." << std::endl;
    ModelConfig config;
    config.memory_cells = 8;
    config.n_gaussians = 2;
    config.num_layers = 2;
    HandwritingModel model(config);

    Mat long_stroke(4, 3), short_stroke(2, 3);
    long_stroke << 0.0, 0.5, -0.2,
                   0.0, 0.1, 0.3,
                   1.0, -0.4, 0.2,
                   0.0, 0.3, 0.1;
    short_stroke << 0.0, -0.3, 0.4,
                    1.0, 0.2, -0.1;
    StrokeBatch batch = pad_strokes({long_stroke, short_stroke});
    const F nan = std::numeric_limits<F>::quiet_NaN();
    batch.inputs[3](1, 1) = nan;
    batch.targets[3](1, 1) = nan;

    TrainConfig train_config;
    train_config.verbose = false;
    Trainer<HandwritingModel> trainer(model, train_config);
    F loss = trainer.train_batch(batch);

    if (!std::isfinite(loss) || !std::isfinite(trainer.last_grad_norm())) {
        std::cout << "FAIL: padded garbage leaked into the loss or gradients" << std::endl;
        return false;
    }
    if (!all_finite(model.head().W) || !all_finite(model.layers()[0].Wx)) {
        std::cout << "FAIL: padded garbage leaked into the weights" << std::endl;
        return false;
    }
    return true;
}

bool test_gradient_norm_clip() {
    std::cout << "Testing global gradient norm clip..." << std::endl;
    OneHotEncoder encoder("abc");
    SynthesisModel model(small_conditional_config(encoder.n_char()));
    StrokeBatch batch = conditional_batches(encoder, 1)[0];

    ModelGrads grads = model.make_grads();
    grads.zero();
    model.loss(batch, &grads);
    grads.scale(1e4);

    const F bound = model.config().grad_norm_clip;
    F before = clip_grad_norm(grads, bound);
    F after = std::sqrt(grads.squared_norm());
    if (!(before > bound) || after > bound + 1e-9) {
        std::cout << "FAIL: norm " << before << " clipped to " << after
                  << ", bound " << bound << std::endl;
        return false;
    }

    // Already inside the bound: untouched
    F small_before = std::sqrt(grads.squared_norm());
    grads.scale(0.1);
    F reported = clip_grad_norm(grads, bound);
    if (std::abs(reported - 0.1 * small_before) > 1e-9 ||
        std::abs(std::sqrt(grads.squared_norm()) - reported) > 1e-12) {
        std::cout << "FAIL: gradients inside the bound were rescaled" << std::endl;
        return false;
    }
    return true;
}

bool test_plateau_schedule() {
    std::cout << "Testing plateau learning rate schedule..." << std::endl;
    Adam opt(1.0);
    ReduceOnPlateau scheduler(0.5, 2);

    bool reduced = scheduler.step(1.0, opt);   // first epoch sets the best loss
    for (int epoch = 0; epoch < 2; ++epoch) {
        reduced |= scheduler.step(1.0, opt);
    }
    if (reduced || opt.lr != 1.0) {
        std::cout << "FAIL: learning rate cut before patience ran out" << std::endl;
        return false;
    }
    if (!scheduler.step(1.0, opt) || opt.lr != 0.5) {
        std::cout << "FAIL: learning rate not cut after patience + 1 flat epochs" << std::endl;
        return false;
    }
    if (scheduler.step(0.9, opt) || opt.lr != 0.5) {
        std::cout << "FAIL: improvement changed the learning rate" << std::endl;
        return false;
    }
    return true;
}

bool test_conditional_training_epoch() {
    std::cout << "Testing a conditional training epoch..." << std::endl;
    OneHotEncoder encoder("abc");
    SynthesisModel model(small_conditional_config(encoder.n_char()));
    std::vector<StrokeBatch> batches = conditional_batches(encoder, 3);

    TrainConfig train_config;
    train_config.verbose = false;
    Trainer<SynthesisModel> trainer(model, train_config);

    F before = trainer.evaluate(batches);
    F epoch_loss = trainer.train_epoch(batches);
    F after = trainer.evaluate(batches);

    if (!std::isfinite(before) || !std::isfinite(epoch_loss) || !std::isfinite(after)) {
        std::cout << "FAIL: non-finite conditional loss" << std::endl;
        return false;
    }
    if (trainer.steps() != 3 || after == before) {
        std::cout << "FAIL: epoch did not update the model" << std::endl;
        return false;
    }
    if (trainer.learning_rate() != train_config.learning_rate) {
        std::cout << "FAIL: learning rate changed after one epoch" << std::endl;
        return false;
    }
    return true;
}

int main() {
    std::cout << "=== Generation Tests ===" << std::endl;

    if (!test_training_step_reduces_loss()) return 1;
    std::cout << "PASS: training step" << std::endl;

    if (!test_unconditional_generation()) return 1;
    std::cout << "PASS: unconditional generation" << std::endl;

    if (!test_conditional_generation_reproducible()) return 1;
    std::cout << "PASS: conditional generation" << std::endl;

    if (!test_generation_errors()) return 1;
    std::cout << "PASS: generation errors" << std::endl;

    if (!test_padding_garbage_does_not_reach_weights()) return 1;
    std::cout << "PASS: garbage padding" << std::endl;

    if (!test_gradient_norm_clip()) return 1;
    std::cout << "PASS: gradient norm clip" << std::endl;

    if (!test_plateau_schedule()) return 1;
    std::cout << "PASS: plateau schedule" << std::endl;

    if (!test_conditional_training_epoch()) return 1;
    std::cout << "PASS: conditional training epoch" << std::endl;

    std::cout << "\nAll generation tests passed!" << std::endl;
    return 0;
}
