#include "scribe/model.hpp"
#include "scribe/data.hpp"
#include <cmath>
#include <functional>
#include <string>
#include <iomanip>
#include <iostream>
#include <limits>

using namespace scribe;

bool gradient_check_sequence(const std::function<F()>& f, F& param, F analytical_grad,
                             const std::string& param_name, F h = 1e-5) {
    // Central difference
    F saved = param;
    param = saved + h;
    F f_plus = f();

    param = saved - h;
    F f_minus = f();

    param = saved;  // Restore

    F numerical_grad = (f_plus - f_minus) / (2.0 * h);
    F error = std::abs(analytical_grad - numerical_grad);
    F rel_error = error / (std::abs(numerical_grad) + 1e-8);

    bool passed = rel_error < 1e-3 || error < 1e-8;

    if (!passed) {
        std::cout << param_name << ": analytical=" << std::setprecision(6) << analytical_grad
                  << ", numerical=" << std::setprecision(6) << numerical_grad
                  << ", rel_error=" << std::setprecision(2) << std::scientific << rel_error
                  << std::defaultfloat << " FAIL" << std::endl;
    }
    return passed;
}

// Check every entry of a small parameter matrix
template <class Param, class Grad>
bool check_all(const std::function<F()>& f, Param& param, const Grad& grad, const std::string& name) {
    bool all_passed = true;
    for (int i = 0; i < param.rows(); ++i) {
        for (int j = 0; j < param.cols(); ++j) {
            all_passed &= gradient_check_sequence(
                f, param(i, j), grad(i, j),
                name + "(" + std::to_string(i) + "," + std::to_string(j) + ")");
        }
    }
    return all_passed;
}

ModelConfig tiny_config() {
    ModelConfig config;
    config.memory_cells = 4;
    config.n_gaussians = 2;
    config.num_layers = 2;
    config.n_gaussians_window = 2;
    config.n_char = 4;
    config.seed = 5;
    return config;
}

StrokeBatch tiny_batch() {
    DataGenerator generator(31);
    auto strokes = generator.generate_strokes(2, 3, 5);
    strokes[1] = strokes[1].topRows(2).eval();   // force padding in the second column
    return pad_strokes(strokes);
}

bool test_lstm_cell_gradients() {
    std::cout << "Testing LSTM cell gradients..." << std::endl;
    Rng gen(3);
    const int input_dim = 3, hidden_dim = 4, B = 2;
    LstmCell cell(input_dim, hidden_dim, gen);

    Mat x = Mat::Random(input_dim, B);
    LstmState prev(hidden_dim, B);
    prev.h = Mat::Random(hidden_dim, B) * 0.5;
    prev.c = Mat::Random(hidden_dim, B) * 0.5;
    Mat R = Mat::Random(hidden_dim, B);
    Mat S = Mat::Random(hidden_dim, B);

    auto compute_loss = [&]() -> F {
        LstmCache cache;
        LstmState next = cell.forward(x, prev, cache);
        return R.cwiseProduct(next.h).sum() + S.cwiseProduct(next.c).sum();
    };

    LstmCache cache;
    cell.forward(x, prev, cache);
    LstmCell::Grads grads(input_dim, hidden_dim);
    Mat dx, dh_prev, dc_prev;
    cell.backward(R, S, cache, grads, dx, dh_prev, dc_prev);

    bool all_passed = true;
    all_passed &= check_all(compute_loss, cell.Wx, grads.dWx, "Wx");
    all_passed &= check_all(compute_loss, cell.Wh, grads.dWh, "Wh");
    all_passed &= check_all(compute_loss, cell.b, grads.db, "b");
    all_passed &= check_all(compute_loss, x, dx, "x");
    all_passed &= check_all(compute_loss, prev.h, dh_prev, "h_prev");
    all_passed &= check_all(compute_loss, prev.c, dc_prev, "c_prev");
    return all_passed;
}

bool test_unconditional_bptt() {
    std::cout << "Testing unconditional BPTT gradients..." << std::endl;
    HandwritingModel model(tiny_config());
    StrokeBatch batch = tiny_batch();

    auto compute_loss = [&]() -> F { return model.loss(batch); };

    ModelGrads grads = model.make_grads();
    grads.zero();
    model.loss(batch, &grads);

    bool all_passed = true;
    for (size_t l = 0; l < model.layers().size(); ++l) {
        std::string prefix = "layer" + std::to_string(l) + ".";
        all_passed &= check_all(compute_loss, model.layers()[l].Wx, grads.layers[l].dWx, prefix + "Wx");
        all_passed &= check_all(compute_loss, model.layers()[l].Wh, grads.layers[l].dWh, prefix + "Wh");
        all_passed &= check_all(compute_loss, model.layers()[l].b, grads.layers[l].db, prefix + "b");
    }
    all_passed &= check_all(compute_loss, model.head().W, grads.head.dW, "head.W");
    all_passed &= check_all(compute_loss, model.head().b, grads.head.db, "head.b");
    return all_passed;
}

bool test_conditional_bptt() {
    std::cout << "Testing conditional BPTT gradients..." << std::endl;
    SynthesisModel model(tiny_config());
    StrokeBatch batch = tiny_batch();
    OneHotEncoder encoder("abc");
    batch.chars = pad_chars(encoder.encode(std::vector<std::string>{"abc", "ca"}));

    auto compute_loss = [&]() -> F { return model.loss(batch); };

    ModelGrads grads = model.make_grads();
    grads.zero();
    model.loss(batch, &grads);

    bool all_passed = true;
    all_passed &= check_all(compute_loss, model.window_cell().Wx, grads.layers[0].dWx, "window_cell.Wx");
    all_passed &= check_all(compute_loss, model.window_cell().Wh, grads.layers[0].dWh, "window_cell.Wh");
    all_passed &= check_all(compute_loss, model.window_cell().b, grads.layers[0].db, "window_cell.b");
    all_passed &= check_all(compute_loss, model.window().W, grads.window.dW, "window.W");
    all_passed &= check_all(compute_loss, model.window().b, grads.window.db, "window.b");
    for (size_t l = 0; l < model.layers().size(); ++l) {
        std::string prefix = "layer" + std::to_string(l + 1) + ".";
        all_passed &= check_all(compute_loss, model.layers()[l].Wx, grads.layers[l + 1].dWx, prefix + "Wx");
        all_passed &= check_all(compute_loss, model.layers()[l].Wh, grads.layers[l + 1].dWh, prefix + "Wh");
        all_passed &= check_all(compute_loss, model.layers()[l].b, grads.layers[l + 1].db, prefix + "b");
    }
    all_passed &= check_all(compute_loss, model.head().W, grads.head.dW, "head.W");
    all_passed &= check_all(compute_loss, model.head().b, grads.head.db, "head.b");
    return all_passed;
}

bool test_hidden_clip_applies() {
    std::cout << "Testing hidden gradient clamp..." << std::endl;
    ModelConfig config = tiny_config();
    StrokeBatch batch = tiny_batch();

    HandwritingModel free_model(config);
    config.hidden_clip = 1e-9;
    HandwritingModel clipped_model(config);

    ModelGrads free_grads = free_model.make_grads();
    ModelGrads clipped_grads = clipped_model.make_grads();
    free_grads.zero();
    clipped_grads.zero();
    free_model.loss(batch, &free_grads);
    clipped_model.loss(batch, &clipped_grads);

    // The head is above every clamp point; the recurrent layers are below
    bool head_same = free_grads.head.dW.isApprox(clipped_grads.head.dW, 1e-12);
    bool layers_shrunk = clipped_grads.layers[0].squared_norm() < 1e-6 * free_grads.layers[0].squared_norm();
    if (!head_same || !layers_shrunk) {
        std::cout << "FAIL: hidden clamp is not applied at the layer outputs" << std::endl;
        return false;
    }
    return true;
}

bool test_trailing_padding_ignored() {
    std::cout << "Testing garbage in trailing padding..." << std::endl;
    HandwritingModel model(tiny_config());
    StrokeBatch clean = tiny_batch();
    const int T = clean.seq_len();

    // Column 1 holds two points, so its last step is padding
    StrokeBatch dirty = clean;
    const F nan = std::numeric_limits<F>::quiet_NaN();
    dirty.inputs[T - 1](1, 1) = nan;
    dirty.targets[T - 1](1, 1) = nan;

    ModelGrads clean_grads = model.make_grads();
    ModelGrads dirty_grads = model.make_grads();
    clean_grads.zero();
    dirty_grads.zero();
    F clean_loss = model.loss(clean, &clean_grads);
    F dirty_loss = model.loss(dirty, &dirty_grads);

    if (clean_loss != dirty_loss) {
        std::cout << "FAIL: padded values changed the loss (" << clean_loss << " vs "
                  << dirty_loss << ")" << std::endl;
        return false;
    }
    if (!std::isfinite(dirty_grads.squared_norm())) {
        std::cout << "FAIL: padded values made the gradients non-finite" << std::endl;
        return false;
    }
    bool same = clean_grads.head.dW.isApprox(dirty_grads.head.dW) &&
                clean_grads.layers[0].dWx.isApprox(dirty_grads.layers[0].dWx) &&
                clean_grads.layers[1].dWh.isApprox(dirty_grads.layers[1].dWh);
    if (!same) {
        std::cout << "FAIL: padded values changed the gradients" << std::endl;
        return false;
    }
    return true;
}

struct ConditionalGrads {
    ModelGrads free;
    ModelGrads clipped;
};

// Gradients of two conditional models that differ only in the edited clip bound
ConditionalGrads conditional_grads_with(F ModelConfig::*bound, F value) {
    ModelConfig config = tiny_config();
    StrokeBatch batch = tiny_batch();
    OneHotEncoder encoder("abc");
    batch.chars = pad_chars(encoder.encode(std::vector<std::string>{"abc", "ca"}));

    SynthesisModel free_model(config);
    config.*bound = value;
    SynthesisModel clipped_model(config);

    ConditionalGrads out{free_model.make_grads(), clipped_model.make_grads()};
    out.free.zero();
    out.clipped.zero();
    free_model.loss(batch, &out.free);
    clipped_model.loss(batch, &out.clipped);
    return out;
}

bool test_window_clip_applies() {
    std::cout << "Testing context vector gradient clamp..." << std::endl;
    ConditionalGrads g = conditional_grads_with(&ModelConfig::window_clip, 1e-9);

    // Every window parameter gradient flows through the context vector
    bool head_same = g.free.head.dW.isApprox(g.clipped.head.dW, 1e-12);
    bool window_shrunk = g.clipped.window.squared_norm() < 1e-6 * g.free.window.squared_norm();
    if (!head_same || !window_shrunk) {
        std::cout << "FAIL: context gradient clamp is not applied (window grad sq norm "
                  << g.free.window.squared_norm() << " -> " << g.clipped.window.squared_norm()
                  << ")" << std::endl;
        return false;
    }
    return true;
}

bool test_conditional_hidden_clip_applies() {
    std::cout << "Testing conditional hidden gradient clamp..." << std::endl;
    ConditionalGrads g = conditional_grads_with(&ModelConfig::hidden_clip, 1e-9);

    bool head_same = g.free.head.dW.isApprox(g.clipped.head.dW, 1e-12);
    bool window_cell_shrunk =
        g.clipped.layers[0].squared_norm() < 1e-6 * g.free.layers[0].squared_norm();
    bool stacked_shrunk =
        g.clipped.layers[1].squared_norm() < 1e-6 * g.free.layers[1].squared_norm();
    if (!head_same || !window_cell_shrunk || !stacked_shrunk) {
        std::cout << "FAIL: hidden clamp is not applied in the conditional model" << std::endl;
        return false;
    }
    return true;
}

int main() {
    std::cout << "=== BPTT Gradient Check Tests ===" << std::endl;

    if (!test_lstm_cell_gradients()) {
        std::cout << "FAIL: LSTM cell gradient check failed" << std::endl;
        return 1;
    }
    std::cout << "PASS: LSTM cell gradients" << std::endl;

    if (!test_unconditional_bptt()) {
        std::cout << "FAIL: unconditional BPTT gradient check failed" << std::endl;
        return 1;
    }
    std::cout << "PASS: unconditional BPTT gradients" << std::endl;

    if (!test_conditional_bptt()) {
        std::cout << "FAIL: conditional BPTT gradient check failed" << std::endl;
        return 1;
    }
    std::cout << "PASS: conditional BPTT gradients" << std::endl;

    if (!test_hidden_clip_applies()) {
        return 1;
    }
    std::cout << "PASS: hidden gradient clamp" << std::endl;

    if (!test_trailing_padding_ignored()) {
        return 1;
    }
    std::cout << "PASS: trailing padding ignored" << std::endl;

    if (!test_window_clip_applies()) {
        return 1;
    }
    std::cout << "PASS: context vector gradient clamp" << std::endl;

    if (!test_conditional_hidden_clip_applies()) {
        return 1;
    }
    std::cout << "PASS: conditional hidden gradient clamp" << std::endl;

    std::cout << "\nAll BPTT tests passed!" << std::endl;
    return 0;
}
