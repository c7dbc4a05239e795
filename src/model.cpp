#include "scribe/model.hpp"
#include "scribe/loss.hpp"
#include <stdexcept>
#include <string>

namespace scribe {

namespace {

int check_inputs(const Seq& inputs) {
    if (inputs.empty()) {
        throw std::invalid_argument("forward: input sequence is empty");
    }
    const int B = inputs[0].cols();
    if (B <= 0) {
        throw std::invalid_argument("forward: batch size must be positive");
    }
    for (size_t t = 0; t < inputs.size(); ++t) {
        if (inputs[t].rows() != 3 || inputs[t].cols() != B) {
            throw std::invalid_argument("forward: inputs[" + std::to_string(t) + "] must be [3 x " +
                                        std::to_string(B) + "], got [" +
                                        std::to_string(inputs[t].rows()) + " x " +
                                        std::to_string(inputs[t].cols()) + "]");
        }
    }
    return B;
}

void check_shape(const Mat& m, int rows, int cols, const std::string& what) {
    if (m.rows() != rows || m.cols() != cols) {
        throw std::invalid_argument(what + " must be [" + std::to_string(rows) + " x " +
                                    std::to_string(cols) + "], got [" + std::to_string(m.rows()) +
                                    " x " + std::to_string(m.cols()) + "]");
    }
}

std::vector<LstmState> continued_layers(const StateInit& init, int num_layers, int hidden,
                                        int batch) {
    const auto& layers = init.state.layers;
    if (static_cast<int>(layers.size()) != num_layers) {
        throw std::invalid_argument("continued state has " + std::to_string(layers.size()) +
                                    " layers, model has " + std::to_string(num_layers));
    }
    for (int l = 0; l < num_layers; ++l) {
        check_shape(layers[l].h, hidden, batch, "state.layers[" + std::to_string(l) + "].h");
        check_shape(layers[l].c, hidden, batch, "state.layers[" + std::to_string(l) + "].c");
    }
    return layers;
}

// Copy of the batch inputs with every step after a column's last valid step
// zeroed. Nothing that reaches the loss depends on those steps, so whatever
// they hold must not reach the gradients either.
Seq without_trailing_padding(const StrokeBatch& batch) {
    const int T = batch.seq_len();
    if (batch.mask.rows() != T || batch.mask.cols() != batch.batch_size()) {
        throw std::invalid_argument("mask must be [" + std::to_string(T) + " x " +
                                    std::to_string(batch.batch_size()) + "], got [" +
                                    std::to_string(batch.mask.rows()) + " x " +
                                    std::to_string(batch.mask.cols()) + "]");
    }

    Seq inputs = batch.inputs;
    for (int col = 0; col < batch.batch_size(); ++col) {
        int last = T - 1;
        while (last >= 0 && batch.mask(last, col) == 0) --last;
        for (int t = last + 1; t < T; ++t) {
            inputs[t].col(col).setZero();
        }
    }
    return inputs;
}

} // namespace

void ModelGrads::zero() {
    for (auto& g : layers) g.zero();
    head.zero();
    window.zero();
}

void ModelGrads::scale(F s) {
    for (auto& g : layers) g.scale(s);
    head.scale(s);
    window.scale(s);
}

F ModelGrads::squared_norm() const {
    F total = head.squared_norm() + window.squared_norm();
    for (const auto& g : layers) total += g.squared_norm();
    return total;
}

// ---------------------------------------------------------------------------
// Unconditional model

HandwritingModel::HandwritingModel(const ModelConfig& config) : config_(config) {
    config_.validate();
    Rng gen(config_.seed);

    const int H = config_.memory_cells;
    layers_.reserve(config_.num_layers);
    for (int l = 0; l < config_.num_layers; ++l) {
        int input_dim = (l == 0) ? 3 : 3 + H;
        layers_.emplace_back(input_dim, H, gen);
    }
    head_ = MixtureHead(config_.stack_width(), config_.n_gaussians, gen);
}

std::vector<LstmState> HandwritingModel::initial_layers(const StateInit& init, int batch) const {
    if (init.kind == StateInit::Kind::Continued) {
        return continued_layers(init, config_.num_layers, config_.memory_cells, batch);
    }
    return std::vector<LstmState>(config_.num_layers, LstmState(config_.memory_cells, batch));
}

ForwardResult HandwritingModel::forward(const Seq& inputs, const StateInit& init) const {
    const int B = check_inputs(inputs);
    const int T = static_cast<int>(inputs.size());
    const int H = config_.memory_cells;
    const int L = config_.num_layers;

    std::vector<LstmState> states = initial_layers(init, B);

    ForwardResult result;
    result.params.reserve(T);
    result.caches.resize(T);

    for (int t = 0; t < T; ++t) {
        const Mat& x = inputs[t];
        StepCache& sc = result.caches[t];
        sc.layers.resize(L);
        sc.hcat.resize(H * L, B);

        for (int l = 0; l < L; ++l) {
            // Skip connection: every layer past the first also sees the raw input
            Mat layer_in = (l == 0) ? x : vstack(states[l - 1].h, x);
            states[l] = layers_[l].forward(layer_in, states[l], sc.layers[l]);
            sc.hcat.middleRows(l * H, H) = states[l].h;
        }
        result.params.push_back(head_.forward(sc.hcat));
    }

    result.final_state.layers = std::move(states);
    return result;
}

void HandwritingModel::backward(const ForwardResult& fwd, const std::vector<MixtureGrads>& dparams,
                                ModelGrads& grads) const {
    const int T = static_cast<int>(fwd.caches.size());
    const int H = config_.memory_cells;
    const int L = config_.num_layers;
    if (T == 0) return;
    const int B = fwd.caches[0].hcat.cols();

    std::vector<Mat> dh_rec(L, Mat::Zero(H, B));
    std::vector<Mat> dc_rec(L, Mat::Zero(H, B));

    for (int t = T - 1; t >= 0; --t) {
        const StepCache& sc = fwd.caches[t];

        Mat dhcat;
        head_.backward(dparams[t], fwd.params[t], sc.hcat, config_.output_clip, grads.head, dhcat);

        Mat dh_from_above = Mat::Zero(H, B);
        for (int l = L - 1; l >= 0; --l) {
            // Gradient arriving at this layer's output from the head and the layer above
            Mat dh_out = dhcat.middleRows(l * H, H) + dh_from_above;
            clamp_inplace(dh_out, config_.hidden_clip);

            Mat dx, dh_prev, dc_prev;
            layers_[l].backward(dh_out + dh_rec[l], dc_rec[l], sc.layers[l], grads.layers[l],
                                dx, dh_prev, dc_prev);
            dh_rec[l] = dh_prev;
            dc_rec[l] = dc_prev;
            if (l > 0) dh_from_above = dx.topRows(H);
        }
    }
}

F HandwritingModel::loss(const StrokeBatch& batch, ModelGrads* grads) const {
    ForwardResult fwd = forward(without_trailing_padding(batch));
    LossEngine engine(config_.eps);
    if (!grads) {
        return engine.loss(batch.targets, fwd.params, batch.mask);
    }
    std::vector<MixtureGrads> dparams;
    F value = engine.loss(batch.targets, fwd.params, batch.mask, &dparams);
    backward(fwd, dparams, *grads);
    return value;
}

ModelGrads HandwritingModel::make_grads() const {
    ModelGrads g;
    for (const auto& cell : layers_) {
        g.layers.emplace_back(cell.input_dim, cell.hidden_dim);
    }
    g.head = MixtureHead::Grads(head_.input_dim, head_.output_dim());
    return g;
}

void HandwritingModel::apply_gradients(const Adam& opt, const ModelGrads& grads,
                                       ModelGrads& m, ModelGrads& v) {
    for (size_t l = 0; l < layers_.size(); ++l) {
        layers_[l].update(opt, grads.layers[l], m.layers[l], v.layers[l]);
    }
    head_.update(opt, grads.head, m.head, v.head);
}

// ---------------------------------------------------------------------------
// Conditional model

SynthesisModel::SynthesisModel(const ModelConfig& config) : config_(config) {
    config_.validate();
    Rng gen(config_.seed);

    const int H = config_.memory_cells;
    const int n_char = config_.n_char;
    window_cell_ = LstmCell(3 + n_char, H, gen);
    window_ = AttentionWindow(H, config_.n_gaussians_window, n_char, gen);

    layers_.reserve(config_.num_layers - 1);
    for (int l = 1; l < config_.num_layers; ++l) {
        layers_.emplace_back(H + 3 + n_char, H, gen);
    }
    head_ = MixtureHead(config_.stack_width(), config_.n_gaussians, gen);
}

void SynthesisModel::check_chars(const CharBatch& chars, int batch) const {
    if (chars.batch_size() != batch) {
        throw std::invalid_argument("character batch has " + std::to_string(chars.batch_size()) +
                                    " sequences, stroke batch has " + std::to_string(batch));
    }
    const int U = chars.max_len();
    if (U <= 0) {
        throw std::invalid_argument("character sequences are empty");
    }
    for (int b = 0; b < batch; ++b) {
        check_shape(chars.chars[b], U, config_.n_char, "chars[" + std::to_string(b) + "]");
    }
}

RecurrentState SynthesisModel::initial_state(const StateInit& init, int batch) const {
    const int H = config_.memory_cells;
    const int K = config_.n_gaussians_window;

    if (init.kind == StateInit::Kind::Continued) {
        RecurrentState state;
        state.layers = continued_layers(init, config_.num_layers, H, batch);
        check_shape(init.state.window, config_.n_char, batch, "state.window");
        check_shape(init.state.kappa, K, batch, "state.kappa");
        state.window = init.state.window;
        state.kappa = init.state.kappa;
        return state;
    }

    RecurrentState state;
    state.layers.assign(config_.num_layers, LstmState(H, batch));
    state.window = Mat::Zero(config_.n_char, batch);
    state.kappa = Mat::Zero(K, batch);
    return state;
}

ForwardResult SynthesisModel::forward(const Seq& inputs, const CharBatch& chars,
                                      const StateInit& init) const {
    const int B = check_inputs(inputs);
    check_chars(chars, B);
    const int T = static_cast<int>(inputs.size());
    const int H = config_.memory_cells;
    const int L = config_.num_layers;

    RecurrentState state = initial_state(init, B);

    ForwardResult result;
    result.params.reserve(T);
    result.caches.resize(T);

    for (int t = 0; t < T; ++t) {
        const Mat& x = inputs[t];
        StepCache& sc = result.caches[t];
        sc.layers.resize(L);
        sc.hcat.resize(H * L, B);

        // Window cell sees the pen point and the previous context vector
        state.layers[0] = window_cell_.forward(vstack(x, state.window), state.layers[0],
                                               sc.layers[0]);
        state.window = window_.forward(state.layers[0].h, state.kappa, chars, sc.window);
        state.kappa = sc.window.kappa;
        sc.hcat.topRows(H) = state.layers[0].h;

        for (int l = 1; l < L; ++l) {
            Mat layer_in = vstack(state.layers[l - 1].h, x, state.window);
            state.layers[l] = layers_[l - 1].forward(layer_in, state.layers[l], sc.layers[l]);
            sc.hcat.middleRows(l * H, H) = state.layers[l].h;
        }
        result.params.push_back(head_.forward(sc.hcat));
    }

    result.final_state = std::move(state);
    return result;
}

void SynthesisModel::backward(const ForwardResult& fwd, const CharBatch& chars,
                              const std::vector<MixtureGrads>& dparams, ModelGrads& grads) const {
    const int T = static_cast<int>(fwd.caches.size());
    const int H = config_.memory_cells;
    const int L = config_.num_layers;
    const int K = config_.n_gaussians_window;
    const int n_char = config_.n_char;
    if (T == 0) return;
    const int B = fwd.caches[0].hcat.cols();

    std::vector<Mat> dh_rec(L, Mat::Zero(H, B));
    std::vector<Mat> dc_rec(L, Mat::Zero(H, B));
    Mat dw_next = Mat::Zero(n_char, B);      // context gradient from the window cell at t+1
    Mat dkappa_next = Mat::Zero(K, B);

    for (int t = T - 1; t >= 0; --t) {
        const StepCache& sc = fwd.caches[t];

        Mat dhcat;
        head_.backward(dparams[t], fwd.params[t], sc.hcat, config_.output_clip, grads.head, dhcat);

        Mat dh_from_above = Mat::Zero(H, B);
        Mat dw = dw_next;
        for (int l = L - 1; l >= 1; --l) {
            Mat dh_out = dhcat.middleRows(l * H, H) + dh_from_above;
            clamp_inplace(dh_out, config_.hidden_clip);

            Mat dx, dh_prev, dc_prev;
            layers_[l - 1].backward(dh_out + dh_rec[l], dc_rec[l], sc.layers[l],
                                    grads.layers[l], dx, dh_prev, dc_prev);
            dh_rec[l] = dh_prev;
            dc_rec[l] = dc_prev;
            dh_from_above = dx.topRows(H);
            dw += dx.bottomRows(n_char);
        }

        clamp_inplace(dw, config_.window_clip);

        Mat dh_window, dkappa_prev;
        window_.backward(dw, dkappa_next, sc.window, chars, grads.window, dh_window, dkappa_prev);
        dkappa_next = dkappa_prev;

        // The window cell output is clamped on its full gradient, recurrent part included
        Mat dh0 = dhcat.topRows(H) + dh_from_above + dh_window + dh_rec[0];
        clamp_inplace(dh0, config_.hidden_clip);

        Mat dx, dh_prev, dc_prev;
        window_cell_.backward(dh0, dc_rec[0], sc.layers[0], grads.layers[0], dx, dh_prev, dc_prev);
        dh_rec[0] = dh_prev;
        dc_rec[0] = dc_prev;
        dw_next = dx.bottomRows(n_char);
    }
}

F SynthesisModel::loss(const StrokeBatch& batch, ModelGrads* grads) const {
    ForwardResult fwd = forward(without_trailing_padding(batch), batch.chars);
    LossEngine engine(config_.eps);
    if (!grads) {
        return engine.loss(batch.targets, fwd.params, batch.mask);
    }
    std::vector<MixtureGrads> dparams;
    F value = engine.loss(batch.targets, fwd.params, batch.mask, &dparams);
    backward(fwd, batch.chars, dparams, *grads);
    return value;
}

ModelGrads SynthesisModel::make_grads() const {
    ModelGrads g;
    g.layers.emplace_back(window_cell_.input_dim, window_cell_.hidden_dim);
    for (const auto& cell : layers_) {
        g.layers.emplace_back(cell.input_dim, cell.hidden_dim);
    }
    g.head = MixtureHead::Grads(head_.input_dim, head_.output_dim());
    g.window = AttentionWindow::Grads(window_.hidden_dim, window_.n_components);
    return g;
}

void SynthesisModel::apply_gradients(const Adam& opt, const ModelGrads& grads,
                                     ModelGrads& m, ModelGrads& v) {
    window_cell_.update(opt, grads.layers[0], m.layers[0], v.layers[0]);
    window_.update(opt, grads.window, m.window, v.window);
    for (size_t l = 0; l < layers_.size(); ++l) {
        layers_[l].update(opt, grads.layers[l + 1], m.layers[l + 1], v.layers[l + 1]);
    }
    head_.update(opt, grads.head, m.head, v.head);
}

} // namespace scribe
