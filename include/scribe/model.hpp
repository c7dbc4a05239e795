#pragma once
#include "config.hpp"
#include "lstm.hpp"
#include "mixture.hpp"
#include "window.hpp"
#include <vector>

namespace scribe {

// Cached computation of one time step, kept for backpropagation
struct StepCache {
    std::vector<LstmCache> layers;
    Mat hcat;            // concatenated layer outputs fed to the head
    WindowCache window;  // conditional model only
};

struct ForwardResult {
    std::vector<MixtureParams> params;  // [T]
    RecurrentState final_state;
    std::vector<StepCache> caches;      // [T]
};

// Parameter gradients shared by both model variants. For the conditional
// model layers[0] is the window-driving cell.
struct ModelGrads {
    std::vector<LstmCell::Grads> layers;
    MixtureHead::Grads head;
    AttentionWindow::Grads window;

    void zero();
    void scale(F s);
    F squared_norm() const;
};

// Unconditional model: stacked LSTMs with the raw input re-injected at every
// depth, followed by the mixture head.
class HandwritingModel {
public:
    explicit HandwritingModel(const ModelConfig& config);

    ForwardResult forward(const Seq& inputs, const StateInit& init = StateInit::fresh()) const;

    void backward(const ForwardResult& fwd, const std::vector<MixtureGrads>& dparams,
                  ModelGrads& grads) const;

    // Loss over a padded batch; fills grads (accumulating) when given
    F loss(const StrokeBatch& batch, ModelGrads* grads = nullptr) const;

    ModelGrads make_grads() const;
    void apply_gradients(const Adam& opt, const ModelGrads& grads, ModelGrads& m, ModelGrads& v);

    const ModelConfig& config() const { return config_; }
    std::vector<LstmCell>& layers() { return layers_; }
    MixtureHead& head() { return head_; }

private:
    ModelConfig config_;
    std::vector<LstmCell> layers_;
    MixtureHead head_;

    std::vector<LstmState> initial_layers(const StateInit& init, int batch) const;
};

// Conditional synthesis model: layer 0 drives the attention window; later
// layers see the previous layer output, the raw input and the context vector.
class SynthesisModel {
public:
    explicit SynthesisModel(const ModelConfig& config);

    ForwardResult forward(const Seq& inputs, const CharBatch& chars,
                          const StateInit& init = StateInit::fresh()) const;

    void backward(const ForwardResult& fwd, const CharBatch& chars,
                  const std::vector<MixtureGrads>& dparams, ModelGrads& grads) const;

    F loss(const StrokeBatch& batch, ModelGrads* grads = nullptr) const;

    ModelGrads make_grads() const;
    void apply_gradients(const Adam& opt, const ModelGrads& grads, ModelGrads& m, ModelGrads& v);

    const ModelConfig& config() const { return config_; }
    LstmCell& window_cell() { return window_cell_; }
    AttentionWindow& window() { return window_; }
    std::vector<LstmCell>& layers() { return layers_; }
    MixtureHead& head() { return head_; }

private:
    ModelConfig config_;
    LstmCell window_cell_;
    AttentionWindow window_;
    std::vector<LstmCell> layers_;   // layers 1..N-1
    MixtureHead head_;

    RecurrentState initial_state(const StateInit& init, int batch) const;
    void check_chars(const CharBatch& chars, int batch) const;
};

} // namespace scribe
