#pragma once
#include <Eigen/Dense>
#include <vector>
#include <utility>

namespace scribe {

using F   = double;
using Mat = Eigen::MatrixXd;
using Vec = Eigen::VectorXd;

// Time-major sequence: [T] of (features x batch), one column per batch element
using Seq = std::vector<Mat>;

// Hidden and cell state of one recurrent layer, each [memory_cells x batch]
struct LstmState {
    Mat h;
    Mat c;

    LstmState() = default;
    LstmState(int hidden_dim, int batch)
        : h(Mat::Zero(hidden_dim, batch)), c(Mat::Zero(hidden_dim, batch)) {}
};

// Everything threaded from one time step to the next.
// window and kappa stay empty for the unconditional model.
struct RecurrentState {
    std::vector<LstmState> layers;
    Mat window;   // [n_char x batch] last context vector
    Mat kappa;    // [K x batch] window positions
};

// Explicit choice between a zero-initialized and a caller-supplied prior state
struct StateInit {
    enum class Kind { Fresh, Continued };

    Kind kind = Kind::Fresh;
    RecurrentState state;

    static StateInit fresh() { return StateInit{}; }

    static StateInit continued(RecurrentState state) {
        StateInit init;
        init.kind = Kind::Continued;
        init.state = std::move(state);
        return init;
    }
};

// Padded one-hot character sequences, one [U x n_char] matrix per batch element.
// Rows past lengths[b] are zero.
struct CharBatch {
    std::vector<Mat> chars;
    std::vector<int> lengths;

    int batch_size() const { return static_cast<int>(chars.size()); }
    int max_len() const { return chars.empty() ? 0 : static_cast<int>(chars[0].rows()); }
    int n_char() const { return chars.empty() ? 0 : static_cast<int>(chars[0].cols()); }
    bool empty() const { return chars.empty(); }
};

// Padded training batch: targets[t] is the point following inputs[t]
struct StrokeBatch {
    Seq inputs;      // [T] of (3 x B): lift, dx, dy
    Seq targets;     // [T] of (3 x B)
    Mat mask;        // [T x B], 1 = real data, 0 = padding
    CharBatch chars; // empty for unconditional training

    int seq_len() const { return static_cast<int>(inputs.size()); }
    int batch_size() const { return inputs.empty() ? 0 : static_cast<int>(inputs[0].cols()); }
};

// Mixture density parameters for one time step. Component matrices are [m x batch].
struct MixtureParams {
    Vec e;          // [batch] pen-lift probability
    Mat pi;         // mixture weights, columns sum to 1
    Mat log_pi;
    Mat mu_x, mu_y;
    Mat sigma_x, sigma_y;
    Mat rho;

    int n_gaussians() const { return static_cast<int>(pi.rows()); }
    int batch_size() const { return static_cast<int>(e.size()); }
};

// Loss gradient with respect to the constrained mixture parameters
struct MixtureGrads {
    Vec de;
    Mat dlog_pi;
    Mat dmu_x, dmu_y;
    Mat dsigma_x, dsigma_y;
    Mat drho;

    MixtureGrads() = default;
    MixtureGrads(int m, int batch)
        : de(Vec::Zero(batch)), dlog_pi(Mat::Zero(m, batch)),
          dmu_x(Mat::Zero(m, batch)), dmu_y(Mat::Zero(m, batch)),
          dsigma_x(Mat::Zero(m, batch)), dsigma_y(Mat::Zero(m, batch)),
          drho(Mat::Zero(m, batch)) {}
};

} // namespace scribe
