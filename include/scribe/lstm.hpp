#pragma once
#include "types.hpp"
#include "numerics.hpp"
#include "optim.hpp"

namespace scribe {

struct LstmCache {
    Mat x;        // input
    Mat h_prev;
    Mat c_prev;
    Mat i, f, g, o;  // gate activations
    Mat c;
    Mat tanh_c;
};

// Single-layer LSTM cell over a batch (one column per element).
// Gate layout in the stacked weights is i, f, g, o.
struct LstmCell {
    int input_dim = 0;
    int hidden_dim = 0;

    Mat Wx;   // [4H x input_dim]
    Mat Wh;   // [4H x H]
    Vec b;    // [4H]

    LstmCell() = default;
    LstmCell(int input_dim_, int hidden_dim_, Rng& gen);

    LstmState forward(const Mat& x, const LstmState& prev, LstmCache& cache) const;

    struct Grads {
        Mat dWx;
        Mat dWh;
        Vec db;

        Grads() = default;
        Grads(int input_dim, int hidden_dim)
            : dWx(Mat::Zero(4 * hidden_dim, input_dim)),
              dWh(Mat::Zero(4 * hidden_dim, hidden_dim)),
              db(Vec::Zero(4 * hidden_dim)) {}

        void zero() {
            dWx.setZero();
            dWh.setZero();
            db.setZero();
        }

        void scale(F s) {
            dWx *= s;
            dWh *= s;
            db *= s;
        }

        F squared_norm() const {
            return dWx.squaredNorm() + dWh.squaredNorm() + db.squaredNorm();
        }
    };

    // dh: total gradient on h_t, dc: gradient on c_t from step t+1
    void backward(const Mat& dh, const Mat& dc, const LstmCache& cache,
                  Grads& grads, Mat& dx, Mat& dh_prev, Mat& dc_prev) const;

    void update(const Adam& opt, const Grads& grads, Grads& m, Grads& v);
};

} // namespace scribe
