#pragma once
#include "types.hpp"
#include "numerics.hpp"
#include "optim.hpp"

namespace scribe {

struct WindowCache {
    Mat h;        // window cell output that drove this step
    Mat params;   // [3K x B] exp of the projection: alpha, beta, kappa increment
    Mat alpha;    // [K x B]
    Mat beta;     // [K x B] positive; enters the kernel negated
    Mat kappa;    // [K x B] accumulated position after this step
    Mat phi;      // [U x B] window weights over character positions
    Mat w;        // [n_char x B] context vector
};

// Gaussian soft window over a character sequence.
//   phi(u) = sum_k alpha_k * exp(-beta_k * (kappa_k - u)^2),  u = 1..U
//   w      = sum_u phi(u) * c_u
// kappa advances by a strictly positive increment every step.
struct AttentionWindow {
    int hidden_dim = 0;
    int n_components = 0;   // K
    int n_char = 0;

    Mat W;   // [3K x hidden_dim]
    Vec b;

    AttentionWindow() = default;
    AttentionWindow(int hidden_dim_, int n_components_, int n_char_, Rng& gen);

    Mat forward(const Mat& h, const Mat& kappa_prev, const CharBatch& chars,
                WindowCache& cache) const;

    struct Grads {
        Mat dW;
        Vec db;

        Grads() = default;
        Grads(int hidden_dim, int n_components)
            : dW(Mat::Zero(3 * n_components, hidden_dim)), db(Vec::Zero(3 * n_components)) {}

        void zero() { dW.setZero(); db.setZero(); }
        void scale(F s) { dW *= s; db *= s; }
        F squared_norm() const { return dW.squaredNorm() + db.squaredNorm(); }
    };

    // dw: gradient on this step's context vector (already clamped by the caller)
    // dkappa: gradient on this step's kappa arriving from step t+1
    void backward(const Mat& dw, const Mat& dkappa, const WindowCache& cache,
                  const CharBatch& chars, Grads& grads, Mat& dh, Mat& dkappa_prev) const;

    void update(const Adam& opt, const Grads& grads, Grads& m, Grads& v);
};

} // namespace scribe
