#pragma once
#include "types.hpp"
#include "numerics.hpp"
#include "optim.hpp"

namespace scribe {

// Projects the concatenated hidden outputs to 6m+1 raw values and maps them
// to mixture parameters.
//
// Raw layout per column: [0, m) weight logits, [m, 3m) means as interleaved
// (x, y) pairs, [3m, 5m) log std-devs as (x, y) pairs, [5m, 6m) correlation
// pre-activations, [6m] pen-lift logit.
struct MixtureHead {
    int input_dim = 0;
    int n_gaussians = 0;

    Mat W;   // [(6m+1) x input_dim]
    Vec b;

    MixtureHead() = default;
    MixtureHead(int input_dim_, int n_gaussians_, Rng& gen);

    int output_dim() const { return 6 * n_gaussians + 1; }

    MixtureParams forward(const Mat& h) const;

    // Nonlinear output transform, no clamping of y
    static MixtureParams transform(const Mat& y, int n_gaussians);

    struct Grads {
        Mat dW;
        Vec db;

        Grads() = default;
        Grads(int input_dim, int output_dim)
            : dW(Mat::Zero(output_dim, input_dim)), db(Vec::Zero(output_dim)) {}

        void zero() { dW.setZero(); db.setZero(); }
        void scale(F s) { dW *= s; db *= s; }
        F squared_norm() const { return dW.squaredNorm() + db.squaredNorm(); }
    };

    // Gradient of the raw projection output, before clamping
    Mat output_grad(const MixtureGrads& dp, const MixtureParams& p) const;

    // The projection output gradient is clamped to [-output_clip, output_clip]
    void backward(const MixtureGrads& dp, const MixtureParams& p, const Mat& h,
                  F output_clip, Grads& grads, Mat& dh) const;

    void update(const Adam& opt, const Grads& grads, Grads& m, Grads& v);
};

} // namespace scribe
