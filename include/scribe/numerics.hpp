#pragma once
#include "types.hpp"
#include <random>

namespace scribe {

using Rng = std::mt19937;

// Parameter initializers
Mat orthogonal(int rows, int cols, Rng& gen);
Mat xavier_uniform(int rows, int cols, Rng& gen);
Vec uniform_bias(int n, F scale, Rng& gen);

inline Mat sigmoid(const Mat& z) {
    return (1.0 / (1.0 + (-z.array()).exp())).matrix();
}

// Column-wise reductions over the mixture axis
Vec logsumexp_cols(const Mat& z);
Mat log_softmax_cols(const Mat& z);
Mat softmax_cols(const Mat& z);

// Elementwise clamp to [-bound, bound]
inline void clamp_inplace(Mat& m, F bound) {
    m = m.cwiseMax(-bound).cwiseMin(bound);
}

// Stack matrices with equal column count vertically
Mat vstack(const Mat& top, const Mat& bottom);
Mat vstack(const Mat& top, const Mat& middle, const Mat& bottom);

bool all_finite(const Mat& m);

} // namespace scribe
