#include "scribe/numerics.hpp"
#include <Eigen/QR>
#include <cmath>

namespace scribe {

Mat orthogonal(int rows, int cols, Rng& gen) {
    std::normal_distribution<F> dist(0.0, 1.0);

    // Factor the tall orientation so the columns of Q are orthonormal
    const bool transposed = rows < cols;
    const int r = transposed ? cols : rows;
    const int c = transposed ? rows : cols;

    Mat a = Mat::NullaryExpr(r, c, [&]() { return dist(gen); });
    Eigen::HouseholderQR<Mat> qr(a);
    Mat q = qr.householderQ() * Mat::Identity(r, c);

    // Sign convention makes the result uniformly distributed
    Vec d = qr.matrixQR().diagonal();
    for (int j = 0; j < c; ++j) {
        if (d(j) < 0) q.col(j) *= -1.0;
    }

    if (transposed) return q.transpose();
    return q;
}

Mat xavier_uniform(int rows, int cols, Rng& gen) {
    F bound = std::sqrt(6.0 / static_cast<F>(rows + cols));
    std::uniform_real_distribution<F> dist(-bound, bound);
    return Mat::NullaryExpr(rows, cols, [&]() { return dist(gen); });
}

Vec uniform_bias(int n, F scale, Rng& gen) {
    std::uniform_real_distribution<F> dist(-scale, scale);
    return Vec::NullaryExpr(n, [&]() { return dist(gen); });
}

Vec logsumexp_cols(const Mat& z) {
    Vec out(z.cols());
    for (int j = 0; j < z.cols(); ++j) {
        F max_z = z.col(j).maxCoeff();
        if (!std::isfinite(max_z)) {
            // all -inf stays -inf, NaN and +inf propagate
            out(j) = max_z;
            continue;
        }
        out(j) = max_z + std::log((z.col(j).array() - max_z).exp().sum());
    }
    return out;
}

Mat log_softmax_cols(const Mat& z) {
    Vec lse = logsumexp_cols(z);
    return z.rowwise() - lse.transpose();
}

Mat softmax_cols(const Mat& z) {
    Mat out(z.rows(), z.cols());
    for (int j = 0; j < z.cols(); ++j) {
        F max_z = z.col(j).maxCoeff();
        Vec exp_z = (z.col(j).array() - max_z).exp().matrix();
        out.col(j) = exp_z / exp_z.sum();
    }
    return out;
}

Mat vstack(const Mat& top, const Mat& bottom) {
    Mat out(top.rows() + bottom.rows(), top.cols());
    out << top, bottom;
    return out;
}

Mat vstack(const Mat& top, const Mat& middle, const Mat& bottom) {
    Mat out(top.rows() + middle.rows() + bottom.rows(), top.cols());
    out << top, middle, bottom;
    return out;
}

bool all_finite(const Mat& m) {
    return m.allFinite();
}

} // namespace scribe
