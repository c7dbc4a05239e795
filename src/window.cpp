#include "scribe/window.hpp"

namespace scribe {

AttentionWindow::AttentionWindow(int hidden_dim_, int n_components_, int n_char_, Rng& gen)
    : hidden_dim(hidden_dim_), n_components(n_components_), n_char(n_char_) {
    W = xavier_uniform(3 * n_components, hidden_dim, gen);
    b = uniform_bias(3 * n_components, 1e-2, gen);
}

Mat AttentionWindow::forward(const Mat& h, const Mat& kappa_prev, const CharBatch& chars,
                             WindowCache& cache) const {
    const int K = n_components;
    const int B = h.cols();
    const int U = chars.max_len();

    Mat z = W * h;
    z.colwise() += b;

    cache.h = h;
    cache.params = z.array().exp();
    cache.alpha = cache.params.topRows(K);
    cache.beta = cache.params.middleRows(K, K);
    cache.kappa = kappa_prev + cache.params.bottomRows(K);

    const auto alpha = cache.alpha.array();
    const auto beta = cache.beta.array();
    const auto kappa = cache.kappa.array();

    // Character positions are 1-based
    cache.phi.resize(U, B);
    for (int u = 0; u < U; ++u) {
        Eigen::ArrayXXd diff = kappa - static_cast<F>(u + 1);
        cache.phi.row(u) = (alpha * (-beta * diff.square()).exp()).colwise().sum().matrix();
    }

    cache.w.resize(n_char, B);
    for (int col = 0; col < B; ++col) {
        cache.w.col(col) = chars.chars[col].transpose() * cache.phi.col(col);
    }
    return cache.w;
}

void AttentionWindow::backward(const Mat& dw, const Mat& dkappa, const WindowCache& cache,
                               const CharBatch& chars, Grads& grads, Mat& dh,
                               Mat& dkappa_prev) const {
    const int K = n_components;
    const int B = cache.h.cols();
    const int U = chars.max_len();

    Mat dphi(U, B);
    for (int col = 0; col < B; ++col) {
        dphi.col(col) = chars.chars[col] * dw.col(col);
    }

    const auto alpha = cache.alpha.array();
    const auto beta = cache.beta.array();
    const auto kappa = cache.kappa.array();

    Eigen::ArrayXXd dalpha = Eigen::ArrayXXd::Zero(K, B);
    Eigen::ArrayXXd dbeta = Eigen::ArrayXXd::Zero(K, B);
    Eigen::ArrayXXd dkappa_local = Eigen::ArrayXXd::Zero(K, B);
    for (int u = 0; u < U; ++u) {
        Eigen::ArrayXXd diff = kappa - static_cast<F>(u + 1);
        Eigen::ArrayXXd kernel = (-beta * diff.square()).exp();
        Eigen::ArrayXXd dphi_u = dphi.row(u).array().replicate(K, 1);
        Eigen::ArrayXXd weighted = alpha * kernel * dphi_u;

        dalpha += kernel * dphi_u;
        dbeta -= weighted * diff.square();
        dkappa_local -= 2.0 * beta * weighted * diff;
    }

    // kappa_t = kappa_{t-1} + increment: both receive the full kappa gradient
    dkappa_prev = dkappa + dkappa_local.matrix();

    Mat dparams(3 * K, B);
    dparams << dalpha.matrix(), dbeta.matrix(), dkappa_prev;
    Mat dz = dparams.cwiseProduct(cache.params);

    grads.dW += dz * cache.h.transpose();
    grads.db += dz.rowwise().sum();
    dh = W.transpose() * dz;
}

void AttentionWindow::update(const Adam& opt, const Grads& grads, Grads& m, Grads& v) {
    opt.step(W, m.dW, v.dW, grads.dW);
    opt.step(b, m.db, v.db, grads.db);
}

} // namespace scribe
