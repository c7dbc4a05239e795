#include "scribe/mixture.hpp"

namespace scribe {

MixtureHead::MixtureHead(int input_dim_, int n_gaussians_, Rng& gen)
    : input_dim(input_dim_), n_gaussians(n_gaussians_) {
    W = xavier_uniform(output_dim(), input_dim, gen);
    b = uniform_bias(output_dim(), 1e-2, gen);
}

MixtureParams MixtureHead::forward(const Mat& h) const {
    Mat y = W * h;
    y.colwise() += b;
    return transform(y, n_gaussians);
}

MixtureParams MixtureHead::transform(const Mat& y, int m) {
    const int B = y.cols();
    MixtureParams p;

    p.pi = softmax_cols(y.topRows(m));
    p.log_pi = log_softmax_cols(y.topRows(m));

    p.mu_x.resize(m, B);
    p.mu_y.resize(m, B);
    p.sigma_x.resize(m, B);
    p.sigma_y.resize(m, B);
    for (int j = 0; j < m; ++j) {
        p.mu_x.row(j) = y.row(m + 2 * j);
        p.mu_y.row(j) = y.row(m + 2 * j + 1);
        p.sigma_x.row(j) = y.row(3 * m + 2 * j).array().exp().matrix();
        p.sigma_y.row(j) = y.row(3 * m + 2 * j + 1).array().exp().matrix();
    }

    p.rho = y.middleRows(5 * m, m).array().tanh();
    p.e = sigmoid(y.row(6 * m).transpose());
    return p;
}

Mat MixtureHead::output_grad(const MixtureGrads& dp, const MixtureParams& p) const {
    const int m = n_gaussians;
    Mat dy(output_dim(), p.batch_size());

    // log_softmax: dy_k = g_k - pi_k * sum_j g_j
    Eigen::RowVectorXd g_sum = dp.dlog_pi.colwise().sum();
    dy.topRows(m) = dp.dlog_pi - (p.pi.array().rowwise() * g_sum.array()).matrix();

    for (int j = 0; j < m; ++j) {
        dy.row(m + 2 * j) = dp.dmu_x.row(j);
        dy.row(m + 2 * j + 1) = dp.dmu_y.row(j);
        dy.row(3 * m + 2 * j) = dp.dsigma_x.row(j).cwiseProduct(p.sigma_x.row(j));
        dy.row(3 * m + 2 * j + 1) = dp.dsigma_y.row(j).cwiseProduct(p.sigma_y.row(j));
    }

    dy.middleRows(5 * m, m) = (dp.drho.array() * (1.0 - p.rho.array().square())).matrix();
    dy.row(6 * m) = (dp.de.array() * p.e.array() * (1.0 - p.e.array())).matrix().transpose();
    return dy;
}

void MixtureHead::backward(const MixtureGrads& dp, const MixtureParams& p, const Mat& h,
                           F output_clip, Grads& grads, Mat& dh) const {
    Mat dy = output_grad(dp, p);
    clamp_inplace(dy, output_clip);

    grads.dW += dy * h.transpose();
    grads.db += dy.rowwise().sum();
    dh = W.transpose() * dy;
}

void MixtureHead::update(const Adam& opt, const Grads& grads, Grads& m, Grads& v) {
    opt.step(W, m.dW, v.dW, grads.dW);
    opt.step(b, m.db, v.db, grads.db);
}

} // namespace scribe
