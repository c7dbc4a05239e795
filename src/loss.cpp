#include "scribe/loss.hpp"
#include "scribe/numerics.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace scribe {

namespace {

const F kLog2Pi = 1.8378770664093453;   // log(2 pi)

// Per-component quantities of the bivariate Gaussian log density, [m x B]
struct DensityTerms {
    Eigen::ArrayXXd zx, zy;   // standardized offsets
    Eigen::ArrayXXd z;        // zx^2 + zy^2 - 2 rho zx zy
    Eigen::ArrayXXd q;        // 1 - rho^2
    Eigen::ArrayXXd log_comp; // log pi_j + log N_j
    Vec log_density;          // log-sum-exp over components
};

DensityTerms density_terms(const Mat& offsets, const MixtureParams& p) {
    const int m = p.n_gaussians();
    DensityTerms t;

    Eigen::ArrayXXd x = offsets.row(0).replicate(m, 1).array();
    Eigen::ArrayXXd y = offsets.row(1).replicate(m, 1).array();
    const auto sx = p.sigma_x.array();
    const auto sy = p.sigma_y.array();
    const auto r = p.rho.array();

    t.zx = (x - p.mu_x.array()) / sx;
    t.zy = (y - p.mu_y.array()) / sy;
    t.q = 1.0 - r.square();
    t.z = t.zx.square() + t.zy.square() - 2.0 * r * t.zx * t.zy;

    t.log_comp = -t.z / (2.0 * t.q)
                 - (kLog2Pi + sx.log() + sy.log() + 0.5 * t.q.log())
                 + p.log_pi.array();

    // Exponentiation only happens inside the reduction
    t.log_density = logsumexp_cols(t.log_comp.matrix());
    return t;
}

void check_offsets(const Mat& offsets, const MixtureParams& p) {
    if (offsets.rows() != 2 || offsets.cols() != p.batch_size()) {
        throw std::invalid_argument("offsets must be [2 x " + std::to_string(p.batch_size()) +
                                    "], got [" + std::to_string(offsets.rows()) + " x " +
                                    std::to_string(offsets.cols()) + "]");
    }
}

} // namespace

Vec mog_log_density(const Mat& offsets, const MixtureParams& p) {
    check_offsets(offsets, p);
    return density_terms(offsets, p).log_density;
}

MixtureParams LossEngine::stabilized(const MixtureParams& p) const {
    MixtureParams s = p;
    s.sigma_x.array() += eps_;
    s.sigma_y.array() += eps_;
    s.rho /= (1.0 + eps_);
    return s;
}

Vec LossEngine::pen_term(const Mat& target, const MixtureParams& p) const {
    Eigen::ArrayXd lift = target.row(0).transpose().array();
    Eigen::ArrayXd e = p.e.array();
    Eigen::ArrayXd pe = e * lift + (1.0 - e) * (1.0 - lift);
    return ((pe + eps_) / (1.0 + 2.0 * eps_)).matrix();
}

Vec LossEngine::step_log_likelihood(const Mat& target, const MixtureParams& p) const {
    Mat offsets = target.bottomRows(2);
    check_offsets(offsets, p);

    Vec log_density = density_terms(offsets, stabilized(p)).log_density;
    return log_density + pen_term(target, p).array().log().matrix();
}

F LossEngine::loss(const Seq& targets, const std::vector<MixtureParams>& params,
                   const Mat& mask, std::vector<MixtureGrads>* grads) const {
    const int T = static_cast<int>(targets.size());
    if (T == 0 || static_cast<int>(params.size()) != T || mask.rows() != T) {
        throw std::invalid_argument("loss: targets, params and mask disagree on sequence length");
    }
    const int B = params[0].batch_size();
    if (mask.cols() != B) {
        throw std::invalid_argument("loss: mask has " + std::to_string(mask.cols()) +
                                    " columns, expected " + std::to_string(B));
    }

    F count = mask.sum();
    if (!(count > 0)) {
        throw std::invalid_argument("loss: mask has no valid steps");
    }

    F total = 0.0;
    for (int t = 0; t < T; ++t) {
        if (targets[t].rows() != 3 || targets[t].cols() != B) {
            throw std::invalid_argument("loss: targets[" + std::to_string(t) + "] must be [3 x " +
                                        std::to_string(B) + "]");
        }
        if (mask.row(t).isZero()) continue;

        Vec ll = step_log_likelihood(targets[t], params[t]);
        for (int col = 0; col < B; ++col) {
            if (mask(t, col) != 0) total += mask(t, col) * ll(col);
        }
    }

    if (grads) {
        grads->assign(T, MixtureGrads());
        for (int t = 0; t < T; ++t) {
            Vec weight = -mask.row(t).transpose() / count;
            step_backward(targets[t], params[t], weight, (*grads)[t]);
        }
    }

    return -total / count;
}

void LossEngine::step_backward(const Mat& target, const MixtureParams& p, const Vec& weight,
                               MixtureGrads& g) const {
    const int m = p.n_gaussians();
    const int B = p.batch_size();
    g = MixtureGrads(m, B);
    if (weight.isZero()) return;

    MixtureParams s = stabilized(p);
    DensityTerms t = density_terms(target.bottomRows(2), s);

    // Component responsibilities: d log_density / d log_comp
    Eigen::ArrayXXd gamma =
        (t.log_comp.matrix().rowwise() - t.log_density.transpose()).array().exp();

    const auto sx = s.sigma_x.array();
    const auto sy = s.sigma_y.array();
    const auto r = s.rho.array();
    Eigen::ArrayXXd ax = (t.zx - r * t.zy) / t.q;
    Eigen::ArrayXXd ay = (t.zy - r * t.zx) / t.q;

    const auto w = weight.asDiagonal();
    g.dlog_pi = gamma.matrix() * w;
    g.dmu_x = (gamma * ax / sx).matrix() * w;
    g.dmu_y = (gamma * ay / sy).matrix() * w;
    g.dsigma_x = (gamma * (t.zx * ax - 1.0) / sx).matrix() * w;
    g.dsigma_y = (gamma * (t.zy * ay - 1.0) / sy).matrix() * w;
    g.drho = (gamma * (t.zx * t.zy / t.q - t.z * r / t.q.square() + r / t.q) /
              (1.0 + eps_)).matrix() * w;

    Eigen::ArrayXd lift = target.row(0).transpose().array();
    Eigen::ArrayXd e = p.e.array();
    Eigen::ArrayXd pe = e * lift + (1.0 - e) * (1.0 - lift);
    g.de = ((2.0 * lift - 1.0) / (pe + eps_) * weight.array()).matrix();

    // Padded columns contribute nothing, whatever values they hold
    for (int col = 0; col < B; ++col) {
        if (weight(col) != 0) continue;
        g.de(col) = 0.0;
        g.dlog_pi.col(col).setZero();
        g.dmu_x.col(col).setZero();
        g.dmu_y.col(col).setZero();
        g.dsigma_x.col(col).setZero();
        g.dsigma_y.col(col).setZero();
        g.drho.col(col).setZero();
    }
}

} // namespace scribe
