#include "scribe/sampler.hpp"
#include <Eigen/Cholesky>
#include <stdexcept>
#include <string>
#include <vector>

namespace scribe {

Mat Sampler::sample(const MixtureParams& p) {
    const int B = p.batch_size();
    const int m = p.n_gaussians();
    Mat out(3, B);

    // 1. pen lift
    for (int col = 0; col < B; ++col) {
        F e = p.e(col);
        if (!(e >= 0.0 && e <= 1.0)) {
            throw std::runtime_error("sample: invalid pen-lift probability " + std::to_string(e) +
                                     " in column " + std::to_string(col));
        }
        std::bernoulli_distribution lift(e);
        out(0, col) = lift(gen_) ? 1.0 : 0.0;
    }

    // 2. active mixture component
    std::vector<int> component(B);
    for (int col = 0; col < B; ++col) {
        Vec weights = p.pi.col(col);
        if (!weights.allFinite()) {
            throw std::runtime_error("sample: non-finite mixture weights in column " +
                                     std::to_string(col));
        }
        std::discrete_distribution<int> pick(weights.data(), weights.data() + m);
        component[col] = pick(gen_);
    }

    // 3-5. offset from the selected bivariate normal
    for (int col = 0; col < B; ++col) {
        const int j = component[col];
        Eigen::Vector2d mu(p.mu_x(j, col), p.mu_y(j, col));
        F sx = p.sigma_x(j, col);
        F sy = p.sigma_y(j, col);
        F rho = p.rho(j, col);

        Eigen::Matrix2d cov;
        cov << sx * sx, rho * sx * sy,
               rho * sx * sy, sy * sy;

        Eigen::LLT<Eigen::Matrix2d> llt(cov);
        if (llt.info() != Eigen::Success) {
            throw std::runtime_error("sample: covariance of component " + std::to_string(j) +
                                     " is not positive definite");
        }

        std::normal_distribution<F> normal(0.0, 1.0);
        Eigen::Vector2d z;
        z(0) = normal(gen_);
        z(1) = normal(gen_);
        out.block<2, 1>(1, col) = mu + llt.matrixL() * z;
    }

    return out;
}

} // namespace scribe
