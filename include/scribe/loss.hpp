#pragma once
#include "types.hpp"
#include <vector>

namespace scribe {

// Log density of 2-D offsets [2 x B] under the bivariate Gaussian mixture in p,
// reduced over components with log-sum-exp. Uses sigma and rho as given.
Vec mog_log_density(const Mat& offsets, const MixtureParams& p);

// Masked negative log-likelihood of next points under the mixture outputs.
class LossEngine {
public:
    explicit LossEngine(F eps = 1e-4) : eps_(eps) {}

    // targets: [T] of (3 x B); mask: [T x B].
    // Returns -sum(valid log-likelihood) / sum(mask). Steps with mask 0 are
    // skipped entirely. When grads is given it is filled with dLoss/dparams.
    F loss(const Seq& targets, const std::vector<MixtureParams>& params,
           const Mat& mask, std::vector<MixtureGrads>* grads = nullptr) const;

    // Log-likelihood (offset density plus pen term) of one step, per column
    Vec step_log_likelihood(const Mat& target, const MixtureParams& p) const;

private:
    F eps_;

    MixtureParams stabilized(const MixtureParams& p) const;
    Vec pen_term(const Mat& target, const MixtureParams& p) const;
    void step_backward(const Mat& target, const MixtureParams& p, const Vec& weight,
                       MixtureGrads& grads) const;
};

} // namespace scribe
