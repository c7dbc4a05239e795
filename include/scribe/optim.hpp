#pragma once
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace scribe {

// Adam optimizer with bias correction.
// Call begin_step() once per update, then step() for every parameter.
struct Adam {
    F lr;      // learning rate
    F beta1;   // exponential decay rate for first moment
    F beta2;   // exponential decay rate for second moment
    F eps;     // small constant for numerical stability
    int t;     // update counter

    explicit Adam(F lr_ = 1e-3, F beta1_ = 0.9, F beta2_ = 0.999, F eps_ = 1e-8)
        : lr(lr_), beta1(beta1_), beta2(beta2_), eps(eps_), t(0) {}

    void begin_step() { t++; }

    void step(Mat& param, Mat& m, Mat& v, const Mat& grad) const {
        m = beta1 * m + (1.0 - beta1) * grad;
        v = beta2 * v + (1.0 - beta2) * grad.cwiseProduct(grad);

        Mat m_hat = m / (1.0 - std::pow(beta1, t));
        Mat v_hat = v / (1.0 - std::pow(beta2, t));

        param -= lr * m_hat.cwiseQuotient((v_hat.array().sqrt() + eps).matrix());
    }

    void step(Vec& param, Vec& m, Vec& v, const Vec& grad) const {
        m = beta1 * m + (1.0 - beta1) * grad;
        v = beta2 * v + (1.0 - beta2) * grad.cwiseProduct(grad);

        Vec m_hat = m / (1.0 - std::pow(beta1, t));
        Vec v_hat = v / (1.0 - std::pow(beta2, t));

        param -= lr * m_hat.cwiseQuotient((v_hat.array().sqrt() + eps).matrix());
    }
};

// Scale gradients so their global L2 norm is at most max_norm.
// Returns the norm before clipping.
template <class Grads>
F clip_grad_norm(Grads& grads, F max_norm) {
    F norm = std::sqrt(grads.squared_norm());
    if (norm > max_norm) {
        grads.scale(max_norm / (norm + 1e-6));
    }
    return norm;
}

// Multiply the learning rate by factor when the monitored loss has not
// improved for more than patience consecutive epochs
struct ReduceOnPlateau {
    F factor;
    int patience;
    F min_lr;
    F best;
    int bad_epochs;

    explicit ReduceOnPlateau(F factor_ = std::sqrt(0.1), int patience_ = 10, F min_lr_ = 0.0)
        : factor(factor_), patience(patience_), min_lr(min_lr_),
          best(std::numeric_limits<F>::infinity()), bad_epochs(0) {}

    // Returns true when the learning rate was reduced
    bool step(F metric, Adam& opt) {
        if (metric < best) {
            best = metric;
            bad_epochs = 0;
            return false;
        }
        if (++bad_epochs > patience) {
            bad_epochs = 0;
            F new_lr = std::max(opt.lr * factor, min_lr);
            bool reduced = new_lr < opt.lr;
            opt.lr = new_lr;
            return reduced;
        }
        return false;
    }
};

} // namespace scribe
