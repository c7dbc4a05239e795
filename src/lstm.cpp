#include "scribe/lstm.hpp"

namespace scribe {

LstmCell::LstmCell(int input_dim_, int hidden_dim_, Rng& gen)
    : input_dim(input_dim_), hidden_dim(hidden_dim_) {
    Wx = orthogonal(4 * hidden_dim, input_dim, gen);
    Wh = orthogonal(4 * hidden_dim, hidden_dim, gen);
    b = uniform_bias(4 * hidden_dim, 1e-2, gen);
}

LstmState LstmCell::forward(const Mat& x, const LstmState& prev, LstmCache& cache) const {
    const int H = hidden_dim;

    cache.x = x;
    cache.h_prev = prev.h;
    cache.c_prev = prev.c;

    Mat gates = Wx * x + Wh * prev.h;
    gates.colwise() += b;

    cache.i = sigmoid(gates.topRows(H));
    cache.f = sigmoid(gates.middleRows(H, H));
    cache.g = gates.middleRows(2 * H, H).array().tanh();
    cache.o = sigmoid(gates.bottomRows(H));

    cache.c = cache.f.cwiseProduct(prev.c) + cache.i.cwiseProduct(cache.g);
    cache.tanh_c = cache.c.array().tanh();

    LstmState next;
    next.h = cache.o.cwiseProduct(cache.tanh_c);
    next.c = cache.c;
    return next;
}

void LstmCell::backward(const Mat& dh, const Mat& dc, const LstmCache& cache,
                        Grads& grads, Mat& dx, Mat& dh_prev, Mat& dc_prev) const {
    const int H = hidden_dim;
    const auto i = cache.i.array();
    const auto f = cache.f.array();
    const auto g = cache.g.array();
    const auto o = cache.o.array();
    const auto tc = cache.tanh_c.array();

    // Total gradient reaching the cell state at this step
    Mat dc_total = dc + (dh.array() * o * (1.0 - tc.square())).matrix();
    const auto dct = dc_total.array();

    Mat dgates(4 * H, dh.cols());
    dgates.topRows(H) = (dct * g * i * (1.0 - i)).matrix();
    dgates.middleRows(H, H) = (dct * cache.c_prev.array() * f * (1.0 - f)).matrix();
    dgates.middleRows(2 * H, H) = (dct * i * (1.0 - g.square())).matrix();
    dgates.bottomRows(H) = (dh.array() * tc * o * (1.0 - o)).matrix();

    grads.dWx += dgates * cache.x.transpose();
    grads.dWh += dgates * cache.h_prev.transpose();
    grads.db += dgates.rowwise().sum();

    dx = Wx.transpose() * dgates;
    dh_prev = Wh.transpose() * dgates;
    dc_prev = dc_total.cwiseProduct(cache.f);
}

void LstmCell::update(const Adam& opt, const Grads& grads, Grads& m, Grads& v) {
    opt.step(Wx, m.dWx, v.dWx, grads.dWx);
    opt.step(Wh, m.dWh, v.dWh, grads.dWh);
    opt.step(b, m.db, v.db, grads.db);
}

} // namespace scribe
