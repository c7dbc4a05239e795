#pragma once
#include "types.hpp"
#include "numerics.hpp"

namespace scribe {

// Ancestral sampling of one point per batch element from mixture outputs:
// pen lift, then mixture component, then the 2-D offset.
class Sampler {
public:
    explicit Sampler(unsigned seed = 42) : gen_(seed) {}

    // Returns [3 x B]: lift, dx, dy
    Mat sample(const MixtureParams& p);

    void seed(unsigned s) { gen_.seed(s); }

private:
    Rng gen_;
};

} // namespace scribe
