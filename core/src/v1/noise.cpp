#include "stochsim/v1/noise.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace stochsim::v1 {

// =============================================================================
// NoiseSource
// =============================================================================

NoiseSource::NoiseSource(NoiseShape shape, std::uint64_t seed)
    : shape_(shape)
    , seed_(seed == 0 ? default_seed : seed)
    , engine_(seed_) {}

void NoiseSource::reseed(std::uint64_t seed) {
    seed_ = seed == 0 ? default_seed : seed;
    engine_.seed(seed_);
    normal_.reset();
    draws_ = 0;
}

Vector NoiseSource::standard_normal(Index n) {
    Vector xi(n);
    for (Index i = 0; i < n; ++i) {
        xi[i] = normal_(engine_);
    }
    return xi;
}

NoiseIncrement NoiseSource::draw_wiener(Real t, Real dt, bool with_auxiliary) {
    NoiseIncrement increment;
    increment.t = t;
    increment.dt = dt;

    const Real sqdt = std::sqrt(std::max(dt, Real{0.0}));
    increment.dW = sqdt * standard_normal(shape_.dimension);
    if (with_auxiliary) {
        increment.dZ = sqdt * standard_normal(shape_.dimension);
    }
    ++draws_;
    return increment;
}

NoiseIncrement NoiseSource::draw_jump_counts(Real t, Real dt, const Vector& rates) {
    if (rates.size() != shape_.dimension) {
        throw std::invalid_argument("jump rate vector size does not match the channel count");
    }

    NoiseIncrement increment;
    increment.t = t;
    increment.dt = dt;
    increment.dW = Vector::Zero(shape_.dimension);

    for (Index j = 0; j < shape_.dimension; ++j) {
        const Real mean = rates[j] * dt;
        if (!std::isfinite(mean)) {
            increment.dW[j] = std::numeric_limits<Real>::quiet_NaN();
            continue;
        }
        if (mean <= 0.0) {
            continue;
        }
        std::poisson_distribution<long long> poisson(mean);
        increment.dW[j] = static_cast<Real>(poisson(engine_));
    }
    ++draws_;
    return increment;
}

// =============================================================================
// NoiseBuffer
// =============================================================================

NoiseBuffer::NoiseBuffer(NoiseShape shape, bool retain)
    : shape_(shape)
    , retain_(retain)
    , W_(shape.zeros()) {}

void NoiseBuffer::stage(const NoiseIncrement& increment) {
    records_.push_back(NoiseRecord{increment.t, increment.dt, increment.dW});
    ++speculative_;
    max_size_ = std::max(max_size_, records_.size());
}

void NoiseBuffer::commit() {
    if (speculative_ == 0) {
        return;
    }

    // Oldest speculative entry sits right above the accepted records
    const std::size_t slot = records_.size() - speculative_;
    W_ += records_[slot].dW;
    --speculative_;
    ++accepted_;

    if (!retain_) {
        records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(slot));
    }
}

void NoiseBuffer::discard_speculative() {
    while (speculative_ > 0) {
        records_.pop_back();
        --speculative_;
        ++discarded_;
    }
}

Vector NoiseBuffer::cumulative(std::size_t steps) const {
    Vector W = shape_.zeros();
    const std::size_t n = std::min(steps, size());
    for (std::size_t i = 0; i < n; ++i) {
        W += records_[i].dW;
    }
    return W;
}

void NoiseBuffer::clear() {
    records_.clear();
    speculative_ = 0;
    accepted_ = 0;
    discarded_ = 0;
    max_size_ = 0;
    W_ = shape_.zeros();
}

}  // namespace stochsim::v1
