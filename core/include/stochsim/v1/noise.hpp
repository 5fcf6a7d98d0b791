#pragma once

// =============================================================================
// stochsim v1 - Noise Sources and Resettable Noise Buffer
// =============================================================================
// This header provides:
// - NoiseIncrement: one sampled increment (dW, optional dZ) over [t, t+dt]
// - NoiseSource: seeded generator for Wiener increments and jump counts
// - NoiseBuffer: stack of accepted increments with a speculative top entry
//   that is committed on acceptance or truncated on rejection
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"
#include "stochsim/v1/problem.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace stochsim::v1 {

struct NoiseIncrement {
    Real t = 0.0;
    Real dt = 0.0;
    Vector dW;   // Wiener increment, or jump counts for Poisson noise
    Vector dZ;   // Auxiliary increment for stochastic Runge-Kutta schemes (may be empty)

    [[nodiscard]] bool has_auxiliary() const { return dZ.size() > 0; }
};

// =============================================================================
// Noise Source
// =============================================================================

/// Seeded generator. The same seed reproduces the same sequence of draws.
class NoiseSource {
public:
    static constexpr std::uint64_t default_seed = 0x5DEECE66DULL;

    explicit NoiseSource(NoiseShape shape, std::uint64_t seed = 0);

    /// dW ~ N(0, dt) per component; dZ ~ N(0, dt) independent of dW when requested
    [[nodiscard]] NoiseIncrement draw_wiener(Real t, Real dt, bool with_auxiliary);

    /// counts_j ~ Poisson(rate_j * dt); non-positive rates give exactly zero
    [[nodiscard]] NoiseIncrement draw_jump_counts(Real t, Real dt, const Vector& rates);

    void reseed(std::uint64_t seed);

    [[nodiscard]] const NoiseShape& shape() const { return shape_; }
    [[nodiscard]] std::uint64_t seed() const { return seed_; }
    [[nodiscard]] std::size_t draws() const { return draws_; }

private:
    [[nodiscard]] Vector standard_normal(Index n);

    NoiseShape shape_;
    std::uint64_t seed_;
    std::mt19937_64 engine_;
    std::normal_distribution<Real> normal_{0.0, 1.0};
    std::size_t draws_ = 0;
};

// =============================================================================
// Noise Buffer
// =============================================================================

struct NoiseRecord {
    Real t = 0.0;
    Real dt = 0.0;
    Vector dW;
};

/// Ordered record of the increments of accepted steps.
///
/// An attempted step stages its increment on top of the stack. Acceptance
/// commits it (the running Wiener value W advances); rejection truncates it so
/// the retried, smaller step draws fresh increments and the discarded sample
/// never appears in the recorded path. With retention disabled only W and the
/// counters are kept.
class NoiseBuffer {
public:
    explicit NoiseBuffer(NoiseShape shape, bool retain = true);

    void stage(const NoiseIncrement& increment);
    void commit();
    void discard_speculative();

    [[nodiscard]] bool has_speculative() const { return speculative_ > 0; }

    /// Retained accepted records
    [[nodiscard]] std::size_t size() const { return records_.size() - speculative_; }
    [[nodiscard]] std::size_t accepted_count() const { return accepted_; }
    [[nodiscard]] std::size_t discarded_count() const { return discarded_; }

    /// High-water mark of the stack, speculative entries included
    [[nodiscard]] std::size_t max_size() const { return max_size_; }

    [[nodiscard]] const Vector& W() const { return W_; }
    [[nodiscard]] const NoiseRecord& operator[](std::size_t i) const { return records_[i]; }
    [[nodiscard]] bool retains_records() const { return retain_; }
    [[nodiscard]] const NoiseShape& shape() const { return shape_; }

    /// Wiener value after the first `steps` retained accepted increments
    [[nodiscard]] Vector cumulative(std::size_t steps) const;

    void clear();

private:
    NoiseShape shape_;
    bool retain_ = true;
    std::vector<NoiseRecord> records_;
    std::size_t speculative_ = 0;
    std::size_t accepted_ = 0;
    std::size_t discarded_ = 0;
    std::size_t max_size_ = 0;
    Vector W_;
};

}  // namespace stochsim::v1
