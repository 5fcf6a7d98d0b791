#pragma once

// =============================================================================
// stochsim v1 - Numeric Types Foundation
// =============================================================================
// This header provides the foundational numeric types for the integrator:
// - Real / Index scalar aliases
// - Eigen-backed Vector and Matrix containers for state and noise samples
// - Tolerance and guard constants shared by the stepping code
// =============================================================================

#include <Eigen/Core>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>

namespace stochsim::v1 {

// =============================================================================
// Scalar and Container Aliases
// =============================================================================

using Real = double;
using Index = Eigen::Index;
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;

/// Concept for valid Real types
template<typename T>
concept RealType = std::floating_point<T>;

/// Traits for Real type characteristics
template<RealType T>
struct RealTraits {
    static constexpr T epsilon = std::numeric_limits<T>::epsilon();
    static constexpr T infinity = std::numeric_limits<T>::infinity();

    /// Default minimum step: ten machine epsilons
    static constexpr T default_dtmin = T{10} * epsilon;
};

// =============================================================================
// Numeric Guards
// =============================================================================

/// Smallest denominator used when normalizing error components
inline constexpr Real kErrorDenominatorFloor = 1e-15;

/// Threshold under which initial-step scales are considered negligible
inline constexpr Real kNegligibleScale = 1e-15;

/// Relative gap under which the remaining interval is absorbed into the current step
inline constexpr Real kFinalStepSnap = 1e-6;

[[nodiscard]] inline bool all_finite(const Vector& v) {
    return v.allFinite();
}

}  // namespace stochsim::v1
