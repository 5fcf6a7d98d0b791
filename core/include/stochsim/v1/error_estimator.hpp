#pragma once

// =============================================================================
// stochsim v1 - Local Error Estimation
// =============================================================================
// Scaled error norm of an attempted step:
//   e = || E_i / (abstol + max(|uprev_i|, |u_i|) * reltol) ||_p
// Each component is normalized independently; the denominator never drops
// below kErrorDenominatorFloor.
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"

namespace stochsim::v1 {

struct StepOutcome;

/// Norm order; any value >= 1, infinity selects the max norm
[[nodiscard]] Real p_norm(const Vector& v, Real p);

[[nodiscard]] Real scaled_error_norm(const Vector& error,
                                     const Vector& u_prev,
                                     const Vector& u_next,
                                     Real abstol,
                                     Real reltol,
                                     Real p = 2.0);

/// delta * E1 + E2; an empty E1 means the kernel already combined the terms
[[nodiscard]] Vector weighted_error(Real delta, const Vector& E1, const Vector& E2);

struct ErrorEstimatorConfig {
    Real abstol = 1e-3;
    Real reltol = 1e-6;
    Real delta = 1.0 / 6.0;
    Real internalnorm = 2.0;
};

class ErrorEstimator {
public:
    explicit ErrorEstimator(const ErrorEstimatorConfig& config = {}) : config_(config) {}

    /// Scaled norm of the outcome's embedded error; 0 when the kernel gave none
    [[nodiscard]] Real estimate(const StepOutcome& outcome, const Vector& u_prev) const;

    [[nodiscard]] const ErrorEstimatorConfig& config() const { return config_; }

private:
    ErrorEstimatorConfig config_;
};

}  // namespace stochsim::v1
