#pragma once

// =============================================================================
// stochsim v1 - Initial Step Heuristic
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"

namespace stochsim::v1 {

class FunctionEvaluator;

struct InitialStepEstimate {
    Real dt = 0.0;        // Proposed starting step
    Real dt_trial = 0.0;  // Trial step used for the curvature estimate
    Real d0 = 0.0;        // Scaled state magnitude
    Real d1 = 0.0;        // Scaled first increment magnitude
    Real d2 = 0.0;        // Scaled curvature estimate
    bool degenerate = false;
};

/// Starting dt from the scales of u0, f and g at t0 and at a trial point
/// (t0 + dt_trial, u0 + dt_trial f0). Diffusion is weighted by 3 so the
/// step covers a three-sigma noise excursion. Result is min(100 dt_trial, dt1).
/// Only the upper bound is enforced: large drift or diffusion scales give a
/// starting dt below 1e-6, and only the degenerate case floors it at 1e-6.
[[nodiscard]] InitialStepEstimate estimate_initial_step(FunctionEvaluator& eval,
                                                        Real t0,
                                                        const Vector& u0,
                                                        Real order,
                                                        Real abstol,
                                                        Real reltol,
                                                        Real internalnorm = 2.0);

}  // namespace stochsim::v1
