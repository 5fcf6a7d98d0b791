#pragma once

// =============================================================================
// stochsim v1 - Adaptive Stochastic Integrator
// =============================================================================
// The integrator owns the time loop: it draws an increment, asks the kernel
// for a candidate, scores it, lets the controller accept or resize the step,
// and records the accepted path. Failures are reported in Solution::status
// together with the partial result.
// =============================================================================

#include "stochsim/v1/options.hpp"
#include "stochsim/v1/problem.hpp"
#include "stochsim/v1/solution.hpp"
#include "stochsim/v1/step_kernel.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stochsim::v1 {

struct InputIssue {
    std::string message;
};

/// First problem with the time span, state or options; nullopt when valid
[[nodiscard]] std::optional<InputIssue> validate_solve_inputs(const SDEProblem& problem,
                                                              const std::vector<Real>& time_span,
                                                              const SolveOptions& options);

class SDEIntegrator {
public:
    SDEIntegrator(const SDEProblem& problem,
                  std::unique_ptr<StepKernel> kernel,
                  SolveOptions options = {});

    /// Integrate from t0 to tf; inputs are expected to be validated
    [[nodiscard]] Solution integrate(Real t0, Real tf);

    [[nodiscard]] const StepKernel& kernel() const { return *kernel_; }
    [[nodiscard]] const SolveOptions& options() const { return options_; }

private:
    const SDEProblem& problem_;
    std::unique_ptr<StepKernel> kernel_;
    SolveOptions options_;
};

/// Validate, select the kernel and integrate over time_span = {t0, tf}
[[nodiscard]] Solution solve(const SDEProblem& problem,
                             const std::vector<Real>& time_span = {0.0, 1.0},
                             const SolveOptions& options = {});

}  // namespace stochsim::v1
