#pragma once

// =============================================================================
// stochsim v1 - Step Kernels
// =============================================================================
// One kernel per algorithm family, selected once before the time loop and held
// for the whole run. A kernel advances the state over one attempted step given
// the increment the integrator drew for it, and reports its embedded error
// terms. Kernels never decide acceptance.
// =============================================================================

#include "stochsim/v1/noise.hpp"
#include "stochsim/v1/numeric_types.hpp"
#include "stochsim/v1/options.hpp"
#include "stochsim/v1/problem.hpp"
#include "stochsim/v1/status.hpp"
#include "stochsim/v1/tableau.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace stochsim::v1 {

// =============================================================================
// Function Evaluation
// =============================================================================

/// Raised when a user callable is missing or returns a vector of the wrong size
class CallableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Evaluates the problem callables, checks output sizes and counts calls
class FunctionEvaluator {
public:
    explicit FunctionEvaluator(const SDEProblem& problem) : problem_(problem) {}

    [[nodiscard]] Vector drift(Real t, const Vector& u);
    [[nodiscard]] Vector diffusion(Real t, const Vector& u);
    [[nodiscard]] Vector jump_rates(Real t, const Vector& u);
    [[nodiscard]] Vector jump_change(Real t, const Vector& u, const Vector& counts);

    [[nodiscard]] const SDEProblem& problem() const { return problem_; }
    [[nodiscard]] std::size_t drift_calls() const { return drift_calls_; }
    [[nodiscard]] std::size_t diffusion_calls() const { return diffusion_calls_; }
    [[nodiscard]] std::size_t jump_calls() const { return jump_calls_; }

private:
    const SDEProblem& problem_;
    std::size_t drift_calls_ = 0;
    std::size_t diffusion_calls_ = 0;
    std::size_t jump_calls_ = 0;
};

// =============================================================================
// Kernel Contract
// =============================================================================

struct StepContext {
    Real t = 0.0;
    Real dt = 0.0;
    const Vector& u;
    const NoiseIncrement& noise;
    bool estimate_error = false;
};

/// Candidate state and embedded error terms of one attempt.
/// Tableau kernels fill E1 (deterministic) and E2 (stochastic); the
/// extrapolation kernels leave E1 empty and put the whole estimate in E2.
struct StepOutcome {
    Vector u_next;
    Vector E1;
    Vector E2;
    bool has_error_estimate = false;
};

class StepKernel {
public:
    virtual ~StepKernel() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual Real order() const = 0;
    [[nodiscard]] virtual bool supports_adaptivity() const { return true; }
    [[nodiscard]] virtual bool needs_auxiliary_noise() const { return false; }

    [[nodiscard]] virtual NoiseShape noise_shape(const SDEProblem& problem) const {
        return wiener_shape(problem);
    }

    /// Fresh increment for an attempt of size dt starting at (t, u)
    [[nodiscard]] virtual NoiseIncrement draw_increment(NoiseSource& source,
                                                        FunctionEvaluator& eval,
                                                        Real t,
                                                        Real dt,
                                                        const Vector& u) const;

    [[nodiscard]] virtual StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const = 0;
};

// =============================================================================
// Low-order Kernels
// =============================================================================

/// u_next = u + f dt + g dW
class EulerMaruyamaKernel final : public StepKernel {
public:
    [[nodiscard]] std::string_view name() const override { return "EM"; }
    [[nodiscard]] Real order() const override { return 0.5; }
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;
};

/// Derivative-free Milstein: g'g is replaced by a difference of g at a
/// supporting value u + f dt + g sqrt(dt)
class RKMilKernel final : public StepKernel {
public:
    [[nodiscard]] std::string_view name() const override { return "RKMil"; }
    [[nodiscard]] Real order() const override { return 1.0; }
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;
};

// =============================================================================
// Stochastic Runge-Kutta Kernels
// =============================================================================

class SRIKernel final : public StepKernel {
public:
    explicit SRIKernel(SRITableau tableau) : tableau_(std::move(tableau)) {}

    [[nodiscard]] std::string_view name() const override { return "SRI"; }
    [[nodiscard]] Real order() const override { return tableau_.order; }
    [[nodiscard]] bool needs_auxiliary_noise() const override { return true; }
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;

    [[nodiscard]] const SRITableau& tableau() const { return tableau_; }

private:
    SRITableau tableau_;
};

/// SRIW1 with its sparse coefficients written out
class SRIW1OptimizedKernel final : public StepKernel {
public:
    [[nodiscard]] std::string_view name() const override { return "SRIW1Optimized"; }
    [[nodiscard]] Real order() const override { return 1.5; }
    [[nodiscard]] bool needs_auxiliary_noise() const override { return true; }
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;
};

class SRAKernel final : public StepKernel {
public:
    explicit SRAKernel(SRATableau tableau) : tableau_(std::move(tableau)) {}

    [[nodiscard]] std::string_view name() const override { return "SRA"; }
    [[nodiscard]] Real order() const override { return tableau_.order; }
    [[nodiscard]] bool needs_auxiliary_noise() const override { return true; }
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;

    [[nodiscard]] const SRATableau& tableau() const { return tableau_; }

private:
    SRATableau tableau_;
};

/// SRA1 with its coefficients written out
class SRA1OptimizedKernel final : public StepKernel {
public:
    [[nodiscard]] std::string_view name() const override { return "SRA1Optimized"; }
    [[nodiscard]] Real order() const override { return 2.0; }
    [[nodiscard]] bool needs_auxiliary_noise() const override { return true; }
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;
};

/// SRI on stage arrays; one-dimensional state only
class SRIVectorizedKernel final : public StepKernel {
public:
    explicit SRIVectorizedKernel(SRITableau tableau) : tableau_(std::move(tableau)) {}

    [[nodiscard]] std::string_view name() const override { return "SRIVectorized"; }
    [[nodiscard]] Real order() const override { return tableau_.order; }
    [[nodiscard]] bool needs_auxiliary_noise() const override { return true; }
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;

private:
    SRITableau tableau_;
};

/// SRA on stage arrays; one-dimensional state only
class SRAVectorizedKernel final : public StepKernel {
public:
    explicit SRAVectorizedKernel(SRATableau tableau) : tableau_(std::move(tableau)) {}

    [[nodiscard]] std::string_view name() const override { return "SRAVectorized"; }
    [[nodiscard]] Real order() const override { return tableau_.order; }
    [[nodiscard]] bool needs_auxiliary_noise() const override { return true; }
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;

private:
    SRATableau tableau_;
};

// =============================================================================
// Jump Kernel
// =============================================================================

/// u_next = u + c(u, p, t, counts) with counts ~ Poisson(rate * dt)
class TauLeapingKernel final : public StepKernel {
public:
    [[nodiscard]] std::string_view name() const override { return "TauLeaping"; }
    [[nodiscard]] Real order() const override { return 1.0; }
    [[nodiscard]] bool supports_adaptivity() const override { return false; }

    [[nodiscard]] NoiseShape noise_shape(const SDEProblem& problem) const override;
    [[nodiscard]] NoiseIncrement draw_increment(NoiseSource& source,
                                                FunctionEvaluator& eval,
                                                Real t,
                                                Real dt,
                                                const Vector& u) const override;
    [[nodiscard]] StepOutcome step(FunctionEvaluator& eval, const StepContext& ctx) const override;
};

// =============================================================================
// Selection
// =============================================================================

/// Iterated-integral approximations shared by the tableau kernels
struct StochasticIntegrals {
    Vector chi1;  // (dW^2 - dt) / (2 sqrt(dt))
    Vector chi2;  // (dW + dZ / sqrt(3)) / 2
    Vector chi3;  // (dW^3 - 3 dW dt) / (6 dt)
};

[[nodiscard]] StochasticIntegrals stochastic_integrals(const NoiseIncrement& noise);

/// Pick the kernel for the options and problem; configuration failures are
/// UnimplementedScheme or InvalidTableau.
[[nodiscard]] std::expected<std::unique_ptr<StepKernel>, ConfigurationIssue>
make_step_kernel(const SolveOptions& options, const SDEProblem& problem);

}  // namespace stochsim::v1
