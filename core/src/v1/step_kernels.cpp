#include "stochsim/v1/step_kernel.hpp"

#include <cmath>
#include <string>

namespace stochsim::v1 {

namespace {

void check_size(const char* what, Index got, Index expected) {
    if (got != expected) {
        throw CallableError(std::string(what) + " returned " + std::to_string(got) +
                            " components, expected " + std::to_string(expected));
    }
}

/// Trapezoidal-versus-Euler difference evaluated at the candidate
Vector extrapolation_error(FunctionEvaluator& eval,
                           const StepContext& ctx,
                           const Vector& u_next,
                           const Vector& f0,
                           const Vector& g0) {
    const Real t1 = ctx.t + ctx.dt;
    const Vector f1 = eval.drift(t1, u_next);
    const Vector g1 = eval.diffusion(t1, u_next);
    return 0.5 * ctx.dt * (f1 - f0) + 0.5 * apply_noise(g1 - g0, ctx.noise.dW);
}

}  // namespace

// =============================================================================
// FunctionEvaluator
// =============================================================================

Vector FunctionEvaluator::drift(Real t, const Vector& u) {
    if (!problem_.drift) {
        throw CallableError("problem has no drift function");
    }
    Vector du = Vector::Zero(u.size());
    problem_.drift(t, u, du);
    ++drift_calls_;
    check_size("drift", du.size(), u.size());
    return du;
}

Vector FunctionEvaluator::diffusion(Real t, const Vector& u) {
    if (!problem_.diffusion) {
        throw CallableError("problem has no diffusion function");
    }
    Vector du = Vector::Zero(u.size());
    problem_.diffusion(t, u, du);
    ++diffusion_calls_;
    check_size("diffusion", du.size(), u.size());
    return du;
}

Vector FunctionEvaluator::jump_rates(Real t, const Vector& u) {
    if (!problem_.jumps || !problem_.jumps->rates) {
        throw CallableError("problem has no jump rate function");
    }
    const JumpDescription& jumps = *problem_.jumps;
    Vector rates = Vector::Zero(jumps.channels);
    jumps.rates(t, u, jumps.parameters, rates);
    ++jump_calls_;
    check_size("jump rate function", rates.size(), jumps.channels);
    return rates;
}

Vector FunctionEvaluator::jump_change(Real t, const Vector& u, const Vector& counts) {
    if (!problem_.jumps || !problem_.jumps->change) {
        throw CallableError("problem has no jump change function");
    }
    const JumpDescription& jumps = *problem_.jumps;
    Vector du = Vector::Zero(u.size());
    jumps.change(u, jumps.parameters, t, counts, du);
    check_size("jump change function", du.size(), u.size());
    return du;
}

// =============================================================================
// Shared Pieces
// =============================================================================

NoiseIncrement StepKernel::draw_increment(NoiseSource& source,
                                          FunctionEvaluator& /*eval*/,
                                          Real t,
                                          Real dt,
                                          const Vector& /*u*/) const {
    return source.draw_wiener(t, dt, needs_auxiliary_noise());
}

StochasticIntegrals stochastic_integrals(const NoiseIncrement& noise) {
    const Real dt = noise.dt;
    const Real sqdt = std::sqrt(dt);
    const auto dW = noise.dW.array();

    StochasticIntegrals chi;
    chi.chi1 = ((dW.square() - dt) / (2.0 * sqdt)).matrix();
    if (noise.has_auxiliary()) {
        chi.chi2 = (0.5 * (dW + noise.dZ.array() / std::sqrt(3.0))).matrix();
    } else {
        chi.chi2 = (0.5 * dW).matrix();
    }
    chi.chi3 = ((dW.cube() - 3.0 * dW * dt) / (6.0 * dt)).matrix();
    return chi;
}

// =============================================================================
// Euler-Maruyama
// =============================================================================

StepOutcome EulerMaruyamaKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    const Vector f0 = eval.drift(ctx.t, ctx.u);
    const Vector g0 = eval.diffusion(ctx.t, ctx.u);

    StepOutcome outcome;
    outcome.u_next = ctx.u + ctx.dt * f0 + apply_noise(g0, ctx.noise.dW);

    if (ctx.estimate_error && all_finite(outcome.u_next)) {
        outcome.E2 = extrapolation_error(eval, ctx, outcome.u_next, f0, g0);
        outcome.has_error_estimate = true;
    }
    return outcome;
}

// =============================================================================
// Runge-Kutta Milstein
// =============================================================================

StepOutcome RKMilKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    const Real sqdt = std::sqrt(ctx.dt);
    const Vector f0 = eval.drift(ctx.t, ctx.u);
    const Vector L = eval.diffusion(ctx.t, ctx.u);

    const Vector K = ctx.u + ctx.dt * f0;
    const Vector support = K + L * sqdt;
    const Vector g_support = eval.diffusion(ctx.t, support);

    const Vector milstein = ((ctx.noise.dW.array().square() - ctx.dt)).matrix();

    StepOutcome outcome;
    outcome.u_next = K + apply_noise(L, ctx.noise.dW) +
                     apply_noise((g_support - L) / (2.0 * sqdt), milstein);

    if (ctx.estimate_error && all_finite(outcome.u_next)) {
        outcome.E2 = extrapolation_error(eval, ctx, outcome.u_next, f0, L);
        outcome.has_error_estimate = true;
    }
    return outcome;
}

// =============================================================================
// Kernel Selection
// =============================================================================

namespace {

template<typename T>
std::expected<T, ConfigurationIssue> resolve_tableau(const SolveOptions& options,
                                                     T fallback,
                                                     const char* family) {
    if (!options.tableau) {
        return fallback;
    }
    const T* tableau = std::get_if<T>(&*options.tableau);
    if (tableau == nullptr) {
        return std::unexpected(ConfigurationIssue{
            SolveStatus::InvalidTableau,
            std::string(to_string(options.algorithm)) + " needs an " + family + " tableau"});
    }

    const auto issues = check_order_conditions(*tableau);
    if (!issues.empty()) {
        std::string message = "tableau '" + tableau->name + "' fails consistency checks: " + issues.front();
        if (issues.size() > 1) {
            message += " (+" + std::to_string(issues.size() - 1) + " more)";
        }
        return std::unexpected(ConfigurationIssue{SolveStatus::InvalidTableau, std::move(message)});
    }
    return *tableau;
}

ConfigurationIssue unimplemented(std::string message) {
    return ConfigurationIssue{SolveStatus::UnimplementedScheme, std::move(message)};
}

}  // namespace

std::expected<std::unique_ptr<StepKernel>, ConfigurationIssue>
make_step_kernel(const SolveOptions& options, const SDEProblem& problem) {
    const Algorithm algorithm = options.algorithm;
    const bool vectorized = algorithm == Algorithm::SRIVectorized ||
                            algorithm == Algorithm::SRAVectorized;

    if (vectorized && problem.dimension() != 1) {
        return std::unexpected(unimplemented(
            std::string(to_string(algorithm)) + " supports one-dimensional state only (got " +
            std::to_string(problem.dimension()) + ")"));
    }

    const bool takes_tableau = algorithm == Algorithm::SRI || algorithm == Algorithm::SRA ||
                               vectorized;
    if (options.tableau && !takes_tableau) {
        return std::unexpected(unimplemented(
            std::string(to_string(algorithm)) + " has fixed coefficients; use SRI or SRA for a custom tableau"));
    }

    if (options.adaptive && !is_adaptive_capable(algorithm)) {
        return std::unexpected(unimplemented(
            std::string(to_string(algorithm)) + " has no error estimate for adaptive stepping"));
    }

    switch (algorithm) {
        case Algorithm::EM:
            return std::make_unique<EulerMaruyamaKernel>();
        case Algorithm::RKMil:
            return std::make_unique<RKMilKernel>();
        case Algorithm::SRIW1Optimized:
            return std::make_unique<SRIW1OptimizedKernel>();
        case Algorithm::SRA1Optimized:
            return std::make_unique<SRA1OptimizedKernel>();
        case Algorithm::SRI:
        case Algorithm::SRIVectorized: {
            auto tableau = resolve_tableau<SRITableau>(options, construct_sriw1(), "SRI");
            if (!tableau) {
                return std::unexpected(tableau.error());
            }
            if (algorithm == Algorithm::SRI) {
                return std::make_unique<SRIKernel>(std::move(*tableau));
            }
            return std::make_unique<SRIVectorizedKernel>(std::move(*tableau));
        }
        case Algorithm::SRA:
        case Algorithm::SRAVectorized: {
            auto tableau = resolve_tableau<SRATableau>(options, construct_sra1(), "SRA");
            if (!tableau) {
                return std::unexpected(tableau.error());
            }
            if (algorithm == Algorithm::SRA) {
                return std::make_unique<SRAKernel>(std::move(*tableau));
            }
            return std::make_unique<SRAVectorizedKernel>(std::move(*tableau));
        }
        case Algorithm::TauLeaping:
            if (!problem.has_jumps()) {
                return std::unexpected(unimplemented("TauLeaping needs a jump description"));
            }
            return std::make_unique<TauLeapingKernel>();
        default:
            break;
    }
    return std::unexpected(unimplemented("no kernel for the requested algorithm"));
}

}  // namespace stochsim::v1
