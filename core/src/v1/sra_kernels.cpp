#include "stochsim/v1/step_kernel.hpp"

#include <cmath>
#include <vector>

namespace stochsim::v1 {

// =============================================================================
// SRA (general tableau)
// =============================================================================

StepOutcome SRAKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    const SRATableau& tab = tableau_;
    const Index s = tab.stages();
    const Index n = ctx.u.size();
    const Real dt = ctx.dt;
    const StochasticIntegrals chi = stochastic_integrals(ctx.noise);

    // Additive noise: diffusion depends on time only, sampled at the step start state
    std::vector<Vector> gv(static_cast<std::size_t>(s));
    for (Index j = 0; j < s; ++j) {
        gv[static_cast<std::size_t>(j)] = eval.diffusion(ctx.t + tab.c1[j] * dt, ctx.u);
    }

    std::vector<Vector> fv(static_cast<std::size_t>(s));
    for (Index i = 0; i < s; ++i) {
        Vector drift0 = Vector::Zero(n);
        Vector diff0 = Vector::Zero(n);
        for (Index j = 0; j < i; ++j) {
            drift0 += tab.A0(i, j) * fv[static_cast<std::size_t>(j)];
            diff0 += tab.B0(i, j) * gv[static_cast<std::size_t>(j)];
        }
        const Vector H0 = ctx.u + dt * drift0 + apply_noise(diff0, chi.chi2);
        fv[static_cast<std::size_t>(i)] = eval.drift(ctx.t + tab.c0[i] * dt, H0);
    }

    Vector drift_sum = Vector::Zero(n);
    Vector w1 = Vector::Zero(n);
    Vector w2 = Vector::Zero(n);
    for (Index i = 0; i < s; ++i) {
        drift_sum += tab.alpha[i] * fv[static_cast<std::size_t>(i)];
        w1 += tab.beta1[i] * gv[static_cast<std::size_t>(i)];
        w2 += tab.beta2[i] * gv[static_cast<std::size_t>(i)];
    }

    StepOutcome outcome;
    outcome.E1 = dt * (fv[0] + fv[1]);
    outcome.E2 = apply_noise(w2, chi.chi2);
    outcome.u_next = ctx.u + dt * drift_sum + apply_noise(w1, ctx.noise.dW) + outcome.E2;
    outcome.has_error_estimate = true;
    return outcome;
}

// =============================================================================
// SRA1 (coefficients written out)
// =============================================================================

StepOutcome SRA1OptimizedKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    const Real t = ctx.t;
    const Real dt = ctx.dt;
    const Vector& u = ctx.u;
    const StochasticIntegrals chi = stochastic_integrals(ctx.noise);

    const Vector gpdt = eval.diffusion(t + dt, u);
    const Vector k1 = dt * eval.drift(t, u);
    const Vector H0 = u + 0.75 * k1 + 1.5 * apply_noise(gpdt, chi.chi2);
    const Vector k2 = dt * eval.drift(t + 0.75 * dt, H0);

    StepOutcome outcome;
    outcome.E1 = k1 + k2;
    outcome.E2 = apply_noise(eval.diffusion(t, u) - gpdt, chi.chi2);
    outcome.u_next = u + (k1 + 2.0 * k2) / 3.0 + outcome.E2 + apply_noise(gpdt, ctx.noise.dW);
    outcome.has_error_estimate = true;
    return outcome;
}

// =============================================================================
// SRA on stage arrays
// =============================================================================

StepOutcome SRAVectorizedKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    const SRATableau& tab = tableau_;
    const Index s = tab.stages();
    const Real dt = ctx.dt;
    const Real u = ctx.u[0];
    const Real dW = ctx.noise.dW[0];
    const Real chi2 = stochastic_integrals(ctx.noise).chi2[0];

    Vector gv(s);
    for (Index j = 0; j < s; ++j) {
        gv[j] = eval.diffusion(ctx.t + tab.c1[j] * dt, ctx.u)[0];
    }

    // All diffusion stages are known up front, only the drift stages chain
    const Vector noise_part = chi2 * (tab.B0 * gv);
    Vector fv = Vector::Zero(s);
    Vector stage(1);
    for (Index i = 0; i < s; ++i) {
        stage[0] = u + dt * tab.A0.row(i).dot(fv) + noise_part[i];
        fv[i] = eval.drift(ctx.t + tab.c0[i] * dt, stage)[0];
    }

    const Real E1 = dt * (fv[0] + fv[1]);
    const Real E2 = chi2 * tab.beta2.dot(gv);

    StepOutcome outcome;
    outcome.E1 = Vector::Constant(1, E1);
    outcome.E2 = Vector::Constant(1, E2);
    outcome.u_next = Vector::Constant(1, u + dt * tab.alpha.dot(fv) + dW * tab.beta1.dot(gv) + E2);
    outcome.has_error_estimate = true;
    return outcome;
}

}  // namespace stochsim::v1
