#include "stochsim/v1/step_kernel.hpp"

#include <cmath>
#include <vector>

namespace stochsim::v1 {

// =============================================================================
// SRI (general tableau)
// =============================================================================

StepOutcome SRIKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    const SRITableau& tab = tableau_;
    const Index s = tab.stages();
    const Index n = ctx.u.size();
    const Real dt = ctx.dt;
    const Real sqdt = std::sqrt(dt);
    const StochasticIntegrals chi = stochastic_integrals(ctx.noise);

    std::vector<Vector> fv(static_cast<std::size_t>(s));
    std::vector<Vector> gv(static_cast<std::size_t>(s));

    for (Index i = 0; i < s; ++i) {
        Vector drift0 = Vector::Zero(n);
        Vector drift1 = Vector::Zero(n);
        Vector diff0 = Vector::Zero(n);
        Vector diff1 = Vector::Zero(n);
        for (Index j = 0; j < i; ++j) {
            const auto& fj = fv[static_cast<std::size_t>(j)];
            const auto& gj = gv[static_cast<std::size_t>(j)];
            drift0 += tab.A0(i, j) * fj;
            drift1 += tab.A1(i, j) * fj;
            diff0 += tab.B0(i, j) * gj;
            diff1 += tab.B1(i, j) * gj;
        }

        const Vector H0 = ctx.u + dt * drift0 + apply_noise(diff0, chi.chi2);
        const Vector H1 = ctx.u + dt * drift1 + sqdt * diff1;

        fv[static_cast<std::size_t>(i)] = eval.drift(ctx.t + tab.c0[i] * dt, H0);
        gv[static_cast<std::size_t>(i)] = eval.diffusion(ctx.t + tab.c1[i] * dt, H1);
    }

    Vector drift_sum = Vector::Zero(n);
    Vector w1 = Vector::Zero(n);
    Vector w2 = Vector::Zero(n);
    Vector w3 = Vector::Zero(n);
    Vector w4 = Vector::Zero(n);
    for (Index i = 0; i < s; ++i) {
        const auto& fi = fv[static_cast<std::size_t>(i)];
        const auto& gi = gv[static_cast<std::size_t>(i)];
        drift_sum += tab.alpha[i] * fi;
        w1 += tab.beta1[i] * gi;
        w2 += tab.beta2[i] * gi;
        w3 += tab.beta3[i] * gi;
        w4 += tab.beta4[i] * gi;
    }

    StepOutcome outcome;
    outcome.E1 = dt * (fv[0] + fv[1]);
    outcome.E2 = apply_noise(w3, chi.chi2) + apply_noise(w4, chi.chi3);
    outcome.u_next = ctx.u + dt * drift_sum + apply_noise(w1, ctx.noise.dW) +
                     apply_noise(w2, chi.chi1) + outcome.E2;
    outcome.has_error_estimate = true;
    return outcome;
}

// =============================================================================
// SRIW1 (coefficients written out)
// =============================================================================

StepOutcome SRIW1OptimizedKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    const Real t = ctx.t;
    const Real dt = ctx.dt;
    const Real sqdt = std::sqrt(dt);
    const Vector& u = ctx.u;
    const StochasticIntegrals chi = stochastic_integrals(ctx.noise);

    const Vector fH01 = dt * eval.drift(t, u);
    const Vector g1 = eval.diffusion(t, u);

    const Vector H0 = u + 0.75 * fH01 + 1.5 * apply_noise(g1, chi.chi2);
    const Vector H11 = u + 0.25 * fH01 + 0.5 * sqdt * g1;
    const Vector H12 = u + fH01 - sqdt * g1;

    const Vector g2 = eval.diffusion(t + 0.25 * dt, H11);
    const Vector g3 = eval.diffusion(t + dt, H12);

    const Vector H13 = u + 0.25 * fH01 + sqdt * (-5.0 * g1 + 3.0 * g2 + 0.5 * g3);
    const Vector g4 = eval.diffusion(t + 0.25 * dt, H13);
    const Vector fH02 = dt * eval.drift(t + 0.75 * dt, H0);

    StepOutcome outcome;
    outcome.E1 = fH01 + fH02;
    outcome.E2 = apply_noise(2.0 * g1 - (4.0 / 3.0) * g2 - (2.0 / 3.0) * g3, chi.chi2) +
                 apply_noise(-2.0 * g1 + (5.0 / 3.0) * g2 - (2.0 / 3.0) * g3 + g4, chi.chi3);
    outcome.u_next = u + (fH01 + 2.0 * fH02) / 3.0 +
                     apply_noise(-g1 + (4.0 / 3.0) * g2 + (2.0 / 3.0) * g3, ctx.noise.dW) +
                     apply_noise(-g1 + (4.0 / 3.0) * g2 - (1.0 / 3.0) * g3, chi.chi1) +
                     outcome.E2;
    outcome.has_error_estimate = true;
    return outcome;
}

// =============================================================================
// SRI on stage arrays
// =============================================================================

StepOutcome SRIVectorizedKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    const SRITableau& tab = tableau_;
    const Index s = tab.stages();
    const Real dt = ctx.dt;
    const Real sqdt = std::sqrt(dt);
    const Real u = ctx.u[0];
    const Real dW = ctx.noise.dW[0];
    const StochasticIntegrals chi = stochastic_integrals(ctx.noise);
    const Real chi1 = chi.chi1[0];
    const Real chi2 = chi.chi2[0];
    const Real chi3 = chi.chi3[0];

    // Unevaluated stages stay zero, so full-row products only see earlier stages
    Vector fv = Vector::Zero(s);
    Vector gv = Vector::Zero(s);
    Vector stage(1);

    for (Index i = 0; i < s; ++i) {
        const Real H0 = u + dt * tab.A0.row(i).dot(fv) + chi2 * tab.B0.row(i).dot(gv);
        const Real H1 = u + dt * tab.A1.row(i).dot(fv) + sqdt * tab.B1.row(i).dot(gv);

        stage[0] = H0;
        fv[i] = eval.drift(ctx.t + tab.c0[i] * dt, stage)[0];
        stage[0] = H1;
        gv[i] = eval.diffusion(ctx.t + tab.c1[i] * dt, stage)[0];
    }

    const Real E1 = dt * (fv[0] + fv[1]);
    const Real E2 = chi2 * tab.beta3.dot(gv) + chi3 * tab.beta4.dot(gv);

    StepOutcome outcome;
    outcome.E1 = Vector::Constant(1, E1);
    outcome.E2 = Vector::Constant(1, E2);
    outcome.u_next = Vector::Constant(
        1, u + dt * tab.alpha.dot(fv) + dW * tab.beta1.dot(gv) + chi1 * tab.beta2.dot(gv) + E2);
    outcome.has_error_estimate = true;
    return outcome;
}

}  // namespace stochsim::v1
