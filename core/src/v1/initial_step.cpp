#include "stochsim/v1/initial_step.hpp"

#include "stochsim/v1/error_estimator.hpp"
#include "stochsim/v1/step_kernel.hpp"

#include <algorithm>
#include <cmath>

namespace stochsim::v1 {

namespace {

constexpr Real kDiffusionWeight = 3.0;
constexpr Real kSmallScale = 1e-5;
constexpr Real kFallbackTrialStep = 1e-6;
constexpr Real kMinInitialStep = 1e-6;

}  // namespace

InitialStepEstimate estimate_initial_step(FunctionEvaluator& eval,
                                          Real t0,
                                          const Vector& u0,
                                          Real order,
                                          Real abstol,
                                          Real reltol,
                                          Real internalnorm) {
    InitialStepEstimate est;

    const Vector scale =
        (abstol + u0.cwiseAbs().array() * reltol).max(kErrorDenominatorFloor).matrix();

    est.d0 = p_norm(u0.cwiseQuotient(scale), internalnorm);

    const Vector f0 = eval.drift(t0, u0);
    const Vector g0 = kDiffusionWeight * eval.diffusion(t0, u0);

    const Vector first = (f0 + g0).cwiseAbs().cwiseMax((f0 - g0).cwiseAbs());
    est.d1 = p_norm(first.cwiseQuotient(scale), internalnorm);

    if (est.d0 < kSmallScale || est.d1 < kSmallScale) {
        est.dt_trial = kFallbackTrialStep;
    } else {
        est.dt_trial = 0.01 * (est.d0 / est.d1);
    }
    const Real dt0 = est.dt_trial;

    const Vector u1 = u0 + dt0 * f0;
    const Vector f1 = eval.drift(t0 + dt0, u1);
    const Vector g1 = kDiffusionWeight * eval.diffusion(t0 + dt0, u1);

    const Vector dg_max = (g0 - g1).cwiseAbs().cwiseMax((g0 + g1).cwiseAbs());
    const Vector df = f1 - f0;
    const Vector second = (df + dg_max).cwiseAbs().cwiseMax((df - dg_max).cwiseAbs());
    est.d2 = p_norm(second.cwiseQuotient(scale), internalnorm) / dt0;

    const Real dmax = std::max(est.d1, est.d2);
    Real dt1 = 0.0;
    if (dmax <= kNegligibleScale) {
        est.degenerate = true;
        dt1 = std::max(kMinInitialStep, dt0 * 1e-3);
    } else {
        dt1 = std::pow(10.0, -(2.0 + std::log10(dmax)) / (order + 0.5));
    }

    est.dt = std::min(100.0 * dt0, dt1);
    return est;
}

}  // namespace stochsim::v1
