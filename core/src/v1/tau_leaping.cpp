#include "stochsim/v1/step_kernel.hpp"

namespace stochsim::v1 {

NoiseShape TauLeapingKernel::noise_shape(const SDEProblem& problem) const {
    if (!problem.has_jumps()) {
        throw CallableError("problem has no jump description");
    }
    return jump_shape(*problem.jumps);
}

NoiseIncrement TauLeapingKernel::draw_increment(NoiseSource& source,
                                                FunctionEvaluator& eval,
                                                Real t,
                                                Real dt,
                                                const Vector& u) const {
    // Propensities are frozen over the leap
    return source.draw_jump_counts(t, dt, eval.jump_rates(t, u));
}

StepOutcome TauLeapingKernel::step(FunctionEvaluator& eval, const StepContext& ctx) const {
    StepOutcome outcome;
    outcome.u_next = ctx.u + eval.jump_change(ctx.t, ctx.u, ctx.noise.dW);
    return outcome;
}

}  // namespace stochsim::v1
