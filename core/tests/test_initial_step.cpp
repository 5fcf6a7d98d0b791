#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "stochsim/v1/initial_step.hpp"
#include "stochsim/v1/problems.hpp"
#include "stochsim/v1/step_kernel.hpp"

#include <cmath>

using namespace stochsim::v1;
using Catch::Approx;

TEST_CASE("Initial step for a problem with no dynamics", "[v1][initial_step]") {
    SDEProblem problem;
    problem.drift = [](Real, const Vector& u, Vector& du) { du = Vector::Zero(u.size()); };
    problem.diffusion = [](Real, const Vector& u, Vector& du) { du = Vector::Zero(u.size()); };
    problem.u0 = Vector::Constant(1, 1.0);

    FunctionEvaluator eval(problem);
    const InitialStepEstimate est = estimate_initial_step(eval, 0.0, problem.u0, 1.5, 1e-3, 1e-6);

    CHECK(est.degenerate);
    CHECK(est.dt_trial == 1e-6);
    CHECK(est.dt == Approx(1e-6));
    CHECK(est.d1 == 0.0);
}

TEST_CASE("Initial step shrinks with stronger noise", "[v1][initial_step]") {
    const SDEProblem calm = linear_problem(1.01, 0.1, 0.5);
    const SDEProblem noisy = linear_problem(1.01, 2.0, 0.5);

    FunctionEvaluator calm_eval(calm);
    FunctionEvaluator noisy_eval(noisy);
    const auto calm_est = estimate_initial_step(calm_eval, 0.0, calm.u0, 1.5, 1e-3, 1e-6);
    const auto noisy_est = estimate_initial_step(noisy_eval, 0.0, noisy.u0, 1.5, 1e-3, 1e-6);

    CHECK(calm_est.dt > 0.0);
    CHECK(noisy_est.dt > 0.0);
    CHECK(noisy_est.dt < calm_est.dt);
    CHECK_FALSE(calm_est.degenerate);
}

TEST_CASE("Initial step never exceeds a hundred trial steps", "[v1][initial_step]") {
    const SDEProblem problem = linear_problem(1.01, 0.87, 0.5);
    FunctionEvaluator eval(problem);
    const auto est = estimate_initial_step(eval, 0.0, problem.u0, 1.5, 1e-2, 1e-2);

    CHECK(est.dt <= 100.0 * est.dt_trial);
    CHECK(std::isfinite(est.d2));
    // Both trial points were evaluated
    CHECK(eval.drift_calls() == 2);
    CHECK(eval.diffusion_calls() == 2);
}

TEST_CASE("Initial step uses the small-scale trial step", "[v1][initial_step]") {
    // u0 = 0 makes d0 vanish
    const SDEProblem problem = additive_problem(0.1, 0.05, 0.0);
    FunctionEvaluator eval(problem);
    const auto est = estimate_initial_step(eval, 0.0, problem.u0, 2.0, 1e-3, 1e-6);
    CHECK(est.d0 == 0.0);
    CHECK(est.dt_trial == 1e-6);
    CHECK(est.dt <= 1e-4);
}

TEST_CASE("Initial step is not floored for large scales", "[v1][initial_step]") {
    // f and g of order 1e3 push dt1 near 1e-7
    const SDEProblem problem = linear_problem(1e3, 1e3, 0.5);
    FunctionEvaluator eval(problem);
    const auto est = estimate_initial_step(eval, 0.0, problem.u0, 1.5, 1e-3, 1e-6);

    CHECK_FALSE(est.degenerate);
    CHECK(est.dt > 0.0);
    CHECK(est.dt < 1e-6);
    CHECK(est.dt <= 100.0 * est.dt_trial);
}
