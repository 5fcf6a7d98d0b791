#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "stochsim/v1/problems.hpp"
#include "stochsim/v1/step_kernel.hpp"

#include <cmath>
#include <limits>

using namespace stochsim::v1;
using Catch::Approx;

namespace {

NoiseIncrement make_increment(Real dt, Real dW, Real dZ = 0.0) {
    NoiseIncrement inc;
    inc.dt = dt;
    inc.dW = Vector::Constant(1, dW);
    inc.dZ = Vector::Constant(1, dZ);
    return inc;
}

/// du = a u dt with no noise
SDEProblem deterministic_growth(Real a, Real u0) {
    SDEProblem problem;
    problem.drift = [a](Real, const Vector& u, Vector& du) { du = a * u; };
    problem.diffusion = [](Real, const Vector& u, Vector& du) { du = Vector::Zero(u.size()); };
    problem.u0 = Vector::Constant(1, u0);
    return problem;
}

StepOutcome run_step(const StepKernel& kernel,
                     const SDEProblem& problem,
                     const NoiseIncrement& inc,
                     bool estimate_error = true) {
    FunctionEvaluator eval(problem);
    return kernel.step(eval, StepContext{.t = 0.0, .dt = inc.dt, .u = problem.u0,
                                         .noise = inc, .estimate_error = estimate_error});
}

}  // namespace

TEST_CASE("Euler-Maruyama takes the explicit one-step update", "[v1][kernel]") {
    const SDEProblem problem = linear_problem(1.5, 0.5, 2.0);
    const NoiseIncrement inc = make_increment(0.1, 0.2);

    const StepOutcome out = run_step(EulerMaruyamaKernel{}, problem, inc, false);
    // u + a u dt + b u dW
    CHECK(out.u_next[0] == Approx(2.0 + 1.5 * 2.0 * 0.1 + 0.5 * 2.0 * 0.2));
    CHECK_FALSE(out.has_error_estimate);
}

TEST_CASE("Euler-Maruyama error estimate is the trapezoidal difference", "[v1][kernel]") {
    const SDEProblem problem = linear_problem(1.5, 0.5, 2.0);
    const NoiseIncrement inc = make_increment(0.1, 0.2);

    const StepOutcome out = run_step(EulerMaruyamaKernel{}, problem, inc);
    REQUIRE(out.has_error_estimate);
    const Real u1 = out.u_next[0];
    const Real expected = 0.5 * 0.1 * 1.5 * (u1 - 2.0) + 0.5 * 0.5 * (u1 - 2.0) * 0.2;
    CHECK(out.E1.size() == 0);
    CHECK(out.E2[0] == Approx(expected));
}

TEST_CASE("Milstein reduces to Euler for state-independent diffusion", "[v1][kernel]") {
    SDEProblem problem;
    problem.drift = [](Real, const Vector& u, Vector& du) { du = -u; };
    problem.diffusion = [](Real, const Vector& u, Vector& du) { du = Vector::Constant(u.size(), 0.3); };
    problem.u0 = Vector::Constant(1, 1.0);
    const NoiseIncrement inc = make_increment(0.05, -0.1);

    const StepOutcome mil = run_step(RKMilKernel{}, problem, inc, false);
    const StepOutcome em = run_step(EulerMaruyamaKernel{}, problem, inc, false);
    CHECK(mil.u_next[0] == Approx(em.u_next[0]));
}

TEST_CASE("Milstein matches the analytic Milstein correction for linear noise", "[v1][kernel]") {
    // g = b u: the derivative-free correction is exact up to the drift shift
    const Real a = 0.0;
    const Real b = 0.4;
    const SDEProblem problem = linear_problem(a, b, 1.0);
    const Real dt = 0.01;
    const Real dW = 0.07;

    const StepOutcome out = run_step(RKMilKernel{}, problem, make_increment(dt, dW), false);
    const Real expected = 1.0 + b * dW + 0.5 * b * b * (dW * dW - dt);
    CHECK(out.u_next[0] == Approx(expected).epsilon(1e-12));
}

TEST_CASE("Tableau kernels are exact Runge-Kutta steps without noise", "[v1][kernel]") {
    const Real a = -0.8;
    const Real dt = 0.1;
    const SDEProblem problem = deterministic_growth(a, 1.0);
    const NoiseIncrement inc = make_increment(dt, 0.3, -0.2);
    // Two-stage second-order scheme on du = a u
    const Real expected = 1.0 + a * dt + 0.5 * a * a * dt * dt;

    CHECK(run_step(SRIW1OptimizedKernel{}, problem, inc).u_next[0] == Approx(expected));
    CHECK(run_step(SRA1OptimizedKernel{}, problem, inc).u_next[0] == Approx(expected));
    CHECK(run_step(SRIKernel{construct_sriw1()}, problem, inc).u_next[0] == Approx(expected));
    CHECK(run_step(SRAKernel{construct_sra1()}, problem, inc).u_next[0] == Approx(expected));

    const StepOutcome sri = run_step(SRIW1OptimizedKernel{}, problem, inc);
    CHECK(sri.E2[0] == Approx(0.0).margin(1e-15));
    CHECK(sri.E1[0] == Approx(dt * a * (1.0 + (1.0 + 0.75 * a * dt))));
}

TEST_CASE("General SRI kernel agrees with the written-out SRIW1", "[v1][kernel]") {
    const SDEProblem problem = linear_problem(1.01, 0.87, 0.5);
    const NoiseIncrement inc = make_increment(0.02, 0.11, -0.07);

    const StepOutcome general = run_step(SRIKernel{construct_sriw1()}, problem, inc);
    const StepOutcome optimized = run_step(SRIW1OptimizedKernel{}, problem, inc);
    const StepOutcome vectorized = run_step(SRIVectorizedKernel{construct_sriw1()}, problem, inc);

    CHECK(general.u_next[0] == Approx(optimized.u_next[0]).epsilon(1e-12));
    CHECK(general.E1[0] == Approx(optimized.E1[0]).epsilon(1e-12));
    CHECK(general.E2[0] == Approx(optimized.E2[0]).epsilon(1e-12));
    CHECK(vectorized.u_next[0] == Approx(general.u_next[0]).epsilon(1e-12));
    CHECK(vectorized.E2[0] == Approx(general.E2[0]).epsilon(1e-12));
}

TEST_CASE("General SRA kernel agrees with the written-out SRA1", "[v1][kernel]") {
    const SDEProblem problem = additive_problem(0.1, 0.05, 0.5);
    NoiseIncrement inc = make_increment(0.05, 0.21, 0.04);

    FunctionEvaluator eval(problem);
    const StepContext ctx{.t = 0.3, .dt = inc.dt, .u = problem.u0, .noise = inc, .estimate_error = true};
    const StepOutcome general = SRAKernel{construct_sra1()}.step(eval, ctx);
    const StepOutcome optimized = SRA1OptimizedKernel{}.step(eval, ctx);
    const StepOutcome vectorized = SRAVectorizedKernel{construct_sra1()}.step(eval, ctx);

    CHECK(general.u_next[0] == Approx(optimized.u_next[0]).epsilon(1e-12));
    CHECK(general.E1[0] == Approx(optimized.E1[0]).epsilon(1e-12));
    CHECK(general.E2[0] == Approx(optimized.E2[0]).epsilon(1e-12));
    CHECK(vectorized.u_next[0] == Approx(general.u_next[0]).epsilon(1e-12));
}

TEST_CASE("Scalar noise broadcasts one increment to every component", "[v1][kernel]") {
    SDEProblem problem = linear_diagonal_problem(Vector::Constant(3, 1.0), 0.0, 1.0);
    problem.noise.kind = NoiseKind::Scalar;
    CHECK(wiener_shape(problem).dimension == 1);

    const StepOutcome out = run_step(EulerMaruyamaKernel{}, problem, make_increment(0.01, 0.05), false);
    REQUIRE(out.u_next.size() == 3);
    CHECK(out.u_next[0] == Approx(1.05));
    CHECK(out.u_next[2] == Approx(1.05));
}

TEST_CASE("Tau-leaping with zero rates returns the previous state", "[v1][kernel][jumps]") {
    SDEProblem problem = birth_death_problem(0.0, 0.0, 7.0);
    const TauLeapingKernel kernel;
    FunctionEvaluator eval(problem);

    const NoiseShape shape = kernel.noise_shape(problem);
    CHECK(shape.process == NoiseProcess::Poisson);
    CHECK(shape.dimension == 2);

    NoiseSource source(shape, 5);
    const NoiseIncrement inc = kernel.draw_increment(source, eval, 0.0, 0.5, problem.u0);
    const StepOutcome out = kernel.step(
        eval, StepContext{.t = 0.0, .dt = 0.5, .u = problem.u0, .noise = inc, .estimate_error = false});
    CHECK(out.u_next[0] == 7.0);
    CHECK_FALSE(kernel.supports_adaptivity());
}

TEST_CASE("Tau-leaping applies the stoichiometry to the counts", "[v1][kernel][jumps]") {
    const SDEProblem problem = birth_death_problem(10.0, 0.1, 10.0);
    FunctionEvaluator eval(problem);

    NoiseIncrement inc;
    inc.dt = 1.0;
    inc.dW = Vector(2);
    inc.dW << 4.0, 1.0;
    const StepOutcome out = TauLeapingKernel{}.step(
        eval, StepContext{.t = 0.0, .dt = 1.0, .u = problem.u0, .noise = inc, .estimate_error = false});
    CHECK(out.u_next[0] == Approx(13.0));
}

TEST_CASE("Function evaluator rejects wrongly sized callables", "[v1][kernel][safety]") {
    SDEProblem problem = linear_problem();
    problem.drift = [](Real, const Vector&, Vector& du) { du = Vector::Zero(3); };
    FunctionEvaluator eval(problem);
    CHECK_THROWS_AS(eval.drift(0.0, problem.u0), CallableError);
    CHECK_NOTHROW(eval.diffusion(0.0, problem.u0));
    CHECK(eval.diffusion_calls() == 1);
}

TEST_CASE("Stochastic integrals follow their closed forms", "[v1][kernel]") {
    const Real dt = 0.04;
    const NoiseIncrement inc = make_increment(dt, 0.3, 0.1);
    const StochasticIntegrals chi = stochastic_integrals(inc);
    CHECK(chi.chi1[0] == Approx((0.09 - dt) / (2.0 * 0.2)));
    CHECK(chi.chi2[0] == Approx(0.5 * (0.3 + 0.1 / std::sqrt(3.0))));
    CHECK(chi.chi3[0] == Approx((0.027 - 3.0 * 0.3 * dt) / (6.0 * dt)));
}

TEST_CASE("Kernel selection reports unsupported configurations", "[v1][kernel][config]") {
    SolveOptions opts;

    SECTION("default is the written-out SRIW1") {
        auto kernel = make_step_kernel(opts, linear_problem());
        REQUIRE(kernel.has_value());
        CHECK((*kernel)->name() == "SRIW1Optimized");
        CHECK((*kernel)->order() == 1.5);
    }

    SECTION("vectorized kernels need a one-dimensional state") {
        opts.algorithm = Algorithm::SRIVectorized;
        auto kernel = make_step_kernel(opts, linear_diagonal_problem(Vector::Constant(2, 1.0)));
        REQUIRE_FALSE(kernel.has_value());
        CHECK(kernel.error().status == SolveStatus::UnimplementedScheme);
    }

    SECTION("adaptive tau-leaping is unimplemented") {
        opts.algorithm = Algorithm::TauLeaping;
        opts.adaptive = true;
        auto kernel = make_step_kernel(opts, birth_death_problem());
        REQUIRE_FALSE(kernel.has_value());
        CHECK(kernel.error().status == SolveStatus::UnimplementedScheme);
    }

    SECTION("tau-leaping needs jumps") {
        opts.algorithm = Algorithm::TauLeaping;
        auto kernel = make_step_kernel(opts, linear_problem());
        REQUIRE_FALSE(kernel.has_value());
        CHECK(kernel.error().status == SolveStatus::UnimplementedScheme);
    }

    SECTION("tableau family must match the algorithm") {
        opts.algorithm = Algorithm::SRI;
        opts.tableau = Tableau{construct_sra1()};
        auto kernel = make_step_kernel(opts, linear_problem());
        REQUIRE_FALSE(kernel.has_value());
        CHECK(kernel.error().status == SolveStatus::InvalidTableau);
    }

    SECTION("inconsistent tableau is rejected") {
        SRITableau bad = construct_sriw1();
        bad.alpha[0] = 0.9;
        opts.algorithm = Algorithm::SRI;
        opts.tableau = Tableau{bad};
        auto kernel = make_step_kernel(opts, linear_problem());
        REQUIRE_FALSE(kernel.has_value());
        CHECK(kernel.error().status == SolveStatus::InvalidTableau);
    }

    SECTION("fixed-coefficient kernels take no tableau") {
        opts.algorithm = Algorithm::SRIW1Optimized;
        opts.tableau = Tableau{construct_sriw1()};
        auto kernel = make_step_kernel(opts, linear_problem());
        REQUIRE_FALSE(kernel.has_value());
        CHECK(kernel.error().status == SolveStatus::UnimplementedScheme);
    }
}
