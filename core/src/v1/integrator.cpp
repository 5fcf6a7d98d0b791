#include "stochsim/v1/integrator.hpp"

#include "stochsim/v1/error_estimator.hpp"
#include "stochsim/v1/initial_step.hpp"
#include "stochsim/v1/noise.hpp"
#include "stochsim/v1/step_controller.hpp"
#include "stochsim/v1/step_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <utility>

namespace stochsim::v1 {

namespace {

constexpr Real kFallbackInitialStep = 1e-6;

[[nodiscard]] bool finite_positive(Real value) {
    return std::isfinite(value) && value > 0.0;
}

std::string describe_time(const char* what, Real t, Real dt) {
    std::ostringstream out;
    out << what << " at t=" << t << " (dt=" << dt << ")";
    return out.str();
}

}  // namespace

// =============================================================================
// Input Validation
// =============================================================================

std::optional<InputIssue> validate_solve_inputs(const SDEProblem& problem,
                                                const std::vector<Real>& time_span,
                                                const SolveOptions& options) {
    if (time_span.size() != 2) {
        return InputIssue{"time span must have exactly two entries {t0, tf}, got " +
                          std::to_string(time_span.size())};
    }
    const Real t0 = time_span[0];
    const Real tf = time_span[1];
    if (!std::isfinite(t0) || !std::isfinite(tf)) {
        return InputIssue{"time span must be finite"};
    }
    if (!(tf > t0)) {
        return InputIssue{"end time must be strictly greater than start time"};
    }

    if (problem.u0.size() == 0) {
        return InputIssue{"initial state must be non-empty"};
    }
    if (!problem.u0.allFinite()) {
        return InputIssue{"initial state contains non-finite values"};
    }

    if (options.algorithm != Algorithm::TauLeaping) {
        if (!problem.drift || !problem.diffusion) {
            return InputIssue{"problem needs both drift and diffusion functions"};
        }
    } else if (options.dt <= 0.0) {
        return InputIssue{"tau-leaping needs an explicit dt > 0"};
    }

    if (options.timeseries_steps == 0) {
        return InputIssue{"timeseries_steps must be at least 1"};
    }
    if (!std::isfinite(options.dt) || options.dt < 0.0) {
        return InputIssue{"dt must be finite and non-negative (0 selects it automatically)"};
    }
    if (!finite_positive(options.dtmin)) {
        return InputIssue{"dtmin must be finite and positive"};
    }
    if (options.dtmax) {
        if (!finite_positive(*options.dtmax) || *options.dtmax < options.dtmin) {
            return InputIssue{"dtmax must be finite, positive and >= dtmin"};
        }
    } else if ((tf - t0) / 2.0 < options.dtmin) {
        return InputIssue{"time span is shorter than twice dtmin"};
    }

    if (!std::isfinite(options.abstol) || options.abstol < 0.0 ||
        !std::isfinite(options.reltol) || options.reltol < 0.0) {
        return InputIssue{"abstol and reltol must be finite and non-negative"};
    }
    if (!finite_positive(options.gamma)) {
        return InputIssue{"gamma must be finite and positive"};
    }
    if (!finite_positive(options.qmin) || options.qmin > 1.0) {
        return InputIssue{"qmin must lie in (0, 1]"};
    }
    if (!std::isfinite(options.qmax) || options.qmax < 1.0) {
        return InputIssue{"qmax must be finite and >= 1"};
    }
    if (!std::isfinite(options.delta) || options.delta < 0.0) {
        return InputIssue{"delta must be finite and non-negative"};
    }
    if (std::isnan(options.internalnorm) || options.internalnorm < 1.0) {
        return InputIssue{"internalnorm must be >= 1 (inf selects the max norm)"};
    }
    if (!std::isfinite(options.discard_length) || options.discard_length < 0.0) {
        return InputIssue{"discard_length must be finite and non-negative"};
    }
    if (options.maxiters == 0) {
        return InputIssue{"maxiters must be at least 1"};
    }
    return std::nullopt;
}

// =============================================================================
// SDEIntegrator
// =============================================================================

SDEIntegrator::SDEIntegrator(const SDEProblem& problem,
                             std::unique_ptr<StepKernel> kernel,
                             SolveOptions options)
    : problem_(problem)
    , kernel_(std::move(kernel))
    , options_(std::move(options)) {}

Solution SDEIntegrator::integrate(Real t0, Real tf) {
    const auto start_time = std::chrono::high_resolution_clock::now();

    Solution result;
    result.algorithm = std::string(kernel_->name());

    FunctionEvaluator eval(problem_);
    const NoiseShape shape = kernel_->noise_shape(problem_);
    NoiseSource source(shape, options_.seed);
    NoiseBuffer buffer(shape, options_.save_timeseries);

    const Real dtmax = options_.dtmax.value_or((tf - t0) / 2.0);
    auto controller = make_step_controller(options_.adaptive_controller,
                                           ControllerConfig::from_options(options_, dtmax));
    const ErrorEstimator estimator(ErrorEstimatorConfig{
        options_.abstol, options_.reltol, options_.delta, options_.internalnorm});

    const bool adaptive = options_.adaptive;
    const Real order = kernel_->order();
    StepLogger* logger = options_.step_logger;

    Real t = t0;
    Vector u = problem_.u0;

    auto record_point = [&](Real time, const Vector& state, const Vector& W) {
        result.time.push_back(time);
        result.states.push_back(state);
        result.wiener.push_back(W);
        if (problem_.has_analytic()) {
            result.states_analytic.push_back(problem_.analytic(time, problem_.u0, W));
        }
    };

    auto finish = [&](SolveStatus status, std::string message) {
        result.status = status;
        result.message = std::move(message);
        result.u = u;
        result.t = t;
        result.W = buffer.W();
        if (problem_.has_analytic() && status == SolveStatus::Success) {
            result.u_analytic = problem_.analytic(t, problem_.u0, result.W);
        }
        result.rejected_steps = controller->state().rejected;
        result.max_stack_size = buffer.max_size();
        result.drift_evaluations = eval.drift_calls();
        result.diffusion_evaluations = eval.diffusion_calls();
        const auto end_time = std::chrono::high_resolution_clock::now();
        result.wall_time_seconds = std::chrono::duration<double>(end_time - start_time).count();
        return std::move(result);
    };

    try {
        Real dt = options_.dt;
        if (dt == 0.0) {
            const InitialStepEstimate est = estimate_initial_step(
                eval, t0, u, order, options_.abstol, options_.reltol, options_.internalnorm);
            dt = finite_positive(est.dt) ? est.dt : kFallbackInitialStep;
        }
        if (adaptive) {
            dt = std::clamp(dt, options_.dtmin, dtmax);
        }
        result.initial_dt = dt;
        const Real dt_nominal = dt;

        if (options_.save_timeseries) {
            record_point(t, u, buffer.W());
        }

        while (t < tf) {
            if (result.accepted_steps >= options_.maxiters) {
                return finish(SolveStatus::IterationBudgetExceeded,
                              "accepted steps reached maxiters=" + std::to_string(options_.maxiters) +
                                  " before the end time (" + describe_time("stopped", t, dt) + ")");
            }

            // Final step: clamp, and absorb a sliver remainder into this step
            Real dt_attempt = dt;
            const Real remaining = tf - (t + dt_attempt);
            const bool final_step = remaining <= kFinalStepSnap * dt_attempt;
            if (final_step) {
                dt_attempt = tf - t;
            }

            const NoiseIncrement increment = kernel_->draw_increment(source, eval, t, dt_attempt, u);
            buffer.stage(increment);

            StepOutcome outcome = kernel_->step(
                eval, StepContext{.t = t, .dt = dt_attempt, .u = u, .noise = increment,
                                  .estimate_error = adaptive});

            if (!all_finite(outcome.u_next)) {
                buffer.discard_speculative();
                ++result.nonfinite_rejections;
                const StepDecision decision = controller->reject_nonfinite(dt_attempt);
                if (logger) {
                    logger->log(t, dt_attempt, decision.error_ratio, decision.dt_next,
                                StepEvent::RejectedNonFinite);
                }
                if (decision.collapsed) {
                    return finish(SolveStatus::StepSizeCollapse,
                                  describe_time("non-finite state with dt at dtmin", t, dt_attempt));
                }
                dt = decision.dt_next;
                continue;
            }

            Real error = 0.0;
            Real dt_next = dt_nominal;
            if (adaptive) {
                error = estimator.estimate(outcome, u);
                const StepDecision decision = controller->decide(error, dt_attempt, order);
                if (!decision.accepted) {
                    buffer.discard_speculative();
                    if (logger) {
                        logger->log(t, dt_attempt, error, decision.dt_next, StepEvent::RejectedError);
                    }
                    if (decision.collapsed) {
                        return finish(SolveStatus::StepSizeCollapse,
                                      describe_time("step size fell below dtmin", t, decision.dt_next));
                    }
                    dt = decision.dt_next;
                    continue;
                }
                // A clamped final step says nothing about the natural step size
                dt_next = final_step ? dt : decision.dt_next;
            }

            buffer.commit();
            u = std::move(outcome.u_next);
            t = final_step ? tf : t + dt_attempt;
            ++result.accepted_steps;
            result.last_dt = dt_attempt;
            dt = dt_next;

            if (logger) {
                logger->log(t - dt_attempt, dt_attempt, error, dt_next,
                            final_step ? StepEvent::FinalStep : StepEvent::Accepted);
            }

            if (options_.save_timeseries && result.accepted_steps % options_.timeseries_steps == 0) {
                record_point(t, u, buffer.W());
            }

            if (options_.progress && options_.progress_steps > 0 &&
                result.accepted_steps % options_.progress_steps == 0) {
                options_.progress(ProgressInfo{t, dt_attempt, (t - t0) / (tf - t0),
                                               result.accepted_steps, controller->state().rejected});
            }
        }
    } catch (const CallableError& e) {
        return finish(SolveStatus::InputError, e.what());
    }

    return finish(SolveStatus::Success, "Integration completed");
}

// =============================================================================
// Entry Point
// =============================================================================

Solution solve(const SDEProblem& problem,
               const std::vector<Real>& time_span,
               const SolveOptions& options) {
    auto early_exit = [&](SolveStatus status, std::string message) {
        Solution result;
        result.status = status;
        result.message = std::move(message);
        result.algorithm = to_string(options.algorithm);
        result.u = problem.u0;
        result.t = time_span.empty() ? 0.0 : time_span.front();
        return result;
    };

    if (const auto issue = validate_solve_inputs(problem, time_span, options)) {
        return early_exit(SolveStatus::InputError, issue->message);
    }

    auto kernel = make_step_kernel(options, problem);
    if (!kernel) {
        return early_exit(kernel.error().status, kernel.error().message);
    }

    SDEIntegrator integrator(problem, std::move(*kernel), options);
    return integrator.integrate(time_span[0], time_span[1]);
}

}  // namespace stochsim::v1
