#include "stochsim/v1/validation.hpp"

#include "stochsim/v1/integrator.hpp"

#include <algorithm>
#include <cmath>

namespace stochsim::v1 {

AnalyticComparison compare_with_analytic(const Solution& solution,
                                         const std::string& name,
                                         Real threshold) {
    AnalyticComparison result;
    result.test_name = name.empty() ? solution.algorithm : name;
    result.error_threshold = threshold;

    if (!solution.has_analytic()) {
        return result;
    }

    result.final_error = (solution.u - solution.u_analytic).cwiseAbs().maxCoeff();

    const std::size_t n = std::min(solution.states.size(), solution.states_analytic.size());
    Real sum_sq = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Real err = (solution.states[i] - solution.states_analytic[i]).cwiseAbs().maxCoeff();
        result.max_error = std::max(result.max_error, err);
        sum_sq += err * err;
    }
    result.num_points = n;
    if (n > 0) {
        result.rms_error = std::sqrt(sum_sq / static_cast<Real>(n));
    } else {
        result.max_error = result.final_error;
        result.rms_error = result.final_error;
    }

    result.passed = result.max_error <= threshold && result.final_error <= threshold;
    return result;
}

Real log_log_slope(const std::vector<Real>& x, const std::vector<Real>& y) {
    Real sx = 0.0;
    Real sy = 0.0;
    Real sxx = 0.0;
    Real sxy = 0.0;
    std::size_t n = 0;
    for (std::size_t i = 0; i < x.size() && i < y.size(); ++i) {
        if (!(x[i] > 0.0) || !(y[i] > 0.0)) continue;
        const Real lx = std::log(x[i]);
        const Real ly = std::log(y[i]);
        sx += lx;
        sy += ly;
        sxx += lx * lx;
        sxy += lx * ly;
        ++n;
    }
    if (n < 2) {
        return 0.0;
    }
    const Real count = static_cast<Real>(n);
    const Real denom = count * sxx - sx * sx;
    if (std::abs(denom) < 1e-300) {
        return 0.0;
    }
    return (count * sxy - sx * sy) / denom;
}

ConvergenceStudy strong_convergence_study(const SDEProblem& problem,
                                          const std::vector<Real>& time_span,
                                          const SolveOptions& options,
                                          const std::vector<Real>& dts,
                                          std::size_t trajectories,
                                          std::uint64_t base_seed) {
    ConvergenceStudy study;
    study.trajectories = trajectories;

    if (!problem.has_analytic()) {
        study.message = "problem has no analytic solution";
        return study;
    }
    if (trajectories == 0 || dts.size() < 2) {
        study.message = "need at least one trajectory and two step sizes";
        return study;
    }

    SolveOptions run_options = options;
    run_options.adaptive = false;
    run_options.save_timeseries = false;
    run_options.progress = nullptr;
    run_options.step_logger = nullptr;

    for (Real dt : dts) {
        run_options.dt = dt;
        Real sum_sq = 0.0;
        std::size_t used = 0;
        for (std::size_t k = 0; k < trajectories; ++k) {
            run_options.seed = base_seed + k;
            const Solution sol = solve(problem, time_span, run_options);
            if (!sol.success() || !sol.has_analytic()) {
                ++study.failed_runs;
                if (study.message.empty()) {
                    study.message = std::string("run failed: ") + to_string(sol.status) + ": " + sol.message;
                }
                continue;
            }
            sum_sq += (sol.u - sol.u_analytic).squaredNorm();
            ++used;
        }
        study.dts.push_back(dt);
        study.rms_errors.push_back(used > 0 ? std::sqrt(sum_sq / static_cast<Real>(used)) : 0.0);
    }

    study.estimated_order = log_log_slope(study.dts, study.rms_errors);
    return study;
}

}  // namespace stochsim::v1
