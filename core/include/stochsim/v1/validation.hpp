#pragma once

// =============================================================================
// stochsim v1 - Validation Against Closed-form Solutions
// =============================================================================
// This header provides:
// - compare_with_analytic: path-wise error of a solution with an analytic series
// - strong_convergence_study: RMS final-time error over many paths per dt and
//   the fitted log-log slope (empirical strong order)
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"
#include "stochsim/v1/options.hpp"
#include "stochsim/v1/problem.hpp"
#include "stochsim/v1/solution.hpp"

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace stochsim::v1 {

/// Path-wise error metrics against the analytic solution
struct AnalyticComparison {
    std::string test_name;
    bool passed = false;
    Real max_error = 0.0;      // Max absolute component error over the stored series
    Real rms_error = 0.0;      // RMS of the per-point max errors
    Real final_error = 0.0;    // Max absolute component error at the final time
    std::size_t num_points = 0;
    Real error_threshold = 1e-2;

    [[nodiscard]] std::string to_string() const {
        std::ostringstream ss;
        ss << std::scientific << std::setprecision(6);
        ss << "Test: " << test_name << "\n";
        ss << "  Status: " << (passed ? "PASSED" : "FAILED") << "\n";
        ss << "  Points: " << num_points << "\n";
        ss << "  Max Error: " << max_error << "\n";
        ss << "  RMS Error: " << rms_error << "\n";
        ss << "  Final Error: " << final_error << "\n";
        ss << "  Threshold: " << error_threshold << "\n";
        return ss.str();
    }
};

/// Needs a solution produced from a problem with an analytic solution
[[nodiscard]] AnalyticComparison compare_with_analytic(const Solution& solution,
                                                       const std::string& name = "",
                                                       Real threshold = 1e-2);

struct ConvergenceStudy {
    std::vector<Real> dts;
    std::vector<Real> rms_errors;       // RMS final-time error per dt
    Real estimated_order = 0.0;         // Least-squares slope of log(error) vs log(dt)
    std::size_t trajectories = 0;
    std::size_t failed_runs = 0;
    std::string message;

    [[nodiscard]] bool valid() const {
        return failed_runs == 0 && rms_errors.size() >= 2 && message.empty();
    }

    [[nodiscard]] std::string to_csv() const {
        std::ostringstream ss;
        ss << "dt,rms_error\n" << std::scientific << std::setprecision(6);
        for (std::size_t i = 0; i < dts.size() && i < rms_errors.size(); ++i) {
            ss << dts[i] << "," << rms_errors[i] << "\n";
        }
        return ss.str();
    }
};

/// Runs `trajectories` independent fixed-step paths per dt over time_span and
/// compares the final state with problem.analytic. Path k uses seed base_seed + k.
[[nodiscard]] ConvergenceStudy strong_convergence_study(const SDEProblem& problem,
                                                        const std::vector<Real>& time_span,
                                                        const SolveOptions& options,
                                                        const std::vector<Real>& dts,
                                                        std::size_t trajectories,
                                                        std::uint64_t base_seed = 1);

/// Least-squares slope of log(y) against log(x); points with non-positive values are skipped
[[nodiscard]] Real log_log_slope(const std::vector<Real>& x, const std::vector<Real>& y);

}  // namespace stochsim::v1
