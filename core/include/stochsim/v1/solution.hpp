#pragma once

// =============================================================================
// stochsim v1 - Solution Record
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"
#include "stochsim/v1/status.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace stochsim::v1 {

struct Solution {
    // Final values (last valid values on failure)
    Vector u;
    Real t = 0.0;
    Vector W;

    // Time series: initial point plus every timeseries_steps-th accepted step
    std::vector<Real> time;
    std::vector<Vector> states;
    std::vector<Vector> wiener;

    // Analytic comparison (problems with a closed form only)
    Vector u_analytic;
    std::vector<Vector> states_analytic;

    SolveStatus status = SolveStatus::Success;
    std::string message;
    std::string algorithm;

    // Telemetry
    std::size_t accepted_steps = 0;
    std::size_t rejected_steps = 0;
    std::size_t nonfinite_rejections = 0;
    std::size_t max_stack_size = 0;
    std::size_t drift_evaluations = 0;
    std::size_t diffusion_evaluations = 0;
    Real initial_dt = 0.0;
    Real last_dt = 0.0;
    double wall_time_seconds = 0.0;

    [[nodiscard]] bool success() const { return status == SolveStatus::Success; }
    [[nodiscard]] bool has_timeseries() const { return !time.empty(); }
    [[nodiscard]] bool has_analytic() const { return u_analytic.size() > 0; }
};

}  // namespace stochsim::v1
