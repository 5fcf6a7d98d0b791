#pragma once

// =============================================================================
// stochsim v1 - Solver Options
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"
#include "stochsim/v1/tableau.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace stochsim::v1 {

class StepLogger;

// =============================================================================
// Algorithm Identifiers
// =============================================================================

enum class Algorithm {
    EM,              // Euler-Maruyama, strong order 0.5
    RKMil,           // Derivative-free Milstein, strong order 1.0
    SRA,             // Additive noise, any SRA tableau
    SRI,             // Diagonal noise, any SRI tableau
    SRIW1Optimized,  // SRIW1 with the coefficients folded in
    SRA1Optimized,   // SRA1 with the coefficients folded in
    SRAVectorized,   // SRA on whole stage arrays, one-dimensional state
    SRIVectorized,   // SRI on whole stage arrays, one-dimensional state
    TauLeaping       // Poisson jump counts per reaction channel
};

inline constexpr Algorithm kAllAlgorithms[] = {
    Algorithm::EM,
    Algorithm::RKMil,
    Algorithm::SRA,
    Algorithm::SRI,
    Algorithm::SRIW1Optimized,
    Algorithm::SRA1Optimized,
    Algorithm::SRAVectorized,
    Algorithm::SRIVectorized,
    Algorithm::TauLeaping,
};

[[nodiscard]] constexpr const char* to_string(Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::EM: return "EM";
        case Algorithm::RKMil: return "RKMil";
        case Algorithm::SRA: return "SRA";
        case Algorithm::SRI: return "SRI";
        case Algorithm::SRIW1Optimized: return "SRIW1Optimized";
        case Algorithm::SRA1Optimized: return "SRA1Optimized";
        case Algorithm::SRAVectorized: return "SRAVectorized";
        case Algorithm::SRIVectorized: return "SRIVectorized";
        case Algorithm::TauLeaping: return "TauLeaping";
        default: return "unknown";
    }
}

/// Case-sensitive lookup by the names returned from to_string
[[nodiscard]] constexpr std::optional<Algorithm> parse_algorithm(std::string_view name) noexcept {
    for (Algorithm algorithm : kAllAlgorithms) {
        if (name == to_string(algorithm)) {
            return algorithm;
        }
    }
    return std::nullopt;
}

/// Schemes that carry an embedded error estimate
[[nodiscard]] constexpr bool is_adaptive_capable(Algorithm algorithm) noexcept {
    return algorithm != Algorithm::TauLeaping;
}

enum class AdaptiveController {
    RSwM3,  // Rejection sampling with memory, error-only proposal
    PI      // RSwM3 proposal with proportional memory of the previous error
};

[[nodiscard]] constexpr const char* to_string(AdaptiveController controller) noexcept {
    switch (controller) {
        case AdaptiveController::RSwM3: return "RSwM3";
        case AdaptiveController::PI: return "PI";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr std::optional<AdaptiveController> parse_adaptive_controller(
    std::string_view name) noexcept {
    if (name == "RSwM3") return AdaptiveController::RSwM3;
    if (name == "PI") return AdaptiveController::PI;
    return std::nullopt;
}

// =============================================================================
// Progress Hook
// =============================================================================

struct ProgressInfo {
    Real t = 0.0;
    Real dt = 0.0;
    Real fraction = 0.0;           // (t - t0) / (T - t0)
    std::size_t accepted_steps = 0;
    std::size_t rejected_steps = 0;
};

using ProgressCallback = std::function<void(const ProgressInfo&)>;

// =============================================================================
// Solve Options
// =============================================================================

struct SolveOptions {
    Real dt = 0.0;                          // 0 selects the initial step heuristically
    bool save_timeseries = true;
    std::size_t timeseries_steps = 1;       // Store every n-th accepted step
    bool adaptive = false;
    Algorithm algorithm = Algorithm::SRIW1Optimized;

    // Error control
    Real abstol = 1e-3;
    Real reltol = 1e-6;
    Real delta = 1.0 / 6.0;                 // Weight of the deterministic error term
    Real internalnorm = 2.0;                // p of the error norm; infinity is allowed

    // Step-size control
    AdaptiveController adaptive_controller = AdaptiveController::RSwM3;
    Real gamma = 2.0;                       // Risk factor
    Real qmin = 0.2;
    Real qmax = 1.125;
    Real beta_p = 0.075;                    // PI proportional gain
    Real discard_length = 1e-15;
    std::optional<Real> dtmax;              // Defaults to half the time span
    Real dtmin = RealTraits<Real>::default_dtmin;
    std::size_t maxiters = 1'000'000'000;

    // Scheme override; defaults to SRA1 or SRIW1 by family
    std::optional<Tableau> tableau;

    std::uint64_t seed = 0;                 // 0 selects the fixed default seed

    // Observation hooks
    std::size_t progress_steps = 1000;
    ProgressCallback progress;
    StepLogger* step_logger = nullptr;      // Not owned

    [[nodiscard]] static SolveOptions defaults() {
        return SolveOptions{};
    }

    [[nodiscard]] static SolveOptions fixed_step(Algorithm algorithm, Real dt) {
        SolveOptions options;
        options.algorithm = algorithm;
        options.dt = dt;
        return options;
    }

    [[nodiscard]] static SolveOptions adaptive_run(Algorithm algorithm,
                                                   Real abstol = 1e-3,
                                                   Real reltol = 1e-6) {
        SolveOptions options;
        options.algorithm = algorithm;
        options.adaptive = true;
        options.abstol = abstol;
        options.reltol = reltol;
        return options;
    }
};

}  // namespace stochsim::v1
