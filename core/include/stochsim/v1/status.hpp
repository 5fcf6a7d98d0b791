#pragma once

// =============================================================================
// stochsim v1 - Run Status and Configuration Issues
// =============================================================================

#include <string>

namespace stochsim::v1 {

enum class SolveStatus {
    Success,
    InputError,               // Malformed time span, state or options
    StepSizeCollapse,         // dt driven below dtmin, or non-finite state at dtmin
    IterationBudgetExceeded,  // Accepted steps exceeded maxiters
    UnimplementedScheme,      // No kernel for the requested configuration
    InvalidTableau            // Tableau override fails the consistency checks
};

[[nodiscard]] constexpr const char* to_string(SolveStatus status) noexcept {
    switch (status) {
        case SolveStatus::Success: return "success";
        case SolveStatus::InputError: return "input_error";
        case SolveStatus::StepSizeCollapse: return "step_size_collapse";
        case SolveStatus::IterationBudgetExceeded: return "iteration_budget_exceeded";
        case SolveStatus::UnimplementedScheme: return "unimplemented_scheme";
        case SolveStatus::InvalidTableau: return "invalid_tableau";
        default: return "unknown";
    }
}

/// Failure found while turning options into a kernel/controller pair
struct ConfigurationIssue {
    SolveStatus status = SolveStatus::UnimplementedScheme;
    std::string message;
};

}  // namespace stochsim::v1
