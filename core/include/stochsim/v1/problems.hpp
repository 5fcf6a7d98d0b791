#pragma once

// =============================================================================
// stochsim v1 - Built-in Problem Catalogue
// =============================================================================
// Test and demonstration problems, most with closed-form solutions in W:
// - linear:            du = a u dt + b u dW (geometric Brownian motion)
// - additive:          du = (b/sqrt(1+t) - u/(2(1+t))) dt + a b/sqrt(1+t) dW
// - cubic:             du = -u(1-u^2)/4 dt + (1-u^2)/2 dW
// - linear_diagonal:   componentwise linear system, any dimension
// - additive_diagonal: componentwise additive system, any dimension
// - birth_death:       jump process, births at a constant rate, deaths per capita
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"
#include "stochsim/v1/options.hpp"
#include "stochsim/v1/problem.hpp"

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stochsim::v1 {

struct ProblemInfo {
    std::string name;
    std::string description;
    std::map<std::string, Real> defaults;   // Parameter name -> default value
    Vector u0;                              // Default initial state
    bool fixed_dimension = true;            // u0 length may not change
    bool has_analytic = true;
    Algorithm suggested_algorithm = Algorithm::SRIW1Optimized;
};

using ProblemParameters = std::map<std::string, Real>;

/// All catalogue entries, in a stable order
[[nodiscard]] const std::vector<ProblemInfo>& problem_catalogue();

[[nodiscard]] const ProblemInfo* find_problem(std::string_view name);

/// Build a catalogue problem; unknown names or parameters and bad u0 are errors
[[nodiscard]] std::expected<SDEProblem, std::string> make_problem(
    std::string_view name,
    const ProblemParameters& parameters = {},
    const std::optional<Vector>& u0 = std::nullopt);

// Direct constructors
[[nodiscard]] SDEProblem linear_problem(Real alpha = 1.01, Real beta = 0.87, Real u0 = 0.5);
[[nodiscard]] SDEProblem additive_problem(Real alpha = 0.1, Real beta = 0.05, Real u0 = 0.5);
[[nodiscard]] SDEProblem cubic_problem(Real u0 = 0.5);
[[nodiscard]] SDEProblem linear_diagonal_problem(Vector u0, Real alpha = 1.01, Real beta = 0.87);
[[nodiscard]] SDEProblem additive_diagonal_problem(Vector u0, Real alpha = 0.1, Real beta = 0.05);
[[nodiscard]] SDEProblem birth_death_problem(Real birth_rate = 10.0,
                                             Real death_rate = 0.1,
                                             Real u0 = 10.0);

}  // namespace stochsim::v1
