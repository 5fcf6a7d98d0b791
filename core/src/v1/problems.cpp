#include "stochsim/v1/problems.hpp"

#include <cmath>
#include <utility>

namespace stochsim::v1 {

namespace {

Vector scalar_state(Real value) {
    return Vector::Constant(1, value);
}

Real parameter_or(const ProblemParameters& parameters, const char* name, Real fallback) {
    const auto it = parameters.find(name);
    return it == parameters.end() ? fallback : it->second;
}

}  // namespace

// =============================================================================
// Problem Constructors
// =============================================================================

SDEProblem linear_diagonal_problem(Vector u0, Real alpha, Real beta) {
    SDEProblem problem;
    problem.name = u0.size() == 1 ? "linear" : "linear_diagonal";
    problem.drift = [alpha](Real, const Vector& u, Vector& du) { du = alpha * u; };
    problem.diffusion = [beta](Real, const Vector& u, Vector& du) { du = beta * u; };
    problem.analytic = [alpha, beta](Real t, const Vector& u0_, const Vector& W) -> Vector {
        return (u0_.array() * ((alpha - 0.5 * beta * beta) * t + beta * W.array()).exp()).matrix();
    };
    problem.u0 = std::move(u0);
    return problem;
}

SDEProblem linear_problem(Real alpha, Real beta, Real u0) {
    return linear_diagonal_problem(scalar_state(u0), alpha, beta);
}

SDEProblem additive_diagonal_problem(Vector u0, Real alpha, Real beta) {
    SDEProblem problem;
    problem.name = u0.size() == 1 ? "additive" : "additive_diagonal";
    problem.drift = [beta](Real t, const Vector& u, Vector& du) {
        du = (beta / std::sqrt(1.0 + t)) * Vector::Ones(u.size()) - u / (2.0 * (1.0 + t));
    };
    problem.diffusion = [alpha, beta](Real t, const Vector& u, Vector& du) {
        du = Vector::Constant(u.size(), alpha * beta / std::sqrt(1.0 + t));
    };
    problem.analytic = [alpha, beta](Real t, const Vector& u0_, const Vector& W) -> Vector {
        const Real root = std::sqrt(1.0 + t);
        return (u0_.array() / root + beta * (t + alpha * W.array()) / root).matrix();
    };
    problem.u0 = std::move(u0);
    return problem;
}

SDEProblem additive_problem(Real alpha, Real beta, Real u0) {
    return additive_diagonal_problem(scalar_state(u0), alpha, beta);
}

SDEProblem cubic_problem(Real u0) {
    SDEProblem problem;
    problem.name = "cubic";
    problem.drift = [](Real, const Vector& u, Vector& du) {
        du = (-0.25 * u.array() * (1.0 - u.array().square())).matrix();
    };
    problem.diffusion = [](Real, const Vector& u, Vector& du) {
        du = (0.5 * (1.0 - u.array().square())).matrix();
    };
    problem.analytic = [](Real, const Vector& u0_, const Vector& W) -> Vector {
        const auto e = W.array().exp();
        const auto a = u0_.array();
        return (((1.0 + a) * e + a - 1.0) / ((1.0 + a) * e + 1.0 - a)).matrix();
    };
    problem.u0 = scalar_state(u0);
    return problem;
}

SDEProblem birth_death_problem(Real birth_rate, Real death_rate, Real u0) {
    SDEProblem problem;
    problem.name = "birth_death";
    problem.u0 = scalar_state(u0);

    JumpDescription jumps;
    jumps.channels = 2;
    jumps.parameters = Vector(2);
    jumps.parameters << birth_rate, death_rate;
    jumps.rates = [](Real, const Vector& u, const Vector& p, Vector& rates) {
        rates[0] = p[0];
        rates[1] = p[1] * u[0];
    };
    Matrix stoichiometry(1, 2);
    stoichiometry << 1.0, -1.0;
    jumps.change = make_stoichiometric_change(std::move(stoichiometry));
    problem.jumps = std::move(jumps);
    return problem;
}

// =============================================================================
// Catalogue
// =============================================================================

const std::vector<ProblemInfo>& problem_catalogue() {
    static const std::vector<ProblemInfo> catalogue = [] {
        std::vector<ProblemInfo> entries;

        entries.push_back(ProblemInfo{"linear", "du = alpha u dt + beta u dW",
                                      {{"alpha", 1.01}, {"beta", 0.87}}, scalar_state(0.5),
                                      true, true, Algorithm::SRIW1Optimized});
        entries.push_back(ProblemInfo{"additive",
                                      "du = (beta/sqrt(1+t) - u/(2(1+t))) dt + alpha beta/sqrt(1+t) dW",
                                      {{"alpha", 0.1}, {"beta", 0.05}}, scalar_state(0.5),
                                      true, true, Algorithm::SRA1Optimized});
        entries.push_back(ProblemInfo{"cubic", "du = -u(1-u^2)/4 dt + (1-u^2)/2 dW",
                                      {}, scalar_state(0.5), true, true,
                                      Algorithm::SRIW1Optimized});
        entries.push_back(ProblemInfo{"linear_diagonal", "componentwise linear system",
                                      {{"alpha", 1.01}, {"beta", 0.87}}, Vector::Constant(2, 0.5),
                                      false, true, Algorithm::SRIW1Optimized});
        entries.push_back(ProblemInfo{"additive_diagonal", "componentwise additive system",
                                      {{"alpha", 0.1}, {"beta", 0.05}}, Vector::Constant(2, 0.5),
                                      false, true, Algorithm::SRA1Optimized});
        entries.push_back(ProblemInfo{"birth_death", "jump process: birth at a constant rate, death per capita",
                                      {{"birth_rate", 10.0}, {"death_rate", 0.1}}, scalar_state(10.0),
                                      true, false, Algorithm::TauLeaping});
        return entries;
    }();
    return catalogue;
}

const ProblemInfo* find_problem(std::string_view name) {
    for (const auto& info : problem_catalogue()) {
        if (info.name == name) {
            return &info;
        }
    }
    return nullptr;
}

std::expected<SDEProblem, std::string> make_problem(std::string_view name,
                                                    const ProblemParameters& parameters,
                                                    const std::optional<Vector>& u0) {
    const ProblemInfo* info = find_problem(name);
    if (info == nullptr) {
        return std::unexpected("unknown problem '" + std::string(name) + "'");
    }

    for (const auto& [key, value] : parameters) {
        if (!info->defaults.contains(key)) {
            return std::unexpected("problem '" + info->name + "' has no parameter '" + key + "'");
        }
        if (!std::isfinite(value)) {
            return std::unexpected("parameter '" + key + "' must be finite");
        }
    }

    Vector initial = u0.value_or(info->u0);
    if (initial.size() == 0) {
        return std::unexpected("u0 must be non-empty");
    }
    if (info->fixed_dimension && initial.size() != info->u0.size()) {
        return std::unexpected("problem '" + info->name + "' needs u0 of size " +
                               std::to_string(info->u0.size()));
    }

    auto param = [&](const char* key) {
        return parameter_or(parameters, key, info->defaults.at(key));
    };

    if (info->name == "linear") {
        return linear_problem(param("alpha"), param("beta"), initial[0]);
    }
    if (info->name == "additive") {
        return additive_problem(param("alpha"), param("beta"), initial[0]);
    }
    if (info->name == "cubic") {
        return cubic_problem(initial[0]);
    }
    if (info->name == "linear_diagonal") {
        return linear_diagonal_problem(std::move(initial), param("alpha"), param("beta"));
    }
    if (info->name == "additive_diagonal") {
        return additive_diagonal_problem(std::move(initial), param("alpha"), param("beta"));
    }
    if (info->name == "birth_death") {
        const Real birth = param("birth_rate");
        const Real death = param("death_rate");
        if (birth < 0.0 || death < 0.0) {
            return std::unexpected("birth_death rates must be non-negative");
        }
        return birth_death_problem(birth, death, initial[0]);
    }
    return std::unexpected("problem '" + info->name + "' has no constructor");
}

}  // namespace stochsim::v1
