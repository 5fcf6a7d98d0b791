#pragma once

// =============================================================================
// stochsim v1 - Stochastic Runge-Kutta Tableaus
// =============================================================================
// This header provides:
// - SRITableau: diagonal/scalar noise schemes (Roessler SRI family)
// - SRATableau: additive noise schemes (Roessler SRA family)
// - construct_sriw1 / construct_sra1 default tableaus
// - check_order_conditions: consistency checks for user overrides
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace stochsim::v1 {

/// Diagonal-noise scheme. Stage H0 carries the drift, stage H1 the diffusion.
struct SRITableau {
    std::string name;
    Vector c0;
    Vector c1;
    Matrix A0;
    Matrix A1;
    Matrix B0;
    Matrix B1;
    Vector alpha;
    Vector beta1;
    Vector beta2;
    Vector beta3;
    Vector beta4;
    Real order = 1.5;

    [[nodiscard]] Index stages() const { return alpha.size(); }
};

/// Additive-noise scheme. Diffusion is evaluated at the step start state.
struct SRATableau {
    std::string name;
    Vector c0;
    Vector c1;
    Matrix A0;
    Matrix B0;
    Vector alpha;
    Vector beta1;
    Vector beta2;
    Real order = 2.0;

    [[nodiscard]] Index stages() const { return alpha.size(); }
};

using Tableau = std::variant<SRATableau, SRITableau>;

/// SRIW1: 4 stages, strong order 1.5
[[nodiscard]] SRITableau construct_sriw1();

/// SRA1: 2 stages, strong order 2.0 for additive noise
[[nodiscard]] SRATableau construct_sra1();

/// Violated consistency conditions; empty when the tableau is usable
[[nodiscard]] std::vector<std::string> check_order_conditions(const SRITableau& tableau,
                                                              Real tolerance = 1e-12);
[[nodiscard]] std::vector<std::string> check_order_conditions(const SRATableau& tableau,
                                                              Real tolerance = 1e-12);
[[nodiscard]] std::vector<std::string> check_order_conditions(const Tableau& tableau,
                                                              Real tolerance = 1e-12);

[[nodiscard]] inline const std::string& tableau_name(const Tableau& tableau) {
    return std::visit([](const auto& t) -> const std::string& { return t.name; }, tableau);
}

}  // namespace stochsim::v1
