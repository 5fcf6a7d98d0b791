#pragma once

// =============================================================================
// stochsim v1 - Problem Definition
// =============================================================================
// The integrator treats drift, diffusion and jump functions as opaque callables.
// This header provides:
// - SDEProblem: du = f(t,u) dt + g(t,u) dW with optional analytic solution
// - JumpDescription: propensities and state change for tau-leaping
// - NoiseShape: explicit, unit-less description of the noise container
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace stochsim::v1 {

/// In-place state function: du = f(t, u)
using StateFunction = std::function<void(Real t, const Vector& u, Vector& du)>;

/// Value-returning state function, adapted to StateFunction
using ValueFunction = std::function<Vector(Real t, const Vector& u)>;

/// Closed-form solution u(t) given u0 and the Wiener value W(t)
using AnalyticFunction = std::function<Vector(Real t, const Vector& u0, const Vector& W)>;

/// Propensity per reaction channel: rates = a(t, u, p)
using RateFunction = std::function<void(Real t, const Vector& u, const Vector& params, Vector& rates)>;

/// Jump state change: du = c(u, p, t, counts)
using JumpChangeFunction = std::function<void(const Vector& u,
                                              const Vector& params,
                                              Real t,
                                              const Vector& counts,
                                              Vector& du)>;

// =============================================================================
// Noise Descriptors
// =============================================================================

enum class NoiseKind {
    Diagonal,  // One independent Wiener process per state component
    Scalar     // A single Wiener process shared by every component
};

enum class NoiseProcess {
    Wiener,   // Gaussian increments, variance dt
    Poisson   // Jump counts per reaction channel
};

[[nodiscard]] constexpr const char* to_string(NoiseKind kind) noexcept {
    switch (kind) {
        case NoiseKind::Diagonal: return "diagonal";
        case NoiseKind::Scalar: return "scalar";
        default: return "unknown";
    }
}

struct NoiseDescriptor {
    NoiseKind kind = NoiseKind::Diagonal;
};

/// Shape of the noise container. Computed from the descriptor, never from the
/// state values, so the samples are always plain unit-less numbers.
struct NoiseShape {
    NoiseProcess process = NoiseProcess::Wiener;
    Index dimension = 1;

    [[nodiscard]] Vector zeros() const { return Vector::Zero(dimension); }

    [[nodiscard]] bool operator==(const NoiseShape&) const = default;
};

// =============================================================================
// Jump Description (tau-leaping)
// =============================================================================

struct JumpDescription {
    Index channels = 0;
    RateFunction rates;
    JumpChangeFunction change;
    Vector parameters;
};

/// Build the common stoichiometric change du = S * counts
[[nodiscard]] inline JumpChangeFunction make_stoichiometric_change(Matrix stoichiometry) {
    return [S = std::move(stoichiometry)](const Vector&, const Vector&, Real,
                                          const Vector& counts, Vector& du) {
        du.noalias() = S * counts;
    };
}

// =============================================================================
// SDE Problem
// =============================================================================

struct SDEProblem {
    StateFunction drift;
    StateFunction diffusion;
    Vector u0;
    NoiseDescriptor noise{};
    AnalyticFunction analytic;
    std::optional<JumpDescription> jumps;
    std::string name;

    [[nodiscard]] Index dimension() const { return u0.size(); }
    [[nodiscard]] bool has_analytic() const { return static_cast<bool>(analytic); }
    [[nodiscard]] bool has_jumps() const { return jumps.has_value(); }

    /// Adapt value-returning drift/diffusion callables
    [[nodiscard]] static SDEProblem from_functions(ValueFunction f,
                                                   ValueFunction g,
                                                   Vector u0,
                                                   NoiseDescriptor noise = {}) {
        SDEProblem problem;
        problem.drift = [f = std::move(f)](Real t, const Vector& u, Vector& du) { du = f(t, u); };
        problem.diffusion = [g = std::move(g)](Real t, const Vector& u, Vector& du) { du = g(t, u); };
        problem.u0 = std::move(u0);
        problem.noise = noise;
        return problem;
    }
};

/// Noise shape for Wiener-driven schemes
[[nodiscard]] inline NoiseShape wiener_shape(const SDEProblem& problem) {
    NoiseShape shape;
    shape.process = NoiseProcess::Wiener;
    shape.dimension = problem.noise.kind == NoiseKind::Scalar ? Index{1} : problem.dimension();
    return shape;
}

/// Noise shape for jump-driven schemes (one count per reaction channel)
[[nodiscard]] inline NoiseShape jump_shape(const JumpDescription& jumps) {
    NoiseShape shape;
    shape.process = NoiseProcess::Poisson;
    shape.dimension = jumps.channels;
    return shape;
}

/// Map a noise sample onto the state: diagonal noise multiplies componentwise,
/// scalar noise broadcasts its single component.
[[nodiscard]] inline Vector apply_noise(const Vector& g, const Vector& noise) {
    if (noise.size() == 1 && g.size() != 1) {
        return g * noise[0];
    }
    return g.cwiseProduct(noise);
}

}  // namespace stochsim::v1
