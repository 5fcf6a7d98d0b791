#pragma once

// =============================================================================
// stochsim v1 - Adaptive Step-Size Controllers
// =============================================================================
// This header provides:
// - ControllerConfig / ControllerState
// - RSwM3Controller: error-only proposal gamma * (1/e)^(1/(order+1/2))
// - PIController: RSwM3 proposal with memory of the previous accepted error
// Both accept a step iff its scaled error norm is at most one.
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"
#include "stochsim/v1/options.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace stochsim::v1 {

struct ControllerConfig {
    Real gamma = 2.0;             // Risk factor
    Real qmin = 0.2;              // Smallest step ratio
    Real qmax = 1.125;            // Largest step ratio
    Real dtmin = RealTraits<Real>::default_dtmin;
    Real dtmax = RealTraits<Real>::infinity;
    Real discard_length = 1e-15;  // Accepted step changes below this are ignored
    Real beta_p = 0.075;          // PI proportional gain

    [[nodiscard]] static constexpr ControllerConfig defaults() {
        return ControllerConfig{};
    }

    [[nodiscard]] static ControllerConfig from_options(const SolveOptions& options, Real dtmax) {
        ControllerConfig cfg;
        cfg.gamma = options.gamma;
        cfg.qmin = options.qmin;
        cfg.qmax = options.qmax;
        cfg.dtmin = options.dtmin;
        cfg.dtmax = dtmax;
        cfg.discard_length = options.discard_length;
        cfg.beta_p = options.beta_p;
        return cfg;
    }
};

struct ControllerState {
    Real error_prev = 0.0;        // Error norm of the last accepted step
    Real dt_prev = 0.0;           // Last accepted step size
    std::size_t accepted = 0;
    std::size_t rejected = 0;
    std::size_t consecutive_rejections = 0;
};

struct StepDecision {
    bool accepted = true;
    Real dt_next = 0.0;
    Real q = 1.0;                 // Applied step ratio
    Real error_ratio = 0.0;       // Scaled error norm
    bool at_minimum = false;      // dt_next limited by dtmin
    bool at_maximum = false;      // dt_next limited by dtmax
    bool collapsed = false;       // Rejection cannot shrink dt while staying >= dtmin
};

class StepSizeController {
public:
    explicit StepSizeController(const ControllerConfig& config) : config_(config) {}
    virtual ~StepSizeController() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Decide on an attempt of size dt with scaled error e for a scheme of the given strong order
    [[nodiscard]] StepDecision decide(Real error, Real dt, Real order);

    /// Forced rejection of a non-finite candidate: dt shrinks by qmin, never below dtmin
    [[nodiscard]] StepDecision reject_nonfinite(Real dt);

    [[nodiscard]] const ControllerState& state() const { return state_; }
    [[nodiscard]] const ControllerConfig& config() const { return config_; }
    void reset() { state_ = ControllerState{}; }

protected:
    /// Step ratio before clamping and rejection capping
    [[nodiscard]] virtual Real step_ratio(Real error, Real order, bool accepted) const;

    ControllerConfig config_;
    ControllerState state_;
};

class RSwM3Controller final : public StepSizeController {
public:
    explicit RSwM3Controller(const ControllerConfig& config = {}) : StepSizeController(config) {}

    [[nodiscard]] std::string_view name() const override { return "RSwM3"; }
};

class PIController final : public StepSizeController {
public:
    explicit PIController(const ControllerConfig& config = {}) : StepSizeController(config) {}

    [[nodiscard]] std::string_view name() const override { return "PI"; }

protected:
    [[nodiscard]] Real step_ratio(Real error, Real order, bool accepted) const override;
};

[[nodiscard]] std::unique_ptr<StepSizeController> make_step_controller(AdaptiveController kind,
                                                                       const ControllerConfig& config);

}  // namespace stochsim::v1
