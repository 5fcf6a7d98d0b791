#include "stochsim/v1/step_controller.hpp"

#include <algorithm>
#include <cmath>

namespace stochsim::v1 {

namespace {

/// Upper bound of the step ratio after a rejection
constexpr Real kRejectRatioCap = 0.9;

/// Errors below this are treated as zero (maximum growth)
constexpr Real kErrorEpsilon = 1e-14;

}  // namespace

Real StepSizeController::step_ratio(Real error, Real order, bool /*accepted*/) const {
    if (error < kErrorEpsilon) {
        return config_.qmax;
    }
    const Real exponent = 1.0 / (order + 0.5);
    return config_.gamma * std::pow(1.0 / error, exponent);
}

Real PIController::step_ratio(Real error, Real order, bool accepted) const {
    Real q = StepSizeController::step_ratio(error, order, accepted);
    if (accepted && error >= kErrorEpsilon && state_.error_prev >= kErrorEpsilon) {
        q *= std::pow(state_.error_prev / error, config_.beta_p / (order + 0.5));
    }
    return q;
}

StepDecision StepSizeController::decide(Real error, Real dt, Real order) {
    StepDecision decision;
    decision.error_ratio = error;
    decision.accepted = std::isfinite(error) && error <= 1.0;

    Real q = std::isfinite(error) ? step_ratio(error, order, decision.accepted) : config_.qmin;
    q = std::clamp(q, config_.qmin, config_.qmax);
    if (!decision.accepted) {
        q = std::min(q, kRejectRatioCap);
    }
    decision.q = q;

    Real dt_next = dt * q;

    if (decision.accepted) {
        if (std::abs(dt_next - dt) < config_.discard_length) {
            dt_next = dt;
        }
        if (dt_next > config_.dtmax) {
            dt_next = config_.dtmax;
            decision.at_maximum = true;
        }
        if (dt_next < config_.dtmin) {
            dt_next = config_.dtmin;
            decision.at_minimum = true;
        }

        state_.error_prev = error;
        state_.dt_prev = dt;
        ++state_.accepted;
        state_.consecutive_rejections = 0;
    } else {
        // Rejections never clamp up to dtmin: going below it ends the run, and so
        // does a step that no longer shrinks to a positive value in floating point
        decision.collapsed = dt_next < config_.dtmin || !(dt_next > 0.0) || dt_next >= dt;
        ++state_.rejected;
        ++state_.consecutive_rejections;
    }

    decision.dt_next = dt_next;
    return decision;
}

StepDecision StepSizeController::reject_nonfinite(Real dt) {
    StepDecision decision;
    decision.accepted = false;
    decision.error_ratio = RealTraits<Real>::infinity;
    decision.q = config_.qmin;

    if (dt <= config_.dtmin) {
        decision.collapsed = true;
        decision.dt_next = dt;
    } else {
        decision.dt_next = std::max(dt * config_.qmin, config_.dtmin);
        decision.at_minimum = decision.dt_next == config_.dtmin;
    }

    ++state_.rejected;
    ++state_.consecutive_rejections;
    return decision;
}

std::unique_ptr<StepSizeController> make_step_controller(AdaptiveController kind,
                                                         const ControllerConfig& config) {
    switch (kind) {
        case AdaptiveController::PI:
            return std::make_unique<PIController>(config);
        case AdaptiveController::RSwM3:
        default:
            return std::make_unique<RSwM3Controller>(config);
    }
}

}  // namespace stochsim::v1
