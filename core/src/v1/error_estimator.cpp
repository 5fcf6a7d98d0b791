#include "stochsim/v1/error_estimator.hpp"

#include "stochsim/v1/step_kernel.hpp"

#include <cmath>

namespace stochsim::v1 {

Real p_norm(const Vector& v, Real p) {
    if (v.size() == 0) {
        return 0.0;
    }
    if (std::isinf(p)) {
        return v.cwiseAbs().maxCoeff();
    }
    if (p == 2.0) {
        return v.norm();
    }
    return std::pow(v.cwiseAbs().array().pow(p).sum(), 1.0 / p);
}

Real scaled_error_norm(const Vector& error,
                       const Vector& u_prev,
                       const Vector& u_next,
                       Real abstol,
                       Real reltol,
                       Real p) {
    const Vector scale = (abstol + u_prev.cwiseAbs().cwiseMax(u_next.cwiseAbs()).array() * reltol)
                             .max(kErrorDenominatorFloor)
                             .matrix();
    return p_norm(error.cwiseQuotient(scale), p);
}

Vector weighted_error(Real delta, const Vector& E1, const Vector& E2) {
    if (E1.size() == 0) {
        return E2;
    }
    return delta * E1 + E2;
}

Real ErrorEstimator::estimate(const StepOutcome& outcome, const Vector& u_prev) const {
    if (!outcome.has_error_estimate) {
        return 0.0;
    }
    return scaled_error_norm(weighted_error(config_.delta, outcome.E1, outcome.E2),
                             u_prev,
                             outcome.u_next,
                             config_.abstol,
                             config_.reltol,
                             config_.internalnorm);
}

}  // namespace stochsim::v1
