// ==============================================================================
// Layer 1: Primitive - Coupling Scheduler
// ==============================================================================
// Maps simulation time to the effective coupling strength K_eff(t):
//
//   t <= rampStart : K_start
//   otherwise      : K_start + curve(z) * (K_end - K_start)
//                    z = clamp((t - rampStart) / (lockTarget - rampStart), 0, 1)
//
// A zero-length window uses kMinTimeWindow as the denominator, which makes
// the ramp an instantaneous jump to K_end.
// ==============================================================================

#pragma once

#include <entrain/sim/core/math_constants.h>
#include <entrain/sim/core/ramp_curves.h>

#include <algorithm>

namespace Entrain {
namespace Sim {

/// @brief Smoothed coupling ramp. Stateless after configure().
class CouplingScheduler {
public:
    /// @brief Set ramp endpoints and timing.
    /// @param kStart Coupling before the ramp
    /// @param kEnd Coupling at and after @p lockTarget
    /// @param rampStart Time the ramp begins (s)
    /// @param lockTarget Time the ramp reaches kEnd (s)
    /// @param curve Ease applied to ramp progress
    void configure(
        double kStart,
        double kEnd,
        double rampStart,
        double lockTarget,
        RampCurve curve = RampCurve::SCurve
    ) noexcept {
        kStart_ = kStart;
        kEnd_ = kEnd;
        rampStart_ = rampStart;
        window_ = std::max(kMinTimeWindow, lockTarget - rampStart);
        curve_ = curve;
    }

    /// @brief Hold coupling at a constant value for all t.
    void setConstant(double k) noexcept {
        configure(k, k, 0.0, 0.0, RampCurve::Linear);
    }

    /// @brief Effective coupling K_eff at time @p t.
    [[nodiscard]] double effectiveCoupling(double t) const noexcept {
        if (t <= rampStart_) {
            return kStart_;
        }
        const double z = (t - rampStart_) / window_;
        return kStart_ + applyRampCurve(curve_, z) * (kEnd_ - kStart_);
    }

    [[nodiscard]] double startCoupling() const noexcept { return kStart_; }
    [[nodiscard]] double endCoupling() const noexcept { return kEnd_; }
    [[nodiscard]] double rampStart() const noexcept { return rampStart_; }
    [[nodiscard]] double lockTarget() const noexcept { return rampStart_ + window_; }

private:
    double kStart_ = 0.0;
    double kEnd_ = 0.0;
    double rampStart_ = 0.0;
    double window_ = kMinTimeWindow;
    RampCurve curve_ = RampCurve::SCurve;
};

} // namespace Sim
} // namespace Entrain
