// ==============================================================================
// Layer 0: Core Utility - Phase Utilities
// ==============================================================================
// Circular phase helpers shared by the integrator, the order parameter and
// the cluster detector.
//
// Design decisions:
// - Oscillator phases are angles in radians, wrapped to (-pi, pi]. This is
//   distinct from a [0, 1) normalized accumulator: the coupling term works
//   directly on angle differences.
// - wrapPhase() uses std::remainder, which is exact for any finite input,
//   then folds the single boundary value -pi onto +pi.
// ==============================================================================

#pragma once

#include <entrain/sim/core/math_constants.h>

#include <cmath>

namespace Entrain {
namespace Sim {

// =============================================================================
// Phase Utility Functions
// =============================================================================

/// @brief Wrap an angle to the half-open interval (-pi, pi].
///
/// @param phase Angle in radians (any finite value)
/// @return Equivalent angle in (-pi, pi]
///
/// @example
/// @code
/// double a = wrapPhase(4.0);        // 4 - 2pi  = -2.283...
/// double b = wrapPhase(-kPi);       // kPi
/// double c = wrapPhase(0.5);        // 0.5 (no change)
/// @endcode
[[nodiscard]] inline double wrapPhase(double phase) noexcept {
    double wrapped = std::remainder(phase, kTwoPi);
    if (wrapped <= -kPi) {
        wrapped += kTwoPi;
    }
    return wrapped;
}

/// @brief Smallest signed circular difference a - b, wrapped to (-pi, pi].
/// @param a Angle in radians
/// @param b Angle in radians
/// @return wrapPhase(a - b)
[[nodiscard]] inline double phaseDifference(double a, double b) noexcept {
    return wrapPhase(a - b);
}

/// @brief Angular distance between two phases, in [0, pi].
[[nodiscard]] inline double phaseDistance(double a, double b) noexcept {
    return std::abs(phaseDifference(a, b));
}

/// @brief Convert a frequency in Hz to angular frequency in rad/s.
[[nodiscard]] constexpr double hzToAngular(double frequencyHz) noexcept {
    return kTwoPi * frequencyHz;
}

/// @brief Test whether an angle lies in the canonical range (-pi, pi].
[[nodiscard]] constexpr bool isWrappedPhase(double phase) noexcept {
    return phase > -kPi && phase <= kPi;
}

} // namespace Sim
} // namespace Entrain
