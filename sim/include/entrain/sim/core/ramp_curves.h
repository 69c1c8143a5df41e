// ==============================================================================
// Layer 0: Core Utility - Ramp Curves
// ==============================================================================
// Pure easing functions used to shape time ramps such as the coupling
// schedule.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstdint>

namespace Entrain {
namespace Sim {

/// @brief Ramp shape applied to a normalized [0, 1] progress value.
///
/// @par Formulas (input z in [0, 1]):
/// - Linear: y = z
/// - SCurve: y = z^2 * (3 - 2z) (smoothstep)
enum class RampCurve : uint8_t {
    Linear = 0,  ///< y = z
    SCurve = 1   ///< y = z^2 * (3 - 2z), zero slope at both ends
};

/// @brief Smoothstep ease. Input is clamped to [0, 1].
[[nodiscard]] constexpr double smoothstep(double z) noexcept {
    z = std::clamp(z, 0.0, 1.0);
    return z * z * (3.0 - 2.0 * z);
}

/// @brief Apply ramp curve to a [0, 1] progress value.
/// @param curve The curve shape to apply
/// @param z Progress, clamped to [0, 1]
/// @return Shaped value in [0, 1], monotone non-decreasing in z
[[nodiscard]] constexpr double applyRampCurve(RampCurve curve, double z) noexcept {
    z = std::clamp(z, 0.0, 1.0);

    switch (curve) {
        case RampCurve::Linear:
            return z;

        case RampCurve::SCurve:
            return smoothstep(z);
    }

    return z;  // Fallback for invalid enum
}

}  // namespace Sim
}  // namespace Entrain
