// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for the simulation layers.
// All components should import these constants instead of defining locally.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units. The engine integrates in double precision, so the
// constants are doubles.
// ==============================================================================

#pragma once

namespace Entrain {
namespace Sim {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant, full double precision
inline constexpr double kPi = 3.14159265358979323846;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f
inline constexpr double kTwoPi = 2.0 * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr double kHalfPi = kPi / 2.0;

// =============================================================================
// Numerical Guards
// =============================================================================

/// Smallest denominator used where a time window may collapse to zero length
inline constexpr double kMinTimeWindow = 1e-9;

/// Tolerance used when comparing accumulated durations against zero
inline constexpr double kTimeEpsilon = 1e-9;

} // namespace Sim
} // namespace Entrain
