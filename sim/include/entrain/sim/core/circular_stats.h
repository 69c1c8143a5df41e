// ==============================================================================
// Layer 0: Core Utility - Circular Statistics
// ==============================================================================
// Mean unit-phasor statistics over sets of phases. The magnitude of the mean
// phasor is the Kuramoto order parameter r: 0 = incoherent, 1 = in phase.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>

namespace Entrain {
namespace Sim {

/// @brief Mean unit phasor of a set of phases.
struct MeanPhasor {
    double re = 0.0;  ///< mean cos(theta)
    double im = 0.0;  ///< mean sin(theta)

    /// Order parameter r = |mean phasor|, clamped to [0, 1]. NaN phases
    /// give NaN.
    [[nodiscard]] double magnitude() const noexcept {
        const double r = std::hypot(re, im);
        return r > 1.0 ? 1.0 : r;
    }

    /// Mean phase psi = arg(mean phasor); 0 for a zero phasor
    [[nodiscard]] double angle() const noexcept {
        return (re == 0.0 && im == 0.0) ? 0.0 : std::atan2(im, re);
    }
};

/// @brief Mean phasor over all phases. Empty input gives the zero phasor.
[[nodiscard]] inline MeanPhasor meanPhasor(std::span<const double> phases) noexcept {
    MeanPhasor result;
    if (phases.empty()) {
        return result;
    }
    for (const double theta : phases) {
        result.re += std::cos(theta);
        result.im += std::sin(theta);
    }
    const double inv = 1.0 / static_cast<double>(phases.size());
    result.re *= inv;
    result.im *= inv;
    return result;
}

/// @brief Mean phasor over the subset @p indices of @p phases.
[[nodiscard]] inline MeanPhasor meanPhasor(
    std::span<const double> phases,
    std::span<const std::size_t> indices
) noexcept {
    MeanPhasor result;
    if (indices.empty()) {
        return result;
    }
    for (const std::size_t i : indices) {
        result.re += std::cos(phases[i]);
        result.im += std::sin(phases[i]);
    }
    const double inv = 1.0 / static_cast<double>(indices.size());
    result.re *= inv;
    result.im *= inv;
    return result;
}

/// @brief Global order parameter r = |mean e^{i theta}| in [0, 1].
[[nodiscard]] inline double orderParameter(std::span<const double> phases) noexcept {
    return meanPhasor(phases).magnitude();
}

/// @brief Order parameter of a subset (cluster coherence) in [0, 1].
[[nodiscard]] inline double orderParameter(
    std::span<const double> phases,
    std::span<const std::size_t> indices
) noexcept {
    return meanPhasor(phases, indices).magnitude();
}

/// @brief Mean phase psi = arg(mean e^{i theta}); 0 when r is 0.
[[nodiscard]] inline double meanPhase(std::span<const double> phases) noexcept {
    return meanPhasor(phases).angle();
}

} // namespace Sim
} // namespace Entrain
