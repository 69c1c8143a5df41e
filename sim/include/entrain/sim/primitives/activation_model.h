// ==============================================================================
// Layer 1: Primitive - Activation Model
// ==============================================================================
// Staggered starts with linear fade-in. Oscillator i is silent before its
// start time, then its coupling gain rises linearly to 1 over fadeIn:
//
//   gain_i(t) = 0                                   t <  start_i
//             = clamp((t - start_i) / fadeIn, 0, 1)  t >= start_i
//
// Coupling between i and j is scaled by gain_i * gain_j, so a pair is fully
// uncoupled until both ends have started.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace Entrain {
namespace Sim {

class ActivationModel {
public:
    /// @brief Set per-oscillator start times and the shared fade-in.
    /// @param startTimes Start time of each oscillator (s)
    /// @param fadeInSeconds Fade-in duration, must be > 0
    void configure(std::span<const double> startTimes, double fadeInSeconds) {
        startTimes_.assign(startTimes.begin(), startTimes.end());
        fadeIn_ = fadeInSeconds;
    }

    [[nodiscard]] std::size_t size() const noexcept { return startTimes_.size(); }

    [[nodiscard]] double startTime(std::size_t i) const noexcept { return startTimes_[i]; }

    [[nodiscard]] double fadeInSeconds() const noexcept { return fadeIn_; }

    /// True once oscillator i has started (t >= start_i)
    [[nodiscard]] bool isActive(std::size_t i, double t) const noexcept {
        return t >= startTimes_[i];
    }

    /// Coupling gain of oscillator i at time t, in [0, 1]
    [[nodiscard]] double gain(std::size_t i, double t) const noexcept {
        if (t < startTimes_[i]) {
            return 0.0;
        }
        return std::clamp((t - startTimes_[i]) / fadeIn_, 0.0, 1.0);
    }

    /// @brief Fill @p out with the gains of all oscillators at time t.
    /// @pre out.size() == size()
    void computeGains(double t, std::span<double> out) const noexcept {
        for (std::size_t i = 0; i < startTimes_.size(); ++i) {
            out[i] = gain(i, t);
        }
    }

    /// @brief Fill @p out with the active flags of all oscillators at time t.
    /// @pre out.size() == size()
    void computeActive(double t, std::span<uint8_t> out) const noexcept {
        for (std::size_t i = 0; i < startTimes_.size(); ++i) {
            out[i] = isActive(i, t) ? 1 : 0;
        }
    }

private:
    std::vector<double> startTimes_;
    double fadeIn_ = 1.0;
};

} // namespace Sim
} // namespace Entrain
