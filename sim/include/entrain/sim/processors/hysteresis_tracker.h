// ==============================================================================
// Layer 2: Processor - Hysteresis Tracker
// ==============================================================================
// Stabilizes cluster colors across frames. Each oscillator carries
// (color, ttl):
// - fresh cluster color this frame  -> (color, holdSeconds)
// - no fresh color, entry present   -> ttl -= frameDuration; the previous color
//                                      is kept while ttl > 0, else cleared
// Per-frame cluster churn is absorbed into visually stable groups.
// ==============================================================================

#pragma once

#include <entrain/sim/core/color.h>
#include <entrain/sim/core/math_constants.h>

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace Entrain {
namespace Sim {

/// Persisted color of one oscillator
struct HysteresisEntry {
    ColorIndex color = kNeutralColor;
    double ttl = 0.0;  ///< Remaining hold time (s); 0 = no entry

    [[nodiscard]] bool present() const noexcept { return color != kNeutralColor; }
};

class HysteresisTracker {
public:
    /// @brief Size the tracker and set the hold time.
    /// @param count Number of oscillators
    /// @param holdSeconds Color hold after losing membership, >= 0
    void prepare(std::size_t count, double holdSeconds) {
        holdSeconds_ = holdSeconds;
        entries_.assign(count, HysteresisEntry{});
        colors_.assign(count, kNeutralColor);
    }

    [[nodiscard]] double holdSeconds() const noexcept { return holdSeconds_; }

    /// @brief Merge this frame's fresh assignments with the decaying state.
    /// @param fresh Per-oscillator palette index or kNeutralColor (N entries)
    /// @param frameDuration Elapsed time since the previous update (s)
    void update(std::span<const ColorIndex> fresh, double frameDuration) noexcept {
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            HysteresisEntry& entry = entries_[i];
            if (fresh[i] >= 0) {
                entry.color = fresh[i];
                entry.ttl = holdSeconds_;
            } else if (entry.present()) {
                entry.ttl -= frameDuration;
                if (entry.ttl <= kTimeEpsilon) {
                    entry = HysteresisEntry{};
                }
            }
            colors_[i] = entry.color;
        }
    }

    /// @brief Drop every entry (all oscillators neutral).
    void clear() noexcept {
        std::fill(entries_.begin(), entries_.end(), HysteresisEntry{});
        std::fill(colors_.begin(), colors_.end(), kNeutralColor);
    }

    /// Smoothed color of every oscillator after the last update()
    [[nodiscard]] std::span<const ColorIndex> colors() const noexcept { return colors_; }

    [[nodiscard]] const HysteresisEntry& entry(std::size_t i) const noexcept { return entries_[i]; }

    /// Number of oscillators currently holding a color
    [[nodiscard]] std::size_t activeEntries() const noexcept {
        return static_cast<std::size_t>(std::count_if(
            entries_.begin(), entries_.end(),
            [](const HysteresisEntry& e) { return e.present(); }));
    }

private:
    std::vector<HysteresisEntry> entries_;
    std::vector<ColorIndex> colors_;
    double holdSeconds_ = 0.0;
};

} // namespace Sim
} // namespace Entrain
