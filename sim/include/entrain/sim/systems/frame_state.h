// ==============================================================================
// Layer 3: System - Frame State
// ==============================================================================
// Read-only per-frame snapshot handed to the rendering/encoding collaborator.
// ==============================================================================

#pragma once

#include <entrain/sim/core/color.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Entrain {
namespace Sim {

struct FrameState {
    std::size_t frameIndex = 0;         ///< 0-based index of the frame
    double time = 0.0;                  ///< Simulation time at the end of the frame (s)
    std::vector<double> phases;         ///< Phase of each oscillator, in (-pi, pi]
    std::vector<uint8_t> active;        ///< 1 once the oscillator has started
    std::vector<ColorIndex> colors;     ///< Palette index, kNeutralColor or kLockedColor
    double orderParameter = 0.0;        ///< Global r in [0, 1]
    double effectiveCoupling = 0.0;     ///< K_eff at the frame time
    double lockTimer = 0.0;             ///< Time r has stayed >= R_LOCK (s)
    bool fullyLocked = false;           ///< Sticky lock flag
    std::size_t clusterCount = 0;       ///< Qualified clusters detected this frame

    [[nodiscard]] std::size_t size() const noexcept { return phases.size(); }
};

} // namespace Sim
} // namespace Entrain
