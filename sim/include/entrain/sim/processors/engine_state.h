// ==============================================================================
// Layer 2: Processor - Engine State
// ==============================================================================
// The mutable state of one run: phases, the engine-owned noise generator,
// the simulation clock and the lock state. It is mutated only by
// KuramotoIntegrator::step() (phases, noise) and OrderParameterTracker::update()
// (lock timer, lock flag); SyncEngine advances the clock.
// ==============================================================================

#pragma once

#include <entrain/sim/primitives/noise_streams.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Entrain {
namespace Sim {

struct EngineState {
    std::vector<double> phases;   ///< Oscillator phases, each in (-pi, pi]
    NoiseStreams noise;           ///< Per-oscillator Gaussian streams
    uint64_t substepCount = 0;    ///< Sub-steps integrated so far
    double time = 0.0;            ///< Simulation clock (s) = substepCount * dt
    double lockTimer = 0.0;       ///< Time r has continuously been >= R_LOCK
    bool fullyLocked = false;     ///< Sticky until the caller resets it

    [[nodiscard]] std::size_t size() const noexcept { return phases.size(); }
};

} // namespace Sim
} // namespace Entrain
