// ==============================================================================
// Layer 0: Core Utility - Oscillator Initialization
// ==============================================================================
// Seeded draw of the per-oscillator constants and initial phases. The draw
// order is fixed: all natural frequencies, then all phases, then all start
// times, from one Xorshift32 seeded with EngineConfig::seed.
// ==============================================================================

#pragma once

#include <entrain/sim/core/engine_config.h>
#include <entrain/sim/core/math_constants.h>
#include <entrain/sim/core/phase_utils.h>
#include <entrain/sim/core/random.h>

#include <cstddef>
#include <utility>
#include <vector>

namespace Entrain {
namespace Sim {

/// Per-oscillator initial data (N entries each)
struct OscillatorInit {
    std::vector<double> naturalFrequencies;  ///< omega_i (rad/s)
    std::vector<double> initialPhases;       ///< theta_i(0), wrapped on use
    std::vector<double> startTimes;          ///< start_i (s)

    /// True when all three vectors have @p count entries
    [[nodiscard]] bool matches(std::size_t count) const noexcept {
        return naturalFrequencies.size() == count &&
               initialPhases.size() == count &&
               startTimes.size() == count;
    }
};

/// @brief Draw initial oscillator data from @p config.
///
/// omega_i ~ N(2 pi * omegaMeanHz, omegaSpread), theta_i ~ U(-pi, pi),
/// start_i ~ U(0, startSpreadSeconds).
[[nodiscard]] inline OscillatorInit drawOscillatorInit(const EngineConfig& config) {
    const std::size_t n = config.numOscillators;
    Xorshift32 rng(config.seed);

    OscillatorInit init;
    init.naturalFrequencies.resize(n);
    init.initialPhases.resize(n);
    init.startTimes.resize(n);

    const double omegaMean = hzToAngular(config.omegaMeanHz);
    for (auto& omega : init.naturalFrequencies) {
        omega = omegaMean + config.omegaSpread * rng.nextGaussian();
    }
    for (auto& theta : init.initialPhases) {
        theta = wrapPhase(rng.nextUniform(-kPi, kPi));
    }
    for (auto& start : init.startTimes) {
        start = rng.nextUniform(0.0, config.startSpreadSeconds);
    }
    return init;
}

/// @brief Uniform oscillator data: identical frequency, all started at t = 0.
///
/// Useful for controlled runs where only the phases differ.
[[nodiscard]] inline OscillatorInit makeUniformInit(
    std::vector<double> initialPhases,
    double naturalFrequency,
    double startTime = 0.0
) {
    OscillatorInit init;
    init.naturalFrequencies.assign(initialPhases.size(), naturalFrequency);
    init.startTimes.assign(initialPhases.size(), startTime);
    init.initialPhases = std::move(initialPhases);
    return init;
}

} // namespace Sim
} // namespace Entrain
