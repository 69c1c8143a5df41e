// ==============================================================================
// Test helpers: engine configurations and layouts for unit tests
// ==============================================================================
#pragma once

#include <entrain/sim/core/engine_config.h>
#include <entrain/sim/core/grid_layout.h>
#include <entrain/sim/core/phase_utils.h>
#include <entrain/sim/primitives/activation_model.h>
#include <entrain/sim/primitives/coupling_scheduler.h>
#include <entrain/sim/primitives/spatial_weights.h>
#include <entrain/sim/processors/engine_state.h>
#include <entrain/sim/processors/kuramoto_integrator.h>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace Entrain::Sim::TestHelpers {

/// @p count positions all at the same point (all-to-all equal weights)
inline std::vector<Position> colocatedPositions(std::size_t count, Position at = {0.0, 0.0}) {
    return std::vector<Position>(count, at);
}

/// @p count positions on a horizontal line with the given spacing
inline std::vector<Position> linePositions(std::size_t count, double spacing) {
    std::vector<Position> positions;
    positions.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        positions.push_back({static_cast<double>(i) * spacing, 0.0});
    }
    return positions;
}

/// Config with noise off, constant coupling and every oscillator fully
/// active from t = 0 (start times at -fadeIn).
inline EngineConfig deterministicConfig(std::size_t count, double coupling) {
    EngineConfig config;
    config.numOscillators = count;
    config.rows = 1;
    config.noiseStd = 0.0;
    config.omegaSpread = 0.0;
    config.kStart = coupling;
    config.kEnd = coupling;
    config.rampStartSeconds = 0.0;
    config.lockTargetSeconds = 0.0;
    config.startSpreadSeconds = 0.0;
    config.fadeInSeconds = 1.0;
    return config;
}

/// Integrator over co-located oscillators with identical frequency,
/// constant coupling, no noise, all fully active from t = 0.
inline KuramotoIntegrator makeColocatedIntegrator(
    std::size_t count,
    double omega,
    double coupling,
    double noiseStd = 0.0
) {
    const auto positions = colocatedPositions(count);
    SpatialWeights weights;
    weights.build(positions, 100.0);

    CouplingScheduler schedule;
    schedule.setConstant(coupling);

    const std::vector<double> starts(count, -1.0);
    ActivationModel activation;
    activation.configure(starts, 1.0);

    KuramotoIntegrator integrator;
    integrator.prepare(std::move(weights), schedule, std::move(activation),
                       std::vector<double>(count, omega), noiseStd);
    return integrator;
}

/// Engine state holding @p phases (wrapped) and seeded noise streams
inline EngineState makeState(const std::vector<double>& phases, uint32_t seed = 7) {
    EngineState state;
    state.phases.reserve(phases.size());
    for (const double theta : phases) {
        state.phases.push_back(wrapPhase(theta));
    }
    state.noise.seed(seed, phases.size());
    return state;
}

} // namespace Entrain::Sim::TestHelpers
