// ==============================================================================
// Layer 0: Core Utility - Engine Presets
// ==============================================================================
// Factory parameter sets. Each preset is a full EngineConfig; they differ only
// in population size, durations and thresholds.
// ==============================================================================

#pragma once

#include <entrain/sim/core/engine_config.h>

#include <array>
#include <optional>
#include <string_view>

namespace Entrain {
namespace Sim {

/// 30 s, 90 metronomes on 3 rows, full lock near t = 25 s.
[[nodiscard]] inline EngineConfig makeLock25Preset() {
    return EngineConfig{};
}

/// 46 s, 120 metronomes on 4 rows, slower ramp with full lock near t = 40 s.
/// Shorter coupling range and more noise keep spatial clusters visible longer.
[[nodiscard]] inline EngineConfig makeLock40Preset() {
    EngineConfig config;
    config.numOscillators = 120;
    config.rows = 4;
    config.durationSeconds = 46.0;
    config.omegaSpread = 0.12;
    config.startSpreadSeconds = 14.0;
    config.fadeInSeconds = 3.0;
    config.spatialDecay = 140.0;
    config.kStart = 0.15;
    config.kEnd = 1.7;
    config.rampStartSeconds = 8.0;
    config.lockTargetSeconds = 40.0;
    config.noiseStd = 0.03;
    config.layout.rowSpacing = 130.0;
    config.layout.marginTop = 140.0;
    config.neighborRadius = 150.0;
    config.phaseThreshold = 0.30;
    config.hysteresisSeconds = 0.8;
    config.lockHoldSeconds = 1.5;
    return config;
}

/// 12 s, 24 metronomes on 2 rows. Quick look at the whole arc.
[[nodiscard]] inline EngineConfig makePreviewPreset() {
    EngineConfig config;
    config.numOscillators = 24;
    config.rows = 2;
    config.durationSeconds = 12.0;
    config.startSpreadSeconds = 3.0;
    config.fadeInSeconds = 1.0;
    config.spatialDecay = 200.0;
    config.kStart = 0.3;
    config.kEnd = 2.5;
    config.rampStartSeconds = 2.0;
    config.lockTargetSeconds = 9.0;
    config.neighborRadius = 260.0;
    config.minClusterSize = 3;
    return config;
}

/// Named preset table entry
struct EnginePreset {
    std::string_view name;
    std::string_view description;
    EngineConfig (*make)();
};

/// All built-in presets, in display order
inline constexpr std::array<EnginePreset, 3> kEnginePresets{{
    {"lock25", "30 s run, 90 metronomes, lock near 25 s", &makeLock25Preset},
    {"lock40", "46 s run, 120 metronomes, lock near 40 s", &makeLock40Preset},
    {"preview", "12 s run, 24 metronomes", &makePreviewPreset},
}};

/// @brief Look up a preset by name.
/// @return The preset configuration, or std::nullopt for an unknown name
[[nodiscard]] inline std::optional<EngineConfig> findPreset(std::string_view name) {
    for (const auto& preset : kEnginePresets) {
        if (preset.name == name) {
            return preset.make();
        }
    }
    return std::nullopt;
}

} // namespace Sim
} // namespace Entrain
