// ==============================================================================
// Layer 0: Core Utility - EngineConfig
// ==============================================================================
// Configuration bundle for one simulation run. Every tunable constant of the
// engine lives here; there are no module-level parameters anywhere else.
//
// Default values reproduce the 30 s run with full lock near t = 25 s.
// ==============================================================================

#pragma once

#include <entrain/sim/core/color.h>
#include <entrain/sim/core/grid_layout.h>
#include <entrain/sim/core/ramp_curves.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace Entrain {
namespace Sim {

// =============================================================================
// ConfigStatus
// =============================================================================

/// @brief Result of configuration validation.
///
/// Anything other than Ok means the configuration was rejected before the
/// run started; the engine never fails partway through a run.
enum class ConfigStatus : uint8_t {
    Ok = 0,
    InvalidOscillatorCount,     ///< N must be > 0
    InvalidRowCount,            ///< rows must be > 0
    InvalidFrameRate,           ///< fps must be > 0
    InvalidSubsteps,            ///< substeps must be >= 1
    InvalidDuration,            ///< duration must be >= 0
    InvalidSpatialDecay,        ///< lambda must be > 0
    InvalidFadeIn,              ///< fade-in must be > 0
    InvalidStartSpread,         ///< start spread must be >= 0
    InvalidRampWindow,          ///< lock target must not precede ramp start
    InvalidCoupling,            ///< K_start, K_end and ramp times must be finite
    InvalidFrequency,           ///< mean natural frequency must be finite
    InvalidNoise,               ///< noise std and frequency spread must be finite and >= 0
    InvalidClusterParameters,   ///< radius/threshold/size out of range
    InvalidLockParameters,      ///< R_LOCK outside [0, 1] or negative hold
    EmptyPalette,               ///< at least one cluster color is required
    SizeMismatch                ///< positions or oscillator init do not match N
};

/// @brief Human-readable name of a ConfigStatus (for tool-level logging).
[[nodiscard]] constexpr std::string_view toString(ConfigStatus status) noexcept {
    switch (status) {
        case ConfigStatus::Ok:                       return "ok";
        case ConfigStatus::InvalidOscillatorCount:   return "oscillator count must be positive";
        case ConfigStatus::InvalidRowCount:          return "row count must be positive";
        case ConfigStatus::InvalidFrameRate:         return "frame rate must be positive";
        case ConfigStatus::InvalidSubsteps:          return "substeps must be at least 1";
        case ConfigStatus::InvalidDuration:          return "duration must not be negative";
        case ConfigStatus::InvalidSpatialDecay:      return "spatial decay length must be positive";
        case ConfigStatus::InvalidFadeIn:            return "fade-in duration must be positive";
        case ConfigStatus::InvalidStartSpread:       return "start spread must not be negative";
        case ConfigStatus::InvalidRampWindow:        return "lock target time precedes ramp start";
        case ConfigStatus::InvalidCoupling:          return "coupling strengths and ramp times must be finite";
        case ConfigStatus::InvalidFrequency:         return "mean natural frequency must be finite";
        case ConfigStatus::InvalidNoise:             return "noise and frequency spread must be finite and not negative";
        case ConfigStatus::InvalidClusterParameters: return "cluster parameters out of range";
        case ConfigStatus::InvalidLockParameters:    return "lock threshold or hold time out of range";
        case ConfigStatus::EmptyPalette:             return "cluster palette is empty";
        case ConfigStatus::SizeMismatch:             return "positions or oscillator data do not match N";
    }
    return "unknown";
}

// =============================================================================
// EngineConfig
// =============================================================================

/// @brief Complete parameter set for one simulation run.
///
/// @note Times are in seconds, frequencies of the oscillators in Hz
///       (omegaMeanHz) or rad/s (omegaSpread), distances in layout units.
struct EngineConfig {
    // =========================================================================
    // Population and timing
    // =========================================================================

    std::size_t numOscillators = 90;   ///< N
    std::size_t rows = 3;              ///< Grid rows for the default layout
    double durationSeconds = 30.0;     ///< Run length
    double fps = 30.0;                 ///< Output frames per second
    int substeps = 4;                  ///< Integrator sub-steps per frame
    uint32_t seed = 7;                 ///< Seed for initial draws and noise

    // =========================================================================
    // Oscillators
    // =========================================================================

    double omegaMeanHz = 1.1;          ///< Mean natural frequency (Hz)
    double omegaSpread = 0.10;         ///< Std-dev of natural frequency (rad/s)
    double startSpreadSeconds = 10.0;  ///< Start times drawn from U(0, spread)
    double fadeInSeconds = 2.5;        ///< Activation fade-in duration

    // =========================================================================
    // Coupling
    // =========================================================================

    double spatialDecay = 160.0;       ///< lambda of exp(-d / lambda)
    double kStart = 0.18;              ///< Coupling before the ramp
    double kEnd = 1.60;                ///< Coupling at and after lock target
    double rampStartSeconds = 5.0;     ///< Ramp begins
    double lockTargetSeconds = 25.0;   ///< Ramp reaches kEnd
    RampCurve rampCurve = RampCurve::SCurve;
    double noiseStd = 0.02;            ///< Phase diffusion (rad / sqrt(s))

    // =========================================================================
    // Clustering
    // =========================================================================

    double neighborRadius = 180.0;            ///< Max spatial distance of an edge
    double phaseThreshold = 0.35;             ///< Max |phase difference| of an edge (rad)
    double clusterCoherenceThreshold = 0.92;  ///< Min r of a qualified cluster
    std::size_t minClusterSize = 4;           ///< Min members of a qualified cluster
    double hysteresisSeconds = 0.6;           ///< Color hold after losing membership

    // =========================================================================
    // Lock detection
    // =========================================================================

    double lockThreshold = 0.97;       ///< R_LOCK
    double lockHoldSeconds = 1.0;      ///< Time r must stay >= R_LOCK

    // =========================================================================
    // Presentation hand-off
    // =========================================================================

    std::vector<Rgb8> palette = defaultPastelPalette();
    Rgb8 neutralColor = kDefaultNeutralColor;
    Rgb8 lockedColor = kDefaultLockedColor;
    LayoutFrame layout{};

    // =========================================================================
    // Derived values
    // =========================================================================

    /// @brief Duration of one output frame (seconds).
    [[nodiscard]] double frameDuration() const noexcept {
        return fps > 0.0 ? 1.0 / fps : 0.0;
    }

    /// @brief Integrator step dt = 1 / (fps * substeps).
    [[nodiscard]] double substepDuration() const noexcept {
        return (fps > 0.0 && substeps > 0) ? 1.0 / (fps * static_cast<double>(substeps)) : 0.0;
    }

    /// @brief Number of output frames in the run (duration * fps, rounded).
    /// 0 for a non-positive or non-finite product.
    [[nodiscard]] std::size_t totalFrames() const noexcept {
        const double frames = durationSeconds * fps;
        if (!std::isfinite(frames) || !(frames > 0.0) || fps <= 0.0) {
            return 0;
        }
        return static_cast<std::size_t>(std::llround(frames));
    }
};

// =============================================================================
// Validation
// =============================================================================

/// @brief Validate every parameter of @p config.
/// @return ConfigStatus::Ok or the first violated constraint
[[nodiscard]] inline ConfigStatus validateConfig(const EngineConfig& config) noexcept {
    // NaN fails every comparison below, so "!(x > 0)" rejects it too.
    // Values that feed the integrator or the frame count must also be finite.
    const auto finiteAtLeast = [](double x, double lo) noexcept {
        return std::isfinite(x) && x >= lo;
    };

    if (config.numOscillators == 0) {
        return ConfigStatus::InvalidOscillatorCount;
    }
    if (config.rows == 0) {
        return ConfigStatus::InvalidRowCount;
    }
    if (!std::isfinite(config.fps) || !(config.fps > 0.0)) {
        return ConfigStatus::InvalidFrameRate;
    }
    if (config.substeps < 1) {
        return ConfigStatus::InvalidSubsteps;
    }
    if (!finiteAtLeast(config.durationSeconds, 0.0)) {
        return ConfigStatus::InvalidDuration;
    }
    if (!(config.spatialDecay > 0.0)) {
        return ConfigStatus::InvalidSpatialDecay;
    }
    if (!std::isfinite(config.fadeInSeconds) || !(config.fadeInSeconds > 0.0)) {
        return ConfigStatus::InvalidFadeIn;
    }
    if (!finiteAtLeast(config.startSpreadSeconds, 0.0)) {
        return ConfigStatus::InvalidStartSpread;
    }
    if (!(config.lockTargetSeconds >= config.rampStartSeconds)) {
        return ConfigStatus::InvalidRampWindow;
    }
    if (!std::isfinite(config.kStart) || !std::isfinite(config.kEnd) ||
        !std::isfinite(config.rampStartSeconds) || !std::isfinite(config.lockTargetSeconds)) {
        return ConfigStatus::InvalidCoupling;
    }
    if (!std::isfinite(config.omegaMeanHz)) {
        return ConfigStatus::InvalidFrequency;
    }
    if (!finiteAtLeast(config.noiseStd, 0.0) || !finiteAtLeast(config.omegaSpread, 0.0)) {
        return ConfigStatus::InvalidNoise;
    }
    if (!(config.neighborRadius >= 0.0) || !(config.phaseThreshold >= 0.0) ||
        !(config.clusterCoherenceThreshold >= 0.0 && config.clusterCoherenceThreshold <= 1.0) ||
        config.minClusterSize == 0 || !(config.hysteresisSeconds >= 0.0)) {
        return ConfigStatus::InvalidClusterParameters;
    }
    if (!(config.lockThreshold >= 0.0 && config.lockThreshold <= 1.0) ||
        !(config.lockHoldSeconds >= 0.0)) {
        return ConfigStatus::InvalidLockParameters;
    }
    if (config.palette.empty()) {
        return ConfigStatus::EmptyPalette;
    }
    return ConfigStatus::Ok;
}

} // namespace Sim
} // namespace Entrain
