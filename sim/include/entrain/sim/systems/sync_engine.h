// ==============================================================================
// Layer 3: System - Sync Engine
// ==============================================================================
// Owns one simulation run and executes the per-frame pipeline:
//
//   substeps x KuramotoIntegrator::step()
//     -> OrderParameterTracker::update()        (r, lock timer, sticky lock)
//     -> ClusterDetector::detect()              (only while unlocked)
//     -> HysteresisTracker::update()            (color smoothing)
//     -> FrameState snapshot for the renderer
//
// Everything that was global state in a script (positions, generator,
// phases, hysteresis map, lock timer) is a member of this object, built from
// one EngineConfig in prepare().
// ==============================================================================

#pragma once

#include <entrain/sim/core/color.h>
#include <entrain/sim/core/engine_config.h>
#include <entrain/sim/core/grid_layout.h>
#include <entrain/sim/core/oscillator_init.h>
#include <entrain/sim/core/phase_utils.h>
#include <entrain/sim/primitives/activation_model.h>
#include <entrain/sim/primitives/coupling_scheduler.h>
#include <entrain/sim/primitives/spatial_weights.h>
#include <entrain/sim/processors/cluster_detector.h>
#include <entrain/sim/processors/engine_state.h>
#include <entrain/sim/processors/hysteresis_tracker.h>
#include <entrain/sim/processors/kuramoto_integrator.h>
#include <entrain/sim/processors/order_parameter_tracker.h>
#include <entrain/sim/systems/frame_state.h>
#include <entrain/sim/systems/i_frame_sink.h>

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace Entrain {
namespace Sim {

/// @brief Coupled-metronome simulation with clustering and lock detection.
///
/// @par Usage
/// @code
/// SyncEngine engine;
/// if (engine.prepare(makeLock25Preset()) != ConfigStatus::Ok) { ... }
/// while (!engine.isFinished()) {
///     const FrameState& frame = engine.advanceFrame();
///     draw(frame);
/// }
/// @endcode
class SyncEngine {
public:
    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Prepare a run on the default grid layout with seeded oscillators.
    [[nodiscard]] ConfigStatus prepare(const EngineConfig& config) {
        const ConfigStatus status = validateConfig(config);
        if (status != ConfigStatus::Ok) {
            return reject(status);
        }
        return prepare(config, makeGridLayout(config.numOscillators, config.rows, config.layout));
    }

    /// @brief Prepare a run with externally supplied positions.
    [[nodiscard]] ConfigStatus prepare(const EngineConfig& config, std::vector<Position> positions) {
        const ConfigStatus status = validateConfig(config);
        if (status != ConfigStatus::Ok) {
            return reject(status);
        }
        return prepare(config, std::move(positions), drawOscillatorInit(config));
    }

    /// @brief Prepare a run with explicit positions and oscillator data.
    /// @return ConfigStatus::Ok, or the reason the run was rejected. On any
    ///         failure the engine is left unprepared and frame() is the
    ///         empty snapshot, even if a previous run was prepared.
    [[nodiscard]] ConfigStatus prepare(
        const EngineConfig& config,
        std::vector<Position> positions,
        OscillatorInit init
    ) {
        const ConfigStatus status = validateConfig(config);
        if (status != ConfigStatus::Ok) {
            return reject(status);
        }
        const std::size_t n = config.numOscillators;
        if (positions.size() != n || !init.matches(n)) {
            return reject(ConfigStatus::SizeMismatch);
        }

        config_ = config;
        positions_ = std::move(positions);
        init_ = std::move(init);
        frameDuration_ = config_.frameDuration();
        substepDuration_ = config_.substepDuration();

        SpatialWeights weights;
        weights.build(positions_, config_.spatialDecay);

        CouplingScheduler schedule;
        schedule.configure(config_.kStart, config_.kEnd,
                           config_.rampStartSeconds, config_.lockTargetSeconds,
                           config_.rampCurve);

        ActivationModel activation;
        activation.configure(init_.startTimes, config_.fadeInSeconds);

        integrator_.prepare(std::move(weights), schedule, std::move(activation),
                            init_.naturalFrequencies, config_.noiseStd);

        tracker_.configure(config_.lockThreshold, config_.lockHoldSeconds);

        detector_.configure(config_.neighborRadius, config_.phaseThreshold,
                            config_.clusterCoherenceThreshold, config_.minClusterSize,
                            config_.palette.size());
        detector_.prepare(n);

        hysteresis_.prepare(n, config_.hysteresisSeconds);

        frame_.phases.assign(n, 0.0);
        frame_.active.assign(n, 0);
        frame_.colors.assign(n, kNeutralColor);

        prepared_ = true;
        reset();
        return ConfigStatus::Ok;
    }

    /// @brief Restart the run from its initial state (same seed, same trajectory).
    void reset() {
        if (!prepared_) {
            return;
        }
        state_.phases.resize(init_.initialPhases.size());
        std::transform(init_.initialPhases.begin(), init_.initialPhases.end(),
                       state_.phases.begin(), [](double theta) { return wrapPhase(theta); });
        state_.noise.seed(config_.seed, state_.phases.size());
        state_.substepCount = 0;
        state_.time = 0.0;
        OrderParameterTracker::resetLock(state_);
        hysteresis_.clear();
        framesProduced_ = 0;
        publishInitialFrame();
    }

    /// @brief Caller reset of the sticky lock. Phases and clock are kept;
    ///        clustering resumes on the next frame.
    void resetLock() noexcept {
        OrderParameterTracker::resetLock(state_);
        hysteresis_.clear();
    }

    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Run one output frame and return its snapshot.
    ///
    /// Before a successful prepare() this does nothing and returns the empty
    /// snapshot.
    const FrameState& advanceFrame() {
        if (!prepared_) {
            return frame_;
        }

        for (int s = 0; s < config_.substeps; ++s) {
            integrator_.step(state_, state_.time, substepDuration_);
            ++state_.substepCount;
            state_.time = static_cast<double>(state_.substepCount) * substepDuration_;
        }

        const LockUpdate lock = tracker_.update(state_, frameDuration_);
        integrator_.activation().computeActive(state_.time, frame_.active);

        if (lock.justLocked) {
            hysteresis_.clear();
        }

        if (state_.fullyLocked) {
            std::fill(frame_.colors.begin(), frame_.colors.end(), kLockedColor);
            frame_.clusterCount = 0;
        } else {
            detector_.detect(positions_, state_.phases, frame_.active);
            hysteresis_.update(detector_.colors(), frameDuration_);
            const auto smoothed = hysteresis_.colors();
            std::copy(smoothed.begin(), smoothed.end(), frame_.colors.begin());
            frame_.clusterCount = detector_.qualifiedCount();
        }

        std::copy(state_.phases.begin(), state_.phases.end(), frame_.phases.begin());
        frame_.frameIndex = framesProduced_++;
        frame_.time = state_.time;
        frame_.orderParameter = lock.orderParameter;
        frame_.effectiveCoupling = integrator_.schedule().effectiveCoupling(state_.time);
        frame_.lockTimer = state_.lockTimer;
        frame_.fullyLocked = state_.fullyLocked;
        return frame_;
    }

    /// @brief Drive @p sink through the remaining frames of the run.
    /// @return Number of frames delivered by this call
    std::size_t run(IFrameSink& sink) {
        std::size_t delivered = 0;
        while (prepared_ && !isFinished()) {
            const FrameState& frame = advanceFrame();
            ++delivered;
            if (!sink.onFrame(frame)) {
                break;
            }
        }
        return delivered;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Frames in a full run (duration * fps)
    [[nodiscard]] std::size_t totalFrames() const noexcept { return config_.totalFrames(); }

    /// Frames produced since prepare()/reset()
    [[nodiscard]] std::size_t framesProduced() const noexcept { return framesProduced_; }

    [[nodiscard]] bool isFinished() const noexcept { return framesProduced_ >= totalFrames(); }

    /// Last published snapshot
    [[nodiscard]] const FrameState& frame() const noexcept { return frame_; }

    [[nodiscard]] const EngineState& state() const noexcept { return state_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::span<const Position> positions() const noexcept { return positions_; }
    [[nodiscard]] const OscillatorInit& oscillatorInit() const noexcept { return init_; }
    [[nodiscard]] const KuramotoIntegrator& integrator() const noexcept { return integrator_; }
    [[nodiscard]] const ClusterDetector& clusterDetector() const noexcept { return detector_; }
    [[nodiscard]] const HysteresisTracker& hysteresis() const noexcept { return hysteresis_; }

    /// RGB of oscillator i in the last frame
    [[nodiscard]] Rgb8 colorOf(std::size_t i) const noexcept {
        return resolveColor(frame_.colors[i], config_.palette,
                            config_.neutralColor, config_.lockedColor);
    }

private:
    /// Failed prepare: unprepared, empty snapshot, nothing left of a prior run
    ConfigStatus reject(ConfigStatus status) {
        prepared_ = false;
        framesProduced_ = 0;
        frame_ = FrameState{};
        return status;
    }

    /// Snapshot before the first frame: t = 0, no clusters
    void publishInitialFrame() {
        std::copy(state_.phases.begin(), state_.phases.end(), frame_.phases.begin());
        integrator_.activation().computeActive(0.0, frame_.active);
        std::fill(frame_.colors.begin(), frame_.colors.end(), kNeutralColor);
        frame_.frameIndex = 0;
        frame_.time = 0.0;
        frame_.orderParameter = orderParameter(state_.phases);
        frame_.effectiveCoupling = integrator_.schedule().effectiveCoupling(0.0);
        frame_.lockTimer = 0.0;
        frame_.fullyLocked = false;
        frame_.clusterCount = 0;
    }

    EngineConfig config_;
    std::vector<Position> positions_;
    OscillatorInit init_;
    double frameDuration_ = 0.0;
    double substepDuration_ = 0.0;

    KuramotoIntegrator integrator_;
    OrderParameterTracker tracker_;
    ClusterDetector detector_;
    HysteresisTracker hysteresis_;

    EngineState state_;
    FrameState frame_;
    std::size_t framesProduced_ = 0;
    bool prepared_ = false;
};

} // namespace Sim
} // namespace Entrain
