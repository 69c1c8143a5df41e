// ==============================================================================
// Metronome Run - headless driver for the sync engine
// ==============================================================================
// Runs one preset from start to finish and logs a HUD line per simulated
// second: coupling, order parameter, cluster count and lock state. A renderer
// or encoder plugs into the same IFrameSink seam.
//
// Usage: metronome_run [preset]     (default: lock25)
// ==============================================================================

#include <entrain/sim/core/engine_presets.h>
#include <entrain/sim/systems/i_frame_sink.h>
#include <entrain/sim/systems/sync_engine.h>

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>

using namespace Entrain::Sim;

namespace {

// ==============================================================================
// HudLogger - prints one status line per simulated second
// ==============================================================================
class HudLogger : public IFrameSink {
public:
    HudLogger(std::size_t oscillators, double fps)
        : oscillators_(oscillators)
        , framesPerLine_(fps > 1.0 ? static_cast<std::size_t>(fps) : 1) {}

    bool onFrame(const FrameState& frame) override {
        if (frame.fullyLocked && !lockReported_) {
            lockReported_ = true;
            lockTime_ = frame.time;
            std::cout << "  >> full lock at t=" << std::fixed << std::setprecision(2)
                      << frame.time << "s (r=" << std::setprecision(3)
                      << frame.orderParameter << ")" << std::endl;
        }

        peakClusters_ = std::max(peakClusters_, frame.clusterCount);
        lastR_ = frame.orderParameter;

        if ((frame.frameIndex + 1) % framesPerLine_ == 0) {
            std::size_t activeCount = 0;
            for (const auto a : frame.active) {
                activeCount += a;
            }
            std::cout << "  t=" << std::fixed << std::setprecision(1) << std::setw(5) << frame.time
                      << "s  N=" << oscillators_
                      << "  active=" << std::setw(3) << activeCount
                      << "  K(t)=" << std::setprecision(2) << frame.effectiveCoupling
                      << "  r=" << std::setprecision(3) << frame.orderParameter
                      << "  clusters=" << frame.clusterCount
                      << (frame.fullyLocked ? "  [LOCKED]" : "") << std::endl;
        }
        return true;
    }

    [[nodiscard]] bool locked() const noexcept { return lockReported_; }
    [[nodiscard]] double lockTime() const noexcept { return lockTime_; }
    [[nodiscard]] std::size_t peakClusters() const noexcept { return peakClusters_; }
    [[nodiscard]] double finalOrderParameter() const noexcept { return lastR_; }

private:
    std::size_t oscillators_;
    std::size_t framesPerLine_;
    bool lockReported_ = false;
    double lockTime_ = 0.0;
    std::size_t peakClusters_ = 0;
    double lastR_ = 0.0;
};

void listPresets() {
    std::cerr << "Available presets:" << std::endl;
    for (const auto& preset : kEnginePresets) {
        std::cerr << "  " << preset.name << " - " << preset.description << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string presetName = "lock25";

    if (argc > 1) {
        presetName = argv[1];
    }

    const auto config = findPreset(presetName);
    if (!config) {
        std::cerr << "Unknown preset: " << presetName << std::endl;
        listPresets();
        return 1;
    }

    SyncEngine engine;
    const ConfigStatus status = engine.prepare(*config);
    if (status != ConfigStatus::Ok) {
        std::cerr << "Failed to prepare engine: " << toString(status) << std::endl;
        return 1;
    }

    std::cout << "Running preset '" << presetName << "': "
              << config->numOscillators << " metronomes, "
              << engine.totalFrames() << " frames at " << config->fps << " fps" << std::endl;

    HudLogger logger(config->numOscillators, config->fps);
    const std::size_t frames = engine.run(logger);

    std::cout << "\nSimulated " << frames << " frames (" << std::fixed << std::setprecision(1)
              << engine.state().time << "s)." << std::endl;
    std::cout << "Final order parameter: " << std::setprecision(3)
              << logger.finalOrderParameter() << std::endl;
    std::cout << "Peak cluster count: " << logger.peakClusters() << std::endl;
    if (logger.locked()) {
        std::cout << "Full lock reached at " << std::setprecision(2) << logger.lockTime() << "s" << std::endl;
    } else {
        std::cerr << "WARNING: run ended without full lock" << std::endl;
    }
    return 0;
}
