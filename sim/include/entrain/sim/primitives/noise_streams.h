// ==============================================================================
// Layer 1: Primitive - Noise Streams
// ==============================================================================
// One pre-seeded Xorshift32 stream per oscillator. Oscillator i always draws
// from stream i, so the noise it receives depends only on the base seed and
// on how many sub-steps have run, never on the order in which other
// oscillators are processed.
// ==============================================================================

#pragma once

#include <entrain/sim/core/random.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Entrain {
namespace Sim {

class NoiseStreams {
public:
    /// @brief Create @p count streams derived from @p baseSeed.
    void seed(uint32_t baseSeed, std::size_t count) {
        baseSeed_ = baseSeed;
        streams_.clear();
        streams_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            streams_.emplace_back(deriveStreamSeed(baseSeed, i));
        }
    }

    /// @brief Rewind every stream to its initial state.
    void reset() {
        seed(baseSeed_, streams_.size());
    }

    [[nodiscard]] std::size_t size() const noexcept { return streams_.size(); }

    [[nodiscard]] uint32_t baseSeed() const noexcept { return baseSeed_; }

    /// Standard normal deviate from stream @p i
    [[nodiscard]] double nextGaussian(std::size_t i) noexcept {
        return streams_[i].nextGaussian();
    }

private:
    std::vector<Xorshift32> streams_;
    uint32_t baseSeed_ = 1;
};

} // namespace Sim
} // namespace Entrain
