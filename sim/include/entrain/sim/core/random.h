// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seedable Pseudo-Random Number Generation
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
//
// The engine owns every generator explicitly; there is no module-level
// default generator anywhere in the library.
// ==============================================================================

#pragma once

#include <entrain/sim/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Entrain {
namespace Sim {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Period 2^32-1, Marsaglia's shifts 13, 17, 5. The sequence is fully
/// determined by the seed, on every platform and standard library, which is
/// what the engine's reproducibility relies on.
///
/// @note NOT cryptographically secure
///
/// @example Basic usage:
///     Xorshift32 rng(12345);
///     double u = rng.nextUnipolar();   // [0.0, 1.0]
///     double g = rng.nextGaussian();   // N(0, 1)
///
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer.
    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next double in unipolar range.
    /// @return Random double in range [0.0, 1.0]
    [[nodiscard]] constexpr double nextUnipolar() noexcept {
        return static_cast<double>(next()) * kToUnit;
    }

    /// Generate next double in bipolar range.
    /// @return Random double in range [-1.0, 1.0]
    [[nodiscard]] constexpr double nextBipolar() noexcept {
        return nextUnipolar() * 2.0 - 1.0;
    }

    /// Generate next double uniformly in [lo, hi].
    [[nodiscard]] constexpr double nextUniform(double lo, double hi) noexcept {
        return lo + (hi - lo) * nextUnipolar();
    }

    /// Generate a standard normal deviate (Box-Muller, cosine branch).
    ///
    /// Consumes exactly two draws per call so that the stream position
    /// depends only on the number of calls.
    /// @return Random double ~ N(0, 1)
    [[nodiscard]] double nextGaussian() noexcept {
        // next() never returns 0, so u1 is in (0, 1] and log(u1) is finite
        const double u1 = static_cast<double>(next()) * kToUnit;
        const double u2 = static_cast<double>(next()) * kToUnit;
        return std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
    }

    /// Reseed the generator.
    /// @param seedValue New seed (0 is automatically replaced with default)
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    /// Get current state (for debugging/serialization).
    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// Default seed used when 0 is passed (0 would cause generator to output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// Conversion factor from uint32_t to [0, 1] double: 1 / (2^32 - 1)
    static constexpr double kToUnit = 1.0 / 4294967295.0;

    uint32_t state_;
};

// ==============================================================================
// Stream Seeding
// ==============================================================================

/// @brief Derive an independent seed for stream @p index from a base seed.
///
/// Uses the 32-bit finalizer of MurmurHash3 over (seed, index) so that
/// neighbouring indices produce unrelated xorshift sequences.
/// @return Non-zero seed suitable for Xorshift32
[[nodiscard]] constexpr uint32_t deriveStreamSeed(uint32_t baseSeed, std::size_t index) noexcept {
    uint32_t h = baseSeed ^ (static_cast<uint32_t>(index) * 0x9E3779B9u);
    h ^= h >> 16;
    h *= 0x85EBCA6Bu;
    h ^= h >> 13;
    h *= 0xC2B2AE35u;
    h ^= h >> 16;
    return h != 0 ? h : 0x6D2B79F5u;
}

} // namespace Sim
} // namespace Entrain
