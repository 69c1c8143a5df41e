// ==============================================================================
// Layer 2: Processor - Order Parameter Tracker
// ==============================================================================
// Global coherence r = |mean e^{i theta}| and the lock-hold state machine.
//
//   UNLOCKED --(r >= R_LOCK continuously for holdSeconds)--> LOCKED
//
// Every frame with r >= R_LOCK adds the frame duration to the lock timer; any
// frame below the threshold resets it to zero. LOCKED is terminal for the
// run: there is no transition back. Only an explicit caller reset (see
// resetLock()) returns the state to UNLOCKED.
// ==============================================================================

#pragma once

#include <entrain/sim/core/circular_stats.h>
#include <entrain/sim/core/math_constants.h>
#include <entrain/sim/processors/engine_state.h>

#include <cstdint>

namespace Entrain {
namespace Sim {

/// Lock state machine states
enum class LockState : uint8_t {
    Unlocked,  ///< Lock timer accumulating or reset
    Locked     ///< Terminal until caller reset
};

/// @brief Outcome of one OrderParameterTracker::update() call
struct LockUpdate {
    double orderParameter = 0.0;  ///< r of this frame, in [0, 1]
    LockState state = LockState::Unlocked;
    bool justLocked = false;      ///< True only on the frame of the transition
};

class OrderParameterTracker {
public:
    /// @brief Set the lock criteria.
    /// @param lockThreshold R_LOCK in [0, 1]
    /// @param holdSeconds Time r must stay >= R_LOCK before locking
    void configure(double lockThreshold, double holdSeconds) noexcept {
        lockThreshold_ = lockThreshold;
        holdSeconds_ = holdSeconds;
    }

    [[nodiscard]] double lockThreshold() const noexcept { return lockThreshold_; }
    [[nodiscard]] double holdSeconds() const noexcept { return holdSeconds_; }

    /// @brief Run one frame of the state machine on @p state.
    /// @param state Engine state; lockTimer and fullyLocked are updated
    /// @param frameDuration Elapsed time of this frame (s)
    [[nodiscard]] LockUpdate update(EngineState& state, double frameDuration) const noexcept {
        LockUpdate result;
        result.orderParameter = orderParameter(state.phases);

        if (state.fullyLocked) {
            result.state = LockState::Locked;
            return result;
        }

        if (result.orderParameter >= lockThreshold_) {
            state.lockTimer += frameDuration;
            if (state.lockTimer >= holdSeconds_ - kTimeEpsilon) {
                state.fullyLocked = true;
                result.justLocked = true;
            }
        } else {
            state.lockTimer = 0.0;
        }
        result.state = state.fullyLocked ? LockState::Locked : LockState::Unlocked;
        return result;
    }

    /// @brief Caller reset: back to UNLOCKED with a cleared timer.
    static void resetLock(EngineState& state) noexcept {
        state.lockTimer = 0.0;
        state.fullyLocked = false;
    }

private:
    double lockThreshold_ = 0.97;
    double holdSeconds_ = 1.0;
};

} // namespace Sim
} // namespace Entrain
