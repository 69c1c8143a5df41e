// ==============================================================================
// IFrameSink - Interface for Frame Consumers
// ==============================================================================
// Layer 3: Systems (Interface)
//
// Abstract interface for the collaborator that consumes engine frames
// (renderer, encoder, HUD logger, test probe). SyncEngine::run() drives a
// sink frame by frame.
// ==============================================================================
#pragma once

#include <entrain/sim/systems/frame_state.h>

namespace Entrain::Sim {

/// @brief Consumer of per-frame engine snapshots
class IFrameSink {
public:
    virtual ~IFrameSink() = default;

    /// @brief Receive one frame.
    /// @param frame Snapshot owned by the engine, valid until the next frame
    /// @return false to stop the run after this frame
    virtual bool onFrame(const FrameState& frame) = 0;
};

} // namespace Entrain::Sim
