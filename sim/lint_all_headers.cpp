// ==============================================================================
// EntrainSim Lint Stub - Compile every public header in one translation unit
// ==============================================================================
// The library is header-only; this file gives the compiler and clang-tidy a
// .cpp that includes every public header so that each one is checked for
// self-sufficiency. It is compiled as a separate OBJECT library target
// (sim_lint_stub) and is NOT part of the library itself.
// ==============================================================================

// Layer 0: Core
#include <entrain/sim/core/circular_stats.h>
#include <entrain/sim/core/color.h>
#include <entrain/sim/core/engine_config.h>
#include <entrain/sim/core/engine_presets.h>
#include <entrain/sim/core/grid_layout.h>
#include <entrain/sim/core/math_constants.h>
#include <entrain/sim/core/oscillator_init.h>
#include <entrain/sim/core/phase_utils.h>
#include <entrain/sim/core/ramp_curves.h>
#include <entrain/sim/core/random.h>

// Layer 1: Primitives
#include <entrain/sim/primitives/activation_model.h>
#include <entrain/sim/primitives/coupling_scheduler.h>
#include <entrain/sim/primitives/disjoint_set.h>
#include <entrain/sim/primitives/noise_streams.h>
#include <entrain/sim/primitives/spatial_weights.h>

// Layer 2: Processors
#include <entrain/sim/processors/cluster_detector.h>
#include <entrain/sim/processors/engine_state.h>
#include <entrain/sim/processors/hysteresis_tracker.h>
#include <entrain/sim/processors/kuramoto_integrator.h>
#include <entrain/sim/processors/order_parameter_tracker.h>

// Layer 3: Systems
#include <entrain/sim/systems/frame_state.h>
#include <entrain/sim/systems/i_frame_sink.h>
#include <entrain/sim/systems/sync_engine.h>
