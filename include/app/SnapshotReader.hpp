#pragma once

#include "app/NodeArena.hpp"
#include "model/FrameSnapshot.hpp"

namespace tally::app {

// Copies the live part of the arena into `out` without locking.
//
// Single reader only: the render thread (or a test standing in for it).
// Each slot is bracketed by two reads of its parent link; the copy is kept
// only when both reads agree. Counters may be torn against concurrent
// updates, tree shape may not. Nodes whose parent was not captured in the
// same pass are dropped rather than attached elsewhere.
void capture_snapshot(const NodeArena& arena, model::FrameSnapshot& out);

} // namespace tally::app
