#pragma once

#include "model/FrameSnapshot.hpp"

namespace tally::ui {

// Fills snapshot.links from the parent array.
//
// Sibling order is snapshot order, which is arena slot order: a node that
// reused a freed low slot is listed before older siblings in higher slots.
// Orphans (parent Unused after remapping) stay unlinked.
void build_tree_links(model::FrameSnapshot& snapshot);

} // namespace tally::ui
