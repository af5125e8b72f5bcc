#include "app/SnapshotReader.hpp"
#include <algorithm>

using tally::model::NodeIndex;
using tally::model::OptionalIndex;
using tally::model::ParentSlot;

namespace tally::app {

void capture_snapshot(const NodeArena& arena, model::FrameSnapshot& out) {
  // The high-water mark can briefly overshoot capacity while a full arena
  // rolls back an allocation.
  const size_t end = std::min({arena.end_index(), arena.capacity(), out.capacity()});
  out.len = 0;
  std::fill_n(out.slot_map.begin(), end, OptionalIndex{});

  for (size_t i = 0; i < end; ++i) {
    const NodeIndex slot(i);
    ParentSlot begin = arena.parent(slot, std::memory_order_seq_cst);
    while (!begin.is_unused()) {
      const auto& src = arena.storage(slot);
      auto& dst = out.nodes[out.len];
      for (size_t k = 0; k < model::kMaxNameLen; ++k)
        dst.name[k] = src.name[k].load(std::memory_order_relaxed);
      dst.completed_count = src.completed_count.load(std::memory_order_relaxed);
      dst.estimated_total_count = src.estimated_total_count.load(std::memory_order_relaxed);

      const ParentSlot end_parent = arena.parent(slot, std::memory_order_seq_cst);
      if (begin == end_parent) {
        dst.parent = begin;
        out.slot_map[i] = NodeIndex(out.len);
        ++out.len;
        break;
      }
      begin = end_parent;
    }
  }

  // Point parents into the compacted arrays. A parent that was not captured
  // this pass leaves the node orphaned (Unused) so it is never drawn.
  for (size_t n = 0; n < out.len; ++n) {
    auto& node = out.nodes[n];
    if (node.parent.is_root()) continue;
    const OptionalIndex p = node.parent.parent();
    OptionalIndex mapped;
    if (p.has_value() && p.value().get() < end) mapped = out.slot_map[p.value().get()];
    node.parent = mapped.has_value() ? ParentSlot::child_of(mapped.value()) : ParentSlot::unused();
  }
}

} // namespace tally::app
