#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include "model/NodeTypes.hpp"

namespace tally::model {

// Plain copy of one live node, parent remapped into snapshot space.
struct SnapshotNode {
  ParentSlot parent{};
  uint32_t completed_count{};
  uint32_t estimated_total_count{};
  std::array<char, kMaxNameLen> name{};

  [[nodiscard]] std::string_view name_view() const {
    size_t n = 0;
    while (n < name.size() && name[n] != '\0') ++n;
    return std::string_view(name.data(), n);
  }
};

// Adjacency rebuilt from the parent array.
struct TreeLinks {
  OptionalIndex first_child{};
  OptionalIndex next_sibling{};
};

// Compacted, non-atomic view of the arena taken by the render thread.
// All storage is sized once at construction.
struct FrameSnapshot {
  explicit FrameSnapshot(size_t capacity)
      : nodes(capacity), links(capacity), slot_map(capacity), len(0) {}

  std::vector<SnapshotNode> nodes;
  std::vector<TreeLinks> links;
  // arena slot -> snapshot index, valid only for slots accepted this pass
  std::vector<OptionalIndex> slot_map;
  size_t len;

  [[nodiscard]] size_t capacity() const { return nodes.size(); }
  [[nodiscard]] bool empty() const { return len == 0; }
};

} // namespace tally::model
