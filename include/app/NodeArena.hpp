#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include "model/NodeTypes.hpp"

namespace tally::app {

// Fixed-capacity node storage with a lock-free allocator.
//
// Parents, counters and freelist links live in parallel arrays so the render
// thread can walk the parent array without pulling counters into cache.
// All storage is allocated in the constructor; allocate() and release() never
// touch the heap and never block.
class NodeArena {
public:
  explicit NodeArena(size_t capacity);
  NodeArena(const NodeArena&) = delete;
  NodeArena& operator=(const NodeArena&) = delete;

  [[nodiscard]] size_t capacity() const { return parents_.size(); }

  // Clears every slot and installs the root at index 0. Not thread-safe;
  // call before any handle is handed out.
  void reset_with_root(std::string_view name, size_t estimated_total);

  // Pops a free slot (or grows the high-water mark), initialises its counters
  // and publishes the parent link last. Returns nothing when the arena is full.
  [[nodiscard]] model::OptionalIndex allocate(model::NodeIndex parent, std::string_view name,
                                              size_t estimated_total);

  // Retires a non-root node: credits one item to its parent, marks the slot
  // Unused, then pushes it onto the freelist. Precondition: the slot is live
  // and is not the root; a second release of the same slot corrupts the
  // freelist (checked only by assert).
  void release(model::NodeIndex index);

  void complete_one(model::NodeIndex index);
  void set_completed(model::NodeIndex index, size_t completed);
  void set_estimated_total(model::NodeIndex index, size_t total);

  [[nodiscard]] model::ParentSlot parent(model::NodeIndex index,
                                         std::memory_order order = std::memory_order_seq_cst) const {
    return parents_[index.get()].load(order);
  }
  [[nodiscard]] const model::NodeStorage& storage(model::NodeIndex index) const {
    return storage_[index.get()];
  }
  // High-water mark: slots [0, end_index) have been handed out at least once.
  [[nodiscard]] size_t end_index() const { return end_index_.load(std::memory_order_relaxed); }
  [[nodiscard]] bool freelist_empty() const {
    return !unpack_index(freelist_head_.load(std::memory_order_seq_cst)).has_value();
  }

private:
  void init_slot(model::NodeIndex index, model::ParentSlot parent, std::string_view name,
                 size_t estimated_total);
  void push_free(model::NodeIndex index);

  // Freelist head word: low 32 bits index, high 32 bits generation tag.
  [[nodiscard]] static model::OptionalIndex unpack_index(uint64_t word) {
    return model::OptionalIndex::from_raw(static_cast<uint32_t>(word));
  }
  [[nodiscard]] static uint64_t pack(model::OptionalIndex index, uint64_t previous_word) {
    uint64_t tag = (previous_word >> 32) + 1;
    return (tag << 32) | index.raw();
  }

  std::vector<std::atomic<model::ParentSlot>> parents_;
  std::vector<model::NodeStorage> storage_;
  std::vector<std::atomic<model::OptionalIndex>> freelist_;
  std::atomic<uint64_t> freelist_head_;
  std::atomic<uint32_t> end_index_{0};
};

} // namespace tally::app
