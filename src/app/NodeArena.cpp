#include "app/NodeArena.hpp"
#include <algorithm>
#include <cassert>

using tally::model::NodeIndex;
using tally::model::OptionalIndex;
using tally::model::ParentSlot;

namespace tally::app {

NodeArena::NodeArena(size_t capacity)
    : parents_(std::clamp<size_t>(capacity, 1, model::kMaxCapacity)),
      storage_(parents_.size()),
      freelist_(parents_.size()),
      freelist_head_(OptionalIndex{}.raw()) {}

void NodeArena::reset_with_root(std::string_view name, size_t estimated_total) {
  for (auto& p : parents_) p.store(ParentSlot::unused(), std::memory_order_relaxed);
  for (auto& f : freelist_) f.store(OptionalIndex{}, std::memory_order_relaxed);
  freelist_head_.store(OptionalIndex{}.raw(), std::memory_order_relaxed);
  init_slot(NodeIndex(0), ParentSlot::root(), name, estimated_total);
  end_index_.store(1, std::memory_order_seq_cst);
}

OptionalIndex NodeArena::allocate(NodeIndex parent, std::string_view name, size_t estimated_total) {
  const ParentSlot link = ParentSlot::child_of(parent);

  // Freelist pop. The tag in the head word changes on every successful
  // exchange, so a slot popped and pushed back in between fails the CAS.
  uint64_t head = freelist_head_.load(std::memory_order_seq_cst);
  for (;;) {
    OptionalIndex top = unpack_index(head);
    if (!top.has_value()) break;
    OptionalIndex next = freelist_[top.value().get()].load(std::memory_order_relaxed);
    if (freelist_head_.compare_exchange_weak(head, pack(next, head),
                                             std::memory_order_seq_cst, std::memory_order_seq_cst)) {
      init_slot(top.value(), link, name, estimated_total);
      return top.value();
    }
  }

  // Never-used capacity.
  uint32_t slot = end_index_.fetch_add(1, std::memory_order_relaxed);
  if (slot >= capacity()) {
    // Out of node storage; this subtree will not be tracked.
    end_index_.fetch_sub(1, std::memory_order_relaxed);
    return {};
  }
  init_slot(NodeIndex(slot), link, name, estimated_total);
  return NodeIndex(slot);
}

void NodeArena::init_slot(NodeIndex index, ParentSlot parent, std::string_view name,
                          size_t estimated_total) {
  assert(!parent.is_unused());
  auto& s = storage_[index.get()];
  s.completed_count.store(0, std::memory_order_relaxed);
  s.estimated_total_count.store(model::lossy_count(estimated_total), std::memory_order_relaxed);
  const size_t n = std::min(name.size(), model::kMaxNameLen);
  for (size_t i = 0; i < model::kMaxNameLen; ++i)
    s.name[i].store(i < n ? name[i] : '\0', std::memory_order_relaxed);

  auto& link = parents_[index.get()];
  assert(link.load(std::memory_order_relaxed).is_unused());
  // Publishing the parent last makes the counters above visible to any
  // reader that observes the link.
  link.store(parent, std::memory_order_release);
}

void NodeArena::release(NodeIndex index) {
  auto& link = parents_[index.get()];
  const ParentSlot p = link.load(std::memory_order_acquire);
  assert(p.kind() == ParentSlot::Kind::Child);
  const OptionalIndex parent = p.parent();
  if (!parent.has_value()) return;

  storage_[parent.value().get()].completed_count.fetch_add(1, std::memory_order_relaxed);
  // Must be Unused before it becomes reachable from the freelist.
  link.store(ParentSlot::unused(), std::memory_order_seq_cst);
  push_free(index);
}

void NodeArena::push_free(NodeIndex index) {
  uint64_t head = freelist_head_.load(std::memory_order_seq_cst);
  do {
    freelist_[index.get()].store(unpack_index(head), std::memory_order_relaxed);
  } while (!freelist_head_.compare_exchange_weak(head, pack(index, head),
                                                 std::memory_order_seq_cst, std::memory_order_seq_cst));
}

void NodeArena::complete_one(NodeIndex index) {
  storage_[index.get()].completed_count.fetch_add(1, std::memory_order_relaxed);
}

void NodeArena::set_completed(NodeIndex index, size_t completed) {
  storage_[index.get()].completed_count.store(model::lossy_count(completed), std::memory_order_relaxed);
}

void NodeArena::set_estimated_total(NodeIndex index, size_t total) {
  storage_[index.get()].estimated_total_count.store(model::lossy_count(total), std::memory_order_relaxed);
}

} // namespace tally::app
