#pragma once

#include <cstddef>
#include <string_view>
#include "model/NodeTypes.hpp"

namespace tally::app {

class Progress;

// Handle to one unit of progress. Cheap to copy; all operations are
// thread-safe, non-blocking and allocation-free. A default-constructed
// handle, or one returned when the arena was full, is disabled and every
// operation on it does nothing.
//
// A handle should be driven by one thread at a time, and must not be used
// after its Progress is destroyed.
class Node {
public:
  Node() = default;

  // Creates a child node. 0 for estimated_total_items means unknown.
  [[nodiscard]] Node start(std::string_view name, size_t estimated_total_items = 0) const;

  // Same as start() followed by end() on the child, without using a slot.
  void complete_one() const;
  void set_completed_items(size_t completed_items) const;
  // 0 means unknown.
  void set_estimated_total_items(size_t count) const;

  // Finishes this node and disables the handle. A child credits its parent
  // with one completed item and frees its slot; the root shuts the context
  // down and blocks until the render thread has exited. Copies of an ended
  // child handle must not be used again.
  void end();

  [[nodiscard]] bool valid() const { return ctx_ != nullptr && index_.has_value(); }
  [[nodiscard]] model::OptionalIndex index() const { return index_; }

private:
  friend class Progress;
  Node(Progress* ctx, model::OptionalIndex index) : ctx_(ctx), index_(index) {}

  [[nodiscard]] bool live() const;

  Progress* ctx_{nullptr};
  model::OptionalIndex index_{};
};

} // namespace tally::app
