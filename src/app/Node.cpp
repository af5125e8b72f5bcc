#include "app/Node.hpp"
#include "app/Progress.hpp"

namespace tally::app {

bool Node::live() const {
  return valid() && !ctx_->done();
}

Node Node::start(std::string_view name, size_t estimated_total_items) const {
  if (!live()) return {};
  auto child = ctx_->arena_.allocate(index_.value(), name, estimated_total_items);
  if (!child.has_value()) return {};
  return Node(ctx_, child);
}

void Node::complete_one() const {
  if (!live()) return;
  ctx_->arena_.complete_one(index_.value());
}

void Node::set_completed_items(size_t completed_items) const {
  if (!live()) return;
  ctx_->arena_.set_completed(index_.value(), completed_items);
}

void Node::set_estimated_total_items(size_t count) const {
  if (!live()) return;
  ctx_->arena_.set_estimated_total(index_.value(), count);
}

void Node::end() {
  if (!valid()) return;
  Progress* ctx = ctx_;
  const model::NodeIndex index = index_.value();
  ctx_ = nullptr;
  index_ = {};

  if (ctx->arena_.parent(index, std::memory_order_acquire).is_root()) {
    ctx->end_root();
  } else if (!ctx->done()) {
    ctx->arena_.release(index);
  }
}

} // namespace tally::app
