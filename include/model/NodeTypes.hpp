#pragma once

#include <array>
#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace tally::model {

// Longest name kept per node; longer names are truncated on start().
inline constexpr size_t kMaxNameLen = 38;
// Index space is 16 bits; the parent tag lives outside it.
inline constexpr size_t kMaxCapacity = std::numeric_limits<uint16_t>::max() + size_t{1};

// Typed index into the node arena.
class NodeIndex {
public:
  constexpr NodeIndex() = default;
  constexpr explicit NodeIndex(size_t v) : value_(static_cast<uint16_t>(v)) {
    assert(v < kMaxCapacity);
  }
  [[nodiscard]] constexpr size_t get() const { return value_; }
  friend constexpr bool operator==(NodeIndex a, NodeIndex b) { return a.value_ == b.value_; }

private:
  uint16_t value_{0};
};

// Index or nothing. Used for handles and freelist links.
class OptionalIndex {
public:
  constexpr OptionalIndex() = default;
  constexpr OptionalIndex(NodeIndex i) : raw_(static_cast<uint32_t>(i.get())) {}

  [[nodiscard]] constexpr bool has_value() const { return raw_ != kNone; }
  [[nodiscard]] constexpr NodeIndex value() const {
    assert(has_value());
    return NodeIndex(raw_);
  }
  [[nodiscard]] constexpr uint32_t raw() const { return raw_; }
  [[nodiscard]] static constexpr OptionalIndex from_raw(uint32_t raw) {
    OptionalIndex o; o.raw_ = raw; return o;
  }
  friend constexpr bool operator==(OptionalIndex a, OptionalIndex b) { return a.raw_ == b.raw_; }

private:
  static constexpr uint32_t kNone = std::numeric_limits<uint32_t>::max();
  uint32_t raw_{kNone};
};

// Tri-state parent link. Unused marks a free slot, Root the top node,
// Child carries the parent index.
class ParentSlot {
public:
  enum class Kind : uint8_t { Unused, Root, Child };

  constexpr ParentSlot() = default;
  [[nodiscard]] static constexpr ParentSlot unused() { return ParentSlot{}; }
  [[nodiscard]] static constexpr ParentSlot root() { ParentSlot p; p.kind_ = Kind::Root; return p; }
  [[nodiscard]] static constexpr ParentSlot child_of(NodeIndex parent) {
    ParentSlot p; p.kind_ = Kind::Child; p.index_ = static_cast<uint16_t>(parent.get()); return p;
  }

  [[nodiscard]] constexpr Kind kind() const { return kind_; }
  [[nodiscard]] constexpr bool is_unused() const { return kind_ == Kind::Unused; }
  [[nodiscard]] constexpr bool is_root() const { return kind_ == Kind::Root; }
  // Parent index for Child, nothing otherwise.
  [[nodiscard]] constexpr OptionalIndex parent() const {
    if (kind_ != Kind::Child) return {};
    return NodeIndex(index_);
  }

  friend constexpr bool operator==(ParentSlot a, ParentSlot b) {
    return a.kind_ == b.kind_ && (a.kind_ != Kind::Child || a.index_ == b.index_);
  }

private:
  Kind kind_{Kind::Unused};
  uint8_t reserved_{0};
  uint16_t index_{0};
};

static_assert(sizeof(ParentSlot) == 4);

// Per-node counters shared between reporting threads and the render thread.
// Every field is atomic; the parent slot is the consistency witness.
struct NodeStorage {
  std::atomic<uint32_t> completed_count{0};
  // 0 means unknown.
  std::atomic<uint32_t> estimated_total_count{0};
  std::array<std::atomic<char>, kMaxNameLen> name{};
};

// Saturating conversion used by the counter setters.
[[nodiscard]] constexpr uint32_t lossy_count(size_t n) {
  return n > std::numeric_limits<uint32_t>::max() ? std::numeric_limits<uint32_t>::max()
                                                  : static_cast<uint32_t>(n);
}

} // namespace tally::model
