#include "minitest.hpp"
#include "app/NodeArena.hpp"
#include <random>
#include <string>
#include <vector>

using tally::app::NodeArena;
using tally::model::NodeIndex;
using tally::model::OptionalIndex;

static std::string slot_name(const NodeArena& arena, NodeIndex i) {
  std::string s;
  for (const auto& c : arena.storage(i).name) {
    char ch = c.load();
    if (ch == '\0') break;
    s.push_back(ch);
  }
  return s;
}

static size_t live_slots(const NodeArena& arena) {
  size_t n = 0;
  for (size_t i = 0; i < arena.capacity(); ++i)
    if (!arena.parent(NodeIndex(i)).is_unused()) ++n;
  return n;
}

// Walks parent links up to the root; false on a cycle or a dangling link.
static bool reaches_root(const NodeArena& arena, NodeIndex start) {
  NodeIndex cur = start;
  for (size_t steps = 0; steps <= arena.capacity(); ++steps) {
    auto p = arena.parent(cur);
    if (p.is_root()) return true;
    if (p.is_unused() || !p.parent().has_value()) return false;
    cur = p.parent().value();
  }
  return false;
}

TEST(arena_root_is_slot_zero) {
  NodeArena arena(8);
  arena.reset_with_root("build", 2);
  ASSERT_TRUE(arena.parent(NodeIndex(0)).is_root());
  ASSERT_EQ(arena.end_index(), 1u);
  ASSERT_EQ(slot_name(arena, NodeIndex(0)), "build");
  ASSERT_EQ(arena.storage(NodeIndex(0)).estimated_total_count.load(), 2u);
}

TEST(arena_allocate_publishes_child) {
  NodeArena arena(8);
  arena.reset_with_root("", 0);
  auto idx = arena.allocate(NodeIndex(0), "compile", 10);
  ASSERT_TRUE(idx.has_value());
  ASSERT_EQ(idx.value().get(), 1u);
  auto p = arena.parent(idx.value());
  ASSERT_TRUE(p.kind() == tally::model::ParentSlot::Kind::Child);
  ASSERT_EQ(p.parent().value().get(), 0u);
  ASSERT_EQ(slot_name(arena, idx.value()), "compile");
  ASSERT_EQ(arena.storage(idx.value()).estimated_total_count.load(), 10u);
  ASSERT_EQ(arena.storage(idx.value()).completed_count.load(), 0u);
}

TEST(arena_truncates_long_names) {
  NodeArena arena(4);
  arena.reset_with_root("", 0);
  std::string long_name(100, 'x');
  auto idx = arena.allocate(NodeIndex(0), long_name, 0);
  ASSERT_EQ(slot_name(arena, idx.value()).size(), tally::model::kMaxNameLen);
}

TEST(arena_exhaustion_returns_disabled_index) {
  const size_t capacity = 8;
  NodeArena arena(capacity);
  arena.reset_with_root("root", 0);
  for (size_t i = 1; i < capacity; ++i)
    ASSERT_TRUE(arena.allocate(NodeIndex(0), "n", 0).has_value());
  ASSERT_EQ(arena.end_index(), capacity);

  auto extra = arena.allocate(NodeIndex(0), "overflow", 0);
  ASSERT_FALSE(extra.has_value());
  // The failed attempt rolls the high-water mark back and touches nothing.
  ASSERT_EQ(arena.end_index(), capacity);
  ASSERT_TRUE(arena.freelist_empty());
  ASSERT_EQ(live_slots(arena), capacity);
}

TEST(arena_release_credits_parent_and_recycles) {
  NodeArena arena(8);
  arena.reset_with_root("", 0);
  auto a = arena.allocate(NodeIndex(0), "a", 5);
  auto b = arena.allocate(NodeIndex(0), "b", 0);
  arena.complete_one(a.value());
  arena.set_completed(a.value(), 4);

  arena.release(a.value());
  ASSERT_TRUE(arena.parent(a.value()).is_unused());
  ASSERT_EQ(arena.storage(NodeIndex(0)).completed_count.load(), 1u);
  ASSERT_FALSE(arena.freelist_empty());

  // The freed slot comes back first and shows only the new node's data.
  auto c = arena.allocate(b.value(), "c", 3);
  ASSERT_EQ(c.value().get(), a.value().get());
  ASSERT_EQ(slot_name(arena, c.value()), "c");
  ASSERT_EQ(arena.storage(c.value()).completed_count.load(), 0u);
  ASSERT_EQ(arena.storage(c.value()).estimated_total_count.load(), 3u);
  ASSERT_EQ(arena.parent(c.value()).parent().value().get(), b.value().get());
  ASSERT_TRUE(arena.freelist_empty());
  ASSERT_EQ(arena.end_index(), 3u);
}

TEST(arena_counters_saturate) {
  NodeArena arena(2);
  arena.reset_with_root("", 0);
  arena.set_completed(NodeIndex(0), size_t{1} << 40);
  arena.set_estimated_total(NodeIndex(0), size_t{1} << 33);
  ASSERT_EQ(arena.storage(NodeIndex(0)).completed_count.load(), 0xFFFFFFFFu);
  ASSERT_EQ(arena.storage(NodeIndex(0)).estimated_total_count.load(), 0xFFFFFFFFu);
}

TEST(arena_random_churn_keeps_tree_shape) {
  const size_t capacity = 32;
  NodeArena arena(capacity);
  arena.reset_with_root("root", 0);
  std::mt19937 rng(1234);
  std::vector<NodeIndex> live;  // non-root nodes, leaves are released first

  for (int step = 0; step < 5000; ++step) {
    bool grow = live.empty() || (rng() % 3 != 0);
    if (grow) {
      NodeIndex parent = live.empty() || rng() % 4 == 0 ? NodeIndex(0) : live[rng() % live.size()];
      auto idx = arena.allocate(parent, "n", 0);
      if (idx.has_value()) live.push_back(idx.value());
      else ASSERT_EQ(live.size() + 1, capacity);
    } else {
      // Release a node with no live children.
      for (size_t k = live.size(); k-- > 0;) {
        bool has_child = false;
        for (auto other : live) {
          auto p = arena.parent(other).parent();
          if (p.has_value() && p.value() == live[k]) { has_child = true; break; }
        }
        if (!has_child) {
          arena.release(live[k]);
          live.erase(live.begin() + static_cast<long>(k));
          break;
        }
      }
    }
    ASSERT_TRUE(live_slots(arena) <= capacity);
    ASSERT_EQ(live_slots(arena), live.size() + 1);
  }
  for (auto n : live) ASSERT_TRUE(reaches_root(arena, n));
}
