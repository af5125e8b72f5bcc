#include "minitest.hpp"
#include "app/Progress.hpp"
#include "app/SnapshotReader.hpp"
#include "ui/TreeBuilder.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using tally::app::Node;
using tally::app::Options;
using tally::app::Progress;
using tally::model::FrameSnapshot;
using tally::model::NodeIndex;

static Options quiet(size_t capacity) {
  Options o;
  o.disable = true;
  o.node_capacity = capacity;
  return o;
}

TEST(stress_concurrent_complete_one) {
  Progress progress(quiet(4));
  Node root = progress.start();
  Node shared = root.start("shared", 100);
  std::vector<std::thread> threads;
  for (int i = 0; i < 100; ++i) threads.emplace_back([shared]{ shared.complete_one(); });
  for (auto& t : threads) t.join();
  ASSERT_EQ(progress.arena().storage(shared.index().value()).completed_count.load(), 100u);
  root.end();
}

// Counts nodes reachable from the root through the rebuilt links; -1 on a
// cycle.
static long reachable(const FrameSnapshot& s) {
  long seen = 0;
  std::vector<size_t> stack{0};
  while (!stack.empty()) {
    size_t n = stack.back();
    stack.pop_back();
    if (++seen > static_cast<long>(s.len)) return -1;
    for (auto c = s.links[n].first_child; c.has_value(); c = s.links[c.value().get()].next_sibling)
      stack.push_back(c.value().get());
  }
  return seen;
}

TEST(stress_churn_while_snapshotting) {
  constexpr int kWorkers = 8;
  constexpr int kGenerations = 2000;
  Progress progress(quiet(64));
  Node root = progress.start();
  // Worker nodes take slots 1..kWorkers before any churn and outlive the
  // reader, so a grandchild's parent slot never changes meaning mid-run.
  std::vector<Node> mine;
  for (int w = 0; w < kWorkers; ++w) mine.push_back(root.start("w" + std::to_string(w), kGenerations));

  std::atomic<bool> stop{false};
  std::atomic<int> bad_frames{0};
  std::atomic<int> frames{0};
  std::thread reader([&]{
    FrameSnapshot snap(progress.arena().capacity());
    while (!stop.load()) {
      tally::app::capture_snapshot(progress.arena(), snap);
      tally::ui::build_tree_links(snap);
      ++frames;
      if (snap.len == 0 || !snap.nodes[0].parent.is_root()) { ++bad_frames; continue; }
      for (size_t i = 1; i < snap.len; ++i) {
        auto p = snap.nodes[i].parent;
        if (p.is_root()) { ++bad_frames; break; }
        if (p.is_unused()) continue;  // orphan, not drawn
        if (p.parent().value().get() >= snap.len) { ++bad_frames; break; }
        // Grandchildren only ever hang off worker nodes, which live for the
        // whole run.
        auto name = snap.nodes[i].name_view();
        auto pname = snap.nodes[p.parent().value().get()].name_view();
        if (name.find('.') != std::string_view::npos &&
            (pname.empty() || pname[0] != 'w' || pname.find('.') != std::string_view::npos)) {
          ++bad_frames; break;
        }
      }
      if (reachable(snap) < 0) ++bad_frames;
    }
  });

  std::vector<uint32_t> worker_totals(kWorkers, 0);
  std::vector<std::thread> workers;
  for (int w = 0; w < kWorkers; ++w) {
    workers.emplace_back([&, w]{
      const Node me = mine[static_cast<size_t>(w)];
      std::vector<Node> open;
      for (int g = 0; g < kGenerations; ++g) {
        open.push_back(me.start("w" + std::to_string(w) + "." + std::to_string(g), 1));
        open.back().complete_one();
        if (open.size() == 3) {
          for (auto& n : open) n.end();
          open.clear();
        }
      }
      for (auto& n : open) n.end();
      worker_totals[static_cast<size_t>(w)] =
          progress.arena().storage(me.index().value()).completed_count.load();
    });
  }
  for (auto& t : workers) t.join();
  stop.store(true);
  reader.join();
  for (auto& n : mine) n.end();

  ASSERT_EQ(bad_frames.load(), 0);
  ASSERT_TRUE(frames.load() > 0);
  for (auto total : worker_totals) ASSERT_EQ(total, static_cast<uint32_t>(kGenerations));
  ASSERT_EQ(progress.arena().storage(NodeIndex(0)).completed_count.load(), static_cast<uint32_t>(kWorkers));

  FrameSnapshot last(progress.arena().capacity());
  tally::app::capture_snapshot(progress.arena(), last);
  ASSERT_EQ(last.len, 1u);
  root.end();
}
