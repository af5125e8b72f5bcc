#pragma once

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>
#include "app/Node.hpp"
#include "app/NodeArena.hpp"
#include "app/Options.hpp"
#include "app/RedrawEvent.hpp"
#include "model/FrameSnapshot.hpp"
#include "ui/FrameRenderer.hpp"
#include "ui/Terminal.hpp"

namespace tally::app {

// Progress context: the node arena plus the render thread that draws it.
//
// Reporting threads touch only the arena, through Node handles. The render
// thread waits on the redraw event (timer, SIGWINCH, shutdown), snapshots the
// arena, draws it into the caller's buffer and writes it in one call. Any
// terminal failure turns rendering off for good; reporting keeps working.
class Progress {
public:
  explicit Progress(Options options);
  // Ends the root if the caller has not.
  ~Progress();
  Progress(const Progress&) = delete;
  Progress& operator=(const Progress&) = delete;

  // Installs the root node and starts rendering. Call once per context.
  [[nodiscard]] Node start();

  // Whether frames are still being written.
  [[nodiscard]] bool rendering() const { return terminal_fd_.load(std::memory_order_acquire) >= 0; }
  [[nodiscard]] bool done() const { return done_.load(std::memory_order_acquire); }
  [[nodiscard]] const NodeArena& arena() const { return arena_; }

private:
  friend class Node;

  void end_root();
  void run(std::stop_token st);
  // Waits for the redraw event; true when geometry should be refreshed.
  [[nodiscard]] bool wait(std::chrono::nanoseconds timeout);
  void maybe_update_size(bool resize);
  void write_out(size_t len);
  void disable_terminal(const char* why);
  [[nodiscard]] int choose_terminal() const;

  Options options_;
  NodeArena arena_;
  model::FrameSnapshot snapshot_;
  ui::FrameRenderer renderer_;
  RedrawEvent redraw_;
  std::atomic<bool> done_{false};
  std::atomic<int> terminal_fd_{-1};
  ui::TermSize size_{};
  bool started_{false};
  bool owns_winch_{false};
  std::jthread thread_{};
};

} // namespace tally::app
