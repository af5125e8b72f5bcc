#include "app/Progress.hpp"
#include "app/SnapshotReader.hpp"
#include "ui/TreeBuilder.hpp"
#include <unistd.h>
#include <cassert>
#include <cstdio>
#include <system_error>

namespace tally::app {

Progress::Progress(Options options)
    : options_(options),
      arena_(options.node_capacity),
      snapshot_(arena_.capacity()),
      renderer_(arena_.capacity()) {}

Progress::~Progress() {
  if (started_) end_root();
}

int Progress::choose_terminal() const {
  if (options_.disable) return -1;
  if (options_.terminal_fd) return *options_.terminal_fd;
  return ui::ansi_capable(STDERR_FILENO) ? STDERR_FILENO : -1;
}

Node Progress::start() {
  // One start per context.
  assert(!started_);
  if (started_) return {};
  started_ = true;

  arena_.reset_with_root(options_.root_name, options_.estimated_total_items);
  done_.store(false, std::memory_order_seq_cst);
  const Node root(this, model::NodeIndex(0));

  int fd = choose_terminal();
  if (fd < 0) return root;

  if (options_.draw_buffer.size() < ui::kMinDrawBuffer) {
    std::fprintf(stderr, "tally: progress: draw buffer holds %zu bytes, need %zu; rendering disabled\n",
                 options_.draw_buffer.size(), ui::kMinDrawBuffer);
    return root;
  }
  if (!redraw_.valid()) return root;

  switch (ui::install_winch_handler(redraw_.fd())) {
    case ui::WinchHook::Installed: owns_winch_ = true; break;
    // Another context gets resize signals; this one still sizes itself once.
    case ui::WinchHook::Busy: break;
    case ui::WinchHook::Failed: return root;
  }

  terminal_fd_.store(fd, std::memory_order_release);
  try {
    thread_ = std::jthread([this](std::stop_token st){ run(st); });
  } catch (const std::system_error& e) {
    std::fprintf(stderr, "tally: progress: cannot start render thread: %s\n", e.what());
    terminal_fd_.store(-1, std::memory_order_release);
  }
  return root;
}

void Progress::end_root() {
  if (done_.exchange(true, std::memory_order_seq_cst)) return;
  redraw_.set();
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  if (owns_winch_) {
    ui::remove_winch_handler(redraw_.fd());
    owns_winch_ = false;
  }
}

bool Progress::wait(std::chrono::nanoseconds timeout) {
  const bool signalled = redraw_.timed_wait(timeout);
  redraw_.reset();
  return signalled || size_.cols == 0;
}

void Progress::maybe_update_size(bool resize) {
  if (!resize) return;
  if (options_.fixed_size) { size_ = *options_.fixed_size; return; }
  const int fd = terminal_fd_.load(std::memory_order_relaxed);
  if (fd < 0) return;
  if (auto s = ui::query_size(fd)) { size_ = *s; return; }
  if (auto s = ui::size_from_env()) { size_ = *s; return; }
  disable_terminal("terminal size unavailable");
}

void Progress::write_out(size_t len) {
  const int fd = terminal_fd_.load(std::memory_order_relaxed);
  if (fd < 0 || len == 0) return;
  if (!ui::write_all(fd, options_.draw_buffer.data(), len)) disable_terminal("write failed");
}

void Progress::disable_terminal(const char* why) {
  terminal_fd_.store(-1, std::memory_order_release);
  std::fprintf(stderr, "tally: progress: %s; rendering disabled\n", why);
}

void Progress::run(std::stop_token st) {
  auto timeout = options_.initial_delay;
  for (;;) {
    const bool resize = wait(timeout);
    timeout = options_.refresh_rate;

    if (done_.load(std::memory_order_seq_cst) || st.stop_requested()) {
      write_out(renderer_.compose_clear(options_.draw_buffer));
      return;
    }

    maybe_update_size(resize);
    if (!rendering()) return;

    capture_snapshot(arena_, snapshot_);
    ui::build_tree_links(snapshot_);
    write_out(renderer_.compose(snapshot_, options_.draw_buffer, size_));
    if (!rendering()) return;
  }
}

} // namespace tally::app
