#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include "ui/Terminal.hpp"

namespace tally::app {

// Startup configuration for a Progress context.
struct Options {
  // Caller-owned scratch space for one frame; must outlive the context and
  // hold at least 200 bytes. Frames that do not fit are truncated.
  std::span<char> draw_buffer{};
  // Time between redraws.
  std::chrono::nanoseconds refresh_rate{std::chrono::milliseconds(60)};
  // Output stays hidden this long so short tasks do not flicker.
  std::chrono::nanoseconds initial_delay{std::chrono::milliseconds(500)};
  // Root denominator; 0 means unknown.
  size_t estimated_total_items{0};
  std::string_view root_name{};
  // Number of node slots, root included.
  size_t node_capacity{100};
  // Output fd. Unset means stderr when it is an ANSI-capable terminal.
  std::optional<int> terminal_fd{};
  // Fixed geometry; skips the ioctl query when set.
  std::optional<ui::TermSize> fixed_size{};
  // Force rendering off. Reporting still works.
  bool disable{false};
};

} // namespace tally::app
