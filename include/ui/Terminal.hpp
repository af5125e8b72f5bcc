#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace tally::ui {

struct TermSize {
  uint16_t rows{0};
  uint16_t cols{0};
};

// Terminal capability detection
[[nodiscard]] bool tty_fd(int fd);
// True when fd is a terminal that understands ANSI escapes (not TERM=dumb).
[[nodiscard]] bool ansi_capable(int fd);

// Geometry. Each source returns nothing when it has no usable column count.
[[nodiscard]] std::optional<TermSize> query_size(int fd);
[[nodiscard]] std::optional<TermSize> size_from_env();

// Writes the whole buffer, retrying short writes and EINTR.
[[nodiscard]] bool write_all(int fd, const char* buf, size_t len);

// SIGWINCH routing. One event fd per process receives resize wakeups; the
// handler only writes to it.
enum class WinchHook { Installed, Busy, Failed };
[[nodiscard]] WinchHook install_winch_handler(int event_fd);
// Restores the previous disposition if event_fd owns the handler.
void remove_winch_handler(int event_fd);

} // namespace tally::ui
