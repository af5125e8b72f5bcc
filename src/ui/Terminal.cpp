#include "ui/Terminal.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace tally::ui {

static std::atomic<int> g_winch_fd{-1};
static struct sigaction g_prev_winch{};

bool tty_fd(int fd) {
  return ::isatty(fd) == 1;
}

bool ansi_capable(int fd) {
  if (!tty_fd(fd)) return false;
  const char* term = std::getenv("TERM");
  if (term && std::string_view(term) == "dumb") return false;
  return true;
}

std::optional<TermSize> query_size(int fd) {
  struct winsize ws{};
  if (ioctl(fd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0) return std::nullopt;
  return TermSize{ws.ws_row, ws.ws_col};
}

std::optional<TermSize> size_from_env() {
  auto read_dim = [](const char* name) -> int {
    const char* v = std::getenv(name);
    if (!v || !*v) return 0;
    int n = std::atoi(v);
    if (n < 0) return 0;
    return n > 0xFFFF ? 0xFFFF : n;
  };
  int cols = read_dim("COLUMNS");
  if (cols == 0) return std::nullopt;
  return TermSize{static_cast<uint16_t>(read_dim("LINES")), static_cast<uint16_t>(cols)};
}

bool write_all(int fd, const char* buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    buf += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

static void on_sigwinch(int) {
  // Async-signal-safe: an atomic load and a write(2).
  int saved = errno;
  int fd = g_winch_fd.load();
  if (fd >= 0) {
    uint64_t one = 1;
    if (::write(fd, &one, sizeof(one)) < 0) { /* counter full; already signalled */ }
  }
  errno = saved;
}

WinchHook install_winch_handler(int event_fd) {
  int expected = -1;
  if (!g_winch_fd.compare_exchange_strong(expected, event_fd)) return WinchHook::Busy;
  struct sigaction act{};
  act.sa_handler = on_sigwinch;
  sigemptyset(&act.sa_mask);
  act.sa_flags = SA_RESTART;
  if (::sigaction(SIGWINCH, &act, &g_prev_winch) != 0) {
    std::fprintf(stderr, "tally: terminal: sigaction(SIGWINCH) failed: %s\n", std::strerror(errno));
    g_winch_fd.store(-1);
    return WinchHook::Failed;
  }
  return WinchHook::Installed;
}

void remove_winch_handler(int event_fd) {
  if (event_fd < 0 || g_winch_fd.load() != event_fd) return;
  if (::sigaction(SIGWINCH, &g_prev_winch, nullptr) != 0) {
    std::fprintf(stderr, "tally: terminal: restoring SIGWINCH failed: %s\n", std::strerror(errno));
  }
  g_winch_fd.store(-1);
}

} // namespace tally::ui
