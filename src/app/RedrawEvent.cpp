#include "app/RedrawEvent.hpp"
#include <sys/eventfd.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace tally::app {

RedrawEvent::RedrawEvent() {
  fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (fd_ < 0) {
    std::fprintf(stderr, "tally: redraw event: eventfd() failed: %s\n", std::strerror(errno));
  }
}

RedrawEvent::~RedrawEvent() {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

void RedrawEvent::set() {
  if (fd_ < 0) return;
  uint64_t one = 1;
  // EAGAIN means the counter is saturated, which still reads as set.
  if (::write(fd_, &one, sizeof(one)) < 0) { /* already set */ }
}

void RedrawEvent::reset() {
  if (fd_ < 0) return;
  uint64_t val = 0;
  while (::read(fd_, &val, sizeof(val)) < 0 && errno == EINTR) {}
}

bool RedrawEvent::timed_wait(std::chrono::nanoseconds timeout) {
  if (fd_ < 0) return false;
  // Round up so a short positive timeout never becomes a busy poll.
  auto ms = std::chrono::ceil<std::chrono::milliseconds>(timeout).count();
  if (ms < 0) ms = 0;
  if (ms > INT_MAX) ms = INT_MAX;
  struct pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
  int rv = ::poll(&pfd, 1, static_cast<int>(ms));
  if (rv < 0) return errno == EINTR;
  return rv > 0 && (pfd.revents & POLLIN);
}

} // namespace tally::app
