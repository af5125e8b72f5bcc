#pragma once

#include <chrono>

namespace tally::app {

// Settable, resettable, timed-waitable event backed by an eventfd.
// set() is async-signal-safe so the SIGWINCH handler can use the same fd.
class RedrawEvent {
public:
  RedrawEvent();
  ~RedrawEvent();
  RedrawEvent(const RedrawEvent&) = delete;
  RedrawEvent& operator=(const RedrawEvent&) = delete;

  [[nodiscard]] bool valid() const { return fd_ >= 0; }
  [[nodiscard]] int fd() const { return fd_; }

  void set();
  void reset();
  // True when the event was set (or the wait was interrupted by a signal)
  // before the timeout expired. Does not reset.
  [[nodiscard]] bool timed_wait(std::chrono::nanoseconds timeout);

private:
  int fd_{-1};
};

} // namespace tally::app
