#pragma once

#include <cstdint>

#include "portico/base-fd.hpp"

namespace portico {

// Lets any thread (or a signal handler) interrupt the event loop poll.
// Wakeups coalesce: several wake() calls before a consume() produce a single readable event.
class WakeupFd {
 public:
  WakeupFd();

  // Async-signal-safe.
  void wake() const noexcept;

  // Returns the number of wake() calls since the previous consume().
  std::uint64_t consume() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
};

}  // namespace portico
