#pragma once

#include <chrono>
#include <cstdint>

#include "portico/base-fd.hpp"

namespace portico {

// Monotonic timerfd ticking the server maintenance pass: timeout sweeps, date header refresh and shutdown
// deadline checks all run from its expirations, so the event loop never needs to compute a poll timeout.
class TimerFd {
 public:
  // Starts disarmed.
  TimerFd();

  // Fires every 'period', the first time one period from now. A zero period disarms.
  void armPeriodic(std::chrono::milliseconds period) const;

  void disarm() const { armPeriodic(std::chrono::milliseconds{0}); }

  // Consumes pending expirations and returns how many periods elapsed since the last call (0 if none).
  std::uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
};

}  // namespace portico
