#include "portico/timer-fd.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>

#include "portico/errno-throw.hpp"
#include "portico/log.hpp"

namespace portico {

TimerFd::TimerFd() : _fd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {
  if (!_fd) {
    throw_errno("timerfd_create");
  }
}

void TimerFd::armPeriodic(std::chrono::milliseconds period) const {
  const auto ms = period.count() > 0 ? period.count() : 0;
  const timespec every{static_cast<time_t>(ms / 1000), static_cast<long>((ms % 1000) * 1000000L)};
  const itimerspec spec{every, every};
  if (::timerfd_settime(fd(), 0, &spec, nullptr) != 0) {
    throw_errno("timerfd_settime on fd # {}", fd());
  }
  log::debug("Maintenance timer fd # {} period set to {} ms", fd(), ms);
}

std::uint64_t TimerFd::drain() const noexcept {
  // A timerfd read returns the accumulated count at once, a second read would only hit EAGAIN.
  std::uint64_t expirations = 0;
  if (::read(fd(), &expirations, sizeof(expirations)) == static_cast<ssize_t>(sizeof(expirations))) {
    return expirations;
  }
  if (errno != EAGAIN) {
    log::error("Unable to read maintenance timer fd # {}: {}", fd(), std::strerror(errno));
  }
  return 0;
}

}  // namespace portico
