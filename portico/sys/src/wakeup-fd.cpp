#include "portico/wakeup-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "portico/errno-throw.hpp"
#include "portico/log.hpp"

namespace portico {

WakeupFd::WakeupFd() : _fd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_fd) {
    throw_errno("eventfd");
  }
}

void WakeupFd::wake() const noexcept {
  // EAGAIN means the counter is saturated, the loop is already due to wake up.
  // No logging here, this runs in signal handlers.
  [[maybe_unused]] const int ret = ::eventfd_write(fd(), 1);
}

std::uint64_t WakeupFd::consume() const noexcept {
  eventfd_t wakeups = 0;
  if (::eventfd_read(fd(), &wakeups) == 0) {
    return wakeups;
  }
  if (errno != EAGAIN) {
    log::error("Unable to read wakeup fd # {}: {}", fd(), std::strerror(errno));
  }
  return 0;
}

}  // namespace portico
