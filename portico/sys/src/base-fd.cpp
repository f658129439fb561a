#include "portico/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "portico/log.hpp"

namespace portico {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::close() noexcept {
  const int fd = release();
  if (fd == kClosedFd) {
    return;
  }
  // Linux releases the descriptor even when close reports EINTR: it must never be closed twice.
  if (::close(fd) != 0 && errno != EINTR) {
    log::error("Unable to close fd # {}: {}", fd, std::strerror(errno));
    return;
  }
  log::trace("fd # {} closed", fd);
}

}  // namespace portico
