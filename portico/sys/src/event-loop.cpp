#include "portico/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstddef>
#include <cstring>
#include <iterator>
#include <optional>
#include <span>

#include "portico/errno-throw.hpp"
#include "portico/log.hpp"

namespace portico {

namespace {

int ToTimeoutMs(std::chrono::milliseconds timeout) {
  return static_cast<int>(std::clamp<std::chrono::milliseconds::rep>(timeout.count(), 0, INT_MAX));
}

int Ctl(int epollFd, int op, EventLoop::EventFd event) {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  return ::epoll_ctl(epollFd, op, event.fd, &ev);
}

}  // namespace

EventLoop::EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity)
    : _epollFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pollTimeoutMs(ToTimeoutMs(pollTimeout)),
      _epollEvents(std::max(initialCapacity, 1U)) {
  if (!_epollFd) {
    throw_errno("epoll_create1");
  }
  _ready.reserve(_epollEvents.size());
}

void EventLoop::addOrThrow(EventFd event) const {
  if (Ctl(_epollFd.fd(), EPOLL_CTL_ADD, event) != 0) {
    throw_errno("epoll_ctl ADD fd # {}", event.fd);
  }
}

bool EventLoop::add(EventFd event) const {
  if (Ctl(_epollFd.fd(), EPOLL_CTL_ADD, event) == 0) {
    return true;
  }
  log::error("Unable to watch fd # {} (events 0x{:x}): {}", event.fd, event.eventBmp, std::strerror(errno));
  return false;
}

bool EventLoop::mod(EventFd event) const {
  if (Ctl(_epollFd.fd(), EPOLL_CTL_MOD, event) == 0) {
    return true;
  }
  const int err = errno;
  // the fd is already being torn down
  if (err == EBADF || err == ENOENT) {
    log::debug("Interest change ignored for fd # {}: {}", event.fd, std::strerror(err));
  } else {
    log::error("Unable to change interest of fd # {} to 0x{:x}: {}", event.fd, event.eventBmp, std::strerror(err));
  }
  return false;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_epollFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    log::debug("Unable to unwatch fd # {}: {}", fd, std::strerror(errno));
  }
}

std::optional<std::span<const EventLoop::EventFd>> EventLoop::poll() {
  _ready.clear();
  const int nbReady =
      ::epoll_wait(_epollFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);
  if (nbReady < 0) {
    if (errno == EINTR) {
      return std::span<const EventFd>{};
    }
    log::critical("epoll_wait on fd # {} failed: {}", _epollFd.fd(), std::strerror(errno));
    return std::nullopt;
  }

  std::transform(_epollEvents.begin(), _epollEvents.begin() + nbReady, std::back_inserter(_ready),
                 [](const epoll_event& ev) { return EventFd{ev.data.fd, ev.events}; });

  if (static_cast<std::size_t>(nbReady) == _epollEvents.size()) {
    // more fds may be ready than reported, make room for all of them next time
    _epollEvents.resize(_epollEvents.size() * 2U);
    log::debug("Event buffer grown to {} entries", _epollEvents.size());
  }
  return std::span<const EventFd>(_ready);
}

void EventLoop::updatePollTimeout(std::chrono::milliseconds pollTimeout) { _pollTimeoutMs = ToTimeoutMs(pollTimeout); }

}  // namespace portico
