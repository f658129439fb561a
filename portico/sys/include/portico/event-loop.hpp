#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "portico/base-fd.hpp"

namespace portico {

// Interest / readiness bitmap of a registered fd.
using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = EPOLLIN;
inline constexpr EventBmp EventOut = EPOLLOUT;
inline constexpr EventBmp EventErr = EPOLLERR;
inline constexpr EventBmp EventHup = EPOLLHUP;
inline constexpr EventBmp EventRdHup = EPOLLRDHUP;

// Level triggered epoll instance of the server thread.
// Registration failures are returned and logged, the caller decides whether the fd or the whole server is dropped.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  EventLoop() noexcept = default;

  explicit EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Throws std::system_error.
  void addOrThrow(EventFd event) const;

  [[nodiscard]] bool add(EventFd event) const;

  [[nodiscard]] bool mod(EventFd event) const;

  // Unregistering an fd that is about to be closed never fails in a way the caller can act on.
  void del(int fd) const;

  // Waits at most the poll timeout. The returned events stay valid until the next call.
  // An interrupted wait returns no events, std::nullopt means epoll itself is broken (logged).
  // The buffer doubles whenever a poll fills it.
  [[nodiscard]] std::optional<std::span<const EventFd>> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  [[nodiscard]] int pollTimeoutMs() const noexcept { return _pollTimeoutMs; }

  void updatePollTimeout(std::chrono::milliseconds pollTimeout);

 private:
  BaseFd _epollFd;
  int _pollTimeoutMs{0};
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _ready;
};

}  // namespace portico
