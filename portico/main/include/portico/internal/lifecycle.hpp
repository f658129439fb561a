#pragma once

#include <atomic>
#include <cstdint>

#include "portico/wakeup-fd.hpp"
#include "portico/timedef.hpp"

namespace portico::internal {

// Server lifecycle: Stopped -> Starting -> Running -> Stopping -> Stopped.
// The state and the shutdown requests may be read and written from any thread (stop() and beginShutdown() are
// thread safe), everything else is owned by the event loop thread.
struct Lifecycle {
  enum class State : uint8_t { Stopped, Starting, Running, Stopping };

  Lifecycle() = default;

  Lifecycle(const Lifecycle&) = delete;
  Lifecycle(Lifecycle&&) = delete;
  Lifecycle& operator=(const Lifecycle&) = delete;
  Lifecycle& operator=(Lifecycle&&) = delete;

  ~Lifecycle() = default;

  void reset() noexcept {
    state.store(State::Stopped, std::memory_order_relaxed);
    gracefulRequested.store(false, std::memory_order_relaxed);
    forceRequested.store(false, std::memory_order_relaxed);
    shutdownDeadline = {};
    shutdownDeadlineEnabled = false;
    forced = false;
  }

  void enterStarting() noexcept { state.store(State::Starting, std::memory_order_relaxed); }

  void enterRunning() noexcept { state.store(State::Running, std::memory_order_relaxed); }

  // Switches Running (or Starting) to Stopping. Returns false if the server was not in one of these states.
  bool enterStopping(SteadyTimePoint deadline, bool deadlineEnabled) noexcept {
    State expected = State::Running;
    if (!state.compare_exchange_strong(expected, State::Stopping, std::memory_order_relaxed)) {
      expected = State::Starting;
      if (!state.compare_exchange_strong(expected, State::Stopping, std::memory_order_relaxed)) {
        return false;
      }
    }
    shutdownDeadline = deadline;
    shutdownDeadlineEnabled = deadlineEnabled;
    return true;
  }

  // Thread safe shutdown requests, served by the event loop at its next iteration.
  void requestGracefulShutdown() noexcept {
    gracefulRequested.store(true, std::memory_order_relaxed);
    wakeupFd.wake();
  }

  void requestForcedShutdown() noexcept {
    forceRequested.store(true, std::memory_order_relaxed);
    wakeupFd.wake();
  }

  [[nodiscard]] bool isStopped() const noexcept { return state.load(std::memory_order_relaxed) == State::Stopped; }
  [[nodiscard]] bool isRunning() const noexcept { return state.load(std::memory_order_relaxed) == State::Running; }
  [[nodiscard]] bool isStopping() const noexcept { return state.load(std::memory_order_relaxed) == State::Stopping; }
  [[nodiscard]] bool isActive() const noexcept { return state.load(std::memory_order_relaxed) != State::Stopped; }

  [[nodiscard]] bool deadlineExpired(SteadyTimePoint now) const noexcept {
    return shutdownDeadlineEnabled && now >= shutdownDeadline;
  }

  SteadyTimePoint shutdownDeadline;
  // Interrupts the poll when a shutdown is requested from another thread or a signal handler.
  WakeupFd wakeupFd;
  std::atomic<State> state{State::Stopped};
  std::atomic<bool> gracefulRequested{false};
  std::atomic<bool> forceRequested{false};
  bool shutdownDeadlineEnabled{false};
  // Handlers have been cancelled and connections closed.
  bool forced{false};
};

}  // namespace portico::internal
