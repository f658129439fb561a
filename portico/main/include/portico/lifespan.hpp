#pragma once

#include <coroutine>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "portico/request-task.hpp"
#include "portico/server-config.hpp"
#include "portico/state-bag.hpp"

namespace portico {

// Event delivered to the lifespan handler by co_await receive().
struct LifespanEvent {
  enum class Type : uint8_t { Startup, Shutdown };

  Type type{Type::Startup};
};

// Completion report emitted by the lifespan handler through co_await send(message).
struct LifespanMessage {
  enum class Type : uint8_t { StartupComplete, StartupFailed, ShutdownComplete, ShutdownFailed };

  static LifespanMessage StartupComplete() { return {Type::StartupComplete, {}}; }
  static LifespanMessage StartupFailed(std::string_view message = {}) {
    return {Type::StartupFailed, std::string(message)};
  }
  static LifespanMessage ShutdownComplete() { return {Type::ShutdownComplete, {}}; }
  static LifespanMessage ShutdownFailed(std::string_view message = {}) {
    return {Type::ShutdownFailed, std::string(message)};
  }

  Type type{Type::StartupComplete};
  std::string message;
};

namespace internal {

struct LifespanChannel {
  std::optional<LifespanEvent> inbox;
  std::vector<LifespanMessage> outbox;
  std::coroutine_handle<> waiter;
  bool sentAny{false};
};

}  // namespace internal

class LifespanReceive {
 public:
  class Awaiter {
   public:
    explicit Awaiter(internal::LifespanChannel& channel) noexcept : _channel(channel) {}

    [[nodiscard]] bool await_ready() const noexcept { return _channel.inbox.has_value(); }
    void await_suspend(std::coroutine_handle<> handle) noexcept { _channel.waiter = handle; }
    LifespanEvent await_resume() noexcept {
      // Resumed without an event only when the server is torn down: report it as a shutdown.
      LifespanEvent event = _channel.inbox.value_or(LifespanEvent{LifespanEvent::Type::Shutdown});
      _channel.inbox.reset();
      return event;
    }

   private:
    internal::LifespanChannel& _channel;
  };

  explicit LifespanReceive(std::shared_ptr<internal::LifespanChannel> channel) noexcept
      : _channel(std::move(channel)) {}

  [[nodiscard]] Awaiter operator()() const noexcept { return Awaiter{*_channel}; }

 private:
  std::shared_ptr<internal::LifespanChannel> _channel;
};

class LifespanSend {
 public:
  class Awaiter {
   public:
    Awaiter(internal::LifespanChannel& channel, LifespanMessage message) noexcept
        : _channel(channel), _message(std::move(message)) {}

    [[nodiscard]] bool await_ready() const noexcept { return true; }
    void await_suspend(std::coroutine_handle<>) const noexcept {}
    void await_resume() {
      _channel.sentAny = true;
      _channel.outbox.push_back(std::move(_message));
    }

   private:
    internal::LifespanChannel& _channel;
    LifespanMessage _message;
  };

  explicit LifespanSend(std::shared_ptr<internal::LifespanChannel> channel) noexcept : _channel(std::move(channel)) {}

  [[nodiscard]] Awaiter operator()(LifespanMessage message) const noexcept { return {*_channel, std::move(message)}; }

 private:
  std::shared_ptr<internal::LifespanChannel> _channel;
};

// Application callable driving startup and shutdown. Values stored in the state bag during startup are copied into
// the state of every connection.
using LifespanHandler = std::function<RequestTask<void>(LifespanReceive, LifespanSend, StateBag&)>;

namespace internal {

// Runs the lifespan handler around the serving phase of a server.
class LifespanRunner {
 public:
  LifespanRunner(LifespanHandler handler, LifespanMode mode, StateBag& state);

  // Delivers the startup event and waits for the handler to report. Throws LifespanFailure if startup failed.
  void startup();

  // Delivers the shutdown event and waits for the handler to report. Failures are only logged.
  void shutdown() noexcept;

  [[nodiscard]] bool enabled() const noexcept { return _enabled; }

 private:
  // Returns normally only if the failure means the handler does not support lifespan events (Auto mode).
  void failStartup(std::string_view reason);

  void deliver(LifespanEvent event);

  LifespanHandler _handler;
  StateBag& _state;
  std::shared_ptr<LifespanChannel> _channel;
  RequestTask<void> _task;
  LifespanMode _mode;
  bool _enabled;
  bool _started{false};
};

}  // namespace internal

}  // namespace portico
