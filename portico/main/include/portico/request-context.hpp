#pragma once

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace portico {

namespace internal {
struct HandlerUnit;
}  // namespace internal

// Execution context of a single request handler.
// Every handler starts with a fresh copy of the server context defaults and nothing else: values set by a handler
// are never visible to another one, even on the same connection.
class RequestContext {
 public:
  using Values = std::map<std::string, std::string, std::less<>>;

  RequestContext() noexcept = default;

  explicit RequestContext(Values defaults, internal::HandlerUnit* unit = nullptr)
      : _values(std::move(defaults)), _unit(unit) {}

  void set(std::string_view key, std::string_view value);

  // nullptr if absent
  [[nodiscard]] const std::string* find(std::string_view key) const noexcept;

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return _values.contains(key); }

  bool erase(std::string_view key);

  [[nodiscard]] std::size_t size() const noexcept { return _values.size(); }

  [[nodiscard]] const Values& values() const noexcept { return _values; }

  class SleepAwaiter {
   public:
    SleepAwaiter(internal::HandlerUnit* unit, std::chrono::milliseconds duration) noexcept
        : _unit(unit), _duration(duration) {}

    [[nodiscard]] bool await_ready() const noexcept;
    void await_suspend(std::coroutine_handle<> handle);
    void await_resume() const;

   private:
    internal::HandlerUnit* _unit;
    std::chrono::milliseconds _duration;
  };

  class YieldAwaiter {
   public:
    explicit YieldAwaiter(internal::HandlerUnit* unit) noexcept : _unit(unit) {}

    [[nodiscard]] bool await_ready() const noexcept;
    void await_suspend(std::coroutine_handle<> handle);
    void await_resume() const;

   private:
    internal::HandlerUnit* _unit;
  };

  // Suspends the handler for at least 'duration' without blocking the event loop.
  [[nodiscard]] SleepAwaiter sleepFor(std::chrono::milliseconds duration) const noexcept { return {_unit, duration}; }

  // Lets the other ready handlers and the event loop run before resuming.
  [[nodiscard]] YieldAwaiter yield() const noexcept { return YieldAwaiter{_unit}; }

 private:
  Values _values;
  internal::HandlerUnit* _unit{nullptr};
};

}  // namespace portico
