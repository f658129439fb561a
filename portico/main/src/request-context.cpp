#include "portico/request-context.hpp"

#include <chrono>
#include <coroutine>
#include <string>
#include <string_view>

#include "portico/errors.hpp"
#include "portico/internal/handler-supervisor.hpp"
#include "portico/internal/handler-unit.hpp"
#include "portico/timedef.hpp"

namespace portico {

void RequestContext::set(std::string_view key, std::string_view value) {
  _values.insert_or_assign(std::string(key), std::string(value));
}

const std::string* RequestContext::find(std::string_view key) const noexcept {
  auto it = _values.find(key);
  return it == _values.end() ? nullptr : &it->second;
}

bool RequestContext::erase(std::string_view key) {
  auto it = _values.find(key);
  if (it == _values.end()) {
    return false;
  }
  _values.erase(it);
  return true;
}

// A context not bound to a running unit (built by the application itself) cannot suspend: its awaitables complete
// immediately.

bool RequestContext::SleepAwaiter::await_ready() const noexcept {
  return _unit == nullptr || _unit->cancelled || _duration.count() <= 0;
}

void RequestContext::SleepAwaiter::await_suspend(std::coroutine_handle<> handle) {
  _unit->supervisor->sleepUntil(*_unit, handle, SteadyClock::now() + _duration);
}

void RequestContext::SleepAwaiter::await_resume() const {
  if (_unit != nullptr && _unit->cancelled) {
    throw RequestCancelled();
  }
}

bool RequestContext::YieldAwaiter::await_ready() const noexcept { return _unit == nullptr || _unit->cancelled; }

void RequestContext::YieldAwaiter::await_suspend(std::coroutine_handle<> handle) {
  _unit->supervisor->yield(*_unit, handle);
}

void RequestContext::YieldAwaiter::await_resume() const {
  if (_unit != nullptr && _unit->cancelled) {
    throw RequestCancelled();
  }
}

}  // namespace portico
