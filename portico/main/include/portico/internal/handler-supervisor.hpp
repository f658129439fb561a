#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>

#include "portico/internal/handler-unit.hpp"
#include "portico/internal/scheduler.hpp"
#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-handler.hpp"
#include "portico/timedef.hpp"

namespace portico::internal {

// Owns the running request handler units and drives them on the event loop thread.
//
// A unit is resumed only from runReady(). Awaiters never resume anything themselves: they record what the unit waits
// for (suspend / sleepUntil) and the connection side makes it runnable again with wake().
// When a unit completes, its outcome is classified (normal return, exception, cancellation) and converted into the
// appropriate connection action: 500 response, connection abort or nothing.
class HandlerSupervisor {
 public:
  HandlerSupervisor(Scheduler& scheduler, RequestContext::Values contextDefaults);

  HandlerSupervisor(const HandlerSupervisor&) = delete;
  HandlerSupervisor(HandlerSupervisor&&) = delete;
  HandlerSupervisor& operator=(const HandlerSupervisor&) = delete;
  HandlerSupervisor& operator=(HandlerSupervisor&&) = delete;

  ~HandlerSupervisor();

  // Creates the unit answering the request of 'bridge' and queues its first step.
  // Returns 0 if the handler failed before producing its task (the failure is already handled).
  UnitId spawn(const std::shared_ptr<RequestBridge>& bridge, const RequestHandler& handler);

  // Promotes expired timers then resumes the units that are ready at call time (units becoming ready while running
  // wait for the next call). Returns the number of resumed units.
  std::size_t runReady(SteadyTimePoint now);

  // Makes the unit runnable if it currently waits for 'reason'.
  void wake(UnitId id, HandlerUnit::Wait reason);

  void suspend(HandlerUnit& unit, std::coroutine_handle<> handle, HandlerUnit::Wait reason) noexcept;

  void sleepUntil(HandlerUnit& unit, std::coroutine_handle<> handle, SteadyTimePoint when);

  void yield(HandlerUnit& unit, std::coroutine_handle<> handle);

  // Delivers a cancellation to every unit at its current suspension point, gives them one chance to unwind, and
  // destroys the ones that did not complete.
  void cancelAll();

  [[nodiscard]] std::size_t nbRunning() const noexcept { return _units.size(); }

  [[nodiscard]] bool hasReady() const noexcept { return _scheduler.hasReady(); }

  [[nodiscard]] std::optional<SteadyTimePoint> nextDeadline() const { return _scheduler.nextDeadline(); }

  [[nodiscard]] uint64_t nbHandlerErrors() const noexcept { return _nbHandlerErrors; }

 private:
  using Units = std::map<UnitId, std::unique_ptr<HandlerUnit>>;

  void finish(Units::iterator it);

  Scheduler& _scheduler;
  RequestContext::Values _contextDefaults;
  Units _units;
  UnitId _nextId{1};
  uint64_t _nbHandlerErrors{0};
};

}  // namespace portico::internal
