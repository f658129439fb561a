#include "portico/internal/handler-supervisor.hpp"

#include <coroutine>
#include <cstddef>
#include <exception>
#include <memory>
#include <utility>

#include "portico/errors.hpp"
#include "portico/internal/handler-unit.hpp"
#include "portico/internal/scheduler.hpp"
#include "portico/log.hpp"
#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-handler.hpp"
#include "portico/timedef.hpp"

namespace portico::internal {

HandlerSupervisor::HandlerSupervisor(Scheduler& scheduler, RequestContext::Values contextDefaults)
    : _scheduler(scheduler), _contextDefaults(std::move(contextDefaults)) {}

HandlerSupervisor::~HandlerSupervisor() {
  // Frames are destroyed before their bridges are told, so that no handler code runs from here.
  for (auto& [id, unit] : _units) {
    unit->task.reset();
    unit->bridge->attachUnit(nullptr);
  }
}

UnitId HandlerSupervisor::spawn(const std::shared_ptr<RequestBridge>& bridge, const RequestHandler& handler) {
  const UnitId id = _nextId++;
  auto unitPtr = std::make_unique<HandlerUnit>(id, *this, bridge, _contextDefaults);
  HandlerUnit& unit = *unitPtr;
  bridge->attachUnit(&unit);

  try {
    unit.task = handler(bridge->scope(), Receive(bridge), Send(bridge), unit.context);
  } catch (const std::exception& ex) {
    ++_nbHandlerErrors;
    log::error("Exception in request handler: {}", ex.what());
    bridge->attachUnit(nullptr);
    bridge->failWithInternalError();
    bridge->handlerFinished();
    return 0;
  }

  unit.resumePoint = unit.task.handle();
  auto it = _units.emplace(id, std::move(unitPtr)).first;
  if (!unit.task.valid()) {
    finish(it);
    return 0;
  }
  _scheduler.schedule(id);
  return id;
}

std::size_t HandlerSupervisor::runReady(SteadyTimePoint now) {
  _scheduler.promoteExpiredTimers(now);

  std::size_t nbResumed = 0;
  for (std::size_t nbToRun = _scheduler.readyCount(); nbToRun != 0 && _scheduler.hasReady(); --nbToRun) {
    const UnitId id = _scheduler.popReady();
    auto it = _units.find(id);
    if (it == _units.end()) {
      continue;
    }
    HandlerUnit& unit = *it->second;
    if ((unit.wait != HandlerUnit::Wait::None && unit.wait != HandlerUnit::Wait::Timer) || !unit.resumePoint) {
      // stale entry, the unit has been resumed for another reason since it was queued
      continue;
    }
    unit.wait = HandlerUnit::Wait::None;
    std::exchange(unit.resumePoint, {}).resume();
    ++nbResumed;
    if (unit.task.done()) {
      finish(it);
    }
  }
  return nbResumed;
}

void HandlerSupervisor::wake(UnitId id, HandlerUnit::Wait reason) {
  auto it = _units.find(id);
  if (it == _units.end()) {
    return;
  }
  HandlerUnit& unit = *it->second;
  if (reason == HandlerUnit::Wait::None || unit.wait != reason) {
    return;
  }
  unit.wait = HandlerUnit::Wait::None;
  _scheduler.schedule(id);
}

void HandlerSupervisor::suspend(HandlerUnit& unit, std::coroutine_handle<> handle, HandlerUnit::Wait reason) noexcept {
  unit.resumePoint = handle;
  unit.wait = reason;
}

void HandlerSupervisor::sleepUntil(HandlerUnit& unit, std::coroutine_handle<> handle, SteadyTimePoint when) {
  unit.resumePoint = handle;
  unit.wait = HandlerUnit::Wait::Timer;
  _scheduler.scheduleAt(unit.id, when);
}

void HandlerSupervisor::yield(HandlerUnit& unit, std::coroutine_handle<> handle) {
  unit.resumePoint = handle;
  unit.wait = HandlerUnit::Wait::None;
  _scheduler.schedule(unit.id);
}

void HandlerSupervisor::cancelAll() {
  if (_units.empty()) {
    return;
  }
  log::debug("Cancelling {} running request handler(s)", _units.size());
  for (auto& [id, unit] : _units) {
    unit->cancelled = true;
    if (unit->wait == HandlerUnit::Wait::Timer) {
      _scheduler.cancelTimer(id);
    }
    if (unit->wait != HandlerUnit::Wait::None) {
      unit->wait = HandlerUnit::Wait::None;
      _scheduler.schedule(id);
    }
  }
  runReady(SteadyClock::now());

  while (!_units.empty()) {
    auto it = _units.begin();
    HandlerUnit& unit = *it->second;
    log::warn("Request handler did not unwind after cancellation, destroying it");
    unit.task.reset();
    std::shared_ptr<RequestBridge> bridge = std::move(unit.bridge);
    _units.erase(it);
    bridge->attachUnit(nullptr);
    bridge->abort();
    bridge->handlerFinished();
  }
  _scheduler.clear();
}

void HandlerSupervisor::finish(Units::iterator it) {
  HandlerUnit& unit = *it->second;
  RequestBridge& bridge = *unit.bridge;

  try {
    unit.task.runSynchronously();
    if (!bridge.responseStarted()) {
      if (!bridge.disconnected()) {
        log::error("Request handler returned without starting response.");
      }
      bridge.failWithInternalError();
    } else if (!bridge.responseComplete()) {
      if (!bridge.disconnected()) {
        log::error("Request handler returned without completing response.");
      }
      bridge.abort();
    }
  } catch (const RequestCancelled&) {
    log::debug("Request handler cancelled");
    if (!bridge.responseComplete()) {
      bridge.abort();
    }
  } catch (const std::exception& ex) {
    ++_nbHandlerErrors;
    log::error("Exception in request handler: {}", ex.what());
    bridge.failWithInternalError();
  } catch (...) {
    ++_nbHandlerErrors;
    log::error("Unknown exception in request handler");
    bridge.failWithInternalError();
  }

  unit.task.reset();
  std::shared_ptr<RequestBridge> bridgePtr = std::move(unit.bridge);
  _units.erase(it);
  bridgePtr->attachUnit(nullptr);
  bridgePtr->handlerFinished();
}

}  // namespace portico::internal
