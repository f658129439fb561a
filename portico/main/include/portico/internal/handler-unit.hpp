#pragma once

#include <coroutine>
#include <cstdint>
#include <memory>
#include <utility>

#include "portico/internal/scheduler.hpp"
#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-task.hpp"

namespace portico::internal {

class HandlerSupervisor;

// One request handler execution: its coroutine, the bridge it talks through and its private context.
struct HandlerUnit {
  // What the unit is suspended on. None: runnable (queued) or running.
  enum class Wait : uint8_t { None, Receive, Writable, Timer };

  HandlerUnit(UnitId unitId, HandlerSupervisor& owner, std::shared_ptr<RequestBridge> requestBridge,
              RequestContext::Values contextDefaults)
      : id(unitId),
        supervisor(&owner),
        bridge(std::move(requestBridge)),
        context(std::move(contextDefaults), this) {}

  HandlerUnit(const HandlerUnit&) = delete;
  HandlerUnit(HandlerUnit&&) = delete;
  HandlerUnit& operator=(const HandlerUnit&) = delete;
  HandlerUnit& operator=(HandlerUnit&&) = delete;

  ~HandlerUnit() = default;

  UnitId id;
  HandlerSupervisor* supervisor;
  std::shared_ptr<RequestBridge> bridge;
  RequestContext context;
  std::coroutine_handle<> resumePoint;
  Wait wait{Wait::None};
  bool cancelled{false};
  // Declared last so that the coroutine frame (which references the context and the bridge scope) is destroyed first.
  RequestTask<void> task;
};

}  // namespace portico::internal
