#include "portico/lifespan.hpp"

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "portico/errors.hpp"
#include "portico/log.hpp"
#include "portico/server-config.hpp"
#include "portico/state-bag.hpp"

namespace portico::internal {

namespace {

const LifespanMessage* FindMessage(const std::vector<LifespanMessage>& outbox, LifespanMessage::Type type) {
  for (const LifespanMessage& message : outbox) {
    if (message.type == type) {
      return &message;
    }
  }
  return nullptr;
}

}  // namespace

LifespanRunner::LifespanRunner(LifespanHandler handler, LifespanMode mode, StateBag& state)
    : _handler(std::move(handler)),
      _state(state),
      _channel(std::make_shared<LifespanChannel>()),
      _mode(mode),
      _enabled(mode != LifespanMode::Off && static_cast<bool>(_handler)) {}

void LifespanRunner::deliver(LifespanEvent event) {
  _channel->inbox = event;
  _channel->outbox.clear();
  if (!_task.valid() || _task.done()) {
    return;
  }
  if (!_started) {
    _started = true;
    _task.resume();
  } else if (_channel->waiter) {
    std::exchange(_channel->waiter, {}).resume();
  }
}

void LifespanRunner::startup() {
  if (!_enabled) {
    return;
  }
  log::info("Waiting for application startup.");

  try {
    _task = _handler(LifespanReceive(_channel), LifespanSend(_channel), _state);
  } catch (const std::exception& ex) {
    failStartup(ex.what());
    return;
  }

  deliver(LifespanEvent{LifespanEvent::Type::Startup});

  if (const LifespanMessage* failed = FindMessage(_channel->outbox, LifespanMessage::Type::StartupFailed)) {
    if (!failed->message.empty()) {
      log::error("{}", failed->message);
    }
    log::error("Application startup failed. Exiting.");
    throw LifespanFailure(failed->message.empty() ? std::string("Application startup failed") : failed->message);
  }

  if (_task.done()) {
    try {
      _task.runSynchronously();
    } catch (const std::exception& ex) {
      failStartup(ex.what());
      return;
    } catch (...) {
      failStartup("unknown exception");
      return;
    }
  }

  log::info("Application startup complete.");
}

void LifespanRunner::failStartup(std::string_view reason) {
  _task.reset();
  if (_mode == LifespanMode::Auto && !_channel->sentAny) {
    log::info("Lifespan protocol appears unsupported ({}).", reason);
    _enabled = false;
    return;
  }
  log::error("Exception in lifespan handler: {}", reason);
  log::error("Application startup failed. Exiting.");
  throw LifespanFailure(std::string(reason));
}

void LifespanRunner::shutdown() noexcept {
  if (!_enabled || !_task.valid() || _task.done()) {
    return;
  }
  log::info("Waiting for application shutdown.");
  deliver(LifespanEvent{LifespanEvent::Type::Shutdown});

  if (const LifespanMessage* failed = FindMessage(_channel->outbox, LifespanMessage::Type::ShutdownFailed)) {
    log::error("Application shutdown failed: {}", failed->message);
  } else if (_task.done()) {
    try {
      _task.runSynchronously();
      log::info("Application shutdown complete.");
    } catch (const std::exception& ex) {
      log::error("Application shutdown failed: {}", ex.what());
    } catch (...) {
      log::error("Application shutdown failed: unknown exception");
    }
  } else {
    log::info("Application shutdown complete.");
  }
  _task.reset();
}

}  // namespace portico::internal
