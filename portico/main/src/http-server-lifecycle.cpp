#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <utility>

#include "portico/event-loop.hpp"
#include "portico/http-server.hpp"
#include "portico/lifespan.hpp"
#include "portico/log.hpp"
#include "portico/signal-handler.hpp"
#include "portico/socket.hpp"
#include "portico/timedef.hpp"

namespace portico {

namespace {

// Period of the housekeeping tick: fine enough for the configured timeouts, and at least once per second for the
// date header.
std::chrono::milliseconds MaintenanceInterval(const ServerConfig& config) {
  std::chrono::milliseconds interval = std::min(config.pollInterval, std::chrono::milliseconds{1000});
  for (auto timeout : {config.keepAliveTimeout, config.headerReadTimeout, config.bodyReadTimeout,
                       config.gracefulShutdownTimeout}) {
    if (timeout.count() > 0) {
      interval = std::min(interval, timeout);
    }
  }
  return std::max(interval, std::chrono::milliseconds{1});
}

}  // namespace

HttpServer::AsyncHandle::AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error)
    : _thread(std::move(thread)), _error(std::move(error)) {}

HttpServer::AsyncHandle::~AsyncHandle() { stop(); }

void HttpServer::AsyncHandle::stop() noexcept {
  // A handler calling stop() runs on the event loop thread itself: it cannot join.
  if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id()) {
    _thread.request_stop();
    _thread.join();
  }
}

void HttpServer::AsyncHandle::rethrowIfError() {
  if (_error && *_error) {
    std::rethrow_exception(*_error);
  }
}

HttpServer::HttpServer(ServerConfig config, RequestHandler handler, LifespanHandler lifespanHandler)
    : _config(std::move(config)),
      _handler(std::move(handler)),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(_config.pollInterval),
      _lifespan(std::move(lifespanHandler), _config.lifespan, _lifespanState),
      _supervisor(_scheduler, _config.contextDefaults) {
  if (!_handler) {
    throw std::invalid_argument("HttpServer requires a request handler");
  }
  initListener();
  _eventLoop.addOrThrow(EventLoop::EventFd{_lifecycle.wakeupFd.fd(), EventIn});
  _maintenanceTimer.armPeriodic(MaintenanceInterval(_config));
  _eventLoop.addOrThrow(EventLoop::EventFd{_maintenanceTimer.fd(), EventIn});
}

HttpServer::~HttpServer() { stop(); }

// Validates the configuration, binds and listens so that port() is valid right after construction.
// The listener is closed when a shutdown begins; a later run() binds it again (on the same port if it was
// ephemeral).
void HttpServer::initListener() {
  _config.validate();
  if (!_listenSocket) {
    _listenSocket = Socket(Socket::Type::StreamNonBlock);
  }
  _config.port = _listenSocket.listen(ListenSpec{_config.host, _config.port, _config.backlog, _config.reusePort});
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
}

void HttpServer::closeListener() noexcept {
  if (_listenSocket) {
    _eventLoop.del(_listenSocket.fd());
    _listenSocket.close();
    log::debug("Listener closed");
  }
}

void HttpServer::prepareRun() {
  if (_lifecycle.isActive()) {
    throw std::logic_error("Server is already running");
  }
  if (!_listenSocket) {
    initListener();
  }
  _lifecycle.enterStarting();
  if (_config.installSignalHandlers) {
    SignalHandler::Enable(_config.signals);
    _signalHandlersInstalled = true;
    _nbSignalsHandled = SignalHandler::NbSignalsReceived();
  }
  _maxRequestsReached = false;
  _nbRequestsAdmitted = 0;
  refreshDate();

  try {
    _lifespan.startup();
  } catch (const std::exception&) {
    closeListener();
    if (_signalHandlersInstalled) {
      _signalHandlersInstalled = false;
      SignalHandler::Disable(false);
    }
    _lifecycle.reset();
    throw;
  }

  log::info("Server running on http://{}:{}", _config.host, port());
  _lifecycle.enterRunning();
}

void HttpServer::finishRun() {
  _lifespan.shutdown();
  _dirtyFds.clear();
  _scheduler.clear();
  log::info("Server stopped, stats: {}", stats().json_str());
  _lifecycle.reset();
  if (_signalHandlersInstalled) {
    _signalHandlersInstalled = false;
    // The captured signal is raised again so that a handler installed before ours observes it.
    SignalHandler::Disable(true);
  }
}

void HttpServer::run() { runUntil({}); }

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  prepareRun();
  try {
    while (true) {
      if (predicate && !_lifecycle.isStopping() && predicate()) {
        beginGracefulShutdown();
      }
      serveShutdownRequests();
      if (shutdownComplete()) {
        break;
      }
      eventLoop();
    }
  } catch (const std::exception& ex) {
    log::critical("Unrecoverable error in event loop: {}", ex.what());
    beginGracefulShutdown();
    forceCloseEverything();
    finishRun();
    throw;
  }
  finishRun();
}

void HttpServer::start() { _internalHandle = startDetached(); }

HttpServer::AsyncHandle HttpServer::startDetached() {
  auto errorPtr = std::make_shared<std::exception_ptr>();

  return {std::jthread([this, errorPtr](const std::stop_token& st) {
            try {
              runUntil([&st]() { return st.stop_requested(); });
            } catch (...) {
              *errorPtr = std::current_exception();
            }
          }),
          std::move(errorPtr)};
}

void HttpServer::stop() noexcept {
  if (_lifecycle.isActive()) {
    _lifecycle.requestForcedShutdown();
  }
  _internalHandle.stop();
}

void HttpServer::beginShutdown() noexcept { _lifecycle.requestGracefulShutdown(); }

void HttpServer::forceShutdown() noexcept { _lifecycle.requestForcedShutdown(); }

ServerStats HttpServer::stats() const {
  ServerStats stats = _stats;
  stats.liveConnections = _connections.size();
  stats.runningHandlers = _supervisor.nbRunning();
  stats.handlerErrors = _supervisor.nbHandlerErrors();
  return stats;
}

// First termination signal: graceful shutdown. Any further one: forced shutdown.
void HttpServer::serveShutdownRequests() {
  if (_signalHandlersInstalled) {
    const int nbSignals = SignalHandler::NbSignalsReceived();
    if (nbSignals > _nbSignalsHandled) {
      const bool escalate = _lifecycle.isStopping() || nbSignals - _nbSignalsHandled > 1;
      _nbSignalsHandled = nbSignals;
      if (escalate) {
        log::warn("Received signal {} again, forcing shutdown", SignalHandler::LastSignal());
        beginGracefulShutdown();
        forceCloseEverything();
      } else {
        log::info("Received signal {}, shutting down", SignalHandler::LastSignal());
        beginGracefulShutdown();
      }
    }
  }
  if (_lifecycle.forceRequested.exchange(false, std::memory_order_relaxed)) {
    beginGracefulShutdown();
    forceCloseEverything();
  }
  if (_lifecycle.gracefulRequested.exchange(false, std::memory_order_relaxed)) {
    beginGracefulShutdown();
  }
  if (_lifecycle.isStopping() && !_lifecycle.forced && _lifecycle.deadlineExpired(SteadyClock::now())) {
    log::warn("Graceful shutdown timeout of {} ms exceeded, cancelling {} request handler(s) and closing {} "
              "connection(s)",
              _config.gracefulShutdownTimeout.count(), _supervisor.nbRunning(), _connections.size());
    forceCloseEverything();
  }
}

void HttpServer::beginGracefulShutdown() {
  const bool hasDeadline = _config.gracefulShutdownTimeout.count() > 0;
  if (!_lifecycle.enterStopping(SteadyClock::now() + _config.gracefulShutdownTimeout, hasDeadline)) {
    return;
  }
  log::info("Shutting down ({} connection(s), {} running request handler(s))", _connections.size(),
            _supervisor.nbRunning());
  closeListener();
  for (auto& [fd, state] : _connections) {
    state->gracefulCloseRequested = true;
    for (internal::RequestCycle& cycle : state->cycles) {
      cycle.bridge->disableKeepAlive();
    }
    markDirty(*state);
  }
}

void HttpServer::forceCloseEverything() {
  if (_lifecycle.forced) {
    return;
  }
  _lifecycle.forced = true;
  _supervisor.cancelAll();
  closeAllConnections();
}

bool HttpServer::shutdownComplete() const noexcept {
  return _lifecycle.isStopping() && _connections.empty() && _supervisor.nbRunning() == 0;
}

}  // namespace portico
