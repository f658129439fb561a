#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

#include "portico/event-loop.hpp"
#include "portico/internal/bridge-host.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/internal/handler-supervisor.hpp"
#include "portico/internal/lifecycle.hpp"
#include "portico/internal/scheduler.hpp"
#include "portico/lifespan.hpp"
#include "portico/request-handler.hpp"
#include "portico/server-config.hpp"
#include "portico/server-stats.hpp"
#include "portico/socket.hpp"
#include "portico/state-bag.hpp"
#include "portico/timedef.hpp"
#include "portico/timer-fd.hpp"
#include "portico/timestring.hpp"
#include "portico/wire-codec.hpp"

namespace portico {

// HttpServer
//  - Single-threaded cooperative engine: one instance == one epoll reactor plus the request handler units it drives,
//    all running in the thread invoking run() / runUntil() (or the internal thread of start()).
//  - Every request is answered by a RequestHandler coroutine. Handlers suspend in co_await receive(), send(),
//    context.sleepFor() or context.yield() and are resumed by the event loop, never concurrently.
//  - Not internally synchronized: apart from stop(), beginShutdown() and forceShutdown() (safe from any thread),
//    do not access an instance concurrently from multiple threads.
//  - Not copyable nor movable: request bridges and handler units refer to the server.
class HttpServer : private internal::BridgeHost {
 public:
  using State = internal::Lifecycle::State;

  // AsyncHandle: RAII wrapper for non-blocking server execution
  // ------------------------------------------------------------
  // Returned by startDetached() to manage the background thread running the event loop.
  // Provides lifetime management (RAII join on destruction) and error propagation from the background thread.
  //
  //   HttpServer server(cfg, handler);
  //   auto handle = server.startDetached();  // non-blocking
  //   // ...
  //   handle.stop();              // graceful shutdown, then join
  //   handle.rethrowIfError();    // e.g. LifespanFailure
  class AsyncHandle {
   public:
    AsyncHandle() noexcept = default;

    AsyncHandle(const AsyncHandle&) = delete;
    AsyncHandle& operator=(const AsyncHandle&) = delete;
    AsyncHandle(AsyncHandle&&) noexcept = default;
    AsyncHandle& operator=(AsyncHandle&&) noexcept = default;

    // Destructor automatically stops and joins the background thread (RAII)
    ~AsyncHandle();

    // Request a graceful stop of the background event loop and join the thread (blocking).
    // Safe to call multiple times; subsequent calls are no-ops.
    void stop() noexcept;

    // Rethrow any exception that occurred in the background event loop.
    void rethrowIfError();

    [[nodiscard]] bool started() const noexcept { return _thread.joinable(); }

   private:
    friend class HttpServer;

    AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error);

    std::jthread _thread;
    std::shared_ptr<std::exception_ptr> _error;  // shared for lambda capture
  };

  // Construct a server bound and listening immediately according to given configuration.
  //  - Validates the configuration (std::invalid_argument), then binds and listens (std::system_error on failure).
  //  - After construction port() returns the actual bound port (deterministic for tests using ephemeral ports).
  //  - The lifespan handler, if any, is driven by run() according to config.lifespan.
  HttpServer(ServerConfig config, RequestHandler handler, LifespanHandler lifespanHandler = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer() override;

  // Runs the server in the calling thread until it is fully stopped:
  //   1. Starting: signal handlers installation (if configured) and lifespan startup. A startup failure throws
  //      LifespanFailure and nothing is served.
  //   2. Running: serve connections until a shutdown is requested (termination signal, beginShutdown(), stop(),
  //      forceShutdown() or the maximum request count is reached).
  //   3. Stopping: the listener is closed, idle connections are closed, the others are closed once their in-flight
  //      request completes. When config.gracefulShutdownTimeout is reached (or on a second termination signal or
  //      forceShutdown()), remaining handlers are cancelled and connections closed.
  //   4. Lifespan shutdown, signal handlers restoration (and re-raise of the captured signal).
  void run();

  // Like run() but begins a graceful shutdown as soon as 'predicate' returns true (checked once per loop iteration).
  void runUntil(const std::function<bool()>& predicate);

  // Launch run() in a background thread managed by the server (stopped and joined by stop() or the destructor).
  void start();

  [[nodiscard]] AsyncHandle startDetached();

  // Forced shutdown, then join the internal thread if start() was used. Safe to call from any thread.
  // If run() is executing in another thread, it returns shortly after.
  void stop() noexcept;

  // Request a graceful shutdown. Safe to call from any thread.
  void beginShutdown() noexcept;

  // Request a forced shutdown: handlers are cancelled and connections closed without waiting. Safe to call from any
  // thread.
  void forceShutdown() noexcept;

  // The config given to the server, with the actual allocated port if 0 was given.
  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] bool isRunning() const noexcept { return _lifecycle.isRunning(); }

  [[nodiscard]] State state() const noexcept { return _lifecycle.state.load(std::memory_order_relaxed); }

  // Statistics snapshot. Call it from the event loop thread (from a handler) or once the server is stopped.
  [[nodiscard]] ServerStats stats() const;

 private:
  using ConnectionMap = std::map<int, std::unique_ptr<internal::ConnectionState>>;

  // BridgeHost
  void queueResponseBytes(internal::ConnectionState& connection, std::size_t nbBytes) override;
  void onResponseComplete(internal::ConnectionState& connection, const RequestBridge& bridge) override;
  void onBodyConsumed(internal::ConnectionState& connection, std::size_t nbBytes) override;
  void abortConnection(internal::ConnectionState& connection) override;
  void onHandlerFinished(internal::ConnectionState* connection, RequestBridge& bridge) override;
  [[nodiscard]] std::string_view currentDate() const noexcept override;

  // Lifecycle (http-server-lifecycle.cpp)
  void initListener();
  void closeListener() noexcept;
  void prepareRun();
  void finishRun();
  void serveShutdownRequests();
  void beginGracefulShutdown();
  void forceCloseEverything();
  [[nodiscard]] bool shutdownComplete() const noexcept;

  // Event loop (http-server.cpp)
  void eventLoop();
  void runHandlers();
  void updatePollTimeout();
  void refreshDate();
  void startHandler(internal::ConnectionState& state, internal::RequestCycle& cycle);
  std::shared_ptr<RequestBridge> makeBridge(internal::ConnectionState& state, http::RequestHead& head);
  void fillScope(const internal::ConnectionState& state, http::RequestHead& head, Scope& scope) const;
  void logAccess(const RequestBridge& bridge) const;

  // Connections (connection-manager.cpp)
  void acceptNewConnections();
  void handleReadableClient(int fd, EventBmp eventBmp);
  void handleWritableClient(int fd);
  void onPeerClosed(internal::ConnectionState& state);
  void markDirty(internal::ConnectionState& state);
  void serviceDirtyConnections();
  void serviceFd(ConnectionMap::iterator cnxIt);
  void serviceConnection(internal::ConnectionState& state);
  void parseInput(internal::ConnectionState& state);
  void retireCompletedCycles(internal::ConnectionState& state);
  void startNextHandler(internal::ConnectionState& state);
  void applyReadBackpressure(internal::ConnectionState& state);
  void flushOutbound(internal::ConnectionState& state);
  void updateInterest(internal::ConnectionState& state);
  void emitEngineResponse(internal::ConnectionState& state, http::StatusCode status, std::string_view body);
  void failRequest(internal::ConnectionState& state, http::StatusCode status, std::string_view body);
  [[nodiscard]] bool shouldClose(const internal::ConnectionState& state) const noexcept;
  ConnectionMap::iterator closeConnection(ConnectionMap::iterator cnxIt);
  void closeAllConnections();
  void sweepIdleConnections();

  ServerConfig _config;
  RequestHandler _handler;
  Socket _listenSocket;
  EventLoop _eventLoop;
  TimerFd _maintenanceTimer;
  internal::Lifecycle _lifecycle;
  StateBag _lifespanState;
  internal::LifespanRunner _lifespan;
  ConnectionMap _connections;
  internal::Scheduler _scheduler;
  // Declared after the connections: handler frames are destroyed first.
  internal::HandlerSupervisor _supervisor;
  std::vector<int> _dirtyFds;
  std::vector<int> _servicedFds;
  ServerStats _stats;
  std::array<char, kRFC7231DateStrLen> _date{};
  SysTimePoint _dateSecond;
  int _nbSignalsHandled{0};
  bool _signalHandlersInstalled{false};
  bool _maxRequestsReached{false};
  uint64_t _nbRequestsAdmitted{0};
  AsyncHandle _internalHandle;
};

}  // namespace portico
