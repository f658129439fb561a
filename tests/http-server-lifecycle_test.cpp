#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <thread>

#include "portico/errors.hpp"
#include "portico/events.hpp"
#include "portico/http-server.hpp"
#include "portico/http-status-code.hpp"
#include "portico/lifespan.hpp"
#include "portico/log-capture.hpp"
#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-handler.hpp"
#include "portico/request-task.hpp"
#include "portico/scope.hpp"
#include "portico/server-config.hpp"
#include "portico/state-bag.hpp"
#include "portico/test_server_fixture.hpp"
#include "portico/test_util.hpp"

using namespace std::chrono_literals;

namespace portico {

namespace {

RequestTask<void> Ok(const Scope&, Receive, Send send) {
  const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", "2"}});
  co_await send(start);
  co_await send(SendEvent::Body("ok"));
}

// Answers after 'delay'.
RequestHandler Delayed(std::chrono::milliseconds delay) {
  return [delay](const Scope&, Receive, Send send, RequestContext& context) -> RequestTask<void> {
    co_await context.sleepFor(delay);
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", "4"}});
    co_await send(start);
    co_await send(SendEvent::Body("done"));
  };
}

template <class Predicate>
bool WaitFor(Predicate pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(2ms);
  }
  return true;
}

std::atomic<int> gOuterSignals{0};

void OuterSignalHandler(int /*sig*/) { gOuterSignals.fetch_add(1); }

}  // namespace

TEST(HttpServerLifecycle, RunInOwnThreadAndBeginShutdown) {
  HttpServer server(ServerConfig{}.withPollInterval(5ms), MakeRequestHandler(Ok));
  EXPECT_EQ(server.state(), HttpServer::State::Stopped);
  std::jthread loop([&server] { server.run(); });
  ASSERT_TRUE(WaitFor([&server] { return server.isRunning(); }, 1s));

  EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(server.port())).body, "ok");

  server.beginShutdown();
  loop.join();
  EXPECT_EQ(server.state(), HttpServer::State::Stopped);
  EXPECT_TRUE(test::WaitForListenerClosed(server.port(), 500ms));
  EXPECT_EQ(server.stats().totalRequestsServed, 1U);
}

TEST(HttpServerLifecycle, RunCanBeRestarted) {
  HttpServer server(ServerConfig{}.withPollInterval(5ms), MakeRequestHandler(Ok));
  for (int round = 0; round < 2; ++round) {
    std::jthread loop([&server] { server.run(); });
    ASSERT_TRUE(WaitFor([&server] { return server.isRunning(); }, 1s));
    EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(server.port())).statusCode, http::StatusCodeOK);
    server.beginShutdown();
  }
  EXPECT_EQ(server.stats().totalRequestsServed, 2U);
}

TEST(HttpServerLifecycle, StartAndStop) {
  HttpServer server(ServerConfig{}.withPollInterval(5ms), MakeRequestHandler(Ok));
  server.start();
  ASSERT_TRUE(WaitFor([&server] { return server.isRunning(); }, 1s));
  EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(server.port())).body, "ok");
  server.stop();
  EXPECT_EQ(server.state(), HttpServer::State::Stopped);
}

TEST(HttpServerLifecycle, InvalidConfigIsRejectedAtConstruction) {
  EXPECT_THROW(HttpServer(ServerConfig{}.withPipelineDepth(0), MakeRequestHandler(Ok)), std::invalid_argument);
  EXPECT_THROW(HttpServer(ServerConfig{}.withReadWatermarks(10, 20), MakeRequestHandler(Ok)), std::invalid_argument);
}

TEST(HttpServerLifecycle, MaxRequestsTriggersShutdown) {
  test::LogCapture logs;
  {
    test::TestServer ts(ServerConfig{}.withLimitMaxRequests(2), MakeRequestHandler(Ok));
    EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(ts.port())).statusCode, http::StatusCodeOK);
    EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(ts.port())).statusCode, http::StatusCodeOK);
    EXPECT_TRUE(ts.waitStopped(2s));
    EXPECT_FALSE(test::AttemptConnect(ts.port()));
  }
  EXPECT_EQ(logs.count("Maximum request limit of 2 exceeded. Terminating process."), 1U);
}

TEST(HttpServerLifecycle, LastAllowedRequestClosesKeepAliveConnection) {
  test::LogCapture logs;
  {
    test::TestServer ts(ServerConfig{}.withLimitMaxRequests(1), MakeRequestHandler(Ok));
    test::ClientConnection cnx(ts.port());
    test::sendAll(cnx.fd(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
    EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
    EXPECT_EQ(resp.body, "ok");
    EXPECT_EQ(resp.headers.at("connection"), "close");
    EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
    EXPECT_TRUE(ts.waitStopped(2s));
    EXPECT_EQ(ts.server.stats().totalRequestsServed, 1U);
  }
  EXPECT_EQ(logs.count("Maximum request limit of 1 exceeded. Terminating process."), 1U);
}

TEST(HttpServerLifecycle, StopLogsStatsSnapshot) {
  test::LogCapture logs;
  {
    test::TestServer ts(ServerConfig{}, MakeRequestHandler(Ok));
    EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(ts.port())).statusCode, http::StatusCodeOK);
    ts.stop();
  }
  EXPECT_EQ(logs.count("Server stopped, stats: {\"totalRequestsServed\":1,"), 1U);
  EXPECT_EQ(logs.count("\"handlerErrors\":0}"), 1U);
}

TEST(HttpServerLifecycle, GracefulShutdownCompletesInFlightRequest) {
  test::TestServer ts(ServerConfig{}, Delayed(150ms));
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
  std::this_thread::sleep_for(30ms);

  ts.server.beginShutdown();
  EXPECT_TRUE(test::WaitForListenerClosed(ts.port(), 500ms));

  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "done");
  EXPECT_EQ(resp.headers.at("connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
  EXPECT_TRUE(ts.waitStopped(1s));
}

TEST(HttpServerLifecycle, GracefulShutdownClosesIdleConnections) {
  test::TestServer ts(ServerConfig{}, MakeRequestHandler(Ok));
  test::ClientConnection idle(ts.port());
  test::sendAll(idle.fd(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(idle.fd())).body, "ok");

  ts.server.beginShutdown();
  EXPECT_TRUE(test::WaitForPeerClose(idle.fd(), 1s));
  EXPECT_TRUE(ts.waitStopped(1s));
}

TEST(HttpServerLifecycle, GracefulShutdownTimeoutCancelsHandlers) {
  test::LogCapture logs;
  std::atomic<bool> cancelled{false};
  RequestHandler handler = [&cancelled](const Scope&, Receive receive, Send, RequestContext&) -> RequestTask<void> {
    try {
      for (;;) {
        ReceiveEvent event = co_await receive();
        if (event.isDisconnect() || !event.moreBody) {
          break;
        }
      }
    } catch (const RequestCancelled&) {
      cancelled = true;
      throw;
    }
  };
  {
    test::TestServer ts(ServerConfig{}.withGracefulShutdownTimeout(50ms), handler);
    test::ClientConnection cnx(ts.port());
    test::sendAll(cnx.fd(), "POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 100\r\n\r\nabc");
    std::this_thread::sleep_for(30ms);

    ts.server.beginShutdown();
    EXPECT_TRUE(ts.waitStopped(2s));
    EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
  }
  EXPECT_TRUE(cancelled);
  EXPECT_TRUE(logs.contains("Graceful shutdown timeout of 50 ms exceeded"));
}

TEST(HttpServerLifecycle, ForceShutdownDoesNotWait) {
  test::TestServer ts(ServerConfig{}, Delayed(10s));
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
  std::this_thread::sleep_for(30ms);

  const auto start = std::chrono::steady_clock::now();
  ts.server.forceShutdown();
  EXPECT_TRUE(ts.waitStopped(2s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
  ts.stop();
  EXPECT_EQ(ts.server.stats().runningHandlers, 0U);
}

TEST(HttpServerLifecycle, SignalTriggersGracefulShutdownAndIsRaisedAgain) {
  gOuterSignals = 0;
  auto* previous = std::signal(SIGUSR1, OuterSignalHandler);
  {
    test::TestServer ts(ServerConfig{}.withSignalHandlers().withSignals({SIGUSR1}), Delayed(100ms));
    ASSERT_TRUE(WaitFor([&ts] { return ts.server.isRunning(); }, 1s));
    test::ClientConnection cnx(ts.port());
    test::sendAll(cnx.fd(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    std::this_thread::sleep_for(20ms);

    ASSERT_EQ(::kill(::getpid(), SIGUSR1), 0);

    const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
    EXPECT_EQ(resp.body, "done");
    EXPECT_EQ(resp.headers.at("connection"), "close");
    EXPECT_TRUE(ts.waitStopped(2s));
  }
  EXPECT_TRUE(WaitFor([] { return gOuterSignals.load() == 1; }, 1s));
  std::signal(SIGUSR1, previous);
}

TEST(HttpServerLifecycle, SecondSignalForcesShutdown) {
  gOuterSignals = 0;
  auto* previous = std::signal(SIGUSR2, OuterSignalHandler);
  {
    test::TestServer ts(ServerConfig{}.withSignalHandlers().withSignals({SIGUSR2}), Delayed(10s));
    ASSERT_TRUE(WaitFor([&ts] { return ts.server.isRunning(); }, 1s));
    test::ClientConnection cnx(ts.port());
    test::sendAll(cnx.fd(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    std::this_thread::sleep_for(20ms);

    ASSERT_EQ(::kill(::getpid(), SIGUSR2), 0);
    EXPECT_TRUE(test::WaitForListenerClosed(ts.port(), 1s));
    EXPECT_FALSE(ts.waitStopped(50ms));

    ASSERT_EQ(::kill(::getpid(), SIGUSR2), 0);
    EXPECT_TRUE(ts.waitStopped(2s));
    EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
  }
  EXPECT_TRUE(WaitFor([] { return gOuterSignals.load() == 1; }, 1s));
  std::signal(SIGUSR2, previous);
}

TEST(HttpServerLifespan, StartupStateIsVisibleToRequests) {
  test::LogCapture logs;
  std::atomic<bool> shutdownSeen{false};
  LifespanHandler lifespan = [&shutdownSeen](LifespanReceive receive, LifespanSend send,
                                             StateBag& state) -> RequestTask<void> {
    LifespanEvent event = co_await receive();
    if (event.type == LifespanEvent::Type::Startup) {
      state.set("pool", std::string("ready"));
      co_await send(LifespanMessage::StartupComplete());
    }
    event = co_await receive();
    if (event.type == LifespanEvent::Type::Shutdown) {
      shutdownSeen = true;
      co_await send(LifespanMessage::ShutdownComplete());
    }
  };
  RequestHandler handler = [](const Scope& scope, Receive, Send send, RequestContext&) -> RequestTask<void> {
    const auto* pool = scope.state->find<std::string>("pool");
    const std::string body = pool == nullptr ? "none" : *pool;
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", std::to_string(body.size())}});
    co_await send(start);
    co_await send(SendEvent::Body(body));
  };
  {
    test::TestServer ts(ServerConfig{}, handler, lifespan);
    EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(ts.port())).body, "ready");
  }
  EXPECT_TRUE(shutdownSeen);
  EXPECT_TRUE(logs.contains("Application startup complete."));
  EXPECT_TRUE(logs.contains("Application shutdown complete."));
}

TEST(HttpServerLifespan, StartupFailureAbortsRun) {
  LifespanHandler lifespan = [](LifespanReceive receive, LifespanSend send, StateBag&) -> RequestTask<void> {
    co_await receive();
    co_await send(LifespanMessage::StartupFailed("database unreachable"));
  };
  HttpServer server(ServerConfig{}, MakeRequestHandler(Ok), lifespan);
  const uint16_t port = server.port();
  try {
    server.run();
    FAIL() << "run() should have thrown";
  } catch (const LifespanFailure& ex) {
    EXPECT_STREQ(ex.what(), "database unreachable");
  }
  EXPECT_EQ(server.state(), HttpServer::State::Stopped);
  EXPECT_FALSE(test::AttemptConnect(port));
}

TEST(HttpServerLifespan, ExceptionIsFatalInOnMode) {
  LifespanHandler lifespan = [](LifespanReceive, LifespanSend, StateBag&) -> RequestTask<void> {
    throw std::runtime_error("not supported");
    co_return;
  };
  HttpServer server(ServerConfig{}.withLifespan(LifespanMode::On), MakeRequestHandler(Ok), lifespan);
  EXPECT_THROW(server.run(), LifespanFailure);
}

TEST(HttpServerLifespan, UnsupportedLifespanIsIgnoredInAutoMode) {
  test::LogCapture logs;
  LifespanHandler lifespan = [](LifespanReceive, LifespanSend, StateBag&) -> RequestTask<void> {
    throw std::runtime_error("unexpected event");
    co_return;
  };
  {
    test::TestServer ts(ServerConfig{}, MakeRequestHandler(Ok), lifespan);
    EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(ts.port())).body, "ok");
  }
  EXPECT_TRUE(logs.contains("Lifespan protocol appears unsupported (unexpected event)."));
  EXPECT_FALSE(logs.contains("Application startup failed"));
}

}  // namespace portico
