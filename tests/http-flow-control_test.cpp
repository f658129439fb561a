#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

#include "portico/events.hpp"
#include "portico/http-status-code.hpp"
#include "portico/log-capture.hpp"
#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-handler.hpp"
#include "portico/request-task.hpp"
#include "portico/scope.hpp"
#include "portico/server-config.hpp"
#include "portico/test_server_fixture.hpp"
#include "portico/test_util.hpp"

using namespace std::chrono_literals;

namespace portico {

namespace {
constexpr std::size_t kChunkSize = 16UL * 1024UL;
constexpr int kNbChunks = 64;
}  // namespace

TEST(HttpFlowControl, SlowConsumerPausesAndResumesReading) {
  // consumes at most one event every 2 ms
  RequestHandler handler = [](const Scope&, Receive receive, Send send, RequestContext& context) -> RequestTask<void> {
    std::size_t total = 0;
    for (;;) {
      co_await context.sleepFor(2ms);
      ReceiveEvent event = co_await receive();
      if (event.isDisconnect()) {
        co_return;
      }
      total += event.body.size();
      if (!event.moreBody) {
        break;
      }
    }
    const std::string body = std::to_string(total);
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", std::to_string(body.size())}});
    co_await send(start);
    co_await send(SendEvent::Body(body));
  };
  test::TestServer ts(ServerConfig{}.withReadWatermarks(4096, 1024).withReadChunkBytes(2048), handler);

  constexpr std::size_t kBodySize = 256UL * 1024UL;
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(),
                "POST /upload HTTP/1.1\r\nHost: x\r\nConnection: close\r\nContent-Length: " +
                    std::to_string(kBodySize) + "\r\n\r\n");
  test::sendAll(cnx.fd(), std::string(kBodySize, 'u'), 10s);
  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd(), 10s));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, std::to_string(kBodySize));

  ts.stop();
  const auto stats = ts.server.stats();
  EXPECT_GE(stats.readPauseSignals, 1U);
  EXPECT_GE(stats.readResumeSignals, 1U);
  EXPECT_GE(stats.totalBytesRead, kBodySize);
}

TEST(HttpFlowControl, BodyAboveHighMarkPausesAndResumesExactlyOnce) {
  RequestHandler handler = [](const Scope&, Receive receive, Send send, RequestContext& context) -> RequestTask<void> {
    co_await context.sleepFor(200ms);
    std::size_t total = 0;
    for (;;) {
      ReceiveEvent event = co_await receive();
      if (event.isDisconnect()) {
        co_return;
      }
      total += event.body.size();
      if (!event.moreBody) {
        break;
      }
    }
    const std::string body = std::to_string(total);
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", std::to_string(body.size())}});
    co_await send(start);
    co_await send(SendEvent::Body(body));
  };
  test::TestServer ts(ServerConfig{}.withReadWatermarks(4096, 1024), handler);

  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "POST / HTTP/1.1\r\nHost: x\r\nConnection: close\r\nContent-Length: 7000\r\n\r\n" +
                              std::string(7000, 'b'));
  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd(), 5s));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "7000");

  ts.stop();
  const auto stats = ts.server.stats();
  EXPECT_EQ(stats.readPauseSignals, 1U);
  EXPECT_EQ(stats.readResumeSignals, 1U);
}

TEST(HttpFlowControl, UnreadBodyIsDiscardedBeforeNextRequest) {
  // POST answers without reading its body, other methods report how many body bytes they received
  RequestHandler handler = [](const Scope& scope, Receive receive, Send send, RequestContext&) -> RequestTask<void> {
    std::size_t total = 0;
    if (scope.method != "POST") {
      for (;;) {
        ReceiveEvent event = co_await receive();
        if (event.isDisconnect()) {
          co_return;
        }
        total += event.body.size();
        if (!event.moreBody) {
          break;
        }
      }
    }
    const std::string body = scope.method + ':' + std::to_string(total);
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", std::to_string(body.size())}});
    co_await send(start);
    co_await send(SendEvent::Body(body));
  };
  test::TestServer ts(ServerConfig{}.withReadWatermarks(4096, 1024).withReadChunkBytes(2048), handler);

  constexpr std::size_t kBodySize = 256UL * 1024UL;
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "POST /upload HTTP/1.1\r\nHost: x\r\nContent-Length: " + std::to_string(kBodySize) +
                              "\r\n\r\n");
  test::sendAll(cnx.fd(), std::string(kBodySize, 'u'), 10s);
  const auto first = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd(), 10s));
  EXPECT_EQ(first.statusCode, http::StatusCodeOK);
  EXPECT_EQ(first.body, "POST:0");

  test::sendAll(cnx.fd(), "PUT /small HTTP/1.1\r\nHost: x\r\nConnection: close\r\nContent-Length: 3\r\n\r\nabc");
  const auto second = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd(), 5s));
  EXPECT_EQ(second.statusCode, http::StatusCodeOK);
  EXPECT_EQ(second.body, "PUT:3");

  ts.stop();
  const auto stats = ts.server.stats();
  EXPECT_EQ(stats.readPauseSignals, stats.readResumeSignals);
  EXPECT_GE(stats.totalBytesRead, kBodySize);
}

TEST(HttpFlowControl, LargeResponseWithSmallWriteBuffer) {
  RequestHandler handler = [](const Scope&, Receive, Send send, RequestContext&) -> RequestTask<void> {
    const SendEvent start = SendEvent::Start(
                  http::StatusCodeOK, {{"content-length", std::to_string(kChunkSize * static_cast<std::size_t>(kNbChunks))}});
    co_await send(start);
    for (int idx = 0; idx < kNbChunks; ++idx) {
      co_await send(SendEvent::Body(std::string(kChunkSize, static_cast<char>('a' + (idx % 26))), idx + 1 < kNbChunks));
    }
  };
  test::TestServer ts(ServerConfig{}.withWriteHighWatermark(4096), handler);

  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port()));
  ASSERT_EQ(resp.body.size(), kChunkSize * kNbChunks);
  for (int idx = 0; idx < kNbChunks; ++idx) {
    ASSERT_EQ(resp.body[static_cast<std::size_t>(idx) * kChunkSize], static_cast<char>('a' + (idx % 26)));
  }
  ts.stop();
  EXPECT_GE(ts.server.stats().totalBytesWritten, kChunkSize * kNbChunks);
}

TEST(HttpFlowControl, BodyIsStreamedInSeveralEvents) {
  std::size_t nbEvents = 0;
  RequestHandler handler = [&nbEvents](const Scope&, Receive receive, Send send,
                                       RequestContext&) -> RequestTask<void> {
    for (;;) {
      ReceiveEvent event = co_await receive();
      ++nbEvents;
      if (event.isDisconnect() || !event.moreBody) {
        break;
      }
    }
    co_await send(SendEvent::Start(http::StatusCodeNoContent));
    co_await send(SendEvent::Body(""));
  };
  test::TestServer ts(ServerConfig{}, handler);
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "POST / HTTP/1.1\r\nHost: x\r\nConnection: close\r\nContent-Length: 6\r\n\r\nabc");
  std::this_thread::sleep_for(30ms);
  test::sendAll(cnx.fd(), "def");
  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeNoContent);
  ts.stop();
  EXPECT_GE(nbEvents, 2U);
}

TEST(HttpConcurrency, LimitExceededAnswers503) {
  test::LogCapture logs;
  RequestHandler handler = [](const Scope&, Receive, Send send, RequestContext& context) -> RequestTask<void> {
    co_await context.sleepFor(300ms);
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", "4"}});
    co_await send(start);
    co_await send(SendEvent::Body("slow"));
  };
  {
    test::TestServer ts(ServerConfig{}.withLimitConcurrency(1), handler);
    // lets the server notice that the readiness check connection is closed
    std::this_thread::sleep_for(20ms);

    test::ClientConnection first(ts.port());
    test::sendAll(first.fd(), "GET /first HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
    std::this_thread::sleep_for(50ms);

    const auto rejected = test::parseResponseOrThrow(test::requestOrThrow(ts.port()));
    EXPECT_EQ(rejected.statusCode, http::StatusCodeServiceUnavailable);
    EXPECT_EQ(rejected.body, "Service Unavailable");
    EXPECT_EQ(rejected.headers.at("connection"), "close");

    const auto accepted = test::parseResponseOrThrow(test::recvWithTimeout(first.fd()));
    EXPECT_EQ(accepted.statusCode, http::StatusCodeOK);
    EXPECT_EQ(accepted.body, "slow");

    ts.stop();
    EXPECT_EQ(ts.server.stats().rejectedConcurrency, 1U);
  }
  EXPECT_EQ(logs.count("Exceeded concurrency limit."), 1U);
}

TEST(HttpConcurrency, HandlersOfDifferentConnectionsInterleave) {
  RequestHandler handler = [](const Scope& scope, Receive, Send send, RequestContext& context) -> RequestTask<void> {
    co_await context.sleepFor(scope.path == "/slow" ? 200ms : 1ms);
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", std::to_string(scope.path.size())}});
    co_await send(start);
    co_await send(SendEvent::Body(scope.path));
  };
  test::TestServer ts(ServerConfig{}, handler);
  test::ClientConnection slow(ts.port());
  test::sendAll(slow.fd(), "GET /slow HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");

  const auto start = std::chrono::steady_clock::now();
  test::RequestOptions opt;
  opt.target = "/fast";
  const auto fast = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  EXPECT_EQ(fast.body, "/fast");
  EXPECT_LT(std::chrono::steady_clock::now() - start, 150ms);

  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(slow.fd())).body, "/slow");
}

TEST(HttpConcurrency, ContextIsPrivateToEachHandler) {
  RequestHandler handler = [](const Scope& scope, Receive, Send send, RequestContext& context) -> RequestTask<void> {
    std::string body = *context.find("tenant");
    if (scope.path == "/set") {
      context.set("tenant", "changed");
      context.set("user", "alice");
    }
    co_await context.yield();
    body += ',' + *context.find("tenant") + ',' + std::to_string(context.size());
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", std::to_string(body.size())}});
    co_await send(start);
    co_await send(SendEvent::Body(body));
  };
  test::TestServer ts(ServerConfig{}.withContextDefault("tenant", "acme"), handler);
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "GET /set HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).body, "acme,changed,2");
  test::sendAll(cnx.fd(), "GET /get HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).body, "acme,acme,1");
}

TEST(HttpConcurrency, ConnectionStateIsSharedAcrossRequests) {
  RequestHandler handler = [](const Scope& scope, Receive, Send send, RequestContext&) -> RequestTask<void> {
    int* counter = scope.state->find<int>("counter");
    if (counter == nullptr) {
      scope.state->set("counter", 1);
      counter = scope.state->find<int>("counter");
    } else {
      ++*counter;
    }
    const std::string body = std::to_string(*counter);
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", std::to_string(body.size())}});
    co_await send(start);
    co_await send(SendEvent::Body(body));
  };
  test::TestServer ts(ServerConfig{}, handler);
  for (int round = 0; round < 2; ++round) {
    test::ClientConnection cnx(ts.port());
    for (int idx = 1; idx <= 2; ++idx) {
      test::sendAll(cnx.fd(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
      EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).body, std::to_string(idx));
    }
  }
}

}  // namespace portico
