#include "portico/internal/handler-supervisor.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <coroutine>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "portico/errors.hpp"
#include "portico/events.hpp"
#include "portico/fake-bridge-host.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/internal/scheduler.hpp"
#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-handler.hpp"
#include "portico/request-task.hpp"
#include "portico/scope.hpp"
#include "portico/timedef.hpp"

namespace portico::internal {

namespace {

class HandlerSupervisorTest : public ::testing::Test {
 protected:
  HandlerSupervisorTest() : connection(host.makeConnection()), bridge(host.makeBridge(*connection)) {}

  std::string_view output() const { return connection->outBuffer; }

  // The handler object must outlive the coroutine frames it creates (lambda captures live in it).
  UnitId spawn(const std::shared_ptr<RequestBridge>& requestBridge, RequestHandler handler) {
    handlers.push_back(std::move(handler));
    return supervisor.spawn(requestBridge, handlers.back());
  }

  test::FakeBridgeHost host;
  std::unique_ptr<ConnectionState> connection;
  std::shared_ptr<RequestBridge> bridge;
  std::deque<RequestHandler> handlers;
  Scheduler scheduler;
  HandlerSupervisor supervisor{scheduler, RequestContext::Values{{"tenant", "default"}}};
};

RequestTask<void> Hello(const Scope&, Receive, Send send, RequestContext&) {
  const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", "5"}});
  co_await send(start);
  co_await send(SendEvent::Body("hello"));
}

}  // namespace

TEST_F(HandlerSupervisorTest, SpawnIsLazy) {
  const UnitId id = spawn(bridge, Hello);
  EXPECT_NE(id, 0U);
  EXPECT_EQ(supervisor.nbRunning(), 1U);
  EXPECT_TRUE(supervisor.hasReady());
  EXPECT_FALSE(bridge->responseStarted());
  EXPECT_EQ(bridge->unit()->id, id);
}

TEST_F(HandlerSupervisorTest, RunsHandlerToCompletion) {
  spawn(bridge, Hello);
  EXPECT_EQ(supervisor.runReady(SteadyClock::now()), 1U);
  EXPECT_EQ(supervisor.nbRunning(), 0U);
  EXPECT_TRUE(bridge->responseComplete());
  EXPECT_TRUE(bridge->handlerDone());
  EXPECT_EQ(bridge->unit(), nullptr);
  EXPECT_EQ(host.nbResponsesComplete, 1);
  EXPECT_EQ(host.nbHandlersFinished, 1);
  EXPECT_TRUE(output().starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_TRUE(output().ends_with("\r\n\r\nhello"));
  EXPECT_EQ(supervisor.nbHandlerErrors(), 0U);
}

TEST_F(HandlerSupervisorTest, ExceptionBeforeResponseAnswers500) {
  spawn(bridge, [](const Scope&, Receive, Send, RequestContext&) -> RequestTask<void> {
    throw std::runtime_error("handler bug");
    co_return;
  });
  supervisor.runReady(SteadyClock::now());
  EXPECT_EQ(supervisor.nbHandlerErrors(), 1U);
  EXPECT_TRUE(output().starts_with("HTTP/1.1 500 Internal Server Error\r\n"));
  EXPECT_NE(output().find("connection: close\r\n"), std::string_view::npos);
  EXPECT_FALSE(bridge->framing().keepAlive);
  EXPECT_EQ(host.nbAborts, 0);
}

TEST_F(HandlerSupervisorTest, ExceptionThrownByHandlerFactory) {
  const UnitId id = spawn(bridge, [](const Scope&, Receive, Send, RequestContext&) -> RequestTask<void> {
    throw std::runtime_error("not even a coroutine");
  });
  EXPECT_EQ(id, 0U);
  EXPECT_EQ(supervisor.nbRunning(), 0U);
  EXPECT_EQ(supervisor.nbHandlerErrors(), 1U);
  EXPECT_TRUE(output().starts_with("HTTP/1.1 500 "));
  EXPECT_EQ(host.nbHandlersFinished, 1);
}

TEST_F(HandlerSupervisorTest, ExceptionAfterResponseStartAbortsConnection) {
  spawn(bridge, [](const Scope&, Receive, Send send, RequestContext&) -> RequestTask<void> {
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-length", "10"}});
    co_await send(start);
    co_await send(SendEvent::Body("abc", true));
    throw std::runtime_error("midway");
  });
  supervisor.runReady(SteadyClock::now());
  EXPECT_EQ(supervisor.nbHandlerErrors(), 1U);
  EXPECT_EQ(host.nbAborts, 1);
  EXPECT_EQ(connection->closeMode, ConnectionState::CloseMode::Immediate);
  EXPECT_FALSE(bridge->responseComplete());
}

TEST_F(HandlerSupervisorTest, ReturnWithoutResponseAnswers500) {
  spawn(bridge, [](const Scope&, Receive, Send, RequestContext&) -> RequestTask<void> { co_return; });
  supervisor.runReady(SteadyClock::now());
  EXPECT_TRUE(output().starts_with("HTTP/1.1 500 "));
  EXPECT_EQ(supervisor.nbHandlerErrors(), 0U);
}

TEST_F(HandlerSupervisorTest, ReturnWithIncompleteResponseAborts) {
  spawn(bridge, [](const Scope&, Receive, Send send, RequestContext&) -> RequestTask<void> {
    co_await send(SendEvent::Start(http::StatusCodeOK));
    co_await send(SendEvent::Body("partial", true));
  });
  supervisor.runReady(SteadyClock::now());
  EXPECT_EQ(host.nbAborts, 1);
}

TEST_F(HandlerSupervisorTest, ProtocolViolationAfterCompletionIsAHandlerError) {
  spawn(bridge, [](const Scope&, Receive, Send send, RequestContext&) -> RequestTask<void> {
    co_await send(SendEvent::Start(http::StatusCodeNoContent));
    co_await send(SendEvent::Body(""));
    co_await send(SendEvent::Body("again"));
  });
  supervisor.runReady(SteadyClock::now());
  EXPECT_EQ(supervisor.nbHandlerErrors(), 1U);
  EXPECT_TRUE(bridge->responseComplete());
  EXPECT_EQ(host.nbAborts, 0);
  EXPECT_EQ(host.nbResponsesComplete, 1);
}

TEST_F(HandlerSupervisorTest, ReceiveSuspendsUntilWoken) {
  std::string received;
  spawn(bridge, [&received](const Scope&, Receive receive, Send send, RequestContext&) -> RequestTask<void> {
    for (;;) {
      ReceiveEvent event = co_await receive();
      received += event.body;
      if (!event.moreBody) {
        break;
      }
    }
    co_await send(SendEvent::Start(http::StatusCodeOK));
    co_await send(SendEvent::Body(received));
  });

  EXPECT_EQ(supervisor.runReady(SteadyClock::now()), 1U);
  EXPECT_EQ(bridge->unit()->wait, HandlerUnit::Wait::Receive);
  EXPECT_FALSE(supervisor.hasReady());

  bridge->appendBody("abc");
  EXPECT_TRUE(supervisor.hasReady());
  supervisor.runReady(SteadyClock::now());
  EXPECT_EQ(received, "abc");
  EXPECT_EQ(host.nbConsumedBytes, 3U);

  bridge->appendBody("def");
  bridge->markMessageComplete();
  supervisor.runReady(SteadyClock::now());
  EXPECT_EQ(received, "abcdef");
  EXPECT_TRUE(bridge->responseComplete());
  EXPECT_EQ(supervisor.nbRunning(), 0U);
}

TEST_F(HandlerSupervisorTest, WakeForAnotherReasonIsIgnored) {
  const UnitId id = spawn(bridge, [](const Scope&, Receive receive, Send, RequestContext&) -> RequestTask<void> {
    co_await receive();
  });
  supervisor.runReady(SteadyClock::now());
  supervisor.wake(id, HandlerUnit::Wait::Writable);
  supervisor.wake(id, HandlerUnit::Wait::Timer);
  EXPECT_FALSE(supervisor.hasReady());
  supervisor.wake(id + 100, HandlerUnit::Wait::Receive);
  EXPECT_FALSE(supervisor.hasReady());
}

TEST_F(HandlerSupervisorTest, SleepResumesAfterDeadline) {
  bool resumed = false;
  spawn(bridge, [&resumed](const Scope&, Receive, Send send, RequestContext& context) -> RequestTask<void> {
    co_await context.sleepFor(std::chrono::milliseconds{50});
    resumed = true;
    co_await send(SendEvent::Start(http::StatusCodeNoContent));
    co_await send(SendEvent::Body(""));
  });
  const auto start = SteadyClock::now();
  supervisor.runReady(start);
  EXPECT_FALSE(resumed);
  ASSERT_TRUE(supervisor.nextDeadline().has_value());
  EXPECT_GE(*supervisor.nextDeadline(), start + std::chrono::milliseconds{50});

  supervisor.runReady(start);
  EXPECT_FALSE(resumed);

  supervisor.runReady(start + std::chrono::seconds{1});
  EXPECT_TRUE(resumed);
  EXPECT_TRUE(bridge->responseComplete());
}

TEST_F(HandlerSupervisorTest, YieldLetsOtherUnitsRun) {
  std::string trace;
  auto otherConnection = host.makeConnection();
  auto otherBridge = host.makeBridge(*otherConnection);
  auto makeHandler = [&trace](char tag) {
    return [&trace, tag](const Scope&, Receive, Send send, RequestContext& context) -> RequestTask<void> {
      trace += tag;
      co_await context.yield();
      trace += tag;
      co_await send(SendEvent::Start(http::StatusCodeNoContent));
      co_await send(SendEvent::Body(""));
    };
  };
  spawn(bridge, makeHandler('a'));
  spawn(otherBridge, makeHandler('b'));

  EXPECT_EQ(supervisor.runReady(SteadyClock::now()), 2U);
  EXPECT_EQ(trace, "ab");
  EXPECT_EQ(supervisor.runReady(SteadyClock::now()), 2U);
  EXPECT_EQ(trace, "abab");
  EXPECT_EQ(supervisor.nbRunning(), 0U);
}

TEST_F(HandlerSupervisorTest, ContextStartsFromDefaultsAndIsPrivate) {
  auto otherConnection = host.makeConnection();
  auto otherBridge = host.makeBridge(*otherConnection);
  std::string seenBySecond;
  spawn(bridge, [](const Scope&, Receive, Send send, RequestContext& context) -> RequestTask<void> {
    context.set("tenant", "first");
    context.set("user", "alice");
    co_await context.yield();
    co_await send(SendEvent::Start(http::StatusCodeNoContent));
    co_await send(SendEvent::Body(""));
  });
  spawn(otherBridge, [&seenBySecond](const Scope&, Receive, Send send, RequestContext& context) -> RequestTask<void> {
    co_await context.yield();
    seenBySecond = *context.find("tenant");
    seenBySecond += context.contains("user") ? "+user" : "";
    co_await send(SendEvent::Start(http::StatusCodeNoContent));
    co_await send(SendEvent::Body(""));
  });
  supervisor.runReady(SteadyClock::now());
  supervisor.runReady(SteadyClock::now());
  EXPECT_EQ(seenBySecond, "default");
}

TEST_F(HandlerSupervisorTest, CancelAllDeliversCancellation) {
  bool sawCancellation = false;
  spawn(bridge, [&sawCancellation](const Scope&, Receive receive, Send, RequestContext&) -> RequestTask<void> {
    try {
      co_await receive();
    } catch (const RequestCancelled&) {
      sawCancellation = true;
      throw;
    }
  });
  supervisor.runReady(SteadyClock::now());
  supervisor.cancelAll();
  EXPECT_TRUE(sawCancellation);
  EXPECT_EQ(supervisor.nbRunning(), 0U);
  EXPECT_EQ(supervisor.nbHandlerErrors(), 0U);
  EXPECT_EQ(host.nbAborts, 1);
  EXPECT_EQ(host.nbHandlersFinished, 1);
}

TEST_F(HandlerSupervisorTest, CancelAllCancelsSleepingUnits) {
  spawn(bridge, [](const Scope&, Receive, Send, RequestContext& context) -> RequestTask<void> {
    co_await context.sleepFor(std::chrono::hours{1});
  });
  supervisor.runReady(SteadyClock::now());
  ASSERT_TRUE(supervisor.nextDeadline().has_value());
  supervisor.cancelAll();
  EXPECT_EQ(supervisor.nbRunning(), 0U);
  EXPECT_FALSE(supervisor.nextDeadline().has_value());
}

TEST_F(HandlerSupervisorTest, CancelAllDestroysUnitsThatKeepRunning) {
  spawn(bridge, [](const Scope&, Receive receive, Send, RequestContext&) -> RequestTask<void> {
    try {
      co_await receive();
    } catch (const RequestCancelled&) {
    }
    co_await std::suspend_always{};
  });
  supervisor.runReady(SteadyClock::now());
  supervisor.cancelAll();
  EXPECT_EQ(supervisor.nbRunning(), 0U);
  EXPECT_EQ(host.nbHandlersFinished, 1);
  EXPECT_EQ(bridge->unit(), nullptr);
}

TEST_F(HandlerSupervisorTest, DestructionDestroysSuspendedFrames) {
  auto alive = std::make_shared<bool>(true);
  {
    Scheduler localScheduler;
    RequestHandler handler = [alive](const Scope&, Receive receive, Send, RequestContext&) -> RequestTask<void> {
      std::shared_ptr<bool> keep = alive;
      co_await receive();
    };
    HandlerSupervisor localSupervisor(localScheduler, {});
    localSupervisor.spawn(bridge, handler);
    localSupervisor.runReady(SteadyClock::now());
    EXPECT_EQ(alive.use_count(), 3);
  }
  EXPECT_EQ(alive.use_count(), 1);
  EXPECT_EQ(bridge->unit(), nullptr);
}

}  // namespace portico::internal
