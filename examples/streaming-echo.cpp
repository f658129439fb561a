#include <portico/portico.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace portico;

// Streams the request body back to the client as it arrives (chunked response), after an optional delay given in
// milliseconds by the 'delay' query parameter. A 'db' connection pool is created by the lifespan handler and its
// name is echoed in the 'x-pool' header.
int main(int argc, char** argv) {
  uint16_t port = 0;
  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  LifespanHandler lifespan = [](LifespanReceive receive, LifespanSend send, StateBag& state) -> RequestTask<void> {
    for (;;) {
      const LifespanEvent event = co_await receive();
      if (event.type == LifespanEvent::Type::Startup) {
        state.set("db", std::string("pool-0"));
        co_await send(LifespanMessage::StartupComplete());
      } else {
        co_await send(LifespanMessage::ShutdownComplete());
        co_return;
      }
    }
  };

  RequestHandler echo = [](const Scope& scope, Receive receive, Send send,
                           RequestContext& context) -> RequestTask<void> {
    if (scope.queryString.starts_with("delay=")) {
      co_await context.sleepFor(std::chrono::milliseconds(std::stoi(scope.queryString.substr(6))));
    }
    const auto* pool = scope.state->find<std::string>("db");
    const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-type", "application/octet-stream"},
                                                                  {"x-pool", pool == nullptr ? "none" : *pool}});
    co_await send(start);
    for (;;) {
      ReceiveEvent event = co_await receive();
      if (event.isDisconnect()) {
        co_return;
      }
      // suspends while the client does not read fast enough
      co_await send(SendEvent::Body(event.body, event.moreBody));
      if (!event.moreBody) {
        break;
      }
    }
  };

  try {
    HttpServer server(ServerConfig{}
                          .withPort(port)
                          .withSignalHandlers()
                          .withReadWatermarks(256UL * 1024UL, 64UL * 1024UL)
                          .withGracefulShutdownTimeout(std::chrono::seconds(10))
                          .withLimitConcurrency(1000),
                      echo, lifespan);
    server.run();
  } catch (const std::exception& e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
