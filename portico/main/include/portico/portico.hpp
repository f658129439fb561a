// portico Umbrella Header
//
// Include this single header to pull in the public API needed to write and serve an application:
//   - HttpServer, ServerConfig, ServerStats
//   - RequestHandler / SimpleRequestHandler and their RequestTask coroutine type
//   - Scope, ReceiveEvent / SendEvent, Receive / Send, RequestContext
//   - Lifespan events and handler, StateBag
//   - HTTP status codes, headers and versions
//
// Internal engine types (connection state, wire codec, handler supervisor) are not re-exported.
//
// Usage Example:
//    #include <portico/portico.hpp>
//    using namespace portico;
//    int main() {
//      HttpServer server(ServerConfig{}.withPort(8080),
//                        MakeRequestHandler([](const Scope&, Receive, Send send) -> RequestTask<void> {
//                          co_await send(SendEvent::Start(http::StatusCodeOK, {{"content-type", "text/plain"}}));
//                          co_await send(SendEvent::Body("hello\n"));
//                        }));
//      server.run();
//    }
#pragma once

// IWYU pragma: begin_exports
#include "portico/errors.hpp"
#include "portico/events.hpp"
#include "portico/http-header.hpp"
#include "portico/http-server.hpp"
#include "portico/http-status-code.hpp"
#include "portico/http-version.hpp"
#include "portico/lifespan.hpp"
#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-handler.hpp"
#include "portico/request-task.hpp"
#include "portico/scope.hpp"
#include "portico/server-config.hpp"
#include "portico/server-stats.hpp"
#include "portico/state-bag.hpp"
// IWYU pragma: end_exports
