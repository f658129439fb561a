#include "portico/request-handler.hpp"

#include <utility>

#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-task.hpp"
#include "portico/scope.hpp"

namespace portico {

RequestHandler MakeRequestHandler(SimpleRequestHandler handler) {
  return [handler = std::move(handler)](const Scope& scope, Receive receive, Send send, RequestContext&) {
    return handler(scope, std::move(receive), std::move(send));
  };
}

}  // namespace portico
