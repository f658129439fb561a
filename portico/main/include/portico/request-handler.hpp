#pragma once

#include <functional>

#include "portico/request-bridge.hpp"
#include "portico/request-context.hpp"
#include "portico/request-task.hpp"
#include "portico/scope.hpp"

namespace portico {

// Application callable invoked once per request. The scope reference stays valid until the returned task completes.
using RequestHandler = std::function<RequestTask<void>(const Scope&, Receive, Send, RequestContext&)>;

// Handler form that does not need its execution context.
using SimpleRequestHandler = std::function<RequestTask<void>(const Scope&, Receive, Send)>;

RequestHandler MakeRequestHandler(SimpleRequestHandler handler);

}  // namespace portico
