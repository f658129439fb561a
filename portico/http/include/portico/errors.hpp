#pragma once

#include <stdexcept>
#include <string>

namespace portico {

// A handler (or the engine on its behalf) broke the request / response contract:
// response events out of order, wrong response framing, invalid response headers.
class ProtocolViolation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// Raised at a suspension point of a handler task that has been cancelled by a forced shutdown.
class RequestCancelled : public std::runtime_error {
 public:
  RequestCancelled() : std::runtime_error("request handler cancelled") {}
};

// The lifespan handler reported (or crashed during) a startup failure.
class LifespanFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace portico
