#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "portico/http-header.hpp"
#include "portico/http-status-code.hpp"

namespace portico {

// Event delivered to a request handler by co_await receive().
struct ReceiveEvent {
  enum class Type : std::uint8_t { Request, Disconnect };

  static ReceiveEvent Disconnect() { return ReceiveEvent{Type::Disconnect, {}, false}; }

  [[nodiscard]] bool isDisconnect() const noexcept { return type == Type::Disconnect; }

  Type type{Type::Request};
  // Request body bytes (may be empty)
  std::string body;
  // true if more body bytes will follow in a later Request event
  bool moreBody{false};
};

// Event emitted by a request handler through co_await send(event).
// A response is exactly one ResponseStart followed by one or more ResponseBody, the last one with moreBody false.
// Disconnect asks the engine to abort the connection.
struct SendEvent {
  enum class Type : std::uint8_t { ResponseStart, ResponseBody, Disconnect };

  static SendEvent Start(http::StatusCode status, http::HeaderList headers = {}) {
    SendEvent event;
    event.type = Type::ResponseStart;
    event.status = status;
    event.headers = std::move(headers);
    return event;
  }

  static SendEvent Body(std::string_view body, bool moreBody = false) {
    SendEvent event;
    event.type = Type::ResponseBody;
    event.body = std::string(body);
    event.moreBody = moreBody;
    return event;
  }

  static SendEvent Disconnect() {
    SendEvent event;
    event.type = Type::Disconnect;
    return event;
  }

  Type type{Type::ResponseStart};
  http::StatusCode status{http::StatusCodeOK};
  http::HeaderList headers;
  std::string body;
  bool moreBody{false};
};

std::string_view SendEventTypeName(SendEvent::Type type) noexcept;

}  // namespace portico
