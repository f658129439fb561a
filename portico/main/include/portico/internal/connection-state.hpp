#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>

#include "portico/connection.hpp"
#include "portico/flow-controller.hpp"
#include "portico/raw-chars.hpp"
#include "portico/request-bridge.hpp"
#include "portico/scope.hpp"
#include "portico/state-bag.hpp"
#include "portico/timedef.hpp"
#include "portico/transport.hpp"
#include "portico/wire-codec.hpp"

namespace portico::internal {

// One parsed request of a connection, from its head to the completion of its response.
struct RequestCycle {
  std::shared_ptr<RequestBridge> bridge;
  SteadyTimePoint lastBodyRead;
  bool handlerStarted{false};
};

// Everything the server knows about one accepted connection.
struct ConnectionState {
  enum class Phase : uint8_t { AwaitingRequest, ReadingBody, AwaitingResponse, WritingResponse, Closing, Closed };

  enum class CloseMode : uint8_t {
    None,
    // Stop reading, flush pending output then close.
    DrainThenClose,
    // Close without flushing.
    Immediate
  };

  ConnectionState(Connection cnx, std::unique_ptr<http::IWireCodec> wireCodec, http::FlowWatermarks watermarks,
                  SteadyTimePoint now);

  [[nodiscard]] Phase phase() const noexcept;

  [[nodiscard]] int fd() const noexcept { return connection.fd(); }

  [[nodiscard]] bool isAnyCloseRequested() const noexcept { return closeMode != CloseMode::None; }

  void requestDrainAndClose() noexcept {
    if (closeMode == CloseMode::None) {
      closeMode = CloseMode::DrainThenClose;
    }
  }

  void requestImmediateClose() noexcept { closeMode = CloseMode::Immediate; }

  // Whether the codec is in the middle of a request message (head parsed, message not complete yet).
  [[nodiscard]] bool inMessage() const noexcept { return messageInProgress; }

  Connection connection;
  Transport transport;
  std::unique_ptr<http::IWireCodec> codec;
  http::FlowController flow;
  RawChars inBuffer;
  RawChars outBuffer;
  // Requests whose response is not complete yet, in arrival order. Only the front one may have a running handler.
  std::deque<RequestCycle> cycles;
  std::shared_ptr<StateBag> state;
  std::optional<Scope::Address> client;
  std::optional<Scope::Address> server;
  uint64_t bytesRead{0};
  uint64_t bytesWritten{0};
  uint64_t requestsServed{0};
  // Accept time or end of the last response, whichever is later.
  SteadyTimePoint lastActivity;
  // Arrival of the first byte of the request head being read, if any.
  std::optional<SteadyTimePoint> headStart;
  CloseMode closeMode{CloseMode::None};
  bool messageInProgress{false};
  // The body of the message being read belongs to a request whose response is already complete.
  bool discardingBody{false};
  bool peerClosed{false};
  bool gracefulCloseRequested{false};
  bool closed{false};
  // Last epoll interest registered for this connection.
  uint32_t registeredEvents{0};
};

}  // namespace portico::internal
