#pragma once

#include <cstddef>
#include <string_view>

namespace portico {
class RequestBridge;
}  // namespace portico

namespace portico::internal {

struct ConnectionState;

// Services a RequestBridge needs from the server owning its connection.
// None of them performs I/O or closes anything synchronously: they only update accounting and mark the connection
// for servicing by the event loop, so they are safe to call from inside a running handler.
class BridgeHost {
 public:
  virtual ~BridgeHost() = default;

  // 'nbBytes' were appended to the outbound buffer of 'connection'.
  virtual void queueResponseBytes(ConnectionState& connection, std::size_t nbBytes) = 0;

  // The last response event of 'bridge' has been encoded.
  virtual void onResponseComplete(ConnectionState& connection, const RequestBridge& bridge) = 0;

  // 'nbBytes' of request body were handed to the handler.
  virtual void onBodyConsumed(ConnectionState& connection, std::size_t nbBytes) = 0;

  // Closes 'connection' as soon as possible, without flushing pending output.
  virtual void abortConnection(ConnectionState& connection) = 0;

  // The handler of 'bridge' completed. 'connection' is nullptr if the bridge was already detached.
  virtual void onHandlerFinished(ConnectionState* connection, RequestBridge& bridge) = 0;

  // Current value of the 'date' response header.
  [[nodiscard]] virtual std::string_view currentDate() const noexcept = 0;
};

}  // namespace portico::internal
