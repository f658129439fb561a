#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "portico/flow-controller.hpp"
#include "portico/internal/bridge-host.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/request-bridge.hpp"
#include "portico/scope.hpp"
#include "portico/wire-codec.hpp"

namespace portico::test {

// BridgeHost recording every notification, for unit tests driving RequestBridge and HandlerSupervisor without a
// server. Its connection states have no socket.
class FakeBridgeHost : public internal::BridgeHost {
 public:
  void queueResponseBytes(internal::ConnectionState& connection, std::size_t nbBytes) override;
  void onResponseComplete(internal::ConnectionState& connection, const RequestBridge& bridge) override;
  void onBodyConsumed(internal::ConnectionState& connection, std::size_t nbBytes) override;
  void abortConnection(internal::ConnectionState& connection) override;
  void onHandlerFinished(internal::ConnectionState* connection, RequestBridge& bridge) override;
  [[nodiscard]] std::string_view currentDate() const noexcept override { return "Mon, 19 Oct 2026 10:00:00 GMT"; }

  [[nodiscard]] std::unique_ptr<internal::ConnectionState> makeConnection(http::FlowWatermarks watermarks = {}) const;

  // Bridge bound to 'connection' answering 'GET /' in HTTP/1.1 with keep-alive.
  [[nodiscard]] std::shared_ptr<RequestBridge> makeBridge(internal::ConnectionState& connection,
                                                          bool expectContinue = false, bool headRequest = false);

  std::size_t nbQueuedBytes{0};
  std::size_t nbConsumedBytes{0};
  int nbResponsesComplete{0};
  int nbAborts{0};
  int nbHandlersFinished{0};
  int nbFinishedDetached{0};
};

}  // namespace portico::test
