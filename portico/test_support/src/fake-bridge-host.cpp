#include "portico/fake-bridge-host.hpp"

#include <cstddef>
#include <memory>
#include <utility>

#include "portico/connection.hpp"
#include "portico/flow-controller.hpp"
#include "portico/http-version.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/request-bridge.hpp"
#include "portico/scope.hpp"
#include "portico/timedef.hpp"
#include "portico/wire-codec.hpp"

namespace portico::test {

void FakeBridgeHost::queueResponseBytes(internal::ConnectionState& connection, std::size_t nbBytes) {
  connection.flow.onBytesQueuedForWrite(nbBytes);
  nbQueuedBytes += nbBytes;
}

void FakeBridgeHost::onResponseComplete([[maybe_unused]] internal::ConnectionState& connection,
                                        [[maybe_unused]] const RequestBridge& bridge) {
  ++nbResponsesComplete;
}

void FakeBridgeHost::onBodyConsumed(internal::ConnectionState& connection, std::size_t nbBytes) {
  connection.flow.onBytesConsumed(nbBytes);
  nbConsumedBytes += nbBytes;
}

void FakeBridgeHost::abortConnection(internal::ConnectionState& connection) {
  connection.requestImmediateClose();
  ++nbAborts;
}

void FakeBridgeHost::onHandlerFinished(internal::ConnectionState* connection,
                                       [[maybe_unused]] RequestBridge& bridge) {
  ++nbHandlersFinished;
  if (connection == nullptr) {
    ++nbFinishedDetached;
  }
}

std::unique_ptr<internal::ConnectionState> FakeBridgeHost::makeConnection(http::FlowWatermarks watermarks) const {
  return std::make_unique<internal::ConnectionState>(Connection{}, http::MakeWireCodec(http::HttpCodecKind::Strict),
                                                     watermarks, SteadyClock::now());
}

std::shared_ptr<RequestBridge> FakeBridgeHost::makeBridge(internal::ConnectionState& connection, bool expectContinue,
                                                          bool headRequest) {
  Scope scope;
  scope.method = headRequest ? "HEAD" : "GET";
  scope.path = "/";
  scope.rawPath = "/";
  scope.httpVersion = http::Version::Http11;

  http::ResponseFraming framing;
  framing.requestVersion = http::Version::Http11;
  framing.headRequest = headRequest;
  framing.serverHeader = "portico";

  return std::make_shared<RequestBridge>(*this, connection, std::move(scope), framing,
                                         RequestBridge::RequestInfo{expectContinue});
}

}  // namespace portico::test
