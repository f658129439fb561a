#include "portico/internal/connection-state.hpp"

#include <memory>
#include <utility>

#include "portico/connection.hpp"
#include "portico/flow-controller.hpp"
#include "portico/timedef.hpp"
#include "portico/wire-codec.hpp"

namespace portico::internal {

ConnectionState::ConnectionState(Connection cnx, std::unique_ptr<http::IWireCodec> wireCodec,
                                 http::FlowWatermarks watermarks, SteadyTimePoint now)
    : connection(std::move(cnx)),
      transport(connection.fd()),
      codec(std::move(wireCodec)),
      flow(watermarks),
      lastActivity(now) {}

ConnectionState::Phase ConnectionState::phase() const noexcept {
  if (closed) {
    return Phase::Closed;
  }
  if (closeMode != CloseMode::None) {
    return Phase::Closing;
  }
  if (cycles.empty()) {
    return outBuffer.empty() ? Phase::AwaitingRequest : Phase::WritingResponse;
  }
  const RequestBridge& front = *cycles.front().bridge;
  if (front.responseStarted()) {
    return Phase::WritingResponse;
  }
  if (!front.messageComplete()) {
    return Phase::ReadingBody;
  }
  return Phase::AwaitingResponse;
}

}  // namespace portico::internal
