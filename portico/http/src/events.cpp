#include "portico/events.hpp"

#include <string_view>

namespace portico {

std::string_view SendEventTypeName(SendEvent::Type type) noexcept {
  switch (type) {
    case SendEvent::Type::ResponseStart:
      return "response start";
    case SendEvent::Type::ResponseBody:
      return "response body";
    case SendEvent::Type::Disconnect:
      return "disconnect";
    default:
      return "unknown";
  }
}

}  // namespace portico
