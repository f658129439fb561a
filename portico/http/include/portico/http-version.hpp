#pragma once

#include <cstdint>
#include <string_view>

namespace portico::http {

// The only two protocol versions spoken by the engine.
enum class Version : uint8_t { Http10, Http11 };

// "1.0" or "1.1", as exposed in the request scope and the access log.
constexpr std::string_view VersionNumber(Version version) noexcept {
  return version == Version::Http10 ? std::string_view("1.0") : std::string_view("1.1");
}

}  // namespace portico::http
