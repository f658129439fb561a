#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "portico/http-header.hpp"
#include "portico/http-version.hpp"

namespace portico {

class StateBag;

// Per-request immutable snapshot of everything a handler needs to know about the request.
struct Scope {
  struct Address {
    std::string host;
    uint16_t port{0};

    bool operator==(const Address&) const noexcept = default;
  };

  // First header with given name (case-insensitive), nullptr if absent.
  [[nodiscard]] const std::string* header(std::string_view name) const noexcept;

  // "1.0" or "1.1"
  [[nodiscard]] std::string_view httpVersionNumber() const noexcept { return http::VersionNumber(httpVersion); }

  http::Version httpVersion{http::Version::Http11};
  std::string method;
  std::string scheme{"http"};
  // percent-decoded path, prefixed by rootPath
  std::string path;
  // path as received on the wire (prefixed by rootPath), without the query
  std::string rawPath;
  // bytes after '?', not decoded
  std::string queryString;
  std::string rootPath;
  // header names are lower case, values as received, arrival order preserved
  http::HeaderList headers;
  std::optional<Address> client;
  std::optional<Address> server;
  // shared by every request of the same connection
  std::shared_ptr<StateBag> state;
};

}  // namespace portico
