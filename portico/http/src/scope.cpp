#include "portico/scope.hpp"

#include <string>
#include <string_view>

#include "portico/http-header.hpp"

namespace portico {

const std::string* Scope::header(std::string_view name) const noexcept {
  const http::Header* found = http::FindHeader(headers, name);
  return found == nullptr ? nullptr : &found->value;
}

}  // namespace portico
