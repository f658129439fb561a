#include "portico/http-header.hpp"

#include <string_view>

#include "portico/string-equal-ignore-case.hpp"

namespace portico::http {

const Header* FindHeader(const HeaderList& headers, std::string_view name) noexcept {
  for (const Header& header : headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return &header;
    }
  }
  return nullptr;
}

}  // namespace portico::http
