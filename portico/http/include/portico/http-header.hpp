#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace portico::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

// Ordered header list. Duplicates are preserved in arrival order.
using HeaderList = std::vector<Header>;

// token chars as defined in RFC 9110 5.6.2
constexpr bool IsTChar(char ch) noexcept {
  if ((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

constexpr bool IsToken(std::string_view str) noexcept {
  if (str.empty()) {
    return false;
  }
  for (char ch : str) {
    if (!IsTChar(ch)) {
      return false;
    }
  }
  return true;
}

constexpr bool IsValidHeaderName(std::string_view name) noexcept { return IsToken(name); }

// Visible chars, SP, HTAB and obs-text. CR, LF and other controls are rejected.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  for (char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    if ((uch < 0x20 && uch != '\t') || uch == 0x7F) {
      return false;
    }
  }
  return true;
}

// First header of the list whose name equals 'name' ignoring case, nullptr if none.
const Header* FindHeader(const HeaderList& headers, std::string_view name) noexcept;

}  // namespace portico::http
