#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace portico {

// ASCII lower case, no locale.
constexpr char LowerAscii(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (LowerAscii(*pLhs) != LowerAscii(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Tells whether the comma separated list 'value' (as found in Connection or Transfer-Encoding headers)
// contains 'token', ignoring case and optional whitespace around elements.
constexpr bool ListContainsTokenCaseInsensitive(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    std::string_view elem = value.substr(0, commaPos);
    while (!elem.empty() && (elem.front() == ' ' || elem.front() == '\t')) {
      elem.remove_prefix(1);
    }
    while (!elem.empty() && (elem.back() == ' ' || elem.back() == '\t')) {
      elem.remove_suffix(1);
    }
    if (CaseInsensitiveEqual(elem, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

inline std::string ToLower(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = LowerAscii(ch);
  }
  return ret;
}

struct CaseInsensitiveHashFunc {
  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 0;
    const char* beg = str.data();
    const char* end = beg + str.size();
    for (; beg != end; ++beg) {
      const auto lower = static_cast<std::size_t>(LowerAscii(*beg));
      hash ^= lower + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (hash << 6) + (hash >> 2);
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace portico
