#pragma once

#include <cstddef>

namespace portico {

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

/// Writes the lower case hexadecimal representation of 'value' without leading zeros into 'buf'.
/// 'buf' should have space for at least 2 * sizeof(std::size_t) chars.
/// Returns a pointer past the last written char.
constexpr char* to_lower_hex(std::size_t value, char* buf) {
  constexpr const char* const kHexits = "0123456789abcdef";
  char tmp[2 * sizeof(std::size_t)];
  char* pos = tmp + sizeof(tmp);
  do {
    *--pos = kHexits[value & 0x0F];
    value >>= 4U;
  } while (value != 0);
  for (; pos != tmp + sizeof(tmp); ++pos) {
    *buf++ = *pos;
  }
  return buf;
}

}  // namespace portico
