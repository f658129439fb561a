#include "portico/url-decode.hpp"

#include <string>
#include <string_view>

#include "portico/char-hexadecimal-converter.hpp"

namespace portico::url {

char* DecodeInPlace(char* first, const char* last) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    const int v1 = first + 2 < last ? from_hex_digit(first[1]) : -1;
    const int v2 = first + 2 < last ? from_hex_digit(first[2]) : -1;
    if (v1 < 0 || v2 < 0) {
      *out++ = '%';
      continue;
    }
    *out++ = static_cast<char>((v1 << 4) | v2);
    first += 2;
  }
  return out;
}

std::string DecodePath(std::string_view rawPath) {
  std::string decoded(rawPath);
  char* newEnd = DecodeInPlace(decoded.data(), decoded.data() + decoded.size());
  decoded.resize(static_cast<std::string::size_type>(newEnd - decoded.data()));
  return decoded;
}

}  // namespace portico::url
