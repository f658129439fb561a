#pragma once

#include <string>
#include <string_view>

namespace portico::url {

// Decodes within the provided buffer, compacting percent-encoded sequences.
// Invalid sequences (truncated % or non-hex digits) are kept literally.
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, const char* last);

// Best effort percent-decoding of a request path. Invalid sequences are kept as is.
std::string DecodePath(std::string_view rawPath);

}  // namespace portico::url
