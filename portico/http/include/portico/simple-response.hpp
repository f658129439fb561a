#pragma once

#include <string_view>

#include "portico/http-status-code.hpp"
#include "portico/raw-chars.hpp"

namespace portico::http {

// Appends a complete plain text response emitted by the engine itself (protocol errors, timeouts, limits, failed
// handlers). It always carries 'connection: close'. An empty body is replaced by the reason phrase.
void AppendSimpleResponse(StatusCode status, std::string_view body, std::string_view serverHeader,
                          std::string_view date, RawChars& out);

}  // namespace portico::http
