#pragma once

#include <cstddef>
#include <string_view>

#include "portico/http-status-code.hpp"  // IWYU pragma: export

namespace portico::http {

// Header field names are case-insensitive. Names below are lower case, which is how the engine stores request
// headers and how it emits its own response headers.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";

inline constexpr std::string_view Connection = "connection";
inline constexpr std::string_view TransferEncoding = "transfer-encoding";
inline constexpr std::string_view ContentLength = "content-length";
inline constexpr std::string_view ContentType = "content-type";
inline constexpr std::string_view Expect = "expect";
inline constexpr std::string_view Host = "host";
inline constexpr std::string_view Date = "date";
inline constexpr std::string_view Server = "server";
inline constexpr std::string_view XForwardedFor = "x-forwarded-for";
inline constexpr std::string_view XForwardedProto = "x-forwarded-proto";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view h100_continue = "100-continue";

inline constexpr std::string_view HTTP11_100_CONTINUE = "HTTP/1.1 100 Continue\r\n\r\n";
inline constexpr std::string_view LastChunk = "0\r\n\r\n";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";

}  // namespace portico::http
