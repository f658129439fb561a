#include "portico/simple-response.hpp"

#include <charconv>
#include <cstddef>
#include <limits>
#include <string_view>

#include "portico/http-constants.hpp"
#include "portico/http-status-code.hpp"
#include "portico/raw-chars.hpp"

namespace portico::http {

void AppendSimpleResponse(StatusCode status, std::string_view body, std::string_view serverHeader,
                          std::string_view date, RawChars& out) {
  const std::string_view reason = ReasonPhraseFor(status);
  if (body.empty()) {
    body = reason;
  }
  char buf[std::numeric_limits<std::size_t>::digits10 + 1];

  out.append(HTTP11Sv);
  out.push_back(' ');
  out.append(buf, std::to_chars(buf, buf + sizeof(buf), static_cast<int>(status)).ptr);
  out.push_back(' ');
  out.append(reason);
  out.append(CRLF);
  if (!serverHeader.empty()) {
    out.append(Server);
    out.append(HeaderSep);
    out.append(serverHeader);
    out.append(CRLF);
  }
  if (!date.empty()) {
    out.append(Date);
    out.append(HeaderSep);
    out.append(date);
    out.append(CRLF);
  }
  out.append(ContentType);
  out.append(HeaderSep);
  out.append(ContentTypeTextPlain);
  out.append(CRLF);
  out.append(ContentLength);
  out.append(HeaderSep);
  out.append(buf, std::to_chars(buf, buf + sizeof(buf), body.size()).ptr);
  out.append(CRLF);
  out.append(Connection);
  out.append(HeaderSep);
  out.append(close);
  out.append(DoubleCRLF);
  out.append(body);
}

}  // namespace portico::http
