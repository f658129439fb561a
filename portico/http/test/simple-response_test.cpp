#include "portico/simple-response.hpp"

#include <gtest/gtest.h>

#include <string_view>

#include "portico/http-status-code.hpp"
#include "portico/raw-chars.hpp"

namespace portico::http {

TEST(SimpleResponse, BadRequest) {
  RawChars out;
  AppendSimpleResponse(StatusCodeBadRequest, "Invalid HTTP request received.", "portico", "", out);
  EXPECT_EQ(std::string_view(out),
            "HTTP/1.1 400 Bad Request\r\nserver: portico\r\ncontent-type: text/plain; charset=utf-8\r\n"
            "content-length: 30\r\nconnection: close\r\n\r\nInvalid HTTP request received.");
}

TEST(SimpleResponse, EmptyBodyUsesReasonPhrase) {
  RawChars out;
  AppendSimpleResponse(StatusCodeServiceUnavailable, {}, {}, "Sun, 06 Nov 1994 08:49:37 GMT", out);
  std::string_view str(out);
  EXPECT_TRUE(str.starts_with("HTTP/1.1 503 Service Unavailable\r\ndate: Sun, 06 Nov 1994 08:49:37 GMT\r\n"));
  EXPECT_TRUE(str.ends_with("content-length: 19\r\nconnection: close\r\n\r\nService Unavailable"));
  EXPECT_EQ(str.find("server:"), std::string_view::npos);
}

}  // namespace portico::http
