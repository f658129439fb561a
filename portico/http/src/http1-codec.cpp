#include "portico/http1-codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "portico/char-hexadecimal-converter.hpp"
#include "portico/errors.hpp"
#include "portico/events.hpp"
#include "portico/http-constants.hpp"
#include "portico/http-header.hpp"
#include "portico/http-status-code.hpp"
#include "portico/http-version.hpp"
#include "portico/raw-chars.hpp"
#include "portico/string-equal-ignore-case.hpp"
#include "portico/string-trim.hpp"
#include "portico/wire-codec.hpp"

namespace portico::http {

namespace {

// Chunk size lines (size + extensions) longer than this are rejected.
constexpr std::size_t kMaxChunkSizeLineLength = 1024;

WireEvent MakeEvent(WireEventKind kind, std::size_t consumed) {
  WireEvent event;
  event.kind = kind;
  event.consumed = consumed;
  return event;
}

bool ParseDecimal(std::string_view str, std::size_t& value) {
  if (str.empty()) {
    return false;
  }
  const char* last = str.data() + str.size();
  const auto [ptr, ec] = std::from_chars(str.data(), last, value);
  return ec == std::errc{} && ptr == last;
}

constexpr bool IsDigit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

StatusCode ParseVersion(std::string_view str, Version& version, std::string_view& reason) {
  if (str == HTTP11Sv) {
    version = Version::Http11;
    return 0;
  }
  if (str == HTTP10Sv) {
    version = Version::Http10;
    return 0;
  }
  if (str.size() == HTTP11Sv.size() && str.starts_with("HTTP/") && IsDigit(str[5]) && str[6] == '.' &&
      IsDigit(str[7])) {
    reason = "Unsupported HTTP version";
    return StatusCodeHTTPVersionNotSupported;
  }
  reason = "Invalid HTTP version";
  return StatusCodeBadRequest;
}

bool IsValidTarget(std::string_view target) noexcept {
  if (target.empty()) {
    return false;
  }
  return std::ranges::none_of(target, [](char ch) {
    const auto uch = static_cast<unsigned char>(ch);
    return uch <= 0x20 || uch == 0x7F;
  });
}

void AppendNumber(std::size_t value, RawChars& out) {
  char buf[std::numeric_limits<std::size_t>::digits10 + 1];
  const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  out.append(buf, ptr);
}

void AppendHeader(std::string_view name, std::string_view value, RawChars& out) {
  out.append(name);
  out.append(HeaderSep);
  out.append(value);
  out.append(CRLF);
}

bool HasHeader(const HeaderList& headers, std::string_view name) { return FindHeader(headers, name) != nullptr; }

}  // namespace

WireEvent Http1CodecBase::parseNextEvent(std::string_view input) {
  switch (_state) {
    case State::Head:
      return parseHead(input);
    case State::FixedBody:
      return parseFixedBody(input);
    case State::Chunked:
      return parseChunked(input);
    case State::Complete:
      _state = State::Head;
      return MakeEvent(WireEventKind::MessageComplete, 0);
    case State::Failed:
      [[fallthrough]];
    default: {
      WireEvent event = MakeEvent(WireEventKind::ParseError, 0);
      event.errorStatus = _errorStatus;
      event.errorReason = _errorReason;
      return event;
    }
  }
}

void Http1CodecBase::reset() noexcept {
  _state = State::Head;
  _chunkState = ChunkState::Size;
  _remaining = 0;
  _trailerBytes = 0;
  _errorStatus = 0;
  _errorReason = {};
}

WireEvent Http1CodecBase::fail(StatusCode status, std::string_view reason) {
  _state = State::Failed;
  _errorStatus = status;
  _errorReason = reason;
  WireEvent event = MakeEvent(WireEventKind::ParseError, 0);
  event.errorStatus = status;
  event.errorReason = reason;
  return event;
}

Http1CodecBase::LineEnd Http1CodecBase::findLineEnd(std::string_view input) const noexcept {
  LineEnd lineEnd;
  const auto lfPos = input.find('\n');
  if (lfPos == std::string_view::npos) {
    return lineEnd;
  }
  if (lfPos != 0 && input[lfPos - 1] == '\r') {
    lineEnd.length = lfPos - 1;
    lineEnd.terminator = 2;
  } else {
    lineEnd.length = lfPos;
    lineEnd.terminator = 1;
    lineEnd.invalid = !allowBareLf();
  }
  return lineEnd;
}

WireEvent Http1CodecBase::parseHead(std::string_view input) {
  // Empty lines preceding a request line are ignored (RFC 9112 2.2)
  std::size_t headStart = 0;
  for (;;) {
    const LineEnd lineEnd = findLineEnd(input.substr(headStart));
    if (lineEnd.terminator == 0 || lineEnd.length != 0) {
      break;
    }
    if (lineEnd.invalid) {
      return fail(StatusCodeBadRequest, "Invalid line terminator");
    }
    headStart += lineEnd.terminator;
  }

  std::size_t pos = headStart;
  std::size_t headEnd = 0;
  for (;;) {
    const LineEnd lineEnd = findLineEnd(input.substr(pos));
    if (lineEnd.terminator == 0) {
      if (input.size() - headStart > _options.maxHeaderBytes) {
        return fail(StatusCodeRequestHeaderFieldsTooLarge, "Request header fields too large");
      }
      return MakeEvent(WireEventKind::NeedData, headStart);
    }
    if (lineEnd.invalid) {
      return fail(StatusCodeBadRequest, "Invalid line terminator");
    }
    if (pos + lineEnd.length - headStart > _options.maxHeaderBytes) {
      return fail(StatusCodeRequestHeaderFieldsTooLarge, "Request header fields too large");
    }
    if (lineEnd.length == 0) {
      headEnd = pos + lineEnd.terminator;
      break;
    }
    pos += lineEnd.length + lineEnd.terminator;
  }

  WireEvent event = MakeEvent(WireEventKind::RequestHead, headEnd);
  std::string_view reason;
  StatusCode status = parseHeadBlock(input.substr(headStart, pos - headStart), event.head, reason);
  if (status == 0) {
    status = resolveFraming(event.head, reason);
  }
  if (status != 0) {
    return fail(status, reason);
  }

  if (event.head.chunked) {
    _state = State::Chunked;
    _chunkState = ChunkState::Size;
    _trailerBytes = 0;
  } else if (event.head.contentLength != 0) {
    _state = State::FixedBody;
    _remaining = event.head.contentLength;
  } else {
    _state = State::Complete;
  }
  return event;
}

StatusCode Http1CodecBase::parseHeadBlock(std::string_view block, RequestHead& head, std::string_view& reason) const {
  std::size_t pos = 0;
  const auto nextLine = [this, block, &pos]() {
    const LineEnd lineEnd = findLineEnd(block.substr(pos));
    const std::string_view line = block.substr(pos, lineEnd.length);
    pos += lineEnd.length + lineEnd.terminator;
    return line;
  };

  const std::string_view requestLine = nextLine();
  if (requestLine.find('\r') != std::string_view::npos) {
    reason = "Invalid line terminator";
    return StatusCodeBadRequest;
  }
  const auto firstSp = requestLine.find(' ');
  const auto lastSp = requestLine.rfind(' ');
  if (firstSp == std::string_view::npos || firstSp == lastSp) {
    reason = "Invalid request line";
    return StatusCodeBadRequest;
  }
  const std::string_view method = requestLine.substr(0, firstSp);
  const std::string_view target = requestLine.substr(firstSp + 1, lastSp - firstSp - 1);
  if (!IsToken(method)) {
    reason = "Invalid request method";
    return StatusCodeBadRequest;
  }
  if (!IsValidTarget(target)) {
    reason = "Invalid request target";
    return StatusCodeBadRequest;
  }
  const StatusCode versionStatus = ParseVersion(requestLine.substr(lastSp + 1), head.version, reason);
  if (versionStatus != 0) {
    return versionStatus;
  }
  head.method = method;
  head.target = target;

  while (pos < block.size()) {
    const std::string_view line = nextLine();
    if (line.find('\r') != std::string_view::npos) {
      reason = "Invalid line terminator";
      return StatusCodeBadRequest;
    }
    if (IsOws(line.front())) {
      if (!allowObsFold() || head.headers.empty()) {
        reason = "Invalid header line folding";
        return StatusCodeBadRequest;
      }
      const std::string_view continuation = TrimOws(line);
      if (!IsValidHeaderValue(continuation)) {
        reason = "Invalid header value";
        return StatusCodeBadRequest;
      }
      if (!continuation.empty()) {
        std::string& value = head.headers.back().value;
        if (!value.empty()) {
          value.push_back(' ');
        }
        value.append(continuation);
      }
      continue;
    }
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      reason = "Invalid header line";
      return StatusCodeBadRequest;
    }
    std::string_view name = line.substr(0, colonPos);
    if (!name.empty() && IsOws(name.back())) {
      if (!allowSpaceBeforeColon()) {
        reason = "Whitespace before header colon";
        return StatusCodeBadRequest;
      }
      name = TrimOws(name);
    }
    if (!IsToken(name)) {
      reason = "Invalid header name";
      return StatusCodeBadRequest;
    }
    const std::string_view value = TrimOws(line.substr(colonPos + 1));
    if (!IsValidHeaderValue(value)) {
      reason = "Invalid header value";
      return StatusCodeBadRequest;
    }
    head.headers.push_back(Header{ToLower(name), std::string(value)});
  }
  return 0;
}

StatusCode Http1CodecBase::resolveFraming(RequestHead& head, std::string_view& reason) const {
  bool hasTransferEncoding = false;
  bool unsupportedCoding = false;
  bool lastIsChunked = false;
  int nbChunked = 0;
  bool connectionClose = false;
  bool connectionKeepAlive = false;
  bool hasHost = false;

  for (const Header& header : head.headers) {
    if (header.name == ContentLength) {
      std::size_t value;
      if (!ParseDecimal(header.value, value)) {
        reason = "Invalid Content-Length";
        return StatusCodeBadRequest;
      }
      if (head.hasContentLength && value != head.contentLength) {
        reason = "Conflicting Content-Length";
        return StatusCodeBadRequest;
      }
      head.contentLength = value;
      head.hasContentLength = true;
    } else if (header.name == TransferEncoding) {
      hasTransferEncoding = true;
      std::string_view codings = header.value;
      while (!codings.empty()) {
        const auto commaPos = codings.find(',');
        const std::string_view coding = TrimOws(codings.substr(0, commaPos));
        if (!coding.empty()) {
          lastIsChunked = CaseInsensitiveEqual(coding, chunked);
          if (lastIsChunked) {
            ++nbChunked;
          } else {
            unsupportedCoding = true;
          }
        }
        if (commaPos == std::string_view::npos) {
          break;
        }
        codings.remove_prefix(commaPos + 1);
      }
    } else if (header.name == Connection) {
      connectionClose = connectionClose || ListContainsTokenCaseInsensitive(header.value, close);
      connectionKeepAlive = connectionKeepAlive || ListContainsTokenCaseInsensitive(header.value, keepalive);
    } else if (header.name == Expect) {
      head.expectContinue = head.version == Version::Http11 && CaseInsensitiveEqual(header.value, h100_continue);
    } else if (header.name == Host) {
      hasHost = true;
    }
  }

  if (requireHost() && head.version == Version::Http11 && !hasHost) {
    reason = "Missing Host header";
    return StatusCodeBadRequest;
  }

  if (hasTransferEncoding) {
    if (unsupportedCoding) {
      reason = "Unsupported Transfer-Encoding";
      return StatusCodeNotImplemented;
    }
    if (!lastIsChunked || nbChunked != 1) {
      reason = "Invalid Transfer-Encoding";
      return StatusCodeBadRequest;
    }
    if (head.hasContentLength) {
      if (!allowContentLengthWithTransferEncoding()) {
        reason = "Both Content-Length and Transfer-Encoding";
        return StatusCodeBadRequest;
      }
      head.hasContentLength = false;
      head.contentLength = 0;
    }
    head.chunked = true;
  }

  if (head.version == Version::Http11) {
    head.keepAlive = !connectionClose;
  } else {
    // chunked framing is not part of HTTP/1.0, the connection cannot be trusted after such a message
    head.keepAlive = connectionKeepAlive && !connectionClose && !head.chunked;
  }
  return 0;
}

WireEvent Http1CodecBase::parseFixedBody(std::string_view input) {
  if (input.empty()) {
    return MakeEvent(WireEventKind::NeedData, 0);
  }
  const std::size_t len = std::min(_remaining, input.size());
  WireEvent event = MakeEvent(WireEventKind::BodyChunk, len);
  event.body = input.substr(0, len);
  _remaining -= len;
  if (_remaining == 0) {
    _state = State::Complete;
  }
  return event;
}

WireEvent Http1CodecBase::parseChunked(std::string_view input) {
  std::size_t pos = 0;
  for (;;) {
    switch (_chunkState) {
      case ChunkState::Size: {
        const LineEnd lineEnd = findLineEnd(input.substr(pos));
        if (lineEnd.terminator == 0) {
          if (input.size() - pos > kMaxChunkSizeLineLength) {
            return fail(StatusCodeBadRequest, "Chunk size line too long");
          }
          return MakeEvent(WireEventKind::NeedData, pos);
        }
        const std::string_view line = input.substr(pos, lineEnd.length);
        if (lineEnd.invalid || line.size() > kMaxChunkSizeLineLength || line.find('\r') != std::string_view::npos) {
          return fail(StatusCodeBadRequest, "Invalid chunk size line");
        }
        std::size_t chunkSize = 0;
        std::size_t nbDigits = 0;
        for (; nbDigits < line.size(); ++nbDigits) {
          const int digit = from_hex_digit(line[nbDigits]);
          if (digit < 0) {
            break;
          }
          if (chunkSize > (std::numeric_limits<std::size_t>::max() >> 4U)) {
            return fail(StatusCodeBadRequest, "Chunk size too large");
          }
          chunkSize = (chunkSize << 4U) | static_cast<std::size_t>(digit);
        }
        const std::string_view extensions = TrimOws(line.substr(nbDigits));
        if (nbDigits == 0 || (!extensions.empty() && extensions.front() != ';')) {
          return fail(StatusCodeBadRequest, "Invalid chunk size");
        }
        pos += lineEnd.length + lineEnd.terminator;
        if (chunkSize == 0) {
          _chunkState = ChunkState::Trailers;
        } else {
          _remaining = chunkSize;
          _chunkState = ChunkState::Data;
        }
        break;
      }
      case ChunkState::Data: {
        if (pos == input.size()) {
          return MakeEvent(WireEventKind::NeedData, pos);
        }
        const std::size_t len = std::min(_remaining, input.size() - pos);
        WireEvent event = MakeEvent(WireEventKind::BodyChunk, pos + len);
        event.body = input.substr(pos, len);
        _remaining -= len;
        if (_remaining == 0) {
          _chunkState = ChunkState::DataEnd;
        }
        return event;
      }
      case ChunkState::DataEnd: {
        const std::string_view rest = input.substr(pos);
        if (rest.starts_with(CRLF)) {
          pos += CRLF.size();
        } else if (allowBareLf() && rest.starts_with('\n')) {
          ++pos;
        } else if (rest.empty() || rest == "\r") {
          return MakeEvent(WireEventKind::NeedData, pos);
        } else {
          return fail(StatusCodeBadRequest, "Missing chunk data terminator");
        }
        _chunkState = ChunkState::Size;
        break;
      }
      case ChunkState::Trailers: {
        const LineEnd lineEnd = findLineEnd(input.substr(pos));
        if (lineEnd.terminator == 0) {
          if (_trailerBytes + (input.size() - pos) > _options.maxHeaderBytes) {
            return fail(StatusCodeRequestHeaderFieldsTooLarge, "Trailer section too large");
          }
          return MakeEvent(WireEventKind::NeedData, pos);
        }
        if (lineEnd.invalid) {
          return fail(StatusCodeBadRequest, "Invalid line terminator");
        }
        pos += lineEnd.length + lineEnd.terminator;
        if (lineEnd.length == 0) {
          _chunkState = ChunkState::Size;
          _trailerBytes = 0;
          _state = State::Head;
          return MakeEvent(WireEventKind::MessageComplete, pos);
        }
        // trailer fields are not exposed to handlers
        _trailerBytes += lineEnd.length;
        if (_trailerBytes > _options.maxHeaderBytes) {
          return fail(StatusCodeRequestHeaderFieldsTooLarge, "Trailer section too large");
        }
        break;
      }
    }
  }
}

void Http1CodecBase::encodeContinue(RawChars& out) const { out.append(HTTP11_100_CONTINUE); }

void Http1CodecBase::encodeResponseEvent(const SendEvent& event, ResponseFraming& framing, RawChars& out) const {
  switch (event.type) {
    case SendEvent::Type::ResponseStart: {
      if (framing.started) {
        throw ProtocolViolation("Unexpected 'response start' event, response already started");
      }
      if (event.status < 100 || event.status > 999) {
        throw ProtocolViolation(std::string("Invalid response status code ") + std::to_string(event.status));
      }
      bool hasServer = false;
      bool hasDate = false;
      bool hasConnection = false;
      bool connectionClose = false;
      bool chunkedEncoding = false;
      bool hasContentLength = false;
      std::size_t contentLength = 0;
      for (const Header& header : event.headers) {
        if (!IsValidHeaderName(header.name) || !IsValidHeaderValue(header.value)) {
          throw ProtocolViolation(std::string("Invalid response header '") + header.name + '\'');
        }
        if (CaseInsensitiveEqual(header.name, ContentLength)) {
          if (!ParseDecimal(header.value, contentLength)) {
            throw ProtocolViolation("Invalid Content-Length response header");
          }
          hasContentLength = true;
        } else if (CaseInsensitiveEqual(header.name, TransferEncoding)) {
          chunkedEncoding = chunkedEncoding || ListContainsTokenCaseInsensitive(header.value, chunked);
        } else if (CaseInsensitiveEqual(header.name, Connection)) {
          hasConnection = true;
          connectionClose = connectionClose || ListContainsTokenCaseInsensitive(header.value, close);
        } else if (CaseInsensitiveEqual(header.name, Server)) {
          hasServer = true;
        } else if (CaseInsensitiveEqual(header.name, Date)) {
          hasDate = true;
        }
      }

      framing.status = event.status;
      framing.started = true;
      if (connectionClose) {
        framing.keepAlive = false;
      }
      if (framing.headRequest || IsBodylessStatus(event.status)) {
        framing.mode = ResponseFraming::Mode::NoBody;
      } else if (chunkedEncoding) {
        framing.mode = ResponseFraming::Mode::Chunked;
      } else if (hasContentLength) {
        framing.mode = ResponseFraming::Mode::ContentLength;
        framing.remaining = contentLength;
      } else if (framing.requestVersion == Version::Http11) {
        framing.mode = ResponseFraming::Mode::Chunked;
      } else {
        // HTTP/1.0 peer without a length: the end of the body is signaled by closing the connection
        framing.mode = ResponseFraming::Mode::CloseDelimited;
        framing.keepAlive = false;
      }

      out.append(HTTP11Sv);
      out.push_back(' ');
      AppendNumber(static_cast<std::size_t>(event.status), out);
      out.push_back(' ');
      out.append(ReasonPhraseFor(event.status));
      out.append(CRLF);
      if (!hasServer && !framing.serverHeader.empty()) {
        AppendHeader(Server, framing.serverHeader, out);
      }
      if (!hasDate && !framing.date.empty()) {
        AppendHeader(Date, framing.date, out);
      }
      if (framing.defaultHeaders != nullptr) {
        for (const Header& header : *framing.defaultHeaders) {
          if (!HasHeader(event.headers, header.name)) {
            AppendHeader(header.name, header.value, out);
          }
        }
      }
      for (const Header& header : event.headers) {
        AppendHeader(header.name, header.value, out);
      }
      if (framing.mode == ResponseFraming::Mode::Chunked && !chunkedEncoding) {
        AppendHeader(TransferEncoding, chunked, out);
      }
      if (!framing.keepAlive) {
        if (!connectionClose) {
          AppendHeader(Connection, close, out);
        }
      } else if (framing.requestVersion == Version::Http10 && !hasConnection) {
        AppendHeader(Connection, keepalive, out);
      }
      out.append(CRLF);
      break;
    }
    case SendEvent::Type::ResponseBody: {
      if (!framing.started) {
        throw ProtocolViolation("Expected 'response start' event before 'response body'");
      }
      if (framing.complete) {
        throw ProtocolViolation("Unexpected 'response body' event, response already completed");
      }
      const std::string_view body = event.body;
      switch (framing.mode) {
        case ResponseFraming::Mode::ContentLength:
          if (body.size() > framing.remaining) {
            throw ProtocolViolation("Response content longer than Content-Length");
          }
          out.append(body);
          framing.remaining -= body.size();
          if (!event.moreBody && framing.remaining != 0) {
            throw ProtocolViolation("Response content shorter than Content-Length");
          }
          break;
        case ResponseFraming::Mode::Chunked:
          if (!body.empty()) {
            char hexBuf[2 * sizeof(std::size_t)];
            out.append(hexBuf, to_lower_hex(body.size(), hexBuf));
            out.append(CRLF);
            out.append(body);
            out.append(CRLF);
          }
          if (!event.moreBody) {
            out.append(LastChunk);
          }
          break;
        case ResponseFraming::Mode::CloseDelimited:
          out.append(body);
          break;
        default:
          // HEAD, 1xx, 204 and 304 responses: body bytes are dropped
          break;
      }
      if (!event.moreBody) {
        framing.complete = true;
      }
      break;
    }
    case SendEvent::Type::Disconnect:
      // no bytes, the connection layer aborts the connection
      break;
  }
}

std::unique_ptr<IWireCodec> MakeWireCodec(HttpCodecKind kind, CodecOptions options) {
  switch (kind) {
    case HttpCodecKind::Lenient:
      return std::make_unique<LenientHttp1Codec>(options);
    case HttpCodecKind::Strict:
      [[fallthrough]];
    default:
      return std::make_unique<StrictHttp1Codec>(options);
  }
}

std::string_view HttpCodecKindName(HttpCodecKind kind) noexcept {
  return kind == HttpCodecKind::Lenient ? std::string_view("lenient") : std::string_view("strict");
}

}  // namespace portico::http
