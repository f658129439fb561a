#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "portico/events.hpp"
#include "portico/http-header.hpp"
#include "portico/http-status-code.hpp"
#include "portico/http-version.hpp"
#include "portico/raw-chars.hpp"

namespace portico::http {

// Selects the HTTP/1.x parsing strategy of a server.
enum class HttpCodecKind : std::uint8_t { Strict, Lenient };

enum class WireEventKind : std::uint8_t { NeedData, RequestHead, BodyChunk, MessageComplete, ParseError };

struct RequestHead {
  std::string method;
  // request target as received (origin-form, absolute-form or '*')
  std::string target;
  Version version{Version::Http11};
  // names lower cased, arrival order preserved
  HeaderList headers;
  std::size_t contentLength{0};
  bool hasContentLength{false};
  bool chunked{false};
  // whether the client allows the connection to be reused after this exchange
  bool keepAlive{true};
  bool expectContinue{false};
};

struct WireEvent {
  WireEventKind kind{WireEventKind::NeedData};
  // number of input bytes this event accounts for, to be dropped by the caller before the next call
  std::size_t consumed{0};
  // RequestHead only
  RequestHead head;
  // BodyChunk only, view into the input given to parseNextEvent (located at its end of the consumed range)
  std::string_view body;
  // ParseError only
  StatusCode errorStatus{0};
  std::string_view errorReason;
};

// Per-response encoding state, owned by the request being answered.
struct ResponseFraming {
  enum class Mode : std::uint8_t { Unset, ContentLength, Chunked, CloseDelimited, NoBody };

  // Inputs, set by the connection before the first response event.
  Version requestVersion{Version::Http11};
  bool headRequest{false};
  // In: the connection may be reused after this response. Out: false if the response forces a close.
  bool keepAlive{true};
  std::string_view serverHeader;
  std::string_view date;
  const HeaderList* defaultHeaders{nullptr};

  // Progress, maintained by the codec.
  StatusCode status{0};
  Mode mode{Mode::Unset};
  std::size_t remaining{0};
  bool started{false};
  bool complete{false};
};

struct CodecOptions {
  // Maximum size of a request head (request line + header lines), and of a chunked trailer section.
  std::size_t maxHeaderBytes{8192};
};

// Translates raw bytes into request events and response events into bytes.
// A codec instance is bound to a single connection and is never shared.
class IWireCodec {
 public:
  virtual ~IWireCodec() = default;

  // Parses the next event out of 'input' (the unconsumed bytes of the connection).
  // Never reads beyond input and never keeps references to it between calls.
  virtual WireEvent parseNextEvent(std::string_view input) = 0;

  // Appends the wire bytes of 'event' to 'out', updating 'framing'.
  // Throws ProtocolViolation on out of order events, invalid headers or Content-Length mismatches.
  virtual void encodeResponseEvent(const SendEvent& event, ResponseFraming& framing, RawChars& out) const = 0;

  // Appends an interim 100 Continue response.
  virtual void encodeContinue(RawChars& out) const = 0;

  // Forgets any partially parsed message.
  virtual void reset() noexcept = 0;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

std::unique_ptr<IWireCodec> MakeWireCodec(HttpCodecKind kind, CodecOptions options = {});

std::string_view HttpCodecKindName(HttpCodecKind kind) noexcept;

}  // namespace portico::http
