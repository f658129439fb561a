#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "portico/events.hpp"
#include "portico/raw-chars.hpp"
#include "portico/wire-codec.hpp"

namespace portico::http {

// HTTP/1.0 and HTTP/1.1 parsing and encoding shared by both strategies.
// Subclasses decide how tolerant the parser is with deviations from RFC 9112 that are common in the wild.
class Http1CodecBase : public IWireCodec {
 public:
  WireEvent parseNextEvent(std::string_view input) override;

  void encodeResponseEvent(const SendEvent& event, ResponseFraming& framing, RawChars& out) const override;

  void encodeContinue(RawChars& out) const override;

  void reset() noexcept override;

 protected:
  explicit Http1CodecBase(CodecOptions options) noexcept : _options(options) {}

  // Accept lines terminated by a bare LF.
  [[nodiscard]] virtual bool allowBareLf() const noexcept = 0;

  // Accept obsolete line folding (header continuation lines starting with SP or HTAB).
  [[nodiscard]] virtual bool allowObsFold() const noexcept = 0;

  // Accept whitespace between a header name and its colon.
  [[nodiscard]] virtual bool allowSpaceBeforeColon() const noexcept = 0;

  // Accept a request carrying both Content-Length and Transfer-Encoding (Transfer-Encoding wins).
  [[nodiscard]] virtual bool allowContentLengthWithTransferEncoding() const noexcept = 0;

  // Reject HTTP/1.1 requests without a Host header.
  [[nodiscard]] virtual bool requireHost() const noexcept = 0;

 private:
  enum class State : std::uint8_t { Head, FixedBody, Chunked, Complete, Failed };
  enum class ChunkState : std::uint8_t { Size, Data, DataEnd, Trailers };

  struct LineEnd {
    std::size_t length{0};      // line length without its terminator
    std::size_t terminator{0};  // 0 if no complete line
    bool invalid{false};        // bare LF not accepted by this codec
  };

  WireEvent parseHead(std::string_view input);
  WireEvent parseFixedBody(std::string_view input);
  WireEvent parseChunked(std::string_view input);

  WireEvent fail(StatusCode status, std::string_view reason);

  [[nodiscard]] LineEnd findLineEnd(std::string_view input) const noexcept;

  // Returns 0 on success, the error status otherwise.
  StatusCode parseHeadBlock(std::string_view block, RequestHead& head, std::string_view& reason) const;
  StatusCode resolveFraming(RequestHead& head, std::string_view& reason) const;

  CodecOptions _options;
  State _state{State::Head};
  ChunkState _chunkState{ChunkState::Size};
  std::size_t _remaining{0};
  std::size_t _trailerBytes{0};
  StatusCode _errorStatus{0};
  std::string_view _errorReason;
};

// RFC 9112 conformant parser. Rejects bare LF line endings, obsolete line folding, whitespace before the colon,
// HTTP/1.1 requests without Host and requests carrying both Content-Length and Transfer-Encoding.
class StrictHttp1Codec : public Http1CodecBase {
 public:
  explicit StrictHttp1Codec(CodecOptions options = {}) noexcept : Http1CodecBase(options) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "strict"; }

 protected:
  [[nodiscard]] bool allowBareLf() const noexcept override { return false; }
  [[nodiscard]] bool allowObsFold() const noexcept override { return false; }
  [[nodiscard]] bool allowSpaceBeforeColon() const noexcept override { return false; }
  [[nodiscard]] bool allowContentLengthWithTransferEncoding() const noexcept override { return false; }
  [[nodiscard]] bool requireHost() const noexcept override { return true; }
};

// Tolerant parser: accepts bare LF, unfolds obs-fold into a single space, trims whitespace before the colon and lets
// Transfer-Encoding win over Content-Length.
class LenientHttp1Codec : public Http1CodecBase {
 public:
  explicit LenientHttp1Codec(CodecOptions options = {}) noexcept : Http1CodecBase(options) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "lenient"; }

 protected:
  [[nodiscard]] bool allowBareLf() const noexcept override { return true; }
  [[nodiscard]] bool allowObsFold() const noexcept override { return true; }
  [[nodiscard]] bool allowSpaceBeforeColon() const noexcept override { return true; }
  [[nodiscard]] bool allowContentLengthWithTransferEncoding() const noexcept override { return true; }
  [[nodiscard]] bool requireHost() const noexcept override { return false; }
};

}  // namespace portico::http
