#pragma once

#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "portico/flow-controller.hpp"
#include "portico/http-header.hpp"
#include "portico/wire-codec.hpp"

namespace portico {

// How the application lifespan handler (startup / shutdown events) is driven.
enum class LifespanMode : std::uint8_t {
  // Run it if one is provided. A failure before it sent any message means the application does not support the
  // protocol: it is logged and serving continues.
  Auto,
  // Any lifespan failure is fatal.
  On,
  // Never run it.
  Off
};

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // IPv4 address to bind. "0.0.0.0" listens on all interfaces.
  std::string host{"127.0.0.1"};

  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port, retrieve it with HttpServer::port().
  uint16_t port{0};

  // Maximum number of pending connections in the accept queue.
  int backlog{2048};

  // If true, enables SO_REUSEPORT. Failure is logged, not fatal. Disabled by default.
  bool reusePort{false};

  // Disables the Nagle algorithm on accepted connections. Default: false.
  bool tcpNoDelay{false};

  // =================
  // Protocol handling
  // =================
  // HTTP/1.x parsing strategy, see StrictHttp1Codec and LenientHttp1Codec.
  http::HttpCodecKind codec{http::HttpCodecKind::Strict};

  // Maximum number of requests per connection whose heads may be parsed while the response of the first one is not
  // fully written. 1 (default) means the next request head is parsed only after the current response is complete.
  // Responses are always written in request order.
  uint32_t pipelineDepth{1};

  // Whether persistent connections are enabled. When false, the server closes after each response.
  bool enableKeepAlive{true};

  // Idle timeout for keep-alive connections, measured from the end of the previous response. Default: 5000 ms.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // Maximum allowed size (in bytes) of a request head (request line + headers). If exceeded, the server replies 431
  // and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum allowed size (in bytes) of a request body. A larger declared Content-Length is answered with 413, a
  // chunked body growing beyond it makes the server reply 413 (if the response did not start yet) and close.
  // Default: 256 MiB.
  std::size_t maxBodyBytes{1 << 28};

  // ===========================================
  // Flow control
  // ===========================================
  // Per connection read / write watermarks. Reading is paused when more than readHigh received bytes have not
  // been consumed by the handler yet, and resumed at readLow. Handlers awaiting send() are suspended while more than
  // writeHigh bytes are queued and not flushed.
  http::FlowWatermarks watermarks;

  // Size of a single socket read. The inbound buffer exceeds readHigh by at most this amount.
  std::size_t readChunkBytes{8192};

  // ===========================================
  // Event loop polling / responsiveness tuning
  // ===========================================
  // Maximum duration of a single epoll_wait() when idle. It caps the latency of periodic housekeeping (timeouts,
  // date header refresh, shutdown deadline). Default: 500 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Maximum duration to fully receive a request head from its first byte. If exceeded, the server replies 408 and
  // closes the connection. 0 disables it (default).
  std::chrono::milliseconds headerReadTimeout{std::chrono::milliseconds{0}};

  // Maximum duration between two reads of a request body. If exceeded, the server replies 408 if the response did
  // not start yet, and closes the connection. 0 disables it (default).
  std::chrono::milliseconds bodyReadTimeout{std::chrono::milliseconds{0}};

  // ===========================================
  // Limits & shutdown
  // ===========================================
  // Maximum number of requests served by the process before a graceful shutdown is initiated. 0 = unlimited.
  uint64_t limitMaxRequests{0};

  // Maximum number of live connections / running request handlers. Requests beyond it are answered with 503.
  // 0 = unlimited.
  uint32_t limitConcurrency{0};

  // Maximum duration of a graceful shutdown, after which remaining handlers are cancelled and connections closed.
  // 0 = wait forever.
  std::chrono::milliseconds gracefulShutdownTimeout{std::chrono::milliseconds{0}};

  // If true, the server installs its own SIGINT / SIGTERM (or 'signals') handlers for the duration of run(), and
  // re-raises the captured signal once stopped so that previous handlers observe it.
  bool installSignalHandlers{false};

  std::vector<int> signals{SIGINT, SIGTERM};

  LifespanMode lifespan{LifespanMode::Auto};

  // ===========================================
  // Response defaults
  // ===========================================
  // Value of the 'server' response header added when the handler does not set one. Empty disables it.
  std::string serverHeader{"portico"};

  // Add a 'date' response header when the handler does not set one.
  bool dateHeader{true};

  // Headers added to every response that does not already carry a header with the same name.
  std::vector<http::Header> defaultHeaders;

  // ===========================================
  // Scope building
  // ===========================================
  // Mount point of the application, exposed in the scope and prefixed to its path.
  std::string rootPath;

  // Trust X-Forwarded-Proto and X-Forwarded-For from peers listed in forwardedAllowIps ("*" allows any peer).
  bool proxyHeaders{true};

  std::vector<std::string> forwardedAllowIps{"127.0.0.1"};

  // Initial content of the context of every request handler. Never modified by the server.
  std::map<std::string, std::string, std::less<>> contextDefaults;

  // Emit one info log line per response.
  bool accessLog{true};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  ServerConfig& withHost(std::string_view host);

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withBacklog(int backlog);

  ServerConfig& withReusePort(bool on = true);

  ServerConfig& withTcpNoDelay(bool on = true);

  ServerConfig& withCodec(http::HttpCodecKind codec);

  ServerConfig& withPipelineDepth(uint32_t depth);

  ServerConfig& withKeepAliveMode(bool on = true);

  ServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  // Set read side watermarks (pause above high, resume at low)
  ServerConfig& withReadWatermarks(std::size_t high, std::size_t low);

  ServerConfig& withWriteHighWatermark(std::size_t high);

  ServerConfig& withReadChunkBytes(std::size_t bytes);

  ServerConfig& withPollInterval(std::chrono::milliseconds interval);

  // Set slow header read timeout (0=off)
  ServerConfig& withHeaderReadTimeout(std::chrono::milliseconds timeout);

  // Set slow body read timeout (0=off)
  ServerConfig& withBodyReadTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withLimitMaxRequests(uint64_t maxRequests);

  ServerConfig& withLimitConcurrency(uint32_t limit);

  ServerConfig& withGracefulShutdownTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withSignalHandlers(bool on = true);

  ServerConfig& withSignals(std::initializer_list<int> signals);

  ServerConfig& withLifespan(LifespanMode mode);

  ServerConfig& withServerHeader(std::string_view value);

  ServerConfig& withDateHeader(bool on = true);

  // Convenience: add a single default header entry (appended)
  ServerConfig& withDefaultHeader(http::Header header);

  ServerConfig& withRootPath(std::string_view rootPath);

  ServerConfig& withProxyHeaders(bool on = true);

  ServerConfig& withForwardedAllowIps(std::initializer_list<std::string_view> ips);

  ServerConfig& withContextDefault(std::string_view key, std::string_view value);

  ServerConfig& withAccessLog(bool on = true);
};

}  // namespace portico
