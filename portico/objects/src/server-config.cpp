#include "portico/server-config.hpp"

#include <fmt/format.h>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "portico/http-header.hpp"
#include "portico/wire-codec.hpp"

namespace portico {

ServerConfig& ServerConfig::withHost(std::string_view host) {
  this->host = host;
  return *this;
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withBacklog(int backlog) {
  this->backlog = backlog;
  return *this;
}

ServerConfig& ServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

ServerConfig& ServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

ServerConfig& ServerConfig::withCodec(http::HttpCodecKind codec) {
  this->codec = codec;
  return *this;
}

ServerConfig& ServerConfig::withPipelineDepth(uint32_t depth) {
  this->pipelineDepth = depth;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  this->keepAliveTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig& ServerConfig::withReadWatermarks(std::size_t high, std::size_t low) {
  watermarks.readHigh = high;
  watermarks.readLow = low;
  return *this;
}

ServerConfig& ServerConfig::withWriteHighWatermark(std::size_t high) {
  watermarks.writeHigh = high;
  return *this;
}

ServerConfig& ServerConfig::withReadChunkBytes(std::size_t bytes) {
  this->readChunkBytes = bytes;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withHeaderReadTimeout(std::chrono::milliseconds timeout) {
  this->headerReadTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withBodyReadTimeout(std::chrono::milliseconds timeout) {
  this->bodyReadTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withLimitMaxRequests(uint64_t maxRequests) {
  this->limitMaxRequests = maxRequests;
  return *this;
}

ServerConfig& ServerConfig::withLimitConcurrency(uint32_t limit) {
  this->limitConcurrency = limit;
  return *this;
}

ServerConfig& ServerConfig::withGracefulShutdownTimeout(std::chrono::milliseconds timeout) {
  this->gracefulShutdownTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withSignalHandlers(bool on) {
  this->installSignalHandlers = on;
  return *this;
}

ServerConfig& ServerConfig::withSignals(std::initializer_list<int> signals) {
  this->signals.assign(signals.begin(), signals.end());
  return *this;
}

ServerConfig& ServerConfig::withLifespan(LifespanMode mode) {
  this->lifespan = mode;
  return *this;
}

ServerConfig& ServerConfig::withServerHeader(std::string_view value) {
  this->serverHeader = value;
  return *this;
}

ServerConfig& ServerConfig::withDateHeader(bool on) {
  this->dateHeader = on;
  return *this;
}

ServerConfig& ServerConfig::withDefaultHeader(http::Header header) {
  defaultHeaders.push_back(std::move(header));
  return *this;
}

ServerConfig& ServerConfig::withRootPath(std::string_view rootPath) {
  this->rootPath = rootPath;
  return *this;
}

ServerConfig& ServerConfig::withProxyHeaders(bool on) {
  this->proxyHeaders = on;
  return *this;
}

ServerConfig& ServerConfig::withForwardedAllowIps(std::initializer_list<std::string_view> ips) {
  forwardedAllowIps.assign(ips.begin(), ips.end());
  return *this;
}

ServerConfig& ServerConfig::withContextDefault(std::string_view key, std::string_view value) {
  contextDefaults.insert_or_assign(std::string(key), std::string(value));
  return *this;
}

ServerConfig& ServerConfig::withAccessLog(bool on) {
  this->accessLog = on;
  return *this;
}

void ServerConfig::validate() const {
  if (host.empty()) {
    throw std::invalid_argument("host must not be empty");
  }
  if (backlog <= 0) {
    throw std::invalid_argument("backlog must be > 0");
  }
  if (watermarks.readHigh == 0 || watermarks.writeHigh == 0) {
    throw std::invalid_argument("high watermarks must be > 0");
  }
  if (watermarks.readLow > watermarks.readHigh) {
    throw std::invalid_argument("read low watermark must be <= read high watermark");
  }
  if (pipelineDepth == 0) {
    throw std::invalid_argument("pipelineDepth must be >= 1");
  }
  if (readChunkBytes == 0) {
    throw std::invalid_argument("readChunkBytes must be > 0");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (keepAliveTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveTimeout must be non-negative");
  }
  if (headerReadTimeout.count() < 0) {
    throw std::invalid_argument("headerReadTimeout must be non-negative");
  }
  if (bodyReadTimeout.count() < 0) {
    throw std::invalid_argument("bodyReadTimeout must be non-negative");
  }
  if (gracefulShutdownTimeout.count() < 0) {
    throw std::invalid_argument("gracefulShutdownTimeout must be non-negative");
  }
  if (installSignalHandlers && signals.empty()) {
    throw std::invalid_argument("signal handlers requested without any signal");
  }
  for (int sig : signals) {
    if (sig <= 0 || sig >= NSIG) {
      throw std::invalid_argument(fmt::format("invalid signal number {}", sig));
    }
  }
  if (!http::IsValidHeaderValue(serverHeader)) {
    throw std::invalid_argument(fmt::format("server header has invalid value: '{}'", serverHeader));
  }
  for (const http::Header& header : defaultHeaders) {
    if (!http::IsValidHeaderName(header.name)) {
      throw std::invalid_argument(fmt::format("header has invalid name: '{}'", header.name));
    }
    if (!http::IsValidHeaderValue(header.value)) {
      throw std::invalid_argument(fmt::format("header has invalid value: '{}'", header.value));
    }
  }
  if (!rootPath.empty() && (rootPath.front() != '/' || rootPath.back() == '/')) {
    throw std::invalid_argument("rootPath must start with '/' and not end with '/'");
  }
}

}  // namespace portico
