#pragma once

#include <cstdint>
#include <string_view>

#include "portico/base-fd.hpp"

namespace portico {

// Where and how a listening socket is bound.
struct ListenSpec {
  // IPv4 address in dotted notation, "0.0.0.0" for all interfaces.
  std::string_view host{"0.0.0.0"};
  // 0 picks an ephemeral port.
  uint16_t port{0};
  // Capped by the kernel to net.core.somaxconn.
  int backlog{2048};
  bool reusePort{false};
};

// Owning IPv4 TCP socket, close-on-exec.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Binds and listens, returning the bound port (the chosen one when spec.port is 0).
  // Throws std::invalid_argument for an unparsable host, std::system_error when the kernel refuses.
  // A failure to enable SO_REUSEPORT is only logged.
  uint16_t listen(const ListenSpec& spec);

  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
};

}  // namespace portico
