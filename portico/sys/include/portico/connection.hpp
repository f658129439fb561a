#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include "portico/base-fd.hpp"
#include "portico/socket.hpp"

namespace portico {

// Client socket accepted from a listener, non-blocking and close-on-exec.
class Connection {
 public:
  Connection() noexcept = default;

  // Takes the next pending connection of 'listener'.
  // Returns an invalid Connection when the accept queue is empty, or on accept failure (logged).
  static Connection Accept(const Socket& listener);

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

  // Remote address as reported by accept.
  [[nodiscard]] const sockaddr_storage& peer() const noexcept { return _peer; }

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
  sockaddr_storage _peer{};
};

}  // namespace portico
