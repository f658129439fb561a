#include "portico/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

#include "portico/errno-throw.hpp"
#include "portico/log.hpp"

namespace portico {

Socket::Socket(Type type)
    : _fd(::socket(AF_INET, type == Type::StreamNonBlock ? SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC
                                                          : SOCK_STREAM | SOCK_CLOEXEC,
                   0)) {
  if (!_fd) {
    throw_errno("socket");
  }
}

uint16_t Socket::listen(const ListenSpec& spec) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(spec.port);
  // inet_pton needs a null terminated string
  const std::string host(spec.host);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 listen address '" + host + "'");
  }

  const int listenFd = fd();
  static constexpr int kOn = 1;
  if (::setsockopt(listenFd, SOL_SOCKET, SO_REUSEADDR, &kOn, sizeof(kOn)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) on fd # {}", listenFd);
  }
  if (spec.reusePort && ::setsockopt(listenFd, SOL_SOCKET, SO_REUSEPORT, &kOn, sizeof(kOn)) != 0) {
    log::warn("SO_REUSEPORT not enabled on fd # {}: {}", listenFd, std::strerror(errno));
  }
  if (::bind(listenFd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind {}:{}", host, spec.port);
  }
  if (::listen(listenFd, spec.backlog) != 0) {
    throw_errno("listen {}:{}", host, spec.port);
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(listenFd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
    throw_errno("getsockname on fd # {}", listenFd);
  }
  const uint16_t port = ntohs(bound.sin_port);
  log::debug("Listening on {}:{} (fd # {})", host, port, listenFd);
  return port;
}

}  // namespace portico
