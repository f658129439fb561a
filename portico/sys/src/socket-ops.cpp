#include "portico/socket-ops.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <optional>

namespace portico {

std::optional<HostPort> ToHostPort(const sockaddr_storage& addr) {
  char buf[INET6_ADDRSTRLEN];
  switch (addr.ss_family) {
    case AF_INET: {
      const auto& in4 = reinterpret_cast<const sockaddr_in&>(addr);
      if (::inet_ntop(AF_INET, &in4.sin_addr, buf, sizeof(buf)) != nullptr) {
        return HostPort{buf, ntohs(in4.sin_port)};
      }
      break;
    }
    case AF_INET6: {
      const auto& in6 = reinterpret_cast<const sockaddr_in6&>(addr);
      if (::inet_ntop(AF_INET6, &in6.sin6_addr, buf, sizeof(buf)) != nullptr) {
        return HostPort{buf, ntohs(in6.sin6_port)};
      }
      break;
    }
    default:
      break;
  }
  return std::nullopt;
}

std::optional<HostPort> LocalHostPort(int fd) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return std::nullopt;
  }
  return ToHostPort(addr);
}

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kOn = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kOn, sizeof(kOn)) == 0;
}

}  // namespace portico
