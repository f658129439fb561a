#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include <cstdint>
#include <optional>
#include <string>

namespace portico {

// Numeric form of an IPv4 or IPv6 socket address.
struct HostPort {
  std::string host;
  uint16_t port{0};
};

// std::nullopt for families other than AF_INET and AF_INET6.
std::optional<HostPort> ToHostPort(const sockaddr_storage& addr);

// Address the connected socket 'fd' is bound to locally.
std::optional<HostPort> LocalHostPort(int fd);

bool SetTcpNoDelay(int fd) noexcept;

}  // namespace portico
