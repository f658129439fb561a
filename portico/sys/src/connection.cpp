#include "portico/connection.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>

#include "portico/log.hpp"
#include "portico/socket.hpp"

namespace portico {

Connection Connection::Accept(const Socket& listener) {
  Connection cnx;
  socklen_t len = sizeof(cnx._peer);
  cnx._fd = BaseFd(::accept4(listener.fd(), reinterpret_cast<sockaddr*>(&cnx._peer), &len,
                             SOCK_NONBLOCK | SOCK_CLOEXEC));
  if (cnx) {
    log::debug("Accepted fd # {}", cnx.fd());
    return cnx;
  }
  switch (errno) {
    case EAGAIN:
    case EINTR:
      break;
    case ECONNABORTED:
      // the peer gave up while queued
      log::debug("Pending connection aborted by peer");
      break;
    default:
      // EMFILE / ENFILE: the pending connection stays queued until descriptors are released
      log::error("accept on listener fd # {} failed: {}", listener.fd(), std::strerror(errno));
      break;
  }
  return cnx;
}

}  // namespace portico
