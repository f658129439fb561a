#include "portico/transport.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

namespace portico {

IoResult Transport::read(char* buf, std::size_t len) const noexcept {
  for (;;) {
    const ssize_t nbRead = ::recv(_fd, buf, len, 0);
    if (nbRead > 0) {
      return {static_cast<std::size_t>(nbRead), IoStatus::Done};
    }
    if (nbRead == 0) {
      return {0, IoStatus::PeerClosed};
    }
    if (errno != EINTR) {
      return {0, errno == EAGAIN || errno == EWOULDBLOCK ? IoStatus::WouldBlock : IoStatus::Error};
    }
  }
}

IoResult Transport::write(std::string_view data) const noexcept {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t nbSent = ::send(_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (nbSent >= 0) {
      sent += static_cast<std::size_t>(nbSent);
    } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return {sent, IoStatus::WouldBlock};
    } else if (errno != EINTR) {
      return {sent, IoStatus::Error};
    }
  }
  return {sent, IoStatus::Done};
}

}  // namespace portico
