#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace portico {

enum class IoStatus : uint8_t {
  Done,        // the whole request was served (read: some bytes were read)
  WouldBlock,  // wait for the next readiness event of the same direction
  PeerClosed,  // orderly shutdown of the peer (read only)
  Error        // the connection is unusable
};

struct IoResult {
  std::size_t bytes;
  IoStatus status;
};

// Non-blocking byte stream over a connected socket. Does not own the fd.
class Transport {
 public:
  explicit Transport(int fd) noexcept : _fd(fd) {}

  // One recv of at most 'len' bytes.
  IoResult read(char* buf, std::size_t len) const noexcept;

  // Sends as much of 'data' as the kernel accepts. Never raises SIGPIPE.
  IoResult write(std::string_view data) const noexcept;

 private:
  int _fd;
};

}  // namespace portico
