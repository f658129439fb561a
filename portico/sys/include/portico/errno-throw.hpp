#pragma once

#include <fmt/format.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace portico {

// Throws std::system_error for the current errno, read before the message is formatted.
//   throw_errno("bind on port {}", port);
template <typename... Args>
[[noreturn]] void throw_errno(fmt::format_string<Args...> what, Args&&... args) {
  const std::error_code ec(errno, std::system_category());
  throw std::system_error(ec, fmt::format(what, std::forward<Args>(args)...));
}

}  // namespace portico
