#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace portico::test {

// Captures the messages of the default logger for the lifetime of the object, while still forwarding them to the
// previous sinks. Install it before starting any server thread and destroy it once they are joined.
class LogCapture {
 public:
  explicit LogCapture(std::size_t capacity = 1024);

  LogCapture(const LogCapture&) = delete;
  LogCapture(LogCapture&&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;
  LogCapture& operator=(LogCapture&&) = delete;

  ~LogCapture();

  // Captured lines, formatted as '<level> <message>'.
  [[nodiscard]] std::vector<std::string> lines() const;

  [[nodiscard]] std::size_t count(std::string_view needle) const;

  [[nodiscard]] bool contains(std::string_view needle) const { return count(needle) != 0; }

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> _sink;
  std::shared_ptr<spdlog::logger> _previous;
};

}  // namespace portico::test
