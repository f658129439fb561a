#include "portico/log-capture.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace portico::test {

LogCapture::LogCapture(std::size_t capacity)
    : _sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity)), _previous(spdlog::default_logger()) {
  _sink->set_pattern("%l %v");
  std::vector<spdlog::sink_ptr> sinks = _previous->sinks();
  sinks.push_back(_sink);
  auto logger = std::make_shared<spdlog::logger>("capture", sinks.begin(), sinks.end());
  logger->set_level(_previous->level());
  spdlog::set_default_logger(std::move(logger));
}

LogCapture::~LogCapture() { spdlog::set_default_logger(_previous); }

std::vector<std::string> LogCapture::lines() const { return _sink->last_formatted(); }

std::size_t LogCapture::count(std::string_view needle) const {
  std::size_t nb = 0;
  for (const std::string& line : lines()) {
    if (line.find(needle) != std::string::npos) {
      ++nb;
    }
  }
  return nb;
}

}  // namespace portico::test
