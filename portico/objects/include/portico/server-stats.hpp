#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace portico {

struct ServerStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Introspection enumeration of scalar numeric fields (order matches serialization order).
  template <class F>
  void for_each_field(F&& fun) const {
    fun("totalRequestsServed", totalRequestsServed);
    fun("totalConnectionsAccepted", totalConnectionsAccepted);
    fun("liveConnections", static_cast<uint64_t>(liveConnections));
    fun("runningHandlers", static_cast<uint64_t>(runningHandlers));
    fun("totalBytesRead", totalBytesRead);
    fun("totalBytesWritten", totalBytesWritten);
    fun("readPauseSignals", readPauseSignals);
    fun("readResumeSignals", readResumeSignals);
    fun("rejectedConcurrency", rejectedConcurrency);
    fun("parseErrors", parseErrors);
    fun("handlerErrors", handlerErrors);
  }

  uint64_t totalRequestsServed{};
  uint64_t totalConnectionsAccepted{};
  std::size_t liveConnections{};
  std::size_t runningHandlers{};
  uint64_t totalBytesRead{};
  uint64_t totalBytesWritten{};
  uint64_t readPauseSignals{};
  uint64_t readResumeSignals{};
  uint64_t rejectedConcurrency{};
  uint64_t parseErrors{};
  uint64_t handlerErrors{};
};

}  // namespace portico
