#include "portico/internal/scheduler.hpp"

#include <cstddef>
#include <optional>

#include "portico/timedef.hpp"

namespace portico::internal {

std::size_t Scheduler::promoteExpiredTimers(SteadyTimePoint now) {
  std::size_t nbPromoted = 0;
  auto it = _timers.begin();
  for (; it != _timers.end() && it->first <= now; ++it) {
    _ready.push_back(it->second);
    ++nbPromoted;
  }
  _timers.erase(_timers.begin(), it);
  return nbPromoted;
}

bool Scheduler::cancelTimer(UnitId id) {
  for (auto it = _timers.begin(); it != _timers.end(); ++it) {
    if (it->second == id) {
      _timers.erase(it);
      return true;
    }
  }
  return false;
}

std::optional<SteadyTimePoint> Scheduler::nextDeadline() const {
  if (_timers.empty()) {
    return std::nullopt;
  }
  return _timers.begin()->first;
}

UnitId Scheduler::popReady() {
  const UnitId id = _ready.front();
  _ready.pop_front();
  return id;
}

}  // namespace portico::internal
