#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>

#include "portico/timedef.hpp"

namespace portico::internal {

using UnitId = uint64_t;

// Ready queue and timers of the cooperative scheduler driving request handler units.
// It only manipulates unit ids, the supervisor owns the units themselves.
class Scheduler {
 public:
  void schedule(UnitId id) { _ready.push_back(id); }

  void scheduleAt(UnitId id, SteadyTimePoint when) { _timers.emplace(when, id); }

  // Moves all units whose timer expired at 'now' to the ready queue (in deadline order).
  // Returns the number of promoted units.
  std::size_t promoteExpiredTimers(SteadyTimePoint now);

  // Forgets the pending timer of the given unit, if any. Returns true if one was removed.
  bool cancelTimer(UnitId id);

  [[nodiscard]] std::optional<SteadyTimePoint> nextDeadline() const;

  [[nodiscard]] bool hasReady() const noexcept { return !_ready.empty(); }

  [[nodiscard]] std::size_t readyCount() const noexcept { return _ready.size(); }

  [[nodiscard]] std::size_t nbTimers() const noexcept { return _timers.size(); }

  // Precondition: hasReady()
  UnitId popReady();

  void clear() noexcept {
    _ready.clear();
    _timers.clear();
  }

 private:
  std::deque<UnitId> _ready;
  std::multimap<SteadyTimePoint, UnitId> _timers;
};

}  // namespace portico::internal
