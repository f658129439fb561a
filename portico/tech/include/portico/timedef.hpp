#pragma once

#include <chrono>

namespace portico {

// Wall clock, only used for the 'date' response header.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;

// Every deadline (keep-alive, header and body read timeouts, graceful shutdown) is measured on this clock.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace portico
