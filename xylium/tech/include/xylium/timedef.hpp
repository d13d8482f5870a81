#pragma once

#include <chrono>

namespace xylium {

/// Alias some types to make it easier to use.
/// Deadlines and rate-limit windows are measured on the monotonic clock, wall-clock time is only needed
/// to render dates in response headers.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using Duration = SteadyClock::duration;

using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;

}  // namespace xylium
