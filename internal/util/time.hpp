#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace loadplan::util {

/*
  Time utilities. One place to swap the clock source.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Injectable clock, used by components with age based behaviour.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

double ElapsedMillis(TimePoint since);

} // namespace loadplan::util
