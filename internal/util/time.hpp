#pragma once

#include <chrono>
#include <cstdint>

namespace unison::util {

/*
  Time utilities: the single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace unison::util
