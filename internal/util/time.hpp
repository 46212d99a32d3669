#pragma once

#include <chrono>
#include <cstdint>

namespace strata::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t ToUnixSeconds(TimePoint tp);

} // namespace strata::util
