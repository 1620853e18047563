#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace gearledger::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Liveness windows use the monotonic clock.
using SteadyClock = std::chrono::steady_clock;

TimePoint Now();

// UTC, millisecond precision: 2026-10-19T08:15:02.114Z
std::string ToIso8601(TimePoint tp);
std::string NowIso8601();

uint64_t ToUnixMillis(TimePoint tp);

} // namespace gearledger::util
