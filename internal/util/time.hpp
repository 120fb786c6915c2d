#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace dispatcher::util {

/*
  Time utilities. Persisted timestamps carry millisecond precision.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();


int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Days since the unix epoch for the wall clock shifted by offset_minutes.
int64_t CalendarDay(TimePoint tp, int32_t offset_minutes);

// "YYYY-MM-DD HH:MM:SS.mmm" in UTC, the TIMESTAMP(3) text form.
std::string FormatTimestamp(TimePoint tp);

} // namespace dispatcher::util
