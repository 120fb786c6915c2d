#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace dispatcher::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

int64_t CalendarDay(TimePoint tp, int32_t offset_minutes) {
  const auto shifted = tp + std::chrono::minutes(offset_minutes);
  return std::chrono::floor<std::chrono::days>(shifted).time_since_epoch().count();
}

std::string FormatTimestamp(TimePoint tp) {
  const int64_t ms      = ToUnixMillis(tp);
  const int64_t seconds = ms >= 0 ? ms / 1000 : (ms - 999) / 1000;
  const int     millis  = static_cast<int>(ms - seconds * 1000);

  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm     utc{};
  gmtime_r(&t, &utc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, millis);
  return buf;
}

} // namespace dispatcher::util
