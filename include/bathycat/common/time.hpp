#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace bathycat {

using SteadyClock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;
using SteadyTime = SteadyClock::time_point;
using WallTime = WallClock::time_point;

/// Seconds as double, for logs and JSON.
inline double to_seconds(std::chrono::nanoseconds d) {
  return std::chrono::duration<double>(d).count();
}

inline std::chrono::nanoseconds from_seconds(double s) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(s));
}

/// Calendar date in UTC.
struct CivilDate {
  int year = 1970;
  int month = 1;   // 1..12
  int day = 1;     // 1..31

  bool operator==(const CivilDate& o) const {
    return year == o.year && month == o.month && day == o.day;
  }
  bool operator!=(const CivilDate& o) const { return !(*this == o); }
};

/// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(const CivilDate& d);

/// UTC calendar date of a time point.
CivilDate civil_date_of(WallTime t);

/// UTC time point from a date plus a time of day.
WallTime make_utc(const CivilDate& date, std::chrono::microseconds time_of_day);

/// "2024-05-01T12:34:56.789Z"
std::string format_iso8601(WallTime t);

/// "20240501" / "123456" / "789" helpers used by filenames.
std::string format_compact_date(WallTime t);
std::string format_compact_time(WallTime t);
int milliseconds_of(WallTime t);

}  // namespace bathycat
