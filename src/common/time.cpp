#include "bathycat/common/time.hpp"

#include <cstdio>
#include <ctime>

namespace bathycat {

namespace {

// Split into whole seconds (floored) and the millisecond remainder.
void split(WallTime t, std::time_t* secs, int* millis) {
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(t.time_since_epoch()).count();
  int64_t s = ms / 1000;
  int64_t r = ms % 1000;
  if (r < 0) {
    r += 1000;
    s -= 1;
  }
  *secs = static_cast<std::time_t>(s);
  *millis = static_cast<int>(r);
}

std::tm utc_tm(WallTime t, int* millis) {
  std::time_t secs = 0;
  split(t, &secs, millis);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  return tm;
}

}  // namespace

int64_t days_from_civil(const CivilDate& d) {
  // Howard Hinnant's days_from_civil.
  const int64_t y = static_cast<int64_t>(d.year) - (d.month <= 2 ? 1 : 0);
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t m = d.month;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d.day - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate civil_date_of(WallTime t) {
  int ms = 0;
  const std::tm tm = utc_tm(t, &ms);
  CivilDate d;
  d.year = tm.tm_year + 1900;
  d.month = tm.tm_mon + 1;
  d.day = tm.tm_mday;
  return d;
}

WallTime make_utc(const CivilDate& date, std::chrono::microseconds time_of_day) {
  using namespace std::chrono;
  const auto days = hours(24) * days_from_civil(date);
  return WallTime(duration_cast<WallClock::duration>(days + time_of_day));
}

std::string format_iso8601(WallTime t) {
  int ms = 0;
  const std::tm tm = utc_tm(t, &ms);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  return buf;
}

std::string format_compact_date(WallTime t) {
  int ms = 0;
  const std::tm tm = utc_tm(t, &ms);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

std::string format_compact_time(WallTime t) {
  int ms = 0;
  const std::tm tm = utc_tm(t, &ms);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d%02d%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

int milliseconds_of(WallTime t) {
  std::time_t secs = 0;
  int ms = 0;
  split(t, &secs, &ms);
  return ms;
}

}  // namespace bathycat
