#include "levtrade/time/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace levtrade {

namespace {

std::tm toUtc(std::int64_t ms, int& millis) {
  std::int64_t secs = ms / kMillisPerSecond;
  millis = static_cast<int>(ms % kMillisPerSecond);
  if (millis < 0) {
    millis += 1000;
    --secs;
  }
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

}  // namespace

// -----------------------------------------------------------------------------
// utcDateString
// -----------------------------------------------------------------------------
std::string utcDateString(std::int64_t ms) {
  int millis = 0;
  std::tm tm = toUtc(ms, millis);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

// -----------------------------------------------------------------------------
// iso8601Utc
// -----------------------------------------------------------------------------
std::string iso8601Utc(std::int64_t ms) {
  int millis = 0;
  std::tm tm = toUtc(ms, millis);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, millis);
  return buf;
}

}  // namespace levtrade
