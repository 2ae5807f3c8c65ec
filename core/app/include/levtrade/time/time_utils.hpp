#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions over int64_t epoch milliseconds, the engine's only
//         time representation.
//
// Thread-safety: Stateless. Formatting uses gmtime_r, so no shared static
//                buffer is touched.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerHour = 3600 * kMillisPerSecond;

inline std::int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Elapsed hours between two epoch-millisecond instants (may be fractional).
inline double hoursBetween(std::int64_t from_ms, std::int64_t to_ms) {
  return static_cast<double>(to_ms - from_ms) /
         static_cast<double>(kMillisPerHour);
}

// "YYYY-MM-DD" of the UTC calendar day containing `ms`. Used as the key for
// the account's daily trade counter.
std::string utcDateString(std::int64_t ms);

// "YYYY-MM-DDTHH:MM:SS.mmmZ": document `last_updated` stamps.
std::string iso8601Utc(std::int64_t ms);

}  // namespace levtrade
