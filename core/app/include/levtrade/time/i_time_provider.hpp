#pragma once

#include <cstdint>

namespace levtrade {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Holding-time limits, the daily trade counter reset and document
// timestamps all depend on "now". Reading the system clock directly would
// make a 36-hour holding rule untestable, so every component receives a
// `const ITimeProvider&` instead:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by tests or a replay.
//
// Time is int64_t milliseconds since the Unix epoch, the same unit carried
// by price snapshots on the wire and by persisted documents.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   Writers (SimulationTimeProvider::set_time) synchronize internally.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace levtrade
