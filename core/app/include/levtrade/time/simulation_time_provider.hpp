#pragma once

#include "levtrade/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace levtrade {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly instead of read from
//         the system clock.
//
// @details
// Used by tests to step across holding-time thresholds and trading-day
// boundaries deterministically, and by replays where the price feed's
// timestamp_ms is the authoritative time.
//
// Thread model:
//   set_time() and advance_by() may race with now_ms() readers on other
//   threads; std::atomic<int64_t> gives the needed visibility without a
//   mutex.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : sim_now_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Jumps to epoch_ms. Going backwards is allowed.
  void set_time(std::int64_t epoch_ms);

  // Steps the clock by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> sim_now_ms_{0};
};

}  // namespace levtrade
