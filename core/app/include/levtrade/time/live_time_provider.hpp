#pragma once

#include "levtrade/time/i_time_provider.hpp"

namespace levtrade {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the levtrade_engine executable. Created in main() and passed by
// const reference to TradingEngine, which hands it to TradeExecutor and
// RiskEngine.
//
// Thread model: stateless; safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace levtrade
