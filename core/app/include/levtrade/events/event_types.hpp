#pragma once

#include "levtrade/domain/position.hpp"
#include "levtrade/domain/price_map.hpp"
#include "levtrade/domain/risk_metrics.hpp"

#include <cstdint>
#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// PriceSnapshotEvent
// -----------------------------------------------------------------------------
// Responsibility: One batch of prices from the price feed.
// Why in architecture: The price feed thread never touches TradeExecutor
// directly; it pushes this event into the risk loop, which applies the whole
// batch with TradeExecutor::updatePrices() before the next queued event
// (typically a MonitorTickEvent) is dispatched.
// -----------------------------------------------------------------------------
struct PriceSnapshotEvent {
  domain::PriceMap prices;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// MonitorTickEvent
// -----------------------------------------------------------------------------
// Emitted by TradingEngine's ticker on a fixed interval; the risk loop
// answers it with RiskEngine::monitorPositions().
// -----------------------------------------------------------------------------
struct MonitorTickEvent {
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TradeExecutedEvent
// -----------------------------------------------------------------------------
// Published by EventBusNotificationSink after a position is opened or
// pyramided. Carries a full copy of the position.
// -----------------------------------------------------------------------------
struct TradeExecutedEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PositionClosedEvent
// -----------------------------------------------------------------------------
// Published after a full close (stop loss, target, risk action, manual).
// `reason` is the close reason recorded in the position's notes.
// -----------------------------------------------------------------------------
struct PositionClosedEvent {
  domain::Position position;
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// RiskAlertEvent
// -----------------------------------------------------------------------------
// Liquidation warnings, emergency closes and stop adjustments. Rate limiting
// happens in RiskEngine before the alert reaches the sink.
// -----------------------------------------------------------------------------
struct RiskAlertEvent {
  std::string symbol;
  domain::RiskLevel level{domain::RiskLevel::Low};
  std::string message;
  std::int64_t timestamp_ms{0};
};

}  // namespace levtrade
