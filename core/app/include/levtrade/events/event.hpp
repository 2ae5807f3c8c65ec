#pragma once

#include "levtrade/events/event_types.hpp"

#include <variant>

namespace levtrade {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type carried by EventBus and
// ThreadSafeQueue.
// Inbound:  PriceSnapshotEvent, MonitorTickEvent (work for the risk loop).
// Outbound: TradeExecutedEvent, PositionClosedEvent, RiskAlertEvent
//           (notifications for external subscribers).
// Dispatch with std::get_if or EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using Event = std::variant<
    PriceSnapshotEvent,
    MonitorTickEvent,
    TradeExecutedEvent,
    PositionClosedEvent,
    RiskAlertEvent>;

}  // namespace levtrade
