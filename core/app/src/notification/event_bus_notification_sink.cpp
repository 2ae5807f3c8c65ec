#include "levtrade/notification/event_bus_notification_sink.hpp"

namespace levtrade {

EventBusNotificationSink::EventBusNotificationSink(EventBus& bus,
                                                   const ITimeProvider& clock)
    : bus_(bus), clock_(clock) {}

// -----------------------------------------------------------------------------
// notifyTradeExecution → TradeExecutedEvent
// -----------------------------------------------------------------------------
void EventBusNotificationSink::notifyTradeExecution(
    const domain::Position& position) {
  TradeExecutedEvent event;
  event.position = position;
  event.timestamp_ms = clock_.now_ms();
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// notifyPositionClose → PositionClosedEvent
// -----------------------------------------------------------------------------
void EventBusNotificationSink::notifyPositionClose(
    const domain::Position& position, const std::string& reason) {
  PositionClosedEvent event;
  event.position = position;
  event.reason = reason;
  event.timestamp_ms = clock_.now_ms();
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// notifyRiskAlert → RiskAlertEvent
// -----------------------------------------------------------------------------
void EventBusNotificationSink::notifyRiskAlert(const std::string& symbol,
                                               domain::RiskLevel level,
                                               const std::string& message) {
  RiskAlertEvent event;
  event.symbol = symbol;
  event.level = level;
  event.message = message;
  event.timestamp_ms = clock_.now_ms();
  bus_.publish(event);
}

}  // namespace levtrade
