#pragma once

#include "levtrade/eventbus/event_bus.hpp"
#include "levtrade/notification/i_notification_sink.hpp"
#include "levtrade/time/i_time_provider.hpp"

namespace levtrade {

// -----------------------------------------------------------------------------
// EventBusNotificationSink
// -----------------------------------------------------------------------------
//
// @brief  Turns notifications into TradeExecutedEvent, PositionClosedEvent
//         and RiskAlertEvent published on an EventBus.
//
// @details
// TradingEngine wires this to the risk loop's bus so that main() (console
// logging) and tests can observe engine activity with ordinary typed
// subscriptions.
//
// publish() runs subscribers synchronously on the notifying thread. A
// subscriber that throws is the caller's problem: TradeExecutor and
// RiskEngine wrap every notify call.
//
// Ownership: borrows the bus and clock; both must outlive the sink.
// -----------------------------------------------------------------------------
class EventBusNotificationSink final : public INotificationSink {
 public:
  EventBusNotificationSink(EventBus& bus, const ITimeProvider& clock);

  void notifyTradeExecution(const domain::Position& position) override;
  void notifyPositionClose(const domain::Position& position,
                           const std::string& reason) override;
  void notifyRiskAlert(const std::string& symbol, domain::RiskLevel level,
                       const std::string& message) override;

 private:
  EventBus& bus_;
  const ITimeProvider& clock_;
};

}  // namespace levtrade
