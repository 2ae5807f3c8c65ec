#pragma once

#include "levtrade/domain/position.hpp"
#include "levtrade/domain/risk_metrics.hpp"

#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// INotificationSink: fire-and-forget notifications
// -----------------------------------------------------------------------------
//
// @brief  Receives trade executions, position closes and risk alerts.
//
// @details
// Delivery (e-mail, chat, dashboards) is someone else's concern. The engine
// only promises to call these methods after the corresponding state change
// has been committed, outside its own locks, and to treat every call as
// best-effort: an exception escaping a sink is caught and logged by the
// caller, never propagated into a trade or risk action.
//
// Implementations:
//   - NullNotificationSink      → no-op (below).
//   - EventBusNotificationSink  → republishes as events on an EventBus.
//
// Thread-safety contract:
//   Calls may arrive from the caller's thread (openTrade) and from the risk
//   loop thread (monitoring) concurrently.
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;

  virtual void notifyTradeExecution(const domain::Position& position) = 0;

  virtual void notifyPositionClose(const domain::Position& position,
                                   const std::string& reason) = 0;

  virtual void notifyRiskAlert(const std::string& symbol,
                               domain::RiskLevel level,
                               const std::string& message) = 0;
};

// -----------------------------------------------------------------------------
// NullNotificationSink: discards everything
// -----------------------------------------------------------------------------
class NullNotificationSink final : public INotificationSink {
 public:
  void notifyTradeExecution(const domain::Position& /*position*/) override {}

  void notifyPositionClose(const domain::Position& /*position*/,
                           const std::string& /*reason*/) override {}

  void notifyRiskAlert(const std::string& /*symbol*/,
                       domain::RiskLevel /*level*/,
                       const std::string& /*message*/) override {}
};

}  // namespace levtrade
