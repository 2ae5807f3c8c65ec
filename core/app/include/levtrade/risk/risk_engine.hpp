#pragma once

#include "levtrade/domain/engine_config.hpp"
#include "levtrade/domain/position.hpp"
#include "levtrade/domain/risk_metrics.hpp"
#include "levtrade/execution/trade_executor.hpp"
#include "levtrade/execution/trade_result.hpp"
#include "levtrade/notification/i_notification_sink.hpp"
#include "levtrade/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace levtrade {

// Admission-control verdict. quantity == 0 means rejected; `reason` names
// the constraint that decided the result either way.
struct SizingDecision {
  double quantity{0.0};
  std::string reason;
  TradeError error{TradeError::None};

  bool approved() const { return quantity > 0.0; }
};

enum class ProtectiveAction {
  None,
  StopLossExit,
  TargetExit,
  TrailingProfitLock,
  TimeLimitExit,
  TrailingStopExit,
  LiquidationClose,
  RiskClose,
  LiquidationWarning,
  StopTightened,
  TrailingActivated
};

inline const char* toString(ProtectiveAction action) {
  switch (action) {
    case ProtectiveAction::None:
      return "none";
    case ProtectiveAction::StopLossExit:
      return "stop_loss_exit";
    case ProtectiveAction::TargetExit:
      return "target_exit";
    case ProtectiveAction::TrailingProfitLock:
      return "trailing_profit_lock";
    case ProtectiveAction::TimeLimitExit:
      return "time_limit_exit";
    case ProtectiveAction::TrailingStopExit:
      return "trailing_stop_exit";
    case ProtectiveAction::LiquidationClose:
      return "liquidation_close";
    case ProtectiveAction::RiskClose:
      return "risk_close";
    case ProtectiveAction::LiquidationWarning:
      return "liquidation_warning";
    case ProtectiveAction::StopTightened:
      return "stop_tightened";
    case ProtectiveAction::TrailingActivated:
      return "trailing_activated";
  }
  return "none";
}

// What a risk pass did to one position. `detail` carries the close reason
// or a short description of the adjustment.
struct RiskActionOutcome {
  std::string position_id;
  std::string symbol;
  ProtectiveAction action{ProtectiveAction::None};
  std::string detail;
};

// -----------------------------------------------------------------------------
// RiskEngine
// -----------------------------------------------------------------------------
//
// @brief  Scores per-position and portfolio risk, sizes new orders
//         (admission control) and triggers protective actions.
//
// @details
// RiskEngine never edits Account or Position state. It reads copies from
// TradeExecutor and asks it to close, partially close, tighten or re-anchor.
// The only state it owns is advisory:
//
//   trailing_   position id → trailing stop price. Activated once a position
//               is far enough in profit, then ratcheted in the favorable
//               direction only. Dropped when the position closes.
//   warnings_   alert key → last emission time, for rate-limited warnings.
//
// Risk thresholds come from EngineConfig::position_risk and
// EngineConfig::portfolio_risk; sizing from EngineConfig::sizing.
//
// Failure handling:
//   executeRiskAction() and monitorPositions() never throw. A failed close
//   is logged and the position is simply re-evaluated on the next tick.
//
// Thread model:
//   monitorPositions() is expected to run on the risk loop thread.
//   calculateSafeQuantity() and the analysis methods may be called from any
//   thread. mutex_ guards trailing_ and warnings_ only and is never held
//   while calling into TradeExecutor.
//
// Ownership:
//   Borrows the executor, clock and (optional) notification sink; all must
//   outlive the RiskEngine.
// -----------------------------------------------------------------------------
class RiskEngine {
 public:
  RiskEngine(TradeExecutor& executor, const domain::EngineConfig& config,
             const ITimeProvider& clock, INotificationSink* notifier = nullptr);

  RiskEngine(const RiskEngine&) = delete;
  RiskEngine& operator=(const RiskEngine&) = delete;
  RiskEngine(RiskEngine&&) = delete;
  RiskEngine& operator=(RiskEngine&&) = delete;

  // -------------------------------------------------------------------------
  // analyzePosition(position, price)
  // -------------------------------------------------------------------------
  //
  // @brief  Risk snapshot of one position marked at `price`.
  //
  // @details
  //   margin_usage   margin_used / current_balance * 100, capped at 100
  //                  (100 when the balance is exhausted)
  //   pnl_percentage realized + unrealized at `price`, over invested amount
  //   holding_hours  now - entry_time
  //
  // Level cascade, first match wins, each tier tripped by margin usage
  // above, loss below, or holding time above its thresholds:
  //   critical → CRITICAL, high → HIGH, medium → MEDIUM, else LOW.
  //
  // Recommendation:
  //   emergency tier tripped   EMERGENCY_CLOSE
  //   CRITICAL                 CLOSE_POSITION
  //   HIGH                     TIGHTEN_STOP_LOSS when the loss tripped it,
  //                            otherwise MONITOR
  //   MEDIUM / LOW             ACTIVATE_TRAILING above the trailing
  //                            activation profit, otherwise MONITOR
  //
  // trailing_stop_price is the ratcheted stop when trailing is active for
  // the position; otherwise a suggestion trailing_stop_distance_pct behind
  // `price` once profit reaches trailing_stop_activation_pct.
  // -------------------------------------------------------------------------
  domain::RiskMetrics analyzePosition(const domain::Position& position,
                                      double price) const;

  // -------------------------------------------------------------------------
  // executeRiskAction(position, metrics, price)
  // -------------------------------------------------------------------------
  //
  // @details
  // Steps, stopping at the first one that closes the position:
  //   1. Trailing stop crossed → close "Trailing Stop Hit". Otherwise a
  //      first suggestion (profit >= trailing_stop_activation_pct) becomes
  //      the stored trailing stop, and a stored one is ratcheted toward
  //      `price`, never back.
  //   2. CRITICAL: liquidation distance <= emergency distance → close
  //      "LIQUIDATION PROTECTION - Emergency Close" and raise a risk alert.
  //      Otherwise a close/emergency recommendation closes with
  //      "Risk Management: <action>".
  //   3. HIGH: liquidation distance <= warning distance → rate-limited
  //      warning, no trade action. Otherwise TIGHTEN_STOP_LOSS moves the
  //      stop tighten_stop_distance_pct from `price` (never looser).
  // -------------------------------------------------------------------------
  RiskActionOutcome executeRiskAction(const domain::Position& position,
                                      const domain::RiskMetrics& metrics,
                                      double price);

  // Percentage move left before the estimated liquidation price.
  // See levtrade/risk/liquidation.hpp.
  double liquidationDistance(const domain::Position& position,
                             double price) const;

  // -------------------------------------------------------------------------
  // analyzePortfolioRisk()
  // -------------------------------------------------------------------------
  //
  // @details
  // Covers OPEN positions with a known price (latest tick, else the last
  // mark).
  //   margin_usage     total margin / current_balance * 100
  //   pnl_percentage   total unrealized PnL / current_balance * 100
  //   portfolio_return (balance + margin + unrealized - initial) / initial
  //   effective_risk   margin_usage + max(0, -pnl_percentage) * 0.5
  //
  // overall_level is decided by margin usage, loss and return against the
  // portfolio tiers (>= on margin and loss, <= on return). effective_risk
  // is reported but does not drive the level.
  // -------------------------------------------------------------------------
  domain::PortfolioRiskSummary analyzePortfolioRisk() const;

  // -------------------------------------------------------------------------
  // calculateSafeQuantity(symbol, price, requested_quantity, leverage)
  // -------------------------------------------------------------------------
  //
  // @details
  // In order:
  //   1. anti-overtrade: reject when account margin usage is at or above
  //      max_portfolio_risk_pct
  //   2. reject when the symbol already has an OPEN position
  //   3. reject when the open-position cap is reached
  //   4. fraction = safe fraction at or below the safe-mode balance,
  //      normal fraction above it
  //   5. value = balance * fraction * leverage, raw = value / price
  //   6. safe = raw * (1 - liquidation_buffer_pct)
  //   7. requested quantity if it is smaller than safe, safe if the request
  //      is zero or negligible, otherwise safe
  //   8. reject below min_trade_size or when margin + fee exceed balance
  //
  // leverage defaults to the configured default leverage.
  // -------------------------------------------------------------------------
  SizingDecision calculateSafeQuantity(
      const std::string& symbol, double price, double requested_quantity,
      std::optional<double> leverage = std::nullopt) const;

  // -------------------------------------------------------------------------
  // monitorPositions()
  // -------------------------------------------------------------------------
  //
  // @details
  // For each OPEN position with a known price, in this order:
  //   1. stop loss hit        → close "Stop Loss Hit"
  //   2. target hit           → trailing partial close "Trailing Profit
  //                             Lock" and re-anchor when eligible, else
  //                             close "Target Hit"
  //   3. max holding exceeded → close "Time Limit Reached"
  //   4. analyzePosition() + executeRiskAction()
  // Returns one outcome per position that was acted on.
  // -------------------------------------------------------------------------
  std::vector<RiskActionOutcome> monitorPositions();

  // Active trailing stop for a position, if any.
  std::optional<double> trailingStop(const std::string& position_id) const;

  // Forget trailing states and warning cooldowns (used on data wipe).
  void reset();

 private:
  struct PositionTiers {
    bool medium{false};
    bool high{false};
    bool critical{false};
    bool emergency{false};
    bool high_by_loss{false};
  };

  PositionTiers evaluateTiers(double margin_usage, double pnl_percentage,
                              double holding_hours) const;
  double marginUsage(double margin_used, double balance) const;
  std::optional<double> priceFor(const domain::Position& position) const;

  // Favorable-direction stop `distance_pct` behind `price`.
  static double trailBehind(const domain::Position& position, double price,
                            double distance_pct);
  static bool stopCrossed(const domain::Position& position, double stop,
                          double price);

  RiskActionOutcome closeFor(const domain::Position& position, double price,
                             ProtectiveAction action,
                             const std::string& reason);
  bool warnRateLimited(const std::string& key, const std::string& symbol,
                       domain::RiskLevel level, const std::string& message);
  void alert(const std::string& symbol, domain::RiskLevel level,
             const std::string& message);
  void forget(const std::string& position_id);

  TradeExecutor& executor_;
  const domain::EngineConfig config_;
  const ITimeProvider& clock_;
  INotificationSink* notifier_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, double> trailing_;
  std::unordered_map<std::string, std::int64_t> warnings_;
};

}  // namespace levtrade
