#include "levtrade/risk/risk_engine.hpp"
#include "levtrade/risk/liquidation.hpp"
#include "levtrade/time/time_utils.hpp"
#include "levtrade/util/format.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>

namespace levtrade {

namespace {

constexpr double kMarginScoreWeight = 0.375;
constexpr double kLossScoreWeight = 0.375;
constexpr double kTimeScoreWeight = 0.25;
constexpr double kEffectiveLossWeight = 0.5;

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskEngine::RiskEngine(TradeExecutor& executor,
                       const domain::EngineConfig& config,
                       const ITimeProvider& clock, INotificationSink* notifier)
    : executor_(executor), config_(config), clock_(clock), notifier_(notifier) {}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
double RiskEngine::marginUsage(double margin_used, double balance) const {
  if (balance <= 0.0) {
    return 100.0;
  }
  return std::min(100.0, margin_used / balance * 100.0);
}

RiskEngine::PositionTiers RiskEngine::evaluateTiers(double margin_usage,
                                                    double pnl_percentage,
                                                    double holding_hours) const {
  const auto& cfg = config_.position_risk;
  auto tripped = [&](const domain::RiskTier& tier) {
    return margin_usage > tier.margin_pct || pnl_percentage < -tier.loss_pct ||
           holding_hours > tier.holding_hours;
  };

  PositionTiers tiers;
  tiers.emergency = tripped(cfg.emergency);
  tiers.critical = tripped(cfg.critical);
  tiers.high = tripped(cfg.high);
  tiers.medium = tripped(cfg.medium);
  tiers.high_by_loss = pnl_percentage < -cfg.high.loss_pct;
  return tiers;
}

std::optional<double> RiskEngine::priceFor(
    const domain::Position& position) const {
  if (auto price = executor_.lastPrice(position.symbol)) {
    return price;
  }
  if (position.last_price > 0.0) {
    return position.last_price;
  }
  return std::nullopt;
}

double RiskEngine::trailBehind(const domain::Position& position, double price,
                               double distance_pct) {
  double offset = distance_pct / 100.0;
  return position.side == domain::PositionSide::Long ? price * (1.0 - offset)
                                                     : price * (1.0 + offset);
}

bool RiskEngine::stopCrossed(const domain::Position& position, double stop,
                             double price) {
  if (stop <= 0.0) {
    return false;
  }
  return position.side == domain::PositionSide::Long ? price <= stop
                                                     : price >= stop;
}

double RiskEngine::liquidationDistance(const domain::Position& position,
                                       double price) const {
  return levtrade::liquidationDistance(position, price);
}

std::optional<double> RiskEngine::trailingStop(
    const std::string& position_id) const {
  std::lock_guard lock(mutex_);
  auto it = trailing_.find(position_id);
  if (it == trailing_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void RiskEngine::reset() {
  std::lock_guard lock(mutex_);
  trailing_.clear();
  warnings_.clear();
}

void RiskEngine::forget(const std::string& position_id) {
  std::lock_guard lock(mutex_);
  trailing_.erase(position_id);
}

// -----------------------------------------------------------------------------
// analyzePosition
// -----------------------------------------------------------------------------
domain::RiskMetrics RiskEngine::analyzePosition(
    const domain::Position& position, double price) const {
  const auto& cfg = config_.position_risk;

  domain::Position marked = position;
  if (price > 0.0) {
    domain::markToMarket(marked, price);
  } else {
    price = marked.last_price;
  }

  domain::Account account = executor_.account();

  domain::RiskMetrics m;
  m.position_id = position.id;
  m.symbol = position.symbol;
  m.margin_usage = marginUsage(marked.margin_used, account.current_balance);
  m.pnl_percentage = marked.pnl_percentage;
  m.holding_hours =
      std::max(0.0, hoursBetween(marked.entry_time_ms, clock_.now_ms()));

  if (price > 0.0) {
    bool is_long = marked.side == domain::PositionSide::Long;
    if (marked.stop_loss > 0.0) {
      m.distance_to_stop_loss = (is_long ? price - marked.stop_loss
                                         : marked.stop_loss - price) /
                                price * 100.0;
    }
    if (marked.target > 0.0) {
      m.distance_to_target =
          (is_long ? marked.target - price : price - marked.target) / price *
          100.0;
    }
  }

  // --- Level cascade ---------------------------------------------------------
  PositionTiers tiers =
      evaluateTiers(m.margin_usage, m.pnl_percentage, m.holding_hours);
  if (tiers.critical || tiers.emergency) {
    m.risk_level = domain::RiskLevel::Critical;
  } else if (tiers.high) {
    m.risk_level = domain::RiskLevel::High;
  } else if (tiers.medium) {
    m.risk_level = domain::RiskLevel::Medium;
  } else {
    m.risk_level = domain::RiskLevel::Low;
  }

  // --- Recommendation --------------------------------------------------------
  switch (m.risk_level) {
    case domain::RiskLevel::Critical:
      m.recommended_action = tiers.emergency
                                 ? domain::RiskAction::EmergencyClose
                                 : domain::RiskAction::ClosePosition;
      break;
    case domain::RiskLevel::High:
      m.recommended_action = tiers.high_by_loss
                                 ? domain::RiskAction::TightenStopLoss
                                 : domain::RiskAction::Monitor;
      break;
    case domain::RiskLevel::Medium:
    case domain::RiskLevel::Low:
      m.recommended_action =
          m.pnl_percentage > cfg.trailing_activation_profit_pct
              ? domain::RiskAction::ActivateTrailing
              : domain::RiskAction::Monitor;
      break;
  }

  // --- Trailing stop ---------------------------------------------------------
  std::optional<double> active = trailingStop(position.id);
  if (active) {
    m.trailing_stop_price = active;
  } else if (price > 0.0 &&
             m.pnl_percentage >= cfg.trailing_stop_activation_pct) {
    m.trailing_stop_price =
        trailBehind(marked, price, cfg.trailing_stop_distance_pct);
  }

  // --- Score -----------------------------------------------------------------
  double loss = std::max(0.0, -m.pnl_percentage);
  double time_component =
      cfg.emergency.holding_hours > 0.0
          ? std::min(100.0,
                     m.holding_hours / cfg.emergency.holding_hours * 100.0)
          : 0.0;
  m.risk_score = std::min(100.0, m.margin_usage * kMarginScoreWeight +
                                     loss * kLossScoreWeight +
                                     time_component * kTimeScoreWeight);
  return m;
}

// -----------------------------------------------------------------------------
// closeFor: close through the executor, drop advisory state on success
// -----------------------------------------------------------------------------
RiskActionOutcome RiskEngine::closeFor(const domain::Position& position,
                                       double price, ProtectiveAction action,
                                       const std::string& reason) {
  RiskActionOutcome outcome;
  outcome.position_id = position.id;
  outcome.symbol = position.symbol;

  TradeResult result = executor_.closePosition(position.id, price, reason);
  if (!result.success) {
    std::cerr << "[RiskEngine] Close of " << position.symbol << " ("
              << reason << ") failed: " << result.reason
              << ". Will retry next tick.\n";
    outcome.detail = "Close failed: " + result.reason;
    return outcome;
  }

  forget(position.id);
  outcome.action = action;
  outcome.detail = reason;
  return outcome;
}

// -----------------------------------------------------------------------------
// Alerts
// -----------------------------------------------------------------------------
void RiskEngine::alert(const std::string& symbol, domain::RiskLevel level,
                       const std::string& message) {
  std::cerr << "[RiskEngine] " << domain::toString(level) << " alert on "
            << symbol << ": " << message << "\n";
  if (notifier_ == nullptr) {
    return;
  }
  try {
    notifier_->notifyRiskAlert(symbol, level, message);
  } catch (const std::exception& e) {
    std::cerr << "[RiskEngine] WARNING: risk alert notification failed: "
              << e.what() << "\n";
  }
}

bool RiskEngine::warnRateLimited(const std::string& key,
                                 const std::string& symbol,
                                 domain::RiskLevel level,
                                 const std::string& message) {
  std::int64_t now = clock_.now_ms();
  std::int64_t cooldown_ms =
      static_cast<std::int64_t>(config_.position_risk.warning_cooldown_seconds) *
      kMillisPerSecond;
  {
    std::lock_guard lock(mutex_);
    auto it = warnings_.find(key);
    if (it != warnings_.end() && now - it->second < cooldown_ms) {
      return false;
    }
    warnings_[key] = now;
  }
  alert(symbol, level, message);
  return true;
}

// -----------------------------------------------------------------------------
// executeRiskAction
// -----------------------------------------------------------------------------
RiskActionOutcome RiskEngine::executeRiskAction(
    const domain::Position& position, const domain::RiskMetrics& metrics,
    double price) {
  const auto& cfg = config_.position_risk;

  RiskActionOutcome outcome;
  outcome.position_id = position.id;
  outcome.symbol = position.symbol;

  try {
    // --- 1. Trailing stop ----------------------------------------------------
    if (metrics.trailing_stop_price &&
        stopCrossed(position, *metrics.trailing_stop_price, price)) {
      return closeFor(position, price, ProtectiveAction::TrailingStopExit,
                      "Trailing Stop Hit");
    }
    if (metrics.trailing_stop_price) {
      std::lock_guard lock(mutex_);
      auto it = trailing_.find(position.id);
      if (it == trailing_.end()) {
        trailing_[position.id] = *metrics.trailing_stop_price;
        std::cout << "[RiskEngine] Trailing stop activated on "
                  << position.symbol << " at "
                  << fixed(*metrics.trailing_stop_price) << " (profit "
                  << fixed(metrics.pnl_percentage) << "%)\n";
        outcome.action = ProtectiveAction::TrailingActivated;
        outcome.detail =
            "Trailing stop activated at " + fixed(*metrics.trailing_stop_price);
      } else {
        double candidate =
            trailBehind(position, price, cfg.trailing_stop_distance_pct);
        it->second = position.side == domain::PositionSide::Long
                         ? std::max(it->second, candidate)
                         : std::min(it->second, candidate);
      }
    }

    // --- 2. Critical ---------------------------------------------------------
    if (metrics.risk_level == domain::RiskLevel::Critical) {
      double distance = liquidationDistance(position, price);
      if (distance <= cfg.liquidation_emergency_distance_pct) {
        alert(position.symbol, domain::RiskLevel::Critical,
              "Liquidation distance " + fixed(distance) +
                  "% - emergency close at " + fixed(price));
        return closeFor(position, price, ProtectiveAction::LiquidationClose,
                        "LIQUIDATION PROTECTION - Emergency Close");
      }
      if (metrics.recommended_action == domain::RiskAction::ClosePosition ||
          metrics.recommended_action == domain::RiskAction::EmergencyClose) {
        return closeFor(position, price, ProtectiveAction::RiskClose,
                        std::string("Risk Management: ") +
                            domain::toString(metrics.recommended_action));
      }
    }

    // --- 3. High -------------------------------------------------------------
    if (metrics.risk_level == domain::RiskLevel::High) {
      double distance = liquidationDistance(position, price);
      if (distance <= cfg.liquidation_warning_distance_pct) {
        std::string message = "Liquidation distance " + fixed(distance) +
                              "% at " + fixed(price) + ", margin usage " +
                              fixed(metrics.margin_usage, 1) + "%";
        if (warnRateLimited(position.symbol + "_liquidation_warning",
                            position.symbol, domain::RiskLevel::High,
                            message)) {
          outcome.action = ProtectiveAction::LiquidationWarning;
          outcome.detail = message;
        } else {
          outcome.detail = "Liquidation warning suppressed (cooldown)";
        }
        return outcome;
      }

      if (metrics.recommended_action == domain::RiskAction::TightenStopLoss) {
        double new_stop =
            trailBehind(position, price, cfg.tighten_stop_distance_pct);
        if (executor_.tightenStopLoss(position.id, new_stop)) {
          std::cout << "[RiskEngine] Tightened stop on " << position.symbol
                    << " to " << fixed(new_stop) << "\n";
          outcome.action = ProtectiveAction::StopTightened;
          outcome.detail = "Stop loss tightened to " + fixed(new_stop);
          return outcome;
        }
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[RiskEngine] Risk action on " << position.symbol
              << " failed: " << e.what() << "\n";
    outcome.action = ProtectiveAction::None;
    outcome.detail = std::string("Risk action failed: ") + e.what();
  }

  return outcome;
}

// -----------------------------------------------------------------------------
// analyzePortfolioRisk
// -----------------------------------------------------------------------------
domain::PortfolioRiskSummary RiskEngine::analyzePortfolioRisk() const {
  const auto& cfg = config_.portfolio_risk;
  domain::PortfolioRiskSummary summary;

  std::vector<domain::Position> open =
      executor_.positions(domain::PositionStatus::Open);
  domain::Account account = executor_.account();
  summary.open_positions = open.size();

  if (open.empty()) {
    summary.status = domain::PortfolioRiskStatus::NoOpenPositions;
    summary.recommendations.push_back("No open positions");
    return summary;
  }
  if (account.current_balance <= 0.0) {
    summary.status = domain::PortfolioRiskStatus::InvalidBalance;
    summary.overall_level = domain::RiskLevel::Critical;
    summary.recommendations.push_back(
        "Account balance exhausted - no new trades possible");
    return summary;
  }

  for (const auto& pos : open) {
    std::optional<double> price = priceFor(pos);
    if (!price) {
      continue;
    }
    domain::Position marked = pos;
    domain::markToMarket(marked, *price);

    domain::RiskMetrics metrics = analyzePosition(pos, *price);
    ++summary.risk_distribution[static_cast<std::size_t>(metrics.risk_level)];
    summary.total_margin_used += marked.margin_used;
    summary.total_unrealized_pnl += marked.unrealized_pnl;
    summary.positions.push_back(std::move(metrics));
  }
  summary.analyzed_positions = summary.positions.size();
  summary.status = domain::PortfolioRiskStatus::Analyzed;

  double balance = account.current_balance;
  summary.margin_usage = summary.total_margin_used / balance * 100.0;
  summary.pnl_percentage = summary.total_unrealized_pnl / balance * 100.0;
  double loss = std::max(0.0, -summary.pnl_percentage);
  summary.effective_risk = summary.margin_usage + loss * kEffectiveLossWeight;
  summary.portfolio_return =
      account.initial_balance > 0.0
          ? (balance + summary.total_margin_used +
             summary.total_unrealized_pnl - account.initial_balance) /
                account.initial_balance * 100.0
          : 0.0;

  auto tripped = [&](const domain::PortfolioTier& tier) {
    return summary.margin_usage >= tier.margin_pct || loss >= tier.loss_pct ||
           summary.portfolio_return <= tier.return_pct;
  };
  if (tripped(cfg.critical)) {
    summary.overall_level = domain::RiskLevel::Critical;
  } else if (tripped(cfg.high)) {
    summary.overall_level = domain::RiskLevel::High;
  } else if (tripped(cfg.medium)) {
    summary.overall_level = domain::RiskLevel::Medium;
  } else {
    summary.overall_level = domain::RiskLevel::Low;
  }

  // --- Recommendations -------------------------------------------------------
  auto& recs = summary.recommendations;
  switch (summary.overall_level) {
    case domain::RiskLevel::Critical:
      recs.push_back("CRITICAL: margin usage " +
                     fixed(summary.margin_usage, 1) +
                     "% - close positions now to avoid liquidation");
      break;
    case domain::RiskLevel::High:
      recs.push_back("HIGH RISK: reduce exposure, margin usage " +
                     fixed(summary.margin_usage, 1) + "%");
      break;
    case domain::RiskLevel::Medium:
      recs.push_back("MEDIUM RISK: monitor positions closely");
      break;
    case domain::RiskLevel::Low:
      recs.push_back("Portfolio risk within limits");
      break;
  }
  if (summary.margin_usage >= cfg.max_portfolio_risk_pct) {
    recs.push_back("New trades blocked: margin usage " +
                   fixed(summary.margin_usage, 1) + "% >= " +
                   fixed(cfg.max_portfolio_risk_pct, 1) + "%");
  } else if (summary.margin_usage >= cfg.high_risk_margin_pct) {
    recs.push_back("Avoid new positions: margin usage above " +
                   fixed(cfg.high_risk_margin_pct, 1) + "%");
  }
  for (const auto& m : summary.positions) {
    if (m.risk_level == domain::RiskLevel::High ||
        m.risk_level == domain::RiskLevel::Critical) {
      recs.push_back(m.symbol + ": " + domain::toString(m.risk_level) +
                     " risk, recommended " +
                     domain::toString(m.recommended_action));
    }
  }
  return summary;
}

// -----------------------------------------------------------------------------
// calculateSafeQuantity
// -----------------------------------------------------------------------------
SizingDecision RiskEngine::calculateSafeQuantity(
    const std::string& symbol, double price, double requested_quantity,
    std::optional<double> leverage) const {
  const auto& sizing = config_.sizing;
  SizingDecision decision;

  if (!std::isfinite(price) || price <= 0.0) {
    decision.error = TradeError::InvalidPrice;
    decision.reason = "Invalid price for " + symbol;
    return decision;
  }

  double lev = leverage && *leverage > 0.0 ? *leverage
                                           : config_.account.default_leverage;
  domain::Account account = executor_.account();
  if (lev > account.max_leverage) {
    decision.error = TradeError::InvalidLeverage;
    decision.reason = "Invalid leverage: " + fixed(lev, 1) + "x (max " +
                      fixed(account.max_leverage, 1) + "x)";
    return decision;
  }

  // --- 1. Anti-overtrade -----------------------------------------------------
  double balance = account.current_balance;
  double usage = balance > 0.0
                     ? account.total_margin_used / balance * 100.0
                     : (account.total_margin_used > 0.0 ? 100.0 : 0.0);
  double max_risk = config_.portfolio_risk.max_portfolio_risk_pct;
  if (usage >= max_risk) {
    decision.error = TradeError::LimitReached;
    decision.reason = "ANTI-OVERTRADE: Portfolio risk too high " +
                      fixed(usage, 1) + "% >= " + fixed(max_risk, 1) +
                      "%. Close existing positions first.";
    return decision;
  }

  // --- 2. One position per symbol --------------------------------------------
  if (auto existing = executor_.openPositionFor(symbol)) {
    decision.error = TradeError::DuplicatePosition;
    decision.reason = "Position already open for " + symbol + " (" +
                      existing->id + ")";
    return decision;
  }

  // --- 3. Open-position cap --------------------------------------------------
  std::size_t open = executor_.openPositionCount();
  if (open >= static_cast<std::size_t>(std::max(0, sizing.max_positions_open))) {
    decision.error = TradeError::LimitReached;
    decision.reason = "Maximum open positions limit reached (" +
                      std::to_string(open) + "/" +
                      std::to_string(sizing.max_positions_open) + ")";
    return decision;
  }

  if (balance <= 0.0) {
    decision.error = TradeError::InsufficientBalance;
    decision.reason = "No available balance";
    return decision;
  }

  // --- 4-6. Balance fraction, leverage, liquidation buffer -------------------
  double fraction = balance <= sizing.safe_mode_balance_threshold
                        ? sizing.safe_balance_per_trade_pct
                        : sizing.balance_per_trade_pct;
  double value = balance * fraction * lev;
  double raw = value / price;
  double safe = raw * (1.0 - sizing.liquidation_buffer_pct);

  // --- 7. Requested vs safe --------------------------------------------------
  double quantity = 0.0;
  std::string basis;
  if (requested_quantity <= 0.0 ||
      requested_quantity < safe * sizing.negligible_request_fraction) {
    quantity = safe;
    basis = "calculated from " + fixed(fraction * 100.0, 0) +
            "% of balance at " + fixed(lev, 0) + "x";
  } else if (requested_quantity <= safe) {
    quantity = requested_quantity;
    basis = "approved";
  } else {
    quantity = safe;
    basis = "adjusted for liquidation protection (requested " +
            fixed(requested_quantity, 6) + ")";
  }

  // --- 8. Viability ----------------------------------------------------------
  if (quantity < sizing.min_trade_size) {
    decision.error = TradeError::InvalidQuantity;
    decision.reason = "Quantity " + fixed(quantity, 6) +
                      " below minimum trade size " +
                      fixed(sizing.min_trade_size, 6);
    return decision;
  }
  double margin = quantity * price / lev;
  double fee = margin * config_.fees.trading_fee_pct;
  if (margin + fee > balance) {
    decision.error = TradeError::InsufficientBalance;
    decision.reason = "Insufficient balance. Need " + fixed(margin + fee) +
                      ", have " + fixed(balance);
    return decision;
  }

  decision.quantity = quantity;
  decision.reason = "Qty: " + fixed(quantity, 6) + " " + basis +
                    " (margin " + fixed(margin) + ", buffer " +
                    fixed(sizing.liquidation_buffer_pct * 100.0, 0) + "%)";
  return decision;
}

// -----------------------------------------------------------------------------
// monitorPositions
// -----------------------------------------------------------------------------
std::vector<RiskActionOutcome> RiskEngine::monitorPositions() {
  std::vector<RiskActionOutcome> outcomes;
  std::vector<domain::Position> open =
      executor_.positions(domain::PositionStatus::Open);

  {
    std::lock_guard lock(mutex_);
    for (auto it = trailing_.begin(); it != trailing_.end();) {
      bool still_open =
          std::any_of(open.begin(), open.end(),
                      [&](const domain::Position& p) { return p.id == it->first; });
      it = still_open ? std::next(it) : trailing_.erase(it);
    }
  }

  std::int64_t now = clock_.now_ms();

  for (const auto& pos : open) {
    try {
      std::optional<double> maybe_price = priceFor(pos);
      if (!maybe_price) {
        continue;
      }
      double price = *maybe_price;
      bool is_long = pos.side == domain::PositionSide::Long;

      // --- 1. Stop loss ------------------------------------------------------
      if (stopCrossed(pos, pos.stop_loss, price)) {
        outcomes.push_back(closeFor(pos, price, ProtectiveAction::StopLossExit,
                                    "Stop Loss Hit"));
        continue;
      }

      // --- 2. Target ---------------------------------------------------------
      bool target_hit = pos.target > 0.0 &&
                        (is_long ? price >= pos.target : price <= pos.target);
      if (target_hit) {
        OpportunityCheck trail = executor_.checkTrailingOpportunity(pos.id, price);
        if (trail.eligible) {
          TradeResult result = executor_.partialClose(
              pos.id, trail.quantity, price, "Trailing Profit Lock");
          RiskActionOutcome outcome;
          outcome.position_id = pos.id;
          outcome.symbol = pos.symbol;
          if (result.success) {
            auto after = executor_.position(pos.id);
            if (after && after->status == domain::PositionStatus::Open) {
              executor_.reanchorLevels(pos.id, price);
            } else {
              forget(pos.id);
            }
            outcome.action = ProtectiveAction::TrailingProfitLock;
            outcome.detail = result.reason;
          } else {
            std::cerr << "[RiskEngine] Trailing partial close on "
                      << pos.symbol << " failed: " << result.reason << "\n";
            outcome.detail = "Partial close failed: " + result.reason;
          }
          outcomes.push_back(std::move(outcome));
        } else {
          outcomes.push_back(
              closeFor(pos, price, ProtectiveAction::TargetExit, "Target Hit"));
        }
        continue;
      }

      // --- 3. Holding time ---------------------------------------------------
      if (hoursBetween(pos.entry_time_ms, now) >=
          config_.protection.max_holding_hours) {
        outcomes.push_back(closeFor(pos, price, ProtectiveAction::TimeLimitExit,
                                    "Time Limit Reached"));
        continue;
      }

      // --- 4. Full analysis --------------------------------------------------
      domain::RiskMetrics metrics = analyzePosition(pos, price);
      RiskActionOutcome outcome = executeRiskAction(pos, metrics, price);
      if (outcome.action != ProtectiveAction::None) {
        outcomes.push_back(std::move(outcome));
      }
    } catch (const std::exception& e) {
      std::cerr << "[RiskEngine] Monitoring " << pos.symbol
                << " failed: " << e.what() << "\n";
    }
  }

  return outcomes;
}

}  // namespace levtrade
