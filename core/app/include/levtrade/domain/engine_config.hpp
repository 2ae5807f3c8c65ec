#pragma once

#include <string>

namespace levtrade {
namespace domain {

// -----------------------------------------------------------------------------
// EngineConfig: every tunable the engine reads
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of account, fee, sizing, pyramiding,
//         trailing and risk-threshold parameters.
//
// @details
// Loaded from JSON by loadEngineConfig() (config/config_loader.hpp) at
// startup and copied by value into TradeExecutor, RiskEngine and
// TradingEngine. Engine logic never hard-codes a threshold; it reads the
// corresponding field here. The member initializers are the reference
// values used when a key is absent from the configuration file.
//
// Units:
//   *_pct fields below 1.0 are fractions (0.01 == 1%).
//   margin_pct / loss_pct / return_pct / *_distance_pct fields are percent
//   units (90.0 == 90%), matching the RiskMetrics they are compared with.
//
// Thread model:
//   Plain data with value semantics. No shared mutable state.
// -----------------------------------------------------------------------------
struct AccountSettings {
  std::string account_id{"main"};
  double initial_balance{10000.0};
  int daily_trades_limit{50};
  double default_leverage{50.0};
  double max_leverage{100.0};
};

struct FeeSettings {
  double trading_fee_pct{0.001};
  /// Exit fee charged on close, as a multiple of the entry fee.
  double exit_fee_multiplier{0.5};
};

struct ProtectionSettings {
  double stop_loss_pct{0.01};
  double target_pct{0.03};
  double min_confidence{60.0};
  double max_holding_hours{48.0};
};

struct SizingSettings {
  double balance_per_trade_pct{0.20};
  double safe_balance_per_trade_pct{0.05};
  /// At or below this balance the safe fraction is used.
  double safe_mode_balance_threshold{1000.0};
  double liquidation_buffer_pct{0.10};
  double min_trade_size{0.001};
  /// Requests smaller than this fraction of the safe quantity are treated
  /// as "no preference" and replaced by the safe quantity.
  double negligible_request_fraction{0.1};
  int max_positions_open{2};
};

struct PyramidingSettings {
  bool enabled{true};
  double min_confidence{80.0};
  double min_profit_pct{1.0};
  int max_adds{3};
  /// Add size as a fraction of the current total quantity.
  double add_percentage{0.5};
};

struct TrailingSettings {
  bool enabled{true};
  int max_count{3};
  /// Fraction of remaining quantity closed per trailing step.
  double exit_percentage{0.3};
  double stop_offset_pct{0.01};
  double target_offset_pct{0.02};
};

struct RiskTier {
  double margin_pct{0.0};
  double loss_pct{0.0};
  double holding_hours{0.0};
};

struct PositionRiskSettings {
  RiskTier medium{70.0, 5.0, 12.0};
  RiskTier high{80.0, 8.0, 24.0};
  RiskTier critical{90.0, 12.0, 36.0};
  RiskTier emergency{95.0, 15.0, 48.0};

  double trailing_stop_activation_pct{5.0};
  double trailing_stop_distance_pct{3.0};
  double trailing_activation_profit_pct{10.0};
  double tighten_stop_distance_pct{2.0};
  double liquidation_emergency_distance_pct{5.0};
  double liquidation_warning_distance_pct{15.0};
  int warning_cooldown_seconds{300};
};

struct PortfolioTier {
  double margin_pct{0.0};
  double loss_pct{0.0};
  /// Account return (vs. initial balance) at or below which the tier fires.
  double return_pct{0.0};
};

struct PortfolioRiskSettings {
  PortfolioTier medium{70.0, 15.0, -20.0};
  PortfolioTier high{85.0, 25.0, -30.0};
  PortfolioTier critical{92.0, 35.0, -40.0};
  /// Anti-overtrade ceiling on ledger margin usage for new admissions.
  double max_portfolio_risk_pct{80.0};
  double high_risk_margin_pct{70.0};
};

struct RuntimeSettings {
  int monitor_interval_ms{5000};
  std::string price_feed_endpoint{"tcp://127.0.0.1:5555"};
  std::string data_directory{"data"};
};

struct EngineConfig {
  AccountSettings account;
  FeeSettings fees;
  ProtectionSettings protection;
  SizingSettings sizing;
  PyramidingSettings pyramiding;
  TrailingSettings trailing;
  PositionRiskSettings position_risk;
  PortfolioRiskSettings portfolio_risk;
  RuntimeSettings runtime;
};

}  // namespace domain
}  // namespace levtrade
