#include "levtrade/config/config_loader.hpp"

#include <fstream>
#include <stdexcept>

namespace levtrade {

namespace {

// Copies json[key] into `out` when present. Type mismatches are reported
// with the dotted path so a broken config file is easy to locate.
template <typename T>
void readField(const nlohmann::json& group, const std::string& group_name,
               const char* key, T& out) {
  auto it = group.find(key);
  if (it == group.end()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("config: " + group_name + "." + key + ": " +
                             e.what());
  }
}

const nlohmann::json* findGroup(const nlohmann::json& json, const char* name) {
  auto it = json.find(name);
  if (it == json.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw std::runtime_error(std::string("config: '") + name +
                             "' must be an object");
  }
  return &(*it);
}

void readRiskTier(const nlohmann::json& group, const std::string& prefix,
                  const char* name, domain::RiskTier& tier) {
  const nlohmann::json* node = findGroup(group, name);
  if (node == nullptr) {
    return;
  }
  std::string path = prefix + "." + name;
  readField(*node, path, "margin_pct", tier.margin_pct);
  readField(*node, path, "loss_pct", tier.loss_pct);
  readField(*node, path, "holding_hours", tier.holding_hours);
}

void readPortfolioTier(const nlohmann::json& group, const std::string& prefix,
                       const char* name, domain::PortfolioTier& tier) {
  const nlohmann::json* node = findGroup(group, name);
  if (node == nullptr) {
    return;
  }
  std::string path = prefix + "." + name;
  readField(*node, path, "margin_pct", tier.margin_pct);
  readField(*node, path, "loss_pct", tier.loss_pct);
  readField(*node, path, "return_pct", tier.return_pct);
}

void validate(const domain::EngineConfig& cfg) {
  if (cfg.account.initial_balance <= 0.0) {
    throw std::runtime_error("config: account.initial_balance must be > 0");
  }
  if (cfg.account.default_leverage <= 0.0 || cfg.account.max_leverage <= 0.0) {
    throw std::runtime_error("config: leverage values must be > 0");
  }
  if (cfg.account.default_leverage > cfg.account.max_leverage) {
    throw std::runtime_error(
        "config: account.default_leverage exceeds account.max_leverage");
  }
  if (cfg.account.daily_trades_limit < 0 ||
      cfg.sizing.max_positions_open < 0) {
    throw std::runtime_error("config: limits must be non-negative");
  }
  if (cfg.sizing.liquidation_buffer_pct < 0.0 ||
      cfg.sizing.liquidation_buffer_pct >= 1.0) {
    throw std::runtime_error(
        "config: sizing.liquidation_buffer_pct must be in [0, 1)");
  }
  if (cfg.trailing.exit_percentage <= 0.0 ||
      cfg.trailing.exit_percentage > 1.0) {
    throw std::runtime_error("config: trailing.exit_percentage must be in (0, 1]");
  }
  if (cfg.runtime.monitor_interval_ms <= 0) {
    throw std::runtime_error("config: runtime.monitor_interval_ms must be > 0");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// engineConfigFromJson
// -----------------------------------------------------------------------------
domain::EngineConfig engineConfigFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::runtime_error("config: top-level value must be an object");
  }

  domain::EngineConfig cfg;

  if (const auto* g = findGroup(json, "account")) {
    readField(*g, "account", "account_id", cfg.account.account_id);
    readField(*g, "account", "initial_balance", cfg.account.initial_balance);
    readField(*g, "account", "daily_trades_limit",
              cfg.account.daily_trades_limit);
    readField(*g, "account", "default_leverage", cfg.account.default_leverage);
    readField(*g, "account", "max_leverage", cfg.account.max_leverage);
  }

  if (const auto* g = findGroup(json, "fees")) {
    readField(*g, "fees", "trading_fee_pct", cfg.fees.trading_fee_pct);
    readField(*g, "fees", "exit_fee_multiplier", cfg.fees.exit_fee_multiplier);
  }

  if (const auto* g = findGroup(json, "protection")) {
    readField(*g, "protection", "stop_loss_pct", cfg.protection.stop_loss_pct);
    readField(*g, "protection", "target_pct", cfg.protection.target_pct);
    readField(*g, "protection", "min_confidence",
              cfg.protection.min_confidence);
    readField(*g, "protection", "max_holding_hours",
              cfg.protection.max_holding_hours);
  }

  if (const auto* g = findGroup(json, "sizing")) {
    auto& s = cfg.sizing;
    readField(*g, "sizing", "balance_per_trade_pct", s.balance_per_trade_pct);
    readField(*g, "sizing", "safe_balance_per_trade_pct",
              s.safe_balance_per_trade_pct);
    readField(*g, "sizing", "safe_mode_balance_threshold",
              s.safe_mode_balance_threshold);
    readField(*g, "sizing", "liquidation_buffer_pct", s.liquidation_buffer_pct);
    readField(*g, "sizing", "min_trade_size", s.min_trade_size);
    readField(*g, "sizing", "negligible_request_fraction",
              s.negligible_request_fraction);
    readField(*g, "sizing", "max_positions_open", s.max_positions_open);
  }

  if (const auto* g = findGroup(json, "pyramiding")) {
    auto& p = cfg.pyramiding;
    readField(*g, "pyramiding", "enabled", p.enabled);
    readField(*g, "pyramiding", "min_confidence", p.min_confidence);
    readField(*g, "pyramiding", "min_profit_pct", p.min_profit_pct);
    readField(*g, "pyramiding", "max_adds", p.max_adds);
    readField(*g, "pyramiding", "add_percentage", p.add_percentage);
  }

  if (const auto* g = findGroup(json, "trailing")) {
    auto& t = cfg.trailing;
    readField(*g, "trailing", "enabled", t.enabled);
    readField(*g, "trailing", "max_count", t.max_count);
    readField(*g, "trailing", "exit_percentage", t.exit_percentage);
    readField(*g, "trailing", "stop_offset_pct", t.stop_offset_pct);
    readField(*g, "trailing", "target_offset_pct", t.target_offset_pct);
  }

  if (const auto* g = findGroup(json, "position_risk")) {
    auto& r = cfg.position_risk;
    readRiskTier(*g, "position_risk", "medium", r.medium);
    readRiskTier(*g, "position_risk", "high", r.high);
    readRiskTier(*g, "position_risk", "critical", r.critical);
    readRiskTier(*g, "position_risk", "emergency", r.emergency);
    readField(*g, "position_risk", "trailing_stop_activation_pct",
              r.trailing_stop_activation_pct);
    readField(*g, "position_risk", "trailing_stop_distance_pct",
              r.trailing_stop_distance_pct);
    readField(*g, "position_risk", "trailing_activation_profit_pct",
              r.trailing_activation_profit_pct);
    readField(*g, "position_risk", "tighten_stop_distance_pct",
              r.tighten_stop_distance_pct);
    readField(*g, "position_risk", "liquidation_emergency_distance_pct",
              r.liquidation_emergency_distance_pct);
    readField(*g, "position_risk", "liquidation_warning_distance_pct",
              r.liquidation_warning_distance_pct);
    readField(*g, "position_risk", "warning_cooldown_seconds",
              r.warning_cooldown_seconds);
  }

  if (const auto* g = findGroup(json, "portfolio_risk")) {
    auto& r = cfg.portfolio_risk;
    readPortfolioTier(*g, "portfolio_risk", "medium", r.medium);
    readPortfolioTier(*g, "portfolio_risk", "high", r.high);
    readPortfolioTier(*g, "portfolio_risk", "critical", r.critical);
    readField(*g, "portfolio_risk", "max_portfolio_risk_pct",
              r.max_portfolio_risk_pct);
    readField(*g, "portfolio_risk", "high_risk_margin_pct",
              r.high_risk_margin_pct);
  }

  if (const auto* g = findGroup(json, "runtime")) {
    readField(*g, "runtime", "monitor_interval_ms",
              cfg.runtime.monitor_interval_ms);
    readField(*g, "runtime", "price_feed_endpoint",
              cfg.runtime.price_feed_endpoint);
    readField(*g, "runtime", "data_directory", cfg.runtime.data_directory);
  }

  validate(cfg);
  return cfg;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
domain::EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open " + path);
  }

  nlohmann::json json;
  try {
    in >> json;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("config: " + path + " is not valid JSON: " +
                             e.what());
  }

  return engineConfigFromJson(json);
}

}  // namespace levtrade
