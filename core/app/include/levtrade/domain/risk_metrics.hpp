#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace levtrade {
namespace domain {

enum class RiskLevel { Low, Medium, High, Critical };

enum class RiskAction {
  Monitor,
  TightenStopLoss,
  ActivateTrailing,
  ClosePosition,
  EmergencyClose
};

inline const char* toString(RiskLevel level) {
  switch (level) {
    case RiskLevel::Low:
      return "low";
    case RiskLevel::Medium:
      return "medium";
    case RiskLevel::High:
      return "high";
    case RiskLevel::Critical:
      return "critical";
  }
  return "low";
}

inline const char* toString(RiskAction action) {
  switch (action) {
    case RiskAction::Monitor:
      return "monitor";
    case RiskAction::TightenStopLoss:
      return "tighten_stop_loss";
    case RiskAction::ActivateTrailing:
      return "activate_trailing";
    case RiskAction::ClosePosition:
      return "close_position";
    case RiskAction::EmergencyClose:
      return "emergency_close";
  }
  return "monitor";
}

// -----------------------------------------------------------------------------
// RiskMetrics: derived per-position risk snapshot
// -----------------------------------------------------------------------------
//
// Recomputed on every evaluation and never persisted. Percentages are in
// percent units (12.5 means 12.5%).
// -----------------------------------------------------------------------------
struct RiskMetrics {
  std::string position_id;
  std::string symbol;
  RiskLevel risk_level{RiskLevel::Low};
  double margin_usage{0.0};
  double pnl_percentage{0.0};
  double holding_hours{0.0};
  double distance_to_stop_loss{0.0};
  double distance_to_target{0.0};
  RiskAction recommended_action{RiskAction::Monitor};
  std::optional<double> trailing_stop_price;
  double risk_score{0.0};
};

enum class PortfolioRiskStatus { Analyzed, NoOpenPositions, InvalidBalance };

inline const char* toString(PortfolioRiskStatus status) {
  switch (status) {
    case PortfolioRiskStatus::Analyzed:
      return "analyzed";
    case PortfolioRiskStatus::NoOpenPositions:
      return "no_open_positions";
    case PortfolioRiskStatus::InvalidBalance:
      return "invalid_balance";
  }
  return "analyzed";
}

// Aggregate view over every OPEN position with a known price.
struct PortfolioRiskSummary {
  PortfolioRiskStatus status{PortfolioRiskStatus::NoOpenPositions};
  RiskLevel overall_level{RiskLevel::Low};
  std::size_t open_positions{0};
  std::size_t analyzed_positions{0};
  double total_margin_used{0.0};
  double total_unrealized_pnl{0.0};
  double margin_usage{0.0};
  double pnl_percentage{0.0};
  double effective_risk{0.0};
  double portfolio_return{0.0};
  std::vector<RiskMetrics> positions;
  // Indexed by static_cast<std::size_t>(RiskLevel).
  std::array<std::size_t, 4> risk_distribution{};
  std::vector<std::string> recommendations;
};

}  // namespace domain
}  // namespace levtrade
