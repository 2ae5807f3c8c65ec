#pragma once

#include <string>
#include <utility>

namespace levtrade {

// Failure taxonomy for TradeExecutor operations. None on success.
enum class TradeError {
  None,
  InvalidRequest,
  InvalidSignal,
  InvalidPrice,
  InvalidQuantity,
  InvalidLeverage,
  LowConfidence,
  DailyLimitReached,
  DuplicatePosition,
  InsufficientBalance,
  PositionNotFound,
  PositionNotOpen,
  FeatureDisabled,
  LimitReached
};

inline const char* toString(TradeError error) {
  switch (error) {
    case TradeError::None:
      return "none";
    case TradeError::InvalidRequest:
      return "invalid_request";
    case TradeError::InvalidSignal:
      return "invalid_signal";
    case TradeError::InvalidPrice:
      return "invalid_price";
    case TradeError::InvalidQuantity:
      return "invalid_quantity";
    case TradeError::InvalidLeverage:
      return "invalid_leverage";
    case TradeError::LowConfidence:
      return "low_confidence";
    case TradeError::DailyLimitReached:
      return "daily_limit_reached";
    case TradeError::DuplicatePosition:
      return "duplicate_position";
    case TradeError::InsufficientBalance:
      return "insufficient_balance";
    case TradeError::PositionNotFound:
      return "position_not_found";
    case TradeError::PositionNotOpen:
      return "position_not_open";
    case TradeError::FeatureDisabled:
      return "feature_disabled";
    case TradeError::LimitReached:
      return "limit_reached";
  }
  return "none";
}

// -----------------------------------------------------------------------------
// TradeResult
// -----------------------------------------------------------------------------
//
// @brief  Outcome of a mutating TradeExecutor call.
//
// @details
// `reason` is human readable and part of the contract: callers display it
// and tests match on it. On success it describes what was done; on failure
// it names the constraint that rejected the call.
// -----------------------------------------------------------------------------
struct TradeResult {
  bool success{false};
  TradeError error{TradeError::None};
  std::string reason;
  std::string position_id;

  static TradeResult ok(std::string position_id, std::string reason) {
    TradeResult r;
    r.success = true;
    r.position_id = std::move(position_id);
    r.reason = std::move(reason);
    return r;
  }

  static TradeResult fail(TradeError error, std::string reason) {
    TradeResult r;
    r.error = error;
    r.reason = std::move(reason);
    return r;
  }
};

// Eligibility verdict from checkPyramidingOpportunity /
// checkTrailingOpportunity. quantity and margin are the proposed sizes when
// eligible (margin is 0 for trailing).
struct OpportunityCheck {
  bool eligible{false};
  std::string reason;
  double quantity{0.0};
  double margin{0.0};
};

}  // namespace levtrade
