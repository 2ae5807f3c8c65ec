#pragma once

#include <string>

namespace levtrade {
namespace domain {

// Signal produced upstream. Wait is a valid signal value that must never be
// executed; openTrade rejects it as an invalid signal.
enum class TradeSignal { Buy, Sell, Wait };

enum class TradeRequestStatus { Pending, Executing, Completed, Failed, Cancelled };

inline const char* toString(TradeSignal signal) {
  switch (signal) {
    case TradeSignal::Buy:
      return "BUY";
    case TradeSignal::Sell:
      return "SELL";
    case TradeSignal::Wait:
      return "WAIT";
  }
  return "WAIT";
}

inline const char* toString(TradeRequestStatus status) {
  switch (status) {
    case TradeRequestStatus::Pending:
      return "pending";
    case TradeRequestStatus::Executing:
      return "executing";
    case TradeRequestStatus::Completed:
      return "completed";
    case TradeRequestStatus::Failed:
      return "failed";
    case TradeRequestStatus::Cancelled:
      return "cancelled";
  }
  return "pending";
}

inline bool isTerminal(TradeRequestStatus status) {
  return status == TradeRequestStatus::Completed ||
         status == TradeRequestStatus::Failed ||
         status == TradeRequestStatus::Cancelled;
}

// -----------------------------------------------------------------------------
// canTransition
// -----------------------------------------------------------------------------
//
// @brief  Encodes the request state machine:
//           Pending   → Executing | Cancelled | Failed
//           Executing → Completed | Failed | Cancelled
//           terminal  → (nothing)
//
// @details
// Pending → Failed is allowed so a request can be rejected by admission
// control before execution starts.
// -----------------------------------------------------------------------------
inline bool canTransition(TradeRequestStatus from, TradeRequestStatus to) {
  switch (from) {
    case TradeRequestStatus::Pending:
      return to == TradeRequestStatus::Executing ||
             to == TradeRequestStatus::Cancelled ||
             to == TradeRequestStatus::Failed;
    case TradeRequestStatus::Executing:
      return to == TradeRequestStatus::Completed ||
             to == TradeRequestStatus::Failed ||
             to == TradeRequestStatus::Cancelled;
    case TradeRequestStatus::Completed:
    case TradeRequestStatus::Failed:
    case TradeRequestStatus::Cancelled:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// TradeRequest: ephemeral instruction to open (or add to) a position
// -----------------------------------------------------------------------------
//
// @details
// leverage <= 0 means "use the configured default leverage". confidence is
// a percentage in [0, 100]. error_reason and position_id are filled in by
// TradeExecutor once the request reaches a terminal status.
// -----------------------------------------------------------------------------
struct TradeRequest {
  std::string id;
  std::string symbol;
  TradeSignal signal{TradeSignal::Wait};
  double price{0.0};
  double quantity{0.0};
  double leverage{0.0};
  std::string strategy;
  double confidence{0.0};
  TradeRequestStatus status{TradeRequestStatus::Pending};
  std::string error_reason;
  std::string position_id;
};

}  // namespace domain
}  // namespace levtrade
