#pragma once

#include <string>

namespace levtrade {
namespace domain {

// -----------------------------------------------------------------------------
// Account: virtual trading account (single owner of monetary state)
// -----------------------------------------------------------------------------
//
// @brief  Balance, margin in use, fees and trade statistics of one simulated
//         account.
//
// @details
// Invariants (maintained by AccountLedger):
//   current_balance >= 0
//   total_margin_used == sum of margin_used over OPEN positions
//
// Margin and entry fees leave current_balance when a position opens and
// margin + pnl - exit fee returns when it closes. brokerage_charges
// accumulates every fee ever paid.
//
// last_trade_date is a "YYYY-MM-DD" UTC date string; daily_trades_count
// belongs to that date only.
//
// Thread model:
//   Value type. Only TradeExecutor (through its AccountLedger) mutates the
//   authoritative copy.
// -----------------------------------------------------------------------------
struct Account {
  std::string id{"main"};
  double initial_balance{0.0};
  double current_balance{0.0};
  int daily_trades_limit{0};
  int daily_trades_count{0};
  double max_leverage{1.0};
  double total_margin_used{0.0};
  double brokerage_charges{0.0};
  double realized_pnl{0.0};
  double total_profit{0.0};
  double total_loss{0.0};
  int total_trades{0};
  int profitable_trades{0};
  int losing_trades{0};
  double win_rate{0.0};
  std::string last_trade_date;
};

}  // namespace domain
}  // namespace levtrade
