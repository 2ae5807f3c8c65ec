#include "levtrade/execution/account_ledger.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace levtrade {

AccountLedger::AccountLedger(domain::Account account)
    : account_(std::move(account)) {}

// -----------------------------------------------------------------------------
// reserve: take margin + entry fee out of the balance
// -----------------------------------------------------------------------------
bool AccountLedger::reserve(double margin, double fee) {
  if (margin < 0.0 || fee < 0.0) {
    return false;
  }
  if (margin + fee > account_.current_balance) {
    return false;
  }

  account_.current_balance -= margin + fee;
  account_.total_margin_used += margin;
  account_.brokerage_charges += fee;
  return true;
}

// -----------------------------------------------------------------------------
// release: settle a closed position back into the balance
// -----------------------------------------------------------------------------
void AccountLedger::release(double margin, double pnl, double exit_fee) {
  account_.current_balance += margin + pnl - exit_fee;
  if (account_.current_balance < 0.0) {
    std::cerr << "[AccountLedger] WARNING: loss exceeded posted margin. "
                 "Balance floored at 0 (was "
              << account_.current_balance << ").\n";
    account_.current_balance = 0.0;
  }

  account_.total_margin_used =
      std::max(0.0, account_.total_margin_used - margin);
  account_.brokerage_charges += exit_fee;
  account_.realized_pnl += pnl;

  if (pnl > 0.0) {
    ++account_.profitable_trades;
    account_.total_profit += pnl;
  } else {
    ++account_.losing_trades;
    account_.total_loss += -pnl;
  }

  int closed = account_.profitable_trades + account_.losing_trades;
  account_.win_rate =
      closed > 0 ? static_cast<double>(account_.profitable_trades) /
                       static_cast<double>(closed) * 100.0
                 : 0.0;
}

// -----------------------------------------------------------------------------
// rollDailyCounter
// -----------------------------------------------------------------------------
void AccountLedger::rollDailyCounter(const std::string& today) {
  if (account_.last_trade_date != today) {
    account_.daily_trades_count = 0;
    account_.last_trade_date = today;
  }
}

void AccountLedger::recordTrade(const std::string& today) {
  rollDailyCounter(today);
  ++account_.total_trades;
  ++account_.daily_trades_count;
}

// -----------------------------------------------------------------------------
// restore: hydrate from persistence
// -----------------------------------------------------------------------------
void AccountLedger::restore(domain::Account account, double open_margin) {
  account_ = std::move(account);
  if (account_.current_balance < 0.0) {
    account_.current_balance = 0.0;
  }
  account_.total_margin_used = open_margin;
}

}  // namespace levtrade
