#pragma once

#include "levtrade/domain/account.hpp"

#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// AccountLedger
// -----------------------------------------------------------------------------
//
// @brief  Owns the Account and is the only code that changes its monetary
//         fields.
//
// @details
// Arithmetic:
//   reserve(margin, fee)
//     fails when margin + fee > current_balance; otherwise
//     current_balance   -= margin + fee
//     total_margin_used += margin
//     brokerage_charges += fee
//
//   release(margin, pnl, exit_fee)
//     current_balance   += margin + pnl - exit_fee   (floored at 0)
//     total_margin_used -= margin                    (floored at 0)
//     brokerage_charges += exit_fee
//     realized_pnl      += pnl
//     pnl > 0 counts as profitable, anything else as losing;
//     win_rate = profitable / (profitable + losing) * 100
//
// The balance floor models a loss larger than the posted margin (the
// position would have been liquidated); the account never goes negative.
//
// Thread model:
//   Not synchronized. Embedded in TradeExecutor and only touched while the
//   executor holds its mutex.
// -----------------------------------------------------------------------------
class AccountLedger {
 public:
  AccountLedger() = default;
  explicit AccountLedger(domain::Account account);

  const domain::Account& account() const { return account_; }

  // Returns false (and changes nothing) if the balance cannot cover it.
  bool reserve(double margin, double fee);

  void release(double margin, double pnl, double exit_fee);

  // Resets daily_trades_count when `today` differs from last_trade_date.
  void rollDailyCounter(const std::string& today);

  bool dailyLimitReached() const {
    return account_.daily_trades_count >= account_.daily_trades_limit;
  }

  // Counts one executed trade on `today`.
  void recordTrade(const std::string& today);

  // Installs a persisted account. total_margin_used is recomputed from the
  // open positions because it is derived state.
  void restore(domain::Account account, double open_margin);

  // Replaces the account wholesale (explicit data wipe).
  void reset(domain::Account account) { account_ = std::move(account); }

 private:
  domain::Account account_;
};

}  // namespace levtrade
