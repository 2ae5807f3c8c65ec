// =============================================================================
// account_ledger_test.cpp
// =============================================================================
// Unit tests for levtrade::AccountLedger.
//
// Validates:
//   - reserve() debits margin + fee and tracks margin/brokerage
//   - reserve() refuses overdrafts and negative inputs without side effects
//   - release() settles margin, PnL and the exit fee
//   - Balance floor at zero when a loss exceeds the posted margin
//   - Win-rate bookkeeping (pnl <= 0 counts as losing)
//   - Daily counter roll-over and limit
//   - restore() recomputes total_margin_used from the supplied open margin
// =============================================================================

#include "levtrade/execution/account_ledger.hpp"

#include <gtest/gtest.h>

class AccountLedgerTest : public ::testing::Test {
 protected:
  static levtrade::domain::Account makeAccount(double balance) {
    levtrade::domain::Account account;
    account.initial_balance = balance;
    account.current_balance = balance;
    account.daily_trades_limit = 2;
    account.max_leverage = 100.0;
    return account;
  }

  levtrade::AccountLedger ledger{makeAccount(10000.0)};
};

// -----------------------------------------------------------------------------
// 1. reserve() moves margin + fee out of the balance.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, ReserveDebitsMarginAndFee) {
  ASSERT_TRUE(ledger.reserve(50.0, 0.05));

  const auto& a = ledger.account();
  EXPECT_NEAR(a.current_balance, 9949.95, 1e-9);
  EXPECT_DOUBLE_EQ(a.total_margin_used, 50.0);
  EXPECT_DOUBLE_EQ(a.brokerage_charges, 0.05);
}

// -----------------------------------------------------------------------------
// 2. reserve() refuses when margin + fee exceed the balance, and changes
//    nothing.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, ReserveRejectsOverdraft) {
  EXPECT_FALSE(ledger.reserve(9999.0, 2.0));
  EXPECT_FALSE(ledger.reserve(-1.0, 0.0));
  EXPECT_FALSE(ledger.reserve(1.0, -0.5));

  const auto& a = ledger.account();
  EXPECT_DOUBLE_EQ(a.current_balance, 10000.0);
  EXPECT_DOUBLE_EQ(a.total_margin_used, 0.0);
  EXPECT_DOUBLE_EQ(a.brokerage_charges, 0.0);
}

// -----------------------------------------------------------------------------
// 3. release() returns margin plus PnL minus the exit fee.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, ReleaseSettlesProfit) {
  ASSERT_TRUE(ledger.reserve(100.0, 0.1));
  ledger.release(100.0, 25.0, 0.05);

  const auto& a = ledger.account();
  EXPECT_NEAR(a.current_balance, 10024.85, 1e-9);
  EXPECT_DOUBLE_EQ(a.total_margin_used, 0.0);
  EXPECT_NEAR(a.brokerage_charges, 0.15, 1e-12);
  EXPECT_DOUBLE_EQ(a.realized_pnl, 25.0);
  EXPECT_EQ(a.profitable_trades, 1);
  EXPECT_EQ(a.losing_trades, 0);
  EXPECT_DOUBLE_EQ(a.total_profit, 25.0);
  EXPECT_DOUBLE_EQ(a.win_rate, 100.0);
}

// -----------------------------------------------------------------------------
// 4. A loss larger than everything left floors the balance at zero.
// -----------------------------------------------------------------------------
TEST(AccountLedgerFloorTest, BalanceNeverGoesNegative) {
  levtrade::domain::Account account;
  account.current_balance = 100.0;
  levtrade::AccountLedger ledger(account);

  ASSERT_TRUE(ledger.reserve(90.0, 0.0));
  ledger.release(90.0, -500.0, 0.0);

  EXPECT_DOUBLE_EQ(ledger.account().current_balance, 0.0);
  EXPECT_DOUBLE_EQ(ledger.account().total_margin_used, 0.0);
  EXPECT_DOUBLE_EQ(ledger.account().total_loss, 500.0);
}

// -----------------------------------------------------------------------------
// 5. Break-even closes count as losing; win rate is over closed trades.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, WinRateCountsBreakEvenAsLosing) {
  ledger.release(0.0, 10.0, 0.0);
  ledger.release(0.0, 0.0, 0.0);
  ledger.release(0.0, -5.0, 0.0);
  ledger.release(0.0, 3.0, 0.0);

  const auto& a = ledger.account();
  EXPECT_EQ(a.profitable_trades, 2);
  EXPECT_EQ(a.losing_trades, 2);
  EXPECT_DOUBLE_EQ(a.win_rate, 50.0);
  EXPECT_DOUBLE_EQ(a.realized_pnl, 8.0);
}

// -----------------------------------------------------------------------------
// 6. Daily counter resets when the date changes.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, DailyCounterRollsOver) {
  ledger.recordTrade("2024-01-01");
  ledger.recordTrade("2024-01-01");
  ledger.rollDailyCounter("2024-01-01");
  EXPECT_TRUE(ledger.dailyLimitReached());

  ledger.rollDailyCounter("2024-01-02");
  EXPECT_FALSE(ledger.dailyLimitReached());
  EXPECT_EQ(ledger.account().daily_trades_count, 0);
  EXPECT_EQ(ledger.account().total_trades, 2);
  EXPECT_EQ(ledger.account().last_trade_date, "2024-01-02");
}

// -----------------------------------------------------------------------------
// 7. restore() trusts open positions over the stored margin total.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, RestoreRecomputesMargin) {
  auto stored = makeAccount(5000.0);
  stored.total_margin_used = 1234.0;  // stale
  ledger.restore(stored, 300.0);

  EXPECT_DOUBLE_EQ(ledger.account().current_balance, 5000.0);
  EXPECT_DOUBLE_EQ(ledger.account().total_margin_used, 300.0);
}
