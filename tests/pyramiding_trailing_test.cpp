// =============================================================================
// pyramiding_trailing_test.cpp
// =============================================================================
// Unit tests for pyramiding (adds) and trailing (partial closes) on
// levtrade::TradeExecutor.
//
// Validates:
//   - checkPyramidingOpportunity() gates: confidence, profit, max adds,
//     feature switch
//   - addToPosition() weighted average entry, margin growth, unchanged
//     stop/target
//   - checkTrailingOpportunity() gates and proposed quantity
//   - partialClose() realizes PnL without settling cash; the final close
//     settles everything once
//   - tightenStopLoss() only moves the stop tighter; reanchorLevels()
// =============================================================================

#include "levtrade/execution/trade_executor.hpp"
#include "levtrade/persistence/in_memory_document_store.hpp"
#include "levtrade/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <memory>

using levtrade::domain::PositionSide;
using levtrade::domain::PositionStatus;
using levtrade::domain::TradeSignal;

class PyramidingTrailingTest : public ::testing::Test {
 protected:
  PyramidingTrailingTest() : clock(1704067200000) {}

  void SetUp() override { rebuild(); }

  void rebuild() {
    executor =
        std::make_unique<levtrade::TradeExecutor>(config, clock, store);
  }

  // ETHUSD LONG 1.0 @ 3000 x10: margin 300, fee 0.3, stop 2970,
  // target 3090.
  std::string openEth(TradeSignal signal = TradeSignal::Buy) {
    levtrade::domain::TradeRequest r;
    r.symbol = "ETHUSD";
    r.signal = signal;
    r.price = 3000.0;
    r.quantity = 1.0;
    r.leverage = 10.0;
    r.confidence = 90.0;
    auto result = executor->openTrade(r);
    EXPECT_TRUE(result.success) << result.reason;
    return result.position_id;
  }

  levtrade::domain::EngineConfig config;
  levtrade::SimulationTimeProvider clock;
  levtrade::InMemoryDocumentStore store;
  std::unique_ptr<levtrade::TradeExecutor> executor;
};

// -----------------------------------------------------------------------------
// 1. Eligible add: half the current size, margin at the add price.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, PyramidEligibleWhenProfitable) {
  auto id = openEth();

  auto check = executor->checkPyramidingOpportunity(id, 3060.0, 85.0);
  ASSERT_TRUE(check.eligible) << check.reason;
  EXPECT_DOUBLE_EQ(check.quantity, 0.5);
  EXPECT_NEAR(check.margin, 153.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. Pyramid gates.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, PyramidGates) {
  auto id = openEth();

  auto low_conf = executor->checkPyramidingOpportunity(id, 3060.0, 70.0);
  EXPECT_FALSE(low_conf.eligible);
  EXPECT_NE(low_conf.reason.find("Confidence"), std::string::npos);

  // +0.33% is below the 1% minimum.
  auto flat = executor->checkPyramidingOpportunity(id, 3010.0, 85.0);
  EXPECT_FALSE(flat.eligible);
  EXPECT_NE(flat.reason.find("not profitable"), std::string::npos);

  EXPECT_FALSE(executor->checkPyramidingOpportunity("pos-42", 3060.0, 85.0)
                   .eligible);
  EXPECT_FALSE(executor->checkPyramidingOpportunity(id, -1.0, 85.0).eligible);
}

// -----------------------------------------------------------------------------
// 3. Feature switch and max adds.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, PyramidDisabledAndMaxAdds) {
  config.pyramiding.enabled = false;
  rebuild();
  auto id = openEth();
  EXPECT_EQ(executor->checkPyramidingOpportunity(id, 3060.0, 85.0).reason,
            "Pyramiding disabled");

  config.pyramiding.enabled = true;
  config.pyramiding.max_adds = 1;
  rebuild();
  id = openEth();
  auto first = executor->checkPyramidingOpportunity(id, 3060.0, 85.0);
  ASSERT_TRUE(first.eligible);
  ASSERT_TRUE(
      executor->addToPosition(id, first.quantity, 3060.0, first.margin).success);

  auto second = executor->checkPyramidingOpportunity(id, 3200.0, 85.0);
  EXPECT_FALSE(second.eligible);
  EXPECT_NE(second.reason.find("Maximum pyramid adds"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. addToPosition() averages the entry and grows margin; levels stay.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, AddToPositionAveragesEntry) {
  auto id = openEth();
  auto before = *executor->position(id);

  auto result = executor->addToPosition(id, 0.5, 3060.0, 153.0);
  ASSERT_TRUE(result.success) << result.reason;

  auto pos = *executor->position(id);
  EXPECT_NEAR(pos.average_entry_price,
              (1.0 * 3000.0 + 0.5 * 3060.0) / (1.0 + 0.5), 1e-9);
  EXPECT_DOUBLE_EQ(pos.entry_price, pos.average_entry_price);
  EXPECT_DOUBLE_EQ(pos.total_quantity, 1.5);
  EXPECT_DOUBLE_EQ(pos.remaining_quantity, 1.5);
  EXPECT_DOUBLE_EQ(pos.original_quantity, 1.0);
  EXPECT_NEAR(pos.margin_used, 453.0, 1e-9);
  EXPECT_NEAR(pos.invested_amount, 4530.0, 1e-9);
  EXPECT_EQ(pos.pyramid_count, 1);
  EXPECT_DOUBLE_EQ(pos.stop_loss, before.stop_loss);
  EXPECT_DOUBLE_EQ(pos.target, before.target);

  auto account = executor->account();
  EXPECT_NEAR(account.total_margin_used, 453.0, 1e-9);
  EXPECT_NEAR(account.current_balance, 10000.0 - 300.3 - 153.153, 1e-9);
  EXPECT_EQ(result.reason.rfind("Pyramid add #1", 0), 0u);
}

// -----------------------------------------------------------------------------
// 5. Pyramid on a short averages the same way.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, PyramidOnShort) {
  auto id = openEth(TradeSignal::Sell);

  auto check = executor->checkPyramidingOpportunity(id, 2940.0, 85.0);
  ASSERT_TRUE(check.eligible) << check.reason;
  ASSERT_TRUE(
      executor->addToPosition(id, check.quantity, 2940.0, check.margin).success);

  auto pos = *executor->position(id);
  EXPECT_EQ(pos.side, PositionSide::Short);
  EXPECT_NEAR(pos.average_entry_price, 2980.0, 1e-9);
  EXPECT_NEAR(pos.unrealized_pnl, (2980.0 - 2940.0) * 1.5, 1e-9);
}

// -----------------------------------------------------------------------------
// 6. addToPosition() refuses what the balance cannot cover.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, AddToPositionInsufficientBalance) {
  auto id = openEth();
  auto result = executor->addToPosition(id, 100.0, 3060.0, 30600.0);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, levtrade::TradeError::InsufficientBalance);
  EXPECT_EQ(executor->position(id)->pyramid_count, 0);
  EXPECT_NEAR(executor->account().total_margin_used, 300.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 7. Trailing gates: target, feature switch.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, TrailingGates) {
  auto id = openEth();

  auto early = executor->checkTrailingOpportunity(id, 3050.0);
  EXPECT_FALSE(early.eligible);
  EXPECT_EQ(early.reason, "Target not reached");

  auto ready = executor->checkTrailingOpportunity(id, 3100.0);
  ASSERT_TRUE(ready.eligible) << ready.reason;
  EXPECT_NEAR(ready.quantity, 0.3, 1e-12);

  config.trailing.enabled = false;
  rebuild();
  id = openEth();
  EXPECT_EQ(executor->checkTrailingOpportunity(id, 3100.0).reason,
            "Trailing disabled");
}

// -----------------------------------------------------------------------------
// 8. A remainder below min_trade_size proposes the whole position.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, TrailingTakesTinyRemainder) {
  config.sizing.min_trade_size = 0.8;
  rebuild();
  auto id = openEth();

  auto check = executor->checkTrailingOpportunity(id, 3100.0);
  ASSERT_TRUE(check.eligible);
  EXPECT_DOUBLE_EQ(check.quantity, 1.0);
}

// -----------------------------------------------------------------------------
// 9. Partial close realizes PnL; cash settles once, at the final close.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, PartialThenFinalClose) {
  auto id = openEth();
  double balance_open = executor->account().current_balance;

  auto partial = executor->partialClose(id, 0.3, 3100.0, "Trailing Profit Lock");
  ASSERT_TRUE(partial.success) << partial.reason;

  auto pos = *executor->position(id);
  EXPECT_EQ(pos.status, PositionStatus::Open);
  EXPECT_NEAR(pos.remaining_quantity, 0.7, 1e-12);
  EXPECT_NEAR(pos.realized_pnl, 30.0, 1e-9);
  EXPECT_NEAR(pos.unrealized_pnl, 70.0, 1e-9);
  EXPECT_NEAR(pos.pnl, 100.0, 1e-9);
  EXPECT_DOUBLE_EQ(pos.average_exit_price, 3100.0);
  EXPECT_EQ(pos.trailing_count, 1);
  EXPECT_DOUBLE_EQ(executor->account().current_balance, balance_open);
  EXPECT_NEAR(executor->account().total_margin_used, 300.0, 1e-9);

  ASSERT_TRUE(executor->closePosition(id, 3200.0, "Target Hit").success);

  pos = *executor->position(id);
  EXPECT_EQ(pos.status, PositionStatus::Closed);
  EXPECT_NEAR(pos.pnl, 30.0 + 140.0, 1e-9);
  EXPECT_NEAR(pos.average_exit_price, 3170.0, 1e-9);

  // margin 300 back, +170 pnl, -0.15 exit fee
  EXPECT_NEAR(executor->account().current_balance, balance_open + 469.85,
              1e-9);
  EXPECT_NEAR(executor->account().total_margin_used, 0.0, 1e-9);
  EXPECT_EQ(executor->account().profitable_trades, 1);
}

// -----------------------------------------------------------------------------
// 10. A partial close for the whole remainder finalizes the position.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, PartialCloseOfRemainderCloses) {
  auto id = openEth();
  auto result = executor->partialClose(id, 5.0, 3100.0, "Trailing Profit Lock");
  ASSERT_TRUE(result.success);

  auto pos = *executor->position(id);
  EXPECT_EQ(pos.status, PositionStatus::Closed);
  EXPECT_NEAR(pos.pnl, 100.0, 1e-9);
  EXPECT_EQ(pos.notes, "Trailing Profit Lock");
  EXPECT_EQ(executor->openPositionCount(), 0u);
}

// -----------------------------------------------------------------------------
// 11. Stops only move tighter; reanchoring uses the trailing offsets.
// -----------------------------------------------------------------------------
TEST_F(PyramidingTrailingTest, TightenAndReanchor) {
  auto id = openEth();

  EXPECT_FALSE(executor->tightenStopLoss(id, 2900.0));
  EXPECT_TRUE(executor->tightenStopLoss(id, 2990.0));
  EXPECT_DOUBLE_EQ(executor->position(id)->stop_loss, 2990.0);

  ASSERT_TRUE(executor->reanchorLevels(id, 3100.0));
  auto pos = *executor->position(id);
  EXPECT_NEAR(pos.stop_loss, 3069.0, 1e-9);
  EXPECT_NEAR(pos.target, 3162.0, 1e-9);

  auto short_id = std::string{};
  {
    levtrade::domain::TradeRequest r;
    r.symbol = "SOLUSD";
    r.signal = TradeSignal::Sell;
    r.price = 100.0;
    r.quantity = 10.0;
    r.leverage = 10.0;
    r.confidence = 90.0;
    short_id = executor->openTrade(r).position_id;
  }
  EXPECT_FALSE(executor->tightenStopLoss(short_id, 102.0));
  EXPECT_TRUE(executor->tightenStopLoss(short_id, 100.5));
  EXPECT_DOUBLE_EQ(executor->position(short_id)->stop_loss, 100.5);
}
