// =============================================================================
// trading_engine_test.cpp
// =============================================================================
// Unit tests for levtrade::TradingEngine.
//
// Validates:
//   - Lifecycle: start() hydrates from persistence; idempotent start/stop;
//     destructor stops threads
//   - submitSignal(): admission sizing, rejections, pyramiding onto a
//     same-direction position
//   - Concurrent submitSignal() calls respect max_positions_open and
//     max_adds
//   - pushPrices() + requestMonitor() run on the risk loop and close at the
//     stop loss; the ticker does the same on its own
//   - Notifications reach external subscribers of eventBus()
//   - wipe() resets account and positions
//
// Design: no price feed (empty endpoint), InMemoryDocumentStore, simulated
// clock. Effects of the risk loop are polled with a timeout.
// =============================================================================

#include "levtrade/engine/trading_engine.hpp"
#include "levtrade/events/event_types.hpp"
#include "levtrade/persistence/documents.hpp"
#include "levtrade/persistence/in_memory_document_store.hpp"
#include "levtrade/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout =
                            std::chrono::milliseconds(2000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

}  // namespace

using levtrade::TradeError;
using levtrade::domain::PositionStatus;
using levtrade::domain::TradeRequestStatus;
using levtrade::domain::TradeSignal;

class TradingEngineTestFixture : public ::testing::Test {
 protected:
  TradingEngineTestFixture() : sim_clock(1704067200000) {
    config.runtime.monitor_interval_ms = 0;
    config.runtime.price_feed_endpoint = "";
  }

  void build() {
    engine = std::make_unique<levtrade::TradingEngine>(config, sim_clock, store);
  }

  static levtrade::domain::TradeRequest signal(const std::string& symbol,
                                               TradeSignal side, double price,
                                               double quantity,
                                               double leverage,
                                               double confidence = 75.0) {
    levtrade::domain::TradeRequest r;
    r.symbol = symbol;
    r.signal = side;
    r.price = price;
    r.quantity = quantity;
    r.leverage = leverage;
    r.confidence = confidence;
    r.strategy = "test";
    return r;
  }

  levtrade::domain::EngineConfig config;
  levtrade::SimulationTimeProvider sim_clock;
  levtrade::InMemoryDocumentStore store;
  std::unique_ptr<levtrade::TradingEngine> engine;
};

// -----------------------------------------------------------------------------
// 1. start() restores the saved account; start/stop are idempotent.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, StartHydratesAndIsIdempotent) {
  levtrade::domain::Account saved;
  saved.initial_balance = 10000.0;
  saved.current_balance = 7321.0;
  saved.max_leverage = 100.0;
  saved.daily_trades_limit = 50;
  store.saveAccount(levtrade::toDocument(saved, sim_clock.now_ms()));

  build();
  engine->start();
  engine->start();
  EXPECT_TRUE(engine->running());
  EXPECT_DOUBLE_EQ(engine->executor().account().current_balance, 7321.0);

  engine->stop();
  engine->stop();
  EXPECT_FALSE(engine->running());
}

// -----------------------------------------------------------------------------
// 2. Destroying a running engine joins its threads.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, DestructorStopsThreads) {
  config.runtime.monitor_interval_ms = 10;
  build();
  engine->start();
  engine->pushPrices({{"BTCUSD", 50000.0}});
  EXPECT_NO_FATAL_FAILURE(engine.reset());
}

// -----------------------------------------------------------------------------
// 3. A signal without a quantity is sized by the risk engine and opened.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, SubmitSignalSizesAndOpens) {
  build();
  engine->start();

  int executed = 0;
  engine->eventBus().subscribe<levtrade::TradeExecutedEvent>(
      [&executed](const levtrade::TradeExecutedEvent&) { ++executed; });

  auto req = signal("BTCUSD", TradeSignal::Buy, 50000.0, 0.0, 0.0);
  auto result = engine->submitSignal(req);
  ASSERT_TRUE(result.success) << result.reason;

  auto pos = engine->executor().position(result.position_id);
  ASSERT_TRUE(pos.has_value());
  EXPECT_NEAR(pos->quantity, 100000.0 / 50000.0 * 0.9, 1e-12);
  EXPECT_DOUBLE_EQ(pos->leverage, 50.0);
  EXPECT_EQ(req.status, TradeRequestStatus::Completed);
  EXPECT_EQ(executed, 1);
}

// -----------------------------------------------------------------------------
// 4. Admission failures leave the request Failed with the reason.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, SubmitSignalRejections) {
  build();

  auto bad_price = signal("BTCUSD", TradeSignal::Buy, 0.0, 0.01, 10.0);
  auto r1 = engine->submitSignal(bad_price);
  EXPECT_EQ(r1.error, TradeError::InvalidPrice);
  EXPECT_EQ(bad_price.status, TradeRequestStatus::Failed);
  EXPECT_EQ(bad_price.error_reason, r1.reason);

  auto low_conf = signal("BTCUSD", TradeSignal::Buy, 50000.0, 0.01, 10.0, 40.0);
  EXPECT_EQ(engine->submitSignal(low_conf).error, TradeError::LowConfidence);

  auto good = signal("BTCUSD", TradeSignal::Buy, 50000.0, 0.01, 10.0);
  ASSERT_TRUE(engine->submitSignal(good).success);

  // Opposite direction on an open symbol is a duplicate.
  auto opposite = signal("BTCUSD", TradeSignal::Sell, 50000.0, 0.01, 10.0);
  EXPECT_EQ(engine->submitSignal(opposite).error,
            TradeError::DuplicatePosition);
  EXPECT_EQ(engine->executor().openPositionCount(), 1u);
}

// -----------------------------------------------------------------------------
// 5. A same-direction signal pyramids when eligible.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, SameDirectionSignalPyramids) {
  build();
  auto first = signal("ETHUSD", TradeSignal::Buy, 3000.0, 1.0, 10.0);
  auto opened = engine->submitSignal(first);
  ASSERT_TRUE(opened.success) << opened.reason;
  EXPECT_DOUBLE_EQ(engine->executor().position(opened.position_id)->quantity,
                   1.0);

  auto weak = signal("ETHUSD", TradeSignal::Buy, 3060.0, 1.0, 10.0, 70.0);
  auto refused = engine->submitSignal(weak);
  EXPECT_EQ(refused.error, TradeError::DuplicatePosition);
  EXPECT_NE(refused.reason.find("pyramiding not possible"), std::string::npos);

  auto strong = signal("ETHUSD", TradeSignal::Buy, 3060.0, 1.0, 10.0, 85.0);
  auto added = engine->submitSignal(strong);
  ASSERT_TRUE(added.success) << added.reason;
  EXPECT_EQ(strong.status, TradeRequestStatus::Completed);
  EXPECT_EQ(strong.position_id, opened.position_id);

  auto pos = *engine->executor().position(opened.position_id);
  EXPECT_EQ(pos.pyramid_count, 1);
  EXPECT_DOUBLE_EQ(pos.total_quantity, 1.5);
  EXPECT_NEAR(pos.average_entry_price, 3020.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 6. With pyramiding off a same-direction signal is refused.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, PyramidingDisabled) {
  config.pyramiding.enabled = false;
  build();
  auto first = signal("ETHUSD", TradeSignal::Buy, 3000.0, 1.0, 10.0);
  ASSERT_TRUE(engine->submitSignal(first).success);

  auto again = signal("ETHUSD", TradeSignal::Buy, 3060.0, 1.0, 10.0, 95.0);
  auto result = engine->submitSignal(again);
  EXPECT_EQ(result.error, TradeError::FeatureDisabled);
  EXPECT_EQ(again.status, TradeRequestStatus::Failed);
}

// -----------------------------------------------------------------------------
// 7. Prices and a monitoring pass on the risk loop close at the stop.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, RiskLoopClosesAtStopLoss) {
  build();
  engine->start();

  std::atomic<int> closes{0};
  engine->eventBus().subscribe<levtrade::PositionClosedEvent>(
      [&closes](const levtrade::PositionClosedEvent& e) {
        if (e.reason == "Stop Loss Hit") {
          ++closes;
        }
      });

  auto req = signal("BTCUSD", TradeSignal::Buy, 50000.0, 0.01, 10.0);
  auto id = engine->submitSignal(req).position_id;
  ASSERT_FALSE(id.empty());

  engine->pushPrices({{"BTCUSD", 49400.0}});
  engine->requestMonitor();

  ASSERT_TRUE(waitFor([&] { return closes.load() == 1; }));
  auto pos = *engine->executor().position(id);
  EXPECT_EQ(pos.status, PositionStatus::Closed);
  EXPECT_DOUBLE_EQ(pos.exit_price, 49400.0);
  engine->stop();
}

// -----------------------------------------------------------------------------
// 8. The ticker drives monitoring without explicit requests.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, TickerMonitorsPeriodically) {
  config.runtime.monitor_interval_ms = 10;
  build();
  engine->start();

  auto req = signal("ETHUSD", TradeSignal::Sell, 3000.0, 1.0, 10.0);
  auto id = engine->submitSignal(req).position_id;
  ASSERT_FALSE(id.empty());

  engine->pushPrices({{"ETHUSD", 3040.0}});

  EXPECT_TRUE(waitFor([&] {
    return engine->executor().position(id)->status == PositionStatus::Closed;
  }));
  EXPECT_EQ(engine->executor().position(id)->notes, "Stop Loss Hit");
  engine->stop();
}

// -----------------------------------------------------------------------------
// 9. wipe() resets account and positions.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, WipeResetsState) {
  build();
  auto req = signal("BTCUSD", TradeSignal::Buy, 50000.0, 0.01, 10.0);
  ASSERT_TRUE(engine->submitSignal(req).success);

  engine->wipe();
  EXPECT_EQ(engine->executor().positions().size(), 0u);
  EXPECT_DOUBLE_EQ(engine->executor().account().current_balance, 10000.0);
}

// -----------------------------------------------------------------------------
// 10. Racing signals on distinct symbols never exceed the position cap.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, ConcurrentSignalsRespectPositionCap) {
  config.sizing.max_positions_open = 2;
  build();

  constexpr int kThreads = 8;
  std::atomic<int> opened{0};
  std::atomic<int> capped{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, i, &opened, &capped] {
      auto req = signal("SYM" + std::to_string(i) + "USD", TradeSignal::Buy,
                        100.0, 1.0, 10.0);
      auto result = engine->submitSignal(req);
      if (result.success) {
        ++opened;
      } else if (result.error == TradeError::LimitReached) {
        ++capped;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(opened.load(), 2);
  EXPECT_EQ(capped.load(), kThreads - 2);
  EXPECT_EQ(engine->executor().openPositionCount(), 2u);
}

// -----------------------------------------------------------------------------
// 11. Racing pyramid signals add at most max_adds times.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, ConcurrentPyramidsRespectMaxAdds) {
  config.pyramiding.max_adds = 1;
  build();
  auto first = signal("ETHUSD", TradeSignal::Buy, 3000.0, 1.0, 10.0);
  auto opened = engine->submitSignal(first);
  ASSERT_TRUE(opened.success) << opened.reason;

  constexpr int kThreads = 6;
  std::atomic<int> added{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, &added] {
      auto req = signal("ETHUSD", TradeSignal::Buy, 3060.0, 1.0, 10.0, 85.0);
      if (engine->submitSignal(req).success) {
        ++added;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(added.load(), 1);
  auto pos = *engine->executor().position(opened.position_id);
  EXPECT_EQ(pos.pyramid_count, 1);
  EXPECT_DOUBLE_EQ(pos.total_quantity, 1.5);
  EXPECT_EQ(engine->executor().openPositionCount(), 1u);
}
