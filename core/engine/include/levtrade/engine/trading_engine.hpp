#pragma once

#include "levtrade/concurrent/event_loop_thread.hpp"
#include "levtrade/domain/engine_config.hpp"
#include "levtrade/domain/price_map.hpp"
#include "levtrade/domain/trade_request.hpp"
#include "levtrade/eventbus/event_bus.hpp"
#include "levtrade/execution/trade_executor.hpp"
#include "levtrade/network/price_feed_thread.hpp"
#include "levtrade/notification/event_bus_notification_sink.hpp"
#include "levtrade/persistence/i_persistence_gateway.hpp"
#include "levtrade/risk/risk_engine.hpp"
#include "levtrade/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace levtrade {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Orchestrator that owns the executor, the risk engine, the risk loop
//         thread, the monitoring ticker and the price feed thread.
//
// @details
// Thread layout:
//
//   risk_loop thread    → PriceSnapshotEvent → TradeExecutor::updatePrices
//                         MonitorTickEvent   → RiskEngine::monitorPositions
//   ticker thread       → pushes MonitorTickEvent every monitor_interval_ms
//   price feed thread   → PriceFeedGateway recv loop, pushes snapshots
//   caller threads      → submitSignal(), wipe(), accessors
//
// Because snapshots and ticks share one queue, a snapshot is fully applied
// before any monitoring pass that was queued after it reads the PnL.
//
// Outbound notifications (TradeExecutedEvent, PositionClosedEvent,
// RiskAlertEvent) are published on eventBus(), synchronously on whichever
// thread caused them.
//
// Thread model:
//   Construct, start() and stop() from one owning thread. submitSignal(),
//   pushPrices() and pushEvent() are safe from any thread.
//   admission_mutex_ is held for the whole of submitSignal() and wipe(), so
//   a gate check (position cap, anti-overtrade, max_adds) and the open or
//   add it approves run as one step. The risk loop does not take it; it can
//   only close or shrink positions, which never invalidates an approval.
//
// Ownership:
//   TradingEngine
//    ├── config_           (EngineConfig, copied)
//    ├── clock_            (ITimeProvider&, non-owning)
//    ├── persistence_      (IPersistenceGateway&, non-owning)
//    ├── events_           (EventBus, outbound notifications)
//    ├── notifier_         (EventBusNotificationSink over events_)
//    ├── executor_         (unique_ptr<TradeExecutor>)
//    ├── risk_engine_      (unique_ptr<RiskEngine>)
//    ├── risk_loop_        (EventLoopThread)
//    ├── ticker_           (std::thread)
//    └── price_feed_       (unique_ptr<PriceFeedThread>)
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  TradingEngine(const domain::EngineConfig& config, const ITimeProvider& clock,
                IPersistenceGateway& persistence);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // 1. Hydrate account and positions from persistence.
  // 2. Start the risk loop and subscribe snapshot/tick handlers.
  // 3. Start the ticker unless monitor_interval_ms is 0.
  // 4. Start the price feed unless the endpoint is empty.
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Stops inflow first (price feed, ticker), then the risk loop. Idempotent.
  void stop();

  bool running() const { return running_; }

  // -------------------------------------------------------------------------
  // submitSignal(request)
  // -------------------------------------------------------------------------
  // Same-direction signal on a symbol with an OPEN position → pyramiding
  // (checkPyramidingOpportunity, then addToPosition). Anything else is sized
  // with RiskEngine::calculateSafeQuantity and executed with openTrade using
  // the approved quantity. `request` is updated in place.
  // -------------------------------------------------------------------------
  TradeResult submitSignal(domain::TradeRequest& request);

  // Queue a price batch / monitoring tick on the risk loop.
  void pushPrices(domain::PriceMap prices);
  void requestMonitor();
  void pushEvent(Event event);

  // Reset to a fresh account with no positions, locally and in persistence.
  void wipe();

  TradeExecutor& executor() { return *executor_; }
  RiskEngine& riskEngine() { return *risk_engine_; }
  EventBus& eventBus() { return events_; }

 private:
  void onPriceSnapshot(const PriceSnapshotEvent& event);
  void onMonitorTick(const MonitorTickEvent& event);
  void runTicker();

  const domain::EngineConfig config_;
  const ITimeProvider& clock_;
  IPersistenceGateway& persistence_;

  EventBus events_;
  EventBusNotificationSink notifier_;

  std::unique_ptr<TradeExecutor> executor_;
  std::unique_ptr<RiskEngine> risk_engine_;

  EventLoopThread risk_loop_;
  EventBus::SubscriptionId snapshot_sub_{0};
  EventBus::SubscriptionId tick_sub_{0};

  std::thread ticker_;
  std::mutex ticker_mutex_;
  std::condition_variable ticker_cv_;
  bool ticker_stop_{false};

  std::unique_ptr<PriceFeedThread> price_feed_;

  std::mutex admission_mutex_;

  std::atomic<std::uint64_t> next_sequence_{1};
  bool running_{false};
};

}  // namespace levtrade
