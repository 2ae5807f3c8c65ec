// -----------------------------------------------------------------------------
// levtrade_engine: single executable entry point.
//
//   levtrade_engine [config.json]
//
//   1) Load EngineConfig (defaults when no path is given).
//   2) Open the JSON file document store under runtime.data_directory.
//   3) Create the TradingEngine with the live clock and start it. start()
//      hydrates saved state, starts the risk loop, the monitoring ticker and
//      the ZeroMQ price feed.
//   4) Log notifications published on the engine's event bus.
//   5) Wait for SIGINT, then stop the engine.
//
// Thread layout:
//   main thread        → waits for shutdown
//   risk loop thread   → price snapshots + monitoring passes
//   ticker thread      → monitoring ticks
//   price feed thread  → ZeroMQ recv loop
// -----------------------------------------------------------------------------

#include "levtrade/config/config_loader.hpp"
#include "levtrade/engine/trading_engine.hpp"
#include "levtrade/events/event_types.hpp"
#include "levtrade/persistence/json_file_document_store.hpp"
#include "levtrade/time/live_time_provider.hpp"
#include "levtrade/util/format.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

// Set from the SIGINT handler; polled by main().
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  levtrade::domain::EngineConfig config;
  if (argc > 1) {
    try {
      config = levtrade::loadEngineConfig(argv[1]);
    } catch (const std::runtime_error& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Loaded configuration from " << argv[1] << "\n";
  } else {
    std::cout << "[main] No configuration file given; using defaults.\n";
  }

  // -------------------------------------------------------------------------
  // 2) Persistence and clock
  // -------------------------------------------------------------------------
  levtrade::JsonFileDocumentStore store(config.runtime.data_directory);
  levtrade::LiveTimeProvider clock;

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  levtrade::TradingEngine engine(config, clock, store);

  // Subscribed before start() so nothing published during hydration or the
  // first tick is missed.
  engine.eventBus().subscribe<levtrade::TradeExecutedEvent>(
      [](const levtrade::TradeExecutedEvent& e) {
        std::cout << "[main] Trade executed: " << e.position.symbol << " "
                  << levtrade::domain::toString(e.position.side)
                  << " qty=" << e.position.total_quantity << " avg="
                  << levtrade::fixed(e.position.average_entry_price) << "\n";
      });
  engine.eventBus().subscribe<levtrade::PositionClosedEvent>(
      [](const levtrade::PositionClosedEvent& e) {
        std::cout << "[main] Position closed: " << e.position.symbol
                  << " pnl=" << levtrade::fixed(e.position.pnl) << " ("
                  << e.reason << ")\n";
      });
  engine.eventBus().subscribe<levtrade::RiskAlertEvent>(
      [](const levtrade::RiskAlertEvent& e) {
        std::cerr << "[main] Risk alert ("
                  << levtrade::domain::toString(e.level) << ") " << e.symbol
                  << ": " << e.message << "\n";
      });

  engine.start();

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Price feed: " << config.runtime.price_feed_endpoint
            << "\n[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait for shutdown
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();

  levtrade::domain::Account account = engine.executor().account();
  std::cout << "[main] Final balance " << levtrade::fixed(account.current_balance)
            << ", realized PnL " << levtrade::fixed(account.realized_pnl)
            << ", win rate " << levtrade::fixed(account.win_rate, 1) << "%\n";
  return 0;
}
