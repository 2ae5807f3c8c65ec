#include "levtrade/engine/trading_engine.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace levtrade {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(const domain::EngineConfig& config,
                             const ITimeProvider& clock,
                             IPersistenceGateway& persistence)
    : config_(config),
      clock_(clock),
      persistence_(persistence),
      notifier_(events_, clock_) {
  executor_ = std::make_unique<TradeExecutor>(config_, clock_, persistence_,
                                              &notifier_);
  risk_engine_ =
      std::make_unique<RiskEngine>(*executor_, config_, clock_, &notifier_);
}

TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Hydration gate ----------------------------------------------------
  bool restored = executor_->loadFromPersistence();
  std::cout << "[TradingEngine] "
            << (restored ? "Restored account " : "Created account ")
            << config_.account.account_id << " with "
            << executor_->openPositionCount() << " open position(s).\n";

  // ---  2) Risk loop ---------------------------------------------------------
  snapshot_sub_ = risk_loop_.eventBus().subscribe<PriceSnapshotEvent>(
      [this](const PriceSnapshotEvent& e) { onPriceSnapshot(e); });
  tick_sub_ = risk_loop_.eventBus().subscribe<MonitorTickEvent>(
      [this](const MonitorTickEvent& e) { onMonitorTick(e); });
  risk_loop_.start();

  // ---  3) Monitoring ticker -------------------------------------------------
  if (config_.runtime.monitor_interval_ms > 0) {
    {
      std::lock_guard lock(ticker_mutex_);
      ticker_stop_ = false;
    }
    ticker_ = std::thread([this] { runTicker(); });
  }

  // ---  4) Price feed LAST (snapshots begin flowing) -------------------------
  if (!config_.runtime.price_feed_endpoint.empty()) {
    price_feed_ = std::make_unique<PriceFeedThread>(
        clock_, [this](Event event) { pushEvent(std::move(event)); },
        config_.runtime.price_feed_endpoint);
    if (!price_feed_->start()) {
      std::cerr << "[TradingEngine] WARNING: price feed unavailable; prices "
                   "must be pushed manually.\n";
      price_feed_.reset();
    }
  }

  running_ = true;

  std::cout << "[TradingEngine] started. Threads: risk"
            << (ticker_.joinable() ? ", ticker" : "")
            << (price_feed_ ? ", price_feed" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop inflow -------------------------------------------------------
  price_feed_.reset();

  {
    std::lock_guard lock(ticker_mutex_);
    ticker_stop_ = true;
  }
  ticker_cv_.notify_all();
  if (ticker_.joinable()) {
    ticker_.join();
  }

  // ---  2) Stop the risk loop ------------------------------------------------
  risk_loop_.stop();
  risk_loop_.eventBus().unsubscribe(tick_sub_);
  risk_loop_.eventBus().unsubscribe(snapshot_sub_);

  running_ = false;

  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// submitSignal(): pyramid onto a matching position, else size and open
// -----------------------------------------------------------------------------
TradeResult TradingEngine::submitSignal(domain::TradeRequest& request) {
  std::lock_guard admission(admission_mutex_);

  std::optional<domain::Position> existing =
      executor_->openPositionFor(request.symbol);

  bool same_direction =
      existing &&
      ((request.signal == domain::TradeSignal::Buy &&
        existing->side == domain::PositionSide::Long) ||
       (request.signal == domain::TradeSignal::Sell &&
        existing->side == domain::PositionSide::Short));

  if (same_direction) {
    if (!config_.pyramiding.enabled) {
      request.status = domain::TradeRequestStatus::Failed;
      request.error_reason = "Position already open for " + request.symbol +
                             "; pyramiding disabled";
      return TradeResult::fail(TradeError::FeatureDisabled,
                               request.error_reason);
    }

    OpportunityCheck check = executor_->checkPyramidingOpportunity(
        existing->id, request.price, request.confidence);
    if (!check.eligible) {
      request.status = domain::TradeRequestStatus::Failed;
      request.error_reason = "Position already open for " + request.symbol +
                             "; pyramiding not possible: " + check.reason;
      return TradeResult::fail(TradeError::DuplicatePosition,
                               request.error_reason);
    }

    TradeResult result = executor_->addToPosition(
        existing->id, check.quantity, request.price, check.margin);
    request.status = result.success ? domain::TradeRequestStatus::Completed
                                    : domain::TradeRequestStatus::Failed;
    request.error_reason = result.success ? "" : result.reason;
    request.position_id = result.success ? existing->id : "";
    return result;
  }

  std::optional<double> leverage;
  if (request.leverage > 0.0) {
    leverage = request.leverage;
  }
  SizingDecision sizing = risk_engine_->calculateSafeQuantity(
      request.symbol, request.price, request.quantity, leverage);
  if (!sizing.approved()) {
    std::cerr << "[TradingEngine] Signal for " << request.symbol
              << " rejected by admission control: " << sizing.reason << "\n";
    request.status = domain::TradeRequestStatus::Failed;
    request.error_reason = sizing.reason;
    return TradeResult::fail(sizing.error, sizing.reason);
  }

  std::cout << "[TradingEngine] " << request.symbol << ": " << sizing.reason
            << "\n";
  request.quantity = sizing.quantity;
  return executor_->openTrade(request);
}

// -----------------------------------------------------------------------------
// Event ingress
// -----------------------------------------------------------------------------
void TradingEngine::pushPrices(domain::PriceMap prices) {
  PriceSnapshotEvent event;
  event.prices = std::move(prices);
  event.timestamp_ms = clock_.now_ms();
  event.sequence_id = next_sequence_.fetch_add(1);
  risk_loop_.push(std::move(event));
}

void TradingEngine::requestMonitor() {
  MonitorTickEvent tick;
  tick.timestamp_ms = clock_.now_ms();
  tick.sequence_id = next_sequence_.fetch_add(1);
  risk_loop_.push(tick);
}

void TradingEngine::pushEvent(Event event) {
  risk_loop_.push(std::move(event));
}

void TradingEngine::wipe() {
  std::lock_guard admission(admission_mutex_);
  executor_->wipeData();
  risk_engine_->reset();
}

// -----------------------------------------------------------------------------
// Risk loop handlers
// -----------------------------------------------------------------------------
void TradingEngine::onPriceSnapshot(const PriceSnapshotEvent& event) {
  executor_->updatePrices(event.prices);
}

void TradingEngine::onMonitorTick(const MonitorTickEvent& /*event*/) {
  std::vector<RiskActionOutcome> outcomes = risk_engine_->monitorPositions();
  for (const auto& outcome : outcomes) {
    std::cout << "[TradingEngine] " << outcome.symbol << " "
              << toString(outcome.action) << ": " << outcome.detail << "\n";
  }
}

// -----------------------------------------------------------------------------
// runTicker(): MonitorTickEvent every monitor_interval_ms
// -----------------------------------------------------------------------------
void TradingEngine::runTicker() {
  auto interval =
      std::chrono::milliseconds(config_.runtime.monitor_interval_ms);
  std::unique_lock lock(ticker_mutex_);
  while (!ticker_cv_.wait_for(lock, interval, [this] { return ticker_stop_; })) {
    lock.unlock();
    requestMonitor();
    lock.lock();
  }
}

}  // namespace levtrade
