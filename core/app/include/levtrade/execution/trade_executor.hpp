#pragma once

#include "levtrade/concurrent/id_generator.hpp"
#include "levtrade/domain/account.hpp"
#include "levtrade/domain/engine_config.hpp"
#include "levtrade/domain/position.hpp"
#include "levtrade/domain/price_map.hpp"
#include "levtrade/domain/trade_request.hpp"
#include "levtrade/execution/account_ledger.hpp"
#include "levtrade/execution/position_store.hpp"
#include "levtrade/execution/trade_result.hpp"
#include "levtrade/notification/i_notification_sink.hpp"
#include "levtrade/persistence/i_persistence_gateway.hpp"
#include "levtrade/time/i_time_provider.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace levtrade {

// -----------------------------------------------------------------------------
// TradeExecutor
// -----------------------------------------------------------------------------
//
// @brief  Validates and executes trade requests and is the single writer of
//         Account (via AccountLedger) and Position (via PositionStore) state.
//
// @details
// Every mutating method takes a unique_lock on mutex_ for its whole
// read-modify-write sequence ("check symbol, reserve margin, insert
// position" happens atomically), so two concurrent requests can neither
// double-spend the balance nor open two positions on one symbol. Read
// accessors take a shared_lock and return copies.
//
// Side-effect ordering inside a mutation:
//   1. ledger/store mutation              (under lock)
//   2. persistence save of changed docs   (under lock; failures logged only)
//   3. notification sink call             (after unlock; failures logged)
//
// Persistence is best-effort: a failed save never rolls back the in-memory
// mutation, which stays authoritative for the running process.
//
// RiskEngine never edits positions directly. It reads snapshots through
// the accessors below and requests changes through closePosition(),
// partialClose(), tightenStopLoss() and reanchorLevels().
//
// Thread model:
//   All public methods are safe to call from any thread. The notification
//   sink may be invoked on whichever thread made the call.
//
// Ownership:
//   Borrows the clock, persistence gateway and (optional) notification sink;
//   all must outlive the executor. Owns the ledger, store and price cache.
// -----------------------------------------------------------------------------
class TradeExecutor {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config       Copied. Account defaults, fees, protection offsets,
  //                      pyramiding and trailing settings are read from it.
  // @param  clock        Source of entry/exit times and the trading day.
  // @param  persistence  Document store for accounts, positions and orders.
  // @param  notifier     Optional; nullptr disables notifications.
  //
  // @details
  // Starts with a fresh account built from config.account. No I/O happens
  // here; call loadFromPersistence() to hydrate saved state.
  // -------------------------------------------------------------------------
  TradeExecutor(const domain::EngineConfig& config, const ITimeProvider& clock,
                IPersistenceGateway& persistence,
                INotificationSink* notifier = nullptr);

  TradeExecutor(const TradeExecutor&) = delete;
  TradeExecutor& operator=(const TradeExecutor&) = delete;
  TradeExecutor(TradeExecutor&&) = delete;
  TradeExecutor& operator=(TradeExecutor&&) = delete;

  // -------------------------------------------------------------------------
  // openTrade(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Opens a new position from a Pending trade request.
  //
  // @details
  // Checks, in order (first failure wins):
  //   a. signal is BUY or SELL              "Invalid signal: WAIT"
  //   b. price > 0, quantity > 0, leverage  "Invalid price" / ...
  //      within (0, max_leverage]
  //   c. confidence >= min_confidence       "Low confidence: 55.0%"
  //   d. daily count < limit (after the     "Daily trade limit reached: n/m"
  //      day rolls over)
  //   e. no OPEN position on the symbol     "Position already open for SYM"
  //   f. reserve(margin, fee) succeeds      "Insufficient balance: need $X,
  //                                          have $Y"
  // with margin = price * quantity / leverage and
  //      fee    = margin * trading_fee_pct.
  //
  // On success the position gets stop/target at fixed offsets from entry,
  // pyramiding and trailing fields are initialized, trade counters are
  // incremented, the position/account/order documents are saved and a
  // trade-execution notification is sent.
  //
  // `request` is updated in place: status (Completed/Failed), error_reason,
  // position_id and a generated id if it had none.
  // -------------------------------------------------------------------------
  TradeResult openTrade(domain::TradeRequest& request);

  // Pending → Cancelled. False if the request was not Pending.
  bool cancelRequest(domain::TradeRequest& request);

  // -------------------------------------------------------------------------
  // closePosition(id, exit_price, reason)
  // -------------------------------------------------------------------------
  //
  // @brief  Finalizes an OPEN position at exit_price.
  //
  // @details
  // Realizes PnL on the remaining quantity, folds exit_price into
  // average_exit_price, then settles with
  //   AccountLedger::release(margin_used, pnl, trading_fee * exit_fee_mult).
  // The position becomes Closed with exit_price, exit_time_ms and
  // notes = reason, and is frozen from then on.
  // -------------------------------------------------------------------------
  TradeResult closePosition(const std::string& id, double exit_price,
                            const std::string& reason);

  // -------------------------------------------------------------------------
  // updatePrices(prices)
  // -------------------------------------------------------------------------
  //
  // @brief  Marks every OPEN position whose symbol is in `prices` to market.
  //
  // @details
  // unrealized_pnl = (price - average_entry) * effective quantity (negated
  // for shorts); pnl = realized_pnl + unrealized_pnl;
  // pnl_percentage = pnl / invested_amount * 100. Idempotent for equal
  // prices. Non-positive or non-finite prices are ignored. The last valid
  // price per symbol is cached for lastPrice().
  //
  // Documents are not re-saved on every tick; the next lifecycle save
  // carries the latest marks.
  // -------------------------------------------------------------------------
  void updatePrices(const domain::PriceMap& prices);

  // -------------------------------------------------------------------------
  // addToPosition(id, quantity, price, margin)   (pyramiding)
  // -------------------------------------------------------------------------
  //
  // @details
  // Reserves margin plus its entry fee, then
  //   average_entry = (total * average_entry + quantity * price)
  //                   / (total + quantity)
  // and grows total/remaining quantity, margin_used, invested_amount and
  // trading_fee. entry_price mirrors the new average; pyramid_count++.
  // Stop loss and target are left where they are.
  // Eligibility is the caller's job (checkPyramidingOpportunity).
  // -------------------------------------------------------------------------
  TradeResult addToPosition(const std::string& id, double quantity,
                            double price, double margin);

  // -------------------------------------------------------------------------
  // partialClose(id, quantity, exit_price, reason)   (trailing)
  // -------------------------------------------------------------------------
  //
  // @details
  // Realizes PnL on `quantity` against the average entry, updates the
  // running average_exit_price, decrements remaining_quantity and
  // increments trailing_count. Cash is not settled until the final close:
  // margin stays reserved and the realized PnL is credited by release().
  // Closing the whole remainder finalizes the position via the full-close
  // path.
  // -------------------------------------------------------------------------
  TradeResult partialClose(const std::string& id, double quantity,
                           double exit_price, const std::string& reason);

  // Gating, evaluated before any mutation. See the .cpp for the checks.
  OpportunityCheck checkPyramidingOpportunity(const std::string& id,
                                              double price,
                                              double confidence) const;
  OpportunityCheck checkTrailingOpportunity(const std::string& id,
                                            double price) const;

  // Moves the stop only if it is tighter (higher for longs, lower for
  // shorts). Returns true when applied.
  bool tightenStopLoss(const std::string& id, double new_stop);

  // Re-anchors stop and target around `price` using the trailing offsets.
  bool reanchorLevels(const std::string& id, double price);

  // -------------------------------------------------------------------------
  // Hydration and data wipe
  // -------------------------------------------------------------------------
  // hydrate() replaces in-memory state. Duplicate OPEN symbols keep the
  // first position seen. total_margin_used is recomputed from open
  // positions. Without an account the fresh default account is used.
  //
  // loadFromPersistence() reads the configured account and all positions
  // from the gateway and hydrates them; when no account exists yet it saves
  // the fresh one. Returns true if a saved account was found.
  //
  // wipeData() resets to a fresh account with no positions and asks the
  // gateway to delete everything.
  // -------------------------------------------------------------------------
  void hydrate(std::optional<domain::Account> account,
               std::vector<domain::Position> positions);
  bool loadFromPersistence();
  void wipeData();

  // --- Read accessors (copies, shared_lock) ----------------------------------
  domain::Account account() const;
  std::optional<domain::Position> position(const std::string& id) const;
  std::optional<domain::Position> openPositionFor(
      const std::string& symbol) const;
  std::vector<domain::Position> positions(
      std::optional<domain::PositionStatus> status_filter =
          std::nullopt) const;
  std::size_t openPositionCount() const;
  std::optional<double> lastPrice(const std::string& symbol) const;

  const domain::EngineConfig& config() const { return config_; }

 private:
  domain::Account freshAccount() const;
  std::string today() const;

  TradeResult rejectLocked(domain::TradeRequest& request, TradeError error,
                           std::string reason);

  // Full-close path shared by closePosition() and partialClose().
  // Returns the frozen position.
  domain::Position closeLocked(domain::Position& pos, double exit_price,
                               const std::string& reason);

  void persistPositionLocked(const domain::Position& pos);
  void persistAccountLocked();
  void persistOrderLocked(const domain::TradeRequest& request);

  void notifyExecution(const domain::Position& pos);
  void notifyClose(const domain::Position& pos, const std::string& reason);

  const domain::EngineConfig config_;
  const ITimeProvider& clock_;
  IPersistenceGateway& persistence_;
  INotificationSink* notifier_;

  mutable std::shared_mutex mutex_;
  AccountLedger ledger_;
  PositionStore store_;
  std::unordered_map<std::string, double> last_prices_;

  IdGenerator position_ids_{"pos"};
  IdGenerator request_ids_{"req"};
};

}  // namespace levtrade
