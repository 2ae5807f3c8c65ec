#include "levtrade/execution/trade_executor.hpp"
#include "levtrade/persistence/documents.hpp"
#include "levtrade/time/time_utils.hpp"
#include "levtrade/util/format.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <utility>

namespace levtrade {

namespace {

// Quantities below this are treated as fully closed.
constexpr double kQuantityEpsilon = 1e-12;

bool validPrice(double price) { return std::isfinite(price) && price > 0.0; }

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradeExecutor::TradeExecutor(const domain::EngineConfig& config,
                             const ITimeProvider& clock,
                             IPersistenceGateway& persistence,
                             INotificationSink* notifier)
    : config_(config),
      clock_(clock),
      persistence_(persistence),
      notifier_(notifier),
      ledger_(freshAccount()) {}

// -----------------------------------------------------------------------------
// freshAccount: default account built from configuration
// -----------------------------------------------------------------------------
domain::Account TradeExecutor::freshAccount() const {
  domain::Account account;
  account.id = config_.account.account_id;
  account.initial_balance = config_.account.initial_balance;
  account.current_balance = config_.account.initial_balance;
  account.daily_trades_limit = config_.account.daily_trades_limit;
  account.max_leverage = config_.account.max_leverage;
  return account;
}

std::string TradeExecutor::today() const {
  return utcDateString(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// rejectLocked: mark request Failed, persist the audit record, log
// -----------------------------------------------------------------------------
TradeResult TradeExecutor::rejectLocked(domain::TradeRequest& request,
                                        TradeError error, std::string reason) {
  request.status = domain::TradeRequestStatus::Failed;
  request.error_reason = reason;
  persistOrderLocked(request);

  std::cerr << "[TradeExecutor] Trade rejected for " << request.symbol << ": "
            << reason << "\n";
  return TradeResult::fail(error, std::move(reason));
}

// -----------------------------------------------------------------------------
// openTrade
// -----------------------------------------------------------------------------
TradeResult TradeExecutor::openTrade(domain::TradeRequest& request) {
  domain::Position opened;

  {
    std::unique_lock lock(mutex_);

    if (request.id.empty()) {
      request.id = request_ids_.next();
    }

    if (!domain::canTransition(request.status,
                               domain::TradeRequestStatus::Executing)) {
      return TradeResult::fail(
          TradeError::InvalidRequest,
          "Trade request " + request.id + " is already " +
              domain::toString(request.status));
    }
    request.status = domain::TradeRequestStatus::Executing;

    // --- a. signal --------------------------------------------------------
    if (request.signal != domain::TradeSignal::Buy &&
        request.signal != domain::TradeSignal::Sell) {
      return rejectLocked(
          request, TradeError::InvalidSignal,
          std::string("Invalid signal: ") + domain::toString(request.signal));
    }

    // --- b. numeric inputs ------------------------------------------------
    if (!validPrice(request.price)) {
      return rejectLocked(request, TradeError::InvalidPrice, "Invalid price");
    }
    if (!std::isfinite(request.quantity) || request.quantity <= 0.0) {
      return rejectLocked(request, TradeError::InvalidQuantity,
                          "Invalid quantity");
    }
    double leverage = request.leverage > 0.0 ? request.leverage
                                             : config_.account.default_leverage;
    const domain::Account& account = ledger_.account();
    if (!std::isfinite(leverage) || leverage > account.max_leverage) {
      return rejectLocked(request, TradeError::InvalidLeverage,
                          "Invalid leverage: " + fixed(leverage, 1) +
                              "x (max " + fixed(account.max_leverage, 1) +
                              "x)");
    }
    request.leverage = leverage;

    // --- c. confidence ----------------------------------------------------
    if (request.confidence < config_.protection.min_confidence) {
      return rejectLocked(request, TradeError::LowConfidence,
                          "Low confidence: " + fixed(request.confidence, 1) +
                              "%");
    }

    // --- d. daily limit ---------------------------------------------------
    std::string day = today();
    ledger_.rollDailyCounter(day);
    if (ledger_.dailyLimitReached()) {
      return rejectLocked(
          request, TradeError::DailyLimitReached,
          "Daily trade limit reached: " +
              std::to_string(ledger_.account().daily_trades_count) + "/" +
              std::to_string(ledger_.account().daily_trades_limit));
    }

    // --- e. one open position per symbol ----------------------------------
    if (store_.hasOpen(request.symbol)) {
      return rejectLocked(request, TradeError::DuplicatePosition,
                          "Position already open for " + request.symbol);
    }

    // --- f. margin reservation --------------------------------------------
    double margin = request.price * request.quantity / leverage;
    double fee = margin * config_.fees.trading_fee_pct;
    double balance = ledger_.account().current_balance;
    if (!ledger_.reserve(margin, fee)) {
      return rejectLocked(request, TradeError::InsufficientBalance,
                          "Insufficient balance: need $" +
                              fixed(margin + fee) + ", have $" +
                              fixed(balance));
    }

    // --- build the position -----------------------------------------------
    domain::Position pos;
    pos.id = position_ids_.next();
    pos.symbol = request.symbol;
    pos.side = request.signal == domain::TradeSignal::Buy
                   ? domain::PositionSide::Long
                   : domain::PositionSide::Short;
    pos.status = domain::PositionStatus::Open;
    pos.entry_price = request.price;
    pos.last_price = request.price;
    pos.quantity = request.quantity;
    pos.leverage = leverage;
    pos.margin_used = margin;
    pos.trading_fee = fee;
    pos.invested_amount = request.price * request.quantity;
    pos.entry_time_ms = clock_.now_ms();
    pos.strategy = request.strategy;
    pos.confidence = request.confidence;

    if (pos.side == domain::PositionSide::Long) {
      pos.stop_loss = request.price * (1.0 - config_.protection.stop_loss_pct);
      pos.target = request.price * (1.0 + config_.protection.target_pct);
    } else {
      pos.stop_loss = request.price * (1.0 + config_.protection.stop_loss_pct);
      pos.target = request.price * (1.0 - config_.protection.target_pct);
    }

    pos.original_quantity = request.quantity;
    pos.total_quantity = request.quantity;
    pos.average_entry_price = request.price;
    pos.remaining_quantity = request.quantity;

    store_.insert(pos);
    ledger_.recordTrade(day);

    request.status = domain::TradeRequestStatus::Completed;
    request.position_id = pos.id;
    request.error_reason.clear();

    persistPositionLocked(pos);
    persistAccountLocked();
    persistOrderLocked(request);

    opened = pos;
  }

  std::cout << "[TradeExecutor] Opened " << domain::toString(opened.side)
            << " " << opened.symbol << " qty=" << opened.quantity << " @ "
            << opened.entry_price << " leverage=" << opened.leverage
            << "x margin=" << fixed(opened.margin_used)
            << " fee=" << fixed(opened.trading_fee, 4) << " id=" << opened.id
            << "\n";

  notifyExecution(opened);

  return TradeResult::ok(opened.id, "Opened " +
                                        std::string(domain::toString(opened.side)) +
                                        " " + opened.symbol + " qty=" +
                                        fixed(opened.quantity, 6) + " @ " +
                                        fixed(opened.entry_price));
}

// -----------------------------------------------------------------------------
// cancelRequest
// -----------------------------------------------------------------------------
bool TradeExecutor::cancelRequest(domain::TradeRequest& request) {
  std::unique_lock lock(mutex_);
  if (request.status != domain::TradeRequestStatus::Pending) {
    return false;
  }
  if (request.id.empty()) {
    request.id = request_ids_.next();
  }
  request.status = domain::TradeRequestStatus::Cancelled;
  persistOrderLocked(request);
  return true;
}

// -----------------------------------------------------------------------------
// closeLocked: realize the remainder and settle with the ledger
// -----------------------------------------------------------------------------
domain::Position TradeExecutor::closeLocked(domain::Position& pos,
                                            double exit_price,
                                            const std::string& reason) {
  double open_qty = domain::effectiveQuantity(pos);
  double closed_before = std::max(0.0, pos.total_quantity - open_qty);

  double leg_pnl = domain::pnlFor(pos, open_qty, exit_price);
  double closed_after = closed_before + open_qty;
  pos.average_exit_price =
      closed_after > 0.0
          ? (pos.average_exit_price * closed_before + exit_price * open_qty) /
                closed_after
          : exit_price;

  pos.realized_pnl += leg_pnl;
  pos.unrealized_pnl = 0.0;
  pos.pnl = pos.realized_pnl;
  pos.pnl_percentage =
      pos.invested_amount > 0.0 ? pos.pnl / pos.invested_amount * 100.0 : 0.0;
  pos.remaining_quantity = 0.0;
  pos.exit_price = exit_price;
  pos.last_price = exit_price;
  pos.exit_time_ms = clock_.now_ms();
  pos.notes = reason;

  double exit_fee = pos.trading_fee * config_.fees.exit_fee_multiplier;
  ledger_.release(pos.margin_used, pos.pnl, exit_fee);
  store_.markClosed(pos.id);

  persistPositionLocked(pos);
  persistAccountLocked();
  return pos;
}

// -----------------------------------------------------------------------------
// closePosition
// -----------------------------------------------------------------------------
TradeResult TradeExecutor::closePosition(const std::string& id,
                                         double exit_price,
                                         const std::string& reason) {
  if (!validPrice(exit_price)) {
    return TradeResult::fail(TradeError::InvalidPrice, "Invalid exit price");
  }

  domain::Position closed;
  {
    std::unique_lock lock(mutex_);
    domain::Position* pos = store_.find(id);
    if (pos == nullptr) {
      return TradeResult::fail(TradeError::PositionNotFound,
                               "Position not found: " + id);
    }
    if (pos->status != domain::PositionStatus::Open) {
      return TradeResult::fail(TradeError::PositionNotOpen,
                               "Position not open: " + id);
    }
    closed = closeLocked(*pos, exit_price, reason);
  }

  std::cout << "[TradeExecutor] Closed " << closed.symbol << " @ "
            << closed.exit_price << " pnl=" << fixed(closed.pnl)
            << " reason=\"" << reason << "\"\n";

  notifyClose(closed, reason);

  return TradeResult::ok(closed.id, "Closed " + closed.symbol + " @ " +
                                        fixed(exit_price) + " pnl=" +
                                        fixed(closed.pnl) + " (" + reason +
                                        ")");
}

// -----------------------------------------------------------------------------
// updatePrices
// -----------------------------------------------------------------------------
void TradeExecutor::updatePrices(const domain::PriceMap& prices) {
  std::unique_lock lock(mutex_);

  for (const auto& [symbol, price] : prices) {
    if (validPrice(price)) {
      last_prices_[symbol] = price;
    }
  }

  for (const auto& id : store_.openIds()) {
    domain::Position* pos = store_.find(id);
    auto it = prices.find(pos->symbol);
    if (it == prices.end() || !validPrice(it->second)) {
      continue;
    }
    domain::markToMarket(*pos, it->second);
  }
}

// -----------------------------------------------------------------------------
// addToPosition: pyramiding
// -----------------------------------------------------------------------------
TradeResult TradeExecutor::addToPosition(const std::string& id,
                                         double quantity, double price,
                                         double margin) {
  if (!validPrice(price)) {
    return TradeResult::fail(TradeError::InvalidPrice, "Invalid price");
  }
  if (!std::isfinite(quantity) || quantity <= 0.0) {
    return TradeResult::fail(TradeError::InvalidQuantity, "Invalid quantity");
  }
  if (!std::isfinite(margin) || margin <= 0.0) {
    return TradeResult::fail(TradeError::InvalidQuantity, "Invalid margin");
  }

  domain::Position updated;
  {
    std::unique_lock lock(mutex_);
    domain::Position* pos = store_.find(id);
    if (pos == nullptr) {
      return TradeResult::fail(TradeError::PositionNotFound,
                               "Position not found: " + id);
    }
    if (pos->status != domain::PositionStatus::Open) {
      return TradeResult::fail(TradeError::PositionNotOpen,
                               "Position not open: " + id);
    }

    double fee = margin * config_.fees.trading_fee_pct;
    double balance = ledger_.account().current_balance;
    if (!ledger_.reserve(margin, fee)) {
      return TradeResult::fail(TradeError::InsufficientBalance,
                               "Insufficient balance: need $" +
                                   fixed(margin + fee) + ", have $" +
                                   fixed(balance));
    }

    // First add on a position that predates the pyramiding fields.
    if (pos->pyramid_count == 0) {
      if (pos->original_quantity <= 0.0) {
        pos->original_quantity = pos->quantity;
      }
      if (pos->total_quantity <= 0.0) {
        pos->total_quantity = pos->quantity;
      }
      if (pos->average_entry_price <= 0.0) {
        pos->average_entry_price = pos->entry_price;
      }
    }

    double open_before = domain::effectiveQuantity(*pos);
    double old_total = pos->total_quantity;
    double old_avg = pos->average_entry_price;
    double new_total = old_total + quantity;

    pos->average_entry_price = (old_total * old_avg + quantity * price) / new_total;
    pos->entry_price = pos->average_entry_price;
    pos->total_quantity = new_total;
    pos->quantity = new_total;
    pos->remaining_quantity = open_before + quantity;
    pos->margin_used += margin;
    pos->trading_fee += fee;
    pos->invested_amount += quantity * price;
    ++pos->pyramid_count;

    domain::markToMarket(*pos, price);

    persistPositionLocked(*pos);
    persistAccountLocked();
    updated = *pos;
  }

  std::cout << "[TradeExecutor] Pyramid add #" << updated.pyramid_count
            << " on " << updated.symbol << ": +" << quantity << " @ " << price
            << " new avg=" << fixed(updated.average_entry_price)
            << " total=" << updated.total_quantity << "\n";

  notifyExecution(updated);

  return TradeResult::ok(
      updated.id, "Pyramid add #" + std::to_string(updated.pyramid_count) +
                      ": +" + fixed(quantity, 6) + " @ " + fixed(price) +
                      ", avg entry " + fixed(updated.average_entry_price));
}

// -----------------------------------------------------------------------------
// partialClose: trailing profit lock
// -----------------------------------------------------------------------------
TradeResult TradeExecutor::partialClose(const std::string& id, double quantity,
                                        double exit_price,
                                        const std::string& reason) {
  if (!validPrice(exit_price)) {
    return TradeResult::fail(TradeError::InvalidPrice, "Invalid exit price");
  }
  if (!std::isfinite(quantity) || quantity <= 0.0) {
    return TradeResult::fail(TradeError::InvalidQuantity, "Invalid quantity");
  }

  domain::Position after;
  bool fully_closed = false;
  double closed_qty = 0.0;
  {
    std::unique_lock lock(mutex_);
    domain::Position* pos = store_.find(id);
    if (pos == nullptr) {
      return TradeResult::fail(TradeError::PositionNotFound,
                               "Position not found: " + id);
    }
    if (pos->status != domain::PositionStatus::Open) {
      return TradeResult::fail(TradeError::PositionNotOpen,
                               "Position not open: " + id);
    }

    double open_qty = domain::effectiveQuantity(*pos);
    closed_qty = std::min(quantity, open_qty);
    ++pos->trailing_count;

    if (open_qty - closed_qty <= kQuantityEpsilon) {
      after = closeLocked(*pos, exit_price, reason);
      fully_closed = true;
    } else {
      double closed_before = std::max(0.0, pos->total_quantity - open_qty);
      double leg_pnl = domain::pnlFor(*pos, closed_qty, exit_price);

      pos->average_exit_price =
          (pos->average_exit_price * closed_before + exit_price * closed_qty) /
          (closed_before + closed_qty);
      pos->realized_pnl += leg_pnl;
      pos->remaining_quantity = open_qty - closed_qty;
      domain::markToMarket(*pos, exit_price);

      persistPositionLocked(*pos);
      after = *pos;
    }
  }

  if (fully_closed) {
    std::cout << "[TradeExecutor] Partial close consumed the remainder of "
              << after.symbol << "; position closed.\n";
    notifyClose(after, reason);
    return TradeResult::ok(after.id, "Closed " + after.symbol + " @ " +
                                         fixed(exit_price) + " pnl=" +
                                         fixed(after.pnl) + " (" + reason +
                                         ")");
  }

  std::cout << "[TradeExecutor] Partial close #" << after.trailing_count
            << " on " << after.symbol << ": -" << closed_qty << " @ "
            << exit_price << " remaining=" << after.remaining_quantity
            << " realized=" << fixed(after.realized_pnl) << "\n";

  return TradeResult::ok(after.id, "Partial close " + fixed(closed_qty, 6) +
                                       " " + after.symbol + " @ " +
                                       fixed(exit_price) + ", remaining " +
                                       fixed(after.remaining_quantity, 6) +
                                       " (" + reason + ")");
}

// -----------------------------------------------------------------------------
// checkPyramidingOpportunity
// -----------------------------------------------------------------------------
// Eligible when: feature enabled, position OPEN, confidence high enough,
// add count below max_adds, position at least min_profit_pct in profit at
// `price`, and the balance covers the add's margin plus fee.
// -----------------------------------------------------------------------------
OpportunityCheck TradeExecutor::checkPyramidingOpportunity(
    const std::string& id, double price, double confidence) const {
  OpportunityCheck check;
  const auto& cfg = config_.pyramiding;

  if (!cfg.enabled) {
    check.reason = "Pyramiding disabled";
    return check;
  }
  if (!validPrice(price)) {
    check.reason = "Invalid price";
    return check;
  }

  std::shared_lock lock(mutex_);
  const domain::Position* pos = store_.find(id);
  if (pos == nullptr || pos->status != domain::PositionStatus::Open) {
    check.reason = "No open position " + id;
    return check;
  }
  if (confidence < cfg.min_confidence) {
    check.reason = "Confidence " + fixed(confidence, 1) +
                   "% below pyramiding minimum " + fixed(cfg.min_confidence, 1) +
                   "%";
    return check;
  }
  if (pos->pyramid_count >= cfg.max_adds) {
    check.reason = "Maximum pyramid adds reached (" +
                   std::to_string(pos->pyramid_count) + "/" +
                   std::to_string(cfg.max_adds) + ")";
    return check;
  }

  domain::Position marked = *pos;
  domain::markToMarket(marked, price);
  if (marked.pnl_percentage < cfg.min_profit_pct) {
    check.reason = "Position not profitable enough: " +
                   fixed(marked.pnl_percentage) + "% < " +
                   fixed(cfg.min_profit_pct) + "%";
    return check;
  }

  double total = pos->total_quantity > 0.0 ? pos->total_quantity
                                           : pos->quantity;
  double quantity = total * cfg.add_percentage;
  double margin = quantity * price / pos->leverage;
  double fee = margin * config_.fees.trading_fee_pct;
  double balance = ledger_.account().current_balance;
  if (quantity < config_.sizing.min_trade_size) {
    check.reason = "Pyramid quantity " + fixed(quantity, 6) +
                   " below minimum trade size";
    return check;
  }
  if (margin + fee > balance) {
    check.reason = "Insufficient balance for pyramid add: need $" +
                   fixed(margin + fee) + ", have $" + fixed(balance);
    return check;
  }

  check.eligible = true;
  check.quantity = quantity;
  check.margin = margin;
  check.reason = "Pyramid add #" + std::to_string(pos->pyramid_count + 1) +
                 ": qty=" + fixed(quantity, 6) + " margin=$" + fixed(margin);
  return check;
}

// -----------------------------------------------------------------------------
// checkTrailingOpportunity
// -----------------------------------------------------------------------------
// Eligible when: feature enabled, position OPEN, trailing_count below
// max_count, `price` at or beyond the target, and the open quantity is in
// profit. The proposed quantity is exit_percentage of the remaining size,
// or the whole remainder when what would be left is below min_trade_size.
// -----------------------------------------------------------------------------
OpportunityCheck TradeExecutor::checkTrailingOpportunity(const std::string& id,
                                                         double price) const {
  OpportunityCheck check;
  const auto& cfg = config_.trailing;

  if (!cfg.enabled) {
    check.reason = "Trailing disabled";
    return check;
  }
  if (!validPrice(price)) {
    check.reason = "Invalid price";
    return check;
  }

  std::shared_lock lock(mutex_);
  const domain::Position* pos = store_.find(id);
  if (pos == nullptr || pos->status != domain::PositionStatus::Open) {
    check.reason = "No open position " + id;
    return check;
  }
  if (pos->trailing_count >= cfg.max_count) {
    check.reason = "Maximum trailing steps reached (" +
                   std::to_string(pos->trailing_count) + "/" +
                   std::to_string(cfg.max_count) + ")";
    return check;
  }

  bool target_reached = pos->side == domain::PositionSide::Long
                            ? price >= pos->target
                            : price <= pos->target;
  if (!target_reached) {
    check.reason = "Target not reached";
    return check;
  }

  double open_qty = domain::effectiveQuantity(*pos);
  if (domain::pnlFor(*pos, open_qty, price) <= 0.0) {
    check.reason = "Position not in profit";
    return check;
  }

  double quantity = open_qty * cfg.exit_percentage;
  if (open_qty - quantity < config_.sizing.min_trade_size) {
    quantity = open_qty;
  }

  check.eligible = true;
  check.quantity = quantity;
  check.reason = "Trailing step #" + std::to_string(pos->trailing_count + 1) +
                 ": close " + fixed(quantity, 6) + " of " + fixed(open_qty, 6);
  return check;
}

// -----------------------------------------------------------------------------
// tightenStopLoss
// -----------------------------------------------------------------------------
bool TradeExecutor::tightenStopLoss(const std::string& id, double new_stop) {
  if (!validPrice(new_stop)) {
    return false;
  }

  std::unique_lock lock(mutex_);
  domain::Position* pos = store_.find(id);
  if (pos == nullptr || pos->status != domain::PositionStatus::Open) {
    return false;
  }

  bool tighter = pos->side == domain::PositionSide::Long
                     ? new_stop > pos->stop_loss
                     : (pos->stop_loss <= 0.0 || new_stop < pos->stop_loss);
  if (!tighter) {
    return false;
  }

  pos->stop_loss = new_stop;
  persistPositionLocked(*pos);
  return true;
}

// -----------------------------------------------------------------------------
// reanchorLevels: stop/target around the latest trailing exit
// -----------------------------------------------------------------------------
bool TradeExecutor::reanchorLevels(const std::string& id, double price) {
  if (!validPrice(price)) {
    return false;
  }

  std::unique_lock lock(mutex_);
  domain::Position* pos = store_.find(id);
  if (pos == nullptr || pos->status != domain::PositionStatus::Open) {
    return false;
  }

  const auto& cfg = config_.trailing;
  if (pos->side == domain::PositionSide::Long) {
    pos->stop_loss = price * (1.0 - cfg.stop_offset_pct);
    pos->target = price * (1.0 + cfg.target_offset_pct);
  } else {
    pos->stop_loss = price * (1.0 + cfg.stop_offset_pct);
    pos->target = price * (1.0 - cfg.target_offset_pct);
  }
  persistPositionLocked(*pos);
  return true;
}

// -----------------------------------------------------------------------------
// hydrate
// -----------------------------------------------------------------------------
void TradeExecutor::hydrate(std::optional<domain::Account> account,
                            std::vector<domain::Position> positions) {
  std::unique_lock lock(mutex_);

  store_.clear();
  last_prices_.clear();

  std::size_t skipped = 0;
  for (auto& pos : positions) {
    position_ids_.observe(pos.id);
    if (!store_.insert(pos)) {
      ++skipped;
      std::cerr << "[TradeExecutor] WARNING: skipping position " << pos.id
                << " (" << pos.symbol
                << "): duplicate id or second open position on symbol.\n";
    }
  }

  if (account) {
    ledger_.restore(std::move(*account), store_.openMargin());
  } else {
    domain::Account fresh = freshAccount();
    ledger_.restore(std::move(fresh), store_.openMargin());
  }

  std::cout << "[TradeExecutor] Hydrated " << store_.size()
            << " position(s), " << store_.openCount() << " open, " << skipped
            << " skipped. Balance=" << fixed(ledger_.account().current_balance)
            << " margin in use=" << fixed(ledger_.account().total_margin_used)
            << "\n";
}

// -----------------------------------------------------------------------------
// loadFromPersistence
// -----------------------------------------------------------------------------
bool TradeExecutor::loadFromPersistence() {
  std::optional<domain::Account> account;
  if (auto doc = persistence_.loadAccount(config_.account.account_id)) {
    account = accountFromDocument(*doc);
  }

  std::vector<domain::Position> positions;
  for (const auto& doc : persistence_.loadPositions(std::nullopt)) {
    if (auto pos = positionFromDocument(doc)) {
      positions.push_back(std::move(*pos));
    }
  }

  bool found = account.has_value();
  hydrate(std::move(account), std::move(positions));

  if (!found) {
    std::unique_lock lock(mutex_);
    persistAccountLocked();
  }
  return found;
}

// -----------------------------------------------------------------------------
// wipeData
// -----------------------------------------------------------------------------
void TradeExecutor::wipeData() {
  std::unique_lock lock(mutex_);

  store_.clear();
  last_prices_.clear();
  ledger_.reset(freshAccount());
  position_ids_.reset();
  request_ids_.reset();

  if (!persistence_.deleteAll()) {
    std::cerr << "[TradeExecutor] WARNING: persistence wipe failed.\n";
  }
  persistAccountLocked();

  std::cout << "[TradeExecutor] Data wiped. Balance reset to "
            << fixed(ledger_.account().current_balance) << "\n";
}

// -----------------------------------------------------------------------------
// Read accessors
// -----------------------------------------------------------------------------
domain::Account TradeExecutor::account() const {
  std::shared_lock lock(mutex_);
  return ledger_.account();
}

std::optional<domain::Position> TradeExecutor::position(
    const std::string& id) const {
  std::shared_lock lock(mutex_);
  const domain::Position* pos = store_.find(id);
  if (pos == nullptr) {
    return std::nullopt;
  }
  return *pos;
}

std::optional<domain::Position> TradeExecutor::openPositionFor(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto id = store_.openIdForSymbol(symbol);
  if (!id) {
    return std::nullopt;
  }
  return *store_.find(*id);
}

std::vector<domain::Position> TradeExecutor::positions(
    std::optional<domain::PositionStatus> status_filter) const {
  std::shared_lock lock(mutex_);
  return store_.snapshot(status_filter);
}

std::size_t TradeExecutor::openPositionCount() const {
  std::shared_lock lock(mutex_);
  return store_.openCount();
}

std::optional<double> TradeExecutor::lastPrice(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = last_prices_.find(symbol);
  if (it == last_prices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Persistence helpers (caller holds mutex_)
// -----------------------------------------------------------------------------
void TradeExecutor::persistPositionLocked(const domain::Position& pos) {
  if (!persistence_.savePosition(toDocument(pos, clock_.now_ms()))) {
    std::cerr << "[TradeExecutor] WARNING: failed to persist position "
              << pos.id << " (" << pos.symbol
              << "). In-memory state kept.\n";
  }
}

void TradeExecutor::persistAccountLocked() {
  if (!persistence_.saveAccount(toDocument(ledger_.account(), clock_.now_ms()))) {
    std::cerr << "[TradeExecutor] WARNING: failed to persist account "
              << ledger_.account().id << ". In-memory state kept.\n";
  }
}

void TradeExecutor::persistOrderLocked(const domain::TradeRequest& request) {
  if (!persistence_.saveOrder(toDocument(request, clock_.now_ms()))) {
    std::cerr << "[TradeExecutor] WARNING: failed to persist order "
              << request.id << ".\n";
  }
}

// -----------------------------------------------------------------------------
// Notification helpers (called without mutex_)
// -----------------------------------------------------------------------------
void TradeExecutor::notifyExecution(const domain::Position& pos) {
  if (notifier_ == nullptr) {
    return;
  }
  try {
    notifier_->notifyTradeExecution(pos);
  } catch (const std::exception& e) {
    std::cerr << "[TradeExecutor] WARNING: trade notification failed: "
              << e.what() << "\n";
  }
}

void TradeExecutor::notifyClose(const domain::Position& pos,
                                const std::string& reason) {
  if (notifier_ == nullptr) {
    return;
  }
  try {
    notifier_->notifyPositionClose(pos, reason);
  } catch (const std::exception& e) {
    std::cerr << "[TradeExecutor] WARNING: close notification failed: "
              << e.what() << "\n";
  }
}

}  // namespace levtrade
