#pragma once

#include <cstdint>
#include <string>

namespace levtrade {
namespace domain {

enum class PositionSide { Long, Short };

// Open → (pyramided | trailed)* → Closed. The engine never produces
// Pending; it is decoded from stored documents that carry "pending" and is
// never counted as open.
enum class PositionStatus { Open, Closed, Pending };

inline const char* toString(PositionSide side) {
  switch (side) {
    case PositionSide::Long:
      return "long";
    case PositionSide::Short:
      return "short";
  }
  return "long";
}

inline const char* toString(PositionStatus status) {
  switch (status) {
    case PositionStatus::Open:
      return "open";
    case PositionStatus::Closed:
      return "closed";
    case PositionStatus::Pending:
      return "pending";
  }
  return "open";
}

// -----------------------------------------------------------------------------
// Position: one leveraged position on a single symbol
// -----------------------------------------------------------------------------
//
// @brief  Full lifecycle state of a leveraged position, including the
//         pyramiding and trailing (partial close) extension fields.
//
// @details
// Quantities:
//   quantity            Mirrors total_quantity (kept for document
//                       compatibility with consumers that only read it).
//   original_quantity   Size at open, before any pyramid add.
//   total_quantity      Size after all pyramid adds.
//   remaining_quantity  Portion still open after trailing partial closes.
//                       Invariant: remaining_quantity <= total_quantity.
//
// PnL:
//   realized_pnl        Locked in by partial closes (and the final close).
//   unrealized_pnl      Mark-to-market of remaining_quantity.
//   pnl                 Always realized_pnl + unrealized_pnl.
//
// Prices:
//   entry_price mirrors average_entry_price after every pyramid add.
//   average_exit_price is the quantity-weighted average over every partial
//   close and the final close.
//
// Times are epoch milliseconds supplied by ITimeProvider. exit_time_ms is 0
// while the position is open.
//
// Thread model:
//   Value type. The authoritative copy lives inside PositionStore, owned by
//   TradeExecutor and guarded by its mutex. Everything else sees copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string id;
  std::string symbol;
  PositionSide side{PositionSide::Long};
  PositionStatus status{PositionStatus::Open};

  double entry_price{0.0};
  double exit_price{0.0};
  double last_price{0.0};  // Last mark applied by updatePrices()
  double quantity{0.0};
  double leverage{1.0};
  double margin_used{0.0};
  double trading_fee{0.0};
  double stop_loss{0.0};
  double target{0.0};
  double invested_amount{0.0};  // Notional: sum of qty * fill price

  double pnl{0.0};
  double pnl_percentage{0.0};

  std::int64_t entry_time_ms{0};
  std::int64_t exit_time_ms{0};

  std::string strategy;
  double confidence{0.0};
  std::string notes;

  // --- Pyramiding ------------------------------------------------------------
  double original_quantity{0.0};
  double total_quantity{0.0};
  double average_entry_price{0.0};
  int pyramid_count{0};

  // --- Trailing (partial close) ----------------------------------------------
  double remaining_quantity{0.0};
  int trailing_count{0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double average_exit_price{0.0};
};

// Quantity still exposed to the market. Legacy documents may carry
// remaining_quantity == 0 while open; fall back to total_quantity then.
inline double effectiveQuantity(const Position& pos) {
  if (pos.remaining_quantity > 0.0) {
    return pos.remaining_quantity;
  }
  return pos.total_quantity > 0.0 ? pos.total_quantity : pos.quantity;
}

inline double averageEntry(const Position& pos) {
  return pos.average_entry_price > 0.0 ? pos.average_entry_price
                                       : pos.entry_price;
}

// PnL of closing `qty` at `price` against the average entry.
inline double pnlFor(const Position& pos, double qty, double price) {
  double diff = price - averageEntry(pos);
  if (pos.side == PositionSide::Short) {
    diff = -diff;
  }
  return diff * qty;
}

// Recompute unrealized/total PnL at `price`. Idempotent for a given price.
inline void markToMarket(Position& pos, double price) {
  pos.last_price = price;
  pos.unrealized_pnl = pnlFor(pos, effectiveQuantity(pos), price);
  pos.pnl = pos.realized_pnl + pos.unrealized_pnl;
  pos.pnl_percentage =
      pos.invested_amount > 0.0 ? pos.pnl / pos.invested_amount * 100.0 : 0.0;
}

}  // namespace domain
}  // namespace levtrade
