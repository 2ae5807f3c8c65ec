#pragma once

#include "levtrade/domain/position.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace levtrade {

// -----------------------------------------------------------------------------
// PositionStore
// -----------------------------------------------------------------------------
//
// @brief  All positions keyed by id, plus a symbol index that enforces at
//         most one OPEN position per symbol.
//
// @details
// Closed positions stay in the store as history. Iteration (snapshot,
// openIds) follows insertion order so that monitoring and reports are
// deterministic.
//
// Status changes to/from Open must go through insert() and markClosed() so
// the symbol index stays consistent; other fields are edited in place
// through find().
//
// Thread model:
//   Not synchronized. Owned by TradeExecutor and accessed under its mutex.
// -----------------------------------------------------------------------------
class PositionStore {
 public:
  // Fails if the id exists or if the position is Open and its symbol
  // already has an Open position.
  bool insert(domain::Position position);

  domain::Position* find(const std::string& id);
  const domain::Position* find(const std::string& id) const;

  // Id of the OPEN position on `symbol`, if any.
  std::optional<std::string> openIdForSymbol(const std::string& symbol) const;

  bool hasOpen(const std::string& symbol) const {
    return open_by_symbol_.count(symbol) != 0;
  }

  // Sets status=Closed and frees the symbol. No-op for unknown ids.
  void markClosed(const std::string& id);

  std::vector<domain::Position> snapshot(
      std::optional<domain::PositionStatus> status_filter) const;

  std::vector<std::string> openIds() const;

  std::size_t openCount() const { return open_by_symbol_.size(); }
  std::size_t size() const { return positions_.size(); }

  // Sum of margin_used over OPEN positions.
  double openMargin() const;

  void clear();

 private:
  std::unordered_map<std::string, domain::Position> positions_;
  std::unordered_map<std::string, std::string> open_by_symbol_;
  std::vector<std::string> insertion_order_;
};

}  // namespace levtrade
