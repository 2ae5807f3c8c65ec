#include "levtrade/execution/position_store.hpp"

namespace levtrade {

// -----------------------------------------------------------------------------
// insert
// -----------------------------------------------------------------------------
bool PositionStore::insert(domain::Position position) {
  if (positions_.count(position.id) != 0) {
    return false;
  }
  bool is_open = position.status == domain::PositionStatus::Open;
  if (is_open && hasOpen(position.symbol)) {
    return false;
  }

  if (is_open) {
    open_by_symbol_[position.symbol] = position.id;
  }
  insertion_order_.push_back(position.id);
  std::string id = position.id;
  positions_.emplace(std::move(id), std::move(position));
  return true;
}

domain::Position* PositionStore::find(const std::string& id) {
  auto it = positions_.find(id);
  return it != positions_.end() ? &it->second : nullptr;
}

const domain::Position* PositionStore::find(const std::string& id) const {
  auto it = positions_.find(id);
  return it != positions_.end() ? &it->second : nullptr;
}

std::optional<std::string> PositionStore::openIdForSymbol(
    const std::string& symbol) const {
  auto it = open_by_symbol_.find(symbol);
  if (it == open_by_symbol_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// markClosed: terminal transition, releases the symbol
// -----------------------------------------------------------------------------
void PositionStore::markClosed(const std::string& id) {
  domain::Position* pos = find(id);
  if (pos == nullptr) {
    return;
  }
  auto it = open_by_symbol_.find(pos->symbol);
  if (it != open_by_symbol_.end() && it->second == id) {
    open_by_symbol_.erase(it);
  }
  pos->status = domain::PositionStatus::Closed;
}

std::vector<domain::Position> PositionStore::snapshot(
    std::optional<domain::PositionStatus> status_filter) const {
  std::vector<domain::Position> result;
  result.reserve(insertion_order_.size());
  for (const auto& id : insertion_order_) {
    const domain::Position& pos = positions_.at(id);
    if (status_filter && pos.status != *status_filter) {
      continue;
    }
    result.push_back(pos);
  }
  return result;
}

std::vector<std::string> PositionStore::openIds() const {
  std::vector<std::string> result;
  result.reserve(open_by_symbol_.size());
  for (const auto& id : insertion_order_) {
    if (positions_.at(id).status == domain::PositionStatus::Open) {
      result.push_back(id);
    }
  }
  return result;
}

double PositionStore::openMargin() const {
  double total = 0.0;
  for (const auto& id : insertion_order_) {
    const domain::Position& pos = positions_.at(id);
    if (pos.status == domain::PositionStatus::Open) {
      total += pos.margin_used;
    }
  }
  return total;
}

void PositionStore::clear() {
  positions_.clear();
  open_by_symbol_.clear();
  insertion_order_.clear();
}

}  // namespace levtrade
