#include "levtrade/persistence/in_memory_document_store.hpp"

namespace levtrade {

// -----------------------------------------------------------------------------
// upsert: insert or replace by "id"; caller holds mutex_
// -----------------------------------------------------------------------------
bool InMemoryDocumentStore::upsert(Collection& collection,
                                   const nlohmann::json& doc) {
  save_calls_.fetch_add(1);
  if (fail_writes_.load()) {
    return false;
  }
  auto it = doc.find("id");
  if (it == doc.end() || !it->is_string()) {
    return false;
  }
  collection[it->get<std::string>()] = doc;
  return true;
}

bool InMemoryDocumentStore::saveAccount(const nlohmann::json& doc) {
  std::lock_guard lock(mutex_);
  return upsert(accounts_, doc);
}

std::optional<nlohmann::json> InMemoryDocumentStore::loadAccount(
    const std::string& id) {
  std::lock_guard lock(mutex_);
  auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryDocumentStore::savePosition(const nlohmann::json& doc) {
  std::lock_guard lock(mutex_);
  return upsert(positions_, doc);
}

// -----------------------------------------------------------------------------
// loadPositions: optional status filter on the "status" string
// -----------------------------------------------------------------------------
std::vector<nlohmann::json> InMemoryDocumentStore::loadPositions(
    std::optional<domain::PositionStatus> status_filter) {
  std::lock_guard lock(mutex_);
  std::vector<nlohmann::json> result;
  result.reserve(positions_.size());
  for (const auto& [id, doc] : positions_) {
    if (status_filter &&
        doc.value("status", std::string{}) != domain::toString(*status_filter)) {
      continue;
    }
    result.push_back(doc);
  }
  return result;
}

bool InMemoryDocumentStore::saveOrder(const nlohmann::json& doc) {
  std::lock_guard lock(mutex_);
  return upsert(orders_, doc);
}

bool InMemoryDocumentStore::deleteAll() {
  std::lock_guard lock(mutex_);
  accounts_.clear();
  positions_.clear();
  orders_.clear();
  return true;
}

std::optional<nlohmann::json> InMemoryDocumentStore::order(
    const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t InMemoryDocumentStore::orderCount() const {
  std::lock_guard lock(mutex_);
  return orders_.size();
}

}  // namespace levtrade
