#pragma once

#include "levtrade/persistence/i_persistence_gateway.hpp"

#include <atomic>
#include <map>
#include <mutex>

namespace levtrade {

// -----------------------------------------------------------------------------
// InMemoryDocumentStore
// -----------------------------------------------------------------------------
//
// @brief  IPersistenceGateway backed by std::map collections.
//
// @details
// Used by tests and by TradingEngine when no durable store is wanted.
// setFailWrites(true) makes every save return false without storing
// anything, to exercise the engine's "log and continue" behavior.
//
// Counters (saveCalls) let tests assert that a mutation was persisted
// without decoding documents.
//
// Thread-safety: All methods lock mutex_.
// -----------------------------------------------------------------------------
class InMemoryDocumentStore final : public IPersistenceGateway {
 public:
  InMemoryDocumentStore() = default;

  InMemoryDocumentStore(const InMemoryDocumentStore&) = delete;
  InMemoryDocumentStore& operator=(const InMemoryDocumentStore&) = delete;

  bool saveAccount(const nlohmann::json& doc) override;
  std::optional<nlohmann::json> loadAccount(const std::string& id) override;
  bool savePosition(const nlohmann::json& doc) override;
  std::vector<nlohmann::json> loadPositions(
      std::optional<domain::PositionStatus> status_filter) override;
  bool saveOrder(const nlohmann::json& doc) override;
  bool deleteAll() override;

  void setFailWrites(bool fail) { fail_writes_.store(fail); }

  std::optional<nlohmann::json> order(const std::string& id) const;
  std::size_t orderCount() const;
  std::size_t saveCalls() const { return save_calls_.load(); }

 private:
  using Collection = std::map<std::string, nlohmann::json>;

  bool upsert(Collection& collection, const nlohmann::json& doc);

  mutable std::mutex mutex_;
  Collection accounts_;
  Collection positions_;
  Collection orders_;

  std::atomic<bool> fail_writes_{false};
  std::atomic<std::size_t> save_calls_{0};
};

}  // namespace levtrade
