#pragma once

#include "levtrade/domain/position.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace levtrade {

// -----------------------------------------------------------------------------
// IPersistenceGateway: document-store boundary
// -----------------------------------------------------------------------------
//
// @brief  Abstract interface for durably storing accounts, positions and
//         trade-request (order) documents.
//
// @details
// Documents are flat JSON objects produced by persistence/documents.hpp,
// each carrying a string "id" and a "last_updated" ISO-8601 stamp. Every
// save is an upsert keyed by "id".
//
// The engine does not depend on any particular database driver. It receives
// an IPersistenceGateway& from its owner (main() or a test) and treats it as
// best-effort: a false return is logged and the in-memory state stays
// authoritative for the running process. Nothing is rolled back.
//
// Implementations:
//   - InMemoryDocumentStore  → tests; supports simulated write failures.
//   - JsonFileDocumentStore  → one JSON file per collection on disk.
//
// Thread-safety contract:
//   Implementations MUST be safe to call from multiple threads. TradeExecutor
//   calls them while holding its own mutex, so implementations must never
//   call back into the engine.
//
// Ownership:
//   Owned by the caller of TradingEngine / TradeExecutor; must outlive them.
// -----------------------------------------------------------------------------
class IPersistenceGateway {
 public:
  virtual ~IPersistenceGateway() = default;

  virtual bool saveAccount(const nlohmann::json& doc) = 0;

  // std::nullopt when no account with that id was ever saved.
  virtual std::optional<nlohmann::json> loadAccount(const std::string& id) = 0;

  virtual bool savePosition(const nlohmann::json& doc) = 0;

  // All position documents, or only those whose "status" matches.
  virtual std::vector<nlohmann::json> loadPositions(
      std::optional<domain::PositionStatus> status_filter) = 0;

  virtual bool saveOrder(const nlohmann::json& doc) = 0;

  // Explicit data wipe: removes every account, position and order.
  virtual bool deleteAll() = 0;
};

}  // namespace levtrade
