#pragma once

#include "levtrade/persistence/i_persistence_gateway.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// JsonFileDocumentStore: file-backed IPersistenceGateway
// -----------------------------------------------------------------------------
//
// @brief  Keeps each collection as one JSON object file (id → document)
//         inside a data directory:
//           <dir>/accounts.json
//           <dir>/positions.json
//           <dir>/orders.json
//
// @details
// Files are read once in the constructor. Every save updates the in-memory
// collection and rewrites that collection's file through a temporary file
// followed by std::filesystem::rename, so a crash mid-write leaves the
// previous file intact.
//
// Errors (unreadable directory, malformed file, failed write) are logged
// with the "[JsonFileStore]" tag and reported as a false return; a malformed
// file on load is treated as an empty collection.
//
// Thread-safety: All methods lock mutex_. File I/O happens under the lock.
// -----------------------------------------------------------------------------
class JsonFileDocumentStore final : public IPersistenceGateway {
 public:
  explicit JsonFileDocumentStore(std::filesystem::path directory);

  JsonFileDocumentStore(const JsonFileDocumentStore&) = delete;
  JsonFileDocumentStore& operator=(const JsonFileDocumentStore&) = delete;

  bool saveAccount(const nlohmann::json& doc) override;
  std::optional<nlohmann::json> loadAccount(const std::string& id) override;
  bool savePosition(const nlohmann::json& doc) override;
  std::vector<nlohmann::json> loadPositions(
      std::optional<domain::PositionStatus> status_filter) override;
  bool saveOrder(const nlohmann::json& doc) override;
  bool deleteAll() override;

 private:
  struct Collection {
    std::filesystem::path file;
    nlohmann::json documents = nlohmann::json::object();
  };

  void load(Collection& collection);
  bool flush(const Collection& collection);
  bool upsert(Collection& collection, const nlohmann::json& doc);

  std::mutex mutex_;
  std::filesystem::path directory_;
  Collection accounts_;
  Collection positions_;
  Collection orders_;
};

}  // namespace levtrade
