#include "levtrade/persistence/json_file_document_store.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

namespace levtrade {

// -----------------------------------------------------------------------------
// Constructor: create the directory and read existing collections
// -----------------------------------------------------------------------------
JsonFileDocumentStore::JsonFileDocumentStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    std::cerr << "[JsonFileStore] ERROR: cannot create " << directory_
              << ": " << ec.message() << "\n";
  }

  accounts_.file = directory_ / "accounts.json";
  positions_.file = directory_ / "positions.json";
  orders_.file = directory_ / "orders.json";

  load(accounts_);
  load(positions_);
  load(orders_);
}

// -----------------------------------------------------------------------------
// load: read one collection file; missing or malformed means empty
// -----------------------------------------------------------------------------
void JsonFileDocumentStore::load(Collection& collection) {
  std::ifstream in(collection.file);
  if (!in) {
    return;
  }

  try {
    nlohmann::json parsed;
    in >> parsed;
    if (parsed.is_object()) {
      collection.documents = std::move(parsed);
    } else {
      std::cerr << "[JsonFileStore] WARNING: " << collection.file
                << " is not a JSON object. Starting empty.\n";
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[JsonFileStore] WARNING: cannot parse " << collection.file
              << ": " << e.what() << ". Starting empty.\n";
  }
}

// -----------------------------------------------------------------------------
// flush: write to <file>.tmp, then rename over the real file
// -----------------------------------------------------------------------------
bool JsonFileDocumentStore::flush(const Collection& collection) {
  std::filesystem::path tmp = collection.file;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      std::cerr << "[JsonFileStore] ERROR: cannot open " << tmp
                << " for writing.\n";
      return false;
    }
    out << collection.documents.dump(2);
    if (!out) {
      std::cerr << "[JsonFileStore] ERROR: write to " << tmp << " failed.\n";
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, collection.file, ec);
  if (ec) {
    std::cerr << "[JsonFileStore] ERROR: rename to " << collection.file
              << " failed: " << ec.message() << "\n";
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// upsert: replace-by-id then flush; caller holds mutex_
// -----------------------------------------------------------------------------
bool JsonFileDocumentStore::upsert(Collection& collection,
                                   const nlohmann::json& doc) {
  auto it = doc.find("id");
  if (it == doc.end() || !it->is_string()) {
    std::cerr << "[JsonFileStore] ERROR: document without string id.\n";
    return false;
  }
  collection.documents[it->get<std::string>()] = doc;
  return flush(collection);
}

bool JsonFileDocumentStore::saveAccount(const nlohmann::json& doc) {
  std::lock_guard lock(mutex_);
  return upsert(accounts_, doc);
}

std::optional<nlohmann::json> JsonFileDocumentStore::loadAccount(
    const std::string& id) {
  std::lock_guard lock(mutex_);
  auto it = accounts_.documents.find(id);
  if (it == accounts_.documents.end()) {
    return std::nullopt;
  }
  return *it;
}

bool JsonFileDocumentStore::savePosition(const nlohmann::json& doc) {
  std::lock_guard lock(mutex_);
  return upsert(positions_, doc);
}

std::vector<nlohmann::json> JsonFileDocumentStore::loadPositions(
    std::optional<domain::PositionStatus> status_filter) {
  std::lock_guard lock(mutex_);
  std::vector<nlohmann::json> result;
  for (const auto& doc : positions_.documents) {
    if (status_filter &&
        doc.value("status", std::string{}) != domain::toString(*status_filter)) {
      continue;
    }
    result.push_back(doc);
  }
  return result;
}

bool JsonFileDocumentStore::saveOrder(const nlohmann::json& doc) {
  std::lock_guard lock(mutex_);
  return upsert(orders_, doc);
}

// -----------------------------------------------------------------------------
// deleteAll: clear every collection and rewrite the (now empty) files
// -----------------------------------------------------------------------------
bool JsonFileDocumentStore::deleteAll() {
  std::lock_guard lock(mutex_);
  accounts_.documents = nlohmann::json::object();
  positions_.documents = nlohmann::json::object();
  orders_.documents = nlohmann::json::object();

  bool ok = flush(accounts_);
  ok = flush(positions_) && ok;
  ok = flush(orders_) && ok;
  return ok;
}

}  // namespace levtrade
