#include "levtrade/persistence/documents.hpp"
#include "levtrade/time/time_utils.hpp"

#include <iostream>

namespace levtrade {

// -----------------------------------------------------------------------------
// Enum parsing
// -----------------------------------------------------------------------------
std::optional<domain::PositionSide> parsePositionSide(const std::string& text) {
  if (text == "long") {
    return domain::PositionSide::Long;
  }
  if (text == "short") {
    return domain::PositionSide::Short;
  }
  return std::nullopt;
}

std::optional<domain::PositionStatus> parsePositionStatus(
    const std::string& text) {
  if (text == "open") {
    return domain::PositionStatus::Open;
  }
  if (text == "closed") {
    return domain::PositionStatus::Closed;
  }
  if (text == "pending") {
    return domain::PositionStatus::Pending;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// toDocument(Position)
// -----------------------------------------------------------------------------
nlohmann::json toDocument(const domain::Position& p, std::int64_t now_ms) {
  nlohmann::json doc;
  doc["id"] = p.id;
  doc["symbol"] = p.symbol;
  doc["side"] = domain::toString(p.side);
  doc["status"] = domain::toString(p.status);
  doc["entry_price"] = p.entry_price;
  doc["exit_price"] = p.exit_price;
  doc["last_price"] = p.last_price;
  doc["quantity"] = p.quantity;
  doc["leverage"] = p.leverage;
  doc["margin_used"] = p.margin_used;
  doc["trading_fee"] = p.trading_fee;
  doc["stop_loss"] = p.stop_loss;
  doc["target"] = p.target;
  doc["invested_amount"] = p.invested_amount;
  doc["pnl"] = p.pnl;
  doc["pnl_percentage"] = p.pnl_percentage;
  doc["entry_time_ms"] = p.entry_time_ms;
  doc["exit_time_ms"] = p.exit_time_ms;
  doc["strategy"] = p.strategy;
  doc["confidence"] = p.confidence;
  doc["notes"] = p.notes;

  doc["original_quantity"] = p.original_quantity;
  doc["total_quantity"] = p.total_quantity;
  doc["average_entry_price"] = p.average_entry_price;
  doc["pyramid_count"] = p.pyramid_count;

  doc["remaining_quantity"] = p.remaining_quantity;
  doc["trailing_count"] = p.trailing_count;
  doc["realized_pnl"] = p.realized_pnl;
  doc["unrealized_pnl"] = p.unrealized_pnl;
  doc["average_exit_price"] = p.average_exit_price;

  doc["last_updated"] = iso8601Utc(now_ms);
  return doc;
}

// -----------------------------------------------------------------------------
// toDocument(Account)
// -----------------------------------------------------------------------------
nlohmann::json toDocument(const domain::Account& a, std::int64_t now_ms) {
  nlohmann::json doc;
  doc["id"] = a.id;
  doc["initial_balance"] = a.initial_balance;
  doc["current_balance"] = a.current_balance;
  doc["daily_trades_limit"] = a.daily_trades_limit;
  doc["daily_trades_count"] = a.daily_trades_count;
  doc["max_leverage"] = a.max_leverage;
  doc["total_margin_used"] = a.total_margin_used;
  doc["brokerage_charges"] = a.brokerage_charges;
  doc["realized_pnl"] = a.realized_pnl;
  doc["total_profit"] = a.total_profit;
  doc["total_loss"] = a.total_loss;
  doc["total_trades"] = a.total_trades;
  doc["profitable_trades"] = a.profitable_trades;
  doc["losing_trades"] = a.losing_trades;
  doc["win_rate"] = a.win_rate;
  doc["last_trade_date"] = a.last_trade_date;
  doc["last_updated"] = iso8601Utc(now_ms);
  return doc;
}

// -----------------------------------------------------------------------------
// toDocument(TradeRequest)
// -----------------------------------------------------------------------------
nlohmann::json toDocument(const domain::TradeRequest& r, std::int64_t now_ms) {
  nlohmann::json doc;
  doc["id"] = r.id;
  doc["symbol"] = r.symbol;
  doc["signal"] = domain::toString(r.signal);
  doc["price"] = r.price;
  doc["quantity"] = r.quantity;
  doc["leverage"] = r.leverage;
  doc["strategy"] = r.strategy;
  doc["confidence"] = r.confidence;
  doc["status"] = domain::toString(r.status);
  doc["error_reason"] = r.error_reason;
  doc["position_id"] = r.position_id;
  doc["last_updated"] = iso8601Utc(now_ms);
  return doc;
}

// -----------------------------------------------------------------------------
// positionFromDocument
// -----------------------------------------------------------------------------
std::optional<domain::Position> positionFromDocument(const nlohmann::json& doc) {
  try {
    domain::Position p;
    p.id = doc.at("id").get<std::string>();
    p.symbol = doc.at("symbol").get<std::string>();

    auto side = parsePositionSide(doc.at("side").get<std::string>());
    auto status = parsePositionStatus(doc.at("status").get<std::string>());
    if (!side || !status) {
      std::cerr << "[Documents] Position " << p.id
                << " has an unknown side or status. Skipping.\n";
      return std::nullopt;
    }
    p.side = *side;
    p.status = *status;

    p.entry_price = doc.value("entry_price", 0.0);
    p.exit_price = doc.value("exit_price", 0.0);
    p.last_price = doc.value("last_price", 0.0);
    p.quantity = doc.value("quantity", 0.0);
    p.leverage = doc.value("leverage", 1.0);
    p.margin_used = doc.value("margin_used", 0.0);
    p.trading_fee = doc.value("trading_fee", 0.0);
    p.stop_loss = doc.value("stop_loss", 0.0);
    p.target = doc.value("target", 0.0);
    p.invested_amount = doc.value("invested_amount", 0.0);
    p.pnl = doc.value("pnl", 0.0);
    p.pnl_percentage = doc.value("pnl_percentage", 0.0);
    p.entry_time_ms = doc.value("entry_time_ms", std::int64_t{0});
    p.exit_time_ms = doc.value("exit_time_ms", std::int64_t{0});
    p.strategy = doc.value("strategy", std::string{});
    p.confidence = doc.value("confidence", 0.0);
    p.notes = doc.value("notes", std::string{});

    p.original_quantity = doc.value("original_quantity", p.quantity);
    p.total_quantity = doc.value("total_quantity", p.quantity);
    p.average_entry_price = doc.value("average_entry_price", p.entry_price);
    p.pyramid_count = doc.value("pyramid_count", 0);

    p.remaining_quantity = doc.value("remaining_quantity", 0.0);
    p.trailing_count = doc.value("trailing_count", 0);
    p.realized_pnl = doc.value("realized_pnl", 0.0);
    p.unrealized_pnl = doc.value("unrealized_pnl", 0.0);
    p.average_exit_price = doc.value("average_exit_price", 0.0);
    return p;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[Documents] Malformed position document: " << e.what()
              << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// accountFromDocument
// -----------------------------------------------------------------------------
std::optional<domain::Account> accountFromDocument(const nlohmann::json& doc) {
  try {
    domain::Account a;
    a.id = doc.at("id").get<std::string>();
    a.initial_balance = doc.value("initial_balance", 0.0);
    a.current_balance = doc.value("current_balance", 0.0);
    a.daily_trades_limit = doc.value("daily_trades_limit", 0);
    a.daily_trades_count = doc.value("daily_trades_count", 0);
    a.max_leverage = doc.value("max_leverage", 1.0);
    a.total_margin_used = doc.value("total_margin_used", 0.0);
    a.brokerage_charges = doc.value("brokerage_charges", 0.0);
    a.realized_pnl = doc.value("realized_pnl", 0.0);
    a.total_profit = doc.value("total_profit", 0.0);
    a.total_loss = doc.value("total_loss", 0.0);
    a.total_trades = doc.value("total_trades", 0);
    a.profitable_trades = doc.value("profitable_trades", 0);
    a.losing_trades = doc.value("losing_trades", 0);
    a.win_rate = doc.value("win_rate", 0.0);
    a.last_trade_date = doc.value("last_trade_date", std::string{});
    return a;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[Documents] Malformed account document: " << e.what()
              << "\n";
    return std::nullopt;
  }
}

}  // namespace levtrade
