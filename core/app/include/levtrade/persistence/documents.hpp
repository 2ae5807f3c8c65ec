#pragma once

#include "levtrade/domain/account.hpp"
#include "levtrade/domain/position.hpp"
#include "levtrade/domain/trade_request.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// Document codecs
// -----------------------------------------------------------------------------
//
// @brief  Conversions between domain structs and the flat JSON documents
//         handed to IPersistenceGateway.
//
// @details
// Encoding rules:
//   - Every domain field becomes a key of the same name.
//   - Enums are lowercase strings ("long", "open", ...); TradeSignal keeps
//     its upper-case wire form ("BUY"/"SELL"/"WAIT").
//   - Times are int64 epoch milliseconds (*_time_ms keys).
//   - "last_updated" is an ISO-8601 UTC stamp of `now_ms`. It is written on
//     encode and ignored on decode.
//
// Decoding is tolerant of missing optional keys (older documents without
// pyramiding/trailing fields decode with those fields at their defaults)
// but strict about identity: "id", "symbol", "side" and "status" must be
// present and valid for a position, "id" for an account. Malformed
// documents decode to std::nullopt and the reason is logged to std::cerr.
//
// Thread-safety: Stateless free functions.
// -----------------------------------------------------------------------------

nlohmann::json toDocument(const domain::Position& position, std::int64_t now_ms);
nlohmann::json toDocument(const domain::Account& account, std::int64_t now_ms);

// Trade requests are persisted as "orders" (audit trail only).
nlohmann::json toDocument(const domain::TradeRequest& request,
                          std::int64_t now_ms);

std::optional<domain::Position> positionFromDocument(const nlohmann::json& doc);
std::optional<domain::Account> accountFromDocument(const nlohmann::json& doc);

std::optional<domain::PositionSide> parsePositionSide(const std::string& text);
std::optional<domain::PositionStatus> parsePositionStatus(
    const std::string& text);

}  // namespace levtrade
