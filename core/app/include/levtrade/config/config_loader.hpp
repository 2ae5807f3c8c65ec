#pragma once

#include "levtrade/domain/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// engineConfigFromJson(json)
// -----------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from a parsed JSON object.
//
// @details
// Expected layout mirrors EngineConfig's groups:
//   {
//     "account":        { "initial_balance": 10000, ... },
//     "fees":           { "trading_fee_pct": 0.001, ... },
//     "protection":     { ... },
//     "sizing":         { ... },
//     "pyramiding":     { "enabled": true, ... },
//     "trailing":       { ... },
//     "position_risk":  { "critical": { "margin_pct": 90, ... }, ... },
//     "portfolio_risk": { ... },
//     "runtime":        { "monitor_interval_ms": 5000, ... }
//   }
// Absent groups and keys keep their defaults.
//
// @throws std::runtime_error if a present key has the wrong JSON type or a
//         value is out of range (e.g. non-positive balance or leverage).
// -----------------------------------------------------------------------------
domain::EngineConfig engineConfigFromJson(const nlohmann::json& json);

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
//
// @brief  Reads and parses a JSON configuration file.
//
// @throws std::runtime_error if the file cannot be opened, is not valid
//         JSON, or fails engineConfigFromJson().
// -----------------------------------------------------------------------------
domain::EngineConfig loadEngineConfig(const std::string& path);

}  // namespace levtrade
