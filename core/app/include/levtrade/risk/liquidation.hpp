#pragma once

#include "levtrade/domain/position.hpp"

namespace levtrade {

// -----------------------------------------------------------------------------
// Liquidation estimate
// -----------------------------------------------------------------------------
//
// @brief  Approximate exchange liquidation price and the percentage move
//         left before it is reached.
//
// @details
//   margin_ratio = margin_used / (quantity * entry)
//   LONG   liq = entry * (1 - margin_ratio * kLiquidationMarginFactor)
//   SHORT  liq = entry * (1 + margin_ratio * kLiquidationMarginFactor)
//   distance   = |price - liq| / price * 100 on the safe side, floored at 0
//
// quantity is the exposed (remaining) quantity and entry the average entry.
// Unleveraged positions and positions without margin have no liquidation
// price; liquidationDistance() reports 100 for them.
//
// This is a heuristic, not any venue's maintenance-margin formula. Callers
// only depend on these two functions, so a real model can replace them.
// -----------------------------------------------------------------------------

constexpr double kLiquidationMarginFactor = 0.95;

// 0 when the position cannot be liquidated.
double liquidationPrice(const domain::Position& position);

double liquidationDistance(const domain::Position& position, double price);

}  // namespace levtrade
