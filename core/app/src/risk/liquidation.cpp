#include "levtrade/risk/liquidation.hpp"

#include <algorithm>

namespace levtrade {

namespace {

bool liquidatable(const domain::Position& position) {
  return position.leverage > 1.0 && position.margin_used > 0.0 &&
         domain::effectiveQuantity(position) > 0.0 &&
         domain::averageEntry(position) > 0.0;
}

}  // namespace

double liquidationPrice(const domain::Position& position) {
  if (!liquidatable(position)) {
    return 0.0;
  }

  double entry = domain::averageEntry(position);
  double ratio =
      position.margin_used / (domain::effectiveQuantity(position) * entry);
  double move = ratio * kLiquidationMarginFactor;

  if (position.side == domain::PositionSide::Long) {
    return std::max(0.0, entry * (1.0 - move));
  }
  return entry * (1.0 + move);
}

double liquidationDistance(const domain::Position& position, double price) {
  if (!liquidatable(position) || price <= 0.0) {
    return 100.0;
  }

  double liq = liquidationPrice(position);
  double distance = position.side == domain::PositionSide::Long
                        ? (price - liq) / price * 100.0
                        : (liq - price) / price * 100.0;
  return std::max(0.0, distance);
}

}  // namespace levtrade
