#pragma once

#include <string>
#include <unordered_map>

namespace levtrade {
namespace domain {

// symbol → latest price. One entry per symbol in a price-feed snapshot.
using PriceMap = std::unordered_map<std::string, double>;

}  // namespace domain
}  // namespace levtrade
