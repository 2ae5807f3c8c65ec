#pragma once

#include <iomanip>
#include <sstream>
#include <string>

namespace levtrade {

// Fixed-point rendering for reason strings and log lines
// (fixed(50.0, 2) == "50.00").
inline std::string fixed(double value, int precision = 2) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

}  // namespace levtrade
