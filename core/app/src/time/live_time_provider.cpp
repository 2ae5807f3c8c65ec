#include "levtrade/time/live_time_provider.hpp"

#include "levtrade/time/time_utils.hpp"

#include <chrono>

namespace levtrade {

std::int64_t LiveTimeProvider::now_ms() const {
  return toEpochMs(std::chrono::system_clock::now());
}

}  // namespace levtrade
