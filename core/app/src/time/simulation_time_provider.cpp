#include "levtrade/time/simulation_time_provider.hpp"

namespace levtrade {

std::int64_t SimulationTimeProvider::now_ms() const {
  return sim_now_ms_.load();
}

void SimulationTimeProvider::set_time(std::int64_t epoch_ms) {
  sim_now_ms_.store(epoch_ms);
}

std::int64_t SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  return sim_now_ms_.fetch_add(delta_ms) + delta_ms;
}

}  // namespace levtrade
