#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// IdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Lock-free source of "<prefix>-<n>" identifiers (e.g. "pos-7").
//
// @details
// TradeExecutor owns one per entity kind (positions, trade requests). After
// hydrating persisted positions it calls observe() with every loaded id so
// that newly issued ids never collide with history.
//
// Thread model: next() and observe() may be called from any thread.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::string next() {
    return prefix_ + "-" +
           std::to_string(next_id_.fetch_add(1, std::memory_order_relaxed));
  }

  // Advances the counter past `id` if it was issued with this prefix.
  void observe(const std::string& id) {
    if (id.size() <= prefix_.size() + 1 ||
        id.compare(0, prefix_.size(), prefix_) != 0 ||
        id[prefix_.size()] != '-') {
      return;
    }
    std::uint64_t value = 0;
    for (std::size_t i = prefix_.size() + 1; i < id.size(); ++i) {
      char c = id[i];
      if (c < '0' || c > '9') {
        return;
      }
      value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }

    std::uint64_t current = next_id_.load();
    while (current <= value &&
           !next_id_.compare_exchange_weak(current, value + 1)) {
    }
  }

  void reset() { next_id_.store(1); }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace levtrade
