#include "levtrade/gateway/price_feed_gateway.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <utility>

namespace levtrade {

namespace {

// A symbol entry is either {"price": p} or a bare number.
std::optional<double> entryPrice(const nlohmann::json& entry) {
  double price = 0.0;
  if (entry.is_number()) {
    price = entry.get<double>();
  } else if (entry.is_object()) {
    auto it = entry.find("price");
    if (it == entry.end() || !it->is_number()) {
      return std::nullopt;
    }
    price = it->get<double>();
  } else {
    return std::nullopt;
  }
  if (!std::isfinite(price) || price <= 0.0) {
    return std::nullopt;
  }
  return price;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, bounded recv
// -----------------------------------------------------------------------------
PriceFeedGateway::PriceFeedGateway(const ITimeProvider& clock,
                                   EventSink event_sink,
                                   const std::string& endpoint)
    : clock_(clock), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  // Bounded recv so run() can observe stop().
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// decodeSnapshot
// -----------------------------------------------------------------------------
std::optional<PriceSnapshotEvent> PriceFeedGateway::decodeSnapshot(
    const std::string& payload) {
  nlohmann::json doc =
      nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) {
    return std::nullopt;
  }

  PriceSnapshotEvent snapshot;
  const nlohmann::json* prices = &doc;

  auto ts = doc.find("timestamp_ms");
  if (ts != doc.end() && ts->is_number_integer()) {
    snapshot.timestamp_ms = ts->get<std::int64_t>();
  }
  auto nested = doc.find("prices");
  if (nested != doc.end()) {
    if (!nested->is_object()) {
      return std::nullopt;
    }
    prices = &*nested;
  }

  for (auto it = prices->begin(); it != prices->end(); ++it) {
    if (prices == &doc && it.key() == "timestamp_ms") {
      continue;
    }
    if (auto price = entryPrice(it.value())) {
      snapshot.prices[it.key()] = *price;
    }
  }

  if (snapshot.prices.empty()) {
    return std::nullopt;
  }
  return snapshot;
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
bool PriceFeedGateway::run() {
  while (!stop_requested_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      std::cerr << "[PriceFeedGateway] recv failed: " << e.what() << "\n";
      return false;
    }
    if (!result.has_value()) {
      continue;  // timeout
    }

    std::string payload = msg.to_string();
    std::optional<PriceSnapshotEvent> snapshot = decodeSnapshot(payload);
    if (!snapshot) {
      std::cerr << "[PriceFeedGateway] Ignoring undecodable payload: "
                << payload << "\n";
      continue;
    }

    if (snapshot->timestamp_ms == 0) {
      snapshot->timestamp_ms = clock_.now_ms();
    }
    snapshot->sequence_id = next_sequence_++;
    event_sink_(std::move(*snapshot));
  }
  return true;
}

void PriceFeedGateway::stop() { stop_requested_.store(true); }

}  // namespace levtrade
