#pragma once

#include "levtrade/events/event.hpp"
#include "levtrade/events/event_types.hpp"
#include "levtrade/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace levtrade {

// -----------------------------------------------------------------------------
// PriceFeedGateway: ZeroMQ subscriber for price snapshots
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON price snapshots and pushes
//         each one into the engine as a PriceSnapshotEvent.
//
// @details
// Accepted payloads:
//   { "timestamp_ms": 1700000000000,
//     "prices": { "BTCUSD": { "price": 50000.0 }, "ETHUSD": { "price": 3000 } } }
// or the bare symbol map
//   { "BTCUSD": { "price": 50000.0 } }
// A symbol may also map straight to a number. Entries without a positive
// price are dropped; a snapshot with no usable entries is ignored.
// Missing timestamps are filled from the time provider.
//
// Thread model:
//   run() blocks; call it from a dedicated thread (PriceFeedThread). stop()
//   may be called from any thread, even before run() starts, and is noticed
//   within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq context and socket. Borrows the time provider.
// -----------------------------------------------------------------------------
class PriceFeedGateway {
 public:
  using EventSink = std::function<void(Event)>;

  PriceFeedGateway(const ITimeProvider& clock, EventSink event_sink,
                   const std::string& endpoint);

  ~PriceFeedGateway() = default;

  PriceFeedGateway(const PriceFeedGateway&) = delete;
  PriceFeedGateway& operator=(const PriceFeedGateway&) = delete;
  PriceFeedGateway(PriceFeedGateway&&) = delete;
  PriceFeedGateway& operator=(PriceFeedGateway&&) = delete;

  // Receives until stop(). Returns false if the socket failed first.
  bool run();

  // Sticky: a stopped gateway is not restarted.
  void stop();

  // -------------------------------------------------------------------------
  // decodeSnapshot(payload)
  // -------------------------------------------------------------------------
  // Parses one payload into a snapshot. timestamp_ms is 0 when the payload
  // carries none. Returns nullopt for malformed JSON or when no entry has a
  // usable price. Never throws.
  // -------------------------------------------------------------------------
  static std::optional<PriceSnapshotEvent> decodeSnapshot(
      const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  const ITimeProvider& clock_;
  EventSink event_sink_;
  std::uint64_t next_sequence_{1};

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stop_requested_{false};
};

}  // namespace levtrade
