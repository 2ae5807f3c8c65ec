#pragma once

#include "levtrade/events/event.hpp"
#include "levtrade/gateway/price_feed_gateway.hpp"
#include "levtrade/time/i_time_provider.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace levtrade {

// -----------------------------------------------------------------------------
// PriceFeedThread: dedicated I/O thread for the price feed
// -----------------------------------------------------------------------------
//
// @brief  Runs PriceFeedGateway's blocking recv loop on its own std::thread
//         so socket I/O never runs on the risk loop.
//
// @details
// The gateway is created in start(), not in the constructor, so no socket
// is opened until TradingEngine has hydrated its state and started the risk
// loop that will receive the snapshots. If the socket fails while running,
// the thread drops the gateway, waits retry_delay and connects a new one
// until stop() is called.
//
// Thread model:
//   start() and stop() are called from the owning thread (TradingEngine).
//   The internal thread runs PriceFeedGateway::run() only.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr; owns the gateway.
// -----------------------------------------------------------------------------
class PriceFeedThread {
 public:
  using EventSink = std::function<void(Event)>;

  PriceFeedThread(const ITimeProvider& clock, EventSink event_sink,
                  std::string endpoint,
                  std::chrono::milliseconds retry_delay =
                      std::chrono::milliseconds(1000));

  // Calls stop().
  ~PriceFeedThread();

  PriceFeedThread(const PriceFeedThread&) = delete;
  PriceFeedThread& operator=(const PriceFeedThread&) = delete;
  PriceFeedThread(PriceFeedThread&&) = delete;
  PriceFeedThread& operator=(PriceFeedThread&&) = delete;

  // Opens the socket and spawns the thread. No-op if already running.
  // Returns false if the socket could not be set up.
  bool start();

  // Idempotent. Blocks until the recv loop has exited.
  void stop();

  // Successful reconnects after a socket failure.
  std::uint64_t reconnects() const;

 private:
  std::unique_ptr<PriceFeedGateway> connect() const;
  void run();

  const ITimeProvider& clock_;
  EventSink event_sink_;
  std::string endpoint_;
  std::chrono::milliseconds retry_delay_;

  mutable std::mutex mutex_;  // gateway_, stopping_, reconnects_
  std::condition_variable retry_cv_;
  std::unique_ptr<PriceFeedGateway> gateway_;
  bool stopping_{false};
  std::uint64_t reconnects_{0};
  std::thread worker_;
};

}  // namespace levtrade
