#pragma once

#include "levtrade/concurrent/thread_safe_queue.hpp"
#include "levtrade/eventbus/event_bus.hpp"
#include "levtrade/events/event.hpp"

#include <atomic>
#include <cstdint>
#include <thread>

namespace levtrade {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its EventBus.
//
// TradingEngine uses a single instance as the "risk loop": price snapshots
// and monitor ticks are pushed from their own threads and handled here one
// at a time, in arrival order. That serialization gives the ordering
// guarantee that a snapshot's PnL recomputation finishes before any later
// monitor tick reads the positions.
//
// Thread model: start(), stop() and push() are safe from any thread. All
// EventBus callbacks of this loop run on the worker thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker if it is still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Spawns the worker. Idempotent.
  void start();

  // Interrupts the worker's wait and joins it. Events still queued stay
  // undelivered (their count is logged). Idempotent; start() may be called
  // again afterwards.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  bool running() const { return running_.load(); }

  // Events published so far by the worker.
  std::uint64_t dispatched() const { return dispatched_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dispatched_{0};
  std::thread worker_;
};

}  // namespace levtrade
