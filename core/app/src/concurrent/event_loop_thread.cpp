#include "levtrade/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>

namespace levtrade {

namespace {

// Upper bound on one wait; interrupt() normally wakes the worker sooner.
constexpr auto kPollSlice = std::chrono::milliseconds(50);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (worker_.joinable()) {
    return;
  }
  running_.store(true);
  worker_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!worker_.joinable()) {
    return;
  }
  running_.store(false);
  queue_.interrupt();
  worker_.join();

  const std::size_t dropped = queue_.size();
  if (dropped > 0) {
    std::cout << "[EventLoop] Stopped with " << dropped
              << " undelivered event(s)\n";
  }
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
// Each event is published to completion before the next is taken, so
// subscribers never overlap on this loop.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    auto next = queue_.pop_for(kPollSlice);
    if (!next || !running_.load()) {
      continue;
    }
    bus_.publish(*next);
    dispatched_.fetch_add(1);
  }
}

}  // namespace levtrade
