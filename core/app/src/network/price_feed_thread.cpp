#include "levtrade/network/price_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace levtrade {

PriceFeedThread::PriceFeedThread(const ITimeProvider& clock,
                                 EventSink event_sink, std::string endpoint,
                                 std::chrono::milliseconds retry_delay)
    : clock_(clock),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)),
      retry_delay_(retry_delay) {}

PriceFeedThread::~PriceFeedThread() { stop(); }

std::unique_ptr<PriceFeedGateway> PriceFeedThread::connect() const {
  try {
    return std::make_unique<PriceFeedGateway>(clock_, event_sink_, endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[PriceFeedThread] Cannot connect to " << endpoint_ << ": "
              << e.what() << "\n";
    return nullptr;
  }
}

bool PriceFeedThread::start() {
  if (worker_.joinable()) {
    return true;
  }

  auto gateway = connect();
  if (!gateway) {
    return false;
  }
  {
    std::lock_guard lock(mutex_);
    gateway_ = std::move(gateway);
    stopping_ = false;
  }
  worker_ = std::thread([this] { run(); });
  return true;
}

void PriceFeedThread::stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    if (gateway_) {
      gateway_->stop();
    }
  }
  retry_cv_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
  std::lock_guard lock(mutex_);
  gateway_.reset();
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
// Only this thread replaces gateway_ while running; stop() reaches the
// current gateway under mutex_.
// -----------------------------------------------------------------------------
void PriceFeedThread::run() {
  std::cout << "[PriceFeedThread] listening on " << endpoint_ << "\n";

  while (true) {
    PriceFeedGateway* gateway = nullptr;
    {
      std::lock_guard lock(mutex_);
      if (stopping_) {
        break;
      }
      gateway = gateway_.get();
    }

    if (gateway && gateway->run()) {
      break;  // stopped
    }

    std::unique_lock lock(mutex_);
    gateway_.reset();
    std::cerr << "[PriceFeedThread] WARNING: feed lost, reconnecting in "
              << retry_delay_.count() << " ms\n";
    if (retry_cv_.wait_for(lock, retry_delay_, [this] { return stopping_; })) {
      break;
    }
    lock.unlock();

    auto fresh = connect();
    lock.lock();
    if (!stopping_) {
      gateway_ = std::move(fresh);
      if (gateway_) {
        ++reconnects_;
      }
    }
  }

  std::cout << "[PriceFeedThread] recv loop exited.\n";
}

std::uint64_t PriceFeedThread::reconnects() const {
  std::lock_guard lock(mutex_);
  return reconnects_;
}

}  // namespace levtrade
