#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace levtrade {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  Unbounded multi-producer / multi-consumer FIFO.
//
// @details
// Carries Event values into an EventLoopThread: the price feed thread and
// the monitor ticker push, the loop thread pops. FIFO order is what lets a
// price snapshot pushed before a monitor tick be applied before that tick
// is evaluated.
//
// A consumer that must also react to shutdown waits with pop_for(); the
// owner calls interrupt() to release every such waiter without pushing a
// value.
//
// Thread model: every member is safe to call from any thread.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on mutex_.
    condition_.notify_one();
  }

  // Blocks until an element is available.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Non-blocking; std::nullopt when empty.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Waits up to `timeout` for an element. std::nullopt on timeout or when
  // interrupt() is called while waiting.
  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    const std::uint64_t seen = interrupts_;
    condition_.wait_for(lock, timeout, [this, seen] {
      return !queue_.empty() || interrupts_ != seen;
    });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  void interrupt() {
    {
      std::lock_guard lock(mutex_);
      ++interrupts_;
    }
    condition_.notify_all();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  std::uint64_t interrupts_{0};
};

}  // namespace levtrade
