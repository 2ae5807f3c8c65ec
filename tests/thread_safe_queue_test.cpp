// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for levtrade::ThreadSafeQueue<T> and levtrade::EventLoopThread.
//
// Validates:
//   - FIFO order of price snapshots; try_pop() on empty
//   - Blocking pop() wakes on push
//   - Multi-producer pushes are delivered exactly once
//   - pop_for() times out on an empty queue and returns early on interrupt()
//   - EventLoopThread dispatches queued events on its worker thread, in
//     submission order, and stop() is idempotent
//
// Threading model:
//   Every spawned thread is joined before assertions.
// =============================================================================

#include "levtrade/concurrent/event_loop_thread.hpp"
#include "levtrade/concurrent/thread_safe_queue.hpp"
#include "levtrade/events/event_types.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace {

// Polls `pred` until true or the timeout expires.
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout =
                            std::chrono::milliseconds(2000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

}  // namespace

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  levtrade::ThreadSafeQueue<levtrade::PriceSnapshotEvent> queue;
};

// -----------------------------------------------------------------------------
// 1. Snapshots come out in the order they went in.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.try_pop().has_value());

  for (std::uint64_t seq = 1; seq <= 50; ++seq) {
    levtrade::PriceSnapshotEvent e;
    e.sequence_id = seq;
    queue.push(e);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (std::uint64_t seq = 1; seq <= 50; ++seq) {
    EXPECT_EQ(queue.pop().sequence_id, seq);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. pop() blocks until a producer pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<std::uint64_t> received{0};
  std::thread consumer([this, &received] { received = queue.pop().sequence_id; });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), 0u);

  levtrade::PriceSnapshotEvent e;
  e.sequence_id = 7;
  queue.push(e);
  consumer.join();

  EXPECT_EQ(received.load(), 7u);
}

// -----------------------------------------------------------------------------
// 3. Several producers, one consumer: every item arrives exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, MultipleProducers) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        levtrade::PriceSnapshotEvent e;
        e.sequence_id = static_cast<std::uint64_t>(p * kPerProducer + i);
        queue.push(e);
      }
    });
  }

  std::vector<std::uint64_t> seen;
  while (seen.size() < static_cast<std::size_t>(kProducers * kPerProducer)) {
    seen.push_back(queue.pop().sequence_id);
  }
  for (auto& t : producers) {
    t.join();
  }

  std::sort(seen.begin(), seen.end());
  for (std::size_t i = 0; i < seen.size(); ++i) {
    ASSERT_EQ(seen[i], i);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 4. pop_for() gives up on timeout, and interrupt() releases a waiter.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TimedPopAndInterrupt) {
  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(5)).has_value());

  levtrade::PriceSnapshotEvent e;
  e.sequence_id = 3;
  queue.push(e);
  auto got = queue.pop_for(std::chrono::milliseconds(5));
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->sequence_id, 3u);

  std::atomic<bool> returned{false};
  auto started = std::chrono::steady_clock::now();
  std::thread waiter([this, &returned] {
    EXPECT_FALSE(queue.pop_for(std::chrono::seconds(10)).has_value());
    returned = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.interrupt();
  waiter.join();

  EXPECT_TRUE(returned.load());
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

// -----------------------------------------------------------------------------
// 5. EventLoopThread dispatches on its own thread, in order.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DispatchesInOrderOnWorker) {
  levtrade::EventLoopThread loop;
  std::mutex m;
  std::vector<std::uint64_t> order;
  std::thread::id worker_id;

  loop.eventBus().subscribe<levtrade::PriceSnapshotEvent>(
      [&](const levtrade::PriceSnapshotEvent& e) {
        std::lock_guard lock(m);
        order.push_back(e.sequence_id);
        worker_id = std::this_thread::get_id();
      });
  loop.eventBus().subscribe<levtrade::MonitorTickEvent>(
      [&](const levtrade::MonitorTickEvent& e) {
        std::lock_guard lock(m);
        order.push_back(1000 + e.sequence_id);
      });

  loop.start();
  EXPECT_TRUE(loop.running());

  for (std::uint64_t seq = 1; seq <= 3; ++seq) {
    levtrade::PriceSnapshotEvent snap;
    snap.sequence_id = seq;
    loop.push(snap);
    levtrade::MonitorTickEvent tick;
    tick.sequence_id = seq;
    loop.push(tick);
  }

  ASSERT_TRUE(waitFor([&] {
    std::lock_guard lock(m);
    return order.size() == 6;
  }));
  EXPECT_TRUE(waitFor([&] { return loop.dispatched() == 6u; }));
  loop.stop();
  loop.stop();
  EXPECT_FALSE(loop.running());

  std::vector<std::uint64_t> expected{1, 1001, 2, 1002, 3, 1003};
  EXPECT_EQ(order, expected);
  EXPECT_NE(worker_id, std::this_thread::get_id());
}
