/**
 * @file EventLoop_uTest.cpp
 * @brief Unit tests for netmeter::timing::EventLoop.
 *
 * Notes:
 *  - Timing assertions use generous bounds; CI hosts may be loaded.
 */

#include "src/timing/inc/EventLoop.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using netmeter::timing::EventLoop;
using netmeter::timing::INVALID_TIMER;
using netmeter::timing::TimerId;

/** @test The loop creates its descriptors. */
TEST(EventLoopTest, Valid) {
  EventLoop loop;
  EXPECT_TRUE(loop.valid());
  EXPECT_EQ(loop.timerCount(), 0U);
}

/** @test Invalid intervals and empty callbacks are rejected. */
TEST(EventLoopTest, RejectsBadTimer) {
  EventLoop loop;
  EXPECT_EQ(loop.addTimer(0, [] {}), INVALID_TIMER);
  EXPECT_EQ(loop.addTimer(-10, [] {}), INVALID_TIMER);
  EXPECT_EQ(loop.addTimer(10, nullptr), INVALID_TIMER);
  EXPECT_EQ(loop.timerCount(), 0U);
}

/** @test A periodic timer fires repeatedly within runFor. */
TEST(EventLoopTest, PeriodicTimerFires) {
  EventLoop loop;
  int fired = 0;
  const TimerId ID = loop.addTimer(10, [&] { ++fired; });
  ASSERT_NE(ID, INVALID_TIMER);
  EXPECT_EQ(loop.timerCount(), 1U);

  loop.runFor(std::chrono::milliseconds(120));
  EXPECT_GE(fired, 3);
}

/** @test A cancelled timer does not fire again. */
TEST(EventLoopTest, CancelStopsTimer) {
  EventLoop loop;
  int fired = 0;
  const TimerId ID = loop.addTimer(10, [&] { ++fired; });
  ASSERT_NE(ID, INVALID_TIMER);

  loop.runFor(std::chrono::milliseconds(50));
  EXPECT_TRUE(loop.cancelTimer(ID));
  const int SNAPSHOT = fired;

  loop.runFor(std::chrono::milliseconds(50));
  EXPECT_EQ(fired, SNAPSHOT);
  EXPECT_FALSE(loop.cancelTimer(ID));
  EXPECT_EQ(loop.timerCount(), 0U);
}

/** @test A timer may cancel itself from its own callback. */
TEST(EventLoopTest, SelfCancel) {
  EventLoop loop;
  int fired = 0;
  TimerId id = INVALID_TIMER;
  id = loop.addTimer(5, [&] {
    ++fired;
    loop.cancelTimer(id);
  });
  ASSERT_NE(id, INVALID_TIMER);

  loop.runFor(std::chrono::milliseconds(60));
  EXPECT_EQ(fired, 1);
}

/** @test Posted tasks run in order on the loop thread. */
TEST(EventLoopTest, PostRunsOnLoopThread) {
  EventLoop loop;
  std::vector<int> order;
  bool onLoop = false;

  loop.post([&] { order.push_back(1); });
  loop.post([&] {
    order.push_back(2);
    onLoop = loop.isLoopThread();
  });
  loop.runFor(std::chrono::milliseconds(20));

  ASSERT_EQ(order.size(), 2U);
  EXPECT_EQ(order[0], 1);
  EXPECT_EQ(order[1], 2);
  EXPECT_TRUE(onLoop);
  EXPECT_FALSE(loop.isLoopThread());
}

/** @test post() from another thread wakes a blocked run() and stop() ends it. */
TEST(EventLoopTest, CrossThreadPostAndStop) {
  EventLoop loop;
  std::atomic<bool> ran{false};

  std::thread poster([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    loop.post([&] {
      ran.store(true);
      loop.stop();
    });
  });

  loop.run();
  poster.join();
  EXPECT_TRUE(ran.load());
}

/** @test stop() before runFor's budget ends returns early. */
TEST(EventLoopTest, StopEndsRunFor) {
  EventLoop loop;
  loop.post([&] { loop.stop(); });

  const auto START = std::chrono::steady_clock::now();
  loop.runFor(std::chrono::seconds(5));
  EXPECT_LT(std::chrono::steady_clock::now() - START, std::chrono::seconds(2));
}
