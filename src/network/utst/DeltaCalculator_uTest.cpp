/**
 * @file DeltaCalculator_uTest.cpp
 * @brief Unit tests for netmeter::network counter deltas.
 */

#include "src/network/inc/DeltaCalculator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using netmeter::network::computeDelta;
using netmeter::network::counterDelta;
using netmeter::network::CounterDelta;
using netmeter::network::CounterState;

/* ----------------------------- counterDelta ----------------------------- */

/** @test Monotonic growth yields the difference. */
TEST(CounterDeltaTest, NormalGrowth) {
  EXPECT_EQ(counterDelta(1500, 1000), 500U);
  EXPECT_EQ(counterDelta(1000, 1000), 0U);
  EXPECT_EQ(counterDelta(1, 0), 1U);
}

/** @test A decreased counter counts its whole current value. */
TEST(CounterDeltaTest, ResetUsesCurrent) {
  EXPECT_EQ(counterDelta(200, 1000), 200U);
  EXPECT_EQ(counterDelta(0, 1000), 0U);
}

/** @test Wraparound at 2^64 reads as a reset (known approximation). */
TEST(CounterDeltaTest, WrapReadsAsReset) {
  const std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();
  EXPECT_EQ(counterDelta(10, MAX - 5), 10U);
}

/** @test counterDelta is usable in constant expressions. */
TEST(CounterDeltaTest, Constexpr) {
  static_assert(counterDelta(10, 4) == 6);
  static_assert(counterDelta(4, 10) == 4);
  SUCCEED();
}

/* ----------------------------- CounterState ----------------------------- */

/** @test advance() diffs against the stored pair and stores the new one. */
TEST(CounterStateTest, AdvanceStoresReadings) {
  CounterState s;
  s.seed(100, 1000);

  const CounterDelta D1 = computeDelta(s, 150, 1300);
  EXPECT_EQ(D1.uploaded, 50U);
  EXPECT_EQ(D1.downloaded, 300U);
  EXPECT_EQ(s.previousUpload, 150U);
  EXPECT_EQ(s.previousDownload, 1300U);

  const CounterDelta D2 = s.advance(150, 1300);
  EXPECT_EQ(D2.uploaded, 0U);
  EXPECT_EQ(D2.downloaded, 0U);
}

/** @test Directions are independent; one may reset while the other grows. */
TEST(CounterStateTest, IndependentDirections) {
  CounterState s;
  s.seed(5000, 100);

  const CounterDelta D = s.advance(20, 400);
  EXPECT_EQ(D.uploaded, 20U);
  EXPECT_EQ(D.downloaded, 300U);
}
