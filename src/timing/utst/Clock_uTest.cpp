/**
 * @file Clock_uTest.cpp
 * @brief Unit tests for netmeter::timing clocks and day helpers.
 */

#include "src/timing/inc/Clock.hpp"

#include <gtest/gtest.h>

#include <chrono>

using netmeter::timing::Day;
using netmeter::timing::formatDay;
using netmeter::timing::getMonotonicNs;
using netmeter::timing::localDay;
using netmeter::timing::ManualClock;
using netmeter::timing::parseDay;
using netmeter::timing::SystemClock;

namespace {

Day ymd(int y, unsigned m, unsigned d) {
  return Day{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

} // namespace

/* ----------------------------- Monotonic ----------------------------- */

/** @test Monotonic time never goes backwards. */
TEST(ClockTest, MonotonicNonDecreasing) {
  const std::uint64_t A = getMonotonicNs();
  const std::uint64_t B = getMonotonicNs();
  EXPECT_GT(A, 0U);
  EXPECT_GE(B, A);

  SystemClock clock;
  EXPECT_GE(clock.monotonicNs(), B);
}

/** @test SystemClock::today matches localDay of now. */
TEST(ClockTest, SystemToday) {
  SystemClock clock;
  const Day EXPECTED = localDay(std::chrono::system_clock::now());
  const Day GOT = clock.today();
  // Allow a midnight rollover between the two reads.
  EXPECT_LE((GOT - EXPECTED).count(), 1);
  EXPECT_GE((GOT - EXPECTED).count(), 0);
}

/* ----------------------------- ManualClock ----------------------------- */

/** @test advance() moves monotonic and wall time together. */
TEST(ManualClockTest, Advance) {
  ManualClock clock;
  const std::uint64_t MONO = clock.monotonicNs();
  const auto WALL = clock.wallNow();

  clock.advance(std::chrono::milliseconds(1500));
  EXPECT_EQ(clock.monotonicNs() - MONO, 1'500'000'000ULL);
  EXPECT_EQ(clock.wallNow() - WALL, std::chrono::milliseconds(1500));
}

/** @test Non-positive advances are ignored. */
TEST(ManualClockTest, IgnoresNegative) {
  ManualClock clock;
  const std::uint64_t MONO = clock.monotonicNs();
  clock.advance(std::chrono::seconds(-5));
  clock.advance(std::chrono::nanoseconds(0));
  EXPECT_EQ(clock.monotonicNs(), MONO);
}

/** @test Crossing local midnight changes today(). */
TEST(ManualClockTest, DayRollover) {
  ManualClock clock;
  const Day START = clock.today();
  clock.advance(std::chrono::hours(24));
  EXPECT_EQ(clock.today(), START + std::chrono::days(1));
}

/* ----------------------------- formatDay / parseDay ----------------------------- */

/** @test formatDay pads to YYYY-MM-DD. */
TEST(DayFormatTest, Format) {
  EXPECT_EQ(formatDay(ymd(2024, 3, 7)), "2024-03-07");
  EXPECT_EQ(formatDay(ymd(1999, 12, 31)), "1999-12-31");
}

/** @test parseDay accepts valid dates including leap days. */
TEST(DayFormatTest, ParseValid) {
  Day d{};
  ASSERT_TRUE(parseDay("2024-02-29", d));
  EXPECT_EQ(d, ymd(2024, 2, 29));
  ASSERT_TRUE(parseDay("2000-01-01", d));
  EXPECT_EQ(formatDay(d), "2000-01-01");
}

/** @test parseDay rejects malformed or impossible dates and leaves out untouched. */
TEST(DayFormatTest, ParseInvalid) {
  const Day SENTINEL = ymd(2020, 1, 1);
  Day d = SENTINEL;
  for (const char* text : {"", "2024-2-29", "2023-02-29", "2024-13-01", "2024-00-10",
                           "2024-01-32", "2024/01/01", "abcd-ef-gh", "2024-01-01x"}) {
    EXPECT_FALSE(parseDay(text, d)) << text;
  }
  EXPECT_EQ(d, SENTINEL);
}
