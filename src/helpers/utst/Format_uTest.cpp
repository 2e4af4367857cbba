/**
 * @file Format_uTest.cpp
 * @brief Unit tests for netmeter::helpers::format.
 */

#include "src/helpers/inc/Format.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using netmeter::helpers::format::formatBytes;
using netmeter::helpers::format::formatCompactSpeed;
using netmeter::helpers::format::formatSpeed;
using netmeter::helpers::format::formatUptime;
using netmeter::helpers::format::GIB;
using netmeter::helpers::format::KIB;
using netmeter::helpers::format::MIB;

/* ----------------------------- formatBytes ----------------------------- */

/** @test Values below one KiB print whole bytes. */
TEST(FormatBytesTest, Bytes) {
  EXPECT_EQ(formatBytes(512.0), "512 B");
  EXPECT_EQ(formatBytes(0.0), "0 B");
  EXPECT_EQ(formatBytes(std::uint64_t{1023}), "1023 B");
}

/** @test Exactly one KiB promotes to KB. */
TEST(FormatBytesTest, PromotesAtKibBoundary) {
  EXPECT_EQ(formatBytes(1024.0), "1.00 KB");
  EXPECT_EQ(formatBytes(std::uint64_t{1024}), "1.00 KB");
}

/** @test MiB and GiB scaling use two decimals. */
TEST(FormatBytesTest, LargerUnits) {
  EXPECT_EQ(formatBytes(1'572'864.0), "1.50 MB");
  EXPECT_EQ(formatBytes(MIB), "1.00 MB");
  EXPECT_EQ(formatBytes(GIB), "1.00 GB");
  EXPECT_EQ(formatBytes(std::uint64_t{5} * 1024 * 1024 * 1024), "5.00 GB");
}

/** @test Negative input clamps to zero. */
TEST(FormatBytesTest, NegativeClamps) { EXPECT_EQ(formatBytes(-5.0), "0 B"); }

/* ----------------------------- formatSpeed ----------------------------- */

/** @test Speed uses the same ladder with a /s suffix. */
TEST(FormatSpeedTest, Suffix) {
  EXPECT_EQ(formatSpeed(512.0), "512 B/s");
  EXPECT_EQ(formatSpeed(KIB), "1.00 KB/s");
  EXPECT_EQ(formatSpeed(1.5 * MIB), "1.50 MB/s");
  EXPECT_EQ(formatSpeed(GIB), "1.00 GB/s");
}

/* ----------------------------- formatCompactSpeed ----------------------------- */

/** @test Compact form uses a single unit letter. */
TEST(FormatCompactSpeedTest, Units) {
  EXPECT_EQ(formatCompactSpeed(1.5 * MIB), "1.50M");
  EXPECT_EQ(formatCompactSpeed(1.5 * MIB, true, true), "1.5M");
  EXPECT_EQ(formatCompactSpeed(2.0 * KIB, false), "2.00");
  EXPECT_EQ(formatCompactSpeed(100.0), "100.00B");
}

/* ----------------------------- formatUptime ----------------------------- */

/** @test Uptime prints HH:MM:SS without wrapping hours. */
TEST(FormatUptimeTest, HoursMinutesSeconds) {
  EXPECT_EQ(formatUptime(0.0), "00:00:00");
  EXPECT_EQ(formatUptime(59.9), "00:00:59");
  EXPECT_EQ(formatUptime(3661.0), "01:01:01");
  EXPECT_EQ(formatUptime(90000.0), "25:00:00");
  EXPECT_EQ(formatUptime(-3.0), "00:00:00");
}
