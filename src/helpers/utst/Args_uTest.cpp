/**
 * @file Args_uTest.cpp
 * @brief Unit tests for netmeter::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <string_view>

using netmeter::helpers::args::ArgMap;
using netmeter::helpers::args::parseArgs;
using netmeter::helpers::args::parseInt;
using netmeter::helpers::args::ParsedArgs;

namespace {

enum Key : std::uint8_t { HELP = 0, COUNT = 1, DIR = 2 };

ArgMap makeMap() {
  ArgMap map;
  map[HELP] = {"--help", 0, false, "Show help"};
  map[COUNT] = {"--count", 1, false, "Count"};
  map[DIR] = {"--data-dir", 1, false, "Directory"};
  return map;
}

} // namespace

/** @test Flags with values are collected by key. */
TEST(ArgsTest, ParsesValues) {
  const std::array<std::string_view, 4> ARGS{"--count", "5", "--data-dir", "/tmp/x"};
  ParsedArgs pargs;
  ASSERT_TRUE(parseArgs(ARGS, makeMap(), pargs));

  ASSERT_EQ(pargs.count(COUNT), 1U);
  EXPECT_EQ(pargs[COUNT][0], "5");
  EXPECT_EQ(pargs[DIR][0], "/tmp/x");
  EXPECT_EQ(pargs.count(HELP), 0U);
}

/** @test A trailing flag missing its value fails with a message. */
TEST(ArgsTest, MissingValue) {
  const std::array<std::string_view, 1> ARGS{"--count"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGS, makeMap(), pargs, error));
  EXPECT_NE(error.find("--count"), std::string::npos);
}

/** @test Zero-arity flags are recorded as present. */
TEST(ArgsTest, ZeroArity) {
  const std::array<std::string_view, 1> ARGS{"--help"};
  ParsedArgs pargs;
  ASSERT_TRUE(parseArgs(ARGS, makeMap(), pargs));
  EXPECT_EQ(pargs.count(HELP), 1U);
}

/** @test parseInt rejects partial and empty input. */
TEST(ArgsTest, ParseInt) {
  EXPECT_EQ(parseInt("250"), 250);
  EXPECT_EQ(parseInt("-3"), -3);
  EXPECT_FALSE(parseInt("").has_value());
  EXPECT_FALSE(parseInt("12ms").has_value());
}
