/**
 * @file Files_uTest.cpp
 * @brief Unit tests for netmeter::helpers::files.
 */

#include "src/helpers/inc/Files.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

using netmeter::helpers::files::isDirectory;
using netmeter::helpers::files::makeDirectories;
using netmeter::helpers::files::pathExists;
using netmeter::helpers::files::readFileToBuffer;
using netmeter::helpers::files::readFileToString;
using netmeter::helpers::files::readFileUint64;
using netmeter::helpers::files::writeFileAtomic;

namespace {

class FilesTest : public ::testing::Test {
protected:
  std::string dir_;

  void SetUp() override {
    char tmpl[] = "/tmp/netmeter_files_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }
};

} // namespace

/** @test Atomic write replaces contents and leaves no temp file behind. */
TEST_F(FilesTest, WriteAtomicReplaces) {
  const std::string PATH = dir_ + "/data.json";
  ASSERT_EQ(writeFileAtomic(PATH, "first"), 0);
  ASSERT_EQ(writeFileAtomic(PATH, "second"), 0);

  std::string out;
  ASSERT_EQ(readFileToString(PATH, out), 0);
  EXPECT_EQ(out, "second");
  EXPECT_FALSE(pathExists((PATH + ".tmp").c_str()));
}

/** @test Missing files report the errno. */
TEST_F(FilesTest, ReadMissing) {
  std::string out = "stale";
  EXPECT_EQ(readFileToString(dir_ + "/nope", out), ENOENT);
  EXPECT_TRUE(out.empty());
  EXPECT_NE(writeFileAtomic(dir_ + "/no/such/dir/file", "x"), 0);
}

/** @test Buffer reads strip trailing newlines; counters parse. */
TEST_F(FilesTest, BufferAndCounter) {
  const std::string PATH = dir_ + "/rx_bytes";
  ASSERT_EQ(writeFileAtomic(PATH, "18446744073709551615\n"), 0);

  std::array<char, 64> buf{};
  EXPECT_EQ(readFileToBuffer(PATH.c_str(), buf.data(), buf.size()), 20U);
  EXPECT_STREQ(buf.data(), "18446744073709551615");

  std::uint64_t val = 0;
  EXPECT_TRUE(readFileUint64(PATH.c_str(), val));
  EXPECT_EQ(val, UINT64_MAX);

  ASSERT_EQ(writeFileAtomic(PATH, "garbage\n"), 0);
  val = 7;
  EXPECT_FALSE(readFileUint64(PATH.c_str(), val));
  EXPECT_EQ(val, 7U);
  EXPECT_FALSE(readFileUint64((dir_ + "/nope").c_str(), val));
}

/** @test Nested directories are created; existing ones are fine. */
TEST_F(FilesTest, MakeDirectories) {
  const std::string NESTED = dir_ + "/a/b/c/";
  EXPECT_EQ(makeDirectories(NESTED), 0);
  EXPECT_TRUE(isDirectory((dir_ + "/a/b/c").c_str()));
  EXPECT_EQ(makeDirectories(NESTED), 0);

  ASSERT_EQ(writeFileAtomic(dir_ + "/plain", "x"), 0);
  EXPECT_NE(makeDirectories(dir_ + "/plain"), 0);
  EXPECT_EQ(makeDirectories(""), EINVAL);
}
