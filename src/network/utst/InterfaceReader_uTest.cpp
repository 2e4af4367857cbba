/**
 * @file InterfaceReader_uTest.cpp
 * @brief Unit tests for netmeter::network::InterfaceReader and the sysfs source.
 *
 * Notes:
 *  - Selection and caching run against an in-memory source and a manual clock.
 *  - The sysfs source is exercised on a temporary directory tree with
 *    interface names that do not exist on the host.
 */

#include "src/network/inc/InterfaceReader.hpp"
#include "src/helpers/inc/Files.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

using netmeter::helpers::files::makeDirectories;
using netmeter::helpers::files::writeFileAtomic;
using netmeter::network::describeInterface;
using netmeter::network::InterfaceReader;
using netmeter::network::InterfaceSample;
using netmeter::network::InterfaceSource;
using netmeter::network::InterfaceStatus;
using netmeter::network::isExcludedInterface;
using netmeter::network::selectPrimary;
using netmeter::network::SysfsInterfaceSource;
using netmeter::timing::ManualClock;

namespace {

InterfaceSample makeSample(const std::string& name, std::uint64_t in, std::uint64_t out,
                           bool active = true) {
  InterfaceSample s;
  s.name = name;
  s.inputBytes = in;
  s.outputBytes = out;
  s.isActive = active;
  s.ipAddress = active ? "192.168.1.10" : "";
  return s;
}

/// In-memory interface table.
class FakeSource final : public InterfaceSource {
public:
  std::vector<InterfaceSample> table;
  InterfaceStatus enumerateStatus{InterfaceStatus::OK};
  int enumerateCalls{0};
  int readCalls{0};

  InterfaceStatus enumerate(std::vector<InterfaceSample>& out) override {
    ++enumerateCalls;
    if (enumerateStatus != InterfaceStatus::OK) {
      return enumerateStatus;
    }
    out = table;
    return InterfaceStatus::OK;
  }

  InterfaceStatus readCounters(const std::string& name, InterfaceSample& sample) override {
    ++readCalls;
    for (const InterfaceSample& S : table) {
      if (S.name == name) {
        sample.inputBytes = S.inputBytes;
        sample.outputBytes = S.outputBytes;
        return InterfaceStatus::OK;
      }
    }
    return InterfaceStatus::NOT_FOUND;
  }

  InterfaceSample* find(const std::string& name) {
    for (InterfaceSample& s : table) {
      if (s.name == name) {
        return &s;
      }
    }
    return nullptr;
  }
};

class InterfaceReaderTest : public ::testing::Test {
protected:
  FakeSource source_;
  ManualClock clock_;
  InterfaceReader reader_{source_, clock_, std::chrono::milliseconds(5000)};
};

} // namespace

/* ----------------------------- Exclusion ----------------------------- */

/** @test Loopback, tunnel, bridge and container names are excluded. */
TEST(InterfaceExclusionTest, PseudoInterfaces) {
  for (const char* name :
       {"lo", "tun0", "tap1", "wg0", "ppp0", "utun3", "ipsec0", "p2p-wlan0", "awdl0", "llw0",
        "bridge0", "br-1a2b", "virbr0", "docker0", "veth12ab", "vnet0", "dummy0", ""}) {
    EXPECT_TRUE(isExcludedInterface(name)) << name;
  }
}

/** @test Physical interface names are candidates. */
TEST(InterfaceExclusionTest, PhysicalInterfaces) {
  for (const char* name : {"eth0", "enp3s0", "wlp2s0", "wlan0", "wwan0", "usb0"}) {
    EXPECT_FALSE(isExcludedInterface(name)) << name;
  }
}

/** @test Descriptions follow name prefixes. */
TEST(InterfaceDescriptionTest, Prefixes) {
  EXPECT_EQ(describeInterface("wlp2s0"), "Wi-Fi");
  EXPECT_EQ(describeInterface("enp3s0"), "Ethernet");
  EXPECT_EQ(describeInterface("eth0"), "Ethernet");
  EXPECT_EQ(describeInterface("wwan0"), "Mobile Broadband");
  EXPECT_EQ(describeInterface("lo"), "Loopback");
  EXPECT_EQ(describeInterface("wg0"), "VPN Tunnel");
  EXPECT_EQ(describeInterface("virbr0"), "Bridge Interface");
  EXPECT_EQ(describeInterface("xyz9"), "xyz9");
}

/* ----------------------------- selectPrimary ----------------------------- */

/** @test The busiest non-excluded interface wins. */
TEST(SelectPrimaryTest, BusiestWins) {
  const std::vector<InterfaceSample> ALL{
      makeSample("lo", 900'000, 900'000),
      makeSample("eth0", 1000, 2000),
      makeSample("wlan0", 50'000, 10'000),
      makeSample("tun0", 800'000, 0),
  };
  const std::size_t IDX = selectPrimary(ALL);
  ASSERT_LT(IDX, ALL.size());
  EXPECT_EQ(ALL[IDX].name, "wlan0");
}

/** @test An active interface outranks a busier inactive one. */
TEST(SelectPrimaryTest, ActivePreferred) {
  const std::vector<InterfaceSample> ALL{
      makeSample("eth0", 10'000'000, 10'000'000, false),
      makeSample("wlan0", 10, 10, true),
  };
  EXPECT_EQ(ALL[selectPrimary(ALL)].name, "wlan0");
}

/** @test Only excluded interfaces means no selection. */
TEST(SelectPrimaryTest, NoneQualifies) {
  const std::vector<InterfaceSample> ALL{makeSample("lo", 1, 1), makeSample("docker0", 5, 5)};
  EXPECT_EQ(selectPrimary(ALL), ALL.size());
  EXPECT_EQ(selectPrimary({}), 0U);
}

/* ----------------------------- InterfaceReader ----------------------------- */

/** @test primaryInterface returns the selected interface with its counters. */
TEST_F(InterfaceReaderTest, SelectsPrimary) {
  source_.table = {makeSample("lo", 5, 5), makeSample("eth0", 100, 200)};

  InterfaceSample out;
  ASSERT_EQ(reader_.primaryInterface(out), InterfaceStatus::OK);
  EXPECT_EQ(out.name, "eth0");
  EXPECT_EQ(out.inputBytes, 100U);
  EXPECT_EQ(out.outputBytes, 200U);
  EXPECT_EQ(out.ipAddress, "192.168.1.10");
}

/** @test No candidate yields NO_ACTIVE_INTERFACE, not an empty success. */
TEST_F(InterfaceReaderTest, NoActiveInterface) {
  source_.table = {makeSample("lo", 5, 5)};

  InterfaceSample out;
  EXPECT_EQ(reader_.primaryInterface(out), InterfaceStatus::NO_ACTIVE_INTERFACE);
}

/** @test Enumeration failure maps to ACCESS_ERROR. */
TEST_F(InterfaceReaderTest, AccessError) {
  source_.enumerateStatus = InterfaceStatus::ACCESS_ERROR;

  InterfaceSample out;
  EXPECT_EQ(reader_.primaryInterface(out), InterfaceStatus::ACCESS_ERROR);
}

/** @test Within the TTL only counters are re-read; the selection is kept. */
TEST_F(InterfaceReaderTest, CachesSelectionButRefreshesCounters) {
  source_.table = {makeSample("eth0", 100, 100), makeSample("wlan0", 10, 10)};

  InterfaceSample out;
  ASSERT_EQ(reader_.primaryInterface(out), InterfaceStatus::OK);
  ASSERT_EQ(out.name, "eth0");
  EXPECT_EQ(source_.enumerateCalls, 1);

  // wlan0 becomes busier, eth0 grows a little.
  source_.find("wlan0")->inputBytes = 1'000'000;
  source_.find("eth0")->inputBytes = 150;
  clock_.advance(std::chrono::seconds(2));

  ASSERT_EQ(reader_.primaryInterface(out), InterfaceStatus::OK);
  EXPECT_EQ(out.name, "eth0");
  EXPECT_EQ(out.inputBytes, 150U);
  EXPECT_EQ(source_.enumerateCalls, 1);
  EXPECT_GE(source_.readCalls, 1);
}

/** @test After the TTL the table is re-enumerated and re-selected. */
TEST_F(InterfaceReaderTest, ReselectsAfterExpiry) {
  source_.table = {makeSample("eth0", 100, 100), makeSample("wlan0", 10, 10)};

  InterfaceSample out;
  ASSERT_EQ(reader_.primaryInterface(out), InterfaceStatus::OK);
  ASSERT_EQ(out.name, "eth0");

  source_.find("wlan0")->inputBytes = 1'000'000;
  clock_.advance(std::chrono::seconds(6));

  ASSERT_EQ(reader_.primaryInterface(out), InterfaceStatus::OK);
  EXPECT_EQ(out.name, "wlan0");
  EXPECT_EQ(source_.enumerateCalls, 2);
}

/** @test The negative result is cached too. */
TEST_F(InterfaceReaderTest, CachesNoActiveInterface) {
  source_.table = {makeSample("lo", 1, 1)};

  InterfaceSample out;
  EXPECT_EQ(reader_.primaryInterface(out), InterfaceStatus::NO_ACTIVE_INTERFACE);
  source_.table.push_back(makeSample("eth0", 1, 1));
  EXPECT_EQ(reader_.primaryInterface(out), InterfaceStatus::NO_ACTIVE_INTERFACE);
  EXPECT_EQ(source_.enumerateCalls, 1);

  reader_.invalidateCache();
  EXPECT_EQ(reader_.primaryInterface(out), InterfaceStatus::OK);
  EXPECT_EQ(out.name, "eth0");
}

/** @test A cached interface that disappears triggers immediate re-selection. */
TEST_F(InterfaceReaderTest, VanishedInterfaceReselects) {
  source_.table = {makeSample("eth0", 100, 100), makeSample("wlan0", 10, 10)};

  InterfaceSample out;
  ASSERT_EQ(reader_.primaryInterface(out), InterfaceStatus::OK);
  source_.table.erase(source_.table.begin());

  ASSERT_EQ(reader_.primaryInterface(out), InterfaceStatus::OK);
  EXPECT_EQ(out.name, "wlan0");
}

/** @test description() is cached per reader. */
TEST_F(InterfaceReaderTest, DescriptionCached) {
  const std::string& A = reader_.description("wlp2s0");
  const std::string& B = reader_.description("wlp2s0");
  EXPECT_EQ(A, "Wi-Fi");
  EXPECT_EQ(&A, &B);
}

/* ----------------------------- SysfsInterfaceSource ----------------------------- */

namespace {

class SysfsSourceTest : public ::testing::Test {
protected:
  std::string root_;

  void SetUp() override {
    char tmpl[] = "/tmp/netmeter_sysfs_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    root_ = tmpl;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  void addInterface(const std::string& name, const char* rx, const char* tx,
                    const char* operstate) {
    const std::string DIR = root_ + "/" + name;
    ASSERT_EQ(makeDirectories(DIR + "/statistics"), 0);
    ASSERT_EQ(writeFileAtomic(DIR + "/statistics/rx_bytes", rx), 0);
    ASSERT_EQ(writeFileAtomic(DIR + "/statistics/tx_bytes", tx), 0);
    ASSERT_EQ(writeFileAtomic(DIR + "/operstate", operstate), 0);
  }
};

} // namespace

/** @test Counters are read from statistics/{rx,tx}_bytes. */
TEST_F(SysfsSourceTest, ReadsCounters) {
  addInterface("nmtest0", "12345\n", "678\n", "up\n");

  SysfsInterfaceSource src(root_);
  InterfaceSample s;
  ASSERT_EQ(src.readCounters("nmtest0", s), InterfaceStatus::OK);
  EXPECT_EQ(s.inputBytes, 12345U);
  EXPECT_EQ(s.outputBytes, 678U);
}

/** @test Unknown interface is NOT_FOUND; unreadable counters are ACCESS_ERROR. */
TEST_F(SysfsSourceTest, ReadErrors) {
  addInterface("nmtest0", "garbage", "1", "up");

  SysfsInterfaceSource src(root_);
  InterfaceSample s;
  EXPECT_EQ(src.readCounters("nmmissing", s), InterfaceStatus::NOT_FOUND);
  EXPECT_EQ(src.readCounters("nmtest0", s), InterfaceStatus::ACCESS_ERROR);
}

/** @test enumerate lists each directory with counters; no address means inactive. */
TEST_F(SysfsSourceTest, Enumerates) {
  addInterface("nmtest0", "10", "20", "up");
  addInterface("nmtest1", "30", "40", "down");
  ASSERT_EQ(makeDirectories(root_ + "/nmbroken"), 0);

  SysfsInterfaceSource src(root_);
  std::vector<InterfaceSample> all;
  ASSERT_EQ(src.enumerate(all), InterfaceStatus::OK);
  ASSERT_EQ(all.size(), 2U);
  for (const InterfaceSample& S : all) {
    EXPECT_TRUE(S.ipAddress.empty());
    EXPECT_FALSE(S.isActive);
  }
}

/** @test A missing root directory is ACCESS_ERROR. */
TEST(SysfsSourceMissingTest, MissingRoot) {
  SysfsInterfaceSource src("/nonexistent/netmeter/sys/class/net");
  std::vector<InterfaceSample> all;
  EXPECT_EQ(src.enumerate(all), InterfaceStatus::ACCESS_ERROR);
}
