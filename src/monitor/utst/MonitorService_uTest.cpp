/**
 * @file MonitorService_uTest.cpp
 * @brief Integration tests for netmeter::monitor::MonitorService on a live loop.
 *
 * Notes:
 *  - Interfaces, HTTP and the sysfs path tree are fakes; timers are real
 *    with short intervals, so assertions use lower bounds.
 */

#include "src/monitor/inc/MonitorService.hpp"
#include "src/helpers/inc/Files.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using netmeter::helpers::files::makeDirectories;
using netmeter::helpers::files::pathExists;
using netmeter::helpers::files::writeFileAtomic;
using netmeter::monitor::MetricsPublisher;
using netmeter::monitor::MonitorErrorCode;
using netmeter::monitor::MonitorService;
using netmeter::monitor::NetworkStatus;
using netmeter::monitor::ServiceDeps;
using netmeter::monitor::Settings;
using netmeter::network::HttpClient;
using netmeter::network::HttpResponse;
using netmeter::network::HttpStatus;
using netmeter::network::RequestToken;
using netmeter::network::InterfaceSample;
using netmeter::network::InterfaceSource;
using netmeter::network::InterfaceStatus;
using netmeter::network::IpService;
using netmeter::network::ResponseFormat;
using netmeter::timing::EventLoop;
using netmeter::timing::SystemClock;

namespace {

/// One interface whose counters grow on every read.
class GrowingSource final : public InterfaceSource {
public:
  InterfaceStatus enumerate(std::vector<InterfaceSample>& out) override {
    InterfaceSample s;
    s.name = "eth0";
    s.ipAddress = "192.168.0.5";
    s.isActive = true;
    s.inputBytes = in_;
    s.outputBytes = out_;
    out = {s};
    return InterfaceStatus::OK;
  }

  InterfaceStatus readCounters(const std::string& name, InterfaceSample& sample) override {
    if (name != "eth0") {
      return InterfaceStatus::NOT_FOUND;
    }
    in_ += 1000;
    out_ += 100;
    sample.inputBytes = in_;
    sample.outputBytes = out_;
    return InterfaceStatus::OK;
  }

private:
  std::uint64_t in_{1'000'000};
  std::uint64_t out_{100'000};
};

class FixedHttpClient final : public HttpClient {
public:
  explicit FixedHttpClient(std::string body) : body_(std::move(body)) {}

  HttpStatus get(const std::string& /*url*/, std::chrono::milliseconds /*timeout*/,
                 RequestToken& /*token*/, HttpResponse& out) override {
    out.statusCode = 200;
    out.body = body_;
    return HttpStatus::OK;
  }

private:
  std::string body_;
};

class MonitorServiceTest : public ::testing::Test {
protected:
  std::string root_;
  std::string sysNet_;
  std::string dataDir_;

  EventLoop loop_;
  GrowingSource source_;
  SystemClock clock_;

  void SetUp() override {
    char tmpl[] = "/tmp/netmeter_service_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    root_ = tmpl;
    sysNet_ = root_ + "/net";
    dataDir_ = root_ + "/data/nested";
    ASSERT_EQ(makeDirectories(sysNet_ + "/eth0"), 0);
    ASSERT_EQ(writeFileAtomic(sysNet_ + "/eth0/operstate", "up\n"), 0);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  Settings fastSettings(bool withDataDir) const {
    Settings s;
    s.sampleIntervalMs = 10;
    s.publishIntervalMs = 50;
    s.dataDirectory = withDataDir ? dataDir_ : std::string();
    s.resolveExternalIp = true;
    return s;
  }

  ServiceDeps deps(std::shared_ptr<HttpClient> http) {
    return ServiceDeps{source_, std::move(http), clock_, sysNet_,
                       std::vector<IpService>{{"https://ip.test/", ResponseFormat::PLAIN_TEXT}}};
  }
};

} // namespace

/** @test A started service publishes rates, totals and the external address. */
TEST_F(MonitorServiceTest, PublishesWhileRunning) {
  auto http = std::make_shared<FixedHttpClient>("203.0.113.10\n");
  MonitorService service(loop_, fastSettings(false), deps(http));

  std::atomic<int> notified{0};
  service.subscribe([&](const MetricsPublisher::Snapshot&) { ++notified; });

  service.start();
  loop_.runFor(std::chrono::milliseconds(400));

  const MetricsPublisher::Snapshot S = service.metrics();
  EXPECT_GE(S->version, 3U);
  EXPECT_GE(notified.load(), 3);
  EXPECT_EQ(S->status, NetworkStatus::CONNECTED);
  EXPECT_EQ(S->interfaceName, "eth0");
  EXPECT_EQ(S->ipAddress, "192.168.0.5");
  EXPECT_EQ(S->externalIPAddress, "203.0.113.10");
  EXPECT_GT(S->totalDownloadedToday, 0U);
  EXPECT_GT(S->peakDownloadSpeed, 0.0);
  EXPECT_GT(S->networkUptime, 0.0);
}

/** @test History lands in a created data directory and survives a restart. */
TEST_F(MonitorServiceTest, PersistsHistory) {
  auto http = std::make_shared<FixedHttpClient>("203.0.113.10");
  std::uint64_t firstTotal = 0;
  {
    MonitorService service(loop_, fastSettings(true), deps(http));
    service.start();
    loop_.runFor(std::chrono::milliseconds(200));
    service.stop();
    loop_.runFor(std::chrono::milliseconds(10));
    firstTotal = service.engine().todayTotals().totalDownloaded;
  }
  EXPECT_GT(firstTotal, 0U);
  EXPECT_TRUE(pathExists((dataDir_ + "/netmeter_stats.json").c_str()));

  MonitorService again(loop_, fastSettings(true), deps(http));
  again.start();
  loop_.runFor(std::chrono::milliseconds(20));
  EXPECT_GE(again.engine().todayTotals().totalDownloaded, firstTotal);
}

/** @test setIntervals with a bad value records an error and keeps settings. */
TEST_F(MonitorServiceTest, RejectsBadIntervals) {
  auto http = std::make_shared<FixedHttpClient>("203.0.113.10");
  MonitorService service(loop_, fastSettings(false), deps(http));
  service.start();
  service.setIntervals(0, 50);
  loop_.runFor(std::chrono::milliseconds(30));

  EXPECT_EQ(service.settings().sampleIntervalMs, 10);
  ASSERT_TRUE(service.engine().current().lastError.has_value());
  EXPECT_EQ(service.engine().current().lastError->code, MonitorErrorCode::INVALID_INTERVAL);

  service.setIntervals(20, 100);
  loop_.runFor(std::chrono::milliseconds(10));
  EXPECT_EQ(service.settings().sampleIntervalMs, 20);
  EXPECT_EQ(service.engine().publishIntervalMs(), 100);
}

/** @test An unparseable external-IP response yields the sentinel. */
TEST_F(MonitorServiceTest, ExternalIpUnavailable) {
  auto http = std::make_shared<FixedHttpClient>("<html>captive portal</html>");
  MonitorService service(loop_, fastSettings(false), deps(http));
  service.start();
  loop_.runFor(std::chrono::milliseconds(200));

  EXPECT_EQ(service.metrics()->externalIPAddress, "Unavailable");
}

/** @test Link down on the path tree moves the status to Disconnected. */
TEST_F(MonitorServiceTest, PathDownDisconnects) {
  ASSERT_EQ(writeFileAtomic(sysNet_ + "/eth0/operstate", "down\n"), 0);

  auto http = std::make_shared<FixedHttpClient>("203.0.113.10");
  MonitorService service(loop_, fastSettings(false), deps(http));
  service.start();
  loop_.runFor(std::chrono::milliseconds(120));

  EXPECT_EQ(service.engine().current().status, NetworkStatus::DISCONNECTED);
  EXPECT_TRUE(service.engine().window().empty());
}

/** @test Tasks posted by a destroyed service are dropped. */
TEST_F(MonitorServiceTest, PostedTasksAfterDestructionAreDropped) {
  auto http = std::make_shared<FixedHttpClient>("203.0.113.10");
  {
    MonitorService service(loop_, fastSettings(false), deps(http));
    service.start();
    service.resetStatistics();
  }
  loop_.runFor(std::chrono::milliseconds(30));
  EXPECT_EQ(loop_.timerCount(), 0U);
}

/** @test Commands queued behind a loop task that destroys the service are dropped. */
TEST_F(MonitorServiceTest, DestroyOnLoopThreadDropsQueuedCommands) {
  auto http = std::make_shared<FixedHttpClient>("203.0.113.10");
  auto service = std::make_unique<MonitorService>(loop_, fastSettings(false), deps(http));
  service->start();
  loop_.runFor(std::chrono::milliseconds(30));

  loop_.post([&service]() { service.reset(); });
  service->resetStatistics();
  service->restart();
  loop_.runFor(std::chrono::milliseconds(30));

  EXPECT_EQ(service, nullptr);
  EXPECT_EQ(loop_.timerCount(), 0U);
}

/** @test Destroying a running service flushes history without notifying subscribers. */
TEST_F(MonitorServiceTest, DestroyWhileRunningSkipsSubscribers) {
  auto http = std::make_shared<FixedHttpClient>("203.0.113.10");
  int notified = 0;
  auto service = std::make_unique<MonitorService>(loop_, fastSettings(false), deps(http));
  service->subscribe([&](const MetricsPublisher::Snapshot&) { ++notified; });
  service->start();
  loop_.runFor(std::chrono::milliseconds(120));

  const int BEFORE = notified;
  EXPECT_GT(BEFORE, 0);
  service.reset();
  EXPECT_EQ(notified, BEFORE);
}
