/**
 * @file netmeter.cpp
 * @brief Live network throughput monitor with daily usage accounting.
 *
 * Samples the primary interface, publishes upload/download rates, session
 * peaks, today's totals, local and external address once per publish
 * interval. History is persisted to the data directory.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/monitor/inc/MonitorService.hpp"
#include "src/monitor/inc/Settings.hpp"
#include "src/network/inc/HttpClient.hpp"
#include "src/network/inc/InterfaceReader.hpp"
#include "src/timing/inc/Clock.hpp"
#include "src/timing/inc/EventLoop.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace args = netmeter::helpers::args;
namespace mon = netmeter::monitor;
namespace net = netmeter::network;
namespace timing = netmeter::timing;

namespace {

/* ----------------------------- Signal Handling ----------------------------- */

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int /*signum*/) { g_running = 0; }

/// How often the loop checks for a termination signal.
constexpr std::int64_t SIGNAL_POLL_MS = 100;

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_SAMPLE = 2,
  ARG_PUBLISH = 3,
  ARG_DATA_DIR = 4,
  ARG_CONFIG = 5,
  ARG_LOG_LEVEL = 6,
  ARG_COUNT = 7,
  ARG_NO_EXTERNAL_IP = 8,
  ARG_MEMORY = 9,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Monitor upload/download throughput on the primary network interface.\n\n"
    "Daily totals are kept in <data-dir>/netmeter_stats.json.\n"
    "Press Ctrl+C to stop.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "One JSON object per published snapshot"};
  map[ARG_SAMPLE] = {"--sample-interval", 1, false, "Counter sample period in ms (default: 250)"};
  map[ARG_PUBLISH] = {"--publish-interval", 1, false, "Publish period in ms (default: 1000)"};
  map[ARG_DATA_DIR] = {"--data-dir", 1, false, "History directory"};
  map[ARG_CONFIG] = {"--config", 1, false, "JSON settings file"};
  map[ARG_LOG_LEVEL] = {"--log-level", 1, false, "trace|debug|info|warn|error|off"};
  map[ARG_COUNT] = {"--count", 1, false, "Exit after N snapshots (default: unlimited)"};
  map[ARG_NO_EXTERNAL_IP] = {"--no-external-ip", 0, false, "Skip the public address lookup"};
  map[ARG_MEMORY] = {"--memory", 0, false, "Keep history in memory only"};
  return map;
}

/// Parse a positive interval flag into @p out. Prints and returns false on error.
bool readIntervalArg(const args::ParsedArgs& pargs, ArgKey key, std::string_view flag,
                     std::int64_t& out) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end()) {
    return true;
  }
  const std::optional<std::int64_t> VAL = args::parseInt(IT->second[0]);
  if (!VAL || *VAL <= 0) {
    fmt::print(stderr, "Error: {} must be a positive integer (ms)\n", flag);
    return false;
  }
  out = *VAL;
  return true;
}

/* ----------------------------- Output ----------------------------- */

void printSnapshot(const mon::PublishedMetrics& m, bool jsonOutput) {
  if (jsonOutput) {
    fmt::print("{}\n", m.toJson().dump());
  } else {
    fmt::print("--- #{} ---\n{}\n", m.version, m.toString());
  }
  std::fflush(stdout);
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (pargs.count(ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  // Settings: defaults, then file, then flags.
  mon::Settings settings = mon::Settings::defaults();
  if (pargs.count(ARG_CONFIG) != 0) {
    const std::string PATH(pargs[ARG_CONFIG][0]);
    const mon::SettingsStatus ST = mon::loadSettingsFile(PATH, settings);
    if (ST == mon::SettingsStatus::READ_FAILED || ST == mon::SettingsStatus::PARSE_FAILED) {
      fmt::print(stderr, "Error: config {}: {}\n", PATH, mon::toString(ST));
      return 1;
    }
    if (ST == mon::SettingsStatus::INVALID_VALUE) {
      fmt::print(stderr, "Warning: config {} has invalid values; defaults kept for them\n", PATH);
    }
  }

  if (!readIntervalArg(pargs, ARG_SAMPLE, "--sample-interval", settings.sampleIntervalMs) ||
      !readIntervalArg(pargs, ARG_PUBLISH, "--publish-interval", settings.publishIntervalMs)) {
    return 1;
  }
  if (pargs.count(ARG_DATA_DIR) != 0) {
    settings.dataDirectory = std::string(pargs[ARG_DATA_DIR][0]);
  }
  if (pargs.count(ARG_MEMORY) != 0) {
    settings.dataDirectory.clear();
  }
  if (pargs.count(ARG_NO_EXTERNAL_IP) != 0) {
    settings.resolveExternalIp = false;
  }
  if (pargs.count(ARG_LOG_LEVEL) != 0) {
    settings.logLevel = std::string(pargs[ARG_LOG_LEVEL][0]);
  }

  std::int64_t maxCount = 0;
  if (pargs.count(ARG_COUNT) != 0) {
    const std::optional<std::int64_t> VAL = args::parseInt(pargs[ARG_COUNT][0]);
    if (!VAL || *VAL < 1) {
      fmt::print(stderr, "Error: --count must be >= 1\n");
      return 1;
    }
    maxCount = *VAL;
  }

  if (mon::validateSettings(settings) != mon::SettingsStatus::OK) {
    fmt::print(stderr, "Error: invalid settings ({})\n", settings.toString());
    return 1;
  }

  const bool JSON_OUTPUT = (pargs.count(ARG_JSON) != 0);
  netmeter::helpers::log::initLogging(
      netmeter::helpers::log::parseLevel(settings.logLevel).value_or(spdlog::level::info));
  SPDLOG_INFO("Settings: {}", settings.toString());

  timing::EventLoop loop;
  if (!loop.valid()) {
    fmt::print(stderr, "Error: failed to create event loop\n");
    return 1;
  }

  net::SysfsInterfaceSource interfaces;
  auto http = std::make_shared<net::TlsHttpClient>();
  timing::SystemClock clock;

  mon::MonitorService service(loop, settings, mon::ServiceDeps{interfaces, http, clock});

  std::int64_t printed = 0;
  service.subscribe([&](const mon::MetricsPublisher::Snapshot& snap) {
    printSnapshot(*snap, JSON_OUTPUT);
    if (maxCount > 0 && ++printed >= maxCount) {
      loop.stop();
    }
  });

  const timing::TimerId SIGNAL_TIMER = loop.addTimer(SIGNAL_POLL_MS, [&loop]() {
    if (g_running == 0) {
      loop.stop();
    }
  });
  if (SIGNAL_TIMER == timing::INVALID_TIMER) {
    fmt::print(stderr, "Error: failed to arm signal timer\n");
    return 1;
  }

  service.start();
  loop.run();

  // Flush the unpublished window to history before exit.
  loop.cancelTimer(SIGNAL_TIMER);
  service.stop();
  loop.runFor(std::chrono::milliseconds(50));

  if (!JSON_OUTPUT) {
    const netmeter::history::DailyStats TODAY = service.engine().todayTotals();
    fmt::print("\nToday: {}\n", TODAY.toString());
  }
  return 0;
}
