/**
 * @file netmeter-history.cpp
 * @brief Show or clear the persisted daily usage history.
 *
 * Reads <data-dir>/netmeter_stats.json and prints the last N days, most
 * recent first, with days without traffic shown as zero.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/history/inc/DailyStatsStore.hpp"
#include "src/monitor/inc/Settings.hpp"
#include "src/timing/inc/Clock.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace args = netmeter::helpers::args;
namespace fmtx = netmeter::helpers::format;
namespace hist = netmeter::history;
namespace mon = netmeter::monitor;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_DAYS = 2,
  ARG_DATA_DIR = 3,
  ARG_CONFIG = 4,
  ARG_RESET = 5,
};

/// Default number of days shown.
constexpr std::int64_t DEFAULT_DAYS = 7;

/// Upper bound on --days.
constexpr std::int64_t MAX_DAYS = 3660;

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Display daily upload/download totals and peak speeds.\n\n"
    "--reset deletes all history (cannot be undone).";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_DAYS] = {"--days", 1, false, "Number of days to show (default: 7)"};
  map[ARG_DATA_DIR] = {"--data-dir", 1, false, "History directory"};
  map[ARG_CONFIG] = {"--config", 1, false, "JSON settings file (for dataDirectory)"};
  map[ARG_RESET] = {"--reset", 0, false, "Clear all stored history"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const std::vector<hist::DailyStats>& days, const std::string& path) {
  fmt::print("=== Usage History ({} days) ===\n", days.size());
  fmt::print("  Source: {}\n\n", path);
  fmt::print("  {:<10}  {:>10}  {:>10}  {:>12}  {:>12}\n", "Date", "Upload", "Download",
             "Peak Up", "Peak Down");

  std::uint64_t up = 0;
  std::uint64_t down = 0;
  double peakUp = 0.0;
  double peakDown = 0.0;
  for (const hist::DailyStats& D : days) {
    fmt::print("  {:<10}  {:>10}  {:>10}  {:>12}  {:>12}\n", netmeter::timing::formatDay(D.date),
               fmtx::formatBytes(D.totalUploaded), fmtx::formatBytes(D.totalDownloaded),
               fmtx::formatSpeed(D.peakUploadSpeed), fmtx::formatSpeed(D.peakDownloadSpeed));
    up += D.totalUploaded;
    down += D.totalDownloaded;
    peakUp = std::max(peakUp, D.peakUploadSpeed);
    peakDown = std::max(peakDown, D.peakDownloadSpeed);
  }

  fmt::print("  {:-<10}  {:->10}  {:->10}  {:->12}  {:->12}\n", "", "", "", "", "");
  fmt::print("  {:<10}  {:>10}  {:>10}  {:>12}  {:>12}\n", "Total", fmtx::formatBytes(up),
             fmtx::formatBytes(down), fmtx::formatSpeed(peakUp), fmtx::formatSpeed(peakDown));
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const std::vector<hist::DailyStats>& days, const std::string& path) {
  nlohmann::json out{{"source", path}, {"days", nlohmann::json::array()}};
  for (const hist::DailyStats& D : days) {
    out["days"].push_back(hist::toJson(D));
  }
  fmt::print("{}\n", out.dump(2));
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
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

  netmeter::helpers::log::initLogging(spdlog::level::warn);

  mon::Settings settings = mon::Settings::defaults();
  if (pargs.count(ARG_CONFIG) != 0) {
    const std::string PATH(pargs[ARG_CONFIG][0]);
    const mon::SettingsStatus ST = mon::loadSettingsFile(PATH, settings);
    if (ST == mon::SettingsStatus::READ_FAILED || ST == mon::SettingsStatus::PARSE_FAILED) {
      fmt::print(stderr, "Error: config {}: {}\n", PATH, mon::toString(ST));
      return 1;
    }
  }
  if (pargs.count(ARG_DATA_DIR) != 0) {
    settings.dataDirectory = std::string(pargs[ARG_DATA_DIR][0]);
  }

  std::int64_t days = DEFAULT_DAYS;
  if (pargs.count(ARG_DAYS) != 0) {
    const std::optional<std::int64_t> VAL = args::parseInt(pargs[ARG_DAYS][0]);
    if (!VAL || *VAL < 1 || *VAL > MAX_DAYS) {
      fmt::print(stderr, "Error: --days must be between 1 and {}\n", MAX_DAYS);
      return 1;
    }
    days = *VAL;
  }

  const std::string PATH = settings.statsFilePath();
  if (PATH.empty()) {
    fmt::print(stderr, "Error: no data directory configured\n");
    return 1;
  }

  const bool RESET = (pargs.count(ARG_RESET) != 0);

  hist::DailyStatsStore store(PATH);
  const hist::StoreStatus LOADED = store.load();
  // A corrupt file can still be reset.
  if (LOADED != hist::StoreStatus::OK && !RESET) {
    fmt::print(stderr, "Error: {}: {}\n", PATH, hist::toString(LOADED));
    return 1;
  }

  if (RESET) {
    const hist::StoreStatus ST = store.resetAll();
    if (ST != hist::StoreStatus::OK) {
      fmt::print(stderr, "Error: reset {}: {}\n", PATH, hist::toString(ST));
      return 1;
    }
    fmt::print("History cleared: {}\n", PATH);
    return 0;
  }

  netmeter::timing::SystemClock clock;
  const std::vector<hist::DailyStats> LAST =
      store.lastNDays(static_cast<std::size_t>(days), clock.today());

  if (pargs.count(ARG_JSON) != 0) {
    printJson(LAST, PATH);
  } else {
    printHuman(LAST, PATH);
  }
  return 0;
}
