/**
 * @file net-primary.cpp
 * @brief One-shot interface table with the selected primary interface.
 *
 * Shows every interface with its counters and address, marks the ones
 * excluded from selection, the one chosen as primary, and the overall
 * path status.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/network/inc/InterfaceReader.hpp"
#include "src/network/inc/PathMonitor.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace args = netmeter::helpers::args;
namespace fmtx = netmeter::helpers::format;
namespace net = netmeter::network;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_SYS_PATH = 2,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "List network interfaces and show which one would be sampled as primary.\n\n"
    "Loopback, tunnel, bridge and virtual devices are never selected.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_SYS_PATH] = {"--sys-path", 1, false, "sysfs net directory (default: /sys/class/net)"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const std::vector<net::InterfaceSample>& all, std::size_t primary,
                net::PathStatus path) {
  fmt::print("=== Network Interfaces ({}) ===\n", all.size());
  for (std::size_t i = 0; i < all.size(); ++i) {
    const net::InterfaceSample& S = all[i];
    const char* mark = (i == primary) ? "*" : (net::isExcludedInterface(S.name) ? "-" : " ");
    fmt::print(" {} {:<12} {:<14} {:<15} rx {:>10}  tx {:>10}  {}\n", mark, S.name,
               net::describeInterface(S.name), S.ipAddress.empty() ? "-" : S.ipAddress,
               fmtx::formatBytes(S.inputBytes), fmtx::formatBytes(S.outputBytes),
               S.isActive ? "active" : "inactive");
  }
  fmt::print("\n  (* primary, - excluded)\n\n");

  if (primary < all.size()) {
    fmt::print("Primary: {} ({})\n", all[primary].name, net::describeInterface(all[primary].name));
  } else {
    fmt::print("Primary: none\n");
  }
  fmt::print("Path:    {}\n", net::toString(path));
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const std::vector<net::InterfaceSample>& all, std::size_t primary,
               net::PathStatus path) {
  nlohmann::json out;
  out["interfaces"] = nlohmann::json::array();
  for (const net::InterfaceSample& S : all) {
    out["interfaces"].push_back({{"name", S.name},
                                 {"description", net::describeInterface(S.name)},
                                 {"ipAddress", S.ipAddress},
                                 {"isActive", S.isActive},
                                 {"excluded", net::isExcludedInterface(S.name)},
                                 {"inputBytes", S.inputBytes},
                                 {"outputBytes", S.outputBytes}});
  }
  out["primary"] = (primary < all.size()) ? nlohmann::json(all[primary].name) : nlohmann::json();
  out["pathStatus"] = net::toString(path);
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

  const std::string SYS_PATH =
      (pargs.count(ARG_SYS_PATH) != 0) ? std::string(pargs[ARG_SYS_PATH][0]) : net::NET_SYS_PATH;

  net::SysfsInterfaceSource source(SYS_PATH);
  std::vector<net::InterfaceSample> all;
  const net::InterfaceStatus ST = source.enumerate(all);
  if (ST != net::InterfaceStatus::OK) {
    fmt::print(stderr, "Error: {}: {}\n", SYS_PATH, net::toString(ST));
    return 1;
  }

  const std::size_t PRIMARY = net::selectPrimary(all);
  const net::PathStatus PATH = net::evaluatePathStatus(SYS_PATH);

  if (pargs.count(ARG_JSON) != 0) {
    printJson(all, PRIMARY, PATH);
  } else {
    printHuman(all, PRIMARY, PATH);
  }
  return 0;
}
