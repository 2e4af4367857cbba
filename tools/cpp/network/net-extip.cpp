/**
 * @file net-extip.cpp
 * @brief One-shot public IP lookup with per-service attempt log.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/network/inc/ExternalIPResolver.hpp"
#include "src/network/inc/HttpClient.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace args = netmeter::helpers::args;
namespace net = netmeter::network;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_TIMEOUT = 2,
  ARG_URL = 3,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Resolve this host's public IP address.\n\n"
    "Services are tried in order until one returns a valid address.\n"
    "--url replaces the built-in list with one plain-text service.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_TIMEOUT] = {"--timeout", 1, false, "Per-request timeout in ms (default: 5000)"};
  map[ARG_URL] = {"--url", 1, false, "Query only this plain-text service"};
  return map;
}

/* ----------------------------- Output ----------------------------- */

void printHuman(const net::ResolveResult& r) {
  for (const net::ResolveAttempt& A : r.attempts) {
    fmt::print("  {:<40} {}\n", A.url, A.outcome);
  }
  fmt::print("\nExternal IP: {}\n", r.address);
}

void printJson(const net::ResolveResult& r) {
  nlohmann::json attempts = nlohmann::json::array();
  for (const net::ResolveAttempt& A : r.attempts) {
    attempts.push_back({{"url", A.url}, {"outcome", A.outcome}});
  }
  const nlohmann::json OUT = {{"status", net::toString(r.status)},
                              {"address", r.address},
                              {"attempts", attempts}};
  fmt::print("{}\n", OUT.dump(2));
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

  std::chrono::milliseconds timeout = net::DEFAULT_REQUEST_TIMEOUT;
  if (pargs.count(ARG_TIMEOUT) != 0) {
    const std::optional<std::int64_t> VAL = args::parseInt(pargs[ARG_TIMEOUT][0]);
    if (!VAL || *VAL <= 0) {
      fmt::print(stderr, "Error: --timeout must be a positive integer (ms)\n");
      return 1;
    }
    timeout = std::chrono::milliseconds(*VAL);
  }

  std::vector<net::IpService> services = net::defaultServices();
  if (pargs.count(ARG_URL) != 0) {
    services = {net::IpService{std::string(pargs[ARG_URL][0]), net::ResponseFormat::PLAIN_TEXT}};
  }

  net::ExternalIPResolver resolver(std::make_shared<net::TlsHttpClient>(), std::move(services), timeout);
  const net::ResolveResult RESULT = resolver.resolveBlocking();

  if (pargs.count(ARG_JSON) != 0) {
    printJson(RESULT);
  } else {
    printHuman(RESULT);
  }
  return RESULT.ok() ? 0 : 2;
}
