/**
 * @file PublishedMetrics.cpp
 * @brief Snapshot formatting.
 */

#include "src/monitor/inc/PublishedMetrics.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>

namespace netmeter {

namespace monitor {

using netmeter::helpers::format::formatBytes;
using netmeter::helpers::format::formatSpeed;
using netmeter::helpers::format::formatUptime;

const char* toString(NetworkStatus status) noexcept {
  switch (status) {
  case NetworkStatus::CONNECTED:
    return "Connected";
  case NetworkStatus::DISCONNECTED:
    return "Disconnected";
  case NetworkStatus::CONNECTING:
    return "Connecting";
  case NetworkStatus::ERROR:
    return "Error";
  }
  return "Unknown";
}

NetworkStatus statusFromPath(network::PathStatus path) noexcept {
  switch (path) {
  case network::PathStatus::SATISFIED:
    return NetworkStatus::CONNECTED;
  case network::PathStatus::UNSATISFIED:
    return NetworkStatus::DISCONNECTED;
  case network::PathStatus::REQUIRES_CONNECTION:
    return NetworkStatus::CONNECTING;
  case network::PathStatus::UNKNOWN:
    break;
  }
  return NetworkStatus::ERROR;
}

std::string PublishedMetrics::toString() const {
  std::string out;
  out += fmt::format("  Status:      {}", monitor::toString(status));
  if (lastError) {
    out += fmt::format(" ({})", lastError->toString());
  }
  out += '\n';
  out += fmt::format("  Interface:   {} ({})\n", interfaceName.empty() ? "-" : interfaceName,
                     interfaceDescription.empty() ? "-" : interfaceDescription);
  out += fmt::format("  Local IP:    {}\n", ipAddress.empty() ? "-" : ipAddress);
  out += fmt::format("  External IP: {}\n", externalIPAddress);
  out += fmt::format("  Upload:      {:>12}  (peak {})\n", formatSpeed(uploadSpeed),
                     formatSpeed(peakUploadSpeed));
  out += fmt::format("  Download:    {:>12}  (peak {})\n", formatSpeed(downloadSpeed),
                     formatSpeed(peakDownloadSpeed));
  out += fmt::format("  Today:       up {}  down {}\n", formatBytes(totalUploadedToday),
                     formatBytes(totalDownloadedToday));
  out += fmt::format("  Uptime:      {}", formatUptime(networkUptime));
  return out;
}

nlohmann::json PublishedMetrics::toJson() const {
  nlohmann::json j{
      {"version", version},
      {"status", monitor::toString(status)},
      {"uploadSpeed", uploadSpeed},
      {"downloadSpeed", downloadSpeed},
      {"peakUploadSpeed", peakUploadSpeed},
      {"peakDownloadSpeed", peakDownloadSpeed},
      {"totalUploadedToday", totalUploadedToday},
      {"totalDownloadedToday", totalDownloadedToday},
      {"interfaceName", interfaceName},
      {"interfaceDescription", interfaceDescription},
      {"ipAddress", ipAddress},
      {"externalIPAddress", externalIPAddress},
      {"networkUptime", networkUptime},
  };
  j["lastError"] = lastError ? lastError->toJson() : nlohmann::json(nullptr);
  return j;
}

} // namespace monitor

} // namespace netmeter
