/**
 * @file MonitorError.cpp
 * @brief Reason codes and descriptions for MonitorErrorCode.
 */

#include "src/monitor/inc/MonitorError.hpp"

#include <fmt/core.h>

namespace netmeter {

namespace monitor {

const char* reasonCode(MonitorErrorCode code) noexcept {
  switch (code) {
  case MonitorErrorCode::NONE:
    return "none";
  case MonitorErrorCode::INTERFACE_ACCESS:
    return "interface_access_error";
  case MonitorErrorCode::NO_ACTIVE_INTERFACE:
    return "no_active_interface";
  case MonitorErrorCode::EXTERNAL_IP_FETCH_FAILED:
    return "external_ip_fetch_failed";
  case MonitorErrorCode::PERSISTENCE:
    return "persistence_error";
  case MonitorErrorCode::INVALID_INTERVAL:
    return "invalid_interval";
  case MonitorErrorCode::PATH_UNAVAILABLE:
    return "path_unavailable";
  }
  return "unknown";
}

const char* toString(MonitorErrorCode code) noexcept {
  switch (code) {
  case MonitorErrorCode::NONE:
    return "No error";
  case MonitorErrorCode::INTERFACE_ACCESS:
    return "Unable to read network interfaces";
  case MonitorErrorCode::NO_ACTIVE_INTERFACE:
    return "No active network interface found";
  case MonitorErrorCode::EXTERNAL_IP_FETCH_FAILED:
    return "Failed to fetch external IP address";
  case MonitorErrorCode::PERSISTENCE:
    return "Failed to load or save usage history";
  case MonitorErrorCode::INVALID_INTERVAL:
    return "Interval must be greater than zero";
  case MonitorErrorCode::PATH_UNAVAILABLE:
    return "Network path status unavailable";
  }
  return "Unknown error";
}

std::string MonitorError::toString() const {
  if (detail.empty()) {
    return monitor::toString(code);
  }
  return fmt::format("{}: {}", monitor::toString(code), detail);
}

nlohmann::json MonitorError::toJson() const {
  return nlohmann::json{
      {"reason", reasonCode(code)},
      {"message", toString()},
  };
}

MonitorError fromInterfaceStatus(network::InterfaceStatus status) {
  switch (status) {
  case network::InterfaceStatus::OK:
    return {};
  case network::InterfaceStatus::NO_ACTIVE_INTERFACE:
  case network::InterfaceStatus::NOT_FOUND:
    return {MonitorErrorCode::NO_ACTIVE_INTERFACE, {}};
  case network::InterfaceStatus::ACCESS_ERROR:
    break;
  }
  return {MonitorErrorCode::INTERFACE_ACCESS, network::toString(status)};
}

MonitorError fromStoreStatus(history::StoreStatus status, const std::string& path) {
  if (status == history::StoreStatus::OK) {
    return {};
  }
  return {MonitorErrorCode::PERSISTENCE, fmt::format("{} ({})", history::toString(status), path)};
}

} // namespace monitor

} // namespace netmeter
