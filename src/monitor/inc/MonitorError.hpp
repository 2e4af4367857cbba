#ifndef NETMETER_MONITOR_MONITOR_ERROR_HPP
#define NETMETER_MONITOR_MONITOR_ERROR_HPP
/**
 * @file MonitorError.hpp
 * @brief Error taxonomy surfaced through published metrics.
 *
 * Every code has a stable machine-readable reason (for consumers and JSON
 * output) and a one-line human description. None is fatal.
 */

#include "src/history/inc/DailyStatsStore.hpp"
#include "src/network/inc/InterfaceReader.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace netmeter {

namespace monitor {

/* ----------------------------- MonitorErrorCode ----------------------------- */

enum class MonitorErrorCode : unsigned char {
  NONE = 0,                 ///< No error
  INTERFACE_ACCESS,         ///< OS interface table unreadable (retried next tick)
  NO_ACTIVE_INTERFACE,      ///< No usable physical interface
  EXTERNAL_IP_FETCH_FAILED, ///< Every external-IP service failed
  PERSISTENCE,              ///< History load/save failed (in-memory only)
  INVALID_INTERVAL,         ///< Non-positive interval rejected
  PATH_UNAVAILABLE,         ///< Connectivity state could not be determined
};

/**
 * @brief Stable machine-readable reason, e.g. "interface_access_error".
 */
[[nodiscard]] const char* reasonCode(MonitorErrorCode code) noexcept;

/**
 * @brief One-line human description.
 */
[[nodiscard]] const char* toString(MonitorErrorCode code) noexcept;

/* ----------------------------- MonitorError ----------------------------- */

/**
 * @brief Error code plus optional context (interface name, errno text, ...).
 */
struct MonitorError {
  MonitorErrorCode code{MonitorErrorCode::NONE};
  std::string detail;

  [[nodiscard]] bool isError() const noexcept { return code != MonitorErrorCode::NONE; }

  /// @brief "description: detail" (or just the description).
  [[nodiscard]] std::string toString() const;

  [[nodiscard]] nlohmann::json toJson() const;

  [[nodiscard]] bool operator==(const MonitorError& other) const noexcept = default;
};

/* ----------------------------- Mapping ----------------------------- */

/// @brief Error for a failed primary-interface read.
[[nodiscard]] MonitorError fromInterfaceStatus(network::InterfaceStatus status);

/// @brief Error for a failed history operation.
[[nodiscard]] MonitorError fromStoreStatus(history::StoreStatus status, const std::string& path);

} // namespace monitor

} // namespace netmeter

#endif // NETMETER_MONITOR_MONITOR_ERROR_HPP
