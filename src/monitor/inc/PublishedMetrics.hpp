#ifndef NETMETER_MONITOR_PUBLISHED_METRICS_HPP
#define NETMETER_MONITOR_PUBLISHED_METRICS_HPP
/**
 * @file PublishedMetrics.hpp
 * @brief Immutable snapshot of everything consumers can observe.
 */

#include "src/monitor/inc/MonitorError.hpp"
#include "src/network/inc/PathMonitor.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace netmeter {

namespace monitor {

/* ----------------------------- NetworkStatus ----------------------------- */

enum class NetworkStatus : unsigned char {
  CONNECTED = 0, ///< Sampling
  DISCONNECTED,  ///< No usable path
  CONNECTING,    ///< Link negotiating
  ERROR,         ///< See PublishedMetrics::lastError
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(NetworkStatus status) noexcept;

/**
 * @brief 1:1 mapping from connectivity observer state.
 */
[[nodiscard]] NetworkStatus statusFromPath(network::PathStatus path) noexcept;

/* ----------------------------- PublishedMetrics ----------------------------- */

struct PublishedMetrics {
  double uploadSpeed{0.0};       ///< Bytes/s over the last publish window
  double downloadSpeed{0.0};     ///< Bytes/s over the last publish window
  double peakUploadSpeed{0.0};   ///< Session peak, reset only explicitly
  double peakDownloadSpeed{0.0}; ///< Session peak, reset only explicitly

  std::uint64_t totalUploadedToday{0};   ///< Persisted total for today
  std::uint64_t totalDownloadedToday{0}; ///< Persisted total for today

  std::string interfaceName;
  std::string interfaceDescription;
  std::string ipAddress;
  std::string externalIPAddress{"Unknown"};

  double networkUptime{0.0}; ///< Seconds since monitoring start

  NetworkStatus status{NetworkStatus::DISCONNECTED};
  std::optional<MonitorError> lastError;

  std::uint64_t version{0}; ///< Stamped by MetricsPublisher

  /// @brief Multi-line human-readable dump.
  [[nodiscard]] std::string toString() const;

  /// @brief Single JSON object (one line per snapshot in --json mode).
  [[nodiscard]] nlohmann::json toJson() const;
};

} // namespace monitor

} // namespace netmeter

#endif // NETMETER_MONITOR_PUBLISHED_METRICS_HPP
