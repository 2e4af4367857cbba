#ifndef NETMETER_NETWORK_PATH_MONITOR_HPP
#define NETMETER_NETWORK_PATH_MONITOR_HPP
/**
 * @file PathMonitor.hpp
 * @brief Connectivity observer derived from interface operational state.
 * @note Linux-only. Reads /sys/class/net/\<if\>/operstate and carrier.
 *
 * Only interfaces that could be selected as primary (see
 * isExcludedInterface) are considered. The owner polls; the handler is
 * invoked only when the evaluated status changes.
 */

#include "src/network/inc/InterfaceReader.hpp"

#include <functional>
#include <string>

namespace netmeter {

namespace network {

/* ----------------------------- PathStatus ----------------------------- */

/**
 * @brief Connectivity of the host's usable network path.
 */
enum class PathStatus : unsigned char {
  SATISFIED = 0,       ///< A candidate interface is up
  UNSATISFIED,         ///< Candidates exist but none is up
  REQUIRES_CONNECTION, ///< Link is negotiating (dormant / lower layer down)
  UNKNOWN,             ///< Interface table unreadable
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(PathStatus status) noexcept;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Evaluate path status from a sysfs net directory.
 * @param sysNetPath Directory holding one entry per interface.
 */
[[nodiscard]] PathStatus evaluatePathStatus(const std::string& sysNetPath = NET_SYS_PATH);

/* ----------------------------- PathMonitor ----------------------------- */

class PathMonitor {
public:
  using Handler = std::function<void(PathStatus)>;

  explicit PathMonitor(std::string sysNetPath = NET_SYS_PATH);

  /// @brief Set the transition handler (replaces any previous one).
  void setHandler(Handler handler);

  /**
   * @brief Evaluate now; invoke the handler if the status changed.
   * @return Current status.
   *
   * The first poll always counts as a transition.
   */
  PathStatus poll();

  /// @brief Last evaluated status (UNKNOWN before the first poll).
  [[nodiscard]] PathStatus current() const noexcept { return current_; }

private:
  std::string root_;
  Handler handler_;
  PathStatus current_{PathStatus::UNKNOWN};
  bool polled_{false};
};

} // namespace network

} // namespace netmeter

#endif // NETMETER_NETWORK_PATH_MONITOR_HPP
