#ifndef NETMETER_NETWORK_INTERFACE_READER_HPP
#define NETMETER_NETWORK_INTERFACE_READER_HPP
/**
 * @file InterfaceReader.hpp
 * @brief Per-interface byte counters and primary-interface selection.
 * @note Linux-only. Counters from /sys/class/net/\<if\>/statistics/,
 *       addresses from getifaddrs().
 *
 * Design:
 *  - InterfaceSource is the OS seam (enumerate + single-interface re-read).
 *  - InterfaceReader applies the selection policy and caches the chosen
 *    interface for a short window. While the cache is valid only the chosen
 *    interface's two counter files are re-read per call.
 *  - Not thread-safe: owned and called by the sampling loop.
 */

#include "src/timing/inc/Clock.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace netmeter {

namespace network {

/* ----------------------------- Constants ----------------------------- */

/// Default sysfs network class directory.
inline constexpr const char* NET_SYS_PATH = "/sys/class/net";

/// How long a primary-interface selection stays valid.
inline constexpr std::chrono::milliseconds DEFAULT_SELECTION_TTL{5000};

/* ----------------------------- InterfaceStatus ----------------------------- */

/**
 * @brief Status codes for interface queries.
 */
enum class InterfaceStatus : unsigned char {
  OK = 0,
  ACCESS_ERROR,        ///< Interface table could not be enumerated
  NO_ACTIVE_INTERFACE, ///< No candidate left after exclusion
  NOT_FOUND,           ///< Named interface vanished
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(InterfaceStatus status) noexcept;

/* ----------------------------- InterfaceSample ----------------------------- */

/**
 * @brief Snapshot of one interface at one instant. Never mutated after a read.
 */
struct InterfaceSample {
  std::string name;             ///< Interface name (e.g. "wlp2s0")
  std::uint64_t inputBytes{0};  ///< Cumulative bytes received
  std::uint64_t outputBytes{0}; ///< Cumulative bytes transmitted
  std::string ipAddress;        ///< Numeric IPv4 address, empty if none
  bool isActive{false};         ///< Has an address and link is not down

  /// @brief input + output, saturating at UINT64_MAX.
  [[nodiscard]] std::uint64_t totalBytes() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- InterfaceSource ----------------------------- */

/**
 * @brief Read-only access to the OS interface table.
 */
class InterfaceSource {
public:
  virtual ~InterfaceSource() = default;

  /**
   * @brief Enumerate every interface with counters and address.
   * @param out Replaced with one sample per interface.
   * @return OK or ACCESS_ERROR.
   */
  [[nodiscard]] virtual InterfaceStatus enumerate(std::vector<InterfaceSample>& out) = 0;

  /**
   * @brief Re-read the byte counters of one interface.
   * @param name Interface name.
   * @param sample Counters are updated in place; other fields untouched.
   * @return OK, NOT_FOUND or ACCESS_ERROR.
   */
  [[nodiscard]] virtual InterfaceStatus readCounters(const std::string& name,
                                                     InterfaceSample& sample) = 0;
};

/**
 * @brief InterfaceSource backed by sysfs and getifaddrs().
 */
class SysfsInterfaceSource final : public InterfaceSource {
public:
  explicit SysfsInterfaceSource(std::string sysNetPath = NET_SYS_PATH);

  [[nodiscard]] InterfaceStatus enumerate(std::vector<InterfaceSample>& out) override;
  [[nodiscard]] InterfaceStatus readCounters(const std::string& name,
                                             InterfaceSample& sample) override;

private:
  std::string root_;
};

/* ----------------------------- InterfaceReader ----------------------------- */

/**
 * @brief Primary-interface selection with a TTL cache.
 *
 * Selection policy: drop names matching isExcludedInterface(); prefer
 * active candidates; pick the highest input+output byte count. Ties keep
 * enumeration order.
 */
class InterfaceReader {
public:
  InterfaceReader(InterfaceSource& source, const timing::Clock& clock,
                  std::chrono::milliseconds ttl = DEFAULT_SELECTION_TTL);

  /**
   * @brief Enumerate all interfaces (uncached).
   * @return OK or ACCESS_ERROR.
   */
  [[nodiscard]] InterfaceStatus listInterfaces(std::vector<InterfaceSample>& out);

  /**
   * @brief Current primary interface with fresh counters.
   * @param out Filled on OK.
   * @return OK, ACCESS_ERROR or NO_ACTIVE_INTERFACE.
   *
   * A NO_ACTIVE_INTERFACE result is cached for the TTL as well.
   */
  [[nodiscard]] InterfaceStatus primaryInterface(InterfaceSample& out);

  /// @brief Drop the cached selection; next call re-enumerates.
  void invalidateCache() noexcept;

  /// @brief Cached describeInterface().
  [[nodiscard]] const std::string& description(const std::string& name);

private:
  [[nodiscard]] InterfaceStatus select(InterfaceSample& out);

  InterfaceSource& source_;
  const timing::Clock& clock_;
  std::uint64_t ttlNs_;

  bool cacheValid_{false};
  std::uint64_t cachedAtNs_{0};
  InterfaceStatus cachedStatus_{InterfaceStatus::NO_ACTIVE_INTERFACE};
  InterfaceSample cached_;

  std::size_t lastCount_{static_cast<std::size_t>(-1)};
  std::string lastPrimary_;
  std::unordered_map<std::string, std::string> descriptions_;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check whether an interface is excluded from primary selection.
 * @param name Interface name.
 * @return true for loopback, VPN tunnels, peer-to-peer and bridge devices.
 *
 * Prefixes: lo, tun, tap, wg, ppp, utun, ipsec, p2p, awdl, llw, bridge,
 * br-, virbr, docker, veth, vnet, dummy.
 */
[[nodiscard]] bool isExcludedInterface(std::string_view name) noexcept;

/**
 * @brief Stable human description for an interface name.
 * @return e.g. "Wi-Fi", "Ethernet", "VPN Tunnel", or the name itself.
 */
[[nodiscard]] std::string describeInterface(std::string_view name);

/**
 * @brief Pick the busiest candidate from an enumeration.
 * @param samples Enumerated interfaces.
 * @return Index into samples, or samples.size() if none qualifies.
 */
[[nodiscard]] std::size_t selectPrimary(const std::vector<InterfaceSample>& samples) noexcept;

} // namespace network

} // namespace netmeter

#endif // NETMETER_NETWORK_INTERFACE_READER_HPP
