/**
 * @file InterfaceReader.cpp
 * @brief sysfs counter reads and primary-interface selection.
 */

#include "src/network/inc/InterfaceReader.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <dirent.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace netmeter {

namespace network {

using netmeter::helpers::files::pathExists;
using netmeter::helpers::files::readFileToBuffer;
using netmeter::helpers::files::readFileUint64;
using netmeter::helpers::strings::startsWith;

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::size_t PATH_BUFFER_SIZE = 256;
constexpr std::size_t READ_BUFFER_SIZE = 64;

/* ----------------------------- Helpers ----------------------------- */

/**
 * Map interface name -> first numeric IPv4 address.
 * Returns false if getifaddrs() fails.
 */
bool collectIpv4Addresses(std::unordered_map<std::string, std::string>& out) {
  struct ifaddrs* ifaddr = nullptr;
  if (::getifaddrs(&ifaddr) != 0) {
    SPDLOG_WARN("getifaddrs failed: {}", std::strerror(errno));
    return false;
  }

  for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if (out.count(ifa->ifa_name) != 0) {
      continue;
    }

    char host[NI_MAXHOST];
    const int RC = ::getnameinfo(ifa->ifa_addr, sizeof(struct sockaddr_in), host, sizeof(host),
                                 nullptr, 0, NI_NUMERICHOST);
    if (RC != 0) {
      SPDLOG_DEBUG("getnameinfo({}) failed: {}", ifa->ifa_name, ::gai_strerror(RC));
      continue;
    }
    out.emplace(ifa->ifa_name, host);
  }

  ::freeifaddrs(ifaddr);
  return true;
}

inline std::uint64_t saturatingAdd(std::uint64_t a, std::uint64_t b) noexcept {
  const std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();
  return (a > MAX - b) ? MAX : a + b;
}

} // namespace

/* ----------------------------- InterfaceStatus ----------------------------- */

const char* toString(InterfaceStatus status) noexcept {
  switch (status) {
  case InterfaceStatus::OK:
    return "ok";
  case InterfaceStatus::ACCESS_ERROR:
    return "interface table unreadable";
  case InterfaceStatus::NO_ACTIVE_INTERFACE:
    return "no active interface";
  case InterfaceStatus::NOT_FOUND:
    return "interface not found";
  }
  return "unknown";
}

/* ----------------------------- InterfaceSample ----------------------------- */

std::uint64_t InterfaceSample::totalBytes() const noexcept {
  return saturatingAdd(inputBytes, outputBytes);
}

std::string InterfaceSample::toString() const {
  return fmt::format("{}: in={} out={} ip={}{}", name, inputBytes, outputBytes,
                     ipAddress.empty() ? "-" : ipAddress, isActive ? " [active]" : "");
}

/* ----------------------------- SysfsInterfaceSource ----------------------------- */

SysfsInterfaceSource::SysfsInterfaceSource(std::string sysNetPath) : root_(std::move(sysNetPath)) {}

InterfaceStatus SysfsInterfaceSource::readCounters(const std::string& name,
                                                   InterfaceSample& sample) {
  char pathBuf[PATH_BUFFER_SIZE];

  std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/statistics", root_.c_str(), name.c_str());
  if (!pathExists(pathBuf)) {
    return InterfaceStatus::NOT_FOUND;
  }

  std::uint64_t rx = 0;
  std::uint64_t tx = 0;

  std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/statistics/rx_bytes", root_.c_str(),
                name.c_str());
  const bool RX_OK = readFileUint64(pathBuf, rx);

  std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/statistics/tx_bytes", root_.c_str(),
                name.c_str());
  const bool TX_OK = readFileUint64(pathBuf, tx);

  if (!RX_OK || !TX_OK) {
    return InterfaceStatus::ACCESS_ERROR;
  }

  sample.inputBytes = rx;
  sample.outputBytes = tx;
  return InterfaceStatus::OK;
}

InterfaceStatus SysfsInterfaceSource::enumerate(std::vector<InterfaceSample>& out) {
  out.clear();

  DIR* dir = ::opendir(root_.c_str());
  if (dir == nullptr) {
    SPDLOG_WARN("Cannot open {}: {}", root_, std::strerror(errno));
    return InterfaceStatus::ACCESS_ERROR;
  }

  std::unordered_map<std::string, std::string> addresses;
  const bool HAVE_ADDRESSES = collectIpv4Addresses(addresses);

  char pathBuf[PATH_BUFFER_SIZE];
  char readBuf[READ_BUFFER_SIZE];

  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    // Skip . and ..
    if (entry->d_name[0] == '.') {
      continue;
    }

    InterfaceSample sample;
    sample.name = entry->d_name;
    if (readCounters(sample.name, sample) != InterfaceStatus::OK) {
      continue;
    }

    if (HAVE_ADDRESSES) {
      const auto IT = addresses.find(sample.name);
      if (IT != addresses.end()) {
        sample.ipAddress = IT->second;
      }
    }

    std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/operstate", root_.c_str(), entry->d_name);
    const bool LINK_DOWN = readFileToBuffer(pathBuf, readBuf, sizeof(readBuf)) > 0 &&
                           std::strcmp(readBuf, "down") == 0;
    sample.isActive = !sample.ipAddress.empty() && !LINK_DOWN;

    out.push_back(std::move(sample));
  }

  ::closedir(dir);
  return InterfaceStatus::OK;
}

/* ----------------------------- InterfaceReader ----------------------------- */

InterfaceReader::InterfaceReader(InterfaceSource& source, const timing::Clock& clock,
                                 std::chrono::milliseconds ttl)
    : source_(source), clock_(clock),
      ttlNs_(static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(ttl).count())) {}

InterfaceStatus InterfaceReader::listInterfaces(std::vector<InterfaceSample>& out) {
  return source_.enumerate(out);
}

void InterfaceReader::invalidateCache() noexcept { cacheValid_ = false; }

InterfaceStatus InterfaceReader::primaryInterface(InterfaceSample& out) {
  const std::uint64_t NOW = clock_.monotonicNs();

  if (cacheValid_ && NOW - cachedAtNs_ < ttlNs_) {
    if (cachedStatus_ != InterfaceStatus::OK) {
      return cachedStatus_;
    }

    const InterfaceStatus ST = source_.readCounters(cached_.name, cached_);
    if (ST == InterfaceStatus::OK) {
      out = cached_;
      return ST;
    }
    if (ST == InterfaceStatus::ACCESS_ERROR) {
      return ST;
    }
    // NOT_FOUND: the interface went away, select again.
  }

  return select(out);
}

InterfaceStatus InterfaceReader::select(InterfaceSample& out) {
  cacheValid_ = false;

  std::vector<InterfaceSample> all;
  const InterfaceStatus ST = source_.enumerate(all);
  if (ST != InterfaceStatus::OK) {
    return InterfaceStatus::ACCESS_ERROR;
  }

  if (all.size() != lastCount_) {
    SPDLOG_DEBUG("Found {} network interfaces", all.size());
    lastCount_ = all.size();
  }

  cachedAtNs_ = clock_.monotonicNs();
  cacheValid_ = true;

  const std::size_t IDX = selectPrimary(all);
  if (IDX >= all.size()) {
    cachedStatus_ = InterfaceStatus::NO_ACTIVE_INTERFACE;
    if (!lastPrimary_.empty()) {
      SPDLOG_WARN("No active network interfaces found");
      lastPrimary_.clear();
    }
    return cachedStatus_;
  }

  cachedStatus_ = InterfaceStatus::OK;
  cached_ = std::move(all[IDX]);

  if (cached_.name != lastPrimary_) {
    SPDLOG_INFO("Selected primary interface: {} ({})", cached_.name, description(cached_.name));
    lastPrimary_ = cached_.name;
  }

  out = cached_;
  return InterfaceStatus::OK;
}

const std::string& InterfaceReader::description(const std::string& name) {
  auto it = descriptions_.find(name);
  if (it == descriptions_.end()) {
    it = descriptions_.emplace(name, describeInterface(name)).first;
  }
  return it->second;
}

/* ----------------------------- API ----------------------------- */

bool isExcludedInterface(std::string_view name) noexcept {
  if (name.empty()) {
    return true;
  }

  static constexpr std::string_view EXCLUDED_PREFIXES[] = {
      "lo",     // Loopback
      "tun",    // TUN (OpenVPN and friends)
      "tap",    // TAP
      "wg",     // WireGuard
      "ppp",    // PPP / PPTP / L2TP
      "utun",   // Userspace tunnel
      "ipsec",  // IPsec VTI
      "p2p",    // Wi-Fi Direct
      "awdl",   // Apple Wireless Direct Link
      "llw",    // Low-latency WLAN
      "bridge", // Bridge
      "br-",    // Bridge (docker networks)
      "virbr",  // Libvirt bridge
      "docker", // Docker bridge
      "veth",   // Container veth pair
      "vnet",   // VM tap
      "dummy",  // Dummy device
  };

  for (const std::string_view PREFIX : EXCLUDED_PREFIXES) {
    if (startsWith(name, PREFIX)) {
      return true;
    }
  }
  return false;
}

std::string describeInterface(std::string_view name) {
  if (name == "lo") {
    return "Loopback";
  }
  if (startsWith(name, "wl")) {
    return "Wi-Fi";
  }
  if (startsWith(name, "en") || startsWith(name, "eth")) {
    return "Ethernet";
  }
  if (startsWith(name, "ww")) {
    return "Mobile Broadband";
  }
  if (startsWith(name, "usb")) {
    return "USB Ethernet";
  }
  if (startsWith(name, "tun") || startsWith(name, "wg") || startsWith(name, "ppp") ||
      startsWith(name, "utun")) {
    return "VPN Tunnel";
  }
  if (startsWith(name, "br") || startsWith(name, "bridge") || startsWith(name, "virbr")) {
    return "Bridge Interface";
  }
  return std::string(name);
}

std::size_t selectPrimary(const std::vector<InterfaceSample>& samples) noexcept {
  std::size_t best = samples.size();
  bool bestActive = false;

  for (std::size_t i = 0; i < samples.size(); ++i) {
    const InterfaceSample& S = samples[i];
    if (isExcludedInterface(S.name)) {
      continue;
    }

    if (best == samples.size()) {
      best = i;
      bestActive = S.isActive;
      continue;
    }

    // Active interfaces outrank inactive ones regardless of traffic.
    if (S.isActive != bestActive) {
      if (S.isActive) {
        best = i;
        bestActive = true;
      }
      continue;
    }

    if (S.totalBytes() > samples[best].totalBytes()) {
      best = i;
    }
  }

  return best;
}

} // namespace network

} // namespace netmeter
