#ifndef NETMETER_HELPERS_FORMAT_HPP
#define NETMETER_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for byte totals, speeds and uptime.
 *
 * Units are binary (1 KB = 1024 B). A value exactly at a unit threshold is
 * promoted to the larger unit ("1.00 KB", never "1024 B").
 *
 * @note All functions return std::string; use only for display and logging.
 */

#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace netmeter {
namespace helpers {
namespace format {

/* ----------------------------- Constants ----------------------------- */

inline constexpr double KIB = 1024.0;
inline constexpr double MIB = KIB * 1024.0;
inline constexpr double GIB = MIB * 1024.0;

namespace detail {

/// Shared unit ladder for bytes and bytes/sec.
inline std::string formatScaled(double value, const char* suffix) {
  if (value < 0.0) {
    value = 0.0;
  }
  if (value >= GIB) {
    return fmt::format("{:.2f} GB{}", value / GIB, suffix);
  }
  if (value >= MIB) {
    return fmt::format("{:.2f} MB{}", value / MIB, suffix);
  }
  if (value >= KIB) {
    return fmt::format("{:.2f} KB{}", value / KIB, suffix);
  }
  return fmt::format("{:.0f} B{}", value, suffix);
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format a byte count (e.g. "512 B", "1.50 MB").
 */
[[nodiscard]] inline std::string formatBytes(double bytes) {
  return detail::formatScaled(bytes, "");
}

/// @brief Overload for integral counters.
[[nodiscard]] inline std::string formatBytes(std::uint64_t bytes) {
  return detail::formatScaled(static_cast<double>(bytes), "");
}

/**
 * @brief Format a transfer rate (e.g. "512 B/s", "1.00 KB/s").
 */
[[nodiscard]] inline std::string formatSpeed(double bytesPerSec) {
  return detail::formatScaled(bytesPerSec, "/s");
}

/**
 * @brief Menu-bar style rate: single-letter unit, no space.
 * @param bytesPerSec Rate in bytes per second.
 * @param showUnits Append the unit letter (B/K/M/G).
 * @param compact One decimal instead of two.
 * @return e.g. "1.50M", "1.5M", "512.00B".
 */
[[nodiscard]] inline std::string formatCompactSpeed(double bytesPerSec, bool showUnits = true,
                                                    bool compact = false) {
  if (bytesPerSec < 0.0) {
    bytesPerSec = 0.0;
  }

  double value = bytesPerSec;
  char unit = 'B';
  if (bytesPerSec >= GIB) {
    value = bytesPerSec / GIB;
    unit = 'G';
  } else if (bytesPerSec >= MIB) {
    value = bytesPerSec / MIB;
    unit = 'M';
  } else if (bytesPerSec >= KIB) {
    value = bytesPerSec / KIB;
    unit = 'K';
  }

  std::string out = compact ? fmt::format("{:.1f}", value) : fmt::format("{:.2f}", value);
  if (showUnits) {
    out.push_back(unit);
  }
  return out;
}

/**
 * @brief Format elapsed seconds as "HH:MM:SS" (hours are not wrapped at 24).
 */
[[nodiscard]] inline std::string formatUptime(double seconds) {
  const std::uint64_t TOTAL = (seconds > 0.0) ? static_cast<std::uint64_t>(seconds) : 0;
  const std::uint64_t HOURS = TOTAL / 3600;
  const std::uint64_t MINUTES = (TOTAL % 3600) / 60;
  const std::uint64_t SECS = TOTAL % 60;
  return fmt::format("{:02}:{:02}:{:02}", HOURS, MINUTES, SECS);
}

} // namespace format
} // namespace helpers
} // namespace netmeter

#endif // NETMETER_HELPERS_FORMAT_HPP
