#ifndef NETMETER_HISTORY_DAILY_STATS_HPP
#define NETMETER_HISTORY_DAILY_STATS_HPP
/**
 * @file DailyStats.hpp
 * @brief Per-day upload/download totals and peak speeds.
 *
 * Persisted form (one element of the store's JSON array):
 * @code
 * {"date": "2024-05-01", "totalUploaded": 1024, "totalDownloaded": 4096,
 *  "peakUploadSpeed": 512.0, "peakDownloadSpeed": 2048.0}
 * @endcode
 */

#include "src/timing/inc/Clock.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace netmeter {

namespace history {

/* ----------------------------- DailyStats ----------------------------- */

/**
 * @brief Usage for one local calendar day.
 */
struct DailyStats {
  timing::Day date{};
  std::uint64_t totalUploaded{0};   ///< Bytes sent
  std::uint64_t totalDownloaded{0}; ///< Bytes received
  double peakUploadSpeed{0.0};      ///< Bytes/s
  double peakDownloadSpeed{0.0};    ///< Bytes/s

  /// @brief A zero-valued record for @p day.
  [[nodiscard]] static DailyStats empty(timing::Day day) noexcept {
    DailyStats s;
    s.date = day;
    return s;
  }

  /// @brief True if no traffic and no peaks recorded.
  [[nodiscard]] bool isZero() const noexcept {
    return totalUploaded == 0 && totalDownloaded == 0 && peakUploadSpeed == 0.0 &&
           peakDownloadSpeed == 0.0;
  }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;

  [[nodiscard]] bool operator==(const DailyStats& other) const noexcept = default;
};

/* ----------------------------- JSON ----------------------------- */

/**
 * @brief Serialize one record.
 */
[[nodiscard]] nlohmann::json toJson(const DailyStats& stats);

/**
 * @brief Deserialize one record.
 * @return false on missing or wrong-typed fields or an invalid date.
 */
[[nodiscard]] bool fromJson(const nlohmann::json& json, DailyStats& out);

} // namespace history

} // namespace netmeter

#endif // NETMETER_HISTORY_DAILY_STATS_HPP
