#ifndef NETMETER_HISTORY_DAILY_STATS_STORE_HPP
#define NETMETER_HISTORY_DAILY_STATS_STORE_HPP
/**
 * @file DailyStatsStore.hpp
 * @brief Day-keyed usage history with JSON file persistence.
 *
 * The whole collection is rewritten (temp file + rename) after every
 * mutation unless auto-save is disabled. Persistence failures are logged
 * and reported, never fatal: the in-memory state stays authoritative.
 *
 * @note Thread-safe (internal mutex).
 */

#include "src/history/inc/DailyStats.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace netmeter {

namespace history {

/* ----------------------------- Constants ----------------------------- */

/// File name inside the data directory.
inline constexpr const char* STATS_FILE_NAME = "netmeter_stats.json";

/* ----------------------------- StoreStatus ----------------------------- */

enum class StoreStatus : unsigned char {
  OK = 0,       ///< Success
  READ_FAILED,  ///< File exists but could not be read
  PARSE_FAILED, ///< File content is not a record array
  WRITE_FAILED, ///< Temp write or rename failed
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(StoreStatus status) noexcept;

/* ----------------------------- DailyStatsStore ----------------------------- */

class DailyStatsStore {
public:
  /**
   * @param filePath Backing file. Empty keeps the store in memory only.
   */
  explicit DailyStatsStore(std::string filePath = {});

  DailyStatsStore(const DailyStatsStore&) = delete;
  DailyStatsStore& operator=(const DailyStatsStore&) = delete;

  /**
   * @brief Replace in-memory state with the file's contents.
   * @return OK when the file is absent (empty history). On READ_FAILED or
   *         PARSE_FAILED the store is left empty.
   *
   * Individual malformed records are skipped; duplicate dates are merged.
   */
  StoreStatus load();

  /// @brief Write the full collection to the backing file.
  StoreStatus save();

  /// @brief Additive upsert of traffic for @p day.
  StoreStatus addDelta(timing::Day day, std::uint64_t uploaded, std::uint64_t downloaded);

  /// @brief Upsert taking the per-direction maximum.
  StoreStatus recordPeak(timing::Day day, double uploadSpeed, double downloadSpeed);

  /// @brief Record for @p day, zero-valued if unseen.
  [[nodiscard]] DailyStats get(timing::Day day) const;

  /**
   * @brief The @p n days ending at @p today, most recent first.
   * @return Exactly n records; days without data are zero-filled.
   */
  [[nodiscard]] std::vector<DailyStats> lastNDays(std::size_t n, timing::Day today) const;

  /// @brief Drop every record and persist the empty collection.
  StoreStatus resetAll();

  /// @brief Number of stored days.
  [[nodiscard]] std::size_t size() const;

  /// @brief All records in ascending date order.
  [[nodiscard]] std::vector<DailyStats> all() const;

  /// @brief Enable or disable the save after each mutation (default on).
  void setAutoSave(bool enabled);

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
  StoreStatus persistLocked();
  StoreStatus saveLocked();
  DailyStats& recordLocked(timing::Day day);

  std::string path_;
  mutable std::mutex mutex_;
  std::map<timing::Day, DailyStats> days_;
  bool autoSave_{true};
};

} // namespace history

} // namespace netmeter

#endif // NETMETER_HISTORY_DAILY_STATS_STORE_HPP
