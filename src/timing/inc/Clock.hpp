#ifndef NETMETER_TIMING_CLOCK_HPP
#define NETMETER_TIMING_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Time sources for sampling, uptime and calendar-day bucketing.
 * @note Linux-only (clock_gettime, localtime_r).
 *
 * Two clocks are needed: a monotonic clock for uptime and cache expiry,
 * and the wall clock for the local calendar day that keys daily history.
 * Components take a Clock& so tests can drive both deterministically.
 */

#include <chrono>
#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC
#include <string>
#include <string_view>

namespace netmeter {

namespace timing {

/// Calendar day (local civil date stored as days since 1970-01-01).
using Day = std::chrono::sys_days;

/* ----------------------------- Monotonic ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC, unaffected by system clock adjustments.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/* ----------------------------- Clock ----------------------------- */

/**
 * @brief Abstract time source.
 */
class Clock {
public:
  virtual ~Clock() = default;

  /// @brief Monotonic time in nanoseconds.
  [[nodiscard]] virtual std::uint64_t monotonicNs() const noexcept = 0;

  /// @brief Current wall-clock time.
  [[nodiscard]] virtual std::chrono::system_clock::time_point wallNow() const noexcept = 0;

  /// @brief Local calendar day of wallNow().
  [[nodiscard]] Day today() const noexcept;
};

/**
 * @brief Real clocks (CLOCK_MONOTONIC and system_clock).
 */
class SystemClock final : public Clock {
public:
  [[nodiscard]] std::uint64_t monotonicNs() const noexcept override;
  [[nodiscard]] std::chrono::system_clock::time_point wallNow() const noexcept override;
};

/**
 * @brief Manually advanced clock for tests and replay.
 *
 * advance() moves both timelines together.
 */
class ManualClock final : public Clock {
public:
  ManualClock() noexcept;

  [[nodiscard]] std::uint64_t monotonicNs() const noexcept override { return monoNs_; }
  [[nodiscard]] std::chrono::system_clock::time_point wallNow() const noexcept override {
    return wall_;
  }

  void advance(std::chrono::nanoseconds delta) noexcept;
  void setWall(std::chrono::system_clock::time_point tp) noexcept { wall_ = tp; }

private:
  std::uint64_t monoNs_{1'000'000'000ULL};
  std::chrono::system_clock::time_point wall_;
};

/* ----------------------------- Day Helpers ----------------------------- */

/**
 * @brief Local calendar day containing a wall-clock instant.
 * @note Time-of-day is truncated in the local time zone.
 */
[[nodiscard]] Day localDay(std::chrono::system_clock::time_point tp) noexcept;

/**
 * @brief Format a day as ISO-8601 "YYYY-MM-DD".
 */
[[nodiscard]] std::string formatDay(Day day);

/**
 * @brief Parse "YYYY-MM-DD".
 * @param text Input text.
 * @param out Parsed day (untouched on failure).
 * @return true if text is a valid calendar date.
 */
[[nodiscard]] bool parseDay(std::string_view text, Day& out) noexcept;

} // namespace timing

} // namespace netmeter

#endif // NETMETER_TIMING_CLOCK_HPP
