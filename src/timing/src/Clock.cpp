/**
 * @file Clock.cpp
 * @brief Clock implementations and calendar-day helpers.
 */

#include "src/timing/inc/Clock.hpp"

#include <charconv>
#include <system_error>

#include <fmt/core.h>

namespace netmeter {

namespace timing {

namespace {

using std::chrono::day;
using std::chrono::month;
using std::chrono::year;
using std::chrono::year_month_day;

/// Parse a fixed-width decimal field; false on any non-digit.
bool parseField(std::string_view text, int& out) noexcept {
  const char* const END = text.data() + text.size();
  const auto RES = std::from_chars(text.data(), END, out);
  return RES.ec == std::errc{} && RES.ptr == END;
}

} // namespace

/* ----------------------------- Clock ----------------------------- */

Day Clock::today() const noexcept { return localDay(wallNow()); }

std::uint64_t SystemClock::monotonicNs() const noexcept { return getMonotonicNs(); }

std::chrono::system_clock::time_point SystemClock::wallNow() const noexcept {
  return std::chrono::system_clock::now();
}

ManualClock::ManualClock() noexcept : wall_(std::chrono::system_clock::now()) {}

void ManualClock::advance(std::chrono::nanoseconds delta) noexcept {
  if (delta.count() <= 0) {
    return;
  }
  monoNs_ += static_cast<std::uint64_t>(delta.count());
  wall_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
}

/* ----------------------------- Day Helpers ----------------------------- */

Day localDay(std::chrono::system_clock::time_point tp) noexcept {
  const std::time_t T = std::chrono::system_clock::to_time_t(tp);
  struct tm local{};
  if (::localtime_r(&T, &local) == nullptr) {
    return std::chrono::floor<std::chrono::days>(tp);
  }

  const year_month_day YMD{year{local.tm_year + 1900},
                           month{static_cast<unsigned>(local.tm_mon + 1)},
                           day{static_cast<unsigned>(local.tm_mday)}};
  return Day{YMD};
}

std::string formatDay(Day d) {
  const year_month_day YMD{d};
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(YMD.year()),
                     static_cast<unsigned>(YMD.month()), static_cast<unsigned>(YMD.day()));
}

bool parseDay(std::string_view text, Day& out) noexcept {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return false;
  }

  int y = 0;
  int m = 0;
  int dd = 0;
  if (!parseField(text.substr(0, 4), y) || !parseField(text.substr(5, 2), m) ||
      !parseField(text.substr(8, 2), dd)) {
    return false;
  }
  if (m < 1 || dd < 1) {
    return false;
  }

  const year_month_day YMD{year{y}, month{static_cast<unsigned>(m)},
                           day{static_cast<unsigned>(dd)}};
  if (!YMD.ok()) {
    return false;
  }

  out = Day{YMD};
  return true;
}

} // namespace timing

} // namespace netmeter
