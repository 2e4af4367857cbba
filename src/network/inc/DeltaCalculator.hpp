#ifndef NETMETER_NETWORK_DELTA_CALCULATOR_HPP
#define NETMETER_NETWORK_DELTA_CALCULATOR_HPP
/**
 * @file DeltaCalculator.hpp
 * @brief Reset-tolerant deltas between successive byte counter readings.
 *
 * A counter that decreased is taken to have reset to near zero (interface
 * restart, driver reload), so the whole current value counts as new
 * traffic. Wraparound at 2^64 is not modelled separately: a wrapped counter
 * also reads as a reset, which under-counts by (2^64 - previous) bytes.
 *
 * @note Pure functions, header-only.
 */

#include <cstdint>

namespace netmeter {

namespace network {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Delta between two readings of a monotonic counter.
 * @param current Latest reading.
 * @param previous Prior reading.
 * @return current - previous, or current if the counter went backwards.
 */
[[nodiscard]] constexpr std::uint64_t counterDelta(std::uint64_t current,
                                                   std::uint64_t previous) noexcept {
  return (current >= previous) ? current - previous : current;
}

/* ----------------------------- CounterState ----------------------------- */

/**
 * @brief Upload/download pair produced by one sample.
 */
struct CounterDelta {
  std::uint64_t uploaded{0};
  std::uint64_t downloaded{0};
};

/**
 * @brief Last observed (upload, download) counters of the sampled interface.
 */
struct CounterState {
  std::uint64_t previousUpload{0};
  std::uint64_t previousDownload{0};

  /// @brief Store readings without producing a delta (reseed).
  constexpr void seed(std::uint64_t upload, std::uint64_t download) noexcept {
    previousUpload = upload;
    previousDownload = download;
  }

  /// @brief Compute deltas against stored readings, then store the new ones.
  [[nodiscard]] constexpr CounterDelta advance(std::uint64_t upload,
                                               std::uint64_t download) noexcept {
    const CounterDelta D{counterDelta(upload, previousUpload),
                         counterDelta(download, previousDownload)};
    seed(upload, download);
    return D;
  }
};

/**
 * @brief Delta of a new reading against @p state, advancing the state.
 */
[[nodiscard]] constexpr CounterDelta computeDelta(CounterState& state, std::uint64_t upload,
                                                  std::uint64_t download) noexcept {
  return state.advance(upload, download);
}

} // namespace network

} // namespace netmeter

#endif // NETMETER_NETWORK_DELTA_CALCULATOR_HPP
