#ifndef NETMETER_MONITOR_SAMPLING_ENGINE_HPP
#define NETMETER_MONITOR_SAMPLING_ENGINE_HPP
/**
 * @file SamplingEngine.hpp
 * @brief Two-timer sampling core: fast counter sampling, slower publishing.
 *
 * State machine: IDLE -> RUNNING (both timers armed) -> IDLE.
 *
 *  - Sample tick (sampleIntervalMs): read the primary interface counters and
 *    add their deltas to the accumulated window. The first sample after a
 *    start, reset, interface change or connectivity loss only seeds the
 *    counter state (reseed rule).
 *  - Publish tick (publishIntervalMs): speed = window / interval, fold the
 *    window into today's persisted totals and peaks, clear the window,
 *    publish a complete snapshot.
 *
 * Every method must be called on the EventLoop thread. The engine owns its
 * timers; stop() and the destructor cancel them before state is released.
 */

#include "src/history/inc/DailyStatsStore.hpp"
#include "src/monitor/inc/MetricsPublisher.hpp"
#include "src/monitor/inc/Settings.hpp"
#include "src/network/inc/DeltaCalculator.hpp"
#include "src/network/inc/InterfaceReader.hpp"
#include "src/network/inc/PathMonitor.hpp"
#include "src/timing/inc/Clock.hpp"
#include "src/timing/inc/EventLoop.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace netmeter {

namespace monitor {

/* ----------------------------- EngineState ----------------------------- */

enum class EngineState : unsigned char {
  IDLE = 0, ///< No timers armed
  RUNNING,  ///< Sample and publish timers armed
};

/**
 * @brief Human-readable state string.
 */
[[nodiscard]] const char* toString(EngineState state) noexcept;

/* ----------------------------- AccumulatedWindow ----------------------------- */

/**
 * @brief Traffic accumulated since the last publish tick.
 */
struct AccumulatedWindow {
  std::uint64_t uploaded{0};
  std::uint64_t downloaded{0};

  void add(const network::CounterDelta& delta) noexcept;
  void clear() noexcept { uploaded = downloaded = 0; }
  [[nodiscard]] bool empty() const noexcept { return uploaded == 0 && downloaded == 0; }
};

/* ----------------------------- SamplingEngine ----------------------------- */

class SamplingEngine {
public:
  SamplingEngine(timing::EventLoop& loop, network::InterfaceReader& reader,
                 history::DailyStatsStore& store, MetricsPublisher& publisher,
                 const timing::Clock& clock);
  ~SamplingEngine();

  SamplingEngine(const SamplingEngine&) = delete;
  SamplingEngine& operator=(const SamplingEngine&) = delete;

  /* ---------------- Control ---------------- */

  /**
   * @brief Arm both timers; restarts if already running.
   * @return false on a non-positive interval (INVALID_INTERVAL recorded,
   *         current schedule untouched) or timer creation failure.
   */
  bool start(std::int64_t sampleIntervalMs, std::int64_t publishIntervalMs);

  /// @brief Cancel both timers, flush the window to history, publish once.
  void stop();

  /// @brief Drop the interface cache and start again with the current intervals.
  bool restart();

  /// @brief Full re-seeding restart with new intervals.
  bool setInterval(std::int64_t sampleIntervalMs, std::int64_t publishIntervalMs);

  /**
   * @brief Zero session peaks, restart uptime, reseed.
   *
   * The window is flushed to history first, so today's totals are
   * unchanged by a reset.
   */
  void resetStatistics();

  /* ---------------- Tick handlers ---------------- */

  void onSampleTick();
  void onPublishTick();

  /* ---------------- External inputs ---------------- */

  /// @brief Connectivity transition from the path observer.
  void onPathUpdate(network::PathStatus path);

  /**
   * @brief Store the external-IP lookup result and publish it.
   * @param address Resolved address or the "Unavailable" sentinel.
   * @param resolved false raises EXTERNAL_IP_FETCH_FAILED.
   */
  void setExternalIp(const std::string& address, bool resolved);

  /// @brief Record a non-fatal error raised outside the tick path.
  void recordError(const MonitorError& error);

  /* ---------------- Queries ---------------- */

  [[nodiscard]] EngineState state() const noexcept { return state_; }
  [[nodiscard]] bool isAwaitingReseed() const noexcept { return awaitingReseed_; }
  [[nodiscard]] const AccumulatedWindow& window() const noexcept { return window_; }
  [[nodiscard]] std::int64_t sampleIntervalMs() const noexcept { return sampleMs_; }
  [[nodiscard]] std::int64_t publishIntervalMs() const noexcept { return publishMs_; }

  /// @brief Working copy of the metrics (what the next publish will carry).
  [[nodiscard]] const PublishedMetrics& current() const noexcept { return metrics_; }

  /// @brief Today's persisted totals plus the unflushed window.
  [[nodiscard]] history::DailyStats todayTotals() const;

  /// @brief Last @p n days ending today, most recent first.
  [[nodiscard]] std::vector<history::DailyStats> lastNDays(std::size_t n) const;

private:
  void cancelTimers();
  void flushWindow(timing::Day today);
  void publish();
  void raise(const MonitorError& error);
  void clearError(MonitorErrorCode code);
  void checkStore(history::StoreStatus status);

  timing::EventLoop& loop_;
  network::InterfaceReader& reader_;
  history::DailyStatsStore& store_;
  MetricsPublisher& publisher_;
  const timing::Clock& clock_;

  EngineState state_{EngineState::IDLE};
  timing::TimerId sampleTimer_{timing::INVALID_TIMER};
  timing::TimerId publishTimer_{timing::INVALID_TIMER};
  std::int64_t sampleMs_{DEFAULT_SAMPLE_INTERVAL_MS};
  std::int64_t publishMs_{DEFAULT_PUBLISH_INTERVAL_MS};

  network::CounterState counters_;
  AccumulatedWindow window_;
  bool awaitingReseed_{true};
  bool pathUsable_{true};
  std::uint64_t startNs_{0};

  PublishedMetrics metrics_;
};

} // namespace monitor

} // namespace netmeter

#endif // NETMETER_MONITOR_SAMPLING_ENGINE_HPP
