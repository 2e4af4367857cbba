#ifndef NETMETER_MONITOR_MONITOR_SERVICE_HPP
#define NETMETER_MONITOR_MONITOR_SERVICE_HPP
/**
 * @file MonitorService.hpp
 * @brief Consumer-facing control surface wiring the monitor together.
 *
 * Owns the interface reader, history store, publisher, sampling engine,
 * external-IP resolver and path monitor. Runs on a caller-supplied
 * EventLoop. Control calls are thread-safe: each one is posted onto the
 * loop, so every mutation of published state happens on the loop thread.
 *
 * Posted tasks run under a life guard that the destructor takes first, so a
 * task is either finished or never runs once destruction begins.
 *
 * @warning Destroy the service on the loop thread or after EventLoop::run()
 *          has returned: the destructor cancels loop timers, which is not
 *          safe while another thread is running the loop.
 */

#include "src/history/inc/DailyStatsStore.hpp"
#include "src/monitor/inc/MetricsPublisher.hpp"
#include "src/monitor/inc/SamplingEngine.hpp"
#include "src/monitor/inc/Settings.hpp"
#include "src/network/inc/ExternalIPResolver.hpp"
#include "src/network/inc/HttpClient.hpp"
#include "src/network/inc/InterfaceReader.hpp"
#include "src/network/inc/PathMonitor.hpp"
#include "src/timing/inc/Clock.hpp"
#include "src/timing/inc/EventLoop.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace netmeter {

namespace monitor {

/* ----------------------------- Constants ----------------------------- */

/// Connectivity poll period.
inline constexpr std::int64_t PATH_POLL_INTERVAL_MS = 2000;

/* ----------------------------- Dependencies ----------------------------- */

/**
 * @brief OS and network seams the service runs against.
 */
struct ServiceDeps {
  network::InterfaceSource& interfaces;
  std::shared_ptr<network::HttpClient> http;
  const timing::Clock& clock;
  std::string sysNetPath{network::NET_SYS_PATH}; ///< For the path monitor
  std::vector<network::IpService> ipServices{network::defaultServices()};
};

/* ----------------------------- MonitorService ----------------------------- */

class MonitorService {
public:
  MonitorService(timing::EventLoop& loop, Settings settings, ServiceDeps deps);
  ~MonitorService();

  MonitorService(const MonitorService&) = delete;
  MonitorService& operator=(const MonitorService&) = delete;

  /* ---------------- Control (thread-safe) ---------------- */

  /// @brief Load history, start sampling, resolve external IP, poll the path.
  void start();

  /// @brief Stop sampling, path polling and any external-IP lookup.
  void stop();

  /// @brief Refresh interface selection and restart sampling.
  void restart();

  /// @brief Change intervals (full re-seeding restart).
  void setIntervals(std::int64_t sampleIntervalMs, std::int64_t publishIntervalMs);

  /// @brief Reset session peaks and counters.
  void resetStatistics();

  /// @brief Start a fresh external-IP lookup (cancels any in flight).
  void resolveExternalIP();

  /* ---------------- Observation (thread-safe) ---------------- */

  [[nodiscard]] MetricsPublisher::Snapshot metrics() const { return publisher_.snapshot(); }

  MetricsPublisher::SubscriptionId subscribe(MetricsPublisher::Subscriber subscriber) {
    return publisher_.subscribe(std::move(subscriber));
  }

  bool unsubscribe(MetricsPublisher::SubscriptionId id) { return publisher_.unsubscribe(id); }

  /* ---------------- Loop-thread access ---------------- */

  [[nodiscard]] SamplingEngine& engine() noexcept { return engine_; }
  [[nodiscard]] history::DailyStatsStore& store() noexcept { return store_; }
  [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

private:
  void startOnLoop();
  void stopOnLoop();
  void resolveOnLoop();

  /// Post a task that is dropped if the service is gone when it runs.
  void postGuarded(std::function<void()> task);

  /// Held while a posted task runs; the destructor clears alive under it.
  struct LifeGuard {
    std::recursive_mutex mutex; // destruction from inside a task re-enters
    bool alive{true};
  };

  timing::EventLoop& loop_;
  Settings settings_;

  network::InterfaceReader reader_;
  history::DailyStatsStore store_;
  MetricsPublisher publisher_;
  SamplingEngine engine_;
  network::ExternalIPResolver resolver_;
  network::PathMonitor pathMonitor_;

  timing::TimerId pathTimer_{timing::INVALID_TIMER};
  bool started_{false};
  bool historyLoaded_{false};

  std::shared_ptr<LifeGuard> guard_{std::make_shared<LifeGuard>()};
};

} // namespace monitor

} // namespace netmeter

#endif // NETMETER_MONITOR_MONITOR_SERVICE_HPP
