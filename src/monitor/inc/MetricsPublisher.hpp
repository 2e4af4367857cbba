#ifndef NETMETER_MONITOR_METRICS_PUBLISHER_HPP
#define NETMETER_MONITOR_METRICS_PUBLISHER_HPP
/**
 * @file MetricsPublisher.hpp
 * @brief Single-writer, multi-reader channel for PublishedMetrics.
 *
 * The writer (loop thread) swaps in a complete immutable snapshot; readers
 * on any thread load the current pointer without locking and can never see
 * a partially updated snapshot. Subscribers are notified synchronously on
 * the publishing thread after the swap.
 */

#include "src/monitor/inc/PublishedMetrics.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace netmeter {

namespace monitor {

class MetricsPublisher {
public:
  using Snapshot = std::shared_ptr<const PublishedMetrics>;
  using Subscriber = std::function<void(const Snapshot&)>;
  using SubscriptionId = std::uint64_t;

  MetricsPublisher();

  MetricsPublisher(const MetricsPublisher&) = delete;
  MetricsPublisher& operator=(const MetricsPublisher&) = delete;

  /**
   * @brief Stamp the next version, swap the snapshot in, notify subscribers.
   * @return The version assigned.
   */
  std::uint64_t publish(PublishedMetrics metrics);

  /// @brief Current snapshot (never null; version 0 before first publish).
  [[nodiscard]] Snapshot snapshot() const;

  /// @brief Version of the current snapshot.
  [[nodiscard]] std::uint64_t version() const noexcept {
    return version_.load(std::memory_order_acquire);
  }

  /// @brief Register a subscriber. Thread-safe.
  SubscriptionId subscribe(Subscriber subscriber);

  /// @brief Remove a subscriber. Returns false if unknown.
  bool unsubscribe(SubscriptionId id);

  /// @brief Remove every subscriber; later publishes only swap the snapshot.
  void unsubscribeAll();

private:
  Snapshot active_;
  std::atomic<std::uint64_t> version_{0};

  mutable std::mutex subMutex_;
  std::map<SubscriptionId, Subscriber> subscribers_;
  SubscriptionId nextSubId_{1};
};

} // namespace monitor

} // namespace netmeter

#endif // NETMETER_MONITOR_METRICS_PUBLISHER_HPP
