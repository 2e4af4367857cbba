/**
 * @file MetricsPublisher.cpp
 * @brief Atomic snapshot swap and subscriber fan-out.
 */

#include "src/monitor/inc/MetricsPublisher.hpp"

#include <vector>

namespace netmeter {

namespace monitor {

MetricsPublisher::MetricsPublisher() {
  std::atomic_store(&active_, Snapshot(std::make_shared<PublishedMetrics>()));
}

std::uint64_t MetricsPublisher::publish(PublishedMetrics metrics) {
  const std::uint64_t VERSION = version_.load(std::memory_order_relaxed) + 1;
  metrics.version = VERSION;

  const Snapshot NEXT = std::make_shared<const PublishedMetrics>(std::move(metrics));
  std::atomic_store(&active_, NEXT);
  version_.store(VERSION, std::memory_order_release);

  // Copy so subscribers may (un)subscribe from inside the callback.
  std::vector<Subscriber> targets;
  {
    std::lock_guard<std::mutex> lock(subMutex_);
    targets.reserve(subscribers_.size());
    for (const auto& [id, sub] : subscribers_) {
      targets.push_back(sub);
    }
  }
  for (const Subscriber& SUB : targets) {
    SUB(NEXT);
  }
  return VERSION;
}

MetricsPublisher::Snapshot MetricsPublisher::snapshot() const { return std::atomic_load(&active_); }

MetricsPublisher::SubscriptionId MetricsPublisher::subscribe(Subscriber subscriber) {
  std::lock_guard<std::mutex> lock(subMutex_);
  const SubscriptionId ID = nextSubId_++;
  subscribers_.emplace(ID, std::move(subscriber));
  return ID;
}

bool MetricsPublisher::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(subMutex_);
  return subscribers_.erase(id) != 0;
}

void MetricsPublisher::unsubscribeAll() {
  std::lock_guard<std::mutex> lock(subMutex_);
  subscribers_.clear();
}

} // namespace monitor

} // namespace netmeter
