/**
 * @file SamplingEngine.cpp
 * @brief Sample/publish tick handling, reseeding and daily folding.
 */

#include "src/monitor/inc/SamplingEngine.hpp"

#include <algorithm>
#include <limits>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace netmeter {

namespace monitor {

namespace {

constexpr double NS_PER_SEC = 1e9;
constexpr double MS_PER_SEC = 1000.0;

inline std::uint64_t saturatingAdd(std::uint64_t a, std::uint64_t b) noexcept {
  const std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();
  return (a > MAX - b) ? MAX : a + b;
}

inline bool isSamplingError(MonitorErrorCode code) noexcept {
  return code == MonitorErrorCode::INTERFACE_ACCESS ||
         code == MonitorErrorCode::NO_ACTIVE_INTERFACE;
}

} // namespace

/* ----------------------------- EngineState ----------------------------- */

const char* toString(EngineState state) noexcept {
  switch (state) {
  case EngineState::IDLE:
    return "idle";
  case EngineState::RUNNING:
    return "running";
  }
  return "unknown";
}

/* ----------------------------- AccumulatedWindow ----------------------------- */

void AccumulatedWindow::add(const network::CounterDelta& delta) noexcept {
  uploaded = saturatingAdd(uploaded, delta.uploaded);
  downloaded = saturatingAdd(downloaded, delta.downloaded);
}

/* ----------------------------- Lifecycle ----------------------------- */

SamplingEngine::SamplingEngine(timing::EventLoop& loop, network::InterfaceReader& reader,
                               history::DailyStatsStore& store, MetricsPublisher& publisher,
                               const timing::Clock& clock)
    : loop_(loop), reader_(reader), store_(store), publisher_(publisher), clock_(clock) {
  metrics_.status = NetworkStatus::DISCONNECTED;
}

SamplingEngine::~SamplingEngine() { cancelTimers(); }

bool SamplingEngine::start(std::int64_t sampleIntervalMs, std::int64_t publishIntervalMs) {
  if (sampleIntervalMs <= 0 || publishIntervalMs <= 0) {
    SPDLOG_WARN("Rejected intervals sample={}ms publish={}ms", sampleIntervalMs,
                publishIntervalMs);
    raise({MonitorErrorCode::INVALID_INTERVAL,
           fmt::format("sample={}ms publish={}ms", sampleIntervalMs, publishIntervalMs)});
    return false;
  }

  if (state_ == EngineState::RUNNING) {
    flushWindow(clock_.today());
    cancelTimers();
  }

  sampleMs_ = sampleIntervalMs;
  publishMs_ = publishIntervalMs;

  startNs_ = clock_.monotonicNs();
  awaitingReseed_ = true;
  window_.clear();
  metrics_.lastError.reset();
  metrics_.uploadSpeed = 0.0;
  metrics_.downloadSpeed = 0.0;
  metrics_.networkUptime = 0.0;
  if (pathUsable_) {
    metrics_.status = NetworkStatus::CONNECTED;
  } else if (metrics_.status == NetworkStatus::ERROR) {
    // Path still unknown: the new session inherits that error.
    raise({MonitorErrorCode::PATH_UNAVAILABLE, {}});
  }

  sampleTimer_ = loop_.addTimer(sampleMs_, [this]() { onSampleTick(); });
  publishTimer_ = loop_.addTimer(publishMs_, [this]() { onPublishTick(); });
  if (sampleTimer_ == timing::INVALID_TIMER || publishTimer_ == timing::INVALID_TIMER) {
    SPDLOG_ERROR("Failed to arm sampling timers");
    cancelTimers();
    state_ = EngineState::IDLE;
    return false;
  }

  state_ = EngineState::RUNNING;
  SPDLOG_INFO("Monitoring started (sample {}ms, publish {}ms)", sampleMs_, publishMs_);
  return true;
}

void SamplingEngine::stop() {
  if (state_ == EngineState::IDLE) {
    return;
  }

  cancelTimers();
  flushWindow(clock_.today());
  state_ = EngineState::IDLE;

  // Speeds are stale once stopped; everything else keeps its last value.
  metrics_.uploadSpeed = 0.0;
  metrics_.downloadSpeed = 0.0;
  SPDLOG_INFO("Monitoring stopped");
  publish();
}

bool SamplingEngine::restart() {
  reader_.invalidateCache();
  return start(sampleMs_, publishMs_);
}

bool SamplingEngine::setInterval(std::int64_t sampleIntervalMs, std::int64_t publishIntervalMs) {
  return start(sampleIntervalMs, publishIntervalMs);
}

void SamplingEngine::resetStatistics() {
  metrics_.peakUploadSpeed = 0.0;
  metrics_.peakDownloadSpeed = 0.0;
  metrics_.uploadSpeed = 0.0;
  metrics_.downloadSpeed = 0.0;
  metrics_.networkUptime = 0.0;
  // Bytes already sampled belong to today's totals, not to the session.
  flushWindow(clock_.today());
  awaitingReseed_ = true;
  startNs_ = clock_.monotonicNs();

  SPDLOG_INFO("Session statistics reset");
  publish();
}

void SamplingEngine::cancelTimers() {
  if (sampleTimer_ != timing::INVALID_TIMER) {
    loop_.cancelTimer(sampleTimer_);
    sampleTimer_ = timing::INVALID_TIMER;
  }
  if (publishTimer_ != timing::INVALID_TIMER) {
    loop_.cancelTimer(publishTimer_);
    publishTimer_ = timing::INVALID_TIMER;
  }
}

/* ----------------------------- Tick handlers ----------------------------- */

void SamplingEngine::onSampleTick() {
  if (state_ != EngineState::RUNNING || !pathUsable_) {
    return;
  }

  network::InterfaceSample sample;
  const network::InterfaceStatus ST = reader_.primaryInterface(sample);
  if (ST != network::InterfaceStatus::OK) {
    metrics_.status = NetworkStatus::ERROR;
    raise(fromInterfaceStatus(ST));
    awaitingReseed_ = true;
    return;
  }

  if (sample.name != metrics_.interfaceName) {
    // Different counters; never diff across interfaces.
    awaitingReseed_ = true;
    metrics_.interfaceName = sample.name;
    metrics_.interfaceDescription = reader_.description(sample.name);
  }
  metrics_.ipAddress = sample.ipAddress;

  if (metrics_.status == NetworkStatus::ERROR && metrics_.lastError &&
      isSamplingError(metrics_.lastError->code)) {
    SPDLOG_INFO("Sampling recovered on {}", sample.name);
    metrics_.status = NetworkStatus::CONNECTED;
    metrics_.lastError.reset();
  }

  if (awaitingReseed_) {
    counters_.seed(sample.outputBytes, sample.inputBytes);
    awaitingReseed_ = false;
    SPDLOG_DEBUG("Seeded counters on {}: out={} in={}", sample.name, sample.outputBytes,
                 sample.inputBytes);
    return;
  }

  const network::CounterDelta DELTA =
      network::computeDelta(counters_, sample.outputBytes, sample.inputBytes);
  window_.add(DELTA);
  SPDLOG_TRACE("Sample {}: +{} up, +{} down", sample.name, DELTA.uploaded, DELTA.downloaded);
}

void SamplingEngine::onPublishTick() {
  if (state_ != EngineState::RUNNING) {
    return;
  }

  const double SECONDS = static_cast<double>(publishMs_) / MS_PER_SEC;
  const double UP_SPEED = static_cast<double>(window_.uploaded) / SECONDS;
  const double DOWN_SPEED = static_cast<double>(window_.downloaded) / SECONDS;

  const timing::Day TODAY = clock_.today();
  flushWindow(TODAY);
  checkStore(store_.recordPeak(TODAY, UP_SPEED, DOWN_SPEED));

  metrics_.uploadSpeed = UP_SPEED;
  metrics_.downloadSpeed = DOWN_SPEED;
  metrics_.peakUploadSpeed = std::max(metrics_.peakUploadSpeed, UP_SPEED);
  metrics_.peakDownloadSpeed = std::max(metrics_.peakDownloadSpeed, DOWN_SPEED);

  publish();
}

void SamplingEngine::flushWindow(timing::Day today) {
  if (window_.empty()) {
    return;
  }
  checkStore(store_.addDelta(today, window_.uploaded, window_.downloaded));
  window_.clear();
}

void SamplingEngine::publish() {
  const timing::Day TODAY = clock_.today();
  const history::DailyStats STATS = store_.get(TODAY);
  metrics_.totalUploadedToday = STATS.totalUploaded;
  metrics_.totalDownloadedToday = STATS.totalDownloaded;

  if (state_ == EngineState::RUNNING) {
    metrics_.networkUptime = static_cast<double>(clock_.monotonicNs() - startNs_) / NS_PER_SEC;
  }

  publisher_.publish(metrics_);
}

/* ----------------------------- External inputs ----------------------------- */

void SamplingEngine::onPathUpdate(network::PathStatus path) {
  const NetworkStatus MAPPED = statusFromPath(path);
  const bool USABLE = (path == network::PathStatus::SATISFIED);

  if (USABLE && !pathUsable_) {
    // Counters may have reset while the link was down.
    awaitingReseed_ = true;
    reader_.invalidateCache();
  }
  if (!USABLE) {
    awaitingReseed_ = true;
  }
  pathUsable_ = USABLE;

  if (metrics_.status != MAPPED) {
    SPDLOG_INFO("Network status: {} -> {}", toString(metrics_.status), toString(MAPPED));
  }
  metrics_.status = MAPPED;

  if (path == network::PathStatus::UNKNOWN) {
    raise({MonitorErrorCode::PATH_UNAVAILABLE, {}});
  } else {
    clearError(MonitorErrorCode::PATH_UNAVAILABLE);
    if (USABLE && metrics_.lastError && isSamplingError(metrics_.lastError->code)) {
      metrics_.lastError.reset();
    }
  }
}

void SamplingEngine::setExternalIp(const std::string& address, bool resolved) {
  metrics_.externalIPAddress = address;
  if (resolved) {
    clearError(MonitorErrorCode::EXTERNAL_IP_FETCH_FAILED);
  } else {
    raise({MonitorErrorCode::EXTERNAL_IP_FETCH_FAILED, {}});
  }
  publish();
}

void SamplingEngine::recordError(const MonitorError& error) { raise(error); }

/* ----------------------------- Errors ----------------------------- */

void SamplingEngine::raise(const MonitorError& error) {
  if (!metrics_.lastError || *metrics_.lastError != error) {
    SPDLOG_WARN("{}", error.toString());
  }
  metrics_.lastError = error;
}

void SamplingEngine::clearError(MonitorErrorCode code) {
  if (metrics_.lastError && metrics_.lastError->code == code) {
    metrics_.lastError.reset();
  }
}

void SamplingEngine::checkStore(history::StoreStatus status) {
  if (status == history::StoreStatus::OK) {
    clearError(MonitorErrorCode::PERSISTENCE);
    return;
  }
  raise(fromStoreStatus(status, store_.path()));
}

/* ----------------------------- Queries ----------------------------- */

history::DailyStats SamplingEngine::todayTotals() const {
  history::DailyStats stats = store_.get(clock_.today());
  stats.totalUploaded = saturatingAdd(stats.totalUploaded, window_.uploaded);
  stats.totalDownloaded = saturatingAdd(stats.totalDownloaded, window_.downloaded);
  return stats;
}

std::vector<history::DailyStats> SamplingEngine::lastNDays(std::size_t n) const {
  return store_.lastNDays(n, clock_.today());
}

} // namespace monitor

} // namespace netmeter
