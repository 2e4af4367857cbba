/**
 * @file MonitorService.cpp
 * @brief Control surface: posts commands onto the loop and wires callbacks.
 */

#include "src/monitor/inc/MonitorService.hpp"
#include "src/helpers/inc/Files.hpp"

#include <cstring>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace netmeter {

namespace monitor {

using netmeter::helpers::files::makeDirectories;

MonitorService::MonitorService(timing::EventLoop& loop, Settings settings, ServiceDeps deps)
    : loop_(loop), settings_(std::move(settings)),
      reader_(deps.interfaces, deps.clock), store_(settings_.statsFilePath()),
      engine_(loop, reader_, store_, publisher_, deps.clock),
      resolver_(deps.http, std::move(deps.ipServices)), pathMonitor_(std::move(deps.sysNetPath)) {
  pathMonitor_.setHandler([this](network::PathStatus path) { engine_.onPathUpdate(path); });
}

MonitorService::~MonitorService() {
  {
    std::lock_guard<std::recursive_mutex> lock(guard_->mutex);
    guard_->alive = false;
  }
  resolver_.cancel();
  if (pathTimer_ != timing::INVALID_TIMER) {
    loop_.cancelTimer(pathTimer_);
  }
  // Subscribers may already be gone; the final flush still reaches history.
  publisher_.unsubscribeAll();
  engine_.stop();
}

void MonitorService::postGuarded(std::function<void()> task) {
  loop_.post([guard = guard_, fn = std::move(task)]() {
    std::lock_guard<std::recursive_mutex> lock(guard->mutex);
    if (!guard->alive) {
      return;
    }
    fn();
  });
}

/* ----------------------------- Control ----------------------------- */

void MonitorService::start() {
  postGuarded([this]() { startOnLoop(); });
}

void MonitorService::stop() {
  postGuarded([this]() { stopOnLoop(); });
}

void MonitorService::restart() {
  postGuarded([this]() {
    if (!started_) {
      startOnLoop();
      return;
    }
    engine_.restart();
  });
}

void MonitorService::setIntervals(std::int64_t sampleIntervalMs, std::int64_t publishIntervalMs) {
  postGuarded([this, sampleIntervalMs, publishIntervalMs]() {
    if (!engine_.setInterval(sampleIntervalMs, publishIntervalMs)) {
      return;
    }
    settings_.sampleIntervalMs = sampleIntervalMs;
    settings_.publishIntervalMs = publishIntervalMs;
  });
}

void MonitorService::resetStatistics() {
  postGuarded([this]() { engine_.resetStatistics(); });
}

void MonitorService::resolveExternalIP() {
  postGuarded([this]() { resolveOnLoop(); });
}

/* ----------------------------- Loop-thread ----------------------------- */

void MonitorService::startOnLoop() {
  if (started_) {
    // start while running is a restart
    engine_.start(settings_.sampleIntervalMs, settings_.publishIntervalMs);
    return;
  }

  MonitorError loadError;
  if (!historyLoaded_ && !store_.path().empty()) {
    const int ERR = makeDirectories(settings_.dataDirectory);
    if (ERR != 0) {
      SPDLOG_ERROR("Cannot create data directory {}: {}", settings_.dataDirectory,
                   std::strerror(ERR));
      loadError = {MonitorErrorCode::PERSISTENCE,
                   fmt::format("{}: {}", settings_.dataDirectory, std::strerror(ERR))};
    } else {
      loadError = fromStoreStatus(store_.load(), store_.path());
    }
    historyLoaded_ = true;
  }

  pathMonitor_.poll();
  pathTimer_ = loop_.addTimer(PATH_POLL_INTERVAL_MS, [this]() { pathMonitor_.poll(); });
  if (pathTimer_ == timing::INVALID_TIMER) {
    SPDLOG_WARN("Path polling unavailable; connectivity changes will not be observed");
  }

  engine_.start(settings_.sampleIntervalMs, settings_.publishIntervalMs);
  if (loadError.isError()) {
    engine_.recordError(loadError);
  }
  started_ = true;

  if (settings_.resolveExternalIp) {
    resolveOnLoop();
  }
}

void MonitorService::stopOnLoop() {
  if (!started_) {
    return;
  }
  resolver_.cancel();
  if (pathTimer_ != timing::INVALID_TIMER) {
    loop_.cancelTimer(pathTimer_);
    pathTimer_ = timing::INVALID_TIMER;
  }
  engine_.stop();
  started_ = false;
}

void MonitorService::resolveOnLoop() {
  resolver_.resolve([this](const network::ResolveResult& result) {
    // Worker thread: hand the result to the loop. Delivery is suppressed
    // once the destructor has cancelled the resolver.
    postGuarded([this, address = result.address, ok = result.ok()]() {
      engine_.setExternalIp(address, ok);
    });
  });
}

} // namespace monitor

} // namespace netmeter
