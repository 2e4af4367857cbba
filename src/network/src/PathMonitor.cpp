/**
 * @file PathMonitor.cpp
 * @brief operstate-based connectivity evaluation.
 */

#include "src/network/inc/PathMonitor.hpp"
#include "src/helpers/inc/Files.hpp"

#include <dirent.h>

#include <cstdio>
#include <cstring>

#include <spdlog/spdlog.h>

namespace netmeter {

namespace network {

using netmeter::helpers::files::readFileToBuffer;

namespace {

constexpr std::size_t PATH_BUFFER_SIZE = 256;
constexpr std::size_t READ_BUFFER_SIZE = 64;

} // namespace

/* ----------------------------- PathStatus ----------------------------- */

const char* toString(PathStatus status) noexcept {
  switch (status) {
  case PathStatus::SATISFIED:
    return "satisfied";
  case PathStatus::UNSATISFIED:
    return "unsatisfied";
  case PathStatus::REQUIRES_CONNECTION:
    return "requires connection";
  case PathStatus::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}

/* ----------------------------- API ----------------------------- */

PathStatus evaluatePathStatus(const std::string& sysNetPath) {
  DIR* dir = ::opendir(sysNetPath.c_str());
  if (dir == nullptr) {
    return PathStatus::UNKNOWN;
  }

  bool anyUp = false;
  bool anyNegotiating = false;

  char pathBuf[PATH_BUFFER_SIZE];
  char readBuf[READ_BUFFER_SIZE];

  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    if (entry->d_name[0] == '.' || isExcludedInterface(entry->d_name)) {
      continue;
    }

    std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/operstate", sysNetPath.c_str(),
                  entry->d_name);
    if (readFileToBuffer(pathBuf, readBuf, sizeof(readBuf)) == 0) {
      continue;
    }

    if (std::strcmp(readBuf, "up") == 0) {
      anyUp = true;
      break;
    }
    if (std::strcmp(readBuf, "dormant") == 0 || std::strcmp(readBuf, "lowerlayerdown") == 0) {
      anyNegotiating = true;
      continue;
    }
    if (std::strcmp(readBuf, "unknown") == 0) {
      // Some drivers never report operstate; trust carrier instead.
      std::snprintf(pathBuf, sizeof(pathBuf), "%s/%s/carrier", sysNetPath.c_str(),
                    entry->d_name);
      if (readFileToBuffer(pathBuf, readBuf, sizeof(readBuf)) > 0 &&
          std::strcmp(readBuf, "1") == 0) {
        anyUp = true;
        break;
      }
    }
  }

  ::closedir(dir);

  if (anyUp) {
    return PathStatus::SATISFIED;
  }
  if (anyNegotiating) {
    return PathStatus::REQUIRES_CONNECTION;
  }
  return PathStatus::UNSATISFIED;
}

/* ----------------------------- PathMonitor ----------------------------- */

PathMonitor::PathMonitor(std::string sysNetPath) : root_(std::move(sysNetPath)) {}

void PathMonitor::setHandler(Handler handler) { handler_ = std::move(handler); }

PathStatus PathMonitor::poll() {
  const PathStatus NOW = evaluatePathStatus(root_);
  if (polled_ && NOW == current_) {
    return NOW;
  }

  if (polled_) {
    SPDLOG_INFO("Network path changed: {} -> {}", toString(current_), toString(NOW));
  }
  polled_ = true;
  current_ = NOW;

  if (handler_) {
    handler_(NOW);
  }
  return NOW;
}

} // namespace network

} // namespace netmeter
