/**
 * @file DailyStatsStore.cpp
 * @brief History store persistence and range queries.
 */

#include "src/history/inc/DailyStatsStore.hpp"
#include "src/helpers/inc/Files.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#include <spdlog/spdlog.h>

namespace netmeter {

namespace history {

using netmeter::helpers::files::readFileToString;
using netmeter::helpers::files::writeFileAtomic;

namespace {

inline std::uint64_t saturatingAdd(std::uint64_t a, std::uint64_t b) noexcept {
  const std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();
  return (a > MAX - b) ? MAX : a + b;
}

void mergeInto(DailyStats& into, const DailyStats& from) noexcept {
  into.totalUploaded = saturatingAdd(into.totalUploaded, from.totalUploaded);
  into.totalDownloaded = saturatingAdd(into.totalDownloaded, from.totalDownloaded);
  into.peakUploadSpeed = std::max(into.peakUploadSpeed, from.peakUploadSpeed);
  into.peakDownloadSpeed = std::max(into.peakDownloadSpeed, from.peakDownloadSpeed);
}

} // namespace

/* ----------------------------- StoreStatus ----------------------------- */

const char* toString(StoreStatus status) noexcept {
  switch (status) {
  case StoreStatus::OK:
    return "ok";
  case StoreStatus::READ_FAILED:
    return "read failed";
  case StoreStatus::PARSE_FAILED:
    return "parse failed";
  case StoreStatus::WRITE_FAILED:
    return "write failed";
  }
  return "unknown";
}

/* ----------------------------- DailyStatsStore ----------------------------- */

DailyStatsStore::DailyStatsStore(std::string filePath) : path_(std::move(filePath)) {}

StoreStatus DailyStatsStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  days_.clear();

  if (path_.empty()) {
    return StoreStatus::OK;
  }

  std::string content;
  const int ERR = readFileToString(path_, content);
  if (ERR == ENOENT) {
    SPDLOG_DEBUG("No history at {}, starting empty", path_);
    return StoreStatus::OK;
  }
  if (ERR != 0) {
    SPDLOG_ERROR("Failed to read history {}: {}", path_, std::strerror(ERR));
    return StoreStatus::READ_FAILED;
  }

  const nlohmann::json DOC = nlohmann::json::parse(content, nullptr, /*allow_exceptions=*/false);
  if (DOC.is_discarded() || !DOC.is_array()) {
    SPDLOG_ERROR("History {} is not a JSON record array, starting empty", path_);
    return StoreStatus::PARSE_FAILED;
  }

  std::size_t skipped = 0;
  for (const nlohmann::json& ENTRY : DOC) {
    DailyStats rec;
    if (!fromJson(ENTRY, rec)) {
      ++skipped;
      continue;
    }
    auto [it, inserted] = days_.emplace(rec.date, rec);
    if (!inserted) {
      mergeInto(it->second, rec);
    }
  }

  if (skipped != 0) {
    SPDLOG_WARN("Skipped {} malformed history record(s) in {}", skipped, path_);
  }
  SPDLOG_INFO("Loaded {} day(s) of history from {}", days_.size(), path_);
  return StoreStatus::OK;
}

StoreStatus DailyStatsStore::save() {
  std::lock_guard<std::mutex> lock(mutex_);
  return saveLocked();
}

StoreStatus DailyStatsStore::saveLocked() {
  if (path_.empty()) {
    return StoreStatus::OK;
  }

  nlohmann::json doc = nlohmann::json::array();
  for (const auto& [day, rec] : days_) {
    doc.push_back(toJson(rec));
  }

  const int ERR = writeFileAtomic(path_, doc.dump(2));
  if (ERR != 0) {
    SPDLOG_ERROR("Failed to save history {}: {}", path_, std::strerror(ERR));
    return StoreStatus::WRITE_FAILED;
  }
  return StoreStatus::OK;
}

StoreStatus DailyStatsStore::persistLocked() {
  return autoSave_ ? saveLocked() : StoreStatus::OK;
}

DailyStats& DailyStatsStore::recordLocked(timing::Day day) {
  auto it = days_.find(day);
  if (it == days_.end()) {
    it = days_.emplace(day, DailyStats::empty(day)).first;
  }
  return it->second;
}

StoreStatus DailyStatsStore::addDelta(timing::Day day, std::uint64_t uploaded,
                                      std::uint64_t downloaded) {
  std::lock_guard<std::mutex> lock(mutex_);
  DailyStats& rec = recordLocked(day);
  rec.totalUploaded = saturatingAdd(rec.totalUploaded, uploaded);
  rec.totalDownloaded = saturatingAdd(rec.totalDownloaded, downloaded);
  return persistLocked();
}

StoreStatus DailyStatsStore::recordPeak(timing::Day day, double uploadSpeed,
                                        double downloadSpeed) {
  std::lock_guard<std::mutex> lock(mutex_);
  DailyStats& rec = recordLocked(day);
  const bool CHANGED = uploadSpeed > rec.peakUploadSpeed || downloadSpeed > rec.peakDownloadSpeed;
  rec.peakUploadSpeed = std::max(rec.peakUploadSpeed, uploadSpeed);
  rec.peakDownloadSpeed = std::max(rec.peakDownloadSpeed, downloadSpeed);
  return CHANGED ? persistLocked() : StoreStatus::OK;
}

DailyStats DailyStatsStore::get(timing::Day day) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto IT = days_.find(day);
  return (IT != days_.end()) ? IT->second : DailyStats::empty(day);
}

std::vector<DailyStats> DailyStatsStore::lastNDays(std::size_t n, timing::Day today) const {
  std::vector<DailyStats> out;
  out.reserve(n);

  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < n; ++i) {
    const timing::Day DAY = today - std::chrono::days{static_cast<int>(i)};
    const auto IT = days_.find(DAY);
    out.push_back((IT != days_.end()) ? IT->second : DailyStats::empty(DAY));
  }
  return out;
}

StoreStatus DailyStatsStore::resetAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  days_.clear();
  SPDLOG_INFO("History cleared");
  return persistLocked();
}

std::size_t DailyStatsStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return days_.size();
}

std::vector<DailyStats> DailyStatsStore::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DailyStats> out;
  out.reserve(days_.size());
  for (const auto& [day, rec] : days_) {
    out.push_back(rec);
  }
  return out;
}

void DailyStatsStore::setAutoSave(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  autoSave_ = enabled;
}

} // namespace history

} // namespace netmeter
