/**
 * @file DailyStats.cpp
 * @brief DailyStats formatting and JSON mapping.
 */

#include "src/history/inc/DailyStats.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>

namespace netmeter {

namespace history {

using netmeter::helpers::format::formatBytes;
using netmeter::helpers::format::formatSpeed;

namespace {

constexpr const char* KEY_DATE = "date";
constexpr const char* KEY_TOTAL_UP = "totalUploaded";
constexpr const char* KEY_TOTAL_DOWN = "totalDownloaded";
constexpr const char* KEY_PEAK_UP = "peakUploadSpeed";
constexpr const char* KEY_PEAK_DOWN = "peakDownloadSpeed";

bool readCounter(const nlohmann::json& json, const char* key, std::uint64_t& out) {
  const auto IT = json.find(key);
  if (IT == json.end() || !IT->is_number_unsigned()) {
    return false;
  }
  out = IT->get<std::uint64_t>();
  return true;
}

bool readSpeed(const nlohmann::json& json, const char* key, double& out) {
  const auto IT = json.find(key);
  if (IT == json.end() || !IT->is_number()) {
    return false;
  }
  const double VAL = IT->get<double>();
  if (!(VAL >= 0.0)) {
    return false;
  }
  out = VAL;
  return true;
}

} // namespace

std::string DailyStats::toString() const {
  return fmt::format("{}  up {:>10}  down {:>10}  peak up {:>12}  peak down {:>12}",
                     timing::formatDay(date), formatBytes(totalUploaded),
                     formatBytes(totalDownloaded), formatSpeed(peakUploadSpeed),
                     formatSpeed(peakDownloadSpeed));
}

nlohmann::json toJson(const DailyStats& stats) {
  return nlohmann::json{
      {KEY_DATE, timing::formatDay(stats.date)},
      {KEY_TOTAL_UP, stats.totalUploaded},
      {KEY_TOTAL_DOWN, stats.totalDownloaded},
      {KEY_PEAK_UP, stats.peakUploadSpeed},
      {KEY_PEAK_DOWN, stats.peakDownloadSpeed},
  };
}

bool fromJson(const nlohmann::json& json, DailyStats& out) {
  if (!json.is_object()) {
    return false;
  }

  const auto DATE = json.find(KEY_DATE);
  if (DATE == json.end() || !DATE->is_string()) {
    return false;
  }

  DailyStats s;
  if (!timing::parseDay(DATE->get_ref<const std::string&>(), s.date)) {
    return false;
  }
  if (!readCounter(json, KEY_TOTAL_UP, s.totalUploaded) ||
      !readCounter(json, KEY_TOTAL_DOWN, s.totalDownloaded) ||
      !readSpeed(json, KEY_PEAK_UP, s.peakUploadSpeed) ||
      !readSpeed(json, KEY_PEAK_DOWN, s.peakDownloadSpeed)) {
    return false;
  }

  out = s;
  return true;
}

} // namespace history

} // namespace netmeter
