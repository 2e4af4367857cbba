/**
 * @file Settings.cpp
 * @brief Settings defaults and JSON loading.
 */

#include "src/monitor/inc/Settings.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/history/inc/DailyStatsStore.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace netmeter {

namespace monitor {

using netmeter::helpers::files::readFileToString;

namespace {

constexpr const char* KEY_SAMPLE = "sampleIntervalMs";
constexpr const char* KEY_PUBLISH = "publishIntervalMs";
constexpr const char* KEY_DATA_DIR = "dataDirectory";
constexpr const char* KEY_EXTERNAL_IP = "resolveExternalIp";
constexpr const char* KEY_LOG_LEVEL = "logLevel";

/// Positive integral interval, or false.
bool readInterval(const nlohmann::json& json, const char* key, std::int64_t& out) {
  const auto IT = json.find(key);
  if (IT == json.end()) {
    return true;
  }
  if (!IT->is_number_integer() || IT->get<std::int64_t>() <= 0) {
    SPDLOG_WARN("Setting '{}' must be a positive integer, keeping {}", key, out);
    return false;
  }
  out = IT->get<std::int64_t>();
  return true;
}

} // namespace

/* ----------------------------- SettingsStatus ----------------------------- */

const char* toString(SettingsStatus status) noexcept {
  switch (status) {
  case SettingsStatus::OK:
    return "ok";
  case SettingsStatus::READ_FAILED:
    return "read failed";
  case SettingsStatus::PARSE_FAILED:
    return "not a JSON object";
  case SettingsStatus::INVALID_VALUE:
    return "invalid value";
  }
  return "unknown";
}

/* ----------------------------- Settings ----------------------------- */

Settings Settings::defaults() {
  Settings s;
  s.dataDirectory = defaultDataDirectory();
  return s;
}

std::string Settings::statsFilePath() const {
  if (dataDirectory.empty()) {
    return {};
  }
  if (dataDirectory.back() == '/') {
    return dataDirectory + history::STATS_FILE_NAME;
  }
  return dataDirectory + "/" + history::STATS_FILE_NAME;
}

nlohmann::json Settings::toJson() const {
  return nlohmann::json{
      {KEY_SAMPLE, sampleIntervalMs},     {KEY_PUBLISH, publishIntervalMs},
      {KEY_DATA_DIR, dataDirectory},      {KEY_EXTERNAL_IP, resolveExternalIp},
      {KEY_LOG_LEVEL, logLevel},
  };
}

std::string Settings::toString() const {
  return fmt::format("sample={}ms publish={}ms data={} externalIp={} log={}", sampleIntervalMs,
                     publishIntervalMs, dataDirectory, resolveExternalIp ? "on" : "off", logLevel);
}

/* ----------------------------- API ----------------------------- */

std::string defaultDataDirectory() {
  const char* xdg = std::getenv("XDG_DATA_HOME");
  if (xdg != nullptr && xdg[0] == '/') {
    return fmt::format("{}/netmeter", xdg);
  }
  const char* home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return fmt::format("{}/.local/share/netmeter", home);
  }
  return "./netmeter-data";
}

SettingsStatus applySettingsJson(const nlohmann::json& json, Settings& settings) {
  if (!json.is_object()) {
    return SettingsStatus::PARSE_FAILED;
  }

  bool ok = readInterval(json, KEY_SAMPLE, settings.sampleIntervalMs);
  ok = readInterval(json, KEY_PUBLISH, settings.publishIntervalMs) && ok;

  if (const auto IT = json.find(KEY_DATA_DIR); IT != json.end()) {
    if (IT->is_string() && !IT->get_ref<const std::string&>().empty()) {
      settings.dataDirectory = IT->get<std::string>();
    } else {
      SPDLOG_WARN("Setting '{}' must be a non-empty string", KEY_DATA_DIR);
      ok = false;
    }
  }

  if (const auto IT = json.find(KEY_EXTERNAL_IP); IT != json.end()) {
    if (IT->is_boolean()) {
      settings.resolveExternalIp = IT->get<bool>();
    } else {
      SPDLOG_WARN("Setting '{}' must be a boolean", KEY_EXTERNAL_IP);
      ok = false;
    }
  }

  if (const auto IT = json.find(KEY_LOG_LEVEL); IT != json.end()) {
    if (IT->is_string() && helpers::log::parseLevel(IT->get_ref<const std::string&>())) {
      settings.logLevel = IT->get<std::string>();
    } else {
      SPDLOG_WARN("Setting '{}' must be one of trace|debug|info|warn|error|off", KEY_LOG_LEVEL);
      ok = false;
    }
  }

  return ok ? SettingsStatus::OK : SettingsStatus::INVALID_VALUE;
}

SettingsStatus loadSettingsFile(const std::string& path, Settings& settings) {
  std::string content;
  const int ERR = readFileToString(path, content);
  if (ERR != 0) {
    SPDLOG_ERROR("Cannot read settings {}: {}", path, std::strerror(ERR));
    return SettingsStatus::READ_FAILED;
  }

  const nlohmann::json DOC = nlohmann::json::parse(content, nullptr, /*allow_exceptions=*/false);
  if (DOC.is_discarded() || !DOC.is_object()) {
    SPDLOG_ERROR("Settings {} is not a JSON object", path);
    return SettingsStatus::PARSE_FAILED;
  }
  return applySettingsJson(DOC, settings);
}

SettingsStatus validateSettings(const Settings& settings) {
  if (settings.sampleIntervalMs <= 0 || settings.publishIntervalMs <= 0) {
    return SettingsStatus::INVALID_VALUE;
  }
  if (!helpers::log::parseLevel(settings.logLevel)) {
    return SettingsStatus::INVALID_VALUE;
  }
  return SettingsStatus::OK;
}

} // namespace monitor

} // namespace netmeter
