#ifndef NETMETER_MONITOR_SETTINGS_HPP
#define NETMETER_MONITOR_SETTINGS_HPP
/**
 * @file Settings.hpp
 * @brief Monitor configuration: defaults, JSON file, validation.
 *
 * Recognized JSON keys:
 * @code
 * {"sampleIntervalMs": 250, "publishIntervalMs": 1000,
 *  "dataDirectory": "/path", "resolveExternalIp": true, "logLevel": "info"}
 * @endcode
 * Unknown keys are ignored. Command-line flags override file values.
 */

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace netmeter {

namespace monitor {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::int64_t DEFAULT_SAMPLE_INTERVAL_MS = 250;
inline constexpr std::int64_t DEFAULT_PUBLISH_INTERVAL_MS = 1000;

/* ----------------------------- SettingsStatus ----------------------------- */

enum class SettingsStatus : unsigned char {
  OK = 0,        ///< All present keys applied
  READ_FAILED,   ///< File could not be read
  PARSE_FAILED,  ///< Not a JSON object
  INVALID_VALUE, ///< A key had a wrong type or out-of-range value (left unchanged)
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(SettingsStatus status) noexcept;

/* ----------------------------- Settings ----------------------------- */

struct Settings {
  std::int64_t sampleIntervalMs{DEFAULT_SAMPLE_INTERVAL_MS};
  std::int64_t publishIntervalMs{DEFAULT_PUBLISH_INTERVAL_MS};
  std::string dataDirectory; ///< History location; empty keeps history in memory
  bool resolveExternalIp{true};
  std::string logLevel{"info"};

  /// @brief Defaults with dataDirectory resolved from the environment.
  [[nodiscard]] static Settings defaults();

  /// @brief dataDirectory joined with the history file name (empty if no directory).
  [[nodiscard]] std::string statsFilePath() const;

  [[nodiscard]] nlohmann::json toJson() const;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Default data directory.
 * @return $XDG_DATA_HOME/netmeter, else $HOME/.local/share/netmeter,
 *         else ./netmeter-data.
 */
[[nodiscard]] std::string defaultDataDirectory();

/**
 * @brief Apply recognized keys from a JSON object onto @p settings.
 *
 * Invalid values are skipped (the prior value is kept) and reported as
 * INVALID_VALUE after the remaining keys have been applied.
 */
[[nodiscard]] SettingsStatus applySettingsJson(const nlohmann::json& json, Settings& settings);

/**
 * @brief Read a JSON settings file and apply it onto @p settings.
 */
[[nodiscard]] SettingsStatus loadSettingsFile(const std::string& path, Settings& settings);

/**
 * @brief Check intervals are positive and the log level is known.
 */
[[nodiscard]] SettingsStatus validateSettings(const Settings& settings);

} // namespace monitor

} // namespace netmeter

#endif // NETMETER_MONITOR_SETTINGS_HPP
