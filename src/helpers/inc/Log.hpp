#ifndef NETMETER_HELPERS_LOG_HPP
#define NETMETER_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief spdlog setup for netmeter processes.
 *
 * Library code logs through the SPDLOG_* macros against the default logger.
 * Tools call initLogging() once at startup; tests leave the spdlog default
 * in place.
 */

#include <optional>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace netmeter {
namespace helpers {
namespace log {

/// Logger name registered by initLogging().
inline constexpr const char* LOGGER_NAME = "netmeter";

/// Pattern shared by all tools.
inline constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

/**
 * @brief Map a level name to an spdlog level.
 * @param name One of trace, debug, info, warn, error, off.
 * @return Level, or nullopt for an unknown name.
 */
[[nodiscard]] inline std::optional<spdlog::level::level_enum>
parseLevel(std::string_view name) noexcept {
  if (name == "trace") {
    return spdlog::level::trace;
  }
  if (name == "debug") {
    return spdlog::level::debug;
  }
  if (name == "info") {
    return spdlog::level::info;
  }
  if (name == "warn" || name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

/**
 * @brief Install a stderr colour logger as the spdlog default.
 * @param level Initial level.
 */
inline void initLogging(spdlog::level::level_enum level = spdlog::level::info) {
  auto logger = spdlog::get(LOGGER_NAME);
  if (!logger) {
    logger = spdlog::stderr_color_mt(LOGGER_NAME);
  }
  logger->set_pattern(LOG_PATTERN);
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
}

} // namespace log
} // namespace helpers
} // namespace netmeter

#endif // NETMETER_HELPERS_LOG_HPP
