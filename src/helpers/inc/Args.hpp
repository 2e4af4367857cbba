#ifndef NETMETER_HELPERS_ARGS_HPP
#define NETMETER_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity CLI argument parsing for the netmeter tools.
 *
 * A flag consumes exactly `nargs` following tokens. Unknown tokens are
 * ignored. Numeric values are validated with parseInt().
 */

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <fmt/core.h>

namespace netmeter {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--interval"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 * @param args   Argument list (views must outlive pargs).
 * @param map    Accepted flags.
 * @param pargs  Output values per key (overwritten when a flag repeats).
 * @param error  Receives a message on failure when provided.
 * @return true on success.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& KV : map) {
    byFlag.emplace(KV.second.flag, KV.first);
  }

  std::unordered_set<std::uint8_t> seen;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = byFlag.find(args[i]);
    if (IT == byFlag.end()) {
      continue;
    }

    const std::uint8_t KEY = IT->second;
    const ArgDef& DEF = map.at(KEY);
    if (i + DEF.nargs >= args.size()) {
      if (error) {
        error->get() = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      }
      return false;
    }

    auto& values = pargs[KEY];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    seen.insert(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && seen.count(KV.first) == 0) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Parse a base-10 integer occupying the whole view.
 * @return Parsed value, or nullopt on garbage/overflow.
 */
[[nodiscard]] inline std::optional<std::int64_t> parseInt(std::string_view text) noexcept {
  std::int64_t value = 0;
  const char* const BEGIN = text.data();
  const char* const END = text.data() + text.size();
  const auto RES = std::from_chars(BEGIN, END, value);
  if (text.empty() || RES.ec != std::errc{} || RES.ptr != END) {
    return std::nullopt;
  }
  return value;
}

/**
 * @brief Print usage information generated from the flag map.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    std::string flagStr(def->flag);
    if (def->nargs == 1) {
      flagStr += " <value>";
    } else if (def->nargs > 1) {
      flagStr += " <value> ...";
    }
    fmt::print("  {:<26}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace netmeter

#endif // NETMETER_HELPERS_ARGS_HPP
