#ifndef NETMETER_HELPERS_STRINGS_HPP
#define NETMETER_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers shared by the sysfs readers, HTTP parsing and CLI tools.
 *
 * @note Header-only. All functions are noexcept and allocation-free except
 *       where they return std::string.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace netmeter {
namespace helpers {
namespace strings {

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

/**
 * @brief Trim leading and trailing whitespace (space, tab, CR, LF).
 * @param sv Input view.
 * @return Sub-view without surrounding whitespace.
 */
[[nodiscard]] inline std::string_view trim(std::string_view sv) noexcept {
  constexpr std::string_view WS = " \t\r\n";
  const std::size_t FIRST = sv.find_first_not_of(WS);
  if (FIRST == std::string_view::npos) {
    return {};
  }
  const std::size_t LAST = sv.find_last_not_of(WS);
  return sv.substr(FIRST, LAST - FIRST + 1);
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Case-insensitive ASCII comparison.
 */
[[nodiscard]] inline bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    char ca = a[i];
    char cb = b[i];
    if (ca >= 'A' && ca <= 'Z') {
      ca = static_cast<char>(ca - 'A' + 'a');
    }
    if (cb >= 'A' && cb <= 'Z') {
      cb = static_cast<char>(cb - 'A' + 'a');
    }
    if (ca != cb) {
      return false;
    }
  }
  return true;
}

/**
 * @brief Return the text before the first occurrence of a delimiter.
 * @param sv Input view.
 * @param delim Delimiter character.
 * @return Prefix up to (not including) delim, or the whole view if absent.
 */
[[nodiscard]] inline std::string_view beforeFirst(std::string_view sv, char delim) noexcept {
  const std::size_t POS = sv.find(delim);
  return (POS == std::string_view::npos) ? sv : sv.substr(0, POS);
}

} // namespace strings
} // namespace helpers
} // namespace netmeter

#endif // NETMETER_HELPERS_STRINGS_HPP
