#ifndef POOLSCOPE_HELPERS_STRINGS_HPP
#define POOLSCOPE_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String tokenizing helpers for line-oriented tool output.
 *
 * All helpers operate on std::string_view and never copy character data.
 * Returned views alias the input and are only valid while it lives.
 */

#include <cstddef>
#include <string_view>
#include <vector>

namespace poolscope {
namespace helpers {
namespace strings {

/* ----------------------------- Predicates ----------------------------- */

/// @brief True for the separators emitted by zpool/arcstat (space, tab, CR, LF).
[[nodiscard]] constexpr bool isFieldSeparator(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] constexpr bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

/**
 * @brief Check if string ends with suffix.
 * @param str String to check.
 * @param suffix Suffix to look for.
 * @return true if str ends with suffix.
 */
[[nodiscard]] constexpr bool endsWith(std::string_view str, std::string_view suffix) noexcept {
  return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip leading and trailing separators.
 * @param str Input view.
 * @return Sub-view without surrounding whitespace (may be empty).
 */
[[nodiscard]] constexpr std::string_view trim(std::string_view str) noexcept {
  std::size_t begin = 0;
  while (begin < str.size() && isFieldSeparator(str[begin])) {
    ++begin;
  }
  std::size_t end = str.size();
  while (end > begin && isFieldSeparator(str[end - 1])) {
    --end;
  }
  return str.substr(begin, end - begin);
}

/* ----------------------------- Tokenizing ----------------------------- */

/**
 * @brief Split a line on runs of whitespace.
 * @param line Input line (e.g. one `zpool iostat -H` record).
 * @return Non-empty tokens in order of appearance.
 * @note Allocates the returned vector; token views alias @p line.
 *
 * Tabs and spaces are treated alike, so scripted (-H, tab separated) and
 * human (space aligned) layouts tokenize to the same columns.
 */
[[nodiscard]] inline std::vector<std::string_view> splitFields(std::string_view line) {
  std::vector<std::string_view> out;
  out.reserve(24);

  std::size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && isFieldSeparator(line[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < line.size() && !isFieldSeparator(line[i])) {
      ++i;
    }
    if (i > START) {
      out.push_back(line.substr(START, i - START));
    }
  }

  return out;
}

} // namespace strings
} // namespace helpers
} // namespace poolscope

#endif // POOLSCOPE_HELPERS_STRINGS_HPP
