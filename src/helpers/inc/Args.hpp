#ifndef POOLSCOPE_HELPERS_ARGS_HPP
#define POOLSCOPE_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the poolscope tools.
 *
 * Flags are declared up front with a fixed value count. Anything on the
 * command line that is not a declared flag or one of its values is an error,
 * so typos such as `--duraton 60` are reported instead of silently ignored.
 *
 * @note Cold-path: Allocates.
 */

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace poolscope {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Declaration of one flag.
 */
struct ArgDef {
  std::string_view flag;         ///< e.g. "--pool"
  std::uint8_t nargs;            ///< Values consumed after the flag
  bool required;                 ///< Must appear at least once
  std::string_view desc{};       ///< Help text
  std::string_view valueName{};  ///< Placeholder in usage, e.g. "SECONDS"
};

/// Flag declarations keyed by caller-defined id.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Values per flag id. A flag given twice keeps the last occurrence.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Match @p args against @p map.
 * @param args  Tokens after the program name (views must outlive @p pargs).
 * @param map   Accepted flags.
 * @param pargs Receives values for every flag seen.
 * @param error Set to a one-line message on failure.
 * @return false on unknown flag, stray token, missing value or missing required flag.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> byFlag;
  byFlag.reserve(map.size());
  for (const auto& KV : map) {
    byFlag.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view TOK = args[i];
    const auto IT = byFlag.find(TOK);
    if (IT == byFlag.end()) {
      error = (TOK.size() > 1 && TOK.front() == '-')
                  ? fmt::format("Unknown flag '{}'", TOK)
                  : fmt::format("Unexpected argument '{}'", TOK);
      return false;
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;
    if (args.size() - i - 1 < DEF.nargs) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    std::vector<std::string_view>& values = pargs[KEY];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && pargs.count(KV.first) == 0) {
      error = fmt::format("Missing required flag '{}'", KV.second.flag);
      return false;
    }
  }
  return true;
}

/// @brief True if flag @p key was given.
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) {
  return pargs.count(key) != 0;
}

/// @brief First value of flag @p key, if given with a value.
[[nodiscard]] inline std::optional<std::string_view> value(const ParsedArgs& pargs,
                                                           std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/**
 * @brief Parse a whole token as a non-negative integer.
 * @return nullopt on sign, trailing characters or overflow.
 */
[[nodiscard]] inline std::optional<std::uint32_t> parseUint(std::string_view text) noexcept {
  std::uint32_t out = 0;
  const char* const END = text.data() + text.size();
  const auto RES = std::from_chars(text.data(), END, out);
  if (text.empty() || RES.ec != std::errc{} || RES.ptr != END) {
    return std::nullopt;
  }
  return out;
}

/* ----------------------------- Usage ----------------------------- */

/**
 * @brief Render help text, flags sorted alphabetically.
 * @param progName    argv[0].
 * @param description One-line summary.
 * @param map         Accepted flags.
 */
[[nodiscard]] inline std::string formatUsage(std::string_view progName,
                                             std::string_view description, const ArgMap& map) {
  std::vector<std::pair<std::string, const ArgDef*>> rows;
  rows.reserve(map.size());
  std::size_t width = 0;
  for (const auto& KV : map) {
    const ArgDef& DEF = KV.second;
    std::string lhs(DEF.flag);
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      lhs += fmt::format(" <{}>", DEF.valueName.empty() ? "value" : DEF.valueName);
    }
    width = std::max(width, lhs.size());
    rows.emplace_back(std::move(lhs), &DEF);
  }
  std::sort(rows.begin(), rows.end(),
            [](const auto& a, const auto& b) { return a.second->flag < b.second->flag; });

  std::string out = fmt::format("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    out += fmt::format("{}\n\n", description);
  }
  out += "Options:\n";
  for (const auto& ROW : rows) {
    out += fmt::format("  {:<{}}  {}{}\n", ROW.first, width, ROW.second->desc,
                       ROW.second->required ? " (required)" : "");
  }
  return out;
}

/// @brief Print formatUsage() to stdout.
inline void printUsage(std::string_view progName, std::string_view description,
                       const ArgMap& map) {
  fmt::print("{}", formatUsage(progName, description, map));
}

} // namespace args
} // namespace helpers
} // namespace poolscope

#endif // POOLSCOPE_HELPERS_ARGS_HPP
