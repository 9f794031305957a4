#ifndef POOLSCOPE_TELEMETRY_UNIT_PARSER_HPP
#define POOLSCOPE_TELEMETRY_UNIT_PARSER_HPP
/**
 * @file UnitParser.hpp
 * @brief Suffix-aware scalar parsing for zpool/arcstat tokens.
 * @note Thread-safe: Pure functions, no shared state.
 *
 * Unit families and canonical outputs:
 *  - COUNT:     decimal suffixes K M G T (x1000^n), output as-is
 *  - SIZE:      binary suffixes K M G T P (x1024^n), output GiB
 *  - BANDWIDTH: binary suffixes K M G T P (x1024^n), output MB/s (2^20 bytes/s)
 *  - TIME:      ns us ms s, bare number is nanoseconds, output milliseconds
 *  - PERCENT:   bare number with optional trailing '%'
 *
 * A lone "-" means the tool did not report the value (NOT_REPORTED, value 0).
 */

#include <cstdint>
#include <string_view>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief How a token's suffix is interpreted.
 */
enum class UnitFamily : std::uint8_t {
  COUNT = 0,
  SIZE,
  BANDWIDTH,
  TIME,
  PERCENT,
};

/**
 * @brief Outcome of parsing one token.
 */
enum class TokenStatus : std::uint8_t {
  OK = 0,       ///< Parsed and scaled
  NOT_REPORTED, ///< "-" placeholder, value is 0
  MALFORMED,    ///< Unparsable, value is 0
};

/// @brief Human-readable family name.
[[nodiscard]] const char* toString(UnitFamily family) noexcept;

/// @brief Human-readable status name.
[[nodiscard]] const char* toString(TokenStatus status) noexcept;

/**
 * @brief Parsed token in canonical units.
 */
struct ScaledValue {
  double value{0.0};
  TokenStatus status{TokenStatus::MALFORMED};

  /// @brief True when the token parsed (including "-").
  [[nodiscard]] bool ok() const noexcept { return status != TokenStatus::MALFORMED; }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse one raw token into canonical units for its family.
 * @param token  Raw column text, e.g. "1.23M", "500us", "87%", "-".
 * @param family Unit family of the column.
 * @return Scaled value; negative or non-finite numbers are MALFORMED.
 */
[[nodiscard]] ScaledValue parseScaled(std::string_view token, UnitFamily family) noexcept;

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_UNIT_PARSER_HPP
