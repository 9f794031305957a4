/**
 * @file UnitParser.cpp
 * @brief Implementation of suffix-aware token parsing.
 */

#include "src/telemetry/inc/UnitParser.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

constexpr ScaledValue malformed() noexcept { return ScaledValue{0.0, TokenStatus::MALFORMED}; }

constexpr ScaledValue scaled(double v) noexcept { return ScaledValue{v, TokenStatus::OK}; }

/// Index of K M G T P (1..5), 0 for anything else.
constexpr int binaryExponent(char c) noexcept {
  switch (c) {
  case 'K':
  case 'k':
    return 1;
  case 'M':
    return 2;
  case 'G':
    return 3;
  case 'T':
    return 4;
  case 'P':
    return 5;
  default:
    return 0;
  }
}

/// Split "12.5Ki" style tokens into the leading number and the remaining suffix.
bool splitNumber(std::string_view token, double& number, std::string_view& suffix) noexcept {
  const char* first = token.data();
  const char* last = token.data() + token.size();
  const auto RES = std::from_chars(first, last, number);
  if (RES.ec != std::errc{} || RES.ptr == first) {
    return false;
  }
  if (!std::isfinite(number) || number < 0.0) {
    return false;
  }
  suffix = std::string_view(RES.ptr, static_cast<std::size_t>(last - RES.ptr));
  return true;
}

ScaledValue parseCount(double v, std::string_view suffix) noexcept {
  if (suffix.empty()) {
    return scaled(v);
  }
  if (suffix.size() != 1) {
    return malformed();
  }
  switch (suffix[0]) {
  case 'K':
  case 'k':
    return scaled(v * 1.0e3);
  case 'M':
    return scaled(v * 1.0e6);
  case 'G':
    return scaled(v * 1.0e9);
  case 'T':
    return scaled(v * 1.0e12);
  default:
    return malformed();
  }
}

/// Bytes-based families. @p shift is log2 of the canonical unit (20 MB/s, 30 GiB).
ScaledValue parseBinary(double v, std::string_view suffix, int shift) noexcept {
  int exp = 0;
  if (!suffix.empty()) {
    // Accept "K", "KB", "Ki", "KiB" and the B/s forms arcstat sometimes prints
    exp = binaryExponent(suffix[0]);
    std::string_view rest = (exp == 0) ? suffix : suffix.substr(1);
    if (exp != 0 && !rest.empty() && rest.front() == 'i') {
      rest.remove_prefix(1);
    }
    if (!rest.empty() && rest.front() == 'B') {
      rest.remove_prefix(1);
    }
    if (rest == "/s") {
      rest = {};
    }
    if (!rest.empty()) {
      return malformed();
    }
  }
  return scaled(std::ldexp(v, 10 * exp - shift));
}

ScaledValue parseTime(double v, std::string_view suffix) noexcept {
  if (suffix.empty() || suffix == "ns") {
    return scaled(v / 1.0e6);
  }
  if (suffix == "us" || suffix == "\xC2\xB5s") {
    return scaled(v / 1.0e3);
  }
  if (suffix == "ms") {
    return scaled(v);
  }
  if (suffix == "s") {
    return scaled(v * 1.0e3);
  }
  return malformed();
}

ScaledValue parsePercent(double v, std::string_view suffix) noexcept {
  if (suffix.empty() || suffix == "%") {
    return scaled(v);
  }
  return malformed();
}

} // namespace

/* ----------------------------- toString ----------------------------- */

const char* toString(UnitFamily family) noexcept {
  switch (family) {
  case UnitFamily::COUNT:
    return "count";
  case UnitFamily::SIZE:
    return "size";
  case UnitFamily::BANDWIDTH:
    return "bandwidth";
  case UnitFamily::TIME:
    return "time";
  case UnitFamily::PERCENT:
    return "percent";
  }
  return "unknown";
}

const char* toString(TokenStatus status) noexcept {
  switch (status) {
  case TokenStatus::OK:
    return "ok";
  case TokenStatus::NOT_REPORTED:
    return "not reported";
  case TokenStatus::MALFORMED:
    return "malformed";
  }
  return "unknown";
}

/* ----------------------------- API ----------------------------- */

ScaledValue parseScaled(std::string_view token, UnitFamily family) noexcept {
  if (token == "-") {
    return ScaledValue{0.0, TokenStatus::NOT_REPORTED};
  }
  if (token.empty()) {
    return malformed();
  }

  double v = 0.0;
  std::string_view suffix;
  if (!splitNumber(token, v, suffix)) {
    return malformed();
  }

  switch (family) {
  case UnitFamily::COUNT:
    return parseCount(v, suffix);
  case UnitFamily::SIZE:
    return parseBinary(v, suffix, 30);
  case UnitFamily::BANDWIDTH:
    return parseBinary(v, suffix, 20);
  case UnitFamily::TIME:
    return parseTime(v, suffix);
  case UnitFamily::PERCENT:
    return parsePercent(v, suffix);
  }
  return malformed();
}

} // namespace telemetry

} // namespace poolscope
