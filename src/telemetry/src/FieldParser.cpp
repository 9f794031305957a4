/**
 * @file FieldParser.cpp
 * @brief Implementation of zpool iostat / arcstat line parsing.
 */

#include "src/telemetry/inc/FieldParser.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <cctype>

namespace poolscope {

namespace telemetry {

using helpers::strings::splitFields;

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

/// Parse @p token, recording a warning on failure. "-" is silently zero.
double fieldValue(std::string_view token, std::size_t column, std::string_view name,
                  UnitFamily family, std::vector<ParseWarning>& warnings) {
  const ScaledValue V = parseScaled(token, family);
  if (!V.ok()) {
    warnings.push_back(ParseWarning{column, std::string(name), std::string(token)});
  }
  return V.value;
}

/// Column headers and separator rows. The pool column is a free-form name, so
/// only the capacity, ops and bandwidth columns decide.
bool isIostatHeader(const std::vector<std::string_view>& tokens) noexcept {
  if (tokens[1] == "alloc") {
    return true;
  }
  for (std::size_t i = 1; i < IOSTAT_BASIC_COLUMNS; ++i) {
    if (parseScaled(tokens[i], IOSTAT_COLUMNS[i].family).ok()) {
      return false;
    }
  }
  return true;
}

double* latencySlot(PoolSample& s, const IostatColumn& col) noexcept {
  LatencySet* set = nullptr;
  if (col.direction == IoDirection::READ) {
    set = &s.read;
  } else if (col.direction == IoDirection::WRITE) {
    set = &s.write;
  }

  switch (col.field) {
  case IostatField::TOTAL_WAIT:
    return set != nullptr ? &set->totalWaitMs : nullptr;
  case IostatField::DISK_WAIT:
    return set != nullptr ? &set->diskWaitMs : nullptr;
  case IostatField::SYNCQ_WAIT:
    return set != nullptr ? &set->syncQueueWaitMs : nullptr;
  case IostatField::ASYNCQ_WAIT:
    return set != nullptr ? &set->asyncQueueWaitMs : nullptr;
  case IostatField::SCRUB_WAIT:
    return &s.scrubWaitMs;
  case IostatField::TRIM_WAIT:
    return &s.trimWaitMs;
  default:
    return nullptr;
  }
}

/// Destination for a non-pool iostat column.
double* iostatSlot(PoolSample& s, const IostatColumn& col) noexcept {
  switch (col.field) {
  case IostatField::ALLOC:
    return &s.allocGiB;
  case IostatField::FREE:
    return &s.freeGiB;
  case IostatField::OPS:
    return col.direction == IoDirection::READ ? &s.readIops : &s.writeIops;
  case IostatField::BANDWIDTH:
    return col.direction == IoDirection::READ ? &s.readBandwidthMBps : &s.writeBandwidthMBps;
  default:
    return latencySlot(s, col);
  }
}

} // namespace

/* ----------------------------- Iostat ----------------------------- */

std::optional<PoolSample> parseIostatLine(std::string_view line,
                                          std::vector<ParseWarning>& warnings) {
  const std::vector<std::string_view> TOKENS = splitFields(line);
  if (TOKENS.size() < IOSTAT_BASIC_COLUMNS || isIostatHeader(TOKENS)) {
    return std::nullopt;
  }

  // Latency columns are only trusted when the full -l block is present
  const std::size_t USABLE =
      TOKENS.size() >= IOSTAT_LATENCY_COLUMNS ? TOKENS.size() : IOSTAT_BASIC_COLUMNS;

  PoolSample s{};
  s.poolName = std::string(TOKENS[0]);

  for (const IostatColumn& col : IOSTAT_COLUMNS) {
    if (col.field == IostatField::POOL || col.index >= USABLE) {
      continue;
    }
    double* slot = iostatSlot(s, col);
    if (slot == nullptr) {
      continue;
    }
    *slot = fieldValue(TOKENS[col.index], col.index, col.name, col.family, warnings);
  }

  return s;
}

/* ----------------------------- Arcstat ----------------------------- */

std::vector<ArcstatColumn> arcstatColumns(bool hasL2arc) {
  std::vector<ArcstatColumn> out;
  out.reserve(ARCSTAT_COLUMNS.size());
  for (const ArcstatColumn& col : ARCSTAT_COLUMNS) {
    if (!col.l2arc || hasL2arc) {
      out.push_back(col);
    }
  }
  return out;
}

std::string arcstatFieldList(bool hasL2arc) {
  std::string out;
  for (const ArcstatColumn& col : arcstatColumns(hasL2arc)) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(col.name);
  }
  return out;
}

std::optional<ArcSample> parseArcstatLine(std::string_view line, bool hasL2arc,
                                          std::vector<ParseWarning>& warnings) {
  const std::vector<std::string_view> TOKENS = splitFields(line);
  if (TOKENS.empty()) {
    return std::nullopt;
  }
  // Data lines start with a digit or "-"; headers repeat the field names
  if (std::isalpha(static_cast<unsigned char>(TOKENS[0].front())) != 0) {
    return std::nullopt;
  }

  const std::vector<ArcstatColumn> COLS = arcstatColumns(hasL2arc);
  if (TOKENS.size() < COLS.size()) {
    return std::nullopt;
  }

  ArcSample s{};
  double zhits = 0.0;
  double zmisses = 0.0;
  if (hasL2arc) {
    s.l2arcHitPct = 0.0;
    s.l2arcSizeGiB = 0.0;
    s.l2arcReadMBps = 0.0;
  }

  for (std::size_t i = 0; i < COLS.size(); ++i) {
    const ArcstatColumn& col = COLS[i];
    const double V = fieldValue(TOKENS[i], i, col.name, col.family, warnings);
    switch (col.field) {
    case ArcField::HIT_PCT:
      s.hitPct = V;
      break;
    case ArcField::MISS_PCT:
      s.missPct = V;
      break;
    case ArcField::ARC_SIZE:
      s.arcSizeGiB = V;
      break;
    case ArcField::READS:
      s.readsPerSec = V;
      break;
    case ArcField::HITS:
      s.hitsPerSec = V;
      break;
    case ArcField::MISSES:
      s.missesPerSec = V;
      break;
    case ArcField::DEMAND_HIT_PCT:
      s.demandHitPct = V;
      break;
    case ArcField::PREFETCH_HIT_PCT:
      s.prefetchHitPct = V;
      break;
    case ArcField::MRU_PCT:
      s.mruPct = V;
      break;
    case ArcField::MFU_PCT:
      s.mfuPct = V;
      break;
    case ArcField::L2_HIT_PCT:
      s.l2arcHitPct = V;
      break;
    case ArcField::L2_SIZE:
      s.l2arcSizeGiB = V;
      break;
    case ArcField::L2_BYTES:
      s.l2arcReadMBps = V;
      break;
    case ArcField::ZFETCH_HITS:
      zhits = V;
      break;
    case ArcField::ZFETCH_MISSES:
      zmisses = V;
      break;
    }
  }

  const double LOOKUPS = zhits + zmisses;
  s.zfetchHitPct = LOOKUPS > 0.0 ? zhits / LOOKUPS * 100.0 : 0.0;
  return s;
}

} // namespace telemetry

} // namespace poolscope
