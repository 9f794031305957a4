#ifndef POOLSCOPE_TELEMETRY_FIELD_PARSER_HPP
#define POOLSCOPE_TELEMETRY_FIELD_PARSER_HPP
/**
 * @file FieldParser.hpp
 * @brief Raw line to typed sample conversion for zpool iostat and arcstat.
 * @note Thread-safe: Pure functions over caller-owned buffers.
 *
 * `zpool iostat -H -l <pool> <interval>` emits one tab-separated line per
 * report. Column positions are fixed by IOSTAT_COLUMNS; read/write pairs are
 * interleaved (ops r, ops w, bw r, bw w, total_wait r, total_wait w, ...).
 *
 * `arcstat -p -f <fields> <interval>` emits the requested fields in order,
 * raw numbers, with header lines reprinted periodically.
 */

#include "src/telemetry/inc/Sample.hpp"
#include "src/telemetry/inc/UnitParser.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Iostat Layout ----------------------------- */

/// Bumped whenever IOSTAT_COLUMNS changes meaning.
inline constexpr int IOSTAT_LAYOUT_VERSION = 2;

/// Minimum columns for a data line (pool, capacity, ops, bandwidth).
inline constexpr std::size_t IOSTAT_BASIC_COLUMNS = 7;

/// Columns required before latency fields are read.
inline constexpr std::size_t IOSTAT_LATENCY_COLUMNS = 15;

/**
 * @brief Logical quantity carried by an iostat column.
 */
enum class IostatField : std::uint8_t {
  POOL = 0,
  ALLOC,
  FREE,
  OPS,
  BANDWIDTH,
  TOTAL_WAIT,
  DISK_WAIT,
  SYNCQ_WAIT,
  ASYNCQ_WAIT,
  SCRUB_WAIT,
  TRIM_WAIT,
};

/**
 * @brief I/O direction of a paired column.
 */
enum class IoDirection : std::uint8_t {
  NONE = 0,
  READ,
  WRITE,
};

/**
 * @brief One entry of the iostat column table.
 */
struct IostatColumn {
  std::size_t index;
  IostatField field;
  IoDirection direction;
  UnitFamily family;
  std::string_view name;
};

/// Column table for `zpool iostat -H -l` (layout version 2).
inline constexpr std::array<IostatColumn, 17> IOSTAT_COLUMNS{{
    {0, IostatField::POOL, IoDirection::NONE, UnitFamily::COUNT, "pool"},
    {1, IostatField::ALLOC, IoDirection::NONE, UnitFamily::SIZE, "alloc"},
    {2, IostatField::FREE, IoDirection::NONE, UnitFamily::SIZE, "free"},
    {3, IostatField::OPS, IoDirection::READ, UnitFamily::COUNT, "read_ops"},
    {4, IostatField::OPS, IoDirection::WRITE, UnitFamily::COUNT, "write_ops"},
    {5, IostatField::BANDWIDTH, IoDirection::READ, UnitFamily::BANDWIDTH, "read_bw"},
    {6, IostatField::BANDWIDTH, IoDirection::WRITE, UnitFamily::BANDWIDTH, "write_bw"},
    {7, IostatField::TOTAL_WAIT, IoDirection::READ, UnitFamily::TIME, "total_wait_read"},
    {8, IostatField::TOTAL_WAIT, IoDirection::WRITE, UnitFamily::TIME, "total_wait_write"},
    {9, IostatField::DISK_WAIT, IoDirection::READ, UnitFamily::TIME, "disk_wait_read"},
    {10, IostatField::DISK_WAIT, IoDirection::WRITE, UnitFamily::TIME, "disk_wait_write"},
    {11, IostatField::SYNCQ_WAIT, IoDirection::READ, UnitFamily::TIME, "syncq_wait_read"},
    {12, IostatField::SYNCQ_WAIT, IoDirection::WRITE, UnitFamily::TIME, "syncq_wait_write"},
    {13, IostatField::ASYNCQ_WAIT, IoDirection::READ, UnitFamily::TIME, "asyncq_wait_read"},
    {14, IostatField::ASYNCQ_WAIT, IoDirection::WRITE, UnitFamily::TIME, "asyncq_wait_write"},
    {15, IostatField::SCRUB_WAIT, IoDirection::NONE, UnitFamily::TIME, "scrub_wait"},
    {16, IostatField::TRIM_WAIT, IoDirection::NONE, UnitFamily::TIME, "trim_wait"},
}};

/* ----------------------------- Arcstat Layout ----------------------------- */

/**
 * @brief Logical quantity carried by an arcstat field.
 */
enum class ArcField : std::uint8_t {
  HIT_PCT = 0,
  MISS_PCT,
  ARC_SIZE,
  READS,
  HITS,
  MISSES,
  DEMAND_HIT_PCT,
  PREFETCH_HIT_PCT,
  MRU_PCT,
  MFU_PCT,
  L2_HIT_PCT,
  L2_SIZE,
  L2_BYTES,
  ZFETCH_HITS,
  ZFETCH_MISSES,
};

/**
 * @brief One requested arcstat field.
 */
struct ArcstatColumn {
  std::string_view name; ///< arcstat field name passed to -f
  ArcField field;
  UnitFamily family;
  bool l2arc; ///< Only requested when L2ARC is present
};

/// All arcstat fields in request order; l2arc entries are dropped without L2ARC.
inline constexpr std::array<ArcstatColumn, 15> ARCSTAT_COLUMNS{{
    {"hit%", ArcField::HIT_PCT, UnitFamily::PERCENT, false},
    {"miss%", ArcField::MISS_PCT, UnitFamily::PERCENT, false},
    {"arcsz", ArcField::ARC_SIZE, UnitFamily::SIZE, false},
    {"read", ArcField::READS, UnitFamily::COUNT, false},
    {"hits", ArcField::HITS, UnitFamily::COUNT, false},
    {"miss", ArcField::MISSES, UnitFamily::COUNT, false},
    {"dh%", ArcField::DEMAND_HIT_PCT, UnitFamily::PERCENT, false},
    {"ph%", ArcField::PREFETCH_HIT_PCT, UnitFamily::PERCENT, false},
    {"mrusz%", ArcField::MRU_PCT, UnitFamily::PERCENT, false},
    {"mfusz%", ArcField::MFU_PCT, UnitFamily::PERCENT, false},
    {"l2hit%", ArcField::L2_HIT_PCT, UnitFamily::PERCENT, true},
    {"l2size", ArcField::L2_SIZE, UnitFamily::SIZE, true},
    {"l2bytes", ArcField::L2_BYTES, UnitFamily::BANDWIDTH, true},
    {"zhits", ArcField::ZFETCH_HITS, UnitFamily::COUNT, false},
    {"zmisses", ArcField::ZFETCH_MISSES, UnitFamily::COUNT, false},
}};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse one `zpool iostat -H [-l]` line.
 * @param line     Raw line (tab or space separated).
 * @param warnings Receives one entry per unparsable field (field is zeroed).
 * @return Sample with timestamp, label and phase unset, or nullopt for blank,
 *         header and short (< IOSTAT_BASIC_COLUMNS) lines.
 * @note Lines with fewer than IOSTAT_LATENCY_COLUMNS columns leave latency at 0.
 */
[[nodiscard]] std::optional<PoolSample> parseIostatLine(std::string_view line,
                                                        std::vector<ParseWarning>& warnings);

/**
 * @brief Columns requested from arcstat for the given L2ARC presence.
 */
[[nodiscard]] std::vector<ArcstatColumn> arcstatColumns(bool hasL2arc);

/**
 * @brief Comma-joined field list for `arcstat -f`.
 * @return e.g. "hit%,miss%,arcsz,read,hits,miss,dh%,ph%,mrusz%,mfusz%,zhits,zmisses".
 */
[[nodiscard]] std::string arcstatFieldList(bool hasL2arc);

/**
 * @brief Parse one `arcstat -p` line.
 * @param line      Raw line.
 * @param hasL2arc  Field set the collector requested.
 * @param warnings  Receives one entry per unparsable field (field is zeroed).
 * @return Sample with l2arc fields engaged iff @p hasL2arc, or nullopt for
 *         blank, header and short lines.
 */
[[nodiscard]] std::optional<ArcSample> parseArcstatLine(std::string_view line, bool hasL2arc,
                                                        std::vector<ParseWarning>& warnings);

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_FIELD_PARSER_HPP
