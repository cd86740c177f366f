#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "tsdump/core/types.h"

namespace tsdump {
namespace codec {

/**
 * @brief Integer or floating point value of a cell
 */
using CellValue = std::variant<int64_t, double>;

/**
 * @brief One logical data point peeled from a column
 */
struct Cell {
    core::Bytes qualifier;     // 2 or 4 bytes
    core::Bytes value;
    uint32_t offset_ms = 0;    // Always milliseconds, even for seconds qualifiers
    bool is_integer = true;
    bool in_milliseconds = false;

    /**
     * @brief base_time * 1000 + offset for millisecond cells, base_time + offset / 1000 otherwise
     */
    core::Timestamp absolute_timestamp(core::Timestamp base_time) const;

    /**
     * @brief Offset as shown by the dump: milliseconds when the absolute
     * timestamp is in milliseconds, seconds otherwise
     */
    int64_t display_offset(core::Timestamp base_time) const;

    /**
     * @throws IllegalDataError when the value bytes do not fit the flags
     */
    CellValue parse_value() const;
};

enum class ColumnKind {
    POINT,
    COMPACTED,
    ANNOTATION,
    OPAQUE
};

struct PointColumn {
    Cell cell;
};

struct CompactedColumn {
    std::vector<Cell> cells;   // Stored order
    bool has_meta = false;     // Whether a trailing meta byte was present
    uint8_t meta = 0;
};

struct AnnotationColumn {
    uint32_t offset_ms = 0;
    core::Timestamp timestamp = 0;  // Milliseconds
    std::string text;
};

/**
 * @brief Odd-length column that is not an annotation; only raw bytes are shown
 */
struct OpaqueColumn {
};

/**
 * @brief A point or compacted column whose bytes violate the encoding.
 *
 * No cells are kept; the decode is all or nothing.
 */
struct MalformedColumn {
    ColumnKind kind;
    std::string reason;
};

using DecodedColumn = std::variant<PointColumn, CompactedColumn, AnnotationColumn, OpaqueColumn, MalformedColumn>;

/**
 * @brief Picks the decoding path from the qualifier alone
 */
ColumnKind classify_column(const core::Bytes& qualifier);

/**
 * @brief Decodes one column against its row base time (seconds).
 *
 * Never throws on bad bytes: integrity violations come back as
 * MalformedColumn so the caller decides how fatal they are.
 */
DecodedColumn decode_column(const core::Column& column, core::Timestamp base_time);

/**
 * @throws IllegalDataError if the column is not a well-formed single point
 */
Cell parse_single_value(const core::Column& column);

/**
 * @throws MalformedColumnError if the buffers are not consumed exactly
 */
CompactedColumn extract_data_points(const core::Column& column);

/**
 * @brief Concatenates cells back into one column, appending the meta byte if requested
 */
core::Column compact_cells(const std::vector<Cell>& cells, bool with_meta = true, uint8_t meta = 0);

/**
 * @brief Builds a cell from its parts (used by the store fixtures)
 */
Cell make_cell(uint32_t offset_ms, bool ms, int64_t value);
Cell make_float_cell(uint32_t offset_ms, bool ms, double value);

} // namespace codec
} // namespace tsdump
