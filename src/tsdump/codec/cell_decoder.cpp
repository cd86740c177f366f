#include "tsdump/codec/cell_decoder.h"
#include "tsdump/codec/const.h"
#include "tsdump/codec/qualifier.h"
#include "tsdump/core/error.h"

#include <optional>
#include <string>

namespace tsdump {
namespace codec {

namespace {

// Empty when the value bytes are consistent with the qualifier flags.
std::optional<std::string> check_value(uint8_t flags, size_t value_size) {
    size_t expected = value_length_from_flags(flags);
    if (value_size != expected) {
        return "value length " + std::to_string(value_size) + " does not match flags length " +
               std::to_string(expected);
    }
    if (is_float(flags)) {
        if (expected != 4 && expected != 8) {
            return "floating point value of length " + std::to_string(expected);
        }
    } else if (expected != 1 && expected != 2 && expected != 4 && expected != 8) {
        return "integer value of length " + std::to_string(expected);
    }
    return std::nullopt;
}

Cell cell_at(const core::Bytes& qualifier, size_t pos, size_t width, core::Bytes value) {
    Cell cell;
    cell.qualifier.assign(qualifier.begin() + pos, qualifier.begin() + pos + width);
    cell.value = std::move(value);
    cell.offset_ms = offset_from_qualifier(qualifier, pos);
    cell.is_integer = !is_float(flags_from_qualifier(qualifier, pos));
    cell.in_milliseconds = in_milliseconds(qualifier, pos);
    return cell;
}

std::string describe(const core::Column& column) {
    return "qualifier=" + core::bytes_to_string(column.qualifier) +
           " value=" + core::bytes_to_string(column.value);
}

// Annotation payloads are ISO-8859-1; re-encode as UTF-8 for the terminal.
std::string latin1_to_utf8(const core::Bytes& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes) {
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
        } else {
            out.push_back(static_cast<char>(0xC0 | (b >> 6)));
            out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
    }
    return out;
}

DecodedColumn decode_annotation(const core::Column& column, core::Timestamp base_time) {
    const auto& q = column.qualifier;
    AnnotationColumn annotation;
    // A bare prefix byte is an annotation at the row base time.
    if (q.size() > 1) {
        if (q.size() != 1 + qualifier_width(q, 1)) {
            return MalformedColumn{ColumnKind::ANNOTATION,
                                   "annotation qualifier of length " + std::to_string(q.size())};
        }
        annotation.offset_ms = offset_from_qualifier(q, 1);
    }
    annotation.timestamp = base_time * 1000 + annotation.offset_ms;
    annotation.text = latin1_to_utf8(column.value);
    return annotation;
}

} // namespace

core::Timestamp Cell::absolute_timestamp(core::Timestamp base_time) const {
    if (in_milliseconds) {
        return base_time * 1000 + offset_ms;
    }
    return base_time + offset_ms / 1000;
}

int64_t Cell::display_offset(core::Timestamp base_time) const {
    if (codec::in_milliseconds(absolute_timestamp(base_time))) {
        return offset_ms;
    }
    return offset_ms / 1000;
}

CellValue Cell::parse_value() const {
    if (is_integer) {
        return decode_integer(value);
    }
    return decode_float(value);
}

ColumnKind classify_column(const core::Bytes& qualifier) {
    if (qualifier.size() % 2 != 0) {
        if (qualifier[0] == kAnnotationPrefix) {
            return ColumnKind::ANNOTATION;
        }
        return ColumnKind::OPAQUE;
    }
    if (qualifier.size() == 2 || (qualifier.size() == 4 && in_milliseconds(qualifier))) {
        return ColumnKind::POINT;
    }
    return ColumnKind::COMPACTED;
}

DecodedColumn decode_column(const core::Column& column, core::Timestamp base_time) {
    switch (classify_column(column.qualifier)) {
        case ColumnKind::ANNOTATION:
            return decode_annotation(column, base_time);
        case ColumnKind::OPAQUE:
            return OpaqueColumn{};
        case ColumnKind::POINT:
            try {
                return PointColumn{parse_single_value(column)};
            } catch (const core::IllegalDataError& e) {
                return MalformedColumn{ColumnKind::POINT, e.what()};
            }
        case ColumnKind::COMPACTED:
            try {
                return extract_data_points(column);
            } catch (const core::MalformedColumnError& e) {
                return MalformedColumn{ColumnKind::COMPACTED, e.what()};
            }
    }
    return MalformedColumn{ColumnKind::OPAQUE, "unknown column kind"};
}

Cell parse_single_value(const core::Column& column) {
    const auto& q = column.qualifier;
    if (classify_column(q) != ColumnKind::POINT) {
        throw core::IllegalDataError("Not a single data point: " + describe(column));
    }
    auto problem = check_value(flags_from_qualifier(q), column.value.size());
    if (problem) {
        throw core::IllegalDataError("Unable to parse row: " + *problem + ": " + describe(column));
    }
    return cell_at(q, 0, q.size(), column.value);
}

CompactedColumn extract_data_points(const core::Column& column) {
    const auto& q = column.qualifier;
    const auto& v = column.value;
    if (q.empty()) {
        throw core::MalformedColumnError("Empty compacted qualifier: " + describe(column));
    }

    CompactedColumn compacted;
    size_t q_pos = 0;
    size_t v_pos = 0;
    while (q_pos < q.size()) {
        size_t width = qualifier_width(q, q_pos);
        if (q_pos + width > q.size()) {
            throw core::MalformedColumnError("Truncated sub-qualifier at byte " + std::to_string(q_pos) +
                                             ": " + describe(column));
        }
        uint8_t flags = flags_from_qualifier(q, q_pos);
        size_t len = value_length_from_flags(flags);
        if (v_pos + len > v.size()) {
            throw core::MalformedColumnError("Value overrun at cell " + std::to_string(compacted.cells.size()) +
                                             ": " + describe(column));
        }
        auto problem = check_value(flags, len);
        if (problem) {
            throw core::MalformedColumnError("Bad cell " + std::to_string(compacted.cells.size()) + ": " +
                                             *problem + ": " + describe(column));
        }
        compacted.cells.push_back(
            cell_at(q, q_pos, width, core::Bytes(v.begin() + v_pos, v.begin() + v_pos + len)));
        q_pos += width;
        v_pos += len;
    }

    size_t remaining = v.size() - v_pos;
    if (remaining == 1) {
        uint8_t meta = v[v_pos];
        if (meta != kCompactMetaDefault && meta != kCompactMetaMixed) {
            throw core::MalformedColumnError("Unknown compaction meta byte " + std::to_string(meta) +
                                             ": " + describe(column));
        }
        compacted.has_meta = true;
        compacted.meta = meta;
    } else if (remaining != 0) {
        throw core::MalformedColumnError(std::to_string(remaining) + " trailing value bytes: " +
                                         describe(column));
    }
    return compacted;
}

core::Column compact_cells(const std::vector<Cell>& cells, bool with_meta, uint8_t meta) {
    core::Column column;
    for (const auto& cell : cells) {
        column.qualifier.insert(column.qualifier.end(), cell.qualifier.begin(), cell.qualifier.end());
        column.value.insert(column.value.end(), cell.value.begin(), cell.value.end());
    }
    if (with_meta) {
        column.value.push_back(meta);
    }
    return column;
}

Cell make_cell(uint32_t offset_ms, bool ms, int64_t value) {
    uint8_t flags = 0;
    core::Bytes encoded = encode_integer(value, flags);
    core::Bytes q = build_qualifier(offset_ms, flags, ms);
    return cell_at(q, 0, q.size(), std::move(encoded));
}

Cell make_float_cell(uint32_t offset_ms, bool ms, double value) {
    uint8_t flags = 0;
    core::Bytes encoded = encode_float(value, flags);
    core::Bytes q = build_qualifier(offset_ms, flags, ms);
    return cell_at(q, 0, q.size(), std::move(encoded));
}

} // namespace codec
} // namespace tsdump
