#include "tsdump/dump/formatter.h"
#include "tsdump/codec/qualifier.h"
#include "tsdump/codec/row_key.h"
#include "tsdump/core/error.h"

#include <ctime>

#include <spdlog/fmt/fmt.h>

namespace tsdump {
namespace dump {

namespace {

// Visitor overload set for DecodedColumn.
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string debug_tags(const core::Bytes& key, const store::UidResolver& resolver) {
    try {
        auto tags = codec::resolve_tags(key, resolver);
        std::string out = "{";
        for (size_t i = 0; i < tags.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += tags[i].first + "=" + tags[i].second;
        }
        return out + "}";
    } catch (const core::ResolutionError& e) {
        return std::string(e.name()) + ": " + e.what();
    }
}

std::string import_tags(const core::Bytes& key, const store::UidResolver& resolver) {
    std::string out;
    for (const auto& tag : codec::resolve_tags(key, resolver)) {
        out += ' ' + tag.first + '=' + tag.second;
    }
    return out;
}

} // namespace

DumpFormatter::DumpFormatter(std::ostream& out, DumpFormat format, const store::UidResolver& resolver)
    : out_(out), format_(format), resolver_(resolver) {
}

void DumpFormatter::write_row(const core::Row& row) {
    std::string buf = format_row(row);
    out_ << buf;
    out_.flush();
}

std::string DumpFormatter::format_row(const core::Row& row) const {
    const core::Timestamp base_time = codec::base_time(row.key);

    std::string metric;
    std::string tags;
    try {
        metric = codec::metric_name(row.key, resolver_);
        if (format_ == DumpFormat::IMPORT) {
            tags = import_tags(row.key, resolver_);
        }
    } catch (const core::ResolutionError& e) {
        throw core::ResolutionError(std::string(e.what()) + " in row " + core::bytes_to_string(row.key));
    }

    std::string buf;
    if (format_ == DumpFormat::DEBUG) {
        buf += core::bytes_to_string(row.key);
        buf += ' ' + metric + ' ' + std::to_string(base_time) + " (" + format_date(base_time) + ") ";
        buf += debug_tags(row.key, resolver_);
        buf += '\n';
    }

    for (const auto& column : row.columns) {
        std::string line = format_ == DumpFormat::DEBUG ? "  " : "";
        size_t header = line.size();
        append_column(line, row, column, base_time, metric, tags);
        if (line.size() > header) {
            buf += line;
            buf += '\n';
        }
    }
    return buf;
}

void DumpFormatter::append_column(std::string& buf, const core::Row& row, const core::Column& column,
                                  core::Timestamp base_time, const std::string& metric,
                                  const std::string& import_tags) const {
    const bool debug = format_ == DumpFormat::DEBUG;
    // Import output only carries data points; odd-length qualifiers are never decoded.
    if (!debug && column.qualifier.size() % 2 != 0) {
        return;
    }
    auto decoded = codec::decode_column(column, base_time);

    std::visit(overloaded{
        [&](const codec::PointColumn& point) {
            if (debug) {
                append_raw_cell(buf, point.cell, base_time);
            } else {
                append_import_cell(buf, point.cell, base_time, metric, import_tags);
            }
        },
        [&](const codec::CompactedColumn& compacted) {
            if (debug) {
                buf += core::bytes_to_string(column.qualifier) + '\t' + core::bytes_to_string(column.value) +
                       " = " + std::to_string(compacted.cells.size()) + " values:";
            }
            for (size_t i = 0; i < compacted.cells.size(); ++i) {
                if (debug) {
                    buf += "\n    ";
                    append_raw_cell(buf, compacted.cells[i], base_time);
                } else {
                    append_import_cell(buf, compacted.cells[i], base_time, metric, import_tags);
                    if (i + 1 < compacted.cells.size()) {
                        buf += '\n';
                    }
                }
            }
        },
        [&](const codec::AnnotationColumn& annotation) {
            if (debug) {
                append_annotation(buf, column, annotation);
            }
        },
        [&](const codec::OpaqueColumn&) {
            if (debug) {
                buf += core::bytes_to_string(column.value) + "\t[Not a data point]";
            }
        },
        [&](const codec::MalformedColumn& malformed) {
            std::string where = " in row " + core::bytes_to_string(row.key) + " (" + metric + ")";
            if (malformed.kind == codec::ColumnKind::COMPACTED) {
                throw core::MalformedColumnError(malformed.reason + where);
            }
            throw core::IllegalDataError(malformed.reason + where);
        },
    }, decoded);
}

void DumpFormatter::append_raw_cell(std::string& buf, const codec::Cell& cell, core::Timestamp base_time) {
    const core::Timestamp timestamp = cell.absolute_timestamp(base_time);
    buf += core::bytes_to_string(cell.qualifier);
    buf += '\t';
    buf += core::bytes_to_string(cell.value);
    buf += '\t';
    buf += std::to_string(cell.display_offset(base_time));
    buf += '\t';
    buf += cell.is_integer ? "l" : "f";
    buf += '\t';
    buf += std::to_string(timestamp);
    buf += "\t(" + format_date(timestamp) + ")";
}

void DumpFormatter::append_import_cell(std::string& buf, const codec::Cell& cell, core::Timestamp base_time,
                                       const std::string& metric, const std::string& tags) {
    buf += metric;
    buf += ' ';
    buf += std::to_string(cell.absolute_timestamp(base_time));
    buf += ' ';
    buf += format_value(cell.parse_value());
    buf += tags;
}

void DumpFormatter::append_annotation(std::string& buf, const core::Column& column,
                                      const codec::AnnotationColumn& annotation) {
    buf += core::bytes_to_string(column.qualifier);
    buf += '\t';
    buf += core::bytes_to_string(column.value);
    buf += '\t';
    buf += std::to_string(annotation.offset_ms / 1000);
    buf += '\t';
    buf += annotation.text;
    buf += '\t';
    buf += std::to_string(annotation.timestamp);
    buf += "\t(" + format_date(annotation.timestamp) + ")";
}

std::string DumpFormatter::format_date(core::Timestamp timestamp) {
    std::time_t seconds = static_cast<std::time_t>(
        codec::in_milliseconds(timestamp) ? timestamp / 1000 : timestamp);
    std::tm tm{};
    if (localtime_r(&seconds, &tm) == nullptr) {
        return "invalid date";
    }
    char out[64];
    size_t n = std::strftime(out, sizeof(out), "%a %b %d %H:%M:%S %Z %Y", &tm);
    return std::string(out, n);
}

std::string DumpFormatter::format_value(const codec::CellValue& value) {
    if (std::holds_alternative<int64_t>(value)) {
        return std::to_string(std::get<int64_t>(value));
    }
    std::string text = fmt::format("{}", std::get<double>(value));
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace dump
} // namespace tsdump
