#pragma once

#include <ostream>
#include <string>

#include "tsdump/codec/cell_decoder.h"
#include "tsdump/core/types.h"
#include "tsdump/store/uid_resolver.h"

namespace tsdump {
namespace dump {

enum class DumpFormat {
    DEBUG,   // Row headers plus raw bytes of every column
    IMPORT   // One "metric timestamp value tags" line per cell
};

/**
 * @brief Renders decoded rows to a stream.
 *
 * Each row is rendered into a buffer first and written and flushed as one
 * unit, so a row that fails to decode leaves no partial output behind.
 */
class DumpFormatter {
public:
    DumpFormatter(std::ostream& out, DumpFormat format, const store::UidResolver& resolver);

    /**
     * @brief Decodes and writes one row.
     * @throws ResolutionError if the metric (or, in import format, a tag) is unknown
     * @throws IllegalDataError if a single point or annotation is malformed
     * @throws MalformedColumnError if a compacted column is malformed
     */
    void write_row(const core::Row& row);

    /**
     * @brief Same as write_row but returns the text instead of writing it
     */
    std::string format_row(const core::Row& row) const;

    DumpFormat format() const { return format_; }

    /**
     * @brief Human readable local date of a seconds or milliseconds timestamp,
     * e.g. "Tue Jan 01 00:00:00 UTC 2013"
     */
    static std::string format_date(core::Timestamp timestamp);

    /**
     * @brief Integers in decimal, floats in shortest form with a decimal point
     */
    static std::string format_value(const codec::CellValue& value);

private:
    void append_column(std::string& buf, const core::Row& row, const core::Column& column,
                       core::Timestamp base_time, const std::string& metric,
                       const std::string& import_tags) const;
    static void append_raw_cell(std::string& buf, const codec::Cell& cell, core::Timestamp base_time);
    static void append_import_cell(std::string& buf, const codec::Cell& cell, core::Timestamp base_time,
                                   const std::string& metric, const std::string& tags);
    static void append_annotation(std::string& buf, const core::Column& column,
                                  const codec::AnnotationColumn& annotation);

    std::ostream& out_;
    DumpFormat format_;
    const store::UidResolver& resolver_;
};

} // namespace dump
} // namespace tsdump
