#ifndef TSDUMP_QUERY_QUERY_H_
#define TSDUMP_QUERY_QUERY_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tsdump/core/types.h"

namespace tsdump {
namespace query {

/**
 * @brief Tag filter of a query: exact value, alternatives, or any value ("*")
 */
struct TagFilter {
    std::string tagk;
    std::vector<std::string> values;   // Empty means any value

    bool matches_any() const { return values.empty(); }
};

struct Downsample {
    int64_t interval_ms = 0;
    std::string aggregator;
};

/**
 * @brief Scan request for one metric over a time range.
 *
 * The aggregator and downsampling are carried for display; the dump never
 * aggregates.
 */
struct Query {
    std::string metric;
    std::vector<TagFilter> filters;
    core::Timestamp start = 0;         // Seconds or milliseconds
    core::Timestamp end = 0;           // Seconds or milliseconds
    std::string aggregator = "sum";
    bool rate = false;
    std::optional<Downsample> downsample;

    /** Start of the scan in seconds. */
    int64_t start_seconds() const;
    /** End of the scan in seconds. */
    int64_t end_seconds() const;

    std::string to_string() const;
};

/**
 * @brief Query used by batch delete: everything up to end for one metric, summed
 */
Query make_delete_query(const std::string& metric, core::Timestamp end);

} // namespace query
} // namespace tsdump

#endif // TSDUMP_QUERY_QUERY_H_
