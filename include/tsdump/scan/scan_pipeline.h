#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "tsdump/dump/formatter.h"
#include "tsdump/query/query.h"
#include "tsdump/store/store.h"
#include "tsdump/store/uid_resolver.h"

namespace tsdump {
namespace scan {

/**
 * @brief Options of one scan pass
 */
struct ScanOptions {
    bool delete_rows = false;          // Issue a delete for every scanned row
    bool quiet = false;                // Skip decoding and output entirely
    dump::DumpFormat format = dump::DumpFormat::DEBUG;
    std::chrono::milliseconds progress_interval{60'000};  // Between progress lines while deleting
    std::string label;                 // Shown in progress lines; defaults to the query metrics
};

/**
 * @brief Counters of the last run
 */
struct ScanStats {
    uint64_t rows_touched = 0;
    uint64_t rows_deleted = 0;
    uint64_t pages = 0;
    uint64_t progress_ticks = 0;
};

/**
 * @brief Drives queries through store cursors, dumping and/or deleting rows.
 *
 * A pipeline is used by one thread at a time; batch workers each own one.
 * Rows are handled in cursor order, and a page is fully processed before
 * the next one is fetched.
 */
class ScanPipeline {
public:
    ScanPipeline(store::StoreClient& client, const store::UidResolver& resolver, std::ostream& out);

    /**
     * @brief Runs every query in sequence
     * @return total rows touched
     * @throws ResolutionError, IllegalDataError or MalformedColumnError from decoding
     * @throws StoreError when a delete fails
     */
    uint64_t run(const std::vector<query::Query>& queries, const ScanOptions& options);

    const ScanStats& stats() const { return stats_; }

private:
    store::StoreClient& client_;
    const store::UidResolver& resolver_;
    std::ostream& out_;
    ScanStats stats_;
};

} // namespace scan
} // namespace tsdump
