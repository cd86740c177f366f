#include "tsdump/scan/scan_pipeline.h"
#include "tsdump/common/logger.h"
#include "tsdump/core/error.h"

namespace tsdump {
namespace scan {

namespace {

std::string default_label(const std::vector<query::Query>& queries) {
    std::string label;
    for (const auto& q : queries) {
        if (!label.empty()) {
            label += ",";
        }
        label += q.metric;
    }
    return label;
}

} // namespace

ScanPipeline::ScanPipeline(store::StoreClient& client, const store::UidResolver& resolver, std::ostream& out)
    : client_(client), resolver_(resolver), out_(out) {
}

uint64_t ScanPipeline::run(const std::vector<query::Query>& queries, const ScanOptions& options) {
    stats_ = ScanStats{};
    const std::string label = options.label.empty() ? default_label(queries) : options.label;
    dump::DumpFormatter formatter(out_, options.format, resolver_);
    auto last_tick = std::chrono::steady_clock::now();

    for (const auto& q : queries) {
        TSDUMP_DEBUG("Scanning {}", q.to_string());
        auto cursor = client_.scan(q);
        while (auto page = cursor->next_page()) {
            ++stats_.pages;
            for (const auto& row : *page) {
                ++stats_.rows_touched;

                if (!options.quiet) {
                    formatter.write_row(row);
                }

                if (options.delete_rows) {
                    auto now = std::chrono::steady_clock::now();
                    if (now - last_tick > options.progress_interval) {
                        ++stats_.progress_ticks;
                        TSDUMP_INFO("Still ({}) deleting {} rows touched = {}",
                                    stats_.progress_ticks, label, stats_.rows_touched);
                        last_tick = now;
                    }

                    auto result = client_.delete_row(row.key);
                    if (!result.ok()) {
                        throw core::StoreError("Delete of row " + core::bytes_to_string(row.key) +
                                               " in " + client_.table() + " failed: " + result.error());
                    }
                    ++stats_.rows_deleted;
                }
            }
        }
    }
    return stats_.rows_touched;
}

} // namespace scan
} // namespace tsdump
