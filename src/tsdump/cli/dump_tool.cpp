#include "tsdump/cli/dump_tool.h"
#include "tsdump/common/logger.h"
#include "tsdump/core/error.h"
#include "tsdump/query/query_parser.h"
#include "tsdump/scan/batch_delete.h"
#include "tsdump/scan/scan_pipeline.h"
#include "tsdump/store/json_snapshot.h"

#include <chrono>
#include <utility>

namespace tsdump {
namespace cli {

DumpTool::DumpTool(Options options, std::ostream& out)
    : options_(std::move(options)), out_(out) {
}

int DumpTool::run() {
    const auto& config = options_.config;
    if (config.store_path.empty()) {
        TSDUMP_ERROR("No store configured: use --store or store_path in the config file");
        return EXIT_STORE_ERROR;
    }

    store::MemoryStore store(config.data_table, config.page_size);
    auto loaded = store::JsonSnapshot::load(config.store_path, store);
    if (!loaded.ok()) {
        TSDUMP_ERROR("{}", loaded.error());
        return EXIT_STORE_ERROR;
    }

    int rc = run_with_store(store);

    if (store.deletes() > 0) {
        auto saved = store::JsonSnapshot::save(config.store_path, store);
        if (!saved.ok()) {
            TSDUMP_ERROR("{}", saved.error());
            return rc == EXIT_OK ? EXIT_STORE_ERROR : rc;
        }
    }
    return rc;
}

int DumpTool::run_with_store(store::MemoryStore& store) {
    try {
        if (options_.mode == Mode::BATCH_DELETE_OLDER) {
            return run_batch(store);
        }
        return run_scan(store);
    } catch (const core::InvalidArgumentError& e) {
        TSDUMP_ERROR("{}", e.what());
        return EXIT_BAD_ARGUMENTS;
    } catch (const core::ResolutionError& e) {
        TSDUMP_ERROR("{}: {}", e.name(), e.what());
        return EXIT_DATA_ERROR;
    } catch (const core::IllegalDataError& e) {
        TSDUMP_ERROR("{}: {}", e.name(), e.what());
        return EXIT_DATA_ERROR;
    } catch (const core::StoreError& e) {
        TSDUMP_ERROR("{}: {}", e.name(), e.what());
        return EXIT_STORE_ERROR;
    }
}

int DumpTool::run_scan(store::MemoryStore& store) {
    auto queries = query::parse_query(options_.args);

    scan::ScanOptions scan_options;
    scan_options.delete_rows = options_.mode == Mode::DELETE;
    scan_options.format = options_.mode == Mode::SCAN ? dump::DumpFormat::DEBUG : dump::DumpFormat::IMPORT;
    scan_options.progress_interval = options_.config.progress_interval;

    scan::ScanPipeline pipeline(store, store, out_);
    uint64_t rows = pipeline.run(queries, scan_options);
    TSDUMP_INFO("Scanned {} rows in {} pages{}", rows, pipeline.stats().pages,
                scan_options.delete_rows ? ", deleted " + std::to_string(pipeline.stats().rows_deleted) : "");
    return EXIT_OK;
}

int DumpTool::run_batch(store::MemoryStore& store) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    core::Timestamp end_time = query::parse_date(options_.args[0], static_cast<core::Timestamp>(now));

    scan::BatchDeleteConfig config;
    config.num_workers = options_.config.batch_workers;
    config.progress_interval = options_.config.progress_interval;

    scan::BatchDeleter deleter(store, store, out_, config);
    auto report = deleter.run(end_time, options_.args[1]);
    if (report.metrics_failed > 0) {
        for (const auto& failure : report.failures) {
            TSDUMP_ERROR("Metric {} failed on worker [{}]: {}: {}",
                         failure.metric, failure.worker, failure.error_type, failure.message);
        }
        return EXIT_BATCH_FAILURES;
    }
    return EXIT_OK;
}

} // namespace cli
} // namespace tsdump
