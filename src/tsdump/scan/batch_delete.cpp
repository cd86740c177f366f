#include "tsdump/scan/batch_delete.h"
#include "tsdump/common/logger.h"
#include "tsdump/core/error.h"
#include "tsdump/query/query.h"
#include "tsdump/scan/scan_pipeline.h"

#include <numeric>
#include <system_error>

namespace tsdump {
namespace scan {

BatchDeleter::BatchDeleter(store::StoreClient& client, const store::UidResolver& resolver,
                           std::ostream& out, const BatchDeleteConfig& config)
    : client_(client), resolver_(resolver), out_(out), config_(config) {
}

BatchDeleter::~BatchDeleter() {
    stopWorkers();
}

BatchDeleteReport BatchDeleter::run(core::Timestamp end_time, const std::string& metric_prefix) {
    if (config_.num_workers == 0) {
        throw core::InvalidArgumentError("Invalid number of workers: 0");
    }

    end_time_ = end_time;
    queue_ = std::make_unique<WorkQueue<std::string>>();
    for (auto& metric : resolver_.suggest_metrics(metric_prefix, config_.max_metrics)) {
        if (!queue_->push(std::move(metric))) {
            throw core::InternalError("Metric queue closed while filling it");
        }
    }
    queue_->close();
    total_ = queue_->total();
    TSDUMP_INFO("Batch delete of {} metrics matching '{}' up to {} with {} workers",
                total_, metric_prefix, end_time, config_.num_workers);

    rows_per_worker_.assign(config_.num_workers, 0);
    metrics_done_.store(0);
    failures_.clear();

    startWorkers();
    stopWorkers();

    BatchDeleteReport report;
    report.metrics_total = total_;
    report.metrics_done = metrics_done_.load();
    report.rows_per_worker = rows_per_worker_;
    report.rows_touched = std::accumulate(rows_per_worker_.begin(), rows_per_worker_.end(), uint64_t{0});
    {
        std::lock_guard<std::mutex> lock(failures_mutex_);
        report.failures = failures_;
    }
    report.metrics_failed = report.failures.size();
    TSDUMP_INFO("Batch delete finished: {}/{} metrics done, {} failed, {} rows touched",
                report.metrics_done, report.metrics_total, report.metrics_failed, report.rows_touched);
    return report;
}

void BatchDeleter::workerThread(uint32_t worker_id) {
    while (auto claimed = queue_->try_pop()) {
        processMetric(worker_id, claimed->first, claimed->second);
    }
    TSDUMP_DEBUG("[{}] No more metrics, worker exiting", worker_id);
}

void BatchDeleter::processMetric(uint32_t worker_id, const std::string& metric, size_t claim) {
    TSDUMP_INFO("[{}] Issue batch delete for metric: {}... ({}/{})", worker_id, metric, claim, total_);
    auto t0 = std::chrono::steady_clock::now();

    ScanOptions options;
    options.delete_rows = true;
    options.quiet = true;
    options.progress_interval = config_.progress_interval;
    options.label = metric;

    ScanPipeline pipeline(client_, resolver_, out_);
    BatchFailure failure;
    try {
        uint64_t rows = pipeline.run({query::make_delete_query(metric, end_time_)}, options);
        rows_per_worker_[worker_id] += rows;
        metrics_done_.fetch_add(1);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        TSDUMP_INFO("[{}] Done batch delete for metric: {}. Touched {} rows in {}ms",
                    worker_id, metric, rows, elapsed);
        return;
    } catch (const core::Error& e) {
        failure = BatchFailure{worker_id, metric, e.name(), e.what()};
    } catch (const std::exception& e) {
        failure = BatchFailure{worker_id, metric, "std::exception", e.what()};
    }

    // Rows deleted before the failure still count as touched.
    rows_per_worker_[worker_id] += pipeline.stats().rows_touched;
    TSDUMP_ERROR("[{}] Batch delete for metric {} died with {}: {} (after {} rows)",
                 worker_id, metric, failure.error_type, failure.message, pipeline.stats().rows_touched);
    std::lock_guard<std::mutex> lock(failures_mutex_);
    failures_.push_back(std::move(failure));
}

void BatchDeleter::startWorkers() {
    workers_.clear();
    workers_.reserve(config_.num_workers);

    for (uint32_t i = 0; i < config_.num_workers; ++i) {
        workers_.emplace_back(&BatchDeleter::workerThread, this, i);
    }
}

void BatchDeleter::stopWorkers() {
    // Wait for all workers to finish
    for (size_t i = 0; i < workers_.size(); ++i) {
        if (!workers_[i].joinable()) {
            continue;
        }
        try {
            workers_[i].join();
        } catch (const std::system_error& e) {
            TSDUMP_ERROR("Error joining worker [{}]: {}", i, e.what());
        }
    }
    workers_.clear();
}

} // namespace scan
} // namespace tsdump
