#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "tsdump/core/types.h"
#include "tsdump/scan/work_queue.h"
#include "tsdump/store/store.h"
#include "tsdump/store/uid_resolver.h"

namespace tsdump {
namespace scan {

/**
 * @brief Batch delete configuration
 */
struct BatchDeleteConfig {
    uint32_t num_workers = 16;
    std::chrono::milliseconds progress_interval{60'000};  // Per worker, between progress lines
    size_t max_metrics = std::numeric_limits<size_t>::max();  // Cap on suggested metrics

    BatchDeleteConfig() = default;
};

/**
 * @brief One metric whose delete pass threw
 */
struct BatchFailure {
    uint32_t worker = 0;
    std::string metric;
    std::string error_type;
    std::string message;
};

/**
 * @brief Outcome of a batch delete run
 */
struct BatchDeleteReport {
    size_t metrics_total = 0;
    size_t metrics_done = 0;
    size_t metrics_failed = 0;
    uint64_t rows_touched = 0;
    std::vector<uint64_t> rows_per_worker;
    std::vector<BatchFailure> failures;
};

/**
 * @brief Deletes every row of every metric matching a prefix.
 *
 * The matching metric names are queued once; a fixed pool of workers
 * claims them one at a time and runs a quiet delete scan from time 0 up
 * to the end time. A metric whose pass throws is logged and recorded,
 * and its worker moves on to the next metric, so a failure never reaches
 * the other workers or the caller.
 */
class BatchDeleter {
public:
    BatchDeleter(store::StoreClient& client, const store::UidResolver& resolver,
                 std::ostream& out, const BatchDeleteConfig& config = BatchDeleteConfig{});
    ~BatchDeleter();

    // Disable copy
    BatchDeleter(const BatchDeleter&) = delete;
    BatchDeleter& operator=(const BatchDeleter&) = delete;

    /**
     * @brief Runs the whole batch and waits for every worker.
     * Each call queues the matching metrics afresh, so a deleter may be run again.
     * @param end_time end of the delete range, seconds or milliseconds
     * @param metric_prefix metrics whose name starts with this are deleted
     * @throws InvalidArgumentError if the config has no workers
     */
    BatchDeleteReport run(core::Timestamp end_time, const std::string& metric_prefix);

    const BatchDeleteConfig& getConfig() const { return config_; }

private:
    /**
     * @brief Worker thread function: claims metrics until the queue is empty
     */
    void workerThread(uint32_t worker_id);

    /**
     * @brief Runs one metric's delete pass, capturing any failure
     */
    void processMetric(uint32_t worker_id, const std::string& metric, size_t claim);

    void startWorkers();
    void stopWorkers();

    store::StoreClient& client_;
    const store::UidResolver& resolver_;
    std::ostream& out_;
    BatchDeleteConfig config_;

    std::unique_ptr<WorkQueue<std::string>> queue_;  // Rebuilt by every run()
    core::Timestamp end_time_ = 0;
    size_t total_ = 0;

    std::vector<std::thread> workers_;
    std::vector<uint64_t> rows_per_worker_;
    std::atomic<size_t> metrics_done_{0};

    std::mutex failures_mutex_;
    std::vector<BatchFailure> failures_;
};

} // namespace scan
} // namespace tsdump
