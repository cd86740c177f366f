#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "tsdump/scan/batch_delete.h"
#include "tsdump/core/error.h"
#include "test_util/mock_store.h"
#include "test_util/store_fixture.h"

#include <sstream>

namespace tsdump {
namespace scan {
namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::ReturnRef;
using testutil::kBaseTime;

class BatchDeleterTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<store::MemoryStore>("tsdb", 4);
        for (int i = 0; i < kMetrics; ++i) {
            testutil::FillMetric(*store_, "sys.m" + std::to_string(i), "web01", kRowsPerMetric);
        }
        testutil::FillMetric(*store_, "proc.keep", "web01", kRowsPerMetric);
    }

    // Deletes every row up to and including the third hour of each metric.
    static constexpr core::Timestamp kEnd = kBaseTime + 2 * 3600;
    static constexpr int kMetrics = 40;
    static constexpr int kRowsPerMetric = 5;

    std::unique_ptr<store::MemoryStore> store_;
    std::ostringstream out_;
};

TEST_F(BatchDeleterTest, DeletesAllMatchingMetrics) {
    BatchDeleter deleter(*store_, *store_, out_);
    EXPECT_EQ(deleter.getConfig().num_workers, 16u);

    auto report = deleter.run(kEnd, "sys.");
    EXPECT_EQ(report.metrics_total, static_cast<size_t>(kMetrics));
    EXPECT_EQ(report.metrics_done, static_cast<size_t>(kMetrics));
    EXPECT_EQ(report.metrics_failed, 0u);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_EQ(report.rows_touched, static_cast<uint64_t>(kMetrics * 3));
    ASSERT_EQ(report.rows_per_worker.size(), 16u);

    // Rows after the end time and other metrics are untouched.
    EXPECT_EQ(store_->row_count(), static_cast<size_t>(kMetrics * 2 + kRowsPerMetric));
    EXPECT_EQ(store_->deletes(), static_cast<uint64_t>(kMetrics * 3));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(BatchDeleterTest, FewerMetricsThanWorkers) {
    BatchDeleteConfig config;
    config.num_workers = 16;
    BatchDeleter deleter(*store_, *store_, out_, config);
    auto report = deleter.run(kEnd, "sys.m1");   // sys.m1, sys.m10 .. sys.m19
    EXPECT_EQ(report.metrics_total, 11u);
    EXPECT_EQ(report.metrics_done, 11u);
    EXPECT_EQ(report.rows_touched, 33u);
}

TEST_F(BatchDeleterTest, NoMatchingMetrics) {
    BatchDeleter deleter(*store_, *store_, out_);
    auto report = deleter.run(kEnd, "nothing.");
    EXPECT_EQ(report.metrics_total, 0u);
    EXPECT_EQ(report.rows_touched, 0u);
    EXPECT_EQ(store_->deletes(), 0u);
}

TEST_F(BatchDeleterTest, WorkerTotalsMatchSerialCount) {
    std::ostringstream sink;
    uint64_t serial = 0;
    for (const auto& metric : store_->suggest_metrics("sys.", 1000)) {
        auto cursor = store_->scan(query::make_delete_query(metric, kEnd));
        while (auto page = cursor->next_page()) {
            serial += page->size();
        }
    }

    BatchDeleteConfig config;
    config.num_workers = 7;
    BatchDeleter deleter(*store_, *store_, sink, config);
    auto report = deleter.run(kEnd, "sys.");
    ASSERT_EQ(report.rows_per_worker.size(), 7u);
    uint64_t sum = 0;
    for (auto rows : report.rows_per_worker) {
        sum += rows;
    }
    EXPECT_EQ(sum, serial);
    EXPECT_EQ(report.rows_touched, serial);
}

TEST_F(BatchDeleterTest, FailingMetricDoesNotStopOthers) {
    std::string table = "tsdb";
    NiceMock<testutil::MockStoreClient> client;
    ON_CALL(client, table()).WillByDefault(ReturnRef(table));
    ON_CALL(client, scan(_)).WillByDefault([this](const query::Query& q) -> std::unique_ptr<store::Cursor> {
        if (q.metric == "sys.m7") {
            throw core::StoreError("region offline");
        }
        return store_->scan(q);
    });
    ON_CALL(client, delete_row(_)).WillByDefault([this](const core::Bytes& key) {
        return store_->delete_row(key);
    });

    BatchDeleteConfig config;
    config.num_workers = 4;
    BatchDeleter deleter(client, *store_, out_, config);
    auto report = deleter.run(kEnd, "sys.");

    EXPECT_EQ(report.metrics_total, static_cast<size_t>(kMetrics));
    EXPECT_EQ(report.metrics_done, static_cast<size_t>(kMetrics - 1));
    ASSERT_EQ(report.metrics_failed, 1u);
    const auto& failure = report.failures[0];
    EXPECT_EQ(failure.metric, "sys.m7");
    EXPECT_EQ(failure.error_type, "StoreError");
    EXPECT_EQ(failure.message, "region offline");
    EXPECT_LT(failure.worker, 4u);
    EXPECT_EQ(report.rows_touched, static_cast<uint64_t>((kMetrics - 1) * 3));
}

TEST_F(BatchDeleterTest, FailedDeleteCountsRowsBeforeTheFailure) {
    std::string table = "tsdb";
    NiceMock<testutil::MockStoreClient> client;
    ON_CALL(client, table()).WillByDefault(ReturnRef(table));
    ON_CALL(client, scan(_)).WillByDefault([this](const query::Query& q) { return store_->scan(q); });
    auto poison = store_->rows()[1].key;   // Second row of the first metric
    ON_CALL(client, delete_row(_)).WillByDefault([this, poison](const core::Bytes& key) {
        if (key == poison) {
            return core::Result<void>::error("write timeout");
        }
        return store_->delete_row(key);
    });

    BatchDeleteConfig config;
    config.num_workers = 1;
    BatchDeleter deleter(client, *store_, out_, config);
    auto report = deleter.run(kEnd, store_->metric_name(core::Bytes(poison.begin(), poison.begin() + 3)));

    ASSERT_EQ(report.metrics_failed, 1u);
    EXPECT_EQ(report.failures[0].error_type, "StoreError");
    EXPECT_EQ(report.rows_touched, 2u);
}

TEST_F(BatchDeleterTest, RunTwiceOnTheSameDeleter) {
    BatchDeleteConfig config;
    config.num_workers = 4;
    BatchDeleter deleter(*store_, *store_, out_, config);

    auto first = deleter.run(kEnd, "sys.m1");
    EXPECT_EQ(first.metrics_total, 11u);
    EXPECT_EQ(first.rows_touched, 33u);

    auto second = deleter.run(kEnd, "proc.");
    EXPECT_EQ(second.metrics_total, 1u);
    EXPECT_EQ(second.metrics_done, 1u);
    EXPECT_EQ(second.rows_touched, 3u);
    EXPECT_EQ(store_->deletes(), 36u);
}

TEST_F(BatchDeleterTest, ZeroWorkersIsInvalid) {
    BatchDeleteConfig config;
    config.num_workers = 0;
    BatchDeleter deleter(*store_, *store_, out_, config);
    EXPECT_THROW(deleter.run(kEnd, "sys."), core::InvalidArgumentError);
}

} // namespace
} // namespace scan
} // namespace tsdump
