#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "tsdump/scan/scan_pipeline.h"
#include "tsdump/core/error.h"
#include "test_util/mock_store.h"
#include "test_util/store_fixture.h"

#include <sstream>
#include <thread>

namespace tsdump {
namespace scan {
namespace {

using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::ReturnRef;
using ::testing::StrictMock;

class ScanPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        resolver_ = std::make_unique<store::MemoryStore>("tsdb");
        for (int i = 0; i < 4; ++i) {
            keys_.push_back(resolver_->put("sys.cpu.user", testutil::kBaseTime + 3600 * i, {{"host", "web01"}},
                                           testutil::IntPoint(0, i)));
        }
        rows_ = resolver_->rows();
        ON_CALL(client_, table()).WillByDefault(ReturnRef(table_));
    }

    std::vector<query::Query> Queries(const std::vector<std::string>& metrics) const {
        std::vector<query::Query> out;
        for (const auto& metric : metrics) {
            query::Query q;
            q.metric = metric;
            q.end = testutil::kBaseTime + 10 * 3600;
            out.push_back(q);
        }
        return out;
    }

    std::string table_ = "tsdb";
    std::unique_ptr<store::MemoryStore> resolver_;
    std::vector<core::Bytes> keys_;
    std::vector<core::Row> rows_;
    ::testing::NiceMock<testutil::MockStoreClient> client_;
    std::ostringstream out_;
};

TEST_F(ScanPipelineTest, DumpsRowsInCursorOrderAcrossPages) {
    EXPECT_CALL(client_, scan(_)).WillOnce([this](const query::Query&) {
        return testutil::CursorOver({{rows_[0], rows_[1]}, {rows_[2]}, {rows_[3]}});
    });
    EXPECT_CALL(client_, delete_row(_)).Times(0);

    ScanPipeline pipeline(client_, *resolver_, out_);
    ScanOptions options;
    options.format = dump::DumpFormat::IMPORT;
    EXPECT_EQ(pipeline.run(Queries({"sys.cpu.user"}), options), 4u);

    EXPECT_EQ(out_.str(),
              "sys.cpu.user 1356998400 0 host=web01\n"
              "sys.cpu.user 1357002000 1 host=web01\n"
              "sys.cpu.user 1357005600 2 host=web01\n"
              "sys.cpu.user 1357009200 3 host=web01\n");
    EXPECT_EQ(pipeline.stats().pages, 3u);
    EXPECT_EQ(pipeline.stats().rows_deleted, 0u);
}

TEST_F(ScanPipelineTest, QueriesRunInSequence) {
    {
        InSequence seq;
        EXPECT_CALL(client_, scan(::testing::Field(&query::Query::metric, "a")))
            .WillOnce([this](const query::Query&) { return testutil::CursorOver({{rows_[0]}}); });
        EXPECT_CALL(client_, scan(::testing::Field(&query::Query::metric, "b")))
            .WillOnce([](const query::Query&) { return testutil::CursorOver({}); });
        EXPECT_CALL(client_, scan(::testing::Field(&query::Query::metric, "c")))
            .WillOnce([this](const query::Query&) { return testutil::CursorOver({{rows_[1], rows_[2]}}); });
    }
    ScanPipeline pipeline(client_, *resolver_, out_);
    ScanOptions options;
    options.quiet = true;
    EXPECT_EQ(pipeline.run(Queries({"a", "b", "c"}), options), 3u);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ScanPipelineTest, DeleteQuietDeletesEveryRowInOrder) {
    EXPECT_CALL(client_, scan(_)).WillOnce([this](const query::Query&) {
        return testutil::CursorOver({{rows_[0], rows_[1]}, {rows_[2], rows_[3]}});
    });
    {
        InSequence seq;
        for (const auto& key : keys_) {
            EXPECT_CALL(client_, delete_row(key)).WillOnce(Return(::testing::ByMove(core::Result<void>())));
        }
    }

    ScanPipeline pipeline(client_, *resolver_, out_);
    ScanOptions options;
    options.delete_rows = true;
    options.quiet = true;
    EXPECT_EQ(pipeline.run(Queries({"sys.cpu.user"}), options), 4u);
    EXPECT_EQ(pipeline.stats().rows_deleted, 4u);
    EXPECT_EQ(pipeline.stats().progress_ticks, 0u);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ScanPipelineTest, DeleteStillDumpsUnlessQuiet) {
    EXPECT_CALL(client_, scan(_)).WillOnce([this](const query::Query&) {
        return testutil::CursorOver({{rows_[0]}});
    });
    EXPECT_CALL(client_, delete_row(keys_[0])).WillOnce([](const core::Bytes&) { return core::Result<void>(); });

    ScanPipeline pipeline(client_, *resolver_, out_);
    ScanOptions options;
    options.delete_rows = true;
    options.format = dump::DumpFormat::IMPORT;
    pipeline.run(Queries({"sys.cpu.user"}), options);
    EXPECT_EQ(out_.str(), "sys.cpu.user 1356998400 0 host=web01\n");
}

TEST_F(ScanPipelineTest, FailedDeleteThrowsStoreError) {
    EXPECT_CALL(client_, scan(_)).WillOnce([this](const query::Query&) {
        return testutil::CursorOver({{rows_[0], rows_[1], rows_[2]}});
    });
    EXPECT_CALL(client_, delete_row(keys_[0])).WillOnce([](const core::Bytes&) { return core::Result<void>(); });
    EXPECT_CALL(client_, delete_row(keys_[1])).WillOnce([](const core::Bytes&) {
        return core::Result<void>::error("region server unavailable");
    });
    EXPECT_CALL(client_, delete_row(keys_[2])).Times(0);

    ScanPipeline pipeline(client_, *resolver_, out_);
    ScanOptions options;
    options.delete_rows = true;
    options.quiet = true;
    try {
        pipeline.run(Queries({"sys.cpu.user"}), options);
        FAIL() << "expected StoreError";
    } catch (const core::StoreError& e) {
        EXPECT_NE(std::string(e.what()).find("region server unavailable"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("tsdb"), std::string::npos);
    }
    EXPECT_EQ(pipeline.stats().rows_deleted, 1u);
    EXPECT_EQ(pipeline.stats().rows_touched, 2u);
}

TEST_F(ScanPipelineTest, ProgressTicksWhenIntervalElapses) {
    EXPECT_CALL(client_, scan(_)).WillOnce([this](const query::Query&) {
        return testutil::CursorOver({{rows_[0], rows_[1], rows_[2]}});
    });
    EXPECT_CALL(client_, delete_row(_)).Times(3).WillRepeatedly([](const core::Bytes&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return core::Result<void>();
    });

    ScanPipeline pipeline(client_, *resolver_, out_);
    ScanOptions options;
    options.delete_rows = true;
    options.quiet = true;
    options.progress_interval = std::chrono::milliseconds(1);
    pipeline.run(Queries({"sys.cpu.user"}), options);
    // The first row may land within the interval; every later one follows a slow delete.
    EXPECT_GE(pipeline.stats().progress_ticks, 2u);
    EXPECT_LE(pipeline.stats().progress_ticks, 3u);
}

TEST_F(ScanPipelineTest, MalformedRowAbortsAfterEarlierRowsAreWritten) {
    auto bad = rows_[1];
    bad.columns.push_back(core::Column({0x00, 0x00, 0x00, 0x10}, {0x01}));   // Second cell has no value
    EXPECT_CALL(client_, scan(_)).WillOnce([this, bad](const query::Query&) {
        auto cursor = std::make_unique<StrictMock<testutil::MockCursor>>();
        EXPECT_CALL(*cursor, next_page())
            .WillOnce(Return(std::optional<std::vector<core::Row>>(std::vector<core::Row>{rows_[0], bad, rows_[2]})));
        return std::unique_ptr<store::Cursor>(std::move(cursor));
    });

    ScanPipeline pipeline(client_, *resolver_, out_);
    ScanOptions options;
    options.format = dump::DumpFormat::IMPORT;
    EXPECT_THROW(pipeline.run(Queries({"sys.cpu.user"}), options), core::MalformedColumnError);
    EXPECT_EQ(out_.str(), "sys.cpu.user 1356998400 0 host=web01\n");
}

TEST_F(ScanPipelineTest, EndToEndAgainstMemoryStore) {
    store::MemoryStore store("tsdb", 3);
    testutil::FillMetric(store, "m", "web01", 10);
    testutil::FillMetric(store, "other", "web01", 2);

    ScanPipeline pipeline(store, store, out_);
    ScanOptions options;
    options.delete_rows = true;
    options.quiet = true;
    auto q = query::make_delete_query("m", testutil::kBaseTime + 4 * 3600);
    EXPECT_EQ(pipeline.run({q}, options), 5u);
    EXPECT_EQ(store.row_count(), 7u);
    EXPECT_EQ(store.deletes(), 5u);
}

} // namespace
} // namespace scan
} // namespace tsdump
