#include <gtest/gtest.h>
#include "tsdump/scan/work_queue.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tsdump {
namespace scan {
namespace {

TEST(WorkQueueTest, FifoWithClaimNumbers) {
    WorkQueue<std::string> queue;
    EXPECT_TRUE(queue.push("a"));
    EXPECT_TRUE(queue.push("b"));
    EXPECT_EQ(queue.size(), 2u);

    auto first = queue.try_pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->first, "a");
    EXPECT_EQ(first->second, 1u);

    auto second = queue.try_pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->first, "b");
    EXPECT_EQ(second->second, 2u);

    EXPECT_FALSE(queue.try_pop().has_value());
    EXPECT_EQ(queue.total(), 2u);
}

TEST(WorkQueueTest, ClosedQueueRefusesPushesButDrains) {
    WorkQueue<int> queue;
    queue.push(1);
    queue.close();
    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(2));
    EXPECT_EQ(queue.total(), 1u);

    auto item = queue.try_pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->first, 1);
    EXPECT_FALSE(queue.try_pop().has_value());
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(WorkQueueTest, ConcurrentConsumersClaimEachItemOnce) {
    constexpr int kItems = 1000;
    constexpr int kConsumers = 8;
    WorkQueue<int> queue;
    for (int i = 0; i < kItems; ++i) {
        queue.push(i);
    }
    queue.close();

    std::mutex mutex;
    std::vector<int> seen;
    std::vector<size_t> claims;
    std::vector<std::thread> consumers;
    for (int c = 0; c < kConsumers; ++c) {
        consumers.emplace_back([&]() {
            while (auto item = queue.try_pop()) {
                std::lock_guard<std::mutex> lock(mutex);
                seen.push_back(item->first);
                claims.push_back(item->second);
            }
        });
    }
    for (auto& consumer : consumers) {
        consumer.join();
    }

    ASSERT_EQ(seen.size(), static_cast<size_t>(kItems));
    std::sort(seen.begin(), seen.end());
    std::sort(claims.begin(), claims.end());
    for (int i = 0; i < kItems; ++i) {
        EXPECT_EQ(seen[i], i);
        EXPECT_EQ(claims[i], static_cast<size_t>(i + 1));
    }
}

} // namespace
} // namespace scan
} // namespace tsdump
