#include "debsnap/builder/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <numeric>
#include <thread>

namespace debsnap {
namespace {

TEST(WorkerPoolTest, ResolveJobsNeverBelowOne) {
    EXPECT_EQ(ResolveJobs(3), 3u);
    EXPECT_GE(ResolveJobs(0), 1u);
}

TEST(WorkerPoolTest, EveryItemGetsItsOwnSlot) {
    std::vector<int> items(1000);
    std::iota(items.begin(), items.end(), 0);

    const auto results = RunBounded(items, 8, [](const int& v) { return v * 2; });
    ASSERT_EQ(results.size(), items.size());
    for (size_t i = 0; i < items.size(); ++i)
        EXPECT_EQ(results[i], items[i] * 2);
}

TEST(WorkerPoolTest, ConcurrencyIsBounded) {
    std::vector<int> items(64, 0);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    RunBounded(items, 3, [&](const int&) {
        const int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
        return 0;
    });
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, LargestAllowedPoolCompletes) {
    std::vector<int> items(2 * kMaxJobs);
    std::iota(items.begin(), items.end(), 0);

    const auto results = RunBounded(items, kMaxJobs, [](const int& v) { return v + 1; });
    ASSERT_EQ(results.size(), items.size());
    EXPECT_EQ(results.front(), 1);
    EXPECT_EQ(results.back(), static_cast<int>(items.size()));
}

TEST(WorkerPoolTest, EmptyInputRunsNothing) {
    const std::vector<int> none;
    const auto results = RunBounded(none, 4, [](const int&) { return 1; });
    EXPECT_TRUE(results.empty());
}

} // namespace
} // namespace debsnap
