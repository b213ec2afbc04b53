#include <gtest/gtest.h>
#include "qrbackup/parallel.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace qrbackup;

TEST(ParallelTest, VisitsEveryIndexOnce) {
    std::vector<std::atomic<int>> hits(200);
    parallel::ParallelFor(hits.size(), 6, [&](std::size_t i) { hits[i].fetch_add(1); });
    for (const auto& hit : hits) {
        EXPECT_EQ(hit.load(), 1);
    }
}

TEST(ParallelTest, ZeroItemsRunsNothing) {
    int calls = 0;
    parallel::ParallelFor(0, 4, [&](std::size_t) { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST(ParallelTest, FirstFailureIsRethrownAfterWorkersFinish) {
    std::atomic<int> finished{0};
    EXPECT_THROW(parallel::ParallelFor(8, 4,
                                       [&](std::size_t i) {
                                           if (i == 0) {
                                               throw std::runtime_error("boom");
                                           }
                                           std::this_thread::sleep_for(std::chrono::milliseconds(20));
                                           finished.fetch_add(1);
                                       }),
                 std::runtime_error);
    // Items already running complete before the call returns.
    const int seen = finished.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(finished.load(), seen);
}
