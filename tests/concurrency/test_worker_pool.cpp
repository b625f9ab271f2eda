#include "pyspot/concurrency/worker_pool.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace pyspot {

TEST(WorkerPoolTest, EveryIndexRunsExactlyOnce)
{
    WorkerPool pool(4);
    std::vector<std::atomic<int>> hits(100);

    pool.parallel_for(hits.size(), [&](size_t i) { hits[i].fetch_add(1); });

    for (const auto& hit : hits) {
        EXPECT_EQ(hit.load(), 1);
    }
}

TEST(WorkerPoolTest, SingleWorkerRunsOnCallingThread)
{
    WorkerPool pool(1);
    std::set<std::thread::id> threads;

    pool.parallel_for(10, [&](size_t) { threads.insert(std::this_thread::get_id()); });

    ASSERT_EQ(threads.size(), 1U);
    EXPECT_EQ(*threads.begin(), std::this_thread::get_id());
}

TEST(WorkerPoolTest, ZeroWorkersMeansOne)
{
    WorkerPool pool(0);
    EXPECT_EQ(pool.max_workers(), 1U);
}

TEST(WorkerPoolTest, EmptyRangeRunsNothing)
{
    WorkerPool pool(4);
    bool called = false;

    pool.parallel_for(0, [&](size_t) { called = true; });

    EXPECT_FALSE(called);
}

TEST(WorkerPoolTest, ConcurrencyIsBounded)
{
    WorkerPool pool(3);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    pool.parallel_for(30, [&](size_t) {
        int now = active.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        active.fetch_sub(1);
    });

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, TaskExceptionIsRethrownOnCaller)
{
    WorkerPool pool(4);

    EXPECT_THROW(pool.parallel_for(20,
                                   [](size_t i) {
                                       if (i == 3) {
                                           throw std::runtime_error("task failed");
                                       }
                                   }),
                 std::runtime_error);
}

} // namespace pyspot
