/**
 * @file test_worker_pool_adapter.cpp
 * @brief Unit tests for the transfer worker pools
 */

#include <gtest/gtest.h>

#include <archive_fetch/adapters/worker_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace archive_fetch::test {

using namespace std::chrono_literals;
using adapters::async_worker_pool;
using adapters::worker_pool_factory;

TEST(WorkerPoolFactoryTest, CreatesRunningPool) {
    auto pool = worker_pool_factory::create(3);
    ASSERT_NE(pool, nullptr);

    EXPECT_TRUE(pool->is_running());
    EXPECT_GE(pool->worker_count(), 1u);
}

TEST(WorkerPoolFactoryTest, RunsSubmittedTasks) {
    auto pool = worker_pool_factory::create(4);
    std::atomic<int> ran{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool->submit([&ran] { ++ran; }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(ran.load(), 8);
}

TEST(AsyncWorkerPoolTest, ReportsRequestedWorkerCount) {
    async_worker_pool pool(5);

    EXPECT_EQ(pool.worker_count(), 5u);
    EXPECT_TRUE(pool.is_running());
}

TEST(AsyncWorkerPoolTest, ZeroMeansHardwareConcurrency) {
    async_worker_pool pool(0);

    EXPECT_GE(pool.worker_count(), 1u);
}

TEST(AsyncWorkerPoolTest, PendingTasksTracksInFlightWork) {
    async_worker_pool pool(2);
    std::atomic<bool> release{false};

    auto future = pool.submit([&release] {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
    });
    EXPECT_EQ(pool.pending_tasks(), 1u);

    release = true;
    future.get();
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(AsyncWorkerPoolTest, ExceptionReachesFuture) {
    async_worker_pool pool(1);

    auto future = pool.submit([] { throw std::runtime_error("worker failed"); });

    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

}  // namespace archive_fetch::test
