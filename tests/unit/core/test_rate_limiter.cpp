/**
 * @file test_rate_limiter.cpp
 * @brief Unit tests for the windowed rate limiter
 */

#include <gtest/gtest.h>

#include <archive_fetch/core/rate_limiter.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace archive_fetch::test {

class RateLimiterTest : public ::testing::Test {
protected:
    static constexpr uint64_t KB = 1024;
    static constexpr auto WINDOW = std::chrono::milliseconds(100);
};

// Construction

TEST_F(RateLimiterTest, Construction_WithLimit) {
    rate_limiter limiter(10 * KB, WINDOW);
    EXPECT_EQ(limiter.get_limit(), 10 * KB);
    EXPECT_TRUE(limiter.is_enabled());
    EXPECT_EQ(limiter.window_length(), WINDOW);
}

TEST_F(RateLimiterTest, Construction_ZeroMeansUnlimited) {
    rate_limiter limiter(0);
    EXPECT_FALSE(limiter.is_enabled());
    EXPECT_EQ(limiter.available_budget(), UINT64_MAX);
}

TEST_F(RateLimiterTest, Construction_NonPositiveWindowFallsBackToOneSecond) {
    rate_limiter limiter(KB, std::chrono::milliseconds(0));
    EXPECT_EQ(limiter.window_length(), std::chrono::milliseconds(1000));
}

// Budget accounting

TEST_F(RateLimiterTest, Unlimited_NeverBlocks) {
    rate_limiter limiter(0);
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(limiter.acquire(1024 * KB));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(100));
    EXPECT_EQ(limiter.total_released(), 100 * 1024 * KB);
}

TEST_F(RateLimiterTest, Acquire_WithinBudgetIsImmediate) {
    rate_limiter limiter(10 * KB, std::chrono::seconds(10));
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(limiter.acquire(4 * KB));
    EXPECT_TRUE(limiter.acquire(6 * KB));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
    EXPECT_EQ(limiter.available_budget(), 0u);
}

TEST_F(RateLimiterTest, Acquire_ZeroBytesAlwaysSucceeds) {
    rate_limiter limiter(KB, WINDOW);
    limiter.interrupt();
    EXPECT_TRUE(limiter.acquire(0));
}

TEST_F(RateLimiterTest, Acquire_BlocksUntilNextWindow) {
    rate_limiter limiter(10 * KB, WINDOW);
    ASSERT_TRUE(limiter.acquire(10 * KB));

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(limiter.acquire(KB));
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_GT(waited, std::chrono::milliseconds(20));
    EXPECT_LT(waited, WINDOW * 3);
}

TEST_F(RateLimiterTest, Acquire_LargerThanWindowSpansSeveralWindows) {
    rate_limiter limiter(10 * KB, WINDOW);
    auto start = std::chrono::steady_clock::now();

    // 35 KB at 10 KB per window needs the current window plus three more
    EXPECT_TRUE(limiter.acquire(35 * KB));
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_GE(waited, WINDOW * 2);
    EXPECT_EQ(limiter.total_released(), 35 * KB);
}

TEST_F(RateLimiterTest, TryAcquire_FailsWithoutBudget) {
    rate_limiter limiter(10 * KB, std::chrono::seconds(10));
    EXPECT_TRUE(limiter.try_acquire(8 * KB));
    EXPECT_FALSE(limiter.try_acquire(4 * KB));
    EXPECT_TRUE(limiter.try_acquire(2 * KB));
}

TEST_F(RateLimiterTest, AggregateThroughputRespectsLimit) {
    constexpr uint64_t limit = 20 * KB;
    rate_limiter limiter(limit, WINDOW);

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&] {
            for (int j = 0; j < 5; ++j) {
                EXPECT_TRUE(limiter.acquire(4 * KB));
            }
        });
    }

    auto start = std::chrono::steady_clock::now();
    for (auto& worker : workers) {
        worker.join();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    // 80 KB at 20 KB per window: the first window is free, three more must pass
    EXPECT_GE(elapsed, WINDOW * 2);
    EXPECT_EQ(limiter.total_released(), 80 * KB);
}

TEST_F(RateLimiterTest, WaitersAreServedInArrivalOrder) {
    rate_limiter limiter(KB, std::chrono::milliseconds(50));
    ASSERT_TRUE(limiter.acquire(KB));

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> workers;
    for (int i = 0; i < 3; ++i) {
        workers.emplace_back([&, i] {
            EXPECT_TRUE(limiter.acquire(KB));
            std::lock_guard lock(order_mutex);
            order.push_back(i);
        });
        // Make the arrival order deterministic
        while (limiter.waiting_count() < static_cast<std::size_t>(i + 1)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

// Dynamic limit

TEST_F(RateLimiterTest, SetLimit_ZeroReleasesWaiters) {
    rate_limiter limiter(KB, std::chrono::seconds(10));
    ASSERT_TRUE(limiter.acquire(KB));

    std::atomic<bool> done{false};
    std::thread waiter([&] {
        EXPECT_TRUE(limiter.acquire(KB));
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(done.load());

    limiter.set_limit(0);
    waiter.join();
    EXPECT_TRUE(done.load());
    EXPECT_FALSE(limiter.is_enabled());
}

TEST_F(RateLimiterTest, SetLimit_RaisingAddsBudget) {
    rate_limiter limiter(KB, std::chrono::seconds(10));
    ASSERT_TRUE(limiter.acquire(KB));
    limiter.set_limit(4 * KB);
    EXPECT_EQ(limiter.available_budget(), 3 * KB);
}

// Interruption

TEST_F(RateLimiterTest, Interrupt_WakesAllWaiters) {
    rate_limiter limiter(KB, std::chrono::seconds(10));
    ASSERT_TRUE(limiter.acquire(KB));

    std::atomic<int> interrupted{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([&] {
            if (!limiter.acquire(KB)) {
                ++interrupted;
            }
        });
    }

    while (limiter.waiting_count() < 3) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    limiter.interrupt();
    for (auto& waiter : waiters) {
        waiter.join();
    }

    EXPECT_EQ(interrupted.load(), 3);
    EXPECT_TRUE(limiter.is_interrupted());
    EXPECT_EQ(limiter.waiting_count(), 0u);
}

TEST_F(RateLimiterTest, Interrupt_RejectsNewCallersUntilResume) {
    rate_limiter limiter(10 * KB, std::chrono::seconds(10));
    limiter.interrupt();
    EXPECT_FALSE(limiter.acquire(KB));

    limiter.resume();
    EXPECT_FALSE(limiter.is_interrupted());
    EXPECT_TRUE(limiter.acquire(KB));
}

}  // namespace archive_fetch::test
