/**
 * @file test_progress_tracker.cpp
 * @brief Unit tests for throughput smoothing and ETA estimation
 */

#include <gtest/gtest.h>

#include <archive_fetch/core/progress_tracker.h>

#include <chrono>
#include <vector>

namespace archive_fetch::test {

using namespace std::chrono_literals;

class ProgressTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0_ = progress_tracker::clock::now();
        tracker_.start(1000, t0_);
    }

    static auto task_with(task_status status, std::optional<uint64_t> expected,
                          uint64_t confirmed) -> file_task {
        file_task task;
        task.status = status;
        task.expected_size = expected;
        task.bytes_confirmed = confirmed;
        return task;
    }

    progress_tracker tracker_{progress_tracker::config{10000ms, 250ms}};
    progress_tracker::clock::time_point t0_;
};

TEST_F(ProgressTrackerTest, Start_ResetsCounters) {
    tracker_.record_delta(1, 500);
    tracker_.start(42, t0_);

    EXPECT_EQ(tracker_.session_bytes(), 0u);
    EXPECT_EQ(tracker_.historical_bytes(), 42u);
    EXPECT_DOUBLE_EQ(tracker_.aggregate_rate(), 0.0);
}

TEST_F(ProgressTrackerTest, RecordDelta_AccumulatesSessionBytes) {
    tracker_.record_delta(1, 100);
    tracker_.record_delta(2, 200);

    EXPECT_EQ(tracker_.session_bytes(), 300u);
    EXPECT_EQ(tracker_.historical_bytes(), 1000u);
}

TEST_F(ProgressTrackerTest, Sample_FirstSampleIsInstantRate) {
    tracker_.record_delta(1, 1000);
    tracker_.sample(t0_ + 1s);

    EXPECT_DOUBLE_EQ(tracker_.aggregate_rate(), 1000.0);
    EXPECT_DOUBLE_EQ(tracker_.file_rate(1), 1000.0);
}

TEST_F(ProgressTrackerTest, Sample_IgnoresCallsInsideInterval) {
    tracker_.record_delta(1, 1000);
    tracker_.sample(t0_ + 100ms);

    EXPECT_DOUBLE_EQ(tracker_.aggregate_rate(), 0.0);

    tracker_.sample(t0_ + 500ms);
    EXPECT_DOUBLE_EQ(tracker_.aggregate_rate(), 2000.0);
}

TEST_F(ProgressTrackerTest, Sample_SmoothsTowardsNewRate) {
    tracker_.record_delta(1, 1000);
    tracker_.sample(t0_ + 1s);

    // Rate jumps to 5000 B/s; one second into a ten-second window moves
    // the average only part of the way
    tracker_.record_delta(1, 5000);
    tracker_.sample(t0_ + 2s);

    EXPECT_GT(tracker_.aggregate_rate(), 1000.0);
    EXPECT_LT(tracker_.aggregate_rate(), 2000.0);
}

TEST_F(ProgressTrackerTest, Sample_IdleDecaysRate) {
    tracker_.record_delta(1, 1000);
    tracker_.sample(t0_ + 1s);
    tracker_.sample(t0_ + 11s);

    EXPECT_LT(tracker_.aggregate_rate(), 1000.0);
    EXPECT_GT(tracker_.aggregate_rate(), 0.0);
}

TEST_F(ProgressTrackerTest, ForgetFile_DropsPerFileRate) {
    tracker_.record_delta(3, 1000);
    tracker_.sample(t0_ + 1s);
    tracker_.forget_file(3);

    EXPECT_DOUBLE_EQ(tracker_.file_rate(3), 0.0);
    EXPECT_DOUBLE_EQ(tracker_.aggregate_rate(), 1000.0);
}

TEST_F(ProgressTrackerTest, Elapsed_MeasuredFromStart) {
    EXPECT_EQ(tracker_.elapsed(t0_ + 1500ms), 1500ms);
}

// ETA

TEST_F(ProgressTrackerTest, EstimateEta_UnknownWithoutRate) {
    EXPECT_FALSE(tracker_.estimate_eta(1000).has_value());
}

TEST_F(ProgressTrackerTest, EstimateEta_UnknownWithoutRemaining) {
    tracker_.record_delta(1, 1000);
    tracker_.sample(t0_ + 1s);

    EXPECT_FALSE(tracker_.estimate_eta(std::nullopt).has_value());
}

TEST_F(ProgressTrackerTest, EstimateEta_ZeroRemainingIsZero) {
    EXPECT_EQ(tracker_.estimate_eta(0), 0s);
}

TEST_F(ProgressTrackerTest, EstimateEta_RoundsUp) {
    tracker_.record_delta(1, 1000);
    tracker_.sample(t0_ + 1s);

    EXPECT_EQ(tracker_.estimate_eta(10000), 10s);
    EXPECT_EQ(tracker_.estimate_eta(10001), 11s);
}

TEST_F(ProgressTrackerTest, RemainingBytes_CountsOnlyUnfinishedTasks) {
    std::vector<file_task> tasks = {
        task_with(task_status::done, 1000, 1000),
        task_with(task_status::failed, 1000, 10),
        task_with(task_status::pending, 1000, 0),
        task_with(task_status::in_progress, 1000, 400),
        task_with(task_status::auth_blocked, 1000, 900),
    };

    EXPECT_EQ(progress_tracker::estimate_remaining_bytes(tasks), 1000u + 600u + 100u);
}

TEST_F(ProgressTrackerTest, RemainingBytes_UnknownSizesUseAverage) {
    std::vector<file_task> tasks = {
        task_with(task_status::done, 2000, 2000),
        task_with(task_status::done, 4000, 4000),
        task_with(task_status::pending, std::nullopt, 500),
    };

    EXPECT_EQ(progress_tracker::estimate_remaining_bytes(tasks), 2500u);
}

TEST_F(ProgressTrackerTest, RemainingBytes_NothingKnown) {
    std::vector<file_task> tasks = {
        task_with(task_status::pending, std::nullopt, 0),
    };

    EXPECT_FALSE(progress_tracker::estimate_remaining_bytes(tasks).has_value());
}

TEST(TransferProgressTest, TotalBytesIncludesHistory) {
    transfer_progress progress;
    progress.session_bytes = 10;
    progress.historical_bytes = 32;

    EXPECT_EQ(progress.total_bytes(), 42u);
}

}  // namespace archive_fetch::test
