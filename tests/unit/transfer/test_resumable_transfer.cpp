/**
 * @file test_resumable_transfer.cpp
 * @brief Unit tests for single-archive range transfers
 */

#include <gtest/gtest.h>

#include <archive_fetch/transfer/resumable_transfer.h>

#include "../../support/fake_http_transport.h"
#include "../../support/zip_builder.h"

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace archive_fetch::test {

using namespace std::chrono_literals;

class ResumableTransferTest : public ::testing::Test {
protected:
    static constexpr const char* URL = "https://host/dl/takeout-001.zip?j=1";

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("archive_fetch_transfer_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);

        archive_ = zip_builder::archive_of_size(20000, 11);
        transport_.add_file(URL, archive_);

        options_.chunk_size = 4096;
        options_.retry.initial_delay = 1ms;
        options_.retry.max_delay = 5ms;
        options_.retry.max_retries = 3;

        credential_.token = "SID=session-token";
        credential_.generation = 1;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto make_task() const -> file_task {
        file_task task;
        task.index = 1;
        task.url = URL;
        task.final_path = test_dir_ / "takeout-001.zip";
        task.partial_path = test_dir_ / "takeout-001.zip.partial";
        return task;
    }

    auto run(const file_task& task) -> transfer_result {
        resumable_transfer transfer(transport_, limiter_, options_);
        return transfer.run(task, credential_, stop_, [this](const transfer_delta& delta) {
            deltas_.push_back(delta);
        });
    }

    std::filesystem::path test_dir_;
    std::vector<uint8_t> archive_;
    fake_http_transport transport_;
    rate_limiter limiter_{0};
    stop_signal stop_;
    transfer_options options_;
    session_credential credential_;
    std::vector<transfer_delta> deltas_;
};

// =============================================================================
// Successful transfers
// =============================================================================

TEST_F(ResumableTransferTest, FreshDownloadUsesBoundedWindows) {
    auto task = make_task();

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::completed) << result.err.message;
    EXPECT_EQ(result.bytes_confirmed, archive_.size());
    EXPECT_EQ(result.expected_size, archive_.size());
    EXPECT_EQ(result.credential_generation, 1u);
    EXPECT_EQ(zip_builder::read_file(task.final_path), archive_);
    EXPECT_FALSE(std::filesystem::exists(task.partial_path));

    auto requests = transport_.requests();
    ASSERT_EQ(requests.size(), (archive_.size() + 4095) / 4096);
    for (std::size_t i = 0; i < requests.size(); ++i) {
        EXPECT_EQ(requests[i].range_start, i * 4096);
        ASSERT_TRUE(requests[i].range_end.has_value());
        EXPECT_LE(*requests[i].range_end - requests[i].range_start, 4095u);
        EXPECT_EQ(requests[i].credential, "SID=session-token");
    }
    EXPECT_EQ(*requests.back().range_end, archive_.size() - 1);
}

TEST_F(ResumableTransferTest, ProgressDeltasAddUpAndEndWithVerifying) {
    auto result = run(make_task());
    ASSERT_EQ(result.outcome, transfer_outcome::completed);

    uint64_t written = 0;
    for (const auto& delta : deltas_) {
        written += delta.bytes;
        EXPECT_FALSE(delta.restarted);
    }
    EXPECT_EQ(written, archive_.size());
    ASSERT_FALSE(deltas_.empty());
    EXPECT_TRUE(deltas_.back().verifying);
    EXPECT_EQ(deltas_.back().bytes_confirmed, archive_.size());
}

TEST_F(ResumableTransferTest, ResumesFromPartialLength) {
    auto task = make_task();
    std::vector<uint8_t> head(archive_.begin(), archive_.begin() + 10000);
    zip_builder::write_file(task.partial_path, head);

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
    auto requests = transport_.requests();
    ASSERT_FALSE(requests.empty());
    EXPECT_EQ(requests.front().range_start, 10000u);
    EXPECT_EQ(zip_builder::read_file(task.final_path), archive_);
}

TEST_F(ResumableTransferTest, ResumeDisabledStartsOver) {
    options_.resume_enabled = false;
    auto task = make_task();
    std::vector<uint8_t> head(archive_.begin(), archive_.begin() + 10000);
    zip_builder::write_file(task.partial_path, head);

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
    EXPECT_EQ(transport_.requests().front().range_start, 0u);
}

TEST_F(ResumableTransferTest, PartialAlreadyCompleteSkipsNetwork) {
    auto task = make_task();
    zip_builder::write_file(task.partial_path, archive_);
    task.expected_size = archive_.size();

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
    EXPECT_EQ(transport_.request_count(), 0u);
    EXPECT_TRUE(std::filesystem::exists(task.final_path));
}

TEST_F(ResumableTransferTest, UnsatisfiableRangeAtEndCompletes) {
    auto task = make_task();
    zip_builder::write_file(task.partial_path, archive_);

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
    EXPECT_EQ(transport_.request_count(), 1u);
    EXPECT_EQ(result.expected_size, archive_.size());
}

TEST_F(ResumableTransferTest, IgnoredRangeRestartsFromZero) {
    transport_.ignore_range(URL);
    auto task = make_task();
    std::vector<uint8_t> head(archive_.begin(), archive_.begin() + 10000);
    zip_builder::write_file(task.partial_path, head);

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
    EXPECT_EQ(zip_builder::read_file(task.final_path), archive_);
    ASSERT_FALSE(deltas_.empty());
    EXPECT_TRUE(deltas_.front().restarted);
    EXPECT_EQ(deltas_.front().bytes_confirmed, 0u);
}

TEST_F(ResumableTransferTest, PartialThatIsNotAnArchiveIsDiscarded) {
    auto task = make_task();
    std::string page = "<html>expired</html>";
    zip_builder::write_file(task.partial_path, std::vector<uint8_t>(page.begin(), page.end()));

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
    EXPECT_EQ(transport_.requests().front().range_start, 0u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(ResumableTransferTest, LoginPageIsAuthFailure) {
    transport_.serve_login_page(URL, 1);
    auto task = make_task();

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::auth_failure);
    EXPECT_EQ(result.err.code, error_code::auth_failure);
    EXPECT_FALSE(std::filesystem::exists(task.final_path));
}

TEST_F(ResumableTransferTest, LoginPageMidFileKeepsConfirmedBytes) {
    auto task = make_task();
    std::vector<uint8_t> head(archive_.begin(), archive_.begin() + 8192);
    zip_builder::write_file(task.partial_path, head);
    transport_.serve_login_page(URL, 1);

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::auth_failure);
    EXPECT_EQ(result.bytes_confirmed, 8192u);
    EXPECT_EQ(std::filesystem::file_size(task.partial_path), 8192u);
}

TEST_F(ResumableTransferTest, JsonErrorOnResumeKeepsConfirmedBytes) {
    auto task = make_task();
    std::vector<uint8_t> head(archive_.begin(), archive_.begin() + 10000);
    zip_builder::write_file(task.partial_path, head);
    transport_.respond_with_body(URL, 200, "application/json",
                                 "{\"error\":\"unauthenticated\"}", 1);

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::auth_failure);
    EXPECT_EQ(result.bytes_confirmed, 10000u);
    EXPECT_EQ(std::filesystem::file_size(task.partial_path), 10000u);
    EXPECT_EQ(zip_builder::read_file(task.partial_path), head);
}

TEST_F(ResumableTransferTest, OctetStreamLoginPageOnResumeKeepsConfirmedBytes) {
    auto task = make_task();
    std::vector<uint8_t> head(archive_.begin(), archive_.begin() + 10000);
    zip_builder::write_file(task.partial_path, head);
    transport_.respond_with_body(URL, 200, "application/octet-stream",
                                 fake_http_transport::LOGIN_PAGE, 1);

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::auth_failure);
    EXPECT_EQ(result.bytes_confirmed, 10000u);
    EXPECT_EQ(std::filesystem::file_size(task.partial_path), 10000u);
}

TEST_F(ResumableTransferTest, ForbiddenIsAuthFailure) {
    transport_.respond_with_status(URL, 403, 1);

    auto result = run(make_task());

    EXPECT_EQ(result.outcome, transfer_outcome::auth_failure);
}

TEST_F(ResumableTransferTest, MissingFileIsNotFoundEvenWithHtmlBody) {
    auto task = make_task();
    task.url = "https://host/dl/takeout-099.zip?j=1";

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::not_found);
    EXPECT_EQ(result.err.code, error_code::remote_not_found);
}

TEST_F(ResumableTransferTest, CorruptDownloadIsDiscarded) {
    transport_.serve_corrupt(URL, 1);
    auto task = make_task();

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::corrupt);
    EXPECT_EQ(result.err.code, error_code::corrupt_file);
    EXPECT_FALSE(std::filesystem::exists(task.partial_path));
    EXPECT_FALSE(std::filesystem::exists(task.final_path));
    EXPECT_EQ(result.bytes_confirmed, 0u);
}

TEST_F(ResumableTransferTest, CorruptDownloadAcceptedWhenVerificationDisabled) {
    options_.verify_enabled = false;
    transport_.serve_corrupt(URL, 1);

    auto result = run(make_task());

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
}

TEST_F(ResumableTransferTest, TinyCompletedFileIsAuthFailure) {
    options_.min_archive_bytes = 1024 * 1024;

    auto result = run(make_task());

    EXPECT_EQ(result.outcome, transfer_outcome::auth_failure);
}

TEST_F(ResumableTransferTest, TransientFailuresAreRetried) {
    transport_.fail_transient(URL, 2);

    auto result = run(make_task());

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
    EXPECT_EQ(result.network_retries, 2u);
}

TEST_F(ResumableTransferTest, ServerErrorsAreRetried) {
    transport_.respond_with_status(URL, 503, 1);

    auto result = run(make_task());

    EXPECT_EQ(result.outcome, transfer_outcome::completed);
    EXPECT_EQ(result.network_retries, 1u);
}

TEST_F(ResumableTransferTest, RetriesExhaustedFails) {
    transport_.fail_transient(URL, 10, error_code::connection_timeout);

    auto result = run(make_task());

    EXPECT_EQ(result.outcome, transfer_outcome::failed);
    EXPECT_EQ(result.err.code, error_code::connection_timeout);
    EXPECT_EQ(transport_.request_count(), options_.retry.max_retries + 1);
}

TEST_F(ResumableTransferTest, OtherClientErrorFails) {
    transport_.respond_with_status(URL, 400, 1);

    auto result = run(make_task());

    EXPECT_EQ(result.outcome, transfer_outcome::failed);
    EXPECT_EQ(result.err.code, error_code::remote_rejected);
}

// =============================================================================
// Interruption
// =============================================================================

TEST_F(ResumableTransferTest, StopBeforeStartIsInterrupted) {
    stop_.request_stop();
    auto task = make_task();

    auto result = run(task);

    EXPECT_EQ(result.outcome, transfer_outcome::interrupted);
    EXPECT_EQ(transport_.request_count(), 0u);
}

TEST_F(ResumableTransferTest, InterruptedLimiterStopsAtChunkBoundary) {
    rate_limiter limited(1024 * 1024);
    limited.interrupt();
    auto task = make_task();

    resumable_transfer transfer(transport_, limited, options_);
    auto result = transfer.run(task, credential_, stop_);

    EXPECT_EQ(result.outcome, transfer_outcome::interrupted);
    EXPECT_EQ(result.bytes_confirmed, 0u);
    EXPECT_FALSE(std::filesystem::exists(task.final_path));
}

// =============================================================================
// Static helpers
// =============================================================================

TEST(TransferStatusTest, ClassifyStatus) {
    EXPECT_EQ(resumable_transfer::classify_status(200), error_code::success);
    EXPECT_EQ(resumable_transfer::classify_status(206), error_code::success);
    EXPECT_EQ(resumable_transfer::classify_status(302), error_code::auth_failure);
    EXPECT_EQ(resumable_transfer::classify_status(401), error_code::auth_failure);
    EXPECT_EQ(resumable_transfer::classify_status(403), error_code::auth_failure);
    EXPECT_EQ(resumable_transfer::classify_status(404), error_code::remote_not_found);
    EXPECT_EQ(resumable_transfer::classify_status(410), error_code::remote_not_found);
    EXPECT_EQ(resumable_transfer::classify_status(416), error_code::range_not_satisfiable);
    EXPECT_EQ(resumable_transfer::classify_status(429), error_code::remote_server_error);
    EXPECT_EQ(resumable_transfer::classify_status(502), error_code::remote_server_error);
    EXPECT_EQ(resumable_transfer::classify_status(418), error_code::remote_rejected);
    EXPECT_EQ(resumable_transfer::classify_status(100), error_code::invalid_response);
}

TEST(RetryPolicyTest, ExponentialBackoffIsCapped) {
    retry_policy policy;
    policy.initial_delay = 100ms;
    policy.max_delay = 1000ms;
    policy.backoff_multiplier = 2.0;

    EXPECT_EQ(policy.delay_for(0), 0ms);
    EXPECT_EQ(policy.delay_for(1), 100ms);
    EXPECT_EQ(policy.delay_for(2), 200ms);
    EXPECT_EQ(policy.delay_for(4), 800ms);
    EXPECT_EQ(policy.delay_for(5), 1000ms);
}

}  // namespace archive_fetch::test
