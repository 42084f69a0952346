/**
 * @file test_fixtures.h
 * @brief Common test fixtures for integration tests
 */

#ifndef ARCHIVE_FETCH_TEST_FIXTURES_H
#define ARCHIVE_FETCH_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <archive_fetch/archive_fetch.h>

#include "../support/fake_http_transport.h"
#include "../support/zip_builder.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace archive_fetch::test {

using namespace std::chrono_literals;

/**
 * @brief Base fixture with a temporary output directory
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("archive_fetch_it_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Events collected from an orchestrator
 *
 * Callbacks run on the coordinator thread, so readers lock.
 */
class event_recorder {
public:
    void record(const fetch_event& event) {
        {
            std::lock_guard lock(mutex_);
            events_.push_back(event);
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto count(fetch_event_type type) const -> std::size_t {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& event : events_) {
            if (event.type == type) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] auto of_type(fetch_event_type type) const -> std::vector<fetch_event> {
        std::lock_guard lock(mutex_);
        std::vector<fetch_event> matching;
        for (const auto& event : events_) {
            if (event.type == type) {
                matching.push_back(event);
            }
        }
        return matching;
    }

    /**
     * @brief Block until an event of @p type arrives
     */
    auto wait_for(fetch_event_type type, std::chrono::milliseconds timeout = 5000ms) -> bool {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            for (const auto& event : events_) {
                if (event.type == type) {
                    return true;
                }
            }
            return false;
        });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<fetch_event> events_;
};

/**
 * @brief Poll @p condition until it holds or @p timeout elapses
 */
inline auto eventually(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = 5000ms) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

/**
 * @brief Fixture serving a numbered archive sequence from a fake transport
 */
class OrchestratorFixture : public TempDirectoryFixture {
protected:
    static constexpr std::size_t ARCHIVE_SIZE = 64 * 1024;
    static constexpr const char* FIRST_URL = "https://takeout.example.com/dl/takeout-001.zip?j=7";

    void SetUp() override {
        TempDirectoryFixture::SetUp();
        transport_ = std::make_shared<fake_http_transport>();
    }

    [[nodiscard]] static auto url_for(uint64_t index) -> std::string {
        return url_template::parse(FIRST_URL).value().url_for(index);
    }

    [[nodiscard]] static auto filename_for(uint64_t index) -> std::string {
        return url_template::parse(FIRST_URL).value().filename_for(index);
    }

    /**
     * @brief Publish archives 1..@p count on the fake server
     */
    void serve_archives(uint64_t count) {
        for (uint64_t index = 1; index <= count; ++index) {
            auto archive = zip_builder::archive_of_size(ARCHIVE_SIZE, static_cast<uint32_t>(index));
            archives_.push_back(archive);
            transport_->add_file(url_for(index), std::move(archive));
        }
    }

    [[nodiscard]] auto make_config(uint64_t file_count, std::size_t concurrency) const
        -> fetch_config {
        fetch_config config;
        config.first_url = FIRST_URL;
        config.credential = "initial";
        config.output_directory = test_dir_;
        config.file_count = file_count;
        config.concurrency = concurrency;
        config.chunk_size = 4096;
        config.retry.initial_delay = 1ms;
        config.retry.max_delay = 10ms;
        config.retry.max_retries = 3;
        config.eta_window = 1000ms;
        config.progress_interval = 20ms;
        return config;
    }

    [[nodiscard]] auto build(const fetch_config& config) -> transfer_orchestrator {
        auto orchestrator = transfer_orchestrator::builder()
                                .with_config(config)
                                .with_transport(transport_)
                                .build();
        EXPECT_TRUE(orchestrator.has_value()) << orchestrator.error().message;
        auto built = std::move(orchestrator.value());
        built.on_event([this](const fetch_event& event) { events_.record(event); });
        return built;
    }

    [[nodiscard]] auto task_at(const transfer_orchestrator& orchestrator, uint64_t index) const
        -> file_task {
        for (const auto& task : orchestrator.tasks()) {
            if (task.index == index) {
                return task;
            }
        }
        return {};
    }

    std::shared_ptr<fake_http_transport> transport_;
    std::vector<std::vector<uint8_t>> archives_;
    event_recorder events_;
};

}  // namespace archive_fetch::test

#endif  // ARCHIVE_FETCH_TEST_FIXTURES_H
