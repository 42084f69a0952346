// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file transfer_orchestrator.h
 * @brief Parallel, pausable fetch of a numbered archive sequence
 * @version 0.1.0
 *
 * The orchestrator owns the worker pool, the job state and the progress
 * aggregate. Workers report back through a channel; a single coordinator
 * thread applies every state transition.
 */

#ifndef ARCHIVE_FETCH_TRANSFER_TRANSFER_ORCHESTRATOR_H
#define ARCHIVE_FETCH_TRANSFER_TRANSFER_ORCHESTRATOR_H

#include <archive_fetch/adapters/worker_pool_adapter.h>
#include <archive_fetch/config/fetch_config.h>
#include <archive_fetch/core/progress_tracker.h>
#include <archive_fetch/core/transfer_types.h>
#include <archive_fetch/core/types.h>
#include <archive_fetch/transport/http_transport.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archive_fetch {

/**
 * @brief Job-level state machine
 *
 * idle -> running <-> paused_auth_expired
 * running / paused_auth_expired -> draining -> completed
 * running -> completed
 */
enum class orchestrator_state {
    idle,
    running,
    paused_auth_expired,
    draining,
    completed
};

[[nodiscard]] constexpr auto to_string(orchestrator_state state) noexcept -> std::string_view {
    switch (state) {
        case orchestrator_state::idle: return "idle";
        case orchestrator_state::running: return "running";
        case orchestrator_state::paused_auth_expired: return "paused_auth_expired";
        case orchestrator_state::draining: return "draining";
        case orchestrator_state::completed: return "completed";
        default: return "unknown";
    }
}

/**
 * @brief Final tally of a job
 */
struct job_summary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    /// Tasks left unfinished by a cancellation or a fatal error
    std::size_t unfinished = 0;
    uint64_t session_bytes = 0;
    uint64_t historical_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    bool cancelled = false;
    /// Set when a storage error stopped the job
    std::optional<error> fatal_error;
    /// Final paths of done archives in sequence order
    std::vector<std::filesystem::path> completed_files;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return !cancelled && !fatal_error && failed == 0 && succeeded == total;
    }
};

enum class fetch_event_type {
    task_status_changed,
    progress,
    auth_expired,
    expiry_warning,
    job_failed,
    job_completed
};

[[nodiscard]] constexpr auto to_string(fetch_event_type type) noexcept -> std::string_view {
    switch (type) {
        case fetch_event_type::task_status_changed: return "task_status_changed";
        case fetch_event_type::progress: return "progress";
        case fetch_event_type::auth_expired: return "auth_expired";
        case fetch_event_type::expiry_warning: return "expiry_warning";
        case fetch_event_type::job_failed: return "job_failed";
        case fetch_event_type::job_completed: return "job_completed";
        default: return "unknown";
    }
}

/**
 * @brief Notification published to observers
 *
 * Every event carries a progress snapshot so observers never need to
 * query the orchestrator.
 */
struct fetch_event {
    fetch_event_type type = fetch_event_type::progress;
    orchestrator_state state = orchestrator_state::idle;
    transfer_progress progress;
    /// The task concerned (task_status_changed, auth_expired)
    std::optional<file_task> task;
    std::optional<task_status> previous_status;
    /// Present on job_completed
    std::optional<job_summary> summary;
    /// Time since the active credential was accepted
    std::chrono::seconds credential_age{0};
    uint64_t credential_generation = 0;
    std::string message;
};

using fetch_event_callback = std::function<void(const fetch_event&)>;

/**
 * @brief Parallel fetch job
 *
 * @code
 * auto orchestrator = transfer_orchestrator::builder()
 *     .with_config(config)
 *     .with_transport(std::make_shared<network_http_transport>())
 *     .build();
 *
 * orchestrator.value().on_event([](const fetch_event& event) {
 *     if (event.type == fetch_event_type::auth_expired) {
 *         // ask the user for a new session cookie
 *     }
 * });
 * auto summary = orchestrator.value().run();
 * @endcode
 *
 * replace_credential() and cancel() may be called from any thread,
 * including from inside an event callback.
 */
class transfer_orchestrator {
public:
    class builder {
    public:
        builder();

        auto with_config(fetch_config config) -> builder&;

        /**
         * @brief HTTP transport (required)
         */
        auto with_transport(std::shared_ptr<http_transport> transport) -> builder&;

        /**
         * @brief Worker pool; defaults to worker_pool_factory::create()
         */
        auto with_worker_pool(std::shared_ptr<adapters::worker_pool_interface> pool) -> builder&;

        auto with_progress_config(progress_tracker::config config) -> builder&;

        /**
         * @brief Validate the configuration and build the orchestrator
         */
        [[nodiscard]] auto build() -> result<transfer_orchestrator>;

    private:
        fetch_config config_;
        std::shared_ptr<http_transport> transport_;
        std::shared_ptr<adapters::worker_pool_interface> pool_;
        std::optional<progress_tracker::config> progress_config_;
    };

    ~transfer_orchestrator();

    transfer_orchestrator(const transfer_orchestrator&) = delete;
    auto operator=(const transfer_orchestrator&) -> transfer_orchestrator& = delete;
    transfer_orchestrator(transfer_orchestrator&&) noexcept;
    auto operator=(transfer_orchestrator&&) noexcept -> transfer_orchestrator&;

    /**
     * @brief Register an observer; call before start()
     */
    void on_event(fetch_event_callback callback);

    /**
     * @brief Load job state and begin dispatching
     * @return job_already_running, or the storage error from loading state
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Block until the job reaches completed
     */
    [[nodiscard]] auto wait() -> job_summary;

    /**
     * @brief start() followed by wait()
     */
    [[nodiscard]] auto run() -> result<job_summary>;

    /**
     * @brief Inject a new session credential
     *
     * While paused, auth-blocked tasks are requeued and dispatch resumes.
     */
    [[nodiscard]] auto replace_credential(std::string token) -> result<void>;

    /**
     * @brief Stop dispatching and finish in-flight chunks
     */
    void cancel();

    [[nodiscard]] auto state() const -> orchestrator_state;

    [[nodiscard]] auto progress() const -> transfer_progress;

    /**
     * @brief Snapshot of every task in sequence order
     */
    [[nodiscard]] auto tasks() const -> std::vector<file_task>;

    [[nodiscard]] auto completed_files() const -> std::vector<std::filesystem::path>;

    [[nodiscard]] auto config() const -> const fetch_config&;

private:
    class impl;

    explicit transfer_orchestrator(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_TRANSFER_TRANSFER_ORCHESTRATOR_H
