// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file transfer_orchestrator.cpp
 * @brief Coordinator, dispatch and pause/resume state machine
 */

#include "archive_fetch/transfer/transfer_orchestrator.h"

#include "archive_fetch/core/job_state_store.h"
#include "archive_fetch/core/logging.h"
#include "archive_fetch/core/message_channel.h"
#include "archive_fetch/core/rate_limiter.h"
#include "archive_fetch/core/stop_signal.h"
#include "archive_fetch/core/url_template.h"
#include "archive_fetch/transfer/resumable_transfer.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <variant>

namespace archive_fetch {

namespace {

// Messages posted to the coordinator
struct worker_progress {
    transfer_delta delta;
};

struct worker_finished {
    transfer_result result;
};

struct credential_replaced {
    std::string token;
};

struct cancel_requested {};

using coordinator_message =
    std::variant<worker_progress, worker_finished, credential_replaced, cancel_requested>;

constexpr auto COORDINATOR_TICK = std::chrono::milliseconds(100);
constexpr std::size_t MAX_MESSAGES_PER_TICK = 256;
constexpr std::size_t MIN_FAILED_PROBES = 3;

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

class transfer_orchestrator::impl {
public:
    impl(fetch_config config, url_template tmpl, std::shared_ptr<http_transport> transport,
         std::shared_ptr<adapters::worker_pool_interface> pool,
         progress_tracker::config progress_config)
        : config_(std::move(config)),
          tmpl_(std::move(tmpl)),
          transport_(std::move(transport)),
          pool_(std::move(pool)),
          limiter_(config_.rate_limit),
          store_(config_.output_directory),
          transfer_(*transport_, limiter_, config_.to_transfer_options()),
          tracker_(progress_config) {
        load_options_.file_count =
            config_.file_count > 0 ? std::optional<uint64_t>(config_.file_count) : std::nullopt;
        load_options_.resume_enabled = config_.resume_enabled;
        load_options_.verify_completed = config_.verify_enabled;
    }

    ~impl() {
        if (coordinator_.joinable()) {
            channel_.push(cancel_requested{});
            coordinator_.join();
        }
    }

    // ========================================================================
    // Public surface
    // ========================================================================

    void on_event(fetch_event_callback callback) {
        std::lock_guard lock(callback_mutex_);
        callbacks_.push_back(std::move(callback));
    }

    auto start() -> result<void> {
        std::lock_guard lock(lifecycle_mutex_);
        if (state_.load() != orchestrator_state::idle) {
            return unexpected(error{error_code::job_already_running,
                                    "job has already been started"});
        }

        if (auto prepared = store_.prepare(); !prepared.has_value()) {
            return prepared;
        }

        auto loaded = store_.load(tmpl_, load_options_);
        if (!loaded.has_value()) {
            return unexpected(loaded.error());
        }

        uint64_t historical = 0;
        for (auto& task : loaded.value()) {
            historical += task.bytes_confirmed;
            if (task.status == task_status::done || task.bytes_confirmed > 0) {
                known_existing_max_ = std::max(known_existing_max_, task.index);
            }
            tasks_.emplace(task.index, std::move(task));
        }

        discovering_ = !load_options_.file_count.has_value();
        if (discovering_) {
            auto manifest = store_.load_manifest();
            if (manifest.has_value() && manifest.value().first_url == tmpl_.source() &&
                manifest.value().discovered_end) {
                discovery_end_ = manifest.value().discovered_end;
                AF_LOG_INFO(log_category::orchestrator,
                            "Sequence end already known: " + std::to_string(*discovery_end_));
            }
        }
        next_probe_ = tasks_.empty() ? 1 : tasks_.rbegin()->first + 1;

        if (auto saved = store_.save_manifest(current_manifest()); !saved.has_value()) {
            return saved;
        }

        get_logger().register_secret(config_.credential);
        credential_ = make_credential(config_.credential, 1);
        tracker_.start(historical);
        state_.store(orchestrator_state::running);
        publish();

        AF_LOG_INFO(log_category::orchestrator,
                    "Starting job: " + std::to_string(tasks_.size()) + " known archives, " +
                        std::to_string(config_.concurrency) + " workers, " +
                        (config_.rate_limit > 0
                             ? std::to_string(config_.rate_limit) + " B/s limit"
                             : std::string("no rate limit")) +
                        (discovering_ && !discovery_end_ ? ", discovering sequence end" : ""));

        coordinator_ = std::thread([this] { coordinate(); });
        return {};
    }

    auto wait() -> job_summary {
        {
            std::unique_lock lock(done_mutex_);
            if (state_.load() == orchestrator_state::idle) {
                return summary_;
            }
            done_cv_.wait(lock, [this] { return finished_; });
        }
        join_coordinator();
        std::lock_guard lock(done_mutex_);
        return summary_;
    }

    auto replace_credential(std::string token) -> result<void> {
        if (token.empty()) {
            return unexpected(error{error_code::credential_missing, "credential is empty"});
        }
        auto current = state_.load();
        if (current == orchestrator_state::idle || current == orchestrator_state::completed) {
            return unexpected(error{error_code::job_not_running, "job is not running"});
        }
        get_logger().register_secret(token);
        if (!channel_.push(credential_replaced{std::move(token)})) {
            return unexpected(error{error_code::job_not_running, "job is shutting down"});
        }
        return {};
    }

    void cancel() {
        if (!channel_.push(cancel_requested{})) {
            AF_LOG_DEBUG(log_category::orchestrator, "Cancel ignored: job already finished");
        }
    }

    auto state() const -> orchestrator_state { return state_.load(); }

    auto progress() const -> transfer_progress {
        std::lock_guard lock(snapshot_mutex_);
        return published_progress_;
    }

    auto tasks() const -> std::vector<file_task> {
        std::lock_guard lock(snapshot_mutex_);
        return published_tasks_;
    }

    auto completed_files() const -> std::vector<std::filesystem::path> {
        std::lock_guard lock(snapshot_mutex_);
        std::vector<std::filesystem::path> files;
        for (const auto& task : published_tasks_) {
            if (task.status == task_status::done) {
                files.push_back(task.final_path);
            }
        }
        return files;
    }

    auto config() const -> const fetch_config& { return config_; }

private:
    struct active_worker {
        std::shared_ptr<stop_signal> stop;
        std::future<void> done;
    };

    // ========================================================================
    // Coordinator loop
    // ========================================================================

    void coordinate() {
        auto next_progress = progress_tracker::clock::now() + config_.progress_interval;

        while (true) {
            dispatch();
            if (should_complete()) {
                break;
            }

            if (auto message = channel_.wait_pop(COORDINATOR_TICK)) {
                handle(*message);
                for (std::size_t i = 0; i < MAX_MESSAGES_PER_TICK; ++i) {
                    auto more = channel_.try_pop();
                    if (!more) {
                        break;
                    }
                    handle(*more);
                }
            }

            auto now = progress_tracker::clock::now();
            tracker_.sample(now);
            check_expiry_warning(now);
            if (now >= next_progress) {
                emit(make_event(fetch_event_type::progress));
                next_progress = now + config_.progress_interval;
            }
            publish();
        }

        finish_job();
    }

    void handle(coordinator_message& message) {
        if (auto* progress = std::get_if<worker_progress>(&message)) {
            on_progress(progress->delta);
        } else if (auto* finished = std::get_if<worker_finished>(&message)) {
            on_finished(finished->result);
        } else if (auto* credential = std::get_if<credential_replaced>(&message)) {
            on_credential(std::move(credential->token));
        } else if (std::holds_alternative<cancel_requested>(message)) {
            on_cancel();
        }
    }

    auto should_complete() const -> bool {
        if (!active_.empty()) {
            return false;
        }
        switch (state_.load()) {
            case orchestrator_state::draining:
                return true;
            case orchestrator_state::running:
                return next_pending() == nullptr && !discovery_open();
            default:
                return false;
        }
    }

    // ========================================================================
    // Dispatch
    // ========================================================================

    void dispatch() {
        while (state_.load() == orchestrator_state::running &&
               active_.size() < config_.concurrency) {
            auto* next = next_pending();
            if (next == nullptr) {
                if (!extend_discovery()) {
                    break;
                }
                continue;
            }
            launch(*next);
        }
    }

    auto next_pending() const -> const file_task* {
        for (const auto& [index, task] : tasks_) {
            if (task.status == task_status::pending) {
                return &task;
            }
        }
        return nullptr;
    }

    auto next_pending() -> file_task* {
        return const_cast<file_task*>(std::as_const(*this).next_pending());
    }

    auto discovery_open() const -> bool {
        return discovering_ && !discovery_end_ && !discovery_abandoned_;
    }

    /**
     * @brief Append the next probe index while the sequence end is unknown
     */
    auto extend_discovery() -> bool {
        if (!discovery_open()) {
            return false;
        }
        auto task = store_.load_task(tmpl_, next_probe_, load_options_);
        if (!task.has_value()) {
            fail_job(task.error());
            return false;
        }
        ++next_probe_;
        auto index = task.value().index;
        AF_LOG_DEBUG(log_category::orchestrator, "Probing index " + std::to_string(index));
        tasks_.emplace(index, std::move(task.value()));
        return true;
    }

    void launch(file_task& task) {
        set_status(task, task_status::in_progress);
        record_task(task);

        auto stop = std::make_shared<stop_signal>();
        auto worker = [this, snapshot = task, credential = credential_, stop]() {
            run_worker(snapshot, credential, *stop);
        };
        active_.emplace(task.index, active_worker{stop, pool_->submit(std::move(worker))});
    }

    /**
     * @brief Body of one worker; runs on the pool
     */
    void run_worker(const file_task& task, const session_credential& credential,
                    stop_signal& stop) {
        transfer_result result;
        try {
            result = transfer_.run(task, credential, stop, [this](const transfer_delta& delta) {
                channel_.push(worker_progress{delta});
            });
        } catch (const std::exception& e) {
            result.index = task.index;
            result.outcome = transfer_outcome::failed;
            result.bytes_confirmed = task.bytes_confirmed;
            result.credential_generation = credential.generation;
            result.err = error{error_code::internal_error, std::string("worker raised: ") + e.what()};
        }
        channel_.push(worker_finished{std::move(result)});
    }

    void stop_workers() {
        for (auto& [index, worker] : active_) {
            worker.stop->request_stop();
        }
    }

    // ========================================================================
    // Worker messages
    // ========================================================================

    void on_progress(const transfer_delta& delta) {
        auto it = tasks_.find(delta.index);
        if (it == tasks_.end()) {
            return;
        }
        auto& task = it->second;
        task.bytes_confirmed = delta.bytes_confirmed;
        if (delta.expected_size) {
            task.expected_size = delta.expected_size;
        }
        tracker_.record_delta(delta.index, delta.bytes);

        auto& checkpoint = last_checkpoint_[delta.index];
        if (delta.restarted) {
            checkpoint = 0;
        }

        if (delta.verifying) {
            set_status(task, task_status::verifying);
            record_task(task);
            return;
        }
        if (delta.bytes_confirmed >= checkpoint + config_.checkpoint_interval) {
            checkpoint = delta.bytes_confirmed;
            record_task(task);
        }
    }

    void on_finished(const transfer_result& result) {
        if (auto active = active_.find(result.index); active != active_.end()) {
            active->second.done.wait();
            active_.erase(active);
        }
        tracker_.forget_file(result.index);
        last_checkpoint_.erase(result.index);

        auto it = tasks_.find(result.index);
        if (it == tasks_.end()) {
            return;
        }
        auto& task = it->second;
        task.bytes_confirmed = result.bytes_confirmed;
        if (result.expected_size) {
            task.expected_size = result.expected_size;
        }
        if (result.err) {
            task.last_error = result.err.message;
        }

        switch (result.outcome) {
            case transfer_outcome::completed:
                task.last_error.clear();
                known_existing_max_ = std::max(known_existing_max_, task.index);
                failed_probes_ = 0;
                set_status(task, task_status::done);
                break;

            case transfer_outcome::corrupt:
                ++task.retry_count;
                task.bytes_confirmed = 0;
                if (task.retry_count > config_.retry.max_retries) {
                    set_status(task, task_status::failed,
                               "corrupt " + std::to_string(task.retry_count) + " times");
                } else {
                    set_status(task, task_status::pending,
                               "corrupt, restart " + std::to_string(task.retry_count));
                }
                break;

            case transfer_outcome::auth_failure:
                handle_auth_failure(task, result);
                break;

            case transfer_outcome::not_found:
                if (handle_not_found(task)) {
                    return;
                }
                break;

            case transfer_outcome::failed:
                if (beyond_discovered_end(task)) {
                    drop_probe(it);
                    return;
                }
                note_failed_probe(task);
                set_status(task, task_status::failed);
                break;

            case transfer_outcome::storage_failure:
                set_status(task, task_status::pending);
                fail_job(result.err);
                break;

            case transfer_outcome::interrupted:
                set_status(task, state_.load() == orchestrator_state::paused_auth_expired
                                     ? task_status::auth_blocked
                                     : task_status::pending);
                break;
        }

        record_task(task);
    }

    void handle_auth_failure(file_task& task, const transfer_result& result) {
        if (result.credential_generation < credential_.generation) {
            // Rejected under a credential that has since been replaced
            set_status(task, task_status::pending, "stale credential");
            return;
        }

        set_status(task, task_status::auth_blocked, task.last_error);
        if (state_.load() != orchestrator_state::running) {
            return;
        }

        state_.store(orchestrator_state::paused_auth_expired);
        stop_workers();
        AF_LOG_WARN(log_category::orchestrator,
                    "Session credential rejected on " + task.filename() + ": " +
                        task.last_error + "; pausing " + std::to_string(active_.size()) +
                        " in-flight transfers");

        if (auth_event_generation_ != credential_.generation) {
            auth_event_generation_ = credential_.generation;
            auto event = make_event(fetch_event_type::auth_expired);
            event.task = task;
            event.message = task.last_error;
            emit(event);
        }
    }

    /**
     * @return true if the task was removed as a probe past the sequence end
     */
    auto handle_not_found(file_task& task) -> bool {
        bool probe = discovering_ && task.index > known_existing_max_;
        if (!probe) {
            set_status(task, task_status::failed, "remote archive not found");
            return false;
        }

        uint64_t end = task.index - 1;
        if (!discovery_end_ || end < *discovery_end_) {
            discovery_end_ = end;
            AF_LOG_INFO(log_category::orchestrator,
                        "Sequence ends at index " + std::to_string(end));
            if (auto saved = store_.save_manifest(current_manifest()); !saved.has_value()) {
                AF_LOG_WARN(log_category::state,
                            "Could not save job manifest: " + saved.error().message);
            }
        }

        for (auto it = tasks_.begin(); it != tasks_.end();) {
            auto& candidate = it->second;
            bool beyond_end = candidate.index > *discovery_end_;
            bool idle = candidate.status == task_status::pending ||
                        candidate.status == task_status::failed ||
                        candidate.index == task.index;
            if (beyond_end && idle && active_.count(candidate.index) == 0) {
                if (auto forgotten = store_.forget(candidate); !forgotten.has_value()) {
                    AF_LOG_WARN(log_category::state, forgotten.error().message);
                }
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
        return true;
    }

    auto beyond_discovered_end(const file_task& task) const -> bool {
        return discovering_ && discovery_end_ && task.index > *discovery_end_;
    }

    /**
     * @brief Remove a probe that turned out to lie past the sequence end
     */
    void drop_probe(std::map<uint64_t, file_task>::iterator it) {
        if (auto forgotten = store_.forget(it->second); !forgotten.has_value()) {
            AF_LOG_WARN(log_category::state, forgotten.error().message);
        }
        tasks_.erase(it);
    }

    void note_failed_probe(const file_task& task) {
        if (!discovery_open() || task.index <= known_existing_max_) {
            return;
        }
        ++failed_probes_;
        if (failed_probes_ >= std::max(config_.concurrency, MIN_FAILED_PROBES)) {
            discovery_abandoned_ = true;
            AF_LOG_WARN(log_category::orchestrator,
                        "Stopping discovery after " + std::to_string(failed_probes_) +
                            " failed probes");
        }
    }

    // ========================================================================
    // External requests
    // ========================================================================

    void on_credential(std::string token) {
        credential_ = make_credential(std::move(token), credential_.generation + 1);
        warning_emitted_ = false;
        AF_LOG_INFO(log_category::orchestrator,
                    "Session credential replaced (generation " +
                        std::to_string(credential_.generation) + ")");

        if (state_.load() != orchestrator_state::paused_auth_expired) {
            return;
        }
        for (auto& [index, task] : tasks_) {
            if (task.status == task_status::auth_blocked) {
                set_status(task, task_status::pending, "credential renewed");
                record_task(task);
            }
        }
        state_.store(orchestrator_state::running);
        AF_LOG_INFO(log_category::orchestrator, "Resuming dispatch");
    }

    void on_cancel() {
        auto current = state_.load();
        if (current != orchestrator_state::running &&
            current != orchestrator_state::paused_auth_expired) {
            return;
        }
        cancelled_ = true;
        enter_draining();
        AF_LOG_INFO(log_category::orchestrator,
                    "Cancellation requested, draining " + std::to_string(active_.size()) +
                        " in-flight transfers");
    }

    void enter_draining() {
        state_.store(orchestrator_state::draining);
        stop_workers();
        limiter_.interrupt();
        for (auto& [index, task] : tasks_) {
            if (task.status == task_status::auth_blocked) {
                set_status(task, task_status::pending);
                record_task(task);
            }
        }
    }

    void fail_job(const error& err) {
        if (fatal_error_) {
            return;
        }
        fatal_error_ = err;
        AF_LOG_ERROR(log_category::orchestrator, "Fatal storage error: " + err.message);

        auto event = make_event(fetch_event_type::job_failed);
        event.message = err.message;
        emit(event);

        if (state_.load() != orchestrator_state::draining) {
            enter_draining();
        }
    }

    void check_expiry_warning(progress_tracker::clock::time_point now) {
        if (warning_emitted_ || state_.load() != orchestrator_state::running ||
            !credential_.warning_due(now)) {
            return;
        }
        warning_emitted_ = true;
        auto event = make_event(fetch_event_type::expiry_warning);
        event.message = "session credential is " +
                        std::to_string(credential_.elapsed(now).count() / 60) +
                        " minutes old, about " +
                        std::to_string(credential_.remaining(now).count() / 60) +
                        " minutes left";
        AF_LOG_WARN(log_category::orchestrator, event.message);
        emit(event);
    }

    // ========================================================================
    // Completion
    // ========================================================================

    void finish_job() {
        state_.store(orchestrator_state::completed);

        job_summary summary;
        summary.total = tasks_.size();
        for (const auto& [index, task] : tasks_) {
            if (task.status == task_status::done) {
                ++summary.succeeded;
                summary.completed_files.push_back(task.final_path);
            } else if (task.status == task_status::failed) {
                ++summary.failed;
            }
        }
        summary.unfinished = summary.total - summary.succeeded - summary.failed;
        summary.session_bytes = tracker_.session_bytes();
        summary.historical_bytes = tracker_.historical_bytes();
        summary.elapsed = tracker_.elapsed();
        summary.cancelled = cancelled_;
        summary.fatal_error = fatal_error_;

        publish();
        AF_LOG_INFO(log_category::orchestrator,
                    "Job completed: " + std::to_string(summary.succeeded) + " succeeded, " +
                        std::to_string(summary.failed) + " failed" +
                        (summary.unfinished > 0
                             ? ", " + std::to_string(summary.unfinished) + " unfinished"
                             : std::string()));

        auto event = make_event(fetch_event_type::job_completed);
        event.summary = summary;
        emit(event);

        channel_.close();
        {
            std::lock_guard lock(done_mutex_);
            summary_ = std::move(summary);
            finished_ = true;
        }
        done_cv_.notify_all();
    }

    void join_coordinator() {
        std::lock_guard lock(lifecycle_mutex_);
        if (coordinator_.joinable() && coordinator_.get_id() != std::this_thread::get_id()) {
            coordinator_.join();
        }
    }

    // ========================================================================
    // Helpers
    // ========================================================================

    void set_status(file_task& task, task_status status, const std::string& note = {}) {
        if (task.status == status) {
            return;
        }
        auto previous = task.status;
        task.status = status;

        fetch_log_context ctx;
        ctx.sequence_index = task.index;
        ctx.filename = task.filename();
        ctx.bytes_confirmed = task.bytes_confirmed;
        ctx.expected_size = task.expected_size;
        ctx.retry_count = task.retry_count;
        if (!note.empty()) {
            ctx.error_message = note;
        }
        AF_LOG_DEBUG_CTX(log_category::orchestrator,
                         std::string(to_string(previous)) + " -> " +
                             std::string(to_string(status)),
                         ctx);

        auto event = make_event(fetch_event_type::task_status_changed);
        event.task = task;
        event.previous_status = previous;
        event.message = note;
        emit(event);
    }

    void record_task(const file_task& task) {
        auto recorded = store_.record(task);
        if (recorded.has_value()) {
            return;
        }
        AF_LOG_ERROR(log_category::state,
                     "Could not record " + task.filename() + ": " + recorded.error().message);
        if (is_job_fatal(recorded.error().code)) {
            fail_job(recorded.error());
        }
    }

    auto make_credential(std::string token, uint64_t generation) const -> session_credential {
        session_credential credential;
        credential.token = std::move(token);
        credential.accepted_at = session_credential::clock::now();
        credential.ttl = config_.credential_ttl;
        credential.warning_threshold = config_.credential_warning;
        credential.generation = generation;
        return credential;
    }

    auto current_manifest() const -> job_manifest {
        job_manifest manifest;
        manifest.first_url = tmpl_.source();
        manifest.file_count = load_options_.file_count;
        manifest.discovered_end = discovery_end_;
        return manifest;
    }

    auto snapshot_tasks() const -> std::vector<file_task> {
        std::vector<file_task> list;
        list.reserve(tasks_.size());
        for (const auto& [index, task] : tasks_) {
            list.push_back(task);
        }
        return list;
    }

    auto compute_progress(const std::vector<file_task>& list) const -> transfer_progress {
        transfer_progress progress;
        progress.session_bytes = tracker_.session_bytes();
        progress.historical_bytes = tracker_.historical_bytes();
        progress.started_at = tracker_.started_at();
        progress.elapsed = tracker_.elapsed();
        progress.aggregate_rate = tracker_.aggregate_rate();
        progress.total = list.size();
        for (const auto& task : list) {
            switch (task.status) {
                case task_status::done: ++progress.succeeded; break;
                case task_status::failed: ++progress.failed; break;
                case task_status::pending: ++progress.pending; break;
                case task_status::in_progress:
                case task_status::verifying: ++progress.in_progress; break;
                case task_status::auth_blocked: ++progress.auth_blocked; break;
            }
        }
        progress.eta = tracker_.estimate_eta(progress_tracker::estimate_remaining_bytes(list));
        return progress;
    }

    auto make_event(fetch_event_type type) const -> fetch_event {
        fetch_event event;
        event.type = type;
        event.state = state_.load();
        event.progress = compute_progress(snapshot_tasks());
        event.credential_age = credential_.elapsed();
        event.credential_generation = credential_.generation;
        return event;
    }

    void emit(const fetch_event& event) {
        std::vector<fetch_event_callback> callbacks;
        {
            std::lock_guard lock(callback_mutex_);
            callbacks = callbacks_;
        }
        for (const auto& callback : callbacks) {
            callback(event);
        }
    }

    void publish() {
        auto list = snapshot_tasks();
        auto progress = compute_progress(list);
        std::lock_guard lock(snapshot_mutex_);
        published_tasks_ = std::move(list);
        published_progress_ = progress;
    }

    // Immutable after construction
    fetch_config config_;
    url_template tmpl_;
    std::shared_ptr<http_transport> transport_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
    load_options load_options_;

    // Shared with workers
    rate_limiter limiter_;
    job_state_store store_;
    resumable_transfer transfer_;
    message_channel<coordinator_message> channel_;

    // Coordinator-owned
    progress_tracker tracker_;
    std::map<uint64_t, file_task> tasks_;
    std::unordered_map<uint64_t, active_worker> active_;
    std::unordered_map<uint64_t, uint64_t> last_checkpoint_;
    session_credential credential_;
    bool warning_emitted_ = false;
    uint64_t auth_event_generation_ = 0;
    bool cancelled_ = false;
    std::optional<error> fatal_error_;
    bool discovering_ = false;
    bool discovery_abandoned_ = false;
    std::optional<uint64_t> discovery_end_;
    uint64_t next_probe_ = 1;
    uint64_t known_existing_max_ = 0;
    std::size_t failed_probes_ = 0;

    std::atomic<orchestrator_state> state_{orchestrator_state::idle};

    // Published for other threads
    mutable std::mutex snapshot_mutex_;
    std::vector<file_task> published_tasks_;
    transfer_progress published_progress_;

    std::mutex callback_mutex_;
    std::vector<fetch_event_callback> callbacks_;

    std::mutex lifecycle_mutex_;
    std::thread coordinator_;

    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    bool finished_ = false;
    job_summary summary_;
};

// ============================================================================
// Builder
// ============================================================================

transfer_orchestrator::builder::builder() = default;

auto transfer_orchestrator::builder::with_config(fetch_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer_orchestrator::builder::with_transport(std::shared_ptr<http_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto transfer_orchestrator::builder::with_worker_pool(
    std::shared_ptr<adapters::worker_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_orchestrator::builder::with_progress_config(progress_tracker::config config)
    -> builder& {
    progress_config_ = config;
    return *this;
}

auto transfer_orchestrator::builder::build() -> result<transfer_orchestrator> {
    if (auto valid = config_.validate(); !valid.has_value()) {
        return unexpected(valid.error());
    }
    if (config_.credential.empty()) {
        return unexpected(error{error_code::credential_missing, "a session credential is required"});
    }
    if (!transport_) {
        return unexpected(error{error_code::config_invalid, "an HTTP transport is required"});
    }

    auto tmpl = url_template::parse(config_.first_url);
    if (!tmpl.has_value()) {
        return unexpected(tmpl.error());
    }

    auto pool = pool_ ? pool_ : adapters::worker_pool_factory::create(config_.concurrency);

    progress_tracker::config progress_config;
    progress_config.smoothing_window = config_.eta_window;
    if (progress_config_) {
        progress_config = *progress_config_;
    }

    get_logger().initialize();

    return transfer_orchestrator(std::make_unique<impl>(
        std::move(config_), std::move(tmpl.value()), std::move(transport_), std::move(pool),
        progress_config));
}

// ============================================================================
// transfer_orchestrator
// ============================================================================

transfer_orchestrator::transfer_orchestrator(std::unique_ptr<impl> impl)
    : impl_(std::move(impl)) {}

transfer_orchestrator::~transfer_orchestrator() = default;

transfer_orchestrator::transfer_orchestrator(transfer_orchestrator&&) noexcept = default;
auto transfer_orchestrator::operator=(transfer_orchestrator&&) noexcept
    -> transfer_orchestrator& = default;

void transfer_orchestrator::on_event(fetch_event_callback callback) {
    impl_->on_event(std::move(callback));
}

auto transfer_orchestrator::start() -> result<void> {
    return impl_->start();
}

auto transfer_orchestrator::wait() -> job_summary {
    return impl_->wait();
}

auto transfer_orchestrator::run() -> result<job_summary> {
    if (auto started = impl_->start(); !started.has_value()) {
        return unexpected(started.error());
    }
    return impl_->wait();
}

auto transfer_orchestrator::replace_credential(std::string token) -> result<void> {
    return impl_->replace_credential(std::move(token));
}

void transfer_orchestrator::cancel() {
    impl_->cancel();
}

auto transfer_orchestrator::state() const -> orchestrator_state {
    return impl_->state();
}

auto transfer_orchestrator::progress() const -> transfer_progress {
    return impl_->progress();
}

auto transfer_orchestrator::tasks() const -> std::vector<file_task> {
    return impl_->tasks();
}

auto transfer_orchestrator::completed_files() const -> std::vector<std::filesystem::path> {
    return impl_->completed_files();
}

auto transfer_orchestrator::config() const -> const fetch_config& {
    return impl_->config();
}

}  // namespace archive_fetch
