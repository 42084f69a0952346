// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file progress_tracker.h
 * @brief Aggregate throughput and ETA for a fetch job
 * @version 0.1.0
 *
 * Throughput is an exponential moving average whose weight decays over a
 * configurable window, so the rate reflects roughly the last N seconds.
 */

#ifndef ARCHIVE_FETCH_CORE_PROGRESS_TRACKER_H
#define ARCHIVE_FETCH_CORE_PROGRESS_TRACKER_H

#include <archive_fetch/core/transfer_types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace archive_fetch {

/**
 * @brief Cumulative job counters
 */
struct transfer_progress {
    /// Bytes written by this process
    uint64_t session_bytes = 0;
    /// Bytes already on disk when the job started
    uint64_t historical_bytes = 0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::milliseconds elapsed{0};
    /// Smoothed aggregate throughput in bytes per second
    double aggregate_rate = 0.0;
    std::optional<std::chrono::seconds> eta;

    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t pending = 0;
    std::size_t in_progress = 0;
    std::size_t auth_blocked = 0;

    [[nodiscard]] auto total_bytes() const noexcept -> uint64_t {
        return session_bytes + historical_bytes;
    }
};

/**
 * @brief Throughput and ETA aggregator
 *
 * Not thread-safe: a single owner feeds it byte deltas and reads the
 * smoothed values.
 *
 * @code
 * progress_tracker tracker;
 * tracker.start(bytes_already_on_disk);
 *
 * tracker.record_delta(task.index, chunk_size);
 * tracker.sample();
 * auto eta = tracker.estimate_eta(progress_tracker::estimate_remaining_bytes(tasks));
 * @endcode
 */
class progress_tracker {
public:
    using clock = std::chrono::steady_clock;

    struct config {
        std::chrono::milliseconds smoothing_window{10000};
        std::chrono::milliseconds sample_interval{250};
    };

    progress_tracker();
    explicit progress_tracker(config cfg);

    void start(uint64_t historical_bytes, clock::time_point now = clock::now());

    /**
     * @brief Account bytes written for one task
     */
    void record_delta(uint64_t index, uint64_t bytes);

    /**
     * @brief Fold accumulated deltas into the moving averages
     *
     * Calls closer together than the sample interval are ignored.
     */
    void sample(clock::time_point now = clock::now());

    /**
     * @brief Drop per-file state once a task stops transferring
     */
    void forget_file(uint64_t index);

    [[nodiscard]] auto aggregate_rate() const noexcept -> double { return aggregate_rate_; }

    [[nodiscard]] auto file_rate(uint64_t index) const -> double;

    [[nodiscard]] auto session_bytes() const noexcept -> uint64_t { return session_bytes_; }

    [[nodiscard]] auto historical_bytes() const noexcept -> uint64_t { return historical_bytes_; }

    [[nodiscard]] auto elapsed(clock::time_point now = clock::now()) const
        -> std::chrono::milliseconds;

    [[nodiscard]] auto started_at() const noexcept -> std::chrono::system_clock::time_point {
        return started_wall_;
    }

    /**
     * @brief ETA for @p remaining_bytes at the current smoothed rate
     * @return nullopt while no rate has been measured
     */
    [[nodiscard]] auto estimate_eta(std::optional<uint64_t> remaining_bytes) const
        -> std::optional<std::chrono::seconds>;

    /**
     * @brief Bytes still to fetch across pending and in-progress tasks
     *
     * Tasks with an unknown size are estimated from the average known size.
     * Returns nullopt when no size is known at all.
     */
    [[nodiscard]] static auto estimate_remaining_bytes(const std::vector<file_task>& tasks)
        -> std::optional<uint64_t>;

private:
    struct rate_state {
        uint64_t pending_bytes = 0;
        double rate = 0.0;
        bool primed = false;
    };

    [[nodiscard]] auto smoothing_factor(double dt_seconds) const -> double;

    config cfg_;
    clock::time_point started_{};
    std::chrono::system_clock::time_point started_wall_{};
    clock::time_point last_sample_{};
    uint64_t session_bytes_ = 0;
    uint64_t historical_bytes_ = 0;
    rate_state aggregate_{};
    double aggregate_rate_ = 0.0;
    std::unordered_map<uint64_t, rate_state> files_;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_PROGRESS_TRACKER_H
