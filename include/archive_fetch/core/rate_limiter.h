// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file rate_limiter.h
 * @brief Shared byte budget throttling all concurrent transfers
 *
 * A fixed-window budget: each window of @c window_length releases at most
 * @c bytes_per_window bytes. Callers are served strictly in arrival order so
 * a worker asking for a large chunk cannot be starved by smaller requests.
 */

#ifndef ARCHIVE_FETCH_CORE_RATE_LIMITER_H
#define ARCHIVE_FETCH_CORE_RATE_LIMITER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace archive_fetch {

/**
 * @brief Windowed byte budget with FIFO fairness
 *
 * @code
 * rate_limiter limiter(10 * 1024 * 1024);  // 10 MiB per second
 *
 * // Before writing each chunk
 * if (!limiter.acquire(chunk.size())) {
 *     return;  // interrupted by cancellation
 * }
 * @endcode
 *
 * A request larger than one window's budget is honored by accumulating
 * budget across as many windows as needed. A budget of 0 disables limiting.
 */
class rate_limiter {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @brief Construct a limiter
     * @param bytes_per_window Bytes released per window (0 = unlimited)
     * @param window_length Duration of one budget window
     */
    explicit rate_limiter(uint64_t bytes_per_window,
                          std::chrono::milliseconds window_length = std::chrono::seconds(1));

    ~rate_limiter();

    rate_limiter(const rate_limiter&) = delete;
    auto operator=(const rate_limiter&) -> rate_limiter& = delete;
    rate_limiter(rate_limiter&&) = delete;
    auto operator=(rate_limiter&&) -> rate_limiter& = delete;

    /**
     * @brief Block until @p bytes of budget have been debited
     *
     * Waiters are served in arrival order.
     *
     * @return false if the wait was interrupted before the full amount
     *         was granted, true otherwise
     */
    [[nodiscard]] auto acquire(uint64_t bytes) -> bool;

    /**
     * @brief Debit budget only if it is available right now
     *
     * Fails when other callers are already queued.
     */
    [[nodiscard]] auto try_acquire(uint64_t bytes) -> bool;

    /**
     * @brief Change the per-window budget (0 = unlimited)
     */
    auto set_limit(uint64_t bytes_per_window) -> void;

    [[nodiscard]] auto get_limit() const noexcept -> uint64_t;

    [[nodiscard]] auto window_length() const noexcept -> std::chrono::milliseconds;

    [[nodiscard]] auto is_enabled() const noexcept -> bool;

    /**
     * @brief Wake every waiter and make acquire() return false
     *
     * Stays in effect until resume() is called.
     */
    auto interrupt() -> void;

    auto resume() -> void;

    [[nodiscard]] auto is_interrupted() const noexcept -> bool;

    /**
     * @brief Budget left in the current window
     */
    [[nodiscard]] auto available_budget() -> uint64_t;

    /**
     * @brief Number of callers currently queued in acquire()
     */
    [[nodiscard]] auto waiting_count() const -> std::size_t;

    /**
     * @brief Total bytes granted since construction
     */
    [[nodiscard]] auto total_released() const noexcept -> uint64_t;

private:
    auto roll_window(clock::time_point now) -> void;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> bytes_per_window_;
    std::chrono::milliseconds window_length_;
    std::atomic<bool> interrupted_{false};
    std::atomic<uint64_t> total_released_{0};

    // Guarded by mutex_
    clock::time_point window_start_;
    uint64_t window_remaining_;
    uint64_t next_ticket_ = 0;
    uint64_t serving_ticket_ = 0;
    uint64_t generation_ = 0;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_RATE_LIMITER_H
