// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file stop_signal.h
 * @brief Resettable stop request shared between the coordinator and workers
 */

#ifndef ARCHIVE_FETCH_CORE_STOP_SIGNAL_H
#define ARCHIVE_FETCH_CORE_STOP_SIGNAL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace archive_fetch {

/**
 * @brief Stop flag with an interruptible sleep
 *
 * Workers poll stop_requested() between chunks and sleep through backoff
 * delays with wait_for(), which returns early once a stop is requested.
 */
class stop_signal {
public:
    stop_signal() = default;

    stop_signal(const stop_signal&) = delete;
    auto operator=(const stop_signal&) -> stop_signal& = delete;

    void request_stop() {
        {
            std::lock_guard lock(mutex_);
            stopped_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard lock(mutex_);
        stopped_.store(false, std::memory_order_release);
    }

    [[nodiscard]] auto stop_requested() const noexcept -> bool {
        return stopped_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for @p delay unless a stop is requested first
     * @return true if the full delay elapsed, false if stopped
     */
    template <typename Rep, typename Period>
    [[nodiscard]] auto wait_for(std::chrono::duration<Rep, Period> delay) -> bool {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, delay,
                             [this] { return stopped_.load(std::memory_order_acquire); });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_STOP_SIGNAL_H
