// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file rate_limiter.cpp
 * @brief Windowed byte budget with FIFO fairness
 */

#include "archive_fetch/core/rate_limiter.h"

#include "archive_fetch/core/logging.h"

#include <algorithm>

namespace archive_fetch {

rate_limiter::rate_limiter(uint64_t bytes_per_window,
                           std::chrono::milliseconds window_length)
    : bytes_per_window_(bytes_per_window)
    , window_length_(window_length.count() > 0 ? window_length
                                               : std::chrono::milliseconds(1000))
    , window_start_(clock::now())
    , window_remaining_(bytes_per_window) {}

rate_limiter::~rate_limiter() {
    interrupt();
}

auto rate_limiter::acquire(uint64_t bytes) -> bool {
    if (bytes == 0) {
        return true;
    }
    if (bytes_per_window_.load(std::memory_order_relaxed) == 0) {
        total_released_ += bytes;
        return true;
    }

    std::unique_lock lock(mutex_);
    if (interrupted_.load()) {
        return false;
    }

    const uint64_t ticket = next_ticket_++;
    const uint64_t generation = generation_;

    // FIFO: wait for our turn at the head of the queue
    cv_.wait(lock, [this, ticket, generation] {
        return serving_ticket_ == ticket || generation_ != generation;
    });

    uint64_t needed = bytes;
    while (needed > 0) {
        if (generation_ != generation) {
            // interrupt() already discarded the whole queue
            return false;
        }

        const uint64_t limit = bytes_per_window_.load(std::memory_order_relaxed);
        if (limit == 0) {
            break;
        }

        roll_window(clock::now());

        const uint64_t take = std::min(needed, window_remaining_);
        window_remaining_ -= take;
        needed -= take;

        if (needed > 0) {
            auto window_end = window_start_ + window_length_;
            cv_.wait_until(lock, window_end, [this, window_end, generation] {
                return generation_ != generation || clock::now() >= window_end ||
                       bytes_per_window_.load(std::memory_order_relaxed) == 0;
            });
        }
    }

    total_released_ += bytes;
    ++serving_ticket_;
    cv_.notify_all();
    return true;
}

auto rate_limiter::try_acquire(uint64_t bytes) -> bool {
    if (bytes == 0 || bytes_per_window_.load(std::memory_order_relaxed) == 0) {
        total_released_ += bytes;
        return true;
    }

    std::lock_guard lock(mutex_);
    if (interrupted_.load() || serving_ticket_ != next_ticket_) {
        return false;
    }

    roll_window(clock::now());
    if (window_remaining_ < bytes) {
        return false;
    }

    window_remaining_ -= bytes;
    total_released_ += bytes;
    return true;
}

auto rate_limiter::set_limit(uint64_t bytes_per_window) -> void {
    {
        std::lock_guard lock(mutex_);
        auto old_limit = bytes_per_window_.exchange(bytes_per_window);
        if (bytes_per_window > old_limit) {
            window_remaining_ += bytes_per_window - old_limit;
        } else {
            window_remaining_ = std::min(window_remaining_, bytes_per_window);
        }
    }
    AF_LOG_DEBUG(log_category::rate_limiter,
                 "Rate limit set to " + std::to_string(bytes_per_window) +
                 " bytes per window");
    cv_.notify_all();
}

auto rate_limiter::get_limit() const noexcept -> uint64_t {
    return bytes_per_window_.load(std::memory_order_relaxed);
}

auto rate_limiter::window_length() const noexcept -> std::chrono::milliseconds {
    return window_length_;
}

auto rate_limiter::is_enabled() const noexcept -> bool {
    return bytes_per_window_.load(std::memory_order_relaxed) > 0;
}

auto rate_limiter::interrupt() -> void {
    {
        std::lock_guard lock(mutex_);
        interrupted_.store(true);
        ++generation_;
        serving_ticket_ = next_ticket_;
    }
    cv_.notify_all();
}

auto rate_limiter::resume() -> void {
    std::lock_guard lock(mutex_);
    interrupted_.store(false);
}

auto rate_limiter::is_interrupted() const noexcept -> bool {
    return interrupted_.load();
}

auto rate_limiter::available_budget() -> uint64_t {
    std::lock_guard lock(mutex_);
    if (bytes_per_window_.load(std::memory_order_relaxed) == 0) {
        return UINT64_MAX;
    }
    roll_window(clock::now());
    return window_remaining_;
}

auto rate_limiter::waiting_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(next_ticket_ - serving_ticket_);
}

auto rate_limiter::total_released() const noexcept -> uint64_t {
    return total_released_.load();
}

auto rate_limiter::roll_window(clock::time_point now) -> void {
    if (now < window_start_ + window_length_) {
        return;
    }

    // Windows are aligned to construction time; unused budget does not carry
    auto elapsed_windows = (now - window_start_) / window_length_;
    window_start_ += window_length_ * elapsed_windows;
    window_remaining_ = bytes_per_window_.load(std::memory_order_relaxed);
}

}  // namespace archive_fetch
