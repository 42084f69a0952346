// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file message_channel.h
 * @brief Multi-producer, single-consumer FIFO used to talk to the coordinator
 */

#ifndef ARCHIVE_FETCH_CORE_MESSAGE_CHANNEL_H
#define ARCHIVE_FETCH_CORE_MESSAGE_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace archive_fetch {

/**
 * @brief Blocking FIFO channel
 *
 * Producers push from any thread. Once closed, push() is rejected but the
 * consumer can still drain what was queued before the close.
 */
template <typename T>
class message_channel {
public:
    message_channel() = default;

    message_channel(const message_channel&) = delete;
    auto operator=(const message_channel&) -> message_channel& = delete;

    /**
     * @brief Enqueue a message
     * @return false if the channel is closed
     */
    auto push(T message) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Wait up to @p timeout for a message
     * @return message, or nullopt on timeout or when closed and empty
     */
    template <typename Rep, typename Period>
    [[nodiscard]] auto wait_pop(std::chrono::duration<Rep, Period> timeout) -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    [[nodiscard]] auto try_pop() -> std::optional<T> {
        std::lock_guard lock(mutex_);
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    auto pop_locked() -> std::optional<T> {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> message(std::move(queue_.front()));
        queue_.pop();
        return message;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool closed_ = false;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_MESSAGE_CHANNEL_H
