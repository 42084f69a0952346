// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file progress_tracker.cpp
 * @brief Implementation of progress_tracker
 */

#include "archive_fetch/core/progress_tracker.h"

#include <cmath>

namespace archive_fetch {

progress_tracker::progress_tracker() : progress_tracker(config{}) {}

progress_tracker::progress_tracker(config cfg) : cfg_(cfg) {
    if (cfg_.smoothing_window.count() <= 0) {
        cfg_.smoothing_window = std::chrono::milliseconds(10000);
    }
}

void progress_tracker::start(uint64_t historical_bytes, clock::time_point now) {
    started_ = now;
    started_wall_ = std::chrono::system_clock::now();
    last_sample_ = now;
    session_bytes_ = 0;
    historical_bytes_ = historical_bytes;
    aggregate_ = rate_state{};
    aggregate_rate_ = 0.0;
    files_.clear();
}

void progress_tracker::record_delta(uint64_t index, uint64_t bytes) {
    session_bytes_ += bytes;
    aggregate_.pending_bytes += bytes;
    files_[index].pending_bytes += bytes;
}

void progress_tracker::sample(clock::time_point now) {
    auto dt = now - last_sample_;
    if (dt < cfg_.sample_interval || dt.count() <= 0) {
        return;
    }
    last_sample_ = now;

    double seconds = std::chrono::duration<double>(dt).count();
    double alpha = smoothing_factor(seconds);

    auto fold = [seconds, alpha](rate_state& state) {
        double instant = static_cast<double>(state.pending_bytes) / seconds;
        state.pending_bytes = 0;
        if (!state.primed) {
            state.rate = instant;
            state.primed = true;
        } else {
            state.rate += alpha * (instant - state.rate);
        }
    };

    fold(aggregate_);
    aggregate_rate_ = aggregate_.rate;
    for (auto& [index, state] : files_) {
        fold(state);
    }
}

void progress_tracker::forget_file(uint64_t index) {
    files_.erase(index);
}

auto progress_tracker::file_rate(uint64_t index) const -> double {
    auto it = files_.find(index);
    return it == files_.end() ? 0.0 : it->second.rate;
}

auto progress_tracker::elapsed(clock::time_point now) const -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - started_);
}

auto progress_tracker::estimate_eta(std::optional<uint64_t> remaining_bytes) const
    -> std::optional<std::chrono::seconds> {
    if (!remaining_bytes) {
        return std::nullopt;
    }
    if (*remaining_bytes == 0) {
        return std::chrono::seconds(0);
    }
    if (aggregate_rate_ <= 0.0) {
        return std::nullopt;
    }
    return std::chrono::seconds(static_cast<int64_t>(
        std::ceil(static_cast<double>(*remaining_bytes) / aggregate_rate_)));
}

auto progress_tracker::estimate_remaining_bytes(const std::vector<file_task>& tasks)
    -> std::optional<uint64_t> {
    uint64_t known_total = 0;
    uint64_t known_count = 0;
    for (const auto& task : tasks) {
        if (task.expected_size) {
            known_total += *task.expected_size;
            ++known_count;
        }
    }

    uint64_t remaining = 0;
    bool any_unknown = false;
    for (const auto& task : tasks) {
        if (task.status != task_status::pending && task.status != task_status::in_progress &&
            task.status != task_status::auth_blocked) {
            continue;
        }
        if (task.expected_size) {
            remaining += task.remaining_bytes().value_or(0);
            continue;
        }
        if (known_count == 0) {
            any_unknown = true;
            continue;
        }
        uint64_t average = known_total / known_count;
        remaining += average > task.bytes_confirmed ? average - task.bytes_confirmed : 0;
    }

    if (any_unknown) {
        return std::nullopt;
    }
    return remaining;
}

auto progress_tracker::smoothing_factor(double dt_seconds) const -> double {
    double window = std::chrono::duration<double>(cfg_.smoothing_window).count();
    return 1.0 - std::exp(-dt_seconds / window);
}

}  // namespace archive_fetch
