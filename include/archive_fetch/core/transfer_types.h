// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file transfer_types.h
 * @brief File task and session credential types
 */

#ifndef ARCHIVE_FETCH_CORE_TRANSFER_TYPES_H
#define ARCHIVE_FETCH_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace archive_fetch {

/**
 * @brief Lifecycle of one numbered archive
 *
 * pending -> in_progress -> verifying -> done
 *                        \-> failed
 *                        \-> auth_blocked -> pending (after a new credential)
 */
enum class task_status {
    pending,
    in_progress,
    verifying,
    done,
    failed,
    auth_blocked
};

[[nodiscard]] constexpr auto to_string(task_status status) noexcept -> std::string_view {
    switch (status) {
        case task_status::pending: return "pending";
        case task_status::in_progress: return "in_progress";
        case task_status::verifying: return "verifying";
        case task_status::done: return "done";
        case task_status::failed: return "failed";
        case task_status::auth_blocked: return "auth_blocked";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto task_status_from_string(std::string_view text)
    -> std::optional<task_status> {
    if (text == "pending") return task_status::pending;
    if (text == "in_progress") return task_status::in_progress;
    if (text == "verifying") return task_status::verifying;
    if (text == "done") return task_status::done;
    if (text == "failed") return task_status::failed;
    if (text == "auth_blocked") return task_status::auth_blocked;
    return std::nullopt;
}

[[nodiscard]] constexpr auto is_terminal(task_status status) noexcept -> bool {
    return status == task_status::done || status == task_status::failed;
}

/**
 * @brief One numbered remote archive and its local transfer state
 *
 * bytes_confirmed never exceeds expected_size once the size is known.
 */
struct file_task {
    uint64_t index = 0;
    std::string url;
    std::filesystem::path final_path;
    std::filesystem::path partial_path;
    std::optional<uint64_t> expected_size;
    uint64_t bytes_confirmed = 0;
    task_status status = task_status::pending;
    uint32_t retry_count = 0;
    std::string last_error;

    [[nodiscard]] auto filename() const -> std::string {
        return final_path.filename().string();
    }

    [[nodiscard]] auto remaining_bytes() const -> std::optional<uint64_t> {
        if (!expected_size) {
            return std::nullopt;
        }
        return *expected_size > bytes_confirmed ? *expected_size - bytes_confirmed : 0;
    }
};

/**
 * @brief Opaque session token with an estimated lifetime
 *
 * The generation increases each time a credential is replaced so that
 * failures reported against an older credential can be told apart.
 */
struct session_credential {
    using clock = std::chrono::steady_clock;

    std::string token;
    clock::time_point accepted_at = clock::now();
    std::chrono::minutes ttl{60};
    std::chrono::minutes warning_threshold{45};
    uint64_t generation = 0;

    [[nodiscard]] auto elapsed(clock::time_point now = clock::now()) const
        -> std::chrono::seconds {
        return std::chrono::duration_cast<std::chrono::seconds>(now - accepted_at);
    }

    [[nodiscard]] auto remaining(clock::time_point now = clock::now()) const
        -> std::chrono::seconds {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(ttl) - elapsed(now);
        return left.count() > 0 ? left : std::chrono::seconds(0);
    }

    [[nodiscard]] auto warning_due(clock::time_point now = clock::now()) const -> bool {
        return elapsed(now) >= warning_threshold;
    }
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_TRANSFER_TYPES_H
