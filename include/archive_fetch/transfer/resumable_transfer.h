// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file resumable_transfer.h
 * @brief Fetch one numbered archive with byte-range continuation
 * @version 0.1.0
 */

#ifndef ARCHIVE_FETCH_TRANSFER_RESUMABLE_TRANSFER_H
#define ARCHIVE_FETCH_TRANSFER_RESUMABLE_TRANSFER_H

#include <archive_fetch/core/integrity_verifier.h>
#include <archive_fetch/core/rate_limiter.h>
#include <archive_fetch/core/stop_signal.h>
#include <archive_fetch/core/transfer_types.h>
#include <archive_fetch/core/types.h>
#include <archive_fetch/transport/http_transport.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace archive_fetch {

/**
 * @brief Backoff for transient network failures
 */
struct retry_policy {
    /// Consecutive failed attempts tolerated before the task fails
    std::size_t max_retries = 5;
    std::chrono::milliseconds initial_delay{2000};
    std::chrono::milliseconds max_delay{60000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay before retry number @p attempt (1-based)
     */
    [[nodiscard]] auto delay_for(std::size_t attempt) const -> std::chrono::milliseconds;
};

/**
 * @brief Per-transfer behavior
 */
struct transfer_options {
    /// Largest window requested per range request
    std::size_t chunk_size = 1024 * 1024;
    bool resume_enabled = true;
    bool verify_enabled = true;
    retry_policy retry;
    std::chrono::milliseconds request_timeout{300000};
    std::string credential_header = "Cookie";
    std::string user_agent{DEFAULT_USER_AGENT};
    /// Completed files smaller than this are treated as error pages (0 = off)
    uint64_t min_archive_bytes = 0;
    verifier_options verification;
};

/**
 * @brief How a transfer attempt ended
 */
enum class transfer_outcome {
    completed,        ///< verified and renamed to its final name
    corrupt,          ///< structural check failed, local bytes discarded
    auth_failure,     ///< the remote served something other than the archive
    not_found,        ///< the archive does not exist (404/410)
    failed,           ///< retries exhausted or the remote rejected the request
    storage_failure,  ///< local disk error, fatal to the job
    interrupted       ///< stopped at a chunk boundary on request
};

[[nodiscard]] constexpr auto to_string(transfer_outcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case transfer_outcome::completed: return "completed";
        case transfer_outcome::corrupt: return "corrupt";
        case transfer_outcome::auth_failure: return "auth_failure";
        case transfer_outcome::not_found: return "not_found";
        case transfer_outcome::failed: return "failed";
        case transfer_outcome::storage_failure: return "storage_failure";
        case transfer_outcome::interrupted: return "interrupted";
        default: return "unknown";
    }
}

/**
 * @brief Final report of one run()
 */
struct transfer_result {
    uint64_t index = 0;
    transfer_outcome outcome = transfer_outcome::failed;
    uint64_t bytes_confirmed = 0;
    std::optional<uint64_t> expected_size;
    /// Transient failures retried during this run
    std::size_t network_retries = 0;
    /// Credential generation the attempt ran under
    uint64_t credential_generation = 0;
    error err;
};

/**
 * @brief Progress increment reported after every flushed chunk
 */
struct transfer_delta {
    uint64_t index = 0;
    /// Bytes written by this chunk
    uint64_t bytes = 0;
    uint64_t bytes_confirmed = 0;
    std::optional<uint64_t> expected_size;
    /// True when bytes_confirmed went back to zero (range ignored or reset)
    bool restarted = false;
    /// True once all bytes are in and the file is being verified
    bool verifying = false;
};

using progress_callback = std::function<void(const transfer_delta&)>;

/**
 * @brief Single-archive fetcher
 *
 * Appends to <name>.partial using bounded range requests, throttled by the
 * shared rate limiter, flushing after every chunk. On completion the file
 * is verified and renamed to its final name.
 *
 * @code
 * resumable_transfer transfer(transport, limiter, options);
 * auto result = transfer.run(task, credential, stop, [](const transfer_delta& d) {
 *     // forward to the coordinator
 * });
 * @endcode
 *
 * One instance may serve many workers: run() keeps its state on the stack.
 */
class resumable_transfer {
public:
    resumable_transfer(http_transport& transport, rate_limiter& limiter,
                       transfer_options options = {});

    /**
     * @brief Run one attempt to completion or interruption
     *
     * Transient network errors are retried in place with exponential
     * backoff; every other failure is returned to the caller.
     */
    [[nodiscard]] auto run(const file_task& task, const session_credential& credential,
                           stop_signal& stop, const progress_callback& on_progress = {})
        -> transfer_result;

    /**
     * @brief Classify a response status
     * @return error code describing the status, success for 200/206
     */
    [[nodiscard]] static auto classify_status(int status_code) -> error_code;

    [[nodiscard]] auto options() const noexcept -> const transfer_options& { return options_; }

private:
    class attempt;

    http_transport& transport_;
    rate_limiter& limiter_;
    transfer_options options_;
    integrity_verifier verifier_;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_TRANSFER_RESUMABLE_TRANSFER_H
