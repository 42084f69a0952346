// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file error_codes.h
 * @brief Error codes for archive_fetch (-700 to -799 range)
 * @version 0.1.0
 *
 * Error code ranges:
 * - -700 to -709: Transient network errors (retried locally)
 * - -710 to -719: Remote errors (not retried)
 * - -720 to -729: Authentication errors (pause the job)
 * - -730 to -739: Integrity errors (restart the task from offset 0)
 * - -740 to -749: Storage errors (fatal to the job)
 * - -750 to -759: Job state errors
 * - -790 to -799: Configuration errors
 */

#ifndef ARCHIVE_FETCH_CORE_ERROR_CODES_H
#define ARCHIVE_FETCH_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace archive_fetch {

/**
 * @brief Error codes for fetch operations
 */
enum class error_code : int32_t {
    success = 0,

    // Transient network errors (-700 to -709)
    connection_failed = -700,
    connection_timeout = -701,
    connection_reset = -702,
    dns_failure = -703,
    remote_server_error = -704,

    // Remote errors (-710 to -719)
    remote_not_found = -710,
    remote_rejected = -711,
    range_not_satisfiable = -712,
    invalid_response = -713,

    // Authentication errors (-720 to -729)
    auth_failure = -720,
    credential_missing = -721,

    // Integrity errors (-730 to -739)
    corrupt_file = -730,
    checksum_mismatch = -731,

    // Storage errors (-740 to -749)
    storage_error = -740,
    disk_full = -741,
    permission_denied = -742,
    file_write_error = -743,
    file_read_error = -744,

    // Job state errors (-750 to -759)
    state_corrupted = -750,
    state_not_found = -751,
    job_already_running = -752,
    job_not_running = -753,
    invalid_state_transition = -754,
    internal_error = -755,

    // Configuration errors (-790 to -799)
    config_invalid = -790,
    invalid_url_template = -791,
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";

        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_reset:
            return "connection reset by peer";
        case error_code::dns_failure:
            return "host name resolution failed";
        case error_code::remote_server_error:
            return "remote server error";

        case error_code::remote_not_found:
            return "remote file not found";
        case error_code::remote_rejected:
            return "request rejected by remote";
        case error_code::range_not_satisfiable:
            return "requested range not satisfiable";
        case error_code::invalid_response:
            return "malformed response";

        case error_code::auth_failure:
            return "authentication failed or session expired";
        case error_code::credential_missing:
            return "no session credential available";

        case error_code::corrupt_file:
            return "archive structure is corrupt";
        case error_code::checksum_mismatch:
            return "archive entry CRC-32 mismatch";

        case error_code::storage_error:
            return "storage error";
        case error_code::disk_full:
            return "local disk full";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_read_error:
            return "file read error";

        case error_code::state_corrupted:
            return "job state record corrupted";
        case error_code::state_not_found:
            return "job state record not found";
        case error_code::job_already_running:
            return "job already running";
        case error_code::job_not_running:
            return "job not running";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::internal_error:
            return "internal error";

        case error_code::config_invalid:
            return "invalid configuration";
        case error_code::invalid_url_template:
            return "url has no numeric sequence suffix";

        default:
            return "unknown error";
    }
}

[[nodiscard]] constexpr auto is_transient(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -700 && value >= -709;
}

[[nodiscard]] constexpr auto is_remote_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -710 && value >= -719;
}

[[nodiscard]] constexpr auto is_auth_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -720 && value >= -729;
}

[[nodiscard]] constexpr auto is_integrity_error(error_code code) noexcept
    -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -730 && value >= -739;
}

/**
 * @brief Storage errors stop the whole job
 */
[[nodiscard]] constexpr auto is_job_fatal(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -740 && value >= -749;
}

[[nodiscard]] constexpr auto is_config_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -790 && value >= -799;
}

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_ERROR_CODES_H
