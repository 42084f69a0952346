// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file fetch_config.h
 * @brief Job configuration for a bulk archive fetch
 * @version 0.1.0
 */

#ifndef ARCHIVE_FETCH_CONFIG_FETCH_CONFIG_H
#define ARCHIVE_FETCH_CONFIG_FETCH_CONFIG_H

#include <archive_fetch/core/types.h>
#include <archive_fetch/transfer/resumable_transfer.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace archive_fetch {

/**
 * @brief Everything a fetch job needs to run
 *
 * Defaults suit a large Takeout-style export: six parallel workers,
 * unlimited bandwidth, resume and verification on.
 */
struct fetch_config {
    /// URL of the first archive; its numeric suffix defines the sequence
    std::string first_url;

    /// Session credential sent with every request
    std::string credential;

    std::filesystem::path output_directory = "./downloads";

    /// Number of archives, 0 = probe until the remote reports not found
    uint64_t file_count = 0;

    std::size_t concurrency = 6;

    /// Aggregate bytes per second, 0 = unlimited
    uint64_t rate_limit = 0;

    bool resume_enabled = true;
    bool verify_enabled = true;

    /// Local network retries, also the per-archive corrupt restart limit
    retry_policy retry;

    std::size_t chunk_size = 1024 * 1024;
    std::chrono::milliseconds request_timeout{300000};

    std::chrono::minutes credential_ttl{60};
    std::chrono::minutes credential_warning{45};

    std::chrono::milliseconds eta_window{10000};
    std::chrono::milliseconds progress_interval{1000};

    /// Byte progress is re-recorded at least this often per archive
    uint64_t checkpoint_interval = 10 * 1024 * 1024;

    std::string credential_header = "Cookie";
    std::string user_agent{DEFAULT_USER_AGENT};

    /// Completed archives smaller than this are treated as error pages
    uint64_t min_archive_bytes = 0;

    /**
     * @brief Check for values the job cannot run with
     * @return config_invalid (or invalid_url_template) describing the first problem
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Options handed to each resumable transfer
     */
    [[nodiscard]] auto to_transfer_options() const -> transfer_options;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CONFIG_FETCH_CONFIG_H
