// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file file_utils.h
 * @brief Local file helpers shared by the state store and transfers
 */

#ifndef ARCHIVE_FETCH_CORE_FILE_UTILS_H
#define ARCHIVE_FETCH_CORE_FILE_UTILS_H

#include <archive_fetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace archive_fetch {

/**
 * @brief Map an OS error to a storage error code
 *
 * ENOSPC becomes disk_full, EACCES/EPERM/EROFS become permission_denied.
 */
[[nodiscard]] auto storage_error(std::string context, const std::error_code& ec) -> error;

/**
 * @brief storage_error() for the calling thread's errno
 */
[[nodiscard]] auto storage_error_from_errno(std::string context) -> error;

/**
 * @brief Replace @p path with @p content via a temporary file and rename
 *
 * Readers see either the old or the new content, never a torn write.
 */
[[nodiscard]] auto write_file_atomically(const std::filesystem::path& path,
                                         std::string_view content) -> result<void>;

[[nodiscard]] auto read_text_file(const std::filesystem::path& path) -> result<std::string>;

/**
 * @brief Size of a regular file, or nullopt when absent
 */
[[nodiscard]] auto regular_file_size(const std::filesystem::path& path)
    -> std::optional<uint64_t>;

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_FILE_UTILS_H
