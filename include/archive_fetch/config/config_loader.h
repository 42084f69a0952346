// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file config_loader.h
 * @brief Populate fetch_config from the environment and a .env file
 */

#ifndef ARCHIVE_FETCH_CONFIG_CONFIG_LOADER_H
#define ARCHIVE_FETCH_CONFIG_CONFIG_LOADER_H

#include <archive_fetch/config/fetch_config.h>
#include <archive_fetch/core/types.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace archive_fetch {

/**
 * @brief Environment variable names read by config_loader
 */
struct env_keys {
    static constexpr const char* cookie = "ARCHIVE_FETCH_COOKIE";
    static constexpr const char* url = "ARCHIVE_FETCH_URL";
    static constexpr const char* output_dir = "ARCHIVE_FETCH_OUTPUT_DIR";
    static constexpr const char* file_count = "ARCHIVE_FETCH_FILE_COUNT";
    static constexpr const char* parallel = "ARCHIVE_FETCH_PARALLEL";
    /// Bytes per second
    static constexpr const char* rate_limit = "ARCHIVE_FETCH_RATE_LIMIT";
};

/**
 * @brief Reads job settings from the process environment
 *
 * @code
 * config_loader::load_env_file(".env");
 * auto config = config_loader::from_environment();
 * @endcode
 */
class config_loader {
public:
    /**
     * @brief Export KEY=VALUE lines from @p path into the environment
     *
     * Blank lines and lines starting with '#' are skipped, matching quotes
     * around a value are removed, and variables already set are left
     * untouched. A missing file is not an error.
     *
     * @return number of variables set
     */
    [[nodiscard]] static auto load_env_file(const std::filesystem::path& path)
        -> result<std::size_t>;

    /**
     * @brief Split one .env line into key and value
     * @return nullopt for blank, comment or malformed lines
     */
    [[nodiscard]] static auto parse_env_line(std::string_view line)
        -> std::optional<std::pair<std::string, std::string>>;

    /**
     * @brief Overlay environment variables on @p base
     * @return config_invalid when a numeric variable does not parse
     */
    [[nodiscard]] static auto from_environment(fetch_config base = {}) -> result<fetch_config>;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CONFIG_CONFIG_LOADER_H
