// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file duplicate_scanner.h
 * @brief Detection and removal of duplicate archives in an output directory
 */

#ifndef ARCHIVE_FETCH_CORE_DUPLICATE_SCANNER_H
#define ARCHIVE_FETCH_CORE_DUPLICATE_SCANNER_H

#include <archive_fetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace archive_fetch {

/**
 * @brief Files sharing one size and fingerprint
 */
struct duplicate_group {
    uint64_t size = 0;
    std::string fingerprint;
    /// Lowest-named file in the group
    std::filesystem::path keep;
    /// Remaining files, sorted by name
    std::vector<std::filesystem::path> duplicates;

    [[nodiscard]] auto reclaimable_bytes() const noexcept -> uint64_t {
        return size * duplicates.size();
    }
};

struct removal_summary {
    std::size_t files_removed = 0;
    uint64_t bytes_freed = 0;
    bool dry_run = false;
};

/**
 * @brief Finds archives downloaded more than once under different names
 *
 * Files are grouped by size first; only same-sized files are fingerprinted.
 * The fingerprint is SHA-256 over the first and last 64 KiB, which is
 * enough to tell apart archives of a single export without reading
 * multi-gigabyte files end to end.
 *
 * @code
 * duplicate_scanner scanner;
 * auto groups = scanner.scan("./downloads");
 * if (groups) {
 *     auto removed = scanner.remove(groups.value(), true);  // report only
 * }
 * @endcode
 */
class duplicate_scanner {
public:
    static constexpr std::size_t FINGERPRINT_SPAN = 64 * 1024;

    explicit duplicate_scanner(std::string extension = ".zip");

    /**
     * @brief Group duplicate files directly inside @p directory
     * @return groups with at least one duplicate, sorted by kept file name
     */
    [[nodiscard]] auto scan(const std::filesystem::path& directory) const
        -> result<std::vector<duplicate_group>>;

    /**
     * @brief Delete every duplicate, or only tally them when @p dry_run
     */
    [[nodiscard]] auto remove(const std::vector<duplicate_group>& groups, bool dry_run) const
        -> result<removal_summary>;

    /**
     * @brief Fingerprint of one file
     */
    [[nodiscard]] static auto fingerprint(const std::filesystem::path& path, uint64_t size)
        -> result<std::string>;

private:
    std::string extension_;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_DUPLICATE_SCANNER_H
