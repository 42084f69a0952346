// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file duplicate_scanner.cpp
 * @brief Implementation of duplicate archive detection
 */

#include <archive_fetch/core/duplicate_scanner.h>

#include <archive_fetch/core/checksum.h>
#include <archive_fetch/core/file_utils.h>
#include <archive_fetch/core/logging.h>

#include <algorithm>
#include <fstream>
#include <map>

namespace archive_fetch {

namespace {

auto read_span(std::ifstream& in, uint64_t offset, std::size_t length, std::vector<char>& buffer)
    -> bool {
    buffer.resize(length);
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(buffer.data(), static_cast<std::streamsize>(length));
    return static_cast<std::size_t>(in.gcount()) == length;
}

auto as_bytes(const std::vector<char>& buffer) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(buffer.data()), buffer.size()};
}

}  // namespace

duplicate_scanner::duplicate_scanner(std::string extension) : extension_(std::move(extension)) {}

// ============================================================================
// Fingerprinting
// ============================================================================

auto duplicate_scanner::fingerprint(const std::filesystem::path& path, uint64_t size)
    -> result<std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected(storage_error_from_errno("open " + path.string()));
    }

    sha256_hasher hasher;
    std::vector<char> buffer;

    auto head = static_cast<std::size_t>(std::min<uint64_t>(size, FINGERPRINT_SPAN));
    if (!read_span(in, 0, head, buffer)) {
        return unexpected(error{error_code::file_read_error, "short read on " + path.string()});
    }
    if (auto updated = hasher.update(as_bytes(buffer)); !updated.has_value()) {
        return unexpected(updated.error());
    }

    // Tail never overlaps the head
    if (size > FINGERPRINT_SPAN) {
        auto tail_length = static_cast<std::size_t>(std::min<uint64_t>(size - head, FINGERPRINT_SPAN));
        if (!read_span(in, size - tail_length, tail_length, buffer)) {
            return unexpected(error{error_code::file_read_error, "short read on " + path.string()});
        }
        if (auto updated = hasher.update(as_bytes(buffer)); !updated.has_value()) {
            return unexpected(updated.error());
        }
    }

    return hasher.finish();
}

// ============================================================================
// Scan
// ============================================================================

auto duplicate_scanner::scan(const std::filesystem::path& directory) const
    -> result<std::vector<duplicate_group>> {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return unexpected(error{error_code::file_read_error,
                                "not a directory: " + directory.string()});
    }

    std::map<uint64_t, std::vector<std::filesystem::path>> by_size;
    std::size_t candidates = 0;

    std::filesystem::directory_iterator it(directory, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry.path().extension() != extension_) {
            continue;
        }
        auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            AF_LOG_WARN(log_category::dedupe,
                        "Skipping " + entry.path().filename().string() + ": " +
                            entry_ec.message());
            continue;
        }
        by_size[size].push_back(entry.path());
        ++candidates;
    }
    if (ec) {
        return unexpected(storage_error("list " + directory.string(), ec));
    }

    std::vector<duplicate_group> groups;
    for (auto& [size, paths] : by_size) {
        if (paths.size() < 2) {
            continue;
        }

        std::map<std::string, std::vector<std::filesystem::path>> by_fingerprint;
        for (const auto& path : paths) {
            auto digest = fingerprint(path, size);
            if (!digest.has_value()) {
                AF_LOG_WARN(log_category::dedupe,
                            "Cannot fingerprint " + path.filename().string() + ": " +
                                digest.error().message);
                continue;
            }
            by_fingerprint[digest.value()].push_back(path);
        }

        for (auto& [digest, same] : by_fingerprint) {
            if (same.size() < 2) {
                continue;
            }
            std::sort(same.begin(), same.end(),
                      [](const auto& a, const auto& b) { return a.filename() < b.filename(); });

            duplicate_group group;
            group.size = size;
            group.fingerprint = digest;
            group.keep = same.front();
            group.duplicates.assign(same.begin() + 1, same.end());
            groups.push_back(std::move(group));
        }
    }

    std::sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) {
        return a.keep.filename() < b.keep.filename();
    });

    AF_LOG_INFO(log_category::dedupe,
                "Scanned " + std::to_string(candidates) + " archives, " +
                    std::to_string(groups.size()) + " duplicate groups");
    return groups;
}

// ============================================================================
// Removal
// ============================================================================

auto duplicate_scanner::remove(const std::vector<duplicate_group>& groups, bool dry_run) const
    -> result<removal_summary> {
    removal_summary summary;
    summary.dry_run = dry_run;

    for (const auto& group : groups) {
        for (const auto& path : group.duplicates) {
            if (dry_run) {
                AF_LOG_INFO(log_category::dedupe,
                            "Would remove " + path.filename().string() + " (same as " +
                                group.keep.filename().string() + ")");
            } else {
                std::error_code ec;
                if (!std::filesystem::remove(path, ec) && ec) {
                    return unexpected(storage_error("remove " + path.string(), ec));
                }
                AF_LOG_INFO(log_category::dedupe,
                            "Removed " + path.filename().string() + " (same as " +
                                group.keep.filename().string() + ")");
            }
            ++summary.files_removed;
            summary.bytes_freed += group.size;
        }
    }

    return summary;
}

}  // namespace archive_fetch
