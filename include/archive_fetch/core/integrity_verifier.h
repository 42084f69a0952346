// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file integrity_verifier.h
 * @brief Structural verification of downloaded ZIP archives
 *
 * Classifies a local file as a valid archive, a corrupt archive, or an
 * authentication failure payload (a login page or error document served in
 * place of the archive).
 */

#ifndef ARCHIVE_FETCH_CORE_INTEGRITY_VERIFIER_H
#define ARCHIVE_FETCH_CORE_INTEGRITY_VERIFIER_H

#include <archive_fetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace archive_fetch {

/**
 * @brief Three-way integrity classification
 */
enum class integrity_verdict {
    valid,
    corrupt,
    auth_failure
};

[[nodiscard]] constexpr auto to_string(integrity_verdict verdict) noexcept
    -> std::string_view {
    switch (verdict) {
        case integrity_verdict::valid: return "valid";
        case integrity_verdict::corrupt: return "corrupt";
        case integrity_verdict::auth_failure: return "auth_failure";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of verifying one file
 */
struct verification_report {
    integrity_verdict verdict = integrity_verdict::corrupt;
    std::string reason;
    uint64_t file_size = 0;
    uint64_t entry_count = 0;
    uint64_t entries_crc_checked = 0;

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return verdict == integrity_verdict::valid;
    }
};

struct verifier_options {
    /// Recompute CRC-32 of stored and deflated entries
    bool check_entry_crc = true;
};

/**
 * @brief ZIP container verifier
 *
 * A file is valid when it starts with a ZIP signature, its end of central
 * directory record (ZIP64 aware) is consistent with the file length, every
 * central directory entry points at a local header inside the file, and
 * (optionally) every entry's data matches its recorded CRC-32.
 *
 * @code
 * integrity_verifier verifier;
 * auto report = verifier.verify_file("takeout-001.zip");
 * if (report && report.value().verdict == integrity_verdict::auth_failure) {
 *     // session expired: the remote served a login page
 * }
 * @endcode
 */
class integrity_verifier {
public:
    explicit integrity_verifier(verifier_options options = {});

    /**
     * @brief Verify a completed file
     * @return report, or file_read_error if the file cannot be read
     */
    [[nodiscard]] auto verify_file(const std::filesystem::path& path) const
        -> result<verification_report>;

    /**
     * @brief Check that a partial file still starts like an archive
     *
     * An empty file is valid (nothing to distrust yet).
     */
    [[nodiscard]] auto verify_prefix(const std::filesystem::path& path) const
        -> result<integrity_verdict>;

    /**
     * @brief Classify the first bytes of a body fetched from offset 0
     *
     * Returns valid when @p head is, or could still become, a ZIP signature.
     * Anything else (HTML, JSON, arbitrary bytes) is auth_failure.
     */
    [[nodiscard]] static auto classify_prefix(std::span<const std::byte> head)
        -> integrity_verdict;

    /**
     * @brief Human-readable description of a non-archive payload
     */
    [[nodiscard]] static auto describe_payload(std::span<const std::byte> head)
        -> std::string;

    /**
     * @brief True for content types that can never carry the archive
     */
    [[nodiscard]] static auto is_markup_content_type(std::string_view content_type)
        -> bool;

    [[nodiscard]] auto options() const noexcept -> const verifier_options& {
        return options_;
    }

private:
    verifier_options options_;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_INTEGRITY_VERIFIER_H
