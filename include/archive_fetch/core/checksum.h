// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file checksum.h
 * @brief CRC-32 and SHA-256 utilities
 */

#ifndef ARCHIVE_FETCH_CORE_CHECKSUM_H
#define ARCHIVE_FETCH_CORE_CHECKSUM_H

#include <archive_fetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace archive_fetch {

/**
 * @brief Checksum utilities
 *
 * - CRC-32 (IEEE 802.3, as used by ZIP entries)
 * - SHA-256 via OpenSSL EVP for file fingerprints
 */
class checksum {
public:
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Continue a CRC-32 over more data
     *
     * Start with @c crc = 0; the return value of one call feeds the next.
     */
    [[nodiscard]] static auto crc32_update(uint32_t crc, std::span<const std::byte> data)
        -> uint32_t;

    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> result<std::string>;

    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;
};

/**
 * @brief Incremental SHA-256
 *
 * @code
 * sha256_hasher hasher;
 * hasher.update(head);
 * hasher.update(tail);
 * auto digest = hasher.finish();  // lowercase hex
 * @endcode
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;
    sha256_hasher(sha256_hasher&&) noexcept;
    auto operator=(sha256_hasher&&) noexcept -> sha256_hasher&;

    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finalize and return the hex digest
     *
     * The hasher cannot be updated afterwards.
     */
    [[nodiscard]] auto finish() -> result<std::string>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_CHECKSUM_H
