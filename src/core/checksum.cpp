// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <archive_fetch/core/checksum.h>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace archive_fetch {

namespace {

// CRC32 polynomial (IEEE 802.3)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32_POLYNOMIAL : crc >> 1;
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

constexpr std::size_t FILE_READ_BUFFER = 64 * 1024;

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

}  // namespace

// ============================================================================
// checksum
// ============================================================================

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    return crc32_update(0, data);
}

auto checksum::crc32_update(uint32_t crc, std::span<const std::byte> data) -> uint32_t {
    crc ^= 0xFFFFFFFF;
    for (std::byte b : data) {
        uint8_t index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC32_TABLE[index] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

auto checksum::sha256(std::span<const std::byte> data) -> result<std::string> {
    sha256_hasher hasher;
    auto updated = hasher.update(data);
    if (!updated) {
        return unexpected(updated.error());
    }
    return hasher.finish();
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + path.string()});
    }

    sha256_hasher hasher;
    std::vector<char> buffer(FILE_READ_BUFFER);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read == 0) {
            break;
        }
        auto updated = hasher.update(
            std::as_bytes(std::span<const char>(buffer.data(), bytes_read)));
        if (!updated) {
            return unexpected(updated.error());
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return hasher.finish();
}

// ============================================================================
// sha256_hasher
// ============================================================================

class sha256_hasher::impl {
public:
    impl() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    ~impl() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    auto update(std::span<const std::byte> data) -> result<void> {
        if (!ctx_ || finished_) {
            return unexpected(error{error_code::checksum_mismatch,
                                    "SHA-256 context unavailable"});
        }
        if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
            return unexpected(error{error_code::checksum_mismatch, get_openssl_error()});
        }
        return {};
    }

    auto finish() -> result<std::string> {
        if (!ctx_ || finished_) {
            return unexpected(error{error_code::checksum_mismatch,
                                    "SHA-256 context unavailable"});
        }
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        finished_ = true;
        if (EVP_DigestFinal_ex(ctx_, digest.data(), &length) != 1) {
            return unexpected(error{error_code::checksum_mismatch, get_openssl_error()});
        }
        return digest_to_hex(digest.data(), length);
    }

private:
    EVP_MD_CTX* ctx_;
    bool finished_ = false;
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {}

sha256_hasher::~sha256_hasher() = default;

sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;

auto sha256_hasher::operator=(sha256_hasher&&) noexcept -> sha256_hasher& = default;

auto sha256_hasher::update(std::span<const std::byte> data) -> result<void> {
    return impl_->update(data);
}

auto sha256_hasher::finish() -> result<std::string> {
    return impl_->finish();
}

}  // namespace archive_fetch
