// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file integrity_verifier.cpp
 * @brief ZIP structural verification
 */

#include "archive_fetch/core/integrity_verifier.h"

#include "archive_fetch/core/checksum.h"
#include "archive_fetch/core/logging.h"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <optional>
#include <vector>

namespace archive_fetch {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t EOCD_SIG = 0x06054b50;
constexpr uint32_t ZIP64_EOCD_SIG = 0x06064b50;
constexpr uint32_t ZIP64_LOCATOR_SIG = 0x07064b50;

constexpr std::size_t EOCD_SIZE = 22;
constexpr std::size_t ZIP64_LOCATOR_SIZE = 20;
constexpr std::size_t ZIP64_EOCD_SIZE = 56;
constexpr std::size_t CENTRAL_HEADER_SIZE = 46;
constexpr std::size_t LOCAL_HEADER_SIZE = 30;
constexpr std::size_t MAX_COMMENT_SIZE = 0xFFFF;
constexpr std::size_t IO_BUFFER_SIZE = 64 * 1024;

constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;
constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATED = 8;
constexpr uint16_t FLAG_ENCRYPTED = 0x0001;

constexpr std::array<uint8_t, 4> LOCAL_MAGIC = {0x50, 0x4B, 0x03, 0x04};
constexpr std::array<uint8_t, 4> EMPTY_MAGIC = {0x50, 0x4B, 0x05, 0x06};

auto read_u16(const uint8_t* p) -> uint16_t {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

auto read_u32(const uint8_t* p) -> uint32_t {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

auto read_u64(const uint8_t* p) -> uint64_t {
    return static_cast<uint64_t>(read_u32(p)) |
           (static_cast<uint64_t>(read_u32(p + 4)) << 32);
}

/**
 * @brief True when [offset, offset + length) lies within [0, limit) without wrapping
 */
auto fits_within(uint64_t offset, uint64_t length, uint64_t limit) -> bool {
    return length <= limit && offset <= limit - length;
}

auto corrupt(std::string reason) -> unexpected {
    return unexpected(error{error_code::corrupt_file, std::move(reason)});
}

struct central_entry {
    std::string name;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint32_t crc = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_offset = 0;
};

struct directory_location {
    uint64_t entry_count = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    // First byte after the central directory region
    uint64_t limit = 0;
};

/**
 * @brief Random-access reader over one archive file
 */
class zip_reader {
public:
    zip_reader(const std::filesystem::path& path, uint64_t size)
        : stream_(path, std::ios::binary), size_(size) {}

    [[nodiscard]] auto is_open() const -> bool { return stream_.is_open(); }
    [[nodiscard]] auto size() const -> uint64_t { return size_; }

    auto read_at(uint64_t offset, uint8_t* dst, std::size_t count) -> bool {
        if (!fits_within(offset, count, size_)) {
            return false;
        }
        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(offset));
        stream_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(count));
        return static_cast<std::size_t>(stream_.gcount()) == count;
    }

    auto locate_directory() -> result<directory_location> {
        if (size_ < EOCD_SIZE) {
            return corrupt("file too small for an end of central directory record");
        }
        const uint64_t tail_size =
            std::min<uint64_t>(size_, MAX_COMMENT_SIZE + EOCD_SIZE);
        std::vector<uint8_t> tail(static_cast<std::size_t>(tail_size));
        const uint64_t tail_start = size_ - tail_size;
        if (!read_at(tail_start, tail.data(), tail.size())) {
            return unexpected(error{error_code::file_read_error, "cannot read archive tail"});
        }

        // The record is followed only by its comment, so scan backwards for a
        // signature whose comment length reaches exactly the end of the file.
        std::optional<std::size_t> eocd_pos;
        for (std::size_t i = tail.size() - EOCD_SIZE + 1; i-- > 0;) {
            if (read_u32(&tail[i]) != EOCD_SIG) {
                continue;
            }
            uint16_t comment_len = read_u16(&tail[i + 20]);
            if (i + EOCD_SIZE + comment_len == tail.size()) {
                eocd_pos = i;
                break;
            }
        }
        if (!eocd_pos) {
            return corrupt("end of central directory record not found");
        }

        const uint8_t* eocd = &tail[*eocd_pos];
        const uint64_t eocd_offset = tail_start + *eocd_pos;

        directory_location loc;
        uint16_t disk = read_u16(eocd + 4);
        uint16_t cd_disk = read_u16(eocd + 6);
        uint16_t disk_entries = read_u16(eocd + 8);
        loc.entry_count = read_u16(eocd + 10);
        loc.size = read_u32(eocd + 12);
        loc.offset = read_u32(eocd + 16);
        loc.limit = eocd_offset;

        const bool needs_zip64 = loc.entry_count == 0xFFFF || loc.size == 0xFFFFFFFF ||
                                 loc.offset == 0xFFFFFFFF;

        if (eocd_offset >= ZIP64_LOCATOR_SIZE) {
            std::array<uint8_t, ZIP64_LOCATOR_SIZE> locator{};
            if (read_at(eocd_offset - ZIP64_LOCATOR_SIZE, locator.data(), locator.size()) &&
                read_u32(locator.data()) == ZIP64_LOCATOR_SIG) {
                auto zip64 = read_zip64_record(read_u64(locator.data() + 8),
                                               eocd_offset - ZIP64_LOCATOR_SIZE);
                if (!zip64) {
                    return unexpected(zip64.error());
                }
                return zip64.value();
            }
        }

        if (needs_zip64) {
            return corrupt("ZIP64 locator missing");
        }
        if (disk != 0 || cd_disk != 0 || disk_entries != loc.entry_count) {
            return corrupt("multi-volume archives are not supported");
        }
        if (!fits_within(loc.offset, loc.size, loc.limit)) {
            return corrupt("central directory extends past its end record");
        }
        return loc;
    }

    auto read_directory(const directory_location& loc) -> result<std::vector<central_entry>> {
        std::vector<uint8_t> cd(static_cast<std::size_t>(loc.size));
        if (!cd.empty() && !read_at(loc.offset, cd.data(), cd.size())) {
            return corrupt("cannot read central directory");
        }

        std::vector<central_entry> entries;
        entries.reserve(static_cast<std::size_t>(std::min<uint64_t>(loc.entry_count, 1 << 20)));

        std::size_t pos = 0;
        while (pos < cd.size()) {
            if (pos + CENTRAL_HEADER_SIZE > cd.size() ||
                read_u32(&cd[pos]) != CENTRAL_HEADER_SIG) {
                return corrupt("bad central directory entry at index " +
                               std::to_string(entries.size()));
            }
            const uint8_t* h = &cd[pos];
            central_entry entry;
            entry.flags = read_u16(h + 8);
            entry.method = read_u16(h + 10);
            entry.crc = read_u32(h + 16);
            entry.compressed_size = read_u32(h + 20);
            entry.uncompressed_size = read_u32(h + 24);
            uint16_t name_len = read_u16(h + 28);
            uint16_t extra_len = read_u16(h + 30);
            uint16_t comment_len = read_u16(h + 32);
            entry.local_offset = read_u32(h + 42);

            std::size_t variable = static_cast<std::size_t>(name_len) + extra_len + comment_len;
            if (pos + CENTRAL_HEADER_SIZE + variable > cd.size()) {
                return corrupt("truncated central directory entry");
            }
            entry.name.assign(reinterpret_cast<const char*>(h + CENTRAL_HEADER_SIZE), name_len);
            apply_zip64_extra(entry, h + CENTRAL_HEADER_SIZE + name_len, extra_len);

            entries.push_back(std::move(entry));
            pos += CENTRAL_HEADER_SIZE + variable;
        }

        if (entries.size() != loc.entry_count) {
            return corrupt("central directory holds " + std::to_string(entries.size()) +
                           " entries, end record declares " +
                           std::to_string(loc.entry_count));
        }
        return entries;
    }

    /**
     * @brief Validate the local header and return the entry data offset
     */
    auto locate_data(const central_entry& entry, uint64_t data_limit) -> result<uint64_t> {
        std::array<uint8_t, LOCAL_HEADER_SIZE> local{};
        if (!read_at(entry.local_offset, local.data(), local.size()) ||
            read_u32(local.data()) != LOCAL_HEADER_SIG) {
            return corrupt("bad local header for " + entry.name);
        }
        uint64_t data_offset = entry.local_offset + LOCAL_HEADER_SIZE +
                               read_u16(local.data() + 26) + read_u16(local.data() + 28);
        if (!fits_within(data_offset, entry.compressed_size, data_limit)) {
            return corrupt("entry data overruns central directory: " + entry.name);
        }
        return data_offset;
    }

    auto check_stored(const central_entry& entry, uint64_t data_offset) -> result<void> {
        if (entry.compressed_size != entry.uncompressed_size) {
            return corrupt("stored entry size mismatch: " + entry.name);
        }
        uint32_t crc = 0;
        std::vector<uint8_t> buffer(IO_BUFFER_SIZE);
        uint64_t remaining = entry.compressed_size;
        uint64_t offset = data_offset;
        while (remaining > 0) {
            auto n = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
            if (!read_at(offset, buffer.data(), n)) {
                return corrupt("cannot read entry data: " + entry.name);
            }
            crc = checksum::crc32_update(
                crc, std::as_bytes(std::span<const uint8_t>(buffer.data(), n)));
            remaining -= n;
            offset += n;
        }
        if (crc != entry.crc) {
            return unexpected(error{error_code::checksum_mismatch,
                                    "CRC-32 mismatch in " + entry.name});
        }
        return {};
    }

    auto check_deflated(const central_entry& entry, uint64_t data_offset) -> result<void> {
        z_stream zs{};
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
            return corrupt("inflate initialization failed");
        }

        std::vector<uint8_t> in_buffer(IO_BUFFER_SIZE);
        std::vector<uint8_t> out_buffer(IO_BUFFER_SIZE);
        uint64_t remaining = entry.compressed_size;
        uint64_t offset = data_offset;
        uint64_t produced = 0;
        uint32_t crc = 0;
        int status = Z_OK;

        while (status != Z_STREAM_END) {
            if (zs.avail_in == 0) {
                if (remaining == 0) {
                    break;
                }
                auto n = static_cast<std::size_t>(std::min<uint64_t>(remaining, in_buffer.size()));
                if (!read_at(offset, in_buffer.data(), n)) {
                    inflateEnd(&zs);
                    return corrupt("cannot read entry data: " + entry.name);
                }
                zs.next_in = in_buffer.data();
                zs.avail_in = static_cast<uInt>(n);
                remaining -= n;
                offset += n;
            }

            zs.next_out = out_buffer.data();
            zs.avail_out = static_cast<uInt>(out_buffer.size());
            status = inflate(&zs, Z_NO_FLUSH);
            if (status != Z_OK && status != Z_STREAM_END) {
                inflateEnd(&zs);
                return corrupt("invalid deflate stream in " + entry.name);
            }

            std::size_t have = out_buffer.size() - zs.avail_out;
            crc = checksum::crc32_update(
                crc, std::as_bytes(std::span<const uint8_t>(out_buffer.data(), have)));
            produced += have;
        }
        inflateEnd(&zs);

        if (status != Z_STREAM_END) {
            return corrupt("truncated deflate stream in " + entry.name);
        }
        if (produced != entry.uncompressed_size) {
            return corrupt("uncompressed size mismatch in " + entry.name);
        }
        if (crc != entry.crc) {
            return unexpected(error{error_code::checksum_mismatch,
                                    "CRC-32 mismatch in " + entry.name});
        }
        return {};
    }

private:
    auto read_zip64_record(uint64_t record_offset, uint64_t locator_offset)
        -> result<directory_location> {
        std::array<uint8_t, ZIP64_EOCD_SIZE> record{};
        if (!fits_within(record_offset, ZIP64_EOCD_SIZE, locator_offset) ||
            !read_at(record_offset, record.data(), record.size()) ||
            read_u32(record.data()) != ZIP64_EOCD_SIG) {
            return corrupt("ZIP64 end of central directory record not found");
        }

        directory_location loc;
        loc.entry_count = read_u64(record.data() + 32);
        loc.size = read_u64(record.data() + 40);
        loc.offset = read_u64(record.data() + 48);
        loc.limit = record_offset;

        if (read_u64(record.data() + 24) != loc.entry_count) {
            return corrupt("multi-volume archives are not supported");
        }
        if (!fits_within(loc.offset, loc.size, loc.limit)) {
            return corrupt("central directory extends past its end record");
        }
        return loc;
    }

    static void apply_zip64_extra(central_entry& entry, const uint8_t* extra, uint16_t length) {
        std::size_t pos = 0;
        while (pos + 4 <= length) {
            uint16_t id = read_u16(extra + pos);
            uint16_t size = read_u16(extra + pos + 2);
            if (pos + 4 + size > length) {
                return;
            }
            if (id == ZIP64_EXTRA_ID) {
                const uint8_t* field = extra + pos + 4;
                std::size_t used = 0;
                auto take = [&](uint64_t& target) {
                    if (used + 8 <= size) {
                        target = read_u64(field + used);
                        used += 8;
                    }
                };
                if (entry.uncompressed_size == 0xFFFFFFFF) take(entry.uncompressed_size);
                if (entry.compressed_size == 0xFFFFFFFF) take(entry.compressed_size);
                if (entry.local_offset == 0xFFFFFFFF) take(entry.local_offset);
                return;
            }
            pos += 4 + size;
        }
    }

    std::ifstream stream_;
    uint64_t size_;
};

auto starts_with_magic(std::span<const std::byte> head, const std::array<uint8_t, 4>& magic)
    -> bool {
    auto n = std::min<std::size_t>(head.size(), magic.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (static_cast<uint8_t>(head[i]) != magic[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ============================================================================
// integrity_verifier
// ============================================================================

integrity_verifier::integrity_verifier(verifier_options options)
    : options_(options) {}

auto integrity_verifier::verify_file(const std::filesystem::path& path) const
    -> result<verification_report> {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot stat " + path.string() + ": " + ec.message()});
    }

    zip_reader reader(path, size);
    if (!reader.is_open()) {
        return unexpected(error{error_code::file_read_error, "cannot open " + path.string()});
    }

    verification_report report;
    report.file_size = size;

    std::array<uint8_t, 64> head{};
    auto head_len = static_cast<std::size_t>(std::min<uint64_t>(size, head.size()));
    if (head_len > 0 && !reader.read_at(0, head.data(), head_len)) {
        return unexpected(error{error_code::file_read_error, "cannot read " + path.string()});
    }
    auto head_bytes = std::as_bytes(std::span<const uint8_t>(head.data(), head_len));

    if (head_len < 4 || classify_prefix(head_bytes) != integrity_verdict::valid) {
        report.verdict = integrity_verdict::auth_failure;
        report.reason = head_len == 0 ? "empty file" : describe_payload(head_bytes);
        AF_LOG_WARN(log_category::verifier,
                    path.filename().string() + " is not an archive: " + report.reason);
        return report;
    }

    auto fail = [&](const error& err) -> result<verification_report> {
        if (err.code == error_code::file_read_error) {
            return unexpected(err);
        }
        report.verdict = integrity_verdict::corrupt;
        report.reason = err.message;
        AF_LOG_WARN(log_category::verifier,
                    path.filename().string() + " is corrupt: " + report.reason);
        return report;
    };

    auto location = reader.locate_directory();
    if (!location) {
        return fail(location.error());
    }

    auto entries = reader.read_directory(location.value());
    if (!entries) {
        return fail(entries.error());
    }
    report.entry_count = entries.value().size();

    for (const auto& entry : entries.value()) {
        auto data_offset = reader.locate_data(entry, location.value().offset);
        if (!data_offset) {
            return fail(data_offset.error());
        }

        if (!options_.check_entry_crc || (entry.flags & FLAG_ENCRYPTED) != 0) {
            continue;
        }

        result<void> checked;
        if (entry.method == METHOD_STORED) {
            checked = reader.check_stored(entry, data_offset.value());
        } else if (entry.method == METHOD_DEFLATED) {
            checked = reader.check_deflated(entry, data_offset.value());
        } else {
            continue;
        }
        if (!checked) {
            return fail(checked.error());
        }
        ++report.entries_crc_checked;
    }

    report.verdict = integrity_verdict::valid;
    AF_LOG_DEBUG(log_category::verifier,
                 path.filename().string() + " verified: " +
                 std::to_string(report.entry_count) + " entries");
    return report;
}

auto integrity_verifier::verify_prefix(const std::filesystem::path& path) const
    -> result<integrity_verdict> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected(error{error_code::file_read_error, "cannot open " + path.string()});
    }

    std::array<char, 4> head{};
    in.read(head.data(), static_cast<std::streamsize>(head.size()));
    auto n = static_cast<std::size_t>(in.gcount());
    return classify_prefix(std::as_bytes(std::span<const char>(head.data(), n)));
}

auto integrity_verifier::classify_prefix(std::span<const std::byte> head)
    -> integrity_verdict {
    if (starts_with_magic(head, LOCAL_MAGIC) || starts_with_magic(head, EMPTY_MAGIC)) {
        return integrity_verdict::valid;
    }
    return integrity_verdict::auth_failure;
}

auto integrity_verifier::describe_payload(std::span<const std::byte> head) -> std::string {
    std::string text;
    for (auto b : head.first(std::min<std::size_t>(head.size(), 32))) {
        text += static_cast<char>(std::tolower(static_cast<unsigned char>(b)));
    }

    // Skip a UTF-8 BOM and leading whitespace
    if (text.rfind("\xef\xbb\xbf", 0) == 0) {
        text.erase(0, 3);
    }
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "blank payload";
    }
    text.erase(0, first);

    if (text.rfind("<!doctype", 0) == 0 || text.rfind("<html", 0) == 0) {
        return "HTML page";
    }
    if (text.front() == '<') {
        return "markup document";
    }
    if (text.front() == '{' || text.front() == '[') {
        return "JSON document";
    }
    return "unrecognized data";
}

auto integrity_verifier::is_markup_content_type(std::string_view content_type) -> bool {
    std::string lowered;
    lowered.reserve(content_type.size());
    for (char c : content_type) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lowered.find("text/html") != std::string::npos ||
           lowered.find("application/xhtml") != std::string::npos;
}

}  // namespace archive_fetch
