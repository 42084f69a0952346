/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <archive_fetch/core/checksum.h>

#include <fstream>
#include <iomanip>
#include <span>
#include <sstream>

namespace archive_fetch::benchmark {

namespace {

void put_u16(std::vector<std::byte>& out, uint16_t value) {
    out.push_back(static_cast<std::byte>(value & 0xFF));
    out.push_back(static_cast<std::byte>((value >> 8) & 0xFF));
}

void put_u32(std::vector<std::byte>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFF));
    }
}

void put_name(std::vector<std::byte>& out, const std::string& name) {
    for (char c : name) {
        out.push_back(static_cast<std::byte>(c));
    }
}

}  // namespace

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_stored_archive(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    const std::string name = "data.bin";
    // local header + central entry + end record, each carrying the name
    const std::size_t overhead = 30 + 46 + 22 + 2 * name.size();
    auto payload = generate_random_data(size > overhead ? size - overhead : 1, seed);
    auto crc = checksum::crc32(std::span<const std::byte>(payload));
    auto payload_size = static_cast<uint32_t>(payload.size());

    std::vector<std::byte> out;
    out.reserve(payload.size() + overhead);

    put_u32(out, 0x04034b50);
    put_u16(out, 20);
    put_u16(out, 0);
    put_u16(out, 0);  // stored
    put_u16(out, 0);
    put_u16(out, 0x21);
    put_u32(out, crc);
    put_u32(out, payload_size);
    put_u32(out, payload_size);
    put_u16(out, static_cast<uint16_t>(name.size()));
    put_u16(out, 0);
    put_name(out, name);
    out.insert(out.end(), payload.begin(), payload.end());

    auto cd_offset = static_cast<uint32_t>(out.size());
    put_u32(out, 0x02014b50);
    put_u16(out, 20);
    put_u16(out, 20);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 0x21);
    put_u32(out, crc);
    put_u32(out, payload_size);
    put_u32(out, payload_size);
    put_u16(out, static_cast<uint16_t>(name.size()));
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u32(out, 0);
    put_u32(out, 0);
    put_name(out, name);
    auto cd_size = static_cast<uint32_t>(out.size()) - cd_offset;

    put_u32(out, 0x06054b50);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 1);
    put_u16(out, 1);
    put_u32(out, cd_size);
    put_u32(out, cd_offset);
    put_u16(out, 0);
    return out;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "archive_fetch_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

temp_file_manager::temp_file_manager(temp_file_manager&& other) noexcept
    : base_dir_(std::move(other.base_dir_)),
      created_files_(std::move(other.created_files_)),
      owns_dir_(other.owns_dir_) {
    other.owns_dir_ = false;
}

auto temp_file_manager::operator=(temp_file_manager&& other) noexcept -> temp_file_manager& {
    if (this != &other) {
        cleanup();
        base_dir_ = std::move(other.base_dir_);
        created_files_ = std::move(other.created_files_);
        owns_dir_ = other.owns_dir_;
        other.owns_dir_ = false;
    }
    return *this;
}

auto temp_file_manager::create_file(
    const std::string& name,
    const std::vector<std::byte>& data) -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::create_archive(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    return create_file(name, test_data_generator::generate_stored_archive(size, seed));
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::GB) {
        oss << static_cast<double>(bytes) / sizes::GB << " GB";
    } else if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace archive_fetch::benchmark
