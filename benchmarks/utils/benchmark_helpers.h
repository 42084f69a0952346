/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef ARCHIVE_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H
#define ARCHIVE_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace archive_fetch::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Build a ZIP archive of exactly @p size bytes holding one
     *        stored entry of random data
     */
    static auto generate_stored_archive(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    // Movable
    temp_file_manager(temp_file_manager&&) noexcept;
    auto operator=(temp_file_manager&&) noexcept -> temp_file_manager&;

    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    /**
     * @brief Create a ZIP archive file of @p size bytes
     */
    auto create_archive(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Format bytes as human-readable string (e.g., "1.50 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_archive = 256 * KB;
constexpr std::size_t medium_archive = 16 * MB;
constexpr std::size_t large_archive = 128 * MB;

// Range request windows
constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t default_chunk = 1 * MB;
constexpr std::size_t max_chunk = 8 * MB;
}  // namespace sizes

}  // namespace archive_fetch::benchmark

#endif  // ARCHIVE_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H
