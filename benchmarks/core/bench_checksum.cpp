/**
 * @file bench_checksum.cpp
 * @brief Benchmarks for CRC-32 and SHA-256
 */

#include <benchmark/benchmark.h>

#include <archive_fetch/core/checksum.h>

#include "utils/benchmark_helpers.h"

#include <span>

namespace archive_fetch::benchmark {

static void BM_Checksum_CRC32(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(data_size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief SHA-256 of a whole archive file, as used by duplicate scanning
 */
static void BM_Checksum_SHA256_File(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto test_file = temp_files.create_archive("sha256_test.zip", file_size, 42);

    for (auto _ : state) {
        auto result = checksum::sha256_file(test_file);
        if (!result) {
            state.SkipWithError("Failed to calculate file hash");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_CRC32)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256_File)
    ->Arg(static_cast<int64_t>(sizes::small_archive))
    ->Arg(static_cast<int64_t>(sizes::medium_archive))
    ->Unit(::benchmark::kMillisecond);

}  // namespace archive_fetch::benchmark
