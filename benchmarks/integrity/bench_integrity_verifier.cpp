/**
 * @file bench_integrity_verifier.cpp
 * @brief Benchmarks for ZIP archive verification
 */

#include <benchmark/benchmark.h>

#include <archive_fetch/core/integrity_verifier.h>

#include "utils/benchmark_helpers.h"

#include <span>
#include <string>

namespace archive_fetch::benchmark {

/**
 * @brief Full verification (structure plus CRC-32 of every entry)
 */
static void BM_Verifier_VerifyFile(::benchmark::State& state) {
    const auto archive_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto archive = temp_files.create_archive("verify_full.zip", archive_size, 42);
    integrity_verifier verifier;

    for (auto _ : state) {
        auto report = verifier.verify_file(archive);
        if (!report || !report.value().is_valid()) {
            state.SkipWithError("Archive did not verify");
            return;
        }
        ::benchmark::DoNotOptimize(report.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(archive_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(archive_size));
}

/**
 * @brief Structural verification only (central directory walk)
 */
static void BM_Verifier_StructureOnly(::benchmark::State& state) {
    const auto archive_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto archive = temp_files.create_archive("verify_structure.zip", archive_size, 42);
    integrity_verifier verifier(verifier_options{false});

    for (auto _ : state) {
        auto report = verifier.verify_file(archive);
        if (!report || !report.value().is_valid()) {
            state.SkipWithError("Archive did not verify");
            return;
        }
        ::benchmark::DoNotOptimize(report.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(archive_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(archive_size));
}

static void BM_Verifier_ClassifyPrefix(::benchmark::State& state) {
    const std::string login_page =
        "<!DOCTYPE html><html><head><title>Sign in</title></head><body></body></html>";
    auto head = std::as_bytes(std::span<const char>(login_page.data(), login_page.size()));

    for (auto _ : state) {
        auto verdict = integrity_verifier::classify_prefix(head);
        ::benchmark::DoNotOptimize(verdict);
    }
}

BENCHMARK(BM_Verifier_VerifyFile)
    ->Arg(static_cast<int64_t>(sizes::small_archive))
    ->Arg(static_cast<int64_t>(sizes::medium_archive))
    ->Arg(static_cast<int64_t>(sizes::large_archive))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Verifier_StructureOnly)
    ->Arg(static_cast<int64_t>(sizes::medium_archive))
    ->Arg(static_cast<int64_t>(sizes::large_archive))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Verifier_ClassifyPrefix)->Unit(::benchmark::kNanosecond);

}  // namespace archive_fetch::benchmark
