/**
 * @file bench_resumable_transfer.cpp
 * @brief Benchmarks for single-archive range transfers from memory
 */

#include <benchmark/benchmark.h>

#include <archive_fetch/transfer/resumable_transfer.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <filesystem>
#include <string>

namespace archive_fetch::benchmark {

namespace {

/**
 * @brief Serves one archive from memory with correct range semantics
 */
class memory_transport : public http_transport {
public:
    explicit memory_transport(std::vector<std::byte> content) : content_(std::move(content)) {}

    auto fetch(const range_request& request) -> result<range_response> override {
        const uint64_t total = content_.size();
        range_response response;
        response.headers["Content-Type"] = "application/zip";
        if (request.range_start >= total) {
            response.status_code = 416;
            response.headers["Content-Range"] = "bytes */" + std::to_string(total);
            return response;
        }
        uint64_t last = request.range_end ? std::min(*request.range_end, total - 1) : total - 1;
        response.status_code = 206;
        response.headers["Content-Range"] = "bytes " + std::to_string(request.range_start) + "-" +
                                            std::to_string(last) + "/" + std::to_string(total);
        auto first = reinterpret_cast<const uint8_t*>(content_.data());
        response.body.assign(first + request.range_start, first + last + 1);
        return response;
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "memory"; }

private:
    std::vector<std::byte> content_;
};

}  // namespace

/**
 * @brief Download, write and verify one archive
 */
static void BM_ResumableTransfer_Download(::benchmark::State& state) {
    const auto archive_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    memory_transport transport(test_data_generator::generate_stored_archive(archive_size, 42));
    rate_limiter limiter(0);

    transfer_options options;
    options.chunk_size = chunk_size;
    resumable_transfer transfer(transport, limiter, options);

    session_credential credential;
    credential.token = "SID=benchmark";
    credential.generation = 1;

    file_task task;
    task.index = 1;
    task.url = "https://host/takeout-001.zip";
    task.final_path = temp_files.base_dir() / "takeout-001.zip";
    task.partial_path = temp_files.base_dir() / "takeout-001.zip.partial";

    for (auto _ : state) {
        state.PauseTiming();
        std::error_code ec;
        std::filesystem::remove(task.final_path, ec);
        stop_signal stop;
        state.ResumeTiming();

        auto result = transfer.run(task, credential, stop);
        if (result.outcome != transfer_outcome::completed) {
            state.SkipWithError(result.err.message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(static_cast<int64_t>(archive_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(archive_size) + " / " + format_bytes(chunk_size));
}

BENCHMARK(BM_ResumableTransfer_Download)
    ->Args({static_cast<int64_t>(sizes::medium_archive), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_archive),
            static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_archive), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace archive_fetch::benchmark
