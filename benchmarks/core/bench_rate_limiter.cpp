/**
 * @file bench_rate_limiter.cpp
 * @brief Benchmarks for the shared bandwidth budget
 */

#include <benchmark/benchmark.h>

#include <archive_fetch/core/rate_limiter.h>

#include "utils/benchmark_helpers.h"

namespace archive_fetch::benchmark {

/**
 * @brief acquire() overhead when no limit is configured
 */
static void BM_RateLimiter_Unlimited(::benchmark::State& state) {
    rate_limiter limiter(0);
    const auto chunk = static_cast<uint64_t>(state.range(0));

    for (auto _ : state) {
        bool granted = limiter.acquire(chunk);
        ::benchmark::DoNotOptimize(granted);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief acquire() against a budget large enough never to block
 */
static void BM_RateLimiter_UnderBudget(::benchmark::State& state) {
    rate_limiter limiter(uint64_t{1} << 50);
    const auto chunk = static_cast<uint64_t>(state.range(0));

    for (auto _ : state) {
        bool granted = limiter.acquire(chunk);
        ::benchmark::DoNotOptimize(granted);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Contended try_acquire() from several workers
 */
static void BM_RateLimiter_Contended(::benchmark::State& state) {
    static rate_limiter limiter(uint64_t{1} << 50);

    for (auto _ : state) {
        bool granted = limiter.try_acquire(sizes::min_chunk);
        ::benchmark::DoNotOptimize(granted);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_RateLimiter_Unlimited)
    ->Arg(static_cast<int64_t>(sizes::min_chunk))
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_RateLimiter_UnderBudget)
    ->Arg(static_cast<int64_t>(sizes::min_chunk))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_RateLimiter_Contended)->Threads(1)->Threads(4)->Threads(8);

}  // namespace archive_fetch::benchmark
