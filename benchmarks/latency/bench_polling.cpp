/**
 * @file bench_polling.cpp
 * @brief Benchmarks for progress queries
 *
 * Polling must stay cheap enough to call from a UI loop while the copy
 * runs on another thread.
 */

#include <benchmark/benchmark.h>

#include <kcenon/transfer_monitor/transfer_monitor.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <memory>

namespace kcenon::transfer_monitor::benchmark {

static void BM_ByteCounter_AddRead(::benchmark::State& state) {
    byte_counter counter;

    for (auto _ : state) {
        counter.add_read(4096);
    }

    ::benchmark::DoNotOptimize(counter.read_count());
}

static void BM_ByteCounter_Load(::benchmark::State& state) {
    byte_counter counter;
    counter.add_read(1234);
    counter.add_written(1000);

    for (auto _ : state) {
        auto c = counter.load();
        ::benchmark::DoNotOptimize(c);
    }
}

/**
 * @brief snapshot() while a copy is in flight on the worker thread
 */
static void BM_Transfer_SnapshotWhileRunning(::benchmark::State& state) {
    constexpr uint64_t total = sizes::GB;
    auto t = transfer::start(std::make_unique<zero_source>(total),
                             std::make_unique<null_sink>(),
                             total);

    for (auto _ : state) {
        auto snap = t.snapshot();
        ::benchmark::DoNotOptimize(snap);
    }

    auto outcome = std::move(t).finish();
    if (!outcome) {
        state.SkipWithError("Transfer failed");
    }
}

static void BM_Format_Snapshot(::benchmark::State& state) {
    const auto style = state.range(0) == 0 ? unit_style::decimal : unit_style::binary;
    byte_counter::counts c;
    c.read = 5 * sizes::GB;
    c.written = 5 * sizes::GB;
    auto snap = make_snapshot(c, std::chrono::seconds(37), 12 * sizes::GB);

    for (auto _ : state) {
        auto text = format(snap, style);
        ::benchmark::DoNotOptimize(text);
    }
}

BENCHMARK(BM_ByteCounter_AddRead);
BENCHMARK(BM_ByteCounter_Load);
BENCHMARK(BM_Transfer_SnapshotWhileRunning);
BENCHMARK(BM_Format_Snapshot)->Arg(0)->Arg(1);

}  // namespace kcenon::transfer_monitor::benchmark
