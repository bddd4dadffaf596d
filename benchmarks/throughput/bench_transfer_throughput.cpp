/**
 * @file bench_transfer_throughput.cpp
 * @brief Benchmarks for monitored copy throughput
 *
 * Measures the cost of the background copy, including thread start-up,
 * counter updates and the final join.
 */

#include <benchmark/benchmark.h>

#include <kcenon/transfer_monitor/transfer_monitor.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::transfer_monitor::benchmark {

/**
 * @brief Zero source to null sink through a full transfer
 */
static void BM_Transfer_ZeroToNull(::benchmark::State& state) {
    const auto size = static_cast<uint64_t>(state.range(0));

    for (auto _ : state) {
        auto t = transfer::start(std::make_unique<zero_source>(size),
                                 std::make_unique<null_sink>(),
                                 size);
        auto outcome = std::move(t).finish();
        if (!outcome) {
            state.SkipWithError("Transfer failed");
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Copy loop without the worker thread
 */
static void BM_CopyWorker_Direct(::benchmark::State& state) {
    const auto size = static_cast<uint64_t>(state.range(0));

    for (auto _ : state) {
        auto counter = std::make_shared<byte_counter>();
        copy_worker worker(std::make_unique<zero_source>(size),
                           std::make_unique<null_sink>(),
                           counter);
        auto outcome = worker.run();
        if (!outcome) {
            state.SkipWithError("Copy failed");
            return;
        }
        ::benchmark::DoNotOptimize(counter->written_count());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Effect of the copy buffer size on memory-to-memory throughput
 */
static void BM_Transfer_BufferSizeImpact(::benchmark::State& state) {
    const auto buffer_size = static_cast<std::size_t>(state.range(0));
    const auto data = test_data_generator::generate_random_data(sizes::medium_transfer, 42);

    for (auto _ : state) {
        auto t = transfer::builder()
                     .with_buffer_size(buffer_size)
                     .with_expected_total(data.size())
                     .start(std::make_unique<memory_source>(data),
                            std::make_unique<memory_sink>());
        if (!t) {
            state.SkipWithError("Invalid buffer size");
            return;
        }
        auto outcome = std::move(t.value()).finish();
        if (!outcome) {
            state.SkipWithError("Transfer failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(data.size()) *
                           static_cast<int64_t>(state.iterations()));
    state.counters["buffer_KB"] = static_cast<double>(buffer_size / sizes::KB);
}

/**
 * @brief File to file copy through a transfer
 */
static void BM_Transfer_FileCopy(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto input = temp_files.create_random_file("copy_source.bin", file_size, 42);
    auto output = temp_files.reserve_path("copy_target.bin");

    for (auto _ : state) {
        auto source = file_source::open(input);
        auto sink = file_sink::create(output);
        if (!source || !sink) {
            state.SkipWithError("Failed to open benchmark files");
            return;
        }

        auto t = transfer::start(std::move(source.value()), std::move(sink.value()), file_size);
        auto outcome = std::move(t).finish();
        if (!outcome) {
            state.SkipWithError("File copy failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.counters["throughput_MB_s"] =
        ::benchmark::Counter(static_cast<double>(file_size) / sizes::MB,
                            ::benchmark::Counter::kIsIterationInvariantRate);
}

BENCHMARK(BM_Transfer_ZeroToNull)
    ->Arg(static_cast<int64_t>(sizes::small_transfer))   // 100 KB
    ->Arg(static_cast<int64_t>(sizes::medium_transfer))  // 10 MB
    ->Arg(static_cast<int64_t>(sizes::large_transfer))   // 100 MB
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_CopyWorker_Direct)
    ->Arg(static_cast<int64_t>(sizes::small_transfer))
    ->Arg(static_cast<int64_t>(sizes::medium_transfer))
    ->Arg(static_cast<int64_t>(sizes::large_transfer))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Transfer_BufferSizeImpact)
    ->Arg(static_cast<int64_t>(sizes::min_buffer))       // 4 KB
    ->Arg(static_cast<int64_t>(16 * sizes::KB))          // 16 KB
    ->Arg(static_cast<int64_t>(sizes::default_buffer))   // 64 KB
    ->Arg(static_cast<int64_t>(sizes::MB))               // 1 MB
    ->Arg(static_cast<int64_t>(sizes::max_buffer))       // 16 MB
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(10);

BENCHMARK(BM_Transfer_FileCopy)
    ->Arg(static_cast<int64_t>(sizes::small_transfer))
    ->Arg(static_cast<int64_t>(sizes::medium_transfer))
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(10);

}  // namespace kcenon::transfer_monitor::benchmark
