/**
 * @file bench_upload_throughput.cpp
 * @brief End-to-end coordinator throughput against a no-op backend
 *
 * Measures the client side of an upload: reading, checksumming, retry
 * bookkeeping, progress accounting and worker scheduling.
 */

#include <benchmark/benchmark.h>

#include <kcenon/chunked_upload/client/upload_coordinator.h>
#include <kcenon/chunked_upload/core/byte_source.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <string>
#include <vector>

namespace kcenon::chunked_upload::benchmark {

namespace {

auto make_coordinator(std::shared_ptr<null_upload_backend> backend, std::size_t workers)
    -> std::unique_ptr<upload_coordinator> {
    auto built = upload_coordinator::builder()
                     .with_backend(std::move(backend))
                     .with_worker_count(workers)
                     .build();
    if (!built) {
        return nullptr;
    }
    return std::make_unique<upload_coordinator>(std::move(built).value());
}

}  // namespace

/**
 * @brief Single file upload from disk
 */
static void BM_Upload_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto test_file = temp_files.create_random_file("upload_test.bin", file_size, 42);

    auto backend = std::make_shared<null_upload_backend>();
    auto coordinator = make_coordinator(backend, 1);
    if (!coordinator) {
        state.SkipWithError("Failed to build coordinator");
        return;
    }

    upload_options options;
    options.chunk_size = chunk_size;

    for (auto _ : state) {
        auto opened = file_byte_source::open(test_file);
        if (!opened) {
            state.SkipWithError("Failed to open source file");
            return;
        }

        auto result = coordinator->start(std::move(opened).value(), "bench", options);
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
        (void)coordinator->remove(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.counters["throughput_MB_s"] =
        ::benchmark::Counter(static_cast<double>(file_size) / sizes::MB,
                            ::benchmark::Counter::kIsIterationInvariantRate);
}

/**
 * @brief Several in-memory uploads sharing one worker pool
 */
static void BM_Upload_Concurrent(::benchmark::State& state) {
    const auto upload_count = static_cast<std::size_t>(state.range(0));
    const auto file_size = sizes::medium_file;

    auto payload = generate_random_data(file_size, 42);
    auto backend = std::make_shared<null_upload_backend>();
    auto coordinator = make_coordinator(backend, 4);
    if (!coordinator) {
        state.SkipWithError("Failed to build coordinator");
        return;
    }

    for (auto _ : state) {
        std::vector<std::string> ids;
        ids.reserve(upload_count);

        for (std::size_t i = 0; i < upload_count; ++i) {
            auto source = std::make_shared<memory_byte_source>(
                "concurrent_" + std::to_string(i) + ".bin", payload);
            auto id = coordinator->submit(std::move(source), "bench");
            if (!id) {
                state.SkipWithError(id.error().message.c_str());
                return;
            }
            ids.push_back(id.value());
        }

        for (const auto& id : ids) {
            auto done = coordinator->wait_for(id);
            if (!done || done.value().status != upload_status::completed) {
                state.SkipWithError("Upload did not complete");
                return;
            }
            (void)coordinator->remove(id);
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size * upload_count) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Upload_SingleFile)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Upload_Concurrent)
    ->Arg(1)
    ->Arg(4)
    ->Arg(16)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::chunked_upload::benchmark
