/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk splitting, checksums and progress accounting
 */

#include <benchmark/benchmark.h>

#include <kcenon/chunked_upload/core/byte_source.h>
#include <kcenon/chunked_upload/core/checksum.h>
#include <kcenon/chunked_upload/core/chunk_splitter.h>
#include <kcenon/chunked_upload/core/progress_tracker.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::chunked_upload::benchmark {

/**
 * @brief Read every chunk of a file through chunk_splitter
 */
static void BM_ChunkSplitter_ReadFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto test_file = temp_files.create_random_file("split_test.bin", file_size, 42);

    auto opened = file_byte_source::open(test_file);
    if (!opened) {
        state.SkipWithError("Failed to open source file");
        return;
    }
    auto source = std::move(opened).value();

    chunk_splitter splitter{chunk_config(chunk_size)};
    const auto total = splitter.total_chunks(file_size);

    for (auto _ : state) {
        for (uint64_t index = 0; index < total; ++index) {
            auto chunk_result = splitter.read_chunk(*source, index);
            if (!chunk_result) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            ::benchmark::DoNotOptimize(chunk_result.value());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(total) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Read every chunk of an in-memory payload
 */
static void BM_ChunkSplitter_ReadMemory(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    memory_byte_source source("memory.bin", generate_random_data(data_size, 42));
    chunk_splitter splitter{chunk_config(chunk_size)};
    const auto total = splitter.total_chunks(data_size);

    for (auto _ : state) {
        for (uint64_t index = 0; index < total; ++index) {
            auto chunk_result = splitter.read_chunk(source, index);
            if (!chunk_result) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            ::benchmark::DoNotOptimize(chunk_result.value());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for CRC32 checksum calculation
 */
static void BM_Checksum_CRC32(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(data_size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(data);
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Per-chunk progress bookkeeping
 */
static void BM_ProgressTracker_RecordChunk(::benchmark::State& state) {
    const auto total_chunks = static_cast<uint64_t>(state.range(0));

    upload_session session;
    session.id = "bench";
    session.file_name = "bench.bin";
    session.chunk_size = sizes::min_chunk;
    session.file_size = total_chunks * session.chunk_size;
    session.total_chunks = total_chunks;

    for (auto _ : state) {
        auto progress = progress_tracker::create(session);
        for (uint64_t index = 0; index < total_chunks; ++index) {
            progress_tracker::record_chunk(progress, session, index);
        }
        ::benchmark::DoNotOptimize(progress);
    }

    state.SetItemsProcessed(static_cast<int64_t>(total_chunks) *
                           static_cast<int64_t>(state.iterations()));
}

// Chunk splitter benchmarks
BENCHMARK(BM_ChunkSplitter_ReadFile)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkSplitter_ReadMemory)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

// CRC32 benchmarks
BENCHMARK(BM_Checksum_CRC32)
    ->Arg(static_cast<int64_t>(1 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(8 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

// Progress benchmarks
BENCHMARK(BM_ProgressTracker_RecordChunk)
    ->Arg(16)
    ->Arg(1024)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::chunked_upload::benchmark
