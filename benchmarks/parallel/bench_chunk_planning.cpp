/**
 * @file bench_chunk_planning.cpp
 * @brief Benchmarks for splitting parallel downloads and encoding their resume state
 */

#include <benchmark/benchmark.h>

#include <kcenon/background_transfer/core/task_codec.h>
#include <kcenon/background_transfer/parallel/chunk_plan.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::background_transfer::benchmark {

/**
 * @brief Plan ranges and build the chunk tasks for one parent
 */
static void BM_ChunkPlan_BuildChunkTasks(::benchmark::State& state) {
    const auto chunks = static_cast<int>(state.range(0));
    const auto mirrors = static_cast<std::size_t>(state.range(1));
    auto parent = task_generator::generate_parallel_parent(chunks, mirrors);
    chunk_plan_config config;

    for (auto _ : state) {
        auto count = planned_chunk_count(parent, config);
        auto ranges = plan_ranges(sizes::xlarge_file, true, count);
        auto urls = source_urls(parent);

        std::vector<task> tasks;
        tasks.reserve(ranges.size());
        for (std::size_t i = 0; i < ranges.size(); ++i) {
            tasks.push_back(make_chunk_task(parent, chunk_task_id(parent.task_id, i),
                                            urls[i % urls.size()], ranges[i]));
        }
        ::benchmark::DoNotOptimize(tasks.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(planned_chunk_count(parent, config)) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Encode and decode a composite resume token
 */
static void BM_ChunkPlan_CompositeTokenCodec(::benchmark::State& state) {
    const auto chunks = static_cast<std::size_t>(state.range(0));

    composite_resume_token token;
    token.total_size = sizes::large_file;
    auto ranges = plan_ranges(sizes::large_file, true, chunks);
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        chunk_resume_entry entry;
        entry.chunk_task_id = chunk_task_id("bench-parent", i);
        entry.url = "https://origin.example.com/image.iso";
        entry.range_start = ranges[i].start;
        entry.range_end = ranges[i].end;
        entry.bytes_transferred = *ranges[i].size() / 2;
        if (i % 2 == 0) {
            entry.child_token = simple_resume_token{
                std::vector<std::byte>(256, std::byte{0x5a}), entry.bytes_transferred, "\"v1\""};
        }
        token.chunks.push_back(std::move(entry));
    }

    std::size_t encoded_bytes = 0;
    for (auto _ : state) {
        auto encoded = encode_resume_token(token);
        encoded_bytes = encoded.size();
        auto decoded = decode_resume_token(encoded);
        if (!decoded) {
            state.SkipWithError("Failed to decode resume token");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(encoded_bytes) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkPlan_BuildChunkTasks)
    ->Args({4, 0})
    ->Args({4, 3})
    ->Args({16, 3})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ChunkPlan_CompositeTokenCodec)
    ->Arg(4)
    ->Arg(16)
    ->Arg(64)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::background_transfer::benchmark
