/**
 * @file bench_update_bridge.cpp
 * @brief Benchmarks for update delivery, coalescing and durable buffering
 */

#include <benchmark/benchmark.h>

#include <kcenon/background_transfer/bridge/update_bridge.h>
#include <kcenon/background_transfer/core/checksum.h>

#include "utils/benchmark_helpers.h"

#include <atomic>

namespace kcenon::background_transfer::benchmark {

namespace {

class counting_listener : public host_listener {
public:
    auto on_status_update(const status_update&) -> bool override {
        ++delivered;
        return true;
    }
    auto on_progress_update(const progress_update&) -> bool override {
        ++delivered;
        return true;
    }
    auto on_resume_data(const resume_data_update&) -> bool override {
        ++delivered;
        return true;
    }

    std::atomic<std::size_t> delivered{0};
};

auto make_task(std::size_t index) -> task {
    task t;
    t.task_id = "bench-" + std::to_string(index);
    t.url = "https://origin.example.com/" + t.task_id;
    return t;
}

}  // namespace

/**
 * @brief Stream fine-grained progress through the coalescing filter
 */
static void BM_UpdateBridge_ProgressCoalescing(::benchmark::State& state) {
    const auto steps = static_cast<int>(state.range(0));
    temp_state_dir dir("bt_bench_bridge");
    auto store = std::make_shared<persistent_store>(dir.path());
    if (!store->initialize()) {
        state.SkipWithError("Failed to initialize store");
        return;
    }

    update_bridge bridge(store, update_bridge_config{std::chrono::milliseconds(0), 0.05});
    auto listener = std::make_shared<counting_listener>();
    bridge.attach_listener(listener);

    auto t = make_task(0);
    for (auto _ : state) {
        bridge.deliver_status(status_update{t, task_status::enqueued, {}, {}, {}});
        bridge.deliver_status(status_update{t, task_status::running, {}, {}, {}});
        for (int i = 1; i < steps; ++i) {
            progress_update update;
            update.t = t;
            update.progress = static_cast<double>(i) / steps;
            bridge.deliver_progress(update);
        }
        bridge.deliver_status(status_update{t, task_status::complete, {}, {}, {}});
    }

    state.SetItemsProcessed(static_cast<int64_t>(steps) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["delivered_per_iter"] = ::benchmark::Counter(
        static_cast<double>(listener->delivered.load()),
        ::benchmark::Counter::kAvgIterations);
}

/**
 * @brief Buffer status updates to disk with no listener attached
 */
static void BM_UpdateBridge_BufferWithoutListener(::benchmark::State& state) {
    const auto tasks = static_cast<std::size_t>(state.range(0));
    temp_state_dir dir("bt_bench_buffer");
    auto store = std::make_shared<persistent_store>(dir.path());
    if (!store->initialize()) {
        state.SkipWithError("Failed to initialize store");
        return;
    }

    for (auto _ : state) {
        update_bridge bridge(store);
        for (std::size_t i = 0; i < tasks; ++i) {
            bridge.deliver_status(status_update{make_task(i), task_status::running, {}, {}, {}});
        }
        auto buffered = bridge.pop_buffered_status_updates();
        if (buffered.size() != tasks) {
            state.SkipWithError("Buffered update count mismatch");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(tasks) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief CRC-32 used to frame durable records
 */
static void BM_Checksum_CRC32(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    std::string payload(size, 'x');

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(checksum::crc32(payload));
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_UpdateBridge_ProgressCoalescing)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_UpdateBridge_BufferWithoutListener)
    ->Arg(10)
    ->Arg(100)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_CRC32)
    ->Arg(256)
    ->Arg(4096)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::background_transfer::benchmark
