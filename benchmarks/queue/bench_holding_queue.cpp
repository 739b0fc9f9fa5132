/**
 * @file bench_holding_queue.cpp
 * @brief Benchmarks for holding queue admission
 */

#include <benchmark/benchmark.h>

#include <kcenon/background_transfer/queue/holding_queue.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::background_transfer::benchmark {

/**
 * @brief Add N tasks and admit them in waves until the queue is empty
 */
static void BM_HoldingQueue_AddAndDrainThroughCeilings(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto requests = task_generator::generate_requests(count, 8, 4, 42);

    for (auto _ : state) {
        holding_queue queue(holding_queue_config{16, 4, 8});
        for (const auto& r : requests) {
            if (!queue.add(r)) {
                state.SkipWithError("Failed to add request");
                return;
            }
        }

        std::vector<std::string> admitted;
        while (queue.waiting_count() > 0) {
            admitted.clear();
            queue.admit_eligible([&](const enqueue_request& r) {
                admitted.push_back(r.t.task_id);
                return true;
            });
            for (const auto& id : admitted) {
                queue.task_finished(id);
            }
        }
        ::benchmark::DoNotOptimize(queue.running_count());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief One admission scan over a long list blocked on a saturated host
 *
 * Every waiting task targets the same host except the last one, so each
 * scan must walk the whole list to find it.
 */
static void BM_HoldingQueue_ScanPastSaturatedHost(::benchmark::State& state) {
    const auto waiting = static_cast<std::size_t>(state.range(0));

    holding_queue queue(holding_queue_config{0, 1, 0});
    auto blocked = task_generator::generate_requests(waiting + 1, 1, 1, 42);
    for (const auto& r : blocked) {
        (void)queue.add(r);
    }
    // Occupy the host's only slot
    queue.admit_eligible([](const enqueue_request&) { return true; });

    enqueue_request other;
    other.t.url = "https://elsewhere.example.com/file.bin";
    int next = 0;

    for (auto _ : state) {
        state.PauseTiming();
        other.t.task_id = "other-" + std::to_string(next++);
        (void)queue.add(other);
        state.ResumeTiming();

        auto admitted = queue.admit_eligible([](const enqueue_request&) { return true; });
        ::benchmark::DoNotOptimize(admitted);

        state.PauseTiming();
        queue.task_finished(other.t.task_id);
        state.ResumeTiming();
    }

    state.SetItemsProcessed(static_cast<int64_t>(waiting) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_HoldingQueue_AddAndDrainThroughCeilings)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(5000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_HoldingQueue_ScanPastSaturatedHost)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::background_transfer::benchmark
