/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_BACKGROUND_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_BACKGROUND_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/background_transfer/core/enqueue_request.h>
#include <kcenon/background_transfer/core/task.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::background_transfer::benchmark {

/**
 * @brief Helper class for generating tasks for benchmarks
 */
class task_generator {
public:
    /**
     * @brief Generate download tasks spread over hosts and groups
     * @param count Number of tasks
     * @param host_count Number of distinct hosts
     * @param group_count Number of distinct groups
     * @param seed Random seed for priorities (0 for random)
     * @return Enqueue requests with unique ids
     */
    static auto generate_requests(std::size_t count,
                                  std::size_t host_count,
                                  std::size_t group_count,
                                  uint32_t seed = 0) -> std::vector<enqueue_request>;

    /**
     * @brief Generate a parallel download parent
     * @param chunk_count Chunks per URL
     * @param mirror_count Number of mirror URLs
     */
    static auto generate_parallel_parent(int chunk_count, std::size_t mirror_count = 0) -> task;
};

/**
 * @brief Temporary directory removed when the helper goes out of scope
 */
class temp_state_dir {
public:
    explicit temp_state_dir(const std::string& prefix = "bt_bench");
    ~temp_state_dir();

    temp_state_dir(const temp_state_dir&) = delete;
    auto operator=(const temp_state_dir&) -> temp_state_dir& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path&;

private:
    std::filesystem::path path_;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr uint64_t KB = 1024;
constexpr uint64_t MB = 1024 * KB;
constexpr uint64_t GB = 1024 * MB;

constexpr uint64_t small_file = 100 * KB;
constexpr uint64_t large_file = 100 * MB;
constexpr uint64_t xlarge_file = 4 * GB;
}  // namespace sizes

}  // namespace kcenon::background_transfer::benchmark

#endif  // KCENON_BACKGROUND_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
