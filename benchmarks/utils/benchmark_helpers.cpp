/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <atomic>
#include <random>

namespace kcenon::background_transfer::benchmark {

// task_generator implementation

auto task_generator::generate_requests(std::size_t count,
                                       std::size_t host_count,
                                       std::size_t group_count,
                                       uint32_t seed) -> std::vector<enqueue_request> {
    std::vector<enqueue_request> requests;
    requests.reserve(count);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<int> priority_dis(0, 9);

    for (std::size_t i = 0; i < count; ++i) {
        enqueue_request request;
        request.t.task_id = "bench-" + std::to_string(i);
        request.t.url = "https://host" + std::to_string(i % host_count) +
                        ".example.com/files/" + std::to_string(i) + ".bin";
        request.t.group = "group" + std::to_string(i % group_count);
        request.t.priority = priority_dis(gen);
        requests.push_back(std::move(request));
    }

    return requests;
}

auto task_generator::generate_parallel_parent(int chunk_count, std::size_t mirror_count)
    -> task {
    task t;
    t.task_id = "bench-parent";
    t.kind = task_kind::parallel_download;
    t.url = "https://origin.example.com/image.iso";
    t.headers = {{"Authorization", "Bearer benchmark"}, {"Accept", "*/*"}};
    t.chunk_count = chunk_count;
    for (std::size_t i = 0; i < mirror_count; ++i) {
        t.mirror_urls.push_back("https://mirror" + std::to_string(i) +
                                ".example.com/image.iso");
    }
    return t;
}

// temp_state_dir implementation

temp_state_dir::temp_state_dir(const std::string& prefix) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(counter.fetch_add(1)));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
}

temp_state_dir::~temp_state_dir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

auto temp_state_dir::path() const -> const std::filesystem::path& {
    return path_;
}

}  // namespace kcenon::background_transfer::benchmark
