/**
 * @file chunk_plan.cpp
 * @brief Implementation of chunk range planning
 */

#include <kcenon/background_transfer/parallel/chunk_plan.h>

#include <algorithm>

namespace kcenon::background_transfer {

auto source_urls(const task& parent) -> std::vector<std::string> {
    std::vector<std::string> urls;
    urls.reserve(1 + parent.mirror_urls.size());
    urls.push_back(parent.url);
    urls.insert(urls.end(), parent.mirror_urls.begin(), parent.mirror_urls.end());
    return urls;
}

auto planned_chunk_count(const task& parent, const chunk_plan_config& config) -> std::size_t {
    int per_url = parent.chunk_count > 0 ? parent.chunk_count : config.chunks_per_url;
    auto total = static_cast<std::size_t>(per_url) * (1 + parent.mirror_urls.size());
    return std::clamp<std::size_t>(total, 1, chunk_plan_config::max_chunks);
}

auto plan_ranges(std::optional<uint64_t> content_length,
                 bool accepts_ranges,
                 std::size_t chunk_count) -> std::vector<byte_range> {
    if (!content_length || *content_length == 0 || !accepts_ranges || chunk_count <= 1) {
        if (content_length && *content_length > 0 && chunk_count <= 1 && accepts_ranges) {
            return {byte_range{0, *content_length - 1}};
        }
        return {byte_range{0, std::nullopt}};
    }

    const uint64_t total = *content_length;
    const uint64_t chunk_size = (total + chunk_count - 1) / chunk_count;

    std::vector<byte_range> ranges;
    ranges.reserve(chunk_count);
    for (uint64_t start = 0; start < total; start += chunk_size) {
        ranges.push_back(byte_range{start, std::min(start + chunk_size, total) - 1});
    }
    return ranges;
}

auto chunk_task_id(const std::string& parent_id, std::size_t index) -> std::string {
    return parent_id + ".chunk" + std::to_string(index);
}

auto make_chunk_task(const task& parent,
                     const std::string& chunk_id,
                     const std::string& url,
                     const byte_range& range) -> task {
    task chunk;
    chunk.task_id = chunk_id;
    chunk.kind = task_kind::download;
    chunk.url = url;
    chunk.headers = parent.headers;
    chunk.http_method = "GET";
    chunk.filename = chunk_id;
    chunk.directory = parent.directory;
    chunk.priority = parent.priority;
    chunk.group = parent.group;
    chunk.requires_unmetered_network = parent.requires_unmetered_network;
    chunk.retries = parent.retries;
    chunk.retries_remaining = parent.retries;
    chunk.allow_pause = true;
    chunk.creation_time = std::chrono::system_clock::now();
    chunk.parent_task_id = parent.task_id;
    chunk.byte_range_start = range.start;
    chunk.byte_range_end = range.end;

    if (range.start > 0 || range.end) {
        chunk.headers["Range"] = range.header_value();
    }
    return chunk;
}

}  // namespace kcenon::background_transfer
