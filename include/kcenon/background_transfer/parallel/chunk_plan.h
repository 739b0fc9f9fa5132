/**
 * @file chunk_plan.h
 * @brief Splitting a parallel download into byte-range chunk tasks
 */

#ifndef KCENON_BACKGROUND_TRANSFER_PARALLEL_CHUNK_PLAN_H
#define KCENON_BACKGROUND_TRANSFER_PARALLEL_CHUNK_PLAN_H

#include <kcenon/background_transfer/core/task.h>
#include <kcenon/background_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::background_transfer {

/**
 * @brief Inclusive byte range; an absent end means "to end of content"
 */
struct byte_range {
    uint64_t start = 0;
    std::optional<uint64_t> end;

    [[nodiscard]] auto size() const noexcept -> std::optional<uint64_t> {
        if (!end) return std::nullopt;
        return *end - start + 1;
    }

    /**
     * @brief Value for an HTTP Range header
     */
    [[nodiscard]] auto header_value() const -> std::string {
        return "bytes=" + std::to_string(start) + "-" + (end ? std::to_string(*end) : "");
    }
};

/**
 * @brief Chunking settings
 */
struct chunk_plan_config {
    /// Chunks per URL when the task does not set chunk_count
    static constexpr int default_chunks_per_url = 4;

    /// Upper bound on chunks for one download
    static constexpr int max_chunks = 64;

    int chunks_per_url = default_chunks_per_url;

    chunk_plan_config() = default;

    explicit chunk_plan_config(int per_url) : chunks_per_url(per_url) {}

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunks_per_url < 1 || chunks_per_url > max_chunks) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunks per url must be between 1 and " + std::to_string(max_chunks)});
        }
        return {};
    }
};

/**
 * @brief All URLs a parallel download may fetch from, primary first
 */
[[nodiscard]] auto source_urls(const task& parent) -> std::vector<std::string>;

/**
 * @brief Number of chunks to split a parent into
 *
 * chunk_count (or the configured default) per source URL, capped at
 * chunk_plan_config::max_chunks.
 */
[[nodiscard]] auto planned_chunk_count(const task& parent, const chunk_plan_config& config)
    -> std::size_t;

/**
 * @brief Partition [0, content_length) into contiguous ranges
 *
 * Each range is ceil(length / count) bytes except possibly the last.
 * Falls back to one open-ended range when the length is unknown or zero,
 * or when the server does not accept range requests.
 */
[[nodiscard]] auto plan_ranges(std::optional<uint64_t> content_length,
                               bool accepts_ranges,
                               std::size_t chunk_count) -> std::vector<byte_range>;

/**
 * @brief Id of the chunk at an index
 */
[[nodiscard]] auto chunk_task_id(const std::string& parent_id, std::size_t index) -> std::string;

/**
 * @brief Build the chunk task that fetches a range of the parent
 *
 * The range header is only set for ranges that do not start at 0 or have
 * a known end, so a single open-ended fallback chunk is a plain GET.
 */
[[nodiscard]] auto make_chunk_task(const task& parent,
                                   const std::string& chunk_id,
                                   const std::string& url,
                                   const byte_range& range) -> task;

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_PARALLEL_CHUNK_PLAN_H
