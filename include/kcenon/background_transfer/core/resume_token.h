/**
 * @file resume_token.h
 * @brief Typed resume state for paused transfers
 *
 * A paused simple transfer is described by the executor's opaque resume
 * blob. A paused parallel download is described by one entry per chunk.
 * Both live in one variant so the resume path can dispatch on the
 * alternative instead of re-parsing bytes.
 */

#ifndef KCENON_BACKGROUND_TRANSFER_CORE_RESUME_TOKEN_H
#define KCENON_BACKGROUND_TRANSFER_CORE_RESUME_TOKEN_H

#include <kcenon/background_transfer/core/task.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kcenon::background_transfer {

/**
 * @brief Executor-native resume state for a single transfer
 */
struct simple_resume_token {
    std::vector<std::byte> data;        ///< Opaque executor blob
    uint64_t bytes_transferred = 0;     ///< Bytes already on disk
    std::string etag;                   ///< Validator for the partial content
};

/**
 * @brief Resume state of one chunk of a parallel download
 */
struct chunk_resume_entry {
    std::string chunk_task_id;
    std::string url;
    uint64_t range_start = 0;
    std::optional<uint64_t> range_end;              ///< Inclusive; open if unknown
    uint64_t bytes_transferred = 0;
    std::optional<simple_resume_token> child_token;
    /// First byte of the request the child token was issued for; range_start if unset
    std::optional<uint64_t> child_range_start;

    /**
     * @brief Number of bytes the full range covers, if the range is closed
     */
    [[nodiscard]] auto range_size() const noexcept -> std::optional<uint64_t> {
        if (!range_end) return std::nullopt;
        return *range_end - range_start + 1;
    }

    [[nodiscard]] auto is_complete() const noexcept -> bool {
        auto size = range_size();
        return size.has_value() && bytes_transferred >= *size;
    }
};

/**
 * @brief Resume state for a whole parallel download, ordered by range start
 */
struct composite_resume_token {
    std::optional<uint64_t> total_size;
    std::vector<chunk_resume_entry> chunks;

    [[nodiscard]] auto bytes_transferred() const noexcept -> uint64_t {
        uint64_t total = 0;
        for (const auto& c : chunks) total += c.bytes_transferred;
        return total;
    }
};

using resume_token = std::variant<simple_resume_token, composite_resume_token>;

[[nodiscard]] inline auto is_composite(const resume_token& token) noexcept -> bool {
    return std::holds_alternative<composite_resume_token>(token);
}

/**
 * @brief Check that a token has the shape a task kind can resume from
 */
[[nodiscard]] inline auto token_matches(const task& t, const resume_token& token) noexcept
    -> bool {
    if (!t.supports_resume()) {
        return false;
    }
    if (t.is_parallel_download()) {
        return is_composite(token) &&
               !std::get<composite_resume_token>(token).chunks.empty();
    }
    return !is_composite(token) &&
           !std::get<simple_resume_token>(token).data.empty();
}

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_CORE_RESUME_TOKEN_H
