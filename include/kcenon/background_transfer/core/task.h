/**
 * @file task.h
 * @brief Task model: kinds, status state machine and the task value type
 */

#ifndef KCENON_BACKGROUND_TRANSFER_CORE_TASK_H
#define KCENON_BACKGROUND_TRANSFER_CORE_TASK_H

#include <kcenon/background_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::background_transfer {

/**
 * @brief Kind of transfer a task describes
 */
enum class task_kind {
    download,
    upload,
    data_request,
    parallel_download
};

[[nodiscard]] constexpr auto to_string(task_kind kind) noexcept -> const char* {
    switch (kind) {
        case task_kind::download: return "download";
        case task_kind::upload: return "upload";
        case task_kind::data_request: return "data_request";
        case task_kind::parallel_download: return "parallel_download";
        default: return "unknown";
    }
}

/**
 * @brief Status shared by tasks and chunk tasks
 *
 * enqueued -> running -> {complete, failed, canceled, not_found}
 * running <-> paused, failed -> waiting_to_retry -> running
 */
enum class task_status {
    enqueued = 0,
    running = 1,
    complete = 2,
    not_found = 3,
    failed = 4,
    canceled = 5,
    waiting_to_retry = 6,
    paused = 7
};

[[nodiscard]] constexpr auto to_string(task_status status) noexcept -> const char* {
    switch (status) {
        case task_status::enqueued: return "enqueued";
        case task_status::running: return "running";
        case task_status::complete: return "complete";
        case task_status::not_found: return "not_found";
        case task_status::failed: return "failed";
        case task_status::canceled: return "canceled";
        case task_status::waiting_to_retry: return "waiting_to_retry";
        case task_status::paused: return "paused";
        default: return "unknown";
    }
}

/**
 * @brief Check if status is terminal (final)
 */
[[nodiscard]] constexpr auto is_terminal_status(task_status status) noexcept -> bool {
    return status == task_status::complete ||
           status == task_status::failed ||
           status == task_status::canceled ||
           status == task_status::not_found;
}

/**
 * @brief Check if a status transition is allowed by the task state machine
 *
 * Re-reporting the current non-terminal status is allowed so that
 * duplicate executor events are harmless.
 */
[[nodiscard]] constexpr auto is_valid_transition(
    task_status from, task_status to) noexcept -> bool {
    if (is_terminal_status(from)) {
        return false;
    }
    if (from == to) {
        return true;
    }
    switch (from) {
        case task_status::enqueued:
            return to != task_status::paused;
        case task_status::running:
            return to != task_status::enqueued;
        case task_status::paused:
            return to == task_status::enqueued ||
                   to == task_status::running ||
                   to == task_status::canceled ||
                   to == task_status::failed;
        case task_status::waiting_to_retry:
            return to == task_status::enqueued ||
                   to == task_status::running ||
                   is_terminal_status(to);
        default:
            return false;
    }
}

/**
 * @brief Sentinel progress values that accompany non-running statuses
 */
struct progress_sentinel {
    static constexpr double complete = 1.0;
    static constexpr double failed = -1.0;
    static constexpr double canceled = -2.0;
    static constexpr double not_found = -3.0;
    static constexpr double waiting_to_retry = -4.0;
    static constexpr double paused = -5.0;
};

/**
 * @brief Sentinel progress for a status, if the status carries one
 */
[[nodiscard]] constexpr auto sentinel_progress_for(task_status status) noexcept
    -> std::optional<double> {
    switch (status) {
        case task_status::complete: return progress_sentinel::complete;
        case task_status::failed: return progress_sentinel::failed;
        case task_status::canceled: return progress_sentinel::canceled;
        case task_status::not_found: return progress_sentinel::not_found;
        case task_status::waiting_to_retry: return progress_sentinel::waiting_to_retry;
        case task_status::paused: return progress_sentinel::paused;
        default: return std::nullopt;
    }
}

/**
 * @brief Category of a task failure
 */
enum class exception_type {
    general,
    file_system,
    url,
    connection,
    resume,
    http_response
};

[[nodiscard]] constexpr auto to_string(exception_type type) noexcept -> const char* {
    switch (type) {
        case exception_type::general: return "general";
        case exception_type::file_system: return "file_system";
        case exception_type::url: return "url";
        case exception_type::connection: return "connection";
        case exception_type::resume: return "resume";
        case exception_type::http_response: return "http_response";
        default: return "unknown";
    }
}

/**
 * @brief Failure details attached to a failed status
 */
struct task_exception {
    exception_type type = exception_type::general;
    std::string description;
    int http_response_code = -1;

    /**
     * @brief Whether retrying the transfer may succeed
     *
     * Client errors (4xx other than 408/429) and file system errors are final.
     */
    [[nodiscard]] auto is_retryable() const noexcept -> bool {
        if (type == exception_type::file_system || type == exception_type::url) {
            return false;
        }
        if (type == exception_type::http_response) {
            return http_response_code == 408 || http_response_code == 429 ||
                   http_response_code >= 500;
        }
        return true;
    }
};

/**
 * @brief One logical transfer tracked end to end
 *
 * Treated as immutable once enqueued. Host-visible modifications are made
 * on a copy (see copy_with_filename) and stored in a side registry.
 */
struct task {
    std::string task_id;
    task_kind kind = task_kind::download;
    std::string url;
    std::vector<std::string> mirror_urls;
    std::map<std::string, std::string> headers;
    std::string http_method = "GET";
    std::optional<std::string> post;
    std::string filename;
    std::string directory;
    std::string mime_type;
    int priority = 5;
    std::string group = "default";
    bool requires_unmetered_network = false;
    int retries = 0;
    int retries_remaining = 0;
    bool allow_pause = true;
    int chunk_count = 0;
    std::chrono::system_clock::time_point creation_time;

    // Chunk-only fields
    std::string parent_task_id;
    uint64_t byte_range_start = 0;
    std::optional<uint64_t> byte_range_end;

    [[nodiscard]] auto is_chunk() const noexcept -> bool { return !parent_task_id.empty(); }

    [[nodiscard]] auto is_parallel_download() const noexcept -> bool {
        return kind == task_kind::parallel_download;
    }

    /**
     * @brief Whether a partial transfer of this kind can be continued
     */
    [[nodiscard]] auto supports_resume() const noexcept -> bool {
        return allow_pause &&
               (kind == task_kind::download || kind == task_kind::parallel_download);
    }

    [[nodiscard]] auto copy_with_filename(std::string new_filename) const -> task {
        task copy = *this;
        copy.filename = std::move(new_filename);
        return copy;
    }

    [[nodiscard]] auto copy_with_retries_remaining(int remaining) const -> task {
        task copy = *this;
        copy.retries_remaining = remaining;
        return copy;
    }
};

/**
 * @brief Host-supplied notification configuration, kept opaque
 */
struct notification_config {
    std::string json;
};

/**
 * @brief Components of an absolute http(s) URL
 */
struct parsed_url {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string path;
};

/**
 * @brief Parse an absolute http or https URL
 * @param url URL string
 * @return Parsed components or invalid_url error
 */
[[nodiscard]] auto parse_url(const std::string& url) -> result<parsed_url>;

/**
 * @brief Host of the task URL, lower-cased; empty if the URL is invalid
 */
[[nodiscard]] auto host_of(const task& t) -> std::string;

/**
 * @brief Validate a task before admission
 *
 * Checks identity, URL and field ranges. Does not look at resume tokens.
 */
[[nodiscard]] auto validate_task(const task& t) -> result<void>;

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_CORE_TASK_H
