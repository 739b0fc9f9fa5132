/**
 * @file task_update.h
 * @brief Status, progress and resume-data updates delivered to the host
 */

#ifndef KCENON_BACKGROUND_TRANSFER_CORE_TASK_UPDATE_H
#define KCENON_BACKGROUND_TRANSFER_CORE_TASK_UPDATE_H

#include <kcenon/background_transfer/core/resume_token.h>
#include <kcenon/background_transfer/core/task.h>

#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::background_transfer {

/**
 * @brief Independent buffers kept by the update bridge
 */
enum class update_kind {
    status,
    progress,
    resume_data
};

[[nodiscard]] constexpr auto to_string(update_kind kind) noexcept -> const char* {
    switch (kind) {
        case update_kind::status: return "status";
        case update_kind::progress: return "progress";
        case update_kind::resume_data: return "resume";
        default: return "unknown";
    }
}

struct status_update {
    task t;
    task_status status = task_status::enqueued;
    std::optional<task_exception> exception;
    std::optional<std::string> response_body;
    std::optional<int> response_status_code;
};

struct progress_update {
    task t;
    double progress = 0.0;
    int64_t expected_file_size = -1;
    double network_speed = -1.0;       ///< Bytes per second, -1 if unknown
    int64_t time_remaining_ms = -1;    ///< -1 if unknown
};

struct resume_data_update {
    task t;
    resume_token token;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_CORE_TASK_UPDATE_H
