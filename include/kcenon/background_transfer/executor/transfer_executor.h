/**
 * @file transfer_executor.h
 * @brief Boundary to the platform service that moves the bytes
 */

#ifndef KCENON_BACKGROUND_TRANSFER_EXECUTOR_TRANSFER_EXECUTOR_H
#define KCENON_BACKGROUND_TRANSFER_EXECUTOR_TRANSFER_EXECUTOR_H

#include <kcenon/background_transfer/core/resume_token.h>
#include <kcenon/background_transfer/core/task.h>
#include <kcenon/background_transfer/core/types.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::background_transfer {

/**
 * @brief Identifier the executor assigns to a submitted transfer
 */
using transfer_handle = uint64_t;

/**
 * @brief What the orchestrator hands to the executor
 *
 * The task carries URL, headers and method. Range requests for chunks are
 * expressed through the task's Range header. The handle is assigned by the
 * orchestrator before submission so that events raised from inside
 * submit() can already be attributed.
 */
struct transfer_request {
    transfer_handle handle = 0;
    task t;
    /// Effective network constraint after applying the global policy
    bool requires_unmetered_network = false;
};

/**
 * @brief Result of a metadata (HEAD-equivalent) probe
 */
struct content_metadata {
    std::optional<uint64_t> content_length;
    bool accepts_ranges = false;
};

/**
 * @brief Status change reported by the executor
 */
struct executor_status_event {
    task_status status = task_status::running;
    std::optional<task_exception> exception;
    std::optional<std::string> response_body;
    std::optional<int> response_status_code;
    /// Server-suggested filename, reported with running
    std::optional<std::string> suggested_filename;
};

/**
 * @brief Receives events for submitted transfers
 *
 * Events may arrive on any thread, including from inside submit() or
 * cancel().
 */
class executor_listener {
public:
    virtual ~executor_listener() = default;

    virtual void on_progress(transfer_handle handle, uint64_t bytes, int64_t total_bytes) = 0;
    virtual void on_status_change(transfer_handle handle,
                                  const executor_status_event& event) = 0;
};

/**
 * @brief Native transfer executor
 *
 * Implementations wrap a platform background transfer service. The
 * orchestrator never holds one of its own locks while calling into it.
 */
class transfer_executor {
public:
    virtual ~transfer_executor() = default;

    virtual void set_listener(std::shared_ptr<executor_listener> listener) = 0;

    /**
     * @brief Start a transfer
     * @param request What to transfer, including the handle to report under
     * @param token Resume state from an earlier pause, if any
     * @return executor_error if the transfer could not be started
     */
    [[nodiscard]] virtual auto submit(const transfer_request& request,
                                      const std::optional<simple_resume_token>& token)
        -> result<void> = 0;

    /**
     * @brief Stop a transfer
     * @param handle Transfer to stop
     * @param produce_resume_data Whether the caller wants resume state back
     * @return Resume state if requested and the executor could produce it
     *
     * The executor still reports a final status (usually canceled) for the
     * handle after this call.
     */
    virtual auto cancel(transfer_handle handle, bool produce_resume_data)
        -> std::optional<simple_resume_token> = 0;

    /**
     * @brief Ask the server for content length and range support
     */
    [[nodiscard]] virtual auto probe(const task& t) -> result<content_metadata> = 0;
};

/**
 * @brief Notification presentation service, called fire-and-forget
 */
class notification_service {
public:
    virtual ~notification_service() = default;

    virtual void on_enqueued(const task& t, const notification_config& config) = 0;
    virtual void on_paused(const task& t, const notification_config& config) = 0;
    virtual void on_finished(const task& t, task_status status,
                             const notification_config& config) = 0;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_EXECUTOR_TRANSFER_EXECUTOR_H
