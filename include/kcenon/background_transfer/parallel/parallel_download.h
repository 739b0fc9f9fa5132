/**
 * @file parallel_download.h
 * @brief Coordinator that runs a parallel download as a set of chunk tasks
 *
 * A parent task is split into byte-range chunks that go through the normal
 * admission path. Chunk events are fed back here and folded into a single
 * parent status and progress stream. Pausing collects a composite resume
 * token from all live chunks; resuming from that token re-creates only the
 * chunks that are not yet complete.
 *
 * All state changes run as events on one serial channel: whichever thread
 * posts an event while the channel is idle drains it, and events posted
 * while draining (from any thread, including re-entrant calls made from
 * the parent sink) are queued behind it. Parent events are therefore
 * emitted in the order the state changed, without holding any lock while
 * calling out.
 */

#ifndef KCENON_BACKGROUND_TRANSFER_PARALLEL_PARALLEL_DOWNLOAD_H
#define KCENON_BACKGROUND_TRANSFER_PARALLEL_PARALLEL_DOWNLOAD_H

#include <kcenon/background_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/background_transfer/core/resume_token.h>
#include <kcenon/background_transfer/core/task.h>
#include <kcenon/background_transfer/core/task_update.h>
#include <kcenon/background_transfer/core/types.h>
#include <kcenon/background_transfer/executor/transfer_executor.h>
#include <kcenon/background_transfer/parallel/chunk_plan.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::background_transfer {

/**
 * @brief Coordinator settings
 */
struct parallel_config {
    chunk_plan_config chunking;

    /// How long pause waits for every live chunk to report
    std::chrono::milliseconds pause_timeout{500};

    /// How long cancel waits for chunks before finalizing anyway
    std::chrono::milliseconds cancel_timeout{2000};

    /// Smallest parent progress increase that is reported
    double min_progress_step = 0.01;

    [[nodiscard]] auto validate() const -> result<void> {
        auto chunks = chunking.validate();
        if (!chunks) {
            return chunks;
        }
        if (pause_timeout.count() <= 0 || cancel_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "parallel download timeouts must be positive"});
        }
        if (min_progress_step < 0.0 || min_progress_step >= 1.0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "min_progress_step must be in [0, 1)"});
        }
        return {};
    }
};

/**
 * @brief How the coordinator reaches chunk tasks
 *
 * Implemented by the orchestrator. Calls are made without any coordinator
 * lock held and may re-enter the coordinator.
 */
class chunk_transport {
public:
    virtual ~chunk_transport() = default;

    /**
     * @brief Submit a chunk through the normal admission path
     * @return false if the chunk could not be accepted
     */
    virtual auto enqueue_chunk(const task& chunk,
                               const std::optional<simple_resume_token>& token) -> bool = 0;

    /**
     * @brief Cancel a chunk; its final status is expected to be reported back
     */
    virtual void cancel_chunk(const task& chunk) = 0;

    /**
     * @brief Stop a chunk and return its resume token, if the executor made one
     *
     * May block on the executor. Always called from a pool worker.
     */
    virtual auto pause_chunk(const task& chunk) -> std::optional<simple_resume_token> = 0;

    /**
     * @brief Query content length and range support for the parent URL
     *
     * May block on the network. Always called from a pool worker.
     */
    virtual auto probe(const task& parent) -> result<content_metadata> = 0;
};

/**
 * @brief Receives aggregated parent events
 */
class parent_update_sink {
public:
    virtual ~parent_update_sink() = default;

    virtual void on_parent_status(const status_update& update) = 0;
    virtual void on_parent_progress(const progress_update& update) = 0;
};

/**
 * @brief Called once a pause has collected its resume token
 *
 * The token is absent only when every chunk completed before the pause
 * took effect; the parent then reports complete instead.
 */
using pause_callback =
    std::function<void(const task& parent, std::optional<composite_resume_token> token)>;

/**
 * @brief Snapshot of one chunk, for inspection
 */
struct chunk_snapshot {
    task chunk;
    task_status status = task_status::enqueued;
    uint64_t bytes_done = 0;
};

/**
 * @brief Runs parallel downloads on top of chunk tasks
 */
class parallel_download_coordinator {
public:
    parallel_download_coordinator(
        chunk_transport& transport,
        parent_update_sink& sink,
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
        parallel_config config = {});

    ~parallel_download_coordinator();

    parallel_download_coordinator(const parallel_download_coordinator&) = delete;
    auto operator=(const parallel_download_coordinator&)
        -> parallel_download_coordinator& = delete;

    /**
     * @brief Start an admitted parent
     * @param parent Parallel download task
     * @param token Composite token from an earlier pause, if resuming
     * @return duplicate_task if the parent is already active
     *
     * Reports running for the parent. Without a token the content length is
     * probed on the pool first; with one, the chunks are rebuilt from it.
     */
    [[nodiscard]] auto start(const task& parent,
                             std::optional<composite_resume_token> token = std::nullopt)
        -> result<void>;

    /**
     * @brief Pause an active parent
     * @return false if the parent is not active or already pausing or canceling
     *
     * Completes asynchronously: on_paused is called once every live chunk
     * reported or pause_timeout elapsed, after which the parent is no longer
     * active. Chunks that did not report in time restart their whole range.
     */
    auto pause(const std::string& parent_id, pause_callback on_paused) -> bool;

    /**
     * @brief Cancel an active parent and all of its chunks
     * @return false if the parent is not active
     *
     * The parent reports canceled once all chunks have reported or after
     * cancel_timeout. Calling again while canceling is a no-op returning true.
     */
    auto cancel(const std::string& parent_id) -> bool;

    /**
     * @brief Feed a chunk status change
     *
     * Events for unknown parents or chunks are logged and dropped.
     */
    void chunk_status_update(const std::string& parent_id,
                             const std::string& chunk_id,
                             task_status status,
                             std::optional<task_exception> exception = std::nullopt,
                             std::optional<std::string> response_body = std::nullopt);

    /**
     * @brief Feed chunk progress as a fraction of the chunk's current request
     */
    void chunk_progress_update(const std::string& parent_id,
                               const std::string& chunk_id,
                               double progress);

    [[nodiscard]] auto is_active(const std::string& parent_id) const -> bool;

    [[nodiscard]] auto parent_task(const std::string& parent_id) const -> std::optional<task>;

    [[nodiscard]] auto active_parents() const -> std::vector<task>;

    [[nodiscard]] auto chunks(const std::string& parent_id) const
        -> std::vector<chunk_snapshot>;

    /**
     * @brief Parent id a chunk belongs to, if the chunk is tracked
     */
    [[nodiscard]] auto parent_of(const std::string& chunk_id) const
        -> std::optional<std::string>;

    [[nodiscard]] auto config() const -> const parallel_config&;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_PARALLEL_PARALLEL_DOWNLOAD_H
