/**
 * @file task_orchestrator.h
 * @brief Host-facing entry point of the background transfer core
 */

#ifndef KCENON_BACKGROUND_TRANSFER_ORCHESTRATOR_TASK_ORCHESTRATOR_H
#define KCENON_BACKGROUND_TRANSFER_ORCHESTRATOR_TASK_ORCHESTRATOR_H

#include <kcenon/background_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/background_transfer/bridge/update_bridge.h>
#include <kcenon/background_transfer/core/enqueue_request.h>
#include <kcenon/background_transfer/core/resume_token.h>
#include <kcenon/background_transfer/core/task.h>
#include <kcenon/background_transfer/core/task_update.h>
#include <kcenon/background_transfer/core/types.h>
#include <kcenon/background_transfer/executor/transfer_executor.h>
#include <kcenon/background_transfer/network/network_policy.h>
#include <kcenon/background_transfer/orchestrator/orchestrator_config.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::background_transfer {

/**
 * @brief Admits, runs and reports background transfer tasks
 *
 * Tasks enter through enqueue(), wait in the holding queue until the
 * concurrency ceilings allow them, and are then handed to the transfer
 * executor; parallel downloads are split into chunk tasks first. Executor
 * events are turned into status and progress updates for the host, which
 * are buffered durably whenever the host listener cannot take them.
 *
 * Host commands answer with plain booleans and optionals. Batch commands
 * and anything that waits on the executor run on the internal pool.
 *
 * @code
 * auto orchestrator = task_orchestrator::builder()
 *     .with_executor(executor)
 *     .with_state_directory("/var/lib/app/transfers")
 *     .with_holding_queue({4, 2, 0})
 *     .build();
 * if (!orchestrator) { ... }
 *
 * orchestrator.value().attach_listener(listener);
 * orchestrator.value().enqueue(download);
 * @endcode
 *
 * @note Thread-safe.
 */
class task_orchestrator {
public:
    /**
     * @brief Builder for task_orchestrator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the executor that moves the bytes (required)
         */
        auto with_executor(std::shared_ptr<transfer_executor> executor) -> builder&;

        /**
         * @brief Set the notification service called on enqueue, pause and finish
         */
        auto with_notification_service(std::shared_ptr<notification_service> service)
            -> builder&;

        /**
         * @brief Use a specific pool instead of creating one
         *
         * The pool stays owned by the caller and is left running on shutdown.
         */
        auto with_thread_pool(
            std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder&;

        /**
         * @brief Directory for durable buffers (default: temp dir)
         */
        auto with_state_directory(std::filesystem::path dir) -> builder&;

        /**
         * @brief Progress coalescing per task
         * @param min_interval Minimum time between delivered values
         * @param min_delta Minimum growth between delivered values
         */
        auto with_progress_coalescing(std::chrono::milliseconds min_interval,
                                      double min_delta) -> builder&;

        auto with_pause_timeout(std::chrono::milliseconds timeout) -> builder&;
        auto with_cancel_timeout(std::chrono::milliseconds timeout) -> builder&;
        auto with_retry_base_delay(std::chrono::milliseconds delay) -> builder&;
        auto with_worker_count(std::size_t count) -> builder&;
        auto with_default_chunk_count(int count) -> builder&;
        auto with_holding_queue(const holding_queue_config& config) -> builder&;

        /**
         * @brief Validate the configuration and create the orchestrator
         * @return The orchestrator, or invalid_configuration / state_write_error
         */
        [[nodiscard]] auto build() -> result<task_orchestrator>;

    private:
        orchestrator_config config_;
        std::shared_ptr<transfer_executor> executor_;
        std::shared_ptr<notification_service> notifications_;
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    };

    // Non-copyable, movable
    task_orchestrator(const task_orchestrator&) = delete;
    auto operator=(const task_orchestrator&) -> task_orchestrator& = delete;
    task_orchestrator(task_orchestrator&&) noexcept;
    auto operator=(task_orchestrator&&) noexcept -> task_orchestrator&;
    ~task_orchestrator();

    // ------------------------------------------------------------------
    // Enqueue
    // ------------------------------------------------------------------

    /**
     * @brief Enqueue a task
     * @param t Task to run
     * @param notification Notification config to associate with the task
     * @param token Resume state from an earlier pause
     * @return false if the task is invalid or its id is already in use
     *
     * The host receives enqueued right away, even when admission is
     * deferred. A token that does not fit the task kind is discarded and
     * the task starts fresh.
     */
    auto enqueue(const task& t,
                 std::optional<notification_config> notification = std::nullopt,
                 std::optional<resume_token> token = std::nullopt) -> bool;

    /**
     * @brief Enqueue a fully specified request
     */
    auto enqueue(enqueue_request request) -> bool;

    /**
     * @brief Enqueue several tasks off the caller's thread
     * @return One result per task, in input order
     */
    [[nodiscard]] auto enqueue_all(std::vector<task> tasks,
                                   std::vector<std::optional<notification_config>> notifications = {})
        -> std::future<std::vector<bool>>;

    // ------------------------------------------------------------------
    // Cancel and pause
    // ------------------------------------------------------------------

    /**
     * @brief Cancel tasks wherever they are
     * @return true if at least one of the ids referred to a live task
     */
    auto cancel_tasks_with_ids(const std::vector<std::string>& task_ids) -> bool;

    /**
     * @brief Cancel every task of a group
     * @return Number of tasks canceled
     */
    auto reset(const std::string& group = "default") -> std::size_t;

    /**
     * @brief Pause a running task
     * @return false if the task is not running or cannot be paused
     *
     * The paused status and resume data follow asynchronously.
     */
    auto pause(const std::string& task_id) -> bool;

    /**
     * @brief Pause several tasks off the caller's thread
     */
    [[nodiscard]] auto pause_all(std::vector<std::string> task_ids)
        -> std::future<std::vector<bool>>;

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    [[nodiscard]] auto task_for_id(const std::string& task_id) const -> std::optional<task>;

    /**
     * @brief Every live task, optionally limited to a group
     */
    [[nodiscard]] auto all_tasks(const std::optional<std::string>& group = std::nullopt) const
        -> std::vector<task>;

    // ------------------------------------------------------------------
    // Policy and admission
    // ------------------------------------------------------------------

    /**
     * @brief Change the global unmetered-network policy
     * @param policy New policy
     * @param reschedule_running Pause and re-admit running tasks it affects
     * @return false if the policy could not be persisted; it applies anyway
     */
    auto set_network_policy(network_policy policy, bool reschedule_running) -> bool;

    [[nodiscard]] auto get_network_policy() const -> network_policy;

    /**
     * @brief Set the holding queue ceilings (0 disables a ceiling)
     * @return invalid_configuration for negative values
     */
    [[nodiscard]] auto configure_holding_queue(int max_concurrent,
                                               int max_concurrent_by_host,
                                               int max_concurrent_by_group) -> result<void>;

    [[nodiscard]] auto configure_holding_queue(const holding_queue_config& config)
        -> result<void>;

    /**
     * @brief Stop holding tasks back; waiting tasks are started immediately
     */
    void disable_holding_queue();

    // ------------------------------------------------------------------
    // Chunk events
    // ------------------------------------------------------------------

    void chunk_status_update(const std::string& parent_id,
                             const std::string& chunk_id,
                             task_status status,
                             std::optional<task_exception> exception = std::nullopt,
                             std::optional<std::string> response_body = std::nullopt);

    void chunk_progress_update(const std::string& parent_id,
                               const std::string& chunk_id,
                               double progress);

    // ------------------------------------------------------------------
    // Host delivery
    // ------------------------------------------------------------------

    void attach_listener(std::shared_ptr<host_listener> listener);
    void detach_listener();

    [[nodiscard]] auto pop_buffered_resume_tokens() -> std::map<std::string, resume_data_update>;
    [[nodiscard]] auto pop_buffered_status_updates() -> std::map<std::string, status_update>;
    [[nodiscard]] auto pop_buffered_progress_updates()
        -> std::map<std::string, progress_update>;

    /**
     * @brief Make every delivery fail so that updates are buffered (testing)
     */
    void force_fail_delivery(bool fail);

    [[nodiscard]] auto config() const -> const orchestrator_config&;

private:
    struct impl;

    explicit task_orchestrator(std::shared_ptr<impl> impl);

    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_ORCHESTRATOR_TASK_ORCHESTRATOR_H
