/**
 * @file holding_queue.h
 * @brief Admission control with global, per-host and per-group ceilings
 */

#ifndef KCENON_BACKGROUND_TRANSFER_QUEUE_HOLDING_QUEUE_H
#define KCENON_BACKGROUND_TRANSFER_QUEUE_HOLDING_QUEUE_H

#include <kcenon/background_transfer/core/enqueue_request.h>
#include <kcenon/background_transfer/core/types.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::background_transfer {

/**
 * @brief Concurrency ceilings; 0 disables a ceiling
 */
struct holding_queue_config {
    int max_concurrent = 0;
    int max_concurrent_by_host = 0;
    int max_concurrent_by_group = 0;

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_concurrent < 0 || max_concurrent_by_host < 0 || max_concurrent_by_group < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "concurrency ceilings must not be negative"});
        }
        return {};
    }
};

/**
 * @brief Defers task start until every configured ceiling has room
 *
 * Waiting entries are ordered by priority (lower first), then by arrival.
 * admit_eligible() scans the whole list each time so that a slot freed on
 * one host admits a task for that host even when it sits behind tasks for
 * a saturated host.
 *
 * Admission decisions, including the slot accounting, are made under the
 * queue lock; submissions happen after the lock is released. Two
 * concurrent admit_eligible() calls can therefore never admit past a
 * ceiling.
 *
 * @code
 * holding_queue queue;
 * queue.configure({2, 1, 0});
 * queue.add(request);
 * queue.admit_eligible([&](const enqueue_request& r) { return start(r); });
 * ...
 * queue.task_finished(task_id);
 * queue.admit_eligible(...);
 * @endcode
 */
class holding_queue {
public:
    /// Starts an admitted request; returns false if it could not be started
    using submitter = std::function<bool(const enqueue_request&)>;

    explicit holding_queue(holding_queue_config config = {});
    ~holding_queue();

    holding_queue(const holding_queue&) = delete;
    auto operator=(const holding_queue&) -> holding_queue& = delete;

    /**
     * @brief Replace the ceilings
     * @return invalid_configuration for negative values
     */
    [[nodiscard]] auto configure(const holding_queue_config& config) -> result<void>;

    [[nodiscard]] auto config() const -> holding_queue_config;

    /**
     * @brief Append a request to the waiting list
     * @return duplicate_task if the id is already waiting or admitted
     */
    [[nodiscard]] auto add(enqueue_request request) -> result<void>;

    /**
     * @brief Admit and submit every waiting request that fits the ceilings
     * @return Number of requests submitted successfully
     */
    auto admit_eligible(const submitter& submit) -> std::size_t;

    /**
     * @brief Release the slot held by an admitted task
     * @return true if the task held a slot
     */
    auto task_finished(const std::string& task_id) -> bool;

    /**
     * @brief Remove waiting requests by id; admitted tasks are not touched
     * @return The removed requests
     */
    auto cancel(const std::vector<std::string>& task_ids) -> std::vector<enqueue_request>;

    /**
     * @brief Remove every waiting request of a group
     */
    auto cancel_group(const std::string& group) -> std::vector<enqueue_request>;

    /**
     * @brief Remove and return every waiting request
     */
    auto drain() -> std::vector<enqueue_request>;

    [[nodiscard]] auto task_for_id(const std::string& task_id) const -> std::optional<task>;

    /**
     * @brief Snapshot of waiting tasks, optionally limited to a group
     */
    [[nodiscard]] auto all_tasks(const std::optional<std::string>& group = std::nullopt) const
        -> std::vector<task>;

    /**
     * @brief Visit every waiting request in admission order under the lock
     */
    void for_each_waiting(const std::function<void(const enqueue_request&)>& fn) const;

    [[nodiscard]] auto is_waiting(const std::string& task_id) const -> bool;
    [[nodiscard]] auto is_admitted(const std::string& task_id) const -> bool;
    [[nodiscard]] auto waiting_count() const -> std::size_t;
    [[nodiscard]] auto running_count() const -> std::size_t;
    [[nodiscard]] auto running_for_host(const std::string& host) const -> std::size_t;
    [[nodiscard]] auto running_for_group(const std::string& group) const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_QUEUE_HOLDING_QUEUE_H
