/**
 * @file network_policy.h
 * @brief Global and per-task "requires unmetered network" policy
 */

#ifndef KCENON_BACKGROUND_TRANSFER_NETWORK_NETWORK_POLICY_H
#define KCENON_BACKGROUND_TRANSFER_NETWORK_NETWORK_POLICY_H

#include <kcenon/background_transfer/core/task.h>
#include <kcenon/background_transfer/core/types.h>
#include <kcenon/background_transfer/storage/persistent_store.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace kcenon::background_transfer {

/**
 * @brief Process-wide unmetered-network policy
 */
enum class network_policy {
    as_set_by_task = 0,  ///< Each task's own requires_unmetered_network flag applies
    for_all_tasks = 1,   ///< Every task waits for an unmetered network
    for_no_tasks = 2     ///< No task waits for an unmetered network
};

[[nodiscard]] constexpr auto to_string(network_policy policy) noexcept -> const char* {
    switch (policy) {
        case network_policy::as_set_by_task: return "as_set_by_task";
        case network_policy::for_all_tasks: return "for_all_tasks";
        case network_policy::for_no_tasks: return "for_no_tasks";
        default: return "unknown";
    }
}

/**
 * @brief Parse the persisted form of a policy
 */
[[nodiscard]] auto parse_network_policy(const std::string& text) -> std::optional<network_policy>;

/**
 * @brief Effective constraint of a task under a policy
 * @param t Task
 * @param override_value Per-task override recorded at enqueue, if any
 * @param policy Global policy
 */
[[nodiscard]] inline auto effective_unmetered(const task& t,
                                              std::optional<bool> override_value,
                                              network_policy policy) noexcept -> bool {
    if (override_value) {
        return *override_value;
    }
    switch (policy) {
        case network_policy::for_all_tasks: return true;
        case network_policy::for_no_tasks: return false;
        default: return t.requires_unmetered_network;
    }
}

/**
 * @brief Holds the global policy and per-task overrides
 *
 * The policy is persisted as a store setting and restored on construction.
 * The effective constraint of a task is computed when it is submitted to
 * the executor, so tasks still waiting for admission follow a policy change
 * without further action. Rescheduling tasks that already run is done by
 * the orchestrator using changed_by().
 *
 * @note Thread-safe.
 */
class network_policy_reconciler {
public:
    explicit network_policy_reconciler(std::shared_ptr<persistent_store> store);

    network_policy_reconciler(const network_policy_reconciler&) = delete;
    auto operator=(const network_policy_reconciler&) -> network_policy_reconciler& = delete;

    [[nodiscard]] auto policy() const -> network_policy;

    /**
     * @brief Replace the global policy and persist it
     * @return state_write_error if the policy could not be saved
     *
     * The in-memory policy changes even when persisting fails.
     */
    auto set_policy(network_policy policy) -> result<void>;

    void record_override(const std::string& task_id, bool requires_unmetered);
    void forget(const std::string& task_id);

    [[nodiscard]] auto override_for(const std::string& task_id) const -> std::optional<bool>;

    /**
     * @brief Effective constraint of a task under the current policy
     */
    [[nodiscard]] auto requires_unmetered(const task& t) const -> bool;

    /**
     * @brief Whether a policy change flips the effective constraint of a task
     *
     * Always false for tasks with an override.
     */
    [[nodiscard]] auto changed_by(const task& t, network_policy from, network_policy to) const
        -> bool;

private:
    static constexpr const char* setting_name = "network_policy";

    std::shared_ptr<persistent_store> store_;
    mutable std::mutex mutex_;
    network_policy policy_ = network_policy::as_set_by_task;
    std::unordered_map<std::string, bool> overrides_;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_NETWORK_NETWORK_POLICY_H
