/**
 * @file network_policy.cpp
 * @brief Implementation of the network policy reconciler
 */

#include <kcenon/background_transfer/network/network_policy.h>
#include <kcenon/background_transfer/core/logging.h>

namespace kcenon::background_transfer {

auto parse_network_policy(const std::string& text) -> std::optional<network_policy> {
    if (text == "as_set_by_task" || text == "0") return network_policy::as_set_by_task;
    if (text == "for_all_tasks" || text == "1") return network_policy::for_all_tasks;
    if (text == "for_no_tasks" || text == "2") return network_policy::for_no_tasks;
    return std::nullopt;
}

network_policy_reconciler::network_policy_reconciler(std::shared_ptr<persistent_store> store)
    : store_(std::move(store)) {
    if (!store_) {
        return;
    }
    auto saved = store_->load_setting(setting_name);
    if (!saved) {
        BT_LOG_WARN(log_category::network,
                    "Could not read saved network policy: " + saved.error().message);
        return;
    }
    if (!saved.value()) {
        return;
    }
    auto parsed = parse_network_policy(*saved.value());
    if (!parsed) {
        BT_LOG_WARN(log_category::network,
                    "Ignoring unknown saved network policy '" + *saved.value() + "'");
        return;
    }
    policy_ = *parsed;
    BT_LOG_DEBUG(log_category::network,
                 std::string("Restored network policy ") + to_string(policy_));
}

auto network_policy_reconciler::policy() const -> network_policy {
    std::lock_guard lock(mutex_);
    return policy_;
}

auto network_policy_reconciler::set_policy(network_policy policy) -> result<void> {
    network_policy previous;
    {
        std::lock_guard lock(mutex_);
        previous = policy_;
        policy_ = policy;
    }

    BT_LOG_INFO(log_category::network, std::string("Network policy ") + to_string(previous) +
                                           " -> " + to_string(policy));

    if (store_) {
        auto saved = store_->save_setting(setting_name, to_string(policy));
        if (!saved) {
            BT_LOG_ERROR(log_category::network,
                         "Could not persist network policy: " + saved.error().message);
            return saved;
        }
    }
    return {};
}

void network_policy_reconciler::record_override(const std::string& task_id,
                                                bool requires_unmetered) {
    std::lock_guard lock(mutex_);
    overrides_[task_id] = requires_unmetered;
}

void network_policy_reconciler::forget(const std::string& task_id) {
    std::lock_guard lock(mutex_);
    overrides_.erase(task_id);
}

auto network_policy_reconciler::override_for(const std::string& task_id) const
    -> std::optional<bool> {
    std::lock_guard lock(mutex_);
    auto it = overrides_.find(task_id);
    if (it == overrides_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto network_policy_reconciler::requires_unmetered(const task& t) const -> bool {
    std::lock_guard lock(mutex_);
    auto it = overrides_.find(t.task_id);
    std::optional<bool> override_value;
    if (it != overrides_.end()) override_value = it->second;
    return effective_unmetered(t, override_value, policy_);
}

auto network_policy_reconciler::changed_by(const task& t,
                                           network_policy from,
                                           network_policy to) const -> bool {
    auto override_value = override_for(t.task_id);
    if (override_value) {
        return false;
    }
    return effective_unmetered(t, std::nullopt, from) != effective_unmetered(t, std::nullopt, to);
}

}  // namespace kcenon::background_transfer
