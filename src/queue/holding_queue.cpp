/**
 * @file holding_queue.cpp
 * @brief Implementation of the admission-controlled holding queue
 */

#include <kcenon/background_transfer/queue/holding_queue.h>
#include <kcenon/background_transfer/core/logging.h>

#include <algorithm>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace kcenon::background_transfer {

namespace {

struct waiting_entry {
    enqueue_request request;
    std::string host;
    uint64_t sequence = 0;
};

struct slot {
    std::string host;
    std::string group;
};

auto entry_before(const waiting_entry& a, const waiting_entry& b) -> bool {
    if (a.request.t.priority != b.request.t.priority) {
        return a.request.t.priority < b.request.t.priority;
    }
    return a.sequence < b.sequence;
}

}  // namespace

struct holding_queue::impl {
    mutable std::mutex mutex;
    holding_queue_config config;
    std::vector<waiting_entry> waiting;
    uint64_t next_sequence = 0;

    std::unordered_map<std::string, slot> admitted;
    std::unordered_map<std::string, std::size_t> by_host;
    std::unordered_map<std::string, std::size_t> by_group;

    explicit impl(holding_queue_config cfg) : config(cfg) {}

    auto fits(const std::string& host, const std::string& group) const -> bool {
        if (config.max_concurrent > 0 &&
            admitted.size() >= static_cast<std::size_t>(config.max_concurrent)) {
            return false;
        }
        if (config.max_concurrent_by_host > 0) {
            auto it = by_host.find(host);
            if (it != by_host.end() &&
                it->second >= static_cast<std::size_t>(config.max_concurrent_by_host)) {
                return false;
            }
        }
        if (config.max_concurrent_by_group > 0) {
            auto it = by_group.find(group);
            if (it != by_group.end() &&
                it->second >= static_cast<std::size_t>(config.max_concurrent_by_group)) {
                return false;
            }
        }
        return true;
    }

    void take_slot(const std::string& task_id, const std::string& host,
                   const std::string& group) {
        admitted[task_id] = slot{host, group};
        ++by_host[host];
        ++by_group[group];
    }

    auto release_slot(const std::string& task_id) -> bool {
        auto it = admitted.find(task_id);
        if (it == admitted.end()) {
            return false;
        }
        auto release = [](std::unordered_map<std::string, std::size_t>& counts,
                          const std::string& key) {
            auto c = counts.find(key);
            if (c != counts.end() && --c->second == 0) {
                counts.erase(c);
            }
        };
        release(by_host, it->second.host);
        release(by_group, it->second.group);
        admitted.erase(it);
        return true;
    }

    template <typename Pred>
    auto remove_waiting_if(Pred pred) -> std::vector<enqueue_request> {
        std::vector<enqueue_request> removed;
        auto it = std::stable_partition(waiting.begin(), waiting.end(),
                                        [&](const waiting_entry& e) { return !pred(e); });
        for (auto r = it; r != waiting.end(); ++r) {
            removed.push_back(std::move(r->request));
        }
        waiting.erase(it, waiting.end());
        return removed;
    }
};

holding_queue::holding_queue(holding_queue_config config)
    : impl_(std::make_unique<impl>(config)) {}

holding_queue::~holding_queue() = default;

auto holding_queue::configure(const holding_queue_config& config) -> result<void> {
    auto valid = config.validate();
    if (!valid) {
        BT_LOG_WARN(log_category::queue,
                    "Rejected holding queue configuration: " + valid.error().message);
        return valid;
    }

    std::lock_guard lock(impl_->mutex);
    impl_->config = config;
    BT_LOG_INFO(log_category::queue,
                "Holding queue ceilings: global=" + std::to_string(config.max_concurrent) +
                " host=" + std::to_string(config.max_concurrent_by_host) +
                " group=" + std::to_string(config.max_concurrent_by_group));
    return {};
}

auto holding_queue::config() const -> holding_queue_config {
    std::lock_guard lock(impl_->mutex);
    return impl_->config;
}

auto holding_queue::add(enqueue_request request) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    const auto& id = request.t.task_id;

    if (impl_->admitted.count(id) > 0 ||
        std::any_of(impl_->waiting.begin(), impl_->waiting.end(),
                    [&](const waiting_entry& e) { return e.request.t.task_id == id; })) {
        return unexpected(error{error_code::duplicate_task, "task already queued: " + id});
    }

    waiting_entry entry;
    entry.host = host_of(request.t);
    entry.sequence = impl_->next_sequence++;
    entry.request = std::move(request);

    auto pos = std::upper_bound(impl_->waiting.begin(), impl_->waiting.end(), entry,
                                entry_before);
    impl_->waiting.insert(pos, std::move(entry));
    return {};
}

auto holding_queue::admit_eligible(const submitter& submit) -> std::size_t {
    std::vector<enqueue_request> chosen;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->waiting.begin();
        while (it != impl_->waiting.end()) {
            if (impl_->fits(it->host, it->request.t.group)) {
                impl_->take_slot(it->request.t.task_id, it->host, it->request.t.group);
                chosen.push_back(std::move(it->request));
                it = impl_->waiting.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::size_t submitted = 0;
    for (const auto& request : chosen) {
        BT_LOG_DEBUG(log_category::queue, "Admitting " + request.t.task_id);
        if (submit(request)) {
            ++submitted;
        } else {
            BT_LOG_WARN(log_category::queue,
                        "Submission failed after admission: " + request.t.task_id);
            task_finished(request.t.task_id);
        }
    }
    return submitted;
}

auto holding_queue::task_finished(const std::string& task_id) -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->release_slot(task_id);
}

auto holding_queue::cancel(const std::vector<std::string>& task_ids)
    -> std::vector<enqueue_request> {
    std::unordered_set<std::string> ids(task_ids.begin(), task_ids.end());
    std::lock_guard lock(impl_->mutex);
    return impl_->remove_waiting_if(
        [&](const waiting_entry& e) { return ids.count(e.request.t.task_id) > 0; });
}

auto holding_queue::cancel_group(const std::string& group) -> std::vector<enqueue_request> {
    std::lock_guard lock(impl_->mutex);
    return impl_->remove_waiting_if(
        [&](const waiting_entry& e) { return e.request.t.group == group; });
}

auto holding_queue::drain() -> std::vector<enqueue_request> {
    std::lock_guard lock(impl_->mutex);
    return impl_->remove_waiting_if([](const waiting_entry&) { return true; });
}

auto holding_queue::task_for_id(const std::string& task_id) const -> std::optional<task> {
    std::lock_guard lock(impl_->mutex);
    for (const auto& e : impl_->waiting) {
        if (e.request.t.task_id == task_id) {
            return e.request.t;
        }
    }
    return std::nullopt;
}

auto holding_queue::all_tasks(const std::optional<std::string>& group) const
    -> std::vector<task> {
    std::lock_guard lock(impl_->mutex);
    std::vector<task> tasks;
    for (const auto& e : impl_->waiting) {
        if (!group || e.request.t.group == *group) {
            tasks.push_back(e.request.t);
        }
    }
    return tasks;
}

void holding_queue::for_each_waiting(
    const std::function<void(const enqueue_request&)>& fn) const {
    std::lock_guard lock(impl_->mutex);
    for (const auto& e : impl_->waiting) {
        fn(e.request);
    }
}

auto holding_queue::is_waiting(const std::string& task_id) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return std::any_of(impl_->waiting.begin(), impl_->waiting.end(),
                       [&](const waiting_entry& e) { return e.request.t.task_id == task_id; });
}

auto holding_queue::is_admitted(const std::string& task_id) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->admitted.count(task_id) > 0;
}

auto holding_queue::waiting_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->waiting.size();
}

auto holding_queue::running_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->admitted.size();
}

auto holding_queue::running_for_host(const std::string& host) const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->by_host.find(host);
    return it == impl_->by_host.end() ? 0 : it->second;
}

auto holding_queue::running_for_group(const std::string& group) const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->by_group.find(group);
    return it == impl_->by_group.end() ? 0 : it->second;
}

}  // namespace kcenon::background_transfer
