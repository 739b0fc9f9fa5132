/**
 * @file update_bridge.cpp
 * @brief Implementation of update delivery and durable buffering
 */

#include <kcenon/background_transfer/bridge/update_bridge.h>
#include <kcenon/background_transfer/core/logging.h>
#include <kcenon/background_transfer/core/task_codec.h>

#include <mutex>
#include <unordered_map>

namespace kcenon::background_transfer {

namespace {

struct progress_state {
    double last_value = 0.0;
    std::chrono::steady_clock::time_point last_time;
};

auto is_sentinel(double progress) -> bool {
    return progress < 0.0 || progress >= progress_sentinel::complete;
}

template <typename Update, typename Decode>
auto decode_all(std::map<std::string, std::string> records, update_kind kind, Decode decode)
    -> std::map<std::string, Update> {
    std::map<std::string, Update> out;
    for (auto& [task_id, payload] : records) {
        auto decoded = decode(payload);
        if (!decoded) {
            BT_LOG_WARN(log_category::bridge,
                        std::string("Dropping undecodable buffered ") + to_string(kind) +
                        " update for " + task_id + ": " + decoded.error().message);
            continue;
        }
        out.emplace(task_id, std::move(decoded.value()));
    }
    return out;
}

}  // namespace

struct update_bridge::impl {
    std::shared_ptr<persistent_store> store;
    update_bridge_config config;

    // Recursive so a listener may re-enter the orchestrator on the same thread
    mutable std::recursive_mutex mutex;
    std::shared_ptr<host_listener> listener;
    bool fail_delivery = false;

    std::unordered_map<std::string, task_status> last_status;
    std::unordered_map<std::string, progress_state> progress;

    impl(std::shared_ptr<persistent_store> s, update_bridge_config cfg)
        : store(std::move(s)), config(cfg) {}

    auto can_push() const -> bool {
        return listener != nullptr && !fail_delivery;
    }

    void buffer(update_kind kind, const std::string& task_id, const std::string& payload) {
        if (!store) {
            BT_LOG_ERROR(log_category::bridge,
                         "No durable store; dropping " + std::string(to_string(kind)) +
                         " update for " + task_id);
            return;
        }
        auto stored = store->put(kind, task_id, payload);
        if (!stored) {
            BT_LOG_ERROR(log_category::bridge,
                         "Failed to buffer update for " + task_id + ": " +
                         stored.error().message);
        }
    }

    auto push_progress(const progress_update& update) -> bool {
        if (can_push() && listener->on_progress_update(update)) {
            return true;
        }
        buffer(update_kind::progress, update.t.task_id, encode_update(update));
        return false;
    }
};

update_bridge::update_bridge(std::shared_ptr<persistent_store> store,
                             update_bridge_config config)
    : impl_(std::make_unique<impl>(std::move(store), config)) {}

update_bridge::~update_bridge() = default;

void update_bridge::attach_listener(std::shared_ptr<host_listener> listener) {
    std::lock_guard lock(impl_->mutex);
    impl_->listener = std::move(listener);
    BT_LOG_DEBUG(log_category::bridge, "Host listener attached");
}

void update_bridge::detach_listener() {
    std::lock_guard lock(impl_->mutex);
    impl_->listener.reset();
    BT_LOG_DEBUG(log_category::bridge, "Host listener detached");
}

auto update_bridge::has_listener() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->listener != nullptr;
}

void update_bridge::force_fail_delivery(bool fail) {
    std::lock_guard lock(impl_->mutex);
    impl_->fail_delivery = fail;
}

auto update_bridge::deliver_status(const status_update& update) -> bool {
    std::lock_guard lock(impl_->mutex);
    const auto& task_id = update.t.task_id;

    auto it = impl_->last_status.find(task_id);
    if (it != impl_->last_status.end()) {
        if (it->second == update.status) {
            BT_LOG_DEBUG(log_category::bridge,
                         "Suppressing repeated " + std::string(to_string(update.status)) +
                         " for " + task_id);
            return false;
        }
        if (!is_valid_transition(it->second, update.status)) {
            task_log_context ctx{task_id};
            ctx.status = to_string(update.status);
            BT_LOG_WARN_CTX(log_category::bridge,
                            std::string("Rejecting transition from ") +
                            to_string(it->second), ctx);
            return false;
        }
    }

    if (is_terminal_status(update.status)) {
        impl_->last_status.erase(task_id);
        impl_->progress.erase(task_id);
    } else {
        impl_->last_status[task_id] = update.status;
        if (update.status == task_status::enqueued) {
            impl_->progress.erase(task_id);
        }
    }

    bool delivered = impl_->can_push() && impl_->listener->on_status_update(update);
    if (!delivered) {
        BT_LOG_DEBUG(log_category::bridge,
                     "Buffering " + std::string(to_string(update.status)) + " for " + task_id);
        impl_->buffer(update_kind::status, task_id, encode_update(update));
    }

    if (auto sentinel = sentinel_progress_for(update.status)) {
        progress_update p;
        p.t = update.t;
        p.progress = *sentinel;
        impl_->push_progress(p);
    }
    return delivered;
}

auto update_bridge::deliver_progress(const progress_update& update) -> bool {
    std::lock_guard lock(impl_->mutex);
    const auto& task_id = update.t.task_id;

    if (!is_sentinel(update.progress)) {
        auto now = std::chrono::steady_clock::now();
        auto it = impl_->progress.find(task_id);
        if (it != impl_->progress.end()) {
            bool grew = update.progress - it->second.last_value >= impl_->config.progress_min_delta;
            bool waited = now - it->second.last_time >= impl_->config.progress_min_interval;
            if (!grew || !waited) {
                return false;
            }
        }
        impl_->progress[task_id] = progress_state{update.progress, now};
    }

    return impl_->push_progress(update);
}

auto update_bridge::deliver_resume_data(const resume_data_update& update) -> bool {
    std::lock_guard lock(impl_->mutex);

    if (impl_->can_push() && impl_->listener->on_resume_data(update)) {
        return true;
    }
    BT_LOG_DEBUG(log_category::bridge, "Buffering resume data for " + update.t.task_id);
    impl_->buffer(update_kind::resume_data, update.t.task_id, encode_update(update));
    return false;
}

auto update_bridge::last_status(const std::string& task_id) const
    -> std::optional<task_status> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->last_status.find(task_id);
    if (it == impl_->last_status.end()) {
        return std::nullopt;
    }
    return it->second;
}

void update_bridge::forget(const std::string& task_id) {
    std::lock_guard lock(impl_->mutex);
    impl_->last_status.erase(task_id);
    impl_->progress.erase(task_id);
}

auto update_bridge::pop_buffered_status_updates() -> std::map<std::string, status_update> {
    if (!impl_->store) return {};
    auto records = impl_->store->take_all(update_kind::status);
    if (!records) {
        BT_LOG_ERROR(log_category::bridge,
                     "Failed to read buffered status updates: " + records.error().message);
        return {};
    }
    return decode_all<status_update>(std::move(records.value()), update_kind::status,
                                     decode_status_update);
}

auto update_bridge::pop_buffered_progress_updates()
    -> std::map<std::string, progress_update> {
    if (!impl_->store) return {};
    auto records = impl_->store->take_all(update_kind::progress);
    if (!records) {
        BT_LOG_ERROR(log_category::bridge,
                     "Failed to read buffered progress updates: " + records.error().message);
        return {};
    }
    return decode_all<progress_update>(std::move(records.value()), update_kind::progress,
                                       decode_progress_update);
}

auto update_bridge::pop_buffered_resume_data() -> std::map<std::string, resume_data_update> {
    if (!impl_->store) return {};
    auto records = impl_->store->take_all(update_kind::resume_data);
    if (!records) {
        BT_LOG_ERROR(log_category::bridge,
                     "Failed to read buffered resume data: " + records.error().message);
        return {};
    }
    return decode_all<resume_data_update>(std::move(records.value()), update_kind::resume_data,
                                          decode_resume_data_update);
}

}  // namespace kcenon::background_transfer
