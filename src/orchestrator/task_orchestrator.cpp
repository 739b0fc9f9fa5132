/**
 * @file task_orchestrator.cpp
 * @brief Implementation of the task orchestrator
 */

#include <kcenon/background_transfer/orchestrator/task_orchestrator.h>
#include <kcenon/background_transfer/core/logging.h>
#include <kcenon/background_transfer/parallel/parallel_download.h>
#include <kcenon/background_transfer/queue/holding_queue.h>
#include <kcenon/background_transfer/storage/persistent_store.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace kcenon::background_transfer {

namespace {

/**
 * @brief Why the orchestrator itself stopped a transfer
 */
enum class stop_intent {
    cancel,
    pause,
    reschedule
};

struct active_transfer {
    enqueue_request request;
    transfer_handle handle = 0;
    std::chrono::steady_clock::time_point started;
    std::optional<stop_intent> intent;
};

auto retry_delay(std::chrono::milliseconds base, const task& t) -> std::chrono::milliseconds {
    int used = std::clamp(t.retries - t.retries_remaining, 0, 16);
    return base * (int64_t{1} << used);
}

auto context_for(const task& t) -> task_log_context {
    task_log_context ctx;
    ctx.task_id = t.task_id;
    ctx.group = t.group;
    ctx.host = host_of(t);
    return ctx;
}

auto make_status(const task& t, task_status status,
                 std::optional<task_exception> exception = std::nullopt) -> status_update {
    status_update update;
    update.t = t;
    update.status = status;
    update.exception = std::move(exception);
    return update;
}

}  // namespace

struct task_orchestrator::impl
    : public chunk_transport,
      public parent_update_sink,
      public std::enable_shared_from_this<task_orchestrator::impl> {
    /**
     * @brief Forwards executor events while the orchestrator is alive
     */
    class executor_events : public executor_listener {
    public:
        explicit executor_events(std::weak_ptr<impl> owner) : owner_(std::move(owner)) {}

        void on_progress(transfer_handle handle, uint64_t bytes, int64_t total_bytes) override {
            if (auto o = owner_.lock()) o->on_executor_progress(handle, bytes, total_bytes);
        }

        void on_status_change(transfer_handle handle,
                              const executor_status_event& event) override {
            if (auto o = owner_.lock()) o->on_executor_status(handle, event);
        }

    private:
        std::weak_ptr<impl> owner_;
    };

    orchestrator_config config;
    std::shared_ptr<transfer_executor> executor;
    std::shared_ptr<notification_service> notifications;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    bool owns_pool = true;
    std::shared_ptr<persistent_store> store;
    update_bridge bridge;
    holding_queue queue;
    network_policy_reconciler reconciler;
    std::unique_ptr<parallel_download_coordinator> coordinator;

    mutable std::mutex mutex;
    std::unordered_set<std::string> tracked;
    std::unordered_map<std::string, active_transfer> active;
    std::unordered_map<transfer_handle, std::string> handles;
    std::unordered_map<std::string, enqueue_request> retrying;
    std::unordered_map<std::string, task> modified;
    std::unordered_map<std::string, notification_config> notification_configs;
    std::unordered_set<std::string> pending_cancel;
    /// Handles that completed while a pause or reschedule was stopping them
    std::unordered_set<transfer_handle> settled_while_stopping;

    std::atomic<bool> holding_enabled{true};
    std::atomic<bool> readmit{false};
    std::atomic<transfer_handle> next_handle{1};
    std::atomic<bool> stopped{false};

    impl(orchestrator_config cfg,
         std::shared_ptr<transfer_executor> exec,
         std::shared_ptr<notification_service> notes,
         std::shared_ptr<adapters::transfer_thread_pool_interface> p,
         std::shared_ptr<persistent_store> s)
        : config(std::move(cfg)),
          executor(std::move(exec)),
          notifications(std::move(notes)),
          pool(std::move(p)),
          store(std::move(s)),
          bridge(store, update_bridge_config{config.progress_min_interval,
                                             config.progress_min_delta}),
          queue(config.holding_queue),
          reconciler(store) {
        parallel_config parallel;
        parallel.chunking = chunk_plan_config{config.default_chunk_count};
        parallel.pause_timeout = config.pause_timeout;
        parallel.cancel_timeout = config.cancel_timeout;
        coordinator = std::make_unique<parallel_download_coordinator>(*this, *this, pool, parallel);
    }

    void start() {
        executor->set_listener(std::make_shared<executor_events>(weak_from_this()));
        BT_LOG_INFO(log_category::orchestrator,
                    "Task orchestrator started, state in " + store->root().string());
    }

    void shutdown() {
        if (stopped.exchange(true)) {
            return;
        }
        executor->set_listener(nullptr);
        if (owns_pool) {
            pool->shutdown();
        }
        BT_LOG_INFO(log_category::orchestrator, "Task orchestrator stopped");
    }

    // ========================================================================
    // Reporting
    // ========================================================================

    /**
     * @brief Route a status to the host, or to the coordinator for chunks
     */
    void report(const status_update& update) {
        const auto& t = update.t;
        if (t.is_chunk()) {
            coordinator->chunk_status_update(t.parent_task_id, t.task_id, update.status,
                                             update.exception, update.response_body);
            return;
        }
        bridge.deliver_status(update);
    }

    auto take_notification(const std::string& task_id) -> std::optional<notification_config> {
        auto it = notification_configs.find(task_id);
        if (it == notification_configs.end()) {
            return std::nullopt;
        }
        auto config_copy = std::move(it->second);
        notification_configs.erase(it);
        return config_copy;
    }

    /**
     * @brief Report a terminal status and forget everything about a task
     */
    void finish(const status_update& update) {
        const auto& id = update.t.task_id;
        std::optional<notification_config> note;
        {
            std::lock_guard lock(mutex);
            tracked.erase(id);
            retrying.erase(id);
            modified.erase(id);
            pending_cancel.erase(id);
            note = take_notification(id);
        }
        reconciler.forget(id);

        report(update);
        if (notifications && note && !update.t.is_chunk()) {
            notifications->on_finished(update.t, update.status, *note);
        }

        queue.task_finished(id);
        admit();
    }

    // ========================================================================
    // Admission
    // ========================================================================

    auto enqueue(enqueue_request request) -> bool {
        const auto& t = request.t;
        auto ctx = context_for(t);

        auto valid = validate_task(t);
        if (!valid) {
            ctx.error_message = valid.error().message;
            BT_LOG_WARN_CTX(log_category::orchestrator, "Rejected invalid task", ctx);
            return false;
        }
        if (t.is_chunk()) {
            BT_LOG_WARN_CTX(log_category::orchestrator, "Chunk tasks cannot be enqueued directly",
                            ctx);
            return false;
        }
        if (request.token && !token_matches(t, *request.token)) {
            ctx.error_message = to_string(error_code::resume_unsupported);
            BT_LOG_WARN_CTX(log_category::orchestrator,
                            "Resume data does not fit the task, starting fresh", ctx);
            request.token.reset();
        }

        {
            std::lock_guard lock(mutex);
            if (!tracked.insert(t.task_id).second) {
                BT_LOG_WARN_CTX(log_category::orchestrator, "Task id already in use", ctx);
                return false;
            }
            if (request.notification) {
                notification_configs[t.task_id] = *request.notification;
            }
            pending_cancel.erase(t.task_id);
        }
        if (request.unmetered_override) {
            reconciler.record_override(t.task_id, *request.unmetered_override);
        }

        BT_LOG_DEBUG_CTX(log_category::orchestrator, "Enqueued", ctx);
        bridge.deliver_status(make_status(t, task_status::enqueued));
        if (notifications && request.notification) {
            notifications->on_enqueued(t, *request.notification);
        }

        admit_request(std::move(request));
        return true;
    }

    void admit_request(enqueue_request request) {
        if (!holding_enabled.load()) {
            start_admitted(request);
            return;
        }
        auto added = queue.add(std::move(request));
        if (!added) {
            BT_LOG_ERROR(log_category::queue, "Holding queue refused a tracked task: " +
                                                  added.error().message);
            return;
        }
        admit();
    }

    void admit() {
        if (stopped.load()) {
            return;
        }
        if (!holding_enabled.load()) {
            for (auto& request : queue.drain()) {
                start_admitted(request);
            }
            return;
        }
        do {
            queue.admit_eligible(
                [this](const enqueue_request& request) { return start_admitted(request); });
        } while (readmit.exchange(false));
    }

    /**
     * @brief Start a task that has been given a slot
     * @return false if it did not start; the slot is then released
     */
    auto start_admitted(const enqueue_request& request) -> bool {
        const auto& t = request.t;
        bool canceled = false;
        {
            std::lock_guard lock(mutex);
            canceled = pending_cancel.erase(t.task_id) > 0;
        }
        if (canceled) {
            finish(make_status(t, task_status::canceled));
            return false;
        }

        if (t.is_parallel_download()) {
            std::optional<composite_resume_token> token;
            if (request.token && is_composite(*request.token)) {
                token = std::get<composite_resume_token>(*request.token);
            }
            auto started = coordinator->start(t, std::move(token));
            if (!started) {
                finish(make_status(t, task_status::failed,
                                   task_exception{exception_type::general,
                                                  started.error().message, -1}));
                return false;
            }
            // The parent holds no slot while its chunks run; they take their own
            queue.task_finished(t.task_id);
            readmit = true;
            return true;
        }
        return submit_to_executor(request);
    }

    auto submit_to_executor(const enqueue_request& request) -> bool {
        const auto& t = request.t;

        transfer_request transfer;
        transfer.handle = next_handle++;
        transfer.t = t;
        transfer.requires_unmetered_network = reconciler.requires_unmetered(t);

        std::optional<simple_resume_token> token;
        if (request.token && !is_composite(*request.token)) {
            token = std::get<simple_resume_token>(*request.token);
        }

        bool canceled = false;
        {
            std::lock_guard lock(mutex);
            canceled = pending_cancel.erase(t.task_id) > 0;
            if (!canceled) {
                active[t.task_id] = active_transfer{request, transfer.handle,
                                                    std::chrono::steady_clock::now(),
                                                    std::nullopt};
                handles[transfer.handle] = t.task_id;
            }
        }
        if (canceled) {
            finish(make_status(t, task_status::canceled));
            return false;
        }

        auto submitted = executor->submit(transfer, token);
        if (submitted) {
            return true;
        }

        bool still_active = false;
        {
            std::lock_guard lock(mutex);
            auto it = active.find(t.task_id);
            if (it != active.end() && it->second.handle == transfer.handle) {
                active.erase(it);
                still_active = true;
            }
            handles.erase(transfer.handle);
        }

        auto ctx = context_for(t);
        ctx.error_message = submitted.error().message;
        BT_LOG_ERROR_CTX(log_category::executor, "Executor refused transfer", ctx);
        if (still_active) {
            finish(make_status(t, task_status::failed,
                               task_exception{exception_type::general,
                                              "executor refused transfer: " +
                                                  submitted.error().message,
                                              -1}));
        }
        return false;
    }

    // ========================================================================
    // Executor events
    // ========================================================================

    void on_executor_status(transfer_handle handle, const executor_status_event& event) {
        const bool stops = is_terminal_status(event.status) || event.status == task_status::paused;
        std::optional<active_transfer> entry;
        {
            std::lock_guard lock(mutex);
            auto h = handles.find(handle);
            if (h == handles.end()) {
                BT_LOG_DEBUG(log_category::executor,
                             std::string("Dropped ") + to_string(event.status) +
                                 " for unknown handle " + std::to_string(handle));
                return;
            }
            auto a = active.find(h->second);
            if (a == active.end()) {
                handles.erase(h);
                return;
            }

            if (event.status == task_status::running && event.suggested_filename &&
                *event.suggested_filename != a->second.request.t.filename) {
                auto renamed = a->second.request.t.copy_with_filename(*event.suggested_filename);
                a->second.request.t = renamed;
                if (!renamed.is_chunk()) {
                    modified[renamed.task_id] = renamed;
                }
            }

            if (stops) {
                if (event.status == task_status::complete && a->second.intent &&
                    *a->second.intent != stop_intent::cancel) {
                    settled_while_stopping.insert(handle);
                }
                entry = std::move(a->second);
                active.erase(a);
                handles.erase(h);
            } else {
                entry = a->second;
            }
        }

        const task& t = entry->request.t;
        if (!stops) {
            auto update = make_status(t, event.status, event.exception);
            report(update);
            return;
        }

        if (entry->intent && event.status == task_status::complete) {
            auto ctx = context_for(t);
            BT_LOG_DEBUG_CTX(log_category::executor, "Transfer completed before it stopped", ctx);
            auto update = make_status(t, event.status, event.exception);
            update.response_body = event.response_body;
            update.response_status_code = event.response_status_code;
            finish(update);
            return;
        }
        if (entry->intent == stop_intent::pause || entry->intent == stop_intent::reschedule) {
            auto ctx = context_for(t);
            ctx.status = to_string(event.status);
            BT_LOG_DEBUG_CTX(log_category::executor, "Transfer stopped on request", ctx);
            return;
        }
        if (entry->intent == stop_intent::cancel) {
            finish(make_status(t, task_status::canceled));
            return;
        }

        switch (event.status) {
            case task_status::failed:
                handle_failure(*entry, event);
                break;
            case task_status::paused:
                if (t.is_chunk()) {
                    // Chunks are only paused through their parent
                    executor_status_event failed = event;
                    failed.status = task_status::failed;
                    failed.exception = task_exception{exception_type::connection,
                                                      "chunk paused by executor", -1};
                    handle_failure(*entry, failed);
                } else {
                    finish_paused(t, std::nullopt);
                }
                break;
            default: {
                auto update = make_status(t, event.status, event.exception);
                update.response_body = event.response_body;
                update.response_status_code = event.response_status_code;
                finish(update);
                break;
            }
        }
    }

    void handle_failure(const active_transfer& entry, const executor_status_event& event) {
        const task& t = entry.request.t;
        bool retryable = !event.exception || event.exception->is_retryable();

        if (t.retries_remaining > 0 && retryable) {
            auto delay = retry_delay(config.retry_base_delay, t);
            enqueue_request retry = entry.request;
            retry.t = t.copy_with_retries_remaining(t.retries_remaining - 1);
            retry.token.reset();
            {
                std::lock_guard lock(mutex);
                retrying[t.task_id] = retry;
                if (modified.count(t.task_id) != 0) {
                    modified[t.task_id] = retry.t;
                }
            }

            auto ctx = context_for(t);
            if (event.exception) ctx.error_message = event.exception->description;
            BT_LOG_INFO_CTX(log_category::orchestrator,
                            "Retrying in " + std::to_string(delay.count()) + " ms, " +
                                std::to_string(retry.t.retries_remaining) + " retries left",
                            ctx);

            report(make_status(retry.t, task_status::waiting_to_retry, event.exception));
            queue.task_finished(t.task_id);
            admit();

            std::weak_ptr<impl> weak = weak_from_this();
            auto id = t.task_id;
            pool->submit_delayed(
                [weak, id]() {
                    if (auto s = weak.lock()) s->resume_retry(id);
                },
                delay);
            return;
        }

        auto update = make_status(
            t, task_status::failed,
            event.exception.value_or(task_exception{exception_type::general, "transfer failed", -1}));
        update.response_body = event.response_body;
        update.response_status_code = event.response_status_code;
        finish(update);
    }

    void resume_retry(const std::string& task_id) {
        std::optional<enqueue_request> request;
        {
            std::lock_guard lock(mutex);
            auto it = retrying.find(task_id);
            if (it == retrying.end()) {
                return;
            }
            request = std::move(it->second);
            retrying.erase(it);
        }
        report(make_status(request->t, task_status::enqueued));
        admit_request(std::move(*request));
    }

    void on_executor_progress(transfer_handle handle, uint64_t bytes, int64_t total_bytes) {
        std::optional<task> t;
        std::chrono::steady_clock::time_point started;
        {
            std::lock_guard lock(mutex);
            auto h = handles.find(handle);
            if (h == handles.end()) return;
            auto a = active.find(h->second);
            if (a == active.end() || a->second.intent) return;
            t = a->second.request.t;
            started = a->second.started;
        }
        if (total_bytes <= 0) {
            return;
        }

        double fraction = std::min(static_cast<double>(bytes) / static_cast<double>(total_bytes),
                                   0.999);
        if (t->is_chunk()) {
            coordinator->chunk_progress_update(t->parent_task_id, t->task_id, fraction);
            return;
        }

        progress_update update;
        update.t = *t;
        update.progress = fraction;
        update.expected_file_size = total_bytes;
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
        if (elapsed.count() > 0.0 && bytes > 0) {
            update.network_speed = static_cast<double>(bytes) / elapsed.count();
            auto remaining = static_cast<double>(total_bytes) - static_cast<double>(bytes);
            update.time_remaining_ms =
                static_cast<int64_t>(std::max(0.0, remaining) / update.network_speed * 1000.0);
        }
        bridge.deliver_progress(update);
    }

    // ========================================================================
    // Cancel
    // ========================================================================

    auto cancel_tasks(const std::vector<std::string>& task_ids) -> bool {
        bool any = false;
        for (auto& request : queue.cancel(task_ids)) {
            any = true;
            finish(make_status(request.t, task_status::canceled));
        }
        for (const auto& id : task_ids) {
            if (cancel_one(id)) any = true;
        }
        return any;
    }

    /**
     * @brief Cancel a task that is not waiting in the holding queue
     */
    auto cancel_one(const std::string& task_id) -> bool {
        std::optional<enqueue_request> retry;
        std::optional<transfer_handle> handle;
        bool unplaced = false;
        {
            std::lock_guard lock(mutex);
            auto r = retrying.find(task_id);
            auto a = active.find(task_id);
            if (r != retrying.end()) {
                retry = std::move(r->second);
                retrying.erase(r);
            } else if (a != active.end()) {
                if (a->second.intent == stop_intent::cancel) {
                    return true;
                }
                if (a->second.intent) {
                    // A pause or reschedule is stopping it; turn that into a cancel
                    pending_cancel.insert(task_id);
                    return true;
                }
                a->second.intent = stop_intent::cancel;
                handle = a->second.handle;
            } else {
                unplaced = tracked.count(task_id) != 0;
            }
        }

        if (retry) {
            finish(make_status(retry->t, task_status::canceled));
            return true;
        }
        if (handle) {
            executor->cancel(*handle, false);
            schedule_cancel_timeout(task_id, *handle);
            return true;
        }
        if (coordinator->cancel(task_id)) {
            return true;
        }
        if (unplaced) {
            // Admitted but not yet started, or between pause and re-admission
            std::lock_guard lock(mutex);
            pending_cancel.insert(task_id);
            return true;
        }
        return false;
    }

    void schedule_cancel_timeout(const std::string& task_id, transfer_handle handle) {
        std::weak_ptr<impl> weak = weak_from_this();
        pool->submit_delayed(
            [weak, task_id, handle]() {
                auto self = weak.lock();
                if (!self) return;
                std::optional<task> t;
                {
                    std::lock_guard lock(self->mutex);
                    auto a = self->active.find(task_id);
                    if (a == self->active.end() || a->second.handle != handle) return;
                    t = a->second.request.t;
                    self->active.erase(a);
                    self->handles.erase(handle);
                }
                auto ctx = context_for(*t);
                BT_LOG_WARN_CTX(log_category::executor,
                                "Executor did not confirm cancel, assuming canceled", ctx);
                self->finish(make_status(*t, task_status::canceled));
            },
            config.cancel_timeout);
    }

    auto reset(const std::string& group) -> std::size_t {
        std::size_t count = 0;
        for (auto& request : queue.cancel_group(group)) {
            finish(make_status(request.t, task_status::canceled));
            if (!request.t.is_chunk()) ++count;
        }

        std::vector<std::string> ids;
        {
            std::lock_guard lock(mutex);
            for (const auto& [id, request] : retrying) {
                if (!request.t.is_chunk() && request.t.group == group) ids.push_back(id);
            }
            for (const auto& [id, entry] : active) {
                if (!entry.request.t.is_chunk() && entry.request.t.group == group) {
                    ids.push_back(id);
                }
            }
        }
        for (const auto& parent : coordinator->active_parents()) {
            if (parent.group == group) ids.push_back(parent.task_id);
        }

        for (const auto& id : ids) {
            if (cancel_one(id)) ++count;
        }
        BT_LOG_INFO(log_category::orchestrator,
                    "Reset group " + group + ": " + std::to_string(count) + " tasks canceled");
        return count;
    }

    // ========================================================================
    // Pause
    // ========================================================================

    auto pause(const std::string& task_id) -> bool {
        if (coordinator->is_active(task_id)) {
            std::weak_ptr<impl> weak = weak_from_this();
            return coordinator->pause(
                task_id, [weak](const task& parent, std::optional<composite_resume_token> token) {
                    auto self = weak.lock();
                    if (!self || !token) return;
                    self->finish_paused(parent, resume_token{std::move(*token)});
                });
        }

        std::optional<active_transfer> entry;
        {
            std::lock_guard lock(mutex);
            auto a = active.find(task_id);
            if (a == active.end() || a->second.intent || !a->second.request.t.supports_resume()) {
                return false;
            }
            a->second.intent = stop_intent::pause;
            entry = a->second;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::weak_ptr<impl> weak = weak_from_this();
        pool->submit([weak, pausing = *entry, done]() {
            auto self = weak.lock();
            if (!self) return;
            auto token = self->executor->cancel(pausing.handle, true);
            if (done->exchange(true)) {
                auto ctx = context_for(pausing.request.t);
                BT_LOG_DEBUG_CTX(log_category::executor, "Resume data arrived after timeout", ctx);
                return;
            }
            self->complete_pause(pausing, std::move(token));
        });
        pool->submit_delayed(
            [weak, pausing = *entry, done]() {
                auto self = weak.lock();
                if (!self || done->exchange(true)) return;
                auto ctx = context_for(pausing.request.t);
                BT_LOG_WARN_CTX(log_category::executor, "Pause timed out without resume data",
                                ctx);
                self->complete_pause(pausing, std::nullopt);
            },
            config.pause_timeout);
        return true;
    }

    void complete_pause(const active_transfer& entry, std::optional<simple_resume_token> token) {
        const auto& id = entry.request.t.task_id;
        task current = entry.request.t;
        {
            std::lock_guard lock(mutex);
            if (settled_while_stopping.erase(entry.handle) > 0) {
                return;
            }
            auto a = active.find(id);
            if (a != active.end() && a->second.handle == entry.handle) {
                current = a->second.request.t;
                active.erase(a);
            }
            handles.erase(entry.handle);
        }

        if (!token) {
            finish(make_status(current, task_status::failed,
                               task_exception{exception_type::resume,
                                              "executor produced no resume data", -1}));
            return;
        }
        finish_paused(current, resume_token{std::move(*token)});
    }

    /**
     * @brief Report a paused task and release it
     *
     * A cancel that arrived while pausing wins over the pause.
     */
    void finish_paused(const task& t, std::optional<resume_token> token) {
        std::optional<notification_config> note;
        bool cancel_requested = false;
        {
            std::lock_guard lock(mutex);
            cancel_requested = pending_cancel.erase(t.task_id) > 0;
            if (!cancel_requested) {
                tracked.erase(t.task_id);
                modified.erase(t.task_id);
                note = take_notification(t.task_id);
            }
        }
        if (cancel_requested) {
            finish(make_status(t, task_status::canceled));
            return;
        }
        reconciler.forget(t.task_id);

        auto ctx = context_for(t);
        BT_LOG_INFO_CTX(log_category::orchestrator, "Paused", ctx);
        if (token) {
            bridge.deliver_resume_data(resume_data_update{t, std::move(*token)});
        }
        bridge.deliver_status(make_status(t, task_status::paused));
        if (notifications && note) {
            notifications->on_paused(t, *note);
        }

        queue.task_finished(t.task_id);
        admit();
    }

    // ========================================================================
    // Network policy
    // ========================================================================

    auto set_network_policy(network_policy policy, bool reschedule_running) -> bool {
        auto previous = reconciler.policy();
        auto saved = reconciler.set_policy(policy);

        std::size_t reclassified = 0;
        queue.for_each_waiting([&](const enqueue_request& request) {
            if (reconciler.changed_by(request.t, previous, policy)) ++reclassified;
        });
        BT_LOG_INFO(log_category::network,
                    std::to_string(reclassified) + " waiting tasks follow the new policy");

        if (reschedule_running && previous != policy) {
            std::vector<std::string> ids;
            {
                std::lock_guard lock(mutex);
                for (const auto& [id, entry] : active) {
                    if (!entry.request.t.is_chunk() && !entry.intent &&
                        reconciler.changed_by(entry.request.t, previous, policy)) {
                        ids.push_back(id);
                    }
                }
            }
            for (const auto& parent : coordinator->active_parents()) {
                if (reconciler.changed_by(parent, previous, policy)) ids.push_back(parent.task_id);
            }

            BT_LOG_INFO(log_category::network,
                        "Rescheduling " + std::to_string(ids.size()) + " running tasks");
            std::weak_ptr<impl> weak = weak_from_this();
            for (const auto& id : ids) {
                pool->submit_to_stage(
                    [weak, id]() {
                        if (auto s = weak.lock()) s->reschedule(id);
                    },
                    "reschedule");
            }
        }
        return saved.has_value();
    }

    /**
     * @brief Stop a running task and admit it again under the current policy
     */
    void reschedule(const std::string& task_id) {
        if (coordinator->is_active(task_id)) {
            std::weak_ptr<impl> weak = weak_from_this();
            coordinator->pause(
                task_id, [weak](const task& parent, std::optional<composite_resume_token> token) {
                    auto self = weak.lock();
                    if (!self || !token) return;
                    self->readmit_rescheduled(parent, resume_token{std::move(*token)});
                });
            return;
        }

        std::optional<active_transfer> entry;
        {
            std::lock_guard lock(mutex);
            auto a = active.find(task_id);
            if (a == active.end() || a->second.intent) return;
            a->second.intent = stop_intent::reschedule;
            entry = a->second;
        }

        auto token = executor->cancel(entry->handle, entry->request.t.supports_resume());
        task current = entry->request.t;
        {
            std::lock_guard lock(mutex);
            if (settled_while_stopping.erase(entry->handle) > 0) {
                return;
            }
            auto a = active.find(task_id);
            if (a != active.end() && a->second.handle == entry->handle) {
                current = a->second.request.t;
                active.erase(a);
            }
            handles.erase(entry->handle);
        }
        queue.task_finished(task_id);

        std::optional<resume_token> resume;
        if (token) resume = resume_token{std::move(*token)};
        readmit_rescheduled(current, std::move(resume));
    }

    void readmit_rescheduled(const task& t, std::optional<resume_token> token) {
        enqueue_request request;
        request.t = t;
        request.token = std::move(token);
        request.unmetered_override = reconciler.override_for(t.task_id);
        bool cancel_requested = false;
        {
            std::lock_guard lock(mutex);
            cancel_requested = pending_cancel.erase(t.task_id) > 0;
            auto n = notification_configs.find(t.task_id);
            if (n != notification_configs.end()) request.notification = n->second;
        }
        if (cancel_requested) {
            finish(make_status(t, task_status::canceled));
            return;
        }

        auto ctx = context_for(t);
        BT_LOG_DEBUG_CTX(log_category::network, "Re-admitting under new policy", ctx);
        bridge.forget(t.task_id);
        bridge.deliver_status(make_status(t, task_status::enqueued));
        admit_request(std::move(request));
    }

    // ========================================================================
    // Queries
    // ========================================================================

    auto task_for_id(const std::string& task_id) const -> std::optional<task> {
        {
            std::lock_guard lock(mutex);
            if (auto m = modified.find(task_id); m != modified.end()) return m->second;
            if (auto a = active.find(task_id); a != active.end()) {
                if (a->second.request.t.is_chunk()) return std::nullopt;
                return a->second.request.t;
            }
            if (auto r = retrying.find(task_id); r != retrying.end()) {
                if (r->second.t.is_chunk()) return std::nullopt;
                return r->second.t;
            }
        }
        if (auto waiting = queue.task_for_id(task_id)) {
            if (waiting->is_chunk()) return std::nullopt;
            return waiting;
        }
        return coordinator->parent_task(task_id);
    }

    auto all_tasks(const std::optional<std::string>& group) const -> std::vector<task> {
        std::vector<task> result;
        std::unordered_set<std::string> seen;
        auto add = [&](const task& t) {
            if (t.is_chunk() || (group && t.group != *group)) return;
            if (seen.insert(t.task_id).second) result.push_back(t);
        };

        {
            std::lock_guard lock(mutex);
            for (const auto& [id, entry] : active) {
                auto m = modified.find(id);
                add(m != modified.end() ? m->second : entry.request.t);
            }
            for (const auto& [id, request] : retrying) add(request.t);
        }
        for (const auto& t : queue.all_tasks(group)) add(t);
        for (const auto& t : coordinator->active_parents()) add(t);
        return result;
    }

    // ========================================================================
    // chunk_transport
    // ========================================================================

    auto enqueue_chunk(const task& chunk,
                       const std::optional<simple_resume_token>& token) -> bool override {
        {
            std::lock_guard lock(mutex);
            if (!tracked.insert(chunk.task_id).second) {
                return false;
            }
            pending_cancel.erase(chunk.task_id);
        }
        if (auto parent_override = reconciler.override_for(chunk.parent_task_id)) {
            reconciler.record_override(chunk.task_id, *parent_override);
        }

        enqueue_request request;
        request.t = chunk;
        if (token) request.token = resume_token{*token};
        admit_request(std::move(request));
        return true;
    }

    void cancel_chunk(const task& chunk) override {
        auto removed = queue.cancel({chunk.task_id});
        for (auto& request : removed) {
            finish(make_status(request.t, task_status::canceled));
        }
        if (removed.empty()) {
            cancel_one(chunk.task_id);
        }
    }

    auto pause_chunk(const task& chunk) -> std::optional<simple_resume_token> override {
        const auto& id = chunk.task_id;
        auto release = [this, &id]() {
            {
                std::lock_guard lock(mutex);
                tracked.erase(id);
                pending_cancel.erase(id);
            }
            reconciler.forget(id);
        };

        if (!queue.cancel({id}).empty()) {
            release();
            return std::nullopt;
        }

        std::optional<transfer_handle> handle;
        {
            std::lock_guard lock(mutex);
            if (retrying.erase(id) == 0) {
                auto a = active.find(id);
                if (a == active.end()) {
                    // Admitted but not yet submitted; submission drops it and frees the slot
                    if (tracked.count(id) != 0) pending_cancel.insert(id);
                    return std::nullopt;
                }
                if (a->second.intent) return std::nullopt;
                a->second.intent = stop_intent::pause;
                handle = a->second.handle;
            }
        }
        if (!handle) {
            release();
            return std::nullopt;
        }

        auto token = executor->cancel(*handle, true);
        {
            std::lock_guard lock(mutex);
            if (settled_while_stopping.erase(*handle) > 0) {
                return std::nullopt;
            }
            auto a = active.find(id);
            if (a != active.end() && a->second.handle == *handle) active.erase(a);
            handles.erase(*handle);
        }
        release();
        queue.task_finished(id);
        admit();
        return token;
    }

    auto probe(const task& parent) -> result<content_metadata> override {
        auto metadata = executor->probe(parent);
        if (!metadata) {
            return unexpected(error{error_code::probe_failed, metadata.error().message});
        }
        return metadata;
    }

    // ========================================================================
    // parent_update_sink
    // ========================================================================

    void on_parent_status(const status_update& update) override {
        if (is_terminal_status(update.status)) {
            finish(update);
            return;
        }
        bridge.deliver_status(update);
    }

    void on_parent_progress(const progress_update& update) override {
        bridge.deliver_progress(update);
    }
};

// ============================================================================
// builder
// ============================================================================

task_orchestrator::builder::builder() = default;

auto task_orchestrator::builder::with_executor(std::shared_ptr<transfer_executor> executor)
    -> builder& {
    executor_ = std::move(executor);
    return *this;
}

auto task_orchestrator::builder::with_notification_service(
    std::shared_ptr<notification_service> service) -> builder& {
    notifications_ = std::move(service);
    return *this;
}

auto task_orchestrator::builder::with_thread_pool(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto task_orchestrator::builder::with_state_directory(std::filesystem::path dir) -> builder& {
    config_.state_directory = std::move(dir);
    return *this;
}

auto task_orchestrator::builder::with_progress_coalescing(std::chrono::milliseconds min_interval,
                                                          double min_delta) -> builder& {
    config_.progress_min_interval = min_interval;
    config_.progress_min_delta = min_delta;
    return *this;
}

auto task_orchestrator::builder::with_pause_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.pause_timeout = timeout;
    return *this;
}

auto task_orchestrator::builder::with_cancel_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.cancel_timeout = timeout;
    return *this;
}

auto task_orchestrator::builder::with_retry_base_delay(std::chrono::milliseconds delay)
    -> builder& {
    config_.retry_base_delay = delay;
    return *this;
}

auto task_orchestrator::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto task_orchestrator::builder::with_default_chunk_count(int count) -> builder& {
    config_.default_chunk_count = count;
    return *this;
}

auto task_orchestrator::builder::with_holding_queue(const holding_queue_config& config)
    -> builder& {
    config_.holding_queue = config;
    return *this;
}

auto task_orchestrator::builder::build() -> result<task_orchestrator> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }
    if (!executor_) {
        return unexpected(error{error_code::invalid_configuration,
                                "a transfer executor is required"});
    }

    get_logger().initialize();

    if (config_.state_directory.empty()) {
        std::error_code ec;
        auto temp = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return unexpected(error{error_code::state_write_error,
                                    "no state directory given and no temp directory: " +
                                        ec.message()});
        }
        config_.state_directory = temp / "background_transfer";
    }

    auto store = std::make_shared<persistent_store>(config_.state_directory);
    auto initialized = store->initialize();
    if (!initialized) {
        return unexpected(initialized.error());
    }

    auto pool = pool_ ? pool_
                      : adapters::transfer_pool_factory::create(config_.worker_count,
                                                                "background_transfer_pool");

    auto state = std::make_shared<impl>(config_, executor_, notifications_, pool, store);
    state->owns_pool = !pool_;
    state->start();
    return task_orchestrator{state};
}

// ============================================================================
// task_orchestrator
// ============================================================================

task_orchestrator::task_orchestrator(std::shared_ptr<impl> impl) : impl_(std::move(impl)) {}

task_orchestrator::task_orchestrator(task_orchestrator&&) noexcept = default;
auto task_orchestrator::operator=(task_orchestrator&& other) noexcept -> task_orchestrator& {
    if (this != &other) {
        if (impl_) impl_->shutdown();
        impl_ = std::move(other.impl_);
    }
    return *this;
}

task_orchestrator::~task_orchestrator() {
    if (impl_) {
        impl_->shutdown();
    }
}

auto task_orchestrator::enqueue(const task& t,
                                std::optional<notification_config> notification,
                                std::optional<resume_token> token) -> bool {
    enqueue_request request;
    request.t = t;
    request.notification = std::move(notification);
    request.token = std::move(token);
    return impl_->enqueue(std::move(request));
}

auto task_orchestrator::enqueue(enqueue_request request) -> bool {
    return impl_->enqueue(std::move(request));
}

auto task_orchestrator::enqueue_all(std::vector<task> tasks,
                                    std::vector<std::optional<notification_config>> notifications)
    -> std::future<std::vector<bool>> {
    auto promise = std::make_shared<std::promise<std::vector<bool>>>();
    auto future = promise->get_future();
    std::weak_ptr<impl> weak = impl_;

    impl_->pool->submit_to_stage(
        [weak, promise, tasks = std::move(tasks), notifications = std::move(notifications)]() {
            std::vector<bool> results;
            results.reserve(tasks.size());
            auto self = weak.lock();
            for (std::size_t i = 0; i < tasks.size(); ++i) {
                enqueue_request request;
                request.t = tasks[i];
                if (i < notifications.size()) request.notification = notifications[i];
                results.push_back(self && self->enqueue(std::move(request)));
            }
            promise->set_value(std::move(results));
        },
        "batch");
    return future;
}

auto task_orchestrator::cancel_tasks_with_ids(const std::vector<std::string>& task_ids) -> bool {
    return impl_->cancel_tasks(task_ids);
}

auto task_orchestrator::reset(const std::string& group) -> std::size_t {
    return impl_->reset(group);
}

auto task_orchestrator::pause(const std::string& task_id) -> bool {
    return impl_->pause(task_id);
}

auto task_orchestrator::pause_all(std::vector<std::string> task_ids)
    -> std::future<std::vector<bool>> {
    auto promise = std::make_shared<std::promise<std::vector<bool>>>();
    auto future = promise->get_future();
    std::weak_ptr<impl> weak = impl_;

    impl_->pool->submit_to_stage(
        [weak, promise, task_ids = std::move(task_ids)]() {
            std::vector<bool> results;
            results.reserve(task_ids.size());
            auto self = weak.lock();
            for (const auto& id : task_ids) {
                results.push_back(self && self->pause(id));
            }
            promise->set_value(std::move(results));
        },
        "batch");
    return future;
}

auto task_orchestrator::task_for_id(const std::string& task_id) const -> std::optional<task> {
    return impl_->task_for_id(task_id);
}

auto task_orchestrator::all_tasks(const std::optional<std::string>& group) const
    -> std::vector<task> {
    return impl_->all_tasks(group);
}

auto task_orchestrator::set_network_policy(network_policy policy, bool reschedule_running)
    -> bool {
    return impl_->set_network_policy(policy, reschedule_running);
}

auto task_orchestrator::get_network_policy() const -> network_policy {
    return impl_->reconciler.policy();
}

auto task_orchestrator::configure_holding_queue(int max_concurrent,
                                                int max_concurrent_by_host,
                                                int max_concurrent_by_group) -> result<void> {
    return configure_holding_queue(
        holding_queue_config{max_concurrent, max_concurrent_by_host, max_concurrent_by_group});
}

auto task_orchestrator::configure_holding_queue(const holding_queue_config& config)
    -> result<void> {
    auto configured = impl_->queue.configure(config);
    if (!configured) {
        return configured;
    }
    impl_->holding_enabled = true;
    impl_->admit();
    return {};
}

void task_orchestrator::disable_holding_queue() {
    impl_->holding_enabled = false;
    BT_LOG_INFO(log_category::queue, "Holding queue disabled");
    impl_->admit();
}

void task_orchestrator::chunk_status_update(const std::string& parent_id,
                                            const std::string& chunk_id,
                                            task_status status,
                                            std::optional<task_exception> exception,
                                            std::optional<std::string> response_body) {
    impl_->coordinator->chunk_status_update(parent_id, chunk_id, status, std::move(exception),
                                            std::move(response_body));
}

void task_orchestrator::chunk_progress_update(const std::string& parent_id,
                                              const std::string& chunk_id,
                                              double progress) {
    impl_->coordinator->chunk_progress_update(parent_id, chunk_id, progress);
}

void task_orchestrator::attach_listener(std::shared_ptr<host_listener> listener) {
    impl_->bridge.attach_listener(std::move(listener));
}

void task_orchestrator::detach_listener() {
    impl_->bridge.detach_listener();
}

auto task_orchestrator::pop_buffered_resume_tokens() -> std::map<std::string, resume_data_update> {
    return impl_->bridge.pop_buffered_resume_data();
}

auto task_orchestrator::pop_buffered_status_updates() -> std::map<std::string, status_update> {
    return impl_->bridge.pop_buffered_status_updates();
}

auto task_orchestrator::pop_buffered_progress_updates()
    -> std::map<std::string, progress_update> {
    return impl_->bridge.pop_buffered_progress_updates();
}

void task_orchestrator::force_fail_delivery(bool fail) {
    impl_->bridge.force_fail_delivery(fail);
}

auto task_orchestrator::config() const -> const orchestrator_config& {
    return impl_->config;
}

}  // namespace kcenon::background_transfer
