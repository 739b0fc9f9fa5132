/**
 * @file parallel_download.cpp
 * @brief Implementation of the parallel download coordinator
 */

#include <kcenon/background_transfer/parallel/parallel_download.h>
#include <kcenon/background_transfer/core/logging.h>

#include <algorithm>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace kcenon::background_transfer {

namespace {

enum class parent_phase {
    probing,
    running,
    pausing,
    canceling
};

struct chunk_state {
    task chunk;
    std::string url;
    task_status status = task_status::enqueued;
    /// Bytes of the range finished by earlier runs; the current request starts after them
    uint64_t base_bytes = 0;
    /// Fraction of the current request
    double progress = 0.0;
    std::optional<std::string> body;
    std::optional<task_exception> exception;

    bool awaiting_pause = false;
    bool pause_reported = false;
    std::optional<simple_resume_token> pause_token;

    [[nodiscard]] auto range_size() const -> std::optional<uint64_t> {
        if (!chunk.byte_range_end) return std::nullopt;
        return *chunk.byte_range_end - chunk.byte_range_start + 1;
    }

    [[nodiscard]] auto is_live() const -> bool { return !is_terminal_status(status); }

    [[nodiscard]] auto bytes_done() const -> uint64_t {
        auto size = range_size();
        if (!size) {
            return base_bytes;
        }
        if (status == task_status::complete) {
            return *size;
        }
        auto remaining = *size > base_bytes ? *size - base_bytes : 0;
        return base_bytes + static_cast<uint64_t>(progress * static_cast<double>(remaining));
    }
};

struct parent_state {
    task parent;
    uint64_t generation = 0;
    parent_phase phase = parent_phase::probing;
    std::optional<uint64_t> total_size;
    std::vector<chunk_state> chunks;
    double last_progress = 0.0;
    pause_callback on_paused;

    auto find_chunk(const std::string& chunk_id) -> chunk_state* {
        for (auto& c : chunks) {
            if (c.chunk.task_id == chunk_id) return &c;
        }
        return nullptr;
    }

    [[nodiscard]] auto progress() const -> double {
        bool sized = total_size.has_value() && *total_size > 0;
        for (const auto& c : chunks) {
            if (!c.range_size()) sized = false;
        }
        if (chunks.empty()) {
            return 0.0;
        }
        if (sized) {
            uint64_t done = 0;
            for (const auto& c : chunks) done += c.bytes_done();
            return static_cast<double>(done) / static_cast<double>(*total_size);
        }
        double sum = 0.0;
        for (const auto& c : chunks) {
            sum += c.status == task_status::complete ? 1.0 : c.progress;
        }
        return sum / static_cast<double>(chunks.size());
    }
};

struct chunk_launch {
    task chunk;
    std::optional<simple_resume_token> token;
};

/**
 * @brief Outcome of folding chunk statuses into one parent status
 */
struct aggregate_result {
    std::optional<task_status> status;
    std::optional<task_exception> exception;
};

auto aggregate(const parent_state& p) -> aggregate_result {
    bool any_live = false;
    bool all_complete = true;
    const chunk_state* canceled = nullptr;

    for (const auto& c : p.chunks) {
        if (c.status == task_status::failed || c.status == task_status::not_found) {
            task_exception ex = c.exception.value_or(task_exception{
                exception_type::general, "chunk " + c.chunk.task_id + " failed", -1});
            return {c.status, ex};
        }
        if (c.status == task_status::canceled && !canceled) {
            canceled = &c;
        }
        if (c.is_live()) any_live = true;
        if (c.status != task_status::complete) all_complete = false;
    }

    if (canceled) {
        return {task_status::canceled, std::nullopt};
    }
    if (any_live) {
        return {task_status::running, std::nullopt};
    }
    if (all_complete) {
        return {task_status::complete, std::nullopt};
    }
    return {};
}

auto log_context(const task& parent, const std::string& chunk_id = {}) -> task_log_context {
    task_log_context ctx;
    ctx.task_id = parent.task_id;
    ctx.group = parent.group;
    if (!chunk_id.empty()) ctx.chunk_id = chunk_id;
    return ctx;
}

}  // namespace

struct parallel_download_coordinator::impl
    : public std::enable_shared_from_this<parallel_download_coordinator::impl> {
    chunk_transport& transport;
    parent_update_sink& sink;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    parallel_config config;

    mutable std::mutex mutex;
    std::unordered_map<std::string, parent_state> parents;
    std::unordered_map<std::string, std::string> chunk_parent;
    uint64_t next_generation = 1;

    std::mutex channel_mutex;
    std::deque<std::function<void()>> events;
    bool draining = false;
    bool stopped = false;

    impl(chunk_transport& t, parent_update_sink& s,
         std::shared_ptr<adapters::transfer_thread_pool_interface> p, parallel_config cfg)
        : transport(t), sink(s), pool(std::move(p)), config(cfg) {}

    // ========================================================================
    // Event channel
    // ========================================================================

    void post(std::function<void()> event) {
        {
            std::lock_guard lock(channel_mutex);
            if (stopped) {
                return;
            }
            events.push_back(std::move(event));
            if (draining) {
                return;
            }
            draining = true;
        }

        for (;;) {
            std::function<void()> next;
            {
                std::lock_guard lock(channel_mutex);
                if (events.empty() || stopped) {
                    events.clear();
                    draining = false;
                    return;
                }
                next = std::move(events.front());
                events.pop_front();
            }
            next();
        }
    }

    void stop() {
        std::lock_guard lock(channel_mutex);
        stopped = true;
        events.clear();
    }

    auto find_parent(const std::string& id, uint64_t generation) -> parent_state* {
        auto it = parents.find(id);
        if (it == parents.end() || it->second.generation != generation) {
            return nullptr;
        }
        return &it->second;
    }

    /**
     * @brief Remove a parent and return the chunks that are still live
     */
    auto remove_parent(const std::string& id) -> std::vector<task> {
        std::vector<task> live;
        auto it = parents.find(id);
        if (it == parents.end()) {
            return live;
        }
        for (const auto& c : it->second.chunks) {
            chunk_parent.erase(c.chunk.task_id);
            if (c.is_live()) live.push_back(c.chunk);
        }
        parents.erase(it);
        return live;
    }

    // ========================================================================
    // Starting
    // ========================================================================

    void on_start(const std::string& id, uint64_t generation,
                  std::optional<composite_resume_token> token) {
        std::optional<task> parent;
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p) return;
            parent = p->parent;
        }

        sink.on_parent_status(status_update{*parent, task_status::running, std::nullopt,
                                            std::nullopt, std::nullopt});

        if (token) {
            plan_from_token(id, generation, std::move(*token));
            return;
        }

        std::weak_ptr<impl> weak = shared_from_this();
        pool->submit_to_stage(
            [weak, id, generation, parent = *parent]() {
                auto self = weak.lock();
                if (!self) return;
                auto metadata = self->transport.probe(parent);
                self->post([weak, id, generation, metadata]() {
                    if (auto s = weak.lock()) s->on_probed(id, generation, metadata);
                });
            },
            "probe");
    }

    void on_probed(const std::string& id, uint64_t generation,
                   const result<content_metadata>& metadata) {
        std::vector<chunk_launch> launches;
        {
            std::unique_lock lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p || p->phase != parent_phase::probing) {
                return;
            }

            if (!metadata) {
                auto ctx = log_context(p->parent);
                ctx.error_message = metadata.error().message;
                BT_LOG_WARN_CTX(log_category::parallel, "Content probe failed", ctx);
                auto parent = p->parent;
                remove_parent(id);
                lock.unlock();
                sink.on_parent_status(status_update{
                    parent, task_status::failed,
                    task_exception{exception_type::connection,
                                   "content probe failed: " + metadata.error().message, -1},
                    std::nullopt, std::nullopt});
                return;
            }

            const auto& meta = metadata.value();
            auto ranges = plan_ranges(meta.content_length, meta.accepts_ranges,
                                      planned_chunk_count(p->parent, config.chunking));
            auto urls = source_urls(p->parent);

            p->total_size = meta.content_length;
            for (std::size_t i = 0; i < ranges.size(); ++i) {
                chunk_state c;
                c.url = urls[i % urls.size()];
                c.chunk = make_chunk_task(p->parent, chunk_task_id(id, i), c.url, ranges[i]);
                chunk_parent[c.chunk.task_id] = id;
                launches.push_back(chunk_launch{c.chunk, std::nullopt});
                p->chunks.push_back(std::move(c));
            }
            p->phase = parent_phase::running;

            auto ctx = log_context(p->parent);
            ctx.bytes = meta.content_length;
            BT_LOG_INFO_CTX(log_category::parallel,
                            "Split into " + std::to_string(ranges.size()) + " chunks", ctx);
        }

        launch(id, generation, std::move(launches));
    }

    void plan_from_token(const std::string& id, uint64_t generation,
                         composite_resume_token token) {
        std::vector<chunk_launch> launches;
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p) return;

            auto urls = source_urls(p->parent);
            p->total_size = token.total_size;

            for (std::size_t i = 0; i < token.chunks.size(); ++i) {
                auto& entry = token.chunks[i];
                chunk_state c;
                c.url = entry.url.empty() ? urls[i % urls.size()] : entry.url;
                auto chunk_id =
                    entry.chunk_task_id.empty() ? chunk_task_id(id, i) : entry.chunk_task_id;
                byte_range full{entry.range_start, entry.range_end};

                if (entry.is_complete()) {
                    c.chunk = make_chunk_task(p->parent, chunk_id, c.url, full);
                    c.status = task_status::complete;
                    c.progress = 1.0;
                } else if (entry.child_token) {
                    // The token continues the request it was issued for, not the full range
                    auto request_start = entry.child_range_start.value_or(entry.range_start);
                    c.base_bytes = request_start - entry.range_start;
                    c.chunk = make_chunk_task(p->parent, chunk_id, c.url,
                                              byte_range{request_start, entry.range_end});
                    c.chunk.byte_range_start = entry.range_start;
                    auto size = entry.range_size();
                    if (size && *size > c.base_bytes && entry.bytes_transferred > c.base_bytes) {
                        c.progress = std::min(
                            1.0, static_cast<double>(entry.bytes_transferred - c.base_bytes) /
                                     static_cast<double>(*size - c.base_bytes));
                    }
                    launches.push_back(chunk_launch{c.chunk, entry.child_token});
                } else {
                    // Open-ended ranges cannot be continued without the executor's token
                    c.base_bytes = entry.range_end ? entry.bytes_transferred : 0;
                    c.chunk = make_chunk_task(p->parent, chunk_id, c.url,
                                              byte_range{entry.range_start + c.base_bytes,
                                                         entry.range_end});
                    c.chunk.byte_range_start = entry.range_start;
                    launches.push_back(chunk_launch{c.chunk, std::nullopt});
                }
                chunk_parent[chunk_id] = id;
                p->chunks.push_back(std::move(c));
            }
            p->phase = parent_phase::running;
            p->last_progress = p->progress();

            auto ctx = log_context(p->parent);
            ctx.bytes = token.bytes_transferred();
            BT_LOG_INFO_CTX(log_category::parallel,
                            "Resuming " + std::to_string(launches.size()) + " of " +
                                std::to_string(token.chunks.size()) + " chunks",
                            ctx);
        }

        if (launches.empty()) {
            evaluate(id, generation);
            return;
        }
        launch(id, generation, std::move(launches));
    }

    void launch(const std::string& id, uint64_t generation, std::vector<chunk_launch> launches) {
        for (auto& l : launches) {
            {
                std::lock_guard lock(mutex);
                auto* p = find_parent(id, generation);
                if (!p || p->phase != parent_phase::running) {
                    return;
                }
            }
            if (!transport.enqueue_chunk(l.chunk, l.token)) {
                apply_chunk_status(id, l.chunk.task_id, task_status::failed,
                                   task_exception{exception_type::general,
                                                  "chunk " + l.chunk.task_id +
                                                      " could not be enqueued",
                                                  -1},
                                   std::nullopt);
            }
        }
    }

    // ========================================================================
    // Chunk events
    // ========================================================================

    void apply_chunk_status(const std::string& id, const std::string& chunk_id,
                            task_status status, std::optional<task_exception> exception,
                            std::optional<std::string> body) {
        uint64_t generation = 0;
        {
            std::lock_guard lock(mutex);
            auto it = parents.find(id);
            chunk_state* c = it == parents.end() ? nullptr : it->second.find_chunk(chunk_id);
            if (!c) {
                task_log_context ctx;
                ctx.task_id = id;
                ctx.chunk_id = chunk_id;
                ctx.status = to_string(status);
                BT_LOG_DEBUG_CTX(log_category::parallel, "Dropped orphan chunk status", ctx);
                return;
            }
            if (c->status == status) {
                return;
            }
            if (!is_valid_transition(c->status, status)) {
                auto ctx = log_context(it->second.parent, chunk_id);
                ctx.status = to_string(status);
                BT_LOG_DEBUG_CTX(log_category::parallel,
                                 std::string("Ignored chunk transition from ") +
                                     to_string(c->status),
                                 ctx);
                return;
            }

            c->status = status;
            if (exception) c->exception = std::move(exception);
            if (body) c->body = std::move(body);
            if (status == task_status::complete) {
                c->progress = 1.0;
            } else if (status == task_status::waiting_to_retry ||
                       status == task_status::enqueued) {
                c->progress = 0.0;
            }
            generation = it->second.generation;
        }
        evaluate(id, generation);
    }

    void apply_chunk_progress(const std::string& id, const std::string& chunk_id,
                              double progress) {
        std::optional<progress_update> update;
        {
            std::lock_guard lock(mutex);
            auto it = parents.find(id);
            chunk_state* c = it == parents.end() ? nullptr : it->second.find_chunk(chunk_id);
            if (!c) {
                BT_LOG_TRACE(log_category::parallel,
                             "Dropped orphan chunk progress for " + chunk_id);
                return;
            }
            if (!c->is_live() || it->second.phase != parent_phase::running) {
                return;
            }
            c->progress = std::clamp(progress, 0.0, 1.0);
            update = progress_step(it->second);
        }
        if (update) {
            sink.on_parent_progress(*update);
        }
    }

    /**
     * @brief Next progress report for a parent, if it moved enough
     */
    auto progress_step(parent_state& p) -> std::optional<progress_update> {
        double value = p.progress();
        if (value >= 1.0 || value < p.last_progress + config.min_progress_step) {
            return std::nullopt;
        }
        p.last_progress = value;
        progress_update update;
        update.t = p.parent;
        update.progress = value;
        update.expected_file_size = p.total_size ? static_cast<int64_t>(*p.total_size) : -1;
        return update;
    }

    /**
     * @brief Re-derive the parent status after a chunk changed
     *
     * Only emits when the derived status differs from running, which the
     * parent reported when it started.
     */
    void evaluate(const std::string& id, uint64_t generation) {
        status_update update;
        std::vector<task> to_cancel;
        std::optional<progress_update> progress;
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p) return;

            if (p->phase == parent_phase::pausing) {
                return;
            }
            if (p->phase == parent_phase::canceling) {
                bool all_terminal = std::none_of(p->chunks.begin(), p->chunks.end(),
                                                 [](const chunk_state& c) { return c.is_live(); });
                if (!all_terminal) return;
                update = status_update{p->parent, task_status::canceled, std::nullopt,
                                       std::nullopt, std::nullopt};
                remove_parent(id);
            } else {
                auto derived = aggregate(*p);
                if (!derived.status || *derived.status == task_status::running) {
                    progress = progress_step(*p);
                } else {
                    update = status_update{p->parent, *derived.status, derived.exception,
                                           std::nullopt, std::nullopt};
                    if (*derived.status == task_status::complete) {
                        update.response_body = concatenated_body(*p);
                    }
                    auto ctx = log_context(p->parent);
                    ctx.status = to_string(*derived.status);
                    if (derived.exception) ctx.error_message = derived.exception->description;
                    BT_LOG_INFO_CTX(log_category::parallel, "Parallel download finished", ctx);
                    to_cancel = remove_parent(id);
                }
            }
        }

        if (progress) {
            sink.on_parent_progress(*progress);
            return;
        }
        if (update.t.task_id.empty()) {
            return;
        }
        sink.on_parent_status(update);
        for (const auto& chunk : to_cancel) {
            transport.cancel_chunk(chunk);
        }
    }

    static auto concatenated_body(const parent_state& p) -> std::optional<std::string> {
        std::optional<std::string> body;
        for (const auto& c : p.chunks) {
            if (!c.body) continue;
            if (!body) body.emplace();
            body->append(*c.body);
        }
        return body;
    }

    // ========================================================================
    // Cancel
    // ========================================================================

    void on_cancel(const std::string& id, uint64_t generation) {
        std::vector<task> live;
        task parent;
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p || p->phase == parent_phase::canceling) return;
            p->phase = parent_phase::canceling;
            p->on_paused = nullptr;
            parent = p->parent;
            for (const auto& c : p->chunks) {
                if (c.is_live()) live.push_back(c.chunk);
            }
            auto ctx = log_context(parent);
            BT_LOG_DEBUG_CTX(log_category::parallel,
                             "Canceling " + std::to_string(live.size()) + " live chunks", ctx);
        }

        if (live.empty()) {
            {
                std::lock_guard lock(mutex);
                remove_parent(id);
            }
            sink.on_parent_status(status_update{parent, task_status::canceled, std::nullopt,
                                                std::nullopt, std::nullopt});
            return;
        }

        std::weak_ptr<impl> weak = shared_from_this();
        pool->submit_delayed(
            [weak, id, generation]() {
                if (auto s = weak.lock()) {
                    s->post([weak, id, generation]() {
                        if (auto s2 = weak.lock()) s2->on_cancel_timeout(id, generation);
                    });
                }
            },
            config.cancel_timeout);

        for (const auto& chunk : live) {
            transport.cancel_chunk(chunk);
        }
    }

    void on_cancel_timeout(const std::string& id, uint64_t generation) {
        task parent;
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p || p->phase != parent_phase::canceling) return;
            parent = p->parent;
            auto ctx = log_context(parent);
            BT_LOG_WARN_CTX(log_category::parallel,
                            "Chunks did not confirm cancellation in time", ctx);
            remove_parent(id);
        }
        sink.on_parent_status(status_update{parent, task_status::canceled, std::nullopt,
                                            std::nullopt, std::nullopt});
    }

    // ========================================================================
    // Pause
    // ========================================================================

    void on_pause(const std::string& id, uint64_t generation, pause_callback callback) {
        std::vector<task> live;
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p || p->phase != parent_phase::running) return;
            p->phase = parent_phase::pausing;
            p->on_paused = std::move(callback);
            for (auto& c : p->chunks) {
                if (c.is_live()) {
                    c.awaiting_pause = true;
                    live.push_back(c.chunk);
                }
            }
            auto ctx = log_context(p->parent);
            BT_LOG_DEBUG_CTX(log_category::parallel,
                             "Pausing " + std::to_string(live.size()) + " live chunks", ctx);
        }

        if (live.empty()) {
            finalize_pause(id, generation);
            return;
        }

        std::weak_ptr<impl> weak = shared_from_this();
        for (const auto& chunk : live) {
            pool->submit_to_stage(
                [weak, id, generation, chunk]() {
                    auto self = weak.lock();
                    if (!self) return;
                    auto token = self->transport.pause_chunk(chunk);
                    self->post([weak, id, generation, chunk_id = chunk.task_id, token]() {
                        if (auto s = weak.lock()) {
                            s->on_pause_outcome(id, generation, chunk_id, token);
                        }
                    });
                },
                "chunk_pause");
        }
        pool->submit_delayed(
            [weak, id, generation]() {
                if (auto s = weak.lock()) {
                    s->post([weak, id, generation]() {
                        if (auto s2 = weak.lock()) s2->on_pause_timeout(id, generation);
                    });
                }
            },
            config.pause_timeout);
    }

    void on_pause_outcome(const std::string& id, uint64_t generation,
                          const std::string& chunk_id,
                          std::optional<simple_resume_token> token) {
        bool all_reported = false;
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p || p->phase != parent_phase::pausing) return;
            auto* c = p->find_chunk(chunk_id);
            if (!c) return;
            c->pause_reported = true;
            c->pause_token = std::move(token);
            all_reported = std::none_of(
                p->chunks.begin(), p->chunks.end(),
                [](const chunk_state& s) { return s.awaiting_pause && !s.pause_reported; });
        }
        if (all_reported) {
            finalize_pause(id, generation);
        }
    }

    void on_pause_timeout(const std::string& id, uint64_t generation) {
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p || p->phase != parent_phase::pausing) return;
            auto ctx = log_context(p->parent);
            BT_LOG_WARN_CTX(log_category::parallel,
                            "Pause timed out; unreported chunks will restart", ctx);
        }
        finalize_pause(id, generation);
    }

    void finalize_pause(const std::string& id, uint64_t generation) {
        task parent;
        pause_callback callback;
        std::optional<composite_resume_token> token;
        bool completed = false;
        {
            std::lock_guard lock(mutex);
            auto* p = find_parent(id, generation);
            if (!p || p->phase != parent_phase::pausing) return;
            parent = p->parent;
            callback = std::move(p->on_paused);

            completed = std::all_of(p->chunks.begin(), p->chunks.end(), [](const chunk_state& c) {
                return c.status == task_status::complete;
            });

            if (!completed) {
                composite_resume_token composite;
                composite.total_size = p->total_size;
                for (const auto& c : p->chunks) {
                    chunk_resume_entry entry;
                    entry.chunk_task_id = c.chunk.task_id;
                    entry.url = c.url;
                    entry.range_start = c.chunk.byte_range_start;
                    entry.range_end = c.chunk.byte_range_end;

                    auto size = c.range_size();
                    if (c.status == task_status::complete) {
                        entry.bytes_transferred = size.value_or(0);
                    } else if (c.awaiting_pause && !c.pause_reported) {
                        entry.bytes_transferred = 0;
                    } else if (c.pause_token) {
                        entry.child_token = c.pause_token;
                        if (c.base_bytes > 0) {
                            entry.child_range_start = c.chunk.byte_range_start + c.base_bytes;
                        }
                        entry.bytes_transferred = c.pause_token->bytes_transferred > 0
                                                      ? c.base_bytes +
                                                            c.pause_token->bytes_transferred
                                                      : c.bytes_done();
                    } else {
                        entry.bytes_transferred = c.bytes_done();
                    }
                    if (size && entry.bytes_transferred > *size) {
                        entry.bytes_transferred = *size;
                    }
                    composite.chunks.push_back(std::move(entry));
                }
                token = std::move(composite);

                auto ctx = log_context(parent);
                ctx.bytes = token->bytes_transferred();
                BT_LOG_INFO_CTX(log_category::parallel, "Collected composite resume token",
                                ctx);
            }
            remove_parent(id);
        }

        if (completed) {
            sink.on_parent_status(status_update{parent, task_status::complete, std::nullopt,
                                                std::nullopt, std::nullopt});
            if (callback) callback(parent, std::nullopt);
            return;
        }
        if (callback) {
            callback(parent, std::move(token));
        }
    }
};

parallel_download_coordinator::parallel_download_coordinator(
    chunk_transport& transport,
    parent_update_sink& sink,
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
    parallel_config config)
    : impl_(std::make_shared<impl>(transport, sink, std::move(pool), config)) {}

parallel_download_coordinator::~parallel_download_coordinator() {
    impl_->stop();
}

auto parallel_download_coordinator::start(const task& parent,
                                          std::optional<composite_resume_token> token)
    -> result<void> {
    if (!parent.is_parallel_download()) {
        return unexpected(error{error_code::invalid_request,
                                "task " + parent.task_id + " is not a parallel download"});
    }
    if (token && token->chunks.empty()) {
        return unexpected(error{error_code::resume_state_invalid,
                                "composite resume token has no chunks"});
    }

    uint64_t generation = 0;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->parents.count(parent.task_id) != 0) {
            return unexpected(error{error_code::duplicate_task,
                                    "parallel download " + parent.task_id + " already active"});
        }
        generation = impl_->next_generation++;
        parent_state state;
        state.parent = parent;
        state.generation = generation;
        impl_->parents.emplace(parent.task_id, std::move(state));
    }

    std::weak_ptr<impl> weak = impl_;
    auto id = parent.task_id;
    impl_->post([weak, id, generation, token = std::move(token)]() mutable {
        if (auto s = weak.lock()) s->on_start(id, generation, std::move(token));
    });
    return {};
}

auto parallel_download_coordinator::pause(const std::string& parent_id,
                                          pause_callback on_paused) -> bool {
    uint64_t generation = 0;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->parents.find(parent_id);
        if (it == impl_->parents.end() || it->second.phase != parent_phase::running ||
            !it->second.parent.allow_pause) {
            return false;
        }
        generation = it->second.generation;
    }

    std::weak_ptr<impl> weak = impl_;
    impl_->post([weak, parent_id, generation, cb = std::move(on_paused)]() mutable {
        if (auto s = weak.lock()) s->on_pause(parent_id, generation, std::move(cb));
    });
    return true;
}

auto parallel_download_coordinator::cancel(const std::string& parent_id) -> bool {
    uint64_t generation = 0;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->parents.find(parent_id);
        if (it == impl_->parents.end()) {
            return false;
        }
        if (it->second.phase == parent_phase::canceling) {
            return true;
        }
        generation = it->second.generation;
    }

    std::weak_ptr<impl> weak = impl_;
    impl_->post([weak, parent_id, generation]() {
        if (auto s = weak.lock()) s->on_cancel(parent_id, generation);
    });
    return true;
}

void parallel_download_coordinator::chunk_status_update(
    const std::string& parent_id,
    const std::string& chunk_id,
    task_status status,
    std::optional<task_exception> exception,
    std::optional<std::string> response_body) {
    std::weak_ptr<impl> weak = impl_;
    impl_->post([weak, parent_id, chunk_id, status, exception = std::move(exception),
                 body = std::move(response_body)]() mutable {
        if (auto s = weak.lock()) {
            s->apply_chunk_status(parent_id, chunk_id, status, std::move(exception),
                                  std::move(body));
        }
    });
}

void parallel_download_coordinator::chunk_progress_update(const std::string& parent_id,
                                                          const std::string& chunk_id,
                                                          double progress) {
    std::weak_ptr<impl> weak = impl_;
    impl_->post([weak, parent_id, chunk_id, progress]() {
        if (auto s = weak.lock()) s->apply_chunk_progress(parent_id, chunk_id, progress);
    });
}

auto parallel_download_coordinator::is_active(const std::string& parent_id) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->parents.count(parent_id) != 0;
}

auto parallel_download_coordinator::parent_task(const std::string& parent_id) const
    -> std::optional<task> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->parents.find(parent_id);
    if (it == impl_->parents.end()) {
        return std::nullopt;
    }
    return it->second.parent;
}

auto parallel_download_coordinator::active_parents() const -> std::vector<task> {
    std::lock_guard lock(impl_->mutex);
    std::vector<task> result;
    result.reserve(impl_->parents.size());
    for (const auto& [id, state] : impl_->parents) {
        result.push_back(state.parent);
    }
    return result;
}

auto parallel_download_coordinator::chunks(const std::string& parent_id) const
    -> std::vector<chunk_snapshot> {
    std::lock_guard lock(impl_->mutex);
    std::vector<chunk_snapshot> result;
    auto it = impl_->parents.find(parent_id);
    if (it == impl_->parents.end()) {
        return result;
    }
    for (const auto& c : it->second.chunks) {
        result.push_back(chunk_snapshot{c.chunk, c.status, c.bytes_done()});
    }
    return result;
}

auto parallel_download_coordinator::parent_of(const std::string& chunk_id) const
    -> std::optional<std::string> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->chunk_parent.find(chunk_id);
    if (it == impl_->chunk_parent.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto parallel_download_coordinator::config() const -> const parallel_config& {
    return impl_->config;
}

}  // namespace kcenon::background_transfer
