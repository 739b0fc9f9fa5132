// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for background_transfer
 */

#include "kcenon/background_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/background_transfer/core/logging.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::background_transfer::adapters {

// ============================================================================
// Shared helpers
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

/**
 * @brief Holds delayed tasks on one timer thread and hands them to a
 *        dispatcher when due
 */
class delay_scheduler {
public:
    using dispatch_fn = std::function<void(std::function<void()>)>;

    explicit delay_scheduler(dispatch_fn dispatch) : dispatch_(std::move(dispatch)) {}

    ~delay_scheduler() { stop(); }

    delay_scheduler(const delay_scheduler&) = delete;
    delay_scheduler& operator=(const delay_scheduler&) = delete;

    auto schedule(std::function<void()> fn, std::chrono::milliseconds delay) -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.emplace(std::chrono::steady_clock::now() + delay, std::move(fn));
        if (!thread_.joinable()) {
            thread_ = std::thread([this] { run(); });
        }
        cv_.notify_one();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            queue_.clear();
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            if (thread_.get_id() == std::this_thread::get_id()) {
                thread_.detach();
            } else {
                thread_.join();
            }
        }
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            if (queue_.empty()) {
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                continue;
            }
            auto due = queue_.begin()->first;
            if (std::chrono::steady_clock::now() < due) {
                cv_.wait_until(lock, due);
                continue;
            }
            auto fn = std::move(queue_.begin()->second);
            queue_.erase(queue_.begin());

            lock.unlock();
            dispatch_(std::move(fn));
            lock.lock();
        }
    }

    dispatch_fn dispatch_;
    std::mutex mutex_;
    std::condition_variable cv_;
    // multimap keeps insertion order among equal deadlines
    std::multimap<std::chrono::steady_clock::time_point, std::function<void()>> queue_;
    bool stopping_ = false;
    std::thread thread_;
};

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

// Runs a task and reports its outcome through the promise
auto wrap_task(std::function<void()> task, std::shared_ptr<std::promise<void>> promise)
    -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise)]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    stage_tracker tracker;
    std::atomic<size_t> active{0};
    std::atomic<bool> running{true};
    std::unique_ptr<delay_scheduler> delayed;

    void enqueue(std::function<void()> fn, const std::string& name) {
        active.fetch_add(1, std::memory_order_relaxed);
        auto counted = [this, fn = std::move(fn)]() {
            fn();
            active.fetch_sub(1, std::memory_order_relaxed);
        };
        auto enqueued = pool->enqueue(std::make_unique<function_job>(std::move(counted), name));
        if (enqueued.is_err()) {
            active.fetch_sub(1, std::memory_order_relaxed);
            BT_LOG_ERROR(log_category::executor,
                         "thread_system rejected job " + name + " in " + pool_name);
        }
    }
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;

    auto* state = pimpl_.get();
    pimpl_->delayed = std::make_unique<delay_scheduler>(
        [state](std::function<void()> fn) { state->enqueue(std::move(fn), "delayed_transfer_task"); });
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    shutdown();
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        auto added = pool->enqueue(std::move(worker));
        if (added.is_err()) {
            BT_LOG_WARN(log_category::executor, "Failed to add worker to " + pool_name);
        }
    }

    auto started = pool->start();
    if (started.is_err()) {
        BT_LOG_ERROR(log_category::executor, "Failed to start thread pool " + pool_name);
    }

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name,
                                                            worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pimpl_->enqueue(wrap_task(std::move(task), promise), "transfer_task");
    return future;
}

std::future<void> thread_system_transfer_adapter::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    if (!pimpl_->delayed->schedule(wrap_task(std::move(task), promise), delay)) {
        BT_LOG_DEBUG(log_category::executor, "Delayed task dropped after shutdown");
    }
    return future;
}

std::future<void> thread_system_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* tracker = &pimpl_->tracker;
    auto staged = [task = wrap_task(std::move(task), promise), tracker, stage = stage_name]() {
        task();
        tracker->decrement(stage);
    };
    pimpl_->enqueue(std::move(staged), "staged_transfer_task");
    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->running.load() && pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    return pimpl_->active.load(std::memory_order_relaxed);
}

size_t thread_system_transfer_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

void thread_system_transfer_adapter::shutdown() {
    if (!pimpl_->running.exchange(false)) {
        return;
    }
    pimpl_->delayed->stop();
    if (pimpl_->pool) {
        auto stopped = pimpl_->pool->stop();
        if (stopped.is_err()) {
            BT_LOG_WARN(log_category::executor, "Thread pool did not stop cleanly");
        }
    }
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_transfer_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// standalone_transfer_pool implementation
// ============================================================================

struct standalone_transfer_pool::impl {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> jobs;
    std::vector<std::thread> workers;
    bool stopping = false;
    size_t worker_count = 0;

    std::atomic<size_t> active{0};
    stage_tracker tracker;
    std::unique_ptr<delay_scheduler> delayed;

    auto push(std::function<void()> fn) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                return false;
            }
            active.fetch_add(1, std::memory_order_relaxed);
            jobs.push_back(std::move(fn));
        }
        cv.notify_one();
        return true;
    }

    void work() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !jobs.empty(); });
                if (stopping) {
                    return;
                }
                job = std::move(jobs.front());
                jobs.pop_front();
            }
            job();
            active.fetch_sub(1, std::memory_order_relaxed);
        }
    }
};

standalone_transfer_pool::standalone_transfer_pool(size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);

    auto* state = pimpl_.get();
    pimpl_->delayed = std::make_unique<delay_scheduler>(
        [state](std::function<void()> fn) { state->push(std::move(fn)); });

    // Workers keep the state alive in case the pool is destroyed from one of them
    for (size_t i = 0; i < pimpl_->worker_count; ++i) {
        pimpl_->workers.emplace_back([state = pimpl_]() { state->work(); });
    }
}

standalone_transfer_pool::~standalone_transfer_pool() {
    shutdown();
}

std::future<void> standalone_transfer_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pimpl_->push(wrap_task(std::move(task), promise));
    return future;
}

std::future<void> standalone_transfer_pool::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    if (!pimpl_->delayed->schedule(wrap_task(std::move(task), promise), delay)) {
        BT_LOG_DEBUG(log_category::executor, "Delayed task dropped after shutdown");
    }
    return future;
}

std::future<void> standalone_transfer_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* tracker = &pimpl_->tracker;
    if (!pimpl_->push([task = wrap_task(std::move(task), promise), tracker, stage = stage_name]() {
            task();
            tracker->decrement(stage);
        })) {
        tracker->decrement(stage_name);
    }
    return future;
}

size_t standalone_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool standalone_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t standalone_transfer_pool::pending_tasks() const {
    return pimpl_->active.load(std::memory_order_relaxed);
}

size_t standalone_transfer_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

void standalone_transfer_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
        pimpl_->active.fetch_sub(pimpl_->jobs.size(), std::memory_order_relaxed);
        pimpl_->jobs.clear();
    }
    pimpl_->cv.notify_all();
    pimpl_->delayed->stop();

    for (auto& worker : pimpl_->workers) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<standalone_transfer_pool>(worker_count);
#endif
}

}  // namespace kcenon::background_transfer::adapters
