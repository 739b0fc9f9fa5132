// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool used for work the orchestrator must not do on the
 *        caller's thread
 *
 * Batch commands, metadata probes, chunk pauses and network-policy
 * rescheduling run here, and so do delayed jobs (retry backoff, cancel
 * timeouts). Backed by thread_system when available, otherwise by a small
 * standalone pool.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::background_transfer::adapters {

/**
 * @brief Interface for thread pool operations
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task that starts after a delay
     * @param task The task to execute
     * @param delay Time to wait before executing the task
     * @return Future for the task completion
     *
     * @note The delay does not occupy a worker.
     */
    virtual std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) = 0;

    /**
     * @brief Submit a task tagged with a stage name for tracking
     * @param task The task to execute
     * @param stage_name Name of the stage (e.g., "probe")
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of submitted tasks not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Number of tasks of a stage not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;

    /**
     * @brief Stop accepting work, drop delayed tasks and join the workers
     *
     * Tasks already running are allowed to finish. Safe to call twice.
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "background_transfer_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create an adapter over a new, started pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "background_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    void shutdown() override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Standalone fixed-size worker pool
 *
 * Used when thread_system is not available. Workers are joined on
 * shutdown; a shutdown issued from one of the pool's own workers detaches
 * that worker instead of joining it.
 */
class standalone_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit standalone_transfer_pool(size_t worker_count = 0);
    ~standalone_transfer_pool() override;

    standalone_transfer_pool(const standalone_transfer_pool&) = delete;
    standalone_transfer_pool& operator=(const standalone_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    void shutdown() override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Creates the best available pool
 *
 * 1. thread_system_transfer_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. standalone_transfer_pool
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "background_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::background_transfer::adapters
