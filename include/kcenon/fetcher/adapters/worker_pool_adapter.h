// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool_adapter.h
 * @brief Worker pool adapter for the job executor
 *
 * The executor runs each admitted job on a worker from this pool. The pool
 * is backed by thread_system when it is available and by one thread per task
 * otherwise.
 */

#pragma once

#include <atomic>
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

namespace kcenon::fetcher::adapters {

/**
 * @brief Interface for the executor's worker pool
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future that becomes ready when the task finishes; it carries
     *         the task's exception, or a std::runtime_error when the pool
     *         has been shut down
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Stop accepting tasks
     * @param wait_for_completion Block until submitted tasks have finished
     */
    virtual void shutdown(bool wait_for_completion) = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter over kcenon::thread::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    explicit thread_system_worker_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "fetcher_pool",
        size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "fetcher_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown(bool wait_for_completion) override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool running every task on its own detached thread
 *
 * Concurrency is bounded by the caller (the executor admits at most
 * max_workers jobs at a time).
 */
class async_worker_pool : public worker_pool_interface {
public:
    explicit async_worker_pool(size_t worker_count = 0);
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown(bool wait_for_completion) override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Selects the best available worker pool
 *
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "fetcher_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::fetcher::adapters
