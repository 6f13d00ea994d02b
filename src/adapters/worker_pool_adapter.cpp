// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/fetcher/adapters/worker_pool_adapter.h"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::fetcher::adapters {

namespace {

/**
 * @brief Counts in-flight tasks and lets shutdown wait for them
 */
class inflight_counter {
public:
    void add() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++count_;
    }

    void done() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (count_ > 0) {
                --count_;
            }
        }
        cv_.notify_all();
    }

    [[nodiscard]] size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return count_ == 0; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t count_{0};
};

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

auto rejected_future() -> std::future<void> {
    std::promise<void> promise;
    promise.set_exception(std::make_exception_ptr(
        std::runtime_error("worker pool is shut down")));
    return promise.get_future();
}

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "fetch_job")
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

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<bool> running{true};
    inflight_counter inflight;
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() {
    shutdown(true);
}

std::shared_ptr<thread_system_worker_pool>
thread_system_worker_pool::create_default(size_t worker_count,
                                          const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task) {
    if (!pimpl_->running) {
        return rejected_future();
    }

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->inflight.add();
    auto* inflight = &pimpl_->inflight;
    auto wrapped_task = [task = std::move(task), promise, inflight]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        inflight->done();
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task));
    auto enqueued = pimpl_->pool->enqueue(std::move(job));
    if (!enqueued.is_ok()) {
        inflight->done();
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("thread pool rejected job")));
    }

    return future;
}

size_t thread_system_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_worker_pool::is_running() const {
    return pimpl_->running && pimpl_->pool != nullptr;
}

size_t thread_system_worker_pool::pending_tasks() const {
    return pimpl_->inflight.count();
}

void thread_system_worker_pool::shutdown(bool wait_for_completion) {
    if (!pimpl_->running.exchange(false) || !pimpl_->pool) {
        return;
    }
    if (wait_for_completion) {
        pimpl_->inflight.wait_idle();
    }
    pimpl_->pool->stop(!wait_for_completion);
}

std::string thread_system_worker_pool::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool implementation
// ============================================================================

struct async_worker_pool::impl {
    size_t worker_count{0};
    std::atomic<bool> running{true};
    inflight_counter inflight;
};

async_worker_pool::async_worker_pool(size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_worker_pool::~async_worker_pool() {
    shutdown(true);
}

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    if (!pimpl_->running) {
        return rejected_future();
    }

    // A std::async future blocks in its destructor; a detached thread
    // reporting through a promise does not.
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->inflight.add();
    auto state = pimpl_;
    try {
        std::thread([state, promise, task = std::move(task)]() mutable {
            try {
                task();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            task = nullptr;
            state->inflight.done();
        }).detach();
    } catch (const std::system_error&) {
        pimpl_->inflight.done();
        promise->set_exception(std::current_exception());
    }
    return future;
}

size_t async_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_worker_pool::is_running() const {
    return pimpl_->running;
}

size_t async_worker_pool::pending_tasks() const {
    return pimpl_->inflight.count();
}

void async_worker_pool::shutdown(bool wait_for_completion) {
    pimpl_->running = false;
    if (wait_for_completion) {
        pimpl_->inflight.wait_idle();
    }
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::fetcher::adapters
