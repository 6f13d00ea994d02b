/**
 * @file job_executor.cpp
 * @brief Implementation of the bounded-worker job scheduler
 */

#include "kcenon/fetcher/executor/job_executor.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <unordered_map>

namespace kcenon::fetcher {

namespace {

struct in_flight_job {
    job_request request;
    std::chrono::system_clock::time_point started_at;
    std::future<void> task;
};

auto context_for(const job_request& request) -> fetch_log_context {
    fetch_log_context ctx;
    ctx.job_id = request.job_id;
    ctx.service_id = request.service_id;
    return ctx;
}

auto failed_result(const job_request& request, std::string message) -> job_result {
    job_result result;
    result.job_id = request.job_id;
    result.service_id = request.service_id;
    result.success = false;
    result.error = std::move(message);
    result.started_at = std::chrono::system_clock::now();
    result.finished_at = result.started_at;
    return result;
}

}  // namespace

// ============================================================================
// job_executor::impl
// ============================================================================

struct job_executor::impl {
    impl(executor_config cfg, job_handler h,
         std::shared_ptr<adapters::worker_pool_interface> p)
        : config(std::move(cfg)), handler(std::move(h)), pool(std::move(p)) {
        config.max_workers = std::max<std::size_t>(1, config.max_workers);
        if (!pool) {
            pool = adapters::worker_pool_factory::create(config.max_workers, config.pool_name);
        }
    }

    executor_config config;
    job_handler handler;
    std::shared_ptr<adapters::worker_pool_interface> pool;

    // Queue region; accepting and scheduling are guarded here as well
    mutable std::mutex queue_mutex;
    std::deque<job_request> queue;
    bool accepting = true;
    bool scheduling = true;

    // Active table region
    mutable std::mutex active_mutex;
    std::unordered_map<std::string, in_flight_job> active;

    // History region
    mutable std::mutex history_mutex;
    std::vector<job_result> history;
    std::unordered_map<std::string, std::size_t> history_index;

    executor_statistics statistics;

    // Leaf lock; never held while acquiring another executor lock
    mutable std::mutex idle_mutex;
    mutable std::condition_variable idle_cv;
    std::size_t pending_jobs = 0;
    std::size_t pool_tasks = 0;

    auto submit(const std::string& job_id, const std::string& service_id) -> bool {
        job_request request{job_id, service_id, std::chrono::system_clock::now()};
        auto key = request.key();
        auto ctx = context_for(request);

        {
            std::lock_guard<std::mutex> queue_lock(queue_mutex);
            if (!accepting) {
                FETCHER_LOG_WARN_CTX(log_category::executor,
                    "Executor is shut down; job rejected", ctx);
                return false;
            }

            std::lock_guard<std::mutex> active_lock(active_mutex);
            std::lock_guard<std::mutex> history_lock(history_mutex);
            bool queued = std::any_of(queue.begin(), queue.end(),
                                      [&](const job_request& q) { return q.key() == key; });
            if (queued || active.count(key) != 0 || history_index.count(key) != 0) {
                FETCHER_LOG_WARN_CTX(log_category::executor, "Job already submitted", ctx);
                return false;
            }

            queue.push_back(request);
            {
                std::lock_guard<std::mutex> idle_lock(idle_mutex);
                ++pending_jobs;
            }
            statistics.increment_submitted();
            statistics.set_queue_size(queue.size());
        }

        FETCHER_LOG_INFO_CTX(log_category::executor, "Job queued", ctx);
        drain();
        return true;
    }

    /**
     * @brief Move queued jobs into free worker slots
     *
     * Popping a job, submitting it and registering it as active happen under
     * the queue and active locks together. The completion of each scheduled
     * job is released only after both locks are dropped.
     */
    void drain() {
        std::vector<std::promise<void>> attach;
        std::vector<job_request> rejected;

        {
            std::lock_guard<std::mutex> queue_lock(queue_mutex);
            std::lock_guard<std::mutex> active_lock(active_mutex);

            while (scheduling && !queue.empty() && active.size() < config.max_workers) {
                auto request = std::move(queue.front());
                queue.pop_front();
                auto key = request.key();
                auto started_at = std::chrono::system_clock::now();

                std::promise<void> attached;
                auto signal = attached.get_future().share();
                {
                    std::lock_guard<std::mutex> idle_lock(idle_mutex);
                    ++pool_tasks;
                }

                auto task = pool->submit([this, request, started_at, signal]() {
                    run_job(request, started_at, signal);
                });

                // The task waits for its signal, so a ready future here means
                // the pool refused it.
                if (task.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                    {
                        std::lock_guard<std::mutex> idle_lock(idle_mutex);
                        --pool_tasks;
                    }
                    rejected.push_back(std::move(request));
                    break;
                }

                active.emplace(key, in_flight_job{request, started_at, std::move(task)});
                attach.push_back(std::move(attached));
            }

            statistics.set_queue_size(queue.size());
            statistics.set_currently_running(active.size());
        }

        for (auto& attached : attach) {
            attached.set_value();
        }

        for (const auto& request : rejected) {
            auto ctx = context_for(request);
            FETCHER_LOG_ERROR_CTX(log_category::executor, "Worker pool rejected job", ctx);
            record(failed_result(request, "worker pool rejected the job"), false);
        }
    }

    void drain_safely() {
        try {
            drain();
        } catch (const std::exception& e) {
            FETCHER_LOG_ERROR(log_category::executor,
                std::string("Scheduling failed: ") + e.what());
        }
    }

    auto invoke_handler(const job_request& request) -> job_outcome {
        job_outcome outcome;
        try {
            if (!handler) {
                outcome.error = "no job handler configured";
                return outcome;
            }
            return handler(request);
        } catch (const std::exception& e) {
            outcome.error = e.what();
        } catch (...) {
            outcome.error = "unknown exception";
        }
        auto ctx = context_for(request);
        ctx.error_message = outcome.error;
        FETCHER_LOG_ERROR_CTX(log_category::executor,
            "Job raised: " + outcome.error.value_or(""), ctx);
        return outcome;
    }

    void run_job(const job_request& request, std::chrono::system_clock::time_point started_at,
                 const std::shared_future<void>& attached) {
        auto ctx = context_for(request);
        FETCHER_LOG_INFO_CTX(log_category::executor, "Job started", ctx);

        auto outcome = invoke_handler(request);
        attached.wait();
        complete(request, started_at, std::move(outcome));

        std::lock_guard<std::mutex> idle_lock(idle_mutex);
        --pool_tasks;
        idle_cv.notify_all();
    }

    void complete(const job_request& request, std::chrono::system_clock::time_point started_at,
                  job_outcome outcome) {
        auto key = request.key();
        auto ctx = context_for(request);

        try {
            job_result result;
            result.job_id = request.job_id;
            result.service_id = request.service_id;
            result.success = outcome.success;
            result.error = std::move(outcome.error);
            result.details = std::move(outcome.details);
            result.files_processed = outcome.files_processed;
            result.started_at = started_at;
            result.finished_at = std::chrono::system_clock::now();
            result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                result.finished_at - started_at);

            ctx.duration_ms = static_cast<uint64_t>(result.duration.count());
            if (result.success) {
                FETCHER_LOG_INFO_CTX(log_category::executor, "Job completed", ctx);
            } else {
                ctx.error_message = result.error;
                FETCHER_LOG_ERROR_CTX(log_category::executor,
                    "Job failed: " + result.error.value_or("unknown error"), ctx);
            }

            record(std::move(result), true);
        } catch (const std::exception& e) {
            ctx.error_message = e.what();
            FETCHER_LOG_ERROR_CTX(log_category::executor,
                std::string("Job completion handling failed: ") + e.what(), ctx);
            settle_after_error(request);
        }

        drain_safely();
    }

    /**
     * @brief Store a terminal result and update the counters
     * @param was_active Remove the job from the active table in the same step
     */
    void record(job_result result, bool was_active) {
        auto key = make_job_key(result.job_id, result.service_id);
        bool success = result.success;
        {
            std::unique_lock<std::mutex> active_lock(active_mutex, std::defer_lock);
            if (was_active) {
                active_lock.lock();
            }
            std::lock_guard<std::mutex> history_lock(history_mutex);
            if (was_active) {
                active.erase(key);
                statistics.set_currently_running(active.size());
            }
            history_index[key] = history.size();
            history.push_back(std::move(result));
        }

        if (success) {
            statistics.increment_completed();
        } else {
            statistics.increment_failed();
        }

        std::lock_guard<std::mutex> idle_lock(idle_mutex);
        --pending_jobs;
        idle_cv.notify_all();
    }

    // Leaves the job out of the active table and counted as failed exactly once
    void settle_after_error(const job_request& request) {
        auto key = request.key();
        bool recorded = false;
        {
            std::lock_guard<std::mutex> active_lock(active_mutex);
            std::lock_guard<std::mutex> history_lock(history_mutex);
            active.erase(key);
            statistics.set_currently_running(active.size());
            recorded = history_index.count(key) != 0;
        }
        if (recorded) {
            return;
        }
        statistics.increment_failed();
        std::lock_guard<std::mutex> idle_lock(idle_mutex);
        --pending_jobs;
        idle_cv.notify_all();
    }

    void abandon_queued() {
        std::deque<job_request> abandoned;
        {
            std::lock_guard<std::mutex> queue_lock(queue_mutex);
            scheduling = false;
            abandoned.swap(queue);
            statistics.set_queue_size(0);
        }

        for (const auto& request : abandoned) {
            auto ctx = context_for(request);
            FETCHER_LOG_WARN_CTX(log_category::executor, "Job abandoned at shutdown", ctx);
            record(failed_result(request, "Job abandoned at shutdown"), false);
        }
    }

    auto wait_idle(std::chrono::milliseconds timeout) const -> bool {
        std::unique_lock<std::mutex> lock(idle_mutex);
        return idle_cv.wait_for(lock, timeout, [this] { return pending_jobs == 0; });
    }

    void wait_for_pool_tasks() {
        std::unique_lock<std::mutex> lock(idle_mutex);
        idle_cv.wait(lock, [this] { return pool_tasks == 0; });
    }

    auto stats() const -> executor_stats_snapshot {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        std::lock_guard<std::mutex> active_lock(active_mutex);
        std::lock_guard<std::mutex> history_lock(history_mutex);
        auto snapshot = statistics.snapshot();
        snapshot.queue_size = queue.size();
        snapshot.currently_running = active.size();
        snapshot.completed_jobs = history.size();
        snapshot.max_workers = config.max_workers;
        return snapshot;
    }

    void shutdown(bool wait, std::chrono::milliseconds timeout) {
        {
            std::lock_guard<std::mutex> queue_lock(queue_mutex);
            if (!accepting) {
                return;
            }
            accepting = false;
        }

        FETCHER_LOG_INFO(log_category::executor,
            std::string("Shutting down executor (") + (wait ? "waiting" : "not waiting") +
            "): " + to_string(stats()));

        bool drained = wait && wait_idle(timeout);
        if (wait && !drained) {
            FETCHER_LOG_WARN(log_category::executor,
                "Shutdown timeout elapsed: " + to_string(stats()));
        }
        if (!drained) {
            abandon_queued();
        }

        FETCHER_LOG_INFO(log_category::executor,
            "Executor shut down: " + to_string(stats()));
    }
};

// ============================================================================
// job_executor
// ============================================================================

job_executor::job_executor(executor_config config, job_handler handler,
                           std::shared_ptr<adapters::worker_pool_interface> pool)
    : impl_(std::make_unique<impl>(std::move(config), std::move(handler), std::move(pool))) {
    FETCHER_LOG_INFO(log_category::executor,
        "Job executor started with " + std::to_string(impl_->config.max_workers) +
        " workers");
}

job_executor::~job_executor() {
    impl_->shutdown(false, std::chrono::milliseconds(0));
    impl_->wait_for_pool_tasks();
    impl_->pool->shutdown(true);
}

auto job_executor::submit(const std::string& job_id, const std::string& service_id) -> bool {
    return impl_->submit(job_id, service_id);
}

auto job_executor::status(const std::string& job_id, const std::string& service_id) const
    -> std::optional<job_status_info> {
    auto key = make_job_key(job_id, service_id);

    job_status_info info;
    info.job_id = job_id;
    info.service_id = service_id;

    std::lock_guard<std::mutex> queue_lock(impl_->queue_mutex);
    std::lock_guard<std::mutex> active_lock(impl_->active_mutex);
    std::lock_guard<std::mutex> history_lock(impl_->history_mutex);

    if (auto it = impl_->active.find(key); it != impl_->active.end()) {
        info.status = job_status::running;
        info.started_at = it->second.started_at;
        return info;
    }

    for (std::size_t i = 0; i < impl_->queue.size(); ++i) {
        if (impl_->queue[i].key() == key) {
            info.status = job_status::queued;
            info.queue_position = i + 1;
            return info;
        }
    }

    if (auto it = impl_->history_index.find(key); it != impl_->history_index.end()) {
        const auto& result = impl_->history[it->second];
        info.status = result.status();
        info.result = result;
        return info;
    }

    return std::nullopt;
}

auto job_executor::stats() const -> executor_stats_snapshot {
    return impl_->stats();
}

auto job_executor::results() const -> std::vector<job_result> {
    std::lock_guard<std::mutex> history_lock(impl_->history_mutex);
    return impl_->history;
}

auto job_executor::wait_idle(std::chrono::milliseconds timeout) const -> bool {
    return impl_->wait_idle(timeout);
}

void job_executor::shutdown(bool wait, std::chrono::milliseconds timeout) {
    impl_->shutdown(wait, timeout);
}

auto job_executor::max_workers() const -> std::size_t {
    return impl_->config.max_workers;
}

auto job_executor::is_accepting() const -> bool {
    std::lock_guard<std::mutex> queue_lock(impl_->queue_mutex);
    return impl_->accepting;
}

}  // namespace kcenon::fetcher
