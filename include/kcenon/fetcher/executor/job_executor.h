/**
 * @file job_executor.h
 * @brief Bounded-worker scheduler for fetch jobs
 * @version 0.1.0
 *
 * Jobs are identified by (job_id, service_id) and run once. At most
 * max_workers jobs are active; the rest wait in a FIFO queue that is drained
 * whenever a job is submitted or finishes.
 *
 * Lock order: queue, then active table, then history. Completion handling
 * runs on the worker after the scheduling locks have been released.
 */

#ifndef KCENON_FETCHER_EXECUTOR_JOB_EXECUTOR_H
#define KCENON_FETCHER_EXECUTOR_JOB_EXECUTOR_H

#include "job_types.h"
#include "kcenon/fetcher/adapters/worker_pool_adapter.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::fetcher {

struct executor_config {
    std::size_t max_workers = 20;
    std::string pool_name = "fetcher_executor";
};

/**
 * @brief Scheduler running jobs through a job_handler on a worker pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 *
 * @code
 * job_executor executor(executor_config{4}, make_module_job_handler(configs, factory));
 * executor.submit("daily_export", "billing");
 * executor.wait_idle(std::chrono::minutes(5));
 * executor.shutdown();
 * @endcode
 */
class job_executor {
public:
    /**
     * @param pool Worker pool to run jobs on; created by worker_pool_factory
     *             with max_workers workers when null. The executor shuts it down.
     */
    job_executor(executor_config config, job_handler handler,
                 std::shared_ptr<adapters::worker_pool_interface> pool = nullptr);

    /**
     * @brief Stops accepting jobs and waits for running ones to finish
     */
    ~job_executor();

    job_executor(const job_executor&) = delete;
    auto operator=(const job_executor&) -> job_executor& = delete;
    job_executor(job_executor&&) = delete;
    auto operator=(job_executor&&) -> job_executor& = delete;

    /**
     * @brief Queue a job
     * @return false when the pair is already queued, running or finished, or
     *         the executor has been shut down
     */
    [[nodiscard]] auto submit(const std::string& job_id, const std::string& service_id) -> bool;

    /**
     * @brief Where a job is: active table, then queue, then history
     */
    [[nodiscard]] auto status(const std::string& job_id, const std::string& service_id) const
        -> std::optional<job_status_info>;

    [[nodiscard]] auto stats() const -> executor_stats_snapshot;

    /**
     * @brief Terminal results in completion order
     */
    [[nodiscard]] auto results() const -> std::vector<job_result>;

    /**
     * @brief Block until every accepted job has a terminal result
     * @return false when @p timeout elapsed first
     */
    [[nodiscard]] auto wait_idle(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Stop accepting jobs
     *
     * With @p wait, queued and running jobs keep being processed until they
     * are all done or @p timeout elapses. Jobs still queued afterwards (or
     * immediately, without @p wait) are recorded as failed. Running jobs are
     * never interrupted. Statistics are logged before and after.
     */
    void shutdown(bool wait = true,
                  std::chrono::milliseconds timeout = std::chrono::seconds(30));

    [[nodiscard]] auto max_workers() const -> std::size_t;

    [[nodiscard]] auto is_accepting() const -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_EXECUTOR_JOB_EXECUTOR_H
