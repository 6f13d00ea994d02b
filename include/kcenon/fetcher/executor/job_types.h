/**
 * @file job_types.h
 * @brief Requests, results and statistics of the job executor
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_EXECUTOR_JOB_TYPES_H
#define KCENON_FETCHER_EXECUTOR_JOB_TYPES_H

#include "kcenon/fetcher/config/job_config.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::fetcher {

/**
 * @brief Identity key of a job: "<job_id>_<service_id>"
 */
[[nodiscard]] auto make_job_key(const std::string& job_id, const std::string& service_id)
    -> std::string;

struct job_request {
    std::string job_id;
    std::string service_id;
    std::chrono::system_clock::time_point submitted_at;

    [[nodiscard]] auto key() const -> std::string { return make_job_key(job_id, service_id); }
};

/**
 * @brief What a job handler reports back to the executor
 */
struct job_outcome {
    bool success = false;
    std::optional<std::string> error;
    std::optional<std::string> details;
    std::size_t files_processed = 0;
};

/**
 * @brief Runs one job; exceptions are caught by the executor
 */
using job_handler = std::function<job_outcome(const job_request&)>;

/**
 * @brief Terminal record of a job
 */
struct job_result {
    std::string job_id;
    std::string service_id;
    bool success = false;
    std::optional<std::string> error;
    std::optional<std::string> details;
    std::size_t files_processed = 0;

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] auto status() const -> job_status {
        return success ? job_status::completed : job_status::failed;
    }
};

/**
 * @brief Answer of job_executor::status()
 */
struct job_status_info {
    job_status status = job_status::queued;
    std::string job_id;
    std::string service_id;
    /// 1-based position, set while queued
    std::optional<std::size_t> queue_position;
    /// Set while running
    std::optional<std::chrono::system_clock::time_point> started_at;
    /// Set once completed or failed
    std::optional<job_result> result;
};

struct executor_stats_snapshot {
    uint64_t total_submitted = 0;
    uint64_t total_completed = 0;
    uint64_t total_failed = 0;
    std::size_t currently_running = 0;
    std::size_t queue_size = 0;
    std::size_t completed_jobs = 0;
    std::size_t max_workers = 0;
};

/**
 * @brief Executor counters
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class executor_statistics {
public:
    void increment_submitted();
    void increment_completed();
    void increment_failed();
    void set_queue_size(std::size_t size);
    void set_currently_running(std::size_t count);

    [[nodiscard]] auto snapshot() const -> executor_stats_snapshot;

private:
    mutable std::mutex mutex_;
    executor_stats_snapshot values_;
};

/**
 * @brief One-line rendering used in executor log records
 */
[[nodiscard]] auto to_string(const executor_stats_snapshot& stats) -> std::string;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_EXECUTOR_JOB_TYPES_H
