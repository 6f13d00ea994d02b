/**
 * @file job_types.cpp
 * @brief Executor statistics
 */

#include "kcenon/fetcher/executor/job_types.h"

namespace kcenon::fetcher {

auto make_job_key(const std::string& job_id, const std::string& service_id) -> std::string {
    return job_id + "_" + service_id;
}

void executor_statistics::increment_submitted() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++values_.total_submitted;
}

void executor_statistics::increment_completed() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++values_.total_completed;
}

void executor_statistics::increment_failed() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++values_.total_failed;
}

void executor_statistics::set_queue_size(std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.queue_size = size;
}

void executor_statistics::set_currently_running(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.currently_running = count;
}

auto executor_statistics::snapshot() const -> executor_stats_snapshot {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
}

auto to_string(const executor_stats_snapshot& stats) -> std::string {
    return "submitted=" + std::to_string(stats.total_submitted) +
           " completed=" + std::to_string(stats.total_completed) +
           " failed=" + std::to_string(stats.total_failed) +
           " running=" + std::to_string(stats.currently_running) +
           " queued=" + std::to_string(stats.queue_size) +
           " history=" + std::to_string(stats.completed_jobs) +
           " max_workers=" + std::to_string(stats.max_workers);
}

}  // namespace kcenon::fetcher
