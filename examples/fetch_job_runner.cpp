/**
 * @file fetch_job_runner.cpp
 * @brief Runs fetch jobs described by YAML documents
 *
 * This example demonstrates:
 * - Loading job documents with yaml_job_config_manager
 * - Running them through the default modules on a bounded job_executor
 * - Reporting per-job status and executor statistics
 */

#include <kcenon/fetcher/fetcher.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace kcenon::fetcher;

namespace {

auto parse_job_argument(const std::string& arg) -> std::pair<std::string, std::string> {
    auto colon = arg.find(':');
    if (colon == std::string::npos) {
        return {arg, "default"};
    }
    return {arg.substr(0, colon), arg.substr(colon + 1)};
}

void print_result(const job_status_info& info) {
    std::cout << "  " << info.job_id << ":" << info.service_id << " -> "
              << to_string(info.status);
    if (info.result) {
        const auto& result = *info.result;
        std::cout << " (" << result.duration.count() << " ms";
        if (result.success) {
            std::cout << ", " << result.files_processed << " files";
        }
        std::cout << ")";
        if (result.error) {
            std::cout << " error: " << *result.error;
        }
        if (result.details) {
            std::cout << " [" << *result.details << "]";
        }
    }
    std::cout << std::endl;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Fetch Job Runner - fetcher_system" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <job_id>[:<service_id>] ..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config-dir <dir>   Directory holding <job_id>.yaml documents (default: .)"
              << std::endl;
    std::cout << "  --workers <n>        Maximum concurrent jobs (default: 20)" << std::endl;
    std::cout << "  --timeout <seconds>  Time to wait for all jobs (default: 3600)" << std::endl;
    std::cout << "  --debug              Enable debug logging" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --config-dir ./jobs daily_export" << std::endl;
    std::cout << "  " << program << " --workers 4 report:billing report:audit" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_dir = ".";
    std::size_t workers = 20;
    long timeout_seconds = 3600;
    bool debug = false;
    std::vector<std::pair<std::string, std::string>> jobs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config-dir") {
            if (++i >= argc) {
                std::cerr << "Error: --config-dir requires an argument" << std::endl;
                return 1;
            }
            config_dir = argv[i];
        } else if (arg == "--workers") {
            if (++i >= argc) {
                std::cerr << "Error: --workers requires an argument" << std::endl;
                return 1;
            }
            workers = static_cast<std::size_t>(std::strtoul(argv[i], nullptr, 10));
            if (workers == 0) {
                std::cerr << "Error: --workers must be positive" << std::endl;
                return 1;
            }
        } else if (arg == "--timeout") {
            if (++i >= argc) {
                std::cerr << "Error: --timeout requires an argument" << std::endl;
                return 1;
            }
            timeout_seconds = std::strtol(argv[i], nullptr, 10);
        } else if (arg == "--debug") {
            debug = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            jobs.push_back(parse_job_argument(arg));
        }
    }

    if (jobs.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(debug ? log_level::debug : log_level::info);

    auto configs = std::make_shared<yaml_job_config_manager>(config_dir);
    auto factory = std::make_shared<const module_factory>(module_factory::with_default_modules());

    std::cout << "fetcher_system " << version::to_string() << ": " << jobs.size()
              << " job(s), " << workers << " worker(s)" << std::endl;

    bool all_succeeded = true;
    {
        job_executor executor(executor_config{workers}, make_module_job_handler(configs, factory));

        for (const auto& [job_id, service_id] : jobs) {
            if (!executor.submit(job_id, service_id)) {
                std::cerr << "Rejected duplicate job " << job_id << ":" << service_id << std::endl;
            }
        }

        if (!executor.wait_idle(std::chrono::seconds(timeout_seconds))) {
            std::cerr << "Timed out waiting for jobs" << std::endl;
        }
        executor.shutdown(false);

        std::cout << std::endl << "Job results:" << std::endl;
        for (const auto& [job_id, service_id] : jobs) {
            auto info = executor.status(job_id, service_id);
            if (!info) {
                continue;
            }
            print_result(*info);
            all_succeeded = all_succeeded && info->status == job_status::completed;
        }

        auto stats = executor.stats();
        std::cout << std::endl << "Statistics:" << std::endl;
        std::cout << "  Submitted: " << stats.total_submitted << std::endl;
        std::cout << "  Completed: " << stats.total_completed << std::endl;
        std::cout << "  Failed:    " << stats.total_failed << std::endl;
        std::cout << "  Running:   " << stats.currently_running << std::endl;
        std::cout << "  Queued:    " << stats.queue_size << std::endl;
    }

    logger.shutdown();
    return all_succeeded ? 0 : 1;
}
