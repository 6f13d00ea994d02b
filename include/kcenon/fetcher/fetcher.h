/**
 * @file fetcher.h
 * @brief Main header for the fetcher_system library
 * @version 0.1.0
 *
 * Include this header to access the executor, the modules and the file
 * transfer pipeline.
 *
 * @code
 * #include <kcenon/fetcher/fetcher.h>
 *
 * using namespace kcenon::fetcher;
 *
 * auto configs = std::make_shared<yaml_job_config_manager>("/etc/fetcher/jobs");
 * auto factory = std::make_shared<const module_factory>(module_factory::with_default_modules());
 *
 * job_executor executor(executor_config{8}, make_module_job_handler(configs, factory));
 * executor.submit("daily_export", "billing");
 * executor.shutdown(true);
 * @endcode
 */

#ifndef KCENON_FETCHER_FETCHER_H
#define KCENON_FETCHER_FETCHER_H

#include <string>

// Core types
#include "kcenon/fetcher/core/types.h"
#include "kcenon/fetcher/core/error_codes.h"
#include "kcenon/fetcher/core/file_entry.h"
#include "kcenon/fetcher/core/logging.h"

// Configuration
#include "kcenon/fetcher/config/job_config.h"
#include "kcenon/fetcher/config/transfer_config.h"
#include "kcenon/fetcher/config/config_mapper.h"

// Pipeline
#include "kcenon/fetcher/pipeline/file_transfer_pipeline.h"

// Modules
#include "kcenon/fetcher/module/fetch_module.h"
#include "kcenon/fetcher/module/module_factory.h"

// Executor
#include "kcenon/fetcher/executor/job_executor.h"
#include "kcenon/fetcher/executor/module_job_handler.h"

namespace kcenon::fetcher {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_FETCHER_H
