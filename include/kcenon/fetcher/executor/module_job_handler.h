/**
 * @file module_job_handler.h
 * @brief job_handler running a job through its module
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_EXECUTOR_MODULE_JOB_HANDLER_H
#define KCENON_FETCHER_EXECUTOR_MODULE_JOB_HANDLER_H

#include "job_types.h"
#include "kcenon/fetcher/config/job_config.h"
#include "kcenon/fetcher/module/module_factory.h"

#include <memory>

namespace kcenon::fetcher {

/**
 * @brief Load the job configuration, create the module and execute it
 *
 * RUNNING is reported to @p configs when the job starts, COMPLETED or FAILED
 * when it ends.
 */
[[nodiscard]] auto make_module_job_handler(std::shared_ptr<job_config_manager> configs,
                                           std::shared_ptr<const module_factory> factory)
    -> job_handler;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_EXECUTOR_MODULE_JOB_HANDLER_H
