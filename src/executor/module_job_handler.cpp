/**
 * @file module_job_handler.cpp
 * @brief Implementation of make_module_job_handler
 */

#include "kcenon/fetcher/executor/module_job_handler.h"
#include "kcenon/fetcher/core/logging.h"

namespace kcenon::fetcher {

auto make_module_job_handler(std::shared_ptr<job_config_manager> configs,
                             std::shared_ptr<const module_factory> factory) -> job_handler {
    return [configs = std::move(configs), factory = std::move(factory)](
               const job_request& request) -> job_outcome {
        job_outcome outcome;
        if (!configs || !factory) {
            outcome.error = "job handler is missing its configuration manager or module factory";
            return outcome;
        }

        configs->update_job_status(request.job_id, request.service_id, job_status::running);

        auto finish = [&](job_outcome result) {
            configs->update_job_status(request.job_id, request.service_id,
                                       result.success ? job_status::completed
                                                      : job_status::failed);
            return result;
        };

        auto config = configs->fetch_job_config(request.job_id, request.service_id);
        if (!config) {
            outcome.error = "Failed to load job configuration";
            outcome.details = config.error().message;
            return finish(std::move(outcome));
        }

        auto created = factory->create(config.value());
        if (!created) {
            outcome.error = created.error().message;
            return finish(std::move(outcome));
        }

        auto& fetcher = created.value();
        fetch_log_context ctx;
        ctx.job_id = request.job_id;
        ctx.service_id = request.service_id;
        FETCHER_LOG_DEBUG_CTX(log_category::executor,
            "Executing " + std::string(fetcher->name()) + " module", ctx);

        auto executed = fetcher->execute();
        outcome.success = executed.success;
        outcome.error = std::move(executed.error);
        outcome.details = std::move(executed.details);
        if (executed.upload) {
            outcome.files_processed = executed.upload->uploaded_files.size();
        }
        return finish(std::move(outcome));
    };
}

}  // namespace kcenon::fetcher
