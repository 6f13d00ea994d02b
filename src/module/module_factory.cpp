/**
 * @file module_factory.cpp
 * @brief Implementation of module_factory
 */

#include "kcenon/fetcher/module/module_factory.h"
#include "kcenon/fetcher/core/logging.h"
#include "kcenon/fetcher/module/file_source_module.h"

#include <algorithm>
#include <cctype>

namespace kcenon::fetcher {

namespace {

auto normalize(std::string type) -> std::string {
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return type;
}

}  // namespace

auto module_factory::with_default_modules(pipeline_dependencies deps) -> module_factory {
    module_factory factory;
    for (const auto& type : file_source_module::supported_source_types()) {
        factory.register_module(type, [deps](const job_config& config) {
            return std::make_unique<file_source_module>(config, deps);
        });
    }
    return factory;
}

void module_factory::register_module(const std::string& source_type, module_creator creator) {
    creators_[normalize(source_type)] = std::move(creator);
}

auto module_factory::create(const job_config& config) const
    -> result<std::unique_ptr<fetch_module>> {
    auto it = creators_.find(normalize(config.source_type));
    if (it == creators_.end()) {
        FETCHER_LOG_ERROR(log_category::module,
            "Unsupported source type: " + config.source_type);
        return unexpected{error{error_code::unsupported_source_type,
            "unsupported source type: " + config.source_type}};
    }

    auto created = it->second(config);
    if (!created) {
        return unexpected{error{error_code::module_initialization_failed,
            "module constructor for " + config.source_type + " returned nothing"}};
    }
    return result<std::unique_ptr<fetch_module>>(std::move(created));
}

auto module_factory::supports(const std::string& source_type) const -> bool {
    return creators_.count(normalize(source_type)) != 0;
}

auto module_factory::supported_types() const -> std::vector<std::string> {
    std::vector<std::string> types;
    types.reserve(creators_.size());
    for (const auto& entry : creators_) {
        types.push_back(entry.first);
    }
    return types;
}

}  // namespace kcenon::fetcher
