/**
 * @file job_config.cpp
 * @brief Job configuration loading
 */

#include "kcenon/fetcher/config/job_config.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace kcenon::fetcher {

namespace {

constexpr int default_fetcher_timeout = 30;
constexpr int default_fetcher_retry_count = 3;

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Copies every entry of @p overrides into @p target
void merge_into(YAML::Node& target, const YAML::Node& overrides) {
    if (!overrides || !overrides.IsMap()) {
        return;
    }
    for (const auto& entry : overrides) {
        target[entry.first.as<std::string>()] = YAML::Clone(entry.second);
    }
}

auto infer_source_type(const YAML::Node& document) -> std::string {
    for (const char* key : {"source_type", "type"}) {
        if (document[key] && document[key].IsScalar()) {
            return to_lower(document[key].as<std::string>());
        }
    }
    if (document["ftp"] && document["ftp"].IsMap()) {
        auto connection = document["ftp"]["connection"];
        if (connection && connection.IsMap() && connection["protocol"] &&
            connection["protocol"].IsScalar()) {
            return to_lower(connection["protocol"].as<std::string>());
        }
        return "ftp";
    }
    if (document["s3"] && document["s3"].IsMap()) {
        return "s3";
    }
    return {};
}

}  // namespace

auto job_config::lookup(const std::string& key) const -> std::optional<YAML::Node> {
    for (const YAML::Node* layer : {&channel_config, &fetcher_config, &environment_config}) {
        if (!layer->IsMap()) {
            continue;
        }
        const YAML::Node& node = *layer;
        auto value = node[key];
        if (value && !value.IsNull()) {
            return value;
        }
    }
    return std::nullopt;
}

auto job_config::lookup_string(const std::string& key) const -> std::optional<std::string> {
    auto value = lookup(key);
    if (!value) {
        return std::nullopt;
    }
    if (value->IsScalar()) {
        return value->as<std::string>();
    }
    return YAML::Dump(*value);
}

yaml_job_config_manager::yaml_job_config_manager(std::filesystem::path config_dir)
    : config_dir_(std::move(config_dir)) {
    FETCHER_LOG_INFO(log_category::config,
        "Job configuration directory: " + config_dir_.string());
}

auto yaml_job_config_manager::from_document(const std::string& job_id,
                                            const std::string& service_id,
                                            const YAML::Node& document) -> result<job_config> {
    if (!document || !document.IsMap()) {
        return unexpected{error{error_code::invalid_configuration,
            "job document for " + job_id + " must be a mapping"}};
    }

    job_config config;
    config.job_id = job_id;
    config.service_id = service_id;

    try {
        if (!document["channel_number"] || !document["channel_number"].IsScalar()) {
            return unexpected{error{error_code::missing_config_field,
                "job " + job_id + " has no channel_number"}};
        }
        config.channel_number = document["channel_number"].as<int>();

        config.source_type = infer_source_type(document);
        if (config.source_type.empty()) {
            return unexpected{error{error_code::missing_config_field,
                "job " + job_id + " has no source_type"}};
        }

        merge_into(config.environment_config, document["environment"]);

        config.channel_config["channel_number"] = config.channel_number;
        config.channel_config["source_type"] = config.source_type;
        config.channel_config["is_active"] = true;
        merge_into(config.channel_config, document["channel"]);

        config.fetcher_config["source_type"] = config.source_type;
        config.fetcher_config["timeout"] = default_fetcher_timeout;
        config.fetcher_config["retry_count"] = default_fetcher_retry_count;
        merge_into(config.fetcher_config, document["fetcher"]);

        config.raw_config = YAML::Clone(document);
    } catch (const YAML::Exception& e) {
        return unexpected{error{error_code::config_parse_error,
            "invalid job configuration for " + job_id + ": " + e.what()}};
    }

    return config;
}

auto yaml_job_config_manager::fetch_job_config(const std::string& job_id,
                                               const std::string& service_id)
    -> result<job_config> {
    std::error_code ec;
    auto path = config_dir_ / (job_id + ".yaml");
    if (!service_id.empty()) {
        auto specific = config_dir_ / (job_id + "_" + service_id + ".yaml");
        if (std::filesystem::exists(specific, ec)) {
            path = specific;
        }
    }

    if (!std::filesystem::exists(path, ec)) {
        FETCHER_LOG_ERROR(log_category::config,
            "No configuration found for job " + job_id + " at " + path.string());
        return unexpected{error{error_code::job_not_found,
            "no configuration for job " + job_id}};
    }

    YAML::Node document;
    try {
        document = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        FETCHER_LOG_ERROR(log_category::config,
            "Failed to parse " + path.string() + ": " + e.what());
        return unexpected{error{error_code::config_parse_error,
            "failed to parse " + path.string() + ": " + e.what()}};
    }

    auto config = from_document(job_id, service_id, document);
    if (!config) {
        FETCHER_LOG_ERROR(log_category::config,
            "Failed to create job configuration: " + config.error().message);
        return config;
    }

    fetch_log_context ctx;
    ctx.job_id = job_id;
    ctx.service_id = service_id;
    FETCHER_LOG_INFO_CTX(log_category::config,
        "Job configuration created (channel " + std::to_string(config.value().channel_number) +
        ", source " + config.value().source_type + ")", ctx);
    return config;
}

void yaml_job_config_manager::update_job_status(const std::string& job_id,
                                                const std::string& service_id,
                                                job_status status) {
    fetch_log_context ctx;
    ctx.job_id = job_id;
    ctx.service_id = service_id;
    FETCHER_LOG_INFO_CTX(log_category::executor,
        "Job status updated to " + std::string(to_string(status)), ctx);
}

}  // namespace kcenon::fetcher
