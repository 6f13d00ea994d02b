/**
 * @file file_source_module.cpp
 * @brief Implementation of file_source_module
 */

#include "kcenon/fetcher/module/file_source_module.h"
#include "kcenon/fetcher/config/config_mapper.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <cctype>

namespace kcenon::fetcher {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto has_section(const YAML::Node& document, const char* key) -> bool {
    return document.IsMap() && document[key] && document[key].IsMap();
}

}  // namespace

file_source_module::file_source_module(job_config config, pipeline_dependencies deps)
    : fetch_module_base(std::move(config)), deps_(std::move(deps)) {}

auto file_source_module::supported_source_types() -> const std::vector<std::string>& {
    static const std::vector<std::string> types = {"ftp", "sftp", "s3", "local"};
    return types;
}

auto file_source_module::accepted_extensions() -> const std::vector<std::string>& {
    static const std::vector<std::string> extensions = {".csv", ".xml", ".json", ".txt"};
    return extensions;
}

auto file_source_module::name() const -> std::string_view {
    return config().source_type;
}

auto file_source_module::upload_folder() const -> std::string {
    return "data/" + config().source_type + "/ch_" + std::to_string(config().channel_number) +
           "/validated";
}

auto file_source_module::initialize() -> bool {
    auto ctx = log_context();
    const auto& types = supported_source_types();
    if (std::find(types.begin(), types.end(), config().source_type) == types.end()) {
        FETCHER_LOG_ERROR_CTX(log_category::module,
            "Unsupported source type: " + config().source_type, ctx);
        return false;
    }
    FETCHER_LOG_INFO_CTX(log_category::module,
        config().source_type + " module initialized", ctx);
    return true;
}

auto file_source_module::build_transfer_config() const -> result<transfer_config> {
    const YAML::Node& raw = config().raw_config;

    YAML::Node flat;
    if (has_section(raw, "ftp")) {
        flat = config_mapper::map_ftp_config(raw);
    } else if (has_section(raw, "s3")) {
        flat = config_mapper::map_s3_config(raw);
    } else if (raw.IsMap()) {
        flat = YAML::Clone(raw);
    } else {
        flat = YAML::Node(YAML::NodeType::Map);
    }

    const YAML::Node& mapped = flat;
    if (!mapped["type"] && !mapped["source_type"]) {
        flat["type"] = config().source_type;
    }
    if (!mapped["instance_id"]) {
        flat["instance_id"] = config().job_id;
    }
    if (!mapped["channel_id"]) {
        flat["channel_id"] = "ch_" + std::to_string(config().channel_number);
    }

    return transfer_config::from_yaml(flat);
}

auto file_source_module::validate_source_config() -> bool {
    auto ctx = log_context();

    auto built = build_transfer_config();
    if (!built) {
        ctx.error_message = built.error().message;
        FETCHER_LOG_ERROR_CTX(log_category::module,
            "Invalid transfer configuration: " + built.error().message, ctx);
        return false;
    }

    const auto& conn = built.value().connection;
    std::vector<std::string> errors;
    if (conn.type == "s3") {
        if (conn.bucket.empty()) {
            errors.emplace_back("S3 bucket is required");
        }
        bool has_keys = !conn.access_key_id.empty() && !conn.secret_access_key.empty();
        if (!has_keys && conn.session_token.empty()) {
            errors.emplace_back("S3 credentials are required (access key pair or session token)");
        }
    } else if (conn.type == "ftp" || conn.type == "sftp") {
        if (conn.host.empty()) {
            errors.emplace_back(conn.type + " host is required");
        }
    } else if (conn.type != "local") {
        errors.emplace_back("unsupported connection type '" + conn.type + "'");
    }

    if (!errors.empty()) {
        for (const auto& message : errors) {
            FETCHER_LOG_ERROR_CTX(log_category::module, "Config validation: " + message, ctx);
        }
        return false;
    }

    transfer_ = std::move(built).value();
    return true;
}

auto file_source_module::fetch() -> fetch_result {
    fetch_result result;
    if (!transfer_) {
        auto built = build_transfer_config();
        if (!built) {
            result.error = "Config validation failed: " + built.error().message;
            return result;
        }
        transfer_ = std::move(built).value();
    }

    auto ctx = log_context();
    ctx.remote_path = transfer_->path;
    if (!transfer_->connection.host.empty()) {
        ctx.host = transfer_->connection.host;
    }
    FETCHER_LOG_INFO_CTX(log_category::module,
        "Fetching from " + transfer_->connection.type + " into " + temp_dir().string(), ctx);

    auto outcome = run_file_transfer(*transfer_, temp_dir(), deps_);
    result.success = outcome.success;
    result.error = std::move(outcome.error);
    result.files_downloaded = std::move(outcome.files_downloaded);
    result.metadata = std::move(outcome.metadata);

    if (!result.success) {
        ctx.error_message = result.error.value_or("no file downloaded");
        FETCHER_LOG_ERROR_CTX(log_category::module, "Fetch failed", ctx);
    }
    return result;
}

auto file_source_module::validate(const fetch_result& fetched) -> validation_result {
    validation_result result;
    result.upload_folder = upload_folder();

    const auto& accepted = accepted_extensions();
    for (const auto& file : fetched.files_downloaded) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            result.invalid_files.push_back(file);
            result.validation_errors.push_back(file.filename().string() + ": missing");
            continue;
        }
        auto extension = to_lower(file.extension().string());
        if (std::find(accepted.begin(), accepted.end(), extension) == accepted.end()) {
            result.invalid_files.push_back(file);
            result.validation_errors.push_back(
                file.filename().string() + ": unsupported file type");
            continue;
        }
        result.valid_files.push_back(file);
    }

    result.success = !result.valid_files.empty();
    if (!result.success && fetched.files_downloaded.empty()) {
        result.validation_errors.emplace_back(
            fetched.metadata.message.empty() ? "no files downloaded" : fetched.metadata.message);
    }

    auto ctx = log_context();
    FETCHER_LOG_INFO_CTX(log_category::module,
        "Validated " + std::to_string(result.valid_files.size()) + " files, " +
        std::to_string(result.invalid_files.size()) + " invalid", ctx);
    return result;
}

}  // namespace kcenon::fetcher
