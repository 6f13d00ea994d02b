/**
 * @file fetch_module.cpp
 * @brief Implementation of the shared module lifecycle
 */

#include "kcenon/fetcher/module/fetch_module.h"
#include "kcenon/fetcher/core/logging.h"

#include <functional>
#include <random>

namespace kcenon::fetcher {

namespace {

constexpr int max_temp_dir_attempts = 100;

auto random_suffix(std::size_t length) -> std::string {
    static constexpr char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789_";
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);

    std::string suffix;
    suffix.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        suffix.push_back(alphabet[pick(engine)]);
    }
    return suffix;
}

/**
 * @brief Removes the module temp directory when execute() returns
 */
class temp_dir_guard {
public:
    explicit temp_dir_guard(std::function<void()> cleanup) : cleanup_(std::move(cleanup)) {}
    ~temp_dir_guard() { cleanup_(); }

    temp_dir_guard(const temp_dir_guard&) = delete;
    auto operator=(const temp_dir_guard&) -> temp_dir_guard& = delete;

private:
    std::function<void()> cleanup_;
};

auto failed(std::string stage, std::optional<std::string> details = std::nullopt)
    -> module_result {
    module_result result;
    result.success = false;
    result.error = std::move(stage);
    result.details = std::move(details);
    return result;
}

}  // namespace

fetch_module_base::fetch_module_base(job_config config) : config_(std::move(config)) {}

auto fetch_module_base::required_config_fields() const -> std::vector<std::string> {
    return {"channel_number"};
}

auto fetch_module_base::config_value(const std::string& key) const
    -> std::optional<std::string> {
    return config_.lookup_string(key);
}

auto fetch_module_base::log_context() const -> fetch_log_context {
    fetch_log_context ctx;
    ctx.job_id = config_.job_id;
    ctx.service_id = config_.service_id;
    return ctx;
}

auto fetch_module_base::validate_config() -> bool {
    auto ctx = log_context();
    for (const auto& field : required_config_fields()) {
        auto value = config_value(field);
        if (!value || value->empty()) {
            FETCHER_LOG_ERROR_CTX(log_category::module,
                "Missing required config field: " + field, ctx);
            return false;
        }
    }

    if (!validate_source_config()) {
        return false;
    }

    FETCHER_LOG_INFO_CTX(log_category::module, "Configuration validation passed", ctx);
    return true;
}

auto fetch_module_base::create_temp_dir() -> bool {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = std::filesystem::current_path();
    }

    auto prefix = config_.job_id + "_ch" + std::to_string(config_.channel_number) + "_";
    for (int attempt = 0; attempt < max_temp_dir_attempts; ++attempt) {
        auto candidate = base / (prefix + random_suffix(8));
        if (std::filesystem::create_directory(candidate, ec)) {
            temp_dir_ = candidate;
            return true;
        }
        if (ec) {
            break;
        }
    }

    auto ctx = log_context();
    ctx.error_message = ec ? ec.message() : "name collision";
    FETCHER_LOG_ERROR_CTX(log_category::module,
        "Cannot create temp directory under " + base.string(), ctx);
    return false;
}

void fetch_module_base::remove_temp_dir() {
    if (temp_dir_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
    if (ec) {
        FETCHER_LOG_WARN(log_category::module,
            "Failed to remove temp directory " + temp_dir_.string() + ": " + ec.message());
    }
    temp_dir_.clear();
}

auto fetch_module_base::execute() -> module_result {
    auto ctx = log_context();

    try {
        if (!create_temp_dir()) {
            return failed("Initialization failed", "cannot create temp directory");
        }
        temp_dir_guard guard([this] { remove_temp_dir(); });

        if (!initialize()) {
            return failed("Initialization failed");
        }

        if (!validate_config()) {
            return failed("Config validation failed");
        }

        auto fetched = fetch();
        if (!fetched.success) {
            auto result = failed("Fetch failed", fetched.error);
            result.fetch = std::move(fetched);
            return result;
        }

        auto validated = validate(fetched);
        if (!validated.success) {
            std::string reasons;
            for (const auto& reason : validated.validation_errors) {
                reasons += (reasons.empty() ? "" : "; ") + reason;
            }
            auto result = failed("Validation failed",
                reasons.empty() ? std::nullopt : std::optional<std::string>(reasons));
            result.fetch = std::move(fetched);
            result.validation = std::move(validated);
            return result;
        }

        auto uploaded = upload(validated);
        if (!uploaded.success) {
            auto result = failed("Upload failed", uploaded.error);
            result.fetch = std::move(fetched);
            result.validation = std::move(validated);
            result.upload = std::move(uploaded);
            return result;
        }

        FETCHER_LOG_INFO_CTX(log_category::module,
            std::string(name()) + " module finished: " +
            std::to_string(uploaded.uploaded_files.size()) + " files uploaded to " +
            uploaded.upload_folder, ctx);

        module_result result;
        result.success = true;
        result.fetch = std::move(fetched);
        result.validation = std::move(validated);
        result.upload = std::move(uploaded);
        return result;
    } catch (const std::exception& e) {
        ctx.error_message = e.what();
        FETCHER_LOG_ERROR_CTX(log_category::module,
            std::string(name()) + " module raised: " + e.what(), ctx);
        return failed(e.what());
    }
}

auto fetch_module_base::upload(const validation_result& validated) -> upload_result {
    upload_result result;
    result.upload_folder = validated.upload_folder;

    auto root = config_value("upload_directory");
    if (!root || root->empty()) {
        const YAML::Node& raw = config_.raw_config;
        if (raw.IsMap() && raw["upload_directory"] && raw["upload_directory"].IsScalar()) {
            root = raw["upload_directory"].as<std::string>();
        }
    }

    if (!root || root->empty()) {
        result.success = true;
        result.uploaded_files = validated.valid_files;
        return result;
    }

    auto destination = std::filesystem::path(*root) / validated.upload_folder;
    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        result.error = "cannot create " + destination.string() + ": " + ec.message();
        return result;
    }

    for (const auto& file : validated.valid_files) {
        auto target = destination / file.filename();
        std::filesystem::copy_file(file, target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            result.error = "failed to copy " + file.string() + ": " + ec.message();
            return result;
        }
        result.uploaded_files.push_back(target);
    }

    auto ctx = log_context();
    FETCHER_LOG_INFO_CTX(log_category::module,
        "Uploaded " + std::to_string(result.uploaded_files.size()) + " files to " +
        destination.string(), ctx);
    result.success = true;
    return result;
}

}  // namespace kcenon::fetcher
