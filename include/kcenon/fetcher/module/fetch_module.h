/**
 * @file fetch_module.h
 * @brief Module lifecycle contract and its shared execute() sequence
 * @version 0.1.0
 *
 * A module runs one job: initialize, validate its configuration, fetch into
 * a temporary directory, validate what was fetched and hand the valid files
 * on. The executor sees only fetch_module.
 */

#ifndef KCENON_FETCHER_MODULE_FETCH_MODULE_H
#define KCENON_FETCHER_MODULE_FETCH_MODULE_H

#include "kcenon/fetcher/config/job_config.h"
#include "kcenon/fetcher/core/logging.h"
#include "kcenon/fetcher/pipeline/file_transfer_pipeline.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::fetcher {

struct fetch_result {
    bool success = false;
    std::optional<std::string> error;
    std::vector<std::filesystem::path> files_downloaded;
    transfer_metadata metadata;
};

struct validation_result {
    bool success = false;
    std::vector<std::filesystem::path> valid_files;
    std::vector<std::filesystem::path> invalid_files;
    std::vector<std::string> validation_errors;
    /// Destination folder, relative to the upload root
    std::string upload_folder;
};

struct upload_result {
    bool success = false;
    std::optional<std::string> error;
    std::vector<std::filesystem::path> uploaded_files;
    std::string upload_folder;
};

/**
 * @brief Outcome of fetch_module::execute()
 *
 * On failure @c error holds the stage message ("Fetch failed", ...) and
 * @c details the underlying cause when there is one.
 */
struct module_result {
    bool success = false;
    std::optional<std::string> error;
    std::optional<std::string> details;

    std::optional<fetch_result> fetch;
    std::optional<validation_result> validation;
    std::optional<upload_result> upload;
};

/**
 * @brief Lifecycle contract of a per-source module
 */
class fetch_module {
public:
    virtual ~fetch_module() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    [[nodiscard]] virtual auto initialize() -> bool = 0;

    [[nodiscard]] virtual auto fetch() -> fetch_result = 0;

    [[nodiscard]] virtual auto validate(const fetch_result& fetched) -> validation_result = 0;

    [[nodiscard]] virtual auto upload(const validation_result& validated) -> upload_result = 0;

    /**
     * @brief Run the whole lifecycle, stopping at the first failing stage
     */
    [[nodiscard]] virtual auto execute() -> module_result = 0;
};

/**
 * @brief Common execute() sequence and configuration access for modules
 *
 * execute() runs Initialize -> Validate-Config -> Fetch -> Validate ->
 * Upload. A job temp directory `<tmp>/<job_id>_ch<channel>_XXXXXXXX` exists
 * for the duration of execute() and is removed however it ends.
 */
class fetch_module_base : public fetch_module {
public:
    auto execute() -> module_result final;

    /**
     * @brief Copies valid files into `<upload_directory>/<upload_folder>`
     *
     * Without an upload_directory setting the valid files are reported as
     * uploaded where they are.
     */
    [[nodiscard]] auto upload(const validation_result& validated) -> upload_result override;

    [[nodiscard]] auto config() const -> const job_config& { return config_; }

protected:
    explicit fetch_module_base(job_config config);

    /**
     * @brief Keys that must resolve to a non-empty value before fetching
     */
    [[nodiscard]] virtual auto required_config_fields() const -> std::vector<std::string>;

    /**
     * @brief Source-specific configuration checks run after the required fields
     */
    [[nodiscard]] virtual auto validate_source_config() -> bool { return true; }

    [[nodiscard]] auto config_value(const std::string& key) const -> std::optional<std::string>;

    /**
     * @brief The job temp directory; empty outside execute()
     */
    [[nodiscard]] auto temp_dir() const -> const std::filesystem::path& { return temp_dir_; }

    [[nodiscard]] auto log_context() const -> fetch_log_context;

private:
    [[nodiscard]] auto validate_config() -> bool;
    [[nodiscard]] auto create_temp_dir() -> bool;
    void remove_temp_dir();

    job_config config_;
    std::filesystem::path temp_dir_;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_MODULE_FETCH_MODULE_H
