/**
 * @file file_source_module.h
 * @brief Module fetching files from FTP, SFTP, S3 or a local directory
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_MODULE_FILE_SOURCE_MODULE_H
#define KCENON_FETCHER_MODULE_FILE_SOURCE_MODULE_H

#include "fetch_module.h"
#include "kcenon/fetcher/config/transfer_config.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief fetch_module running the file transfer pipeline
 *
 * The job document is either structured (an `ftp:` or `s3:` section, see
 * config_mapper) or already flat. Downloaded files are valid when they have
 * one of accepted_extensions(); the upload folder is
 * `data/<source_type>/ch_<channel>/validated`.
 *
 * Unless the document sets them, the resume key is
 * (instance_id = job_id, channel_id = "ch_<channel>").
 */
class file_source_module : public fetch_module_base {
public:
    explicit file_source_module(job_config config, pipeline_dependencies deps = {});

    [[nodiscard]] auto name() const -> std::string_view override;

    [[nodiscard]] auto initialize() -> bool override;

    [[nodiscard]] auto fetch() -> fetch_result override;

    [[nodiscard]] auto validate(const fetch_result& fetched) -> validation_result override;

    /**
     * @brief Transfer configuration built from the job document
     * @return std::nullopt until configuration validation has run
     */
    [[nodiscard]] auto transfer_settings() const -> const std::optional<transfer_config>& {
        return transfer_;
    }

    [[nodiscard]] auto upload_folder() const -> std::string;

    [[nodiscard]] static auto supported_source_types() -> const std::vector<std::string>&;

    [[nodiscard]] static auto accepted_extensions() -> const std::vector<std::string>&;

protected:
    [[nodiscard]] auto validate_source_config() -> bool override;

private:
    [[nodiscard]] auto build_transfer_config() const -> result<transfer_config>;

    pipeline_dependencies deps_;
    std::optional<transfer_config> transfer_;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_MODULE_FILE_SOURCE_MODULE_H
