/**
 * @file file_transfer_pipeline.h
 * @brief Connect, list, filter, sort and download in one call
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_PIPELINE_FILE_TRANSFER_PIPELINE_H
#define KCENON_FETCHER_PIPELINE_FILE_TRANSFER_PIPELINE_H

#include "directory_lister.h"
#include "kcenon/fetcher/config/transfer_config.h"
#include "kcenon/fetcher/connection/connection_resolver.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief Counters reported by a pipeline run
 */
struct transfer_metadata {
    std::size_t total_found = 0;
    std::size_t after_filtering = 0;
    std::size_t after_sorting = 0;
    std::size_t downloaded = 0;
    std::size_t failed = 0;
    /// Set when the run ended before downloading ("No files found", ...)
    std::string message;
};

/**
 * @brief Outcome of run_file_transfer()
 */
struct transfer_outcome {
    bool success = false;
    std::optional<std::string> error;
    /// Every regular file under the download directory after the run
    std::vector<std::filesystem::path> files_downloaded;
    transfer_metadata metadata;
};

/**
 * @brief Collaborators of the pipeline, replaceable in tests
 */
struct pipeline_dependencies {
    connection_factory connect = default_connection_factory();
    sleep_function sleeper = default_sleeper();
};

/**
 * @brief Run the whole pipeline into @p download_dir
 *
 * local_download_path is overridden with @p download_dir. The connection is
 * closed before returning. Exceptions are converted into a failed outcome.
 */
[[nodiscard]] auto run_file_transfer(const transfer_config& config,
                                     const std::filesystem::path& download_dir,
                                     const pipeline_dependencies& deps = {})
    -> transfer_outcome;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_PIPELINE_FILE_TRANSFER_PIPELINE_H
