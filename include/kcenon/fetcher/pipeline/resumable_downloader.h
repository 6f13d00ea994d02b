/**
 * @file resumable_downloader.h
 * @brief Size-verified downloads with retry, reconnection and resume state
 * @version 0.1.0
 *
 * Files already recorded as processed for the configured
 * (instance_id, channel_id) key are not downloaded again. State is saved
 * after every successful file and cleared once a run finishes with no
 * failed and no skipped files.
 */

#ifndef KCENON_FETCHER_PIPELINE_RESUMABLE_DOWNLOADER_H
#define KCENON_FETCHER_PIPELINE_RESUMABLE_DOWNLOADER_H

#include "directory_lister.h"
#include "transfer_state_store.h"
#include "kcenon/fetcher/config/transfer_config.h"
#include "kcenon/fetcher/connection/connection_resolver.h"
#include "kcenon/fetcher/core/file_entry.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief Outcome of one download run
 */
struct download_report {
    /// Files skipped because a previous run already downloaded them
    std::size_t resumed_count = 0;
    /// Downloaded files, including resumed ones
    std::size_t success_count = 0;
    /// Existing local files left untouched (overwrite disabled)
    std::size_t skipped_count = 0;
    /// Files that exhausted their retries
    std::size_t failed_count = 0;
    /// Files attempted in this run
    std::size_t total_count = 0;

    std::vector<std::filesystem::path> downloaded_files;
    std::vector<std::string> skipped_files;
    std::vector<std::string> failed_files;

    /// Files that still need a later run
    [[nodiscard]] auto outstanding() const -> std::size_t { return skipped_count + failed_count; }
};

/**
 * @brief Downloader bound to one transfer configuration
 */
class resumable_downloader {
public:
    explicit resumable_downloader(transfer_config config,
                                  connection_factory reconnect = default_connection_factory(),
                                  sleep_function sleeper = default_sleeper());

    /**
     * @brief Download @p files in order
     *
     * @p fs is replaced when the handle dies and a reconnect succeeds; the
     * caller owns and closes whatever handle it holds afterwards.
     */
    [[nodiscard]] auto download(std::shared_ptr<remote_filesystem>& fs, const file_list& files)
        -> download_report;

    /**
     * @brief Local destination of @p file under local_download_path
     */
    [[nodiscard]] auto local_path_for(const file_entry& file) const -> std::filesystem::path;

    [[nodiscard]] auto state_key() const -> transfer_state_key;

    [[nodiscard]] auto state_store() -> transfer_state_store& { return store_; }

private:
    enum class attempt_outcome {
        downloaded,
        failed
    };

    [[nodiscard]] auto download_one(std::shared_ptr<remote_filesystem>& fs,
                                    const file_entry& file,
                                    const std::filesystem::path& local_path,
                                    const std::string& progress) -> attempt_outcome;
    void rename_remote(remote_filesystem& fs, const file_entry& file);
    void persist(const std::vector<std::string>& processed,
                 const std::vector<std::string>& remaining);

    transfer_config config_;
    connection_factory reconnect_;
    sleep_function sleeper_;
    transfer_state_store store_;
};

/**
 * @brief Remote path of a renamed file: <dir>/<prefix>_<name>
 */
[[nodiscard]] auto renamed_remote_path(const std::string& remote_path, const std::string& prefix)
    -> std::string;

/**
 * @brief Download @p files with the download settings of @p config
 */
[[nodiscard]] auto download_files(std::shared_ptr<remote_filesystem>& fs, const file_list& files,
                                  const transfer_config& config) -> download_report;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_PIPELINE_RESUMABLE_DOWNLOADER_H
