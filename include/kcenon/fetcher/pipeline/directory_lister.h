/**
 * @file directory_lister.h
 * @brief Recursive remote directory walk with per-directory retry
 * @version 0.1.0
 *
 * A directory whose listing keeps failing is abandoned after the configured
 * number of retries; the walk continues with its siblings.
 */

#ifndef KCENON_FETCHER_PIPELINE_DIRECTORY_LISTER_H
#define KCENON_FETCHER_PIPELINE_DIRECTORY_LISTER_H

#include "kcenon/fetcher/config/transfer_config.h"
#include "kcenon/fetcher/connection/remote_filesystem.h"
#include "kcenon/fetcher/core/file_entry.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief Blocking delay used between retries (injectable for tests)
 */
using sleep_function = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Default sleeper backed by std::this_thread::sleep_for
 */
[[nodiscard]] auto default_sleeper() -> sleep_function;

/**
 * @brief Directory lister tuning
 */
struct lister_options {
    /// Retries after the first failed listing of one directory
    int max_retries = 3;
    /// Delay before the first retry; doubles for each further retry
    std::chrono::milliseconds base_delay{500};
    /// Wall-clock ceiling for the whole walk (0 = unlimited)
    std::chrono::seconds deadline{0};
    /// Directory base names that are never entered
    std::vector<std::string> exclude_folders;
    /// List only the root directory
    bool skip_sub_folders = false;

    [[nodiscard]] static auto from_config(const transfer_config& config) -> lister_options;
};

/**
 * @brief Outcome of one walk
 */
struct listing_result {
    file_list files;
    /// Directories skipped because of excludeFolders
    std::vector<std::string> skipped_folders;
    /// Directories abandoned after exhausting retries
    std::vector<std::string> failed_directories;
    /// Walk stopped early by the deadline
    bool deadline_reached = false;
};

/**
 * @brief Recursive lister over a remote_filesystem
 */
class directory_lister {
public:
    explicit directory_lister(lister_options options, sleep_function sleeper = default_sleeper());

    /**
     * @brief Walk @p root depth first
     */
    [[nodiscard]] auto list(remote_filesystem& fs, const std::string& root) const
        -> listing_result;

    /**
     * @brief Delay before retry number @p retry (1-based)
     */
    [[nodiscard]] auto retry_delay(int retry) const -> std::chrono::milliseconds;

    [[nodiscard]] auto options() const -> const lister_options& { return options_; }

private:
    struct walk_state;

    void walk(remote_filesystem& fs, const std::string& path, int depth,
              walk_state& state) const;
    [[nodiscard]] auto is_excluded(const std::string& dir_path) const -> bool;

    lister_options options_;
    sleep_function sleeper_;
};

/**
 * @brief Root path of the walk, prefixed with the bucket for object stores
 */
[[nodiscard]] auto resolve_listing_root(const transfer_config& config) -> std::string;

/**
 * @brief Normalize a backend timestamp, falling back to @p now
 */
[[nodiscard]] auto normalize_mtime(const remote_mtime& mtime,
                                   std::chrono::system_clock::time_point now)
    -> std::chrono::system_clock::time_point;

/**
 * @brief "1.50 MB", "2.00 KB" or "512 Bytes"
 */
[[nodiscard]] auto format_file_size(uint64_t size) -> std::string;

/**
 * @brief List every file reachable from the configured root
 */
[[nodiscard]] auto list_files(remote_filesystem& fs, const transfer_config& config,
                              sleep_function sleeper = default_sleeper()) -> listing_result;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_PIPELINE_DIRECTORY_LISTER_H
