/**
 * @file remote_filesystem.h
 * @brief Abstract interface over the file sources a job can fetch from
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_CONNECTION_REMOTE_FILESYSTEM_H
#define KCENON_FETCHER_CONNECTION_REMOTE_FILESYSTEM_H

#include "kcenon/fetcher/core/file_entry.h"
#include "kcenon/fetcher/core/types.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief Modification time as reported by a backend
 *
 * Backends report either a parsed time point, a POSIX epoch in seconds, or
 * nothing at all; the directory lister normalizes the three forms.
 */
using remote_mtime = std::variant<std::monostate,
                                  std::chrono::system_clock::time_point,
                                  double>;

/**
 * @brief One entry of a directory listing
 */
struct remote_entry {
    std::string name;
    std::string path;
    entry_type type = entry_type::file;
    uint64_t size = 0;
    remote_mtime mtime;
};

/**
 * @brief Remote filesystem interface
 *
 * Paths are absolute within the source ('/' separated). For object stores
 * the first component is the bucket.
 */
class remote_filesystem {
public:
    virtual ~remote_filesystem() = default;

    /**
     * @brief List the direct children of a directory
     */
    [[nodiscard]] virtual auto list(const std::string& path)
        -> result<std::vector<remote_entry>> = 0;

    /**
     * @brief Copy a remote file to a local path, replacing any existing file
     */
    [[nodiscard]] virtual auto download(const std::string& remote_path,
                                        const std::filesystem::path& local_path)
        -> result<void> = 0;

    /**
     * @brief Rename (move) a remote file
     */
    [[nodiscard]] virtual auto rename(const std::string& from, const std::string& to)
        -> result<void> = 0;

    /**
     * @brief Whether the handle can still serve requests
     */
    [[nodiscard]] virtual auto is_alive() const -> bool = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual auto protocol() const -> std::string_view = 0;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONNECTION_REMOTE_FILESYSTEM_H
