/**
 * @file local_filesystem.h
 * @brief remote_filesystem backed by a locally mounted directory tree
 */

#ifndef KCENON_FETCHER_CONNECTION_LOCAL_FILESYSTEM_H
#define KCENON_FETCHER_CONNECTION_LOCAL_FILESYSTEM_H

#include "remote_filesystem.h"

#include <atomic>

namespace kcenon::fetcher {

class local_filesystem : public remote_filesystem {
public:
    local_filesystem() = default;

    [[nodiscard]] auto list(const std::string& path)
        -> result<std::vector<remote_entry>> override;
    [[nodiscard]] auto download(const std::string& remote_path,
                                const std::filesystem::path& local_path)
        -> result<void> override;
    [[nodiscard]] auto rename(const std::string& from, const std::string& to)
        -> result<void> override;
    [[nodiscard]] auto is_alive() const -> bool override { return !closed_.load(); }
    void close() override { closed_ = true; }
    [[nodiscard]] auto protocol() const -> std::string_view override { return "local"; }

private:
    std::atomic<bool> closed_{false};
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONNECTION_LOCAL_FILESYSTEM_H
