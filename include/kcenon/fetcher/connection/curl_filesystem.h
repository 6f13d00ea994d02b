/**
 * @file curl_filesystem.h
 * @brief FTP and SFTP remote filesystem over libcurl
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_CONNECTION_CURL_FILESYSTEM_H
#define KCENON_FETCHER_CONNECTION_CURL_FILESYSTEM_H

#include "remote_filesystem.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace kcenon::fetcher {

/**
 * @brief FTP/SFTP session parameters
 */
struct curl_session_settings {
    /// "ftp" or "sftp"
    std::string protocol = "ftp";
    std::string host;
    int port = 21;
    std::string user;
    std::string pass;
    /// FTP passive mode (EPSV/PASV); active mode uses PORT
    bool passive = true;
    std::chrono::seconds connection_timeout{30};
};

/**
 * @brief Remote filesystem backed by a libcurl easy handle
 *
 * One handle is reused for all requests so the control connection stays open
 * between calls. A transport-level failure marks the handle dead; callers
 * are expected to build a new instance to reconnect.
 *
 * @note Calls are serialized internally.
 */
class curl_filesystem : public remote_filesystem {
public:
    explicit curl_filesystem(curl_session_settings settings);
    ~curl_filesystem() override;

    curl_filesystem(const curl_filesystem&) = delete;
    auto operator=(const curl_filesystem&) -> curl_filesystem& = delete;

    [[nodiscard]] auto list(const std::string& path)
        -> result<std::vector<remote_entry>> override;
    [[nodiscard]] auto download(const std::string& remote_path,
                                const std::filesystem::path& local_path)
        -> result<void> override;
    [[nodiscard]] auto rename(const std::string& from, const std::string& to)
        -> result<void> override;
    [[nodiscard]] auto is_alive() const -> bool override;
    void close() override;
    [[nodiscard]] auto protocol() const -> std::string_view override;

    /**
     * @brief Parse a LIST response (Unix "ls -l" or DOS "dir" format)
     *
     * Lines that cannot be parsed, "." and ".." are skipped. Times without a
     * year are placed in the most recent year that is not in the future.
     * Listing times are taken as UTC.
     *
     * @param text Raw listing
     * @param directory Listed directory, used to build entry paths
     * @param now Reference time for year inference
     */
    [[nodiscard]] static auto parse_listing(const std::string& text,
                                            const std::string& directory,
                                            std::chrono::system_clock::time_point now)
        -> std::vector<remote_entry>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONNECTION_CURL_FILESYSTEM_H
