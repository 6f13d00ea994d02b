/**
 * @file s3_filesystem.h
 * @brief remote_filesystem over the S3 REST API
 * @version 0.1.0
 *
 * Paths have the form "bucket/key/..." (a leading '/' is ignored). Listing
 * uses ListObjectsV2 with '/' as delimiter, so common prefixes surface as
 * directories. Requests are signed with AWS Signature Version 4.
 */

#ifndef KCENON_FETCHER_CONNECTION_S3_FILESYSTEM_H
#define KCENON_FETCHER_CONNECTION_S3_FILESYSTEM_H

#include "http_client.h"
#include "remote_filesystem.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace kcenon::fetcher {

/**
 * @brief Object store connection settings
 */
struct s3_settings {
    std::string bucket;
    std::string region = "us-east-1";
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    /// S3-compatible endpoint (host[:port], optional scheme); path-style addressing
    std::string endpoint;
};

class s3_filesystem : public remote_filesystem {
public:
    using clock_fn = std::function<std::chrono::system_clock::time_point()>;

    s3_filesystem(s3_settings settings,
                  std::shared_ptr<http_client_interface> http,
                  clock_fn clock = {});

    [[nodiscard]] auto list(const std::string& path)
        -> result<std::vector<remote_entry>> override;
    [[nodiscard]] auto download(const std::string& remote_path,
                                const std::filesystem::path& local_path)
        -> result<void> override;
    /// CopyObject followed by DeleteObject
    [[nodiscard]] auto rename(const std::string& from, const std::string& to)
        -> result<void> override;
    [[nodiscard]] auto is_alive() const -> bool override { return !closed_.load(); }
    void close() override { closed_ = true; }
    [[nodiscard]] auto protocol() const -> std::string_view override { return "s3"; }

    [[nodiscard]] auto settings() const -> const s3_settings& { return settings_; }

    /**
     * @brief Split "bucket/key" into its parts
     */
    [[nodiscard]] static auto split_path(const std::string& path)
        -> std::pair<std::string, std::string>;

    /**
     * @brief Headers (including Authorization) for a signed request
     */
    [[nodiscard]] auto sign_request(const std::string& method,
                                    const std::string& bucket,
                                    const std::string& key,
                                    const std::map<std::string, std::string>& query,
                                    std::map<std::string, std::string> extra_headers,
                                    const std::string& payload) const
        -> std::map<std::string, std::string>;

private:
    struct request_target {
        std::string url;        ///< scheme://host/uri, without query
        std::string host;       ///< Host header value
        std::string canonical_uri;
    };

    [[nodiscard]] auto target_for(const std::string& bucket, const std::string& key) const
        -> request_target;
    [[nodiscard]] auto error_from_response(const http_response& response,
                                           const std::string& context) const -> error;

    s3_settings settings_;
    std::shared_ptr<http_client_interface> http_;
    clock_fn clock_;
    std::atomic<bool> closed_{false};
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONNECTION_S3_FILESYSTEM_H
