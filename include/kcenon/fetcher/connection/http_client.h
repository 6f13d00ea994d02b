/**
 * @file http_client.h
 * @brief HTTP transport used by the S3 remote filesystem
 * @version 0.1.0
 *
 * The S3 backend talks to the object store through http_client_interface so
 * tests can substitute a scripted client. The default http_client wraps the
 * network_system HTTP client when it is available and libcurl otherwise.
 */

#ifndef KCENON_FETCHER_CONNECTION_HTTP_CLIENT_H
#define KCENON_FETCHER_CONNECTION_HTTP_CLIENT_H

#include "kcenon/fetcher/core/types.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Header value by name (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string>;

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Minimal HTTP client contract
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    [[nodiscard]] virtual auto get(
        const std::string& url,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto put(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto del(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

/**
 * @brief Default HTTP client
 *
 * @note Thread-safe for concurrent requests.
 */
class http_client : public http_client_interface {
public:
    explicit http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~http_client() override;

    http_client(const http_client&) = delete;
    auto operator=(const http_client&) -> http_client& = delete;
    http_client(http_client&&) noexcept;
    auto operator=(http_client&&) noexcept -> http_client&;

    [[nodiscard]] auto get(
        const std::string& url,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto del(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Whether any HTTP transport was compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client>;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONNECTION_HTTP_CLIENT_H
