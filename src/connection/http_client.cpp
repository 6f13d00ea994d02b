/**
 * @file http_client.cpp
 * @brief Default HTTP client implementation
 * @version 0.1.0
 */

#include "kcenon/fetcher/connection/http_client.h"
#include "kcenon/fetcher/connection/s3_utils.h"
#include "kcenon/fetcher/config/feature_flags.h"

#include "curl_easy.h"

#include <algorithm>
#include <cctype>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::fetcher {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

auto http_response::get_header(const std::string& key) const -> std::optional<std::string> {
    auto it = headers.find(key);
    if (it != headers.end()) {
        return it->second;
    }

    auto lower_key = to_lower(key);
    for (const auto& [name, value] : headers) {
        if (to_lower(name) == lower_key) {
            return value;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Implementation
// ============================================================================

struct http_client::impl {
    std::chrono::milliseconds timeout;
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif

    explicit impl(std::chrono::milliseconds t) : timeout(t) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }
#elif FETCHER_HAS_CURL
    static auto collect_header(char* buffer, size_t size, size_t nitems, void* userdata)
        -> size_t {
        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        std::string line(buffer, size * nitems);
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            auto name = line.substr(0, colon);
            auto value = line.substr(colon + 1);
            auto first = value.find_first_not_of(" \t");
            auto last = value.find_last_not_of(" \t\r\n");
            value = first == std::string::npos ? "" : value.substr(first, last - first + 1);
            (*headers)[name] = value;
        }
        return size * nitems;
    }

    auto perform(const std::string& method,
                 const std::string& url,
                 const std::string* body,
                 const std::map<std::string, std::string>& headers)
        -> result<http_response> {
        auto handle = detail::make_curl_easy();
        if (!handle) {
            return unexpected{error{error_code::internal_error, "curl_easy_init failed"}};
        }

        detail::curl_slist_ptr header_list;
        for (const auto& [name, value] : headers) {
            if (!detail::append_slist(header_list, name + ": " + value)) {
                return unexpected{error{error_code::internal_error,
                    "failed to build request headers"}};
            }
        }

        std::string response_body;
        http_response response;
        char errbuf[CURL_ERROR_SIZE] = {0};

        CURL* curl = handle.get();
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &detail::write_to_string);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &impl::collect_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        if (method == "PUT") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body ? body->size() : 0));
        } else if (method != "GET") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        }

        auto code = curl_easy_perform(curl);
        if (code != CURLE_OK) {
            return unexpected{error{detail::map_curl_code(code),
                "HTTP " + method + " request failed: " +
                detail::curl_error_message(code, errbuf)}};
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
        response.body.assign(response_body.begin(), response_body.end());
        return response;
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

http_client::http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
auto http_client::operator=(http_client&&) noexcept -> http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto http_client::get(
    const std::string& url,
    const std::map<std::string, std::string>& query,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->get(url, query, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP GET request failed: " + response.error().message}};
    }
    return impl_->convert_response(response.value());
#elif FETCHER_HAS_CURL
    auto full_url = url;
    if (!query.empty()) {
        full_url += "?" + s3_utils::canonical_query(query);
    }
    return impl_->perform("GET", full_url, nullptr, headers);
#else
    (void)url;
    (void)query;
    (void)headers;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP client not available (no network_system or libcurl)"}};
#endif
}

auto http_client::put(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->put(url, body, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP PUT request failed: " + response.error().message}};
    }
    return impl_->convert_response(response.value());
#elif FETCHER_HAS_CURL
    return impl_->perform("PUT", url, &body, headers);
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP client not available (no network_system or libcurl)"}};
#endif
}

auto http_client::del(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->del(url, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP DELETE request failed: " + response.error().message}};
    }
    return impl_->convert_response(response.value());
#elif FETCHER_HAS_CURL
    return impl_->perform("DELETE", url, nullptr, headers);
#else
    (void)url;
    (void)headers;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP client not available (no network_system or libcurl)"}};
#endif
}

auto http_client::is_available() const noexcept -> bool {
#if KCENON_WITH_NETWORK_SYSTEM || FETCHER_HAS_CURL
    return true;
#else
    return false;
#endif
}

auto make_http_client(std::chrono::milliseconds timeout) -> std::shared_ptr<http_client> {
    return std::make_shared<http_client>(timeout);
}

}  // namespace kcenon::fetcher
