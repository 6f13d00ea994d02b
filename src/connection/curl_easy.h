/**
 * @file curl_easy.h
 * @brief RAII wrappers and error mapping shared by the libcurl transports
 */

#ifndef KCENON_FETCHER_SRC_CONNECTION_CURL_EASY_H
#define KCENON_FETCHER_SRC_CONNECTION_CURL_EASY_H

#include "kcenon/fetcher/config/feature_flags.h"
#include "kcenon/fetcher/core/types.h"

#if FETCHER_HAS_CURL

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>

namespace kcenon::fetcher::detail {

struct curl_easy_deleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
using curl_easy_ptr = std::unique_ptr<CURL, curl_easy_deleter>;

struct curl_slist_deleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using curl_slist_ptr = std::unique_ptr<curl_slist, curl_slist_deleter>;

inline void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

inline auto make_curl_easy() -> curl_easy_ptr {
    ensure_curl_global_init();
    return curl_easy_ptr(curl_easy_init());
}

inline auto append_slist(curl_slist_ptr& list, const std::string& line) -> bool {
    curl_slist* appended = curl_slist_append(list.get(), line.c_str());
    if (!appended) {
        return false;
    }
    list.release();
    list.reset(appended);
    return true;
}

inline auto write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata)
    -> size_t {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

/**
 * @brief Map a libcurl status to the closest fetcher error code
 */
inline auto map_curl_code(CURLcode code) -> error_code {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return error_code::connection_timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
            return error_code::host_not_found;
        case CURLE_LOGIN_DENIED:
            return error_code::authentication_failed;
        case CURLE_REMOTE_ACCESS_DENIED:
            return error_code::permission_denied;
        case CURLE_FTP_WEIRD_PASV_REPLY:
        case CURLE_FTP_CANT_GET_HOST:
            return error_code::passive_mode_error;
        case CURLE_FTP_ACCEPT_FAILED:
        case CURLE_FTP_ACCEPT_TIMEOUT:
            return error_code::data_connection_failed;
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return error_code::path_not_found;
        case CURLE_SSH:
            return error_code::ssh_handshake_failed;
        case CURLE_WRITE_ERROR:
            return error_code::local_write_error;
        default:
            return error_code::connection_failed;
    }
}

/**
 * @brief Whether the failure means the session has to be re-established
 */
inline auto is_session_fatal(CURLcode code) -> bool {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSH:
        case CURLE_LOGIN_DENIED:
            return true;
        default:
            return false;
    }
}

inline auto curl_error_message(CURLcode code, const char* errbuf) -> std::string {
    std::string message = curl_easy_strerror(code);
    if (errbuf && errbuf[0] != '\0') {
        message += ": ";
        message += errbuf;
    }
    return message;
}

}  // namespace kcenon::fetcher::detail

#endif  // FETCHER_HAS_CURL

#endif  // KCENON_FETCHER_SRC_CONNECTION_CURL_EASY_H
