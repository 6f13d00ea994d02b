/**
 * @file s3_filesystem.cpp
 * @brief Implementation of s3_filesystem
 * @version 0.1.0
 */

#include "kcenon/fetcher/connection/s3_filesystem.h"
#include "kcenon/fetcher/connection/s3_utils.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace kcenon::fetcher {

using namespace s3_utils;

namespace {

auto trim(const std::string& value) -> std::string {
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto code_for_s3_error(const std::string& s3_code, int status) -> error_code {
    if (s3_code == "AccessDenied" || s3_code == "InvalidAccessKeyId" ||
        s3_code == "SignatureDoesNotMatch" || s3_code == "ExpiredToken" ||
        s3_code == "InvalidToken") {
        return error_code::authentication_failed;
    }
    if (s3_code == "NoSuchBucket") {
        return error_code::bucket_not_found;
    }
    if (s3_code == "PermanentRedirect" || s3_code == "AuthorizationHeaderMalformed" ||
        s3_code == "IllegalLocationConstraintException") {
        return error_code::region_mismatch;
    }
    if (s3_code == "NoSuchKey") {
        return error_code::path_not_found;
    }
    if (s3_code == "RequestTimeout") {
        return error_code::connection_timeout;
    }

    switch (status) {
        case 301: return error_code::region_mismatch;
        case 401:
        case 403: return error_code::authentication_failed;
        case 404: return error_code::path_not_found;
        case 408: return error_code::connection_timeout;
        default: return error_code::connection_failed;
    }
}

}  // namespace

s3_filesystem::s3_filesystem(s3_settings settings,
                             std::shared_ptr<http_client_interface> http,
                             clock_fn clock)
    : settings_(std::move(settings))
    , http_(std::move(http))
    , clock_(clock ? std::move(clock) : clock_fn([] { return std::chrono::system_clock::now(); })) {}

auto s3_filesystem::split_path(const std::string& path)
    -> std::pair<std::string, std::string> {
    auto start = path.find_first_not_of('/');
    if (start == std::string::npos) {
        return {"", ""};
    }
    auto slash = path.find('/', start);
    if (slash == std::string::npos) {
        return {path.substr(start), ""};
    }
    return {path.substr(start, slash - start), path.substr(slash + 1)};
}

auto s3_filesystem::target_for(const std::string& bucket, const std::string& key) const
    -> request_target {
    request_target target;
    auto encoded_key = url_encode(key, false);

    if (settings_.endpoint.empty()) {
        target.host = bucket + ".s3." + settings_.region + ".amazonaws.com";
        target.canonical_uri = "/" + encoded_key;
        target.url = "https://" + target.host + target.canonical_uri;
        return target;
    }

    std::string scheme = "https";
    std::string host = settings_.endpoint;
    auto sep = host.find("://");
    if (sep != std::string::npos) {
        scheme = host.substr(0, sep);
        host = host.substr(sep + 3);
    }
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }

    target.host = host;
    target.canonical_uri = "/" + url_encode(bucket, false);
    if (!key.empty()) {
        target.canonical_uri += "/" + encoded_key;
    }
    target.url = scheme + "://" + host + target.canonical_uri;
    return target;
}

auto s3_filesystem::sign_request(const std::string& method,
                                 const std::string& bucket,
                                 const std::string& key,
                                 const std::map<std::string, std::string>& query,
                                 std::map<std::string, std::string> extra_headers,
                                 const std::string& payload) const
    -> std::map<std::string, std::string> {
    auto target = target_for(bucket, key);
    auto now = clock_();
    auto amz_date = format_amz_date(now);
    auto date_stamp = format_date_stamp(now);
    auto payload_hash = bytes_to_hex(sha256(payload));

    std::map<std::string, std::string> headers = std::move(extra_headers);
    headers["Host"] = target.host;
    headers["x-amz-date"] = amz_date;
    headers["x-amz-content-sha256"] = payload_hash;
    if (!settings_.session_token.empty()) {
        headers["x-amz-security-token"] = settings_.session_token;
    }

    // Canonical headers are sorted by lowercase name
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [name, value] : headers) {
        sorted_headers[to_lower(name)] = trim(value);
    }

    std::ostringstream canonical_headers;
    std::ostringstream signed_headers_builder;
    bool first = true;
    for (const auto& [name, value] : sorted_headers) {
        canonical_headers << name << ":" << value << "\n";
        if (!first) signed_headers_builder << ";";
        signed_headers_builder << name;
        first = false;
    }
    auto signed_headers = signed_headers_builder.str();

    std::ostringstream canonical_request;
    canonical_request << method << "\n";
    canonical_request << target.canonical_uri << "\n";
    canonical_request << canonical_query(query) << "\n";
    canonical_request << canonical_headers.str() << "\n";
    canonical_request << signed_headers << "\n";
    canonical_request << payload_hash;

    std::string algorithm = "AWS4-HMAC-SHA256";
    std::string credential_scope = date_stamp + "/" + settings_.region + "/s3/aws4_request";

    std::ostringstream string_to_sign;
    string_to_sign << algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << credential_scope << "\n";
    string_to_sign << bytes_to_hex(sha256(canonical_request.str()));

    auto k_date = hmac_sha256("AWS4" + settings_.secret_access_key, date_stamp);
    auto k_region = hmac_sha256(k_date, settings_.region);
    auto k_service = hmac_sha256(k_region, "s3");
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    auto signature = hmac_sha256(k_signing, string_to_sign.str());

    std::ostringstream auth_header;
    auth_header << algorithm << " ";
    auth_header << "Credential=" << settings_.access_key_id << "/" << credential_scope << ", ";
    auth_header << "SignedHeaders=" << signed_headers << ", ";
    auth_header << "Signature=" << bytes_to_hex(signature);

    headers["Authorization"] = auth_header.str();
    return headers;
}

auto s3_filesystem::error_from_response(const http_response& response,
                                        const std::string& context) const -> error {
    auto body = response.get_body_string();
    auto s3_code = extract_xml_element(body, "Code").value_or("");
    auto s3_message = extract_xml_element(body, "Message").value_or("");

    std::ostringstream oss;
    oss << context << " failed (HTTP " << response.status_code << ")";
    if (!s3_code.empty()) {
        oss << ": " << s3_code;
    }
    if (!s3_message.empty()) {
        oss << ": " << s3_message;
    }
    return error{code_for_s3_error(s3_code, response.status_code), oss.str()};
}

auto s3_filesystem::list(const std::string& path) -> result<std::vector<remote_entry>> {
    if (closed_) {
        return unexpected{error{error_code::connection_closed, "S3 handle is closed"}};
    }

    auto [bucket, prefix] = split_path(path);
    if (bucket.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "S3 path '" + path + "' does not name a bucket"}};
    }
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }

    std::vector<remote_entry> entries;
    std::string continuation;

    do {
        std::map<std::string, std::string> query{
            {"list-type", "2"},
            {"delimiter", "/"},
            {"prefix", prefix},
        };
        if (!continuation.empty()) {
            query["continuation-token"] = continuation;
        }

        auto target = target_for(bucket, "");
        auto headers = sign_request("GET", bucket, "", query, {}, "");
        auto response = http_->get(target.url, query, headers);
        if (!response) {
            return unexpected{response.error()};
        }
        if (!response.value().is_success()) {
            return unexpected{error_from_response(response.value(),
                "ListObjectsV2 " + bucket + "/" + prefix)};
        }

        auto body = response.value().get_body_string();

        for (const auto& block : extract_xml_blocks(body, "Contents")) {
            auto key = extract_xml_element(block, "Key").value_or("");
            if (key.empty() || key == prefix) {
                continue;
            }

            remote_entry entry;
            entry.name = key.substr(prefix.size());
            entry.path = bucket + "/" + key;
            entry.type = entry_type::file;
            try {
                entry.size = std::stoull(extract_xml_element(block, "Size").value_or("0"));
            } catch (const std::exception&) {
                entry.size = 0;
            }
            if (auto modified = extract_xml_element(block, "LastModified")) {
                if (auto tp = parse_iso8601_utc(*modified)) {
                    entry.mtime = *tp;
                }
            }
            entries.push_back(std::move(entry));
        }

        for (const auto& block : extract_xml_blocks(body, "CommonPrefixes")) {
            auto sub = extract_xml_element(block, "Prefix").value_or("");
            while (!sub.empty() && sub.back() == '/') {
                sub.pop_back();
            }
            if (sub.size() <= prefix.size()) {
                continue;
            }

            remote_entry entry;
            entry.name = sub.substr(prefix.size());
            entry.path = bucket + "/" + sub;
            entry.type = entry_type::directory;
            entries.push_back(std::move(entry));
        }

        continuation.clear();
        if (extract_xml_element(body, "IsTruncated").value_or("false") == "true") {
            continuation = extract_xml_element(body, "NextContinuationToken").value_or("");
        }
    } while (!continuation.empty());

    return entries;
}

auto s3_filesystem::download(const std::string& remote_path,
                             const std::filesystem::path& local_path) -> result<void> {
    if (closed_) {
        return unexpected{error{error_code::connection_closed, "S3 handle is closed"}};
    }

    auto [bucket, key] = split_path(remote_path);
    if (bucket.empty() || key.empty()) {
        return unexpected{error{error_code::download_failed,
            "S3 path '" + remote_path + "' does not name an object"}};
    }

    auto target = target_for(bucket, key);
    auto headers = sign_request("GET", bucket, key, {}, {}, "");
    auto response = http_->get(target.url, {}, headers);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return unexpected{error_from_response(response.value(), "GetObject " + remote_path)};
    }

    std::error_code ec;
    if (local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path(), ec);
    }

    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected{error{error_code::local_write_error,
            "cannot open '" + local_path.string() + "' for writing"}};
    }
    const auto& body = response.value().body;
    out.write(reinterpret_cast<const char*>(body.data()),
              static_cast<std::streamsize>(body.size()));
    if (!out) {
        return unexpected{error{error_code::local_write_error,
            "write to '" + local_path.string() + "' failed"}};
    }
    return {};
}

auto s3_filesystem::rename(const std::string& from, const std::string& to) -> result<void> {
    if (closed_) {
        return unexpected{error{error_code::connection_closed, "S3 handle is closed"}};
    }

    auto [src_bucket, src_key] = split_path(from);
    auto [dst_bucket, dst_key] = split_path(to);
    if (src_key.empty() || dst_key.empty()) {
        return unexpected{error{error_code::rename_failed,
            "S3 rename needs object paths, got '" + from + "' -> '" + to + "'"}};
    }

    auto copy_target = target_for(dst_bucket, dst_key);
    auto copy_headers = sign_request(
        "PUT", dst_bucket, dst_key, {},
        {{"x-amz-copy-source", "/" + src_bucket + "/" + url_encode(src_key, false)}}, "");
    auto copied = http_->put(copy_target.url, "", copy_headers);
    if (!copied) {
        return unexpected{error{error_code::rename_failed, copied.error().message}};
    }
    // CopyObject can report failure inside a 200 response
    if (!copied.value().is_success() ||
        copied.value().get_body_string().find("<Error>") != std::string::npos) {
        auto err = error_from_response(copied.value(), "CopyObject " + from);
        return unexpected{error{error_code::rename_failed, err.message}};
    }

    auto delete_target = target_for(src_bucket, src_key);
    auto delete_headers = sign_request("DELETE", src_bucket, src_key, {}, {}, "");
    auto deleted = http_->del(delete_target.url, delete_headers);
    if (!deleted) {
        return unexpected{error{error_code::rename_failed, deleted.error().message}};
    }
    if (!deleted.value().is_success()) {
        auto err = error_from_response(deleted.value(), "DeleteObject " + from);
        return unexpected{error{error_code::rename_failed, err.message}};
    }

    FETCHER_LOG_DEBUG(log_category::connection, "Renamed " + from + " -> " + to);
    return {};
}

}  // namespace kcenon::fetcher
