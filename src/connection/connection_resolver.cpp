/**
 * @file connection_resolver.cpp
 * @brief Implementation of create_connection and failure classification
 * @version 0.1.0
 */

#include "kcenon/fetcher/connection/connection_resolver.h"
#include "kcenon/fetcher/connection/curl_filesystem.h"
#include "kcenon/fetcher/connection/local_filesystem.h"
#include "kcenon/fetcher/connection/s3_filesystem.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace kcenon::fetcher {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto contains_any(const std::string& haystack, std::initializer_list<const char*> needles)
    -> bool {
    return std::any_of(needles.begin(), needles.end(), [&](const char* needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

auto kind_from_code(error_code code) -> std::optional<connection_failure_kind> {
    switch (code) {
        case error_code::connection_timeout: return connection_failure_kind::timeout;
        case error_code::host_not_found: return connection_failure_kind::host_not_found;
        case error_code::connection_refused: return connection_failure_kind::connection_refused;
        case error_code::network_unreachable: return connection_failure_kind::network_unreachable;
        case error_code::authentication_failed: return connection_failure_kind::authentication_failed;
        case error_code::passive_mode_error: return connection_failure_kind::passive_mode;
        case error_code::data_connection_failed: return connection_failure_kind::data_connection;
        case error_code::ssh_handshake_failed: return connection_failure_kind::ssh_handshake;
        case error_code::ssh_key_rejected: return connection_failure_kind::ssh_key_authentication;
        case error_code::permission_denied: return connection_failure_kind::permission_denied;
        default: return std::nullopt;
    }
}

auto kind_from_message(const std::string& message) -> connection_failure_kind {
    auto text = to_lower(message);

    if (contains_any(text, {"timeout", "timed out"})) {
        return connection_failure_kind::timeout;
    }
    if (contains_any(text, {"name or service not known", "nodename nor servname provided",
                            "getaddrinfo failed", "could not resolve host",
                            "couldn't resolve host"})) {
        return connection_failure_kind::host_not_found;
    }
    if (contains_any(text, {"refused"})) {
        return connection_failure_kind::connection_refused;
    }
    if (contains_any(text, {"unreachable"})) {
        return connection_failure_kind::network_unreachable;
    }
    if (contains_any(text, {"authentication failed", "login incorrect", "access denied",
                            "login failed", "login denied"})) {
        return connection_failure_kind::authentication_failed;
    }
    if (contains_any(text, {"passive mode", "pasv"})) {
        return connection_failure_kind::passive_mode;
    }
    if (contains_any(text, {"data connection"})) {
        return connection_failure_kind::data_connection;
    }
    if (text.find("ssh") != std::string::npos &&
        contains_any(text, {"handshake", "protocol"})) {
        return connection_failure_kind::ssh_handshake;
    }
    if (text.find("key") != std::string::npos &&
        text.find("authentication") != std::string::npos) {
        return connection_failure_kind::ssh_key_authentication;
    }
    if (contains_any(text, {"permission denied"})) {
        return connection_failure_kind::permission_denied;
    }
    return connection_failure_kind::generic;
}

auto render_connection_failure(connection_failure_kind kind, const std::string& host,
                               const std::string& raw) -> std::string {
    switch (kind) {
        case connection_failure_kind::timeout:
            return "Connection Timeout: Unable to connect to " + host +
                   " within the specified timeout period";
        case connection_failure_kind::host_not_found:
            return "Host Not Found: Unable to resolve hostname " + host +
                   ". Please check the hostname and network connectivity";
        case connection_failure_kind::connection_refused:
            return "Connection Refused: The server at " + host +
                   " refused the connection. Please check if the service is running "
                   "and the port is correct";
        case connection_failure_kind::network_unreachable:
            return "Network Unreachable: Cannot reach " + host +
                   ". Please check your network connectivity";
        case connection_failure_kind::authentication_failed:
            return "Authentication Failed: Invalid credentials for " + host +
                   ". Please check username and password";
        case connection_failure_kind::passive_mode:
            return "FTP Passive Mode Error: Data connection failed for " + host +
                   ". Try disabling passive mode";
        case connection_failure_kind::data_connection:
            return "FTP Data Connection Failed: Unable to establish data channel to " + host;
        case connection_failure_kind::ssh_handshake:
            return "SSH Protocol Error: SSH handshake failed with " + host +
                   ". Check SSH version compatibility";
        case connection_failure_kind::ssh_key_authentication:
            return "SSH Key Authentication Failed: Invalid SSH key for " + host +
                   ". Falling back to password authentication";
        case connection_failure_kind::permission_denied:
            return "Permission Denied: Insufficient permissions to access " + host;
        default:
            return "Connection Error: " + raw;
    }
}

auto probe_path(const transfer_config& config) -> std::string {
    return config.path.empty() ? "/" : config.path;
}

auto failed(std::string message) -> resolved_connection {
    resolved_connection result;
    result.failure = std::move(message);
    return result;
}

auto connect_local(const transfer_config& config) -> resolved_connection {
    auto path = config.path.empty() ? std::string("./") : config.path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        FETCHER_LOG_WARN(log_category::connection, "Local path does not exist: " + path);
        std::filesystem::create_directories(path, ec);
        if (ec) {
            auto failure = classify_connection_error(
                error{error_code::permission_denied, ec.message()}, "localhost");
            return failed(failure.message);
        }
    }

    auto fs = std::make_shared<local_filesystem>();
    auto probe = fs->list(path);
    if (!probe) {
        return failed(classify_connection_error(probe.error(), "localhost").message);
    }

    resolved_connection result;
    result.filesystem = std::move(fs);
    return result;
}

auto connect_curl(const transfer_config& config, const std::string& type)
    -> resolved_connection {
    const auto& conn = config.connection;

    curl_session_settings settings;
    settings.protocol = type;
    settings.host = conn.host;
    settings.port = conn.effective_port();
    settings.user = conn.user;
    settings.pass = conn.pass;
    settings.passive = conn.passive;
    settings.connection_timeout = conn.connection_timeout;

    auto fs = std::make_shared<curl_filesystem>(settings);
    auto probe = fs->list(probe_path(config));
    if (!probe) {
        fs->close();
        return failed(classify_connection_error(probe.error(), conn.host).message);
    }

    resolved_connection result;
    result.filesystem = std::move(fs);
    result.options = {
        {"host", conn.host},
        {"username", conn.user},
        {"port", std::to_string(settings.port)},
        {"timeout", std::to_string(conn.connection_timeout.count())},
    };
    if (type == "ftp") {
        result.options["use_passive_mode"] = conn.passive ? "true" : "false";
    }
    return result;
}

auto connect_s3(const transfer_config& config, const connection_dependencies& deps)
    -> resolved_connection {
    const auto& conn = config.connection;
    if (conn.bucket.empty()) {
        return failed("No bucket specified in S3 configuration");
    }

    s3_settings settings;
    settings.bucket = conn.bucket;
    settings.region = conn.region.empty() ? "us-east-1" : conn.region;
    settings.access_key_id = conn.access_key_id;
    settings.secret_access_key = conn.secret_access_key;
    settings.session_token = conn.session_token;
    settings.endpoint = conn.endpoint;

    std::shared_ptr<http_client_interface> http = deps.http;
    if (!http) {
        http = make_http_client(
            std::chrono::duration_cast<std::chrono::milliseconds>(conn.connection_timeout));
    }

    auto fs = std::make_shared<s3_filesystem>(settings, std::move(http));
    auto probe = fs->list(conn.bucket + "/");
    if (!probe) {
        return failed(classify_s3_error(probe.error(), conn.bucket).message);
    }

    resolved_connection result;
    result.filesystem = std::move(fs);
    result.options = {{"bucket", settings.bucket}, {"region", settings.region}};
    return result;
}

}  // namespace

auto classify_connection_error(const error& err, const std::string& host)
    -> classified_failure<connection_failure_kind> {
    auto kind = kind_from_code(err.code).value_or(kind_from_message(err.message));
    return {kind, render_connection_failure(kind, host, err.message)};
}

auto classify_s3_error(const error& err, const std::string& bucket)
    -> classified_failure<s3_failure_kind> {
    auto text = to_lower(err.message);

    s3_failure_kind kind = s3_failure_kind::generic;
    if (err.code == error_code::authentication_failed ||
        contains_any(text, {"access denied", "invalid access key", "signature does not match"})) {
        kind = s3_failure_kind::authentication_failed;
    } else if (err.code == error_code::bucket_not_found ||
               contains_any(text, {"no such bucket", "bucket does not exist"})) {
        kind = s3_failure_kind::bucket_not_found;
    } else if (err.code == error_code::region_mismatch ||
               contains_any(text, {"incorrect region", "region"})) {
        kind = s3_failure_kind::region_mismatch;
    } else if (err.code == error_code::connection_timeout ||
               contains_any(text, {"timeout", "timed out"})) {
        kind = s3_failure_kind::timeout;
    }

    switch (kind) {
        case s3_failure_kind::authentication_failed:
            return {kind, "S3 Authentication Failed: Invalid AWS credentials or insufficient "
                          "permissions for bucket " + bucket};
        case s3_failure_kind::bucket_not_found:
            return {kind, "S3 Bucket Not Found: Bucket '" + bucket +
                          "' does not exist or you don't have access to it"};
        case s3_failure_kind::region_mismatch:
            return {kind, "S3 Region Error: Bucket '" + bucket +
                          "' is in a different region. Please check the region configuration"};
        case s3_failure_kind::timeout:
            return {kind, "S3 Connection Timeout: Unable to connect to S3 service"};
        default:
            return {kind, "S3 Error: " + err.message};
    }
}

auto create_connection(const transfer_config& config, const connection_dependencies& deps)
    -> resolved_connection {
    auto type = config.connection.type;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (type.empty()) {
        FETCHER_LOG_ERROR(log_category::connection, "Connection type not specified in config");
        return failed("Connection type not specified in config");
    }

    FETCHER_LOG_INFO(log_category::connection, "Creating " + type + " connection");

    resolved_connection result;
    try {
        if (type == "local") {
            result = connect_local(config);
        } else if (type == "ftp" || type == "sftp") {
            result = connect_curl(config, type);
        } else if (type == "s3") {
            result = connect_s3(config, deps);
        } else {
            result = failed("Unsupported connection type: " + type);
        }
    } catch (const std::exception& e) {
        result = failed(type == "s3"
            ? classify_s3_error(error{error_code::connection_failed, e.what()},
                                config.connection.bucket).message
            : classify_connection_error(error{error_code::connection_failed, e.what()},
                                        config.connection.host).message);
    }

    if (!result) {
        fetch_log_context ctx;
        ctx.host = type == "s3" ? config.connection.bucket : config.connection.host;
        ctx.error_message = result.failure;
        FETCHER_LOG_ERROR_CTX(log_category::connection,
            "Failed to connect to " + type + ": " + result.failure, ctx);
        result.options.clear();
        return result;
    }

    FETCHER_LOG_INFO(log_category::connection, "Successfully connected to " + type);
    return result;
}

auto default_connection_factory() -> connection_factory {
    return [](const transfer_config& config) { return create_connection(config); };
}

}  // namespace kcenon::fetcher
