/**
 * @file types.h
 * @brief Core type definitions for fetcher_system
 */

#ifndef KCENON_FETCHER_CORE_TYPES_H
#define KCENON_FETCHER_CORE_TYPES_H

#include <optional>
#include <string>
#include <utility>

namespace kcenon::fetcher {

/**
 * @brief Error codes for fetch operations
 */
enum class error_code {
    success = 0,

    // Configuration errors (-100 to -119)
    invalid_configuration = -100,
    missing_config_field = -101,
    config_parse_error = -102,
    unsupported_source_type = -103,

    // Connection errors (-120 to -149)
    connection_failed = -120,
    connection_timeout = -121,
    connection_refused = -122,
    host_not_found = -123,
    network_unreachable = -124,
    authentication_failed = -125,
    permission_denied = -126,
    passive_mode_error = -127,
    data_connection_failed = -128,
    ssh_handshake_failed = -129,
    ssh_key_rejected = -130,
    bucket_not_found = -131,
    region_mismatch = -132,
    connection_closed = -133,
    transport_unavailable = -134,

    // Listing errors (-150 to -159)
    listing_failed = -150,
    path_not_found = -151,
    listing_deadline_exceeded = -152,

    // Filter and sort errors (-160 to -179)
    invalid_pattern = -160,
    invalid_date_format = -161,
    invalid_date_value = -162,
    sort_failed = -163,

    // Download and state errors (-180 to -199)
    download_failed = -180,
    size_mismatch = -181,
    rename_failed = -182,
    local_write_error = -183,
    state_read_error = -184,
    state_write_error = -185,
    state_corrupted = -186,

    // Job errors (-200 to -219)
    job_not_found = -200,
    job_already_exists = -201,
    job_execution_failed = -202,
    executor_shutdown = -203,
    module_initialization_failed = -204,
    validation_failed = -205,
    upload_failed = -206,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_initialized = -221,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_config_field:
            return "missing configuration field";
        case error_code::config_parse_error:
            return "configuration parse error";
        case error_code::unsupported_source_type:
            return "unsupported source type";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::host_not_found:
            return "host not found";
        case error_code::network_unreachable:
            return "network unreachable";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::passive_mode_error:
            return "passive mode error";
        case error_code::data_connection_failed:
            return "data connection failed";
        case error_code::ssh_handshake_failed:
            return "ssh handshake failed";
        case error_code::ssh_key_rejected:
            return "ssh key rejected";
        case error_code::bucket_not_found:
            return "bucket not found";
        case error_code::region_mismatch:
            return "region mismatch";
        case error_code::connection_closed:
            return "connection closed";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::listing_failed:
            return "listing failed";
        case error_code::path_not_found:
            return "path not found";
        case error_code::listing_deadline_exceeded:
            return "listing deadline exceeded";
        case error_code::invalid_pattern:
            return "invalid pattern";
        case error_code::invalid_date_format:
            return "invalid date format";
        case error_code::invalid_date_value:
            return "invalid date value";
        case error_code::sort_failed:
            return "sort failed";
        case error_code::download_failed:
            return "download failed";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::rename_failed:
            return "rename failed";
        case error_code::local_write_error:
            return "local write error";
        case error_code::state_read_error:
            return "state read error";
        case error_code::state_write_error:
            return "state write error";
        case error_code::state_corrupted:
            return "state corrupted";
        case error_code::job_not_found:
            return "job not found";
        case error_code::job_already_exists:
            return "job already exists";
        case error_code::job_execution_failed:
            return "job execution failed";
        case error_code::executor_shutdown:
            return "executor shut down";
        case error_code::module_initialization_failed:
            return "module initialization failed";
        case error_code::validation_failed:
            return "validation failed";
        case error_code::upload_failed:
            return "upload failed";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the manner of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CORE_TYPES_H
