/**
 * @file error_codes.h
 * @brief Error code range helpers for fetcher_system
 *
 * Error code ranges:
 * - -100 to -119: Configuration Errors
 * - -120 to -149: Connection Errors
 * - -150 to -159: Listing Errors
 * - -160 to -179: Filter and Sort Errors
 * - -180 to -199: Download and State Errors
 * - -200 to -219: Job Errors
 * - -220 to -239: Internal Errors
 */

#ifndef KCENON_FETCHER_CORE_ERROR_CODES_H
#define KCENON_FETCHER_CORE_ERROR_CODES_H

#include "types.h"

#include <cstdint>

namespace kcenon::fetcher {

[[nodiscard]] constexpr auto to_int(error_code code) noexcept -> int32_t {
    return static_cast<int32_t>(code);
}

/**
 * @brief Check if error code is in configuration error range
 */
[[nodiscard]] constexpr auto is_config_error(error_code code) noexcept -> bool {
    return to_int(code) <= -100 && to_int(code) >= -119;
}

/**
 * @brief Check if error code is in connection error range
 */
[[nodiscard]] constexpr auto is_connection_error(error_code code) noexcept -> bool {
    return to_int(code) <= -120 && to_int(code) >= -149;
}

/**
 * @brief Check if error code is in listing error range
 */
[[nodiscard]] constexpr auto is_listing_error(error_code code) noexcept -> bool {
    return to_int(code) <= -150 && to_int(code) >= -159;
}

/**
 * @brief Check if error code is in filter/sort error range
 */
[[nodiscard]] constexpr auto is_selection_error(error_code code) noexcept -> bool {
    return to_int(code) <= -160 && to_int(code) >= -179;
}

/**
 * @brief Check if error code is in download/state error range
 */
[[nodiscard]] constexpr auto is_download_error(error_code code) noexcept -> bool {
    return to_int(code) <= -180 && to_int(code) >= -199;
}

/**
 * @brief Check if error code is in job error range
 */
[[nodiscard]] constexpr auto is_job_error(error_code code) noexcept -> bool {
    return to_int(code) <= -200 && to_int(code) >= -219;
}

/**
 * @brief Check if the error is worth another attempt
 *
 * Credential, configuration and pattern errors never succeed on retry.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_refused:
        case error_code::network_unreachable:
        case error_code::passive_mode_error:
        case error_code::data_connection_failed:
        case error_code::connection_closed:
        case error_code::listing_failed:
        case error_code::download_failed:
        case error_code::size_mismatch:
            return true;
        default:
            return false;
    }
}

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CORE_ERROR_CODES_H
