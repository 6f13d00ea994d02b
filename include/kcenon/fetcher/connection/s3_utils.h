/**
 * @file s3_utils.h
 * @brief Encoding, hashing and XML helpers for the S3 backend
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_CONNECTION_S3_UTILS_H
#define KCENON_FETCHER_CONNECTION_S3_UTILS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::fetcher::s3_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Lowercase hexadecimal rendering of @p bytes
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief URL encode a string (RFC 3986 unreserved set)
 * @param value String to encode
 * @param encode_slash Whether '/' is percent-encoded
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Canonical query string: keys sorted, keys and values URL encoded
 */
auto canonical_query(const std::map<std::string, std::string>& query) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief SHA256 digest (32 bytes), or zeros when signing support is disabled
 */
auto sha256(const std::string& data) -> std::vector<uint8_t>;

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief UTC "YYYYMMDD'T'HHMMSS'Z'"
 */
auto format_amz_date(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief UTC "YYYYMMDD"
 */
auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Parse an ISO 8601 UTC timestamp such as "2024-05-01T10:20:30.000Z"
 */
auto parse_iso8601_utc(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point>;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Value of the first <tag>...</tag> element in @p xml
 *
 * Entity references (&amp; &lt; &gt; &quot; &apos;) are decoded.
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

/**
 * @brief Inner text of every <tag>...</tag> block in @p xml, in order
 */
auto extract_xml_blocks(const std::string& xml,
                        const std::string& tag) -> std::vector<std::string>;

}  // namespace kcenon::fetcher::s3_utils

#endif  // KCENON_FETCHER_CONNECTION_S3_UTILS_H
