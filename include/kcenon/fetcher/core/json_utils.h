/**
 * @file json_utils.h
 * @brief Minimal JSON helpers shared by logging and state persistence
 *
 * Covers the flat documents this library writes itself: string, number and
 * string-array values under top-level keys.
 */

#ifndef KCENON_FETCHER_CORE_JSON_UTILS_H
#define KCENON_FETCHER_CORE_JSON_UTILS_H

#include <optional>
#include <string>
#include <vector>

namespace kcenon::fetcher::json_utils {

/**
 * @brief Escape a string for inclusion between JSON quotes
 */
auto escape(const std::string& input) -> std::string;

/**
 * @brief Reverse escape() for a raw JSON string body
 * @return std::nullopt on a truncated or non-hex unicode escape
 */
auto unescape(const std::string& input) -> std::optional<std::string>;

/**
 * @brief Extract a scalar value for a top-level key
 * @return Unescaped string body for strings, raw text for other scalars,
 *         std::nullopt if the key is absent or a string escape is malformed
 */
auto extract_value(const std::string& json, const std::string& key)
    -> std::optional<std::string>;

/**
 * @brief Extract an array of strings for a top-level key
 * @return std::nullopt if the key is absent or the array is malformed
 */
auto extract_string_array(const std::string& json, const std::string& key)
    -> std::optional<std::vector<std::string>>;

/**
 * @brief Render a string array with the given indentation for its items
 */
auto format_string_array(const std::vector<std::string>& items,
                         const std::string& indent) -> std::string;

}  // namespace kcenon::fetcher::json_utils

#endif  // KCENON_FETCHER_CORE_JSON_UTILS_H
