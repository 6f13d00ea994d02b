/**
 * @file json_utils.cpp
 * @brief Minimal JSON helpers (no external library)
 */

#include "kcenon/fetcher/core/json_utils.h"

#include <cctype>
#include <cstdio>
#include <sstream>
#include <utility>

namespace kcenon::fetcher::json_utils {

namespace {

auto skip_whitespace(const std::string& json, std::size_t pos) -> std::size_t {
    while (pos < json.size() &&
           (json[pos] == ' ' || json[pos] == '\n' ||
            json[pos] == '\r' || json[pos] == '\t')) {
        ++pos;
    }
    return pos;
}

// Returns the index of the closing quote of the string starting at `open`.
auto find_string_end(const std::string& json, std::size_t open) -> std::size_t {
    auto pos = open + 1;
    while (pos < json.size()) {
        if (json[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (json[pos] == '"') {
            return pos;
        }
        ++pos;
    }
    return std::string::npos;
}

auto find_value_start(const std::string& json, const std::string& key)
    -> std::size_t {
    auto key_pos = json.find("\"" + key + "\"");
    if (key_pos == std::string::npos) {
        return std::string::npos;
    }
    auto colon_pos = json.find(':', key_pos + key.size() + 2);
    if (colon_pos == std::string::npos) {
        return std::string::npos;
    }
    auto value_start = skip_whitespace(json, colon_pos + 1);
    return value_start < json.size() ? value_start : std::string::npos;
}

}  // namespace

auto escape(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto unescape(const std::string& input) -> std::optional<std::string> {
    std::string output;
    output.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '\\' || i + 1 >= input.size()) {
            output += input[i];
            continue;
        }
        switch (input[i + 1]) {
            case '"':  output += '"';  ++i; break;
            case '\\': output += '\\'; ++i; break;
            case '/':  output += '/';  ++i; break;
            case 'b':  output += '\b'; ++i; break;
            case 'f':  output += '\f'; ++i; break;
            case 'n':  output += '\n'; ++i; break;
            case 'r':  output += '\r'; ++i; break;
            case 't':  output += '\t'; ++i; break;
            case 'u': {
                if (i + 5 >= input.size()) {
                    return std::nullopt;
                }
                int code = 0;
                for (std::size_t k = i + 2; k < i + 6; ++k) {
                    auto digit = static_cast<unsigned char>(input[k]);
                    if (!std::isxdigit(digit)) {
                        return std::nullopt;
                    }
                    code = code * 16 + (std::isdigit(digit) ? digit - '0'
                                                            : std::tolower(digit) - 'a' + 10);
                }
                output += static_cast<char>(code);
                i += 5;
                break;
            }
            default:
                output += input[i];
                break;
        }
    }
    return output;
}

auto extract_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    if (json[pos] == '"') {
        auto end = find_string_end(json, pos);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        return unescape(json.substr(pos + 1, end - pos - 1));
    }

    auto end = json.find_first_of(",}\n", pos);
    if (end == std::string::npos) {
        end = json.size();
    }
    auto value = json.substr(pos, end - pos);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' ||
                              value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

auto extract_string_array(const std::string& json, const std::string& key)
    -> std::optional<std::vector<std::string>> {
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos || json[pos] != '[') {
        return std::nullopt;
    }

    std::vector<std::string> items;
    pos = skip_whitespace(json, pos + 1);
    while (pos < json.size()) {
        if (json[pos] == ']') {
            return items;
        }
        if (json[pos] != '"') {
            return std::nullopt;
        }
        auto end = find_string_end(json, pos);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        auto item = unescape(json.substr(pos + 1, end - pos - 1));
        if (!item) {
            return std::nullopt;
        }
        items.push_back(std::move(*item));

        pos = skip_whitespace(json, end + 1);
        if (pos < json.size() && json[pos] == ',') {
            pos = skip_whitespace(json, pos + 1);
        }
    }
    return std::nullopt;
}

auto format_string_array(const std::vector<std::string>& items,
                         const std::string& indent) -> std::string {
    if (items.empty()) {
        return "[]";
    }

    std::ostringstream oss;
    oss << "[\n";
    for (std::size_t i = 0; i < items.size(); ++i) {
        oss << indent << "  \"" << escape(items[i]) << "\"";
        if (i + 1 < items.size()) {
            oss << ",";
        }
        oss << "\n";
    }
    oss << indent << "]";
    return oss.str();
}

}  // namespace kcenon::fetcher::json_utils
