/**
 * @file s3_utils.cpp
 * @brief Encoding, hashing and XML helpers for the S3 backend
 * @version 0.1.0
 */

#include "kcenon/fetcher/connection/s3_utils.h"
#include "kcenon/fetcher/config/feature_flags.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#if FETCHER_HAS_S3_SIGNING
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#endif

namespace kcenon::fetcher::s3_utils {

namespace {

auto to_utc_tm(std::chrono::system_clock::time_point tp) -> std::tm {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);
    return tm_buf;
}

auto decode_entities(std::string text) -> std::string {
    static const std::pair<const char*, char> entities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}, {"&amp;", '&'}};

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                std::string_view ent(entity);
                if (text.compare(i, ent.size(), ent) == 0) {
                    out += ch;
                    i += ent.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out += text[i++];
        }
    }
    return out;
}

}  // namespace

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto canonical_query(const std::map<std::string, std::string>& query) -> std::string {
    std::map<std::string, std::string> encoded;
    for (const auto& [key, value] : query) {
        encoded[url_encode(key)] = url_encode(value);
    }

    std::string out;
    for (const auto& [key, value] : encoded) {
        if (!out.empty()) {
            out += '&';
        }
        out += key + "=" + value;
    }
    return out;
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(const std::string& data) -> std::vector<uint8_t> {
#if FETCHER_HAS_S3_SIGNING
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           hash.data());
    return hash;
#else
    (void)data;
    return std::vector<uint8_t>(32, 0);
#endif
}

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t> {
#if FETCHER_HAS_S3_SIGNING
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         out.data(), &len);
    out.resize(len);
    return out;
#else
    (void)key;
    (void)data;
    return std::vector<uint8_t>(32, 0);
#endif
}

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t> {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

// ============================================================================
// Time Utilities
// ============================================================================

auto format_amz_date(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm_buf = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm_buf = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d");
    return oss.str();
}

auto parse_iso8601_utc(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm_buf{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    auto seconds = timegm(&tm_buf);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

// ============================================================================
// XML Utilities
// ============================================================================

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    auto start = xml.find(open_tag);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += open_tag.size();

    auto end = xml.find(close_tag, start);
    if (end == std::string::npos) {
        return std::nullopt;
    }

    return decode_entities(xml.substr(start, end - start));
}

auto extract_xml_blocks(const std::string& xml,
                        const std::string& tag) -> std::vector<std::string> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    std::vector<std::string> blocks;
    std::size_t pos = 0;
    while (true) {
        auto start = xml.find(open_tag, pos);
        if (start == std::string::npos) {
            break;
        }
        start += open_tag.size();
        auto end = xml.find(close_tag, start);
        if (end == std::string::npos) {
            break;
        }
        blocks.push_back(xml.substr(start, end - start));
        pos = end + close_tag.size();
    }
    return blocks;
}

}  // namespace kcenon::fetcher::s3_utils
