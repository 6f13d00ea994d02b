/**
 * @file transfer_config.cpp
 * @brief Parsing of the flat transfer configuration
 */

#include "kcenon/fetcher/config/transfer_config.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace kcenon::fetcher {

namespace {

auto trim(const std::string& s) -> std::string {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

auto to_lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

auto is_set(const YAML::Node& node, const char* key) -> bool {
    auto child = node[key];
    return child && !child.IsNull();
}

auto read_string(const YAML::Node& node, const char* key, std::string& out) -> void {
    if (is_set(node, key) && node[key].IsScalar()) {
        out = node[key].as<std::string>();
    }
}

auto read_bool(const YAML::Node& node, const char* key, bool& out) -> void {
    if (is_set(node, key)) {
        out = node[key].as<bool>();
    }
}

auto read_int(const YAML::Node& node, const char* key) -> std::optional<int> {
    if (!is_set(node, key)) {
        return std::nullopt;
    }
    return node[key].as<int>();
}

// Sequence or comma separated string
auto read_list(const YAML::Node& node, const char* key) -> std::vector<std::string> {
    if (!is_set(node, key)) {
        return {};
    }
    auto child = node[key];
    if (child.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& item : child) {
            if (item.IsScalar()) {
                auto value = trim(item.as<std::string>());
                if (!value.empty()) {
                    items.push_back(std::move(value));
                }
            }
        }
        return items;
    }
    return split_comma_list(child.as<std::string>());
}

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "type", "source_type", "host", "port", "user", "username", "pass", "password",
        "bucket", "region", "credentials", "aws_access_key_id", "aws_secret_access_key",
        "aws_session_token", "endpoint", "passive", "connection_timeout", "path",
        "pattern", "sampleFiles", "generateRegex", "exclude_pattern", "skipPatterns",
        "excludeKeywords", "excludeFolders", "skipSubFolders", "extensions",
        "min_size", "max_size", "last_days", "start_date", "end_date",
        "escapeSpecialCharacters", "dontEscapeBrackets", "sortByDate",
        "sortByDateInPath", "sortByDateInFilename", "sortFilesByModifiedTime",
        "getLatestFileOnly", "sortOnFileName", "sortDescending", "caseSensitive",
        "dateFormat", "dateFormatInFilename", "dateFormatInPath", "num_files",
        "extractedDateStart", "extractedDateEnd", "extractedDateLastDays",
        "extractedDateNextDays", "local_download_path", "overwrite_existing",
        "appendFullPath", "skipFrontSlashPath", "addFrontSlashPath", "resume_transfer",
        "max_reconnect_attempts", "reconnect_delay_seconds", "renameAfterFetching",
        "fileParsedString", "instance_id", "channel_id", "state_directory",
        "listing_deadline_seconds"};
    return keys;
}

}  // namespace

auto connection_settings::effective_port() const -> int {
    if (port) {
        return *port;
    }
    if (type == "sftp") {
        return 22;
    }
    return 21;
}

auto parse_size(const std::string& text) -> std::optional<uint64_t> {
    auto value = trim(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (value.empty()) {
        return std::nullopt;
    }

    static const std::pair<const char*, uint64_t> units[] = {
        {"KB", 1024ULL},
        {"MB", 1024ULL * 1024},
        {"GB", 1024ULL * 1024 * 1024},
        {"TB", 1024ULL * 1024 * 1024 * 1024},
    };

    for (const auto& [unit, multiplier] : units) {
        std::string suffix(unit);
        if (value.size() >= suffix.size() &&
            value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0) {
            auto number = trim(value.substr(0, value.size() - suffix.size()));
            try {
                std::size_t consumed = 0;
                double amount = std::stod(number, &consumed);
                if (consumed != number.size() || amount < 0 || !std::isfinite(amount)) {
                    return std::nullopt;
                }
                return static_cast<uint64_t>(amount * static_cast<double>(multiplier));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }

    try {
        std::size_t consumed = 0;
        auto bytes = std::stoll(value, &consumed);
        if (consumed != value.size() || bytes < 0) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(bytes);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto split_comma_list(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        auto item = trim(text.substr(start, comma == std::string::npos
                                               ? std::string::npos
                                               : comma - start));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

auto transfer_config::from_yaml(const YAML::Node& flat) -> result<transfer_config> {
    if (!flat || !flat.IsMap()) {
        return unexpected{error{error_code::invalid_configuration,
            "transfer configuration must be a mapping"}};
    }

    transfer_config cfg;
    try {
        // Connection
        auto& conn = cfg.connection;
        read_string(flat, "source_type", conn.type);
        read_string(flat, "type", conn.type);
        conn.type = to_lower(conn.type);
        read_string(flat, "host", conn.host);
        conn.port = read_int(flat, "port");
        read_string(flat, "username", conn.user);
        read_string(flat, "user", conn.user);
        read_string(flat, "password", conn.pass);
        read_string(flat, "pass", conn.pass);
        read_string(flat, "bucket", conn.bucket);
        read_string(flat, "region", conn.region);
        read_string(flat, "aws_access_key_id", conn.access_key_id);
        read_string(flat, "aws_secret_access_key", conn.secret_access_key);
        read_string(flat, "aws_session_token", conn.session_token);
        if (is_set(flat, "credentials") && flat["credentials"].IsMap()) {
            auto creds = flat["credentials"];
            read_string(creds, "access_key_id", conn.access_key_id);
            read_string(creds, "secret_access_key", conn.secret_access_key);
            read_string(creds, "session_token", conn.session_token);
        }
        read_string(flat, "endpoint", conn.endpoint);
        read_bool(flat, "passive", conn.passive);
        if (auto timeout = read_int(flat, "connection_timeout")) {
            conn.connection_timeout = std::chrono::seconds(*timeout);
        }
        if (conn.type.empty() && !conn.bucket.empty()) {
            conn.type = "s3";
        }

        read_string(flat, "path", cfg.path);
        if (cfg.path.empty()) {
            cfg.path = "/";
        }

        // Selection
        auto& sel = cfg.selection;
        read_string(flat, "pattern", sel.pattern);
        sel.sample_files = read_list(flat, "sampleFiles");
        read_bool(flat, "generateRegex", sel.generate_regex);
        read_string(flat, "exclude_pattern", sel.exclude_pattern);
        sel.skip_patterns = read_list(flat, "skipPatterns");
        for (auto& keyword : read_list(flat, "excludeKeywords")) {
            sel.exclude_keywords.push_back(to_lower(keyword));
        }
        sel.exclude_folders = read_list(flat, "excludeFolders");
        read_bool(flat, "skipSubFolders", sel.skip_sub_folders);
        sel.extensions = read_list(flat, "extensions");
        read_string(flat, "min_size", sel.min_size);
        read_string(flat, "max_size", sel.max_size);
        sel.last_days = read_int(flat, "last_days");
        read_string(flat, "start_date", sel.start_date);
        read_string(flat, "end_date", sel.end_date);
        read_string(flat, "escapeSpecialCharacters", sel.escape_special_characters);
        read_bool(flat, "dontEscapeBrackets", sel.dont_escape_brackets);

        // Sorting
        auto& sort = cfg.sorting;
        if (is_set(flat, "sortByDate")) {
            sort.sort_by_date = flat["sortByDate"].as<bool>();
        }
        read_bool(flat, "sortByDateInPath", sort.sort_by_date_in_path);
        read_bool(flat, "sortByDateInFilename", sort.sort_by_date_in_filename);
        read_bool(flat, "sortFilesByModifiedTime", sort.sort_files_by_modified_time);
        read_bool(flat, "getLatestFileOnly", sort.get_latest_file_only);
        read_bool(flat, "sortOnFileName", sort.sort_on_file_name);
        read_bool(flat, "sortDescending", sort.sort_descending);
        read_bool(flat, "caseSensitive", sort.case_sensitive);
        read_string(flat, "dateFormat", sort.date_format);
        read_string(flat, "dateFormatInFilename", sort.date_format_in_filename);
        read_string(flat, "dateFormatInPath", sort.date_format_in_path);
        if (auto num = read_int(flat, "num_files"); num && *num > 0) {
            sort.num_files = static_cast<std::size_t>(*num);
        }

        // Extracted-date window
        auto& window = cfg.date_window;
        read_string(flat, "extractedDateStart", window.start);
        read_string(flat, "extractedDateEnd", window.end);
        window.last_days = read_int(flat, "extractedDateLastDays");
        window.next_days = read_int(flat, "extractedDateNextDays");

        // Download
        auto& dl = cfg.download;
        std::string local_path;
        read_string(flat, "local_download_path", local_path);
        if (!local_path.empty()) {
            dl.local_download_path = local_path;
        }
        read_bool(flat, "overwrite_existing", dl.overwrite_existing);
        read_bool(flat, "appendFullPath", dl.append_full_path);
        read_bool(flat, "skipFrontSlashPath", dl.skip_front_slash_path);
        read_bool(flat, "addFrontSlashPath", dl.add_front_slash_path);
        read_bool(flat, "resume_transfer", dl.resume_transfer);
        if (auto attempts = read_int(flat, "max_reconnect_attempts")) {
            dl.max_reconnect_attempts = std::max(0, *attempts);
        }
        if (auto delay = read_int(flat, "reconnect_delay_seconds")) {
            dl.reconnect_delay = std::chrono::seconds(std::max(0, *delay));
        }
        read_bool(flat, "renameAfterFetching", dl.rename_after_fetching);
        read_string(flat, "fileParsedString", dl.file_parsed_string);
        read_string(flat, "instance_id", dl.instance_id);
        read_string(flat, "channel_id", dl.channel_id);
        std::string state_dir;
        read_string(flat, "state_directory", state_dir);
        if (!state_dir.empty()) {
            dl.state_directory = state_dir;
        }

        if (auto deadline = read_int(flat, "listing_deadline_seconds"); deadline && *deadline > 0) {
            cfg.listing_deadline = std::chrono::seconds(*deadline);
        }

        for (const auto& entry : flat) {
            auto key = entry.first.as<std::string>();
            if (known_keys().count(key) != 0 || entry.second.IsNull()) {
                continue;
            }
            cfg.extras[key] = entry.second.IsScalar()
                ? entry.second.as<std::string>()
                : YAML::Dump(entry.second);
        }
    } catch (const YAML::Exception& e) {
        FETCHER_LOG_ERROR(log_category::config,
            std::string("Invalid transfer configuration value: ") + e.what());
        return unexpected{error{error_code::config_parse_error,
            std::string("invalid configuration value: ") + e.what()}};
    }

    return cfg;
}

auto transfer_config::from_yaml_string(const std::string& text) -> result<transfer_config> {
    try {
        return from_yaml(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        return unexpected{error{error_code::config_parse_error,
            std::string("failed to parse configuration: ") + e.what()}};
    }
}

}  // namespace kcenon::fetcher
