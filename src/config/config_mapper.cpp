/**
 * @file config_mapper.cpp
 * @brief Structured-to-flat configuration mapping
 */

#include "kcenon/fetcher/config/config_mapper.h"

namespace kcenon::fetcher {

namespace {

auto child(const YAML::Node& node, const char* key) -> YAML::Node {
    if (node && node.IsMap() && node[key]) {
        return node[key];
    }
    return YAML::Node(YAML::NodeType::Null);
}

auto scalar_or_null(const YAML::Node& node) -> YAML::Node {
    if (node && node.IsScalar()) {
        return YAML::Node(node.as<std::string>());
    }
    return YAML::Node(YAML::NodeType::Null);
}

auto scalar_or(const YAML::Node& node, const std::string& fallback) -> YAML::Node {
    if (node && node.IsScalar()) {
        return YAML::Node(node.as<std::string>());
    }
    return YAML::Node(fallback);
}

auto bool_or(const YAML::Node& node, bool fallback) -> bool {
    if (node && node.IsScalar()) {
        return node.as<bool>();
    }
    return fallback;
}

auto sequence_or_empty(const YAML::Node& node) -> YAML::Node {
    if (node && node.IsSequence()) {
        return YAML::Clone(node);
    }
    return YAML::Node(YAML::NodeType::Sequence);
}

auto first_pattern(const YAML::Node& group) -> YAML::Node {
    auto patterns = child(group, "patterns");
    if (patterns.IsSequence() && patterns.size() > 0 && patterns[0].IsScalar()) {
        return YAML::Node(patterns[0].as<std::string>());
    }
    return YAML::Node(YAML::NodeType::Null);
}

// Selection, sorting, window and post-fetch groups shared by every source
void map_common_groups(const YAML::Node& section, YAML::Node& flat) {
    auto scope = child(section, "scope");
    auto file_select = child(section, "file_select");
    auto include = child(file_select, "include");
    auto exclude = child(file_select, "exclude");
    auto sorting = child(section, "sorting");
    auto date_window = child(section, "date_window");
    auto post_fetch = child(section, "post_fetch");

    flat["path"] = scalar_or(child(scope, "path"), "/");

    flat["pattern"] = first_pattern(include);
    flat["extensions"] = sequence_or_empty(child(include, "extensions"));
    flat["caseSensitive"] = bool_or(child(include, "case_sensitive"), false);
    flat["exclude_pattern"] = first_pattern(exclude);

    std::string by;
    if (auto by_node = child(sorting, "by"); by_node.IsScalar()) {
        by = by_node.as<std::string>();
    }
    flat["sortFilesByModifiedTime"] = by == "modified_time";
    flat["sortByDateInFilename"] = by == "date_in_filename";
    flat["sortByDateInPath"] = by == "date_in_path";
    flat["sortOnFileName"] = by == "filename";
    flat["sortDescending"] = bool_or(child(sorting, "descending"), false);
    flat["dateFormatInFilename"] = scalar_or(child(sorting, "date_format"), "%Y-%m-%d");
    flat["dateFormatInPath"] = scalar_or(child(sorting, "date_format"), "%Y/%m/%d");

    auto range = child(date_window, "range");
    std::optional<int> next_days;
    if (range.IsScalar()) {
        next_days = config_mapper::parse_date_range(range.as<std::string>());
    }
    flat["extractedDateNextDays"] = next_days
        ? YAML::Node(*next_days)
        : YAML::Node(YAML::NodeType::Null);

    flat["sampleFiles"] = sequence_or_empty(child(section, "file_examples"));

    flat["renameAfterFetching"] = bool_or(child(post_fetch, "rename_after_fetch"), false);
    flat["fileParsedString"] = scalar_or(child(post_fetch, "rename_template"), "Processed");
}

void copy_through(const YAML::Node& structured, const std::string& section_key,
                  YAML::Node& flat) {
    if (!structured || !structured.IsMap()) {
        return;
    }
    const YAML::Node& mapped = flat;
    for (const auto& entry : structured) {
        auto key = entry.first.as<std::string>();
        if (key == section_key || mapped[key]) {
            continue;
        }
        flat[key] = YAML::Clone(entry.second);
    }
}

}  // namespace

auto config_mapper::map_ftp_config(const YAML::Node& structured) -> YAML::Node {
    auto section = child(structured, "ftp");
    auto connection = child(section, "connection");
    auto auth = child(connection, "auth");
    auto exclude = child(child(section, "file_select"), "exclude");

    YAML::Node flat(YAML::NodeType::Map);
    auto protocol = scalar_or(child(connection, "protocol"), "ftp");
    flat["source_type"] = protocol;
    flat["type"] = YAML::Clone(protocol);
    flat["host"] = scalar_or_null(child(connection, "host"));
    flat["port"] = scalar_or_null(child(connection, "port"));
    flat["user"] = scalar_or_null(child(auth, "username"));
    flat["pass"] = scalar_or_null(child(auth, "password"));

    map_common_groups(section, flat);

    flat["excludeFolders"] = sequence_or_empty(child(exclude, "folders"));
    flat["skipSubFolders"] = bool_or(child(exclude, "skip_subfolders"), false);

    copy_through(structured, "ftp", flat);
    return flat;
}

auto config_mapper::map_s3_config(const YAML::Node& structured) -> YAML::Node {
    auto section = child(structured, "s3");
    auto connection = child(section, "connection");
    auto credentials = child(connection, "credentials");

    YAML::Node flat(YAML::NodeType::Map);
    flat["type"] = "s3";
    flat["bucket"] = scalar_or_null(child(connection, "bucket"));
    flat["region"] = scalar_or(child(connection, "region"), "us-east-1");
    flat["aws_access_key_id"] = scalar_or_null(child(credentials, "access_key_id"));
    flat["aws_secret_access_key"] = scalar_or_null(child(credentials, "secret_access_key"));

    map_common_groups(section, flat);

    copy_through(structured, "s3", flat);
    return flat;
}

auto config_mapper::parse_date_range(const std::string& range) -> std::optional<int> {
    if (range.size() < 3 || range.compare(0, 2, "T+") != 0) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        auto days = std::stoi(range.substr(2), &consumed);
        if (consumed != range.size() - 2) {
            return std::nullopt;
        }
        return days;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace kcenon::fetcher
