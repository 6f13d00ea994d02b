/**
 * @file transfer_config.h
 * @brief Typed view of the flat transfer configuration
 * @version 0.1.0
 *
 * The pipeline is configured by a flat key/value mapping (the keys listed in
 * from_yaml()). Structured per-protocol documents are converted into that
 * mapping by config_mapper before being parsed here.
 */

#ifndef KCENON_FETCHER_CONFIG_TRANSFER_CONFIG_H
#define KCENON_FETCHER_CONFIG_TRANSFER_CONFIG_H

#include "kcenon/fetcher/core/types.h"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief Remote source connection settings
 */
struct connection_settings {
    /// local | ftp | sftp | s3
    std::string type;
    std::string host;
    std::optional<int> port;
    std::string user;
    std::string pass;

    std::string bucket;
    std::string region = "us-east-1";
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    /// Custom S3-compatible endpoint (host[:port], optionally with scheme)
    std::string endpoint;

    /// FTP passive mode
    bool passive = true;
    std::chrono::seconds connection_timeout{30};

    /**
     * @brief Port to use, falling back to the protocol default
     */
    [[nodiscard]] auto effective_port() const -> int;
};

/**
 * @brief File selection (filter) settings
 */
struct selection_settings {
    std::string pattern;
    std::vector<std::string> sample_files;
    bool generate_regex = false;
    std::string exclude_pattern;
    std::vector<std::string> skip_patterns;
    std::vector<std::string> exclude_keywords;
    std::vector<std::string> exclude_folders;
    bool skip_sub_folders = false;
    std::vector<std::string> extensions;
    std::string min_size;
    std::string max_size;
    std::optional<int> last_days;
    std::string start_date;
    std::string end_date;

    std::string escape_special_characters;
    bool dont_escape_brackets = false;
};

/**
 * @brief Sort strategy settings
 */
struct sort_settings {
    /// Explicit request (true) or opt-out (false) of date auto-detection
    std::optional<bool> sort_by_date;
    bool sort_by_date_in_path = false;
    bool sort_by_date_in_filename = false;
    bool sort_files_by_modified_time = false;
    bool get_latest_file_only = false;
    bool sort_on_file_name = false;
    bool sort_descending = false;
    bool case_sensitive = false;

    /// Preferred format for auto-detection in file names
    std::string date_format;
    std::string date_format_in_filename = "%Y-%m-%d";
    std::string date_format_in_path = "%Y/%m/%d";

    /// Keep at most this many files (0 = all)
    std::size_t num_files = 0;
};

/**
 * @brief Window applied to dates extracted from names or paths
 */
struct date_window_settings {
    std::string start;
    std::string end;
    std::optional<int> last_days;
    std::optional<int> next_days;

    [[nodiscard]] auto is_configured() const -> bool {
        return !start.empty() || !end.empty() || last_days.has_value() ||
               next_days.has_value();
    }
};

/**
 * @brief Download and resume settings
 */
struct download_settings {
    std::filesystem::path local_download_path = "./downloads";
    bool overwrite_existing = false;
    bool append_full_path = false;
    bool skip_front_slash_path = false;
    bool add_front_slash_path = false;
    bool resume_transfer = true;

    int max_reconnect_attempts = 3;
    std::chrono::seconds reconnect_delay{5};

    bool rename_after_fetching = false;
    std::string file_parsed_string = "Parsed";

    std::string instance_id = "default";
    std::string channel_id = "default";
    /// Directory holding resume state (empty = system temp directory)
    std::filesystem::path state_directory;
};

/**
 * @brief Complete configuration of one transfer run
 */
struct transfer_config {
    connection_settings connection;
    std::string path = "/";
    selection_settings selection;
    sort_settings sorting;
    date_window_settings date_window;
    download_settings download;

    /// Overall listing wall-clock ceiling (0 = unlimited)
    std::chrono::seconds listing_deadline{0};

    /// Keys not understood by the pipeline, preserved for modules
    std::map<std::string, std::string> extras;

    /**
     * @brief Parse a flat configuration mapping
     *
     * Recognised keys: type, source_type, host, port, user/username,
     * pass/password, bucket, region, credentials{access_key_id,
     * secret_access_key, session_token}, aws_access_key_id,
     * aws_secret_access_key, endpoint, passive, connection_timeout, path,
     * pattern, sampleFiles, generateRegex, exclude_pattern, skipPatterns,
     * excludeKeywords, excludeFolders, skipSubFolders, extensions, min_size,
     * max_size, last_days, start_date, end_date, escapeSpecialCharacters,
     * dontEscapeBrackets, sortByDate, sortByDateInPath, sortByDateInFilename,
     * sortFilesByModifiedTime, getLatestFileOnly, sortOnFileName,
     * sortDescending, caseSensitive, dateFormat, dateFormatInFilename,
     * dateFormatInPath, num_files, extractedDateStart, extractedDateEnd,
     * extractedDateLastDays, extractedDateNextDays, local_download_path,
     * overwrite_existing, appendFullPath, skipFrontSlashPath,
     * addFrontSlashPath, resume_transfer, max_reconnect_attempts,
     * reconnect_delay_seconds, renameAfterFetching, fileParsedString,
     * instance_id, channel_id, state_directory, listing_deadline_seconds.
     *
     * List-valued keys accept a sequence or a comma-separated string.
     */
    [[nodiscard]] static auto from_yaml(const YAML::Node& flat) -> result<transfer_config>;

    /**
     * @brief Parse a flat configuration document from text
     */
    [[nodiscard]] static auto from_yaml_string(const std::string& text)
        -> result<transfer_config>;
};

/**
 * @brief Convert a human readable size ("10MB", "1.5 GB", "2048") to bytes
 *
 * Units KB, MB, GB, TB are powers of 1024.
 * @return std::nullopt for empty or unparsable input
 */
[[nodiscard]] auto parse_size(const std::string& text) -> std::optional<uint64_t>;

/**
 * @brief Split a comma separated list, trimming blanks and dropping empties
 */
[[nodiscard]] auto split_comma_list(const std::string& text) -> std::vector<std::string>;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONFIG_TRANSFER_CONFIG_H
