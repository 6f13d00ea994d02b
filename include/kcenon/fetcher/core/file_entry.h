/**
 * @file file_entry.h
 * @brief Remote file description passed through the pipeline
 */

#ifndef KCENON_FETCHER_CORE_FILE_ENTRY_H
#define KCENON_FETCHER_CORE_FILE_ENTRY_H

#include "date_pattern.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::fetcher {

enum class entry_type {
    file,
    directory,
    link,
    other
};

[[nodiscard]] constexpr auto to_string(entry_type type) -> const char* {
    switch (type) {
        case entry_type::file: return "file";
        case entry_type::directory: return "directory";
        case entry_type::link: return "link";
        default: return "other";
    }
}

/**
 * @brief One remote file selected by listing
 */
struct file_entry {
    std::string name;   ///< Base name
    std::string path;   ///< Full remote path
    uint64_t size = 0;
    std::chrono::system_clock::time_point mtime;
    entry_type type = entry_type::file;

    /// Set by date-in-filename sorting
    std::optional<civil_datetime> extracted_date;
    /// Set by date-in-path sorting
    std::optional<civil_datetime> extracted_path_date;
};

using file_list = std::vector<file_entry>;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CORE_FILE_ENTRY_H
