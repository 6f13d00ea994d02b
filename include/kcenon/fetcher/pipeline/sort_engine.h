/**
 * @file sort_engine.h
 * @brief Ordering and selection of filtered files
 * @version 0.1.0
 *
 * Exactly one strategy is applied. A strategy that cannot run (for example
 * an unusable date format) leaves the input order untouched.
 */

#ifndef KCENON_FETCHER_PIPELINE_SORT_ENGINE_H
#define KCENON_FETCHER_PIPELINE_SORT_ENGINE_H

#include "kcenon/fetcher/config/transfer_config.h"
#include "kcenon/fetcher/core/file_entry.h"

#include <string>

namespace kcenon::fetcher {

/**
 * @brief Sort strategies in priority order
 */
enum class sort_strategy {
    modified_time,
    date_in_path,
    date_in_filename,
    latest_only,
    file_name,
    none
};

[[nodiscard]] constexpr auto to_string(sort_strategy strategy) -> const char* {
    switch (strategy) {
        case sort_strategy::modified_time: return "modified_time";
        case sort_strategy::date_in_path: return "date_in_path";
        case sort_strategy::date_in_filename: return "date_in_filename";
        case sort_strategy::latest_only: return "latest_only";
        case sort_strategy::file_name: return "file_name";
        default: return "none";
    }
}

/**
 * @brief Strategy selected for a file list
 */
struct sort_plan {
    sort_strategy strategy = sort_strategy::none;
    /// Date format for the date strategies
    std::string date_format;
    /// Chosen by auto-detection rather than configured
    bool auto_detected = false;
};

/**
 * @brief Guess where dates live by sampling up to ten files
 *
 * Tries the configured dateFormat (or a shortlist of common formats) against
 * base names, then against parent directories. The location with more
 * matches wins; ties and zero matches select filename sorting.
 */
[[nodiscard]] auto detect_date_location(const file_list& files, const sort_settings& settings)
    -> sort_plan;

/**
 * @brief Sort engine for one sort_settings
 */
class sort_engine {
public:
    explicit sort_engine(sort_settings settings);

    /**
     * @brief Resolve the strategy, running auto-detection when none is set
     *
     * Auto-detection runs when no explicit strategy is configured and
     * sortByDate was not set to false.
     */
    [[nodiscard]] auto plan(const file_list& files) const -> sort_plan;

    /**
     * @brief Order @p files and apply the num_files cap
     *
     * Date strategies annotate each file with the extracted date.
     */
    [[nodiscard]] auto sort(const file_list& files) const -> file_list;

private:
    [[nodiscard]] auto apply(const sort_plan& plan, file_list files) const -> result<file_list>;
    [[nodiscard]] auto sort_by_extracted_date(file_list files, const std::string& format,
                                              bool in_path) const -> result<file_list>;

    sort_settings settings_;
};

/**
 * @brief Sort once with the given settings
 */
[[nodiscard]] auto sort_files(const file_list& files, const sort_settings& settings)
    -> file_list;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_PIPELINE_SORT_ENGINE_H
