/**
 * @file filter_engine.h
 * @brief Sequential include/exclude filter chain over listed files
 * @version 0.1.0
 *
 * Stages run in a fixed order, each on the output of the previous one:
 * sample names or include pattern, exclude pattern, skip patterns, exclude
 * keywords, extensions, size bounds, last N days, modified-time bounds and
 * the extracted-date window.
 *
 * A regular expression that fails to compile empties the result.
 */

#ifndef KCENON_FETCHER_PIPELINE_FILTER_ENGINE_H
#define KCENON_FETCHER_PIPELINE_FILTER_ENGINE_H

#include "kcenon/fetcher/config/transfer_config.h"
#include "kcenon/fetcher/core/date_pattern.h"
#include "kcenon/fetcher/core/file_entry.h"

#include <chrono>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief Resolved [start, end] window for extracted dates
 */
struct extracted_date_window {
    std::optional<civil_datetime> start;
    std::optional<civil_datetime> end;

    [[nodiscard]] auto contains(const civil_datetime& value) const -> bool {
        return (!start || value >= *start) && (!end || value <= *end);
    }
};

/**
 * @brief Resolve the extracted-date window
 *
 * Explicit start/end win over "next N days", which wins over "last N days".
 * "Last N days" ends at the explicit end date when one is given, else today.
 *
 * @return invalid_date_value when an explicit date is not YYYY-MM-DD
 */
[[nodiscard]] auto resolve_extracted_date_window(const date_window_settings& settings,
                                                 const civil_datetime& today)
    -> result<extracted_date_window>;

/**
 * @brief Outcome of one filter run
 */
struct filter_result {
    file_list files;
    /// Names removed by the pattern stages
    std::vector<std::string> skipped;
    /// A pattern stage failed to compile
    bool aborted = false;
};

/**
 * @brief Filter chain configured from a transfer_config
 */
class filter_engine {
public:
    explicit filter_engine(transfer_config config,
                           std::chrono::system_clock::time_point now =
                               std::chrono::system_clock::now());

    [[nodiscard]] auto apply(const file_list& files) const -> filter_result;

private:
    [[nodiscard]] auto compile(const std::string& pattern, std::string_view stage) const
        -> std::optional<std::regex>;
    [[nodiscard]] auto matches(const std::regex& regex, const file_entry& file) const -> bool;
    [[nodiscard]] auto extract_date(const file_entry& file,
                                    const std::optional<compiled_date_pattern>& in_name,
                                    const std::optional<compiled_date_pattern>& in_path) const
        -> std::optional<civil_datetime>;

    auto select_samples(file_list& files) const -> void;
    auto apply_include(file_list& files, filter_result& out) const -> bool;
    auto apply_exclude(file_list& files, filter_result& out) const -> bool;
    auto apply_skip_patterns(file_list& files, filter_result& out) const -> bool;
    auto apply_keywords(file_list& files) const -> void;
    auto apply_extensions(file_list& files) const -> void;
    auto apply_size_bounds(file_list& files) const -> void;
    auto apply_modified_window(file_list& files) const -> void;
    auto apply_extracted_dates(file_list& files) const -> bool;

    transfer_config config_;
    std::chrono::system_clock::time_point now_;
    civil_datetime today_;
};

/**
 * @brief Run the filter chain once
 */
[[nodiscard]] auto filter_files(const file_list& files, const transfer_config& config)
    -> file_list;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_PIPELINE_FILTER_ENGINE_H
