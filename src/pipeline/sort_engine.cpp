/**
 * @file sort_engine.cpp
 * @brief Implementation of the sort engine
 */

#include "kcenon/fetcher/pipeline/sort_engine.h"
#include "kcenon/fetcher/core/date_pattern.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>
#include <vector>

namespace kcenon::fetcher {

namespace {

constexpr std::size_t detection_sample_size = 10;

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto parent_directory(const std::string& path) -> std::string {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? std::string{} : path.substr(0, pos);
}

/**
 * @brief Count sampled texts holding a date in any of @p formats
 * @return match count and the last format that matched
 */
auto count_matches(const std::vector<std::string>& texts, const std::vector<std::string>& formats)
    -> std::pair<std::size_t, std::string> {
    std::vector<compiled_date_pattern> patterns;
    std::vector<std::string> names;
    for (const auto& fmt : formats) {
        auto compiled = compile_date_format(fmt);
        if (compiled) {
            patterns.push_back(std::move(compiled.value()));
            names.push_back(fmt);
        }
    }

    std::size_t count = 0;
    std::string best;
    for (const auto& text : texts) {
        for (std::size_t i = 0; i < patterns.size(); ++i) {
            if (patterns[i].search(text)) {
                ++count;
                best = names[i];
                break;
            }
        }
    }
    return {count, best};
}

}  // namespace

auto detect_date_location(const file_list& files, const sort_settings& settings) -> sort_plan {
    auto sample = std::min(files.size(), detection_sample_size);

    std::vector<std::string> filename_formats;
    std::vector<std::string> path_formats;
    if (!settings.date_format.empty()) {
        filename_formats = {settings.date_format};
        path_formats = {settings.date_format};
    } else {
        filename_formats = {"%Y-%m-%d", "%Y%m%d", "%d-%m-%Y", "%Y_%m_%d"};
        path_formats = {"%Y/%m/%d", "%Y/%b/%d", "%Y-%m-%d"};
    }

    std::vector<std::string> names;
    std::vector<std::string> directories;
    for (std::size_t i = 0; i < sample; ++i) {
        const auto& file = files[i];
        names.push_back(file.name);
        if (!file.path.empty() && file.path != file.name) {
            directories.push_back(parent_directory(file.path));
        }
    }

    auto [name_hits, name_format] = count_matches(names, filename_formats);
    auto [path_hits, path_format] = count_matches(directories, path_formats);

    sort_plan plan;
    plan.auto_detected = true;
    if (name_hits > path_hits) {
        FETCHER_LOG_INFO(log_category::sort,
            "Auto-detected dates in filenames (" + std::to_string(name_hits) + "/" +
            std::to_string(sample) + " matches)");
        plan.strategy = sort_strategy::date_in_filename;
        plan.date_format = name_format;
    } else if (path_hits > name_hits) {
        FETCHER_LOG_INFO(log_category::sort,
            "Auto-detected dates in directory paths (" + std::to_string(path_hits) + "/" +
            std::to_string(sample) + " matches)");
        plan.strategy = sort_strategy::date_in_path;
        plan.date_format = path_format;
    } else {
        FETCHER_LOG_INFO(log_category::sort,
            "Could not auto-detect dates in filenames or directory paths, "
            "defaulting to filename sorting");
        plan.strategy = sort_strategy::file_name;
    }
    return plan;
}

sort_engine::sort_engine(sort_settings settings) : settings_(std::move(settings)) {}

auto sort_engine::plan(const file_list& files) const -> sort_plan {
    const auto& s = settings_;
    sort_plan plan;

    if (s.sort_files_by_modified_time) {
        plan.strategy = sort_strategy::modified_time;
    } else if (s.sort_by_date_in_path) {
        plan.strategy = sort_strategy::date_in_path;
        plan.date_format = s.date_format_in_path;
    } else if (s.sort_by_date_in_filename) {
        plan.strategy = sort_strategy::date_in_filename;
        plan.date_format = s.date_format_in_filename;
    } else if (s.get_latest_file_only) {
        plan.strategy = sort_strategy::latest_only;
    } else if (s.sort_on_file_name) {
        plan.strategy = sort_strategy::file_name;
    } else if (s.sort_by_date.value_or(true)) {
        plan = detect_date_location(files, s);
    }
    return plan;
}

auto sort_engine::sort_by_extracted_date(file_list files, const std::string& format,
                                         bool in_path) const -> result<file_list> {
    auto compiled = compile_date_format(format);
    if (!compiled) {
        return unexpected{compiled.error()};
    }
    const auto& pattern = compiled.value();

    file_list dated;
    file_list undated;
    for (auto& file : files) {
        if (in_path) {
            const auto& path = file.path.empty() ? file.name : file.path;
            file.extracted_path_date = pattern.search(parent_directory(path));
            (file.extracted_path_date ? dated : undated).push_back(std::move(file));
        } else {
            file.extracted_date = pattern.search(file.name);
            (file.extracted_date ? dated : undated).push_back(std::move(file));
        }
    }

    FETCHER_LOG_INFO(log_category::sort,
        "Found dates in " + std::string(in_path ? "paths of " : "") +
        std::to_string(dated.size()) + " files, " + std::to_string(undated.size()) +
        " files without recognizable dates");

    auto key = [in_path](const file_entry& f) -> const civil_datetime& {
        return in_path ? *f.extracted_path_date : *f.extracted_date;
    };
    if (settings_.sort_descending) {
        std::stable_sort(dated.begin(), dated.end(),
                         [&](const file_entry& a, const file_entry& b) { return key(a) > key(b); });
    } else {
        std::stable_sort(dated.begin(), dated.end(),
                         [&](const file_entry& a, const file_entry& b) { return key(a) < key(b); });
    }

    if (!undated.empty()) {
        FETCHER_LOG_WARN(log_category::sort,
            std::to_string(undated.size()) +
            " files could not be sorted by date (no matching date pattern)");
    }

    dated.insert(dated.end(), std::make_move_iterator(undated.begin()),
                 std::make_move_iterator(undated.end()));
    return dated;
}

auto sort_engine::apply(const sort_plan& plan, file_list files) const -> result<file_list> {
    const bool descending = settings_.sort_descending;

    switch (plan.strategy) {
        case sort_strategy::modified_time:
            FETCHER_LOG_INFO(log_category::sort,
                std::string("Sorting files by modification time (") +
                (descending ? "descending" : "ascending") + ")");
            std::stable_sort(files.begin(), files.end(),
                [descending](const file_entry& a, const file_entry& b) {
                    return descending ? a.mtime > b.mtime : a.mtime < b.mtime;
                });
            return files;

        case sort_strategy::date_in_path:
            FETCHER_LOG_INFO(log_category::sort,
                "Sorting files by date in path using format: " + plan.date_format);
            return sort_by_extracted_date(std::move(files), plan.date_format, true);

        case sort_strategy::date_in_filename:
            FETCHER_LOG_INFO(log_category::sort,
                "Sorting files by date in filename using format: " + plan.date_format);
            return sort_by_extracted_date(std::move(files), plan.date_format, false);

        case sort_strategy::latest_only: {
            FETCHER_LOG_INFO(log_category::sort,
                "Getting latest file only - selecting files with the newest modification time");
            if (files.empty()) {
                return files;
            }
            auto latest = std::max_element(files.begin(), files.end(),
                [](const file_entry& a, const file_entry& b) { return a.mtime < b.mtime; })->mtime;
            file_list newest;
            std::copy_if(files.begin(), files.end(), std::back_inserter(newest),
                         [latest](const file_entry& f) { return f.mtime == latest; });
            FETCHER_LOG_INFO(log_category::sort,
                "Found " + std::to_string(newest.size()) +
                " file(s) with latest modification time");
            return newest;
        }

        case sort_strategy::file_name: {
            const bool case_sensitive = settings_.case_sensitive;
            FETCHER_LOG_INFO(log_category::sort,
                std::string("Sorting files by filename (case ") +
                (case_sensitive ? "sensitive" : "insensitive") + ", " +
                (descending ? "descending" : "ascending") + ")");
            auto key = [case_sensitive](const file_entry& f) {
                return case_sensitive ? f.name : to_lower(f.name);
            };
            std::stable_sort(files.begin(), files.end(),
                [&](const file_entry& a, const file_entry& b) {
                    return descending ? key(a) > key(b) : key(a) < key(b);
                });
            return files;
        }

        default:
            return files;
    }
}

auto sort_engine::sort(const file_list& files) const -> file_list {
    if (files.empty()) {
        FETCHER_LOG_INFO(log_category::sort, "No files to sort");
        return {};
    }

    auto chosen = plan(files);
    FETCHER_LOG_INFO(log_category::sort,
        "Sorting " + std::to_string(files.size()) + " files by " + to_string(chosen.strategy));

    file_list sorted;
    try {
        auto applied = apply(chosen, files);
        if (applied) {
            sorted = std::move(applied.value());
        } else {
            FETCHER_LOG_ERROR(log_category::sort,
                "Error sorting by " + std::string(to_string(chosen.strategy)) + ": " +
                applied.error().message);
            FETCHER_LOG_WARN(log_category::sort, "Falling back to unsorted file list");
            sorted = files;
        }
    } catch (const std::exception& e) {
        FETCHER_LOG_ERROR(log_category::sort, std::string("Error sorting files: ") + e.what());
        FETCHER_LOG_WARN(log_category::sort, "Falling back to unsorted file list");
        sorted = files;
    }

    const bool latest_only = chosen.strategy == sort_strategy::latest_only;
    if (!latest_only && settings_.num_files > 0 && sorted.size() > settings_.num_files) {
        FETCHER_LOG_INFO(log_category::sort,
            "Limiting to " + std::to_string(settings_.num_files) + " files (from " +
            std::to_string(sorted.size()) + " total)");
        sorted.resize(settings_.num_files);
    } else if (latest_only && settings_.num_files > 0) {
        FETCHER_LOG_DEBUG(log_category::sort,
            "Skipping num_files limit - getLatestFileOnly is enabled");
    }

    FETCHER_LOG_INFO(log_category::sort, "Sorted to " + std::to_string(sorted.size()) + " files");
    return sorted;
}

auto sort_files(const file_list& files, const sort_settings& settings) -> file_list {
    sort_engine engine(settings);
    return engine.sort(files);
}

}  // namespace kcenon::fetcher
