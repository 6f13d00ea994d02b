/**
 * @file filter_engine.cpp
 * @brief Implementation of the filter chain
 */

#include "kcenon/fetcher/pipeline/filter_engine.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace kcenon::fetcher {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto parent_directory(const std::string& path) -> std::string {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? std::string{} : path.substr(0, pos);
}

template <typename Predicate>
auto remove_matching(file_list& files, Predicate pred) -> std::vector<std::string> {
    std::vector<std::string> removed;
    auto it = std::stable_partition(files.begin(), files.end(),
                                    [&](const file_entry& f) { return !pred(f); });
    for (auto r = it; r != files.end(); ++r) {
        removed.push_back(r->name);
    }
    files.erase(it, files.end());
    return removed;
}

void log_removed(std::string_view what, const std::vector<std::string>& names) {
    if (names.empty()) {
        return;
    }
    FETCHER_LOG_INFO(log_category::filter,
        "Skipped " + std::to_string(names.size()) + " files matching " + std::string(what));
    for (std::size_t i = 0; i < names.size() && i < 5; ++i) {
        FETCHER_LOG_DEBUG(log_category::filter, "  - " + names[i]);
    }
    if (names.size() > 5) {
        FETCHER_LOG_DEBUG(log_category::filter,
            "  ... and " + std::to_string(names.size() - 5) + " more files");
    }
}

}  // namespace

auto resolve_extracted_date_window(const date_window_settings& settings,
                                   const civil_datetime& today)
    -> result<extracted_date_window> {
    extracted_date_window window;

    std::optional<civil_datetime> explicit_start;
    std::optional<civil_datetime> explicit_end;
    if (!settings.start.empty()) {
        explicit_start = parse_iso_date(settings.start);
        if (!explicit_start) {
            return unexpected{error{error_code::invalid_date_value,
                "Invalid extractedDateStart: " + settings.start + ". Use YYYY-MM-DD format."}};
        }
    }
    if (!settings.end.empty()) {
        explicit_end = parse_iso_date(settings.end);
        if (!explicit_end) {
            return unexpected{error{error_code::invalid_date_value,
                "Invalid extractedDateEnd: " + settings.end + ". Use YYYY-MM-DD format."}};
        }
    }

    if (settings.next_days) {
        window.start = today.start_of_day();
        window.end = today.add_days(*settings.next_days).end_of_day();
    } else if (settings.last_days) {
        auto anchor = explicit_end ? *explicit_end : today;
        window.start = anchor.add_days(-(*settings.last_days - 1)).start_of_day();
        window.end = anchor.end_of_day();
    }

    if (explicit_start) {
        window.start = explicit_start->start_of_day();
    }
    if (explicit_end) {
        window.end = explicit_end->end_of_day();
    }
    return window;
}

filter_engine::filter_engine(transfer_config config, std::chrono::system_clock::time_point now)
    : config_(std::move(config))
    , now_(now)
    , today_(civil_datetime::from_time_point(now)) {}

auto filter_engine::compile(const std::string& pattern, std::string_view stage) const
    -> std::optional<std::regex> {
    pattern_options options;
    options.escape_special_characters = config_.selection.escape_special_characters;
    options.dont_escape_brackets = config_.selection.dont_escape_brackets;

    auto prepared = prepare_regex_pattern(pattern, options, today_);
    try {
        return std::regex(prepared);
    } catch (const std::regex_error& e) {
        FETCHER_LOG_ERROR(log_category::filter,
            "Invalid " + std::string(stage) + " regex pattern '" + prepared + "': " + e.what());
        return std::nullopt;
    }
}

auto filter_engine::matches(const std::regex& regex, const file_entry& file) const -> bool {
    if (std::regex_search(file.name, regex)) {
        return true;
    }
    return config_.download.append_full_path && std::regex_search(file.path, regex);
}

auto filter_engine::select_samples(file_list& files) const -> void {
    const auto& samples = config_.selection.sample_files;
    if (config_.selection.generate_regex) {
        FETCHER_LOG_INFO(log_category::filter,
            "Regex generation requested but not available. Using exact matching.");
    }
    auto removed = remove_matching(files, [&](const file_entry& f) {
        return std::find(samples.begin(), samples.end(), f.name) == samples.end();
    });
    FETCHER_LOG_INFO(log_category::filter,
        "Filtered by sample files: " + std::to_string(files.size()) + " files match, " +
        std::to_string(removed.size()) + " files skipped");
}

auto filter_engine::apply_include(file_list& files, filter_result& out) const -> bool {
    auto regex = compile(config_.selection.pattern, "include");
    if (!regex) {
        return false;
    }
    auto removed = remove_matching(files, [&](const file_entry& f) { return !matches(*regex, f); });
    FETCHER_LOG_INFO(log_category::filter,
        "Filtered by pattern '" + config_.selection.pattern + "': " +
        std::to_string(files.size()) + " files match, " + std::to_string(removed.size()) +
        " files skipped");
    out.skipped.insert(out.skipped.end(), removed.begin(), removed.end());
    return true;
}

auto filter_engine::apply_exclude(file_list& files, filter_result& out) const -> bool {
    auto regex = compile(config_.selection.exclude_pattern, "exclude");
    if (!regex) {
        return false;
    }
    auto removed = remove_matching(files, [&](const file_entry& f) { return matches(*regex, f); });
    FETCHER_LOG_INFO(log_category::filter,
        "Filtered by exclude pattern '" + config_.selection.exclude_pattern + "': " +
        std::to_string(files.size()) + " files remain, " + std::to_string(removed.size()) +
        " files skipped");
    out.skipped.insert(out.skipped.end(), removed.begin(), removed.end());
    return true;
}

auto filter_engine::apply_skip_patterns(file_list& files, filter_result& out) const -> bool {
    std::size_t total = 0;
    for (const auto& pattern : config_.selection.skip_patterns) {
        auto regex = compile(pattern, "skip");
        if (!regex) {
            return false;
        }
        auto removed =
            remove_matching(files, [&](const file_entry& f) { return matches(*regex, f); });
        log_removed("skip pattern '" + pattern + "'", removed);
        total += removed.size();
        out.skipped.insert(out.skipped.end(), removed.begin(), removed.end());
    }
    if (total > 0) {
        FETCHER_LOG_INFO(log_category::filter,
            "Total files skipped by skip patterns: " + std::to_string(total));
    }
    return true;
}

auto filter_engine::apply_keywords(file_list& files) const -> void {
    std::vector<std::string> keywords;
    for (const auto& keyword : config_.selection.exclude_keywords) {
        if (!keyword.empty()) {
            keywords.push_back(to_lower(keyword));
        }
    }
    if (keywords.empty()) {
        return;
    }

    auto removed = remove_matching(files, [&](const file_entry& f) {
        auto lowered = to_lower(f.name);
        return std::any_of(keywords.begin(), keywords.end(), [&](const std::string& k) {
            return lowered.find(k) != std::string::npos;
        });
    });
    log_removed("exclude keywords", removed);
}

auto filter_engine::apply_extensions(file_list& files) const -> void {
    std::vector<std::string> extensions;
    for (const auto& ext : config_.selection.extensions) {
        if (ext.empty()) {
            continue;
        }
        auto lowered = to_lower(ext);
        extensions.push_back(lowered.front() == '.' ? lowered : "." + lowered);
    }
    if (extensions.empty()) {
        return;
    }

    remove_matching(files, [&](const file_entry& f) {
        auto ext = to_lower(std::filesystem::path(f.name).extension().string());
        return std::find(extensions.begin(), extensions.end(), ext) == extensions.end();
    });
    FETCHER_LOG_INFO(log_category::filter,
        "Filtered by extensions: " + std::to_string(files.size()) + " files match");
}

auto filter_engine::apply_size_bounds(file_list& files) const -> void {
    const auto& selection = config_.selection;
    if (!selection.min_size.empty()) {
        if (auto min_size = parse_size(selection.min_size)) {
            remove_matching(files, [&](const file_entry& f) { return f.size < *min_size; });
            FETCHER_LOG_INFO(log_category::filter,
                "Filtered by min size " + std::to_string(*min_size) + " bytes: " +
                std::to_string(files.size()) + " files match");
        }
    }
    if (!selection.max_size.empty()) {
        if (auto max_size = parse_size(selection.max_size)) {
            remove_matching(files, [&](const file_entry& f) { return f.size > *max_size; });
            FETCHER_LOG_INFO(log_category::filter,
                "Filtered by max size " + std::to_string(*max_size) + " bytes: " +
                std::to_string(files.size()) + " files match");
        }
    }
}

auto filter_engine::apply_modified_window(file_list& files) const -> void {
    const auto& selection = config_.selection;

    if (selection.last_days && *selection.last_days > 0) {
        auto cutoff = now_ - std::chrono::hours(24 * *selection.last_days);
        remove_matching(files, [&](const file_entry& f) { return f.mtime < cutoff; });
        FETCHER_LOG_INFO(log_category::filter,
            "Filtered by last " + std::to_string(*selection.last_days) + " days: " +
            std::to_string(files.size()) + " files match");
    }

    if (!selection.start_date.empty()) {
        if (auto start = parse_iso_date(selection.start_date)) {
            auto bound = start->to_time_point();
            remove_matching(files, [&](const file_entry& f) { return f.mtime < bound; });
            FETCHER_LOG_INFO(log_category::filter,
                "Filtered by start date " + selection.start_date + ": " +
                std::to_string(files.size()) + " files match");
        } else {
            FETCHER_LOG_ERROR(log_category::filter,
                "Invalid 'start_date' format: " + selection.start_date + ". Use YYYY-MM-DD format.");
        }
    }

    if (!selection.end_date.empty()) {
        if (auto end = parse_iso_date(selection.end_date)) {
            auto bound = end->end_of_day().to_time_point();
            remove_matching(files, [&](const file_entry& f) {
                return std::chrono::floor<std::chrono::seconds>(f.mtime) > bound;
            });
            FETCHER_LOG_INFO(log_category::filter,
                "Filtered by end date " + selection.end_date + ": " +
                std::to_string(files.size()) + " files match");
        } else {
            FETCHER_LOG_ERROR(log_category::filter,
                "Invalid 'end_date' format: " + selection.end_date + ". Use YYYY-MM-DD format.");
        }
    }
}

auto filter_engine::extract_date(const file_entry& file,
                                 const std::optional<compiled_date_pattern>& in_name,
                                 const std::optional<compiled_date_pattern>& in_path) const
    -> std::optional<civil_datetime> {
    if (in_name) {
        if (auto date = in_name->search(file.name)) {
            return date;
        }
    }
    if (in_path) {
        const auto& path = file.path.empty() ? file.name : file.path;
        return in_path->search(parent_directory(path));
    }
    return std::nullopt;
}

auto filter_engine::apply_extracted_dates(file_list& files) const -> bool {
    const auto& sorting = config_.sorting;
    if (!config_.date_window.is_configured() ||
        !(sorting.sort_by_date_in_filename || sorting.sort_by_date_in_path)) {
        return true;
    }

    auto window = resolve_extracted_date_window(config_.date_window, today_);
    if (!window) {
        FETCHER_LOG_ERROR(log_category::filter, window.error().message);
        return true;
    }

    std::optional<compiled_date_pattern> in_name;
    std::optional<compiled_date_pattern> in_path;
    if (sorting.sort_by_date_in_filename) {
        auto compiled = compile_date_format(sorting.date_format_in_filename);
        if (!compiled) {
            FETCHER_LOG_ERROR(log_category::filter, compiled.error().message);
            return false;
        }
        in_name = std::move(compiled.value());
    }
    if (sorting.sort_by_date_in_path) {
        auto compiled = compile_date_format(sorting.date_format_in_path);
        if (!compiled) {
            FETCHER_LOG_ERROR(log_category::filter, compiled.error().message);
            return false;
        }
        in_path = std::move(compiled.value());
    }

    std::size_t out_of_range = 0;
    std::size_t undated = 0;
    remove_matching(files, [&](const file_entry& f) {
        auto date = extract_date(f, in_name, in_path);
        if (!date) {
            ++undated;
            FETCHER_LOG_TRACE(log_category::filter, "SKIPPED " + f.name + ": no date extracted");
            return true;
        }
        if (!window.value().contains(*date)) {
            ++out_of_range;
            FETCHER_LOG_TRACE(log_category::filter,
                "SKIPPED " + f.name + ": date " + date->to_string() + " outside window");
            return true;
        }
        return false;
    });

    FETCHER_LOG_INFO(log_category::filter,
        "Filtered by extracted dates: " + std::to_string(files.size()) + " files match, " +
        std::to_string(out_of_range) + " outside window, " + std::to_string(undated) +
        " without date");
    return true;
}

auto filter_engine::apply(const file_list& files) const -> filter_result {
    filter_result out;
    out.files = files;
    auto& current = out.files;

    auto fail_closed = [&out]() {
        out.files.clear();
        out.aborted = true;
        return out;
    };

    const auto& selection = config_.selection;
    if (!selection.sample_files.empty()) {
        select_samples(current);
    } else if (!selection.pattern.empty()) {
        if (!apply_include(current, out)) {
            return fail_closed();
        }
    }

    if (!selection.exclude_pattern.empty() && !apply_exclude(current, out)) {
        return fail_closed();
    }
    if (!selection.skip_patterns.empty() && !apply_skip_patterns(current, out)) {
        return fail_closed();
    }

    apply_keywords(current);
    apply_extensions(current);
    apply_size_bounds(current);
    apply_modified_window(current);

    if (!apply_extracted_dates(current)) {
        return fail_closed();
    }

    FETCHER_LOG_INFO(log_category::filter,
        "Filtering kept " + std::to_string(current.size()) + " of " +
        std::to_string(files.size()) + " files");
    return out;
}

auto filter_files(const file_list& files, const transfer_config& config) -> file_list {
    filter_engine engine(config);
    return engine.apply(files).files;
}

}  // namespace kcenon::fetcher
