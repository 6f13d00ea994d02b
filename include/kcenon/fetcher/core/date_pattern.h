/**
 * @file date_pattern.h
 * @brief Date format compilation, date extraction and placeholder expansion
 *
 * Every place that turns a strftime-style format into something that can be
 * searched for in a file name or path goes through compile_date_format(), so
 * filtering, sorting and auto-detection agree on which directives exist and
 * how their text is parsed.
 */

#ifndef KCENON_FETCHER_CORE_DATE_PATTERN_H
#define KCENON_FETCHER_CORE_DATE_PATTERN_H

#include "types.h"

#include <chrono>
#include <compare>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief Calendar date and wall-clock time without a time zone
 */
struct civil_datetime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;

    auto operator<=>(const civil_datetime&) const = default;

    /**
     * @brief Local wall-clock representation of a time point
     */
    [[nodiscard]] static auto from_time_point(std::chrono::system_clock::time_point tp)
        -> civil_datetime;

    /**
     * @brief Interpret this value as local time
     */
    [[nodiscard]] auto to_time_point() const -> std::chrono::system_clock::time_point;

    [[nodiscard]] auto start_of_day() const -> civil_datetime;
    [[nodiscard]] auto end_of_day() const -> civil_datetime;
    [[nodiscard]] auto add_days(int days) const -> civil_datetime;

    /**
     * @brief 0 = Sunday ... 6 = Saturday
     */
    [[nodiscard]] auto weekday() const -> int;

    /**
     * @brief Zero-based day of the year
     */
    [[nodiscard]] auto day_of_year() const -> int;

    [[nodiscard]] auto is_valid() const -> bool;

    /**
     * @brief "YYYY-MM-DD HH:MM:SS"
     */
    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Parse a "YYYY-MM-DD" date
 */
[[nodiscard]] auto parse_iso_date(const std::string& text) -> std::optional<civil_datetime>;

/**
 * @brief Directives understood by the date-format compiler
 */
enum class date_directive {
    year4,        ///< %Y
    year2,        ///< %y
    month,        ///< %m
    day,          ///< %d
    hour,         ///< %H
    minute,       ///< %M
    second,       ///< %S
    month_abbr,   ///< %b
    month_name,   ///< %B
};

/**
 * @brief A date format compiled into a searchable regular expression
 */
class compiled_date_pattern {
public:
    compiled_date_pattern(std::string format,
                          std::string regex_source,
                          std::vector<date_directive> directives);

    [[nodiscard]] auto format() const -> const std::string& { return format_; }
    [[nodiscard]] auto regex_source() const -> const std::string& { return source_; }
    [[nodiscard]] auto directives() const -> const std::vector<date_directive>& {
        return directives_;
    }

    /**
     * @brief Find the first date in @p text
     *
     * Matches whose fields do not form a valid calendar date are skipped.
     */
    [[nodiscard]] auto search(const std::string& text) const -> std::optional<civil_datetime>;

private:
    [[nodiscard]] auto parse_match(const std::smatch& match) const
        -> std::optional<civil_datetime>;

    std::string format_;
    std::string source_;
    std::regex regex_;
    std::vector<date_directive> directives_;
};

/**
 * @brief Compile a strftime-style format
 *
 * %Y -> (\d{4}), %y -> (\d{2}), %m %d %H %M %S -> (\d{1,2}),
 * %b -> ([A-Za-z]{3}), %B -> ([A-Za-z]+), %% -> literal '%'.
 * Any other character is matched literally.
 *
 * @return invalid_date_format for unknown or dangling directives
 */
[[nodiscard]] auto compile_date_format(const std::string& format)
    -> result<compiled_date_pattern>;

/**
 * @brief Expand {..} date placeholders using @p now
 *
 * Single characters inside braces expand as:
 * Y y m n M F d j D l S H G h g a A i s W
 * (e.g. {Y} -> 2025, {n} -> 6, {S} -> "nd", {a} -> "pm").
 * Compound placeholders such as {Y-m-d} expand character by character.
 * Regex quantifiers like \d{4} or [0-9]{2,3} are left untouched.
 */
[[nodiscard]] auto expand_date_placeholders(const std::string& pattern,
                                            const civil_datetime& now) -> std::string;

/**
 * @brief Options applied while turning a configured pattern into a regex
 */
struct pattern_options {
    /// Characters to prefix with a backslash after placeholder expansion
    std::string escape_special_characters;
    /// Leave '[' and ']' as regex syntax instead of literals
    bool dont_escape_brackets = false;
};

/**
 * @brief Normalize a configured pattern before regex compilation
 *
 * Placeholder expansion, then escapeSpecialCharacters, then literal
 * bracket escaping (brackets already escaped are not escaped twice).
 */
[[nodiscard]] auto prepare_regex_pattern(const std::string& pattern,
                                         const pattern_options& options,
                                         const civil_datetime& now) -> std::string;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CORE_DATE_PATTERN_H
