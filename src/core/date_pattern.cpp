/**
 * @file date_pattern.cpp
 * @brief Implementation of the date-format compiler and placeholder expansion
 */

#include "kcenon/fetcher/core/date_pattern.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace kcenon::fetcher {

namespace {

constexpr std::array<const char*, 12> month_names = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"};

constexpr std::array<const char*, 7> weekday_names = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

auto to_lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

auto to_sys_days(const civil_datetime& dt) -> std::chrono::sys_days {
    return std::chrono::sys_days{std::chrono::year{dt.year} /
                                 std::chrono::month{static_cast<unsigned>(dt.month)} /
                                 std::chrono::day{static_cast<unsigned>(dt.day)}};
}

auto two_digits(int value) -> std::string {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << value;
    return oss.str();
}

auto month_from_name(const std::string& text, bool abbreviated) -> std::optional<int> {
    auto lowered = to_lower(text);
    for (std::size_t i = 0; i < month_names.size(); ++i) {
        auto name = to_lower(month_names[i]);
        if (abbreviated ? lowered == name.substr(0, 3) : lowered == name) {
            return static_cast<int>(i) + 1;
        }
    }
    return std::nullopt;
}

auto is_regex_metachar(char c) -> bool {
    static const std::string metachars = R"(\^$.|?*+()[]{}/)";
    return metachars.find(c) != std::string::npos;
}

// Expansion of one placeholder character. Returns nullopt for characters
// without a meaning, which are copied through unchanged.
auto expand_placeholder_char(char c, const civil_datetime& now) -> std::optional<std::string> {
    const int hour12 = now.hour % 12 == 0 ? 12 : now.hour % 12;
    switch (c) {
        case 'Y': return std::to_string(now.year);
        case 'y': return two_digits(now.year % 100);
        case 'm': return two_digits(now.month);
        case 'n': return std::to_string(now.month);
        case 'M': return std::string(month_names[now.month - 1]).substr(0, 3);
        case 'F': return std::string(month_names[now.month - 1]);
        case 'd': return two_digits(now.day);
        case 'j': return std::to_string(now.day);
        case 'D': return std::string(weekday_names[now.weekday()]).substr(0, 3);
        case 'l': return std::string(weekday_names[now.weekday()]);
        case 'S': {
            if ((now.day >= 4 && now.day <= 20) || (now.day >= 24 && now.day <= 30)) {
                return std::string("th");
            }
            switch (now.day % 10) {
                case 1: return std::string("st");
                case 2: return std::string("nd");
                case 3: return std::string("rd");
                default: return std::string("th");
            }
        }
        case 'H': return two_digits(now.hour);
        case 'G': return std::to_string(now.hour);
        case 'h': return two_digits(hour12);
        case 'g': return std::to_string(hour12);
        case 'a': return std::string(now.hour < 12 ? "am" : "pm");
        case 'A': return std::string(now.hour < 12 ? "AM" : "PM");
        case 'i': return two_digits(now.minute);
        case 's': return two_digits(now.second);
        case 'W': {
            // Monday-based week of the year, as strftime %W
            int monday_index = (now.weekday() + 6) % 7;
            return two_digits((now.day_of_year() + 7 - monday_index) / 7);
        }
        default:
            return std::nullopt;
    }
}

}  // namespace

// ============================================================================
// civil_datetime
// ============================================================================

auto civil_datetime::from_time_point(std::chrono::system_clock::time_point tp)
    -> civil_datetime {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &time_t_val);
#else
    localtime_r(&time_t_val, &tm_buf);
#endif
    return civil_datetime{tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                          tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec};
}

auto civil_datetime::to_time_point() const -> std::chrono::system_clock::time_point {
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    tm_buf.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));
}

auto civil_datetime::start_of_day() const -> civil_datetime {
    return civil_datetime{year, month, day, 0, 0, 0};
}

auto civil_datetime::end_of_day() const -> civil_datetime {
    return civil_datetime{year, month, day, 23, 59, 59};
}

auto civil_datetime::add_days(int days) const -> civil_datetime {
    std::chrono::year_month_day ymd{to_sys_days(*this) + std::chrono::days{days}};
    return civil_datetime{static_cast<int>(ymd.year()),
                          static_cast<int>(static_cast<unsigned>(ymd.month())),
                          static_cast<int>(static_cast<unsigned>(ymd.day())),
                          hour, minute, second};
}

auto civil_datetime::weekday() const -> int {
    return static_cast<int>(std::chrono::weekday{to_sys_days(*this)}.c_encoding());
}

auto civil_datetime::day_of_year() const -> int {
    auto jan1 = std::chrono::sys_days{std::chrono::year{year} / std::chrono::January / 1};
    return static_cast<int>((to_sys_days(*this) - jan1).count());
}

auto civil_datetime::is_valid() const -> bool {
    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    return month >= 1 && day >= 1 && ymd.ok() &&
           hour >= 0 && hour <= 23 && minute >= 0 && minute <= 59 &&
           second >= 0 && second <= 61;
}

auto civil_datetime::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month
        << '-' << std::setw(2) << day << ' ' << std::setw(2) << hour << ':'
        << std::setw(2) << minute << ':' << std::setw(2) << second;
    return oss.str();
}

auto parse_iso_date(const std::string& text) -> std::optional<civil_datetime> {
    static const std::regex iso_date(R"(^\s*(\d{4})-(\d{1,2})-(\d{1,2})\s*$)");
    std::smatch match;
    if (!std::regex_match(text, match, iso_date)) {
        return std::nullopt;
    }
    civil_datetime dt{std::stoi(match[1].str()), std::stoi(match[2].str()),
                      std::stoi(match[3].str()), 0, 0, 0};
    if (!dt.is_valid()) {
        return std::nullopt;
    }
    return dt;
}

// ============================================================================
// compiled_date_pattern
// ============================================================================

compiled_date_pattern::compiled_date_pattern(std::string format,
                                             std::string regex_source,
                                             std::vector<date_directive> directives)
    : format_(std::move(format))
    , source_(std::move(regex_source))
    , regex_(source_)
    , directives_(std::move(directives)) {}

auto compiled_date_pattern::search(const std::string& text) const
    -> std::optional<civil_datetime> {
    auto begin = text.cbegin();
    std::smatch match;
    while (std::regex_search(begin, text.cend(), match, regex_)) {
        if (auto parsed = parse_match(match)) {
            return parsed;
        }
        if (match.length(0) == 0) {
            break;
        }
        begin = match[0].first + 1;
    }
    return std::nullopt;
}

auto compiled_date_pattern::parse_match(const std::smatch& match) const
    -> std::optional<civil_datetime> {
    // Fields absent from the format keep strptime defaults (1900-01-01 00:00:00)
    civil_datetime dt{1900, 1, 1, 0, 0, 0};

    for (std::size_t i = 0; i < directives_.size(); ++i) {
        const auto text = match[i + 1].str();
        switch (directives_[i]) {
            case date_directive::year4:
                dt.year = std::stoi(text);
                break;
            case date_directive::year2: {
                int yy = std::stoi(text);
                dt.year = yy < 69 ? 2000 + yy : 1900 + yy;
                break;
            }
            case date_directive::month:
                dt.month = std::stoi(text);
                break;
            case date_directive::day:
                dt.day = std::stoi(text);
                break;
            case date_directive::hour:
                dt.hour = std::stoi(text);
                break;
            case date_directive::minute:
                dt.minute = std::stoi(text);
                break;
            case date_directive::second:
                dt.second = std::stoi(text);
                break;
            case date_directive::month_abbr:
            case date_directive::month_name: {
                auto month = month_from_name(
                    text, directives_[i] == date_directive::month_abbr);
                if (!month) {
                    return std::nullopt;
                }
                dt.month = *month;
                break;
            }
        }
    }

    if (!dt.is_valid()) {
        return std::nullopt;
    }
    return dt;
}

auto compile_date_format(const std::string& format) -> result<compiled_date_pattern> {
    if (format.empty()) {
        return unexpected{error{error_code::invalid_date_format, "empty date format"}};
    }

    std::string source;
    std::vector<date_directive> directives;

    for (std::size_t i = 0; i < format.size(); ++i) {
        char c = format[i];
        if (c != '%') {
            if (is_regex_metachar(c)) {
                source += '\\';
            }
            source += c;
            continue;
        }

        if (i + 1 >= format.size()) {
            return unexpected{error{error_code::invalid_date_format,
                "dangling '%' in date format '" + format + "'"}};
        }

        char directive = format[++i];
        switch (directive) {
            case 'Y': source += R"((\d{4}))"; directives.push_back(date_directive::year4); break;
            case 'y': source += R"((\d{2}))"; directives.push_back(date_directive::year2); break;
            case 'm': source += R"((\d{1,2}))"; directives.push_back(date_directive::month); break;
            case 'd': source += R"((\d{1,2}))"; directives.push_back(date_directive::day); break;
            case 'H': source += R"((\d{1,2}))"; directives.push_back(date_directive::hour); break;
            case 'M': source += R"((\d{1,2}))"; directives.push_back(date_directive::minute); break;
            case 'S': source += R"((\d{1,2}))"; directives.push_back(date_directive::second); break;
            case 'b': source += "([A-Za-z]{3})"; directives.push_back(date_directive::month_abbr); break;
            case 'B': source += "([A-Za-z]+)"; directives.push_back(date_directive::month_name); break;
            case '%': source += '%'; break;
            default:
                return unexpected{error{error_code::invalid_date_format,
                    std::string("unsupported directive '%") + directive +
                    "' in date format '" + format + "'"}};
        }
    }

    if (directives.empty()) {
        return unexpected{error{error_code::invalid_date_format,
            "date format '" + format + "' contains no date directive"}};
    }

    return compiled_date_pattern(format, std::move(source), std::move(directives));
}

// ============================================================================
// Placeholder expansion
// ============================================================================

auto expand_date_placeholders(const std::string& pattern, const civil_datetime& now)
    -> std::string {
    if (pattern.empty()) {
        return pattern;
    }

    // Shield class-escape quantifiers such as \d{4} before touching braces
    static const std::regex quantifier_token(R"(\\[dswbDSWB]\{[0-9,]+\})");
    std::map<std::string, std::string> protected_parts;
    std::string working;
    {
        std::size_t last = 0;
        std::size_t index = 0;
        for (std::sregex_iterator it(pattern.begin(), pattern.end(), quantifier_token), end;
             it != end; ++it, ++index) {
            auto token = "\x01" + std::to_string(index) + "\x01";
            protected_parts[token] = it->str();
            working += pattern.substr(last, it->position() - last);
            working += token;
            last = it->position() + it->length();
        }
        working += pattern.substr(last);
    }

    std::string expanded;
    std::size_t pos = 0;
    while (pos < working.size()) {
        auto open = working.find('{', pos);
        if (open == std::string::npos) {
            expanded += working.substr(pos);
            break;
        }
        auto close = working.find('}', open + 1);
        if (close == std::string::npos) {
            expanded += working.substr(pos);
            break;
        }

        expanded += working.substr(pos, open - pos);
        auto body = working.substr(open + 1, close - open - 1);

        bool is_quantifier = !body.empty() &&
            std::all_of(body.begin(), body.end(),
                        [](unsigned char c) { return std::isdigit(c) || c == ','; });
        if (body.empty() || is_quantifier) {
            expanded += working.substr(open, close - open + 1);
        } else {
            for (char c : body) {
                auto value = expand_placeholder_char(c, now);
                expanded += value ? *value : std::string(1, c);
            }
        }
        pos = close + 1;
    }

    for (const auto& [token, original] : protected_parts) {
        std::size_t at = 0;
        while ((at = expanded.find(token, at)) != std::string::npos) {
            expanded.replace(at, token.size(), original);
            at += original.size();
        }
    }

    return expanded;
}

auto prepare_regex_pattern(const std::string& pattern,
                           const pattern_options& options,
                           const civil_datetime& now) -> std::string {
    if (pattern.empty()) {
        return pattern;
    }

    auto expanded = expand_date_placeholders(pattern, now);

    if (!options.escape_special_characters.empty()) {
        std::string escaped;
        for (char c : expanded) {
            if (options.escape_special_characters.find(c) != std::string::npos) {
                escaped += '\\';
            }
            escaped += c;
        }
        expanded = std::move(escaped);
    }

    if (options.dont_escape_brackets) {
        return expanded;
    }

    std::string processed;
    processed.reserve(expanded.size() + 8);
    for (std::size_t i = 0; i < expanded.size(); ++i) {
        char c = expanded[i];
        if (c == '\\' && i + 1 < expanded.size() &&
            (expanded[i + 1] == '[' || expanded[i + 1] == ']')) {
            processed += expanded.substr(i, 2);
            ++i;
        } else if (c == '[' || c == ']') {
            processed += '\\';
            processed += c;
        } else {
            processed += c;
        }
    }
    return processed;
}

}  // namespace kcenon::fetcher
