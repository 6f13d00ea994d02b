/**
 * @file curl_filesystem.cpp
 * @brief Implementation of curl_filesystem
 * @version 0.1.0
 */

#include "kcenon/fetcher/connection/curl_filesystem.h"
#include "kcenon/fetcher/connection/s3_utils.h"
#include "kcenon/fetcher/core/logging.h"

#include "curl_easy.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace kcenon::fetcher {

namespace {

struct token {
    std::size_t start;
    std::string_view text;
};

auto tokenize(std::string_view line) -> std::vector<token> {
    std::vector<token> tokens;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        if (pos >= line.size()) {
            break;
        }
        auto start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        tokens.push_back({start, line.substr(start, pos - start)});
    }
    return tokens;
}

auto all_digits(std::string_view text) -> bool {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

auto to_int(std::string_view text) -> int {
    int value = 0;
    for (char c : text) {
        value = value * 10 + (c - '0');
    }
    return value;
}

// Sizes beyond uint64_t reject the line
auto parse_size(const std::string& digits) -> std::optional<uint64_t> {
    try {
        return std::stoull(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto month_index(std::string_view text) -> int {
    static constexpr std::array<std::string_view, 12> months = {
        "jan", "feb", "mar", "apr", "may", "jun",
        "jul", "aug", "sep", "oct", "nov", "dec"};
    if (text.size() != 3) {
        return 0;
    }
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (std::size_t i = 0; i < months.size(); ++i) {
        if (months[i] == lower) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

auto utc_time_point(int year, int month, int day, int hour, int minute)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        return std::nullopt;
    }
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    auto seconds = timegm(&tm_buf);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

auto utc_year(std::chrono::system_clock::time_point tp) -> int {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);
    return tm_buf.tm_year + 1900;
}

auto join_path(const std::string& directory, std::string_view name) -> std::string {
    if (directory.empty()) {
        return std::string(name);
    }
    if (directory.back() == '/') {
        return directory + std::string(name);
    }
    return directory + "/" + std::string(name);
}

//   drwxr-xr-x 1 owner group    4096 Jan 10 11:58 version
//   -rw-r--r-- 1 owner          1084 Feb 28  2016 notes.txt
//   lrwxrwxrwx 1 owner group      18 Apr 26 15:17 current -> releases/7
auto parse_unix_line(std::string_view line, const std::string& directory,
                     std::chrono::system_clock::time_point now)
    -> std::optional<remote_entry> {
    auto tokens = tokenize(line);
    if (tokens.size() < 7 || tokens[0].text.size() < 10) {
        return std::nullopt;
    }

    char type_tag = tokens[0].text[0];
    if (std::string_view("-dlbcps").find(type_tag) == std::string_view::npos) {
        return std::nullopt;
    }

    // Owner and group columns are optional; anchor on "<size> <month> <day> <time>"
    for (std::size_t m = 3; m + 3 < tokens.size() && m <= 5; ++m) {
        int month = month_index(tokens[m].text);
        if (month == 0 || !all_digits(tokens[m - 1].text) ||
            !all_digits(tokens[m + 1].text)) {
            continue;
        }

        auto time_or_year = tokens[m + 2].text;
        int day = to_int(tokens[m + 1].text);
        std::optional<std::chrono::system_clock::time_point> mtime;

        auto colon = time_or_year.find(':');
        if (colon != std::string_view::npos) {
            auto hour_text = time_or_year.substr(0, colon);
            auto minute_text = time_or_year.substr(colon + 1);
            if (!all_digits(hour_text) || !all_digits(minute_text)) {
                continue;
            }
            int year = utc_year(now);
            mtime = utc_time_point(year, month, day, to_int(hour_text), to_int(minute_text));
            if (mtime && *mtime > now + std::chrono::hours(24)) {
                mtime = utc_time_point(year - 1, month, day,
                                       to_int(hour_text), to_int(minute_text));
            }
        } else if (time_or_year.size() == 4 && all_digits(time_or_year)) {
            mtime = utc_time_point(to_int(time_or_year), month, day, 0, 0);
        }
        if (!mtime) {
            continue;
        }

        auto name = line.substr(tokens[m + 3].start);
        while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
            name.remove_suffix(1);
        }
        if (type_tag == 'l') {
            auto arrow = name.find(" -> ");
            if (arrow != std::string_view::npos) {
                name = name.substr(0, arrow);
            }
        }
        if (type_tag == 'd' && !name.empty() && name.back() == '/') {
            name.remove_suffix(1);
        }
        if (name.empty() || name == "." || name == "..") {
            return std::nullopt;
        }

        remote_entry entry;
        entry.name = std::string(name);
        entry.path = join_path(directory, name);
        entry.mtime = *mtime;
        switch (type_tag) {
            case '-': {
                auto size = parse_size(std::string(tokens[m - 1].text));
                if (!size) {
                    return std::nullopt;
                }
                entry.type = entry_type::file;
                entry.size = *size;
                break;
            }
            case 'd': entry.type = entry_type::directory; break;
            case 'l': entry.type = entry_type::link; break;
            default: entry.type = entry_type::other; break;
        }
        return entry;
    }
    return std::nullopt;
}

//   10-27-15  03:46AM       <DIR>          pub
//   06-20-2017  12:50PM          11,399 readme.txt
auto parse_dos_line(std::string_view line, const std::string& directory,
                    std::chrono::system_clock::time_point now)
    -> std::optional<remote_entry> {
    auto tokens = tokenize(line);
    if (tokens.size() < 4) {
        return std::nullopt;
    }

    auto date = tokens[0].text;
    if (date.size() < 8 || (date[2] != '-' && date[2] != '/') || date[5] != date[2]) {
        return std::nullopt;
    }
    auto month_text = date.substr(0, 2);
    auto day_text = date.substr(3, 2);
    auto year_text = date.substr(6);
    if (!all_digits(month_text) || !all_digits(day_text) || !all_digits(year_text)) {
        return std::nullopt;
    }

    int year = to_int(year_text);
    if (year_text.size() == 2) {
        int current = utc_year(now);
        year += (current / 100) * 100;
        if (year > current + 1) {
            year -= 100;
        }
    } else if (year_text.size() != 4) {
        return std::nullopt;
    }

    auto time = tokens[1].text;
    auto colon = time.find(':');
    if (colon == std::string_view::npos || time.size() < colon + 3) {
        return std::nullopt;
    }
    auto hour_text = time.substr(0, colon);
    auto minute_text = time.substr(colon + 1, 2);
    if (!all_digits(hour_text) || !all_digits(minute_text)) {
        return std::nullopt;
    }
    int hour = to_int(hour_text);
    auto period = time.substr(colon + 3);
    if (period == "PM" && hour < 12) {
        hour += 12;
    } else if (period == "AM" && hour == 12) {
        hour = 0;
    }

    auto mtime = utc_time_point(year, to_int(month_text), to_int(day_text),
                                hour, to_int(minute_text));
    if (!mtime) {
        return std::nullopt;
    }

    remote_entry entry;
    auto size_or_dir = tokens[2].text;
    if (size_or_dir == "<DIR>") {
        entry.type = entry_type::directory;
    } else {
        std::string digits;
        for (char c : size_or_dir) {
            if (c != ',' && c != '.') {
                digits += c;
            }
        }
        if (!all_digits(digits)) {
            return std::nullopt;
        }
        auto size = parse_size(digits);
        if (!size) {
            return std::nullopt;
        }
        entry.type = entry_type::file;
        entry.size = *size;
    }

    auto name = line.substr(tokens[3].start);
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
        name.remove_suffix(1);
    }
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }

    entry.name = std::string(name);
    entry.path = join_path(directory, name);
    entry.mtime = *mtime;
    return entry;
}

#if FETCHER_HAS_CURL
auto write_to_stream(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* out = static_cast<std::ofstream*>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return *out ? size * nmemb : 0;
}
#endif

}  // namespace

auto curl_filesystem::parse_listing(const std::string& text,
                                    const std::string& directory,
                                    std::chrono::system_clock::time_point now)
    -> std::vector<remote_entry> {
    std::vector<remote_entry> entries;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.rfind("total ", 0) == 0) {
            continue;
        }

        auto entry = std::isdigit(static_cast<unsigned char>(line[0]))
                         ? parse_dos_line(line, directory, now)
                         : parse_unix_line(line, directory, now);
        if (entry) {
            entries.push_back(std::move(*entry));
        } else {
            FETCHER_LOG_DEBUG(log_category::listing, "Skipping unparsable listing line: " + line);
        }
    }
    return entries;
}

// ============================================================================
// Implementation
// ============================================================================

struct curl_filesystem::impl {
    curl_session_settings settings;
    std::mutex mutex;
    std::atomic<bool> alive{true};
    std::atomic<bool> closed{false};
#if FETCHER_HAS_CURL
    detail::curl_easy_ptr handle;
#endif

    explicit impl(curl_session_settings s) : settings(std::move(s)) {
#if FETCHER_HAS_CURL
        handle = detail::make_curl_easy();
        if (!handle) {
            alive = false;
        }
#endif
    }

    [[nodiscard]] auto is_sftp() const -> bool { return settings.protocol == "sftp"; }

    [[nodiscard]] auto base_url() const -> std::string {
        return settings.protocol + "://" + settings.host + ":" + std::to_string(settings.port);
    }

    /**
     * @brief URL for a remote path
     *
     * FTP URLs are relative to the login directory, so an absolute path
     * becomes "//path". SFTP URLs are absolute; relative paths go under "~/".
     */
    [[nodiscard]] auto url_for(const std::string& path, bool directory) const -> std::string {
        auto encoded = s3_utils::url_encode(path, false);
        std::string url = base_url();
        if (is_sftp()) {
            url += (!path.empty() && path.front() == '/') ? encoded : "/~/" + encoded;
        } else {
            url += "/" + encoded;
        }
        if (directory && url.back() != '/') {
            url += '/';
        }
        return url;
    }

#if FETCHER_HAS_CURL
    auto prepare(const std::string& url, char* errbuf) -> CURL* {
        CURL* curl = handle.get();
        // reset keeps the connection cache, so the session is reused
        curl_easy_reset(curl);
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(settings.connection_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(settings.connection_timeout.count()));
        if (!settings.user.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERNAME, settings.user.c_str());
            curl_easy_setopt(curl, CURLOPT_PASSWORD, settings.pass.c_str());
        }
        if (!is_sftp()) {
            curl_easy_setopt(curl, CURLOPT_FTP_FILEMETHOD,
                             static_cast<long>(CURLFTPMETHOD_SINGLECWD));
            curl_easy_setopt(curl, CURLOPT_FTP_USE_EPSV, settings.passive ? 1L : 0L);
            if (!settings.passive) {
                curl_easy_setopt(curl, CURLOPT_FTPPORT, "-");
            }
        }
        return curl;
    }

    auto failure(CURLcode code, const char* errbuf, const std::string& context) -> error {
        if (detail::is_session_fatal(code)) {
            alive = false;
        }
        return error{detail::map_curl_code(code),
                     context + ": " + detail::curl_error_message(code, errbuf)};
    }
#endif

    [[nodiscard]] auto unavailable() const -> result<void> {
        if (closed) {
            return unexpected{error{error_code::connection_closed,
                settings.protocol + " session is closed"}};
        }
#if FETCHER_HAS_CURL
        if (!handle) {
            return unexpected{error{error_code::internal_error, "curl_easy_init failed"}};
        }
        return {};
#else
        return unexpected{error{error_code::transport_unavailable,
            settings.protocol + " support requires libcurl (FETCHER_ENABLE_CURL)"}};
#endif
    }
};

curl_filesystem::curl_filesystem(curl_session_settings settings)
    : impl_(std::make_unique<impl>(std::move(settings))) {}

curl_filesystem::~curl_filesystem() = default;

auto curl_filesystem::list(const std::string& path) -> result<std::vector<remote_entry>> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (auto check = impl_->unavailable(); !check) {
        return unexpected{check.error()};
    }

#if FETCHER_HAS_CURL
    std::string body;
    char errbuf[CURL_ERROR_SIZE] = {0};
    CURL* curl = impl_->prepare(impl_->url_for(path, true), errbuf);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &detail::write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

    auto code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        return unexpected{impl_->failure(code, errbuf, "LIST " + path)};
    }
    return parse_listing(body, path, std::chrono::system_clock::now());
#else
    (void)path;
    return unexpected{error{error_code::transport_unavailable, "libcurl not available"}};
#endif
}

auto curl_filesystem::download(const std::string& remote_path,
                               const std::filesystem::path& local_path) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (auto check = impl_->unavailable(); !check) {
        return check;
    }

#if FETCHER_HAS_CURL
    std::error_code ec;
    if (local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path(), ec);
    }

    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected{error{error_code::local_write_error,
            "cannot open '" + local_path.string() + "' for writing"}};
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    CURL* curl = impl_->prepare(impl_->url_for(remote_path, false), errbuf);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_to_stream);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out);

    auto code = curl_easy_perform(curl);
    out.close();
    if (code != CURLE_OK) {
        std::filesystem::remove(local_path, ec);
        return unexpected{impl_->failure(code, errbuf, "RETR " + remote_path)};
    }
    return {};
#else
    (void)remote_path;
    (void)local_path;
    return unexpected{error{error_code::transport_unavailable, "libcurl not available"}};
#endif
}

auto curl_filesystem::rename(const std::string& from, const std::string& to) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (auto check = impl_->unavailable(); !check) {
        return check;
    }

#if FETCHER_HAS_CURL
    detail::curl_slist_ptr commands;
    bool built = impl_->is_sftp()
        ? detail::append_slist(commands, "rename \"" + from + "\" \"" + to + "\"")
        : detail::append_slist(commands, "RNFR " + from) &&
          detail::append_slist(commands, "RNTO " + to);
    if (!built) {
        return unexpected{error{error_code::internal_error, "failed to build rename commands"}};
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    CURL* curl = impl_->prepare(impl_->url_for("", true), errbuf);
    curl_easy_setopt(curl, CURLOPT_QUOTE, commands.get());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);

    auto code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        auto err = impl_->failure(code, errbuf, "rename " + from);
        return unexpected{error{error_code::rename_failed, err.message}};
    }
    return {};
#else
    (void)from;
    (void)to;
    return unexpected{error{error_code::transport_unavailable, "libcurl not available"}};
#endif
}

auto curl_filesystem::is_alive() const -> bool {
    return impl_->alive && !impl_->closed;
}

void curl_filesystem::close() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->closed = true;
#if FETCHER_HAS_CURL
    impl_->handle.reset();
#endif
}

auto curl_filesystem::protocol() const -> std::string_view {
    return impl_->settings.protocol;
}

}  // namespace kcenon::fetcher
