/**
 * @file directory_lister.cpp
 * @brief Implementation of the recursive directory lister
 */

#include "kcenon/fetcher/pipeline/directory_lister.h"
#include "kcenon/fetcher/core/error_codes.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <thread>

namespace kcenon::fetcher {

namespace {

auto base_name(const std::string& path) -> std::string {
    auto trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto pos = trimmed.rfind('/');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

auto child_path(const std::string& parent, const remote_entry& entry) -> std::string {
    if (!entry.path.empty()) {
        return entry.path;
    }
    if (parent.empty() || parent.back() == '/') {
        return parent + entry.name;
    }
    return parent + "/" + entry.name;
}

}  // namespace

auto default_sleeper() -> sleep_function {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

auto lister_options::from_config(const transfer_config& config) -> lister_options {
    lister_options options;
    options.max_retries = std::max(0, config.download.max_reconnect_attempts);
    options.deadline = config.listing_deadline;
    options.exclude_folders = config.selection.exclude_folders;
    options.skip_sub_folders = config.selection.skip_sub_folders;
    return options;
}

struct directory_lister::walk_state {
    listing_result result;
    std::chrono::steady_clock::time_point started;
    std::chrono::system_clock::time_point now;

    [[nodiscard]] auto expired(std::chrono::seconds deadline) const -> bool {
        return deadline.count() > 0 &&
               std::chrono::steady_clock::now() - started >= deadline;
    }
};

directory_lister::directory_lister(lister_options options, sleep_function sleeper)
    : options_(std::move(options)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = default_sleeper();
    }
}

auto directory_lister::retry_delay(int retry) const -> std::chrono::milliseconds {
    auto shift = std::clamp(retry - 1, 0, 20);
    return options_.base_delay * (int64_t{1} << shift);
}

auto directory_lister::is_excluded(const std::string& dir_path) const -> bool {
    if (options_.exclude_folders.empty()) {
        return false;
    }
    auto name = base_name(dir_path);
    return std::find(options_.exclude_folders.begin(), options_.exclude_folders.end(), name) !=
           options_.exclude_folders.end();
}

auto directory_lister::list(remote_filesystem& fs, const std::string& root) const
    -> listing_result {
    walk_state state;
    state.started = std::chrono::steady_clock::now();
    state.now = std::chrono::system_clock::now();

    FETCHER_LOG_INFO(log_category::listing, "Listing files from: " + root);
    walk(fs, root, 0, state);

    auto& result = state.result;
    if (!result.skipped_folders.empty()) {
        FETCHER_LOG_INFO(log_category::listing,
            "Folders skipped during listing: " + std::to_string(result.skipped_folders.size()));
        for (const auto& folder : result.skipped_folders) {
            FETCHER_LOG_DEBUG(log_category::listing, "  - " + folder);
        }
    }
    if (result.deadline_reached) {
        FETCHER_LOG_WARN(log_category::listing,
            "Listing deadline of " + std::to_string(options_.deadline.count()) +
            "s reached, keeping " + std::to_string(result.files.size()) + " files");
    }

    FETCHER_LOG_INFO(log_category::listing,
        "Found " + std::to_string(result.files.size()) + " files");
    return std::move(state.result);
}

void directory_lister::walk(remote_filesystem& fs, const std::string& path, int depth,
                            walk_state& state) const {
    if (state.result.deadline_reached) {
        return;
    }
    if (state.expired(options_.deadline)) {
        state.result.deadline_reached = true;
        return;
    }

    const std::string indent(static_cast<std::size_t>(depth) * 2, ' ');
    FETCHER_LOG_DEBUG(log_category::listing, indent + "Scanning directory: " + path);

    std::vector<remote_entry> entries;
    for (int retry = 0;; ++retry) {
        auto listed = fs.list(path);
        if (listed) {
            entries = std::move(listed.value());
            break;
        }

        fetch_log_context ctx;
        ctx.remote_path = path;
        ctx.attempt = static_cast<uint32_t>(retry + 1);
        ctx.error_message = listed.error().message;
        FETCHER_LOG_ERROR_CTX(log_category::listing,
            indent + "Failed to list directory " + path + ": " + listed.error().message, ctx);

        if (!is_retryable(listed.error().code)) {
            FETCHER_LOG_ERROR(log_category::listing,
                indent + "Not retrying listing of " + path + " (" +
                to_string(listed.error().code) + ")");
            state.result.failed_directories.push_back(path);
            return;
        }
        if (retry >= options_.max_retries) {
            FETCHER_LOG_ERROR(log_category::listing,
                indent + "Maximum retry attempts reached. Listing failed for " + path + ".");
            state.result.failed_directories.push_back(path);
            return;
        }
        if (state.expired(options_.deadline)) {
            state.result.deadline_reached = true;
            return;
        }

        auto delay = retry_delay(retry + 1);
        FETCHER_LOG_INFO(log_category::listing,
            indent + "Retrying listing in " + std::to_string(delay.count()) + " ms (attempt " +
            std::to_string(retry + 1) + "/" + std::to_string(options_.max_retries) + ")");
        sleeper_(delay);
    }

    FETCHER_LOG_DEBUG(log_category::listing,
        indent + "Found " + std::to_string(entries.size()) + " items in " + path);

    for (const auto& entry : entries) {
        if (entry.type == entry_type::directory) {
            auto dir_path = child_path(path, entry);
            if (is_excluded(dir_path)) {
                FETCHER_LOG_INFO(log_category::listing,
                    indent + "SKIP FOLDER: " + dir_path + " (matches excluded folder name: " +
                    base_name(dir_path) + ")");
                state.result.skipped_folders.push_back(dir_path);
                continue;
            }
            if (options_.skip_sub_folders) {
                FETCHER_LOG_DEBUG(log_category::listing,
                    indent + "SKIP SUBFOLDER: " + dir_path + " (skipSubFolders=true)");
                continue;
            }
            walk(fs, dir_path, depth + 1, state);
            if (state.result.deadline_reached) {
                return;
            }
            continue;
        }

        file_entry file;
        file.path = child_path(path, entry);
        file.name = entry.name.empty() ? base_name(file.path) : base_name(entry.name);
        file.size = entry.size;
        file.mtime = normalize_mtime(entry.mtime, state.now);
        file.type = entry_type::file;

        FETCHER_LOG_TRACE(log_category::listing,
            indent + "FOUND FILE: " + file.name + " - Size: " + format_file_size(file.size));
        state.result.files.push_back(std::move(file));
    }
}

auto resolve_listing_root(const transfer_config& config) -> std::string {
    auto path = config.path.empty() ? std::string("/") : config.path;

    auto type = config.connection.type;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (type == "s3" && !config.connection.bucket.empty()) {
        if (path.front() == '/') {
            return config.connection.bucket + path;
        }
        return config.connection.bucket + "/" + path;
    }
    return path;
}

auto normalize_mtime(const remote_mtime& mtime, std::chrono::system_clock::time_point now)
    -> std::chrono::system_clock::time_point {
    if (const auto* tp = std::get_if<std::chrono::system_clock::time_point>(&mtime)) {
        return *tp;
    }
    if (const auto* epoch = std::get_if<double>(&mtime)) {
        if (!std::isfinite(*epoch) || *epoch < 0) {
            return now;
        }
        auto micros = std::chrono::microseconds(static_cast<int64_t>(*epoch * 1e6));
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(micros));
    }
    return now;
}

auto format_file_size(uint64_t size) -> std::string {
    char buffer[64];
    if (size >= 1024 * 1024) {
        std::snprintf(buffer, sizeof(buffer), "%.2f MB",
                      static_cast<double>(size) / (1024.0 * 1024.0));
    } else if (size >= 1024) {
        std::snprintf(buffer, sizeof(buffer), "%.2f KB", static_cast<double>(size) / 1024.0);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%llu Bytes",
                      static_cast<unsigned long long>(size));
    }
    return buffer;
}

auto list_files(remote_filesystem& fs, const transfer_config& config, sleep_function sleeper)
    -> listing_result {
    directory_lister lister(lister_options::from_config(config), std::move(sleeper));
    return lister.list(fs, resolve_listing_root(config));
}

}  // namespace kcenon::fetcher
