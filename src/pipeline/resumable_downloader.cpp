/**
 * @file resumable_downloader.cpp
 * @brief Implementation of the resumable downloader
 */

#include "kcenon/fetcher/pipeline/resumable_downloader.h"
#include "kcenon/fetcher/core/error_codes.h"
#include "kcenon/fetcher/core/logging.h"

#include <algorithm>
#include <chrono>
#include <unordered_set>

namespace kcenon::fetcher {

namespace {

auto base_name(const std::string& path) -> std::string {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

}  // namespace

auto renamed_remote_path(const std::string& remote_path, const std::string& prefix)
    -> std::string {
    auto pos = remote_path.rfind('/');
    auto renamed = prefix + "_" + base_name(remote_path);
    if (pos == std::string::npos) {
        return renamed;
    }
    return remote_path.substr(0, pos + 1) + renamed;
}

resumable_downloader::resumable_downloader(transfer_config config,
                                           connection_factory reconnect,
                                           sleep_function sleeper)
    : config_(std::move(config))
    , reconnect_(std::move(reconnect))
    , sleeper_(std::move(sleeper))
    , store_(config_.download.state_directory) {
    if (!sleeper_) {
        sleeper_ = default_sleeper();
    }
}

auto resumable_downloader::state_key() const -> transfer_state_key {
    return transfer_state_key{config_.download.instance_id, config_.download.channel_id};
}

auto resumable_downloader::local_path_for(const file_entry& file) const
    -> std::filesystem::path {
    const auto& settings = config_.download;
    if (!settings.append_full_path) {
        return settings.local_download_path / file.name;
    }

    auto relative = file.path;
    if (settings.skip_front_slash_path && !relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    } else if (settings.add_front_slash_path && (relative.empty() || relative.front() != '/')) {
        relative.insert(0, 1, '/');
    }
    // Never let the remote path replace the download root
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    return settings.local_download_path / relative;
}

void resumable_downloader::persist(const std::vector<std::string>& processed,
                                   const std::vector<std::string>& remaining) {
    auto saved = store_.save(state_key(), processed, remaining);
    if (!saved) {
        FETCHER_LOG_WARN(log_category::state,
            "Could not persist transfer state: " + saved.error().message);
    }
}

void resumable_downloader::rename_remote(remote_filesystem& fs, const file_entry& file) {
    auto target = renamed_remote_path(file.path, config_.download.file_parsed_string);
    FETCHER_LOG_INFO(log_category::download,
        "Renaming file on server: " + file.path + " -> " + target);

    auto renamed = fs.rename(file.path, target);
    if (!renamed) {
        fetch_log_context ctx;
        ctx.remote_path = file.path;
        ctx.error_message = renamed.error().message;
        FETCHER_LOG_ERROR_CTX(log_category::download,
            "Failed to rename file on server: " + renamed.error().message, ctx);
        return;
    }
    FETCHER_LOG_INFO(log_category::download, "File renamed successfully on server");
}

auto resumable_downloader::download_one(std::shared_ptr<remote_filesystem>& fs,
                                        const file_entry& file,
                                        const std::filesystem::path& local_path,
                                        const std::string& progress) -> attempt_outcome {
    const int max_retries = std::max(0, config_.download.max_reconnect_attempts);
    const auto delay =
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.download.reconnect_delay);

    fetch_log_context ctx;
    ctx.remote_path = file.path;
    ctx.file_size = file.size;

    int retries = 0;
    while (retries <= max_retries) {
        ctx.attempt = static_cast<uint32_t>(retries + 1);

        if (retries > 0) {
            FETCHER_LOG_INFO(log_category::download,
                "Retry " + std::to_string(retries) + "/" + std::to_string(max_retries) +
                " for " + file.name);
            if (!fs || !fs->is_alive()) {
                sleeper_(delay);
                auto resolved = reconnect_ ? reconnect_(config_) : resolved_connection{};
                if (!resolved) {
                    FETCHER_LOG_ERROR_CTX(log_category::download, "Reconnection failed", ctx);
                    ++retries;
                    continue;
                }
                fs = std::move(resolved.filesystem);
                FETCHER_LOG_INFO(log_category::download, "Reconnected to remote source");
            }
        }

        std::error_code ec;
        std::filesystem::create_directories(local_path.parent_path(), ec);

        FETCHER_LOG_DEBUG(log_category::download,
            "DOWNLOAD START: " + file.path + " -> " + local_path.string());
        auto started = std::chrono::steady_clock::now();

        auto fetched = fs ? fs->download(file.path, local_path)
                          : result<void>{unexpected{error{error_code::connection_closed,
                                "no remote connection"}}};
        if (!fetched) {
            ctx.error_message = fetched.error().message;
            FETCHER_LOG_ERROR_CTX(log_category::download,
                "DOWNLOAD ERROR: " + file.name + ": " + fetched.error().message, ctx);
            if (!is_retryable(fetched.error().code)) {
                FETCHER_LOG_ERROR_CTX(log_category::download,
                    progress + " " + file.name + " failed, not retrying (" +
                    to_string(fetched.error().code) + ")", ctx);
                return attempt_outcome::failed;
            }
            ++retries;
            continue;
        }

        auto local_size = std::filesystem::file_size(local_path, ec);
        if (ec) {
            ctx.error_message = ec.message();
            FETCHER_LOG_ERROR_CTX(log_category::download,
                "File not found after download: " + file.name, ctx);
            ++retries;
            continue;
        }

        if (local_size != file.size) {
            ctx.error_message = "size mismatch";
            FETCHER_LOG_ERROR_CTX(log_category::download,
                "SIZE MISMATCH: " + file.name + " - Expected: " + format_file_size(file.size) +
                ", Got: " + format_file_size(local_size), ctx);
            std::filesystem::remove(local_path, ec);
            ++retries;
            continue;
        }

        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count());
        ctx.error_message.reset();
        FETCHER_LOG_INFO_CTX(log_category::download,
            progress + " DOWNLOADED: " + file.name + " (" + format_file_size(file.size) + ")",
            ctx);
        return attempt_outcome::downloaded;
    }

    FETCHER_LOG_ERROR_CTX(log_category::download,
        progress + " " + file.name + " failed after " + std::to_string(max_retries) +
        " retries", ctx);
    return attempt_outcome::failed;
}

auto resumable_downloader::download(std::shared_ptr<remote_filesystem>& fs,
                                    const file_list& files) -> download_report {
    download_report report;
    if (files.empty()) {
        FETCHER_LOG_INFO(log_category::download, "No files to download");
        return report;
    }

    const auto& settings = config_.download;
    FETCHER_LOG_INFO(log_category::download,
        "Starting download: " + std::to_string(files.size()) + " files to " +
        settings.local_download_path.string());

    std::vector<std::string> processed;
    file_list work = files;

    auto loaded = store_.load(state_key());
    if (!loaded) {
        FETCHER_LOG_WARN(log_category::state,
            "Ignoring unreadable transfer state: " + loaded.error().message);
    } else if (settings.resume_transfer && !loaded.value().processed_files.empty()) {
        processed = loaded.value().processed_files;
        std::unordered_set<std::string> done(processed.begin(), processed.end());
        work.erase(std::remove_if(work.begin(), work.end(),
                                  [&](const file_entry& f) { return done.count(f.path) > 0; }),
                   work.end());
        FETCHER_LOG_INFO(log_category::download,
            "Resuming: " + std::to_string(processed.size()) + " done, " +
            std::to_string(work.size()) + " remaining");
    }

    std::error_code ec;
    std::filesystem::create_directories(settings.local_download_path, ec);
    if (ec) {
        FETCHER_LOG_ERROR(log_category::download,
            "Cannot create download directory " + settings.local_download_path.string() + ": " +
            ec.message());
    }

    report.resumed_count = processed.size();
    report.success_count = processed.size();
    report.total_count = work.size();

    // Outstanding remote paths (skipped or failed) from earlier iterations
    std::vector<std::string> outstanding;
    auto remaining_after = [&](std::size_t index) {
        std::vector<std::string> remaining = outstanding;
        for (std::size_t j = index + 1; j < work.size(); ++j) {
            remaining.push_back(work[j].path);
        }
        return remaining;
    };

    {
        std::vector<std::string> all;
        for (const auto& f : work) {
            all.push_back(f.path);
        }
        persist(processed, all);
    }

    for (std::size_t i = 0; i < work.size(); ++i) {
        const auto& file = work[i];
        auto local_path = local_path_for(file);
        auto progress = "[" + std::to_string(i + 1) + "/" + std::to_string(work.size()) + "]";

        FETCHER_LOG_DEBUG(log_category::download,
            progress + " " + file.name + " (" + format_file_size(file.size) + ")");

        if (!settings.overwrite_existing && std::filesystem::exists(local_path, ec)) {
            FETCHER_LOG_INFO(log_category::download, "SKIPPED: " + file.name + " (exists)");
            ++report.skipped_count;
            report.skipped_files.push_back(file.name);
            outstanding.push_back(file.path);
            continue;
        }

        if (download_one(fs, file, local_path, progress) == attempt_outcome::failed) {
            ++report.failed_count;
            report.failed_files.push_back(file.name);
            outstanding.push_back(file.path);
            continue;
        }

        ++report.success_count;
        processed.push_back(file.path);
        report.downloaded_files.push_back(local_path);

        if (settings.rename_after_fetching && fs) {
            rename_remote(*fs, file);
        }

        persist(processed, remaining_after(i));
    }

    FETCHER_LOG_INFO(log_category::download,
        "Download complete: " + std::to_string(report.success_count) + " success, " +
        std::to_string(report.skipped_count) + " skipped, " +
        std::to_string(report.failed_count) + " failed");

    if (report.failed_count > 0) {
        std::string names;
        for (const auto& name : report.failed_files) {
            names += (names.empty() ? "" : ", ") + name;
        }
        FETCHER_LOG_ERROR(log_category::download, "Failed files: " + names);
    }

    if (report.failed_count == 0 && report.skipped_count == 0) {
        auto cleared = store_.clear(state_key());
        if (!cleared) {
            FETCHER_LOG_WARN(log_category::state,
                "Could not clear transfer state: " + cleared.error().message);
        } else {
            FETCHER_LOG_INFO(log_category::state, "State cleared - all files processed");
        }
    } else {
        persist(processed, outstanding);
    }

    return report;
}

auto download_files(std::shared_ptr<remote_filesystem>& fs, const file_list& files,
                    const transfer_config& config) -> download_report {
    resumable_downloader downloader(config);
    return downloader.download(fs, files);
}

}  // namespace kcenon::fetcher
