/**
 * @file file_transfer_pipeline.cpp
 * @brief Implementation of run_file_transfer
 */

#include "kcenon/fetcher/pipeline/file_transfer_pipeline.h"
#include "kcenon/fetcher/core/logging.h"
#include "kcenon/fetcher/pipeline/filter_engine.h"
#include "kcenon/fetcher/pipeline/resumable_downloader.h"
#include "kcenon/fetcher/pipeline/sort_engine.h"

namespace kcenon::fetcher {

namespace {

auto collect_regular_files(const std::filesystem::path& root)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
        return files;
    }
    for (std::filesystem::recursive_directory_iterator it(root, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    return files;
}

/**
 * @brief Closes the current handle however the pipeline exits
 */
class connection_guard {
public:
    explicit connection_guard(std::shared_ptr<remote_filesystem>& fs) : fs_(fs) {}
    ~connection_guard() {
        if (fs_) {
            fs_->close();
        }
    }

    connection_guard(const connection_guard&) = delete;
    auto operator=(const connection_guard&) -> connection_guard& = delete;

private:
    std::shared_ptr<remote_filesystem>& fs_;
};

}  // namespace

auto run_file_transfer(const transfer_config& config,
                       const std::filesystem::path& download_dir,
                       const pipeline_dependencies& deps) -> transfer_outcome {
    transfer_outcome outcome;

    try {
        auto effective = config;
        effective.download.local_download_path = download_dir;

        auto connect = deps.connect ? deps.connect : default_connection_factory();
        auto resolved = connect(effective);
        if (!resolved) {
            outcome.error = "Failed to create connection";
            return outcome;
        }

        auto fs = resolved.filesystem;
        connection_guard guard(fs);

        auto listing = list_files(*fs, effective, deps.sleeper);
        if (listing.files.empty()) {
            outcome.success = true;
            outcome.metadata.message = "No files found";
            return outcome;
        }

        FETCHER_LOG_INFO(log_category::pipeline,
            "Filtering " + std::to_string(listing.files.size()) + " files");
        auto filtered = filter_files(listing.files, effective);
        if (filtered.empty()) {
            outcome.success = true;
            outcome.metadata.total_found = listing.files.size();
            outcome.metadata.message = "No files match filters";
            return outcome;
        }

        FETCHER_LOG_INFO(log_category::pipeline,
            "Sorting " + std::to_string(filtered.size()) + " files");
        auto sorted = sort_files(filtered, effective.sorting);

        FETCHER_LOG_INFO(log_category::pipeline,
            "Starting download of " + std::to_string(sorted.size()) + " files");
        resumable_downloader downloader(effective, connect, deps.sleeper);
        auto report = downloader.download(fs, sorted);

        FETCHER_LOG_INFO(log_category::pipeline,
            "Download complete: " + std::to_string(report.success_count) + " success, " +
            std::to_string(report.outstanding()) + " outstanding");

        outcome.success = report.success_count > 0;
        outcome.files_downloaded = collect_regular_files(download_dir);
        outcome.metadata.total_found = listing.files.size();
        outcome.metadata.after_filtering = filtered.size();
        outcome.metadata.after_sorting = sorted.size();
        outcome.metadata.downloaded = report.success_count;
        outcome.metadata.failed = report.outstanding();
        return outcome;
    } catch (const std::exception& e) {
        FETCHER_LOG_ERROR(log_category::pipeline,
            std::string("File transfer failed: ") + e.what());
        outcome.success = false;
        outcome.error = e.what();
        outcome.files_downloaded.clear();
        return outcome;
    }
}

}  // namespace kcenon::fetcher
