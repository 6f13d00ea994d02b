/**
 * @file local_filesystem.cpp
 * @brief Implementation of local_filesystem
 */

#include "kcenon/fetcher/connection/local_filesystem.h"

#include <system_error>

namespace kcenon::fetcher {

namespace {

auto closed_error() -> unexpected {
    return unexpected{error{error_code::connection_closed, "local filesystem handle is closed"}};
}

auto classify_fs_error(const std::error_code& ec) -> error_code {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return error_code::permission_denied;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return error_code::path_not_found;
    }
    return error_code::listing_failed;
}

}  // namespace

auto local_filesystem::list(const std::string& path) -> result<std::vector<remote_entry>> {
    if (closed_) {
        return closed_error();
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        return unexpected{error{classify_fs_error(ec),
            "cannot list '" + path + "': " + ec.message()}};
    }

    std::vector<remote_entry> entries;
    for (const auto& dirent : it) {
        remote_entry entry;
        entry.name = dirent.path().filename().string();
        entry.path = dirent.path().generic_string();

        std::error_code status_ec;
        if (dirent.is_symlink(status_ec)) {
            entry.type = dirent.is_directory(status_ec) ? entry_type::directory
                                                        : entry_type::link;
        } else if (dirent.is_directory(status_ec)) {
            entry.type = entry_type::directory;
        } else if (dirent.is_regular_file(status_ec)) {
            entry.type = entry_type::file;
            entry.size = dirent.file_size(status_ec);
        } else {
            entry.type = entry_type::other;
        }

        auto ftime = dirent.last_write_time(status_ec);
        if (!status_ec) {
            entry.mtime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(ftime));
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

auto local_filesystem::download(const std::string& remote_path,
                                const std::filesystem::path& local_path) -> result<void> {
    if (closed_) {
        return closed_error();
    }

    std::error_code ec;
    if (local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path(), ec);
    }
    std::filesystem::copy_file(remote_path, local_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected{error{error_code::download_failed,
            "copy '" + remote_path + "' failed: " + ec.message()}};
    }
    return {};
}

auto local_filesystem::rename(const std::string& from, const std::string& to)
    -> result<void> {
    if (closed_) {
        return closed_error();
    }

    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        return unexpected{error{error_code::rename_failed,
            "rename '" + from + "' failed: " + ec.message()}};
    }
    return {};
}

}  // namespace kcenon::fetcher
