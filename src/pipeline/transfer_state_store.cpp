/**
 * @file transfer_state_store.cpp
 * @brief Implementation of the file-backed transfer state store
 */

#include "kcenon/fetcher/pipeline/transfer_state_store.h"
#include "kcenon/fetcher/core/json_utils.h"
#include "kcenon/fetcher/core/logging.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>

namespace kcenon::fetcher {

namespace {

auto format_iso_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()) % std::chrono::seconds(1);
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &time_t_val);
#else
    localtime_r(&time_t_val, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
        << std::setfill('0') << micros.count();
    return oss.str();
}

auto parse_iso_timestamp(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm_buf{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    tm_buf.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));
}

// Key parts become one file name component
auto file_name_part(std::string part) -> std::string {
    for (auto& c : part) {
        if (c == '/' || c == '\\' || c == ':' || c == '\0') {
            c = '_';
        }
    }
    return part;
}

auto default_state_directory() -> std::filesystem::path {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path(".") : dir;
}

}  // namespace

auto serialize_transfer_state(const transfer_state& state) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"processed_files\": "
        << json_utils::format_string_array(state.processed_files, "  ") << ",\n";
    oss << "  \"remaining_files\": "
        << json_utils::format_string_array(state.remaining_files, "  ") << ",\n";
    oss << "  \"timestamp\": \"" << format_iso_timestamp(state.timestamp) << "\"\n";
    oss << "}";
    return oss.str();
}

auto deserialize_transfer_state(const std::string& json) -> result<transfer_state> {
    auto processed = json_utils::extract_string_array(json, "processed_files");
    if (!processed) {
        return unexpected{error{error_code::state_corrupted,
            "state document has no valid processed_files array"}};
    }

    transfer_state state;
    state.processed_files = std::move(*processed);
    if (auto remaining = json_utils::extract_string_array(json, "remaining_files")) {
        state.remaining_files = std::move(*remaining);
    }
    if (auto stamp = json_utils::extract_value(json, "timestamp")) {
        if (auto parsed = parse_iso_timestamp(*stamp)) {
            state.timestamp = *parsed;
        }
    }
    return state;
}

// ============================================================================
// transfer_state_store::impl
// ============================================================================

class transfer_state_store::impl {
public:
    explicit impl(std::filesystem::path directory)
        : directory_(directory.empty() ? default_state_directory() : std::move(directory)) {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
    }

    auto path_for(const transfer_state_key& key) const -> std::filesystem::path {
        return directory_ /
               ("transfer_state_" + file_name_part(key.instance_id) + "_" +
                file_name_part(key.channel_id) + ".json");
    }

    auto save(const transfer_state_key& key,
              const std::vector<std::string>& processed,
              const std::vector<std::string>& remaining) -> result<void> {
        std::unique_lock lock(mutex_);

        transfer_state state;
        state.processed_files = processed;
        state.remaining_files = remaining;
        state.timestamp = std::chrono::system_clock::now();

        auto path = path_for(key);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream file(temp_path, std::ios::trunc);
            if (!file) {
                FETCHER_LOG_ERROR(log_category::state,
                    "Failed to open state file for writing: " + temp_path.string());
                return unexpected{error{error_code::state_write_error,
                    "failed to open state file for writing: " + temp_path.string()}};
            }

            file << serialize_transfer_state(state);
            file.flush();
            if (!file) {
                FETCHER_LOG_ERROR(log_category::state,
                    "Failed to write state file: " + temp_path.string());
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                return unexpected{error{error_code::state_write_error,
                    "failed to write state file: " + temp_path.string()}};
            }
        }

        // The previous document stays intact until the new one is complete
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            FETCHER_LOG_ERROR(log_category::state,
                "Failed to replace state file " + path.string() + ": " + ec.message());
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return unexpected{error{error_code::state_write_error,
                "failed to replace state file: " + ec.message()}};
        }

        FETCHER_LOG_DEBUG(log_category::state,
            "Saved transfer state: " + std::to_string(processed.size()) + " processed, " +
            std::to_string(remaining.size()) + " remaining");
        return {};
    }

    auto load(const transfer_state_key& key) const -> result<transfer_state> {
        std::shared_lock lock(mutex_);

        auto path = path_for(key);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            FETCHER_LOG_TRACE(log_category::state, "No state file at " + path.string());
            return transfer_state{};
        }

        std::ifstream file(path);
        if (!file) {
            FETCHER_LOG_ERROR(log_category::state, "Failed to open state file: " + path.string());
            return unexpected{error{error_code::state_read_error,
                "failed to open state file: " + path.string()}};
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        auto state = deserialize_transfer_state(oss.str());
        if (!state) {
            FETCHER_LOG_ERROR(log_category::state,
                "Failed to parse state file " + path.string() + ": " + state.error().message);
            return state;
        }

        FETCHER_LOG_DEBUG(log_category::state,
            "Loaded transfer state: " + std::to_string(state.value().processed_files.size()) +
            " processed, " + std::to_string(state.value().remaining_files.size()) + " remaining");
        return state;
    }

    auto clear(const transfer_state_key& key) -> result<void> {
        std::unique_lock lock(mutex_);

        auto path = path_for(key);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            FETCHER_LOG_ERROR(log_category::state,
                "Failed to delete state file: " + path.string() + " (" + ec.message() + ")");
            return unexpected{error{error_code::state_write_error,
                "failed to delete state file: " + ec.message()}};
        }
        FETCHER_LOG_DEBUG(log_category::state, "Cleared transfer state: " + path.string());
        return {};
    }

    auto exists(const transfer_state_key& key) const -> bool {
        std::shared_lock lock(mutex_);
        std::error_code ec;
        return std::filesystem::exists(path_for(key), ec);
    }

    auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    std::filesystem::path directory_;
    mutable std::shared_mutex mutex_;
};

// ============================================================================
// transfer_state_store
// ============================================================================

transfer_state_store::transfer_state_store(std::filesystem::path directory)
    : impl_(std::make_unique<impl>(std::move(directory))) {}

transfer_state_store::~transfer_state_store() = default;

transfer_state_store::transfer_state_store(transfer_state_store&&) noexcept = default;
auto transfer_state_store::operator=(transfer_state_store&&) noexcept
    -> transfer_state_store& = default;

auto transfer_state_store::save(const transfer_state_key& key,
                                const std::vector<std::string>& processed,
                                const std::vector<std::string>& remaining) -> result<void> {
    return impl_->save(key, processed, remaining);
}

auto transfer_state_store::load(const transfer_state_key& key) const -> result<transfer_state> {
    return impl_->load(key);
}

auto transfer_state_store::clear(const transfer_state_key& key) -> result<void> {
    return impl_->clear(key);
}

auto transfer_state_store::exists(const transfer_state_key& key) const -> bool {
    return impl_->exists(key);
}

auto transfer_state_store::path_for(const transfer_state_key& key) const
    -> std::filesystem::path {
    return impl_->path_for(key);
}

auto transfer_state_store::directory() const -> const std::filesystem::path& {
    return impl_->directory();
}

}  // namespace kcenon::fetcher
