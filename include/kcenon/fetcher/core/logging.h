// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for fetcher_system
 *
 * Routes to logger_system when FETCHER_USE_LOGGER_SYSTEM is enabled and to a
 * serialized stderr writer otherwise.
 */

#pragma once

#include "kcenon/fetcher/config/feature_flags.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#if FETCHER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::fetcher {

/**
 * @brief Log categories for the fetcher
 */
struct log_category {
    static constexpr std::string_view executor = "fetcher.executor";
    static constexpr std::string_view module = "fetcher.module";
    static constexpr std::string_view config = "fetcher.config";
    static constexpr std::string_view connection = "fetcher.connection";
    static constexpr std::string_view listing = "fetcher.listing";
    static constexpr std::string_view filter = "fetcher.filter";
    static constexpr std::string_view sort = "fetcher.sort";
    static constexpr std::string_view download = "fetcher.download";
    static constexpr std::string_view state = "fetcher.state";
    static constexpr std::string_view pipeline = "fetcher.pipeline";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_ips = false;
    char mask_char = '*';

    static auto all_masked() -> masking_config { return {true, true, '*'}; }
    static auto none() -> masking_config { return {false, false, '*'}; }
};

/**
 * @brief Masks IP addresses and directory components in log text
 *
 * Hosts and remote directory layouts of customer sources are treated as
 * sensitive; file names stay visible so operators can correlate downloads.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string;
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string;
    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string;

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }
    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured context attached to fetch log records
 */
struct fetch_log_context {
    std::string job_id;
    std::string service_id;
    std::string remote_path;
    std::optional<uint64_t> file_size;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;
    std::optional<std::string> host;

    [[nodiscard]] auto to_json() const -> std::string { return to_json_with_masking(nullptr); }
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

/**
 * @brief Complete structured log record
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<fetch_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

enum class log_output_format {
    text,   ///< Human readable single line
    json    ///< One JSON object per record
};

/**
 * @brief Process-wide fetcher logger
 */
class fetcher_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const fetch_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&,
                                                 const std::string&)>;

    fetcher_logger() = default;
    ~fetcher_logger() = default;

    fetcher_logger(const fetcher_logger&) = delete;
    fetcher_logger& operator=(const fetcher_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize();

    void shutdown();

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format);
    [[nodiscard]] auto get_output_format() const -> log_output_format;

    void set_masking_config(masking_config config);
    [[nodiscard]] auto get_masking_config() const -> masking_config;

    /**
     * @brief Receive every enabled record before it is written
     */
    void set_callback(log_callback callback);

    /**
     * @brief Receive every record rendered as JSON (json format only)
     */
    void set_json_callback(json_log_callback callback);

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const fetch_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

    void flush();

private:
    void write(log_level level, const std::string& rendered,
               const char* file, int line, const char* function);

#if FETCHER_USE_LOGGER_SYSTEM
    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
auto get_logger() -> fetcher_logger&;

#define FETCHER_LOG(level, category, message) \
    kcenon::fetcher::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FETCHER_LOG_CTX(level, category, message, context) \
    kcenon::fetcher::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FETCHER_LOG_TRACE(category, message) \
    FETCHER_LOG(kcenon::fetcher::log_level::trace, category, message)

#define FETCHER_LOG_DEBUG(category, message) \
    FETCHER_LOG(kcenon::fetcher::log_level::debug, category, message)

#define FETCHER_LOG_INFO(category, message) \
    FETCHER_LOG(kcenon::fetcher::log_level::info, category, message)

#define FETCHER_LOG_WARN(category, message) \
    FETCHER_LOG(kcenon::fetcher::log_level::warn, category, message)

#define FETCHER_LOG_ERROR(category, message) \
    FETCHER_LOG(kcenon::fetcher::log_level::error, category, message)

#define FETCHER_LOG_FATAL(category, message) \
    FETCHER_LOG(kcenon::fetcher::log_level::fatal, category, message)

#define FETCHER_LOG_DEBUG_CTX(category, message, ctx) \
    FETCHER_LOG_CTX(kcenon::fetcher::log_level::debug, category, message, ctx)

#define FETCHER_LOG_INFO_CTX(category, message, ctx) \
    FETCHER_LOG_CTX(kcenon::fetcher::log_level::info, category, message, ctx)

#define FETCHER_LOG_WARN_CTX(category, message, ctx) \
    FETCHER_LOG_CTX(kcenon::fetcher::log_level::warn, category, message, ctx)

#define FETCHER_LOG_ERROR_CTX(category, message, ctx) \
    FETCHER_LOG_CTX(kcenon::fetcher::log_level::error, category, message, ctx)

}  // namespace kcenon::fetcher
