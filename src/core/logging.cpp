// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.cpp
 * @brief Implementation of the fetcher logger
 */

#include "kcenon/fetcher/core/logging.h"
#include "kcenon/fetcher/core/json_utils.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

namespace kcenon::fetcher {

namespace {

auto format_timestamp(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    if (utc) gmtime_s(&tm_buf, &time_t_val); else localtime_s(&tm_buf, &time_t_val);
#else
    if (utc) gmtime_r(&time_t_val, &tm_buf); else localtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

template <typename Fn>
auto replace_matches(const std::string& input, const std::regex& pattern, Fn&& fn)
    -> std::string {
    std::string output;
    std::size_t last_pos = 0;
    for (std::sregex_iterator it(input.begin(), input.end(), pattern), end;
         it != end; ++it) {
        output += input.substr(last_pos, it->position() - last_pos);
        output += fn(it->str());
        last_pos = it->position() + it->length();
    }
    output += input.substr(last_pos);
    return output;
}

void output_to_stderr(const std::string& msg) {
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << msg << "\n";
}

#if FETCHER_USE_LOGGER_SYSTEM
auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warning;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::critical;
        default: return kcenon::logger::log_level::info;
    }
}
#endif

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// sensitive_info_masker
// ============================================================================

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    std::string result = input;

    if (config_.mask_ips) {
        static const std::regex ip_pattern(
            R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
        result = replace_matches(result, ip_pattern,
            [this](const std::string& ip) { return mask_ip(ip); });
    }

    if (config_.mask_paths) {
        static const std::regex path_pattern(R"((?:/[A-Za-z0-9._-]+){2,})");
        result = replace_matches(result, path_pattern,
            [this](const std::string& path) { return mask_path(path); });
    }

    return result;
}

auto sensitive_info_masker::mask_path(const std::string& path) const -> std::string {
    if (!config_.mask_paths || path.empty()) {
        return path;
    }

    auto last_sep = path.find_last_of("/\\");
    if (last_sep == std::string::npos || last_sep == 0) {
        return path;
    }
    return std::string(last_sep, config_.mask_char) + path.substr(last_sep);
}

auto sensitive_info_masker::mask_ip(const std::string& ip) const -> std::string {
    if (!config_.mask_ips || ip.empty()) {
        return ip;
    }

    auto last_dot = ip.find_last_of('.');
    if (last_dot == std::string::npos) {
        return std::string(ip.size(), config_.mask_char);
    }
    return std::string(last_dot, config_.mask_char) + ip.substr(last_dot);
}

// ============================================================================
// Structured records
// ============================================================================

auto fetch_log_context::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    auto add_field = [&](const char* name, const std::string& value) {
        if (!first) oss << ",";
        oss << "\"" << name << "\":\"" << json_utils::escape(value) << "\"";
        first = false;
    };
    auto add_uint = [&](const char* name, uint64_t value) {
        if (!first) oss << ",";
        oss << "\"" << name << "\":" << value;
        first = false;
    };

    if (!job_id.empty()) add_field("job_id", job_id);
    if (!service_id.empty()) add_field("service_id", service_id);
    if (!remote_path.empty()) {
        add_field("remote_path", masker ? masker->mask_path(remote_path) : remote_path);
    }
    if (file_size) add_uint("size", *file_size);
    if (attempt) add_uint("attempt", *attempt);
    if (duration_ms) add_uint("duration_ms", *duration_ms);
    if (error_message) {
        add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
    }
    if (host) {
        add_field("host", masker ? masker->mask_ip(*host) : *host);
    }

    oss << "}";
    return oss.str();
}

auto structured_log_entry::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << timestamp << "\"";
    oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
    oss << ",\"category\":\"" << category << "\"";
    oss << ",\"message\":\""
        << json_utils::escape(masker ? masker->mask(message) : message) << "\"";

    if (context) {
        auto ctx_json = context->to_json_with_masking(masker);
        if (ctx_json.size() > 2) {
            oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
        }
    }

    if (source_file) {
        oss << ",\"source\":{\"file\":\"" << json_utils::escape(*source_file) << "\"";
        if (source_line) {
            oss << ",\"line\":" << *source_line;
        }
        if (function_name) {
            oss << ",\"function\":\"" << *function_name << "\"";
        }
        oss << "}";
    }

    oss << "}";
    return oss.str();
}

// ============================================================================
// fetcher_logger
// ============================================================================

void fetcher_logger::initialize() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;
    }

#if FETCHER_USE_LOGGER_SYSTEM
    auto result = kcenon::logger::logger_builder()
        .with_async(true)
        .with_min_level(to_logger_level(min_level_.load()))
        .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
        .build();

    if (result) {
        logger_ = std::move(result.value());
    }
#endif
}

void fetcher_logger::shutdown() {
#if FETCHER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->flush();
        logger_->stop();
        logger_.reset();
    }
#endif
    initialized_ = false;
}

void fetcher_logger::set_level(log_level level) {
    min_level_.store(level);
#if FETCHER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->set_min_level(to_logger_level(level));
    }
#endif
}

void fetcher_logger::set_output_format(log_output_format format) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    output_format_ = format;
}

auto fetcher_logger::get_output_format() const -> log_output_format {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return output_format_;
}

void fetcher_logger::set_masking_config(masking_config config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    masker_.set_config(config);
}

auto fetcher_logger::get_masking_config() const -> masking_config {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return masker_.get_config();
}

void fetcher_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void fetcher_logger::set_json_callback(json_log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    json_callback_ = std::move(callback);
}

void fetcher_logger::log(log_level level,
                         std::string_view category,
                         std::string_view message,
                         const fetch_log_context* context,
                         const char* file,
                         int line,
                         const char* function) {
    if (!is_enabled(level)) return;

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            callback_(level, category, message, context);
        }
    }

    log_output_format format;
    sensitive_info_masker masker;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format = output_format_;
        masker = masker_;
    }

    if (format == log_output_format::json) {
        structured_log_entry entry;
        entry.timestamp = format_timestamp(true);
        entry.level = level;
        entry.category = std::string(category);
        entry.message = std::string(message);
        if (context) entry.context = *context;
        if (file) entry.source_file = file;
        if (line > 0) entry.source_line = line;
        if (function) entry.function_name = function;

        auto json_str = entry.to_json_with_masking(&masker);
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }
        write(level, json_str, file, line, function);
        return;
    }

    std::ostringstream oss;
#if !FETCHER_USE_LOGGER_SYSTEM
    oss << format_timestamp(false) << " [" << log_level_to_string(level) << "] ";
#endif
    oss << "[" << category << "] " << masker.mask(std::string(message));
    if (context) {
        oss << " " << context->to_json_with_masking(&masker);
    }
    write(level, oss.str(), file, line, function);
}

void fetcher_logger::write(log_level level, const std::string& rendered,
                           [[maybe_unused]] const char* file,
                           [[maybe_unused]] int line,
                           [[maybe_unused]] const char* function) {
#if FETCHER_USE_LOGGER_SYSTEM
    if (logger_) {
        if (file && line > 0 && function) {
            logger_->log(to_logger_level(level), rendered, file, line, function);
        } else {
            logger_->log(to_logger_level(level), rendered);
        }
        return;
    }
#else
    (void)level;
#endif
    output_to_stderr(rendered);
}

void fetcher_logger::flush() {
#if FETCHER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->flush();
    }
#endif
}

auto get_logger() -> fetcher_logger& {
    static fetcher_logger instance;
    return instance;
}

}  // namespace kcenon::fetcher
