// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/chunked_upload/config/feature_flags.h"

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::chunked_upload {

/**
 * @brief Log categories for the upload system
 */
struct log_category {
    static constexpr std::string_view coordinator = "chunked_upload.coordinator";
    static constexpr std::string_view retry = "chunked_upload.retry";
    static constexpr std::string_view registry = "chunked_upload.registry";
    static constexpr std::string_view progress = "chunked_upload.progress";
    static constexpr std::string_view backend = "chunked_upload.backend";
    static constexpr std::string_view store = "chunked_upload.store";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
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

namespace detail {

[[nodiscard]] inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string upload_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> uploaded_bytes;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<double> progress_percent;
    std::optional<double> speed_bps;
    std::optional<uint64_t> retry_count;
    std::optional<uint64_t> delay_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!upload_id.empty()) add_field("upload_id", upload_id);
        if (!filename.empty()) add_field("filename", filename);
        if (file_size) add_uint("size", *file_size);
        if (uploaded_bytes) add_uint("uploaded_bytes", *uploaded_bytes);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (speed_bps) add_double("speed_bps", *speed_bps);
        if (retry_count) add_uint("retry_count", *retry_count);
        if (delay_ms) add_uint("delay_ms", *delay_ms);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Upload system logger
 *
 * Forwards to logger_system when the integration is compiled in and falls
 * back to stderr otherwise. A user callback receives every record that
 * passes the level filter.
 */
class upload_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const upload_log_context*)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called when an upload coordinator is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
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

    /**
     * @brief Shutdown the logger
     */
    void shutdown() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Set custom log callback (pass nullptr to clear)
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        auto line_text = get_output_format() == log_output_format::json
            ? format_json(level, category, message, context)
            : format_text(level, category, message, context);

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
            return;
        }
#endif
        output_to_stderr(line_text);
    }

    void flush() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

    /**
     * @brief Render a record as a single JSON object
     */
    [[nodiscard]] static auto format_json(log_level level,
                                          std::string_view category,
                                          std::string_view message,
                                          const upload_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp(true) << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";
        if (context) {
            auto ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    /**
     * @brief Render a record as a single text line
     */
    [[nodiscard]] static auto format_text(log_level level,
                                          std::string_view category,
                                          std::string_view message,
                                          const upload_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << get_timestamp(false) << " [" << log_level_to_string(level) << "] ["
            << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp(bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        if (utc) {
            gmtime_s(&tm_buf, &time_t_val);
        } else {
            localtime_s(&tm_buf, &time_t_val);
        }
#else
        if (utc) {
            gmtime_r(&time_t_val, &tm_buf);
        } else {
            localtime_r(&time_t_val, &tm_buf);
        }
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        if (utc) {
            oss << 'Z';
        }
        return oss.str();
    }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
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

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

// Logging macros for convenience
#define CU_LOG(level, category, message) \
    kcenon::chunked_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_CTX(level, category, message, context) \
    kcenon::chunked_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_TRACE(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::trace, category, message)
#define CU_LOG_DEBUG(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::debug, category, message)
#define CU_LOG_INFO(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::info, category, message)
#define CU_LOG_WARN(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::warn, category, message)
#define CU_LOG_ERROR(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::error, category, message)

#define CU_LOG_DEBUG_CTX(category, message, context) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::debug, category, message, context)
#define CU_LOG_INFO_CTX(category, message, context) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::info, category, message, context)
#define CU_LOG_WARN_CTX(category, message, context) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::warn, category, message, context)
#define CU_LOG_ERROR_CTX(category, message, context) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::error, category, message, context)

}  // namespace kcenon::chunked_upload
