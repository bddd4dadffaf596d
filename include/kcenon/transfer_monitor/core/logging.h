// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <memory>
#include <functional>
#include <sstream>
#include <iomanip>
#include <atomic>
#include <mutex>
#include <iostream>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define TRANSFER_MONITOR_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::transfer_monitor {

/**
 * @brief Log categories for transfer monitor
 */
struct log_category {
    static constexpr std::string_view transfer = "transfer_monitor.transfer";
    static constexpr std::string_view worker = "transfer_monitor.worker";
    static constexpr std::string_view io = "transfer_monitor.io";
};

/**
 * @brief Log levels for transfer monitor
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

inline auto escape_json_string(std::string_view input) -> std::string {
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
 * @brief Structured log context for a monitored transfer
 */
struct transfer_log_context {
    std::string label;
    std::optional<uint64_t> bytes_read;
    std::optional<uint64_t> bytes_written;
    std::optional<uint64_t> expected_total;
    std::optional<double> progress_percent;
    std::optional<double> rate_bytes_per_sec;
    std::optional<uint64_t> duration_ms;
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

        if (!label.empty()) add_field("label", label);
        if (bytes_read) add_uint("bytes_read", *bytes_read);
        if (bytes_written) add_uint("bytes_written", *bytes_written);
        if (expected_total) add_uint("expected_total", *expected_total);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (rate_bytes_per_sec) add_double("rate_bytes_per_sec", *rate_bytes_per_sec);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    /**
     * @brief Convert to complete JSON format
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
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
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::transfer)
 *     .with_message("Transfer finished")
 *     .with_label("backup.tar")
 *     .with_bytes_read(1048576)
 *     .with_duration_ms(500)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_label(std::string_view label) -> log_entry_builder& {
        ensure_context();
        entry_.context->label = std::string(label);
        return *this;
    }

    auto with_bytes_read(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_read = bytes;
        return *this;
    }

    auto with_bytes_written(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_written = bytes;
        return *this;
    }

    auto with_expected_total(uint64_t total) -> log_entry_builder& {
        ensure_context();
        entry_.context->expected_total = total;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    /**
     * @brief Set the source file location
     */
    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    /**
     * @brief Set the context directly
     */
    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Transfer monitor logging interface
 */
class transfer_monitor_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    transfer_monitor_logger() = default;
    ~transfer_monitor_logger() = default;

    transfer_monitor_logger(const transfer_monitor_logger&) = delete;
    transfer_monitor_logger& operator=(const transfer_monitor_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called automatically whenever a transfer is started.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef TRANSFER_MONITOR_USE_LOGGER_SYSTEM
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
#ifdef TRANSFER_MONITOR_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    /**
     * @brief Set minimum log level
     */
    void set_level(log_level level) {
        min_level_.store(level);
#ifdef TRANSFER_MONITOR_USE_LOGGER_SYSTEM
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

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    /**
     * @brief Set custom log callback
     *
     * The callback sees every enabled message before it is written.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    /**
     * @brief Suppress the stderr sink (callbacks still fire)
     */
    void set_stderr_enabled(bool enable) {
        stderr_enabled_.store(enable);
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
             const transfer_log_context* context = nullptr,
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

        if (get_output_format() == log_output_format::json) {
            log_json(level, category, message, context, file, line, function);
        } else {
            log_text(level, category, message, context, file, line, function);
        }
    }

    void flush() {
#ifdef TRANSFER_MONITOR_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  const char* file,
                  int line,
                  const char* function) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json();

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#ifdef TRANSFER_MONITOR_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), json_str);
            }
        }
#else
        output_to_stderr(json_str);
#endif
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function) {

#ifdef TRANSFER_MONITOR_USE_LOGGER_SYSTEM
        if (logger_) {
            std::ostringstream oss;
            oss << "[" << category << "] " << message;
            if (context) {
                oss << " " << context->to_json();
            }
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), oss.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), oss.str());
            }
        }
#else
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }

        output_to_stderr(oss.str());
#endif
    }

    void output_to_stderr(const std::string& msg) const {
        if (!stderr_enabled_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef TRANSFER_MONITOR_USE_LOGGER_SYSTEM
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

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::warn};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> stderr_enabled_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline transfer_monitor_logger& get_logger() {
    static transfer_monitor_logger instance;
    return instance;
}

// Logging macros for convenience
#define TM_LOG(level, category, message) \
    kcenon::transfer_monitor::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define TM_LOG_CTX(level, category, message, context) \
    kcenon::transfer_monitor::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define TM_LOG_TRACE(category, message) \
    TM_LOG(kcenon::transfer_monitor::log_level::trace, category, message)

#define TM_LOG_DEBUG(category, message) \
    TM_LOG(kcenon::transfer_monitor::log_level::debug, category, message)

#define TM_LOG_INFO(category, message) \
    TM_LOG(kcenon::transfer_monitor::log_level::info, category, message)

#define TM_LOG_WARN(category, message) \
    TM_LOG(kcenon::transfer_monitor::log_level::warn, category, message)

#define TM_LOG_ERROR(category, message) \
    TM_LOG(kcenon::transfer_monitor::log_level::error, category, message)

#define TM_LOG_FATAL(category, message) \
    TM_LOG(kcenon::transfer_monitor::log_level::fatal, category, message)

#define TM_LOG_DEBUG_CTX(category, message, ctx) \
    TM_LOG_CTX(kcenon::transfer_monitor::log_level::debug, category, message, ctx)

#define TM_LOG_INFO_CTX(category, message, ctx) \
    TM_LOG_CTX(kcenon::transfer_monitor::log_level::info, category, message, ctx)

#define TM_LOG_WARN_CTX(category, message, ctx) \
    TM_LOG_CTX(kcenon::transfer_monitor::log_level::warn, category, message, ctx)

#define TM_LOG_ERROR_CTX(category, message, ctx) \
    TM_LOG_CTX(kcenon::transfer_monitor::log_level::error, category, message, ctx)

} // namespace kcenon::transfer_monitor
