/**
 * @file types.h
 * @brief Core type definitions for transfer_monitor
 */

#ifndef KCENON_TRANSFER_MONITOR_CORE_TYPES_H
#define KCENON_TRANSFER_MONITOR_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kcenon::transfer_monitor {

/**
 * @brief Error codes for transfer operations
 *
 * Error code ranges:
 * - -100 to -119: I/O errors
 * - -120 to -139: Transfer lifecycle errors
 * - -140 to -159: Argument and configuration errors
 */
enum class error_code : int32_t {
    success = 0,

    // I/O errors (-100 to -119)
    source_read_error = -100,
    sink_write_error = -101,
    file_not_found = -102,
    file_access_denied = -103,

    // Transfer lifecycle errors (-120 to -139)
    reuse_error = -120,
    worker_fault = -121,

    // Argument and configuration errors (-140 to -159)
    invalid_argument = -140,
    invalid_configuration = -141,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::source_read_error:
            return "source read error";
        case error_code::sink_write_error:
            return "sink write error";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::reuse_error:
            return "transfer already finished";
        case error_code::worker_fault:
            return "copy worker terminated abnormally";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_configuration:
            return "invalid configuration";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in I/O error range
 */
[[nodiscard]] constexpr auto is_io_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -100 && value >= -119;
}

/**
 * @brief Check if error code signals a misuse of the API or an internal fault
 */
[[nodiscard]] constexpr auto is_fatal_error(error_code code) noexcept -> bool {
    return code == error_code::reuse_error || code == error_code::worker_fault;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_CORE_TYPES_H
