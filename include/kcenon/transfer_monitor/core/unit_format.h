/**
 * @file unit_format.h
 * @brief Human-readable byte, rate and duration formatting
 */

#ifndef KCENON_TRANSFER_MONITOR_CORE_UNIT_FORMAT_H
#define KCENON_TRANSFER_MONITOR_CORE_UNIT_FORMAT_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::transfer_monitor {

/**
 * @brief Unit prefix family used when rendering sizes
 */
enum class unit_style {
    decimal,  // kB, MB, GB (powers of 1000)
    binary,   // KiB, MiB, GiB (powers of 1024)
};

[[nodiscard]] constexpr auto to_string(unit_style style) noexcept -> std::string_view {
    switch (style) {
        case unit_style::decimal:
            return "decimal";
        case unit_style::binary:
            return "binary";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a unit style name
 *
 * Accepts "decimal" / "si" and "binary" / "iec" (case-sensitive).
 */
[[nodiscard]] auto parse_unit_style(std::string_view name) -> std::optional<unit_style>;

/**
 * @brief Format a byte count
 *
 * Picks the largest prefix that keeps the displayed magnitude >= 1.
 * Unprefixed values print as integers, prefixed values with two decimals.
 *
 * @code
 * format_bytes(999, unit_style::decimal);      // "999 B"
 * format_bytes(1000000, unit_style::decimal);  // "1.00 MB"
 * format_bytes(1048576, unit_style::binary);   // "1.00 MiB"
 * @endcode
 */
[[nodiscard]] auto format_bytes(uint64_t bytes, unit_style style) -> std::string;

/**
 * @brief Format a rate in bytes per second (e.g. "12.50 MB/s")
 */
[[nodiscard]] auto format_rate(double bytes_per_second, unit_style style) -> std::string;

/**
 * @brief Format a duration as hh:mm:ss (hours are not wrapped)
 */
[[nodiscard]] auto format_duration(std::chrono::milliseconds value) -> std::string;

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_CORE_UNIT_FORMAT_H
