/**
 * @file unit_format.cpp
 * @brief Implementation of human-readable unit formatting
 */

#include "kcenon/transfer_monitor/core/unit_format.h"

#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace kcenon::transfer_monitor {

namespace {

constexpr std::array<std::string_view, 7> decimal_units = {
    "B", "kB", "MB", "GB", "TB", "PB", "EB"};

constexpr std::array<std::string_view, 7> binary_units = {
    "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

auto round_to(double value, int decimals) -> double {
    auto factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

auto format_scaled(double value, unit_style style) -> std::string {
    const auto& units = style == unit_style::binary ? binary_units : decimal_units;
    const double base = style == unit_style::binary ? 1024.0 : 1000.0;

    if (!std::isfinite(value) || value < 0.0) {
        value = 0.0;
    }

    std::size_t index = 0;
    while (value >= base && index + 1 < units.size()) {
        value /= base;
        ++index;
    }

    // 999.996 kB would print as "1000.00 kB"; promote it to the next prefix.
    if (index + 1 < units.size() && round_to(value, index == 0 ? 0 : 2) >= base) {
        value /= base;
        ++index;
    }

    std::ostringstream oss;
    if (index == 0) {
        oss << static_cast<uint64_t>(std::llround(value)) << ' ' << units[index];
    } else {
        oss << std::fixed << std::setprecision(2) << value << ' ' << units[index];
    }
    return oss.str();
}

}  // namespace

auto parse_unit_style(std::string_view name) -> std::optional<unit_style> {
    if (name == "decimal" || name == "si") {
        return unit_style::decimal;
    }
    if (name == "binary" || name == "iec") {
        return unit_style::binary;
    }
    return std::nullopt;
}

auto format_bytes(uint64_t bytes, unit_style style) -> std::string {
    return format_scaled(static_cast<double>(bytes), style);
}

auto format_rate(double bytes_per_second, unit_style style) -> std::string {
    return format_scaled(bytes_per_second, style) + "/s";
}

auto format_duration(std::chrono::milliseconds value) -> std::string {
    auto ms = value.count() < 0 ? 0 : value.count();
    auto total_seconds = ms / 1000 + (ms % 1000 >= 500 ? 1 : 0);

    auto hours = total_seconds / 3600;
    auto minutes = (total_seconds % 3600) / 60;
    auto seconds = total_seconds % 60;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ':'
        << std::setw(2) << minutes << ':'
        << std::setw(2) << seconds;
    return oss.str();
}

}  // namespace kcenon::transfer_monitor
