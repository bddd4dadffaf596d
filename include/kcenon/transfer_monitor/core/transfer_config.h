/**
 * @file transfer_config.h
 * @brief Configuration for a monitored transfer
 */

#ifndef KCENON_TRANSFER_MONITOR_CORE_TRANSFER_CONFIG_H
#define KCENON_TRANSFER_MONITOR_CORE_TRANSFER_CONFIG_H

#include <kcenon/transfer_monitor/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::transfer_monitor {

/**
 * @brief Configuration for a monitored transfer
 */
struct transfer_config {
    /// Default copy buffer size (64KB)
    static constexpr std::size_t default_buffer_size = 64 * 1024;

    /// Minimum allowed copy buffer size (4KB)
    static constexpr std::size_t min_buffer_size = 4 * 1024;

    /// Maximum allowed copy buffer size (16MB)
    static constexpr std::size_t max_buffer_size = 16 * 1024 * 1024;

    /// Size of the intermediate buffer used by the copy worker
    std::size_t buffer_size = default_buffer_size;

    /// Total bytes the caller expects to move, if known
    std::optional<uint64_t> expected_total;

    /// Free-form name attached to log records
    std::string label;

    transfer_config() = default;

    explicit transfer_config(std::optional<uint64_t> total) : expected_total(total) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (buffer_size < min_buffer_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "buffer size too small (minimum: " + std::to_string(min_buffer_size) + ")"});
        }
        if (buffer_size > max_buffer_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "buffer size too large (maximum: " + std::to_string(max_buffer_size) + ")"});
        }
        return {};
    }
};

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_CORE_TRANSFER_CONFIG_H
