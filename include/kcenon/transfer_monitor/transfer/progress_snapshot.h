/**
 * @file progress_snapshot.h
 * @brief Point-in-time view of a running transfer
 */

#ifndef KCENON_TRANSFER_MONITOR_TRANSFER_PROGRESS_SNAPSHOT_H
#define KCENON_TRANSFER_MONITOR_TRANSFER_PROGRESS_SNAPSHOT_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/transfer_monitor/core/byte_counter.h"
#include "kcenon/transfer_monitor/core/unit_format.h"

namespace kcenon::transfer_monitor {

/**
 * @brief Duration type for ETA values
 */
using duration = std::chrono::milliseconds;

/**
 * @brief Progress of a transfer, computed on demand and never stored
 *
 * fraction and estimated_remaining are only populated when the caller
 * supplied an expected total; estimated_remaining is additionally left
 * empty while the throughput is still zero.
 */
struct progress_snapshot {
    uint64_t bytes_read = 0;                     ///< Bytes read from the source
    uint64_t bytes_written = 0;                  ///< Bytes written to the sink
    std::chrono::nanoseconds elapsed{0};         ///< Time since the transfer started
    double throughput = 0.0;                     ///< Average rate (bytes/sec)
    std::optional<uint64_t> expected_total;      ///< Total supplied by the caller
    std::optional<double> fraction;              ///< Completion in [0.0, 1.0]
    std::optional<duration> estimated_remaining; ///< Time left at the current rate

    [[nodiscard]] auto bytes_transferred() const noexcept -> uint64_t { return bytes_read; }

    /**
     * @brief Completion percentage (0.0 - 100.0), if the total is known
     */
    [[nodiscard]] auto percent() const -> std::optional<double> {
        if (!fraction) {
            return std::nullopt;
        }
        return *fraction * 100.0;
    }
};

/**
 * @brief Derive a snapshot from raw counts
 *
 * throughput = bytes_read / elapsed (0 when elapsed is zero).
 * fraction = bytes_read / expected_total clamped to [0, 1]; an expected
 * total of 0 counts as complete.
 * estimated_remaining = (expected_total - bytes_read) / throughput,
 * saturated at duration::max().
 */
[[nodiscard]] auto make_snapshot(byte_counter::counts counts,
                                 std::chrono::nanoseconds elapsed,
                                 std::optional<uint64_t> expected_total) -> progress_snapshot;

/**
 * @brief Render a snapshot as one line of text
 *
 * Without a total: "5.00 MB (1.00 MB/s)".
 * With a total:    "50.0 % (5.00 MB of 10.00 MB, 1.00 MB/s, ETA 00:00:05)";
 * the ETA part is dropped while it cannot be estimated.
 */
[[nodiscard]] auto format(const progress_snapshot& snapshot, unit_style style) -> std::string;

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_TRANSFER_PROGRESS_SNAPSHOT_H
