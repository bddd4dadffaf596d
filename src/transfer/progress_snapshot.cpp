/**
 * @file progress_snapshot.cpp
 * @brief Rate, ETA and text rendering for progress snapshots
 */

#include "kcenon/transfer_monitor/transfer/progress_snapshot.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace kcenon::transfer_monitor {

auto make_snapshot(byte_counter::counts counts,
                   std::chrono::nanoseconds elapsed,
                   std::optional<uint64_t> expected_total) -> progress_snapshot {
    progress_snapshot s;
    s.bytes_read = counts.read;
    s.bytes_written = counts.written;
    s.elapsed = std::max(elapsed, std::chrono::nanoseconds::zero());
    s.expected_total = expected_total;

    auto seconds = std::chrono::duration<double>(s.elapsed).count();
    if (seconds > 0.0) {
        s.throughput = static_cast<double>(s.bytes_read) / seconds;
    }

    if (!expected_total) {
        return s;
    }

    uint64_t total = *expected_total;
    if (total == 0 || s.bytes_read >= total) {
        s.fraction = 1.0;
    } else {
        s.fraction = std::clamp(
            static_cast<double>(s.bytes_read) / static_cast<double>(total), 0.0, 1.0);
    }

    if (s.throughput > 0.0) {
        uint64_t remaining = total > s.bytes_read ? total - s.bytes_read : 0;
        auto eta_ms = static_cast<double>(remaining) * 1000.0 / s.throughput;
        // Saturate: a slow start against a huge total overflows the tick count.
        if (eta_ms >= static_cast<double>(duration::max().count())) {
            s.estimated_remaining = duration::max();
        } else {
            s.estimated_remaining = duration{static_cast<int64_t>(std::llround(eta_ms))};
        }
    }

    return s;
}

auto format(const progress_snapshot& snapshot, unit_style style) -> std::string {
    std::ostringstream oss;

    auto transferred = format_bytes(snapshot.bytes_read, style);
    auto rate = format_rate(snapshot.throughput, style);

    if (snapshot.fraction && snapshot.expected_total) {
        oss << std::fixed << std::setprecision(1) << *snapshot.percent() << " % ("
            << transferred << " of " << format_bytes(*snapshot.expected_total, style)
            << ", " << rate;
        if (snapshot.estimated_remaining) {
            oss << ", ETA " << format_duration(*snapshot.estimated_remaining);
        }
        oss << ")";
    } else {
        oss << transferred << " (" << rate << ")";
    }

    return oss.str();
}

}  // namespace kcenon::transfer_monitor
