/**
 * @file transfer_monitor.h
 * @brief Main header for the transfer_monitor library
 * @version 0.1.0
 *
 * This is the primary include file for the transfer_monitor library.
 * Include this header to access all transfer monitoring functionality.
 *
 * @code
 * #include <kcenon/transfer_monitor/transfer_monitor.h>
 *
 * using namespace kcenon::transfer_monitor;
 *
 * auto t = transfer::start(std::make_unique<zero_source>(1 << 20),
 *                          std::make_unique<null_sink>(),
 *                          1 << 20);
 * std::cout << t << "\n";
 * auto endpoints = std::move(t).finish();
 * @endcode
 */

#ifndef KCENON_TRANSFER_MONITOR_TRANSFER_MONITOR_H
#define KCENON_TRANSFER_MONITOR_TRANSFER_MONITOR_H

#include <string>

// Core types
#include "kcenon/transfer_monitor/core/types.h"
#include "kcenon/transfer_monitor/core/byte_counter.h"
#include "kcenon/transfer_monitor/core/io.h"
#include "kcenon/transfer_monitor/core/counting_io.h"
#include "kcenon/transfer_monitor/core/copy_worker.h"
#include "kcenon/transfer_monitor/core/transfer_config.h"
#include "kcenon/transfer_monitor/core/unit_format.h"
#include "kcenon/transfer_monitor/core/logging.h"

// Transfer handle
#include "kcenon/transfer_monitor/transfer/progress_snapshot.h"
#include "kcenon/transfer_monitor/transfer/transfer.h"

namespace kcenon::transfer_monitor {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_TRANSFER_MONITOR_H
