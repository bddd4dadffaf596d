/**
 * @file copy_worker.h
 * @brief Buffered copy loop run on the background thread of a transfer
 */

#ifndef KCENON_TRANSFER_MONITOR_CORE_COPY_WORKER_H
#define KCENON_TRANSFER_MONITOR_CORE_COPY_WORKER_H

#include <cstddef>
#include <memory>
#include <string>

#include "byte_counter.h"
#include "io.h"
#include "transfer_config.h"
#include "types.h"

namespace kcenon::transfer_monitor {

/**
 * @brief Source and sink handed back after a successful copy
 */
struct transfer_endpoints {
    std::unique_ptr<byte_source> source;
    std::unique_ptr<byte_sink> sink;
};

/**
 * @brief Terminal result of a copy: the endpoints, or the I/O error
 */
using transfer_outcome = result<transfer_endpoints>;

/**
 * @brief Moves bytes from a source to a sink through a fixed-size buffer
 *
 * Every chunk is read through a counting_source and written through a
 * counting_sink, so the shared byte_counter advances as the copy runs.
 * The loop stops at end of input (read returns 0) or on the first error;
 * failed reads and writes are not retried.
 *
 * @code
 * auto counter = std::make_shared<byte_counter>();
 * copy_worker worker(std::move(source), std::move(sink), counter);
 * auto outcome = worker.run();
 * @endcode
 */
class copy_worker {
public:
    copy_worker(std::unique_ptr<byte_source> source,
                std::unique_ptr<byte_sink> sink,
                std::shared_ptr<byte_counter> counter,
                const transfer_config& config = {});

    // Non-copyable, movable
    copy_worker(const copy_worker&) = delete;
    auto operator=(const copy_worker&) -> copy_worker& = delete;
    copy_worker(copy_worker&&) noexcept = default;
    auto operator=(copy_worker&&) noexcept -> copy_worker& = default;

    ~copy_worker() = default;

    /**
     * @brief Run the copy to completion
     *
     * Blocks the calling thread. The endpoints are moved into the outcome,
     * so a second call fails with error_code::invalid_argument.
     *
     * @return Recovered endpoints on success, or
     *         - source_read_error if the source failed
     *         - sink_write_error if a write or the final flush failed
     *         - invalid_argument if source or sink is missing
     */
    [[nodiscard]] auto run() -> transfer_outcome;

    [[nodiscard]] auto buffer_size() const noexcept -> std::size_t { return buffer_size_; }

private:
    std::unique_ptr<byte_source> source_;
    std::unique_ptr<byte_sink> sink_;
    std::shared_ptr<byte_counter> counter_;
    std::size_t buffer_size_;
    std::string label_;
};

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_CORE_COPY_WORKER_H
