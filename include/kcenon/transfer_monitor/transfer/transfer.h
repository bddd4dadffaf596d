/**
 * @file transfer.h
 * @brief Handle for a copy running on a background thread
 * @version 0.1.0
 *
 * This file defines the transfer class, which starts a copy_worker on its
 * own thread and lets the caller watch progress and collect the result.
 */

#ifndef KCENON_TRANSFER_MONITOR_TRANSFER_TRANSFER_H
#define KCENON_TRANSFER_MONITOR_TRANSFER_TRANSFER_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "kcenon/transfer_monitor/core/copy_worker.h"
#include "kcenon/transfer_monitor/core/io.h"
#include "kcenon/transfer_monitor/core/transfer_config.h"
#include "kcenon/transfer_monitor/core/types.h"
#include "kcenon/transfer_monitor/core/unit_format.h"
#include "kcenon/transfer_monitor/transfer/progress_snapshot.h"

namespace kcenon::transfer_monitor {

/**
 * @brief Monitors a copy from a byte_source to a byte_sink
 *
 * Starting a transfer spawns a dedicated worker thread immediately; there
 * is no way to construct one without starting the copy. The handle can be
 * polled from any number of threads while the copy runs, then consumed
 * once with finish().
 *
 * States: running -> finished (worker terminated, outcome pending) ->
 * consumed (finish() returned). is_complete() and snapshot() never block
 * and never report the copy's error; only finish() does.
 *
 * Destroying a transfer that was never finished joins the worker thread,
 * which blocks until the copy terminates on its own.
 *
 * @code
 * auto src = file_source::open("in.bin");
 * auto dst = file_sink::create("out.bin");
 * auto total = src.value()->size();
 *
 * auto t = transfer::start(std::move(src.value()), std::move(dst.value()), total);
 * while (!t.is_complete()) {
 *     std::this_thread::sleep_for(std::chrono::seconds(1));
 *     std::cout << t.to_string(unit_style::binary) << "\n";
 * }
 *
 * auto endpoints = std::move(t).finish();
 * if (!endpoints) {
 *     std::cerr << endpoints.error().message << "\n";
 * }
 * @endcode
 */
class transfer {
public:
    /**
     * @brief Builder for transfers with a non-default configuration
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the number of bytes the caller expects to move
         * @param total Expected total; enables percent and ETA
         * @return Reference to builder for chaining
         */
        auto with_expected_total(uint64_t total) -> builder&;

        /**
         * @brief Set copy buffer size
         * @param size Buffer size in bytes (default: 64KB)
         * @return Reference to builder for chaining
         */
        auto with_buffer_size(std::size_t size) -> builder&;

        /**
         * @brief Set the label attached to log records
         * @return Reference to builder for chaining
         */
        auto with_label(std::string label) -> builder&;

        /**
         * @brief Replace the whole configuration
         * @return Reference to builder for chaining
         */
        auto with_config(transfer_config config) -> builder&;

        /**
         * @brief Validate the configuration and start the copy
         * @return Running transfer, or invalid_configuration
         */
        [[nodiscard]] auto start(std::unique_ptr<byte_source> source,
                                 std::unique_ptr<byte_sink> sink) -> result<transfer>;

    private:
        transfer_config config_;
    };

    /**
     * @brief Start copying @p source into @p sink on a new thread
     *
     * Returns as soon as the worker thread is running. A missing source or
     * sink is not rejected here; finish() reports it as invalid_argument.
     * Failure to create the thread throws std::system_error.
     *
     * @param source Readable side (ownership returned by finish())
     * @param sink Writable side (ownership returned by finish())
     * @param expected_total Bytes expected, if known
     */
    [[nodiscard]] static auto start(std::unique_ptr<byte_source> source,
                                    std::unique_ptr<byte_sink> sink,
                                    std::optional<uint64_t> expected_total = std::nullopt)
        -> transfer;

    // Non-copyable, movable
    transfer(const transfer&) = delete;
    auto operator=(const transfer&) -> transfer& = delete;
    transfer(transfer&&) noexcept;
    auto operator=(transfer&&) noexcept -> transfer&;

    ~transfer();

    /**
     * @brief Check whether the worker has terminated (success or failure)
     *
     * Non-blocking. Once true, stays true.
     */
    [[nodiscard]] auto is_complete() const noexcept -> bool;

    /**
     * @brief Check whether finish() has already been called
     */
    [[nodiscard]] auto is_finished() const noexcept -> bool;

    /**
     * @brief Compute current progress
     *
     * Non-blocking; safe to call from any thread while the copy runs.
     */
    [[nodiscard]] auto snapshot() const -> progress_snapshot;

    /**
     * @brief Format the current progress
     * @param style Unit prefix family
     * @return Equivalent to format(snapshot(), style)
     */
    [[nodiscard]] auto to_string(unit_style style = unit_style::decimal) const -> std::string;

    /**
     * @brief Wait for the worker and take its outcome
     *
     * Blocks until the copy terminates and joins the worker thread.
     * Callable once; later calls return reuse_error without blocking.
     *
     * @return Recovered source and sink, or
     *         - source_read_error / sink_write_error from the copy
     *         - invalid_argument if the transfer was started without a source or sink
     *         - worker_fault if an exception escaped the worker
     *         - reuse_error if finish() was already called
     */
    [[nodiscard]] auto finish() && -> result<transfer_endpoints>;

    // Progress accessors

    /**
     * @brief Bytes read from the source so far
     */
    [[nodiscard]] auto bytes_transferred() const noexcept -> uint64_t;

    /**
     * @brief Bytes written to the sink so far
     */
    [[nodiscard]] auto bytes_written() const noexcept -> uint64_t;

    /**
     * @brief Time since the transfer started
     */
    [[nodiscard]] auto elapsed() const -> std::chrono::nanoseconds;

    /**
     * @brief Average speed in bytes per second, rounded
     */
    [[nodiscard]] auto speed() const -> uint64_t;

    [[nodiscard]] auto expected_total() const noexcept -> std::optional<uint64_t>;

    /**
     * @brief Bytes still expected (saturates at 0), if the total is known
     */
    [[nodiscard]] auto remaining() const noexcept -> std::optional<uint64_t>;

    /**
     * @brief Completion fraction in [0.0, 1.0], if the total is known
     */
    [[nodiscard]] auto fraction_transferred() const -> std::optional<double>;

    /**
     * @brief Estimated time remaining, if it can be computed yet
     */
    [[nodiscard]] auto eta() const -> std::optional<duration>;

    [[nodiscard]] auto label() const -> const std::string&;

private:
    transfer(std::unique_ptr<byte_source> source,
             std::unique_ptr<byte_sink> sink,
             transfer_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Stream the progress line in decimal units
 */
auto operator<<(std::ostream& os, const transfer& t) -> std::ostream&;

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_TRANSFER_TRANSFER_H
