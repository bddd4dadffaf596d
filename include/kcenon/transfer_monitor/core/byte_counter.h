/**
 * @file byte_counter.h
 * @brief Lock-free counters for bytes read and written during a transfer
 */

#ifndef KCENON_TRANSFER_MONITOR_CORE_BYTE_COUNTER_H
#define KCENON_TRANSFER_MONITOR_CORE_BYTE_COUNTER_H

#include <atomic>
#include <cstdint>

namespace kcenon::transfer_monitor {

/**
 * @brief Pair of monotonically increasing byte counts
 *
 * One writer (the copy worker) increments; any number of threads read.
 * The two counts are independent: a reader may observe bytes_read ahead
 * of bytes_written while a chunk is in flight.
 *
 * @code
 * auto counter = std::make_shared<byte_counter>();
 * counter->add_read(4096);
 * counter->add_written(4096);
 * auto done = counter->written_count();
 * @endcode
 */
class byte_counter {
public:
    /**
     * @brief Both counts, loaded one after the other
     */
    struct counts {
        uint64_t read = 0;
        uint64_t written = 0;
    };

    byte_counter() = default;

    byte_counter(const byte_counter&) = delete;
    auto operator=(const byte_counter&) -> byte_counter& = delete;

    /**
     * @brief Add @p bytes to the read count (no-op for 0)
     */
    void add_read(uint64_t bytes) noexcept;

    /**
     * @brief Add @p bytes to the written count (no-op for 0)
     */
    void add_written(uint64_t bytes) noexcept;

    [[nodiscard]] auto read_count() const noexcept -> uint64_t;
    [[nodiscard]] auto written_count() const noexcept -> uint64_t;

    /**
     * @brief Load both counts
     *
     * No atomicity across the pair; each value is individually consistent.
     */
    [[nodiscard]] auto load() const noexcept -> counts;

private:
    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> bytes_written_{0};
};

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_CORE_BYTE_COUNTER_H
