/**
 * @file byte_counter.cpp
 * @brief Implementation of the transfer byte counters
 */

#include "kcenon/transfer_monitor/core/byte_counter.h"

namespace kcenon::transfer_monitor {

void byte_counter::add_read(uint64_t bytes) noexcept {
    if (bytes == 0) {
        return;
    }
    bytes_read_.fetch_add(bytes, std::memory_order_release);
}

void byte_counter::add_written(uint64_t bytes) noexcept {
    if (bytes == 0) {
        return;
    }
    bytes_written_.fetch_add(bytes, std::memory_order_release);
}

auto byte_counter::read_count() const noexcept -> uint64_t {
    return bytes_read_.load(std::memory_order_acquire);
}

auto byte_counter::written_count() const noexcept -> uint64_t {
    return bytes_written_.load(std::memory_order_acquire);
}

auto byte_counter::load() const noexcept -> counts {
    counts c;
    c.read = read_count();
    c.written = written_count();
    return c;
}

}  // namespace kcenon::transfer_monitor
