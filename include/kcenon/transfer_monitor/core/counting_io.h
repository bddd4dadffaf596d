/**
 * @file counting_io.h
 * @brief Instrumented source and sink views that report into a byte_counter
 */

#ifndef KCENON_TRANSFER_MONITOR_CORE_COUNTING_IO_H
#define KCENON_TRANSFER_MONITOR_CORE_COUNTING_IO_H

#include <memory>

#include "byte_counter.h"
#include "io.h"

namespace kcenon::transfer_monitor {

/**
 * @brief Source wrapper adding every completed read to byte_counter::add_read
 */
class counting_source : public byte_source {
public:
    counting_source(std::unique_ptr<byte_source> inner, std::shared_ptr<byte_counter> counter);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

    /**
     * @brief Give back the wrapped source
     */
    [[nodiscard]] auto release() -> std::unique_ptr<byte_source>;

private:
    std::unique_ptr<byte_source> inner_;
    std::shared_ptr<byte_counter> counter_;
};

/**
 * @brief Sink wrapper adding every completed write to byte_counter::add_written
 */
class counting_sink : public byte_sink {
public:
    counting_sink(std::unique_ptr<byte_sink> inner, std::shared_ptr<byte_counter> counter);

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override;
    [[nodiscard]] auto flush() -> result<void> override;

    /**
     * @brief Give back the wrapped sink
     */
    [[nodiscard]] auto release() -> std::unique_ptr<byte_sink>;

private:
    std::unique_ptr<byte_sink> inner_;
    std::shared_ptr<byte_counter> counter_;
};

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_CORE_COUNTING_IO_H
