/**
 * @file counting_io.cpp
 * @brief Implementation of the instrumented source and sink views
 */

#include "kcenon/transfer_monitor/core/counting_io.h"

namespace kcenon::transfer_monitor {

counting_source::counting_source(std::unique_ptr<byte_source> inner,
                                 std::shared_ptr<byte_counter> counter)
    : inner_(std::move(inner)), counter_(std::move(counter)) {}

auto counting_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (!inner_) {
        return unexpected(error{error_code::source_read_error, "source already released"});
    }

    auto read_result = inner_->read(buffer);
    if (read_result && counter_) {
        counter_->add_read(read_result.value());
    }
    return read_result;
}

auto counting_source::release() -> std::unique_ptr<byte_source> {
    return std::move(inner_);
}

counting_sink::counting_sink(std::unique_ptr<byte_sink> inner,
                             std::shared_ptr<byte_counter> counter)
    : inner_(std::move(inner)), counter_(std::move(counter)) {}

auto counting_sink::write(std::span<const std::byte> data) -> result<void> {
    if (!inner_) {
        return unexpected(error{error_code::sink_write_error, "sink already released"});
    }

    auto write_result = inner_->write(data);
    if (write_result && counter_) {
        counter_->add_written(data.size());
    }
    return write_result;
}

auto counting_sink::flush() -> result<void> {
    if (!inner_) {
        return unexpected(error{error_code::sink_write_error, "sink already released"});
    }
    return inner_->flush();
}

auto counting_sink::release() -> std::unique_ptr<byte_sink> {
    return std::move(inner_);
}

}  // namespace kcenon::transfer_monitor
