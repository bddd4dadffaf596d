/**
 * @file copy_worker.cpp
 * @brief Implementation of the buffered copy loop
 */

#include "kcenon/transfer_monitor/core/copy_worker.h"

#include "kcenon/transfer_monitor/core/counting_io.h"
#include "kcenon/transfer_monitor/core/logging.h"

#include <vector>

namespace kcenon::transfer_monitor {

namespace {

auto classify(const error& err, error_code as) -> error {
    if (err.message.empty()) {
        return error{as};
    }
    return error{as, err.message};
}

}  // namespace

copy_worker::copy_worker(std::unique_ptr<byte_source> source,
                         std::unique_ptr<byte_sink> sink,
                         std::shared_ptr<byte_counter> counter,
                         const transfer_config& config)
    : source_(std::move(source))
    , sink_(std::move(sink))
    , counter_(std::move(counter))
    , buffer_size_(config.buffer_size > 0 ? config.buffer_size
                                          : transfer_config::default_buffer_size)
    , label_(config.label) {}

auto copy_worker::run() -> transfer_outcome {
    if (!source_ || !sink_) {
        return unexpected(error{error_code::invalid_argument,
                                "copy worker requires both a source and a sink"});
    }

    counting_source reader(std::move(source_), counter_);
    counting_sink writer(std::move(sink_), counter_);
    std::vector<std::byte> buffer(buffer_size_);
    uint64_t chunks = 0;

    auto fail = [&](error err) -> transfer_outcome {
        transfer_log_context ctx;
        ctx.label = label_;
        if (counter_) {
            ctx.bytes_read = counter_->read_count();
            ctx.bytes_written = counter_->written_count();
        }
        ctx.error_message = err.message;
        TM_LOG_ERROR_CTX(log_category::worker,
                         std::string("Copy aborted: ") + std::string(to_string(err.code)),
                         ctx);
        return unexpected(std::move(err));
    };

    while (true) {
        auto read_result = reader.read(buffer);
        if (!read_result) {
            return fail(classify(read_result.error(), error_code::source_read_error));
        }

        auto length = read_result.value();
        if (length == 0) {
            break;
        }

        auto write_result = writer.write(std::span<const std::byte>(buffer.data(), length));
        if (!write_result) {
            return fail(classify(write_result.error(), error_code::sink_write_error));
        }
        ++chunks;
    }

    auto flush_result = writer.flush();
    if (!flush_result) {
        return fail(classify(flush_result.error(), error_code::sink_write_error));
    }

    TM_LOG_DEBUG(log_category::worker,
                 "Copy reached end of input after " + std::to_string(chunks) + " chunks");

    return transfer_endpoints{reader.release(), writer.release()};
}

}  // namespace kcenon::transfer_monitor
