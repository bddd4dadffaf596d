/**
 * @file io.cpp
 * @brief Implementation of the stock source and sink adapters
 */

#include "kcenon/transfer_monitor/core/io.h"

#include "kcenon/transfer_monitor/core/logging.h"

#include <algorithm>
#include <cstring>
#include <system_error>

namespace kcenon::transfer_monitor {

// stream_source

stream_source::stream_source(std::unique_ptr<std::istream> stream)
    : stream_(std::move(stream)) {}

auto stream_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (!stream_) {
        return unexpected(error{error_code::source_read_error, "source stream is null"});
    }
    if (buffer.empty() || stream_->eof()) {
        return std::size_t{0};
    }

    stream_->read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
    auto count = static_cast<std::size_t>(stream_->gcount());

    // A short read at end of file sets failbit together with eofbit.
    if (stream_->bad() || (stream_->fail() && !stream_->eof())) {
        return unexpected(error{error_code::source_read_error,
                                "failed to read from input stream"});
    }

    return count;
}

// stream_sink

stream_sink::stream_sink(std::unique_ptr<std::ostream> stream)
    : stream_(std::move(stream)) {}

auto stream_sink::write(std::span<const std::byte> data) -> result<void> {
    if (!stream_) {
        return unexpected(error{error_code::sink_write_error, "sink stream is null"});
    }
    if (data.empty()) {
        return {};
    }

    stream_->write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    if (!*stream_) {
        return unexpected(error{error_code::sink_write_error,
                                "failed to write to output stream"});
    }
    return {};
}

auto stream_sink::flush() -> result<void> {
    if (!stream_) {
        return unexpected(error{error_code::sink_write_error, "sink stream is null"});
    }
    stream_->flush();
    if (!*stream_) {
        return unexpected(error{error_code::sink_write_error,
                                "failed to flush output stream"});
    }
    return {};
}

// file_source

file_source::file_source(std::unique_ptr<std::ifstream> stream,
                         std::filesystem::path path,
                         uint64_t size)
    : stream_source(std::move(stream)), path_(std::move(path)), size_(size) {}

auto file_source::open(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_source>> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected(error{error_code::file_not_found,
                                "file not found: " + path.string()});
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot stat file: " + path.string() + ": " + ec.message()});
    }

    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open()) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot open file for reading: " + path.string()});
    }

    TM_LOG_DEBUG(log_category::io, "Opened source file " + path.string() +
                 " (" + std::to_string(size) + " bytes)");

    return std::unique_ptr<file_source>(
        new file_source(std::move(stream), path, static_cast<uint64_t>(size)));
}

// file_sink

file_sink::file_sink(std::unique_ptr<std::ofstream> stream, std::filesystem::path path)
    : stream_sink(std::move(stream)), path_(std::move(path)) {}

auto file_sink::create(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_sink>> {
    auto parent = path.parent_path();
    std::error_code ec;
    if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
        return unexpected(error{error_code::file_not_found,
                                "directory not found: " + parent.string()});
    }

    auto stream = std::make_unique<std::ofstream>(
        path, std::ios::binary | std::ios::trunc);
    if (!stream->is_open()) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot open file for writing: " + path.string()});
    }

    TM_LOG_DEBUG(log_category::io, "Created sink file " + path.string());

    return std::unique_ptr<file_sink>(new file_sink(std::move(stream), path));
}

// memory_source

memory_source::memory_source(std::vector<std::byte> data)
    : data_(std::move(data)) {}

auto memory_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto available = data_.size() - position_;
    auto count = std::min(available, buffer.size());
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

// memory_sink

auto memory_sink::write(std::span<const std::byte> data) -> result<void> {
    data_.insert(data_.end(), data.begin(), data.end());
    return {};
}

// zero_source

zero_source::zero_source(uint64_t length) : remaining_(length) {}

auto zero_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto count = static_cast<std::size_t>(
        std::min<uint64_t>(remaining_, buffer.size()));
    std::fill_n(buffer.begin(), count, std::byte{0});
    remaining_ -= count;
    return count;
}

// limited_source

limited_source::limited_source(std::unique_ptr<byte_source> inner, uint64_t limit)
    : inner_(std::move(inner)), limit_(limit), remaining_(limit) {}

auto limited_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (!inner_) {
        return unexpected(error{error_code::source_read_error, "inner source is null"});
    }
    if (remaining_ == 0) {
        return std::size_t{0};
    }

    auto max = static_cast<std::size_t>(std::min<uint64_t>(remaining_, buffer.size()));
    auto read_result = inner_->read(buffer.first(max));
    if (!read_result) {
        return read_result;
    }

    remaining_ -= read_result.value();
    return read_result;
}

// null_sink

auto null_sink::write(std::span<const std::byte> data) -> result<void> {
    discarded_ += data.size();
    return {};
}

}  // namespace kcenon::transfer_monitor
