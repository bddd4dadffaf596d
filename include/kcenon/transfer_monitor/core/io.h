/**
 * @file io.h
 * @brief Source and sink abstractions used by the copy worker
 *
 * A transfer moves bytes from a byte_source to a byte_sink. Both are
 * blocking interfaces; the stock adapters below cover streams, files,
 * in-memory buffers and the usual test doubles.
 */

#ifndef KCENON_TRANSFER_MONITOR_CORE_IO_H
#define KCENON_TRANSFER_MONITOR_CORE_IO_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <vector>

#include "types.h"

namespace kcenon::transfer_monitor {

/**
 * @brief Readable side of a transfer
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @param buffer Destination buffer
     * @return Number of bytes read; 0 signals end of input
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief Writable side of a transfer
 */
class byte_sink {
public:
    virtual ~byte_sink() = default;

    /**
     * @brief Write all of @p data or fail
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Flush buffered data (no-op unless the sink buffers)
     */
    [[nodiscard]] virtual auto flush() -> result<void> { return {}; }
};

/**
 * @brief Source reading from an owned std::istream
 */
class stream_source : public byte_source {
public:
    explicit stream_source(std::unique_ptr<std::istream> stream);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

protected:
    std::unique_ptr<std::istream> stream_;
};

/**
 * @brief Sink writing to an owned std::ostream
 */
class stream_sink : public byte_sink {
public:
    explicit stream_sink(std::unique_ptr<std::ostream> stream);

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override;
    [[nodiscard]] auto flush() -> result<void> override;

protected:
    std::unique_ptr<std::ostream> stream_;
};

/**
 * @brief Source reading a regular file in binary mode
 *
 * @code
 * auto src = file_source::open("/data/image.iso");
 * if (!src) {
 *     return unexpected(src.error());
 * }
 * auto total = src.value()->size();
 * @endcode
 */
class file_source : public stream_source {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_source>>;

    /**
     * @brief File size at open time
     */
    [[nodiscard]] auto size() const noexcept -> uint64_t { return size_; }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    file_source(std::unique_ptr<std::ifstream> stream, std::filesystem::path path, uint64_t size);

    std::filesystem::path path_;
    uint64_t size_;
};

/**
 * @brief Sink writing a regular file in binary mode (truncates)
 */
class file_sink : public stream_sink {
public:
    [[nodiscard]] static auto create(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_sink>>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    file_sink(std::unique_ptr<std::ofstream> stream, std::filesystem::path path);

    std::filesystem::path path_;
};

/**
 * @brief Source serving bytes from an owned buffer
 */
class memory_source : public byte_source {
public:
    explicit memory_source(std::vector<std::byte> data);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

    [[nodiscard]] auto position() const noexcept -> std::size_t { return position_; }

private:
    std::vector<std::byte> data_;
    std::size_t position_ = 0;
};

/**
 * @brief Sink collecting everything written into a buffer
 */
class memory_sink : public byte_sink {
public:
    memory_sink() = default;

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override;

    [[nodiscard]] auto data() const -> const std::vector<std::byte>& { return data_; }

    [[nodiscard]] auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

/**
 * @brief Source yielding a fixed number of zero bytes
 */
class zero_source : public byte_source {
public:
    explicit zero_source(uint64_t length);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

private:
    uint64_t remaining_;
};

/**
 * @brief Caps another source at a fixed number of bytes
 */
class limited_source : public byte_source {
public:
    limited_source(std::unique_ptr<byte_source> inner, uint64_t limit);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

    [[nodiscard]] auto limit() const noexcept -> uint64_t { return limit_; }

    /**
     * @brief Give back the wrapped source
     */
    [[nodiscard]] auto release() -> std::unique_ptr<byte_source> { return std::move(inner_); }

private:
    std::unique_ptr<byte_source> inner_;
    uint64_t limit_;
    uint64_t remaining_;
};

/**
 * @brief Sink discarding all input
 */
class null_sink : public byte_sink {
public:
    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override;

    [[nodiscard]] auto discarded() const noexcept -> uint64_t { return discarded_; }

private:
    uint64_t discarded_ = 0;
};

}  // namespace kcenon::transfer_monitor

#endif  // KCENON_TRANSFER_MONITOR_CORE_IO_H
