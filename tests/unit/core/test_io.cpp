/**
 * @file test_io.cpp
 * @brief Unit tests for the stock source and sink adapters
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_monitor/core/io.h>

#include "test_doubles.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::transfer_monitor::test {

namespace {

auto to_bytes(std::string_view text) -> std::vector<std::byte> {
    std::vector<std::byte> out(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

auto to_text(const std::vector<std::byte>& bytes) -> std::string {
    std::string out(bytes.size(), '\0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        out[i] = static_cast<char>(bytes[i]);
    }
    return out;
}

}  // namespace

// =============================================================================
// Memory adapters
// =============================================================================

class MemoryIoTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(MemoryIoTest, MemorySourceReadsInChunks) {
    memory_source source(to_bytes("hello world"));
    std::vector<std::byte> buffer(4);

    auto first = source.read(buffer);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value(), 4u);
    EXPECT_EQ(source.position(), 4u);

    auto second = source.read(buffer);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), 4u);

    auto third = source.read(buffer);
    ASSERT_TRUE(third);
    EXPECT_EQ(third.value(), 3u);

    auto eof = source.read(buffer);
    ASSERT_TRUE(eof);
    EXPECT_EQ(eof.value(), 0u);
}

TEST_F(MemoryIoTest, MemorySinkAccumulates) {
    memory_sink sink;
    auto a = to_bytes("abc");
    auto b = to_bytes("def");

    ASSERT_TRUE(sink.write(a));
    ASSERT_TRUE(sink.write(b));
    ASSERT_TRUE(sink.flush());

    EXPECT_EQ(to_text(sink.data()), "abcdef");

    auto taken = sink.take();
    EXPECT_EQ(taken.size(), 6u);
}

TEST_F(MemoryIoTest, ZeroSourceYieldsExactLength) {
    zero_source source(10000);
    std::vector<std::byte> buffer(4096, std::byte{0xff});
    uint64_t total = 0;

    while (true) {
        auto r = source.read(buffer);
        ASSERT_TRUE(r);
        if (r.value() == 0) {
            break;
        }
        for (std::size_t i = 0; i < r.value(); ++i) {
            ASSERT_EQ(buffer[i], std::byte{0});
        }
        total += r.value();
    }

    EXPECT_EQ(total, 10000u);
}

TEST_F(MemoryIoTest, LimitedSourceCapsInner) {
    limited_source source(std::make_unique<zero_source>(1000), 300);
    std::vector<std::byte> buffer(256);

    auto first = source.read(buffer);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value(), 256u);

    auto second = source.read(buffer);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), 44u);

    auto eof = source.read(buffer);
    ASSERT_TRUE(eof);
    EXPECT_EQ(eof.value(), 0u);
    EXPECT_EQ(source.limit(), 300u);

    auto inner = source.release();
    EXPECT_NE(inner, nullptr);

    auto after_release = source.read(buffer);
    EXPECT_FALSE(after_release);
    EXPECT_EQ(after_release.error().code, error_code::source_read_error);
}

TEST_F(MemoryIoTest, LimitedSourcePropagatesInnerError) {
    limited_source source(std::make_unique<failing_source>(0), 100);
    std::vector<std::byte> buffer(16);

    auto r = source.read(buffer);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::source_read_error);
}

TEST_F(MemoryIoTest, NullSinkCountsDiscardedBytes) {
    null_sink sink;
    std::vector<std::byte> buffer(123);

    ASSERT_TRUE(sink.write(buffer));
    ASSERT_TRUE(sink.write(buffer));

    EXPECT_EQ(sink.discarded(), 246u);
}

// =============================================================================
// Stream adapters
// =============================================================================

TEST(StreamIoTest, StreamSourceReadsUntilEof) {
    stream_source source(std::make_unique<std::istringstream>("0123456789"));
    std::vector<std::byte> buffer(6);

    auto first = source.read(buffer);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value(), 6u);

    auto second = source.read(buffer);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), 4u);

    auto eof = source.read(buffer);
    ASSERT_TRUE(eof);
    EXPECT_EQ(eof.value(), 0u);
}

TEST(StreamIoTest, StreamSinkWritesAndFlushes) {
    auto owned = std::make_unique<std::ostringstream>();
    auto* raw = owned.get();
    stream_sink sink(std::move(owned));

    auto data = to_bytes("payload");
    ASSERT_TRUE(sink.write(data));
    ASSERT_TRUE(sink.flush());

    EXPECT_EQ(raw->str(), "payload");
}

TEST(StreamIoTest, BadStreamReportsSinkWriteError) {
    auto owned = std::make_unique<std::ostringstream>();
    owned->setstate(std::ios::badbit);
    stream_sink sink(std::move(owned));

    auto data = to_bytes("x");
    auto r = sink.write(data);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::sink_write_error);
}

TEST(StreamIoTest, BadStreamReportsSourceReadError) {
    auto owned = std::make_unique<std::istringstream>("data");
    owned->setstate(std::ios::badbit);
    stream_source source(std::move(owned));

    std::vector<std::byte> buffer(4);
    auto r = source.read(buffer);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::source_read_error);
}

TEST(StreamIoTest, NullStreamsAreErrors) {
    stream_source source(nullptr);
    stream_sink sink(nullptr);
    std::vector<std::byte> buffer(4);

    EXPECT_FALSE(source.read(buffer));
    EXPECT_FALSE(sink.write(buffer));
    EXPECT_FALSE(sink.flush());
}

// =============================================================================
// File adapters
// =============================================================================

class FileIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("transfer_monitor_io_") + info->name());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
};

TEST_F(FileIoTest, OpenMissingFileFails) {
    auto r = file_source::open(test_dir_ / "missing.bin");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::file_not_found);
}

TEST_F(FileIoTest, CreateInMissingDirectoryFails) {
    auto r = file_sink::create(test_dir_ / "no_such_dir" / "out.bin");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::file_not_found);
}

TEST_F(FileIoTest, WriteThenReadBack) {
    auto data = make_random_bytes(100000);
    auto path = test_dir_ / "roundtrip.bin";

    {
        auto sink = file_sink::create(path);
        ASSERT_TRUE(sink);
        EXPECT_EQ(sink.value()->path().string(), path.string());
        ASSERT_TRUE(sink.value()->write(data));
        ASSERT_TRUE(sink.value()->flush());
    }

    auto source = file_source::open(path);
    ASSERT_TRUE(source);
    EXPECT_EQ(source.value()->size(), data.size());

    std::vector<std::byte> read_back;
    std::vector<std::byte> buffer(8192);
    while (true) {
        auto r = source.value()->read(buffer);
        ASSERT_TRUE(r);
        if (r.value() == 0) {
            break;
        }
        read_back.insert(read_back.end(), buffer.begin(), buffer.begin() + r.value());
    }

    EXPECT_EQ(read_back, data);
}

TEST_F(FileIoTest, EmptyFileHasSizeZero) {
    auto path = test_dir_ / "empty.bin";
    { std::ofstream empty(path, std::ios::binary); }

    auto source = file_source::open(path);
    ASSERT_TRUE(source);
    EXPECT_EQ(source.value()->size(), 0u);

    std::vector<std::byte> buffer(16);
    auto r = source.value()->read(buffer);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 0u);
}

}  // namespace kcenon::transfer_monitor::test
