/**
 * @file test_transfer.cpp
 * @brief Unit tests for the transfer handle
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_monitor/core/logging.h>
#include <kcenon/transfer_monitor/transfer/transfer.h>

#include "test_doubles.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace kcenon::transfer_monitor::test {

static_assert(!std::is_copy_constructible_v<transfer>);
static_assert(!std::is_copy_assignable_v<transfer>);
static_assert(std::is_nothrow_move_constructible_v<transfer>);

namespace {

auto wait_until(const std::function<bool()>& predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

}  // namespace

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_stderr_enabled(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::warn);
        get_logger().set_stderr_enabled(true);
    }
};

// =============================================================================
// Completion polling
// =============================================================================

TEST_F(TransferTest, IsCompleteFalseWhileWorkerBlocked) {
    auto g = std::make_shared<gate>();
    auto t = transfer::start(std::make_unique<gated_source>(4096, 4096, g),
                             std::make_unique<null_sink>(),
                             8192);
    gate_opener opener(g);

    ASSERT_TRUE(wait_until([&] { return t.bytes_written() == 4096; }));
    EXPECT_FALSE(t.is_complete());

    auto snap = t.snapshot();
    EXPECT_EQ(snap.bytes_read, 4096u);
    ASSERT_TRUE(snap.fraction.has_value());
    EXPECT_DOUBLE_EQ(*snap.fraction, 0.5);

    g->open();
    ASSERT_TRUE(wait_until([&] { return t.is_complete(); }));

    for (int i = 0; i < 1000; ++i) {
        ASSERT_TRUE(t.is_complete());
    }

    auto outcome = std::move(t).finish();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(t.bytes_transferred(), 8192u);
}

TEST_F(TransferTest, CompleteWithoutFinishReportsNoError) {
    auto t = transfer::start(std::make_unique<failing_source>(0),
                             std::make_unique<null_sink>());

    ASSERT_TRUE(wait_until([&] { return t.is_complete(); }));

    // The error is only surfaced by finish(); polling stays quiet.
    auto snap = t.snapshot();
    EXPECT_EQ(snap.bytes_read, 0u);

    auto outcome = std::move(t).finish();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::source_read_error);
}

// =============================================================================
// finish()
// =============================================================================

TEST_F(TransferTest, FinishReturnsEndpoints) {
    auto data = make_random_bytes(200000);
    auto t = transfer::start(std::make_unique<memory_source>(data),
                             std::make_unique<memory_sink>(),
                             data.size());

    auto outcome = std::move(t).finish();
    ASSERT_TRUE(outcome);

    auto endpoints = std::move(outcome).value();
    auto* sink = dynamic_cast<memory_sink*>(endpoints.sink.get());
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->data(), data);
    EXPECT_NE(dynamic_cast<memory_source*>(endpoints.source.get()), nullptr);

    EXPECT_TRUE(t.is_complete());
    EXPECT_EQ(t.bytes_transferred(), data.size());
    EXPECT_EQ(t.bytes_written(), data.size());
}

TEST_F(TransferTest, FinishTwiceIsReuseError) {
    auto t = transfer::start(std::make_unique<zero_source>(1000),
                             std::make_unique<null_sink>());

    EXPECT_FALSE(t.is_finished());
    auto first = std::move(t).finish();
    ASSERT_TRUE(first);
    EXPECT_TRUE(t.is_finished());

    auto second = std::move(t).finish();
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, error_code::reuse_error);
}

TEST_F(TransferTest, FinishAfterFailureIsStillReuseError) {
    auto t = transfer::start(std::make_unique<failing_source>(10),
                             std::make_unique<null_sink>());

    auto first = std::move(t).finish();
    ASSERT_FALSE(first);
    EXPECT_EQ(first.error().code, error_code::source_read_error);

    auto second = std::move(t).finish();
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, error_code::reuse_error);
}

TEST_F(TransferTest, SourceErrorReportedByFinish) {
    auto t = transfer::start(std::make_unique<failing_source>(512),
                             std::make_unique<null_sink>());

    ASSERT_TRUE(wait_until([&] { return t.is_complete(); }));
    EXPECT_EQ(t.bytes_transferred(), 512u);

    auto outcome = std::move(t).finish();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::source_read_error);
}

TEST_F(TransferTest, SinkErrorReportedByFinish) {
    auto t = transfer::builder()
                 .with_buffer_size(4096)
                 .start(std::make_unique<zero_source>(100000),
                        std::make_unique<failing_sink>(4096));
    ASSERT_TRUE(t);

    auto outcome = std::move(t.value()).finish();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::sink_write_error);
    EXPECT_EQ(t.value().bytes_written(), 4096u);
}

TEST_F(TransferTest, MissingSourceIsInvalidArgument) {
    auto t = transfer::start(nullptr, std::make_unique<null_sink>());

    auto outcome = std::move(t).finish();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::invalid_argument);
}

TEST_F(TransferTest, WorkerExceptionIsWorkerFault) {
    auto t = transfer::start(std::make_unique<throwing_source>(),
                             std::make_unique<null_sink>());

    ASSERT_TRUE(wait_until([&] { return t.is_complete(); }));

    auto outcome = std::move(t).finish();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::worker_fault);
    EXPECT_EQ(outcome.error().message, "source exploded");
    EXPECT_TRUE(is_fatal_error(outcome.error().code));
}

// =============================================================================
// builder
// =============================================================================

TEST_F(TransferTest, BuilderRejectsInvalidBufferSize) {
    auto t = transfer::builder()
                 .with_buffer_size(100)
                 .start(std::make_unique<zero_source>(10), std::make_unique<null_sink>());

    ASSERT_FALSE(t);
    EXPECT_EQ(t.error().code, error_code::invalid_configuration);
}

TEST_F(TransferTest, BuilderAppliesConfig) {
    auto t = transfer::builder()
                 .with_expected_total(2048)
                 .with_label("job-7")
                 .with_buffer_size(4096)
                 .start(std::make_unique<zero_source>(2048), std::make_unique<null_sink>());
    ASSERT_TRUE(t);

    auto& running = t.value();
    EXPECT_EQ(running.label(), "job-7");
    ASSERT_TRUE(running.expected_total().has_value());
    EXPECT_EQ(*running.expected_total(), 2048u);

    ASSERT_TRUE(std::move(running).finish());

    EXPECT_EQ(running.remaining(), std::optional<uint64_t>(0));
    ASSERT_TRUE(running.fraction_transferred().has_value());
    EXPECT_EQ(*running.fraction_transferred(), 1.0);
}

TEST_F(TransferTest, BuilderWithConfig) {
    transfer_config config(uint64_t{10});
    config.label = "from-config";

    auto t = transfer::builder()
                 .with_config(config)
                 .start(std::make_unique<zero_source>(10), std::make_unique<null_sink>());
    ASSERT_TRUE(t);
    EXPECT_EQ(t.value().label(), "from-config");
    EXPECT_TRUE(std::move(t.value()).finish());
}

// =============================================================================
// Accessors and formatting
// =============================================================================

TEST_F(TransferTest, UnknownTotalAccessors) {
    auto t = transfer::start(std::make_unique<zero_source>(1 << 20),
                             std::make_unique<null_sink>());
    ASSERT_TRUE(std::move(t).finish());

    EXPECT_FALSE(t.expected_total().has_value());
    EXPECT_FALSE(t.remaining().has_value());
    EXPECT_FALSE(t.fraction_transferred().has_value());
    EXPECT_FALSE(t.eta().has_value());
    EXPECT_GT(t.speed(), 0u);
    EXPECT_GT(t.elapsed().count(), 0);

    auto text = t.to_string();
    EXPECT_NE(text.find("B/s"), std::string::npos);
    EXPECT_EQ(text.find('%'), std::string::npos);
}

TEST_F(TransferTest, KnownTotalFormatting) {
    auto t = transfer::start(std::make_unique<zero_source>(1 << 20),
                             std::make_unique<null_sink>(),
                             1 << 20);
    ASSERT_TRUE(std::move(t).finish());

    auto binary = t.to_string(unit_style::binary);
    EXPECT_EQ(binary.rfind("100.0 % (1.00 MiB of 1.00 MiB, ", 0), 0u) << binary;
    EXPECT_NE(binary.find("ETA 00:00:00"), std::string::npos) << binary;

    std::ostringstream oss;
    oss << t;
    EXPECT_EQ(oss.str().rfind("100.0 % (1.05 MB of 1.05 MB, ", 0), 0u) << oss.str();
}

TEST_F(TransferTest, MovedFromTransfer) {
    auto t = transfer::start(std::make_unique<zero_source>(4096),
                             std::make_unique<null_sink>());
    auto moved = std::move(t);

    EXPECT_TRUE(t.is_complete());
    EXPECT_TRUE(t.is_finished());
    EXPECT_EQ(t.bytes_transferred(), 0u);
    EXPECT_TRUE(t.label().empty());

    auto stale = std::move(t).finish();
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().code, error_code::reuse_error);

    EXPECT_TRUE(std::move(moved).finish());
}

// =============================================================================
// Destruction and logging
// =============================================================================

TEST_F(TransferTest, DestroyWithoutFinishJoinsWorker) {
    auto sink = std::make_unique<null_sink>();
    {
        auto t = transfer::start(std::make_unique<zero_source>(4 << 20), std::move(sink));
    }
    SUCCEED();
}

TEST_F(TransferTest, DestroyWithoutFinishWarnsAboutDroppedError) {
    std::mutex mutex;
    std::vector<std::string> warnings;
    get_logger().set_callback([&](log_level level, std::string_view,
                                  std::string_view message, const transfer_log_context*) {
        if (level == log_level::warn) {
            std::lock_guard<std::mutex> lock(mutex);
            warnings.emplace_back(message);
        }
    });

    {
        auto t = transfer::start(std::make_unique<failing_source>(0),
                                 std::make_unique<null_sink>());
    }

    get_logger().set_callback(nullptr);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("without finish()"), std::string::npos);
}

TEST_F(TransferTest, LogsLifecycleAtInfo) {
    std::mutex mutex;
    std::vector<std::string> messages;
    get_logger().set_level(log_level::info);
    get_logger().set_callback([&](log_level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        if (category == log_category::transfer) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.emplace_back(message);
        }
    });

    auto t = transfer::builder()
                 .with_label("lifecycle")
                 .start(std::make_unique<zero_source>(100), std::make_unique<null_sink>());
    ASSERT_TRUE(t);
    ASSERT_TRUE(std::move(t.value()).finish());

    get_logger().set_callback(nullptr);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "Transfer started");
    EXPECT_EQ(messages[1], "Transfer finished");
}

}  // namespace kcenon::transfer_monitor::test
