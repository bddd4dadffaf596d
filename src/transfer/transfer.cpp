/**
 * @file transfer.cpp
 * @brief Implementation of the background transfer handle
 */

#include "kcenon/transfer_monitor/transfer/transfer.h"

#include "kcenon/transfer_monitor/core/byte_counter.h"
#include "kcenon/transfer_monitor/core/logging.h"

#include <atomic>
#include <cmath>
#include <exception>
#include <future>
#include <thread>

namespace kcenon::transfer_monitor {

namespace {

/**
 * @brief State shared between the handle and the worker thread
 */
struct shared_state {
    byte_counter counter;
    std::atomic<bool> complete{false};
};

/**
 * @brief Raises the completion flag when the worker leaves run(), even by exception
 */
class completion_guard {
public:
    explicit completion_guard(shared_state& state) : state_(state) {}
    ~completion_guard() { state_.complete.store(true, std::memory_order_release); }

    completion_guard(const completion_guard&) = delete;
    auto operator=(const completion_guard&) -> completion_guard& = delete;

private:
    shared_state& state_;
};

auto make_context(const transfer_config& config, const progress_snapshot& snap)
    -> transfer_log_context {
    transfer_log_context ctx;
    ctx.label = config.label;
    ctx.bytes_read = snap.bytes_read;
    ctx.bytes_written = snap.bytes_written;
    ctx.expected_total = snap.expected_total;
    if (auto pct = snap.percent()) {
        ctx.progress_percent = *pct;
    }
    ctx.rate_bytes_per_sec = snap.throughput;
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(snap.elapsed).count());
    return ctx;
}

auto describe_exception(std::exception_ptr eptr) -> std::string {
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

}  // namespace

struct transfer::impl {
    transfer_config config;
    std::chrono::steady_clock::time_point start_time;
    std::shared_ptr<shared_state> state;
    std::future<transfer_outcome> outcome;
    std::thread worker_thread;
    std::atomic<bool> consumed{false};

    explicit impl(transfer_config cfg)
        : config(std::move(cfg))
        , start_time(std::chrono::steady_clock::now())
        , state(std::make_shared<shared_state>()) {}

    ~impl() {
        if (consumed.exchange(true)) {
            return;
        }

        // Nobody called finish(): wait for the copy so the thread is not leaked.
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
        if (!outcome.valid()) {
            return;
        }

        std::string failure;
        try {
            auto result = outcome.get();
            if (!result) {
                failure = result.error().message;
            }
        } catch (...) {
            failure = describe_exception(std::current_exception());
        }

        if (!failure.empty()) {
            transfer_log_context ctx;
            ctx.label = config.label;
            ctx.error_message = failure;
            TM_LOG_WARN_CTX(log_category::transfer,
                            "Transfer destroyed without finish(); its error was dropped", ctx);
        }
    }

    [[nodiscard]] auto take_snapshot() const -> progress_snapshot {
        auto elapsed = std::chrono::steady_clock::now() - start_time;
        return make_snapshot(state->counter.load(),
                             std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed),
                             config.expected_total);
    }

    void launch(std::unique_ptr<byte_source> source, std::unique_ptr<byte_sink> sink) {
        // The worker holds the counter through the shared state (aliasing constructor).
        std::shared_ptr<byte_counter> counter(state, &state->counter);
        copy_worker worker(std::move(source), std::move(sink), std::move(counter), config);

        std::packaged_task<transfer_outcome()> task(
            [worker = std::move(worker), shared = state]() mutable -> transfer_outcome {
                completion_guard guard(*shared);
                return worker.run();
            });

        outcome = task.get_future();
        worker_thread = std::thread(std::move(task));
    }
};

// builder implementation

transfer::builder::builder() = default;

auto transfer::builder::with_expected_total(uint64_t total) -> builder& {
    config_.expected_total = total;
    return *this;
}

auto transfer::builder::with_buffer_size(std::size_t size) -> builder& {
    config_.buffer_size = size;
    return *this;
}

auto transfer::builder::with_label(std::string label) -> builder& {
    config_.label = std::move(label);
    return *this;
}

auto transfer::builder::with_config(transfer_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer::builder::start(std::unique_ptr<byte_source> source,
                              std::unique_ptr<byte_sink> sink) -> result<transfer> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }

    return transfer{std::move(source), std::move(sink), config_};
}

// transfer implementation

auto transfer::start(std::unique_ptr<byte_source> source,
                     std::unique_ptr<byte_sink> sink,
                     std::optional<uint64_t> expected_total) -> transfer {
    return transfer{std::move(source), std::move(sink), transfer_config{expected_total}};
}

transfer::transfer(std::unique_ptr<byte_source> source,
                   std::unique_ptr<byte_sink> sink,
                   transfer_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();

    transfer_log_context ctx;
    ctx.label = impl_->config.label;
    ctx.expected_total = impl_->config.expected_total;
    TM_LOG_INFO_CTX(log_category::transfer, "Transfer started", ctx);

    impl_->launch(std::move(source), std::move(sink));
}

transfer::transfer(transfer&&) noexcept = default;
auto transfer::operator=(transfer&&) noexcept -> transfer& = default;
transfer::~transfer() = default;

auto transfer::is_complete() const noexcept -> bool {
    if (!impl_) {
        return true;
    }
    return impl_->state->complete.load(std::memory_order_acquire);
}

auto transfer::is_finished() const noexcept -> bool {
    return !impl_ || impl_->consumed.load();
}

auto transfer::snapshot() const -> progress_snapshot {
    if (!impl_) {
        return progress_snapshot{};
    }
    return impl_->take_snapshot();
}

auto transfer::to_string(unit_style style) const -> std::string {
    return format(snapshot(), style);
}

auto transfer::finish() && -> result<transfer_endpoints> {
    if (!impl_ || impl_->consumed.exchange(true)) {
        return unexpected(error{error_code::reuse_error,
                                "finish() was already called on this transfer"});
    }

    if (impl_->worker_thread.joinable()) {
        impl_->worker_thread.join();
    }

    transfer_outcome outcome;
    try {
        outcome = impl_->outcome.get();
    } catch (...) {
        outcome = unexpected(error{error_code::worker_fault,
                                   describe_exception(std::current_exception())});
    }

    auto snap = impl_->take_snapshot();
    auto ctx = make_context(impl_->config, snap);
    if (outcome) {
        TM_LOG_INFO_CTX(log_category::transfer, "Transfer finished", ctx);
    } else {
        ctx.error_message = outcome.error().message;
        if (outcome.error().code == error_code::worker_fault) {
            TM_LOG_ERROR_CTX(log_category::transfer, "Copy worker terminated abnormally", ctx);
        } else {
            TM_LOG_INFO_CTX(log_category::transfer, "Transfer failed", ctx);
        }
    }

    return outcome;
}

auto transfer::bytes_transferred() const noexcept -> uint64_t {
    return impl_ ? impl_->state->counter.read_count() : 0;
}

auto transfer::bytes_written() const noexcept -> uint64_t {
    return impl_ ? impl_->state->counter.written_count() : 0;
}

auto transfer::elapsed() const -> std::chrono::nanoseconds {
    return snapshot().elapsed;
}

auto transfer::speed() const -> uint64_t {
    return static_cast<uint64_t>(std::llround(snapshot().throughput));
}

auto transfer::expected_total() const noexcept -> std::optional<uint64_t> {
    if (!impl_) {
        return std::nullopt;
    }
    return impl_->config.expected_total;
}

auto transfer::remaining() const noexcept -> std::optional<uint64_t> {
    auto total = expected_total();
    if (!total) {
        return std::nullopt;
    }
    auto done = bytes_transferred();
    return done >= *total ? 0 : *total - done;
}

auto transfer::fraction_transferred() const -> std::optional<double> {
    return snapshot().fraction;
}

auto transfer::eta() const -> std::optional<duration> {
    return snapshot().estimated_remaining;
}

auto transfer::label() const -> const std::string& {
    static const std::string empty;
    return impl_ ? impl_->config.label : empty;
}

auto operator<<(std::ostream& os, const transfer& t) -> std::ostream& {
    return os << t.to_string(unit_style::decimal);
}

}  // namespace kcenon::transfer_monitor
