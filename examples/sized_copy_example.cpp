/**
 * @file sized_copy_example.cpp
 * @brief Monitor a copy with a known size, showing percent and ETA
 *
 * This example demonstrates:
 * - Configuring a transfer with the builder
 * - Reporting completion percentage and estimated time remaining
 * - Copying between files and recovering the file sink afterwards
 */

#include <kcenon/transfer_monitor/transfer_monitor.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::transfer_monitor;

namespace {

constexpr uint64_t default_size = 1024ULL * 1024 * 1024;  // 1 GiB

void print_usage(const char* program) {
    std::cout << "Sized Copy Example - Transfer Monitor" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] [source_file destination_file]" << std::endl;
    std::cout << std::endl;
    std::cout << "Without files, copies 1 GiB from /dev/urandom into a discarding sink." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -b, --buffer <bytes>  Copy buffer size (default: 65536)" << std::endl;
    std::cout << "  -u, --units <style>   decimal or binary (default: binary)" << std::endl;
    std::cout << "  -v, --verbose         Log transfer lifecycle events" << std::endl;
    std::cout << "  --help                Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t buffer_size = transfer_config::default_buffer_size;
    unit_style style = unit_style::binary;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-b" || arg == "--buffer") {
            if (++i >= argc) {
                std::cerr << "Error: --buffer requires an argument" << std::endl;
                return 1;
            }
            buffer_size = static_cast<std::size_t>(std::stoull(argv[i]));
        } else if (arg == "-u" || arg == "--units") {
            if (++i >= argc) {
                std::cerr << "Error: --units requires an argument" << std::endl;
                return 1;
            }
            auto parsed = parse_unit_style(argv[i]);
            if (!parsed) {
                std::cerr << "Error: unknown unit style: " << argv[i] << std::endl;
                return 1;
            }
            style = *parsed;
        } else if (arg == "-v" || arg == "--verbose") {
            get_logger().set_level(log_level::info);
        } else {
            positional.push_back(arg);
        }
    }

    if (!positional.empty() && positional.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::unique_ptr<byte_source> source;
    std::unique_ptr<byte_sink> sink;
    uint64_t total = default_size;
    std::string label = "urandom";

    if (positional.empty()) {
        auto stream = std::make_unique<std::ifstream>("/dev/urandom", std::ios::binary);
        if (!stream->is_open()) {
            std::cerr << "Error: cannot open /dev/urandom" << std::endl;
            return 1;
        }
        source = std::make_unique<limited_source>(
            std::make_unique<stream_source>(std::move(stream)), total);
        sink = std::make_unique<null_sink>();
    } else {
        auto file = file_source::open(positional[0]);
        if (!file) {
            std::cerr << "Error: " << file.error().message << std::endl;
            return 1;
        }
        total = file.value()->size();
        source = std::move(file.value());

        auto out = file_sink::create(positional[1]);
        if (!out) {
            std::cerr << "Error: " << out.error().message << std::endl;
            return 1;
        }
        sink = std::move(out.value());
        label = positional[0];
    }

    auto started = transfer::builder()
        .with_expected_total(total)
        .with_buffer_size(buffer_size)
        .with_label(label)
        .start(std::move(source), std::move(sink));

    if (!started) {
        std::cerr << "Error: " << started.error().message << std::endl;
        return 1;
    }

    auto& t = started.value();
    while (!t.is_complete()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        std::cout << t.to_string(style) << std::endl;
    }

    auto outcome = std::move(t).finish();
    if (!outcome) {
        std::cerr << "Transfer failed: " << outcome.error().message << std::endl;
        return 1;
    }

    auto endpoints = std::move(outcome).value();
    if (auto* file = dynamic_cast<file_sink*>(endpoints.sink.get())) {
        std::cout << "Wrote " << file->path() << std::endl;
    }

    std::cout << t.to_string(style) << std::endl;
    return 0;
}
