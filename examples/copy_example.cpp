/**
 * @file copy_example.cpp
 * @brief Monitor a copy whose size is not known up front
 *
 * This example demonstrates:
 * - Starting a transfer without an expected total
 * - Polling progress once per second from the main thread
 * - Collecting the outcome and the recovered endpoints with finish()
 */

#include <kcenon/transfer_monitor/transfer_monitor.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

using namespace kcenon::transfer_monitor;

namespace {

constexpr uint64_t default_size = 1024ULL * 1024 * 1024;  // 1 GiB

void print_usage(const char* program) {
    std::cout << "Copy Example - Transfer Monitor" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -i, --input <path>    Source to read (default: /dev/urandom)" << std::endl;
    std::cout << "  -n, --bytes <count>   Stop after this many bytes (default: 1 GiB)" << std::endl;
    std::cout << "  -u, --units <style>   decimal or binary (default: binary)" << std::endl;
    std::cout << "  --help                Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string input = "/dev/urandom";
    uint64_t limit = default_size;
    unit_style style = unit_style::binary;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-i" || arg == "--input") {
            if (++i >= argc) {
                std::cerr << "Error: --input requires an argument" << std::endl;
                return 1;
            }
            input = argv[i];
        } else if (arg == "-n" || arg == "--bytes") {
            if (++i >= argc) {
                std::cerr << "Error: --bytes requires an argument" << std::endl;
                return 1;
            }
            limit = std::stoull(argv[i]);
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
        } else {
            std::cerr << "Error: unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto stream = std::make_unique<std::ifstream>(input, std::ios::binary);
    if (!stream->is_open()) {
        std::cerr << "Error: cannot open " << input << std::endl;
        return 1;
    }

    auto source = std::make_unique<limited_source>(
        std::make_unique<stream_source>(std::move(stream)), limit);

    auto t = transfer::start(std::move(source), std::make_unique<null_sink>());

    while (!t.is_complete()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        std::cout << t.to_string(style) << std::endl;
    }

    auto outcome = std::move(t).finish();
    if (!outcome) {
        std::cerr << "Transfer failed: " << outcome.error().message << std::endl;
        return 1;
    }

    std::cout << "Copied " << format_bytes(t.bytes_transferred(), style) << " in "
              << format_duration(std::chrono::duration_cast<std::chrono::milliseconds>(
                     t.elapsed()))
              << std::endl;
    return 0;
}
