/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_TRANSFER_MONITOR_TEST_FIXTURES_H
#define KCENON_TRANSFER_MONITOR_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/transfer_monitor/transfer_monitor.h>

#include "test_doubles.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::transfer_monitor::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("transfer_monitor_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        get_logger().set_stderr_enabled(false);
    }

    void TearDown() override {
        get_logger().set_stderr_enabled(true);
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        auto data = make_random_bytes(size);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));

        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::vector<char> {
        std::ifstream file(path, std::ios::binary);
        return std::vector<char>(std::istreambuf_iterator<char>(file),
                                 std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Poll a transfer until its worker terminates
 * @return false if @p timeout elapsed first
 */
inline auto wait_for_completion(const transfer& t,
                                std::chrono::milliseconds timeout = std::chrono::seconds(30))
    -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!t.is_complete()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/**
 * @brief Test data sizes
 */
namespace test_data {
    constexpr std::size_t small_size = 1024;                 // 1KB
    constexpr std::size_t medium_size = 10 * 1024 * 1024;   // 10MB
    constexpr std::size_t large_size = 64 * 1024 * 1024;    // 64MB
}

}  // namespace kcenon::transfer_monitor::test

#endif  // KCENON_TRANSFER_MONITOR_TEST_FIXTURES_H
