/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_TRANSFER_MONITOR_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_TRANSFER_MONITOR_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::transfer_monitor::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @param name File name
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Path for a file the benchmark will create itself
     */
    auto reserve_path(const std::string& name) -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_transfer = 100 * KB;   // 100 KB
constexpr std::size_t medium_transfer = 10 * MB;   // 10 MB
constexpr std::size_t large_transfer = 100 * MB;   // 100 MB

// Copy buffer sizes for testing
constexpr std::size_t min_buffer = 4 * KB;         // 4 KB
constexpr std::size_t default_buffer = 64 * KB;    // 64 KB
constexpr std::size_t max_buffer = 16 * MB;        // 16 MB
}  // namespace sizes

}  // namespace kcenon::transfer_monitor::benchmark

#endif  // KCENON_TRANSFER_MONITOR_BENCHMARKS_BENCHMARK_HELPERS_H
