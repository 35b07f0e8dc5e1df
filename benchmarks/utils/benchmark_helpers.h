/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_LOG_COLLECTOR_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_LOG_COLLECTOR_BENCHMARKS_BENCHMARK_HELPERS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include <kcenon/log_collector/core/source_types.h>

namespace kcenon::log_collector::benchmark {

/**
 * @brief Helper class for generating log-like test data
 */
class test_data_generator {
public:
    /**
     * @brief Generate syslog-style text
     * @param size Approximate size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_log_text(std::size_t size, uint32_t seed = 0) -> std::string;

    /**
     * @brief Generate in-memory entries resembling a /var/log listing
     * @param count Number of entries
     * @param seed Random seed (0 for random)
     *
     * Names cycle through common log file names and rotations; sizes and
     * modification times are spread over the last 30 days.
     */
    static auto generate_entries(std::size_t count, uint32_t seed = 0)
        -> std::vector<file_entry>;
};

/**
 * @brief Helper class for managing temporary benchmark directories
 */
class temp_tree_manager {
public:
    explicit temp_tree_manager(const std::filesystem::path& base_dir = {});

    ~temp_tree_manager();

    // Non-copyable
    temp_tree_manager(const temp_tree_manager&) = delete;
    auto operator=(const temp_tree_manager&) -> temp_tree_manager& = delete;

    // Movable
    temp_tree_manager(temp_tree_manager&&) noexcept;
    auto operator=(temp_tree_manager&&) noexcept -> temp_tree_manager&;

    /**
     * @brief Create a file with the given content below base_dir
     * @param relative Relative path, parent directories are created
     */
    auto create_file(const std::string& relative, const std::string& content)
        -> std::filesystem::path;

    /**
     * @brief Populate a directory tree of log files
     * @param files Number of files
     * @param fan_out Files per directory before a new subdirectory starts
     * @param file_size Size of each file in bytes
     * @return Root of the created tree
     */
    auto create_log_tree(std::size_t files, std::size_t fan_out, std::size_t file_size)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    bool owns_dir_ = false;
};

/**
 * @brief Format throughput as human-readable string
 * @param bytes_per_second Throughput in bytes per second
 * @return Formatted string (e.g., "500.00 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_log = 4 * KB;
constexpr std::size_t medium_log = 256 * KB;
constexpr std::size_t large_log = 4 * MB;
}  // namespace sizes

/**
 * @brief Performance targets
 */
namespace targets {
constexpr double listing_10k_files_ms = 100.0;  // < 100ms for 10K entries
constexpr std::size_t event_queue_capacity = 1024;
}  // namespace targets

}  // namespace kcenon::log_collector::benchmark

#endif  // KCENON_LOG_COLLECTOR_BENCHMARKS_BENCHMARK_HELPERS_H
