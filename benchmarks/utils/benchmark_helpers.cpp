/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::log_collector::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_log_text(std::size_t size, uint32_t seed) -> std::string {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);

    static const std::array<const char*, 4> levels = {"INFO", "WARN", "ERROR", "DEBUG"};
    static const std::array<const char*, 8> messages = {
        "worker heartbeat ok",
        "connection accepted from 10.0.0.12",
        "request completed in 12ms",
        "cache miss for key session:4821",
        "retrying upstream call",
        "disk usage at 71%",
        "scheduled job rotate_logs started",
        "configuration reloaded"};

    std::uniform_int_distribution<std::size_t> level_dis(0, levels.size() - 1);
    std::uniform_int_distribution<std::size_t> message_dis(0, messages.size() - 1);
    std::uniform_int_distribution<int> second_dis(0, 59);

    std::string text;
    text.reserve(size + 128);
    while (text.size() < size) {
        std::ostringstream line;
        line << "2025-01-31 08:" << std::setw(2) << std::setfill('0') << second_dis(gen) << ':'
             << std::setw(2) << second_dis(gen) << ' ' << levels[level_dis(gen)] << ' '
             << messages[message_dis(gen)] << '\n';
        text += line.str();
    }
    text.resize(size);
    return text;
}

auto test_data_generator::generate_entries(std::size_t count, uint32_t seed)
    -> std::vector<file_entry> {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);

    static const std::array<const char*, 8> names = {
        "syslog", "kern.log", "auth.log", "dpkg.log", "server.log", "trace.txt", "core.gz",
        "app.out"};

    std::uniform_int_distribution<uint64_t> size_dis(0, 8 * sizes::MB);
    std::uniform_int_distribution<int> age_dis(0, 30 * 24);

    const auto now = std::chrono::system_clock::now();
    std::vector<file_entry> entries;
    entries.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        file_entry entry;
        auto name = std::string(names[i % names.size()]);
        if (i >= names.size()) {
            name += "." + std::to_string(i / names.size());
        }
        entry.path = "dir" + std::to_string(i % 16) + "/" + name;
        entry.absolute_path = "/var/log/" + entry.path;
        entry.size = size_dis(gen);
        entry.modified_at = now - std::chrono::hours(age_dis(gen));
        entries.push_back(std::move(entry));
    }
    return entries;
}

// temp_tree_manager implementation

temp_tree_manager::temp_tree_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("log_collector_benchmarks_" + std::to_string(std::random_device{}()));
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_tree_manager::~temp_tree_manager() {
    cleanup();
}

temp_tree_manager::temp_tree_manager(temp_tree_manager&& other) noexcept
    : base_dir_(std::move(other.base_dir_)), owns_dir_(other.owns_dir_) {
    other.owns_dir_ = false;
}

auto temp_tree_manager::operator=(temp_tree_manager&& other) noexcept -> temp_tree_manager& {
    if (this != &other) {
        cleanup();
        base_dir_ = std::move(other.base_dir_);
        owns_dir_ = other.owns_dir_;
        other.owns_dir_ = false;
    }
    return *this;
}

auto temp_tree_manager::create_file(const std::string& relative, const std::string& content)
    -> std::filesystem::path {
    auto path = base_dir_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream file(path, std::ios::binary);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return path;
}

auto temp_tree_manager::create_log_tree(std::size_t files, std::size_t fan_out,
                                        std::size_t file_size) -> std::filesystem::path {
    const auto root = base_dir_ / ("tree_" + std::to_string(files));
    const auto content = test_data_generator::generate_log_text(file_size, 42);
    const auto per_dir = fan_out == 0 ? files : fan_out;

    for (std::size_t i = 0; i < files; ++i) {
        auto relative = "tree_" + std::to_string(files) + "/d" + std::to_string(i / per_dir) +
                        "/app_" + std::to_string(i) + ".log";
        create_file(relative, content);
    }
    return root;
}

auto temp_tree_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_tree_manager::cleanup() {
    if (owns_dir_) {
        std::error_code ec;
        std::filesystem::remove_all(base_dir_, ec);
        owns_dir_ = false;
    }
}

// Utility functions

auto format_throughput(double bytes_per_second) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes_per_second >= sizes::MB) {
        oss << bytes_per_second / sizes::MB << " MB/s";
    } else if (bytes_per_second >= sizes::KB) {
        oss << bytes_per_second / sizes::KB << " KB/s";
    } else {
        oss << bytes_per_second << " B/s";
    }

    return oss.str();
}

}  // namespace kcenon::log_collector::benchmark
