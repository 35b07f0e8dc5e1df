/**
 * @file source_types.h
 * @brief Log sources, discovered entries and per-file error records
 */

#ifndef KCENON_LOG_COLLECTOR_CORE_SOURCE_TYPES_H
#define KCENON_LOG_COLLECTOR_CORE_SOURCE_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "kcenon/log_collector/core/types.h"

namespace kcenon::log_collector {

/**
 * @brief Where a source lives
 */
enum class source_kind {
    remote,  ///< Reached over the connection session (SFTP)
    local    ///< Read from the local filesystem
};

[[nodiscard]] constexpr auto to_string(source_kind kind) -> const char* {
    switch (kind) {
        case source_kind::remote: return "remote";
        case source_kind::local: return "local";
        default: return "unknown";
    }
}

/**
 * @brief One log source root
 *
 * The label names the archive or the destination sub-folder produced for
 * this source.
 */
struct source_spec {
    source_kind kind = source_kind::remote;
    std::string root_path;
    std::string label;

    /**
     * @brief Kernel and system logs of the remote controller
     */
    [[nodiscard]] static auto linux_kernel_logs() -> source_spec {
        return {source_kind::remote, "/var/log/", "controller_kernel_log"};
    }

    /**
     * @brief Application logs of the remote controller
     */
    [[nodiscard]] static auto linux_server_logs() -> source_spec {
        return {source_kind::remote, "/opt/myapp/logs/", "controller_log"};
    }

    /**
     * @brief Client application logs on this machine
     */
    [[nodiscard]] static auto local_client_logs(const std::filesystem::path& root)
        -> source_spec {
        return {source_kind::local, root.string(), "user_app_log"};
    }

    [[nodiscard]] auto is_remote() const -> bool { return kind == source_kind::remote; }
};

/**
 * @brief Snapshot of a discovered file or directory
 *
 * Taken at discovery time. The underlying file may change or disappear
 * before it is transferred; that race is reported per file.
 */
struct file_entry {
    std::string path;           ///< Relative to the source root, '/' separated
    std::string absolute_path;  ///< As seen by the side that owns the file
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified_at{};
    bool is_directory = false;

    /**
     * @brief Final path component
     */
    [[nodiscard]] auto name() const -> std::string {
        auto pos = path.find_last_of('/');
        return pos == std::string::npos ? path : path.substr(pos + 1);
    }
};

/**
 * @brief Error recorded against a single file or directory
 *
 * Recoverable errors are collected and reported in the job summary.
 * A non-recoverable one ends the job.
 */
struct collection_error {
    std::string file_path;
    error_code kind = error_code::internal_error;
    std::string message;
    bool recoverable = true;

    [[nodiscard]] static auto from(const error& err, std::string path, bool recoverable)
        -> collection_error {
        return {std::move(path), err.code, err.message, recoverable};
    }
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_CORE_SOURCE_TYPES_H
