/**
 * @file collection_types.h
 * @brief Collection job model shared between the orchestrator and its clients
 */

#ifndef KCENON_LOG_COLLECTOR_ORCHESTRATOR_COLLECTION_TYPES_H
#define KCENON_LOG_COLLECTOR_ORCHESTRATOR_COLLECTION_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/log_collector/core/filter_engine.h"
#include "kcenon/log_collector/core/source_types.h"
#include "kcenon/log_collector/core/types.h"

namespace kcenon::log_collector {

/**
 * @brief Lifecycle of a collection job
 */
enum class job_status {
    pending,     ///< Created, worker not started
    running,     ///< Worker active
    cancelling,  ///< Cancel requested, worker finishing the current file
    cancelled,   ///< Stopped by request; partial results stay on disk
    completed,   ///< Finished, possibly with recoverable errors
    failed       ///< Stopped by a terminal error
};

[[nodiscard]] constexpr auto to_string(job_status status) -> const char* {
    switch (status) {
        case job_status::pending: return "pending";
        case job_status::running: return "running";
        case job_status::cancelling: return "cancelling";
        case job_status::cancelled: return "cancelled";
        case job_status::completed: return "completed";
        case job_status::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(job_status status) -> bool {
    return status == job_status::cancelled || status == job_status::completed ||
           status == job_status::failed;
}

/**
 * @brief Sub-phase of a running job
 */
enum class job_phase {
    discovering,
    space_checking,
    compressing,
    downloading,
    transferring_files,
    deleting,
    finalizing
};

[[nodiscard]] constexpr auto to_string(job_phase phase) -> const char* {
    switch (phase) {
        case job_phase::discovering: return "discovering";
        case job_phase::space_checking: return "space_checking";
        case job_phase::compressing: return "compressing";
        case job_phase::downloading: return "downloading";
        case job_phase::transferring_files: return "transferring_files";
        case job_phase::deleting: return "deleting";
        case job_phase::finalizing: return "finalizing";
        default: return "unknown";
    }
}

/**
 * @brief Parameters of startCollection
 */
struct collection_request {
    std::vector<source_spec> sources;
    filter_chain filters;
    bool compress = false;
    bool delete_after_collect = false;
    std::filesystem::path destination_root;
};

/**
 * @brief State of one collection job
 *
 * Written only by the orchestrator worker; clients receive copies.
 */
struct collection_job {
    job_id id;
    std::vector<source_spec> sources;
    filter_chain filters;
    bool compress = false;
    bool delete_after_collect = false;
    std::filesystem::path destination_root;

    job_status status = job_status::pending;
    std::optional<job_phase> phase;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};

    uint64_t transferred_bytes = 0;
    uint64_t total_bytes = 0;
    std::size_t files_discovered = 0;
    std::size_t files_collected = 0;
    std::string current_file;

    std::filesystem::path destination;  ///< Timestamped folder created for this job
    std::vector<std::filesystem::path> produced_artifacts;
    std::size_t deleted_sources = 0;

    std::vector<collection_error> errors;
    std::optional<error> terminal_error;

    [[nodiscard]] auto is_terminal() const -> bool { return log_collector::is_terminal(status); }

    [[nodiscard]] auto progress_percent() const -> double {
        if (total_bytes == 0) return is_terminal() ? 100.0 : 0.0;
        return static_cast<double>(transferred_bytes) / static_cast<double>(total_bytes) * 100.0;
    }

    [[nodiscard]] auto duration() const -> std::chrono::milliseconds {
        auto end = is_terminal() ? finished_at : std::chrono::system_clock::now();
        if (started_at == std::chrono::system_clock::time_point{}) {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(end - started_at);
    }
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_ORCHESTRATOR_COLLECTION_TYPES_H
