/**
 * @file collection_orchestrator.h
 * @brief Runs collection jobs: discovery, compression or per-file transfer, deletion
 */

#ifndef KCENON_LOG_COLLECTOR_ORCHESTRATOR_COLLECTION_ORCHESTRATOR_H
#define KCENON_LOG_COLLECTOR_ORCHESTRATOR_COLLECTION_ORCHESTRATOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/discovery/discovery_engine.h"
#include "kcenon/log_collector/orchestrator/collection_types.h"
#include "kcenon/log_collector/orchestrator/event_channel.h"
#include "kcenon/log_collector/session/connection_session.h"

namespace kcenon::log_collector {

/**
 * @brief Tunables of the collection pipeline
 */
struct orchestrator_config {
    std::string remote_temp_dir = "/tmp";
    /// {archive}, {root} and {files} are replaced by quoted values
    std::string remote_compress_command = "tar -czf {archive} -C {root} -T -";
    std::chrono::seconds compression_timeout{600};
    uint64_t space_check_interval_bytes = 64ULL * 1024 * 1024;
    double space_warning_margin = 0.10;
    bool verify_before_delete = true;
    std::size_t event_queue_capacity = 1024;
    std::size_t transfer_retry_limit = 1;
    std::size_t buffer_size = 32768;
    int compression_level = 6;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Drives one collection job at a time on a dedicated worker thread
 *
 * Per source the worker picks a strategy: remote sources with compress set
 * are archived on the host and downloaded as one file; everything else is
 * copied file by file below a timestamped folder (and archived locally when
 * compress is set). A failed remote compression falls back to per-file
 * transfer for that source.
 *
 * Per-file problems are recorded in collection_job::errors and the job goes
 * on; a lost session or a full destination fails the job.
 *
 * @code
 * auto orchestrator = collection_orchestrator::builder()
 *     .with_session(&session)
 *     .build();
 * auto id = orchestrator.value().start_collection(request);
 * auto job = orchestrator.value().wait(id.value(), std::chrono::minutes(10));
 * @endcode
 */
class collection_orchestrator {
public:
    class builder;

    // Non-copyable, movable
    collection_orchestrator(const collection_orchestrator&) = delete;
    auto operator=(const collection_orchestrator&) -> collection_orchestrator& = delete;
    collection_orchestrator(collection_orchestrator&&) noexcept;
    auto operator=(collection_orchestrator&&) noexcept -> collection_orchestrator&;

    /**
     * @brief Cancels a running job and waits for its worker
     */
    ~collection_orchestrator();

    /**
     * @brief Start a job
     * @return The new job id, job_already_running while another job is not
     *         terminal, or invalid_configuration for a malformed request
     */
    [[nodiscard]] auto start_collection(const collection_request& request) -> result<job_id>;

    /**
     * @brief Request cooperative cancellation
     *
     * The current file finishes before the worker stops. Cancelling a
     * terminal job is a no-op.
     */
    [[nodiscard]] auto cancel(const job_id& id) -> result<void>;

    [[nodiscard]] auto snapshot(const job_id& id) const -> result<collection_job>;

    /**
     * @brief Block until the job is terminal
     * @return The final job, or job_not_terminal on timeout
     */
    [[nodiscard]] auto wait(const job_id& id, std::chrono::milliseconds timeout)
        -> result<collection_job>;

    /**
     * @brief Release a terminal job
     * @return job_not_terminal while the job still runs
     */
    [[nodiscard]] auto acknowledge(const job_id& id) -> result<void>;

    /**
     * @brief Id of the job that is not yet terminal, if any
     */
    [[nodiscard]] auto active_job() const -> std::optional<job_id>;

    /**
     * @brief Enumerate a source without transferring anything
     */
    [[nodiscard]] auto list_remote_files(const source_spec& source, const filter_chain& filters)
        -> result<discovery_listing>;

    /**
     * @brief Delete files of a source by relative path
     * @return Per-path failures; paths leaving the root are rejected
     */
    [[nodiscard]] auto delete_files(const source_spec& source,
                                    const std::vector<std::string>& paths)
        -> result<std::vector<collection_error>>;

    /**
     * @brief Use another session for subsequent jobs
     * @return job_already_running while a job is active
     */
    [[nodiscard]] auto attach_session(connection_session* session) -> result<void>;

    [[nodiscard]] auto events() const -> std::shared_ptr<event_channel>;

    [[nodiscard]] auto config() const -> const orchestrator_config&;

private:
    collection_orchestrator(orchestrator_config config, connection_session* session,
                            std::shared_ptr<event_channel> events);

    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Builder for collection_orchestrator
 */
class collection_orchestrator::builder {
public:
    builder();

    /**
     * @brief Session borrowed for remote sources; may be omitted for local-only use
     */
    auto with_session(connection_session* session) -> builder&;

    auto with_config(orchestrator_config config) -> builder&;

    /**
     * @brief Share an existing event channel instead of creating one
     */
    auto with_event_channel(std::shared_ptr<event_channel> events) -> builder&;

    auto with_remote_temp_dir(std::string dir) -> builder&;

    auto with_remote_compress_command(std::string command_template) -> builder&;

    auto with_compression_level(int level) -> builder&;

    [[nodiscard]] auto build() -> result<collection_orchestrator>;

private:
    orchestrator_config config_;
    connection_session* session_ = nullptr;
    std::shared_ptr<event_channel> events_;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_ORCHESTRATOR_COLLECTION_ORCHESTRATOR_H
