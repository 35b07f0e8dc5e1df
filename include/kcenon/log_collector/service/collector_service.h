/**
 * @file collector_service.h
 * @brief Command/event boundary between the collection core and a front end
 */

#ifndef KCENON_LOG_COLLECTOR_SERVICE_COLLECTOR_SERVICE_H
#define KCENON_LOG_COLLECTOR_SERVICE_COLLECTOR_SERVICE_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/orchestrator/collection_orchestrator.h"
#include "kcenon/log_collector/orchestrator/event_channel.h"
#include "kcenon/log_collector/session/connection_session.h"

namespace kcenon::log_collector {

/**
 * @brief Owns the single connection session and the orchestrator
 *
 * Front ends issue commands through this class from any thread and read
 * results from events(); they never touch the session or job state
 * directly.
 *
 * @code
 * auto service = collector_service::builder().build();
 * service.value().connect(profile);
 * auto id = service.value().start_collection(request);
 * while (auto event = service.value().events()->wait_pop(std::chrono::seconds(1))) {
 *     // render
 * }
 * @endcode
 */
class collector_service {
public:
    class builder;

    // Non-copyable, movable
    collector_service(const collector_service&) = delete;
    auto operator=(const collector_service&) -> collector_service& = delete;
    collector_service(collector_service&&) noexcept;
    auto operator=(collector_service&&) noexcept -> collector_service&;
    ~collector_service();

    /**
     * @brief Open a session, replacing a previous one
     * @return job_already_running while a job is active, or the connect error
     */
    [[nodiscard]] auto connect(const connection_profile& profile) -> result<void>;

    /**
     * @brief Cancel any running job, wait for it and close the session
     *
     * Blocks until the job is terminal; the session outlives every job
     * that uses it.
     */
    void disconnect();

    [[nodiscard]] auto connection_state() const -> session_state;

    [[nodiscard]] auto start_collection(const collection_request& request) -> result<job_id>;

    [[nodiscard]] auto cancel(const job_id& id) -> result<void>;

    [[nodiscard]] auto snapshot(const job_id& id) const -> result<collection_job>;

    [[nodiscard]] auto wait(const job_id& id, std::chrono::milliseconds timeout)
        -> result<collection_job>;

    [[nodiscard]] auto acknowledge(const job_id& id) -> result<void>;

    [[nodiscard]] auto list_remote_files(const source_spec& source, const filter_chain& filters)
        -> result<discovery_listing>;

    [[nodiscard]] auto delete_files(const source_spec& source,
                                    const std::vector<std::string>& paths)
        -> result<std::vector<collection_error>>;

    [[nodiscard]] auto events() const -> std::shared_ptr<event_channel>;

private:
    collector_service(collection_orchestrator orchestrator, channel_factory factory,
                      std::shared_ptr<event_channel> events,
                      std::chrono::milliseconds shutdown_timeout);

    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Builder for collector_service
 */
class collector_service::builder {
public:
    builder();

    /**
     * @brief Replace the SSH channel, e.g. with an in-process fake
     */
    auto with_channel_factory(channel_factory factory) -> builder&;

    auto with_orchestrator_config(orchestrator_config config) -> builder&;

    /**
     * @brief How long disconnect() waits for a cancelled job before closing
     *        the channel under it (default 5 minutes)
     */
    auto with_shutdown_timeout(std::chrono::milliseconds timeout) -> builder&;

    [[nodiscard]] auto build() -> result<collector_service>;

private:
    channel_factory factory_;
    orchestrator_config config_;
    std::chrono::milliseconds shutdown_timeout_{std::chrono::minutes(5)};
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_SERVICE_COLLECTOR_SERVICE_H
