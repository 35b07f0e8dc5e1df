/**
 * @file event_channel.h
 * @brief Bounded event stream from the collection core to its front end
 */

#ifndef KCENON_LOG_COLLECTOR_ORCHESTRATOR_EVENT_CHANNEL_H
#define KCENON_LOG_COLLECTOR_ORCHESTRATOR_EVENT_CHANNEL_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/orchestrator/collection_types.h"
#include "kcenon/log_collector/session/session_types.h"

namespace kcenon::log_collector {

struct connection_state_changed {
    session_state state = session_state::disconnected;
    std::string host;
};

struct job_progress {
    job_id id;
    uint64_t transferred_bytes = 0;
    uint64_t total_bytes = 0;
    std::string current_file;
    std::optional<job_phase> phase;
};

/**
 * @brief Job reached completed; errors holds the recoverable failures
 */
struct job_completed {
    collection_job summary;
};

struct job_failed {
    job_id id;
    error reason;
    collection_job summary;
};

struct job_cancelled {
    collection_job summary;
};

struct disk_space_warning {
    std::optional<job_id> id;
    std::string location;
    uint64_t available_bytes = 0;
    uint64_t required_bytes = 0;
};

using collector_event = std::variant<connection_state_changed, job_progress, job_completed,
                                     job_failed, job_cancelled, disk_space_warning>;

/**
 * @brief Name of the event alternative, for logs and tests
 */
[[nodiscard]] auto event_name(const collector_event& event) -> const char*;

/**
 * @brief Multi-producer, multi-consumer event queue with bounded memory
 *
 * publish() never blocks. When the queue is full the oldest progress
 * event is dropped to make room; progress is cumulative, so a later
 * progress event supersedes it. Lifecycle events are only dropped when
 * the queue holds nothing but lifecycle events.
 */
class event_channel {
public:
    explicit event_channel(std::size_t capacity = 1024);
    ~event_channel();

    event_channel(const event_channel&) = delete;
    auto operator=(const event_channel&) -> event_channel& = delete;

    /**
     * @brief Enqueue an event
     * @return false if an event had to be discarded (this one or an older one)
     */
    auto publish(collector_event event) -> bool;

    [[nodiscard]] auto try_pop() -> std::optional<collector_event>;

    /**
     * @brief Wait up to timeout for an event
     * @return std::nullopt on timeout or once closed and empty
     */
    [[nodiscard]] auto wait_pop(std::chrono::milliseconds timeout)
        -> std::optional<collector_event>;

    /**
     * @brief Remove and return everything queued
     */
    [[nodiscard]] auto drain() -> std::vector<collector_event>;

    /**
     * @brief Wake waiting consumers and reject further events
     */
    void close();

    [[nodiscard]] auto is_closed() const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto capacity() const -> std::size_t;

    [[nodiscard]] auto dropped_count() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_ORCHESTRATOR_EVENT_CHANNEL_H
