/**
 * @file connection_session.h
 * @brief One live remote session with keep-alive and bounded reconnection
 */

#ifndef KCENON_LOG_COLLECTOR_SESSION_CONNECTION_SESSION_H
#define KCENON_LOG_COLLECTOR_SESSION_CONNECTION_SESSION_H

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/session/libssh_channel.h"
#include "kcenon/log_collector/session/remote_channel.h"
#include "kcenon/log_collector/session/session_types.h"

namespace kcenon::log_collector {

/**
 * @brief Owns one authenticated remote channel and keeps it alive
 *
 * A heartbeat thread probes the channel every keep_alive_interval. A failed
 * probe moves the session to degraded and starts up to
 * reconnect.max_attempts reconnects with exponential backoff; when all of
 * them fail the session is disconnected for good.
 *
 * The channel is used by one caller at a time. with_channel() waits while
 * the session is degraded or reconnecting (up to request_timeout) and
 * fails fast with channel_unavailable once it is disconnected.
 *
 * @code
 * auto session = connection_session::connect(profile);
 * if (session) {
 *     auto listing = session.value().with_channel([](remote_channel& ch) {
 *         return ch.list_directory("/var/log");
 *     });
 * }
 * @endcode
 */
class connection_session {
public:
    using state_listener = std::function<void(session_state)>;

    /**
     * @brief Exclusive access to the channel, released on destruction
     */
    class channel_lease {
    public:
        channel_lease(std::unique_lock<std::mutex> lock, remote_channel& channel)
            : lock_(std::move(lock)), channel_(&channel) {}

        [[nodiscard]] auto channel() -> remote_channel& { return *channel_; }

    private:
        std::unique_lock<std::mutex> lock_;
        remote_channel* channel_;
    };

    /**
     * @brief Open a session
     * @param profile Connection profile, validated before use
     * @param factory Produces the channel; called again for every reconnect
     * @return The connected session, or auth_failed / connection_timeout /
     *         network_error / host_key_mismatch / invalid_configuration
     */
    [[nodiscard]] static auto connect(const connection_profile& profile,
                                      channel_factory factory = libssh_channel::factory())
        -> result<connection_session>;

    // Non-copyable, movable
    connection_session(const connection_session&) = delete;
    auto operator=(const connection_session&) -> connection_session& = delete;
    connection_session(connection_session&&) noexcept;
    auto operator=(connection_session&&) noexcept -> connection_session&;
    ~connection_session();

    /**
     * @brief Run fn with exclusive use of the channel
     *
     * fn receives a remote_channel& and returns result<T>. A connection
     * level failure reported by fn wakes the heartbeat so recovery starts
     * without waiting for the next interval.
     */
    template <typename Fn>
    auto with_channel(Fn&& fn) -> std::invoke_result_t<Fn, remote_channel&> {
        auto lease = acquire();
        if (!lease) {
            return unexpected{lease.error()};
        }
        auto outcome = std::forward<Fn>(fn)(lease.value().channel());
        if (!outcome && is_connection_error(outcome.error().code)) {
            report_channel_failure(outcome.error());
        }
        return outcome;
    }

    /**
     * @brief Close the channel and stop the heartbeat; idempotent
     */
    void disconnect();

    [[nodiscard]] auto state() const -> session_state;

    [[nodiscard]] auto is_connected() const -> bool;

    [[nodiscard]] auto profile() const -> const connection_profile&;

    /**
     * @brief Probe now and, on failure, run the reconnect sequence inline
     * @return Success if the session is connected afterwards
     */
    [[nodiscard]] auto check_alive() -> result<void>;

    /**
     * @brief Register a state change listener
     *
     * Listeners run on the thread that changed the state (heartbeat or
     * caller) and must not block.
     */
    void on_state_changed(state_listener listener);

    /**
     * @brief Total reconnect attempts made over the session lifetime
     */
    [[nodiscard]] auto reconnect_attempts() const -> std::size_t;

private:
    explicit connection_session(connection_profile profile, channel_factory factory);

    [[nodiscard]] auto acquire() -> result<channel_lease>;
    void report_channel_failure(const error& err);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_SESSION_CONNECTION_SESSION_H
