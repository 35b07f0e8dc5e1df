/**
 * @file connection_session.cpp
 * @brief Implementation of the connection session
 */

#include <kcenon/log_collector/session/connection_session.h>
#include <kcenon/log_collector/config/validation.h>
#include <kcenon/log_collector/core/logging.h>

#include <atomic>
#include <condition_variable>
#include <thread>
#include <vector>

namespace kcenon::log_collector {

struct connection_session::impl {
    connection_profile profile;
    channel_factory factory;

    std::mutex channel_mutex;
    std::unique_ptr<remote_channel> channel;

    std::atomic<session_state> current_state{session_state::disconnected};
    std::mutex state_mutex;
    std::condition_variable state_cv;
    bool stopping = false;
    bool probe_requested = false;

    std::mutex recovery_mutex;
    std::atomic<std::size_t> reconnect_attempts{0};
    std::atomic<uint64_t> generation{0};

    std::mutex listener_mutex;
    std::vector<state_listener> listeners;

    std::thread heartbeat;

    impl(connection_profile p, channel_factory f)
        : profile(std::move(p)), factory(std::move(f)) {}

    void set_state(session_state new_state) {
        session_state old_state;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            old_state = current_state.exchange(new_state);
        }
        state_cv.notify_all();

        if (old_state == new_state) {
            return;
        }

        collection_log_context ctx;
        ctx.host = profile.host;
        if (new_state == session_state::degraded) {
            LC_LOG_WARN_CTX(log_category::session, "Keep-alive probe failed, session degraded",
                            ctx);
        } else if (new_state == session_state::reconnecting) {
            LC_LOG_INFO_CTX(log_category::session, "Attempting to reconnect", ctx);
        } else if (new_state == session_state::connected &&
                   old_state == session_state::reconnecting) {
            LC_LOG_INFO_CTX(log_category::session, "Reconnection successful", ctx);
        } else if (new_state == session_state::disconnected &&
                   old_state == session_state::reconnecting) {
            LC_LOG_ERROR_CTX(log_category::session, "Reconnection failed, session lost", ctx);
        } else {
            LC_LOG_DEBUG_CTX(log_category::session,
                             std::string("Session state ") + to_string(old_state) + " -> " +
                                 to_string(new_state),
                             ctx);
        }

        std::vector<state_listener> snapshot;
        {
            std::lock_guard<std::mutex> lock(listener_mutex);
            snapshot = listeners;
        }
        for (auto& listener : snapshot) {
            listener(new_state);
        }
    }

    /**
     * @brief Sleep for delay unless the session is being torn down
     * @return false when interrupted by disconnect
     */
    auto interruptible_sleep(std::chrono::milliseconds delay) -> bool {
        std::unique_lock<std::mutex> lock(state_mutex);
        return !state_cv.wait_for(lock, delay, [this] { return stopping; });
    }

    /**
     * @brief Probe the channel
     * @param wait_for_channel Block for the channel instead of skipping a busy one
     * @param probed_generation Receives the channel generation that was probed
     * @return false only when a probe ran and failed
     */
    auto probe(bool wait_for_channel, uint64_t& probed_generation) -> bool {
        std::unique_lock<std::mutex> lock(channel_mutex, std::defer_lock);
        if (wait_for_channel) {
            lock.lock();
        } else if (!lock.try_lock()) {
            // An operation is using the channel, which proves it is alive.
            return true;
        }

        probed_generation = generation.load();
        if (!channel) {
            return false;
        }
        auto alive = channel->probe();
        if (!alive) {
            LC_LOG_WARN(log_category::session, "Keep-alive probe failed: " + alive.error().message);
        }
        return alive.has_value();
    }

    /**
     * @brief Degraded -> reconnecting -> connected | disconnected
     * @param failed_generation Generation whose probe failed; a newer channel
     *        means another thread already recovered
     */
    void recover(uint64_t failed_generation) {
        std::lock_guard<std::mutex> recovery(recovery_mutex);
        if (current_state.load() == session_state::disconnected ||
            generation.load() != failed_generation) {
            return;
        }

        set_state(session_state::degraded);
        set_state(session_state::reconnecting);

        const auto& policy = profile.reconnect;
        for (std::size_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
            if (!interruptible_sleep(policy.delay_for_attempt(attempt))) {
                return;
            }
            ++reconnect_attempts;

            result<void> opened;
            {
                std::lock_guard<std::mutex> lock(channel_mutex);
                if (channel) {
                    channel->close();
                }
                auto fresh = factory();
                opened = fresh ? fresh->open(profile)
                               : result<void>{unexpected{error{error_code::internal_error,
                                                               "channel factory returned null"}}};
                if (opened) {
                    channel = std::move(fresh);
                    ++generation;
                }
            }
            // Listeners may use the channel, so they run without channel_mutex held
            if (opened) {
                set_state(session_state::connected);
                return;
            }
            LC_LOG_WARN(log_category::session,
                        "Reconnect attempt " + std::to_string(attempt) + "/" +
                            std::to_string(policy.max_attempts) +
                            " failed: " + opened.error().message);
        }

        {
            std::lock_guard<std::mutex> lock(channel_mutex);
            if (channel) {
                channel->close();
            }
        }
        set_state(session_state::disconnected);
    }

    void heartbeat_loop() {
        for (;;) {
            bool requested = false;
            {
                std::unique_lock<std::mutex> lock(state_mutex);
                state_cv.wait_for(lock, profile.keep_alive_interval,
                                  [this] { return stopping || probe_requested; });
                if (stopping) {
                    return;
                }
                requested = probe_requested;
                probe_requested = false;
            }

            if (current_state.load() != session_state::connected) {
                continue;
            }
            uint64_t probed = 0;
            if (!probe(requested, probed)) {
                recover(probed);
                if (current_state.load() == session_state::disconnected) {
                    return;
                }
            }
        }
    }

    void stop_heartbeat() {
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            stopping = true;
        }
        state_cv.notify_all();
        if (heartbeat.joinable() && heartbeat.get_id() != std::this_thread::get_id()) {
            heartbeat.join();
        }
    }
};

connection_session::connection_session(connection_profile profile, channel_factory factory)
    : impl_(std::make_unique<impl>(std::move(profile), std::move(factory))) {
    get_logger().initialize();
}

connection_session::connection_session(connection_session&&) noexcept = default;

auto connection_session::operator=(connection_session&& other) noexcept -> connection_session& {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

connection_session::~connection_session() {
    if (impl_) {
        disconnect();
    }
}

auto connection_session::connect(const connection_profile& profile, channel_factory factory)
    -> result<connection_session> {
    if (auto valid = validate_connection_profile(profile); !valid) {
        return unexpected{valid.error()};
    }
    if (!factory) {
        return unexpected{error{error_code::invalid_configuration, "channel factory is empty"}};
    }

    connection_session session(profile, std::move(factory));
    auto& state = *session.impl_;

    collection_log_context ctx;
    ctx.host = profile.host;
    LC_LOG_INFO_CTX(log_category::session, "Connecting to " + profile.endpoint(), ctx);

    state.set_state(session_state::connecting);
    auto channel = state.factory();
    if (!channel) {
        state.set_state(session_state::disconnected);
        return unexpected{error{error_code::internal_error, "channel factory returned null"}};
    }

    auto opened = channel->open(profile);
    if (!opened) {
        state.set_state(session_state::disconnected);
        ctx.error_message = opened.error().message;
        LC_LOG_ERROR_CTX(log_category::session, "Connection failed", ctx);
        return unexpected{opened.error()};
    }

    {
        std::lock_guard<std::mutex> lock(state.channel_mutex);
        state.channel = std::move(channel);
    }
    state.set_state(session_state::connected);

    if (profile.keep_alive_enabled) {
        impl* raw = session.impl_.get();
        state.heartbeat = std::thread([raw] { raw->heartbeat_loop(); });
    }

    LC_LOG_INFO_CTX(log_category::session, "Connected", ctx);
    return result<connection_session>(std::move(session));
}

auto connection_session::acquire() -> result<channel_lease> {
    {
        std::unique_lock<std::mutex> lock(impl_->state_mutex);
        impl_->state_cv.wait_for(lock, impl_->profile.request_timeout, [this] {
            auto s = impl_->current_state.load();
            return impl_->stopping || s == session_state::connected ||
                   s == session_state::disconnected;
        });
    }

    auto current = impl_->current_state.load();
    if (current != session_state::connected) {
        return unexpected{error{error_code::channel_unavailable,
                                std::string("session is ") + to_string(current)}};
    }

    std::unique_lock<std::mutex> lock(impl_->channel_mutex);
    if (!impl_->channel || impl_->current_state.load() != session_state::connected) {
        return unexpected{error{error_code::channel_unavailable, "session channel is closed"}};
    }
    return channel_lease(std::move(lock), *impl_->channel);
}

void connection_session::report_channel_failure(const error& err) {
    LC_LOG_WARN(log_category::session, "Channel operation failed: " + err.message);
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        impl_->probe_requested = true;
    }
    impl_->state_cv.notify_all();
}

void connection_session::disconnect() {
    impl_->stop_heartbeat();

    {
        std::lock_guard<std::mutex> lock(impl_->channel_mutex);
        if (impl_->channel) {
            impl_->channel->close();
            impl_->channel.reset();
        }
    }

    if (impl_->current_state.load() != session_state::disconnected) {
        impl_->set_state(session_state::disconnected);
        LC_LOG_INFO(log_category::session, "Disconnected from " + impl_->profile.host);
    }
}

auto connection_session::state() const -> session_state {
    return impl_->current_state.load();
}

auto connection_session::is_connected() const -> bool {
    return impl_->current_state.load() == session_state::connected;
}

auto connection_session::profile() const -> const connection_profile& {
    return impl_->profile;
}

auto connection_session::check_alive() -> result<void> {
    {
        std::unique_lock<std::mutex> lock(impl_->state_mutex);
        impl_->state_cv.wait_for(lock, impl_->profile.request_timeout, [this] {
            auto s = impl_->current_state.load();
            return impl_->stopping || s == session_state::connected ||
                   s == session_state::disconnected;
        });
    }
    if (impl_->current_state.load() == session_state::disconnected) {
        return unexpected{error{error_code::channel_unavailable, "session is disconnected"}};
    }

    uint64_t probed = 0;
    if (!impl_->probe(true, probed)) {
        impl_->recover(probed);
    }

    if (impl_->current_state.load() != session_state::connected) {
        return unexpected{error{error_code::channel_unavailable,
                                "session could not be re-established"}};
    }
    return {};
}

void connection_session::on_state_changed(state_listener listener) {
    std::lock_guard<std::mutex> lock(impl_->listener_mutex);
    impl_->listeners.push_back(std::move(listener));
}

auto connection_session::reconnect_attempts() const -> std::size_t {
    return impl_->reconnect_attempts.load();
}

}  // namespace kcenon::log_collector
