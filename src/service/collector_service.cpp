/**
 * @file collector_service.cpp
 * @brief Implementation of the collector service facade
 */

#include <kcenon/log_collector/service/collector_service.h>
#include <kcenon/log_collector/core/logging.h>
#include <kcenon/log_collector/session/libssh_channel.h>

#include <mutex>

namespace kcenon::log_collector {

struct collector_service::impl {
    collection_orchestrator orchestrator;
    channel_factory factory;
    std::shared_ptr<event_channel> events;
    std::chrono::milliseconds shutdown_timeout;

    mutable std::mutex session_mutex;
    std::unique_ptr<connection_session> session;

    impl(collection_orchestrator o, channel_factory f, std::shared_ptr<event_channel> e,
         std::chrono::milliseconds timeout)
        : orchestrator(std::move(o)),
          factory(std::move(f)),
          events(std::move(e)),
          shutdown_timeout(timeout) {}

    /**
     * @brief Stop the active job and close the session; session_mutex held
     *
     * The session is destroyed only once no job references it. A job that
     * ignores cancellation past shutdown_timeout has its channel closed under
     * it so that its next channel operation fails fast.
     */
    void close_session() {
        if (auto active = orchestrator.active_job()) {
            LC_LOG_INFO(log_category::service, "Cancelling running job before disconnect");
            if (orchestrator.cancel(*active)) {
                wait_for_job(*active);
            }
        }
        if (auto detached = orchestrator.attach_session(nullptr); !detached) {
            LC_LOG_ERROR(log_category::service,
                         "Session still in use, keeping it open: " + detached.error().message);
            return;
        }
        if (session) {
            session->disconnect();
            session.reset();
        }
    }

    void wait_for_job(const job_id& id) {
        auto finished = orchestrator.wait(id, shutdown_timeout);
        if (finished || finished.error().code != error_code::job_not_terminal) {
            return;
        }

        LC_LOG_WARN(log_category::service,
                    "Job " + std::to_string(id.value) +
                        " did not stop in time, closing its channel");
        if (session) {
            session->disconnect();
        }
        for (;;) {
            finished = orchestrator.wait(id, shutdown_timeout);
            if (finished || finished.error().code != error_code::job_not_terminal) {
                return;
            }
            LC_LOG_WARN(log_category::service, "Still waiting for job " +
                                                   std::to_string(id.value) + " to stop");
        }
    }
};

collector_service::collector_service(collection_orchestrator orchestrator,
                                     channel_factory factory,
                                     std::shared_ptr<event_channel> events,
                                     std::chrono::milliseconds shutdown_timeout)
    : impl_(std::make_unique<impl>(std::move(orchestrator), std::move(factory),
                                   std::move(events), shutdown_timeout)) {
    get_logger().initialize();
}

collector_service::collector_service(collector_service&&) noexcept = default;

auto collector_service::operator=(collector_service&& other) noexcept -> collector_service& {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

collector_service::~collector_service() {
    if (impl_) {
        disconnect();
    }
}

auto collector_service::connect(const connection_profile& profile) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    if (auto active = impl_->orchestrator.active_job()) {
        return unexpected{error{error_code::job_already_running,
                                "cannot reconnect while job " + std::to_string(active->value) +
                                    " is running"}};
    }
    if (impl_->session) {
        LC_LOG_INFO(log_category::service, "Replacing existing session");
        impl_->close_session();
    }

    auto connected = connection_session::connect(profile, impl_->factory);
    if (!connected) {
        impl_->events->publish(connection_state_changed{session_state::disconnected, profile.host});
        return unexpected{connected.error()};
    }

    impl_->session = std::make_unique<connection_session>(std::move(connected.value()));
    auto events = impl_->events;
    auto host = profile.host;
    impl_->session->on_state_changed([events, host](session_state state) {
        events->publish(connection_state_changed{state, host});
    });
    events->publish(connection_state_changed{impl_->session->state(), host});

    if (auto attached = impl_->orchestrator.attach_session(impl_->session.get()); !attached) {
        impl_->session->disconnect();
        impl_->session.reset();
        return attached;
    }
    return {};
}

void collector_service::disconnect() {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    impl_->close_session();
}

auto collector_service::connection_state() const -> session_state {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    return impl_->session ? impl_->session->state() : session_state::disconnected;
}

auto collector_service::start_collection(const collection_request& request) -> result<job_id> {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    return impl_->orchestrator.start_collection(request);
}

auto collector_service::cancel(const job_id& id) -> result<void> {
    return impl_->orchestrator.cancel(id);
}

auto collector_service::snapshot(const job_id& id) const -> result<collection_job> {
    return impl_->orchestrator.snapshot(id);
}

auto collector_service::wait(const job_id& id, std::chrono::milliseconds timeout)
    -> result<collection_job> {
    return impl_->orchestrator.wait(id, timeout);
}

auto collector_service::acknowledge(const job_id& id) -> result<void> {
    return impl_->orchestrator.acknowledge(id);
}

auto collector_service::list_remote_files(const source_spec& source, const filter_chain& filters)
    -> result<discovery_listing> {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    return impl_->orchestrator.list_remote_files(source, filters);
}

auto collector_service::delete_files(const source_spec& source,
                                     const std::vector<std::string>& paths)
    -> result<std::vector<collection_error>> {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    return impl_->orchestrator.delete_files(source, paths);
}

auto collector_service::events() const -> std::shared_ptr<event_channel> {
    return impl_->events;
}

collector_service::builder::builder() : factory_(libssh_channel::factory()) {}

auto collector_service::builder::with_channel_factory(channel_factory factory) -> builder& {
    factory_ = std::move(factory);
    return *this;
}

auto collector_service::builder::with_orchestrator_config(orchestrator_config config)
    -> builder& {
    config_ = std::move(config);
    return *this;
}

auto collector_service::builder::with_shutdown_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    shutdown_timeout_ = timeout;
    return *this;
}

auto collector_service::builder::build() -> result<collector_service> {
    if (!factory_) {
        return unexpected{error{error_code::invalid_configuration, "channel factory is empty"}};
    }
    if (shutdown_timeout_.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "shutdown timeout must be positive"}};
    }

    auto events = std::make_shared<event_channel>(config_.event_queue_capacity);
    auto orchestrator =
        collection_orchestrator::builder().with_config(config_).with_event_channel(events).build();
    if (!orchestrator) {
        return unexpected{orchestrator.error()};
    }
    return result<collector_service>(
        collector_service(std::move(orchestrator.value()), factory_, std::move(events),
                          shutdown_timeout_));
}

}  // namespace kcenon::log_collector
