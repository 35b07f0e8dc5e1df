/**
 * @file event_channel.cpp
 * @brief Implementation of the bounded event stream
 */

#include <kcenon/log_collector/orchestrator/event_channel.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace kcenon::log_collector {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

auto is_progress(const collector_event& event) -> bool {
    return std::holds_alternative<job_progress>(event);
}

}  // namespace

auto event_name(const collector_event& event) -> const char* {
    return std::visit(overloaded{
                          [](const connection_state_changed&) { return "connection_state_changed"; },
                          [](const job_progress&) { return "job_progress"; },
                          [](const job_completed&) { return "job_completed"; },
                          [](const job_failed&) { return "job_failed"; },
                          [](const job_cancelled&) { return "job_cancelled"; },
                          [](const disk_space_warning&) { return "disk_space_warning"; },
                      },
                      event);
}

struct event_channel::impl {
    std::size_t capacity;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<collector_event> queue;
    uint64_t dropped = 0;
    bool closed = false;

    explicit impl(std::size_t cap) : capacity(std::max<std::size_t>(cap, 1)) {}
};

event_channel::event_channel(std::size_t capacity)
    : impl_(std::make_unique<impl>(capacity)) {}

event_channel::~event_channel() {
    close();
}

auto event_channel::publish(collector_event event) -> bool {
    bool intact = true;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->closed) {
            ++impl_->dropped;
            return false;
        }

        if (impl_->queue.size() >= impl_->capacity) {
            intact = false;
            ++impl_->dropped;
            auto oldest_progress =
                std::find_if(impl_->queue.begin(), impl_->queue.end(), is_progress);
            if (oldest_progress != impl_->queue.end()) {
                impl_->queue.erase(oldest_progress);
            } else if (is_progress(event)) {
                return false;
            } else {
                impl_->queue.pop_front();
            }
        }
        impl_->queue.push_back(std::move(event));
    }
    impl_->cv.notify_one();
    return intact;
}

auto event_channel::try_pop() -> std::optional<collector_event> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->queue.empty()) {
        return std::nullopt;
    }
    auto event = std::move(impl_->queue.front());
    impl_->queue.pop_front();
    return event;
}

auto event_channel::wait_pop(std::chrono::milliseconds timeout)
    -> std::optional<collector_event> {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->cv.wait_for(lock, timeout,
                       [this] { return impl_->closed || !impl_->queue.empty(); });
    if (impl_->queue.empty()) {
        return std::nullopt;
    }
    auto event = std::move(impl_->queue.front());
    impl_->queue.pop_front();
    return event;
}

auto event_channel::drain() -> std::vector<collector_event> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<collector_event> events;
    events.reserve(impl_->queue.size());
    for (auto& event : impl_->queue) {
        events.push_back(std::move(event));
    }
    impl_->queue.clear();
    return events;
}

void event_channel::close() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->closed = true;
    }
    impl_->cv.notify_all();
}

auto event_channel::is_closed() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->closed;
}

auto event_channel::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->queue.size();
}

auto event_channel::capacity() const -> std::size_t {
    return impl_->capacity;
}

auto event_channel::dropped_count() const -> uint64_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->dropped;
}

}  // namespace kcenon::log_collector
