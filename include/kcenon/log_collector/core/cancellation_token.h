/**
 * @file cancellation_token.h
 * @brief Cooperative cancellation flag shared between a job and its callers
 */

#ifndef KCENON_LOG_COLLECTOR_CORE_CANCELLATION_TOKEN_H
#define KCENON_LOG_COLLECTOR_CORE_CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>

namespace kcenon::log_collector {

/**
 * @brief Shared, copyable cancellation flag
 *
 * Copies observe the same flag. Cancellation is sticky: once requested it
 * cannot be withdrawn. Long-running loops poll is_cancelled() at safe
 * points; nothing is interrupted preemptively.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Request cancellation
     * @return true if this call flipped the flag, false if already cancelled
     */
    auto cancel() noexcept -> bool {
        bool expected = false;
        return state_->compare_exchange_strong(expected, true);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->load(std::memory_order_acquire);
    }

    /**
     * @brief Token that is never cancelled, for callers with no cancel path
     */
    [[nodiscard]] static auto none() -> cancellation_token { return cancellation_token{}; }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_CORE_CANCELLATION_TOKEN_H
