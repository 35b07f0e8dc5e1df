/**
 * @file session_types.h
 * @brief Connection profile and session state definitions
 */

#ifndef KCENON_LOG_COLLECTOR_SESSION_SESSION_TYPES_H
#define KCENON_LOG_COLLECTOR_SESSION_SESSION_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::log_collector {

/**
 * @brief Connection session state
 *
 * disconnected -> connecting -> connected -> (degraded -> reconnecting ->
 * connected) -> disconnected
 */
enum class session_state {
    disconnected,
    connecting,
    connected,
    degraded,
    reconnecting
};

/**
 * @brief Convert session_state to string
 */
[[nodiscard]] constexpr auto to_string(session_state state) -> const char* {
    switch (state) {
        case session_state::disconnected: return "disconnected";
        case session_state::connecting: return "connecting";
        case session_state::connected: return "connected";
        case session_state::degraded: return "degraded";
        case session_state::reconnecting: return "reconnecting";
        default: return "unknown";
    }
}

/**
 * @brief Reconnection policy configuration
 */
struct reconnect_policy {
    std::size_t max_attempts = 5;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay before the given attempt (1-based)
     */
    [[nodiscard]] auto delay_for_attempt(std::size_t attempt) const -> std::chrono::milliseconds {
        double delay = static_cast<double>(initial_delay.count());
        for (std::size_t i = 1; i < attempt; ++i) {
            delay *= backoff_multiplier;
            if (delay >= static_cast<double>(max_delay.count())) {
                return max_delay;
            }
        }
        return std::chrono::milliseconds(static_cast<int64_t>(delay));
    }
};

/**
 * @brief Authentication material for one profile
 */
struct auth_credential {
    std::string password;
    std::optional<std::filesystem::path> private_key_path;
    std::string key_passphrase;

    [[nodiscard]] static auto with_password(std::string secret) -> auth_credential {
        auth_credential cred;
        cred.password = std::move(secret);
        return cred;
    }

    [[nodiscard]] static auto with_private_key(std::filesystem::path key,
                                               std::string passphrase = {})
        -> auth_credential {
        auth_credential cred;
        cred.private_key_path = std::move(key);
        cred.key_passphrase = std::move(passphrase);
        return cred;
    }

    [[nodiscard]] auto uses_key() const -> bool { return private_key_path.has_value(); }
};

/**
 * @brief Everything needed to open and keep one remote session
 *
 * Immutable once a session has been established from it.
 */
struct connection_profile {
    std::string host;
    uint16_t port = 22;
    std::string username = "root";
    auth_credential credential;

    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds request_timeout{300};

    bool keep_alive_enabled = true;
    std::chrono::milliseconds keep_alive_interval{30000};
    reconnect_policy reconnect;

    /// Reject hosts missing from known_hosts instead of accepting them
    bool strict_host_key_checking = false;

    [[nodiscard]] auto endpoint() const -> std::string {
        return username + "@" + host + ":" + std::to_string(port);
    }
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_SESSION_SESSION_TYPES_H
