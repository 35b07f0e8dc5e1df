/**
 * @file validation.h
 * @brief Validation of operator-supplied connection and source settings
 */

#ifndef KCENON_LOG_COLLECTOR_CONFIG_VALIDATION_H
#define KCENON_LOG_COLLECTOR_CONFIG_VALIDATION_H

#include <cstdint>
#include <filesystem>
#include <string>

#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/session/session_types.h"

namespace kcenon::log_collector {

/**
 * @brief Dotted IPv4 address with octets in 0-255
 */
[[nodiscard]] auto validate_ip_address(const std::string& ip) -> result<void>;

/**
 * @brief Port in 1-65535
 */
[[nodiscard]] auto validate_port(int64_t port) -> result<void>;

/**
 * @brief Port given as text, as typed by an operator
 */
[[nodiscard]] auto validate_port(const std::string& port) -> result<void>;

/**
 * @brief Letters, digits, '-' and '_', at most 32 characters
 */
[[nodiscard]] auto validate_username(const std::string& username) -> result<void>;

/**
 * @brief Timeout between 10 and 3600 seconds
 */
[[nodiscard]] auto validate_timeout(std::chrono::seconds timeout) -> result<void>;

/**
 * @brief Absolute POSIX path on the remote host
 */
[[nodiscard]] auto validate_remote_path(const std::string& path) -> result<void>;

/**
 * @brief Local path without parent traversal, optionally required to exist
 */
[[nodiscard]] auto validate_local_path(const std::filesystem::path& path,
                                       bool must_exist = false) -> result<void>;

/**
 * @brief Regular expression that compiles
 */
[[nodiscard]] auto validate_regex(const std::string& pattern) -> result<void>;

/**
 * @brief All of the above applied to a connection profile
 */
[[nodiscard]] auto validate_connection_profile(const connection_profile& profile)
    -> result<void>;

/**
 * @brief Replace characters that are illegal in file names with '_'
 */
[[nodiscard]] auto sanitize_filename(const std::string& name) -> std::string;

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_CONFIG_VALIDATION_H
