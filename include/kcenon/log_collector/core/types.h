/**
 * @file types.h
 * @brief Core type definitions for log_collector
 */

#ifndef KCENON_LOG_COLLECTOR_CORE_TYPES_H
#define KCENON_LOG_COLLECTOR_CORE_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::log_collector {

/**
 * @brief Error codes for log collection operations
 *
 * Error code ranges:
 * - -100 to -119: Connection errors
 * - -120 to -139: Discovery errors
 * - -140 to -159: Compression errors
 * - -160 to -179: Transfer errors
 * - -180 to -199: Job errors
 * - -200 to -219: File errors
 * - -220 to -239: Configuration errors
 * - -240 to -259: Internal errors
 */
enum class error_code {
    success = 0,

    // Connection errors (-100 to -119)
    auth_failed = -100,
    connection_timeout = -101,
    network_error = -102,
    channel_unavailable = -103,
    host_key_mismatch = -104,

    // Discovery errors (-120 to -139)
    root_inaccessible = -120,
    permission_denied = -121,

    // Compression errors (-140 to -159)
    remote_command_failed = -140,
    local_write_failed = -141,
    insufficient_space = -142,
    archive_verify_failed = -143,

    // Transfer errors (-160 to -179)
    transfer_interrupted = -160,
    transfer_permission_denied = -161,
    transfer_timeout = -162,
    source_changed = -163,

    // Job errors (-180 to -199)
    job_failed = -180,
    job_already_running = -181,
    job_not_found = -182,
    job_cancelled = -183,
    job_not_terminal = -184,

    // File errors (-200 to -219)
    file_not_found = -200,
    file_read_error = -201,
    file_write_error = -202,
    invalid_file_path = -203,

    // Configuration errors (-220 to -239)
    invalid_configuration = -220,
    invalid_filter_pattern = -221,
    invalid_date = -222,

    // Internal errors (-240 to -259)
    internal_error = -240,
    not_initialized = -241,
    already_initialized = -242,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::auth_failed:
            return "authentication failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::network_error:
            return "network error";
        case error_code::channel_unavailable:
            return "channel unavailable";
        case error_code::host_key_mismatch:
            return "host key mismatch";
        case error_code::root_inaccessible:
            return "source root inaccessible";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::remote_command_failed:
            return "remote command failed";
        case error_code::local_write_failed:
            return "local write failed";
        case error_code::insufficient_space:
            return "insufficient space";
        case error_code::archive_verify_failed:
            return "archive verification failed";
        case error_code::transfer_interrupted:
            return "transfer interrupted";
        case error_code::transfer_permission_denied:
            return "transfer permission denied";
        case error_code::transfer_timeout:
            return "transfer timeout";
        case error_code::source_changed:
            return "source changed since discovery";
        case error_code::job_failed:
            return "job failed";
        case error_code::job_already_running:
            return "job already running";
        case error_code::job_not_found:
            return "job not found";
        case error_code::job_cancelled:
            return "job cancelled";
        case error_code::job_not_terminal:
            return "job not terminal";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_filter_pattern:
            return "invalid filter pattern";
        case error_code::invalid_date:
            return "invalid date";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if code belongs to the connection error family
 */
[[nodiscard]] constexpr auto is_connection_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value >= -119;
}

/**
 * @brief Check if a failure with this code leaves the job able to continue
 *
 * Per-file problems (permissions, races with log rotation, a single
 * interrupted transfer) are recoverable. Lost connections, full disks
 * and internal errors are not.
 */
[[nodiscard]] constexpr auto is_recoverable_by_default(error_code code) -> bool {
    switch (code) {
        case error_code::permission_denied:
        case error_code::transfer_permission_denied:
        case error_code::transfer_interrupted:
        case error_code::transfer_timeout:
        case error_code::source_changed:
        case error_code::file_not_found:
        case error_code::file_read_error:
        case error_code::remote_command_failed:
        case error_code::archive_verify_failed:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Unique identifier for a collection job
 */
struct job_id {
    uint64_t value;

    job_id() : value(0) {}
    explicit job_id(uint64_t v) : value(v) {}

    [[nodiscard]] auto operator==(const job_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const job_id& other) const -> bool {
        return value < other.value;
    }
};

}  // namespace kcenon::log_collector

// Hash support for job_id
template <>
struct std::hash<kcenon::log_collector::job_id> {
    auto operator()(const kcenon::log_collector::job_id& id) const noexcept -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

#endif  // KCENON_LOG_COLLECTOR_CORE_TYPES_H
