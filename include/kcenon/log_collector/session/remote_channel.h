/**
 * @file remote_channel.h
 * @brief Abstraction over the SSH/SFTP channel used by a connection session
 *
 * A remote_channel is one authenticated transport plus its file channel.
 * It is not safe for concurrent use; connection_session serializes every
 * call. The production implementation is libssh_channel; tests substitute
 * their own.
 */

#ifndef KCENON_LOG_COLLECTOR_SESSION_REMOTE_CHANNEL_H
#define KCENON_LOG_COLLECTOR_SESSION_REMOTE_CHANNEL_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/log_collector/core/cancellation_token.h"
#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/session/session_types.h"

namespace kcenon::log_collector {

/**
 * @brief Type of a remote directory entry (links are reported, not followed)
 */
enum class remote_entry_type {
    regular,
    directory,
    symlink,
    other
};

/**
 * @brief One entry of a remote directory listing
 */
struct remote_entry {
    std::string name;
    remote_entry_type type = remote_entry_type::regular;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified_at{};
};

/**
 * @brief Outcome of a remote command
 */
struct command_result {
    int exit_status = -1;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] auto succeeded() const -> bool { return exit_status == 0; }
};

/**
 * @brief Free space of a filesystem, local or remote
 */
struct space_info {
    uint64_t capacity = 0;
    uint64_t free = 0;
    uint64_t available = 0;
};

/**
 * @brief Download progress: bytes written so far and file size
 */
using download_progress_callback = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief Interface for one remote transport + SFTP channel
 */
class remote_channel {
public:
    virtual ~remote_channel() = default;

    /**
     * @brief Connect and authenticate
     * @return auth_failed, connection_timeout, network_error or host_key_mismatch
     */
    [[nodiscard]] virtual auto open(const connection_profile& profile) -> result<void> = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    /**
     * @brief Lightweight liveness request
     */
    [[nodiscard]] virtual auto probe() -> result<void> = 0;

    /**
     * @brief List a directory, excluding "." and ".."
     * @return permission_denied, file_not_found or network_error on failure
     */
    [[nodiscard]] virtual auto list_directory(const std::string& path)
        -> result<std::vector<remote_entry>> = 0;

    /**
     * @brief Stat a path without following a final symbolic link
     */
    [[nodiscard]] virtual auto stat(const std::string& path) -> result<remote_entry> = 0;

    /**
     * @brief Copy a remote file into a local file
     * @return Number of bytes written
     */
    [[nodiscard]] virtual auto download(const std::string& remote_path,
                                        const std::filesystem::path& local_path,
                                        const download_progress_callback& progress)
        -> result<uint64_t> = 0;

    [[nodiscard]] virtual auto remove(const std::string& path) -> result<void> = 0;

    /**
     * @brief Run a shell command on the remote host
     * @param command Command line passed to the remote shell
     * @param stdin_data Written to the command's standard input, then EOF
     * @param timeout Maximum wall time; transfer_timeout when exceeded
     * @param cancel Polled while waiting; job_cancelled when set
     */
    [[nodiscard]] virtual auto execute(const std::string& command,
                                       const std::string& stdin_data,
                                       std::chrono::milliseconds timeout,
                                       const cancellation_token& cancel)
        -> result<command_result> = 0;

    /**
     * @brief Free space of the filesystem holding a path
     * @return not_initialized when the server lacks the statvfs extension
     */
    [[nodiscard]] virtual auto filesystem_space(const std::string& path)
        -> result<space_info> = 0;
};

/**
 * @brief Creates a fresh, unopened channel (called again on every reconnect)
 */
using channel_factory = std::function<std::unique_ptr<remote_channel>()>;

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_SESSION_REMOTE_CHANNEL_H
