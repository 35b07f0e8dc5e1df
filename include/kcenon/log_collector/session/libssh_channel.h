/**
 * @file libssh_channel.h
 * @brief remote_channel implementation on top of libssh
 */

#ifndef KCENON_LOG_COLLECTOR_SESSION_LIBSSH_CHANNEL_H
#define KCENON_LOG_COLLECTOR_SESSION_LIBSSH_CHANNEL_H

#include <memory>

#include "kcenon/log_collector/session/remote_channel.h"

namespace kcenon::log_collector {

/**
 * @brief SSH transport and SFTP subsystem driven through libssh
 *
 * Authenticates with a password, a private key file, or (when neither is
 * configured) keys offered by the agent and default identity files.
 */
class libssh_channel final : public remote_channel {
public:
    libssh_channel();
    ~libssh_channel() override;

    libssh_channel(const libssh_channel&) = delete;
    auto operator=(const libssh_channel&) -> libssh_channel& = delete;
    libssh_channel(libssh_channel&&) noexcept;
    auto operator=(libssh_channel&&) noexcept -> libssh_channel&;

    [[nodiscard]] auto open(const connection_profile& profile) -> result<void> override;
    void close() override;
    [[nodiscard]] auto is_open() const -> bool override;
    [[nodiscard]] auto probe() -> result<void> override;

    [[nodiscard]] auto list_directory(const std::string& path)
        -> result<std::vector<remote_entry>> override;
    [[nodiscard]] auto stat(const std::string& path) -> result<remote_entry> override;
    [[nodiscard]] auto download(const std::string& remote_path,
                                const std::filesystem::path& local_path,
                                const download_progress_callback& progress)
        -> result<uint64_t> override;
    [[nodiscard]] auto remove(const std::string& path) -> result<void> override;

    [[nodiscard]] auto execute(const std::string& command,
                               const std::string& stdin_data,
                               std::chrono::milliseconds timeout,
                               const cancellation_token& cancel)
        -> result<command_result> override;

    [[nodiscard]] auto filesystem_space(const std::string& path)
        -> result<space_info> override;

    /**
     * @brief Factory producing libssh channels for connection_session
     */
    [[nodiscard]] static auto factory() -> channel_factory;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_SESSION_LIBSSH_CHANNEL_H
