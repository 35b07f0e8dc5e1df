/**
 * @file libssh_channel.cpp
 * @brief libssh backed SSH/SFTP channel
 */

#include <kcenon/log_collector/session/libssh_channel.h>
#include <kcenon/log_collector/core/logging.h>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace kcenon::log_collector {

namespace {

constexpr std::size_t read_buffer_size = 32 * 1024;
constexpr int exec_poll_interval_ms = 200;

auto to_time_point(uint64_t epoch_seconds) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds));
}

auto to_entry_type(uint8_t type) -> remote_entry_type {
    switch (type) {
        case SSH_FILEXFER_TYPE_REGULAR: return remote_entry_type::regular;
        case SSH_FILEXFER_TYPE_DIRECTORY: return remote_entry_type::directory;
        case SSH_FILEXFER_TYPE_SYMLINK: return remote_entry_type::symlink;
        default: return remote_entry_type::other;
    }
}

auto to_remote_entry(sftp_attributes attrs) -> remote_entry {
    remote_entry entry;
    entry.name = attrs->name ? attrs->name : "";
    entry.type = to_entry_type(attrs->type);
    entry.size = attrs->size;
    entry.modified_at = to_time_point(attrs->mtime64 != 0 ? attrs->mtime64 : attrs->mtime);
    return entry;
}

auto contains_timeout(const std::string& message) -> bool {
    std::string lowered = message;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("timeout") != std::string::npos ||
           lowered.find("timed out") != std::string::npos;
}

}  // namespace

struct libssh_channel::impl {
    ssh_session session = nullptr;
    sftp_session sftp = nullptr;
    std::string host;

    ~impl() { release(); }

    void release() {
        if (sftp) {
            sftp_free(sftp);
            sftp = nullptr;
        }
        if (session) {
            if (ssh_is_connected(session)) {
                ssh_disconnect(session);
            }
            ssh_free(session);
            session = nullptr;
        }
    }

    [[nodiscard]] auto last_error() const -> std::string {
        return session ? ssh_get_error(session) : "no session";
    }

    [[nodiscard]] auto connected() const -> bool {
        return session && ssh_is_connected(session) && sftp;
    }

    /**
     * @brief Translate the pending SFTP status into an error
     */
    [[nodiscard]] auto sftp_failure(const std::string& what, const std::string& path) const
        -> error {
        if (!session || !ssh_is_connected(session)) {
            return error{error_code::network_error,
                         what + " failed for '" + path + "': connection lost"};
        }

        int code = sftp ? sftp_get_error(sftp) : SSH_FX_FAILURE;
        std::string detail = what + " failed for '" + path + "': " + last_error();
        switch (code) {
            case SSH_FX_PERMISSION_DENIED:
                return error{error_code::permission_denied, detail};
            case SSH_FX_NO_SUCH_FILE:
            case SSH_FX_NO_SUCH_PATH:
                return error{error_code::file_not_found, detail};
            case SSH_FX_CONNECTION_LOST:
            case SSH_FX_NO_CONNECTION:
                return error{error_code::network_error, detail};
            default:
                return error{error_code::file_read_error, detail};
        }
    }

    [[nodiscard]] auto verify_host(bool strict) -> result<void> {
        auto state = ssh_session_is_known_server(session);
        switch (state) {
            case SSH_KNOWN_HOSTS_OK:
                return {};
            case SSH_KNOWN_HOSTS_CHANGED:
            case SSH_KNOWN_HOSTS_OTHER:
                return unexpected{error{error_code::host_key_mismatch,
                                        "host key for " + host + " does not match known_hosts"}};
            case SSH_KNOWN_HOSTS_NOT_FOUND:
            case SSH_KNOWN_HOSTS_UNKNOWN:
                if (strict) {
                    return unexpected{error{error_code::host_key_mismatch,
                                            "host " + host + " is not in known_hosts"}};
                }
                LC_LOG_WARN(log_category::session,
                            "Accepting unknown host key for " + host);
                return {};
            case SSH_KNOWN_HOSTS_ERROR:
            default:
                return unexpected{error{error_code::network_error,
                                        "host key verification failed: " + last_error()}};
        }
    }

    [[nodiscard]] auto authenticate(const connection_profile& profile) -> result<void> {
        int rc = SSH_AUTH_ERROR;
        const auto& cred = profile.credential;

        if (cred.uses_key()) {
            ssh_key key = nullptr;
            const char* passphrase = cred.key_passphrase.empty() ? nullptr
                                                                  : cred.key_passphrase.c_str();
            if (ssh_pki_import_privkey_file(cred.private_key_path->string().c_str(), passphrase,
                                            nullptr, nullptr, &key) != SSH_OK) {
                return unexpected{error{error_code::auth_failed,
                                        "cannot load private key " +
                                            cred.private_key_path->string()}};
            }
            rc = ssh_userauth_publickey(session, nullptr, key);
            ssh_key_free(key);
        } else if (!cred.password.empty()) {
            rc = ssh_userauth_password(session, nullptr, cred.password.c_str());
        } else {
            rc = ssh_userauth_publickey_auto(session, nullptr, nullptr);
        }

        if (rc != SSH_AUTH_SUCCESS) {
            return unexpected{error{error_code::auth_failed,
                                    "authentication failed for " + profile.username + "@" +
                                        host + ": " + last_error()}};
        }
        return {};
    }
};

libssh_channel::libssh_channel() : impl_(std::make_unique<impl>()) {}

libssh_channel::~libssh_channel() = default;

libssh_channel::libssh_channel(libssh_channel&&) noexcept = default;
auto libssh_channel::operator=(libssh_channel&&) noexcept -> libssh_channel& = default;

auto libssh_channel::factory() -> channel_factory {
    return [] { return std::make_unique<libssh_channel>(); };
}

auto libssh_channel::open(const connection_profile& profile) -> result<void> {
    impl_->release();
    impl_->host = profile.host;

    impl_->session = ssh_new();
    if (!impl_->session) {
        return unexpected{error{error_code::internal_error, "ssh_new failed"}};
    }

    unsigned int port = profile.port;
    long timeout_sec = static_cast<long>(profile.connect_timeout.count());
    if (ssh_options_set(impl_->session, SSH_OPTIONS_HOST, profile.host.c_str()) != SSH_OK ||
        ssh_options_set(impl_->session, SSH_OPTIONS_PORT, &port) != SSH_OK ||
        ssh_options_set(impl_->session, SSH_OPTIONS_USER, profile.username.c_str()) != SSH_OK ||
        ssh_options_set(impl_->session, SSH_OPTIONS_TIMEOUT, &timeout_sec) != SSH_OK) {
        auto message = impl_->last_error();
        impl_->release();
        return unexpected{error{error_code::invalid_configuration,
                                "ssh_options_set failed: " + message}};
    }

    if (ssh_connect(impl_->session) != SSH_OK) {
        auto message = impl_->last_error();
        impl_->release();
        auto code = contains_timeout(message) ? error_code::connection_timeout
                                              : error_code::network_error;
        return unexpected{error{code, "ssh_connect to " + profile.endpoint() + " failed: " +
                                          message}};
    }

    if (auto verified = impl_->verify_host(profile.strict_host_key_checking); !verified) {
        impl_->release();
        return verified;
    }

    if (auto authed = impl_->authenticate(profile); !authed) {
        impl_->release();
        return authed;
    }

    impl_->sftp = sftp_new(impl_->session);
    if (!impl_->sftp) {
        auto message = impl_->last_error();
        impl_->release();
        return unexpected{error{error_code::network_error, "sftp_new failed: " + message}};
    }
    if (sftp_init(impl_->sftp) != SSH_OK) {
        auto message = impl_->last_error();
        impl_->release();
        return unexpected{error{error_code::network_error, "sftp_init failed: " + message}};
    }

    return {};
}

void libssh_channel::close() {
    impl_->release();
}

auto libssh_channel::is_open() const -> bool {
    return impl_->connected();
}

auto libssh_channel::probe() -> result<void> {
    if (!impl_->connected()) {
        return unexpected{error{error_code::network_error, "channel is not open"}};
    }

    sftp_attributes attrs = sftp_stat(impl_->sftp, ".");
    if (!attrs) {
        return unexpected{impl_->sftp_failure("probe", ".")};
    }
    sftp_attributes_free(attrs);
    return {};
}

auto libssh_channel::list_directory(const std::string& path)
    -> result<std::vector<remote_entry>> {
    if (!impl_->connected()) {
        return unexpected{error{error_code::network_error, "channel is not open"}};
    }

    sftp_dir dir = sftp_opendir(impl_->sftp, path.c_str());
    if (!dir) {
        return unexpected{impl_->sftp_failure("opendir", path)};
    }

    std::vector<remote_entry> entries;
    while (sftp_attributes attrs = sftp_readdir(impl_->sftp, dir)) {
        std::string name = attrs->name ? attrs->name : "";
        if (name != "." && name != "..") {
            entries.push_back(to_remote_entry(attrs));
        }
        sftp_attributes_free(attrs);
    }

    bool complete = sftp_dir_eof(dir) != 0;
    sftp_closedir(dir);
    if (!complete) {
        return unexpected{impl_->sftp_failure("readdir", path)};
    }
    return entries;
}

auto libssh_channel::stat(const std::string& path) -> result<remote_entry> {
    if (!impl_->connected()) {
        return unexpected{error{error_code::network_error, "channel is not open"}};
    }

    sftp_attributes attrs = sftp_lstat(impl_->sftp, path.c_str());
    if (!attrs) {
        return unexpected{impl_->sftp_failure("stat", path)};
    }
    auto entry = to_remote_entry(attrs);
    if (entry.name.empty()) {
        auto pos = path.find_last_of('/');
        entry.name = pos == std::string::npos ? path : path.substr(pos + 1);
    }
    sftp_attributes_free(attrs);
    return entry;
}

auto libssh_channel::download(const std::string& remote_path,
                              const std::filesystem::path& local_path,
                              const download_progress_callback& progress) -> result<uint64_t> {
    if (!impl_->connected()) {
        return unexpected{error{error_code::network_error, "channel is not open"}};
    }

    uint64_t total = 0;
    if (sftp_attributes attrs = sftp_stat(impl_->sftp, remote_path.c_str())) {
        total = attrs->size;
        sftp_attributes_free(attrs);
    }

    sftp_file file = sftp_open(impl_->sftp, remote_path.c_str(), O_RDONLY, 0);
    if (!file) {
        auto err = impl_->sftp_failure("open", remote_path);
        if (err.code == error_code::permission_denied) {
            err.code = error_code::transfer_permission_denied;
        }
        return unexpected{err};
    }

    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        sftp_close(file);
        return unexpected{error{error_code::file_write_error,
                                "cannot create local file " + local_path.string()}};
    }

    std::array<char, read_buffer_size> buffer{};
    uint64_t written = 0;
    for (;;) {
        ssize_t n = sftp_read(file, buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        if (n < 0) {
            sftp_close(file);
            auto err = impl_->sftp_failure("read", remote_path);
            if (err.code != error_code::network_error) {
                err.code = error_code::transfer_interrupted;
            }
            return unexpected{err};
        }
        out.write(buffer.data(), n);
        if (!out) {
            sftp_close(file);
            return unexpected{error{error_code::file_write_error,
                                    "write failed for " + local_path.string()}};
        }
        written += static_cast<uint64_t>(n);
        if (progress) {
            progress(written, std::max(total, written));
        }
    }

    sftp_close(file);
    out.flush();
    if (!out) {
        return unexpected{error{error_code::file_write_error,
                                "flush failed for " + local_path.string()}};
    }
    return written;
}

auto libssh_channel::remove(const std::string& path) -> result<void> {
    if (!impl_->connected()) {
        return unexpected{error{error_code::network_error, "channel is not open"}};
    }
    if (sftp_unlink(impl_->sftp, path.c_str()) != 0) {
        return unexpected{impl_->sftp_failure("unlink", path)};
    }
    return {};
}

auto libssh_channel::execute(const std::string& command,
                             const std::string& stdin_data,
                             std::chrono::milliseconds timeout,
                             const cancellation_token& cancel) -> result<command_result> {
    if (!impl_->connected()) {
        return unexpected{error{error_code::network_error, "channel is not open"}};
    }

    ssh_channel channel = ssh_channel_new(impl_->session);
    if (!channel) {
        return unexpected{error{error_code::network_error,
                                "ssh_channel_new failed: " + impl_->last_error()}};
    }

    auto fail = [&](error_code code, const std::string& message) -> result<command_result> {
        ssh_channel_close(channel);
        ssh_channel_free(channel);
        return unexpected{error{code, message}};
    };

    if (ssh_channel_open_session(channel) != SSH_OK) {
        ssh_channel_free(channel);
        return unexpected{error{error_code::network_error,
                                "ssh_channel_open_session failed: " + impl_->last_error()}};
    }
    if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
        return fail(error_code::remote_command_failed,
                    "exec request rejected: " + impl_->last_error());
    }

    std::size_t offset = 0;
    while (offset < stdin_data.size()) {
        auto chunk = static_cast<uint32_t>(std::min<std::size_t>(stdin_data.size() - offset,
                                                                 read_buffer_size));
        int n = ssh_channel_write(channel, stdin_data.data() + offset, chunk);
        if (n == SSH_ERROR) {
            return fail(error_code::network_error,
                        "writing command input failed: " + impl_->last_error());
        }
        offset += static_cast<std::size_t>(n);
    }
    ssh_channel_send_eof(channel);

    command_result outcome;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, read_buffer_size> buffer{};

    while (!ssh_channel_is_eof(channel)) {
        if (cancel.is_cancelled()) {
            return fail(error_code::job_cancelled, "remote command cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return fail(error_code::transfer_timeout,
                        "remote command exceeded " + std::to_string(timeout.count()) + " ms");
        }

        for (int is_stderr = 0; is_stderr <= 1; ++is_stderr) {
            int n = ssh_channel_read_timeout(channel, buffer.data(),
                                             static_cast<uint32_t>(buffer.size()), is_stderr,
                                             is_stderr ? 0 : exec_poll_interval_ms);
            if (n == SSH_ERROR) {
                return fail(error_code::network_error,
                            "reading command output failed: " + impl_->last_error());
            }
            if (n > 0) {
                (is_stderr ? outcome.stderr_text : outcome.stdout_text)
                    .append(buffer.data(), static_cast<std::size_t>(n));
            }
        }
    }

    for (int is_stderr = 0; is_stderr <= 1; ++is_stderr) {
        int n = 0;
        while ((n = ssh_channel_read_nonblocking(channel, buffer.data(),
                                                 static_cast<uint32_t>(buffer.size()),
                                                 is_stderr)) > 0) {
            (is_stderr ? outcome.stderr_text : outcome.stdout_text)
                .append(buffer.data(), static_cast<std::size_t>(n));
        }
    }

    outcome.exit_status = ssh_channel_get_exit_status(channel);
    ssh_channel_close(channel);
    ssh_channel_free(channel);
    return outcome;
}

auto libssh_channel::filesystem_space(const std::string& path) -> result<space_info> {
    if (!impl_->connected()) {
        return unexpected{error{error_code::network_error, "channel is not open"}};
    }
    if (!sftp_extension_supported(impl_->sftp, "statvfs@openssh.com", "2")) {
        return unexpected{error{error_code::not_initialized,
                                "server does not support statvfs@openssh.com"}};
    }

    sftp_statvfs_t st = sftp_statvfs(impl_->sftp, path.c_str());
    if (!st) {
        return unexpected{impl_->sftp_failure("statvfs", path)};
    }

    space_info info;
    info.capacity = st->f_blocks * st->f_frsize;
    info.free = st->f_bfree * st->f_frsize;
    info.available = st->f_bavail * st->f_frsize;
    sftp_statvfs_free(st);
    return info;
}

}  // namespace kcenon::log_collector
