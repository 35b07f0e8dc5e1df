/**
 * @file compression_handler.h
 * @brief Archive creation on this machine (libarchive) or on the remote host
 */

#ifndef KCENON_LOG_COLLECTOR_COMPRESSION_COMPRESSION_HANDLER_H
#define KCENON_LOG_COLLECTOR_COMPRESSION_COMPRESSION_HANDLER_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/log_collector/core/cancellation_token.h"
#include "kcenon/log_collector/core/source_types.h"
#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/session/connection_session.h"

namespace kcenon::log_collector {

/**
 * @brief Archive container format
 */
enum class archive_format {
    zip,    ///< Archives of local sources
    tar_gz  ///< Archives produced on, or staged from, the remote host
};

[[nodiscard]] constexpr auto to_string(archive_format format) -> const char* {
    switch (format) {
        case archive_format::zip: return "zip";
        case archive_format::tar_gz: return "tar.gz";
        default: return "unknown";
    }
}

/**
 * @brief Settings shared by local and remote compression
 */
struct compression_settings {
    int level = 6;                    ///< 0 (store) to 9 (best)
    std::size_t buffer_size = 32768;  ///< Read buffer for archive input
    /// Remote command; {archive}, {root} and {files} are replaced
    std::string remote_command = "tar -czf {archive} -C {root} -T -";
    std::chrono::seconds remote_timeout{600};
};

/**
 * @brief One member of an archive
 */
struct archive_member {
    std::string name;
    uint64_t size = 0;
};

/**
 * @brief Archive written on this machine
 */
struct local_archive {
    std::filesystem::path path;
    uint64_t archive_size = 0;
    uint64_t input_bytes = 0;
    std::vector<std::string> members;          ///< Relative paths actually written
    std::vector<collection_error> skipped;     ///< Inputs that vanished or were unreadable
};

/**
 * @brief Archive left on the remote host by compress_remote()
 */
struct remote_archive {
    std::string path;
    uint64_t size = 0;
    std::vector<std::string> members;
};

/**
 * @brief Running totals over the handler's lifetime
 */
struct compression_stats {
    uint64_t archives_created = 0;
    uint64_t remote_archives_created = 0;
    uint64_t files_archived = 0;
    uint64_t input_bytes = 0;
    uint64_t output_bytes = 0;

    [[nodiscard]] auto compression_ratio() const -> double {
        if (input_bytes == 0) return 1.0;
        return static_cast<double>(output_bytes) / static_cast<double>(input_bytes);
    }
};

/**
 * @brief Produces archives of discovered files
 *
 * @code
 * compression_handler handler;
 * auto archive = handler.compress_local(entries, dest / compression_handler::archive_name(
 *                                           "user_app_log", now, archive_format::zip),
 *                                       archive_format::zip);
 * @endcode
 */
class compression_handler {
public:
    explicit compression_handler(compression_settings settings = {});
    ~compression_handler();

    // Non-copyable but movable
    compression_handler(const compression_handler&) = delete;
    auto operator=(const compression_handler&) -> compression_handler& = delete;
    compression_handler(compression_handler&&) noexcept;
    auto operator=(compression_handler&&) noexcept -> compression_handler&;

    /**
     * @brief Write an archive of local files
     *
     * Each entry is read from absolute_path and stored under its relative
     * path. The archive is written next to dest_archive with a ".partial"
     * suffix and renamed once closed, so dest_archive is either complete
     * or absent.
     *
     * @return local_write_failed or insufficient_space on failure
     */
    [[nodiscard]] auto compress_local(const std::vector<file_entry>& files,
                                      const std::filesystem::path& dest_archive,
                                      archive_format format) -> result<local_archive>;

    /**
     * @brief Run the configured compression command on the remote host
     * @param remote_root Directory the relative paths of files are based on
     * @param remote_archive_path Where the archive is created
     * @return remote_command_failed on a non-zero exit or missing archive,
     *         transfer_timeout when remote_timeout elapses, job_cancelled
     */
    [[nodiscard]] auto compress_remote(connection_session& session,
                                       const std::vector<file_entry>& files,
                                       const std::string& remote_root,
                                       const std::string& remote_archive_path,
                                       const cancellation_token& cancel)
        -> result<remote_archive>;

    /**
     * @brief Read an archive back completely and list its regular members
     * @return archive_verify_failed if the archive is truncated or corrupt
     */
    [[nodiscard]] static auto verify_archive(const std::filesystem::path& archive)
        -> result<std::vector<archive_member>>;

    /**
     * @brief Restore regular members below dest_dir
     * @return invalid_file_path for absolute or ".." member names
     */
    [[nodiscard]] static auto extract_archive(const std::filesystem::path& archive,
                                              const std::filesystem::path& dest_dir)
        -> result<std::vector<std::filesystem::path>>;

    /**
     * @brief "<label>_<YYYYMMDD_HHMMSS>.<ext>" with the label sanitized
     */
    [[nodiscard]] static auto archive_name(const std::string& label,
                                           std::chrono::system_clock::time_point when,
                                           archive_format format) -> std::string;

    /**
     * @brief Local time as "YYYYMMDD_HHMMSS"
     */
    [[nodiscard]] static auto timestamp(std::chrono::system_clock::time_point when)
        -> std::string;

    /**
     * @brief Expand a remote command template
     *
     * Placeholders are replaced by single-quoted values; {files} expands to
     * the space separated quoted relative paths.
     */
    [[nodiscard]] static auto build_remote_command(const std::string& command_template,
                                                   const std::string& archive_path,
                                                   const std::string& root,
                                                   const std::vector<file_entry>& files)
        -> std::string;

    [[nodiscard]] static auto shell_quote(const std::string& value) -> std::string;

    [[nodiscard]] auto settings() const -> const compression_settings&;

    [[nodiscard]] auto stats() const -> compression_stats;

    void reset_stats();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_COMPRESSION_COMPRESSION_HANDLER_H
