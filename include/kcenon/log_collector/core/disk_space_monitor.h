/**
 * @file disk_space_monitor.h
 * @brief Free space checks for the collection destination and remote staging area
 */

#ifndef KCENON_LOG_COLLECTOR_CORE_DISK_SPACE_MONITOR_H
#define KCENON_LOG_COLLECTOR_CORE_DISK_SPACE_MONITOR_H

#include <cstdint>
#include <filesystem>
#include <string>

#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/session/connection_session.h"
#include "kcenon/log_collector/session/remote_channel.h"

namespace kcenon::log_collector {

/**
 * @brief Queries free space before and during a collection
 *
 * Required sizes are the uncompressed totals from discovery; the
 * compression ratio is not known in advance, so checks are conservative.
 */
class disk_space_monitor {
public:
    /**
     * @brief Space on the filesystem holding path (or its nearest existing parent)
     */
    [[nodiscard]] static auto query_local(const std::filesystem::path& path)
        -> result<space_info>;

    /**
     * @brief Space on the remote filesystem holding path
     *
     * Uses the SFTP statvfs extension and falls back to `df -P -B1`.
     */
    [[nodiscard]] static auto query_remote(connection_session& session, const std::string& path)
        -> result<space_info>;

    /**
     * @brief Fail with insufficient_space when less than required is available
     * @return The measured space on success
     */
    [[nodiscard]] static auto check_local(const std::filesystem::path& path,
                                          uint64_t required_bytes) -> result<space_info>;

    [[nodiscard]] static auto check_remote(connection_session& session, const std::string& path,
                                           uint64_t required_bytes) -> result<space_info>;

    /**
     * @brief True when available space is within margin of the requirement
     * @param margin Fraction of required_bytes kept as headroom (0.10 = 10%)
     */
    [[nodiscard]] static auto needs_warning(const space_info& info, uint64_t required_bytes,
                                            double margin) -> bool;

    /**
     * @brief Parse the output of `df -P -B1 <path>`
     */
    [[nodiscard]] static auto parse_df_output(const std::string& output) -> result<space_info>;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_CORE_DISK_SPACE_MONITOR_H
