/**
 * @file disk_space_monitor.cpp
 * @brief Implementation of free space checks
 */

#include <kcenon/log_collector/core/disk_space_monitor.h>
#include <kcenon/log_collector/compression/compression_handler.h>
#include <kcenon/log_collector/core/filter_engine.h>
#include <kcenon/log_collector/core/logging.h>

#include <algorithm>
#include <sstream>
#include <vector>

namespace kcenon::log_collector {

namespace {

auto insufficient(const std::string& where, const space_info& info, uint64_t required)
    -> error {
    return error{error_code::insufficient_space,
                 where + " has " + filter_engine::format_size(info.available) +
                     " available, " + filter_engine::format_size(required) + " required"};
}

}  // namespace

auto disk_space_monitor::query_local(const std::filesystem::path& path) -> result<space_info> {
    std::error_code ec;
    auto probe = path;
    while (!probe.empty() && !std::filesystem::exists(probe, ec)) {
        auto parent = probe.parent_path();
        if (parent == probe) {
            break;
        }
        probe = parent;
    }
    if (probe.empty()) {
        probe = std::filesystem::current_path(ec);
    }

    auto fs_space = std::filesystem::space(probe, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "cannot query free space of " + probe.string() + ": " +
                                    ec.message()}};
    }

    space_info info;
    info.capacity = fs_space.capacity;
    info.free = fs_space.free;
    info.available = fs_space.available;
    return info;
}

auto disk_space_monitor::query_remote(connection_session& session, const std::string& path)
    -> result<space_info> {
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        session.profile().request_timeout);

    return session.with_channel([&](remote_channel& channel) -> result<space_info> {
        auto statvfs = channel.filesystem_space(path);
        if (statvfs || is_connection_error(statvfs.error().code)) {
            return statvfs;
        }

        LC_LOG_DEBUG(log_category::disk,
                     "statvfs unavailable (" + statvfs.error().message + "), using df");
        auto df = channel.execute("df -P -B1 " + compression_handler::shell_quote(path), {},
                                  timeout, cancellation_token::none());
        if (!df) {
            return unexpected{df.error()};
        }
        if (!df.value().succeeded()) {
            return unexpected{error{error_code::remote_command_failed,
                                    "df failed for " + path + ": " + df.value().stderr_text}};
        }
        return parse_df_output(df.value().stdout_text);
    });
}

auto disk_space_monitor::check_local(const std::filesystem::path& path, uint64_t required_bytes)
    -> result<space_info> {
    auto info = query_local(path);
    if (!info) {
        return info;
    }
    if (info.value().available < required_bytes) {
        auto err = insufficient(path.string(), info.value(), required_bytes);
        LC_LOG_WARN(log_category::disk, err.message);
        return unexpected{err};
    }
    return info;
}

auto disk_space_monitor::check_remote(connection_session& session, const std::string& path,
                                      uint64_t required_bytes) -> result<space_info> {
    auto info = query_remote(session, path);
    if (!info) {
        return info;
    }
    if (info.value().available < required_bytes) {
        auto err = insufficient(session.profile().host + ":" + path, info.value(), required_bytes);
        LC_LOG_WARN(log_category::disk, err.message);
        return unexpected{err};
    }
    return info;
}

auto disk_space_monitor::needs_warning(const space_info& info, uint64_t required_bytes,
                                       double margin) -> bool {
    auto headroom = static_cast<double>(required_bytes) * (1.0 + margin);
    return static_cast<double>(info.available) < headroom;
}

auto disk_space_monitor::parse_df_output(const std::string& output) -> result<space_info> {
    std::istringstream lines(output);
    std::string line;
    std::string last;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            last = line;
        }
    }

    std::istringstream fields(last);
    std::vector<std::string> tokens;
    for (std::string token; fields >> token;) {
        tokens.push_back(token);
    }

    // Filesystem 1-blocks Used Available Capacity Mounted-on
    if (tokens.size() < 6) {
        return unexpected{error{error_code::remote_command_failed,
                                "unexpected df output: " + last}};
    }

    try {
        space_info info;
        info.capacity = std::stoull(tokens[1]);
        info.available = std::stoull(tokens[3]);
        info.free = info.capacity - std::min<uint64_t>(info.capacity, std::stoull(tokens[2]));
        return info;
    } catch (const std::exception&) {
        return unexpected{error{error_code::remote_command_failed,
                                "unexpected df output: " + last}};
    }
}

}  // namespace kcenon::log_collector
