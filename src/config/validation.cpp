/**
 * @file validation.cpp
 * @brief Implementation of settings validation
 */

#include <kcenon/log_collector/config/validation.h>

#include <algorithm>
#include <charconv>
#include <regex>

namespace kcenon::log_collector {

namespace {

auto invalid(std::string message) -> result<void> {
    return unexpected{error{error_code::invalid_configuration, std::move(message)}};
}

auto is_hostname(const std::string& host) -> bool {
    static const std::regex hostname_pattern(
        R"(^[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?(\.[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?)*$)");
    return host.size() <= 253 && std::regex_match(host, hostname_pattern);
}

auto looks_numeric(const std::string& host) -> bool {
    return std::all_of(host.begin(), host.end(),
                       [](char c) { return (c >= '0' && c <= '9') || c == '.'; });
}

}  // namespace

auto validate_ip_address(const std::string& ip) -> result<void> {
    if (ip.empty()) {
        return invalid("IP address is empty");
    }

    static const std::regex ipv4_pattern(R"(^(\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3})$)");
    std::smatch match;
    if (!std::regex_match(ip, match, ipv4_pattern)) {
        return invalid("malformed IPv4 address '" + ip + "' (e.g. 192.168.1.100)");
    }

    for (std::size_t i = 1; i <= 4; ++i) {
        if (std::stoi(match[i].str()) > 255) {
            return invalid("IPv4 octets must be within 0-255: " + ip);
        }
    }
    return {};
}

auto validate_port(int64_t port) -> result<void> {
    if (port < 1 || port > 65535) {
        return invalid("port must be within 1-65535, got " + std::to_string(port));
    }
    return {};
}

auto validate_port(const std::string& port) -> result<void> {
    if (port.empty()) {
        return invalid("port is empty");
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc{} || ptr != port.data() + port.size()) {
        return invalid("port must be a number: '" + port + "'");
    }
    return validate_port(value);
}

auto validate_username(const std::string& username) -> result<void> {
    if (username.empty()) {
        return invalid("username is empty");
    }

    static const std::regex username_pattern(R"(^[a-zA-Z0-9_-]+$)");
    if (!std::regex_match(username, username_pattern)) {
        return invalid("username may contain only letters, digits, '-' and '_'");
    }
    if (username.size() > 32) {
        return invalid("username must be at most 32 characters");
    }
    return {};
}

auto validate_timeout(std::chrono::seconds timeout) -> result<void> {
    if (timeout.count() < 10) {
        return invalid("timeout must be at least 10 seconds");
    }
    if (timeout.count() > 3600) {
        return invalid("timeout must be at most 3600 seconds");
    }
    return {};
}

auto validate_remote_path(const std::string& path) -> result<void> {
    if (path.empty()) {
        return invalid("remote path is empty");
    }
    if (path.front() != '/') {
        return invalid("remote path must start with '/': " + path);
    }
    return {};
}

auto validate_local_path(const std::filesystem::path& path, bool must_exist) -> result<void> {
    if (path.empty()) {
        return invalid("local path is empty");
    }

    for (const auto& part : path) {
        if (part == "..") {
            return invalid("local path must not contain '..': " + path.string());
        }
    }

    if (must_exist) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return unexpected{
                error{error_code::file_not_found, "path does not exist: " + path.string()}};
        }
    }
    return {};
}

auto validate_regex(const std::string& pattern) -> result<void> {
    if (pattern.empty()) {
        return unexpected{error{error_code::invalid_filter_pattern, "pattern is empty"}};
    }
    try {
        std::regex compiled(pattern);
    } catch (const std::regex_error& e) {
        return unexpected{error{error_code::invalid_filter_pattern,
                                std::string("invalid regular expression: ") + e.what()}};
    }
    return {};
}

auto validate_connection_profile(const connection_profile& profile) -> result<void> {
    if (profile.host.empty()) {
        return invalid("host is empty");
    }
    if (looks_numeric(profile.host)) {
        if (auto r = validate_ip_address(profile.host); !r) {
            return r;
        }
    } else if (!is_hostname(profile.host)) {
        return invalid("malformed host name: " + profile.host);
    }

    if (auto r = validate_port(static_cast<int64_t>(profile.port)); !r) {
        return r;
    }
    if (auto r = validate_username(profile.username); !r) {
        return r;
    }
    if (auto r = validate_timeout(profile.request_timeout); !r) {
        return r;
    }
    if (profile.connect_timeout.count() <= 0) {
        return invalid("connect timeout must be positive");
    }
    if (profile.keep_alive_enabled && profile.keep_alive_interval.count() <= 0) {
        return invalid("keep-alive interval must be positive");
    }
    if (profile.reconnect.backoff_multiplier < 1.0) {
        return invalid("reconnect backoff multiplier must be >= 1.0");
    }
    if (profile.credential.uses_key()) {
        std::error_code ec;
        if (!std::filesystem::exists(*profile.credential.private_key_path, ec)) {
            return unexpected{error{error_code::file_not_found,
                                    "private key not found: " +
                                        profile.credential.private_key_path->string()}};
        }
    }
    return {};
}

auto sanitize_filename(const std::string& name) -> std::string {
    static const std::string illegal = "<>:\"/\\|?* ";

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        char mapped = illegal.find(c) != std::string::npos ? '_' : c;
        if (mapped == '_' && !out.empty() && out.back() == '_') {
            continue;
        }
        out += mapped;
    }
    return out;
}

}  // namespace kcenon::log_collector
