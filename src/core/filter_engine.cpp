/**
 * @file filter_engine.cpp
 * @brief Implementation of filter predicates and listing helpers
 */

#include <kcenon/log_collector/core/filter_engine.h>
#include <kcenon/log_collector/core/logging.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <numeric>
#include <sstream>

namespace kcenon::log_collector {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto ends_with(const std::string& value, const std::string& suffix) -> bool {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto format_local_time(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace

// filter_config factories

auto filter_config::all() -> filter_config {
    return filter_config{};
}

auto filter_config::pattern(const std::string& expression) -> result<filter_config> {
    if (expression.empty()) {
        return unexpected{error{error_code::invalid_filter_pattern, "pattern is empty"}};
    }

    filter_config config;
    config.mode_ = filter_mode::pattern;
    config.expression_ = expression;
    try {
        config.regex_ = std::make_shared<const std::regex>(expression, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        LC_LOG_WARN(log_category::filter,
                    "Rejected filter pattern '" + expression + "': " + e.what());
        return unexpected{error{error_code::invalid_filter_pattern,
                                "invalid regular expression '" + expression + "': " + e.what()}};
    }
    return config;
}

auto filter_config::date_since(std::chrono::system_clock::time_point since) -> filter_config {
    filter_config config;
    config.mode_ = filter_mode::date_since;
    config.since_ = since;
    return config;
}

auto filter_config::date_since(const std::string& text) -> result<filter_config> {
    auto parsed = filter_engine::parse_date(text);
    if (!parsed) {
        return unexpected{parsed.error()};
    }
    return date_since(parsed.value());
}

auto filter_config::extensions(std::vector<std::string> allowed) -> result<filter_config> {
    if (allowed.empty()) {
        return unexpected{error{error_code::invalid_configuration, "extension list is empty"}};
    }

    filter_config config;
    config.mode_ = filter_mode::extension;
    for (auto& ext : allowed) {
        if (ext.empty()) {
            return unexpected{error{error_code::invalid_configuration, "empty extension"}};
        }
        auto lowered = to_lower(ext);
        config.extensions_.push_back(lowered.front() == '.' ? lowered : "." + lowered);
    }
    return config;
}

auto filter_config::size_range(uint64_t min_size, std::optional<uint64_t> max_size)
    -> result<filter_config> {
    if (max_size && *max_size < min_size) {
        return unexpected{error{error_code::invalid_configuration,
                                "size range maximum is below minimum"}};
    }

    filter_config config;
    config.mode_ = filter_mode::size_range;
    config.min_size_ = min_size;
    config.max_size_ = max_size;
    return config;
}

auto filter_config::describe() const -> std::string {
    switch (mode_) {
        case filter_mode::all:
            return "all";
        case filter_mode::pattern:
            return "pattern '" + expression_ + "'";
        case filter_mode::date_since:
            return "modified since " + format_local_time(since_);
        case filter_mode::extension: {
            std::string joined;
            for (const auto& ext : extensions_) {
                joined += (joined.empty() ? "" : ",") + ext;
            }
            return "extension in {" + joined + "}";
        }
        case filter_mode::size_range:
            return "size in [" + std::to_string(min_size_) + ", " +
                   (max_size_ ? std::to_string(*max_size_) : std::string("inf")) + "]";
        default:
            return "unknown";
    }
}

// filter_engine

auto filter_engine::matches(const file_entry& entry, const filter_config& config) -> bool {
    if (entry.is_directory) {
        return true;
    }

    switch (config.mode_) {
        case filter_mode::all:
            return true;
        case filter_mode::pattern:
            return config.regex_ && std::regex_search(entry.name(), *config.regex_);
        case filter_mode::date_since:
            return entry.modified_at >= config.since_;
        case filter_mode::extension: {
            auto name = to_lower(entry.name());
            return std::any_of(config.extensions_.begin(), config.extensions_.end(),
                               [&name](const std::string& ext) { return ends_with(name, ext); });
        }
        case filter_mode::size_range:
            return entry.size >= config.min_size_ &&
                   (!config.max_size_ || entry.size <= *config.max_size_);
        default:
            return false;
    }
}

auto filter_engine::matches(const file_entry& entry, const filter_chain& chain) -> bool {
    return std::all_of(chain.begin(), chain.end(),
                       [&entry](const filter_config& config) { return matches(entry, config); });
}

auto filter_engine::apply(std::span<const file_entry> entries, const filter_chain& chain)
    -> std::vector<file_entry> {
    std::vector<file_entry> selected;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(selected),
                 [&chain](const file_entry& e) { return !e.is_directory && matches(e, chain); });
    return selected;
}

void filter_engine::sort_entries(std::vector<file_entry>& entries, sort_key key,
                                 bool descending) {
    auto less = [key](const file_entry& a, const file_entry& b) {
        switch (key) {
            case sort_key::size:
                return a.size < b.size;
            case sort_key::modified:
                return a.modified_at < b.modified_at;
            case sort_key::name:
            default:
                return to_lower(a.name()) < to_lower(b.name());
        }
    };

    if (descending) {
        std::stable_sort(entries.begin(), entries.end(),
                         [&less](const file_entry& a, const file_entry& b) { return less(b, a); });
    } else {
        std::stable_sort(entries.begin(), entries.end(), less);
    }
}

auto filter_engine::total_size(std::span<const file_entry> entries) -> uint64_t {
    return std::accumulate(entries.begin(), entries.end(), uint64_t{0},
                           [](uint64_t sum, const file_entry& e) {
                               return e.is_directory ? sum : sum + e.size;
                           });
}

auto filter_engine::format_size(uint64_t bytes) -> std::string {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};

    auto size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2) << size << " " << unit;
            return oss.str();
        }
        size /= 1024.0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " PB";
    return oss.str();
}

auto filter_engine::parse_date(const std::string& text)
    -> result<std::chrono::system_clock::time_point> {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), 'T', ' ');
    bool has_time = normalized.find(' ') != std::string::npos;

    std::tm tm_buf{};
    std::istringstream iss(normalized);
    iss >> std::get_time(&tm_buf, has_time ? "%Y-%m-%d %H:%M:%S" : "%Y-%m-%d");
    if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) {
        return unexpected{error{error_code::invalid_date,
                                "unsupported date '" + text +
                                    "', expected YYYY-MM-DD or YYYY-MM-DD HH:MM:SS"}};
    }

    int expected_month = tm_buf.tm_mon;
    int expected_day = tm_buf.tm_mday;
    tm_buf.tm_isdst = -1;
    std::time_t t = std::mktime(&tm_buf);
    if (t == static_cast<std::time_t>(-1) || tm_buf.tm_mon != expected_month ||
        tm_buf.tm_mday != expected_day) {
        return unexpected{error{error_code::invalid_date, "date out of range: " + text}};
    }
    return std::chrono::system_clock::from_time_t(t);
}

}  // namespace kcenon::log_collector
