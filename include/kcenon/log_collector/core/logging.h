// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define LOG_COLLECTOR_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::log_collector {

/**
 * @brief Log categories for the collection engine
 */
struct log_category {
    static constexpr std::string_view session = "log_collector.session";
    static constexpr std::string_view discovery = "log_collector.discovery";
    static constexpr std::string_view filter = "log_collector.filter";
    static constexpr std::string_view compression = "log_collector.compression";
    static constexpr std::string_view disk = "log_collector.disk";
    static constexpr std::string_view orchestrator = "log_collector.orchestrator";
    static constexpr std::string_view service = "log_collector.service";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * Host addresses and log paths of customer machines end up in collected
 * diagnostics, so both can be masked before a record leaves the process.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_hosts = false;
    bool mask_filenames = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, false, '*', 4};
    }
};

/**
 * @brief Masks host addresses and paths inside log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask every IPv4 address and absolute path found in a message
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths && !config_.mask_hosts) {
            return input;
        }

        std::string out = input;
        if (config_.mask_hosts) {
            static const std::regex ip_pattern(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)");
            out = replace_all(out, ip_pattern,
                              [this](const std::string& m) { return mask_host(m); });
        }
        if (config_.mask_paths) {
            static const std::regex path_pattern(R"((?:/[A-Za-z0-9._-]+)+/?)");
            out = replace_all(out, path_pattern,
                              [this](const std::string& m) { return mask_path(m); });
        }
        return out;
    }

    /**
     * @brief Mask the directory part of a path, keeping the last component
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos) {
            return config_.mask_filenames ? mask_filename(path) : path;
        }

        std::string name = path.substr(last_sep + 1);
        if (config_.mask_filenames) {
            name = mask_filename(name);
        }
        return std::string(last_sep, config_.mask_char) + "/" + name;
    }

    /**
     * @brief Mask all but the last octet of a dotted address
     */
    [[nodiscard]] auto mask_host(const std::string& host) const -> std::string {
        if (!config_.mask_hosts || host.empty()) {
            return host;
        }

        auto last_dot = host.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(host.size(), config_.mask_char);
        }
        return std::string(last_dot, config_.mask_char) + host.substr(last_dot);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern, Fn&& fn)
        -> std::string {
        std::string out;
        size_t last_pos = 0;
        for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
            auto pos = static_cast<size_t>(it->position());
            out += input.substr(last_pos, pos - last_pos);
            out += fn(it->str());
            last_pos = pos + static_cast<size_t>(it->length());
        }
        out += input.substr(last_pos);
        return out;
    }

    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        auto dot_pos = filename.find_last_of('.');
        std::string stem = (dot_pos != std::string::npos && dot_pos > 0)
                               ? filename.substr(0, dot_pos)
                               : filename;
        std::string ext = stem.size() < filename.size() ? filename.substr(stem.size()) : "";

        if (stem.size() <= config_.visible_chars) {
            return filename;
        }
        return stem.substr(0, config_.visible_chars) +
               std::string(stem.size() - config_.visible_chars, config_.mask_char) + ext;
    }

    masking_config config_;
};

/**
 * @brief Structured context attached to collection log records
 */
struct collection_log_context {
    std::optional<uint64_t> job_id;
    std::string source_label;
    std::string file_path;
    std::optional<std::string> phase;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<double> progress_percent;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;
    std::optional<std::string> host;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (job_id) add_uint("job_id", *job_id);
        if (!source_label.empty()) add_field("source", source_label);
        if (!file_path.empty()) {
            add_field("file", masker ? masker->mask_path(file_path) : file_path);
        }
        if (phase) add_field("phase", *phase);
        if (file_size) add_uint("size", *file_size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (progress_percent) {
            if (!first) oss << ",";
            oss << "\"progress_percent\":" << std::fixed << std::setprecision(2)
                << *progress_percent;
            first = false;
        }
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
        if (host) add_field("host", masker ? masker->mask_host(*host) : *host);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<collection_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json(masker ? masker->mask(message) : message)
            << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::orchestrator)
 *     .with_message("Archive downloaded")
 *     .with_job_id(7)
 *     .with_file_path("/tmp/controller_log_20250101_120000.tar.gz")
 *     .with_bytes_transferred(1048576)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() { entry_.timestamp = iso8601_now(); }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_job_id(uint64_t id) -> log_entry_builder& {
        context().job_id = id;
        return *this;
    }

    auto with_source_label(std::string_view label) -> log_entry_builder& {
        context().source_label = std::string(label);
        return *this;
    }

    auto with_file_path(std::string_view path) -> log_entry_builder& {
        context().file_path = std::string(path);
        return *this;
    }

    auto with_phase(std::string_view phase) -> log_entry_builder& {
        context().phase = std::string(phase);
        return *this;
    }

    auto with_file_size(uint64_t size) -> log_entry_builder& {
        context().file_size = size;
        return *this;
    }

    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
        context().bytes_transferred = bytes;
        return *this;
    }

    auto with_total_bytes(uint64_t bytes) -> log_entry_builder& {
        context().total_bytes = bytes;
        return *this;
    }

    auto with_progress_percent(double percent) -> log_entry_builder& {
        context().progress_percent = percent;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        context().duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view message) -> log_entry_builder& {
        context().error_message = std::string(message);
        return *this;
    }

    auto with_host(std::string_view host) -> log_entry_builder& {
        context().host = std::string(host);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const collection_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }

    [[nodiscard]] auto build_json() const -> std::string { return entry_.to_json(); }

private:
    auto context() -> collection_log_context& {
        if (!entry_.context) {
            entry_.context = collection_log_context{};
        }
        return *entry_.context;
    }

    [[nodiscard]] static auto iso8601_now() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< One line per record, context appended as JSON
    json    ///< One JSON object per record
};

/**
 * @brief Process-wide logger for the collection engine
 *
 * Records go to kcenon::logger when the library is built with the logger
 * and common systems, otherwise to stderr. Callbacks see every record
 * that passes the level filter.
 */
class collector_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const collection_log_context*)>;
    using json_log_callback =
        std::function<void(const structured_log_entry&, const std::string&)>;

    collector_logger() = default;
    ~collector_logger() = default;

    collector_logger(const collector_logger&) = delete;
    collector_logger& operator=(const collector_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called by the session, orchestrator and
     * service constructors.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef LOG_COLLECTOR_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#ifdef LOG_COLLECTOR_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef LOG_COLLECTOR_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Suppress the default stderr sink (callbacks still fire)
     */
    void set_console_output(bool enabled) { console_output_.store(enabled); }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const collection_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            write_json(builder.build(), current_masker);
        } else {
            write_text(level, category, message, context, current_masker);
        }
    }

    void log(const structured_log_entry& entry) {
        if (!is_enabled(entry.level)) return;

        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            current_masker = masker_;
        }
        write_json(entry, current_masker);
    }

    void flush() {
#ifdef LOG_COLLECTOR_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write_json(const structured_log_entry& entry, const sensitive_info_masker& masker) {
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#ifdef LOG_COLLECTOR_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(entry.level), json_str);
            return;
        }
#endif
        output_to_stderr(json_str);
    }

    void write_text(log_level level,
                    std::string_view category,
                    std::string_view message,
                    const collection_log_context* context,
                    const sensitive_info_masker& masker) {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

#ifdef LOG_COLLECTOR_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), oss.str());
            return;
        }
#endif
        output_to_stderr(local_timestamp() + " [" + std::string(log_level_to_string(level)) +
                         "] " + oss.str());
    }

    void output_to_stderr(const std::string& msg) {
        if (!console_output_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef LOG_COLLECTOR_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto local_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline collector_logger& get_logger() {
    static collector_logger instance;
    return instance;
}

#define LC_LOG(level, category, message) \
    kcenon::log_collector::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define LC_LOG_CTX(level, category, message, context) \
    kcenon::log_collector::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define LC_LOG_TRACE(category, message) \
    LC_LOG(kcenon::log_collector::log_level::trace, category, message)

#define LC_LOG_DEBUG(category, message) \
    LC_LOG(kcenon::log_collector::log_level::debug, category, message)

#define LC_LOG_INFO(category, message) \
    LC_LOG(kcenon::log_collector::log_level::info, category, message)

#define LC_LOG_WARN(category, message) \
    LC_LOG(kcenon::log_collector::log_level::warn, category, message)

#define LC_LOG_ERROR(category, message) \
    LC_LOG(kcenon::log_collector::log_level::error, category, message)

#define LC_LOG_FATAL(category, message) \
    LC_LOG(kcenon::log_collector::log_level::fatal, category, message)

#define LC_LOG_DEBUG_CTX(category, message, ctx) \
    LC_LOG_CTX(kcenon::log_collector::log_level::debug, category, message, ctx)

#define LC_LOG_INFO_CTX(category, message, ctx) \
    LC_LOG_CTX(kcenon::log_collector::log_level::info, category, message, ctx)

#define LC_LOG_WARN_CTX(category, message, ctx) \
    LC_LOG_CTX(kcenon::log_collector::log_level::warn, category, message, ctx)

#define LC_LOG_ERROR_CTX(category, message, ctx) \
    LC_LOG_CTX(kcenon::log_collector::log_level::error, category, message, ctx)

}  // namespace kcenon::log_collector
