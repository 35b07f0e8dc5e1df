/**
 * @file filter_engine.h
 * @brief Predicates that decide which discovered files are collected
 */

#ifndef KCENON_LOG_COLLECTOR_CORE_FILTER_ENGINE_H
#define KCENON_LOG_COLLECTOR_CORE_FILTER_ENGINE_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <vector>

#include "kcenon/log_collector/core/source_types.h"
#include "kcenon/log_collector/core/types.h"

namespace kcenon::log_collector {

/**
 * @brief Filter modes
 */
enum class filter_mode {
    all,         ///< Every file qualifies
    pattern,     ///< Filename contains a match of a regular expression
    date_since,  ///< Modified at or after a point in time
    extension,   ///< Filename ends with one of a set of extensions
    size_range   ///< Size within [min, max]
};

[[nodiscard]] constexpr auto to_string(filter_mode mode) -> const char* {
    switch (mode) {
        case filter_mode::all: return "all";
        case filter_mode::pattern: return "pattern";
        case filter_mode::date_since: return "date_since";
        case filter_mode::extension: return "extension";
        case filter_mode::size_range: return "size_range";
        default: return "unknown";
    }
}

/**
 * @brief One filter predicate
 *
 * Built only through the factories below, so a pattern config always
 * holds a compiled expression. Invalid input is rejected when the filter
 * is created, never during traversal.
 */
class filter_config {
public:
    filter_config() = default;

    [[nodiscard]] static auto all() -> filter_config;

    /**
     * @brief Match filenames against a regular expression
     * @param expression ECMAScript regex; a match anywhere in the name counts
     * @return The filter, or invalid_filter_pattern
     */
    [[nodiscard]] static auto pattern(const std::string& expression) -> result<filter_config>;

    [[nodiscard]] static auto date_since(std::chrono::system_clock::time_point since)
        -> filter_config;

    /**
     * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS"
     *
     * The value is read as local time.
     */
    [[nodiscard]] static auto date_since(const std::string& text) -> result<filter_config>;

    /**
     * @brief Match case-insensitively on extension; a leading dot is optional
     */
    [[nodiscard]] static auto extensions(std::vector<std::string> allowed)
        -> result<filter_config>;

    [[nodiscard]] static auto size_range(uint64_t min_size,
                                         std::optional<uint64_t> max_size = std::nullopt)
        -> result<filter_config>;

    [[nodiscard]] auto mode() const -> filter_mode { return mode_; }
    [[nodiscard]] auto expression() const -> const std::string& { return expression_; }
    [[nodiscard]] auto since() const -> std::chrono::system_clock::time_point { return since_; }
    [[nodiscard]] auto allowed_extensions() const -> const std::vector<std::string>& {
        return extensions_;
    }
    [[nodiscard]] auto min_size() const -> uint64_t { return min_size_; }
    [[nodiscard]] auto max_size() const -> std::optional<uint64_t> { return max_size_; }

    /**
     * @brief Human readable description for logs
     */
    [[nodiscard]] auto describe() const -> std::string;

private:
    friend class filter_engine;

    filter_mode mode_ = filter_mode::all;
    std::string expression_;
    std::shared_ptr<const std::regex> regex_;
    std::chrono::system_clock::time_point since_{};
    std::vector<std::string> extensions_;
    uint64_t min_size_ = 0;
    std::optional<uint64_t> max_size_;
};

/**
 * @brief A set of predicates that must all hold
 */
using filter_chain = std::vector<filter_config>;

/**
 * @brief Sort keys for listings
 */
enum class sort_key {
    name,
    size,
    modified
};

/**
 * @brief Pure predicate evaluation over discovered entries
 */
class filter_engine {
public:
    /**
     * @brief Evaluate one predicate
     *
     * Directories always match: filters decide inclusion of leaf files,
     * never whether traversal descends.
     */
    [[nodiscard]] static auto matches(const file_entry& entry, const filter_config& config)
        -> bool;

    /**
     * @brief Evaluate every predicate of a chain (AND); empty chain matches
     */
    [[nodiscard]] static auto matches(const file_entry& entry, const filter_chain& chain)
        -> bool;

    [[nodiscard]] static auto apply(std::span<const file_entry> entries,
                                    const filter_chain& chain) -> std::vector<file_entry>;

    /**
     * @brief Sort entries in place; names compare case-insensitively
     */
    static void sort_entries(std::vector<file_entry>& entries, sort_key key,
                             bool descending = false);

    [[nodiscard]] static auto total_size(std::span<const file_entry> entries) -> uint64_t;

    /**
     * @brief Format a byte count as "1.50 MB"
     */
    [[nodiscard]] static auto format_size(uint64_t bytes) -> std::string;

    /**
     * @brief Parse a local date or date-time string
     */
    [[nodiscard]] static auto parse_date(const std::string& text)
        -> result<std::chrono::system_clock::time_point>;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_CORE_FILTER_ENGINE_H
