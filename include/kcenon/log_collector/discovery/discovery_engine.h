/**
 * @file discovery_engine.h
 * @brief Recursive enumeration of log files below a source root
 */

#ifndef KCENON_LOG_COLLECTOR_DISCOVERY_DISCOVERY_ENGINE_H
#define KCENON_LOG_COLLECTOR_DISCOVERY_DISCOVERY_ENGINE_H

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "kcenon/log_collector/core/cancellation_token.h"
#include "kcenon/log_collector/core/filter_engine.h"
#include "kcenon/log_collector/core/source_types.h"
#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/session/connection_session.h"

namespace kcenon::log_collector {

/**
 * @brief Eager discovery result
 */
struct discovery_listing {
    std::vector<file_entry> entries;
    std::vector<collection_error> errors;

    [[nodiscard]] auto total_size() const -> uint64_t {
        return filter_engine::total_size(entries);
    }
};

/**
 * @brief Lazy, single-pass sequence of discovered files
 *
 * Directories are walked depth-first with children in name order. Each
 * call to next() lists at most the directories needed to reach the next
 * matching file, so a cancelled walk stops without listing the rest of
 * the tree.
 */
class discovery_stream {
public:
    // Non-copyable, movable
    discovery_stream(const discovery_stream&) = delete;
    auto operator=(const discovery_stream&) -> discovery_stream& = delete;
    discovery_stream(discovery_stream&&) noexcept;
    auto operator=(discovery_stream&&) noexcept -> discovery_stream&;
    ~discovery_stream();

    /**
     * @brief Advance to the next matching file
     * @return The entry, std::nullopt when exhausted or cancelled, or an
     *         error when the session is lost mid-walk
     */
    [[nodiscard]] auto next() -> result<std::optional<file_entry>>;

    /**
     * @brief Recoverable errors met so far (unreadable directories)
     */
    [[nodiscard]] auto errors() const -> const std::vector<collection_error>&;

    [[nodiscard]] auto exhausted() const -> bool;

    /**
     * @brief True when the walk stopped because of cancellation
     */
    [[nodiscard]] auto cancelled() const -> bool;

    [[nodiscard]] auto directories_visited() const -> std::size_t;

private:
    friend class discovery_engine;
    discovery_stream();

    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Creates discovery streams for remote and local sources
 */
class discovery_engine {
public:
    /**
     * @brief Start walking a source root
     * @param source Source to walk
     * @param filters Predicates every yielded file must satisfy
     * @param session Required for remote sources, ignored for local ones
     * @param cancel Checked before every directory listing and file yield
     * @return root_inaccessible when the root cannot be listed
     */
    [[nodiscard]] static auto discover(const source_spec& source, const filter_chain& filters,
                                       connection_session* session,
                                       cancellation_token cancel = cancellation_token::none())
        -> result<discovery_stream>;

    /**
     * @brief Run discover() to exhaustion
     */
    [[nodiscard]] static auto list_remote_files(const source_spec& source,
                                                const filter_chain& filters,
                                                connection_session* session,
                                                cancellation_token cancel =
                                                    cancellation_token::none())
        -> result<discovery_listing>;

    /**
     * @brief Join a source root and a relative path with '/'
     */
    [[nodiscard]] static auto join_path(const std::string& root, const std::string& relative)
        -> std::string;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_DISCOVERY_DISCOVERY_ENGINE_H
