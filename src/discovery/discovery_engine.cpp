/**
 * @file discovery_engine.cpp
 * @brief Implementation of remote and local source discovery
 */

#include <kcenon/log_collector/discovery/discovery_engine.h>
#include <kcenon/log_collector/core/logging.h>

#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace kcenon::log_collector {

namespace {

auto fs_error(const std::error_code& ec, const std::filesystem::path& path) -> error {
    auto code = error_code::file_read_error;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = error_code::permission_denied;
    } else if (ec == std::errc::no_such_file_or_directory) {
        code = error_code::file_not_found;
    }
    return error{code, path.string() + ": " + ec.message()};
}

auto to_system_time(std::filesystem::file_time_type ftime)
    -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

auto list_local(const std::filesystem::path& dir) -> result<std::vector<remote_entry>> {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return unexpected{fs_error(ec, dir)};
    }

    std::vector<remote_entry> entries;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return unexpected{fs_error(ec, dir)};
        }

        remote_entry entry;
        entry.name = it->path().filename().string();

        std::error_code status_ec;
        auto status = it->symlink_status(status_ec);
        if (status_ec) {
            continue;
        }
        if (std::filesystem::is_symlink(status)) {
            entry.type = remote_entry_type::symlink;
        } else if (std::filesystem::is_directory(status)) {
            entry.type = remote_entry_type::directory;
        } else if (std::filesystem::is_regular_file(status)) {
            entry.type = remote_entry_type::regular;
            entry.size = it->file_size(status_ec);
            if (status_ec) {
                // Removed while listing
                continue;
            }
        } else {
            entry.type = remote_entry_type::other;
        }

        auto last_write = it->last_write_time(status_ec);
        if (!status_ec) {
            entry.modified_at = to_system_time(last_write);
        }
        entries.push_back(std::move(entry));
    }
    if (ec) {
        return unexpected{fs_error(ec, dir)};
    }
    return entries;
}

auto normalize_remote_root(std::string root) -> std::string {
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }
    return root;
}

// Listings retried after the session recovers from a dropped link
constexpr std::size_t max_listing_retries = 3;

}  // namespace

struct discovery_stream::impl {
    struct frame {
        std::string relative;
        std::vector<remote_entry> children;
        std::size_t cursor = 0;
    };

    source_spec source;
    std::string root;
    filter_chain filters;
    connection_session* session = nullptr;
    cancellation_token cancel;

    std::vector<frame> stack;
    std::unordered_set<std::string> visited;
    std::vector<collection_error> errors;
    std::size_t directories = 0;
    std::size_t yielded = 0;
    bool is_exhausted = false;
    bool was_cancelled = false;

    [[nodiscard]] auto absolute(const std::string& relative) const -> std::string {
        if (source.is_remote()) {
            return discovery_engine::join_path(root, relative);
        }
        if (relative.empty()) {
            return root;
        }
        return (std::filesystem::path(root) / relative).lexically_normal().string();
    }

    auto list(const std::string& relative) -> result<std::vector<remote_entry>> {
        auto path = absolute(relative);
        result<std::vector<remote_entry>> listed =
            source.is_remote()
                ? session->with_channel([&path](remote_channel& channel) {
                      return channel.list_directory(path);
                  })
                : list_local(path);
        if (!listed) {
            return listed;
        }

        ++directories;
        auto entries = std::move(listed.value());
        std::sort(entries.begin(), entries.end(),
                  [](const remote_entry& a, const remote_entry& b) { return a.name < b.name; });
        return entries;
    }

    /**
     * @brief list() that waits out a dropped link instead of failing
     *
     * The stack and visited set are untouched, so a recovered session
     * continues with the directory that failed.
     */
    auto list_recovering(const std::string& relative) -> result<std::vector<remote_entry>> {
        auto listed = list(relative);
        for (std::size_t attempt = 0;
             !listed && is_connection_error(listed.error().code) && source.is_remote() &&
             attempt < max_listing_retries && !cancel.is_cancelled();
             ++attempt) {
            if (!session->check_alive()) {
                break;
            }
            collection_log_context ctx;
            ctx.source_label = source.label;
            ctx.file_path = absolute(relative);
            LC_LOG_INFO_CTX(log_category::discovery, "Session recovered, retrying listing", ctx);
            listed = list(relative);
        }
        return listed;
    }

    void finish() {
        if (is_exhausted) {
            return;
        }
        is_exhausted = true;
        stack.clear();

        collection_log_context ctx;
        ctx.source_label = source.label;
        ctx.file_path = root;
        if (was_cancelled) {
            LC_LOG_INFO_CTX(log_category::discovery,
                            "Discovery cancelled after " + std::to_string(yielded) + " files",
                            ctx);
        } else {
            LC_LOG_DEBUG_CTX(log_category::discovery,
                             "Discovery finished: " + std::to_string(yielded) + " files in " +
                                 std::to_string(directories) + " directories, " +
                                 std::to_string(errors.size()) + " errors",
                             ctx);
        }
    }

    auto stop_if_cancelled() -> bool {
        if (cancel.is_cancelled()) {
            was_cancelled = true;
            finish();
            return true;
        }
        return false;
    }
};

discovery_stream::discovery_stream() : impl_(std::make_unique<impl>()) {}

discovery_stream::discovery_stream(discovery_stream&&) noexcept = default;
auto discovery_stream::operator=(discovery_stream&&) noexcept -> discovery_stream& = default;
discovery_stream::~discovery_stream() = default;

auto discovery_stream::next() -> result<std::optional<file_entry>> {
    auto& state = *impl_;

    while (!state.is_exhausted) {
        if (state.stop_if_cancelled()) {
            break;
        }
        if (state.stack.empty()) {
            state.finish();
            break;
        }

        auto& top = state.stack.back();
        if (top.cursor >= top.children.size()) {
            state.stack.pop_back();
            continue;
        }

        const auto child = top.children[top.cursor++];
        auto relative = top.relative.empty() ? child.name : top.relative + "/" + child.name;

        if (child.type == remote_entry_type::directory) {
            auto absolute = state.absolute(relative);
            if (!state.visited.insert(absolute).second) {
                continue;
            }

            auto listed = state.list_recovering(relative);
            if (!listed) {
                if (is_connection_error(listed.error().code)) {
                    state.finish();
                    return unexpected{listed.error()};
                }
                collection_log_context ctx;
                ctx.source_label = state.source.label;
                ctx.file_path = absolute;
                ctx.error_message = listed.error().message;
                LC_LOG_WARN_CTX(log_category::discovery, "Skipping unreadable directory", ctx);
                state.errors.push_back(
                    collection_error::from(listed.error(), relative, true));
                continue;
            }
            state.stack.push_back({std::move(relative), std::move(listed.value()), 0});
            continue;
        }

        // Links are not followed and special files are never collected
        if (child.type != remote_entry_type::regular) {
            continue;
        }

        file_entry entry;
        entry.path = relative;
        entry.absolute_path = state.absolute(relative);
        entry.size = child.size;
        entry.modified_at = child.modified_at;
        entry.is_directory = false;

        if (!filter_engine::matches(entry, state.filters)) {
            continue;
        }
        if (!state.visited.insert(entry.absolute_path).second) {
            continue;
        }
        ++state.yielded;
        return std::optional<file_entry>{std::move(entry)};
    }

    return std::optional<file_entry>{};
}

auto discovery_stream::errors() const -> const std::vector<collection_error>& {
    return impl_->errors;
}

auto discovery_stream::exhausted() const -> bool {
    return impl_->is_exhausted;
}

auto discovery_stream::cancelled() const -> bool {
    return impl_->was_cancelled;
}

auto discovery_stream::directories_visited() const -> std::size_t {
    return impl_->directories;
}

auto discovery_engine::discover(const source_spec& source, const filter_chain& filters,
                                connection_session* session, cancellation_token cancel)
    -> result<discovery_stream> {
    if (source.root_path.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "source '" + source.label + "' has an empty root path"}};
    }
    if (source.is_remote() && session == nullptr) {
        return unexpected{error{error_code::not_initialized,
                                "remote source '" + source.label + "' requires a session"}};
    }

    discovery_stream stream;
    auto& state = *stream.impl_;
    state.source = source;
    state.root = source.is_remote() ? normalize_remote_root(source.root_path)
                                    : std::filesystem::path(source.root_path)
                                          .lexically_normal()
                                          .string();
    state.filters = filters;
    state.session = session;
    state.cancel = std::move(cancel);

    collection_log_context ctx;
    ctx.source_label = source.label;
    ctx.file_path = state.root;
    LC_LOG_DEBUG_CTX(log_category::discovery,
                     std::string("Discovering ") + to_string(source.kind) + " source", ctx);

    auto root_listing = state.list_recovering({});
    if (!root_listing) {
        if (is_connection_error(root_listing.error().code)) {
            return unexpected{root_listing.error()};
        }
        ctx.error_message = root_listing.error().message;
        LC_LOG_ERROR_CTX(log_category::discovery, "Source root is inaccessible", ctx);
        return unexpected{error{error_code::root_inaccessible,
                                "cannot read source root " + state.root + ": " +
                                    root_listing.error().message}};
    }

    state.visited.insert(state.absolute({}));
    state.stack.push_back({std::string{}, std::move(root_listing.value()), 0});
    return result<discovery_stream>(std::move(stream));
}

auto discovery_engine::list_remote_files(const source_spec& source, const filter_chain& filters,
                                         connection_session* session,
                                         cancellation_token cancel)
    -> result<discovery_listing> {
    auto stream = discover(source, filters, session, std::move(cancel));
    if (!stream) {
        return unexpected{stream.error()};
    }

    discovery_listing listing;
    for (;;) {
        auto next = stream.value().next();
        if (!next) {
            return unexpected{next.error()};
        }
        if (!next.value()) {
            break;
        }
        listing.entries.push_back(std::move(*next.value()));
    }
    listing.errors = stream.value().errors();
    return listing;
}

auto discovery_engine::join_path(const std::string& root, const std::string& relative)
    -> std::string {
    if (relative.empty()) {
        return root;
    }
    if (!root.empty() && root.back() == '/') {
        return root + relative;
    }
    return root + "/" + relative;
}

}  // namespace kcenon::log_collector
