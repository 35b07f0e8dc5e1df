/**
 * @file collection_orchestrator.cpp
 * @brief Implementation of the collection job worker
 */

#include <kcenon/log_collector/orchestrator/collection_orchestrator.h>
#include <kcenon/log_collector/compression/compression_handler.h>
#include <kcenon/log_collector/config/validation.h>
#include <kcenon/log_collector/core/checksum.h>
#include <kcenon/log_collector/core/disk_space_monitor.h>
#include <kcenon/log_collector/core/logging.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace kcenon::log_collector {

namespace {

/**
 * @brief Errors that end the whole job instead of one file
 */
auto is_terminal_failure(const error& err) -> bool {
    return err.code == error_code::insufficient_space ||
           err.code == error_code::channel_unavailable || is_connection_error(err.code);
}

auto copy_failure(const std::error_code& ec, const std::string& what) -> error {
    auto code = error_code::file_write_error;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = error_code::transfer_permission_denied;
    } else if (ec == std::errc::no_such_file_or_directory) {
        code = error_code::file_not_found;
    } else if (ec == std::errc::no_space_on_device) {
        code = error_code::insufficient_space;
    }
    return error{code, what + ": " + ec.message()};
}

auto is_inside_root(const std::string& relative) -> bool {
    if (relative.empty() || relative.front() == '/') {
        return false;
    }
    for (const auto& part : std::filesystem::path(relative)) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

/**
 * @brief Discovered files of one source and how they will be collected
 */
struct source_plan {
    source_spec source;
    std::vector<file_entry> entries;
    uint64_t total_bytes = 0;
    uint64_t progress_base = 0;
    bool remote_compress = false;
};

/**
 * @brief A file copied to this machine during per-file transfer
 */
struct copied_file {
    file_entry source;
    std::filesystem::path local_path;
    bool deletable = false;
};

struct job_record {
    collection_job job;
    collection_request request;
    cancellation_token cancel;
};

}  // namespace

struct collection_orchestrator::impl {
    orchestrator_config config;
    connection_session* session = nullptr;
    std::shared_ptr<event_channel> events;
    compression_handler compressor;

    mutable std::mutex mutex;
    std::condition_variable job_cv;
    std::unordered_map<job_id, std::shared_ptr<job_record>> jobs;
    std::optional<job_id> active;
    uint64_t next_id = 1;
    std::thread worker;

    impl(orchestrator_config c, connection_session* s, std::shared_ptr<event_channel> e)
        : config(std::move(c)),
          session(s),
          events(std::move(e)),
          compressor(compression_settings{config.compression_level, config.buffer_size,
                                          config.remote_compress_command,
                                          config.compression_timeout}) {}

    void run(std::shared_ptr<job_record> record);

    auto find(const job_id& id) const -> std::shared_ptr<job_record> {
        auto it = jobs.find(id);
        return it == jobs.end() ? nullptr : it->second;
    }
};

// ============================================================================
// Job worker
// ============================================================================

namespace {

class job_runner {
public:
    job_runner(const orchestrator_config& config, connection_session* session,
               event_channel& events, compression_handler& compressor,
               std::shared_ptr<job_record> record, std::mutex& mutex,
               std::condition_variable& cv, std::optional<job_id>& active)
        : config_(config),
          session_(session),
          events_(events),
          compressor_(compressor),
          record_(std::move(record)),
          mutex_(mutex),
          cv_(cv),
          active_(active),
          id_(record_->job.id),
          request_(record_->request),
          cancel_(record_->cancel) {}

    void run();

private:
    // State updates

    template <typename Fn>
    void update(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(record_->job);
    }

    auto context() const -> collection_log_context {
        collection_log_context ctx;
        ctx.job_id = id_.value;
        return ctx;
    }

    void set_phase(job_phase phase) {
        update([phase](collection_job& job) { job.phase = phase; });
        auto ctx = context();
        ctx.phase = to_string(phase);
        LC_LOG_DEBUG_CTX(log_category::orchestrator, "Entering phase", ctx);
    }

    void record_error(collection_error err) {
        auto ctx = context();
        ctx.file_path = err.file_path;
        ctx.error_message = err.message;
        LC_LOG_WARN_CTX(log_category::orchestrator, "Recoverable collection error", ctx);
        update([&err](collection_job& job) { job.errors.push_back(std::move(err)); });
    }

    void record_error(const error& err, const std::string& path) {
        record_error(collection_error::from(err, path, true));
    }

    /**
     * @brief Move progress forward to value (never backwards, never past total)
     */
    void advance(uint64_t value, const std::string& current_file) {
        job_progress event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& job = record_->job;
            auto capped = std::min(value, job.total_bytes);
            job.transferred_bytes = std::max(job.transferred_bytes, capped);
            if (!current_file.empty()) {
                job.current_file = current_file;
            }
            event = {id_, job.transferred_bytes, job.total_bytes, job.current_file, job.phase};
        }
        events_.publish(std::move(event));
    }

    void finish(job_status status, std::optional<error> reason = std::nullopt) {
        collection_job summary;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& job = record_->job;
            job.status = status;
            job.finished_at = std::chrono::system_clock::now();
            job.terminal_error = reason;
            job.current_file.clear();
            summary = job;
            if (active_ && *active_ == id_) {
                active_.reset();
            }
        }
        cv_.notify_all();

        auto ctx = context();
        ctx.bytes_transferred = summary.transferred_bytes;
        ctx.total_bytes = summary.total_bytes;
        ctx.duration_ms = static_cast<uint64_t>(summary.duration().count());
        if (status == job_status::completed) {
            LC_LOG_INFO_CTX(log_category::orchestrator,
                            "Collection completed with " + std::to_string(summary.errors.size()) +
                                " recoverable errors",
                            ctx);
            events_.publish(job_completed{std::move(summary)});
        } else if (status == job_status::cancelled) {
            LC_LOG_INFO_CTX(log_category::orchestrator,
                            "Collection cancelled; collected files are kept", ctx);
            events_.publish(job_cancelled{std::move(summary)});
        } else {
            ctx.error_message = reason ? reason->message : "unknown";
            LC_LOG_ERROR_CTX(log_category::orchestrator, "Collection failed", ctx);
            auto failure = reason.value_or(error{error_code::job_failed, "collection failed"});
            events_.publish(job_failed{id_, failure, std::move(summary)});
        }
    }

    auto cancelled() const -> bool { return cancel_.is_cancelled(); }

    void warn_space(const std::string& location, const space_info& info, uint64_t required) {
        if (!disk_space_monitor::needs_warning(info, required, config_.space_warning_margin)) {
            return;
        }
        LC_LOG_WARN(log_category::disk,
                    location + " is close to full: " +
                        filter_engine::format_size(info.available) + " available for " +
                        filter_engine::format_size(required));
        events_.publish(disk_space_warning{id_, location, info.available, required});
    }

    // Phases

    auto discover(const source_spec& source) -> result<std::vector<file_entry>>;
    auto check_space(std::vector<source_plan>& plans, uint64_t total) -> result<void>;
    auto create_destination() -> result<std::filesystem::path>;
    auto collect(source_plan& plan) -> result<void>;
    auto collect_remote_archive(source_plan& plan) -> result<std::optional<std::vector<file_entry>>>;
    auto download(const std::string& remote_path, const std::filesystem::path& target,
                  const download_progress_callback& progress) -> result<uint64_t>;
    auto copy_files(source_plan& plan, const std::filesystem::path& staging)
        -> result<std::vector<copied_file>>;
    auto copy_one(const source_plan& plan, const file_entry& entry,
                  const std::filesystem::path& target) -> result<uint64_t>;
    auto archive_copies(source_plan& plan, std::vector<copied_file>& copies,
                        const std::filesystem::path& staging) -> result<std::vector<file_entry>>;
    void delete_sources(const source_plan& plan, const std::vector<file_entry>& confirmed);

    const orchestrator_config& config_;
    connection_session* session_;
    event_channel& events_;
    compression_handler& compressor_;
    std::shared_ptr<job_record> record_;
    std::mutex& mutex_;
    std::condition_variable& cv_;
    std::optional<job_id>& active_;
    job_id id_;
    const collection_request& request_;
    cancellation_token cancel_;
    std::chrono::system_clock::time_point started_at_{};
    std::filesystem::path destination_;
};

void job_runner::run() {
    started_at_ = std::chrono::system_clock::now();
    update([this](collection_job& job) {
        if (job.status == job_status::pending) {
            job.status = job_status::running;
        }
        job.started_at = started_at_;
    });

    auto ctx = context();
    ctx.file_path = request_.destination_root.string();
    LC_LOG_INFO_CTX(log_category::orchestrator,
                    "Collection started: " + std::to_string(request_.sources.size()) +
                        " sources, compress=" + (request_.compress ? "true" : "false") +
                        ", delete_after_collect=" +
                        (request_.delete_after_collect ? "true" : "false"),
                    ctx);

    // Discovering
    set_phase(job_phase::discovering);
    std::vector<source_plan> plans;
    uint64_t total = 0;
    std::size_t file_count = 0;
    for (const auto& source : request_.sources) {
        if (cancelled()) {
            finish(job_status::cancelled);
            return;
        }
        auto entries = discover(source);
        if (!entries) {
            if (entries.error().code == error_code::job_cancelled || cancelled()) {
                finish(job_status::cancelled);
            } else {
                finish(job_status::failed, entries.error());
            }
            return;
        }

        source_plan plan;
        plan.source = source;
        plan.entries = std::move(entries.value());
        plan.total_bytes = filter_engine::total_size(plan.entries);
        plan.progress_base = total;
        plan.remote_compress = request_.compress && source.is_remote();
        total += plan.total_bytes;
        file_count += plan.entries.size();
        plans.push_back(std::move(plan));
    }
    if (cancelled()) {
        finish(job_status::cancelled);
        return;
    }

    update([total, file_count](collection_job& job) {
        job.total_bytes = total;
        job.files_discovered = file_count;
    });
    advance(0, {});

    // Space checking
    set_phase(job_phase::space_checking);
    if (auto space = check_space(plans, total); !space) {
        finish(job_status::failed, space.error());
        return;
    }
    if (cancelled()) {
        finish(job_status::cancelled);
        return;
    }

    auto destination = create_destination();
    if (!destination) {
        finish(job_status::failed, destination.error());
        return;
    }
    destination_ = destination.value();
    update([this](collection_job& job) { job.destination = destination_; });

    for (auto& plan : plans) {
        if (cancelled()) {
            break;
        }
        if (plan.entries.empty()) {
            LC_LOG_INFO(log_category::orchestrator,
                        "No matching files in " + plan.source.label);
            continue;
        }
        if (auto collected = collect(plan); !collected) {
            if (collected.error().code == error_code::job_cancelled || cancelled()) {
                break;
            }
            finish(job_status::failed, collected.error());
            return;
        }
    }

    if (cancelled()) {
        finish(job_status::cancelled);
        return;
    }

    set_phase(job_phase::finalizing);
    finish(job_status::completed);
}

auto job_runner::discover(const source_spec& source) -> result<std::vector<file_entry>> {
    // The stream retries a dropped listing itself; an error here is final
    auto stream = discovery_engine::discover(source, request_.filters,
                                             source.is_remote() ? session_ : nullptr, cancel_);
    if (!stream) {
        return unexpected{stream.error()};
    }

    std::vector<file_entry> entries;
    for (;;) {
        auto next = stream.value().next();
        if (!next) {
            return unexpected{next.error()};
        }
        if (!next.value()) {
            break;
        }
        entries.push_back(std::move(*next.value()));
    }

    for (const auto& err : stream.value().errors()) {
        record_error(err);
    }
    LC_LOG_INFO(log_category::orchestrator,
                "Discovered " + std::to_string(entries.size()) + " files (" +
                    filter_engine::format_size(filter_engine::total_size(entries)) + ") in " +
                    source.label);
    return entries;
}

auto job_runner::check_space(std::vector<source_plan>& plans, uint64_t total) -> result<void> {
    auto local = disk_space_monitor::check_local(request_.destination_root, total);
    if (!local) {
        if (local.error().code == error_code::insufficient_space) {
            return unexpected{local.error()};
        }
        LC_LOG_WARN(log_category::disk,
                    "Could not check destination space: " + local.error().message);
    } else {
        warn_space(request_.destination_root.string(), local.value(), total);
    }

    for (auto& plan : plans) {
        if (!plan.remote_compress || plan.entries.empty()) {
            continue;
        }
        auto remote = disk_space_monitor::check_remote(*session_,
                                                       config_.remote_temp_dir,
                                                       plan.total_bytes);
        if (!remote) {
            if (is_connection_error(remote.error().code) ||
                remote.error().code == error_code::channel_unavailable) {
                return unexpected{remote.error()};
            }
            plan.remote_compress = false;
            record_error(error{remote.error().code,
                               "remote compression skipped: " + remote.error().message},
                         config_.remote_temp_dir);
            LC_LOG_INFO(log_category::orchestrator,
                        "Using per-file transfer for " + plan.source.label);
        }
    }
    return {};
}

auto job_runner::create_destination() -> result<std::filesystem::path> {
    auto base = request_.destination_root / compression_handler::timestamp(started_at_);
    auto candidate = base;
    std::error_code ec;
    for (int suffix = 2; std::filesystem::exists(candidate, ec); ++suffix) {
        candidate = base;
        candidate += "_" + std::to_string(suffix);
    }

    std::filesystem::create_directories(candidate, ec);
    if (ec) {
        return unexpected{copy_failure(ec, "cannot create " + candidate.string())};
    }
    return candidate;
}

auto job_runner::collect(source_plan& plan) -> result<void> {
    auto ctx = context();
    ctx.source_label = plan.source.label;
    ctx.total_bytes = plan.total_bytes;

    std::vector<file_entry> confirmed;
    bool archived_remotely = false;

    if (plan.remote_compress) {
        LC_LOG_INFO_CTX(log_category::orchestrator, "Strategy: compress on remote host", ctx);
        auto archived = collect_remote_archive(plan);
        if (!archived) {
            return unexpected{archived.error()};
        }
        if (archived.value()) {
            confirmed = std::move(*archived.value());
            archived_remotely = true;
        } else {
            LC_LOG_WARN_CTX(log_category::orchestrator,
                            "Remote compression unavailable, falling back to per-file transfer",
                            ctx);
        }
    }

    if (!archived_remotely) {
        if (!plan.remote_compress) {
            LC_LOG_INFO_CTX(log_category::orchestrator,
                            request_.compress ? "Strategy: copy files, then archive locally"
                                              : "Strategy: copy files",
                            ctx);
        }

        auto label_dir = sanitize_filename(plan.source.label);
        auto staging = request_.compress ? destination_ / ("." + label_dir + ".staging")
                                         : destination_ / label_dir;

        auto copies = copy_files(plan, staging);
        if (!copies) {
            return unexpected{copies.error()};
        }
        if (cancelled()) {
            // Copies stay in place as the partial result
            return {};
        }

        if (request_.compress && !copies.value().empty()) {
            auto archived = archive_copies(plan, copies.value(), staging);
            if (!archived) {
                return unexpected{archived.error()};
            }
            confirmed = std::move(archived.value());
        } else {
            for (const auto& copy : copies.value()) {
                if (copy.deletable) {
                    confirmed.push_back(copy.source);
                }
            }
        }
    }

    advance(plan.progress_base + plan.total_bytes, {});

    if (request_.delete_after_collect && !cancelled()) {
        delete_sources(plan, confirmed);
    }
    return {};
}

auto job_runner::collect_remote_archive(source_plan& plan)
    -> result<std::optional<std::vector<file_entry>>> {
    auto* session = session_;
    const auto name = compression_handler::archive_name(plan.source.label, started_at_,
                                                        archive_format::tar_gz);
    const auto remote_path = discovery_engine::join_path(config_.remote_temp_dir, name);
    const auto root = plan.source.root_path;

    set_phase(job_phase::compressing);
    auto archive = compressor_.compress_remote(*session, plan.entries, root, remote_path,
                                                     cancel_);
    if (!archive) {
        const auto& err = archive.error();
        if (err.code == error_code::job_cancelled) {
            return unexpected{err};
        }
        if (is_connection_error(err.code) || err.code == error_code::channel_unavailable) {
            if (!session->check_alive()) {
                return unexpected{error{error_code::channel_unavailable,
                                        "connection lost during remote compression: " +
                                            err.message}};
            }
        }
        record_error(err, remote_path);
        return std::optional<std::vector<file_entry>>{};
    }

    auto remove_remote = [&] {
        auto removed = session->with_channel(
            [&](remote_channel& channel) { return channel.remove(remote_path); });
        if (!removed) {
            LC_LOG_WARN(log_category::orchestrator,
                        "Could not remove remote archive " + remote_path + ": " +
                            removed.error().message);
        }
    };

    set_phase(job_phase::downloading);
    const auto local_archive = destination_ / name;
    const auto archive_size = std::max<uint64_t>(archive.value().size, 1);
    uint64_t last_published = 0;
    const uint64_t step = std::max<uint64_t>(plan.total_bytes / 100, 1);
    auto progress = [&](uint64_t done, uint64_t) {
        auto scaled = static_cast<uint64_t>(static_cast<double>(done) /
                                            static_cast<double>(archive_size) *
                                            static_cast<double>(plan.total_bytes));
        if (scaled - last_published >= step || done >= archive_size) {
            last_published = scaled;
            advance(plan.progress_base + scaled, name);
        }
    };

    auto downloaded = download(remote_path, local_archive, progress);
    if (!downloaded) {
        if (is_terminal_failure(downloaded.error())) {
            return unexpected{downloaded.error()};
        }
        remove_remote();
        record_error(downloaded.error(), remote_path);
        return std::optional<std::vector<file_entry>>{};
    }
    remove_remote();

    auto members = compression_handler::verify_archive(local_archive);
    if (!members) {
        std::error_code ec;
        std::filesystem::remove(local_archive, ec);
        record_error(members.error(), local_archive.string());
        return std::optional<std::vector<file_entry>>{};
    }

    std::unordered_map<std::string, uint64_t> archived_sizes;
    for (const auto& member : members.value()) {
        archived_sizes[member.name] = member.size;
    }

    // Only members whose archived size equals the discovered size may be deleted
    std::size_t collected = 0;
    std::vector<file_entry> confirmed;
    for (const auto& entry : plan.entries) {
        auto member = archived_sizes.find(entry.path);
        if (member == archived_sizes.end()) {
            record_error(error{error_code::archive_verify_failed,
                               "missing from remote archive"},
                         entry.path);
            continue;
        }
        ++collected;
        if (member->second != entry.size) {
            record_error(error{error_code::source_changed,
                               "archived size " + std::to_string(member->second) +
                                   " differs from discovered size " +
                                   std::to_string(entry.size)},
                         entry.path);
            continue;
        }
        confirmed.push_back(entry);
    }

    update([&](collection_job& job) {
        job.produced_artifacts.push_back(local_archive);
        job.files_collected += collected;
    });
    LC_LOG_INFO(log_category::orchestrator,
                "Downloaded remote archive " + name + " (" +
                    filter_engine::format_size(downloaded.value()) + ")");
    return std::optional<std::vector<file_entry>>{std::move(confirmed)};
}

auto job_runner::download(const std::string& remote_path, const std::filesystem::path& target,
                          const download_progress_callback& progress) -> result<uint64_t> {
    auto* session = session_;
    auto partial = target;
    partial += ".part";

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return unexpected{copy_failure(ec, "cannot create " + target.parent_path().string())};
    }

    for (std::size_t attempt = 0;; ++attempt) {
        auto fetched = session->with_channel([&](remote_channel& channel) {
            return channel.download(remote_path, partial, progress);
        });
        if (fetched) {
            std::filesystem::rename(partial, target, ec);
            if (ec) {
                std::filesystem::remove(partial, ec);
                return unexpected{copy_failure(ec, "cannot finalize " + target.string())};
            }
            return fetched;
        }

        std::filesystem::remove(partial, ec);
        const auto& err = fetched.error();
        if (!is_connection_error(err.code) && err.code != error_code::channel_unavailable) {
            return fetched;
        }
        if (attempt >= config_.transfer_retry_limit || !session->check_alive()) {
            return unexpected{error{error_code::channel_unavailable,
                                    "connection lost while downloading " + remote_path + ": " +
                                        err.message}};
        }
        LC_LOG_INFO(log_category::orchestrator, "Session recovered, retrying " + remote_path);
    }
}

auto job_runner::copy_one(const source_plan& plan, const file_entry& entry,
                          const std::filesystem::path& target) -> result<uint64_t> {
    if (plan.source.is_remote()) {
        return download(entry.absolute_path, target, {});
    }

    auto partial = target;
    partial += ".part";
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return unexpected{copy_failure(ec, "cannot create " + target.parent_path().string())};
    }
    std::filesystem::copy_file(entry.absolute_path, partial,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        auto err = copy_failure(ec, "cannot copy " + entry.absolute_path);
        std::filesystem::remove(partial, ec);
        return unexpected{err};
    }
    std::filesystem::rename(partial, target, ec);
    if (ec) {
        auto err = copy_failure(ec, "cannot finalize " + target.string());
        std::filesystem::remove(partial, ec);
        return unexpected{err};
    }
    auto size = std::filesystem::file_size(target, ec);
    return ec ? uint64_t{0} : size;
}

auto job_runner::copy_files(source_plan& plan, const std::filesystem::path& staging)
    -> result<std::vector<copied_file>> {
    set_phase(job_phase::transferring_files);

    std::vector<copied_file> copies;
    uint64_t done = 0;
    uint64_t since_space_check = 0;
    const bool verify_local = request_.delete_after_collect && !plan.source.is_remote() &&
                              config_.verify_before_delete;

    for (const auto& entry : plan.entries) {
        if (cancelled()) {
            break;
        }
        update([&entry](collection_job& job) { job.current_file = entry.path; });

        const auto target = staging / std::filesystem::path(entry.path);
        auto copied = copy_one(plan, entry, target);
        if (!copied) {
            if (is_terminal_failure(copied.error())) {
                return unexpected{copied.error()};
            }
            record_error(copied.error(), entry.path);
            continue;
        }

        copied_file copy{entry, target, true};
        if (copied.value() != entry.size) {
            copy.deletable = false;
            record_error(error{error_code::source_changed,
                               "size changed from " + std::to_string(entry.size) + " to " +
                                   std::to_string(copied.value()) + " since discovery"},
                         entry.path);
        } else if (verify_local) {
            auto same = checksum::files_match(entry.absolute_path, target);
            if (!same || !same.value()) {
                copy.deletable = false;
                record_error(error{error_code::source_changed,
                                   "copy does not match source checksum"},
                             entry.path);
            }
        }
        copies.push_back(std::move(copy));

        done += entry.size;
        since_space_check += copied.value();
        advance(plan.progress_base + done, entry.path);

        if (since_space_check >= config_.space_check_interval_bytes) {
            since_space_check = 0;
            auto remaining = plan.total_bytes > done ? plan.total_bytes - done : 0;
            auto space = disk_space_monitor::check_local(staging, remaining);
            if (!space && space.error().code == error_code::insufficient_space) {
                return unexpected{space.error()};
            }
            if (space) {
                warn_space(staging.string(), space.value(), remaining);
            }
        }
    }

    if (!request_.compress) {
        update([&copies](collection_job& job) {
            for (const auto& copy : copies) {
                job.produced_artifacts.push_back(copy.local_path);
            }
            job.files_collected += copies.size();
        });
    }
    return copies;
}

auto job_runner::archive_copies(source_plan& plan, std::vector<copied_file>& copies,
                                const std::filesystem::path& staging)
    -> result<std::vector<file_entry>> {
    set_phase(job_phase::compressing);

    std::vector<file_entry> staged;
    staged.reserve(copies.size());
    for (const auto& copy : copies) {
        auto entry = copy.source;
        entry.absolute_path = copy.local_path.string();
        staged.push_back(std::move(entry));
    }

    auto format = plan.source.is_remote() ? archive_format::tar_gz : archive_format::zip;
    auto archive_path =
        destination_ / compression_handler::archive_name(plan.source.label, started_at_, format);

    auto archived = compressor_.compress_local(staged, archive_path, format);
    std::optional<std::vector<archive_member>> members;
    if (archived) {
        auto verified = compression_handler::verify_archive(archive_path);
        if (verified) {
            members = std::move(verified.value());
        } else {
            std::error_code ec;
            std::filesystem::remove(archive_path, ec);
            archived = unexpected{verified.error()};
        }
    }

    std::error_code ec;
    if (!members) {
        if (archived.error().code == error_code::insufficient_space) {
            return unexpected{archived.error()};
        }

        // Keep the copies as the result of this source
        auto label_dir = destination_ / sanitize_filename(plan.source.label);
        std::filesystem::rename(staging, label_dir, ec);
        record_error(archived.error(), archive_path.string());
        std::vector<file_entry> confirmed;
        update([&](collection_job& job) {
            for (const auto& copy : copies) {
                auto relocated = label_dir / std::filesystem::path(copy.source.path);
                job.produced_artifacts.push_back(ec ? copy.local_path : relocated);
                if (copy.deletable) {
                    confirmed.push_back(copy.source);
                }
            }
            job.files_collected += copies.size();
        });
        return confirmed;
    }

    for (auto& skipped : archived.value().skipped) {
        record_error(std::move(skipped));
    }

    std::unordered_set<std::string> names;
    for (const auto& member : *members) {
        names.insert(member.name);
    }

    std::vector<file_entry> confirmed;
    for (const auto& copy : copies) {
        if (copy.deletable && names.count(copy.source.path) != 0) {
            confirmed.push_back(copy.source);
        }
    }

    std::filesystem::remove_all(staging, ec);
    if (ec) {
        LC_LOG_WARN(log_category::orchestrator,
                    "Could not remove staging directory " + staging.string());
    }

    update([&](collection_job& job) {
        job.produced_artifacts.push_back(archive_path);
        job.files_collected += names.size();
    });
    return confirmed;
}

auto size_changed_message(uint64_t discovered, uint64_t current) -> std::string {
    return "size changed from " + std::to_string(discovered) + " to " +
           std::to_string(current) + " before deletion";
}

void job_runner::delete_sources(const source_plan& plan, const std::vector<file_entry>& confirmed) {
    if (confirmed.empty()) {
        return;
    }
    set_phase(job_phase::deleting);

    std::size_t deleted = 0;
    for (const auto& entry : confirmed) {
        if (plan.source.is_remote()) {
            auto removed =
                session_->with_channel([&](remote_channel& channel) -> result<void> {
                    auto current = channel.stat(entry.absolute_path);
                    if (!current) {
                        return unexpected{current.error()};
                    }
                    if (current.value().size != entry.size) {
                        return unexpected{error{error_code::source_changed,
                                                size_changed_message(entry.size,
                                                                     current.value().size)}};
                    }
                    return channel.remove(entry.absolute_path);
                });
            if (!removed) {
                record_error(removed.error(), entry.path);
                continue;
            }
        } else {
            std::error_code ec;
            auto current = std::filesystem::file_size(entry.absolute_path, ec);
            if (!ec && current != entry.size) {
                record_error(error{error_code::source_changed,
                                   size_changed_message(entry.size, current)},
                             entry.path);
                continue;
            }
            if (!std::filesystem::remove(entry.absolute_path, ec) || ec) {
                record_error(copy_failure(ec ? ec : std::make_error_code(
                                                        std::errc::no_such_file_or_directory),
                                          "cannot delete " + entry.absolute_path),
                             entry.path);
                continue;
            }
        }
        ++deleted;
    }

    update([deleted](collection_job& job) { job.deleted_sources += deleted; });
    LC_LOG_INFO(log_category::orchestrator,
                "Deleted " + std::to_string(deleted) + " collected files from " +
                    plan.source.label);
}

}  // namespace

void collection_orchestrator::impl::run(std::shared_ptr<job_record> record) {
    job_runner runner(config, session, *events, compressor, std::move(record), mutex, job_cv,
                      active);
    runner.run();
}

// ============================================================================
// Orchestrator
// ============================================================================

auto orchestrator_config::validate() const -> result<void> {
    if (auto r = validate_remote_path(remote_temp_dir); !r) {
        return r;
    }
    if (remote_compress_command.find("{archive}") == std::string::npos) {
        return unexpected{error{error_code::invalid_configuration,
                                "remote compress command must contain {archive}"}};
    }
    if (compression_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "compression timeout must be positive"}};
    }
    if (space_check_interval_bytes == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "space check interval must be positive"}};
    }
    if (space_warning_margin < 0.0) {
        return unexpected{error{error_code::invalid_configuration,
                                "space warning margin must not be negative"}};
    }
    if (event_queue_capacity == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "event queue capacity must be positive"}};
    }
    if (buffer_size < 1024) {
        return unexpected{error{error_code::invalid_configuration,
                                "buffer size must be at least 1024 bytes"}};
    }
    if (compression_level < 0 || compression_level > 9) {
        return unexpected{error{error_code::invalid_configuration,
                                "compression level must be within 0-9"}};
    }
    return {};
}

collection_orchestrator::collection_orchestrator(orchestrator_config config,
                                                 connection_session* session,
                                                 std::shared_ptr<event_channel> events)
    : impl_(std::make_unique<impl>(std::move(config), session, std::move(events))) {
    get_logger().initialize();
}

collection_orchestrator::collection_orchestrator(collection_orchestrator&&) noexcept = default;

auto collection_orchestrator::operator=(collection_orchestrator&& other) noexcept
    -> collection_orchestrator& {
    if (this != &other) {
        if (impl_) {
            if (auto id = active_job()) {
                (void)cancel(*id);
            }
            if (impl_->worker.joinable()) {
                impl_->worker.join();
            }
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

collection_orchestrator::~collection_orchestrator() {
    if (!impl_) {
        return;
    }
    if (auto id = active_job()) {
        (void)cancel(*id);
    }
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

auto collection_orchestrator::start_collection(const collection_request& request)
    -> result<job_id> {
    if (request.sources.empty()) {
        return unexpected{error{error_code::invalid_configuration, "no sources selected"}};
    }
    if (auto r = validate_local_path(request.destination_root, false); !r) {
        return unexpected{r.error()};
    }
    for (const auto& source : request.sources) {
        if (source.label.empty()) {
            return unexpected{error{error_code::invalid_configuration, "source label is empty"}};
        }
        if (source.is_remote()) {
            if (auto r = validate_remote_path(source.root_path); !r) {
                return unexpected{r.error()};
            }
        }
    }

    std::thread previous;
    job_id id;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->active) {
            return unexpected{error{error_code::job_already_running,
                                    "job " + std::to_string(impl_->active->value) +
                                        " is still running"}};
        }
        for (const auto& source : request.sources) {
            if (source.is_remote() &&
                (impl_->session == nullptr ||
                 impl_->session->state() == session_state::disconnected)) {
                return unexpected{error{error_code::channel_unavailable,
                                        "remote source '" + source.label +
                                            "' requires a connected session"}};
            }
        }

        id = job_id(impl_->next_id++);
        auto record = std::make_shared<job_record>();
        record->request = request;
        record->job.id = id;
        record->job.sources = request.sources;
        record->job.filters = request.filters;
        record->job.compress = request.compress;
        record->job.delete_after_collect = request.delete_after_collect;
        record->job.destination_root = request.destination_root;
        impl_->jobs.emplace(id, record);
        impl_->active = id;

        previous = std::move(impl_->worker);
        impl* owner = impl_.get();
        impl_->worker = std::thread([owner, record] { owner->run(record); });
    }
    if (previous.joinable()) {
        previous.join();
    }
    return id;
}

auto collection_orchestrator::cancel(const job_id& id) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto record = impl_->find(id);
    if (!record) {
        return unexpected{error{error_code::job_not_found,
                                "job " + std::to_string(id.value) + " not found"}};
    }
    if (record->job.is_terminal()) {
        return {};
    }
    if (record->cancel.cancel()) {
        record->job.status = job_status::cancelling;
        collection_log_context ctx;
        ctx.job_id = id.value;
        LC_LOG_INFO_CTX(log_category::orchestrator, "Cancellation requested", ctx);
    }
    return {};
}

auto collection_orchestrator::snapshot(const job_id& id) const -> result<collection_job> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto record = impl_->find(id);
    if (!record) {
        return unexpected{error{error_code::job_not_found,
                                "job " + std::to_string(id.value) + " not found"}};
    }
    return record->job;
}

auto collection_orchestrator::wait(const job_id& id, std::chrono::milliseconds timeout)
    -> result<collection_job> {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    auto record = impl_->find(id);
    if (!record) {
        return unexpected{error{error_code::job_not_found,
                                "job " + std::to_string(id.value) + " not found"}};
    }
    if (!impl_->job_cv.wait_for(lock, timeout, [&record] { return record->job.is_terminal(); })) {
        return unexpected{error{error_code::job_not_terminal,
                                "job " + std::to_string(id.value) + " is still " +
                                    to_string(record->job.status)}};
    }
    return record->job;
}

auto collection_orchestrator::acknowledge(const job_id& id) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto record = impl_->find(id);
    if (!record) {
        return unexpected{error{error_code::job_not_found,
                                "job " + std::to_string(id.value) + " not found"}};
    }
    if (!record->job.is_terminal()) {
        return unexpected{error{error_code::job_not_terminal,
                                "job " + std::to_string(id.value) + " is still " +
                                    to_string(record->job.status)}};
    }
    impl_->jobs.erase(id);
    return {};
}

auto collection_orchestrator::active_job() const -> std::optional<job_id> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->active;
}

auto collection_orchestrator::list_remote_files(const source_spec& source,
                                                const filter_chain& filters)
    -> result<discovery_listing> {
    connection_session* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        session = impl_->session;
    }
    return discovery_engine::list_remote_files(source, filters,
                                               source.is_remote() ? session : nullptr);
}

auto collection_orchestrator::delete_files(const source_spec& source,
                                           const std::vector<std::string>& paths)
    -> result<std::vector<collection_error>> {
    connection_session* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        session = impl_->session;
    }
    if (source.is_remote() && session == nullptr) {
        return unexpected{error{error_code::not_initialized,
                                "remote deletion requires a session"}};
    }

    std::vector<collection_error> failures;
    std::size_t deleted = 0;
    for (const auto& path : paths) {
        if (!is_inside_root(path)) {
            failures.push_back({path, error_code::invalid_file_path,
                                "path escapes the source root", false});
            continue;
        }

        if (source.is_remote()) {
            auto absolute = discovery_engine::join_path(source.root_path, path);
            auto removed = session->with_channel(
                [&](remote_channel& channel) { return channel.remove(absolute); });
            if (!removed) {
                if (is_connection_error(removed.error().code) ||
                    removed.error().code == error_code::channel_unavailable) {
                    return unexpected{removed.error()};
                }
                failures.push_back(collection_error::from(removed.error(), path, true));
                continue;
            }
        } else {
            std::error_code ec;
            auto absolute = std::filesystem::path(source.root_path) / path;
            if (!std::filesystem::remove(absolute, ec) || ec) {
                auto err = copy_failure(
                    ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory),
                    "cannot delete " + absolute.string());
                failures.push_back(collection_error::from(err, path, true));
                continue;
            }
        }
        ++deleted;
    }

    LC_LOG_INFO(log_category::orchestrator,
                "Deleted " + std::to_string(deleted) + " of " + std::to_string(paths.size()) +
                    " files from " + source.label);
    return failures;
}

auto collection_orchestrator::attach_session(connection_session* session) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->active) {
        return unexpected{error{error_code::job_already_running,
                                "cannot change session while a job is running"}};
    }
    impl_->session = session;
    return {};
}

auto collection_orchestrator::events() const -> std::shared_ptr<event_channel> {
    return impl_->events;
}

auto collection_orchestrator::config() const -> const orchestrator_config& {
    return impl_->config;
}

// ============================================================================
// Builder
// ============================================================================

collection_orchestrator::builder::builder() = default;

auto collection_orchestrator::builder::with_session(connection_session* session) -> builder& {
    session_ = session;
    return *this;
}

auto collection_orchestrator::builder::with_config(orchestrator_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto collection_orchestrator::builder::with_event_channel(std::shared_ptr<event_channel> events)
    -> builder& {
    events_ = std::move(events);
    return *this;
}

auto collection_orchestrator::builder::with_remote_temp_dir(std::string dir) -> builder& {
    config_.remote_temp_dir = std::move(dir);
    return *this;
}

auto collection_orchestrator::builder::with_remote_compress_command(std::string command_template)
    -> builder& {
    config_.remote_compress_command = std::move(command_template);
    return *this;
}

auto collection_orchestrator::builder::with_compression_level(int level) -> builder& {
    config_.compression_level = level;
    return *this;
}

auto collection_orchestrator::builder::build() -> result<collection_orchestrator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }
    auto events = events_ ? events_ : std::make_shared<event_channel>(config_.event_queue_capacity);
    return result<collection_orchestrator>(
        collection_orchestrator(config_, session_, std::move(events)));
}

}  // namespace kcenon::log_collector
