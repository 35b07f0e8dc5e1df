/**
 * @file compression_handler.cpp
 * @brief Implementation of local (libarchive) and remote archive creation
 */

#include <kcenon/log_collector/compression/compression_handler.h>
#include <kcenon/log_collector/config/validation.h>
#include <kcenon/log_collector/core/logging.h>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace kcenon::log_collector {

namespace {

struct archive_write_deleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

struct archive_read_deleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct archive_entry_deleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using write_handle = std::unique_ptr<struct archive, archive_write_deleter>;
using read_handle = std::unique_ptr<struct archive, archive_read_deleter>;
using entry_handle = std::unique_ptr<struct archive_entry, archive_entry_deleter>;

auto archive_message(struct archive* a) -> std::string {
    const char* text = archive_error_string(a);
    return text ? text : "unknown archive error";
}

auto write_failure(struct archive* a, const std::string& what) -> error {
    auto code = archive_errno(a) == ENOSPC ? error_code::insufficient_space
                                           : error_code::local_write_failed;
    return error{code, what + ": " + archive_message(a)};
}

auto open_reader(const std::filesystem::path& path) -> result<read_handle> {
    read_handle reader(archive_read_new());
    if (!reader) {
        return unexpected{error{error_code::internal_error, "archive_read_new failed"}};
    }
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());
    if (archive_read_open_filename(reader.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        return unexpected{error{error_code::archive_verify_failed,
                                "cannot open archive " + path.string() + ": " +
                                    archive_message(reader.get())}};
    }
    return result<read_handle>(std::move(reader));
}

/**
 * @brief Member names are relative and never climb out of the destination
 */
auto is_safe_member(const std::string& name) -> bool {
    if (name.empty() || name.front() == '/') {
        return false;
    }
    std::filesystem::path path(name);
    if (path.has_root_name() || path.has_root_directory()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

}  // namespace

struct compression_handler::impl {
    compression_settings settings;
    mutable std::mutex stats_mutex;
    compression_stats totals;

    explicit impl(compression_settings s) : settings(std::move(s)) {}

    void configure_writer(struct archive* a, archive_format format) const {
        auto level = std::to_string(settings.level);
        if (format == archive_format::zip) {
            archive_write_set_format_zip(a);
            int rc = settings.level == 0
                         ? archive_write_set_format_option(a, "zip", "compression", "store")
                         : archive_write_set_format_option(a, "zip", "compression-level",
                                                           level.c_str());
            if (rc != ARCHIVE_OK) {
                LC_LOG_DEBUG(log_category::compression,
                             "zip compression level not applied: " + archive_message(a));
            }
        } else {
            archive_write_set_format_pax_restricted(a);
            archive_write_add_filter_gzip(a);
            if (archive_write_set_filter_option(a, "gzip", "compression-level", level.c_str()) !=
                ARCHIVE_OK) {
                LC_LOG_DEBUG(log_category::compression,
                             "gzip compression level not applied: " + archive_message(a));
            }
        }
    }

    /**
     * @brief Append one file; a vanished or changed source is recorded in out.skipped
     * @return An error only when the archive itself can no longer be written
     */
    auto append(struct archive* a, const file_entry& file, std::vector<char>& buffer,
                local_archive& out) -> result<void> {
        std::error_code ec;
        auto size = std::filesystem::file_size(file.absolute_path, ec);
        std::ifstream input(file.absolute_path, std::ios::binary);
        if (ec || !input) {
            auto code = ec == std::errc::permission_denied ? error_code::permission_denied
                                                           : error_code::file_not_found;
            out.skipped.push_back(
                {file.path, code, "cannot read " + file.absolute_path, true});
            LC_LOG_WARN(log_category::compression,
                        "Skipping unreadable input " + file.absolute_path);
            return {};
        }

        entry_handle entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), file.path.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_mtime(entry.get(),
                                std::chrono::system_clock::to_time_t(file.modified_at), 0);

        if (archive_write_header(a, entry.get()) != ARCHIVE_OK) {
            return unexpected{write_failure(a, "cannot add " + file.path)};
        }

        uint64_t remaining = size;
        while (remaining > 0 && input) {
            auto want = static_cast<std::streamsize>(
                std::min<uint64_t>(remaining, buffer.size()));
            input.read(buffer.data(), want);
            auto got = input.gcount();
            if (got <= 0) {
                break;
            }
            if (archive_write_data(a, buffer.data(), static_cast<std::size_t>(got)) < 0) {
                return unexpected{write_failure(a, "cannot write " + file.path)};
            }
            remaining -= static_cast<uint64_t>(got);
        }

        out.input_bytes += size - remaining;
        if (remaining > 0) {
            // Truncated while being archived; the member is padded and not trusted
            out.skipped.push_back({file.path, error_code::source_changed,
                                   file.absolute_path + " shrank while being archived", true});
            LC_LOG_WARN(log_category::compression, file.absolute_path + " changed during archiving");
            return {};
        }
        out.members.push_back(file.path);
        return {};
    }
};

compression_handler::compression_handler(compression_settings settings)
    : impl_(std::make_unique<impl>(std::move(settings))) {
    get_logger().initialize();
}

compression_handler::~compression_handler() = default;
compression_handler::compression_handler(compression_handler&&) noexcept = default;
auto compression_handler::operator=(compression_handler&&) noexcept
    -> compression_handler& = default;

auto compression_handler::compress_local(const std::vector<file_entry>& files,
                                         const std::filesystem::path& dest_archive,
                                         archive_format format) -> result<local_archive> {
    if (files.empty()) {
        return unexpected{error{error_code::invalid_configuration, "no files to archive"}};
    }

    std::error_code ec;
    if (dest_archive.has_parent_path()) {
        std::filesystem::create_directories(dest_archive.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::local_write_failed,
                                    "cannot create " + dest_archive.parent_path().string() +
                                        ": " + ec.message()}};
        }
    }

    auto partial = dest_archive;
    partial += ".partial";

    collection_log_context ctx;
    ctx.file_path = dest_archive.string();
    LC_LOG_INFO_CTX(log_category::compression,
                    "Creating " + std::string(to_string(format)) + " archive of " +
                        std::to_string(files.size()) + " files",
                    ctx);

    local_archive out;
    out.path = dest_archive;

    {
        write_handle writer(archive_write_new());
        if (!writer) {
            return unexpected{error{error_code::internal_error, "archive_write_new failed"}};
        }
        impl_->configure_writer(writer.get(), format);
        if (archive_write_open_filename(writer.get(), partial.c_str()) != ARCHIVE_OK) {
            return unexpected{write_failure(writer.get(), "cannot open " + partial.string())};
        }

        std::vector<char> buffer(std::max<std::size_t>(impl_->settings.buffer_size, 4096));
        for (const auto& file : files) {
            if (file.is_directory) {
                continue;
            }
            if (auto appended = impl_->append(writer.get(), file, buffer, out); !appended) {
                auto err = appended.error();
                writer.reset();
                std::filesystem::remove(partial, ec);
                ctx.error_message = err.message;
                LC_LOG_ERROR_CTX(log_category::compression, "Archive creation failed", ctx);
                return unexpected{err};
            }
        }

        if (archive_write_close(writer.get()) != ARCHIVE_OK) {
            auto err = write_failure(writer.get(), "cannot finish " + partial.string());
            writer.reset();
            std::filesystem::remove(partial, ec);
            return unexpected{err};
        }
    }

    std::filesystem::rename(partial, dest_archive, ec);
    if (ec) {
        std::filesystem::remove(partial, ec);
        return unexpected{error{error_code::local_write_failed,
                                "cannot finalize " + dest_archive.string()}};
    }
    out.archive_size = std::filesystem::file_size(dest_archive, ec);

    {
        std::lock_guard<std::mutex> lock(impl_->stats_mutex);
        ++impl_->totals.archives_created;
        impl_->totals.files_archived += out.members.size();
        impl_->totals.input_bytes += out.input_bytes;
        impl_->totals.output_bytes += out.archive_size;
    }

    ctx.file_size = out.archive_size;
    LC_LOG_INFO_CTX(log_category::compression,
                    "Archive written: " + std::to_string(out.members.size()) + " members, " +
                        std::to_string(out.skipped.size()) + " skipped",
                    ctx);
    return out;
}

auto compression_handler::compress_remote(connection_session& session,
                                          const std::vector<file_entry>& files,
                                          const std::string& remote_root,
                                          const std::string& remote_archive_path,
                                          const cancellation_token& cancel)
    -> result<remote_archive> {
    if (files.empty()) {
        return unexpected{error{error_code::invalid_configuration, "no files to archive"}};
    }

    const auto& command_template = impl_->settings.remote_command;
    auto command = build_remote_command(command_template, remote_archive_path, remote_root, files);

    std::string stdin_data;
    if (command_template.find("{files}") == std::string::npos) {
        for (const auto& file : files) {
            stdin_data += file.path;
            stdin_data += '\n';
        }
    }

    collection_log_context ctx;
    ctx.host = session.profile().host;
    ctx.file_path = remote_archive_path;
    LC_LOG_INFO_CTX(log_category::compression,
                    "Compressing " + std::to_string(files.size()) + " files on remote host", ctx);
    LC_LOG_DEBUG(log_category::compression, "Remote command: " + command);

    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        impl_->settings.remote_timeout);
    auto executed = session.with_channel([&](remote_channel& channel) {
        return channel.execute(command, stdin_data, timeout, cancel);
    });

    auto discard_remote = [&] {
        auto removed = session.with_channel([&](remote_channel& channel) {
            return channel.remove(remote_archive_path);
        });
        if (!removed && removed.error().code != error_code::file_not_found) {
            LC_LOG_WARN(log_category::compression,
                        "Could not remove remote archive " + remote_archive_path + ": " +
                            removed.error().message);
        }
    };

    if (!executed) {
        ctx.error_message = executed.error().message;
        LC_LOG_WARN_CTX(log_category::compression, "Remote compression did not complete", ctx);
        if (!is_connection_error(executed.error().code)) {
            discard_remote();
        }
        return unexpected{executed.error()};
    }

    const auto& outcome = executed.value();
    if (!outcome.succeeded()) {
        discard_remote();
        return unexpected{error{error_code::remote_command_failed,
                                "remote compression exited with status " +
                                    std::to_string(outcome.exit_status) + ": " +
                                    outcome.stderr_text}};
    }

    auto produced = session.with_channel([&](remote_channel& channel) {
        return channel.stat(remote_archive_path);
    });
    if (!produced) {
        if (is_connection_error(produced.error().code)) {
            return unexpected{produced.error()};
        }
        return unexpected{error{error_code::remote_command_failed,
                                "remote compression produced no archive at " +
                                    remote_archive_path}};
    }

    remote_archive archive;
    archive.path = remote_archive_path;
    archive.size = produced.value().size;
    archive.members.reserve(files.size());
    for (const auto& file : files) {
        archive.members.push_back(file.path);
    }

    {
        std::lock_guard<std::mutex> lock(impl_->stats_mutex);
        ++impl_->totals.remote_archives_created;
    }

    ctx.file_size = archive.size;
    LC_LOG_INFO_CTX(log_category::compression, "Remote archive ready", ctx);
    return archive;
}

auto compression_handler::verify_archive(const std::filesystem::path& archive)
    -> result<std::vector<archive_member>> {
    auto reader = open_reader(archive);
    if (!reader) {
        return unexpected{reader.error()};
    }
    auto* a = reader.value().get();

    std::vector<archive_member> members;
    std::vector<char> buffer(65536);
    struct archive_entry* entry = nullptr;
    int rc = ARCHIVE_OK;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }

        archive_member member;
        const char* name = archive_entry_pathname(entry);
        member.name = name ? name : "";

        la_ssize_t got = 0;
        while ((got = archive_read_data(a, buffer.data(), buffer.size())) > 0) {
            member.size += static_cast<uint64_t>(got);
        }
        if (got < 0) {
            return unexpected{error{error_code::archive_verify_failed,
                                    "corrupt member " + member.name + " in " + archive.string() +
                                        ": " + archive_message(a)}};
        }
        members.push_back(std::move(member));
    }

    if (rc != ARCHIVE_EOF) {
        return unexpected{error{error_code::archive_verify_failed,
                                "cannot read " + archive.string() + ": " + archive_message(a)}};
    }
    return members;
}

auto compression_handler::extract_archive(const std::filesystem::path& archive,
                                          const std::filesystem::path& dest_dir)
    -> result<std::vector<std::filesystem::path>> {
    auto reader = open_reader(archive);
    if (!reader) {
        return unexpected{reader.error()};
    }
    auto* a = reader.value().get();

    std::vector<std::filesystem::path> extracted;
    std::vector<char> buffer(65536);
    struct archive_entry* entry = nullptr;
    int rc = ARCHIVE_OK;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        const char* raw = archive_entry_pathname(entry);
        std::string name = raw ? raw : "";
        if (!is_safe_member(name)) {
            return unexpected{error{error_code::invalid_file_path,
                                    "refusing to extract unsafe member '" + name + "'"}};
        }

        auto target = dest_dir / std::filesystem::path(name);
        std::error_code ec;
        if (archive_entry_filetype(entry) == AE_IFDIR) {
            std::filesystem::create_directories(target, ec);
            continue;
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }

        std::filesystem::create_directories(target.parent_path(), ec);
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        if (!output) {
            return unexpected{error{error_code::file_write_error,
                                    "cannot create " + target.string()}};
        }

        la_ssize_t got = 0;
        while ((got = archive_read_data(a, buffer.data(), buffer.size())) > 0) {
            output.write(buffer.data(), got);
        }
        if (got < 0) {
            return unexpected{error{error_code::archive_verify_failed,
                                    "corrupt member " + name + ": " + archive_message(a)}};
        }
        if (!output) {
            return unexpected{error{error_code::file_write_error,
                                    "cannot write " + target.string()}};
        }
        extracted.push_back(target);
    }

    if (rc != ARCHIVE_EOF) {
        return unexpected{error{error_code::archive_verify_failed,
                                "cannot read " + archive.string() + ": " + archive_message(a)}};
    }
    return extracted;
}

auto compression_handler::archive_name(const std::string& label,
                                       std::chrono::system_clock::time_point when,
                                       archive_format format) -> std::string {
    return sanitize_filename(label) + "_" + timestamp(when) + "." + to_string(format);
}

auto compression_handler::timestamp(std::chrono::system_clock::time_point when)
    -> std::string {
    auto time_t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

auto compression_handler::build_remote_command(const std::string& command_template,
                                               const std::string& archive_path,
                                               const std::string& root,
                                               const std::vector<file_entry>& files)
    -> std::string {
    std::string quoted_files;
    for (const auto& file : files) {
        if (!quoted_files.empty()) {
            quoted_files += ' ';
        }
        quoted_files += shell_quote(file.path);
    }

    const std::pair<std::string, std::string> placeholders[] = {
        {"{archive}", shell_quote(archive_path)},
        {"{root}", shell_quote(root)},
        {"{files}", quoted_files},
    };

    // Single pass so substituted values are never expanded again
    std::string command;
    std::size_t pos = 0;
    while (pos < command_template.size()) {
        bool replaced = false;
        if (command_template[pos] == '{') {
            for (const auto& [name, value] : placeholders) {
                if (command_template.compare(pos, name.size(), name) == 0) {
                    command += value;
                    pos += name.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            command += command_template[pos++];
        }
    }
    return command;
}

auto compression_handler::shell_quote(const std::string& value) -> std::string {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

auto compression_handler::settings() const -> const compression_settings& {
    return impl_->settings;
}

auto compression_handler::stats() const -> compression_stats {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    return impl_->totals;
}

void compression_handler::reset_stats() {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    impl_->totals = compression_stats{};
}

}  // namespace kcenon::log_collector
