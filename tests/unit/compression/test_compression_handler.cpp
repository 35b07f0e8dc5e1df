/**
 * @file test_compression_handler.cpp
 * @brief Unit tests for archive creation, verification and remote commands
 */

#include <gtest/gtest.h>

#include <kcenon/log_collector/compression/compression_handler.h>
#include <kcenon/log_collector/core/logging.h>

#include "fake_remote_channel.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::log_collector::test {

class CompressionHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        test_dir_ = std::filesystem::temp_directory_path() / "log_collector_test_compression";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_ / "src");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_console_output(true);
    }

    auto add_file(const std::string& relative, const std::string& content) -> file_entry {
        auto path = test_dir_ / "src" / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;

        file_entry entry;
        entry.path = relative;
        entry.absolute_path = path.string();
        entry.size = content.size();
        entry.modified_at = std::chrono::system_clock::now();
        return entry;
    }

    static auto random_text(std::size_t size) -> std::string {
        std::mt19937 gen(42);
        std::uniform_int_distribution<int> dist(0, 255);
        std::string text(size, '\0');
        for (auto& c : text) {
            c = static_cast<char>(dist(gen));
        }
        return text;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream input(path, std::ios::binary);
        std::ostringstream oss;
        oss << input.rdbuf();
        return oss.str();
    }

    std::filesystem::path test_dir_;
};

// =============================================================================
// Local archives
// =============================================================================

TEST_F(CompressionHandlerTest, CompressLocal_ZipPreservesStructure) {
    std::vector<file_entry> files{add_file("app.log", "application started\n"),
                                  add_file("2025/01/worker.log", "worker line\n")};
    compression_handler handler;
    auto dest = test_dir_ / "out" / "user_app_log.zip";

    auto archive = handler.compress_local(files, dest, archive_format::zip);

    ASSERT_TRUE(archive.has_value()) << archive.error().message;
    EXPECT_TRUE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "out" / "user_app_log.zip.partial"));
    EXPECT_EQ(archive.value().members.size(), 2u);
    EXPECT_TRUE(archive.value().skipped.empty());
    EXPECT_GT(archive.value().archive_size, 0u);

    auto extracted = compression_handler::extract_archive(dest, test_dir_ / "restored");
    ASSERT_TRUE(extracted.has_value()) << extracted.error().message;
    EXPECT_EQ(read_file(test_dir_ / "restored" / "app.log"), "application started\n");
    EXPECT_EQ(read_file(test_dir_ / "restored" / "2025" / "01" / "worker.log"),
              "worker line\n");
}

TEST_F(CompressionHandlerTest, CompressLocal_TarGzVerifies) {
    auto big = random_text(100000);
    std::vector<file_entry> files{add_file("kern.log", big), add_file("syslog", "boot\n")};
    compression_handler handler;
    auto dest = test_dir_ / "controller_kernel_log.tar.gz";

    auto archive = handler.compress_local(files, dest, archive_format::tar_gz);
    ASSERT_TRUE(archive.has_value()) << archive.error().message;
    EXPECT_EQ(archive.value().input_bytes, big.size() + 5);

    auto members = compression_handler::verify_archive(dest);
    ASSERT_TRUE(members.has_value()) << members.error().message;
    ASSERT_EQ(members.value().size(), 2u);
    EXPECT_EQ(members.value()[0].name, "kern.log");
    EXPECT_EQ(members.value()[0].size, big.size());
    EXPECT_EQ(members.value()[1].name, "syslog");
}

TEST_F(CompressionHandlerTest, CompressLocal_SkipsVanishedInput) {
    auto kept = add_file("kept.log", "kept");
    auto gone = add_file("gone.log", "gone");
    std::filesystem::remove(gone.absolute_path);
    compression_handler handler;

    auto archive = handler.compress_local({kept, gone}, test_dir_ / "partial.zip",
                                          archive_format::zip);

    ASSERT_TRUE(archive.has_value());
    EXPECT_EQ(archive.value().members, (std::vector<std::string>{"kept.log"}));
    ASSERT_EQ(archive.value().skipped.size(), 1u);
    EXPECT_EQ(archive.value().skipped[0].file_path, "gone.log");
    EXPECT_TRUE(archive.value().skipped[0].recoverable);
}

TEST_F(CompressionHandlerTest, CompressLocal_RejectsEmptyInput) {
    compression_handler handler;

    auto archive = handler.compress_local({}, test_dir_ / "empty.zip", archive_format::zip);

    ASSERT_FALSE(archive.has_value());
    EXPECT_EQ(archive.error().code, error_code::invalid_configuration);
}

TEST_F(CompressionHandlerTest, CompressLocal_StoreLevel) {
    compression_settings settings;
    settings.level = 0;
    compression_handler handler(settings);
    auto text = std::string(50000, 'a');

    auto archive = handler.compress_local({add_file("flat.log", text)},
                                          test_dir_ / "stored.zip", archive_format::zip);

    ASSERT_TRUE(archive.has_value());
    EXPECT_GE(archive.value().archive_size, text.size());
}

TEST_F(CompressionHandlerTest, Stats_AccumulateAndReset) {
    compression_handler handler;
    auto text = std::string(20000, 'x');

    ASSERT_TRUE(handler.compress_local({add_file("a.log", text)}, test_dir_ / "a.zip",
                                       archive_format::zip)
                    .has_value());

    auto stats = handler.stats();
    EXPECT_EQ(stats.archives_created, 1u);
    EXPECT_EQ(stats.files_archived, 1u);
    EXPECT_EQ(stats.input_bytes, text.size());
    EXPECT_LT(stats.compression_ratio(), 1.0);

    handler.reset_stats();
    EXPECT_EQ(handler.stats().archives_created, 0u);
}

// =============================================================================
// Verification and extraction
// =============================================================================

TEST_F(CompressionHandlerTest, VerifyArchive_DetectsTruncation) {
    compression_handler handler;
    auto dest = test_dir_ / "truncated.tar.gz";
    ASSERT_TRUE(handler.compress_local({add_file("noise.log", random_text(200000))}, dest,
                                       archive_format::tar_gz)
                    .has_value());

    std::filesystem::resize_file(dest, std::filesystem::file_size(dest) / 2);

    auto members = compression_handler::verify_archive(dest);
    ASSERT_FALSE(members.has_value());
    EXPECT_EQ(members.error().code, error_code::archive_verify_failed);
}

TEST_F(CompressionHandlerTest, VerifyArchive_MissingFile) {
    auto members = compression_handler::verify_archive(test_dir_ / "absent.zip");

    ASSERT_FALSE(members.has_value());
    EXPECT_EQ(members.error().code, error_code::archive_verify_failed);
}

TEST_F(CompressionHandlerTest, ExtractArchive_RejectsParentTraversal) {
    auto evil = add_file("evil.log", "payload");
    evil.path = "../evil.log";
    compression_handler handler;
    auto dest = test_dir_ / "evil.tar.gz";
    ASSERT_TRUE(handler.compress_local({evil}, dest, archive_format::tar_gz).has_value());

    auto extracted = compression_handler::extract_archive(dest, test_dir_ / "restored");

    ASSERT_FALSE(extracted.has_value());
    EXPECT_EQ(extracted.error().code, error_code::invalid_file_path);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "evil.log"));
}

// =============================================================================
// Naming and command templates
// =============================================================================

TEST_F(CompressionHandlerTest, ArchiveName_UsesLabelAndTimestamp) {
    std::tm tm{};
    tm.tm_year = 2025 - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = 31;
    tm.tm_hour = 8;
    tm.tm_min = 5;
    tm.tm_sec = 9;
    tm.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&tm));

    EXPECT_EQ(compression_handler::timestamp(when), "20250131_080509");
    EXPECT_EQ(compression_handler::archive_name("controller_log", when, archive_format::tar_gz),
              "controller_log_20250131_080509.tar.gz");
    EXPECT_EQ(compression_handler::archive_name("my app", when, archive_format::zip),
              "my_app_20250131_080509.zip");
}

TEST_F(CompressionHandlerTest, ShellQuote) {
    EXPECT_EQ(compression_handler::shell_quote("/var/log"), "'/var/log'");
    EXPECT_EQ(compression_handler::shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(compression_handler::shell_quote(""), "''");
}

TEST_F(CompressionHandlerTest, BuildRemoteCommand_DefaultTemplate) {
    compression_settings defaults;
    file_entry entry;
    entry.path = "syslog";

    auto command = compression_handler::build_remote_command(
        defaults.remote_command, "/tmp/a.tar.gz", "/var/log", {entry});

    EXPECT_EQ(command, "tar -czf '/tmp/a.tar.gz' -C '/var/log' -T -");
}

TEST_F(CompressionHandlerTest, BuildRemoteCommand_FilesPlaceholder) {
    file_entry a;
    a.path = "kern.log";
    file_entry b;
    b.path = "odd name's.log";

    auto command = compression_handler::build_remote_command(
        "zip -q {archive} {files}", "/tmp/x.zip", "/var/log", {a, b});

    EXPECT_EQ(command, "zip -q '/tmp/x.zip' 'kern.log' 'odd name'\\''s.log'");
}

TEST_F(CompressionHandlerTest, BuildRemoteCommand_DoesNotReexpandValues) {
    file_entry entry;
    entry.path = "x";

    auto command = compression_handler::build_remote_command(
        "cmd {archive} {root}", "/tmp/{root}.tgz", "/r", {entry});

    EXPECT_EQ(command, "cmd '/tmp/{root}.tgz' '/r'");
}

// =============================================================================
// Remote archives
// =============================================================================

class RemoteCompressionTest : public CompressionHandlerTest {
protected:
    void SetUp() override {
        CompressionHandlerTest::SetUp();
        state_ = std::make_shared<fake_remote_state>();
        state_->root = test_dir_ / "remote";
        std::filesystem::create_directories(state_->root / "var" / "log");
        std::filesystem::create_directories(state_->root / "tmp");
    }

    auto remote_file(const std::string& relative, const std::string& content) -> file_entry {
        auto path = state_->root / "var" / "log" / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;

        file_entry entry;
        entry.path = relative;
        entry.absolute_path = "/var/log/" + relative;
        entry.size = content.size();
        return entry;
    }

    auto connect() -> result<connection_session> {
        connection_profile profile;
        profile.host = "192.168.1.100";
        profile.keep_alive_enabled = false;
        profile.credential = auth_credential::with_password("secret");
        return connection_session::connect(profile, fake_remote_channel::factory(state_));
    }

    std::shared_ptr<fake_remote_state> state_;
};

TEST_F(RemoteCompressionTest, CompressRemote_RunsCommandWithFileList) {
    state_->on_execute = tar_emulator(state_);
    std::vector<file_entry> files{remote_file("syslog", "boot\n"),
                                  remote_file("apt/history.log", "install\n")};
    auto session = connect();
    ASSERT_TRUE(session.has_value());
    compression_handler handler;

    auto archive = handler.compress_remote(session.value(), files, "/var/log",
                                           "/tmp/controller_kernel_log.tar.gz",
                                           cancellation_token::none());

    ASSERT_TRUE(archive.has_value()) << archive.error().message;
    EXPECT_EQ(archive.value().path, "/tmp/controller_kernel_log.tar.gz");
    EXPECT_GT(archive.value().size, 0u);
    EXPECT_EQ(archive.value().members.size(), 2u);
    ASSERT_EQ(state_->commands.size(), 1u);
    EXPECT_EQ(state_->commands[0],
              "tar -czf '/tmp/controller_kernel_log.tar.gz' -C '/var/log' -T -");

    auto members =
        compression_handler::verify_archive(state_->local("/tmp/controller_kernel_log.tar.gz"));
    ASSERT_TRUE(members.has_value());
    EXPECT_EQ(members.value().size(), 2u);
    EXPECT_EQ(handler.stats().remote_archives_created, 1u);
}

TEST_F(RemoteCompressionTest, TarEmulator_DoesNotKeepStateAlive) {
    state_->on_execute = tar_emulator(state_);
    std::weak_ptr<fake_remote_state> weak = state_;
    auto root = state_->root;

    state_.reset();

    EXPECT_TRUE(weak.expired());
    state_ = std::make_shared<fake_remote_state>();
    state_->root = root;
}

TEST_F(RemoteCompressionTest, CompressRemote_NonZeroExitFails) {
    std::vector<file_entry> files{remote_file("syslog", "boot\n")};
    auto session = connect();
    ASSERT_TRUE(session.has_value());
    compression_handler handler;

    auto archive = handler.compress_remote(session.value(), files, "/var/log",
                                           "/tmp/out.tar.gz", cancellation_token::none());

    ASSERT_FALSE(archive.has_value());
    EXPECT_EQ(archive.error().code, error_code::remote_command_failed);
    EXPECT_NE(archive.error().message.find("127"), std::string::npos);
}

TEST_F(RemoteCompressionTest, CompressRemote_MissingArchiveFails) {
    state_->on_execute = [](const std::string&, const std::string&) -> result<command_result> {
        return command_result{0, {}, {}};
    };
    std::vector<file_entry> files{remote_file("syslog", "boot\n")};
    auto session = connect();
    ASSERT_TRUE(session.has_value());
    compression_handler handler;

    auto archive = handler.compress_remote(session.value(), files, "/var/log",
                                           "/tmp/never.tar.gz", cancellation_token::none());

    ASSERT_FALSE(archive.has_value());
    EXPECT_EQ(archive.error().code, error_code::remote_command_failed);
}

TEST_F(RemoteCompressionTest, CompressRemote_Cancelled) {
    state_->on_execute = tar_emulator(state_);
    std::vector<file_entry> files{remote_file("syslog", "boot\n")};
    auto session = connect();
    ASSERT_TRUE(session.has_value());
    compression_handler handler;
    cancellation_token cancel;
    cancel.cancel();

    auto archive = handler.compress_remote(session.value(), files, "/var/log",
                                           "/tmp/out.tar.gz", cancel);

    ASSERT_FALSE(archive.has_value());
    EXPECT_EQ(archive.error().code, error_code::job_cancelled);
}

}  // namespace kcenon::log_collector::test
