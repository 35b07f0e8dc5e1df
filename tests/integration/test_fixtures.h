/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_LOG_COLLECTOR_TEST_FIXTURES_H
#define KCENON_LOG_COLLECTOR_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/log_collector/log_collector.h>
#include <kcenon/log_collector/core/logging.h>

#include "fake_remote_channel.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::log_collector::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);

        test_dir_ = std::filesystem::temp_directory_path() /
                    ("log_collector_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        destination_dir_ = test_dir_ / "collected";
        std::filesystem::create_directories(destination_dir_);
        local_logs_dir_ = test_dir_ / "client_logs";
        std::filesystem::create_directories(local_logs_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_console_output(true);
    }

    /**
     * @brief Write highly compressible text of roughly size bytes
     */
    static auto create_text_file(const std::filesystem::path& path, std::size_t size)
        -> std::filesystem::path {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);

        const std::string pattern = "2025-01-31 08:00:00 INFO worker heartbeat ok\n";
        std::string content;
        while (content.size() < size) {
            content += pattern;
        }
        content.resize(size);
        file << content;
        return path;
    }

    static void set_age(const std::filesystem::path& path, std::chrono::hours age) {
        std::filesystem::last_write_time(
            path, std::filesystem::file_time_type::clock::now() - age);
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream input(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(input),
                           std::istreambuf_iterator<char>());
    }

    /**
     * @brief Regular files below dir, relative and '/' separated, sorted
     */
    static auto list_tree(const std::filesystem::path& dir) -> std::vector<std::string> {
        std::vector<std::string> files;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
             it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file()) {
                files.push_back(std::filesystem::relative(it->path(), dir).generic_string());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path destination_dir_;
    std::filesystem::path local_logs_dir_;
};

/**
 * @brief Fixture with a fake controller reachable through a connection session
 */
class RemoteHostFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        remote_ = std::make_shared<fake_remote_state>();
        remote_->root = test_dir_ / "controller";
        std::filesystem::create_directories(remote_->root / "var" / "log");
        std::filesystem::create_directories(remote_->root / "opt" / "myapp" / "logs");
        std::filesystem::create_directories(remote_->root / "tmp");

        profile_.host = "192.168.1.100";
        profile_.username = "root";
        profile_.credential = auth_credential::with_password("secret");
        profile_.keep_alive_enabled = false;
        profile_.reconnect.max_attempts = 3;
        profile_.reconnect.initial_delay = std::chrono::milliseconds(5);
        profile_.reconnect.max_delay = std::chrono::milliseconds(20);
    }

    void TearDown() override {
        orchestrator_.reset();
        session_.reset();
        TempDirectoryFixture::TearDown();
    }

    /**
     * @brief Create a file on the fake controller
     * @param remote_path Absolute remote path, e.g. "/var/log/syslog"
     */
    auto create_remote_file(const std::string& remote_path, std::size_t size)
        -> std::filesystem::path {
        return create_text_file(remote_->local(remote_path), size);
    }

    void connect_session() {
        auto session = connection_session::connect(profile_, fake_remote_channel::factory(remote_));
        ASSERT_TRUE(session.has_value()) << session.error().message;
        session_ = std::make_unique<connection_session>(std::move(session.value()));
    }

    void build_orchestrator(orchestrator_config config = {}) {
        auto built = collection_orchestrator::builder()
                         .with_session(session_.get())
                         .with_config(std::move(config))
                         .build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        orchestrator_ = std::make_unique<collection_orchestrator>(std::move(built.value()));
    }

    auto request_for(std::vector<source_spec> sources) const -> collection_request {
        collection_request request;
        request.sources = std::move(sources);
        request.destination_root = destination_dir_;
        return request;
    }

    auto run_to_end(const collection_request& request,
                    std::chrono::milliseconds timeout = std::chrono::seconds(30))
        -> collection_job {
        auto id = orchestrator_->start_collection(request);
        EXPECT_TRUE(id.has_value()) << id.error().message;
        if (!id) {
            return {};
        }
        auto job = orchestrator_->wait(id.value(), timeout);
        EXPECT_TRUE(job.has_value()) << job.error().message;
        return job ? job.value() : collection_job{};
    }

    auto drain_events() -> std::vector<collector_event> {
        return orchestrator_->events()->drain();
    }

    std::shared_ptr<fake_remote_state> remote_;
    connection_profile profile_;
    std::unique_ptr<connection_session> session_;
    std::unique_ptr<collection_orchestrator> orchestrator_;
};

}  // namespace kcenon::log_collector::test

#endif  // KCENON_LOG_COLLECTOR_TEST_FIXTURES_H
