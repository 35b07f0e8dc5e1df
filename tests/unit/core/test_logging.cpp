/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/log_collector/core/logging.h>

#include <optional>
#include <regex>
#include <string>
#include <tuple>
#include <vector>

namespace kcenon::log_collector::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_FALSE(config.mask_paths);
    EXPECT_FALSE(config.mask_hosts);
    EXPECT_FALSE(config.mask_filenames);
    EXPECT_EQ(config.mask_char, '*');
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_paths);
    EXPECT_TRUE(config.mask_hosts);
    EXPECT_TRUE(config.mask_filenames);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "Collected /var/log/syslog from 192.168.1.100";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskHostKeepsLastOctet) {
    masking_config config;
    config.mask_hosts = true;
    sensitive_info_masker masker(config);

    EXPECT_EQ(masker.mask_host("192.168.1.100"), "*********.100");
}

TEST_F(SensitiveInfoMaskerTest, MaskHostsInText) {
    masking_config config;
    config.mask_hosts = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask("Connecting to 192.168.1.100 via 10.0.0.1");

    EXPECT_NE(result.find("*********.100"), std::string::npos);
    EXPECT_NE(result.find("******.1"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathKeepsFilename) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/opt/myapp/logs/server.log");

    EXPECT_NE(result.find("server.log"), std::string::npos);
    EXPECT_EQ(result.find("/opt/"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathWithFilename) {
    masking_config config;
    config.mask_paths = true;
    config.mask_filenames = true;
    config.visible_chars = 4;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/var/log/controller_kernel.log");

    EXPECT_NE(result.find("cont"), std::string::npos);
    EXPECT_NE(result.find(".log"), std::string::npos);
    EXPECT_EQ(result.find("controller_kernel"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInText) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask("Archive written to /home/user/collected/logs.zip");

    EXPECT_EQ(result.find("/home/user/"), std::string::npos);
    EXPECT_NE(result.find("logs.zip"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, EmptyInput) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask(""), "");
    EXPECT_EQ(masker.mask_path(""), "");
    EXPECT_EQ(masker.mask_host(""), "");
}

TEST_F(SensitiveInfoMaskerTest, UpdateConfig) {
    sensitive_info_masker masker;
    std::string host = "192.168.1.100";

    EXPECT_EQ(masker.mask_host(host), host);

    masking_config config;
    config.mask_hosts = true;
    masker.set_config(config);

    EXPECT_NE(masker.mask_host(host), host);
}

// =============================================================================
// Collection Log Context Tests
// =============================================================================

class CollectionLogContextTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(CollectionLogContextTest, EmptyContextToJson) {
    collection_log_context ctx;

    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(CollectionLogContextTest, AllFieldsToJson) {
    collection_log_context ctx;
    ctx.job_id = 7;
    ctx.source_label = "controller_log";
    ctx.file_path = "/opt/myapp/logs/app.log";
    ctx.phase = "downloading";
    ctx.file_size = 1048576;
    ctx.bytes_transferred = 524288;
    ctx.total_bytes = 2097152;
    ctx.progress_percent = 25.0;
    ctx.duration_ms = 1000;
    ctx.error_message = "Test error";
    ctx.host = "192.168.1.100";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"job_id\":7"), std::string::npos);
    EXPECT_NE(json.find("\"source\":\"controller_log\""), std::string::npos);
    EXPECT_NE(json.find("\"file\":\"/opt/myapp/logs/app.log\""), std::string::npos);
    EXPECT_NE(json.find("\"phase\":\"downloading\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":1048576"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":524288"), std::string::npos);
    EXPECT_NE(json.find("\"total_bytes\":2097152"), std::string::npos);
    EXPECT_NE(json.find("\"progress_percent\":25.00"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":1000"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"Test error\""), std::string::npos);
    EXPECT_NE(json.find("\"host\":\"192.168.1.100\""), std::string::npos);
}

TEST_F(CollectionLogContextTest, JsonWithMasking) {
    collection_log_context ctx;
    ctx.host = "192.168.1.100";
    ctx.error_message = "cannot read /var/log/secure";

    masking_config config;
    config.mask_hosts = true;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("192.168.1.100"), std::string::npos);
    EXPECT_NE(json.find(".100"), std::string::npos);
    EXPECT_EQ(json.find("/var/log/"), std::string::npos);
}

TEST_F(CollectionLogContextTest, JsonEscaping) {
    collection_log_context ctx;
    ctx.source_label = "label-with-\"quotes\"";
    ctx.error_message = "Error:\nLine break\tand\ttabs";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

// =============================================================================
// Structured Log Entry Tests
// =============================================================================

class StructuredLogEntryTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(StructuredLogEntryTest, BasicEntryToJson) {
    structured_log_entry entry;
    entry.timestamp = "2026-03-02T10:30:00.000Z";
    entry.level = log_level::info;
    entry.category = "log_collector.orchestrator";
    entry.message = "Collection completed";

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"timestamp\":\"2026-03-02T10:30:00.000Z\""), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"log_collector.orchestrator\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Collection completed\""), std::string::npos);
}

TEST_F(StructuredLogEntryTest, EntryWithContextIsFlattened) {
    structured_log_entry entry;
    entry.timestamp = "2026-03-02T10:30:00.000Z";
    entry.category = "log_collector.discovery";
    entry.message = "Skipping unreadable directory";

    collection_log_context ctx;
    ctx.job_id = 3;
    ctx.file_path = "private";
    entry.context = ctx;

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"job_id\":3"), std::string::npos);
    EXPECT_NE(json.find("\"file\":\"private\""), std::string::npos);
    EXPECT_EQ(json.find("{{"), std::string::npos);
}

TEST_F(StructuredLogEntryTest, EntryWithSourceLocation) {
    structured_log_entry entry;
    entry.timestamp = "2026-03-02T10:30:00.000Z";
    entry.level = log_level::error;
    entry.category = "log_collector.session";
    entry.message = "Reconnection failed";
    entry.source_file = "connection_session.cpp";
    entry.source_line = 42;
    entry.function_name = "recover";

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"source\":{"), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"function\":\"recover\""), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(LogEntryBuilderTest, BasicBuilder) {
    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::discovery)
        .with_message("Discovery started")
        .build();

    EXPECT_EQ(entry.level, log_level::info);
    EXPECT_EQ(entry.category, log_category::discovery);
    EXPECT_EQ(entry.message, "Discovery started");
    EXPECT_FALSE(entry.timestamp.empty());
    EXPECT_FALSE(entry.context.has_value());
}

TEST_F(LogEntryBuilderTest, BuilderWithContextFields) {
    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::orchestrator)
        .with_message("Progress")
        .with_job_id(12)
        .with_source_label("controller_kernel_log")
        .with_file_path("kern.log")
        .with_phase("transferring_files")
        .with_file_size(4096)
        .with_bytes_transferred(2048)
        .with_total_bytes(8192)
        .with_progress_percent(25.0)
        .with_duration_ms(500)
        .with_host("10.0.0.5")
        .build();

    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->job_id.value(), 12u);
    EXPECT_EQ(entry.context->source_label, "controller_kernel_log");
    EXPECT_EQ(entry.context->file_path, "kern.log");
    EXPECT_EQ(entry.context->phase.value(), "transferring_files");
    EXPECT_EQ(entry.context->file_size.value(), 4096u);
    EXPECT_EQ(entry.context->bytes_transferred.value(), 2048u);
    EXPECT_EQ(entry.context->total_bytes.value(), 8192u);
    EXPECT_DOUBLE_EQ(entry.context->progress_percent.value(), 25.0);
    EXPECT_EQ(entry.context->duration_ms.value(), 500u);
    EXPECT_EQ(entry.context->host.value(), "10.0.0.5");
}

TEST_F(LogEntryBuilderTest, BuilderWithExistingContext) {
    collection_log_context ctx;
    ctx.source_label = "user_app_log";
    ctx.error_message = "disk full";

    auto entry = log_entry_builder()
        .with_level(log_level::error)
        .with_category(log_category::disk)
        .with_message("Space check failed")
        .with_context(ctx)
        .build();

    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->source_label, "user_app_log");
    EXPECT_EQ(entry.context->error_message.value(), "disk full");
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::service)
        .with_message("Test")
        .build();

    // YYYY-MM-DDTHH:MM:SS.mmmZ
    std::regex iso8601_regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(entry.timestamp, iso8601_regex));
}

// =============================================================================
// Log Level Tests
// =============================================================================

TEST(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Integration Tests
// =============================================================================

class CollectorLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().set_level(log_level::info);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
        get_logger().set_console_output(true);
    }
};

TEST_F(CollectorLoggerTest, SetOutputFormat) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(CollectorLoggerTest, SetMaskingConfig) {
    get_logger().set_masking_config(masking_config::all_masked());

    auto retrieved = get_logger().get_masking_config();
    EXPECT_TRUE(retrieved.mask_paths);
    EXPECT_TRUE(retrieved.mask_hosts);
    EXPECT_TRUE(retrieved.mask_filenames);
}

TEST_F(CollectorLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const collection_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    LC_LOG_INFO(log_category::session, "Connected");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::session);
    EXPECT_EQ(std::get<2>(captured[0]), "Connected");
}

TEST_F(CollectorLoggerTest, CallbackReceivesContext) {
    std::optional<uint64_t> seen_job;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const collection_log_context* ctx) {
        if (ctx) {
            seen_job = ctx->job_id;
        }
    });

    collection_log_context ctx;
    ctx.job_id = 42;
    LC_LOG_WARN_CTX(log_category::orchestrator, "Recoverable collection error", ctx);

    ASSERT_TRUE(seen_job.has_value());
    EXPECT_EQ(*seen_job, 42u);
}

TEST_F(CollectorLoggerTest, JsonCallback) {
    std::vector<std::string> captured_json;

    get_logger().set_output_format(log_output_format::json);
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    LC_LOG_INFO(log_category::compression, "Archive written");

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(captured_json[0].find("\"message\":\"Archive written\""), std::string::npos);
    EXPECT_NE(captured_json[0].find("\"category\":\"log_collector.compression\""),
              std::string::npos);
}

TEST_F(CollectorLoggerTest, LogStructuredEntry) {
    std::vector<std::string> captured_json;

    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::orchestrator)
        .with_message("Structured entry test")
        .with_job_id(99)
        .build();

    get_logger().log(entry);

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find("\"job_id\":99"), std::string::npos);
}

TEST_F(CollectorLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view message,
                                  const collection_log_context*) {
        captured.emplace_back(message);
    });

    get_logger().set_level(log_level::warn);

    LC_LOG_DEBUG(log_category::session, "Debug message");
    LC_LOG_INFO(log_category::session, "Info message");
    LC_LOG_WARN(log_category::session, "Warn message");
    LC_LOG_ERROR(log_category::session, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

TEST_F(CollectorLoggerTest, MaskingInJsonOutput) {
    std::vector<std::string> captured_json;

    get_logger().set_output_format(log_output_format::json);
    get_logger().set_masking_config(masking_config::all_masked());
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    collection_log_context ctx;
    ctx.host = "192.168.1.100";
    LC_LOG_INFO_CTX(log_category::session, "Connected", ctx);

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_EQ(captured_json[0].find("192.168.1.100"), std::string::npos);
    EXPECT_NE(captured_json[0].find(".100"), std::string::npos);
}

}  // namespace kcenon::log_collector::test
