/**
 * @file test_validation.cpp
 * @brief Unit tests for connection and path validation
 */

#include <gtest/gtest.h>

#include <kcenon/log_collector/config/validation.h>

#include <filesystem>
#include <fstream>

namespace kcenon::log_collector::test {

using namespace std::chrono_literals;

class ValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "log_collector_test_validation";
        std::filesystem::create_directories(test_dir_);

        profile_.host = "192.168.1.100";
        profile_.username = "root";
        profile_.credential = auth_credential::with_password("secret");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
    connection_profile profile_;
};

// =============================================================================
// Field validators
// =============================================================================

TEST_F(ValidationTest, IpAddress_Accepted) {
    EXPECT_TRUE(validate_ip_address("192.168.1.100").has_value());
    EXPECT_TRUE(validate_ip_address("0.0.0.0").has_value());
    EXPECT_TRUE(validate_ip_address("255.255.255.255").has_value());
}

TEST_F(ValidationTest, IpAddress_Rejected) {
    for (const char* ip : {"", "192.168.1", "192.168.1.256", "a.b.c.d", "1.2.3.4.5"}) {
        auto result = validate_ip_address(ip);
        ASSERT_FALSE(result.has_value()) << ip;
        EXPECT_EQ(result.error().code, error_code::invalid_configuration) << ip;
    }
}

TEST_F(ValidationTest, Port_Bounds) {
    EXPECT_TRUE(validate_port(int64_t{1}).has_value());
    EXPECT_TRUE(validate_port(int64_t{65535}).has_value());
    EXPECT_FALSE(validate_port(int64_t{0}).has_value());
    EXPECT_FALSE(validate_port(int64_t{65536}).has_value());
}

TEST_F(ValidationTest, Port_FromText) {
    EXPECT_TRUE(validate_port(std::string("22")).has_value());
    EXPECT_FALSE(validate_port(std::string("")).has_value());
    EXPECT_FALSE(validate_port(std::string("22a")).has_value());
    EXPECT_FALSE(validate_port(std::string("-1")).has_value());
}

TEST_F(ValidationTest, Username) {
    EXPECT_TRUE(validate_username("root").has_value());
    EXPECT_TRUE(validate_username("svc_log-reader01").has_value());
    EXPECT_FALSE(validate_username("").has_value());
    EXPECT_FALSE(validate_username("bad user").has_value());
    EXPECT_FALSE(validate_username(std::string(33, 'a')).has_value());
}

TEST_F(ValidationTest, Timeout_Bounds) {
    EXPECT_TRUE(validate_timeout(10s).has_value());
    EXPECT_TRUE(validate_timeout(3600s).has_value());
    EXPECT_FALSE(validate_timeout(9s).has_value());
    EXPECT_FALSE(validate_timeout(3601s).has_value());
}

TEST_F(ValidationTest, RemotePath) {
    EXPECT_TRUE(validate_remote_path("/var/log/").has_value());
    EXPECT_FALSE(validate_remote_path("").has_value());
    EXPECT_FALSE(validate_remote_path("var/log").has_value());
}

TEST_F(ValidationTest, LocalPath) {
    EXPECT_TRUE(validate_local_path(test_dir_, true).has_value());
    EXPECT_FALSE(validate_local_path("").has_value());
    EXPECT_FALSE(validate_local_path(test_dir_ / ".." / "escape").has_value());

    auto missing = validate_local_path(test_dir_ / "missing", true);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::file_not_found);
}

TEST_F(ValidationTest, Regex) {
    EXPECT_TRUE(validate_regex("^kern.*\\.log$").has_value());

    auto result = validate_regex("(unbalanced");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_filter_pattern);
}

// =============================================================================
// Connection profile
// =============================================================================

TEST_F(ValidationTest, Profile_Valid) {
    EXPECT_TRUE(validate_connection_profile(profile_).has_value());

    profile_.host = "controller-01.plant.local";
    EXPECT_TRUE(validate_connection_profile(profile_).has_value());
}

TEST_F(ValidationTest, Profile_RejectsBadHost) {
    profile_.host = "";
    EXPECT_FALSE(validate_connection_profile(profile_).has_value());

    profile_.host = "300.1.1.1";
    EXPECT_FALSE(validate_connection_profile(profile_).has_value());

    profile_.host = "bad host!";
    EXPECT_FALSE(validate_connection_profile(profile_).has_value());
}

TEST_F(ValidationTest, Profile_RejectsRequestTimeoutOutOfRange) {
    profile_.request_timeout = 5s;
    EXPECT_FALSE(validate_connection_profile(profile_).has_value());
}

TEST_F(ValidationTest, Profile_RejectsMissingKeyFile) {
    profile_.credential = auth_credential::with_private_key(test_dir_ / "id_ed25519");

    auto result = validate_connection_profile(profile_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_not_found);

    std::ofstream(test_dir_ / "id_ed25519") << "key";
    EXPECT_TRUE(validate_connection_profile(profile_).has_value());
}

TEST_F(ValidationTest, Profile_RejectsShrinkingBackoff) {
    profile_.reconnect.backoff_multiplier = 0.5;
    EXPECT_FALSE(validate_connection_profile(profile_).has_value());
}

// =============================================================================
// Reconnect policy / file names
// =============================================================================

TEST_F(ValidationTest, ReconnectDelayGrowsAndCaps) {
    reconnect_policy policy;
    policy.initial_delay = 100ms;
    policy.max_delay = 1000ms;
    policy.backoff_multiplier = 2.0;

    EXPECT_EQ(policy.delay_for_attempt(1), 100ms);
    EXPECT_EQ(policy.delay_for_attempt(2), 200ms);
    EXPECT_EQ(policy.delay_for_attempt(4), 800ms);
    EXPECT_EQ(policy.delay_for_attempt(5), 1000ms);
    EXPECT_EQ(policy.delay_for_attempt(20), 1000ms);
}

TEST_F(ValidationTest, SanitizeFilename) {
    EXPECT_EQ(sanitize_filename("controller_log"), "controller_log");
    EXPECT_EQ(sanitize_filename("my app:logs"), "my_app_logs");
    EXPECT_EQ(sanitize_filename("a/b\\c"), "a_b_c");
    EXPECT_EQ(sanitize_filename("x<>y"), "x_y");
}

TEST_F(ValidationTest, ProfileEndpoint) {
    profile_.port = 2222;
    EXPECT_EQ(profile_.endpoint(), "root@192.168.1.100:2222");
}

}  // namespace kcenon::log_collector::test
