#include <gtest/gtest.h>
#include "DDOC/DoctorConfig.hpp"
#include <filesystem>
#include <fstream>

using namespace DDOC;

TEST(DoctorConfigTest, DefaultsAreValid) {
    DoctorConfig config;
    EXPECT_TRUE(config.isValid());
    EXPECT_EQ(config.adbPath, "adb");
    EXPECT_EQ(config.commandTimeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.discovery.retryDuration, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.discovery.maxAttempts, 3u);
}

TEST(DoctorConfigTest, IsValidRejectsBrokenValues) {
    DoctorConfig config;
    config.adbPath.clear();
    EXPECT_FALSE(config.isValid());

    config = DoctorConfig{};
    config.commandTimeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(config.isValid());

    config = DoctorConfig{};
    config.discovery.maxAttempts = 0;
    EXPECT_FALSE(config.isValid());

    config = DoctorConfig{};
    config.outputDirectory.clear();
    EXPECT_FALSE(config.isValid());

    config = DoctorConfig{};
    config.logLevel = "verbose";
    EXPECT_FALSE(config.isValid());
    config.logLevel = "off";
    EXPECT_TRUE(config.isValid());
}

TEST(DoctorConfigTest, ParseConfigOverridesPresentKeysOnly) {
    auto config = parseConfig(R"({
        "adb_path": "/opt/adb",
        "discovery_retry_ms": 0,
        "discovery_max_attempts": 5
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->adbPath, "/opt/adb");
    EXPECT_EQ(config->discovery.retryDuration, std::chrono::milliseconds(0));
    EXPECT_EQ(config->discovery.maxAttempts, 5u);
    EXPECT_EQ(config->outputDirectory, "/tmp/device_doctor");
    EXPECT_EQ(config->commandTimeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(config->logLevel, "info");
}

TEST(DoctorConfigTest, ParseConfigRejectsMalformedInput) {
    EXPECT_EQ(parseConfig("{ not json").error(), DoctorError::InvalidConfig);
    EXPECT_EQ(parseConfig("[1, 2]").error(), DoctorError::InvalidConfig);
    EXPECT_EQ(parseConfig(R"({"command_timeout_ms": "soon"})").error(), DoctorError::InvalidConfig);
    EXPECT_EQ(parseConfig(R"({"discovery_max_attempts": -1})").error(), DoctorError::InvalidConfig);
    EXPECT_EQ(parseConfig(R"({"adb_path": ""})").error(), DoctorError::InvalidConfig);
    EXPECT_EQ(parseConfig(R"({"log_level": "verbose"})").error(), DoctorError::InvalidConfig);
    EXPECT_EQ(parseConfig(R"({"discovery_max_attempts": 4294967297})").error(), DoctorError::InvalidConfig);
    EXPECT_EQ(parseConfig(R"({"output_directory": ""})").error(), DoctorError::InvalidConfig);
}

TEST(DoctorConfigTest, ParseConfigAcceptsLargestAttemptCount) {
    auto config = parseConfig(R"({"discovery_max_attempts": 4294967295, "log_level": "warning"})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->discovery.maxAttempts, 4294967295u);
}

TEST(DoctorConfigTest, LoadConfigReadsFile) {
    const auto path = std::filesystem::temp_directory_path() / "device_doctor_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"output_directory": "/tmp/output", "log_level": "debug"})";
    }
    auto config = loadConfig(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->outputDirectory, "/tmp/output");
    EXPECT_EQ(config->logLevel, "debug");
}

TEST(DoctorConfigTest, LoadConfigMissingFile) {
    auto config = loadConfig("/nonexistent/device_doctor.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), DoctorError::InvalidConfig);
}

TEST(DoctorErrorTest, ConvertsToErrorCode) {
    std::error_code ec = DoctorError::BuildFailed;
    EXPECT_EQ(ec.category().name(), std::string("DeviceDoctor"));
    EXPECT_EQ(ec.message(), "Device discovery failed after retries");
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_FALSE(static_cast<bool>(make_error_code(DoctorError::Success)));
}
