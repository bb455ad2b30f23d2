// tests/unit/test_common_logging.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/common/logging.hpp"
#include "../../src/common/config_manager.hpp"
#include "../../src/common/sniffer_error.hpp"
#include "../../src/common/utils.hpp"
#include <filesystem>
#include <sstream>

using namespace PacketSniffer::Common;
using namespace testing;

// ==================== Test Fixture ====================
class LoggingTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ConfigManager::getInstance().resetToDefaults();
        test_dir = "/tmp/packet_sniffer_logging_test_" + std::to_string(Utils::getCurrentTimestampUs());
    }

    void TearDown() override
    {
        // Trả logger mặc định về console để các test khác không ghi vào file đã xóa
        LoggingOptions options;
        options.enable_file = false;
        setupLogger(options);

        ConfigManager::getInstance().resetToDefaults();
        if (std::filesystem::exists(test_dir))
        {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string test_dir;
};

// ==================== Level parsing ====================
TEST_F(LoggingTest, ParseLogLevel)
{
    EXPECT_EQ(parseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel(" info "), spdlog::level::info);
    EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("error"), spdlog::level::err);
    EXPECT_EQ(parseLogLevel("nonsense"), spdlog::level::info);
}

// ==================== Options from config ====================
TEST_F(LoggingTest, OptionsFromConfig)
{
    auto &config = ConfigManager::getInstance();
    config.setString(ConfigKeys::LOGGING_LEVEL, "debug");
    config.setString(ConfigKeys::LOGGING_FILE, "/var/tmp/sniffer.log");
    config.setBool(ConfigKeys::LOGGING_ENABLE_CONSOLE, false);

    LoggingOptions options = loggingOptionsFromConfig();
    EXPECT_EQ(options.level, "debug");
    EXPECT_EQ(options.file, "/var/tmp/sniffer.log");
    EXPECT_FALSE(options.enable_console);
    EXPECT_TRUE(options.enable_file);
    EXPECT_FALSE(options.quiet_console);
}

// ==================== Logger setup ====================
TEST_F(LoggingTest, WritesToLogFile)
{
    LoggingOptions options;
    options.level = "debug";
    options.file = test_dir + "/logs/sniffer.log";
    options.enable_console = false;

    ASSERT_TRUE(setupLogger(options));
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);

    spdlog::info("Started packet capture on {}", "lo");
    spdlog::default_logger()->flush();

    std::string content = Utils::readFileToString(options.file);
    EXPECT_THAT(content, HasSubstr("[info]"));
    EXPECT_THAT(content, HasSubstr("Started packet capture on lo"));
}

TEST_F(LoggingTest, NoSinksStillInstallsLogger)
{
    LoggingOptions options;
    options.enable_console = false;
    options.enable_file = false;

    ASSERT_TRUE(setupLogger(options));
    ASSERT_NE(spdlog::default_logger(), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "packet_sniffer");
    spdlog::error("discarded");
}

// ==================== Error reporting ====================
TEST_F(LoggingTest, ErrorMessages)
{
    SnifferError not_found(ErrorCode::InterfaceNotFound, "eth9");
    EXPECT_EQ(not_found.describe(),
              "Network interface 'eth9' not found. Use --list-interfaces to see available interfaces.");
    EXPECT_THAT(not_found.suggestion(), HasSubstr("--list-interfaces"));

    SnifferError filter(ErrorCode::InvalidFilter, "smtp");
    EXPECT_THAT(filter.describe(), HasSubstr("'smtp'"));
    EXPECT_THAT(filter.describe(), HasSubstr("tcp, udp, icmp, http, dns"));

    EXPECT_EQ(errorCodeToString(ErrorCode::PermissionDenied), "PermissionDenied");
    EXPECT_EQ(errorCodeToString(ErrorCode::ExportError), "ExportError");
}

TEST_F(LoggingTest, ReportPrintsMessageAndSuggestion)
{
    std::ostringstream out;
    SnifferError(ErrorCode::ExportError, "cannot write out.csv").report(out);

    EXPECT_THAT(out.str(), HasSubstr("Error: Export error: cannot write out.csv."));
    EXPECT_THAT(out.str(), HasSubstr("Suggestion: Ensure you have write permissions"));
}
