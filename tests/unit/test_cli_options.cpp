// tests/unit/test_cli_options.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../interfaces/cli/cli_options.hpp"
#include "../../interfaces/cli/console_printer.hpp"
#include "../../interfaces/cli/sniffer_app.hpp"
#include "../../src/common/config_manager.hpp"
#include <sstream>

using namespace PacketSniffer::CLI;
using namespace PacketSniffer::Common;
using namespace testing;

// ==================== Test Fixture ====================
class CliParserTest : public ::testing::Test
{
protected:
    bool parse(const std::vector<std::string> &args)
    {
        error.clear();
        return CliParser::parseArguments(args, options, error);
    }

    CliOptions options;
    std::string error;
};

// ==================== Defaults ====================
TEST_F(CliParserTest, DefaultsWithoutArguments)
{
    ASSERT_TRUE(parse({}));
    EXPECT_FALSE(options.interface.has_value());
    EXPECT_FALSE(options.read_file.has_value());
    EXPECT_FALSE(options.protocol.has_value());
    EXPECT_FALSE(options.port.has_value());
    EXPECT_EQ(options.count, 0u);
    EXPECT_EQ(options.stats_interval, 10u);
    EXPECT_FALSE(options.dashboard);
    EXPECT_FALSE(options.verbose);
    EXPECT_FALSE(options.list_interfaces);
    EXPECT_FALSE(options.show_help);
}

// ==================== Short & long forms ====================
TEST_F(CliParserTest, LongOptions)
{
    ASSERT_TRUE(parse({"--interface", "eth0", "--protocol", "http", "--port", "8080",
                       "--count", "100", "--dashboard", "--verbose",
                       "--export-json", "out.json", "--export-csv", "out.csv",
                       "--stats-interval", "5", "--config", "/tmp/c.json"}));

    EXPECT_EQ(options.interface, "eth0");
    EXPECT_EQ(options.protocol, "http");
    EXPECT_EQ(options.port, 8080);
    EXPECT_EQ(options.count, 100u);
    EXPECT_TRUE(options.dashboard);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.export_json, "out.json");
    EXPECT_EQ(options.export_csv, "out.csv");
    EXPECT_EQ(options.stats_interval, 5u);
    EXPECT_EQ(options.config_path, "/tmp/c.json");
}

TEST_F(CliParserTest, ShortOptions)
{
    ASSERT_TRUE(parse({"-i", "wlan0", "-p", "dns", "-P", "53", "-c", "7", "-d", "-v", "-l",
                       "-o", "capture"}));

    EXPECT_EQ(options.interface, "wlan0");
    EXPECT_EQ(options.protocol, "dns");
    EXPECT_EQ(options.port, 53);
    EXPECT_EQ(options.count, 7u);
    EXPECT_TRUE(options.dashboard);
    EXPECT_TRUE(options.verbose);
    EXPECT_TRUE(options.list_interfaces);
    EXPECT_EQ(options.export_default, "capture");
}

TEST_F(CliParserTest, InlineValues)
{
    ASSERT_TRUE(parse({"--read=trace.pcap", "--port=443", "--stats-interval=0"}));
    EXPECT_EQ(options.read_file, "trace.pcap");
    EXPECT_EQ(options.port, 443);
    EXPECT_EQ(options.stats_interval, 0u);
}

TEST_F(CliParserTest, InformationalFlags)
{
    ASSERT_TRUE(parse({"-h"}));
    EXPECT_TRUE(options.show_help);

    ASSERT_TRUE(parse({"--version"}));
    EXPECT_TRUE(options.show_version);
    EXPECT_FALSE(options.show_help);

    ASSERT_TRUE(parse({"--generate-config"}));
    EXPECT_TRUE(options.generate_config);
}

TEST_F(CliParserTest, ProtocolNotValidatedByParser)
{
    ASSERT_TRUE(parse({"--protocol", "gopher"}));
    EXPECT_EQ(options.protocol, "gopher");
}

// ==================== Errors ====================
TEST_F(CliParserTest, UnknownOption)
{
    EXPECT_FALSE(parse({"--bogus"}));
    EXPECT_EQ(error, "Unknown option: --bogus");
}

TEST_F(CliParserTest, UnexpectedPositional)
{
    EXPECT_FALSE(parse({"eth0"}));
    EXPECT_EQ(error, "Unexpected argument: eth0");
}

TEST_F(CliParserTest, MissingValue)
{
    EXPECT_FALSE(parse({"--interface"}));
    EXPECT_EQ(error, "Option --interface requires a value");
}

TEST_F(CliParserTest, FlagWithInlineValue)
{
    EXPECT_FALSE(parse({"--dashboard=yes"}));
    EXPECT_EQ(error, "Option --dashboard does not take a value");
}

TEST_F(CliParserTest, InvalidNumbers)
{
    EXPECT_FALSE(parse({"--port", "65536"}));
    EXPECT_EQ(error, "Invalid port number: 65536");

    EXPECT_FALSE(parse({"-P", "http"}));
    EXPECT_EQ(error, "Invalid port number: http");

    EXPECT_FALSE(parse({"-c", "-1"}));
    EXPECT_EQ(error, "Invalid packet count: -1");

    EXPECT_FALSE(parse({"--stats-interval", "1.5"}));
    EXPECT_EQ(error, "Invalid stats interval: 1.5");

    EXPECT_TRUE(parse({"--port", "65535"}));
    EXPECT_EQ(options.port, 65535);
}

TEST_F(CliParserTest, ParseCommandLineSkipsProgramName)
{
    char arg0[] = "packet_sniffer";
    char arg1[] = "-i";
    char arg2[] = "lo";
    char *argv[] = {arg0, arg1, arg2};

    ASSERT_TRUE(CliParser::parseCommandLine(3, argv, options, error));
    EXPECT_EQ(options.interface, "lo");
}

TEST_F(CliParserTest, HelpListsOptions)
{
    std::ostringstream help;
    CliParser::printHelp(help);

    EXPECT_THAT(help.str(), HasSubstr("--interface"));
    EXPECT_THAT(help.str(), HasSubstr("--export-csv"));
    EXPECT_THAT(help.str(), HasSubstr("--stats-interval"));
    EXPECT_THAT(help.str(), HasSubstr("export.default_directory"));

    std::ostringstream version;
    CliParser::printVersion(version);
    EXPECT_EQ(version.str(), "packet_sniffer 1.0.0\n");
}

// ==================== Export targets ====================
TEST(SnifferAppExportTest, ResolveExportPath)
{
    EXPECT_EQ(SnifferApp::resolveExportPath("out.json", "./exports"), "./exports/out.json");
    EXPECT_EQ(SnifferApp::resolveExportPath("out.json", "/data/"), "/data/out.json");
    EXPECT_EQ(SnifferApp::resolveExportPath("dir/out.json", "./exports"), "dir/out.json");
    EXPECT_EQ(SnifferApp::resolveExportPath("/abs/out.json", "./exports"), "/abs/out.json");
    EXPECT_EQ(SnifferApp::resolveExportPath("out.json", ""), "out.json");
}

TEST(SnifferAppExportTest, CollectExportTargets)
{
    CliOptions options;
    options.export_json = "a.json";
    options.export_csv = "b.csv";
    options.export_default = "c.out";

    auto targets = SnifferApp::collectExportTargets(options, "CSV", "");
    ASSERT_TRUE(targets.has_value());
    ASSERT_EQ(targets->size(), 3u);
    EXPECT_EQ((*targets)[0].format, "json");
    EXPECT_EQ((*targets)[0].path, "a.json");
    EXPECT_EQ((*targets)[1].format, "csv");
    EXPECT_EQ((*targets)[2].format, "csv");
    EXPECT_EQ((*targets)[2].path, "c.out");
}

TEST(SnifferAppExportTest, DefaultConfigKeepsGivenPath)
{
    auto &config = ConfigManager::getInstance();
    config.resetToDefaults();

    CliOptions options;
    options.export_json = "out.json";
    options.export_default = "capture";

    auto targets = SnifferApp::collectExportTargets(options,
                                                    config.getString(ConfigKeys::EXPORT_DEFAULT_FORMAT),
                                                    config.getString(ConfigKeys::EXPORT_DEFAULT_DIRECTORY));
    ASSERT_TRUE(targets.has_value());
    ASSERT_EQ(targets->size(), 2u);
    EXPECT_EQ((*targets)[0].path, "out.json");
    EXPECT_EQ((*targets)[1].format, "json");
    EXPECT_EQ((*targets)[1].path, "capture");
}

TEST(SnifferAppExportTest, UnsupportedDefaultFormat)
{
    CliOptions options;
    EXPECT_TRUE(SnifferApp::collectExportTargets(options, "xml", "")->empty());

    options.export_default = "capture";
    EXPECT_FALSE(SnifferApp::collectExportTargets(options, "xml", "").has_value());
}

// ==================== Output rate limiter ====================
TEST(OutputRateLimiterTest, UnlimitedByDefault)
{
    OutputRateLimiter limiter;
    for (int i = 0; i < 1000; ++i)
    {
        EXPECT_TRUE(limiter.allow(5000));
    }
    EXPECT_EQ(limiter.totalSuppressed(), 0u);
}

TEST(OutputRateLimiterTest, LimitsPerSecondWindow)
{
    OutputRateLimiter limiter(2);

    EXPECT_TRUE(limiter.allow(1000));
    EXPECT_TRUE(limiter.allow(1100));
    EXPECT_FALSE(limiter.allow(1200));
    EXPECT_FALSE(limiter.allow(1999));

    EXPECT_EQ(limiter.takeSuppressed(), 2u);
    EXPECT_EQ(limiter.takeSuppressed(), 0u);

    // Giây mới mở lại cửa sổ
    EXPECT_TRUE(limiter.allow(2000));
    EXPECT_TRUE(limiter.allow(2500));
    EXPECT_FALSE(limiter.allow(2600));
    EXPECT_EQ(limiter.totalSuppressed(), 3u);
}

// ==================== Console printer ====================
class ConsolePrinterTest : public ::testing::Test
{
protected:
    ConsolePrinterTest()
        : printer(out, ConsoleStyle(false, false, true))
    {
    }

    static PacketRecord makeRecord(const std::string &protocol, std::optional<std::string> app)
    {
        PacketRecord record;
        record.timestamp_us = 1700000000123456ULL;
        record.packet_number = 3;
        record.src_mac = "aa:bb:cc:dd:ee:ff";
        record.dst_mac = "00:11:22:33:44:55";
        record.src_ip = "192.168.1.10";
        record.dst_ip = "8.8.8.8";
        record.protocol = protocol;
        record.src_port = 5353;
        record.dst_port = 53;
        record.packet_size = 80;
        record.payload_size = 52;
        record.application_protocol = app;
        record.description = "Domain name lookup";
        return record;
    }

    std::ostringstream out;
    ConsolePrinter printer;
};

TEST_F(ConsolePrinterTest, SimpleLine)
{
    printer.printPacketSimple(makeRecord("UDP", std::string("DNS")));
    EXPECT_EQ(out.str(), "22:13:20.123 | UDP DNS | 192.168.1.10 -> 8.8.8.8 | Domain name lookup\n");
}

TEST_F(ConsolePrinterTest, SimpleLineWithoutAddresses)
{
    PacketRecord arp;
    arp.timestamp_us = 1700000000000000ULL;
    arp.protocol = "ARP";
    arp.description = "Address resolution (ARP)";

    printer.printPacketSimple(arp);
    EXPECT_EQ(out.str(), "22:13:20.000 | ARP  | N/A -> N/A | Address resolution (ARP)\n");
}

TEST_F(ConsolePrinterTest, VerboseBlock)
{
    printer.printPacketVerbose(makeRecord("UDP", std::string("DNS")));
    std::string text = out.str();

    EXPECT_THAT(text, HasSubstr("[Packet #3]"));
    EXPECT_THAT(text, HasSubstr("Timestamp: 2023-11-14 22:13:20.123 UTC"));
    EXPECT_THAT(text, HasSubstr("Ethernet: aa:bb:cc:dd:ee:ff -> 00:11:22:33:44:55"));
    EXPECT_THAT(text, HasSubstr("IP: 192.168.1.10 -> 8.8.8.8 (UDP)"));
    EXPECT_THAT(text, HasSubstr("Ports: 5353 -> 53"));
    EXPECT_THAT(text, HasSubstr("Application: DNS"));
    EXPECT_THAT(text, HasSubstr("Size: 80 bytes (payload: 52 bytes)"));
    EXPECT_THAT(text, Not(HasSubstr("Flags:")));
}

TEST_F(ConsolePrinterTest, Distributions)
{
    std::vector<PacketRecord> records = {
        makeRecord("UDP", std::string("DNS")),
        makeRecord("TCP", std::nullopt),
        makeRecord("TCP", std::string("HTTP")),
        makeRecord("TCP", std::string("HTTP"))};

    using Entry = std::pair<std::string, uint64_t>;
    EXPECT_THAT(ConsolePrinter::protocolDistribution(records),
                ElementsAre(Entry("TCP", 3), Entry("UDP", 1)));
    EXPECT_THAT(ConsolePrinter::applicationDistribution(records),
                ElementsAre(Entry("HTTP", 2), Entry("DNS", 1)));
}

TEST_F(ConsolePrinterTest, FinalSummaryTables)
{
    std::vector<PacketRecord> records = {
        makeRecord("UDP", std::string("DNS")),
        makeRecord("TCP", std::nullopt)};

    printer.printFinalSummary(records, 2);
    std::string text = out.str();

    EXPECT_THAT(text, HasSubstr("Total Duration: 2s"));
    EXPECT_THAT(text, HasSubstr("Total Packets: 2 (1.00 packets/second)"));
    EXPECT_THAT(text, HasSubstr("Total Data: 160.0 B (80.00 bytes/second)"));
    EXPECT_THAT(text, HasSubstr("| UDP      |          1 |      50.0% |"));
    EXPECT_THAT(text, HasSubstr("Application Protocols:"));
    EXPECT_THAT(text, HasSubstr("| DNS         |          1 |      50.0% |"));
}
