// tests/unit/test_telemetry_threat_classifier.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/core/telemetry/threat_classifier.hpp"

using namespace PacketSniffer::Telemetry;
using namespace PacketSniffer::Common;
using namespace testing;

// ==================== Test Fixture ====================
class ThreatClassifierTest : public ::testing::Test
{
protected:
    PacketRecord makeTcp(const std::string &dst_ip, uint16_t dst_port, size_t size)
    {
        PacketRecord record;
        record.ip_version = 4;
        record.src_ip = "192.168.1.50";
        record.dst_ip = dst_ip;
        record.protocol = "TCP";
        record.src_port = 51000;
        record.dst_port = dst_port;
        record.packet_size = size;
        return record;
    }
};

// ==================== Combined score ====================
TEST_F(ThreatClassifierTest, RdpToPublicAddressIsMedium)
{
    PacketRecord record = makeTcp("93.184.216.34", 3389, 100);

    EXPECT_EQ(ThreatClassifier::score(record), 4);
    EXPECT_EQ(ThreatClassifier::classify(record), ThreatLevel::Medium);
}

TEST_F(ThreatClassifierTest, HttpsInsideLanIsSafe)
{
    PacketRecord record = makeTcp("192.168.1.1", 443, 400);

    EXPECT_EQ(ThreatClassifier::score(record), 0);
    EXPECT_EQ(ThreatClassifier::classify(record), ThreatLevel::Safe);
}

TEST_F(ThreatClassifierTest, DestinationPortPreferredOverSource)
{
    PacketRecord record = makeTcp("192.168.1.1", 80, 400);
    record.src_port = 3389;
    EXPECT_EQ(ThreatClassifier::score(record), 0);

    record.dst_port.reset();
    EXPECT_EQ(ThreatClassifier::score(record), 3);
}

TEST_F(ThreatClassifierTest, CriticalCombination)
{
    // SMB (3) + 10.0.0.x (2) + jumbo (1) + non-DNS UDP (1) = 7 -> High
    PacketRecord record = makeTcp("10.0.0.7", 445, 9000);
    record.protocol = "UDP";
    EXPECT_EQ(ThreatClassifier::score(record), 7);
    EXPECT_EQ(ThreatClassifier::classify(record), ThreatLevel::High);

    // 169.254.x.x là link-local nên không được coi là private: +1 +2
    record.dst_ip = "169.254.10.10";
    EXPECT_EQ(ThreatClassifier::score(record), 8);
    EXPECT_EQ(ThreatClassifier::classify(record), ThreatLevel::Critical);
}

TEST_F(ThreatClassifierTest, RecordWithoutAddressesOnlyUsesSizeAndProtocol)
{
    PacketRecord record;
    record.protocol = "ARP";
    record.packet_size = 42;

    EXPECT_EQ(ThreatClassifier::score(record), 1);
    EXPECT_EQ(ThreatClassifier::classify(record), ThreatLevel::Safe);
}

TEST_F(ThreatClassifierTest, Deterministic)
{
    PacketRecord record = makeTcp("8.8.4.4", 23, 20);
    ThreatLevel first = ThreatClassifier::classify(record);
    for (int i = 0; i < 10; ++i)
    {
        EXPECT_EQ(ThreatClassifier::classify(record), first);
    }
}

// ==================== Individual rules ====================
TEST_F(ThreatClassifierTest, PortWeights)
{
    for (uint16_t port : {1433, 3389, 5900, 23, 135, 139, 445})
    {
        EXPECT_EQ(ThreatClassifier::portScore(port), 3) << "port " << port;
    }
    for (uint16_t port : {21, 25, 110, 143, 993, 995})
    {
        EXPECT_EQ(ThreatClassifier::portScore(port), 2) << "port " << port;
    }

    EXPECT_EQ(ThreatClassifier::portScore(49152), 0);
    EXPECT_EQ(ThreatClassifier::portScore(49153), 1);
    EXPECT_EQ(ThreatClassifier::portScore(65535), 1);
    EXPECT_EQ(ThreatClassifier::portScore(80), 0);
    EXPECT_EQ(ThreatClassifier::portScore(443), 0);
}

TEST_F(ThreatClassifierTest, DestinationWeights)
{
    EXPECT_EQ(ThreatClassifier::destinationScore("192.168.0.1"), 0);
    EXPECT_EQ(ThreatClassifier::destinationScore("172.16.5.5"), 0);
    EXPECT_EQ(ThreatClassifier::destinationScore("10.1.2.3"), 0);
    EXPECT_EQ(ThreatClassifier::destinationScore("127.0.0.1"), 0);
    EXPECT_EQ(ThreatClassifier::destinationScore("10.0.0.1"), 2);
    EXPECT_EQ(ThreatClassifier::destinationScore("169.254.1.1"), 3);
    EXPECT_EQ(ThreatClassifier::destinationScore("1.1.1.1"), 1);
}

TEST_F(ThreatClassifierTest, SizeWeights)
{
    EXPECT_EQ(ThreatClassifier::sizeScore(63), 1);
    EXPECT_EQ(ThreatClassifier::sizeScore(64), 0);
    EXPECT_EQ(ThreatClassifier::sizeScore(1500), 0);
    EXPECT_EQ(ThreatClassifier::sizeScore(1501), 1);
}

TEST_F(ThreatClassifierTest, ProtocolWeights)
{
    PacketRecord record;
    record.protocol = "ICMP";
    EXPECT_EQ(ThreatClassifier::protocolScore(record), 1);

    record.protocol = "UDP";
    record.dst_port = 53;
    EXPECT_EQ(ThreatClassifier::protocolScore(record), 0);

    record.dst_port = 123;
    EXPECT_EQ(ThreatClassifier::protocolScore(record), 1);

    record.protocol = "TCP";
    EXPECT_EQ(ThreatClassifier::protocolScore(record), 0);
}

// ==================== Level mapping ====================
TEST_F(ThreatClassifierTest, LevelBoundaries)
{
    EXPECT_EQ(ThreatClassifier::levelForScore(0), ThreatLevel::Safe);
    EXPECT_EQ(ThreatClassifier::levelForScore(1), ThreatLevel::Safe);
    EXPECT_EQ(ThreatClassifier::levelForScore(2), ThreatLevel::Low);
    EXPECT_EQ(ThreatClassifier::levelForScore(3), ThreatLevel::Low);
    EXPECT_EQ(ThreatClassifier::levelForScore(4), ThreatLevel::Medium);
    EXPECT_EQ(ThreatClassifier::levelForScore(5), ThreatLevel::Medium);
    EXPECT_EQ(ThreatClassifier::levelForScore(6), ThreatLevel::High);
    EXPECT_EQ(ThreatClassifier::levelForScore(7), ThreatLevel::High);
    EXPECT_EQ(ThreatClassifier::levelForScore(8), ThreatLevel::Critical);
    EXPECT_EQ(ThreatClassifier::levelForScore(12), ThreatLevel::Critical);
}

TEST_F(ThreatClassifierTest, LevelNames)
{
    EXPECT_STREQ(threatLevelToString(ThreatLevel::Safe), "Safe");
    EXPECT_STREQ(threatLevelToString(ThreatLevel::Low), "Low");
    EXPECT_STREQ(threatLevelToString(ThreatLevel::Medium), "Medium");
    EXPECT_STREQ(threatLevelToString(ThreatLevel::High), "High");
    EXPECT_STREQ(threatLevelToString(ThreatLevel::Critical), "Critical");
    EXPECT_LT(ThreatLevel::Low, ThreatLevel::High);
}
