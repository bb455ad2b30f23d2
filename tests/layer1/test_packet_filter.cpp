// tests/layer1/test_packet_filter.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/core/layer1/packet_filter.hpp"

using namespace PacketSniffer::Layer1;
using namespace PacketSniffer::Common;
using namespace testing;

// ==================== Test Fixture ====================
class PacketFilterTest : public ::testing::Test
{
protected:
    PacketRecord makeRecord(const std::string &protocol,
                            std::optional<uint16_t> src_port = std::nullopt,
                            std::optional<uint16_t> dst_port = std::nullopt)
    {
        PacketRecord record;
        record.src_mac = "aa:bb:cc:dd:ee:ff";
        record.dst_mac = "00:11:22:33:44:55";
        record.ip_version = 4;
        record.src_ip = "192.168.1.10";
        record.dst_ip = "192.168.1.20";
        record.protocol = protocol;
        record.src_port = src_port;
        record.dst_port = dst_port;
        return record;
    }

    PacketFilter protocolFilter(const std::string &protocol)
    {
        return PacketFilter(protocol, std::nullopt);
    }
};

// ==================== No filter ====================
TEST_F(PacketFilterTest, EmptyFilterAcceptsEverything)
{
    PacketFilter filter;
    EXPECT_TRUE(filter.empty());
    EXPECT_EQ(filter.toString(), "none");

    PacketRecord arp;
    arp.src_mac = "aa:bb:cc:dd:ee:ff";
    arp.protocol = "ARP";
    EXPECT_TRUE(filter.matches(arp));
    EXPECT_TRUE(filter.matches(makeRecord("TCP", 1, 2)));
}

// ==================== Protocol filter ====================
TEST_F(PacketFilterTest, TransportProtocols)
{
    PacketFilter tcp = protocolFilter("tcp");
    EXPECT_TRUE(tcp.matches(makeRecord("TCP", 1000, 2000)));
    EXPECT_FALSE(tcp.matches(makeRecord("UDP", 1000, 2000)));

    PacketFilter udp = protocolFilter("UDP");
    EXPECT_TRUE(udp.matches(makeRecord("UDP", 1000, 2000)));
    EXPECT_FALSE(udp.matches(makeRecord("ICMP")));

    PacketFilter icmp = protocolFilter("Icmp");
    EXPECT_TRUE(icmp.matches(makeRecord("ICMP")));
    EXPECT_FALSE(icmp.matches(makeRecord("TCP", 1, 2)));
}

TEST_F(PacketFilterTest, HttpRequiresTcpOnWebPort)
{
    PacketFilter http = protocolFilter("http");
    EXPECT_TRUE(http.matches(makeRecord("TCP", 51000, 80)));
    EXPECT_TRUE(http.matches(makeRecord("TCP", 8080, 51000)));
    EXPECT_FALSE(http.matches(makeRecord("TCP", 51000, 443)));
    EXPECT_FALSE(http.matches(makeRecord("UDP", 51000, 80)));
}

TEST_F(PacketFilterTest, DnsRequiresUdpOnPort53)
{
    PacketFilter dns = protocolFilter("dns");
    EXPECT_TRUE(dns.matches(makeRecord("UDP", 40000, 53)));
    EXPECT_TRUE(dns.matches(makeRecord("UDP", 53, 40000)));
    EXPECT_FALSE(dns.matches(makeRecord("TCP", 40000, 53)));
    EXPECT_FALSE(dns.matches(makeRecord("UDP", 40000, 5353)));
}

TEST_F(PacketFilterTest, UnknownProtocolAcceptsIpv4)
{
    ProtocolFilter unknown("smtp");
    EXPECT_TRUE(unknown.evaluate(makeRecord("TCP", 1, 25)));
    EXPECT_TRUE(unknown.evaluate(makeRecord("ICMP")));
}

// ==================== Port filter ====================
TEST_F(PacketFilterTest, PortMatchesEitherSide)
{
    PacketFilter filter(std::nullopt, static_cast<uint16_t>(443));
    EXPECT_TRUE(filter.matches(makeRecord("TCP", 51000, 443)));
    EXPECT_TRUE(filter.matches(makeRecord("UDP", 443, 51000)));
    EXPECT_FALSE(filter.matches(makeRecord("TCP", 51000, 80)));
}

TEST_F(PacketFilterTest, PortFilterRejectsNonTransport)
{
    PacketFilter filter(std::nullopt, static_cast<uint16_t>(0));
    EXPECT_FALSE(filter.matches(makeRecord("ICMP")));
}

TEST_F(PacketFilterTest, ProtocolAndPortCombine)
{
    PacketFilter filter(std::string("tcp"), static_cast<uint16_t>(22));
    EXPECT_TRUE(filter.matches(makeRecord("TCP", 50000, 22)));
    EXPECT_FALSE(filter.matches(makeRecord("UDP", 50000, 22)));
    EXPECT_FALSE(filter.matches(makeRecord("TCP", 50000, 23)));
    EXPECT_EQ(filter.toString(), "protocol == tcp && port == 22");
}

// ==================== Frame kinds ====================
TEST_F(PacketFilterTest, ActiveFilterRejectsNonIpv4Ethernet)
{
    PacketFilter filter = protocolFilter("udp");

    PacketRecord ipv6 = makeRecord("IPv6");
    ipv6.ip_version = 6;
    EXPECT_FALSE(filter.matches(ipv6));

    PacketRecord arp = makeRecord("ARP");
    arp.ip_version = 0;
    EXPECT_FALSE(filter.matches(arp));
}

TEST_F(PacketFilterTest, ShortFramePassesActiveFilter)
{
    PacketFilter filter = protocolFilter("tcp");

    PacketRecord runt;      // quá ngắn để là Ethernet: không có MAC
    runt.protocol = "Unknown";
    EXPECT_TRUE(filter.matches(runt));
}

// ==================== Validation ====================
TEST_F(PacketFilterTest, ValidProtocolNames)
{
    EXPECT_TRUE(PacketFilter::isValidProtocol("tcp"));
    EXPECT_TRUE(PacketFilter::isValidProtocol("HTTP"));
    EXPECT_TRUE(PacketFilter::isValidProtocol(" dns "));
    EXPECT_FALSE(PacketFilter::isValidProtocol("smtp"));
    EXPECT_FALSE(PacketFilter::isValidProtocol(""));
    EXPECT_THAT(PacketFilter::supportedProtocols(), ElementsAre("tcp", "udp", "icmp", "http", "dns"));
}
