// tests/layer1/test_packet_decoder.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/core/layer1/packet_decoder.hpp"
#include <cstring>
#include <string>
#include <vector>

using namespace PacketSniffer::Layer1;
using namespace PacketSniffer::Common;
using namespace testing;

// ==================== Frame builders ====================
namespace
{
    const uint8_t DST_MAC[6] = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55};
    const uint8_t SRC_MAC[6] = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};

    void putU16(std::vector<uint8_t> &buf, uint16_t value)
    {
        buf.push_back(static_cast<uint8_t>(value >> 8));
        buf.push_back(static_cast<uint8_t>(value & 0xff));
    }

    std::vector<uint8_t> ethernet(uint16_t ether_type, const std::vector<uint8_t> &payload)
    {
        std::vector<uint8_t> frame(DST_MAC, DST_MAC + 6);
        frame.insert(frame.end(), SRC_MAC, SRC_MAC + 6);
        putU16(frame, ether_type);
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }

    std::vector<uint8_t> ipv4(uint8_t protocol, const uint8_t src[4], const uint8_t dst[4],
                              const std::vector<uint8_t> &transport)
    {
        std::vector<uint8_t> packet;
        packet.push_back(0x45);     // version 4, IHL 5
        packet.push_back(0x00);
        putU16(packet, static_cast<uint16_t>(20 + transport.size()));
        putU16(packet, 0x1234);     // id
        putU16(packet, 0x4000);     // DF
        packet.push_back(64);       // TTL
        packet.push_back(protocol);
        putU16(packet, 0);          // checksum
        packet.insert(packet.end(), src, src + 4);
        packet.insert(packet.end(), dst, dst + 4);
        packet.insert(packet.end(), transport.begin(), transport.end());
        return packet;
    }

    std::vector<uint8_t> tcp(uint16_t sport, uint16_t dport, uint8_t flags, const std::string &payload)
    {
        std::vector<uint8_t> segment;
        putU16(segment, sport);
        putU16(segment, dport);
        segment.insert(segment.end(), {0, 0, 0, 1});   // seq
        segment.insert(segment.end(), {0, 0, 0, 0});   // ack
        segment.push_back(0x50);                        // data offset 5
        segment.push_back(flags);
        putU16(segment, 65535);                         // window
        putU16(segment, 0);                             // checksum
        putU16(segment, 0);                             // urgent
        segment.insert(segment.end(), payload.begin(), payload.end());
        return segment;
    }

    std::vector<uint8_t> udp(uint16_t sport, uint16_t dport, const std::string &payload)
    {
        std::vector<uint8_t> datagram;
        putU16(datagram, sport);
        putU16(datagram, dport);
        putU16(datagram, static_cast<uint16_t>(8 + payload.size()));
        putU16(datagram, 0);
        datagram.insert(datagram.end(), payload.begin(), payload.end());
        return datagram;
    }

    const uint8_t LAN_A[4] = {192, 168, 1, 10};
    const uint8_t LAN_B[4] = {192, 168, 1, 20};
    const uint8_t GOOGLE_DNS[4] = {8, 8, 8, 8};

    PacketRecord decodeFrame(const std::vector<uint8_t> &frame, uint64_t number = 1)
    {
        return PacketDecoder::decode(frame.data(), frame.size(), 1700000000123456ULL, number);
    }
} // namespace

// ==================== Ethernet ====================
TEST(PacketDecoderTest, ShortFrameKeepsDefaults)
{
    std::vector<uint8_t> frame(10, 0xab);
    PacketRecord record = decodeFrame(frame, 7);

    EXPECT_EQ(record.packet_number, 7u);
    EXPECT_EQ(record.packet_size, 10u);
    EXPECT_EQ(record.protocol, "Unknown");
    EXPECT_TRUE(record.src_mac.empty());
    EXPECT_TRUE(record.dst_mac.empty());
    EXPECT_FALSE(record.src_ip.has_value());
    EXPECT_EQ(record.ip_version, 0);
    EXPECT_FALSE(record.geo_info.has_value());
}

TEST(PacketDecoderTest, NullDataIsHandled)
{
    PacketRecord record = PacketDecoder::decode(nullptr, 0, 0, 1);
    EXPECT_EQ(record.protocol, "Unknown");
    EXPECT_EQ(record.packet_size, 0u);
}

TEST(PacketDecoderTest, MacAddressesAreFormatted)
{
    PacketRecord record = decodeFrame(ethernet(0x0806, std::vector<uint8_t>(28, 0)));

    EXPECT_EQ(record.dst_mac, "00:11:22:33:44:55");
    EXPECT_EQ(record.src_mac, "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(record.protocol, "ARP");
    EXPECT_EQ(record.ip_version, 0);
}

TEST(PacketDecoderTest, UnknownEtherTypeIsNamed)
{
    PacketRecord record = decodeFrame(ethernet(0x88cc, std::vector<uint8_t>(20, 0)));
    EXPECT_EQ(record.protocol, "EtherType-0x88cc");
}

TEST(PacketDecoderTest, WireLengthOverridesCapturedLength)
{
    auto frame = ethernet(0x0800, ipv4(17, LAN_A, LAN_B, udp(1000, 2000, "abc")));
    PacketRecord record = PacketDecoder::decode(frame.data(), frame.size(), 0, 1, 1514);
    EXPECT_EQ(record.packet_size, 1514u);
}

// ==================== IPv4 / TCP ====================
TEST(PacketDecoderTest, HttpRequestOverTcp)
{
    std::string payload = "GET /index.html HTTP/1.1\r\nHost: example.com\r\n\r\n";
    auto frame = ethernet(0x0800, ipv4(6, LAN_A, LAN_B, tcp(51515, 80, 0x18, payload)));
    PacketRecord record = decodeFrame(frame);

    EXPECT_EQ(record.ip_version, 4);
    EXPECT_EQ(record.protocol, "TCP");
    ASSERT_TRUE(record.src_ip.has_value());
    EXPECT_EQ(*record.src_ip, "192.168.1.10");
    EXPECT_EQ(*record.dst_ip, "192.168.1.20");
    EXPECT_EQ(record.src_port, std::optional<uint16_t>(51515));
    EXPECT_EQ(record.dst_port, std::optional<uint16_t>(80));
    EXPECT_EQ(record.flags, std::optional<std::string>("PSH ACK"));
    EXPECT_EQ(record.payload_size, payload.size());
    EXPECT_EQ(record.application_protocol, std::optional<std::string>("HTTP"));
    EXPECT_EQ(record.description, "Web browsing (HTTP request/response)");
    EXPECT_EQ(record.packet_size, frame.size());
    EXPECT_EQ(record.timestamp_us, 1700000000123456ULL);
}

TEST(PacketDecoderTest, WebPortWithoutHttpPayload)
{
    auto frame = ethernet(0x0800, ipv4(6, LAN_A, LAN_B, tcp(40000, 8080, 0x10, std::string("\x01\x02\x03", 3))));
    PacketRecord record = decodeFrame(frame);

    EXPECT_EQ(record.application_protocol, std::optional<std::string>("Web Traffic"));
    EXPECT_EQ(record.description, "Web-related traffic");
}

TEST(PacketDecoderTest, TcpSynWithoutKnownPort)
{
    auto frame = ethernet(0x0800, ipv4(6, LAN_A, LAN_B, tcp(40000, 3389, 0x02, "")));
    PacketRecord record = decodeFrame(frame);

    EXPECT_EQ(record.flags, std::optional<std::string>("SYN"));
    EXPECT_FALSE(record.application_protocol.has_value());
    EXPECT_EQ(record.payload_size, 0u);
    EXPECT_EQ(record.description, "TCP connection from port 40000 to port 3389");
}

TEST(PacketDecoderTest, EthernetPaddingIsNotPayload)
{
    auto frame = ethernet(0x0800, ipv4(6, LAN_A, LAN_B, tcp(1234, 22, 0x10, "")));
    frame.resize(60, 0);    // minimum Ethernet frame

    PacketRecord record = decodeFrame(frame);
    EXPECT_EQ(record.payload_size, 0u);
    EXPECT_EQ(record.packet_size, 60u);
    EXPECT_EQ(record.application_protocol, std::optional<std::string>("SSH"));
}

TEST(PacketDecoderTest, TruncatedIpv4HeaderHasNoAddresses)
{
    std::vector<uint8_t> partial = {0x45, 0x00, 0x00, 0x28, 0x00};
    PacketRecord record = decodeFrame(ethernet(0x0800, partial));

    EXPECT_EQ(record.ip_version, 0);
    EXPECT_FALSE(record.src_ip.has_value());
    EXPECT_FALSE(record.dst_ip.has_value());
}

// ==================== IPv4 / UDP / ICMP ====================
TEST(PacketDecoderTest, DnsQueryOverUdp)
{
    auto frame = ethernet(0x0800, ipv4(17, LAN_A, GOOGLE_DNS, udp(53000, 53, std::string(30, 'q'))));
    PacketRecord record = decodeFrame(frame);

    EXPECT_EQ(record.protocol, "UDP");
    EXPECT_EQ(record.payload_size, 30u);
    EXPECT_FALSE(record.flags.has_value());
    EXPECT_EQ(record.application_protocol, std::optional<std::string>("DNS"));
    EXPECT_EQ(record.description, "Domain name lookup");

    ASSERT_TRUE(record.geo_info.has_value());
    EXPECT_EQ(record.geo_info->country, "United States");
    EXPECT_EQ(record.geo_info->city, "Mountain View");
}

TEST(PacketDecoderTest, PlainUdpDescription)
{
    auto frame = ethernet(0x0800, ipv4(17, LAN_A, LAN_B, udp(5000, 6000, "xyz")));
    PacketRecord record = decodeFrame(frame);

    EXPECT_FALSE(record.application_protocol.has_value());
    EXPECT_EQ(record.description, "UDP communication from port 5000 to port 6000");
    ASSERT_TRUE(record.geo_info.has_value());
    EXPECT_EQ(record.geo_info->country, "Local Network");
    EXPECT_FALSE(record.geo_info->latitude.has_value());
    EXPECT_FALSE(record.geo_info->longitude.has_value());
}

TEST(PacketDecoderTest, IcmpEcho)
{
    std::vector<uint8_t> icmp = {8, 0, 0, 0, 0, 1, 0, 1};
    PacketRecord record = decodeFrame(ethernet(0x0800, ipv4(1, LAN_A, LAN_B, icmp)));

    EXPECT_EQ(record.protocol, "ICMP");
    EXPECT_FALSE(record.src_port.has_value());
    EXPECT_EQ(record.description, "ICMP ping/echo message");
}

TEST(PacketDecoderTest, OtherIpProtocolIsNumbered)
{
    PacketRecord record = decodeFrame(ethernet(0x0800, ipv4(47, LAN_A, LAN_B, std::vector<uint8_t>(8, 0))));
    EXPECT_EQ(record.protocol, "IPv4-47");
    EXPECT_EQ(record.ip_version, 4);
}

TEST(PacketDecoderTest, VlanTagIsSkipped)
{
    std::vector<uint8_t> tagged = {0x00, 0x64, 0x08, 0x00};     // VLAN 100, inner IPv4
    auto inner = ipv4(17, LAN_A, LAN_B, udp(1111, 53, "q"));
    tagged.insert(tagged.end(), inner.begin(), inner.end());

    PacketRecord record = decodeFrame(ethernet(0x8100, tagged));
    EXPECT_EQ(record.protocol, "UDP");
    EXPECT_EQ(record.dst_port, std::optional<uint16_t>(53));
}

// ==================== IPv6 ====================
TEST(PacketDecoderTest, Ipv6AddressesAreDecoded)
{
    std::vector<uint8_t> header(40, 0);
    header[0] = 0x60;
    header[6] = 17;     // next header UDP
    header[7] = 64;
    // src 2001:db8::1
    header[8] = 0x20;
    header[9] = 0x01;
    header[10] = 0x0d;
    header[11] = 0xb8;
    header[23] = 0x01;
    // dst ::1
    header[39] = 0x01;

    PacketRecord record = decodeFrame(ethernet(0x86DD, header));

    EXPECT_EQ(record.protocol, "IPv6");
    EXPECT_EQ(record.ip_version, 6);
    EXPECT_EQ(record.src_ip, std::optional<std::string>("2001:db8::1"));
    EXPECT_EQ(record.dst_ip, std::optional<std::string>("::1"));
    EXPECT_EQ(record.description, "IPv6 packet (parsing not fully implemented)");
    ASSERT_TRUE(record.geo_info.has_value());
    EXPECT_EQ(record.geo_info->country, "Local Network");
}

// ==================== Helpers ====================
TEST(PacketDecoderTest, TcpFlagOrder)
{
    EXPECT_EQ(PacketDecoder::formatTcpFlags(0x00), "");
    EXPECT_EQ(PacketDecoder::formatTcpFlags(0x12), "SYN ACK");
    EXPECT_EQ(PacketDecoder::formatTcpFlags(0x11), "FIN ACK");
    EXPECT_EQ(PacketDecoder::formatTcpFlags(0x3F), "FIN SYN RST PSH ACK URG");
}

TEST(PacketDecoderTest, ApplicationProtocolByPort)
{
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(443, nullptr, 0), std::optional<std::string>("HTTPS"));
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(21, nullptr, 0), std::optional<std::string>("FTP"));
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(25, nullptr, 0), std::optional<std::string>("SMTP"));
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(110, nullptr, 0), std::optional<std::string>("POP3"));
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(143, nullptr, 0), std::optional<std::string>("IMAP"));
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(993, nullptr, 0), std::optional<std::string>("IMAPS"));
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(995, nullptr, 0), std::optional<std::string>("POP3S"));
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(80, nullptr, 0), std::optional<std::string>("Web Traffic"));
    EXPECT_FALSE(PacketDecoder::detectApplicationProtocol(12345, nullptr, 0).has_value());

    const std::string response = "HTTP/1.1 200 OK\r\n";
    EXPECT_EQ(PacketDecoder::detectApplicationProtocol(
                  8080, reinterpret_cast<const uint8_t *>(response.data()), response.size()),
              std::optional<std::string>("HTTP"));
}

TEST(PacketDecoderTest, DescriptionForUnlistedApplication)
{
    PacketRecord record;
    record.protocol = "TCP";
    record.application_protocol = "IMAPS";
    EXPECT_EQ(PacketDecoder::describe(record), "IMAPS communication");

    PacketRecord arp;
    arp.protocol = "ARP";
    EXPECT_EQ(PacketDecoder::describe(arp), "ARP network traffic");
}
