// src/core/layer1/packet_decoder.cpp
#include "packet_decoder.hpp"
#include "../../common/network_utils.hpp"
#include <algorithm>
#include <cstring>
#include <cstdio>
#include <arpa/inet.h>
#include <netinet/ip.h>
#include <netinet/ip6.h>
#include <netinet/tcp.h>
#include <netinet/udp.h>

namespace PacketSniffer
{
    namespace Layer1
    {
        using Common::PacketRecord;
        using Common::NetworkUtils;

        namespace
        {
            constexpr size_t ETHERNET_HEADER_LEN = 14;
            constexpr size_t VLAN_TAG_LEN = 4;
            constexpr size_t ICMP_MIN_LEN = 4;
            constexpr size_t HTTP_SNIFF_LEN = 100;

            constexpr uint16_t ETH_TYPE_IPV4 = 0x0800;
            constexpr uint16_t ETH_TYPE_ARP = 0x0806;
            constexpr uint16_t ETH_TYPE_VLAN = 0x8100;
            constexpr uint16_t ETH_TYPE_IPV6 = 0x86DD;

            uint16_t readU16(const uint8_t *p)
            {
                return static_cast<uint16_t>((p[0] << 8) | p[1]);
            }
        } // namespace

        // ==================== Public API ====================

        PacketRecord PacketDecoder::decode(const uint8_t *data, size_t length,
                                           uint64_t timestamp_us, uint64_t packet_number,
                                           size_t wire_length)
        {
            PacketRecord record;
            record.timestamp_us = timestamp_us;
            record.packet_number = packet_number;
            record.packet_size = wire_length > 0 ? wire_length : length;
            record.protocol = "Unknown";
            record.description = "Unknown packet";

            if (!data || length < ETHERNET_HEADER_LEN)
            {
                return record;
            }

            record.dst_mac = NetworkUtils::macToString(data);
            record.src_mac = NetworkUtils::macToString(data + 6);

            size_t offset = ETHERNET_HEADER_LEN;
            uint16_t ether_type = readU16(data + 12);

            // Check for VLAN tag (802.1Q)
            if (ether_type == ETH_TYPE_VLAN && length >= offset + VLAN_TAG_LEN)
            {
                ether_type = readU16(data + offset + 2);
                offset += VLAN_TAG_LEN;
            }

            switch (ether_type)
            {
            case ETH_TYPE_IPV4:
                decodeIPv4(data + offset, length - offset, record);
                break;
            case ETH_TYPE_IPV6:
                decodeIPv6(data + offset, length - offset, record);
                break;
            case ETH_TYPE_ARP:
                record.protocol = "ARP";
                record.description = "Address resolution (ARP)";
                break;
            default:
            {
                char name[24];
                std::snprintf(name, sizeof(name), "EtherType-0x%04x", ether_type);
                record.protocol = name;
                break;
            }
            }

            // Geo hint theo địa chỉ đích
            if (record.dst_ip)
            {
                record.geo_info = NetworkUtils::getGeoLocation(*record.dst_ip);
            }

            return record;
        }

        // ==================== IPv4 ====================

        void PacketDecoder::decodeIPv4(const uint8_t *data, size_t length, PacketRecord &record)
        {
            if (length < sizeof(struct iphdr))
            {
                return;
            }

            const struct iphdr *ip_header = reinterpret_cast<const struct iphdr *>(data);
            size_t ip_header_len = ip_header->ihl * 4;
            if (ip_header_len < sizeof(struct iphdr) || ip_header_len > length)
            {
                return;
            }

            record.ip_version = 4;
            record.src_ip = NetworkUtils::ipv4BytesToString(reinterpret_cast<const uint8_t *>(&ip_header->saddr));
            record.dst_ip = NetworkUtils::ipv4BytesToString(reinterpret_cast<const uint8_t *>(&ip_header->daddr));

            // Giới hạn theo total length của IP (bỏ padding Ethernet)
            size_t ip_total = ntohs(ip_header->tot_len);
            size_t ip_end = (ip_total >= ip_header_len && ip_total <= length) ? ip_total : length;

            const uint8_t *transport = data + ip_header_len;
            size_t transport_len = ip_end - ip_header_len;

            switch (ip_header->protocol)
            {
            case IPPROTO_TCP:
            {
                record.protocol = "TCP";
                if (transport_len < sizeof(struct tcphdr))
                {
                    break;
                }

                const struct tcphdr *tcp_header = reinterpret_cast<const struct tcphdr *>(transport);
                size_t tcp_header_len = std::max<size_t>(tcp_header->doff * 4, sizeof(struct tcphdr));
                tcp_header_len = std::min(tcp_header_len, transport_len);

                record.src_port = ntohs(tcp_header->source);
                record.dst_port = ntohs(tcp_header->dest);
                record.payload_size = transport_len - tcp_header_len;
                record.flags = formatTcpFlags(transport[13]);

                record.application_protocol = detectApplicationProtocol(
                    *record.dst_port, transport + tcp_header_len, record.payload_size);
                record.description = describe(record);
                break;
            }
            case IPPROTO_UDP:
            {
                record.protocol = "UDP";
                if (transport_len < sizeof(struct udphdr))
                {
                    break;
                }

                const struct udphdr *udp_header = reinterpret_cast<const struct udphdr *>(transport);
                record.src_port = ntohs(udp_header->source);
                record.dst_port = ntohs(udp_header->dest);
                record.payload_size = transport_len - sizeof(struct udphdr);

                record.application_protocol = detectApplicationProtocol(
                    *record.dst_port, transport + sizeof(struct udphdr), record.payload_size);
                record.description = describe(record);
                break;
            }
            case IPPROTO_ICMP:
                record.protocol = "ICMP";
                if (transport_len >= ICMP_MIN_LEN)
                {
                    record.description = "ICMP ping/echo message";
                }
                break;
            default:
                record.protocol = NetworkUtils::getProtocolName(ip_header->protocol);
                break;
            }
        }

        // ==================== IPv6 ====================

        void PacketDecoder::decodeIPv6(const uint8_t *data, size_t length, PacketRecord &record)
        {
            record.protocol = "IPv6";
            record.description = "IPv6 packet (parsing not fully implemented)";

            if (length < sizeof(struct ip6_hdr))
            {
                return;
            }

            const struct ip6_hdr *ip6_header = reinterpret_cast<const struct ip6_hdr *>(data);
            record.ip_version = 6;
            record.src_ip = NetworkUtils::ipv6BytesToString(ip6_header->ip6_src.s6_addr);
            record.dst_ip = NetworkUtils::ipv6BytesToString(ip6_header->ip6_dst.s6_addr);
        }

        // ==================== Helpers ====================

        std::string PacketDecoder::formatTcpFlags(uint8_t flags)
        {
            static const struct
            {
                uint8_t mask;
                const char *name;
            } FLAG_NAMES[] = {
                {0x01, "FIN"}, {0x02, "SYN"}, {0x04, "RST"},
                {0x08, "PSH"}, {0x10, "ACK"}, {0x20, "URG"}};

            std::string result;
            for (const auto &flag : FLAG_NAMES)
            {
                if (flags & flag.mask)
                {
                    if (!result.empty())
                        result += ' ';
                    result += flag.name;
                }
            }
            return result;
        }

        std::optional<std::string> PacketDecoder::detectApplicationProtocol(uint16_t dst_port,
                                                                            const uint8_t *payload,
                                                                            size_t payload_length)
        {
            switch (dst_port)
            {
            case 80:
            case 8080:
            {
                if (payload && payload_length > 0)
                {
                    std::string text(reinterpret_cast<const char *>(payload),
                                     std::min(payload_length, HTTP_SNIFF_LEN));
                    if (text.compare(0, 3, "GET") == 0 || text.compare(0, 4, "POST") == 0 ||
                        text.compare(0, 4, "HTTP") == 0 || text.find("Host:") != std::string::npos)
                    {
                        return std::string("HTTP");
                    }
                }
                return std::string("Web Traffic");
            }
            case 443:
                return std::string("HTTPS");
            case 53:
                return std::string("DNS");
            case 22:
                return std::string("SSH");
            case 21:
                return std::string("FTP");
            case 25:
                return std::string("SMTP");
            case 110:
                return std::string("POP3");
            case 143:
                return std::string("IMAP");
            case 993:
                return std::string("IMAPS");
            case 995:
                return std::string("POP3S");
            default:
                return std::nullopt;
            }
        }

        std::string PacketDecoder::describe(const PacketRecord &record)
        {
            if (record.application_protocol)
            {
                const std::string &app = *record.application_protocol;
                if (app == "HTTP")
                    return "Web browsing (HTTP request/response)";
                if (app == "HTTPS")
                    return "Secure web browsing (encrypted)";
                if (app == "DNS")
                    return "Domain name lookup";
                if (app == "SSH")
                    return "Secure shell connection";
                if (app == "FTP")
                    return "File transfer";
                if (app == "SMTP")
                    return "Email sending";
                if (app == "Web Traffic")
                    return "Web-related traffic";
                return app + " communication";
            }

            bool has_ports = record.src_port && record.dst_port;
            if (record.protocol == "TCP")
            {
                return has_ports ? "TCP connection from port " + std::to_string(*record.src_port) +
                                       " to port " + std::to_string(*record.dst_port)
                                 : "TCP connection";
            }
            if (record.protocol == "UDP")
            {
                return has_ports ? "UDP communication from port " + std::to_string(*record.src_port) +
                                       " to port " + std::to_string(*record.dst_port)
                                 : "UDP communication";
            }
            if (record.protocol == "ICMP")
            {
                return "Network diagnostic (ping/traceroute)";
            }
            return record.protocol + " network traffic";
        }

    } // namespace Layer1
} // namespace PacketSniffer
