// src/common/network_utils.cpp
#include "network_utils.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cstring>
#include <cstdio>

namespace PacketSniffer
{
    namespace Common
    {
        // ==================== IP address utilities ====================

        bool NetworkUtils::isValidIPv4(const std::string &ip)
        {
            struct sockaddr_in sa;
            return inet_pton(AF_INET, ip.c_str(), &(sa.sin_addr)) == 1;
        }

        bool NetworkUtils::isValidIPv6(const std::string &ip)
        {
            struct sockaddr_in6 sa;
            return inet_pton(AF_INET6, ip.c_str(), &(sa.sin6_addr)) == 1;
        }

        uint32_t NetworkUtils::ipStringToInt(const std::string &ip)
        {
            struct sockaddr_in sa;
            if (inet_pton(AF_INET, ip.c_str(), &(sa.sin_addr)) == 1) {
                return ntohl(sa.sin_addr.s_addr);
            }
            return 0;
        }

        bool NetworkUtils::isPrivateIP(const std::string &ip)
        {
            if (!isValidIPv4(ip)) {
                return false;
            }

            uint32_t ip_int = ipStringToInt(ip);

            // 10.0.0.0/8 (10.0.0.0 - 10.255.255.255)
            if ((ip_int >= 0x0A000000) && (ip_int <= 0x0AFFFFFF)) {
                return true;
            }

            // 172.16.0.0/12 (172.16.0.0 - 172.31.255.255)
            if ((ip_int >= 0xAC100000) && (ip_int <= 0xAC1FFFFF)) {
                return true;
            }

            // 192.168.0.0/16 (192.168.0.0 - 192.168.255.255)
            if ((ip_int >= 0xC0A80000) && (ip_int <= 0xC0A8FFFF)) {
                return true;
            }

            return false;
        }

        bool NetworkUtils::isLoopbackIP(const std::string &ip)
        {
            if (isValidIPv6(ip)) {
                struct in6_addr addr;
                inet_pton(AF_INET6, ip.c_str(), &addr);
                return IN6_IS_ADDR_LOOPBACK(&addr);
            }

            if (!isValidIPv4(ip)) {
                return false;
            }

            uint32_t ip_int = ipStringToInt(ip);
            // 127.0.0.0/8 (127.0.0.0 - 127.255.255.255)
            return (ip_int >= 0x7F000000) && (ip_int <= 0x7FFFFFFF);
        }

        bool NetworkUtils::isLinkLocalIPv6(const std::string &ip)
        {
            struct in6_addr addr;
            if (inet_pton(AF_INET6, ip.c_str(), &addr) != 1) {
                return false;
            }
            // fe80::/10
            return addr.s6_addr[0] == 0xfe && (addr.s6_addr[1] & 0xc0) == 0x80;
        }

        bool NetworkUtils::isLocalAddress(const std::string &ip)
        {
            return isPrivateIP(ip) || isLoopbackIP(ip) || isLinkLocalIPv6(ip);
        }

        std::string NetworkUtils::ipv4BytesToString(const uint8_t *bytes)
        {
            char str[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, bytes, str, INET_ADDRSTRLEN)) {
                return std::string(str);
            }
            return "";
        }

        std::string NetworkUtils::ipv6BytesToString(const uint8_t *bytes)
        {
            char str[INET6_ADDRSTRLEN];
            if (inet_ntop(AF_INET6, bytes, str, INET6_ADDRSTRLEN)) {
                return std::string(str);
            }
            return "";
        }

        std::string NetworkUtils::macToString(const uint8_t *mac)
        {
            char buf[18];
            std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                          mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
            return std::string(buf);
        }

        // ==================== Protocol utilities ====================

        std::string NetworkUtils::getProtocolName(int protocol_number)
        {
            switch (protocol_number) {
            case 1:
                return "ICMP";
            case 6:
                return "TCP";
            case 17:
                return "UDP";
            default:
                return "IPv4-" + std::to_string(protocol_number);
            }
        }

        // ==================== Geolocation ====================

        GeoLocation NetworkUtils::getGeoLocation(const std::string &ip)
        {
            if (isLocalAddress(ip)) {
                return GeoLocation("Local Network", "Local");
            }

            if (Utils::startsWith(ip, "8.8.")) {
                return GeoLocation("United States", "Mountain View", 37.4056, -122.0775);
            }

            if (Utils::startsWith(ip, "1.1.")) {
                return GeoLocation("Australia", "Sydney", -33.8688, 151.2093);
            }

            return GeoLocation("Unknown", "Unknown");
        }

    } // namespace Common
} // namespace PacketSniffer
