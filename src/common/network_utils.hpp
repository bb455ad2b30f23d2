// src/common/network_utils.hpp
#ifndef PACKET_SNIFFER_NETWORK_UTILS_HPP
#define PACKET_SNIFFER_NETWORK_UTILS_HPP

#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace PacketSniffer
{
    namespace Common
    {
        /**
         * @brief Thông tin vị trí địa lý (dữ liệu placeholder, không tra cứu thật)
         */
        struct GeoLocation
        {
            std::string country;
            std::string city;
            std::optional<double> latitude;   // Không có tọa độ cho Local/Unknown
            std::optional<double> longitude;

            GeoLocation() = default;
            GeoLocation(const std::string &c, const std::string &ci)
                : country(c), city(ci) {}
            GeoLocation(const std::string &c, const std::string &ci, double lat, double lon)
                : country(c), city(ci), latitude(lat), longitude(lon) {}
        };

        /**
         * @brief Tiện ích mạng
         */
        class NetworkUtils
        {
        public:
            /**
             * @brief IP address utilities
             */
            static bool isValidIPv4(const std::string &ip);
            static bool isValidIPv6(const std::string &ip);
            static uint32_t ipStringToInt(const std::string &ip);

            /**
             * @brief 10/8, 172.16/12, 192.168/16
             */
            static bool isPrivateIP(const std::string &ip);

            /**
             * @brief 127/8 hoặc ::1
             */
            static bool isLoopbackIP(const std::string &ip);

            /**
             * @brief IPv6 link-local fe80::/10
             */
            static bool isLinkLocalIPv6(const std::string &ip);

            /**
             * @brief Địa chỉ thuộc mạng nội bộ (private, loopback hoặc link-local IPv6)
             */
            static bool isLocalAddress(const std::string &ip);

            /**
             * @brief Chuyển đổi bytes thô sang dạng text
             */
            static std::string ipv4BytesToString(const uint8_t *bytes);
            static std::string ipv6BytesToString(const uint8_t *bytes);
            static std::string macToString(const uint8_t *mac);

            /**
             * @brief Tên protocol IPv4 theo số hiệu (6 -> "TCP", ...), khác: "IPv4-<n>"
             */
            static std::string getProtocolName(int protocol_number);

            /**
             * @brief Thông tin địa lý giả lập cho một địa chỉ IP
             */
            static GeoLocation getGeoLocation(const std::string &ip);

        private:
            NetworkUtils() = default;
        };

    } // namespace Common
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_NETWORK_UTILS_HPP
