// src/common/packet_record.hpp
#ifndef PACKET_SNIFFER_PACKET_RECORD_HPP
#define PACKET_SNIFFER_PACKET_RECORD_HPP

#include "network_utils.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <optional>

namespace PacketSniffer
{
    namespace Common
    {
        /**
         * @brief Mức độ nguy hiểm, có thứ tự Safe < Low < Medium < High < Critical
         */
        enum class ThreatLevel : uint8_t
        {
            Safe = 0,
            Low = 1,
            Medium = 2,
            High = 3,
            Critical = 4
        };

        /**
         * @brief Tên hiển thị ("Safe", "Low", ...)
         */
        const char *threatLevelToString(ThreatLevel level);

        using GeoInfo = GeoLocation;

        /**
         * @brief Bản ghi một packet đã decode
         *
         * Được tạo một lần bởi decoder + classifier, sau đó chỉ đọc.
         */
        struct PacketRecord
        {
            uint64_t timestamp_us = 0;          // Thời điểm capture (microseconds từ epoch)
            uint64_t packet_number = 0;         // Số thứ tự, bắt đầu từ 1

            std::string src_mac;
            std::string dst_mac;

            std::optional<std::string> src_ip;
            std::optional<std::string> dst_ip;
            uint8_t ip_version = 0;             // 0, 4 hoặc 6

            std::string protocol = "Unknown";
            std::optional<uint16_t> src_port;
            std::optional<uint16_t> dst_port;

            size_t packet_size = 0;
            size_t payload_size = 0;

            std::optional<std::string> flags;
            std::optional<std::string> application_protocol;
            std::string description;

            ThreatLevel threat_level = ThreatLevel::Safe;
            std::optional<GeoInfo> geo_info;
        };

    } // namespace Common
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_PACKET_RECORD_HPP
