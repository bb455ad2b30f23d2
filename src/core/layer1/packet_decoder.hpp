// src/core/layer1/packet_decoder.hpp
#ifndef PACKET_SNIFFER_PACKET_DECODER_HPP
#define PACKET_SNIFFER_PACKET_DECODER_HPP

#include "../../common/packet_record.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <optional>

namespace PacketSniffer
{
    namespace Layer1
    {
        /**
         * @brief Decode frame Ethernet II thành PacketRecord
         *
         * Hỗ trợ một VLAN tag (802.1Q), IPv4 (TCP/UDP/ICMP), địa chỉ IPv6 và ARP.
         * Không bao giờ thất bại: trường nào không đọc được thì để trống.
         * threat_level luôn là Safe, do ThreatClassifier gán sau.
         */
        class PacketDecoder
        {
        public:
            /**
             * @brief Decode một frame
             * @param data Dữ liệu frame
             * @param length Số bytes đã capture
             * @param timestamp_us Thời điểm capture (microseconds)
             * @param packet_number Số thứ tự (từ 1)
             * @param wire_length Kích thước thật trên dây (0 = dùng length)
             */
            static Common::PacketRecord decode(const uint8_t *data, size_t length,
                                               uint64_t timestamp_us, uint64_t packet_number,
                                               size_t wire_length = 0);

            /**
             * @brief Suy ra application protocol từ port đích và payload
             */
            static std::optional<std::string> detectApplicationProtocol(uint16_t dst_port,
                                                                        const uint8_t *payload,
                                                                        size_t payload_length);

            /**
             * @brief Mô tả ngắn gọn cho record (dựa trên app protocol hoặc transport)
             */
            static std::string describe(const Common::PacketRecord &record);

            /**
             * @brief Chuỗi cờ TCP theo thứ tự FIN SYN RST PSH ACK URG
             */
            static std::string formatTcpFlags(uint8_t flags);

        private:
            PacketDecoder() = default;

            static void decodeIPv4(const uint8_t *data, size_t length, Common::PacketRecord &record);
            static void decodeIPv6(const uint8_t *data, size_t length, Common::PacketRecord &record);
        };

    } // namespace Layer1
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_PACKET_DECODER_HPP
