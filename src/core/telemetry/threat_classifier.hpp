// src/core/telemetry/threat_classifier.hpp
#ifndef PACKET_SNIFFER_THREAT_CLASSIFIER_HPP
#define PACKET_SNIFFER_THREAT_CLASSIFIER_HPP

#include "../../common/packet_record.hpp"

namespace PacketSniffer
{
    namespace Telemetry
    {
        /**
         * @brief Phân loại mức nguy hiểm theo heuristic cộng điểm
         *
         * Hàm thuần: cùng input luôn cho cùng output, không có trạng thái.
         * Chỉ đọc port, địa chỉ đích, kích thước và protocol của record.
         */
        class ThreatClassifier
        {
        public:
            /**
             * @brief Tổng điểm heuristic của record
             */
            static int score(const Common::PacketRecord &record);

            /**
             * @brief Map điểm sang ThreatLevel: 0-1 Safe, 2-3 Low, 4-5 Medium, 6-7 High, >=8 Critical
             */
            static Common::ThreatLevel levelForScore(int score);

            static Common::ThreatLevel classify(const Common::PacketRecord &record);

            // ==================== Individual rules ====================
            static int portScore(uint16_t port);
            static int destinationScore(const std::string &dst_ip);
            static int sizeScore(size_t packet_size);
            static int protocolScore(const Common::PacketRecord &record);

        private:
            ThreatClassifier() = default;
        };

    } // namespace Telemetry
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_THREAT_CLASSIFIER_HPP
