// src/core/telemetry/threat_classifier.cpp
#include "threat_classifier.hpp"
#include "../../common/network_utils.hpp"
#include "../../common/utils.hpp"
#include <unordered_set>

namespace PacketSniffer
{
    namespace Telemetry
    {
        using Common::PacketRecord;
        using Common::ThreatLevel;

        namespace
        {
            // MSSQL, RDP, VNC, Telnet, RPC, NetBIOS, SMB
            const std::unordered_set<uint16_t> HIGH_RISK_PORTS = {1433, 3389, 5900, 23, 135, 139, 445};

            // FTP, SMTP, POP3, IMAP, IMAPS, POP3S
            const std::unordered_set<uint16_t> MEDIUM_RISK_PORTS = {21, 25, 110, 143, 993, 995};

            constexpr uint16_t EPHEMERAL_PORT_THRESHOLD = 49152;
            constexpr size_t MAX_NORMAL_SIZE = 1500;
            constexpr size_t MIN_NORMAL_SIZE = 64;
        } // namespace

        int ThreatClassifier::portScore(uint16_t port)
        {
            if (HIGH_RISK_PORTS.count(port))
                return 3;
            if (MEDIUM_RISK_PORTS.count(port))
                return 2;
            if (port > EPHEMERAL_PORT_THRESHOLD)
                return 1;
            return 0;
        }

        int ThreatClassifier::destinationScore(const std::string &dst_ip)
        {
            int points = 0;
            if (!Common::NetworkUtils::isLocalAddress(dst_ip))
                points += 1;

            // Cộng độc lập với kiểm tra private ở trên
            if (Common::Utils::startsWith(dst_ip, "10.0.0.") ||
                Common::Utils::startsWith(dst_ip, "169.254."))
            {
                points += 2;
            }
            return points;
        }

        int ThreatClassifier::sizeScore(size_t packet_size)
        {
            return (packet_size > MAX_NORMAL_SIZE || packet_size < MIN_NORMAL_SIZE) ? 1 : 0;
        }

        int ThreatClassifier::protocolScore(const PacketRecord &record)
        {
            if (record.protocol == "ICMP")
                return 1;

            // DNS qua UDP là bình thường
            if (record.protocol == "UDP" && record.dst_port != std::optional<uint16_t>(53))
                return 1;

            return 0;
        }

        int ThreatClassifier::score(const PacketRecord &record)
        {
            int total = 0;

            std::optional<uint16_t> port = record.dst_port ? record.dst_port : record.src_port;
            if (port)
                total += portScore(*port);

            if (record.dst_ip)
                total += destinationScore(*record.dst_ip);

            total += sizeScore(record.packet_size);
            total += protocolScore(record);

            return total;
        }

        ThreatLevel ThreatClassifier::levelForScore(int score)
        {
            if (score >= 8)
                return ThreatLevel::Critical;
            if (score >= 6)
                return ThreatLevel::High;
            if (score >= 4)
                return ThreatLevel::Medium;
            if (score >= 2)
                return ThreatLevel::Low;
            return ThreatLevel::Safe;
        }

        ThreatLevel ThreatClassifier::classify(const PacketRecord &record)
        {
            return levelForScore(score(record));
        }

    } // namespace Telemetry
} // namespace PacketSniffer
