// src/core/layer1/packet_filter.cpp

#include "packet_filter.hpp"
#include "../../common/utils.hpp"
#include <algorithm>

namespace PacketSniffer
{
    namespace Layer1
    {
        using Common::PacketRecord;

        namespace
        {
            bool hasPort(const PacketRecord &record, uint16_t port)
            {
                return record.src_port == port || record.dst_port == port;
            }

            bool isEthernetFrame(const PacketRecord &record)
            {
                return !record.src_mac.empty();
            }
        } // namespace

        // ==================== ProtocolFilter ====================

        ProtocolFilter::ProtocolFilter(const std::string &protocol)
            : protocol_(Common::Utils::toLowerCase(Common::Utils::trim(protocol)))
        {
        }

        bool ProtocolFilter::evaluate(const PacketRecord &record) const
        {
            if (protocol_ == "tcp")
                return record.protocol == "TCP";
            if (protocol_ == "udp")
                return record.protocol == "UDP";
            if (protocol_ == "icmp")
                return record.protocol == "ICMP";
            if (protocol_ == "http")
                return record.protocol == "TCP" && (hasPort(record, 80) || hasPort(record, 8080));
            if (protocol_ == "dns")
                return record.protocol == "UDP" && hasPort(record, 53);

            return true;
        }

        std::string ProtocolFilter::toString() const
        {
            return "protocol == " + protocol_;
        }

        // ==================== PortFilter ====================

        bool PortFilter::evaluate(const PacketRecord &record) const
        {
            if (record.protocol != "TCP" && record.protocol != "UDP")
                return false;

            return hasPort(record, port_);
        }

        std::string PortFilter::toString() const
        {
            return "port == " + std::to_string(port_);
        }

        // ==================== PacketFilter ====================

        PacketFilter::PacketFilter(const std::optional<std::string> &protocol, const std::optional<uint16_t> &port)
        {
            if (protocol)
            {
                addExpression(std::make_unique<ProtocolFilter>(*protocol));
            }
            if (port)
            {
                addExpression(std::make_unique<PortFilter>(*port));
            }
        }

        void PacketFilter::addExpression(std::unique_ptr<FilterExpression> expression)
        {
            if (expression)
            {
                expressions_.push_back(std::move(expression));
            }
        }

        bool PacketFilter::matches(const PacketRecord &record) const
        {
            if (expressions_.empty() || !isEthernetFrame(record))
            {
                return true;
            }

            if (record.ip_version != 4)
            {
                return false;
            }

            return std::all_of(expressions_.begin(), expressions_.end(),
                               [&record](const std::unique_ptr<FilterExpression> &expr)
                               { return expr->evaluate(record); });
        }

        std::string PacketFilter::toString() const
        {
            if (expressions_.empty())
            {
                return "none";
            }

            std::vector<std::string> parts;
            for (const auto &expr : expressions_)
            {
                parts.push_back(expr->toString());
            }
            return Common::Utils::join(parts, " && ");
        }

        const std::vector<std::string> &PacketFilter::supportedProtocols()
        {
            static const std::vector<std::string> protocols = {"tcp", "udp", "icmp", "http", "dns"};
            return protocols;
        }

        bool PacketFilter::isValidProtocol(const std::string &protocol)
        {
            const auto &protocols = supportedProtocols();
            std::string lower = Common::Utils::toLowerCase(Common::Utils::trim(protocol));
            return std::find(protocols.begin(), protocols.end(), lower) != protocols.end();
        }

    } // namespace Layer1
} // namespace PacketSniffer
