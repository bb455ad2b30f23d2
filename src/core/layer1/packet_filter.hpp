// src/core/layer1/packet_filter.hpp

#ifndef PACKET_SNIFFER_LAYER1_PACKET_FILTER_HPP
#define PACKET_SNIFFER_LAYER1_PACKET_FILTER_HPP

#include "../../common/packet_record.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace PacketSniffer
{
    namespace Layer1
    {
        // ==================== Filter Expression Tree ====================

        class FilterExpression
        {
        public:
            virtual ~FilterExpression() = default;
            virtual bool evaluate(const Common::PacketRecord &record) const = 0;
            virtual std::string toString() const = 0;
        };

        /**
         * @brief Lọc theo protocol: tcp, udp, icmp, http (TCP 80/8080), dns (UDP 53)
         *
         * Giá trị không nhận diện được thì cho qua tất cả.
         */
        class ProtocolFilter : public FilterExpression
        {
        public:
            explicit ProtocolFilter(const std::string &protocol);

            bool evaluate(const Common::PacketRecord &record) const override;
            std::string toString() const override;

        private:
            std::string protocol_;      // lowercase
        };

        /**
         * @brief Lọc TCP/UDP theo port nguồn hoặc đích, protocol khác bị loại
         */
        class PortFilter : public FilterExpression
        {
        public:
            explicit PortFilter(uint16_t port) : port_(port) {}

            bool evaluate(const Common::PacketRecord &record) const override;
            std::string toString() const override;

        private:
            uint16_t port_;
        };

        // ==================== Packet Filter ====================

        /**
         * @brief Bộ lọc packet từ tùy chọn dòng lệnh (AND các điều kiện)
         *
         * Khi có ít nhất một điều kiện: frame Ethernet không phải IPv4 bị loại,
         * frame quá ngắn để là Ethernet thì luôn được cho qua.
         */
        class PacketFilter
        {
        public:
            PacketFilter() = default;
            PacketFilter(const std::optional<std::string> &protocol, const std::optional<uint16_t> &port);

            void addExpression(std::unique_ptr<FilterExpression> expression);

            bool matches(const Common::PacketRecord &record) const;

            bool empty() const { return expressions_.empty(); }
            std::string toString() const;

            /**
             * @brief Các protocol hợp lệ cho --protocol
             */
            static bool isValidProtocol(const std::string &protocol);
            static const std::vector<std::string> &supportedProtocols();

        private:
            std::vector<std::unique_ptr<FilterExpression>> expressions_;
        };

    } // namespace Layer1
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_LAYER1_PACKET_FILTER_HPP
