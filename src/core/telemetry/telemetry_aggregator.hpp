// src/core/telemetry/telemetry_aggregator.hpp
#ifndef PACKET_SNIFFER_TELEMETRY_AGGREGATOR_HPP
#define PACKET_SNIFFER_TELEMETRY_AGGREGATOR_HPP

#include "../../common/packet_record.hpp"
#include "ordered_counter.hpp"
#include "ring_buffer.hpp"
#include <unordered_map>
#include <functional>
#include <mutex>
#include <vector>
#include <string>
#include <optional>

namespace PacketSniffer
{
    namespace Telemetry
    {
        /**
         * @brief Định danh connection (có hướng): src ip/port, dst ip/port, protocol
         */
        struct FlowKey
        {
            std::string src_ip;
            std::string dst_ip;
            uint16_t src_port;          // 0 nếu không có port
            uint16_t dst_port;
            std::string protocol;

            bool operator==(const FlowKey &other) const;
            size_t hash() const;

            /**
             * @brief Dạng "src:sport-dst:dport"
             */
            std::string toString() const;
        };

        /**
         * @brief Hash function cho FlowKey
         */
        struct FlowKeyHash
        {
            size_t operator()(const FlowKey &key) const
            {
                return key.hash();
            }
        };

        /**
         * @brief Thông tin một connection
         */
        struct ConnectionFlow
        {
            FlowKey key;
            uint64_t packet_count = 0;
            uint64_t total_bytes = 0;
            uint64_t first_seen_us = 0;
            uint64_t last_seen_us = 0;
            Common::ThreatLevel threat_level = Common::ThreatLevel::Safe;   // max đã thấy
        };

        struct BandwidthPoint
        {
            uint64_t timestamp_us = 0;
            double bytes_per_sec = 0.0;
            double packets_per_sec = 0.0;
        };

        struct ThreatAlert
        {
            uint64_t timestamp_us = 0;
            std::string message;
            Common::ThreatLevel level = Common::ThreatLevel::Safe;
        };

        /**
         * @brief Dung lượng các ring buffer
         */
        struct AggregatorLimits
        {
            size_t packet_size_history = 1000;
            size_t bandwidth_history = 100;
            size_t threat_alert_history = 100;
        };

        /**
         * @brief Bản copy trạng thái thống kê tại một thời điểm
         *
         * Các bảng đếm giữ thứ tự xuất hiện lần đầu.
         */
        struct NetworkStats
        {
            uint64_t total_packets = 0;
            uint64_t total_bytes = 0;
            uint64_t start_time_ms = 0;         // theo clock của aggregator
            uint64_t elapsed_seconds = 0;

            std::vector<std::pair<std::string, uint64_t>> protocol_counts;
            std::vector<std::pair<std::string, uint64_t>> top_talkers;
            std::vector<std::pair<uint16_t, uint64_t>> port_activity;

            std::vector<size_t> packet_sizes;
            std::vector<BandwidthPoint> bandwidth_history;
            std::vector<ThreatAlert> threat_alerts;

            double peak_bandwidth = 0.0;
            double peak_packets_per_sec = 0.0;
            size_t current_connections = 0;

            std::vector<ConnectionFlow> connections;
        };

        /**
         * @brief Tổng hợp telemetry từ luồng PacketRecord
         *
         * ingest() là điểm ghi duy nhất, snapshot() là điểm đọc duy nhất.
         * Cả hai giữ cùng một mutex. Các bảng đếm và bảng connection không bị
         * giới hạn kích thước.
         */
        class TelemetryAggregator
        {
        public:
            /**
             * @brief Clock monotonic trả về milliseconds
             */
            using Clock = std::function<uint64_t()>;

            explicit TelemetryAggregator(const AggregatorLimits &limits = AggregatorLimits(),
                                         Clock clock = Clock());
            ~TelemetryAggregator() = default;

            TelemetryAggregator(const TelemetryAggregator &) = delete;
            TelemetryAggregator &operator=(const TelemetryAggregator &) = delete;

            /**
             * @brief Cập nhật toàn bộ thống kê với một record đã được phân loại
             */
            void ingest(const Common::PacketRecord &record);

            /**
             * @brief Copy trạng thái hiện tại (kèm elapsed_seconds)
             */
            NetworkStats snapshot() const;

            uint64_t getTotalPackets() const;
            size_t getConnectionCount() const;

            /**
             * @brief Tạo FlowKey từ record, std::nullopt nếu thiếu địa chỉ
             */
            static std::optional<FlowKey> makeFlowKey(const Common::PacketRecord &record);

            /**
             * @brief "Suspicious <proto> traffic from <src|unknown> to <dst|unknown>"
             */
            static std::string formatAlertMessage(const Common::PacketRecord &record);

        private:
            uint64_t elapsedSecondsLocked() const;
            void updateConnectionLocked(const Common::PacketRecord &record);
            void sampleBandwidthLocked(uint64_t timestamp_us);

            mutable std::mutex stats_mutex_;
            Clock clock_;

            uint64_t total_packets_;
            uint64_t total_bytes_;
            uint64_t start_time_ms_;

            OrderedCounter<std::string> protocol_counts_;
            OrderedCounter<std::string> top_talkers_;
            OrderedCounter<uint16_t> port_activity_;

            RingBuffer<size_t> packet_sizes_;
            RingBuffer<BandwidthPoint> bandwidth_history_;
            RingBuffer<ThreatAlert> threat_alerts_;

            double peak_bandwidth_;
            double peak_packets_per_sec_;
            size_t current_connections_;

            std::vector<ConnectionFlow> connections_;
            std::unordered_map<FlowKey, size_t, FlowKeyHash> connection_index_;
        };

    } // namespace Telemetry
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_TELEMETRY_AGGREGATOR_HPP
