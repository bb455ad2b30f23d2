// src/core/telemetry/telemetry_aggregator.cpp
#include "telemetry_aggregator.hpp"
#include "../../common/utils.hpp"
#include <algorithm>

namespace PacketSniffer
{
    namespace Telemetry
    {
        using Common::PacketRecord;
        using Common::ThreatLevel;

        namespace
        {
            constexpr uint64_t BANDWIDTH_SAMPLE_EVERY = 100;
        }

        // ==================== FlowKey ====================

        bool FlowKey::operator==(const FlowKey &other) const
        {
            return src_ip == other.src_ip &&
                   dst_ip == other.dst_ip &&
                   src_port == other.src_port &&
                   dst_port == other.dst_port &&
                   protocol == other.protocol;
        }

        size_t FlowKey::hash() const
        {
            size_t h1 = std::hash<std::string>{}(src_ip);
            size_t h2 = std::hash<std::string>{}(dst_ip);
            size_t h3 = std::hash<uint16_t>{}(src_port);
            size_t h4 = std::hash<uint16_t>{}(dst_port);
            size_t h5 = std::hash<std::string>{}(protocol);

            // Combine hashes
            return h1 ^ (h2 << 1) ^ (h3 << 2) ^ (h4 << 3) ^ (h5 << 4);
        }

        std::string FlowKey::toString() const
        {
            return src_ip + ":" + std::to_string(src_port) + "-" +
                   dst_ip + ":" + std::to_string(dst_port);
        }

        // ==================== TelemetryAggregator ====================

        TelemetryAggregator::TelemetryAggregator(const AggregatorLimits &limits, Clock clock)
            : clock_(clock ? std::move(clock) : Clock(&Common::Utils::getMonotonicTimeMs)),
              total_packets_(0),
              total_bytes_(0),
              start_time_ms_(0),
              packet_sizes_(limits.packet_size_history),
              bandwidth_history_(limits.bandwidth_history),
              threat_alerts_(limits.threat_alert_history),
              peak_bandwidth_(0.0),
              peak_packets_per_sec_(0.0),
              current_connections_(0)
        {
            start_time_ms_ = clock_();
        }

        std::optional<FlowKey> TelemetryAggregator::makeFlowKey(const PacketRecord &record)
        {
            if (!record.src_ip || !record.dst_ip)
            {
                return std::nullopt;
            }

            FlowKey key;
            key.src_ip = *record.src_ip;
            key.dst_ip = *record.dst_ip;
            key.src_port = record.src_port.value_or(0);
            key.dst_port = record.dst_port.value_or(0);
            key.protocol = record.protocol;
            return key;
        }

        std::string TelemetryAggregator::formatAlertMessage(const PacketRecord &record)
        {
            return "Suspicious " + record.protocol + " traffic from " +
                   record.src_ip.value_or("unknown") + " to " +
                   record.dst_ip.value_or("unknown");
        }

        void TelemetryAggregator::ingest(const PacketRecord &record)
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);

            // 1. Totals
            total_packets_++;
            total_bytes_ += record.packet_size;

            // 2. Protocol
            protocol_counts_.increment(record.protocol);

            // 3. Size history
            packet_sizes_.push(record.packet_size);

            // 4. Port activity (ưu tiên port đích)
            std::optional<uint16_t> port = record.dst_port ? record.dst_port : record.src_port;
            if (port)
            {
                port_activity_.increment(*port);
            }

            // 5. Top talkers
            if (record.src_ip)
            {
                top_talkers_.increment(*record.src_ip);
            }

            // 6. Threat alerts
            if (record.threat_level > ThreatLevel::Safe)
            {
                ThreatAlert alert;
                alert.timestamp_us = record.timestamp_us;
                alert.message = formatAlertMessage(record);
                alert.level = record.threat_level;
                threat_alerts_.push(alert);
            }

            // 7. Connections
            updateConnectionLocked(record);

            // 8. Bandwidth sampling
            sampleBandwidthLocked(record.timestamp_us);

            // 9. Số connection hiện tại
            current_connections_ = connections_.size();
        }

        void TelemetryAggregator::updateConnectionLocked(const PacketRecord &record)
        {
            std::optional<FlowKey> key = makeFlowKey(record);
            if (!key)
            {
                return;
            }

            auto it = connection_index_.find(*key);
            if (it == connection_index_.end())
            {
                ConnectionFlow flow;
                flow.key = *key;
                flow.first_seen_us = record.timestamp_us;
                flow.last_seen_us = record.timestamp_us;
                flow.threat_level = record.threat_level;

                connection_index_.emplace(*key, connections_.size());
                connections_.push_back(flow);
                it = connection_index_.find(*key);
            }

            ConnectionFlow &flow = connections_[it->second];
            flow.packet_count++;
            flow.total_bytes += record.packet_size;
            flow.last_seen_us = std::max(flow.last_seen_us, record.timestamp_us);
            flow.threat_level = std::max(flow.threat_level, record.threat_level);
        }

        void TelemetryAggregator::sampleBandwidthLocked(uint64_t timestamp_us)
        {
            uint64_t elapsed = elapsedSecondsLocked();
            if (elapsed == 0 || total_packets_ % BANDWIDTH_SAMPLE_EVERY != 0)
            {
                return;
            }

            BandwidthPoint point;
            point.timestamp_us = timestamp_us;
            point.bytes_per_sec = static_cast<double>(total_bytes_) / static_cast<double>(elapsed);
            point.packets_per_sec = static_cast<double>(total_packets_) / static_cast<double>(elapsed);
            bandwidth_history_.push(point);

            peak_bandwidth_ = std::max(peak_bandwidth_, point.bytes_per_sec);
            peak_packets_per_sec_ = std::max(peak_packets_per_sec_, point.packets_per_sec);
        }

        uint64_t TelemetryAggregator::elapsedSecondsLocked() const
        {
            uint64_t now = clock_();
            return now > start_time_ms_ ? (now - start_time_ms_) / 1000 : 0;
        }

        NetworkStats TelemetryAggregator::snapshot() const
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);

            NetworkStats stats;
            stats.total_packets = total_packets_;
            stats.total_bytes = total_bytes_;
            stats.start_time_ms = start_time_ms_;
            stats.elapsed_seconds = elapsedSecondsLocked();

            stats.protocol_counts = protocol_counts_.entries();
            stats.top_talkers = top_talkers_.entries();
            stats.port_activity = port_activity_.entries();

            stats.packet_sizes = packet_sizes_.toVector();
            stats.bandwidth_history = bandwidth_history_.toVector();
            stats.threat_alerts = threat_alerts_.toVector();

            stats.peak_bandwidth = peak_bandwidth_;
            stats.peak_packets_per_sec = peak_packets_per_sec_;
            stats.current_connections = current_connections_;
            stats.connections = connections_;
            return stats;
        }

        uint64_t TelemetryAggregator::getTotalPackets() const
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            return total_packets_;
        }

        size_t TelemetryAggregator::getConnectionCount() const
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            return connections_.size();
        }

    } // namespace Telemetry
} // namespace PacketSniffer
