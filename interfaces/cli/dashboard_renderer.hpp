// interfaces/cli/dashboard_renderer.hpp
#ifndef PACKET_SNIFFER_DASHBOARD_RENDERER_HPP
#define PACKET_SNIFFER_DASHBOARD_RENDERER_HPP

#include "console_style.hpp"
#include "../../src/core/telemetry/telemetry_aggregator.hpp"
#include "../../src/common/packet_record.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace PacketSniffer
{
    namespace CLI
    {
        /**
         * @brief Phân bố kích thước gói theo 4 nhóm
         */
        struct SizeDistribution
        {
            size_t small = 0;       // < 100
            size_t medium = 0;      // 100-499
            size_t large = 0;       // 500-1499
            size_t jumbo = 0;       // >= 1500
            size_t total = 0;
            double average = 0.0;
            size_t min = 0;
            size_t max = 0;
        };

        /**
         * @brief Chọn dữ liệu và định dạng dashboard từ snapshot
         *
         * Không giữ state nào ngoài style; mọi hàm đều chạy trên bản copy
         * nên có thể gọi mà không cần lock.
         */
        class DashboardRenderer
        {
        public:
            static constexpr size_t BANDWIDTH_WINDOW = 20;
            static constexpr size_t BAR_WIDTH = 40;
            static constexpr size_t RECENT_ALERTS = 3;
            static constexpr size_t TOP_CONNECTIONS = 8;
            static constexpr size_t MIN_TABLE_ROWS = 5;
            static constexpr size_t TOP_PORTS = 10;
            static constexpr size_t GEO_WINDOW = 500;
            static constexpr size_t TOP_COUNTRIES = 6;
            static constexpr size_t RECENT_ACTIVITY = 8;
            static constexpr size_t SCREEN_WIDTH = 100;
            static constexpr size_t COLUMN_WIDTH = 49;

            explicit DashboardRenderer(const ConsoleStyle &style = ConsoleStyle());

            // ==================== Data selection ====================

            /**
             * @brief N điểm băng thông mới nhất, theo thứ tự thời gian
             */
            static std::vector<Telemetry::BandwidthPoint> bandwidthWindow(
                const std::vector<Telemetry::BandwidthPoint> &history, size_t window = BANDWIDTH_WINDOW);

            /**
             * @brief Giá trị lớn nhất của cửa sổ, tối thiểu 1
             */
            static double windowMax(const std::vector<Telemetry::BandwidthPoint> &window);

            /**
             * @brief floor(value / max(window_max, 1) * width), giới hạn trong [0, width]
             */
            static size_t barLength(double value, double window_max, size_t width = BAR_WIDTH);

            /**
             * @brief Đếm số record theo từng ThreatLevel (index = giá trị enum)
             */
            static std::array<uint64_t, 5> threatCounts(const std::vector<Common::PacketRecord> &records);

            /**
             * @brief N cảnh báo mới nhất, mới nhất trước
             */
            static std::vector<Telemetry::ThreatAlert> latestAlerts(
                const std::vector<Telemetry::ThreatAlert> &alerts, size_t n = RECENT_ALERTS);

            /**
             * @brief Sắp xếp giảm dần theo count, giữ thứ tự first-seen khi bằng nhau
             * @param limit 0 = không giới hạn
             */
            template <typename Key>
            static std::vector<std::pair<Key, uint64_t>> rankByCount(
                std::vector<std::pair<Key, uint64_t>> entries, size_t limit = 0)
            {
                std::stable_sort(entries.begin(), entries.end(),
                                 [](const std::pair<Key, uint64_t> &a, const std::pair<Key, uint64_t> &b)
                                 {
                                     return a.second > b.second;
                                 });
                if (limit > 0 && entries.size() > limit)
                {
                    entries.resize(limit);
                }
                return entries;
            }

            static std::vector<Telemetry::ConnectionFlow> topConnections(
                const std::vector<Telemetry::ConnectionFlow> &connections, size_t n = TOP_CONNECTIONS);

            static SizeDistribution sizeDistribution(const std::vector<size_t> &sizes);

            /**
             * @brief part / total * 100, trả 0 khi total = 0
             */
            static double percentage(uint64_t part, uint64_t total);

            /**
             * @brief Đếm quốc gia trong `window` record mới nhất, top `limit`
             */
            static std::vector<std::pair<std::string, uint64_t>> geoDistribution(
                const std::vector<Common::PacketRecord> &records,
                size_t window = GEO_WINDOW, size_t limit = TOP_COUNTRIES);

            /**
             * @brief N record mới nhất, mới nhất trước
             */
            static std::vector<Common::PacketRecord> recentActivity(
                const std::vector<Common::PacketRecord> &records, size_t n = RECENT_ACTIVITY);

            // ==================== Formatting ====================

            /**
             * @brief Toàn bộ màn hình dashboard (không gồm lệnh clear screen)
             * @param now_us Thời điểm hiển thị ở footer
             */
            std::string render(const Telemetry::NetworkStats &stats,
                               const std::vector<Common::PacketRecord> &records,
                               uint64_t now_us) const;

            std::string renderSummary(const Telemetry::NetworkStats &stats) const;
            std::string renderBandwidthGraph(const Telemetry::NetworkStats &stats) const;
            std::string renderThreatStatus(const Telemetry::NetworkStats &stats,
                                           const std::vector<Common::PacketRecord> &records) const;
            std::string renderProtocolsAndConnections(const Telemetry::NetworkStats &stats) const;
            std::string renderPortActivity(const Telemetry::NetworkStats &stats) const;
            std::string renderPacketSizes(const Telemetry::NetworkStats &stats) const;
            std::string renderGeography(const std::vector<Common::PacketRecord> &records) const;
            std::string renderRecentActivity(const std::vector<Common::PacketRecord> &records) const;

            const ConsoleStyle &style() const { return style_; }

        private:
            std::string sectionTitle(const char *emoji, const char *fallback, const std::string &title) const;
            std::string emptyNotice(const std::string &text) const;
            std::string protocolCell(const std::pair<std::string, uint64_t> &entry, uint64_t total) const;
            std::string connectionCell(const Telemetry::ConnectionFlow &flow) const;
            std::string portLabel(uint16_t port) const;

            ConsoleStyle style_;
        };

    } // namespace CLI
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_DASHBOARD_RENDERER_HPP
