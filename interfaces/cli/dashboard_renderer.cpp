// interfaces/cli/dashboard_renderer.cpp
#include "dashboard_renderer.hpp"
#include "../../src/common/utils.hpp"
#include <sstream>
#include <cmath>
#include <unordered_map>

namespace PacketSniffer
{
    namespace CLI
    {
        using Common::PacketRecord;
        using Common::ThreatLevel;
        using Common::Utils;
        using Telemetry::BandwidthPoint;
        using Telemetry::ConnectionFlow;
        using Telemetry::NetworkStats;
        using Telemetry::ThreatAlert;

        namespace
        {
            std::string bytesText(double bytes)
            {
                return Utils::formatBytes(bytes > 0.0 ? static_cast<size_t>(bytes) : 0, 1);
            }

            double perSecond(uint64_t value, uint64_t seconds)
            {
                return seconds > 0 ? static_cast<double>(value) / static_cast<double>(seconds) : 0.0;
            }

            // Phần cuối của địa chỉ: octet cuối (IPv4) hoặc nhóm cuối (IPv6)
            std::string addressTail(const std::string &ip)
            {
                size_t pos = ip.find_last_of(".:");
                if (pos == std::string::npos || pos + 1 >= ip.size())
                {
                    return ip.empty() ? "?" : ip;
                }
                return ip.substr(pos + 1);
            }
        } // namespace

        DashboardRenderer::DashboardRenderer(const ConsoleStyle &style)
            : style_(style)
        {
        }

        // ==================== Data selection ====================

        std::vector<BandwidthPoint> DashboardRenderer::bandwidthWindow(const std::vector<BandwidthPoint> &history,
                                                                      size_t window)
        {
            size_t start = history.size() > window ? history.size() - window : 0;
            return std::vector<BandwidthPoint>(history.begin() + start, history.end());
        }

        double DashboardRenderer::windowMax(const std::vector<BandwidthPoint> &window)
        {
            double max_value = 1.0;
            for (const auto &point : window)
            {
                max_value = std::max(max_value, point.bytes_per_sec);
            }
            return max_value;
        }

        size_t DashboardRenderer::barLength(double value, double window_max, size_t width)
        {
            double denominator = std::max(window_max, 1.0);
            if (value <= 0.0)
            {
                return 0;
            }
            double length = std::floor(value / denominator * static_cast<double>(width));
            if (length >= static_cast<double>(width))
            {
                return width;
            }
            return static_cast<size_t>(length);
        }

        std::array<uint64_t, 5> DashboardRenderer::threatCounts(const std::vector<PacketRecord> &records)
        {
            std::array<uint64_t, 5> counts = {0, 0, 0, 0, 0};
            for (const auto &record : records)
            {
                size_t index = static_cast<size_t>(record.threat_level);
                if (index < counts.size())
                {
                    ++counts[index];
                }
            }
            return counts;
        }

        std::vector<ThreatAlert> DashboardRenderer::latestAlerts(const std::vector<ThreatAlert> &alerts, size_t n)
        {
            std::vector<ThreatAlert> result;
            for (auto it = alerts.rbegin(); it != alerts.rend() && result.size() < n; ++it)
            {
                result.push_back(*it);
            }
            return result;
        }

        std::vector<ConnectionFlow> DashboardRenderer::topConnections(const std::vector<ConnectionFlow> &connections,
                                                                     size_t n)
        {
            std::vector<ConnectionFlow> sorted = connections;
            std::stable_sort(sorted.begin(), sorted.end(),
                             [](const ConnectionFlow &a, const ConnectionFlow &b)
                             {
                                 return a.packet_count > b.packet_count;
                             });
            if (sorted.size() > n)
            {
                sorted.resize(n);
            }
            return sorted;
        }

        SizeDistribution DashboardRenderer::sizeDistribution(const std::vector<size_t> &sizes)
        {
            SizeDistribution dist;
            if (sizes.empty())
            {
                return dist;
            }

            uint64_t sum = 0;
            dist.min = sizes.front();
            dist.max = sizes.front();

            for (size_t size : sizes)
            {
                if (size < 100)
                    ++dist.small;
                else if (size < 500)
                    ++dist.medium;
                else if (size < 1500)
                    ++dist.large;
                else
                    ++dist.jumbo;

                sum += size;
                dist.min = std::min(dist.min, size);
                dist.max = std::max(dist.max, size);
            }

            dist.total = sizes.size();
            dist.average = static_cast<double>(sum) / static_cast<double>(dist.total);
            return dist;
        }

        double DashboardRenderer::percentage(uint64_t part, uint64_t total)
        {
            if (total == 0)
            {
                return 0.0;
            }
            return static_cast<double>(part) / static_cast<double>(total) * 100.0;
        }

        std::vector<std::pair<std::string, uint64_t>> DashboardRenderer::geoDistribution(
            const std::vector<PacketRecord> &records, size_t window, size_t limit)
        {
            std::vector<std::pair<std::string, uint64_t>> counts;
            std::unordered_map<std::string, size_t> index;

            size_t start = records.size() > window ? records.size() - window : 0;
            for (size_t i = start; i < records.size(); ++i)
            {
                const auto &geo = records[i].geo_info;
                if (!geo || geo->country.empty())
                {
                    continue;
                }

                auto it = index.find(geo->country);
                if (it == index.end())
                {
                    index.emplace(geo->country, counts.size());
                    counts.emplace_back(geo->country, 1);
                }
                else
                {
                    ++counts[it->second].second;
                }
            }

            return rankByCount(counts, limit);
        }

        std::vector<PacketRecord> DashboardRenderer::recentActivity(const std::vector<PacketRecord> &records, size_t n)
        {
            std::vector<PacketRecord> result;
            for (auto it = records.rbegin(); it != records.rend() && result.size() < n; ++it)
            {
                result.push_back(*it);
            }
            return result;
        }

        // ==================== Formatting ====================

        std::string DashboardRenderer::render(const NetworkStats &stats,
                                              const std::vector<PacketRecord> &records,
                                              uint64_t now_us) const
        {
            std::ostringstream out;

            out << style_.paint(style_.icon("🚀 ", "") + "ADVANCED NETWORK TRAFFIC DASHBOARD", Color::GREEN, Color::BOLD) << "\n";
            out << style_.paint(style_.doubleRule(SCREEN_WIDTH), Color::BLUE) << "\n";

            out << renderSummary(stats);
            out << renderBandwidthGraph(stats);
            out << renderThreatStatus(stats, records);
            out << renderProtocolsAndConnections(stats);
            out << renderPortActivity(stats);
            out << renderPacketSizes(stats);
            out << renderGeography(records);
            out << renderRecentActivity(records);

            out << "\n" << style_.paint(style_.doubleRule(SCREEN_WIDTH), Color::BLUE) << "\n";
            out << style_.paint(style_.icon("💡 ", "") + "CONTROLS: [Ctrl+C] Exit", Color::CYAN) << "\n";
            out << style_.paint(style_.icon("📡 ", "") + "Last Updated: " + Utils::formatUtc(now_us, "%H:%M:%S") + " UTC",
                                Color::GRAY)
                << "\n";

            return out.str();
        }

        std::string DashboardRenderer::renderSummary(const NetworkStats &stats) const
        {
            std::ostringstream out;
            uint64_t duration = stats.elapsed_seconds;
            double packets_per_sec = perSecond(stats.total_packets, duration);
            double bytes_per_sec = perSecond(stats.total_bytes, duration);

            out << style_.icon("⏱️  ", "")
                << style_.paint("Duration:", Color::CYAN) << " "
                << style_.paint(std::to_string(duration) + "s", Color::YELLOW, Color::BOLD) << " "
                << style_.paint("| " + style_.icon("📦 ", "") + "Packets:", Color::CYAN) << " "
                << style_.paint(std::to_string(stats.total_packets) + " (" + formatFixed(packets_per_sec, 1) + "/s)",
                                Color::YELLOW, Color::BOLD)
                << " "
                << style_.paint("| " + style_.icon("📊 ", "") + "Data:", Color::CYAN) << " "
                << style_.paint(Utils::formatBytes(stats.total_bytes, 1) + " (" + formatFixed(bytes_per_sec, 1) + "/s)",
                                Color::YELLOW, Color::BOLD)
                << " "
                << style_.paint("| " + style_.icon("🔗 ", "") + "Connections:", Color::CYAN) << " "
                << style_.paint(std::to_string(stats.current_connections), Color::YELLOW, Color::BOLD)
                << "\n";

            out << style_.icon("⚡ ", "")
                << style_.paint("Peak Bandwidth:", Color::CYAN) << " "
                << style_.paint(bytesText(stats.peak_bandwidth) + "/s", Color::RED, Color::BOLD) << " "
                << style_.paint("| Peak Packets:", Color::CYAN) << " "
                << style_.paint(formatFixed(stats.peak_packets_per_sec, 1) + "/s", Color::RED, Color::BOLD)
                << "\n\n";

            return out.str();
        }

        std::string DashboardRenderer::renderBandwidthGraph(const NetworkStats &stats) const
        {
            std::ostringstream out;
            out << sectionTitle("📈", "", "REAL-TIME BANDWIDTH GRAPH");

            std::vector<BandwidthPoint> window = bandwidthWindow(stats.bandwidth_history);
            if (window.empty())
            {
                out << emptyNotice("No data available yet...");
                return out.str();
            }

            double max_bytes = windowMax(window);
            out << "   " << style_.paint("Peak:", Color::CYAN) << " "
                << style_.paint(bytesText(max_bytes), Color::RED, Color::BOLD) << "/s\n";

            const TableGlyphs &g = style_.glyphs();
            for (const auto &point : window)
            {
                size_t length = barLength(point.bytes_per_sec, max_bytes);
                std::string bar = Utils::repeat(g.bar, length) + std::string(BAR_WIDTH - length, ' ');

                out << "   " << style_.paint(Utils::formatUtc(point.timestamp_us, "%H:%M:%S"), Color::GRAY)
                    << " " << g.vertical << style_.paint(bar, Color::GREEN) << g.vertical << " "
                    << style_.paint(bytesText(point.bytes_per_sec), Color::CYAN) << "\n";
            }
            out << "\n";
            return out.str();
        }

        std::string DashboardRenderer::renderThreatStatus(const NetworkStats &stats,
                                                          const std::vector<PacketRecord> &records) const
        {
            std::ostringstream out;
            std::array<uint64_t, 5> counts = threatCounts(records);
            uint64_t total_threats = counts[1] + counts[2] + counts[3] + counts[4];

            out << style_.paint(style_.icon("🛡️  ", "") + "SECURITY STATUS:", Color::YELLOW, Color::BOLD) << " ";
            if (total_threats == 0)
            {
                out << style_.paint(style_.icon("✅ ", "") + "SECURE", Color::GREEN, Color::BOLD);
            }
            else
            {
                out << style_.paint(style_.icon("⚠️  ", "") + "THREATS DETECTED", Color::RED, Color::BOLD);
            }
            out << " " << style_.paint("(" + std::to_string(stats.threat_alerts.size()) + " alerts)", Color::GRAY) << "\n";

            std::ostringstream bar;
            bar << "Safe:" << counts[0] << " Low:" << counts[1] << " Med:" << counts[2]
                << " High:" << counts[3] << " Crit:" << counts[4];
            out << "   " << style_.paint(bar.str(), Color::CYAN) << "\n";

            std::vector<ThreatAlert> alerts = latestAlerts(stats.threat_alerts);
            if (!alerts.empty())
            {
                out << "   " << style_.paint(style_.icon("🚨", "[ALERT]"), Color::RED) << " Recent Alerts:\n";
                for (const auto &alert : alerts)
                {
                    out << "   " << style_.threatIcon(alert.level) << " "
                        << style_.paint(Utils::formatUtc(alert.timestamp_us, "%H:%M:%S"), Color::GRAY) << " "
                        << style_.paint(alert.message, Color::YELLOW) << "\n";
                }
            }
            out << "\n";
            return out.str();
        }

        std::string DashboardRenderer::protocolCell(const std::pair<std::string, uint64_t> &entry, uint64_t total) const
        {
            // 1 + 12 + 1 + 8 + 1 + 7 = 30 cột
            std::string cell = " " + style_.paint(padRight(truncate(entry.first, 12), 12), Color::GREEN) + " " +
                               style_.paint(padLeft(std::to_string(entry.second), 8), Color::YELLOW) + " " +
                               padLeft(formatFixed(percentage(entry.second, total), 1) + "%", 7);
            return cell + std::string(COLUMN_WIDTH - 30, ' ');
        }

        std::string DashboardRenderer::connectionCell(const ConnectionFlow &flow) const
        {
            std::string label = "." + addressTail(flow.key.src_ip) + "→." + addressTail(flow.key.dst_ip);
            if (flow.key.dst_port != 0)
            {
                label += ":" + std::to_string(flow.key.dst_port);
            }

            // Emoji chiếm 2 cột, nhãn text chiếm 4
            size_t icon_width = style_.emojisEnabled() ? 2 : 4;
            size_t used = 1 + icon_width + 1 + 22 + 1 + 8 + 1 + 10;

            std::string cell = " " + style_.threatIcon(flow.threat_level) + " " +
                               style_.paint(padRight(truncate(label, 22), 22), Color::BLUE) + " " +
                               style_.paint(padLeft(std::to_string(flow.packet_count), 8), Color::YELLOW) + " " +
                               style_.paint(padLeft(Utils::formatBytes(flow.total_bytes, 1), 10), Color::CYAN);
            return cell + std::string(used < COLUMN_WIDTH ? COLUMN_WIDTH - used : 0, ' ');
        }

        std::string DashboardRenderer::renderProtocolsAndConnections(const NetworkStats &stats) const
        {
            std::ostringstream out;
            const TableGlyphs &g = style_.glyphs();
            std::string column_rule = style_.rule(COLUMN_WIDTH);

            auto protocols = rankByCount(stats.protocol_counts);
            auto connections = topConnections(stats.connections);

            out << style_.paint(std::string(g.top_left) + column_rule + g.top_mid + column_rule + g.top_right, Color::BLUE) << "\n";

            std::string proto_title = style_.icon("🔗 ", "") + "PROTOCOL ANALYSIS";
            std::string conn_title = style_.icon("🌍 ", "") + "TOP CONNECTIONS";
            out << style_.paint(g.vertical, Color::BLUE)
                << style_.paint(padRight(" " + proto_title, COLUMN_WIDTH - (style_.emojisEnabled() ? 1 : 0)), Color::YELLOW, Color::BOLD)
                << style_.paint(g.vertical, Color::BLUE)
                << style_.paint(padRight(" " + conn_title, COLUMN_WIDTH - (style_.emojisEnabled() ? 1 : 0)), Color::YELLOW, Color::BOLD)
                << style_.paint(g.vertical, Color::BLUE) << "\n";

            out << style_.paint(std::string(g.mid_left) + column_rule + g.cross + column_rule + g.mid_right, Color::BLUE) << "\n";

            size_t rows = std::max(std::max(protocols.size(), connections.size()), MIN_TABLE_ROWS);
            for (size_t i = 0; i < rows; ++i)
            {
                out << style_.paint(g.vertical, Color::BLUE);
                if (i < protocols.size())
                    out << protocolCell(protocols[i], stats.total_packets);
                else
                    out << std::string(COLUMN_WIDTH, ' ');

                out << style_.paint(g.vertical, Color::BLUE);
                if (i < connections.size())
                    out << connectionCell(connections[i]);
                else
                    out << std::string(COLUMN_WIDTH, ' ');

                out << style_.paint(g.vertical, Color::BLUE) << "\n";
            }

            out << style_.paint(std::string(g.bottom_left) + column_rule + g.bottom_mid + column_rule + g.bottom_right, Color::BLUE) << "\n";
            return out.str();
        }

        std::string DashboardRenderer::portLabel(uint16_t port) const
        {
            std::string text = std::to_string(port);
            switch (port)
            {
            case 80:
            case 443:
                return style_.paint(text, Color::GREEN);
            case 22:
            case 23:
                return style_.paint(text, Color::YELLOW);
            case 53:
                return style_.paint(text, Color::BLUE);
            default:
                return style_.paint(text, port > 1024 ? Color::CYAN : Color::RED);
            }
        }

        std::string DashboardRenderer::renderPortActivity(const NetworkStats &stats) const
        {
            std::ostringstream out;
            out << sectionTitle("🚪", "", "TOP PORT ACTIVITY");

            if (stats.port_activity.empty())
            {
                out << emptyNotice("No port activity recorded yet...");
                return out.str();
            }

            out << "   ";
            for (const auto &entry : rankByCount(stats.port_activity, TOP_PORTS))
            {
                out << portLabel(entry.first) << ":" << style_.paint(std::to_string(entry.second), Color::GRAY) << " ";
            }
            out << "\n\n";
            return out.str();
        }

        std::string DashboardRenderer::renderPacketSizes(const NetworkStats &stats) const
        {
            std::ostringstream out;
            out << sectionTitle("📏", "", "PACKET SIZE DISTRIBUTION");

            SizeDistribution dist = sizeDistribution(stats.packet_sizes);
            if (dist.total == 0)
            {
                out << emptyNotice("No packet size data available...");
                return out.str();
            }

            out << "   " << style_.paint("Avg:", Color::CYAN) << " "
                << style_.paint(std::to_string(static_cast<size_t>(dist.average)) + "B", Color::YELLOW) << " "
                << style_.paint("Range:", Color::CYAN) << " "
                << style_.paint(std::to_string(dist.min) + "-" + std::to_string(dist.max) + "B", Color::YELLOW) << "\n";

            const TableGlyphs &g = style_.glyphs();
            struct Bucket
            {
                const char *label;
                size_t count;
                const char *color;
            };
            const Bucket buckets[] = {
                {"<100B    ", dist.small, Color::GREEN},
                {"100-499B ", dist.medium, Color::YELLOW},
                {"500-1499B", dist.large, Color::MAGENTA},
                {">=1500B  ", dist.jumbo, Color::RED},
            };

            const size_t width = 30;
            for (const auto &bucket : buckets)
            {
                size_t length = std::min(width, bucket.count * width / dist.total);
                std::string bar = Utils::repeat(g.bar, length) + std::string(width - length, ' ');
                out << "   " << bucket.label << g.vertical << style_.paint(bar, bucket.color) << g.vertical << " "
                    << padLeft(std::to_string(bucket.count), 6) << " "
                    << padLeft(formatFixed(percentage(bucket.count, dist.total), 1) + "%", 6) << "\n";
            }
            out << "\n";
            return out.str();
        }

        std::string DashboardRenderer::renderGeography(const std::vector<PacketRecord> &records) const
        {
            std::ostringstream out;
            out << sectionTitle("🌍", "", "GEOGRAPHIC DISTRIBUTION");

            auto countries = geoDistribution(records);
            if (countries.empty())
            {
                out << emptyNotice("No geographic data available...");
                return out.str();
            }

            out << "   ";
            for (const auto &entry : countries)
            {
                std::string flag;
                if (entry.first == "United States")
                    flag = style_.icon("🇺🇸 ", "");
                else if (entry.first == "Australia")
                    flag = style_.icon("🇦🇺 ", "");
                else if (entry.first == "Local Network")
                    flag = style_.icon("🏠 ", "");
                else
                    flag = style_.icon("🌐 ", "");

                out << flag << style_.paint(entry.first, Color::CYAN) << ": "
                    << style_.paint(std::to_string(entry.second), Color::YELLOW) << " ";
            }
            out << "\n\n";
            return out.str();
        }

        std::string DashboardRenderer::renderRecentActivity(const std::vector<PacketRecord> &records) const
        {
            std::ostringstream out;
            out << sectionTitle("📋", "", "LIVE ACTIVITY STREAM");

            if (records.empty())
            {
                out << emptyNotice("Waiting for network activity...");
                return out.str();
            }

            for (const auto &record : recentActivity(records))
            {
                std::string app = record.application_protocol ? " (" + *record.application_protocol + ")" : "";

                std::string geo;
                if (record.geo_info && !record.geo_info->country.empty())
                {
                    geo = record.geo_info->country == "Local Network" ? style_.icon("🏠 ", "[local] ")
                                                                      : style_.icon("🌐 ", "[remote] ");
                }

                out << "   " << style_.threatIcon(record.threat_level) << " "
                    << style_.paint(Utils::formatUtc(record.timestamp_us, "%H:%M:%S", 1), Color::GRAY) << " "
                    << style_.paint(record.protocol, Color::GREEN, Color::BOLD)
                    << style_.paint(app, Color::YELLOW) << " "
                    << style_.paint(record.src_ip.value_or("?"), Color::BLUE) << " → "
                    << style_.paint(record.dst_ip.value_or("?"), Color::BLUE) << " "
                    << geo
                    << style_.paint(Utils::formatBytes(record.packet_size, 1), Color::CYAN)
                    << (record.packet_size > 1000 ? style_.icon(" 📈", " [big]") : "")
                    << "\n";
            }
            out << "\n";
            return out.str();
        }

        std::string DashboardRenderer::sectionTitle(const char *emoji, const char *fallback, const std::string &title) const
        {
            std::string prefix = style_.icon(emoji, fallback);
            if (!prefix.empty())
            {
                prefix += " ";
            }
            return style_.paint(prefix + title, Color::YELLOW, Color::BOLD) + "\n";
        }

        std::string DashboardRenderer::emptyNotice(const std::string &text) const
        {
            return "   " + style_.paint(text, Color::GRAY) + "\n\n";
        }

    } // namespace CLI
} // namespace PacketSniffer
