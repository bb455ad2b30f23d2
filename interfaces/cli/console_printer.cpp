// interfaces/cli/console_printer.cpp
#include "console_printer.hpp"
#include "dashboard_renderer.hpp"
#include "../../src/common/utils.hpp"
#include <sstream>
#include <unordered_map>

namespace PacketSniffer
{
    namespace CLI
    {
        using Common::PacketRecord;
        using Common::Utils;

        namespace
        {
            double rate(uint64_t value, uint64_t seconds)
            {
                return seconds > 0 ? static_cast<double>(value) / static_cast<double>(seconds) : 0.0;
            }

            template <typename Extract>
            std::vector<std::pair<std::string, uint64_t>> countBy(const std::vector<PacketRecord> &records,
                                                                 Extract extract)
            {
                std::vector<std::pair<std::string, uint64_t>> counts;
                std::unordered_map<std::string, size_t> index;

                for (const auto &record : records)
                {
                    std::optional<std::string> key = extract(record);
                    if (!key)
                    {
                        continue;
                    }

                    auto it = index.find(*key);
                    if (it == index.end())
                    {
                        index.emplace(*key, counts.size());
                        counts.emplace_back(*key, 1);
                    }
                    else
                    {
                        ++counts[it->second].second;
                    }
                }
                return DashboardRenderer::rankByCount(counts);
            }
        } // namespace

        // ==================== OutputRateLimiter ====================

        OutputRateLimiter::OutputRateLimiter(uint64_t max_per_second)
            : max_per_second_(max_per_second),
              window_second_(0),
              shown_in_window_(0),
              suppressed_(0),
              total_suppressed_(0)
        {
        }

        bool OutputRateLimiter::allow(uint64_t now_ms)
        {
            if (max_per_second_ == 0)
            {
                return true;
            }

            uint64_t second = now_ms / 1000;
            if (second != window_second_)
            {
                window_second_ = second;
                shown_in_window_ = 0;
            }

            if (shown_in_window_ < max_per_second_)
            {
                ++shown_in_window_;
                return true;
            }

            ++suppressed_;
            ++total_suppressed_;
            return false;
        }

        uint64_t OutputRateLimiter::takeSuppressed()
        {
            uint64_t count = suppressed_;
            suppressed_ = 0;
            return count;
        }

        // ==================== ConsolePrinter ====================

        ConsolePrinter::ConsolePrinter(std::ostream &output, const ConsoleStyle &style)
            : output_(output), style_(style)
        {
        }

        void ConsolePrinter::printBanner(const CaptureBanner &banner)
        {
            std::lock_guard<std::mutex> lock(output_mutex_);

            output_ << style_.paint(style_.icon("🚀 ", "") + banner.title, Color::GREEN, Color::BOLD) << "\n";
            output_ << style_.paint(style_.icon("📡 ", "") + "Source: " + banner.source, Color::CYAN) << "\n";
            if (banner.protocol)
            {
                output_ << style_.paint(style_.icon("🔍 ", "") + "Protocol Filter: " + *banner.protocol, Color::YELLOW) << "\n";
            }
            if (banner.port)
            {
                output_ << style_.paint(style_.icon("🚪 ", "") + "Port Filter: " + std::to_string(*banner.port), Color::YELLOW) << "\n";
            }
            if (banner.count > 0)
            {
                output_ << style_.paint(style_.icon("📊 ", "") + "Capture Limit: " + std::to_string(banner.count) + " packets",
                                        Color::BLUE)
                        << "\n";
            }
            output_ << style_.paint(style_.icon("🎯 ", "") + "Capturing packets... (Press Ctrl+C to stop)", Color::GREEN) << "\n\n";
            output_ << std::flush;
        }

        void ConsolePrinter::printPacketSimple(const PacketRecord &record)
        {
            std::ostringstream line;
            line << style_.icon("🕐 ", "")
                 << style_.paint(Utils::formatUtc(record.timestamp_us, "%H:%M:%S", 3), Color::CYAN) << " | "
                 << style_.paint(record.protocol, Color::GREEN, Color::BOLD) << " "
                 << style_.paint(record.application_protocol.value_or(""), Color::YELLOW) << " | "
                 << style_.paint(record.src_ip.value_or("N/A"), Color::BLUE) << " -> "
                 << style_.paint(record.dst_ip.value_or("N/A"), Color::BLUE) << " | "
                 << style_.paint(record.description, Color::WHITE) << "\n";

            std::lock_guard<std::mutex> lock(output_mutex_);
            output_ << line.str();
        }

        void ConsolePrinter::printPacketVerbose(const PacketRecord &record)
        {
            std::ostringstream block;
            block << style_.paint("[Packet #" + std::to_string(record.packet_number) + "]", Color::GREEN, Color::BOLD) << "\n";
            block << style_.icon("🕐 ", "") << "Timestamp: "
                  << style_.paint(Utils::formatUtc(record.timestamp_us, "%Y-%m-%d %H:%M:%S", 3) + " UTC", Color::CYAN) << "\n";
            block << style_.icon("📟 ", "") << "Ethernet: "
                  << style_.paint(record.src_mac, Color::BLUE) << " -> " << style_.paint(record.dst_mac, Color::BLUE) << "\n";

            if (record.src_ip && record.dst_ip)
            {
                block << style_.icon("🌐 ", "") << "IP: " << style_.paint(*record.src_ip, Color::GREEN) << " -> "
                      << style_.paint(*record.dst_ip, Color::GREEN) << " (" << style_.paint(record.protocol, Color::YELLOW) << ")\n";
            }

            if (record.src_port && record.dst_port)
            {
                block << style_.icon("🚪 ", "") << "Ports: " << style_.paint(std::to_string(*record.src_port), Color::MAGENTA)
                      << " -> " << style_.paint(std::to_string(*record.dst_port), Color::MAGENTA) << "\n";
            }

            if (record.flags)
            {
                block << style_.icon("🏁 ", "") << "Flags: " << style_.paint(*record.flags, Color::RED) << "\n";
            }

            if (record.application_protocol)
            {
                block << style_.icon("📱 ", "") << "Application: "
                      << style_.paint(*record.application_protocol, Color::YELLOW, Color::BOLD) << "\n";
            }

            block << style_.icon("📊 ", "") << "Size: " << record.packet_size << " bytes (payload: "
                  << record.payload_size << " bytes)\n";
            block << style_.icon("💬 ", "") << "Description: " << style_.paint(record.description, Color::WHITE, Color::ITALIC) << "\n";
            block << style_.paint(style_.rule(80), Color::GRAY) << "\n";

            std::lock_guard<std::mutex> lock(output_mutex_);
            output_ << block.str();
        }

        void ConsolePrinter::printInterimStats(const Telemetry::NetworkStats &stats)
        {
            std::ostringstream out;
            uint64_t duration = stats.elapsed_seconds;

            out << "\n" << style_.paint(style_.icon("📈 ", "") + "Interim Statistics", Color::GREEN, Color::BOLD) << "\n";
            out << style_.paint(style_.doubleRule(50), Color::BLUE) << "\n";
            out << style_.icon("⏱️  ", "") << "Duration: " << duration << "s | " << style_.icon("📦 ", "")
                << "Packets: " << stats.total_packets << " (" << formatFixed(rate(stats.total_packets, duration), 1) << "/s)\n";
            out << style_.icon("📊 ", "") << "Total Data: " << Utils::formatBytes(stats.total_bytes, 1) << "\n";
            out << style_.icon("🔗 ", "") << "Protocols:\n";

            for (const auto &entry : stats.protocol_counts)
            {
                out << "   " << style_.paint(style_.icon("▶", ">"), Color::GREEN) << " "
                    << style_.paint(entry.first, Color::YELLOW) << ": " << entry.second << "\n";
            }

            out << style_.paint(style_.doubleRule(50), Color::BLUE) << "\n\n";

            std::lock_guard<std::mutex> lock(output_mutex_);
            output_ << out.str() << std::flush;
        }

        void ConsolePrinter::printFinalSummary(const std::vector<PacketRecord> &records, uint64_t duration_seconds)
        {
            std::ostringstream out;
            uint64_t total_packets = records.size();
            uint64_t total_bytes = 0;
            for (const auto &record : records)
            {
                total_bytes += record.packet_size;
            }

            out << "\n" << style_.paint(style_.icon("🏁 ", "") + "Capture Complete - Final Summary", Color::GREEN, Color::BOLD) << "\n";
            out << style_.paint(style_.doubleRule(80), Color::BLUE) << "\n";
            out << style_.icon("⏱️  ", "") << "Total Duration: " << duration_seconds << "s\n";
            out << style_.icon("📦 ", "") << "Total Packets: " << total_packets << " ("
                << formatFixed(rate(total_packets, duration_seconds), 2) << " packets/second)\n";
            out << style_.icon("📊 ", "") << "Total Data: " << Utils::formatBytes(total_bytes, 1) << " ("
                << formatFixed(rate(total_bytes, duration_seconds), 2) << " bytes/second)\n";

            out << "\n" << style_.paint(style_.icon("🔗 ", "") + "Protocol Distribution:", Color::YELLOW, Color::BOLD) << "\n";
            out << formatDistributionTable("Protocol", protocolDistribution(records), total_packets);

            auto applications = applicationDistribution(records);
            if (!applications.empty())
            {
                out << "\n" << style_.paint(style_.icon("📱 ", "") + "Application Protocols:", Color::YELLOW, Color::BOLD) << "\n";
                out << formatDistributionTable("Application", applications, total_packets);
            }

            out << style_.paint(style_.doubleRule(80), Color::BLUE) << "\n";

            std::lock_guard<std::mutex> lock(output_mutex_);
            output_ << out.str() << std::flush;
        }

        void ConsolePrinter::printNotice(const std::string &text)
        {
            std::lock_guard<std::mutex> lock(output_mutex_);
            output_ << style_.paint(text, Color::GRAY) << "\n";
        }

        // ==================== Distribution helpers ====================

        std::vector<std::pair<std::string, uint64_t>> ConsolePrinter::protocolDistribution(const std::vector<PacketRecord> &records)
        {
            return countBy(records, [](const PacketRecord &record) -> std::optional<std::string>
                           { return record.protocol; });
        }

        std::vector<std::pair<std::string, uint64_t>> ConsolePrinter::applicationDistribution(const std::vector<PacketRecord> &records)
        {
            return countBy(records, [](const PacketRecord &record)
                           { return record.application_protocol; });
        }

        std::string ConsolePrinter::formatDistributionTable(const std::string &name_header,
                                                            const std::vector<std::pair<std::string, uint64_t>> &rows,
                                                            uint64_t total) const
        {
            const TableGlyphs &g = style_.glyphs();

            size_t name_width = displayWidth(name_header);
            for (const auto &row : rows)
            {
                name_width = std::max(name_width, displayWidth(row.first));
            }
            const size_t count_width = 10;
            const size_t percent_width = 10;

            auto border = [&](const char *left, const char *mid, const char *right)
            {
                return std::string(left) + style_.rule(name_width + 2) + mid + style_.rule(count_width + 2) + mid +
                       style_.rule(percent_width + 2) + right + "\n";
            };
            auto line = [&](const std::string &name, const std::string &count, const std::string &percent)
            {
                return std::string(g.vertical) + " " + padRight(name, name_width) + " " + g.vertical + " " +
                       padLeft(count, count_width) + " " + g.vertical + " " + padLeft(percent, percent_width) + " " +
                       g.vertical + "\n";
            };

            std::string table = border(g.top_left, g.top_mid, g.top_right);
            table += line(name_header, "Packets", "Percentage");
            table += border(g.mid_left, g.cross, g.mid_right);
            for (const auto &row : rows)
            {
                table += line(row.first, std::to_string(row.second),
                              formatFixed(DashboardRenderer::percentage(row.second, total), 1) + "%");
            }
            table += border(g.bottom_left, g.bottom_mid, g.bottom_right);
            return table;
        }

    } // namespace CLI
} // namespace PacketSniffer
