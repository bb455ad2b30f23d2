// interfaces/cli/console_printer.hpp
#ifndef PACKET_SNIFFER_CONSOLE_PRINTER_HPP
#define PACKET_SNIFFER_CONSOLE_PRINTER_HPP

#include "console_style.hpp"
#include "../../src/common/packet_record.hpp"
#include "../../src/core/telemetry/telemetry_aggregator.hpp"
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace PacketSniffer
{
    namespace CLI
    {
        /**
         * @brief Thông tin hiển thị khi bắt đầu capture
         */
        struct CaptureBanner
        {
            std::string title;
            std::string source;
            std::optional<std::string> protocol;
            std::optional<uint16_t> port;
            uint64_t count = 0;
        };

        /**
         * @brief Giới hạn số dòng in ra mỗi giây (0 = không giới hạn)
         *
         * Gói vượt giới hạn vẫn được đếm và export, chỉ không in ra console.
         */
        class OutputRateLimiter
        {
        public:
            explicit OutputRateLimiter(uint64_t max_per_second = 0);

            /**
             * @brief true nếu được phép in gói này
             * @param now_ms Thời gian monotonic (ms)
             */
            bool allow(uint64_t now_ms);

            /**
             * @brief Số gói bị ẩn kể từ lần gọi trước, rồi reset về 0
             */
            uint64_t takeSuppressed();

            uint64_t totalSuppressed() const { return total_suppressed_; }

        private:
            uint64_t max_per_second_;
            uint64_t window_second_;
            uint64_t shown_in_window_;
            uint64_t suppressed_;
            uint64_t total_suppressed_;
        };

        /**
         * @brief Output của streaming mode (một dòng / một khối cho mỗi gói)
         */
        class ConsolePrinter
        {
        public:
            ConsolePrinter(std::ostream &output, const ConsoleStyle &style);

            void printBanner(const CaptureBanner &banner);

            /**
             * @brief "time | PROTO app | src -> dst | description"
             */
            void printPacketSimple(const Common::PacketRecord &record);

            void printPacketVerbose(const Common::PacketRecord &record);

            /**
             * @brief Thống kê định kỳ: thời gian, số gói, data, protocol
             */
            void printInterimStats(const Telemetry::NetworkStats &stats);

            /**
             * @brief Tổng kết cuối: tổng, tốc độ, bảng protocol và application
             */
            void printFinalSummary(const std::vector<Common::PacketRecord> &records, uint64_t duration_seconds);

            void printNotice(const std::string &text);

            // ==================== Distribution helpers ====================
            static std::vector<std::pair<std::string, uint64_t>> protocolDistribution(
                const std::vector<Common::PacketRecord> &records);

            static std::vector<std::pair<std::string, uint64_t>> applicationDistribution(
                const std::vector<Common::PacketRecord> &records);

            /**
             * @brief Bảng 3 cột (name, packets, percentage)
             */
            std::string formatDistributionTable(const std::string &name_header,
                                                const std::vector<std::pair<std::string, uint64_t>> &rows,
                                                uint64_t total) const;

        private:
            std::ostream &output_;
            ConsoleStyle style_;
            std::mutex output_mutex_;
        };

    } // namespace CLI
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_CONSOLE_PRINTER_HPP
