// interfaces/cli/sniffer_app.hpp
#ifndef PACKET_SNIFFER_SNIFFER_APP_HPP
#define PACKET_SNIFFER_SNIFFER_APP_HPP

#include "cli_options.hpp"
#include "console_printer.hpp"
#include "console_style.hpp"
#include "../../src/common/packet_record.hpp"
#include "../../src/common/sniffer_error.hpp"
#include "../../src/core/layer1/packet_ingress.hpp"
#include "../../src/core/layer1/packet_filter.hpp"
#include "../../src/core/telemetry/telemetry_aggregator.hpp"
#include "../../src/core/telemetry/recent_record_buffer.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace PacketSniffer
{
    namespace CLI
    {
        /**
         * @brief Một file cần export khi kết thúc capture
         */
        struct ExportTarget
        {
            std::string format;     // "json" hoặc "csv"
            std::string path;
        };

        /**
         * @brief Ứng dụng packet_sniffer: nối ingress -> decoder -> filter
         *        -> classifier -> aggregator/recent buffer, rồi dashboard hoặc streaming
         */
        class SnifferApp
        {
        public:
            explicit SnifferApp(const CliOptions &options);
            ~SnifferApp();

            SnifferApp(const SnifferApp &) = delete;
            SnifferApp &operator=(const SnifferApp &) = delete;

            /**
             * @brief Chạy theo tùy chọn dòng lệnh
             * @return Exit code (0 = thành công, 1 = lỗi)
             */
            int run();

            /**
             * @brief Yêu cầu dừng (gọi được từ signal handler)
             */
            void requestShutdown();

            bool isShutdownRequested() const { return shutdown_requested_.load(); }

            /**
             * @brief Đường dẫn export sau khi áp dụng export.default_directory
             *
             * Tên file không có thư mục được đặt vào default_directory.
             */
            static std::string resolveExportPath(const std::string &path, const std::string &default_directory);

            /**
             * @brief Danh sách export từ --export-json, --export-csv, --export
             * @return std::nullopt nếu export.default_format không hợp lệ
             */
            static std::optional<std::vector<ExportTarget>> collectExportTargets(const CliOptions &options,
                                                                                const std::string &default_format,
                                                                                const std::string &default_directory);

        private:
            int generateConfig(const std::string &config_path);
            int listInterfaces();
            int fail(const Common::SnifferError &error, const std::string &context);
            void reportError(const Common::SnifferError &error, const std::string &context);

            std::optional<Common::SnifferError> validateOptions() const;
            bool openCapture();

            int runDashboardMode();
            int runStreamingMode();

            void processFrame(const Layer1::RawFrame &frame);
            void printStreaming(const Common::PacketRecord &record);

            bool exportRecords(const std::vector<Common::PacketRecord> &records);
            void logCaptureStop(uint64_t duration_seconds);

            CliOptions options_;
            ConsoleStyle style_;

            std::unique_ptr<Layer1::PacketIngress> ingress_;
            std::unique_ptr<Layer1::PacketFilter> filter_;
            std::unique_ptr<Telemetry::TelemetryAggregator> aggregator_;
            std::unique_ptr<Telemetry::RecentRecordBuffer> recent_;
            std::unique_ptr<ConsolePrinter> printer_;

            std::atomic<bool> shutdown_requested_;
            std::atomic<uint64_t> accepted_packets_;
            uint64_t capture_start_ms_;

            // Streaming mode (chỉ truy cập từ capture thread và sau khi thread kết thúc)
            std::vector<Common::PacketRecord> captured_records_;
            OutputRateLimiter output_limiter_;
            uint64_t last_stats_ms_;
        };

    } // namespace CLI
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_SNIFFER_APP_HPP
