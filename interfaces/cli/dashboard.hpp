// interfaces/cli/dashboard.hpp
#ifndef PACKET_SNIFFER_DASHBOARD_HPP
#define PACKET_SNIFFER_DASHBOARD_HPP

#include "dashboard_renderer.hpp"
#include "../../src/core/telemetry/telemetry_aggregator.hpp"
#include "../../src/core/telemetry/recent_record_buffer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>

namespace PacketSniffer
{
    namespace CLI
    {
        /**
         * @brief Render dashboard định kỳ trên thread riêng
         *
         * Mỗi tick: chờ refresh interval, lấy snapshot của aggregator và
         * recent buffer (lock chỉ giữ trong lúc copy), định dạng rồi ghi ra stream.
         */
        class Dashboard
        {
        public:
            Dashboard(const Telemetry::TelemetryAggregator &aggregator,
                      const Telemetry::RecentRecordBuffer &recent,
                      const DashboardRenderer &renderer,
                      std::ostream &output,
                      std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(1000));
            ~Dashboard();

            Dashboard(const Dashboard &) = delete;
            Dashboard &operator=(const Dashboard &) = delete;

            /**
             * @brief Bắt đầu thread render
             * @return false nếu đang chạy
             */
            bool start();

            /**
             * @brief Đánh thức thread đang ngủ và join
             */
            void stop();

            bool isRunning() const { return running_.load(); }

            /**
             * @brief Render một lần ngay trên thread gọi
             */
            void renderOnce();

            uint64_t getFrameCount() const { return frames_rendered_.load(); }

        private:
            void tickLoop();

            const Telemetry::TelemetryAggregator &aggregator_;
            const Telemetry::RecentRecordBuffer &recent_;
            DashboardRenderer renderer_;
            std::ostream &output_;
            std::chrono::milliseconds refresh_interval_;

            std::atomic<bool> running_;
            std::atomic<uint64_t> frames_rendered_;
            std::unique_ptr<std::thread> render_thread_;

            std::mutex wait_mutex_;
            std::condition_variable wake_cv_;
            bool stop_requested_;

            std::mutex output_mutex_;
        };

    } // namespace CLI
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_DASHBOARD_HPP
