// interfaces/cli/dashboard.cpp
#include "dashboard.hpp"
#include "../../src/common/utils.hpp"
#include <spdlog/spdlog.h>

namespace PacketSniffer
{
    namespace CLI
    {
        Dashboard::Dashboard(const Telemetry::TelemetryAggregator &aggregator,
                             const Telemetry::RecentRecordBuffer &recent,
                             const DashboardRenderer &renderer,
                             std::ostream &output,
                             std::chrono::milliseconds refresh_interval)
            : aggregator_(aggregator),
              recent_(recent),
              renderer_(renderer),
              output_(output),
              refresh_interval_(refresh_interval.count() > 0 ? refresh_interval : std::chrono::milliseconds(1000)),
              running_(false),
              frames_rendered_(0),
              stop_requested_(false)
        {
        }

        Dashboard::~Dashboard()
        {
            stop();
        }

        bool Dashboard::start()
        {
            if (running_.load())
            {
                spdlog::warn("Dashboard already running");
                return false;
            }

            {
                std::lock_guard<std::mutex> lock(wait_mutex_);
                stop_requested_ = false;
            }

            running_.store(true);
            render_thread_ = std::make_unique<std::thread>(&Dashboard::tickLoop, this);

            spdlog::debug("Dashboard started (refresh every {} ms)", refresh_interval_.count());
            return true;
        }

        void Dashboard::stop()
        {
            {
                std::lock_guard<std::mutex> lock(wait_mutex_);
                stop_requested_ = true;
            }
            wake_cv_.notify_all();

            if (render_thread_ && render_thread_->joinable())
            {
                render_thread_->join();
                spdlog::debug("Dashboard stopped after {} frames", frames_rendered_.load());
            }
            render_thread_.reset();
            running_.store(false);
        }

        void Dashboard::renderOnce()
        {
            // Mỗi snapshot chỉ giữ lock trong lúc copy
            Telemetry::NetworkStats stats = aggregator_.snapshot();
            std::vector<Common::PacketRecord> records = recent_.snapshot();

            std::string frame = renderer_.render(stats, records, Common::Utils::getCurrentTimestampUs());

            std::lock_guard<std::mutex> lock(output_mutex_);
            output_ << Color::CLEAR_SCREEN << frame << std::flush;
            frames_rendered_.fetch_add(1);
        }

        void Dashboard::tickLoop()
        {
            while (true)
            {
                {
                    std::unique_lock<std::mutex> lock(wait_mutex_);
                    if (wake_cv_.wait_for(lock, refresh_interval_, [this]
                                          { return stop_requested_; }))
                    {
                        break;
                    }
                }

                renderOnce();
            }
        }

    } // namespace CLI
} // namespace PacketSniffer
