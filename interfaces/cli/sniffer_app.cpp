// interfaces/cli/sniffer_app.cpp
#include "sniffer_app.hpp"
#include "dashboard.hpp"
#include "dashboard_renderer.hpp"
#include "../../src/common/config_manager.hpp"
#include "../../src/common/logging.hpp"
#include "../../src/common/utils.hpp"
#include "../../src/core/layer1/packet_decoder.hpp"
#include "../../src/core/telemetry/threat_classifier.hpp"
#include "../../src/core/storage/export_serializer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace PacketSniffer
{
    namespace CLI
    {
        using Common::ConfigManager;
        using Common::ErrorCode;
        using Common::PacketRecord;
        using Common::SnifferError;
        using Common::Utils;
        namespace ConfigKeys = Common::ConfigKeys;

        namespace
        {
            constexpr int EXIT_OK = 0;
            constexpr int EXIT_FAILURE_CODE = 1;
            constexpr auto SHUTDOWN_POLL_INTERVAL = std::chrono::milliseconds(100);

            size_t configCapacity(const char *key, size_t default_value)
            {
                int value = ConfigManager::getInstance().getInt(key, static_cast<int>(default_value));
                return value > 0 ? static_cast<size_t>(value) : default_value;
            }
        } // namespace

        SnifferApp::SnifferApp(const CliOptions &options)
            : options_(options),
              shutdown_requested_(false),
              accepted_packets_(0),
              capture_start_ms_(0),
              last_stats_ms_(0)
        {
        }

        SnifferApp::~SnifferApp()
        {
            if (ingress_ && ingress_->isRunning())
            {
                ingress_->stop();
            }
        }

        // ==================== Entry point ====================

        int SnifferApp::run()
        {
            if (options_.show_help)
            {
                CliParser::printHelp(std::cout);
                return EXIT_OK;
            }
            if (options_.show_version)
            {
                CliParser::printVersion(std::cout);
                return EXIT_OK;
            }

            std::string config_path = options_.config_path ? *options_.config_path : ConfigManager::defaultConfigPath();

            if (options_.generate_config)
            {
                return generateConfig(config_path);
            }

            auto &config = ConfigManager::getInstance();
            if (!config.loadOrCreate(config_path))
            {
                SnifferError error(ErrorCode::ConfigError, "Failed to load configuration: " + config_path);
                error.report(std::cerr);
                return EXIT_FAILURE_CODE;
            }

            Common::LoggingOptions logging = Common::loggingOptionsFromConfig();
            logging.quiet_console = options_.dashboard;
            if (!Common::setupLogger(logging))
            {
                std::cerr << "Failed to initialize logger" << std::endl;
                return EXIT_FAILURE_CODE;
            }

            style_ = ConsoleStyle::fromConfig();
            spdlog::info("Starting Advanced Network Packet Sniffer v{}", PROGRAM_VERSION);

            if (options_.list_interfaces)
            {
                return listInterfaces();
            }

            if (auto error = validateOptions())
            {
                return fail(*error, "Option validation");
            }

            if (!openCapture())
            {
                auto error = ingress_->getLastError();
                return fail(error ? *error : SnifferError(ErrorCode::NetworkError, ingress_->getSourceName()),
                            "Capture setup");
            }

            return options_.dashboard ? runDashboardMode() : runStreamingMode();
        }

        void SnifferApp::requestShutdown()
        {
            shutdown_requested_.store(true);
            if (ingress_)
            {
                ingress_->requestStop();
            }
        }

        // ==================== Startup ====================

        int SnifferApp::generateConfig(const std::string &config_path)
        {
            auto &config = ConfigManager::getInstance();
            config.resetToDefaults();

            if (!config.saveToFile(config_path))
            {
                SnifferError(ErrorCode::ConfigError, "Failed to generate configuration: " + config_path).report(std::cerr);
                return EXIT_FAILURE_CODE;
            }

            std::cout << "✅ Default configuration generated at: " << config_path << std::endl;
            std::cout << "💡 You can now edit this file to customize the packet sniffer behavior." << std::endl;
            return EXIT_OK;
        }

        int SnifferApp::listInterfaces()
        {
            auto interfaces = Layer1::PacketIngress::listInterfaces();
            if (!interfaces)
            {
                return fail(SnifferError(ErrorCode::NetworkError, "Unable to enumerate network interfaces"),
                            "Interface listing");
            }

            std::cout << style_.paint(style_.icon("🌐 ", "") + "Available Network Interfaces:", Color::GREEN, Color::BOLD)
                      << "\n\n";

            size_t name_width = 9;
            for (const auto &info : *interfaces)
            {
                name_width = std::max(name_width, displayWidth(info.name));
            }

            std::cout << style_.paint(padRight("Interface", name_width), Color::BOLD) << "  "
                      << style_.paint(padRight("Status", 6), Color::BOLD) << "  "
                      << style_.paint("IP Addresses", Color::BOLD) << "\n";
            std::cout << style_.rule(name_width + 2 + 6 + 2 + 40) << "\n";

            for (const auto &info : *interfaces)
            {
                std::string status = info.is_up ? style_.paint(padRight("UP", 6), Color::GREEN)
                                                : style_.paint(padRight("DOWN", 6), Color::RED);
                std::cout << padRight(info.name, name_width) << "  " << status << "  "
                          << Utils::join(info.addresses, ", ") << "\n";
                if (!info.description.empty())
                {
                    std::cout << padRight("", name_width + 10) << style_.paint(info.description, Color::GRAY) << "\n";
                }
            }

            std::cout << "\n" << style_.paint(style_.icon("💡 ", "") + "Usage example:", Color::YELLOW, Color::BOLD) << "\n";
            std::cout << style_.paint(std::string("  sudo ") + PROGRAM_NAME + " --interface eth0 --dashboard", Color::CYAN) << "\n";
            std::cout << style_.paint(std::string("  sudo ") + PROGRAM_NAME + " --interface wlan0 --protocol http --verbose",
                                      Color::CYAN)
                      << std::endl;

            spdlog::debug("Listed {} interfaces", interfaces->size());
            return EXIT_OK;
        }

        int SnifferApp::fail(const SnifferError &error, const std::string &context)
        {
            reportError(error, context);
            return EXIT_FAILURE_CODE;
        }

        void SnifferApp::reportError(const SnifferError &error, const std::string &context)
        {
            spdlog::error("{}: {}", context, error.describe());
            error.report(std::cerr);
        }

        std::optional<SnifferError> SnifferApp::validateOptions() const
        {
            if (!options_.read_file && !options_.interface)
            {
                return SnifferError(ErrorCode::InterfaceNotFound, "No interface specified");
            }

            if (options_.protocol && !Layer1::PacketFilter::isValidProtocol(*options_.protocol))
            {
                return SnifferError(ErrorCode::InvalidFilter, *options_.protocol);
            }

            auto &config = ConfigManager::getInstance();
            auto targets = collectExportTargets(options_,
                                                config.getString(ConfigKeys::EXPORT_DEFAULT_FORMAT, "json"),
                                                config.getString(ConfigKeys::EXPORT_DEFAULT_DIRECTORY, ""));
            if (!targets)
            {
                return SnifferError(ErrorCode::ConfigError,
                                    "Unsupported export.default_format: " +
                                        config.getString(ConfigKeys::EXPORT_DEFAULT_FORMAT, ""));
            }

            return std::nullopt;
        }

        bool SnifferApp::openCapture()
        {
            auto &config = ConfigManager::getInstance();

            Layer1::IngressConfig ingress_config;
            if (options_.read_file)
            {
                if (options_.interface)
                {
                    spdlog::warn("Both --read and --interface given; reading from {}", *options_.read_file);
                }
                ingress_config.offline_file = *options_.read_file;
            }
            else
            {
                ingress_config.interface = *options_.interface;
            }

            // performance.buffer_size tính bằng KiB
            int buffer_kib = config.getInt(ConfigKeys::PERF_BUFFER_SIZE, 4096);
            if (buffer_kib > 0)
            {
                ingress_config.buffer_size = buffer_kib * 1024;
            }

            ingress_ = std::make_unique<Layer1::PacketIngress>(ingress_config);
            filter_ = std::make_unique<Layer1::PacketFilter>(options_.protocol, options_.port);

            Telemetry::AggregatorLimits limits;
            limits.packet_size_history = configCapacity(ConfigKeys::TELEMETRY_PACKET_SIZE_HISTORY, limits.packet_size_history);
            limits.bandwidth_history = configCapacity(ConfigKeys::TELEMETRY_BANDWIDTH_HISTORY, limits.bandwidth_history);
            limits.threat_alert_history = configCapacity(ConfigKeys::TELEMETRY_THREAT_ALERT_HISTORY, limits.threat_alert_history);

            aggregator_ = std::make_unique<Telemetry::TelemetryAggregator>(limits);
            recent_ = std::make_unique<Telemetry::RecentRecordBuffer>(configCapacity(ConfigKeys::TELEMETRY_RECENT_RECORDS, 1000));

            if (!filter_->empty())
            {
                spdlog::info("Packet filter: {}", filter_->toString());
            }

            return ingress_->initialize();
        }

        // ==================== Run modes ====================

        int SnifferApp::runDashboardMode()
        {
            auto &config = ConfigManager::getInstance();
            int refresh_ms = config.getInt(ConfigKeys::PERF_DASHBOARD_REFRESH_RATE, 1000);

            std::cout << style_.paint(style_.icon("🚀 ", "") + "Starting Interactive Dashboard Mode", Color::GREEN, Color::BOLD) << "\n";
            std::cout << style_.paint(style_.icon("📡 ", "") + "Source: " + ingress_->getSourceName(), Color::CYAN) << "\n";
            std::cout << style_.paint("Press Ctrl+C to stop", Color::YELLOW) << "\n" << std::endl;

            Dashboard dashboard(*aggregator_, *recent_, DashboardRenderer(style_), std::cout,
                                std::chrono::milliseconds(refresh_ms > 0 ? refresh_ms : 1000));

            capture_start_ms_ = Utils::getMonotonicTimeMs();
            if (!ingress_->start([this](const Layer1::RawFrame &frame)
                                 { processFrame(frame); }))
            {
                return fail(SnifferError(ErrorCode::NetworkError, "Failed to start capture on " + ingress_->getSourceName()),
                            "Capture start");
            }
            dashboard.start();

            // Capture kết thúc (EOF, lỗi, đủ --count) thì dashboard vẫn hiển thị trạng thái cuối
            bool capture_end_logged = false;
            while (!shutdown_requested_.load())
            {
                if (!capture_end_logged && !ingress_->isRunning())
                {
                    spdlog::debug("Capture ended, dashboard keeps the last state until Ctrl+C");
                    capture_end_logged = true;
                }
                std::this_thread::sleep_for(SHUTDOWN_POLL_INTERVAL);
            }

            ingress_->stop();
            dashboard.stop();
            dashboard.renderOnce();

            uint64_t duration = (Utils::getMonotonicTimeMs() - capture_start_ms_) / 1000;
            logCaptureStop(duration);

            std::cout << std::endl;
            if (!exportRecords(recent_->snapshot()))
            {
                return EXIT_FAILURE_CODE;
            }

            if (auto error = ingress_->getLastError())
            {
                return fail(*error, "Packet capture");
            }
            return EXIT_OK;
        }

        int SnifferApp::runStreamingMode()
        {
            auto &config = ConfigManager::getInstance();
            int max_lines = config.getInt(ConfigKeys::PERF_MAX_PACKETS_PER_SECOND, 0);
            output_limiter_ = OutputRateLimiter(max_lines > 0 ? static_cast<uint64_t>(max_lines) : 0);

            printer_ = std::make_unique<ConsolePrinter>(std::cout, style_);

            CaptureBanner banner;
            banner.title = "Starting Advanced Packet Capture";
            banner.source = ingress_->getSourceName();
            banner.protocol = options_.protocol;
            banner.port = options_.port;
            banner.count = options_.count;
            printer_->printBanner(banner);

            capture_start_ms_ = Utils::getMonotonicTimeMs();
            last_stats_ms_ = capture_start_ms_;

            if (!ingress_->start([this](const Layer1::RawFrame &frame)
                                 { processFrame(frame); }))
            {
                return fail(SnifferError(ErrorCode::NetworkError, "Failed to start capture on " + ingress_->getSourceName()),
                            "Capture start");
            }

            if (shutdown_requested_.load())
            {
                ingress_->requestStop();
            }

            // Dừng khi hết file, đủ --count, lỗi đọc hoặc Ctrl+C
            ingress_->waitForCompletion();

            uint64_t duration = (Utils::getMonotonicTimeMs() - capture_start_ms_) / 1000;

            if (output_limiter_.totalSuppressed() > 0)
            {
                printer_->printNotice("(" + std::to_string(output_limiter_.totalSuppressed()) +
                                      " packets not shown, output limited to " + std::to_string(max_lines) + "/s)");
            }

            printer_->printFinalSummary(captured_records_, duration);
            logCaptureStop(duration);

            if (!exportRecords(captured_records_))
            {
                return EXIT_FAILURE_CODE;
            }

            if (auto error = ingress_->getLastError())
            {
                return fail(*error, "Packet capture");
            }
            return EXIT_OK;
        }

        // ==================== Per-packet pipeline ====================

        void SnifferApp::processFrame(const Layer1::RawFrame &frame)
        {
            uint64_t accepted = accepted_packets_.load();
            if (options_.count > 0 && accepted >= options_.count)
            {
                ingress_->requestStop();
                return;
            }

            PacketRecord record = Layer1::PacketDecoder::decode(frame.data, frame.captured_length,
                                                                frame.timestamp_us, accepted + 1,
                                                                frame.original_length);
            if (!filter_->matches(record))
            {
                return;
            }

            record.threat_level = Telemetry::ThreatClassifier::classify(record);

            aggregator_->ingest(record);
            recent_->push(record);
            accepted = accepted_packets_.fetch_add(1) + 1;

            if (!options_.dashboard)
            {
                printStreaming(record);
                captured_records_.push_back(std::move(record));
            }

            if (options_.count > 0 && accepted >= options_.count)
            {
                spdlog::debug("Packet limit of {} reached", options_.count);
                ingress_->requestStop();
            }
        }

        void SnifferApp::printStreaming(const PacketRecord &record)
        {
            uint64_t now_ms = Utils::getMonotonicTimeMs();

            if (output_limiter_.allow(now_ms))
            {
                uint64_t hidden = output_limiter_.takeSuppressed();
                if (hidden > 0)
                {
                    printer_->printNotice("... " + std::to_string(hidden) + " packets not shown");
                }

                if (options_.verbose)
                    printer_->printPacketVerbose(record);
                else
                    printer_->printPacketSimple(record);
            }

            if (options_.stats_interval > 0 && now_ms - last_stats_ms_ >= options_.stats_interval * 1000)
            {
                printer_->printInterimStats(aggregator_->snapshot());
                last_stats_ms_ = now_ms;
            }
        }

        // ==================== Export ====================

        std::string SnifferApp::resolveExportPath(const std::string &path, const std::string &default_directory)
        {
            if (default_directory.empty() || path.find('/') != std::string::npos)
            {
                return path;
            }
            std::string dir = default_directory;
            if (dir.back() != '/')
            {
                dir += '/';
            }
            return dir + path;
        }

        std::optional<std::vector<ExportTarget>> SnifferApp::collectExportTargets(const CliOptions &options,
                                                                                  const std::string &default_format,
                                                                                  const std::string &default_directory)
        {
            std::vector<ExportTarget> targets;

            if (options.export_json)
            {
                targets.push_back({"json", resolveExportPath(*options.export_json, default_directory)});
            }
            if (options.export_csv)
            {
                targets.push_back({"csv", resolveExportPath(*options.export_csv, default_directory)});
            }
            if (options.export_default)
            {
                std::string format = Utils::toLowerCase(default_format);
                if (format != "json" && format != "csv")
                {
                    return std::nullopt;
                }
                targets.push_back({format, resolveExportPath(*options.export_default, default_directory)});
            }

            return targets;
        }

        bool SnifferApp::exportRecords(const std::vector<PacketRecord> &records)
        {
            auto &config = ConfigManager::getInstance();
            auto targets = collectExportTargets(options_,
                                                config.getString(ConfigKeys::EXPORT_DEFAULT_FORMAT, "json"),
                                                config.getString(ConfigKeys::EXPORT_DEFAULT_DIRECTORY, ""));
            if (!targets)
            {
                // Đã được kiểm tra trong validateOptions()
                return false;
            }

            Core::Storage::ExportOptions export_options;
            export_options.backup_existing = config.getBool(ConfigKeys::EXPORT_AUTO_BACKUP, true);

            for (const auto &target : *targets)
            {
                bool ok = target.format == "csv"
                              ? Core::Storage::ExportSerializer::writeCsvFile(records, target.path, export_options)
                              : Core::Storage::ExportSerializer::writeJsonFile(records, target.path, export_options);
                if (!ok)
                {
                    reportError(SnifferError(ErrorCode::ExportError,
                                             "Failed to write " + std::to_string(records.size()) + " packets to " + target.path),
                                "Export");
                    return false;
                }

                std::cout << style_.paint(style_.icon("✅ ", "") + "Exported " + std::to_string(records.size()) +
                                              " packets to " + target.path,
                                          Color::GREEN)
                          << std::endl;
            }
            return true;
        }

        void SnifferApp::logCaptureStop(uint64_t duration_seconds)
        {
            Layer1::IngressStats stats = ingress_->getStats();
            spdlog::info("Stopped packet capture. Captured {} packets in {} seconds", accepted_packets_.load(), duration_seconds);
            spdlog::debug("Ingress stats: received={} dropped={} errors={}",
                          stats.packets_received, stats.packets_dropped, stats.errors);
        }

    } // namespace CLI
} // namespace PacketSniffer
