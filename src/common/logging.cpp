// src/common/logging.cpp
#include "logging.hpp"
#include "config_manager.hpp"
#include "utils.hpp"
#include <iostream>
#include <vector>
#include <algorithm>
#include <chrono>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace PacketSniffer
{
    namespace Common
    {
        LoggingOptions loggingOptionsFromConfig()
        {
            auto &config = ConfigManager::getInstance();

            LoggingOptions options;
            options.level = config.getString(ConfigKeys::LOGGING_LEVEL, options.level);
            options.file = config.getString(ConfigKeys::LOGGING_FILE, options.file);
            options.enable_console = config.getBool(ConfigKeys::LOGGING_ENABLE_CONSOLE, options.enable_console);
            options.enable_file = config.getBool(ConfigKeys::LOGGING_ENABLE_FILE, options.enable_file);
            return options;
        }

        spdlog::level::level_enum parseLogLevel(const std::string &level)
        {
            std::string lower = Utils::toLowerCase(Utils::trim(level));
            if (lower == "trace")
                return spdlog::level::trace;
            if (lower == "debug")
                return spdlog::level::debug;
            if (lower == "warn" || lower == "warning")
                return spdlog::level::warn;
            if (lower == "error")
                return spdlog::level::err;
            if (lower == "critical")
                return spdlog::level::critical;
            if (lower == "off")
                return spdlog::level::off;
            return spdlog::level::info;
        }

        bool setupLogger(const LoggingOptions &options)
        {
            try
            {
                std::vector<spdlog::sink_ptr> sinks;
                spdlog::level::level_enum level = parseLogLevel(options.level);

                if (options.enable_console)
                {
                    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                    console_sink->set_level(options.quiet_console ? std::max(level, spdlog::level::warn) : level);
                    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
                    sinks.push_back(console_sink);
                }

                if (options.enable_file && !options.file.empty())
                {
                    if (!Utils::createDirectory(Utils::getDirectoryName(options.file)))
                    {
                        std::cerr << "❌ Cannot create log directory for: " << options.file << std::endl;
                    }
                    else
                    {
                        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                            options.file, 1024 * 1024 * 10, 5);
                        file_sink->set_level(level);
                        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                        sinks.push_back(file_sink);
                    }
                }

                if (sinks.empty())
                {
                    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
                }

                auto logger = std::make_shared<spdlog::logger>("packet_sniffer", sinks.begin(), sinks.end());
                logger->set_level(level);

                spdlog::set_default_logger(logger);
                spdlog::flush_every(std::chrono::seconds(5));

                spdlog::debug("Logger initialized (level={}, file={})", options.level,
                              options.enable_file ? options.file : "disabled");
                return true;
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                std::cerr << "❌ Log initialization failed: " << ex.what() << std::endl;
                return false;
            }
        }

    } // namespace Common
} // namespace PacketSniffer
