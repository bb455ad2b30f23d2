// src/common/logging.hpp
#ifndef PACKET_SNIFFER_LOGGING_HPP
#define PACKET_SNIFFER_LOGGING_HPP

#include <string>
#include <spdlog/spdlog.h>

namespace PacketSniffer
{
    namespace Common
    {
        /**
         * @brief Tùy chọn cho logger mặc định của spdlog
         */
        struct LoggingOptions
        {
            std::string level = "info";
            std::string file = "packet_sniffer.log";
            bool enable_console = true;
            bool enable_file = true;
            bool quiet_console = false;     // dashboard mode: console chỉ hiện warn trở lên
        };

        /**
         * @brief Đọc các key logging.* từ ConfigManager
         */
        LoggingOptions loggingOptionsFromConfig();

        /**
         * @brief Chuyển tên level ("info", "warn", ...) sang spdlog level, mặc định info
         */
        spdlog::level::level_enum parseLogLevel(const std::string &level);

        /**
         * @brief Khởi tạo logger mặc định (console + rotating file)
         * @return false nếu spdlog không tạo được sink
         */
        bool setupLogger(const LoggingOptions &options);

    } // namespace Common
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_LOGGING_HPP
