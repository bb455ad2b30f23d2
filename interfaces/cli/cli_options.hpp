// interfaces/cli/cli_options.hpp
#ifndef PACKET_SNIFFER_CLI_OPTIONS_HPP
#define PACKET_SNIFFER_CLI_OPTIONS_HPP

#include <string>
#include <vector>
#include <optional>
#include <ostream>
#include <cstdint>

namespace PacketSniffer
{
    namespace CLI
    {
        constexpr const char *PROGRAM_NAME = "packet_sniffer";
        constexpr const char *PROGRAM_VERSION = "1.0.0";

        // ==================== Command line options ====================
        struct CliOptions
        {
            std::optional<std::string> interface;
            std::optional<std::string> read_file;
            std::optional<std::string> protocol;
            std::optional<uint16_t> port;
            uint64_t count = 0;                     // 0 = không giới hạn
            bool list_interfaces = false;
            bool dashboard = false;
            std::optional<std::string> export_json;
            std::optional<std::string> export_csv;
            std::optional<std::string> export_default;  // --export, định dạng theo export.default_format
            bool verbose = false;
            uint64_t stats_interval = 10;           // giây
            std::optional<std::string> config_path;
            bool generate_config = false;
            bool show_help = false;
            bool show_version = false;
        };

        /**
         * @brief Parser cho dòng lệnh của packet_sniffer
         *
         * Hỗ trợ dạng "-i eth0", "--interface eth0" và "--interface=eth0".
         */
        class CliParser
        {
        public:
            /**
             * @brief Parse argv
             * @param options Kết quả (chỉ hợp lệ khi trả về true)
             * @param error Thông báo lỗi khi trả về false
             */
            static bool parseCommandLine(int argc, char *argv[], CliOptions &options, std::string &error);

            static bool parseArguments(const std::vector<std::string> &args, CliOptions &options, std::string &error);

            static void printHelp(std::ostream &os);
            static void printVersion(std::ostream &os);

        private:
            CliParser() = default;

            static bool parseUnsigned(const std::string &text, uint64_t max_value, uint64_t &value);
        };

    } // namespace CLI
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_CLI_OPTIONS_HPP
