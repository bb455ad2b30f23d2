// interfaces/cli/cli_options.cpp
#include "cli_options.hpp"
#include <cctype>
#include <limits>

namespace PacketSniffer
{
    namespace CLI
    {
        namespace
        {
            enum class OptionId
            {
                Interface,
                Read,
                Protocol,
                Port,
                Count,
                ListInterfaces,
                Dashboard,
                ExportJson,
                ExportCsv,
                Export,
                Verbose,
                StatsInterval,
                Config,
                GenerateConfig,
                Help,
                Version
            };

            struct OptionSpec
            {
                const char *short_name;     // nullptr nếu không có
                const char *long_name;
                bool takes_value;
                OptionId id;
            };

            const OptionSpec OPTIONS[] = {
                {"-i", "--interface", true, OptionId::Interface},
                {"-r", "--read", true, OptionId::Read},
                {"-p", "--protocol", true, OptionId::Protocol},
                {"-P", "--port", true, OptionId::Port},
                {"-c", "--count", true, OptionId::Count},
                {"-l", "--list-interfaces", false, OptionId::ListInterfaces},
                {"-d", "--dashboard", false, OptionId::Dashboard},
                {nullptr, "--export-json", true, OptionId::ExportJson},
                {nullptr, "--export-csv", true, OptionId::ExportCsv},
                {"-o", "--export", true, OptionId::Export},
                {"-v", "--verbose", false, OptionId::Verbose},
                {nullptr, "--stats-interval", true, OptionId::StatsInterval},
                {nullptr, "--config", true, OptionId::Config},
                {nullptr, "--generate-config", false, OptionId::GenerateConfig},
                {"-h", "--help", false, OptionId::Help},
                {"-V", "--version", false, OptionId::Version},
            };

            const OptionSpec *findOption(const std::string &name)
            {
                for (const auto &spec : OPTIONS)
                {
                    if ((spec.short_name && name == spec.short_name) || name == spec.long_name)
                    {
                        return &spec;
                    }
                }
                return nullptr;
            }
        } // namespace

        // ==================== Parsing ====================

        bool CliParser::parseCommandLine(int argc, char *argv[], CliOptions &options, std::string &error)
        {
            std::vector<std::string> args;
            for (int i = 1; i < argc; ++i)
            {
                args.push_back(argv[i]);
            }
            return parseArguments(args, options, error);
        }

        bool CliParser::parseArguments(const std::vector<std::string> &args, CliOptions &options, std::string &error)
        {
            options = CliOptions();

            for (size_t i = 0; i < args.size(); ++i)
            {
                std::string token = args[i];
                std::optional<std::string> inline_value;

                // --name=value
                if (token.rfind("--", 0) == 0)
                {
                    size_t eq = token.find('=');
                    if (eq != std::string::npos)
                    {
                        inline_value = token.substr(eq + 1);
                        token = token.substr(0, eq);
                    }
                }

                const OptionSpec *spec = findOption(token);
                if (!spec)
                {
                    if (!token.empty() && token[0] == '-')
                        error = "Unknown option: " + token;
                    else
                        error = "Unexpected argument: " + token;
                    return false;
                }

                std::string value;
                if (spec->takes_value)
                {
                    if (inline_value)
                    {
                        value = *inline_value;
                    }
                    else if (i + 1 < args.size())
                    {
                        value = args[++i];
                    }
                    else
                    {
                        error = "Option " + token + " requires a value";
                        return false;
                    }
                }
                else if (inline_value)
                {
                    error = "Option " + token + " does not take a value";
                    return false;
                }

                uint64_t number = 0;
                switch (spec->id)
                {
                case OptionId::Interface:
                    options.interface = value;
                    break;
                case OptionId::Read:
                    options.read_file = value;
                    break;
                case OptionId::Protocol:
                    options.protocol = value;
                    break;
                case OptionId::Port:
                    if (!parseUnsigned(value, std::numeric_limits<uint16_t>::max(), number))
                    {
                        error = "Invalid port number: " + value;
                        return false;
                    }
                    options.port = static_cast<uint16_t>(number);
                    break;
                case OptionId::Count:
                    if (!parseUnsigned(value, std::numeric_limits<uint64_t>::max(), number))
                    {
                        error = "Invalid packet count: " + value;
                        return false;
                    }
                    options.count = number;
                    break;
                case OptionId::ListInterfaces:
                    options.list_interfaces = true;
                    break;
                case OptionId::Dashboard:
                    options.dashboard = true;
                    break;
                case OptionId::ExportJson:
                    options.export_json = value;
                    break;
                case OptionId::ExportCsv:
                    options.export_csv = value;
                    break;
                case OptionId::Export:
                    options.export_default = value;
                    break;
                case OptionId::Verbose:
                    options.verbose = true;
                    break;
                case OptionId::StatsInterval:
                    if (!parseUnsigned(value, std::numeric_limits<uint32_t>::max(), number))
                    {
                        error = "Invalid stats interval: " + value;
                        return false;
                    }
                    options.stats_interval = number;
                    break;
                case OptionId::Config:
                    options.config_path = value;
                    break;
                case OptionId::GenerateConfig:
                    options.generate_config = true;
                    break;
                case OptionId::Help:
                    options.show_help = true;
                    break;
                case OptionId::Version:
                    options.show_version = true;
                    break;
                }
            }

            return true;
        }

        bool CliParser::parseUnsigned(const std::string &text, uint64_t max_value, uint64_t &value)
        {
            if (text.empty() || text.size() > 20)
            {
                return false;
            }

            uint64_t result = 0;
            for (char c : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                {
                    return false;
                }
                uint64_t digit = static_cast<uint64_t>(c - '0');
                if (result > (max_value - digit) / 10)
                {
                    return false;
                }
                result = result * 10 + digit;
            }

            value = result;
            return true;
        }

        // ==================== Help ====================

        void CliParser::printHelp(std::ostream &os)
        {
            os << PROGRAM_NAME << " " << PROGRAM_VERSION << "\n"
               << "Network packet sniffer with real-time telemetry dashboard\n\n"
               << "Usage: " << PROGRAM_NAME << " [OPTIONS]\n\n"
               << "Options:\n"
               << "  -i, --interface <name>      Network interface to sniff on\n"
               << "  -r, --read <file.pcap>      Read packets from a capture file\n"
               << "  -p, --protocol <proto>      Filter by protocol (tcp, udp, icmp, http, dns)\n"
               << "  -P, --port <n>              Filter by port number\n"
               << "  -c, --count <n>             Number of packets to capture (0 = unlimited) [default: 0]\n"
               << "  -l, --list-interfaces       Show available network interfaces\n"
               << "  -d, --dashboard             Enable interactive dashboard mode\n"
               << "      --export-json <path>    Export captured data to JSON file\n"
               << "      --export-csv <path>     Export captured data to CSV file\n"
               << "  -o, --export <path>         Export using export.default_format\n"
               << "                              (bare file names go under export.default_directory when set)\n"
               << "  -v, --verbose               Show detailed packet analysis\n"
               << "      --stats-interval <s>    Show statistics summary every N seconds [default: 10]\n"
               << "      --config <path>         Configuration file (default: ~/.config/packet_sniffer/config.json)\n"
               << "      --generate-config       Generate default configuration file and exit\n"
               << "  -h, --help                  Print help\n"
               << "  -V, --version               Print version\n\n"
               << "Examples:\n"
               << "  sudo " << PROGRAM_NAME << " --interface eth0 --dashboard\n"
               << "  sudo " << PROGRAM_NAME << " --interface wlan0 --protocol http --verbose\n"
               << "  " << PROGRAM_NAME << " --read capture.pcap --export-csv packets.csv\n";
        }

        void CliParser::printVersion(std::ostream &os)
        {
            os << PROGRAM_NAME << " " << PROGRAM_VERSION << "\n";
        }

    } // namespace CLI
} // namespace PacketSniffer
