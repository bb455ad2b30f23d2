// src/common/sniffer_error.cpp
#include "sniffer_error.hpp"

namespace PacketSniffer
{
    namespace Common
    {
        std::string SnifferError::describe() const
        {
            switch (code_)
            {
            case ErrorCode::InterfaceNotFound:
                return "Network interface '" + detail_ + "' not found. Use --list-interfaces to see available interfaces.";
            case ErrorCode::PermissionDenied:
                return "Permission denied. Please run with administrator/root privileges to capture packets.";
            case ErrorCode::NetworkError:
                return "Network error: " + detail_ + ". Check your network connection and interface status.";
            case ErrorCode::ConfigError:
                return "Configuration error: " + detail_ + ". Check your config.json file.";
            case ErrorCode::ExportError:
                return "Export error: " + detail_ + ". Check file permissions and disk space.";
            case ErrorCode::InvalidFilter:
                return "Invalid filter '" + detail_ + "'. Supported filters: tcp, udp, icmp, http, dns";
            case ErrorCode::IoError:
                return "I/O error: " + detail_ + ". Check file permissions and disk space.";
            }
            return detail_;
        }

        std::string SnifferError::suggestion() const
        {
            switch (code_)
            {
            case ErrorCode::PermissionDenied:
                return "Try running with 'sudo' or grant the binary CAP_NET_RAW\n"
                       "   Example: sudo ./packet_sniffer --interface eth0";
            case ErrorCode::InterfaceNotFound:
                return "Use '--list-interfaces' to see available network interfaces\n"
                       "   Example: ./packet_sniffer --list-interfaces";
            case ErrorCode::NetworkError:
                return "Check if the network interface is up and connected\n"
                       "   You can use 'ip addr' to check interface status";
            case ErrorCode::ConfigError:
                return "Delete config.json to regenerate default configuration";
            case ErrorCode::ExportError:
                return "Ensure you have write permissions and sufficient disk space";
            case ErrorCode::InvalidFilter:
                return "Use one of these protocol filters: tcp, udp, icmp, http, dns";
            case ErrorCode::IoError:
                return "Check file permissions and available disk space";
            }
            return "";
        }

        void SnifferError::report(std::ostream &os) const
        {
            os << "❌ Error: " << describe() << std::endl;
            os << "💡 Suggestion: " << suggestion() << std::endl;
        }

        std::string errorCodeToString(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::InterfaceNotFound:
                return "InterfaceNotFound";
            case ErrorCode::PermissionDenied:
                return "PermissionDenied";
            case ErrorCode::NetworkError:
                return "NetworkError";
            case ErrorCode::ConfigError:
                return "ConfigError";
            case ErrorCode::ExportError:
                return "ExportError";
            case ErrorCode::InvalidFilter:
                return "InvalidFilter";
            case ErrorCode::IoError:
                return "IoError";
            }
            return "Unknown";
        }

    } // namespace Common
} // namespace PacketSniffer
