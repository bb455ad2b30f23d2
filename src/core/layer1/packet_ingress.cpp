// src/core/layer1/packet_ingress.cpp

#include "packet_ingress.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>
#include <cerrno>

namespace PacketSniffer
{
    namespace Layer1
    {
        // ==================== PacketIngress Implementation ====================

        PacketIngress::PacketIngress(const IngressConfig &config)
            : config_(config),
              pcap_handle_(nullptr),
              running_(false),
              initialized_(false),
              callback_(nullptr),
              packets_received_(0),
              bytes_received_(0),
              errors_(0)
        {
            spdlog::debug("PacketIngress created for {}", getSourceName());
        }

        PacketIngress::~PacketIngress()
        {
            stop();
            closeHandle();
        }

        std::string PacketIngress::getSourceName() const
        {
            return config_.isOffline() ? config_.offline_file : config_.interface;
        }

        void PacketIngress::setError(Common::ErrorCode code, const std::string &detail)
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            last_error_ = Common::SnifferError(code, detail);
        }

        std::optional<Common::SnifferError> PacketIngress::getLastError() const
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            return last_error_;
        }

        void PacketIngress::closeHandle()
        {
            if (pcap_handle_)
            {
                pcap_close(pcap_handle_);
                pcap_handle_ = nullptr;
            }
        }

        bool PacketIngress::initialize()
        {
            if (initialized_.load())
            {
                spdlog::warn("PacketIngress already initialized for {}", getSourceName());
                return true;
            }

            bool opened = config_.isOffline() ? openOffline() : openLive();
            if (!opened)
            {
                return false;
            }

            int datalink = pcap_datalink(pcap_handle_);
            const char *datalink_name = pcap_datalink_val_to_name(datalink);
            spdlog::debug("Datalink type: {}", datalink_name ? datalink_name : "unknown");
            if (datalink != DLT_EN10MB)
            {
                spdlog::warn("{} is not an Ethernet source, frames may not decode", getSourceName());
            }

            initialized_.store(true);
            return true;
        }

        bool PacketIngress::openOffline()
        {
            char errbuf[PCAP_ERRBUF_SIZE];
            pcap_handle_ = pcap_open_offline(config_.offline_file.c_str(), errbuf);
            if (!pcap_handle_)
            {
                spdlog::error("Failed to open capture file {}: {}", config_.offline_file, errbuf);
                setError(Common::ErrorCode::IoError, std::string(errbuf));
                return false;
            }

            spdlog::info("Opened capture file: {}", config_.offline_file);
            return true;
        }

        bool PacketIngress::openLive()
        {
            if (!isInterfaceValid(config_.interface))
            {
                spdlog::error("Interface {} does not exist or is not available", config_.interface);
                setError(Common::ErrorCode::InterfaceNotFound, config_.interface);
                return false;
            }

            // Tạo PCAP handle (KHÔNG dùng pcap_open_live)
            char errbuf[PCAP_ERRBUF_SIZE];
            pcap_handle_ = pcap_create(config_.interface.c_str(), errbuf);
            if (!pcap_handle_)
            {
                spdlog::error("Failed to create pcap handle for {}: {}", config_.interface, errbuf);
                setError(Common::ErrorCode::NetworkError, std::string(errbuf));
                return false;
            }

            // Các option phải set trước khi activate
            if (pcap_set_snaplen(pcap_handle_, config_.snaplen) != 0)
            {
                spdlog::warn("Failed to set snaplen: {}", pcap_geterr(pcap_handle_));
            }

            if (pcap_set_promisc(pcap_handle_, config_.promiscuous ? 1 : 0) != 0)
            {
                spdlog::warn("Failed to set promiscuous mode: {}", pcap_geterr(pcap_handle_));
            }

            if (pcap_set_timeout(pcap_handle_, config_.timeout_ms) != 0)
            {
                spdlog::warn("Failed to set timeout: {}", pcap_geterr(pcap_handle_));
            }

            if (pcap_set_buffer_size(pcap_handle_, config_.buffer_size) != 0)
            {
                spdlog::warn("Failed to set buffer size: {}", pcap_geterr(pcap_handle_));
            }

            if (pcap_set_immediate_mode(pcap_handle_, 1) != 0)
            {
                spdlog::debug("Failed to set immediate mode: {}", pcap_geterr(pcap_handle_));
            }

            int activate_result = pcap_activate(pcap_handle_);
            if (activate_result > 0)
            {
                if (activate_result == PCAP_WARNING_PROMISC_NOTSUP)
                {
                    spdlog::warn("Promiscuous mode not supported on {}", config_.interface);
                }
                else
                {
                    spdlog::warn("Activation warning: {}", pcap_geterr(pcap_handle_));
                }
            }
            else if (activate_result < 0)
            {
                if (activate_result == PCAP_ERROR_PERM_DENIED)
                {
                    spdlog::error("Permission denied opening {}", config_.interface);
                    setError(Common::ErrorCode::PermissionDenied, config_.interface);
                }
                else if (activate_result == PCAP_ERROR_NO_SUCH_DEVICE)
                {
                    spdlog::error("No such device: {}", config_.interface);
                    setError(Common::ErrorCode::InterfaceNotFound, config_.interface);
                }
                else
                {
                    std::string message = pcap_geterr(pcap_handle_);
                    spdlog::error("Failed to activate {}: {}", config_.interface, message);
                    setError(Common::ErrorCode::NetworkError, message);
                }
                closeHandle();
                return false;
            }

            spdlog::info("Successfully opened interface: {}", config_.interface);
            return true;
        }

        bool PacketIngress::start(FrameCallback callback)
        {
            if (!initialized_.load())
            {
                spdlog::error("PacketIngress not initialized. Call initialize() first");
                return false;
            }

            if (running_.load())
            {
                spdlog::warn("PacketIngress already running for {}", getSourceName());
                return false;
            }

            if (!callback)
            {
                spdlog::error("Callback function is null");
                return false;
            }

            callback_ = callback;
            running_.store(true);

            spdlog::info("Starting packet capture on interface: {}", getSourceName());

            capture_thread_ = std::make_unique<std::thread>(&PacketIngress::captureLoop, this);
            return true;
        }

        void PacketIngress::requestStop()
        {
            running_.store(false);
            if (pcap_handle_)
            {
                pcap_breakloop(pcap_handle_);
            }
        }

        void PacketIngress::stop()
        {
            requestStop();
            waitForCompletion();
        }

        void PacketIngress::waitForCompletion()
        {
            if (capture_thread_ && capture_thread_->joinable())
            {
                capture_thread_->join();
            }
        }

        void PacketIngress::captureLoop()
        {
            spdlog::debug("Capture loop started for {}", getSourceName());

            int result = pcap_loop(pcap_handle_, -1, pcapCallback, reinterpret_cast<u_char *>(this));

            if (result == PCAP_ERROR)
            {
                std::string err = pcap_geterr(pcap_handle_);
                spdlog::error("Failed to read packet: {}", err);
                setError(Common::ErrorCode::NetworkError, err);
                errors_.fetch_add(1);
            }
            else if (result == PCAP_ERROR_BREAK)
            {
                spdlog::debug("pcap_loop stopped by breakloop");
            }
            else
            {
                spdlog::info("End of capture source reached: {}", getSourceName());
            }

            running_.store(false);
            spdlog::debug("Capture loop ended for {}", getSourceName());
        }

        void PacketIngress::pcapCallback(u_char *user, const struct pcap_pkthdr *header,
                                         const u_char *packet)
        {
            PacketIngress *self = reinterpret_cast<PacketIngress *>(user);
            self->processPacket(header, packet);
        }

        void PacketIngress::processPacket(const struct pcap_pkthdr *header, const u_char *packet)
        {
            if (!running_.load())
            {
                return;
            }

            packets_received_.fetch_add(1);
            bytes_received_.fetch_add(header->caplen);

            RawFrame frame;
            frame.data = packet;
            frame.captured_length = header->caplen;
            frame.original_length = header->len;
            frame.timestamp_us = header->ts.tv_sec * 1000000ULL + header->ts.tv_usec;

            try
            {
                callback_(frame);
            }
            catch (const std::exception &e)
            {
                errors_.fetch_add(1);
                spdlog::error("Exception in packet callback: {}", e.what());
            }
        }

        IngressStats PacketIngress::getStats() const
        {
            IngressStats stats;

            stats.packets_received = packets_received_.load();
            stats.bytes_received = bytes_received_.load();
            stats.errors = errors_.load();

            // Lấy dropped packets từ pcap (chỉ có với live capture)
            if (pcap_handle_ && !config_.isOffline())
            {
                struct pcap_stat pstats;
                if (pcap_stats(pcap_handle_, &pstats) == 0)
                {
                    stats.packets_dropped = pstats.ps_drop;
                }
            }

            return stats;
        }

        // ==================== Static Utility Methods ====================

        bool PacketIngress::isInterfaceValid(const std::string &interface)
        {
            auto interfaces = listInterfaces();
            if (!interfaces)
            {
                return false;
            }

            for (const auto &info : *interfaces)
            {
                if (info.name == interface)
                {
                    return true;
                }
            }
            return false;
        }

        std::optional<std::vector<InterfaceInfo>> PacketIngress::listInterfaces()
        {
            pcap_if_t *alldevs;
            char errbuf[PCAP_ERRBUF_SIZE];

            if (pcap_findalldevs(&alldevs, errbuf) == -1)
            {
                spdlog::error("pcap_findalldevs failed: {}", errbuf);
                return std::nullopt;
            }

            std::vector<InterfaceInfo> interfaces;
            for (pcap_if_t *dev = alldevs; dev != nullptr; dev = dev->next)
            {
                InterfaceInfo info;
                info.name = dev->name;
                info.description = dev->description ? dev->description : "";
                info.is_loopback = (dev->flags & PCAP_IF_LOOPBACK) != 0;
                info.is_up = (dev->flags & PCAP_IF_UP) != 0;

                for (pcap_addr_t *a = dev->addresses; a != nullptr; a = a->next)
                {
                    if (!a->addr)
                        continue;

                    if (a->addr->sa_family == AF_INET)
                    {
                        char ip[INET_ADDRSTRLEN];
                        inet_ntop(AF_INET, &reinterpret_cast<struct sockaddr_in *>(a->addr)->sin_addr,
                                  ip, sizeof(ip));
                        info.addresses.push_back(ip);
                    }
                    else if (a->addr->sa_family == AF_INET6)
                    {
                        char ip[INET6_ADDRSTRLEN];
                        inet_ntop(AF_INET6, &reinterpret_cast<struct sockaddr_in6 *>(a->addr)->sin6_addr,
                                  ip, sizeof(ip));
                        info.addresses.push_back(ip);
                    }
                }

                interfaces.push_back(info);
            }

            pcap_freealldevs(alldevs);
            return interfaces;
        }

    } // namespace Layer1
} // namespace PacketSniffer
