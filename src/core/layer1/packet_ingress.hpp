// src/core/layer1/packet_ingress.hpp
#ifndef PACKET_SNIFFER_PACKET_INGRESS_HPP
#define PACKET_SNIFFER_PACKET_INGRESS_HPP

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <functional>
#include <thread>
#include <mutex>
#include <optional>
#include <pcap.h>
#include "../../common/sniffer_error.hpp"

namespace PacketSniffer
{
    namespace Layer1
    {
        /**
         * @brief Cấu trúc cấu hình cho Packet Ingress
         */
        struct IngressConfig
        {
            std::string interface;      // Tên interface (eth0, wlan0, ...)
            std::string offline_file;   // File .pcap (nếu có thì bỏ qua interface)
            int snaplen;                // Snapshot length (bytes to capture)
            int buffer_size;            // Kernel buffer size (bytes)
            int timeout_ms;             // Read timeout (milliseconds)
            bool promiscuous;           // Promiscuous mode

            // Default values
            IngressConfig()
                : snaplen(65535),
                  buffer_size(16 * 1024 * 1024),
                  timeout_ms(100),
                  promiscuous(true) {}

            bool isOffline() const { return !offline_file.empty(); }
        };

        /**
         * @brief Một frame thô nhận từ libpcap
         */
        struct RawFrame
        {
            const uint8_t *data;        // Chỉ hợp lệ trong callback
            size_t captured_length;     // caplen
            size_t original_length;     // len trên dây
            uint64_t timestamp_us;
        };

        /**
         * @brief Statistics của Packet Ingress
         */
        struct IngressStats
        {
            uint64_t packets_received;   // Tổng số gói nhận được
            uint64_t packets_dropped;    // Gói bị drop bởi kernel
            uint64_t bytes_received;     // Tổng bytes nhận được
            uint64_t errors;             // Số lỗi

            IngressStats()
                : packets_received(0), packets_dropped(0),
                  bytes_received(0), errors(0) {}
        };

        /**
         * @brief Thông tin một interface (dùng cho --list-interfaces)
         */
        struct InterfaceInfo
        {
            std::string name;
            std::string description;
            std::vector<std::string> addresses;
            bool is_loopback;
            bool is_up;
        };

        /**
         * @brief Callback function type cho packet processing
         */
        using FrameCallback = std::function<void(const RawFrame &)>;

        /**
         * @class PacketIngress
         * @brief Nguồn packet từ libpcap (interface live hoặc file .pcap)
         */
        class PacketIngress
        {
        public:
            explicit PacketIngress(const IngressConfig &config);
            ~PacketIngress();

            // Disable copy
            PacketIngress(const PacketIngress &) = delete;
            PacketIngress &operator=(const PacketIngress &) = delete;

            /**
             * @brief Mở interface hoặc file
             * @return true nếu thành công, nếu không xem getLastError()
             */
            bool initialize();

            /**
             * @brief Bắt đầu capture trên thread riêng
             * @param callback Function được gọi cho mỗi frame
             * @return true nếu thành công
             */
            bool start(FrameCallback callback);

            /**
             * @brief Yêu cầu dừng, an toàn khi gọi từ trong callback
             */
            void requestStop();

            /**
             * @brief Dừng capture và chờ thread kết thúc
             */
            void stop();

            /**
             * @brief Chờ capture kết thúc (hết file, lỗi hoặc stop)
             */
            void waitForCompletion();

            bool isRunning() const { return running_.load(); }

            /**
             * @brief Lỗi khởi tạo hoặc lỗi đọc gần nhất
             */
            std::optional<Common::SnifferError> getLastError() const;

            IngressStats getStats() const;

            /**
             * @brief Nguồn capture (tên interface hoặc đường dẫn file)
             */
            std::string getSourceName() const;

            /**
             * @brief Kiểm tra interface có tồn tại không
             */
            static bool isInterfaceValid(const std::string &interface);

            /**
             * @brief Liệt kê tất cả interfaces có sẵn
             * @return std::nullopt nếu pcap_findalldevs lỗi
             */
            static std::optional<std::vector<InterfaceInfo>> listInterfaces();

        private:
            bool openLive();
            bool openOffline();
            void closeHandle();
            void setError(Common::ErrorCode code, const std::string &detail);

            static void pcapCallback(u_char *user, const struct pcap_pkthdr *header,
                                     const u_char *packet);

            void processPacket(const struct pcap_pkthdr *header, const u_char *packet);

            void captureLoop();

        private:
            IngressConfig config_;
            pcap_t *pcap_handle_;
            std::atomic<bool> running_;
            std::atomic<bool> initialized_;
            FrameCallback callback_;
            std::unique_ptr<std::thread> capture_thread_;

            mutable std::mutex error_mutex_;
            std::optional<Common::SnifferError> last_error_;

            // Statistics
            std::atomic<uint64_t> packets_received_;
            std::atomic<uint64_t> bytes_received_;
            std::atomic<uint64_t> errors_;
        };

    } // namespace Layer1
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_PACKET_INGRESS_HPP
