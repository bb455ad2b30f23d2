// src/common/utils.hpp
#ifndef PACKET_SNIFFER_UTILS_HPP
#define PACKET_SNIFFER_UTILS_HPP

#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <atomic>
#include <functional>

namespace PacketSniffer
{
    namespace Common
    {
        /**
         * @brief Lớp tiện ích chung cho hệ thống
         */
        class Utils
        {
        public:
            // ==================== Time utilities ====================
            /**
             * @brief Lấy thời gian hiện tại tính bằng microseconds
             * @return Timestamp tính bằng microseconds từ epoch
             */
            static uint64_t getCurrentTimestampUs();

            /**
             * @brief Lấy thời gian monotonic (steady clock) tính bằng milliseconds
             */
            static uint64_t getMonotonicTimeMs();

            /**
             * @brief Chuyển đổi timestamp (microseconds, UTC) thành string
             * @param timestamp_us Timestamp tính bằng microseconds
             * @param format Định dạng strftime
             * @param fraction_digits Số chữ số phần thập phân của giây (0-6)
             * @return Chuỗi thời gian đã định dạng
             */
            static std::string formatUtc(uint64_t timestamp_us, const std::string &format,
                                         int fraction_digits = 0);

            /**
             * @brief Định dạng RFC 3339, VD: "2024-05-01T12:30:45.123456+00:00"
             */
            static std::string toRfc3339(uint64_t timestamp_us);

            // ==================== String utilities ====================
            /**
             * @brief Tách chuỗi thành vector bằng delimiter
             * @param str Chuỗi cần tách
             * @param delimiter Ký tự phân cách
             * @return Vector chứa các phần đã tách
             */
            static std::vector<std::string> split(const std::string &str, char delimiter);

            /**
             * @brief Cắt bỏ khoảng trắng ở đầu/cuối chuỗi
             */
            static std::string trim(const std::string &str);

            /**
             * @brief Chuyển chuỗi sang chữ thường
             */
            static std::string toLowerCase(const std::string &str);

            /**
             * @brief Kiểm tra chuỗi có bắt đầu bằng prefix không
             */
            static bool startsWith(const std::string &str, const std::string &prefix);

            /**
             * @brief Ghép vector string thành chuỗi với delimiter
             */
            static std::string join(const std::vector<std::string> &strings, const std::string &delimiter);

            /**
             * @brief Lặp lại chuỗi n lần (dùng cho thanh biểu đồ)
             */
            static std::string repeat(const std::string &str, size_t count);

            // ==================== File utilities ====================
            static bool fileExists(const std::string &filepath);
            static bool directoryExists(const std::string &dirpath);

            /**
             * @brief Tạo thư mục (bao gồm thư mục cha)
             * @return true nếu thư mục tồn tại sau khi gọi
             */
            static bool createDirectory(const std::string &dirpath);

            static std::string getDirectoryName(const std::string &filepath);

            /**
             * @brief Đọc toàn bộ file thành string
             * @return Nội dung file (rỗng nếu lỗi)
             */
            static std::string readFileToString(const std::string &filepath);

            /**
             * @brief Ghi string ra file
             * @return true nếu thành công
             */
            static bool writeStringToFile(const std::string &filepath, const std::string &content, bool append = false);

            /**
             * @brief Lấy thư mục home của user hiện tại
             */
            static std::string getHomeDirectory();

            // ==================== Formatting ====================
            /**
             * @brief Định dạng kích thước bytes thành string dễ đọc
             * @param bytes Số bytes
             * @param precision Số chữ số thập phân
             * @return Chuỗi định dạng (VD: "1.5 MB")
             */
            static std::string formatBytes(size_t bytes, int precision = 2);

        private:
            Utils() = default;
            ~Utils() = default;
            Utils(const Utils &) = delete;
            Utils &operator=(const Utils &) = delete;
        };

        /**
         * @brief Thread-safe Singleton template
         */
        template <typename T>
        class Singleton
        {
        public:
            /**
             * @brief Lấy instance duy nhất
             * @return Reference tới instance
             */
            static T &getInstance()
            {
                static T instance;
                return instance;
            }

        protected:
            Singleton() = default;
            virtual ~Singleton() = default;

        public:
            Singleton(const Singleton &) = delete;
            Singleton &operator=(const Singleton &) = delete;
            Singleton(Singleton &&) = delete;
            Singleton &operator=(Singleton &&) = delete;
        };

    } // namespace Common
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_UTILS_HPP
