// src/common/sniffer_error.hpp
#ifndef PACKET_SNIFFER_SNIFFER_ERROR_HPP
#define PACKET_SNIFFER_SNIFFER_ERROR_HPP

#include <string>
#include <ostream>

namespace PacketSniffer
{
    namespace Common
    {
        /**
         * @brief Phân loại lỗi hiển thị cho người dùng
         */
        enum class ErrorCode
        {
            InterfaceNotFound,
            PermissionDenied,
            NetworkError,
            ConfigError,
            ExportError,
            InvalidFilter,
            IoError
        };

        /**
         * @brief Lỗi cấp ứng dụng: mã lỗi + chi tiết
         */
        class SnifferError
        {
        public:
            SnifferError(ErrorCode code, const std::string &detail = "")
                : code_(code), detail_(detail) {}

            ErrorCode code() const { return code_; }
            const std::string &detail() const { return detail_; }

            /**
             * @brief Thông báo lỗi đầy đủ cho người dùng
             */
            std::string describe() const;

            /**
             * @brief Gợi ý cách khắc phục (có thể nhiều dòng)
             */
            std::string suggestion() const;

            /**
             * @brief In lỗi + gợi ý ra stream (mặc định stderr)
             */
            void report(std::ostream &os) const;

        private:
            ErrorCode code_;
            std::string detail_;
        };

        std::string errorCodeToString(ErrorCode code);

    } // namespace Common
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_SNIFFER_ERROR_HPP
