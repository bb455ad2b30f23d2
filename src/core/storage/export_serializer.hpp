// src/core/storage/export_serializer.hpp
#ifndef PACKET_SNIFFER_EXPORT_SERIALIZER_HPP
#define PACKET_SNIFFER_EXPORT_SERIALIZER_HPP

#include "../../common/packet_record.hpp"
#include <string>
#include <vector>
#include <optional>

namespace PacketSniffer
{
    namespace Core
    {
        namespace Storage
        {
            /**
             * @brief Tùy chọn khi ghi file export
             */
            struct ExportOptions
            {
                bool backup_existing = false;       // đổi tên file cũ thành <path>.bak
            };

            /**
             * @brief Xuất danh sách PacketRecord ra JSON / CSV
             */
            class ExportSerializer
            {
            public:
                /**
                 * @brief Cột CSV theo đúng thứ tự xuất
                 */
                static const std::vector<std::string> &csvColumns();

                /**
                 * @brief JSON array (indent 2), optional trống là null,
                 *        threat_level là tên, timestamp là RFC 3339 UTC
                 */
                static std::string toJson(const std::vector<Common::PacketRecord> &records);

                /**
                 * @brief CSV có header, field trống cho optional không có, quote theo RFC 4180
                 */
                static std::string toCsv(const std::vector<Common::PacketRecord> &records);

                /**
                 * @brief Ghi file JSON (tự tạo thư mục cha)
                 * @return false nếu lỗi, lỗi đã được log kèm số record và đường dẫn
                 */
                static bool writeJsonFile(const std::vector<Common::PacketRecord> &records,
                                          const std::string &path,
                                          const ExportOptions &options = ExportOptions());

                static bool writeCsvFile(const std::vector<Common::PacketRecord> &records,
                                         const std::string &path,
                                         const ExportOptions &options = ExportOptions());

                /**
                 * @brief Đọc CSV (RFC 4180) thành các dòng
                 * @return std::nullopt nếu có quote không đóng
                 */
                static std::optional<std::vector<std::vector<std::string>>> parseCsv(const std::string &text);

                /**
                 * @brief Quote field nếu chứa dấu phẩy, dấu nháy kép hoặc xuống dòng
                 */
                static std::string escapeCsvField(const std::string &field);

            private:
                ExportSerializer() = default;

                static bool writeFile(const std::string &content, size_t record_count,
                                      const std::string &path, const std::string &format,
                                      const ExportOptions &options);
            };

        } // namespace Storage
    }     // namespace Core
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_EXPORT_SERIALIZER_HPP
