// src/core/storage/export_serializer.cpp
#include "export_serializer.hpp"
#include "../../common/utils.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <cstdio>
#include <cerrno>
#include <cstring>

namespace PacketSniffer
{
    namespace Core
    {
        namespace Storage
        {
            using Common::PacketRecord;
            using Common::Utils;
            using ordered_json = nlohmann::ordered_json;

            namespace
            {
                template <typename T>
                ordered_json optionalToJson(const std::optional<T> &value)
                {
                    return value ? ordered_json(*value) : ordered_json(nullptr);
                }

                std::string optionalPort(const std::optional<uint16_t> &port)
                {
                    return port ? std::to_string(*port) : "";
                }

                ordered_json recordToJson(const PacketRecord &record)
                {
                    ordered_json j;
                    j["timestamp"] = Utils::toRfc3339(record.timestamp_us);
                    j["packet_number"] = record.packet_number;
                    j["src_mac"] = record.src_mac;
                    j["dst_mac"] = record.dst_mac;
                    j["src_ip"] = optionalToJson(record.src_ip);
                    j["dst_ip"] = optionalToJson(record.dst_ip);
                    j["ip_version"] = record.ip_version;
                    j["protocol"] = record.protocol;
                    j["src_port"] = optionalToJson(record.src_port);
                    j["dst_port"] = optionalToJson(record.dst_port);
                    j["packet_size"] = record.packet_size;
                    j["flags"] = optionalToJson(record.flags);
                    j["payload_size"] = record.payload_size;
                    j["application_protocol"] = optionalToJson(record.application_protocol);
                    j["description"] = record.description;
                    j["threat_level"] = Common::threatLevelToString(record.threat_level);

                    if (record.geo_info)
                    {
                        ordered_json geo;
                        geo["country"] = record.geo_info->country;
                        geo["city"] = record.geo_info->city;
                        geo["latitude"] = optionalToJson(record.geo_info->latitude);
                        geo["longitude"] = optionalToJson(record.geo_info->longitude);
                        j["geo_info"] = geo;
                    }
                    else
                    {
                        j["geo_info"] = nullptr;
                    }
                    return j;
                }
            } // namespace

            const std::vector<std::string> &ExportSerializer::csvColumns()
            {
                static const std::vector<std::string> columns = {
                    "timestamp", "packet_number", "src_ip", "dst_ip", "protocol",
                    "src_port", "dst_port", "packet_size", "flags",
                    "application_protocol", "description"};
                return columns;
            }

            // ==================== JSON ====================

            std::string ExportSerializer::toJson(const std::vector<PacketRecord> &records)
            {
                ordered_json array = ordered_json::array();
                for (const auto &record : records)
                {
                    array.push_back(recordToJson(record));
                }
                // Không throw khi gặp UTF-8 lỗi trong description
                return array.dump(2, ' ', false, ordered_json::error_handler_t::replace);
            }

            // ==================== CSV ====================

            std::string ExportSerializer::escapeCsvField(const std::string &field)
            {
                if (field.find_first_of(",\"\r\n") == std::string::npos)
                {
                    return field;
                }

                std::string escaped = "\"";
                for (char c : field)
                {
                    if (c == '"')
                        escaped += "\"\"";
                    else
                        escaped += c;
                }
                escaped += "\"";
                return escaped;
            }

            std::string ExportSerializer::toCsv(const std::vector<PacketRecord> &records)
            {
                std::ostringstream out;
                out << Utils::join(csvColumns(), ",") << "\n";

                for (const auto &record : records)
                {
                    std::vector<std::string> fields = {
                        Utils::toRfc3339(record.timestamp_us),
                        std::to_string(record.packet_number),
                        record.src_ip.value_or(""),
                        record.dst_ip.value_or(""),
                        record.protocol,
                        optionalPort(record.src_port),
                        optionalPort(record.dst_port),
                        std::to_string(record.packet_size),
                        record.flags.value_or(""),
                        record.application_protocol.value_or(""),
                        record.description};

                    for (size_t i = 0; i < fields.size(); ++i)
                    {
                        if (i > 0)
                            out << ',';
                        out << escapeCsvField(fields[i]);
                    }
                    out << "\n";
                }
                return out.str();
            }

            std::optional<std::vector<std::vector<std::string>>> ExportSerializer::parseCsv(const std::string &text)
            {
                std::vector<std::vector<std::string>> rows;
                std::vector<std::string> row;
                std::string field;
                bool in_quotes = false;
                bool row_has_data = false;

                for (size_t i = 0; i < text.size(); ++i)
                {
                    char c = text[i];

                    if (in_quotes)
                    {
                        if (c == '"')
                        {
                            if (i + 1 < text.size() && text[i + 1] == '"')
                            {
                                field += '"';
                                ++i;
                            }
                            else
                            {
                                in_quotes = false;
                            }
                        }
                        else
                        {
                            field += c;
                        }
                        continue;
                    }

                    switch (c)
                    {
                    case '"':
                        in_quotes = true;
                        row_has_data = true;
                        break;
                    case ',':
                        row.push_back(field);
                        field.clear();
                        row_has_data = true;
                        break;
                    case '\r':
                        break;
                    case '\n':
                        row.push_back(field);
                        rows.push_back(row);
                        row.clear();
                        field.clear();
                        row_has_data = false;
                        break;
                    default:
                        field += c;
                        row_has_data = true;
                        break;
                    }
                }

                if (in_quotes)
                {
                    return std::nullopt;
                }

                // Dòng cuối không có newline
                if (row_has_data)
                {
                    row.push_back(field);
                    rows.push_back(row);
                }
                return rows;
            }

            // ==================== File output ====================

            bool ExportSerializer::writeJsonFile(const std::vector<PacketRecord> &records,
                                                 const std::string &path,
                                                 const ExportOptions &options)
            {
                return writeFile(toJson(records), records.size(), path, "JSON", options);
            }

            bool ExportSerializer::writeCsvFile(const std::vector<PacketRecord> &records,
                                                const std::string &path,
                                                const ExportOptions &options)
            {
                return writeFile(toCsv(records), records.size(), path, "CSV", options);
            }

            bool ExportSerializer::writeFile(const std::string &content, size_t record_count,
                                             const std::string &path, const std::string &format,
                                             const ExportOptions &options)
            {
                std::string dir = Utils::getDirectoryName(path);
                if (!Utils::createDirectory(dir))
                {
                    spdlog::error("Failed to export {} packets to {}: cannot create directory {}",
                                  record_count, path, dir);
                    return false;
                }

                if (options.backup_existing && Utils::fileExists(path))
                {
                    std::string backup = path + ".bak";
                    if (std::rename(path.c_str(), backup.c_str()) != 0)
                    {
                        spdlog::warn("Cannot back up {} to {}: {}", path, backup, std::strerror(errno));
                    }
                    else
                    {
                        spdlog::debug("Backed up existing export to {}", backup);
                    }
                }

                if (!Utils::writeStringToFile(path, content))
                {
                    spdlog::error("Failed to export {} packets to {} file: {}", record_count, format, path);
                    return false;
                }

                spdlog::info("Exported {} packets to {} file: {}", record_count, format, path);
                return true;
            }

        } // namespace Storage
    }     // namespace Core
} // namespace PacketSniffer
