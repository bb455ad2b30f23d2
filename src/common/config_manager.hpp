// src/common/config_manager.hpp
#ifndef PACKET_SNIFFER_CONFIG_MANAGER_HPP
#define PACKET_SNIFFER_CONFIG_MANAGER_HPP

#include "utils.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <any>
#include <shared_mutex>

namespace PacketSniffer
{
    namespace Common
    {
        /**
         * @brief Enum cho các loại cấu hình
         */
        enum class ConfigType
        {
            STRING,
            INTEGER,
            DOUBLE,
            BOOLEAN
        };

        /**
         * @brief Struct chứa thông tin một config entry
         */
        struct ConfigEntry
        {
            std::any value;
            ConfigType type;
            std::string description;

            ConfigEntry() : type(ConfigType::STRING) {}

            ConfigEntry(const std::any &val, ConfigType t, const std::string &desc = "")
                : value(val), type(t), description(desc) {}
        };

        /**
         * @brief Thread-safe Configuration Manager
         *
         * Key dạng "section.name"; file JSON lưu dạng object lồng nhau
         * ({"logging": {"level": "info"}}) và được làm phẳng khi load.
         */
        class ConfigManager : public Singleton<ConfigManager>
        {
            friend class Singleton<ConfigManager>;

        public:
            /**
             * @brief Load cấu hình từ file
             * @param config_file Đường dẫn file cấu hình
             * @return true nếu load thành công
             */
            bool loadFromFile(const std::string &config_file);

            /**
             * @brief Save cấu hình ra file (tự tạo thư mục cha)
             * @param config_file Đường dẫn file cấu hình
             * @return true nếu save thành công
             */
            bool saveToFile(const std::string &config_file) const;

            /**
             * @brief Load file nếu tồn tại, nếu không thì ghi cấu hình mặc định ra file đó
             * @return true nếu cấu hình sẵn sàng sử dụng
             */
            bool loadOrCreate(const std::string &config_file);

            /**
             * @brief Load cấu hình từ JSON string
             */
            bool loadFromJson(const std::string &json_content);

            /**
             * @brief Export cấu hình thành JSON string (object lồng nhau, indent 2)
             */
            std::string exportToJson() const;

            /**
             * @brief Đường dẫn file cấu hình mặc định (~/.config/packet_sniffer/config.json)
             */
            static std::string defaultConfigPath();

            // ==================== Set methods ====================
            bool setString(const std::string &key, const std::string &value, const std::string &description = "");
            bool setInt(const std::string &key, int value, const std::string &description = "");
            bool setDouble(const std::string &key, double value, const std::string &description = "");
            bool setBool(const std::string &key, bool value, const std::string &description = "");

            // ==================== Get methods ====================
            std::string getString(const std::string &key, const std::string &default_value = "") const;
            int getInt(const std::string &key, int default_value = 0) const;
            double getDouble(const std::string &key, double default_value = 0.0) const;
            bool getBool(const std::string &key, bool default_value = false) const;

            // ==================== Utility methods ====================
            bool hasKey(const std::string &key) const;
            std::vector<std::string> getAllKeys() const;
            std::string getDescription(const std::string &key) const;
            size_t size() const;

            /**
             * @brief Xóa toàn bộ và nạp lại giá trị mặc định
             */
            void resetToDefaults();

        protected:
            ConfigManager();
            virtual ~ConfigManager() = default;

        private:
            void initializeDefaults();
            bool setValue(const std::string &key, const std::any &value, ConfigType type, const std::string &description);
            bool isValidKey(const std::string &key) const;

            mutable std::shared_mutex config_mutex_;
            std::unordered_map<std::string, ConfigEntry> config_map_;
        };

        // ==================== Predefined config keys ====================
        namespace ConfigKeys
        {
            // Logging
            constexpr const char *LOGGING_LEVEL = "logging.level";
            constexpr const char *LOGGING_FILE = "logging.file";
            constexpr const char *LOGGING_ENABLE_CONSOLE = "logging.enable_console";
            constexpr const char *LOGGING_ENABLE_FILE = "logging.enable_file";

            // Performance
            constexpr const char *PERF_BUFFER_SIZE = "performance.buffer_size";
            constexpr const char *PERF_MAX_PACKETS_PER_SECOND = "performance.max_packets_per_second";
            constexpr const char *PERF_DASHBOARD_REFRESH_RATE = "performance.dashboard_refresh_rate";

            // Export
            constexpr const char *EXPORT_DEFAULT_FORMAT = "export.default_format";
            constexpr const char *EXPORT_DEFAULT_DIRECTORY = "export.default_directory";
            constexpr const char *EXPORT_AUTO_BACKUP = "export.auto_backup";

            // UI
            constexpr const char *UI_COLORS_ENABLED = "ui.colors_enabled";
            constexpr const char *UI_EMOJIS_ENABLED = "ui.emojis_enabled";
            constexpr const char *UI_TABLE_STYLE = "ui.table_style";

            // Telemetry capacities
            constexpr const char *TELEMETRY_PACKET_SIZE_HISTORY = "telemetry.packet_size_history";
            constexpr const char *TELEMETRY_BANDWIDTH_HISTORY = "telemetry.bandwidth_history";
            constexpr const char *TELEMETRY_THREAT_ALERT_HISTORY = "telemetry.threat_alert_history";
            constexpr const char *TELEMETRY_RECENT_RECORDS = "telemetry.recent_records";
        }

    } // namespace Common
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_CONFIG_MANAGER_HPP
