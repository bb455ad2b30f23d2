// src/common/config_manager.cpp
#include "config_manager.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace PacketSniffer
{
    namespace Common
    {
        // ==================== Constructor ====================
        ConfigManager::ConfigManager()
        {
            initializeDefaults();
        }

        // ==================== Initialization ====================
        void ConfigManager::initializeDefaults()
        {
            // Logging
            setString(ConfigKeys::LOGGING_LEVEL, "info", "Log level (trace, debug, info, warn, error)");
            setString(ConfigKeys::LOGGING_FILE, "packet_sniffer.log", "Log file path");
            setBool(ConfigKeys::LOGGING_ENABLE_CONSOLE, true, "Enable console logging");
            setBool(ConfigKeys::LOGGING_ENABLE_FILE, true, "Enable file logging");

            // Performance
            setInt(ConfigKeys::PERF_BUFFER_SIZE, 4096, "Capture buffer size");
            setInt(ConfigKeys::PERF_MAX_PACKETS_PER_SECOND, 1000, "Maximum packets processed per second");
            setInt(ConfigKeys::PERF_DASHBOARD_REFRESH_RATE, 1000, "Dashboard refresh interval in milliseconds");

            // Export
            setString(ConfigKeys::EXPORT_DEFAULT_FORMAT, "json", "Default export format (json, csv)");
            setString(ConfigKeys::EXPORT_DEFAULT_DIRECTORY, "", "Directory prepended to bare export file names (empty = as given)");
            setBool(ConfigKeys::EXPORT_AUTO_BACKUP, true, "Keep backups of exported files");

            // UI
            setBool(ConfigKeys::UI_COLORS_ENABLED, true, "Enable ANSI colors");
            setBool(ConfigKeys::UI_EMOJIS_ENABLED, true, "Enable emoji icons");
            setString(ConfigKeys::UI_TABLE_STYLE, "modern", "Table style");

            // Telemetry
            setInt(ConfigKeys::TELEMETRY_PACKET_SIZE_HISTORY, 1000, "Packet sizes kept for the histogram");
            setInt(ConfigKeys::TELEMETRY_BANDWIDTH_HISTORY, 100, "Bandwidth samples kept");
            setInt(ConfigKeys::TELEMETRY_THREAT_ALERT_HISTORY, 100, "Threat alerts kept");
            setInt(ConfigKeys::TELEMETRY_RECENT_RECORDS, 1000, "Recent packet records kept");
        }

        void ConfigManager::resetToDefaults()
        {
            {
                std::unique_lock<std::shared_mutex> lock(config_mutex_);
                config_map_.clear();
            }
            initializeDefaults();
        }

        std::string ConfigManager::defaultConfigPath()
        {
            return Utils::getHomeDirectory() + "/.config/packet_sniffer/config.json";
        }

        // ==================== File I/O ====================
        bool ConfigManager::loadFromFile(const std::string &config_file)
        {
            try
            {
                std::ifstream file(config_file);
                if (!file.is_open())
                {
                    std::cerr << "Cannot open config file: " << config_file << std::endl;
                    return false;
                }

                std::stringstream buffer;
                buffer << file.rdbuf();
                file.close();

                return loadFromJson(buffer.str());
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error loading config file: " << e.what() << std::endl;
                return false;
            }
        }

        bool ConfigManager::saveToFile(const std::string &config_file) const
        {
            std::string dir = Utils::getDirectoryName(config_file);
            if (!Utils::createDirectory(dir))
            {
                std::cerr << "Cannot create config directory: " << dir << std::endl;
                return false;
            }

            if (!Utils::writeStringToFile(config_file, exportToJson() + "\n"))
            {
                std::cerr << "Cannot create config file: " << config_file << std::endl;
                return false;
            }
            return true;
        }

        bool ConfigManager::loadOrCreate(const std::string &config_file)
        {
            if (Utils::fileExists(config_file))
            {
                return loadFromFile(config_file);
            }
            return saveToFile(config_file);
        }

        // ==================== JSON Operations ====================
        namespace
        {
            void flattenJson(const json &node, const std::string &prefix, ConfigManager &config)
            {
                for (auto it = node.begin(); it != node.end(); ++it)
                {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
                    const json &value = it.value();

                    if (value.is_object())
                    {
                        flattenJson(value, key, config);
                    }
                    else if (value.is_string())
                    {
                        config.setString(key, value.get<std::string>());
                    }
                    else if (value.is_boolean())
                    {
                        config.setBool(key, value.get<bool>());
                    }
                    else if (value.is_number_integer())
                    {
                        config.setInt(key, value.get<int>());
                    }
                    else if (value.is_number_float())
                    {
                        config.setDouble(key, value.get<double>());
                    }
                    else
                    {
                        std::cerr << "Unsupported config value for key: " << key << std::endl;
                    }
                }
            }
        } // namespace

        bool ConfigManager::loadFromJson(const std::string &json_content)
        {
            try
            {
                json j = json::parse(json_content);
                if (!j.is_object())
                {
                    std::cerr << "Config root must be a JSON object" << std::endl;
                    return false;
                }

                // setXxx tự lock
                flattenJson(j, "", *this);
                return true;
            }
            catch (const json::parse_error &e)
            {
                std::cerr << "JSON parse error: " << e.what() << std::endl;
                return false;
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error loading JSON: " << e.what() << std::endl;
                return false;
            }
        }

        std::string ConfigManager::exportToJson() const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            json j = json::object();

            for (const auto &[key, entry] : config_map_)
            {
                try
                {
                    json::json_pointer ptr("/" + Utils::join(Utils::split(key, '.'), "/"));
                    switch (entry.type)
                    {
                    case ConfigType::STRING:
                        j[ptr] = std::any_cast<std::string>(entry.value);
                        break;
                    case ConfigType::INTEGER:
                        j[ptr] = std::any_cast<int>(entry.value);
                        break;
                    case ConfigType::DOUBLE:
                        j[ptr] = std::any_cast<double>(entry.value);
                        break;
                    case ConfigType::BOOLEAN:
                        j[ptr] = std::any_cast<bool>(entry.value);
                        break;
                    }
                }
                catch (const json::exception &e)
                {
                    std::cerr << "Cannot export config key: " << key << " - " << e.what() << std::endl;
                }
            }

            return j.dump(2);
        }

        // ==================== Set Methods ====================
        bool ConfigManager::setString(const std::string &key, const std::string &value, const std::string &description)
        {
            return setValue(key, value, ConfigType::STRING, description);
        }

        bool ConfigManager::setInt(const std::string &key, int value, const std::string &description)
        {
            return setValue(key, value, ConfigType::INTEGER, description);
        }

        bool ConfigManager::setDouble(const std::string &key, double value, const std::string &description)
        {
            return setValue(key, value, ConfigType::DOUBLE, description);
        }

        bool ConfigManager::setBool(const std::string &key, bool value, const std::string &description)
        {
            return setValue(key, value, ConfigType::BOOLEAN, description);
        }

        bool ConfigManager::setValue(const std::string &key, const std::any &value, ConfigType type, const std::string &description)
        {
            if (!isValidKey(key))
            {
                std::cerr << "Invalid key: " << key << std::endl;
                return false;
            }

            std::unique_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            ConfigEntry entry(value, type, description);
            if (it != config_map_.end() && description.empty())
            {
                // Giữ lại mô tả khi giá trị được ghi đè từ file
                entry.description = it->second.description;
            }

            config_map_[key] = entry;
            return true;
        }

        bool ConfigManager::isValidKey(const std::string &key) const
        {
            if (key.empty() || key.front() == '.' || key.back() == '.')
                return false;

            return key.find("..") == std::string::npos;
        }

        // ==================== Get Methods ====================
        std::string ConfigManager::getString(const std::string &key, const std::string &default_value) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return default_value;
            }

            switch (it->second.type)
            {
            case ConfigType::STRING:
                return std::any_cast<std::string>(it->second.value);
            case ConfigType::INTEGER:
                return std::to_string(std::any_cast<int>(it->second.value));
            case ConfigType::DOUBLE:
                return std::to_string(std::any_cast<double>(it->second.value));
            case ConfigType::BOOLEAN:
                return std::any_cast<bool>(it->second.value) ? "true" : "false";
            }
            return default_value;
        }

        int ConfigManager::getInt(const std::string &key, int default_value) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return default_value;
            }

            try
            {
                if (it->second.type == ConfigType::INTEGER)
                {
                    return std::any_cast<int>(it->second.value);
                }
                else if (it->second.type == ConfigType::STRING)
                {
                    return std::stoi(std::any_cast<std::string>(it->second.value));
                }
                else if (it->second.type == ConfigType::DOUBLE)
                {
                    return static_cast<int>(std::any_cast<double>(it->second.value));
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error converting to int for key: " << key << " - " << e.what() << std::endl;
            }

            return default_value;
        }

        double ConfigManager::getDouble(const std::string &key, double default_value) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return default_value;
            }

            try
            {
                if (it->second.type == ConfigType::DOUBLE)
                {
                    return std::any_cast<double>(it->second.value);
                }
                else if (it->second.type == ConfigType::INTEGER)
                {
                    return static_cast<double>(std::any_cast<int>(it->second.value));
                }
                else if (it->second.type == ConfigType::STRING)
                {
                    return std::stod(std::any_cast<std::string>(it->second.value));
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error converting to double for key: " << key << " - " << e.what() << std::endl;
            }

            return default_value;
        }

        bool ConfigManager::getBool(const std::string &key, bool default_value) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return default_value;
            }

            if (it->second.type == ConfigType::BOOLEAN)
            {
                return std::any_cast<bool>(it->second.value);
            }
            else if (it->second.type == ConfigType::STRING)
            {
                std::string str_val = Utils::toLowerCase(std::any_cast<std::string>(it->second.value));
                return (str_val == "true" || str_val == "1" || str_val == "yes" || str_val == "on");
            }
            else if (it->second.type == ConfigType::INTEGER)
            {
                return std::any_cast<int>(it->second.value) != 0;
            }

            return default_value;
        }

        // ==================== Utility methods ====================
        bool ConfigManager::hasKey(const std::string &key) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);
            return config_map_.find(key) != config_map_.end();
        }

        std::vector<std::string> ConfigManager::getAllKeys() const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            std::vector<std::string> keys;
            keys.reserve(config_map_.size());
            for (const auto &pair : config_map_)
            {
                keys.push_back(pair.first);
            }
            std::sort(keys.begin(), keys.end());
            return keys;
        }

        std::string ConfigManager::getDescription(const std::string &key) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            return it != config_map_.end() ? it->second.description : "";
        }

        size_t ConfigManager::size() const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);
            return config_map_.size();
        }

    } // namespace Common
} // namespace PacketSniffer
