// src/common/utils.cpp
#include "utils.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstdlib>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <pwd.h>

namespace PacketSniffer
{
    namespace Common
    {
        // ==================== Time utilities ====================
        uint64_t Utils::getCurrentTimestampUs()
        {
            return std::chrono::duration_cast<std::chrono::microseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        uint64_t Utils::getMonotonicTimeMs()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now().time_since_epoch())
                .count();
        }

        std::string Utils::formatUtc(uint64_t timestamp_us, const std::string &format, int fraction_digits)
        {
            std::time_t seconds = static_cast<std::time_t>(timestamp_us / 1000000ULL);
            std::tm tm_utc{};
            gmtime_r(&seconds, &tm_utc);

            std::stringstream ss;
            ss << std::put_time(&tm_utc, format.c_str());

            if (fraction_digits > 0)
            {
                int digits = std::min(fraction_digits, 6);
                uint64_t fraction = timestamp_us % 1000000ULL;
                for (int i = digits; i < 6; ++i)
                    fraction /= 10;
                ss << '.' << std::setfill('0') << std::setw(digits) << fraction;
            }
            return ss.str();
        }

        std::string Utils::toRfc3339(uint64_t timestamp_us)
        {
            return formatUtc(timestamp_us, "%Y-%m-%dT%H:%M:%S", 6) + "+00:00";
        }

        // ==================== String utilities ====================
        std::vector<std::string> Utils::split(const std::string &str, char delimiter)
        {
            std::vector<std::string> tokens;
            std::stringstream ss(str);
            std::string token;

            while (std::getline(ss, token, delimiter))
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string Utils::trim(const std::string &str)
        {
            const std::string chars = " \t\n\r\f\v";
            size_t start = str.find_first_not_of(chars);
            if (start == std::string::npos)
                return "";

            size_t end = str.find_last_not_of(chars);
            return str.substr(start, end - start + 1);
        }

        std::string Utils::toLowerCase(const std::string &str)
        {
            std::string result = str;
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        bool Utils::startsWith(const std::string &str, const std::string &prefix)
        {
            return str.length() >= prefix.length() &&
                   str.compare(0, prefix.length(), prefix) == 0;
        }

        std::string Utils::join(const std::vector<std::string> &strings, const std::string &delimiter)
        {
            if (strings.empty())
                return "";

            std::stringstream ss;
            for (size_t i = 0; i < strings.size(); ++i)
            {
                if (i > 0)
                    ss << delimiter;
                ss << strings[i];
            }
            return ss.str();
        }

        std::string Utils::repeat(const std::string &str, size_t count)
        {
            std::string result;
            result.reserve(str.size() * count);
            for (size_t i = 0; i < count; ++i)
                result += str;
            return result;
        }

        // ==================== File utilities ====================
        bool Utils::fileExists(const std::string &filepath)
        {
            struct stat buffer;
            return (stat(filepath.c_str(), &buffer) == 0) && S_ISREG(buffer.st_mode);
        }

        bool Utils::directoryExists(const std::string &dirpath)
        {
            struct stat buffer;
            return (stat(dirpath.c_str(), &buffer) == 0) && S_ISDIR(buffer.st_mode);
        }

        bool Utils::createDirectory(const std::string &dirpath)
        {
            if (dirpath.empty() || directoryExists(dirpath))
                return true;

            // Tạo thư mục cha trước
            size_t pos = dirpath.find_last_of('/');
            if (pos != std::string::npos && pos > 0)
            {
                std::string parent = dirpath.substr(0, pos);
                if (!createDirectory(parent))
                    return false;
            }

            return mkdir(dirpath.c_str(), 0755) == 0 || directoryExists(dirpath);
        }

        std::string Utils::getDirectoryName(const std::string &filepath)
        {
            size_t pos = filepath.find_last_of('/');
            if (pos == std::string::npos)
                return ".";
            if (pos == 0)
                return "/";
            return filepath.substr(0, pos);
        }

        std::string Utils::readFileToString(const std::string &filepath)
        {
            std::ifstream file(filepath, std::ios::binary);
            if (!file.is_open())
                return "";

            std::stringstream ss;
            ss << file.rdbuf();
            return ss.str();
        }

        bool Utils::writeStringToFile(const std::string &filepath, const std::string &content, bool append)
        {
            std::ios::openmode mode = std::ios::binary;
            if (append)
                mode |= std::ios::app;
            else
                mode |= std::ios::trunc;

            std::ofstream file(filepath, mode);
            if (!file.is_open())
                return false;

            file.write(content.c_str(), content.length());
            return file.good();
        }

        std::string Utils::getHomeDirectory()
        {
            const char *home = std::getenv("HOME");
            if (home && *home)
                return home;

            struct passwd *pw = getpwuid(getuid());
            if (pw && pw->pw_dir)
                return pw->pw_dir;

            return ".";
        }

        // ==================== Formatting ====================
        std::string Utils::formatBytes(size_t bytes, int precision)
        {
            const char *units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
            const size_t num_units = sizeof(units) / sizeof(units[0]);

            double size = static_cast<double>(bytes);
            size_t unit_index = 0;

            while (size >= 1024.0 && unit_index < num_units - 1)
            {
                size /= 1024.0;
                unit_index++;
            }

            std::stringstream ss;
            ss << std::fixed << std::setprecision(precision) << size << " " << units[unit_index];
            return ss.str();
        }

    } // namespace Common
} // namespace PacketSniffer
