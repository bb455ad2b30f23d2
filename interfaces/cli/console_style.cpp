// interfaces/cli/console_style.cpp
#include "console_style.hpp"
#include "../../src/common/config_manager.hpp"
#include "../../src/common/utils.hpp"
#include <sstream>
#include <iomanip>

namespace PacketSniffer
{
    namespace CLI
    {
        using Common::ThreatLevel;

        namespace
        {
            const TableGlyphs MODERN_GLYPHS = {
                "─", "│", "═", "┌", "┬", "┐", "├", "┼", "┤", "└", "┴", "┘", "█"};

            const TableGlyphs ASCII_GLYPHS = {
                "-", "|", "=", "+", "+", "+", "+", "+", "+", "+", "+", "+", "#"};
        } // namespace

        ConsoleStyle ConsoleStyle::fromConfig()
        {
            auto &config = Common::ConfigManager::getInstance();
            std::string table_style = Common::Utils::toLowerCase(
                config.getString(Common::ConfigKeys::UI_TABLE_STYLE, "modern"));

            return ConsoleStyle(config.getBool(Common::ConfigKeys::UI_COLORS_ENABLED, true),
                                config.getBool(Common::ConfigKeys::UI_EMOJIS_ENABLED, true),
                                table_style == "ascii");
        }

        std::string ConsoleStyle::paint(const std::string &text, const char *color) const
        {
            if (!colors_)
            {
                return text;
            }
            return std::string(color) + text + Color::RESET;
        }

        std::string ConsoleStyle::paint(const std::string &text, const char *color, const char *attribute) const
        {
            if (!colors_)
            {
                return text;
            }
            return std::string(attribute) + color + text + Color::RESET;
        }

        std::string ConsoleStyle::icon(const char *emoji, const char *fallback) const
        {
            return emojis_ ? emoji : fallback;
        }

        std::string ConsoleStyle::threatIcon(ThreatLevel level) const
        {
            switch (level)
            {
            case ThreatLevel::Safe:
                return icon("✅", "[ok]");
            case ThreatLevel::Low:
                return icon("🟡", "[lo]");
            case ThreatLevel::Medium:
                return icon("🟠", "[md]");
            case ThreatLevel::High:
                return icon("🔴", "[hi]");
            case ThreatLevel::Critical:
                return icon("💀", "[!!]");
            }
            return icon("⚪", "[--]");
        }

        const char *ConsoleStyle::threatColor(ThreatLevel level) const
        {
            switch (level)
            {
            case ThreatLevel::Safe:
                return Color::GREEN;
            case ThreatLevel::Low:
                return Color::YELLOW;
            case ThreatLevel::Medium:
                return Color::MAGENTA;
            case ThreatLevel::High:
            case ThreatLevel::Critical:
                return Color::RED;
            }
            return Color::WHITE;
        }

        const TableGlyphs &ConsoleStyle::glyphs() const
        {
            return ascii_tables_ ? ASCII_GLYPHS : MODERN_GLYPHS;
        }

        std::string ConsoleStyle::rule(size_t width) const
        {
            return Common::Utils::repeat(glyphs().horizontal, width);
        }

        std::string ConsoleStyle::doubleRule(size_t width) const
        {
            return Common::Utils::repeat(glyphs().double_rule, width);
        }

        // ==================== Text helpers ====================

        size_t displayWidth(const std::string &text)
        {
            size_t width = 0;
            for (unsigned char c : text)
            {
                // Bỏ qua byte tiếp nối 10xxxxxx
                if ((c & 0xC0) != 0x80)
                {
                    ++width;
                }
            }
            return width;
        }

        std::string padRight(const std::string &text, size_t width)
        {
            size_t current = displayWidth(text);
            if (current >= width)
            {
                return text;
            }
            return text + std::string(width - current, ' ');
        }

        std::string padLeft(const std::string &text, size_t width)
        {
            size_t current = displayWidth(text);
            if (current >= width)
            {
                return text;
            }
            return std::string(width - current, ' ') + text;
        }

        std::string truncate(const std::string &text, size_t width)
        {
            if (displayWidth(text) <= width)
            {
                return text;
            }
            if (width == 0)
            {
                return "";
            }

            std::string result;
            size_t count = 0;
            for (size_t i = 0; i < text.size(); ++i)
            {
                unsigned char c = static_cast<unsigned char>(text[i]);
                if ((c & 0xC0) != 0x80)
                {
                    if (count == width - 1)
                    {
                        break;
                    }
                    ++count;
                }
                result += text[i];
            }
            return result + "~";
        }

        std::string formatFixed(double value, int precision)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(precision) << value;
            return oss.str();
        }

    } // namespace CLI
} // namespace PacketSniffer
