// interfaces/cli/console_style.hpp
#ifndef PACKET_SNIFFER_CONSOLE_STYLE_HPP
#define PACKET_SNIFFER_CONSOLE_STYLE_HPP

#include "../../src/common/packet_record.hpp"
#include <string>

namespace PacketSniffer
{
    namespace CLI
    {
        // ANSI color codes
        namespace Color
        {
            constexpr const char *RESET = "\033[0m";
            constexpr const char *RED = "\033[31m";
            constexpr const char *GREEN = "\033[32m";
            constexpr const char *YELLOW = "\033[33m";
            constexpr const char *BLUE = "\033[34m";
            constexpr const char *MAGENTA = "\033[35m";
            constexpr const char *CYAN = "\033[36m";
            constexpr const char *WHITE = "\033[37m";
            constexpr const char *GRAY = "\033[90m";
            constexpr const char *BOLD = "\033[1m";
            constexpr const char *ITALIC = "\033[3m";
            constexpr const char *CLEAR_SCREEN = "\033[2J\033[1;1H";
        }

        /**
         * @brief Các ký tự khung bảng (modern = Unicode box drawing, ascii = +-|)
         */
        struct TableGlyphs
        {
            const char *horizontal;
            const char *vertical;
            const char *double_rule;
            const char *top_left;
            const char *top_mid;
            const char *top_right;
            const char *mid_left;
            const char *cross;
            const char *mid_right;
            const char *bottom_left;
            const char *bottom_mid;
            const char *bottom_right;
            const char *bar;
        };

        /**
         * @brief Cấu hình hiển thị console: màu, emoji, kiểu bảng
         */
        class ConsoleStyle
        {
        public:
            ConsoleStyle() = default;
            ConsoleStyle(bool colors, bool emojis, bool ascii_tables)
                : colors_(colors), emojis_(emojis), ascii_tables_(ascii_tables) {}

            /**
             * @brief Đọc ui.colors_enabled, ui.emojis_enabled, ui.table_style từ ConfigManager
             */
            static ConsoleStyle fromConfig();

            bool colorsEnabled() const { return colors_; }
            bool emojisEnabled() const { return emojis_; }
            bool asciiTables() const { return ascii_tables_; }

            /**
             * @brief Bọc text bằng mã màu (trả nguyên text khi tắt màu)
             */
            std::string paint(const std::string &text, const char *color) const;
            std::string paint(const std::string &text, const char *color, const char *attribute) const;

            /**
             * @brief Emoji hoặc nhãn text thay thế khi tắt emoji
             */
            std::string icon(const char *emoji, const char *fallback) const;

            std::string threatIcon(Common::ThreatLevel level) const;
            const char *threatColor(Common::ThreatLevel level) const;

            const TableGlyphs &glyphs() const;

            std::string rule(size_t width) const;
            std::string doubleRule(size_t width) const;

        private:
            bool colors_ = true;
            bool emojis_ = true;
            bool ascii_tables_ = false;
        };

        // ==================== Text helpers ====================

        /**
         * @brief Độ rộng hiển thị (số code point UTF-8)
         */
        size_t displayWidth(const std::string &text);

        std::string padRight(const std::string &text, size_t width);
        std::string padLeft(const std::string &text, size_t width);
        std::string truncate(const std::string &text, size_t width);

        /**
         * @brief Định dạng số thực với số chữ số thập phân cố định
         */
        std::string formatFixed(double value, int precision);

    } // namespace CLI
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_CONSOLE_STYLE_HPP
