#ifndef GUNGAMESERVER_ANSI_COLORS_HPP
#define GUNGAMESERVER_ANSI_COLORS_HPP
#include <string>
#include <cstdio>

namespace ggs {
    struct ansi {
    private:
        inline static constexpr int MODIFIER_BEGIN_BIT = 8;
    public:
        // the low byte holds the colour, modifiers are flags above it
        enum color {
            Reset = 0,
            Black = 30, Red, Green, Yellow,
            Blue, Magenta, Cyan, White,
            BrightBlack = 90, BrightRed, BrightGreen, BrightYellow,
            BrightBlue, BrightMagenta, BrightCyan, BrightWhite,

            Bold = 1 << MODIFIER_BEGIN_BIT,
            Italic = 1 << (MODIFIER_BEGIN_BIT + 1),
            Underline = 1 << (MODIFIER_BEGIN_BIT + 2),
            Inverse = 1 << (MODIFIER_BEGIN_BIT + 3),
            Xterm256 = 1 << (MODIFIER_BEGIN_BIT + 4), // 38;5;<color>
        };

        inline static constexpr const char* RESET = "\033[0m";

        static std::string get_escape_code(int v) {
            std::string modifiers;
            if (v & Bold) modifiers += ";1";
            if (v & Italic) modifiers += ";3";
            if (v & Underline) modifiers += ";4";
            if (v & Inverse) modifiers += ";7";
            char text[32];
            std::snprintf(text, sizeof(text), (v & Xterm256) ? "\033[38;5;%d%sm" : "\033[%d%sm",
                          v & 0xff, modifiers.c_str());
            return {text};
        }
    };
}

#endif //GUNGAMESERVER_ANSI_COLORS_HPP
