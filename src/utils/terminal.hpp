#ifndef ONEIRO_UTILS_TERMINAL_HPP
#define ONEIRO_UTILS_TERMINAL_HPP

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

namespace Oneiro::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightRed     = "\033[91m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";

        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kCross     = "✘";
        inline constexpr std::string_view kInfo      = "ℹ";
        inline constexpr std::string_view kWarn      = "⚠";

        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kRoundedTopLeft     = "╭";
        inline constexpr std::string_view kRoundedTopRight    = "╮";
        inline constexpr std::string_view kRoundedBottomLeft  = "╰";
        inline constexpr std::string_view kRoundedBottomRight = "╯";
    }

    // ---------- Small helpers ----------
    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // ╭━━━━…╮ / ╰━━━━…╯
    inline std::string TopBarRounded(std::size_t inner_len, std::string_view color) {
        using namespace Symbols;
        return ApplyColor(std::string(kRoundedTopLeft) + Repeat(kBoxHorizontal, inner_len) + std::string(kRoundedTopRight), color);
    }
    inline std::string BottomBarRounded(std::size_t inner_len, std::string_view color) {
        using namespace Symbols;
        return ApplyColor(std::string(kRoundedBottomLeft) + Repeat(kBoxHorizontal, inner_len) + std::string(kRoundedBottomRight), color);
    }

    // One status line: "<symbol> message", symbol coloured.
    inline void Status(std::ostream& stream, std::string_view symbol, std::string_view color, std::string_view message) {
        stream << ApplyColor(symbol, color) << ' ' << message << '\n';
    }

    inline void Info(std::string_view message) {
        Status(std::cout, Symbols::kInfo, Colors::kBrightBlue, message);
    }

    inline void Warn(std::string_view message) {
        Status(std::cout, Symbols::kWarn, Colors::kBrightYellow, message);
    }
}

/* Instance:
using namespace Oneiro::Utils::Terminal;

Info("Using GPU.");                                   // ℹ Using GPU.
Warn("GPU isn't available, CPU is being used.");      // ⚠ GPU isn't available, CPU is being used.
auto top = TopBarRounded(13, Colors::kBrightYellow);  // ╭━━━━━━━━━━━━━╮
*/
#endif // ONEIRO_UTILS_TERMINAL_HPP
