#ifndef SKULD_UTILS_TERMINAL_HPP
#define SKULD_UTILS_TERMINAL_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace Skuld::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";

        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kInfo      = "ℹ";
        inline constexpr std::string_view kWarn      = "⚠";

        inline constexpr std::string_view kBoxTopLeft         = "┏";
        inline constexpr std::string_view kBoxTopSeparator    = "┳";
        inline constexpr std::string_view kBoxTopRight        = "┓";
        inline constexpr std::string_view kBoxMiddleLeft      = "┣";
        inline constexpr std::string_view kBoxMiddleSeparator = "╋";
        inline constexpr std::string_view kBoxMiddleRight     = "┫";
        inline constexpr std::string_view kBoxBottomLeft      = "┗";
        inline constexpr std::string_view kBoxBottomSeparator = "┻";
        inline constexpr std::string_view kBoxBottomRight     = "┛";
        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";
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

    // ---------- Table separators ----------
    // spacings = widths of each column between vertical junctions.
    enum class HSepKind { Top, Middle, Bottom };

    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  HSepKind kind) {
        using namespace Symbols;

        std::string_view left;
        std::string_view midJunction;
        std::string_view right;
        switch (kind) {
            case HSepKind::Top:
                left = kBoxTopLeft; midJunction = kBoxTopSeparator; right = kBoxTopRight;
                break;
            case HSepKind::Middle:
                left = kBoxMiddleLeft; midJunction = kBoxMiddleSeparator; right = kBoxMiddleRight;
                break;
            case HSepKind::Bottom:
                left = kBoxBottomLeft; midJunction = kBoxBottomSeparator; right = kBoxBottomRight;
                break;
        }

        std::string out;
        out.reserve(16 + spacings.size() * 8);
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(midJunction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    // Pads every cell to its column width; cells longer than the column are kept whole.
    inline std::string Row(const std::vector<std::string>& cells,
                           const std::vector<std::size_t>& spacings,
                           std::string_view color) {
        std::string out{ApplyColor(Symbols::kBoxVertical, color)};
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            std::string cell = i < cells.size() ? cells[i] : std::string{};
            cell.insert(cell.begin(), ' ');
            if (cell.size() < spacings[i]) {
                cell.append(spacings[i] - cell.size(), ' ');
            }
            out.append(cell);
            out.append(ApplyColor(Symbols::kBoxVertical, color));
        }
        return out;
    }

    // Leveled one-line messages; a null stream silences the call.
    inline void Info(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) return;
        *stream << ApplyColor(Symbols::kInfo, Colors::kBrightBlue) << ' ' << message << '\n';
    }
    inline void Warn(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) return;
        *stream << ApplyColor(Symbols::kWarn, Colors::kOrange) << ' ' << message << '\n';
    }
    inline void Success(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) return;
        *stream << ApplyColor(Symbols::kCheck, Colors::kBrightGreen) << ' ' << message << '\n';
    }
}

#endif // SKULD_UTILS_TERMINAL_HPP
