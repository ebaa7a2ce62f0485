#ifndef ROUNDWISE_UTILS_TERMINAL_HPP
#define ROUNDWISE_UTILS_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Roundwise::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightBlack  = "\033[90m";
        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
        inline constexpr std::string_view kCrimson      = "\033[38;5;196m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
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

    // Pads (or truncates) to exactly `width` visible columns. ASCII input only.
    inline std::string Cell(std::string_view text, std::size_t width) {
        std::string out(text.substr(0, width));
        out.append(width - out.size(), ' ');
        return out;
    }

    // ---------- Table separators ----------
    enum class HSepKind { Top, Middle, Bottom };

    inline std::string HSeparator(const std::vector<std::size_t>& spacings, HSepKind kind) {
        using namespace Symbols;

        std::string_view left;
        std::string_view midJunction;
        std::string_view right;
        switch (kind) {
            case HSepKind::Top:
                left = kBoxTopLeft;
                midJunction = kBoxTopSeparator;
                right = kBoxTopRight;
                break;
            case HSepKind::Middle:
                left = kBoxMiddleLeft;
                midJunction = kBoxMiddleSeparator;
                right = kBoxMiddleRight;
                break;
            case HSepKind::Bottom:
                left = kBoxBottomLeft;
                midJunction = kBoxBottomSeparator;
                right = kBoxBottomRight;
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
        return out;
    }

    // One framed row; every cell is padded to its column width.
    inline std::string Row(const std::vector<std::string>& cells, const std::vector<std::size_t>& spacings) {
        std::string out{Symbols::kBoxVertical};
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            const std::string_view text = i < cells.size() ? std::string_view{cells[i]} : std::string_view{};
            out.append(Cell(text, spacings[i]));
            out.append(Symbols::kBoxVertical);
        }
        return out;
    }

    // Header + body rows framed with heavy box glyphs, one string per line.
    inline std::vector<std::string> Table(const std::vector<std::string>& header,
                                          const std::vector<std::vector<std::string>>& rows) {
        std::vector<std::size_t> spacings(header.size(), 0);
        for (std::size_t i = 0; i < header.size(); ++i) {
            spacings[i] = header[i].size() + 2;
        }
        for (const auto& row : rows) {
            for (std::size_t i = 0; i < row.size() && i < spacings.size(); ++i) {
                if (row[i].size() + 2 > spacings[i]) {
                    spacings[i] = row[i].size() + 2;
                }
            }
        }

        auto pad = [](const std::vector<std::string>& cells) {
            std::vector<std::string> padded;
            padded.reserve(cells.size());
            for (const auto& cell : cells) {
                padded.push_back(" " + cell);
            }
            return padded;
        };

        std::vector<std::string> lines;
        lines.reserve(rows.size() + 4);
        lines.push_back(HSeparator(spacings, HSepKind::Top));
        lines.push_back(Row(pad(header), spacings));
        lines.push_back(HSeparator(spacings, HSepKind::Middle));
        for (const auto& row : rows) {
            lines.push_back(Row(pad(row), spacings));
        }
        lines.push_back(HSeparator(spacings, HSepKind::Bottom));
        return lines;
    }
}

#endif // ROUNDWISE_UTILS_TERMINAL_HPP
