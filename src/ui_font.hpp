#pragma once
#include "sdl.hpp"

#include "common.hpp"

#include <string>
#include <vector>

// Built-in 5x7 bitmap font for the board labels and HUD (no SDL_ttf dependency).
// Covers ASCII 0x20..0x60; lowercase is drawn as uppercase, anything else as '?'.

struct Glyph5x7 {
    // 7 rows, low 5 bits used (0x10 is the leftmost column).
    uint8_t rows[7];
};

inline constexpr int GLYPH_FIRST = 0x20;
inline constexpr int GLYPH_LAST = 0x60;

inline constexpr Glyph5x7 GLYPHS_5X7[GLYPH_LAST - GLYPH_FIRST + 1] = {
    {{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // space
    {{0x04, 0x04, 0x04, 0x04, 0x04, 0x00, 0x04}}, // !
    {{0x0A, 0x0A, 0x00, 0x00, 0x00, 0x00, 0x00}}, // "
    {{0x0A, 0x0A, 0x1F, 0x0A, 0x1F, 0x0A, 0x0A}}, // #
    {{0x0E, 0x11, 0x01, 0x02, 0x04, 0x00, 0x04}}, // $
    {{0x19, 0x1A, 0x02, 0x04, 0x08, 0x0B, 0x13}}, // %
    {{0x0C, 0x12, 0x14, 0x08, 0x15, 0x12, 0x0D}}, // &
    {{0x04, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '
    {{0x04, 0x08, 0x10, 0x10, 0x10, 0x08, 0x04}}, // (
    {{0x04, 0x02, 0x01, 0x01, 0x01, 0x02, 0x04}}, // )
    {{0x00, 0x15, 0x0E, 0x1F, 0x0E, 0x15, 0x00}}, // *
    {{0x00, 0x04, 0x04, 0x1F, 0x04, 0x04, 0x00}}, // +
    {{0x00, 0x00, 0x00, 0x00, 0x00, 0x0C, 0x04}}, // ,
    {{0x00, 0x00, 0x00, 0x1F, 0x00, 0x00, 0x00}}, // -
    {{0x00, 0x00, 0x00, 0x00, 0x00, 0x0C, 0x0C}}, // .
    {{0x01, 0x02, 0x04, 0x08, 0x10, 0x00, 0x00}}, // /
    {{0x0E, 0x11, 0x13, 0x15, 0x19, 0x11, 0x0E}}, // 0
    {{0x04, 0x0C, 0x04, 0x04, 0x04, 0x04, 0x0E}}, // 1
    {{0x0E, 0x11, 0x01, 0x02, 0x04, 0x08, 0x1F}}, // 2
    {{0x1E, 0x01, 0x01, 0x0E, 0x01, 0x01, 0x1E}}, // 3
    {{0x02, 0x06, 0x0A, 0x12, 0x1F, 0x02, 0x02}}, // 4
    {{0x1F, 0x10, 0x10, 0x1E, 0x01, 0x01, 0x1E}}, // 5
    {{0x06, 0x08, 0x10, 0x1E, 0x11, 0x11, 0x0E}}, // 6
    {{0x1F, 0x01, 0x02, 0x04, 0x08, 0x08, 0x08}}, // 7
    {{0x0E, 0x11, 0x11, 0x0E, 0x11, 0x11, 0x0E}}, // 8
    {{0x0E, 0x11, 0x11, 0x0F, 0x01, 0x02, 0x0C}}, // 9
    {{0x00, 0x0C, 0x0C, 0x00, 0x0C, 0x0C, 0x00}}, // :
    {{0x00, 0x0C, 0x0C, 0x00, 0x0C, 0x04, 0x00}}, // ;
    {{0x01, 0x02, 0x04, 0x08, 0x04, 0x02, 0x01}}, // <
    {{0x00, 0x00, 0x1F, 0x00, 0x1F, 0x00, 0x00}}, // =
    {{0x10, 0x08, 0x04, 0x02, 0x04, 0x08, 0x10}}, // >
    {{0x0E, 0x11, 0x01, 0x02, 0x04, 0x00, 0x04}}, // ?
    {{0x0E, 0x11, 0x17, 0x15, 0x17, 0x10, 0x0E}}, // @
    {{0x0E, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}}, // A
    {{0x1E, 0x11, 0x11, 0x1E, 0x11, 0x11, 0x1E}}, // B
    {{0x0E, 0x11, 0x10, 0x10, 0x10, 0x11, 0x0E}}, // C
    {{0x1C, 0x12, 0x11, 0x11, 0x11, 0x12, 0x1C}}, // D
    {{0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x1F}}, // E
    {{0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x10}}, // F
    {{0x0E, 0x11, 0x10, 0x10, 0x13, 0x11, 0x0E}}, // G
    {{0x11, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}}, // H
    {{0x0E, 0x04, 0x04, 0x04, 0x04, 0x04, 0x0E}}, // I
    {{0x01, 0x01, 0x01, 0x01, 0x11, 0x11, 0x0E}}, // J
    {{0x11, 0x12, 0x14, 0x18, 0x14, 0x12, 0x11}}, // K
    {{0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x1F}}, // L
    {{0x11, 0x1B, 0x15, 0x15, 0x11, 0x11, 0x11}}, // M
    {{0x11, 0x11, 0x19, 0x15, 0x13, 0x11, 0x11}}, // N
    {{0x0E, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}}, // O
    {{0x1E, 0x11, 0x11, 0x1E, 0x10, 0x10, 0x10}}, // P
    {{0x0E, 0x11, 0x11, 0x11, 0x15, 0x12, 0x0D}}, // Q
    {{0x1E, 0x11, 0x11, 0x1E, 0x14, 0x12, 0x11}}, // R
    {{0x0F, 0x10, 0x10, 0x0E, 0x01, 0x01, 0x1E}}, // S
    {{0x1F, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04}}, // T
    {{0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}}, // U
    {{0x11, 0x11, 0x11, 0x11, 0x11, 0x0A, 0x04}}, // V
    {{0x11, 0x11, 0x11, 0x15, 0x15, 0x15, 0x0A}}, // W
    {{0x11, 0x11, 0x0A, 0x04, 0x0A, 0x11, 0x11}}, // X
    {{0x11, 0x11, 0x0A, 0x04, 0x04, 0x04, 0x04}}, // Y
    {{0x1F, 0x01, 0x02, 0x04, 0x08, 0x10, 0x1F}}, // Z
    {{0x1C, 0x10, 0x10, 0x10, 0x10, 0x10, 0x1C}}, // [
    {{0x10, 0x08, 0x04, 0x02, 0x01, 0x00, 0x00}}, // backslash
    {{0x07, 0x01, 0x01, 0x01, 0x01, 0x01, 0x07}}, // ]
    {{0x0E, 0x11, 0x01, 0x02, 0x04, 0x00, 0x04}}, // ^
    {{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x1F}}, // _
    {{0x0E, 0x11, 0x01, 0x02, 0x04, 0x00, 0x04}}, // backtick, drawn as ?
};

inline const Glyph5x7& glyph5x7(char ch) {
    int c = static_cast<unsigned char>(ch);
    if (c >= 'a' && c <= 'z') c -= 'a' - 'A';
    if (c < GLYPH_FIRST || c > GLYPH_LAST) c = '?';
    return GLYPHS_5X7[c - GLYPH_FIRST];
}

// Advance per character and per line, in pixels, including 1px spacing.
inline int glyphAdvance(int scale) { return 6 * scale; }
inline int lineAdvance(int scale) { return 8 * scale; }

inline int textWidth5x7(const std::string& text, int scale) {
    return static_cast<int>(text.size()) * glyphAdvance(scale);
}

inline void drawText5x7(SDL_Renderer* r, int x, int y, int scale, Color c, const std::string& text) {
    if (!r || scale <= 0) return;
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);

    int penX = x;
    for (char ch : text) {
        const Glyph5x7& g = glyph5x7(ch);
        for (int row = 0; row < 7; ++row) {
            for (int col = 0; col < 5; ++col) {
                if (g.rows[row] & (0x10 >> col)) {
                    SDL_Rect px{penX + col * scale, y + row * scale, scale, scale};
                    SDL_RenderFillRect(r, &px);
                }
            }
        }
        penX += glyphAdvance(scale);
    }
}

// Greedy word wrap to at most maxChars per line. Words longer than a line are split.
inline std::vector<std::string> wrapText(const std::string& text, int maxChars) {
    std::vector<std::string> lines;
    if (maxChars <= 0) maxChars = 1;

    std::string line;
    std::string word;
    auto pushWord = [&]() {
        while (static_cast<int>(word.size()) > maxChars) {
            if (!line.empty()) {
                lines.push_back(line);
                line.clear();
            }
            lines.push_back(word.substr(0, static_cast<size_t>(maxChars)));
            word.erase(0, static_cast<size_t>(maxChars));
        }
        if (word.empty()) return;
        if (line.empty()) {
            line = word;
        } else if (static_cast<int>(line.size() + 1 + word.size()) <= maxChars) {
            line += ' ';
            line += word;
        } else {
            lines.push_back(line);
            line = word;
        }
        word.clear();
    };

    for (char ch : text) {
        if (ch == '\n') {
            pushWord();
            lines.push_back(line);
            line.clear();
        } else if (ch == ' ' || ch == '\t' || ch == '\r') {
            pushWord();
        } else {
            word.push_back(ch);
        }
    }
    pushWord();
    if (!line.empty()) lines.push_back(line);
    return lines;
}

// Returns the number of lines drawn.
inline int drawTextWrapped5x7(SDL_Renderer* r, int x, int y, int scale, Color c,
                              const std::string& text, int maxWidthPx) {
    const int perLine = scale > 0 ? maxWidthPx / glyphAdvance(scale) : 0;
    const std::vector<std::string> lines = wrapText(text, perLine);
    for (size_t i = 0; i < lines.size(); ++i) {
        drawText5x7(r, x, y + static_cast<int>(i) * lineAdvance(scale), scale, c, lines[i]);
    }
    return static_cast<int>(lines.size());
}
