#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Board coordinate. Rows grow downward (south), columns grow rightward (east).
struct Coord {
    int row = 0;
    int col = 0;
};

inline bool operator==(const Coord& a, const Coord& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Coord& a, const Coord& b) {
    return !(a == b);
}

// Row-major ordering so Coord can key a std::map.
inline bool operator<(const Coord& a, const Coord& b) {
    if (a.row != b.row) return a.row < b.row;
    return a.col < b.col;
}

inline std::string coordToString(Coord c) {
    return "(" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")";
}

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline std::string toUpper(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}

// Joins names as "[A, B]" (used for exit lists, inventories and prompts).
inline std::string joinList(const std::vector<std::string>& parts) {
    std::string out = "[";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += ", ";
        out += parts[i];
    }
    out += "]";
    return out;
}
