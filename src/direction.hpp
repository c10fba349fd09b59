#pragma once
#include "common.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <string>

// Cardinal directions in clockwise order. The numeric value doubles as the
// index into a tile's exit array, so keep the order N, E, S, W.
enum class Direction : uint8_t {
    North = 0,
    East,
    South,
    West,
};

inline constexpr int DIRECTION_COUNT = 4;

inline constexpr std::array<Direction, DIRECTION_COUNT> ALL_DIRECTIONS = {
    Direction::North, Direction::East, Direction::South, Direction::West,
};

inline int dirIndex(Direction d) {
    return static_cast<int>(d);
}

inline bool isCardinal(Direction d) {
    return static_cast<uint8_t>(d) < DIRECTION_COUNT;
}

inline Direction dirFromIndex(int i) {
    return static_cast<Direction>(((i % DIRECTION_COUNT) + DIRECTION_COUNT) % DIRECTION_COUNT);
}

inline Direction opposite(Direction d) {
    switch (d) {
        case Direction::North: return Direction::South;
        case Direction::East:  return Direction::West;
        case Direction::South: return Direction::North;
        case Direction::West:  return Direction::East;
        default:               return d;
    }
}

// Row/col delta of one step. North is row-1 (up the screen).
inline Coord dirDelta(Direction d) {
    switch (d) {
        case Direction::North: return {-1, 0};
        case Direction::East:  return {0, 1};
        case Direction::South: return {1, 0};
        case Direction::West:  return {0, -1};
        default:               return {0, 0};
    }
}

inline Coord stepFrom(Coord c, Direction d) {
    const Coord dd = dirDelta(d);
    return {c.row + dd.row, c.col + dd.col};
}

inline char dirChar(Direction d) {
    switch (d) {
        case Direction::North: return 'N';
        case Direction::East:  return 'E';
        case Direction::South: return 'S';
        case Direction::West:  return 'W';
        default:               return '?';
    }
}

inline const char* dirName(Direction d) {
    switch (d) {
        case Direction::North: return "north";
        case Direction::East:  return "east";
        case Direction::South: return "south";
        case Direction::West:  return "west";
        default:               return "nowhere";
    }
}

// Accepts "n", "N", "north", "North" (and the same for the other sides).
inline bool parseDirection(const std::string& raw, Direction& out) {
    std::string s;
    s.reserve(raw.size());
    for (unsigned char ch : raw) {
        if (std::isspace(ch)) continue;
        s.push_back(static_cast<char>(std::tolower(ch)));
    }

    if (s == "n" || s == "north") { out = Direction::North; return true; }
    if (s == "e" || s == "east")  { out = Direction::East;  return true; }
    if (s == "s" || s == "south") { out = Direction::South; return true; }
    if (s == "w" || s == "west")  { out = Direction::West;  return true; }
    return false;
}
