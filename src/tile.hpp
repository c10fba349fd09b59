#pragma once
#include "common.hpp"
#include "direction.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

enum class TileCategory : uint8_t {
    Indoor = 0,
    Outdoor,
    // Reserved rooms handed out by name (start room, patio companion).
    Special,
};

inline const char* tileCategoryName(TileCategory c) {
    switch (c) {
        case TileCategory::Indoor:  return "Indoor";
        case TileCategory::Outdoor: return "Outdoor";
        case TileCategory::Special: return "Special";
        default:                    return "Indoor";
    }
}

using ExitSet = std::array<bool, DIRECTION_COUNT>;

// Builds an exit set from a string like "NE" or "N,S,W". Unknown characters are ignored.
ExitSet exitsFromString(const std::string& s);
std::string exitsToString(const ExitSet& exits);

// Quarter turns (clockwise) needed so that side `entry` of a tile ends up facing
// the room the player just left, given the player moved in direction `exit`.
int rotationCount(Direction entry, Direction exit);

// Read-only copy of a placed room handed to observers.
struct TileView {
    std::string name;
    ExitSet exits{};
    TileCategory category = TileCategory::Indoor;
    uint32_t visual = 0;
    int rotation = 0;
};

struct Tile {
    std::string name;
    ExitSet exits{};
    TileCategory category = TileCategory::Indoor;

    // Opaque handle for the presentation layer (sprite index). Never interpreted here.
    uint32_t visual = 0;

    // Quarter turns applied so far (0..3). The renderer rotates `visual` by this.
    int rotation = 0;

    Tile() = default;
    Tile(std::string n, ExitSet e, TileCategory c, uint32_t vis = 0)
        : name(std::move(n)), exits(e), category(c), visual(vis) {}

    bool hasExit(Direction d) const { return isCardinal(d) && exits[static_cast<size_t>(dirIndex(d))]; }
    std::vector<Direction> possibleExits() const;
    std::string possibleExitsText() const;

    // Returns false if d is not one of the four cardinal directions.
    bool addExit(Direction d);

    // Rotates in place so that `entry` faces the arrival side for a player who
    // moved in direction `exit`. Returns *this for chaining.
    Tile& rotate(Direction entry, Direction exit);

    // One clockwise quarter turn: new N = old W, new E = old N, ...
    void rotateClockwise();

    TileView view() const;

    // Multi-line ASCII rendering (open sides shown as gaps).
    std::string toAscii() const;
};
