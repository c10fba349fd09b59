#include "tile.hpp"

#include <algorithm>
#include <sstream>

namespace {

// ROTATIONS[exit][entry]; derived from k = (opposite(exit) - entry) mod 4.
constexpr int ROTATIONS[DIRECTION_COUNT][DIRECTION_COUNT] = {
    //            entry: N  E  S  W
    /* exit N */        {2, 1, 0, 3},
    /* exit E */        {3, 2, 1, 0},
    /* exit S */        {0, 3, 2, 1},
    /* exit W */        {1, 0, 3, 2},
};

std::string centered(const std::string& s, size_t width) {
    if (s.size() >= width) return s;
    const size_t total = width - s.size();
    const size_t left = total / 2;
    return std::string(left, ' ') + s + std::string(total - left, ' ');
}

} // namespace

ExitSet exitsFromString(const std::string& s) {
    ExitSet out{};
    for (char c : s) {
        Direction d;
        if (parseDirection(std::string(1, c), d)) {
            out[static_cast<size_t>(dirIndex(d))] = true;
        }
    }
    return out;
}

std::string exitsToString(const ExitSet& exits) {
    std::string out;
    for (Direction d : ALL_DIRECTIONS) {
        if (exits[static_cast<size_t>(dirIndex(d))]) out.push_back(dirChar(d));
    }
    return out;
}

int rotationCount(Direction entry, Direction exit) {
    if (!isCardinal(entry) || !isCardinal(exit)) return 0;
    return ROTATIONS[dirIndex(exit)][dirIndex(entry)];
}

std::vector<Direction> Tile::possibleExits() const {
    std::vector<Direction> out;
    for (Direction d : ALL_DIRECTIONS) {
        if (hasExit(d)) out.push_back(d);
    }
    return out;
}

std::string Tile::possibleExitsText() const {
    std::vector<std::string> parts;
    for (Direction d : possibleExits()) parts.emplace_back(1, dirChar(d));
    return joinList(parts);
}

bool Tile::addExit(Direction d) {
    if (!isCardinal(d)) return false;
    exits[static_cast<size_t>(dirIndex(d))] = true;
    return true;
}

void Tile::rotateClockwise() {
    ExitSet next{};
    for (Direction d : ALL_DIRECTIONS) {
        const Direction prev = dirFromIndex(dirIndex(d) - 1);
        next[static_cast<size_t>(dirIndex(d))] = exits[static_cast<size_t>(dirIndex(prev))];
    }
    exits = next;
    rotation = (rotation + 1) % DIRECTION_COUNT;
}

Tile& Tile::rotate(Direction entry, Direction exit) {
    const int turns = rotationCount(entry, exit);
    for (int i = 0; i < turns; ++i) rotateClockwise();
    return *this;
}

TileView Tile::view() const {
    TileView v;
    v.name = name;
    v.exits = exits;
    v.category = category;
    v.visual = visual;
    v.rotation = rotation;
    return v;
}

std::string Tile::toAscii() const {
    const size_t w = std::max<size_t>(15, name.size());
    const char top = hasExit(Direction::North) ? ' ' : '_';
    const char right = hasExit(Direction::East) ? ' ' : '|';
    const char bottom = hasExit(Direction::South) ? ' ' : '_';
    const char left = hasExit(Direction::West) ? ' ' : '|';

    std::ostringstream ss;
    ss << ' ' << std::string(w + 2, top) << " \n";
    ss << '+' << std::string(w + 2, ' ') << "+\n";
    ss << left << ' ' << centered(name, w) << ' ' << right << "\n";
    ss << '+' << std::string(w + 2, bottom) << "+\n";
    return ss.str();
}
