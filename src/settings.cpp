#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        out = std::stoi(trim(v));
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseU32(const std::string& v, uint32_t& out) {
    try {
        const unsigned long long x = std::stoull(trim(v));
        if (x > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(x);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        if (key == "seed") {
            uint32_t v = 0;
            if (parseU32(val, v)) s.seed = v;
        } else if (key == "start_row") {
            int v = 0;
            if (parseInt(val, v)) s.startRow = std::clamp(v, -64, 64);
        } else if (key == "start_col") {
            int v = 0;
            if (parseInt(val, v)) s.startCol = std::clamp(v, -64, 64);
        } else if (key == "start_health") {
            int v = 0;
            if (parseInt(val, v)) s.startHealth = std::clamp(v, 1, 99);
        } else if (key == "start_attack") {
            int v = 0;
            if (parseInt(val, v)) s.startAttack = std::clamp(v, 0, 99);
        } else if (key == "item_capacity") {
            int v = 0;
            if (parseInt(val, v)) s.itemCapacity = std::clamp(v, 1, 9);
        } else if (key == "content_file") {
            s.contentFile = val;
        } else if (key == "tile_size") {
            int v = 0;
            if (parseInt(val, v)) s.tileSize = std::clamp(v, 48, 192);
        } else if (key == "hud_height") {
            int v = 0;
            if (parseInt(val, v)) s.hudHeight = std::clamp(v, 120, 320);
        } else if (key == "vsync") {
            bool b = true;
            if (parseBool(val, b)) s.vsync = b;
        } else if (key == "ascii_tiles") {
            bool b = true;
            if (parseBool(val, b)) s.asciiTiles = b;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# ZombiePocket settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# Game
# seed: 0 picks a new seed every run; any other value replays the same shuffle.
seed = 0

# Player setup
start_row = 3
start_col = 3
start_health = 6
start_attack = 1
item_capacity = 2

# Content override (tiles, clock, cards, items). Leave empty for the stock game.
content_file =

# Rendering / UI
tile_size = 96
hud_height = 160
# vsync: true/false  (true = lower CPU usage, smoother rendering)
vsync = true

# Console
# ascii_tiles: print the current room as an ASCII box after each action
ascii_tiles = true
)INI";

    return static_cast<bool>(f);
}

GameConfig toGameConfig(const Settings& s, uint32_t seed) {
    GameConfig cfg;
    cfg.start = Coord{s.startRow, s.startCol};
    cfg.seed = seed;
    cfg.startHealth = s.startHealth;
    cfg.startAttack = s.startAttack;
    cfg.itemCapacity = s.itemCapacity;
    return cfg;
}
