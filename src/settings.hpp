#pragma once

#include <cstdint>
#include <string>

#include "game.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// The file is created with commented defaults on first run.
struct Settings {
    // 0 = pick a seed from the clock at startup.
    uint32_t seed = 0;

    // Player setup
    int startRow = 3;
    int startCol = 3;
    int startHealth = 6;
    int startAttack = 1;
    int itemCapacity = 2;

    // Optional content override file (see loadContentIni). Empty = stock content.
    std::string contentFile;

    // Rendering / UI (SDL front-end)
    int tileSize = 96;
    int hudHeight = 160;
    bool vsync = true;

    // Console front-end: print the current room as an ASCII box after each action.
    bool asciiTiles = true;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);

// Engine configuration for a new game. `seed` must already be resolved (non-zero).
GameConfig toGameConfig(const Settings& s, uint32_t seed);
