#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "content.hpp"
#include "game.hpp"
#include "settings.hpp"

// Command-line options shared by both front-ends. CLI values override settings.
struct LaunchOptions {
    std::string settingsPath = "zimp_settings.ini";
    std::optional<std::string> contentPath;
    std::optional<uint32_t> seed;

    bool showHelp = false;
    bool showVersion = false;
};

// Returns false on an unknown flag or a missing/invalid value (reason in err).
bool parseLaunchArgs(int argc, char** argv, LaunchOptions& out, std::string* err = nullptr);

void printUsage(const char* exe, const char* extraHelp = nullptr);

// Everything a front-end needs to start a game.
struct LaunchSetup {
    Settings settings;
    GameContent content;
    GameConfig config;
};

// Loads (or creates) the settings file, loads the content override and resolves the seed.
// Returns false if the content cannot be used (reason in err). Non-fatal issues go to warnings.
bool prepareLaunch(const LaunchOptions& opts, LaunchSetup& out, std::string* err = nullptr,
                   std::string* warnings = nullptr);
