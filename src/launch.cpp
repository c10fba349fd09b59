#include "launch.hpp"

#include "rng.hpp"
#include "version.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace {

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

uint32_t timeSeed() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const uint64_t t = static_cast<uint64_t>(now);
    uint32_t s = hashCombine(static_cast<uint32_t>(t), static_cast<uint32_t>(t >> 32));
    return s ? s : 1u;
}

} // namespace

bool parseLaunchArgs(int argc, char** argv, LaunchOptions& out, std::string* err) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
        } else if (a == "--version" || a == "-v") {
            out.showVersion = true;
        } else if (a == "--seed") {
            uint32_t s = 0;
            if (!argValue(i, argc, argv, v) || !parseU32(v, s)) {
                if (err) *err = "--seed expects a non-negative integer";
                return false;
            }
            out.seed = s;
        } else if (a == "--settings") {
            if (!argValue(i, argc, argv, v) || v.empty()) {
                if (err) *err = "--settings expects a path";
                return false;
            }
            out.settingsPath = v;
        } else if (a == "--content") {
            if (!argValue(i, argc, argv, v) || v.empty()) {
                if (err) *err = "--content expects a path";
                return false;
            }
            out.contentPath = v;
        } else {
            if (err) *err = "Unknown option: " + a;
            return false;
        }
    }
    return true;
}

void printUsage(const char* exe, const char* extraHelp) {
    std::cout
        << ZIMP_APPNAME << " " << ZIMP_VERSION << "\n"
        << "Usage: " << (exe ? exe : "zimp") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Shuffle the decks with a specific seed\n"
        << "  --settings <path>    Settings file (created with defaults if missing)\n"
        << "  --content <path>     Content override INI (tiles, clock, cards, items)\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
    if (extraHelp) std::cout << "\n" << extraHelp;
}

bool prepareLaunch(const LaunchOptions& opts, LaunchSetup& out, std::string* err, std::string* warnings) {
    std::error_code ec;
    if (!std::filesystem::exists(opts.settingsPath, ec)) {
        if (!writeDefaultSettings(opts.settingsPath) && warnings) {
            *warnings += "Could not write default settings to " + opts.settingsPath + "\n";
        }
    }
    out.settings = loadSettings(opts.settingsPath);

    out.content = defaultContent();
    const std::string contentPath = opts.contentPath ? *opts.contentPath : out.settings.contentFile;
    if (!contentPath.empty()) {
        std::string w;
        if (!loadContentIni(contentPath, out.content, &w)) {
            if (err) *err = "Could not read content file: " + contentPath;
            return false;
        }
        if (warnings && !w.empty()) *warnings += w + "\n";
    }

    std::string why;
    if (!validateContent(out.content, &why)) {
        if (err) *err = "Unusable content: " + why;
        return false;
    }

    uint32_t seed = opts.seed ? *opts.seed : out.settings.seed;
    if (seed == 0) seed = timeSeed();
    out.config = toGameConfig(out.settings, seed);
    return true;
}
