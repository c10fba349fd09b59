#include "game.hpp"
#include "launch.hpp"
#include "version.hpp"

#include <algorithm>
#include <climits>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

const char* COMMAND_HELP =
    "Commands:\n"
    "  go <dir>      Move through an exit (n/e/s/w also work on their own)\n"
    "  bash <dir>    Break through a wall (after a completed move)\n"
    "  cower         Hide for a turn: +3 health, one card is discarded\n"
    "  totem         Search for the totem / bury it\n"
    "  details       Show location, health, attack and items\n"
    "  map           Show the explored house\n"
    "  help          Show this list\n"
    "  quit          Leave the game\n";

const char* messagePrefix(MessageKind k) {
    switch (k) {
        case MessageKind::Combat:  return "! ";
        case MessageKind::Loot:    return "+ ";
        case MessageKind::System:  return "* ";
        case MessageKind::Warning: return "? ";
        case MessageKind::Success: return "# ";
        case MessageKind::Info:
        default:                   return "  ";
    }
}

std::string lowerWord(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

// One 7-character cell per room: the first letters of its name, '@' for the player.
std::string renderMap(const Game& game) {
    const auto& tiles = game.board().tiles();
    if (tiles.empty()) return "(nothing explored)\n";

    int minR = INT_MAX, maxR = INT_MIN, minC = INT_MAX, maxC = INT_MIN;
    for (const auto& kv : tiles) {
        minR = std::min(minR, kv.first.row);
        maxR = std::max(maxR, kv.first.row);
        minC = std::min(minC, kv.first.col);
        maxC = std::max(maxC, kv.first.col);
    }

    std::ostringstream ss;
    for (int r = minR; r <= maxR; ++r) {
        std::string top, mid;
        for (int c = minC; c <= maxC; ++c) {
            const Tile* t = game.board().tileAt(Coord{r, c});
            if (!t) {
                top += "       ";
                mid += "       ";
                continue;
            }
            top += t->hasExit(Direction::North) ? "+-- --+" : "+-----+";
            std::string label = toUpper(t->name).substr(0, 3);
            while (label.size() < 3) label.push_back(' ');
            const bool here = game.player().location == Coord{r, c};
            mid += t->hasExit(Direction::West) ? ' ' : '|';
            mid += here ? '@' : ' ';
            mid += label;
            mid += ' ';
            mid += t->hasExit(Direction::East) ? ' ' : '|';
        }
        ss << top << "\n" << mid << "\n";

        std::string bottom;
        for (int c = minC; c <= maxC; ++c) {
            const Tile* t = game.board().tileAt(Coord{r, c});
            if (!t) bottom += "       ";
            else bottom += t->hasExit(Direction::South) ? "+-- --+" : "+-----+";
        }
        ss << bottom << "\n";
    }
    return ss.str();
}

void printStatus(const Game& game, bool asciiTiles) {
    const GameSnapshot s = game.snapshot();
    if (asciiTiles) std::cout << game.currentRoom().toAscii();
    std::cout << "Room: " << game.currentRoom().name
              << "  Exits: " << game.currentRoom().possibleExitsText() << "\n"
              << "Time: " << s.time << "  Cards: " << s.devCardsLeft
              << "  Indoor: " << s.indoorTilesLeft << "  Outdoor: " << s.outdoorTilesLeft << "\n"
              << "Health: " << s.health << "  Attack: " << s.attack
              << "  Items: " << joinList(s.items) << (s.hasTotem ? "  [TOTEM]" : "") << "\n";
}

} // namespace

int main(int argc, char** argv) {
    LaunchOptions opts;
    std::string err;
    if (!parseLaunchArgs(argc, argv, opts, &err)) {
        std::cerr << err << "\n";
        printUsage(argc > 0 ? argv[0] : "zimp_console", COMMAND_HELP);
        return 2;
    }
    if (opts.showHelp) {
        printUsage(argc > 0 ? argv[0] : "zimp_console", COMMAND_HELP);
        return 0;
    }
    if (opts.showVersion) {
        std::cout << ZIMP_APPNAME << " " << ZIMP_VERSION << "\n";
        return 0;
    }

    LaunchSetup setup;
    std::string warnings;
    if (!prepareLaunch(opts, setup, &err, &warnings)) {
        std::cerr << err << "\n";
        return 1;
    }
    if (!warnings.empty()) std::cerr << warnings;

    Game game(setup.content, setup.config);

    bool inputClosed = false;
    game.setChoiceProvider([&inputClosed](const ChoiceRequest& req) {
        std::cout << req.prompt << "\n> " << std::flush;
        std::string line;
        if (inputClosed || !std::getline(std::cin, line)) {
            // End of input: accept the first option so the running action can finish.
            inputClosed = true;
            return req.options.empty() ? std::string() : req.options.front();
        }
        return line;
    });

    GameObserver printer;
    printer.onMessage = [](const Message& m) {
        std::cout << messagePrefix(m.kind) << m.text;
        if (m.repeat > 1) std::cout << " (x" << m.repeat << ")";
        std::cout << "\n";
    };
    game.addObserver(std::move(printer));

    std::cout << ZIMP_APPNAME << " " << ZIMP_VERSION << " (seed " << setup.config.seed << ")\n"
              << "Type 'help' for commands.\n\n";
    game.pushSystemMessage("FIND THE TOTEM IN THE " + toUpper(setup.content.rooms.totemFindRoom) + " AND BURY IT IN THE "
                           + toUpper(setup.content.rooms.totemBuryRoom) + " BEFORE THE LAST CARD OF "
                           + toUpper(setup.content.clockLabels.back()) + ".");
    printStatus(game, setup.settings.asciiTiles);

    std::string line;
    while (!game.isFinished() && !inputClosed) {
        std::cout << "\n> " << std::flush;
        if (!std::getline(std::cin, line)) break;

        std::istringstream ss(line);
        std::string cmd, arg;
        ss >> cmd >> arg;
        cmd = lowerWord(cmd);
        if (cmd.empty()) continue;

        Direction d = Direction::North;
        if (cmd == "quit" || cmd == "exit" || cmd == "q") {
            break;
        } else if (cmd == "help" || cmd == "?") {
            std::cout << COMMAND_HELP;
            continue;
        } else if (cmd == "map") {
            std::cout << renderMap(game);
            continue;
        } else if (cmd == "details" || cmd == "inspect") {
            game.inspect();
            continue;
        } else if (cmd == "go" || cmd == "bash") {
            if (!parseDirection(arg, d)) {
                std::cout << "Usage: " << cmd << " <n|e|s|w>\n";
                continue;
            }
            if (cmd == "go") game.move(d);
            else game.bash(d);
        } else if (parseDirection(cmd, d)) {
            game.move(d);
        } else if (cmd == "cower") {
            game.cower();
        } else if (cmd == "totem") {
            game.findOrBuryTotem();
        } else {
            std::cout << "Unknown command '" << cmd << "'. Type 'help'.\n";
            continue;
        }

        if (!game.isFinished()) printStatus(game, setup.settings.asciiTiles);
    }

    if (game.isFinished()) {
        std::cout << "\n" << (game.isGameWon() ? "VICTORY" : "GAME OVER") << ": " << game.endCause() << "\n";
    }
    return game.isGameWon() ? 0 : (game.isFinished() ? 3 : 0);
}
