#include "sdl.hpp"

#include <iostream>
#include <string>

#include "game.hpp"
#include "launch.hpp"
#include "render.hpp"
#include "version.hpp"

namespace {

constexpr int VIEW_COLS = 7;
constexpr int VIEW_ROWS = 5;

std::string directionKeyAnswer(SDL_Keycode key) {
    switch (key) {
        case SDLK_UP:    case SDLK_n: return "N";
        case SDLK_RIGHT: case SDLK_e: return "E";
        case SDLK_DOWN:  case SDLK_s: return "S";
        case SDLK_LEFT:  case SDLK_w: return "W";
        default:                      return std::string();
    }
}

// Maps a key press to an answer for the pending question ("" = not an answer).
std::string keyAnswer(const ChoiceRequest& req, SDL_Keycode key) {
    switch (req.kind) {
        case ChoiceKind::EntrySide:
        case ChoiceKind::EscapeDirection:
            return directionKeyAnswer(key);
        case ChoiceKind::FightOrRun:
            if (key == SDLK_f) return "F";
            if (key == SDLK_r) return "R";
            return std::string();
        case ChoiceKind::ReplaceItem:
            if (key == SDLK_y) return "Y";
            if (key == SDLK_n) return "N";
            return std::string();
        case ChoiceKind::ItemToReplace:
            if (key >= SDLK_1 && key <= SDLK_9) {
                const size_t idx = static_cast<size_t>(key - SDLK_1);
                if (idx < req.options.size()) return req.options[idx];
            }
            return std::string();
        default:
            return std::string();
    }
}

bool arrowDirection(SDL_Keycode key, Direction& out) {
    switch (key) {
        case SDLK_UP:    out = Direction::North; return true;
        case SDLK_RIGHT: out = Direction::East;  return true;
        case SDLK_DOWN:  out = Direction::South; return true;
        case SDLK_LEFT:  out = Direction::West;  return true;
        default:         return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    LaunchOptions opts;
    std::string err;
    if (!parseLaunchArgs(argc, argv, opts, &err)) {
        std::cerr << err << "\n";
        printUsage(argc > 0 ? argv[0] : "zimp");
        return 2;
    }
    if (opts.showHelp) {
        printUsage(argc > 0 ? argv[0] : "zimp");
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

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    Renderer renderer(VIEW_COLS, VIEW_ROWS, setup.settings.tileSize, setup.settings.hudHeight, setup.settings.vsync);
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }

    Game game(setup.content, setup.config);
    game.addObserver(renderer.observer());
    game.pushSystemMessage("FIND THE TOTEM IN THE " + toUpper(setup.content.rooms.totemFindRoom) + " AND BURY IT IN THE "
                           + toUpper(setup.content.rooms.totemBuryRoom) + ".");

    bool running = true;

    // In-turn questions block here until a matching key is pressed.
    game.setChoiceProvider([&renderer, &running](const ChoiceRequest& req) {
        if (!running && !req.options.empty()) return req.options.front();

        renderer.setPrompt(req);
        std::string answer;
        while (answer.empty()) {
            SDL_Event ev;
            while (SDL_PollEvent(&ev)) {
                if (ev.type == SDL_QUIT) {
                    // Let the running action finish with the default answer.
                    running = false;
                    answer = req.options.empty() ? std::string("N") : req.options.front();
                    break;
                }
                if (ev.type == SDL_KEYDOWN && ev.key.repeat == 0) {
                    answer = keyAnswer(req, ev.key.keysym.sym);
                    if (!answer.empty()) break;
                }
            }
            renderer.render();
            SDL_Delay(16);
        }
        renderer.clearPrompt();
        return answer;
    });

    while (running) {
        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            if (ev.type == SDL_QUIT) {
                running = false;
                break;
            }
            if (ev.type != SDL_KEYDOWN || ev.key.repeat != 0) continue;

            const SDL_Keycode key = ev.key.keysym.sym;
            const bool shift = (ev.key.keysym.mod & KMOD_SHIFT) != 0;

            if (key == SDLK_ESCAPE) {
                running = false;
                break;
            }
            if (key == SDLK_F11) {
                renderer.toggleFullscreen();
                continue;
            }
            if (game.isFinished()) continue;

            Direction d = Direction::North;
            if (arrowDirection(key, d)) {
                if (shift) game.bash(d);
                else game.move(d);
            } else if (key == SDLK_c) {
                game.cower();
            } else if (key == SDLK_t) {
                game.findOrBuryTotem();
            } else if (key == SDLK_i) {
                game.inspect();
            }
        }

        renderer.render();
        SDL_Delay(16);
    }

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
