#include "render.hpp"
#include "ui_font.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace {

constexpr Color COL_BG{14, 12, 18, 255};
constexpr Color COL_GRID{28, 26, 34, 255};
constexpr Color COL_INDOOR{92, 70, 52, 255};
constexpr Color COL_OUTDOOR{46, 82, 50, 255};
constexpr Color COL_SPECIAL{78, 62, 104, 255};
constexpr Color COL_WALL{210, 200, 180, 255};
constexpr Color COL_TEXT{235, 235, 235, 255};
constexpr Color COL_DIM{150, 150, 160, 255};
constexpr Color COL_PLAYER{230, 60, 50, 255};
constexpr Color COL_TOTEM{240, 200, 70, 255};
constexpr Color COL_HUD{24, 22, 30, 235};
constexpr Color COL_PROMPT{40, 34, 54, 240};

Color roomColor(TileCategory c) {
    switch (c) {
        case TileCategory::Outdoor: return COL_OUTDOOR;
        case TileCategory::Special: return COL_SPECIAL;
        case TileCategory::Indoor:
        default:                    return COL_INDOOR;
    }
}

Color messageColor(MessageKind k) {
    switch (k) {
        case MessageKind::Combat:  return {240, 110, 100, 255};
        case MessageKind::Loot:    return {240, 210, 120, 255};
        case MessageKind::System:  return {150, 190, 240, 255};
        case MessageKind::Warning: return {240, 170, 80, 255};
        case MessageKind::Success: return {130, 230, 130, 255};
        case MessageKind::Info:
        default:                   return COL_TEXT;
    }
}

} // namespace

Renderer::Renderer(int viewCols, int viewRows, int tileSize, int hudHeight, bool vsync)
    : cols(viewCols), rows(viewRows), tile(tileSize), hudH(hudHeight), vsyncEnabled(vsync) {
    winW = cols * tile;
    winH = rows * tile + hudH;
}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(ZIMP_APPNAME) + " v" + ZIMP_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Fixed logical resolution; SDL scales the output when the window is resized.
    SDL_RenderSetLogicalSize(renderer, winW, winH);

    initialized = true;
    return true;
}

void Renderer::shutdown() {
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }
    initialized = false;
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    const Uint32 flags = SDL_GetWindowFlags(window);
    const bool isFs = (flags & SDL_WINDOW_FULLSCREEN_DESKTOP) != 0;
    SDL_SetWindowFullscreen(window, isFs ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP);
}

GameObserver Renderer::observer() {
    GameObserver o;
    o.onSnapshot = [this](const GameSnapshot& s) {
        snap = s;
        haveSnapshot = true;
    };
    o.onTilePlaced = [this](const TilePlacedEvent& ev) {
        rooms[ev.pos] = ev.tile;
    };
    o.onMessage = [this](const Message& m) {
        // A repeated message arrives again with a higher counter.
        if (!recent.empty() && recent.back().text == m.text && recent.back().kind == m.kind) {
            recent.back() = m;
            return;
        }
        recent.push_back(m);
        while (recent.size() > MAX_LOG_LINES) recent.pop_front();
    };
    o.onGameEnded = [this](GameOutcome out, const std::string& cause) {
        outcome = out;
        endText = cause;
    };
    return o;
}

void Renderer::setPrompt(const ChoiceRequest& req) {
    prompt = req;
}

void Renderer::clearPrompt() {
    prompt.reset();
}

void Renderer::fillRect(const SDL_Rect& r, Color c) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_RenderFillRect(renderer, &r);
}

Coord Renderer::viewOrigin() const {
    const Coord center = haveSnapshot ? snap.location : Coord{3, 3};
    return Coord{center.row - rows / 2, center.col - cols / 2};
}

void Renderer::render() {
    if (!renderer) return;

    SDL_SetRenderDrawColor(renderer, COL_BG.r, COL_BG.g, COL_BG.b, COL_BG.a);
    SDL_RenderClear(renderer);

    drawBoard();
    drawHud();
    if (prompt) drawPrompt();

    SDL_RenderPresent(renderer);
}

void Renderer::drawBoard() {
    const Coord origin = viewOrigin();
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const SDL_Rect cell{c * tile, r * tile, tile, tile};
            const Coord pos{origin.row + r, origin.col + c};

            auto it = rooms.find(pos);
            if (it == rooms.end()) {
                fillRect(SDL_Rect{cell.x + 1, cell.y + 1, cell.w - 2, cell.h - 2}, COL_GRID);
                continue;
            }
            drawRoom(it->second, cell, haveSnapshot && snap.location == pos);
        }
    }
}

void Renderer::drawRoom(const TileView& t, const SDL_Rect& cell, bool playerHere) {
    fillRect(cell, roomColor(t.category));

    // Walls with a door gap in the middle of each open side.
    const int wall = std::max(2, tile / 16);
    const int gap = tile / 3;
    const int gapStart = (tile - gap) / 2;
    for (Direction d : ALL_DIRECTIONS) {
        const bool open = t.exits[static_cast<size_t>(dirIndex(d))];
        const bool horizontal = (d == Direction::North || d == Direction::South);
        SDL_Rect a{}, b{};
        if (horizontal) {
            const int y = (d == Direction::North) ? cell.y : cell.y + tile - wall;
            a = {cell.x, y, open ? gapStart : tile, wall};
            b = {cell.x + gapStart + gap, y, tile - gapStart - gap, wall};
        } else {
            const int x = (d == Direction::West) ? cell.x : cell.x + tile - wall;
            a = {x, cell.y, wall, open ? gapStart : tile};
            b = {x, cell.y + gapStart + gap, wall, tile - gapStart - gap};
        }
        fillRect(a, COL_WALL);
        if (open) fillRect(b, COL_WALL);
    }

    const int scale = tile >= 96 ? 2 : 1;
    const int margin = wall + 3;
    drawTextWrapped5x7(renderer, cell.x + margin, cell.y + margin, scale > 1 && t.name.size() > 7 ? 1 : scale,
                       COL_TEXT, t.name, tile - 2 * margin);

    if (playerHere) {
        const int sz = tile / 4;
        const SDL_Rect marker{cell.x + (tile - sz) / 2, cell.y + tile - sz - margin - sz / 2, sz, sz};
        fillRect(marker, (haveSnapshot && snap.hasTotem) ? COL_TOTEM : COL_PLAYER);
    }
}

void Renderer::drawHud() {
    const SDL_Rect hud{0, rows * tile, winW, hudH};
    fillRect(hud, COL_HUD);

    const int x = 8;
    int y = hud.y + 8;
    const int lineH = lineAdvance(1) + 2;

    if (haveSnapshot) {
        std::ostringstream a;
        a << "TIME " << snap.time << "   CARDS " << snap.devCardsLeft
          << "   INDOOR " << snap.indoorTilesLeft << "   OUTDOOR " << snap.outdoorTilesLeft;
        drawText5x7(renderer, x, y, 1, COL_TEXT, a.str());
        y += lineH;

        std::ostringstream b;
        b << "HEALTH " << snap.health << "   ATTACK " << snap.attack << "   ITEMS " << joinList(snap.items)
          << (snap.hasTotem ? "   TOTEM" : "");
        drawText5x7(renderer, x, y, 1, snap.health <= 2 ? COL_PLAYER : COL_TEXT, b.str());
        y += lineH;
    }

    y += 4;
    for (const Message& m : recent) {
        std::string line = m.text;
        if (m.repeat > 1) line += " (X" + std::to_string(m.repeat) + ")";
        y += drawTextWrapped5x7(renderer, x, y, 1, messageColor(m.kind), line, winW - 2 * x) * lineH;
        if (y > hud.y + hudH - lineH) break;
    }

    if (outcome != GameOutcome::InProgress) {
        const std::string t = (outcome == GameOutcome::Won ? "VICTORY! " : "GAME OVER. ") + std::string("PRESS ESC");
        drawText5x7(renderer, winW - textWidth5x7(t, 1) - 8, hud.y + 8, 1, COL_TOTEM, t);
    } else {
        const std::string keys = "ARROWS MOVE  SHIFT+ARROWS BASH  C COWER  T TOTEM  I DETAILS";
        drawText5x7(renderer, x, hud.y + hudH - lineH, 1, COL_DIM, keys);
    }
}

void Renderer::drawPrompt() {
    std::string opts;
    for (size_t i = 0; i < prompt->options.size(); ++i) {
        if (i) opts += "  ";
        if (prompt->kind == ChoiceKind::ItemToReplace) opts += std::to_string(i + 1) + ":";
        opts += prompt->options[i];
    }

    const int w = std::min(winW - 32, std::max(textWidth5x7(prompt->prompt, 2), textWidth5x7(opts, 2)) + 24);
    const int h = 4 * lineAdvance(2) + 16;
    const SDL_Rect box{(winW - w) / 2, (rows * tile - h) / 2, w, h};
    fillRect(box, COL_PROMPT);

    int y = box.y + 10;
    y += drawTextWrapped5x7(renderer, box.x + 12, y, 2, COL_TEXT, prompt->prompt, box.w - 24) * lineAdvance(2);
    drawTextWrapped5x7(renderer, box.x + 12, y + 4, 2, COL_TOTEM, opts, box.w - 24);
}
