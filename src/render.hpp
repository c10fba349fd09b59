#pragma once
#include "sdl.hpp"

#include "common.hpp"
#include "game.hpp"
#include "tile.hpp"

#include <deque>
#include <map>
#include <optional>
#include <string>

// SDL board viewer. It never reads the engine directly: everything it draws
// arrives through the GameObserver callbacks returned by observer().
class Renderer {
public:
    Renderer(int viewCols, int viewRows, int tileSize, int hudHeight, bool vsync);
    ~Renderer();

    bool init();
    void shutdown();

    void render();

    // Window controls
    void toggleFullscreen();

    // Callbacks that keep the cached board/HUD state in sync with a Game.
    // The Renderer must outlive the registration.
    GameObserver observer();

    // An in-turn question shown over the HUD until cleared.
    void setPrompt(const ChoiceRequest& req);
    void clearPrompt();

private:
    void drawBoard();
    void drawRoom(const TileView& t, const SDL_Rect& cell, bool playerHere);
    void drawHud();
    void drawPrompt();
    void fillRect(const SDL_Rect& r, Color c);

    // Top-left board coordinate of the view, centered on the player.
    Coord viewOrigin() const;

    static constexpr size_t MAX_LOG_LINES = 6;

    int cols = 7;
    int rows = 5;
    int winW = 0;
    int winH = 0;
    int tile = 96;
    int hudH = 160;
    bool vsyncEnabled = false;

    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    // Cached engine state (observer side)
    std::map<Coord, TileView> rooms;
    GameSnapshot snap;
    bool haveSnapshot = false;
    std::deque<Message> recent;
    std::optional<ChoiceRequest> prompt;
    std::string endText;
    GameOutcome outcome = GameOutcome::InProgress;
};
