#pragma once
#include "common.hpp"
#include "content.hpp"
#include "deck.hpp"
#include "events.hpp"
#include "tile.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Result of drawing a room for an unexplored neighbour. `tile` is empty when
// the deck for `category` has run out.
struct TileDraw {
    std::optional<Tile> tile;
    TileCategory category = TileCategory::Indoor;
};

// The explored house: placed rooms keyed by coordinate, the two room decks,
// the development-card deck and the clock.
class Board {
public:
    // With shuffle=false every deck keeps the content order (scripted games).
    Board(const GameContent& content, Coord start, uint32_t seed, bool shuffle = true);

    bool isExplored(Coord c) const { return tiles_.count(c) != 0; }

    Tile* tileAt(Coord c);
    const Tile* tileAt(Coord c) const;

    // Creates or overwrites the room at c.
    void place(Coord c, Tile tile);

    // Draws from the deck that neighbours of `fromRoom` come from.
    TileDraw drawTile(const Tile& fromRoom);
    TileCategory neighborCategory(const Tile& room) const;

    // The companion room (patio), reserved at setup. Handed out once.
    std::optional<Tile> takeCompanion();
    bool hasCompanion() const { return companion_.has_value(); }

    // Development cards
    Deck<EventCard>& devCards() { return devCards_; }
    const Deck<EventCard>& devCards() const { return devCards_; }

    // Clock
    const std::string& time() const;
    int hourIndex() const { return hour_; }
    int hourCount() const { return static_cast<int>(clock_.size()); }
    bool isLastHour() const { return hour_ + 1 >= hourCount(); }

    // Advances the clock one label and starts a new pass of the development
    // cards. Returns false (and changes nothing) at the last label.
    bool updateTime();

    Deck<Tile>& indoorTiles() { return indoor_; }
    Deck<Tile>& outdoorTiles() { return outdoor_; }
    const Deck<Tile>& indoorTiles() const { return indoor_; }
    const Deck<Tile>& outdoorTiles() const { return outdoor_; }

    const std::map<Coord, Tile>& tiles() const { return tiles_; }

private:
    Deck<EventCard> buildDevCardPass() const;

    std::map<Coord, Tile> tiles_;
    Deck<Tile> indoor_;
    Deck<Tile> outdoor_;
    Deck<EventCard> devCards_;

    std::vector<EventCard> allCards_;
    std::vector<std::string> clock_;
    int hour_ = 0;

    std::map<std::string, TileCategory> neighborRules_;
    std::optional<Tile> companion_;

    Coord start_{};
    uint32_t seed_ = 0;
    bool shuffle_ = true;
};
