#pragma once

#include "events.hpp"
#include "tile.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Names of the rooms with special rules. Matched exactly against Tile::name.
struct RoomRules {
    std::string startRoom = "Foyer";
    std::string companionRoom = "Patio";      // placed next to the anchor room
    std::string companionAnchor = "Dining Room";
    std::string totemFindRoom = "Evil Temple";
    std::string totemBuryRoom = "Graveyard";
    std::vector<std::string> healRooms = {"Kitchen", "Garden"}; // +1 health after an event
    std::vector<std::string> scavengeRooms = {"Storage"};       // extra item after an event
};

// Everything the board needs to start a game: the tile supply for both decks,
// the development cards, the clock and the item table.
struct GameContent {
    std::vector<Tile> indoorTiles;
    std::vector<Tile> outdoorTiles;
    std::vector<EventCard> eventCards;
    std::vector<std::string> clockLabels;
    std::vector<ItemDef> items;

    // Which deck a room's unexplored neighbours come from, keyed by folded room
    // name ("diningroom"). Rooms without an entry use their own category.
    std::map<std::string, TileCategory> neighborRules;

    RoomRules rooms;

    // Hash of the override file (FNV-1a 64-bit), 0 for stock content.
    uint64_t sourceHash = 0;
};

// Stock Zombie-in-my-Pocket content.
GameContent defaultContent();

// Applies a user-editable INI-ish override file on top of `content`.
// Returns false only if the file could not be read. Parsing issues are reported in outWarnings.
bool loadContentIni(const std::string& path, GameContent& content, std::string* outWarnings = nullptr);

// Rejects content the engine cannot play (no start room, clock/card mismatch, ...).
bool validateContent(const GameContent& content, std::string* err = nullptr);

// "Dining Room" -> "diningroom". Used for rule keys and INI ids.
std::string foldRoomName(const std::string& name);
