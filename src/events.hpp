#pragma once
#include <cstdint>
#include <string>
#include <vector>

// What a development card does at a given hour.
enum class EventKind : uint8_t {
    Zombies = 0, // value = number of zombies
    Item,        // draw the next card and take the item printed on it
    Health,      // value = signed health change
};

bool parseEventKind(const std::string& raw, EventKind& out);

struct EventContent {
    EventKind kind = EventKind::Health;
    int value = 0;
    std::string text;
};

// A development card. `name` is the item printed on the card; `contents` holds
// one entry per clock hour, in clock order.
struct EventCard {
    std::string name;
    std::vector<EventContent> contents;

    // Clamps out-of-range hours to the last entry.
    const EventContent& contentAt(int hourIndex) const;
};

std::string describeEvent(const EventContent& e);

// Effects of carrying an item.
struct ItemDef {
    std::string name;
    int attackBonus = 0;       // granted while carried
    int healthBonus = 0;       // applied once on pickup
    bool negatesEscapeDamage = false; // consumed instead of losing health when running away
};

// Stock item table of the base game.
std::vector<ItemDef> defaultItemDefs();

// Case-insensitive lookup. Returns nullptr for items without effects.
const ItemDef* findItemDef(const std::vector<ItemDef>& defs, const std::string& name);
