#pragma once
#include "common.hpp"

#include <string>
#include <vector>

struct Player {
    Coord location{};
    int health = 6;
    int attack = 1;

    // Soft capacity: picking up beyond it requires replacing a carried item.
    int itemCapacity = 2;
    std::vector<std::string> items;

    bool hasTotem = false;

    bool isDead() const { return health <= 0; }
    bool atCapacity() const { return static_cast<int>(items.size()) >= itemCapacity; }

    // Removes the first carried item called `name`. Returns false if not carried.
    bool removeItem(const std::string& name);

    std::string itemsText() const { return joinList(items); }

    // "Location: (3, 3), Health: 6, Attack: 1, Items: [], Totem: no"
    std::string detailsText() const;
};
