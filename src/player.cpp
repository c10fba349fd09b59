#include "player.hpp"

#include <algorithm>
#include <sstream>

bool Player::removeItem(const std::string& name) {
    auto it = std::find(items.begin(), items.end(), name);
    if (it == items.end()) return false;
    items.erase(it);
    return true;
}

std::string Player::detailsText() const {
    std::ostringstream ss;
    ss << "Location: " << coordToString(location)
       << ", Health: " << health
       << ", Attack: " << attack
       << ", Items: " << itemsText()
       << ", Totem: " << (hasTotem ? "yes" : "no");
    return ss.str();
}
