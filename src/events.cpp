#include "events.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string foldName(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

const EventContent& emptyContent() {
    static const EventContent e{EventKind::Health, 0, "Nothing happens."};
    return e;
}

} // namespace

bool parseEventKind(const std::string& raw, EventKind& out) {
    const std::string s = foldName(raw);
    if (s == "zombies" || s == "zombie") { out = EventKind::Zombies; return true; }
    if (s == "item" || s == "items") { out = EventKind::Item; return true; }
    if (s == "health" || s == "heal" || s == "damage") { out = EventKind::Health; return true; }
    return false;
}

const EventContent& EventCard::contentAt(int hourIndex) const {
    if (contents.empty()) return emptyContent();
    const int last = static_cast<int>(contents.size()) - 1;
    return contents[static_cast<size_t>(std::clamp(hourIndex, 0, last))];
}

std::string describeEvent(const EventContent& e) {
    std::ostringstream ss;
    if (!e.text.empty()) ss << e.text << " ";
    switch (e.kind) {
        case EventKind::Zombies:
            ss << "(" << e.value << (e.value == 1 ? " ZOMBIE)" : " ZOMBIES)");
            break;
        case EventKind::Item:
            ss << "(ITEM)";
            break;
        case EventKind::Health:
            if (e.value > 0) ss << "(+" << e.value << " HEALTH)";
            else if (e.value < 0) ss << "(" << e.value << " HEALTH)";
            else ss << "(NOTHING HAPPENS)";
            break;
    }
    return ss.str();
}

std::vector<ItemDef> defaultItemDefs() {
    return {
        {"Oil",              0, 0, true},
        {"Gasoline",         0, 0, false},
        {"Board with Nails", 1, 0, false},
        {"Machete",          2, 0, false},
        {"Grisly Femur",     1, 0, false},
        {"Golf Club",        1, 0, false},
        {"Chainsaw",         3, 0, false},
        {"Soda Can",         0, 2, false},
        {"Candle",           0, 0, false},
    };
}

const ItemDef* findItemDef(const std::vector<ItemDef>& defs, const std::string& name) {
    const std::string key = foldName(name);
    for (const ItemDef& d : defs) {
        if (foldName(d.name) == key) return &d;
    }
    return nullptr;
}
