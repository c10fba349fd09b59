#include "content.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

uint64_t fnv1a64(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint64_t h = 14695981039346656037ull;
    for (size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint64_t>(p[i]);
        h *= 1099511628211ull;
    }
    return h;
}

std::string ltrim(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

bool parseInt(const std::string& raw, int& out) {
    const std::string t = trim(raw);
    if (t.empty()) return false;
    try {
        size_t idx = 0;
        const int v = std::stoi(t, &idx, 10);
        if (idx != t.size()) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseBool(const std::string& raw, bool& out) {
    const std::string v = toLower(trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

std::vector<std::string> splitDot(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '.') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<std::string> splitComma(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            cur = trim(cur);
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    cur = trim(cur);
    if (!cur.empty()) out.push_back(cur);
    return out;
}

void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}

// "evil_temple" -> "Evil Temple"
std::string displayNameFromId(const std::string& id) {
    std::string out;
    bool startWord = true;
    for (char c : id) {
        if (c == '_' || c == '-') {
            if (!out.empty() && out.back() != ' ') out.push_back(' ');
            startWord = true;
            continue;
        }
        const unsigned char uc = static_cast<unsigned char>(c);
        out.push_back(static_cast<char>(startWord ? std::toupper(uc) : uc));
        startWord = false;
    }
    return trim(out);
}

bool parseCategory(const std::string& raw, TileCategory& out) {
    const std::string v = toLower(trim(raw));
    if (v == "indoor" || v == "inside") { out = TileCategory::Indoor; return true; }
    if (v == "outdoor" || v == "outside") { out = TileCategory::Outdoor; return true; }
    return false;
}

// "zombies 4 | Zombies crash through the window" / "item" / "health -1 | Ouch"
bool parseEventEntry(const std::string& raw, EventContent& out) {
    std::string head = raw;
    std::string text;
    const size_t bar = raw.find('|');
    if (bar != std::string::npos) {
        head = raw.substr(0, bar);
        text = trim(raw.substr(bar + 1));
    }

    std::istringstream iss(trim(head));
    std::string kindTok;
    if (!(iss >> kindTok)) return false;

    EventContent e;
    if (!parseEventKind(kindTok, e.kind)) return false;

    std::string valueTok;
    if (iss >> valueTok) {
        if (!parseInt(valueTok, e.value)) return false;
    } else if (e.kind != EventKind::Item) {
        return false;
    }

    std::string extra;
    if (iss >> extra) return false;

    e.text = text;
    out = e;
    return true;
}

Tile makeTile(const char* name, const char* exits, TileCategory cat, uint32_t visual) {
    return Tile(name, exitsFromString(exits), cat, visual);
}

EventContent ev(EventKind kind, int value, const char* text) {
    return EventContent{kind, value, text};
}

std::vector<Tile>* tilesForCategory(GameContent& c, TileCategory cat) {
    return (cat == TileCategory::Outdoor) ? &c.outdoorTiles : &c.indoorTiles;
}

} // namespace

std::string foldRoomName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

GameContent defaultContent() {
    GameContent c;

    // Visual handles are the sprite indices of the 4x2 tile sheets.
    c.indoorTiles = {
        makeTile("Foyer",       "N",    TileCategory::Indoor, 0),
        makeTile("Bathroom",    "N",    TileCategory::Indoor, 1),
        makeTile("Kitchen",     "NE",   TileCategory::Indoor, 2),
        makeTile("Storage",     "N",    TileCategory::Indoor, 3),
        makeTile("Evil Temple", "NW",   TileCategory::Indoor, 4),
        makeTile("Family Room", "NEW",  TileCategory::Indoor, 5),
        makeTile("Dining Room", "NESW", TileCategory::Indoor, 6),
        makeTile("Bedroom",     "NW",   TileCategory::Indoor, 7),
    };

    // The patio's south side faces the dining room when it sits above it unrotated.
    c.outdoorTiles = {
        makeTile("Patio",        "ESW", TileCategory::Outdoor, 0),
        makeTile("Garden",       "NEW", TileCategory::Outdoor, 1),
        makeTile("Sitting Area", "NEW", TileCategory::Outdoor, 2),
        makeTile("Graveyard",    "NE",  TileCategory::Outdoor, 3),
        makeTile("Yard",         "NES", TileCategory::Outdoor, 4),
        makeTile("Yard",         "NEW", TileCategory::Outdoor, 5),
        makeTile("Yard",         "NS",  TileCategory::Outdoor, 6),
        makeTile("Garage",       "NW",  TileCategory::Outdoor, 7),
    };

    c.clockLabels = {"9 PM", "10 PM", "11 PM"};

    using K = EventKind;
    c.eventCards = {
        {"Oil", {
            ev(K::Health, 0, "You try hard not to wet yourself."),
            ev(K::Item, 0, "You find something useful."),
            ev(K::Zombies, 6, "A horde shambles out of the dark."),
        }},
        {"Gasoline", {
            ev(K::Zombies, 4, "Zombies crash through the window."),
            ev(K::Health, -1, "A bat flies into your face."),
            ev(K::Item, 0, "You find something useful."),
        }},
        {"Board with Nails", {
            ev(K::Item, 0, "You find something useful."),
            ev(K::Zombies, 4, "Zombies claw at the door."),
            ev(K::Health, -1, "You step on broken glass."),
        }},
        {"Machete", {
            ev(K::Zombies, 4, "Zombies crawl out from under the floor."),
            ev(K::Health, 0, "You hear terrible screams."),
            ev(K::Zombies, 6, "A horde shambles out of the dark."),
        }},
        {"Grisly Femur", {
            ev(K::Item, 0, "You find something useful."),
            ev(K::Health, 1, "You find a first-aid kit."),
            ev(K::Zombies, 5, "Zombies stagger towards you."),
        }},
        {"Golf Club", {
            ev(K::Health, -1, "Your soul isn't wanted here."),
            ev(K::Item, 0, "You find something useful."),
            ev(K::Zombies, 4, "Zombies claw at the door."),
        }},
        {"Chainsaw", {
            ev(K::Zombies, 3, "A few zombies block your path."),
            ev(K::Health, -1, "Something slimy bites your ankle."),
            ev(K::Zombies, 5, "Zombies stagger towards you."),
        }},
        {"Soda Can", {
            ev(K::Health, 1, "You find a vending machine."),
            ev(K::Item, 0, "You find something useful."),
            ev(K::Zombies, 4, "Zombies crash through the window."),
        }},
        {"Candle", {
            ev(K::Health, 0, "Your body shivers involuntarily."),
            ev(K::Health, 1, "You catch your breath."),
            ev(K::Zombies, 4, "Zombies crawl out from under the floor."),
        }},
    };

    c.items = defaultItemDefs();

    c.neighborRules[foldRoomName("Foyer")] = TileCategory::Indoor;
    c.neighborRules[foldRoomName("Patio")] = TileCategory::Outdoor;

    return c;
}

bool loadContentIni(const std::string& path, GameContent& content, std::string* outWarnings) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (outWarnings) *outWarnings = "Could not open content file: " + path;
        return false;
    }

    std::string contents;
    {
        std::ostringstream oss;
        oss << f.rdbuf();
        contents = oss.str();
    }

    content.sourceHash = fnv1a64(contents.data(), contents.size());

    std::istringstream iss(contents);
    std::string line;

    std::string warnings;
    int warnCount = 0;

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        stripUtf8Bom(line);

        // Strip comments (# or ;) but do not attempt to handle quoted strings.
        size_t commentPos = std::string::npos;
        size_t pHash = line.find('#');
        size_t pSemi = line.find(';');
        if (pHash != std::string::npos) commentPos = pHash;
        if (pSemi != std::string::npos) commentPos = std::min(commentPos, pSemi);
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        line = trim(std::move(line));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        if (key.empty()) {
            appendWarning(warnings, lineNo, "Empty key", warnCount);
            continue;
        }

        std::vector<std::string> toks = splitDot(key);
        if (toks.empty()) continue;

        const std::string head = toks[0];

        if (head == "clock") {
            std::vector<std::string> labels = splitComma(val);
            if (labels.empty()) {
                appendWarning(warnings, lineNo, "Clock needs at least one label", warnCount);
                continue;
            }
            content.clockLabels = labels;
        } else if (head == "tile") {
            if (toks.size() != 3) {
                appendWarning(warnings, lineNo, "Tile key should be tile.<indoor|outdoor>.<id>", warnCount);
                continue;
            }
            TileCategory cat;
            if (!parseCategory(toks[1], cat)) {
                appendWarning(warnings, lineNo, "Unknown tile deck: " + toks[1], warnCount);
                continue;
            }
            std::vector<Tile>& tiles = *tilesForCategory(content, cat);
            const std::string id = foldRoomName(toks[2]);
            const std::string v = toLower(val);

            if (v == "none" || v == "remove") {
                tiles.erase(std::remove_if(tiles.begin(), tiles.end(),
                                           [&](const Tile& t) { return foldRoomName(t.name) == id; }),
                            tiles.end());
                continue;
            }

            const ExitSet exits = exitsFromString(val);
            if (exitsToString(exits).empty()) {
                appendWarning(warnings, lineNo, "Tile needs at least one exit (N, E, S, W)", warnCount);
                continue;
            }

            auto it = std::find_if(tiles.begin(), tiles.end(),
                                   [&](const Tile& t) { return foldRoomName(t.name) == id; });
            if (it != tiles.end()) {
                it->exits = exits;
            } else {
                tiles.emplace_back(displayNameFromId(toks[2]), exits, cat, static_cast<uint32_t>(tiles.size()));
            }
        } else if (head == "card") {
            if (toks.size() != 3) {
                appendWarning(warnings, lineNo, "Card key should be card.<n>.<item|hour>", warnCount);
                continue;
            }
            int n = 0;
            if (!parseInt(toks[1], n) || n < 1 || n > static_cast<int>(content.eventCards.size()) + 1) {
                appendWarning(warnings, lineNo, "Card number out of range: " + toks[1], warnCount);
                continue;
            }
            if (n == static_cast<int>(content.eventCards.size()) + 1) {
                content.eventCards.emplace_back();
            }
            EventCard& card = content.eventCards[static_cast<size_t>(n - 1)];

            if (toks[2] == "item") {
                if (val.empty()) {
                    appendWarning(warnings, lineNo, "Card item must not be empty", warnCount);
                    continue;
                }
                card.name = val;
                continue;
            }

            int hour = 0;
            if (!parseInt(toks[2], hour) || hour < 1 || hour > 24) {
                appendWarning(warnings, lineNo, "Card hour should be 1.." + std::to_string(24), warnCount);
                continue;
            }
            EventContent e;
            if (!parseEventEntry(val, e)) {
                appendWarning(warnings, lineNo, "Invalid event (expected: zombies <n> | health <n> | item)", warnCount);
                continue;
            }
            if (card.contents.size() < static_cast<size_t>(hour)) {
                card.contents.resize(static_cast<size_t>(hour));
            }
            card.contents[static_cast<size_t>(hour - 1)] = e;
        } else if (head == "item") {
            if (toks.size() != 3) {
                appendWarning(warnings, lineNo, "Item key should be item.<id>.<field>", warnCount);
                continue;
            }
            const std::string id = foldRoomName(toks[1]);
            auto it = std::find_if(content.items.begin(), content.items.end(),
                                   [&](const ItemDef& d) { return foldRoomName(d.name) == id; });
            if (it == content.items.end()) {
                ItemDef d;
                d.name = displayNameFromId(toks[1]);
                content.items.push_back(d);
                it = content.items.end() - 1;
            }

            const std::string& field = toks[2];
            int iv = 0;
            bool bv = false;
            if (field == "attack" || field == "atk") {
                if (!parseInt(val, iv)) {
                    appendWarning(warnings, lineNo, "Invalid int for attack", warnCount);
                    continue;
                }
                it->attackBonus = iv;
            } else if (field == "health" || field == "heal") {
                if (!parseInt(val, iv)) {
                    appendWarning(warnings, lineNo, "Invalid int for health", warnCount);
                    continue;
                }
                it->healthBonus = iv;
            } else if (field == "negates_escape" || field == "negates_escape_damage") {
                if (!parseBool(val, bv)) {
                    appendWarning(warnings, lineNo, "Invalid bool for negates_escape", warnCount);
                    continue;
                }
                it->negatesEscapeDamage = bv;
            } else {
                appendWarning(warnings, lineNo, "Unknown item field: " + field, warnCount);
            }
        } else if (head == "neighbor") {
            if (toks.size() != 2) {
                appendWarning(warnings, lineNo, "Neighbor key should be neighbor.<room id>", warnCount);
                continue;
            }
            TileCategory cat;
            if (!parseCategory(val, cat)) {
                appendWarning(warnings, lineNo, "Neighbor deck should be indoor or outdoor", warnCount);
                continue;
            }
            content.neighborRules[foldRoomName(toks[1])] = cat;
        } else if (head == "room") {
            if (toks.size() != 2 || val.empty()) {
                appendWarning(warnings, lineNo, "Room key should be room.<role> = <name>", warnCount);
                continue;
            }
            RoomRules& r = content.rooms;
            const std::string& role = toks[1];
            if (role == "start") r.startRoom = val;
            else if (role == "companion") r.companionRoom = val;
            else if (role == "anchor") r.companionAnchor = val;
            else if (role == "totem_find") r.totemFindRoom = val;
            else if (role == "totem_bury") r.totemBuryRoom = val;
            else if (role == "heal") r.healRooms = splitComma(val);
            else if (role == "scavenge") r.scavengeRooms = splitComma(val);
            else appendWarning(warnings, lineNo, "Unknown room role: " + role, warnCount);
        } else {
            appendWarning(warnings, lineNo, "Unknown key group: " + head, warnCount);
            continue;
        }
    }

    if (outWarnings) {
        *outWarnings = warnings;
    }

    return true;
}

bool validateContent(const GameContent& content, std::string* err) {
    auto fail = [&](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };

    if (content.clockLabels.empty()) return fail("Clock has no labels.");
    if (content.eventCards.empty()) return fail("There are no development cards.");

    for (size_t i = 0; i < content.eventCards.size(); ++i) {
        const EventCard& card = content.eventCards[i];
        if (card.name.empty()) {
            return fail("Development card " + std::to_string(i + 1) + " has no item.");
        }
        if (card.contents.size() != content.clockLabels.size()) {
            return fail("Development card " + std::to_string(i + 1) + " (" + card.name + ") has "
                        + std::to_string(card.contents.size()) + " hours, the clock has "
                        + std::to_string(content.clockLabels.size()) + ".");
        }
    }

    const bool hasStart = std::any_of(content.indoorTiles.begin(), content.indoorTiles.end(),
                                      [&](const Tile& t) { return t.name == content.rooms.startRoom; });
    if (!hasStart) return fail("Indoor tiles have no start room (" + content.rooms.startRoom + ").");

    for (const Tile& t : content.indoorTiles) {
        if (t.possibleExits().empty()) return fail("Indoor tile " + t.name + " has no exits.");
    }
    for (const Tile& t : content.outdoorTiles) {
        if (t.possibleExits().empty()) return fail("Outdoor tile " + t.name + " has no exits.");
    }

    return true;
}
